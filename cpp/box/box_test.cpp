#include "box/box.hpp"

#include <sys/stat.h>

#include <capnp/message.h>
#include <capnp/serialize.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::HasSubstr;

std::string AsString(capnp::Data::Reader data) {
  return std::string(reinterpret_cast<const char*>(data.begin()), data.size());
}

// Programs are shell scripts: the stub box binary runs program.py with
// /bin/sh, and the stub python stands in for pip.
class BoxTest : public ::testing::Test {
 protected:
  BoxTest() : tmp_("/tmp") {
    self_ = Script("self", "exec /bin/sh \"$3/program.py\"\n");
    python_ = Script("python",
                     "echo \"$@\" > " + Path("pip_args") +
                         "\n"
                         "echo collecting\n"
                         "echo 'No matching distribution' >&2\n"
                         "exit $(cat " +
                         Path("pip_exit") + " 2>/dev/null || echo 0)\n");
  }

  std::string Path(const std::string& name) const {
    return util::File::JoinPath(tmp_.Path(), name);
  }

  std::string Script(const std::string& name, const std::string& body) {
    std::string path = Path(name);
    util::File::WriteAll(path, "#!/bin/sh\n" + body);
    EXPECT_EQ(chmod(path.c_str(), 0755), 0);
    return path;
  }

  box::BoxOptions Options() const {
    box::BoxOptions options;
    options.temp_directory = tmp_.Path();
    options.python = python_;
    options.self = self_;
    options.wheelhouse = Path("wheels");
    return options;
  }

  capnproto::BoxRequest::Builder Request(const std::string& code) {
    auto request = request_.initRoot<capnproto::BoxRequest>();
    request.setCode(code);
    request.setLanguage("python");
    auto limits = request.initLimits();
    limits.setWallTimeMillis(10000);
    limits.setCpuTimeMillis(10000);
    limits.setInstallTimeMillis(10000);
    return request;
  }

  capnproto::BoxResponse::Reader Run(capnproto::BoxRequest::Builder request,
                                     box::BoxOptions options) {
    box::Box box(std::move(options));
    auto response = response_.initRoot<capnproto::BoxResponse>();
    box.Run(request.asReader(), response);
    return response.asReader();
  }

  capnproto::BoxResponse::Reader Run(capnproto::BoxRequest::Builder request) {
    return Run(request, Options());
  }

  // Writes a list of `rows` records {"x": i} to a file the program copies to
  // its result.
  std::string RowsProgram(size_t rows) {
    capnp::MallocMessageBuilder builder;
    auto list = builder.initRoot<capnproto::Value>().initList(rows);
    for (size_t i = 0; i < rows; i++) {
      auto field = list[i].initRecord(1);
      field[0].setName("x");
      field[0].initValue().setInteger(i);
    }
    kj::Array<capnp::word> words = capnp::messageToFlatArray(builder);
    util::File::WriteAll(Path("value.bin"), words.asPtr().asChars());
    return "cp " + Path("value.bin") + " result.bin\nprintf list > " +
           "result_type\n";
  }

  util::TempDir tmp_;
  std::string self_;
  std::string python_;
  capnp::MallocMessageBuilder request_;
  capnp::MallocMessageBuilder response_;
};

// NOLINTNEXTLINE
TEST_F(BoxTest, SuccessCarriesStreams) {
  auto response = Run(Request("echo hello\necho oops >&2\n"));
  EXPECT_TRUE(response.getStatus().isSuccess());
  EXPECT_EQ(AsString(response.getStdout()), "hello\n");
  EXPECT_EQ(AsString(response.getStderr()), "oops\n");
  EXPECT_TRUE(response.getResult().isAbsent());
}

// NOLINTNEXTLINE
TEST_F(BoxTest, NonZeroExitIsRuntimeError) {
  auto response = Run(Request("echo failing >&2\nexit 3\n"));
  ASSERT_TRUE(response.getStatus().isRuntimeError());
  EXPECT_EQ(response.getStatus().getRuntimeError(), 3);
  EXPECT_EQ(AsString(response.getStderr()), "failing\n");
  EXPECT_TRUE(response.getResult().isAbsent());
}

// NOLINTNEXTLINE
TEST_F(BoxTest, WallLimitIsClassified) {
  auto request = Request("sleep 5\n");
  request.getLimits().setWallTimeMillis(200);
  auto response = Run(request);
  EXPECT_TRUE(response.getStatus().isWallLimit());
}

// NOLINTNEXTLINE
TEST_F(BoxTest, CpuLimitIsClassified) {
  auto request = Request("while :; do :; done\n");
  request.getLimits().setCpuTimeMillis(1000);
  auto response = Run(request);
  EXPECT_TRUE(response.getStatus().isTimeLimit());
}

// NOLINTNEXTLINE
TEST_F(BoxTest, MemoryErrorIsClassified) {
  auto request = Request("echo MemoryError >&2\nexit 1\n");
  request.getLimits().setMemoryKb(512 * 1024);
  auto response = Run(request);
  EXPECT_TRUE(response.getStatus().isMemoryLimit());
}

// NOLINTNEXTLINE
TEST_F(BoxTest, StreamsAreCapped) {
  box::BoxOptions options = Options();
  options.max_output = 16;
  auto response = Run(
      Request("printf 0123456789abcdefXYZ\nprintf XYZ0123456789abcdef >&2\n"),
      options);
  EXPECT_TRUE(response.getStatus().isSuccess());
  EXPECT_EQ(AsString(response.getStdout()), "0123456789abcdef");
  EXPECT_EQ(AsString(response.getStderr()), "0123456789abcdef");
}

// NOLINTNEXTLINE
TEST_F(BoxTest, InvalidDependencyIsRejected) {
  auto request = Request("echo never\n");
  request.initDependencies(2).set(0, "numpy");
  request.getDependencies().set(1, "--index-url=http://example.com");
  auto response = Run(request);
  ASSERT_TRUE(response.getStatus().isDependencyFailure());
  EXPECT_THAT(response.getStatus().getDependencyFailure().cStr(),
              HasSubstr("Invalid dependency"));
  EXPECT_FALSE(util::File::Exists(Path("pip_args")));
  EXPECT_EQ(AsString(response.getStdout()), "");
}

// NOLINTNEXTLINE
TEST_F(BoxTest, FailedInstallationStopsTheProgram) {
  util::File::WriteAll(Path("pip_exit"), std::string("1\n"));
  auto request = Request("echo never\n");
  request.initDependencies(1).set(0, "missing-package");
  auto response = Run(request);
  ASSERT_TRUE(response.getStatus().isDependencyFailure());
  EXPECT_THAT(response.getStatus().getDependencyFailure().cStr(),
              HasSubstr("failed with code 1"));
  EXPECT_EQ(AsString(response.getStdout()), "collecting\n");
  EXPECT_EQ(AsString(response.getStderr()), "No matching distribution\n");
}

// NOLINTNEXTLINE
TEST_F(BoxTest, OfflineInstallationUsesWheelhouse) {
  auto request = Request("echo ran\n");
  request.initDependencies(1).set(0, "numpy==1.26.0");
  auto response = Run(request);
  EXPECT_TRUE(response.getStatus().isSuccess());
  EXPECT_EQ(AsString(response.getStdout()), "ran\n");
  std::string args = util::File::ReadHead(Path("pip_args"));
  EXPECT_THAT(args, HasSubstr("-m pip install"));
  EXPECT_THAT(args, HasSubstr("--no-index --find-links " + Path("wheels")));
  EXPECT_THAT(args, HasSubstr("numpy==1.26.0"));
}

// NOLINTNEXTLINE
TEST_F(BoxTest, SmallResultIsForwarded) {
  auto response = Run(Request(RowsProgram(3)));
  ASSERT_TRUE(response.getStatus().isSuccess());
  ASSERT_TRUE(response.getResult().isValue());
  EXPECT_EQ(response.getResult().getValue().getList().size(), 3u);
  EXPECT_EQ(response.getResultType(), "list");
  EXPECT_FALSE(response.getResultCapped());
}

// NOLINTNEXTLINE
TEST_F(BoxTest, LongResultShipsItsHead) {
  size_t rows = box::kMaxResultItems + 5;
  auto response = Run(Request(RowsProgram(rows)));
  ASSERT_TRUE(response.getStatus().isSuccess());
  ASSERT_TRUE(response.getResult().isValue());
  auto list = response.getResult().getValue().getList();
  ASSERT_EQ(list.size(), box::kMaxResultItems);
  EXPECT_EQ(list[0].getRecord()[0].getValue().getInteger(), 0);
  EXPECT_TRUE(response.getResultCapped());
  EXPECT_EQ(response.getResultCount(), static_cast<int64_t>(rows));
  ASSERT_EQ(response.getResultSchema().size(), 1u);
  EXPECT_EQ(response.getResultSchema()[0].getName(), "x");
  EXPECT_EQ(response.getResultSchema()[0].getType(), "int");
  ASSERT_EQ(response.getResultStats().size(), 1u);
  auto stats = response.getResultStats()[0];
  EXPECT_EQ(stats.getCount(), static_cast<int64_t>(rows));
  EXPECT_EQ(stats.getMin(), 0);
  EXPECT_EQ(stats.getMax(), rows - 1);
}

// NOLINTNEXTLINE
TEST_F(BoxTest, UnsupportedLanguageIsInternalError) {
  auto request = Request("puts 1");
  request.setLanguage("ruby");
  auto response = Run(request);
  ASSERT_TRUE(response.getStatus().isInternalError());
  EXPECT_THAT(response.getStatus().getInternalError().cStr(),
              HasSubstr("ruby"));
}

}  // namespace
