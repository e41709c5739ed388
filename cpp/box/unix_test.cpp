#include <fcntl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <csignal>
#include <cstdlib>
#include <memory>
#include "box/runner.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

const char* test_tmpdir = "/tmp/rexec_unix_testdir";

using ::testing::AnyOf;
using ::testing::Eq;
using ::testing::StartsWith;

using namespace box;  // NOLINT

ExecutionOptions Shell(const std::string& script) {
  ExecutionOptions options("/tmp", "/bin/sh");
  options.SetArgs({"-c", script});
  return options;
}

// NOLINTNEXTLINE
TEST(UnixTest, TestNoDir) {
  std::unique_ptr<Runner> runner = Runner::Create();
  ASSERT_TRUE(runner);
  ExecutionOptions options("foo", "bar");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(runner->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("chdir:"));
}

// NOLINTNEXTLINE
TEST(UnixTest, TestNoFile) {
  std::unique_ptr<Runner> runner = Runner::Create();
  ASSERT_TRUE(runner);
  ExecutionOptions options("/tmp", "/nonexistent/program");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_FALSE(runner->Execute(options, &info, &error_msg));
  EXPECT_THAT(error_msg, StartsWith("exec:"));
}

// NOLINTNEXTLINE
TEST(UnixTest, TestExitCode) {
  std::unique_ptr<Runner> runner = Runner::Create();
  ExecutionOptions options = Shell("exit 15");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(runner->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.status_code, 15);
  EXPECT_EQ(info.signal, 0);
  EXPECT_STREQ(info.message, "Non-zero return code");
}

// NOLINTNEXTLINE
TEST(UnixTest, TestSignal) {
  std::unique_ptr<Runner> runner = Runner::Create();
  ExecutionOptions options = Shell("kill -ABRT $$");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(runner->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, SIGABRT);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_FALSE(info.killed);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestWait) {
  std::unique_ptr<Runner> runner = Runner::Create();
  ExecutionOptions options = Shell("sleep 1");
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(runner->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_GE(info.wall_time_millis, 900);
  EXPECT_LE(info.wall_time_millis, 2000);
  EXPECT_LE(info.cpu_time_millis, 300);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestWallLimitOk) {
  std::unique_ptr<Runner> runner = Runner::Create();
  ExecutionOptions options = Shell("sleep 1");
  options.wall_limit_millis = 2500;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(runner->Execute(options, &info, &error_msg));
  EXPECT_EQ(info.signal, 0);
  EXPECT_GE(info.wall_time_millis, 900);
  EXPECT_LE(info.wall_time_millis, 2400);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestWallLimitNotOk) {
  std::unique_ptr<Runner> runner = Runner::Create();
  ExecutionOptions options = Shell("sleep 10");
  options.wall_limit_millis = 200;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(runner->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, SIGKILL);
  EXPECT_TRUE(info.killed);
  EXPECT_GE(info.wall_time_millis, 100);
  EXPECT_LE(info.wall_time_millis, 1000);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestWallLimitKillsGrandchildren) {
  std::unique_ptr<Runner> runner = Runner::Create();
  util::File::MakeDirs(test_tmpdir);
  std::string marker = std::string(test_tmpdir) + "/late";
  if (util::File::Exists(marker)) util::File::Remove(marker);
  ExecutionOptions options =
      Shell("(sleep 1; touch " + marker + ") & sleep 10");
  options.wall_limit_millis = 200;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(runner->Execute(options, &info, &error_msg));
  EXPECT_EQ(info.signal, SIGKILL);
  sleep(2);
  EXPECT_FALSE(util::File::Exists(marker));
}

// NOLINTNEXTLINE
TEST(UnixTest, TestCpuLimitNotOk) {
  std::unique_ptr<Runner> runner = Runner::Create();
  ExecutionOptions options = Shell("while :; do :; done");
  options.cpu_limit_millis = 1000;
  options.wall_limit_millis = 10000;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(runner->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_THAT(info.signal, AnyOf(Eq(SIGKILL), Eq(SIGXCPU)));
  EXPECT_TRUE(info.killed);
  EXPECT_GE(info.cpu_time_millis + info.sys_time_millis, 900);
  EXPECT_LE(info.cpu_time_millis + info.sys_time_millis, 2500);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestFileSizeLimit) {
  std::unique_ptr<Runner> runner = Runner::Create();
  util::File::MakeDirs(test_tmpdir);
  std::string out = std::string(test_tmpdir) + "/big";
  ExecutionOptions options =
      Shell("head -c 1000000 /dev/zero > " + out);
  options.max_file_size_kb = 64;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(runner->Execute(options, &info, &error_msg));
  EXPECT_TRUE(info.signal == SIGXFSZ || info.status_code != 0);
  EXPECT_LE(util::File::Size(out), 64 * 1024);
}

// NOLINTNEXTLINE
TEST(UnixTest, TestIORedirect) {
  std::unique_ptr<Runner> runner = Runner::Create();
  ExecutionOptions options = Shell("read x; echo $x; echo $((x * 2)) >&2");
  util::File::MakeDirs(test_tmpdir);
  std::string dir = test_tmpdir;
  ExecutionOptions::stringcpy(options.stdin_file, dir + "/in");
  ExecutionOptions::stringcpy(options.stdout_file, dir + "/out");
  ExecutionOptions::stringcpy(options.stderr_file, dir + "/err");
  util::File::WriteAll(options.stdin_file, std::string("10\n"));

  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(runner->Execute(options, &info, &error_msg));
  EXPECT_EQ(error_msg, "");
  EXPECT_EQ(info.signal, 0);
  EXPECT_EQ(info.status_code, 0);
  EXPECT_EQ(util::File::ReadHead(options.stdout_file), "10\n");
  EXPECT_EQ(util::File::ReadHead(options.stderr_file), "20\n");
}

// Every sandbox runs as the same uid, so a per-uid process limit would be
// shared between them.
// NOLINTNEXTLINE
TEST(UnixTest, TestProcessLimitIsInherited) {
  struct rlimit parent {};
  ASSERT_EQ(getrlimit(RLIMIT_NPROC, &parent), 0);
  std::unique_ptr<Runner> runner = Runner::Create();
  util::File::MakeDirs(test_tmpdir);
  std::string out = std::string(test_tmpdir) + "/nproc";
  ExecutionOptions options = Shell("ulimit -u");
  ExecutionOptions::stringcpy(options.stdout_file, out);
  options.cpu_limit_millis = 1000;
  options.memory_limit_kb = 256 * 1024;
  options.max_files = 64;
  ExecutionInfo info;
  std::string error_msg;
  EXPECT_TRUE(runner->Execute(options, &info, &error_msg));
  EXPECT_EQ(info.status_code, 0);
  std::string expected = parent.rlim_cur == RLIM_INFINITY
                             ? "unlimited"
                             : std::to_string(parent.rlim_cur);
  EXPECT_EQ(util::File::ReadHead(out), expected + "\n");
}

}  // namespace
