#include "util/subprocess.hpp"
#include <csignal>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;

// NOLINTNEXTLINE
TEST(Subprocess, CapturesOutput) {
  util::SubprocessOptions options;
  options.args = {"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"};
  util::SubprocessResult result;
  std::string error_msg;
  ASSERT_TRUE(util::RunSubprocess(options, &result, &error_msg)) << error_msg;
  EXPECT_EQ(result.stdout_data, "out\n");
  EXPECT_EQ(result.stderr_data, "err\n");
  EXPECT_EQ(result.exit_code, 3);
  EXPECT_EQ(result.signal, 0);
  EXPECT_FALSE(result.timed_out);
}

// NOLINTNEXTLINE
TEST(Subprocess, FeedsInput) {
  util::SubprocessOptions options;
  options.args = {"cat"};
  options.input = std::string(300 * 1024, 'z');
  util::SubprocessResult result;
  std::string error_msg;
  ASSERT_TRUE(util::RunSubprocess(options, &result, &error_msg)) << error_msg;
  EXPECT_EQ(result.stdout_data, options.input);
}

// NOLINTNEXTLINE
TEST(Subprocess, PassesEnvironment) {
  util::SubprocessOptions options;
  options.args = {"/bin/sh", "-c", "echo $REXEC_TEST_VAR"};
  options.env = {"REXEC_TEST_VAR=hands"};
  util::SubprocessResult result;
  std::string error_msg;
  ASSERT_TRUE(util::RunSubprocess(options, &result, &error_msg)) << error_msg;
  EXPECT_EQ(result.stdout_data, "hands\n");
}

// NOLINTNEXTLINE
TEST(Subprocess, TimeoutKillsProcessGroup) {
  util::SubprocessOptions options;
  options.args = {"/bin/sh", "-c", "sleep 30 & sleep 30"};
  options.timeout_millis = 300;
  util::SubprocessResult result;
  std::string error_msg;
  ASSERT_TRUE(util::RunSubprocess(options, &result, &error_msg)) << error_msg;
  EXPECT_TRUE(result.timed_out);
  EXPECT_EQ(result.signal, SIGKILL);
  EXPECT_LE(result.wall_time_millis, 3000);
}

// NOLINTNEXTLINE
TEST(Subprocess, OutputIsBounded) {
  util::SubprocessOptions options;
  options.args = {"/bin/sh", "-c", "yes | head -c 100000"};
  options.max_output = 1000;
  util::SubprocessResult result;
  std::string error_msg;
  ASSERT_TRUE(util::RunSubprocess(options, &result, &error_msg)) << error_msg;
  EXPECT_EQ(result.stdout_data.size(), 1000);
  EXPECT_TRUE(result.stdout_truncated);
  EXPECT_THAT(result.stdout_data, StartsWith("y\ny\n"));
}

// NOLINTNEXTLINE
TEST(Subprocess, MissingProgram) {
  util::SubprocessOptions options;
  options.args = {"rexec-no-such-program"};
  util::SubprocessResult result;
  std::string error_msg;
  EXPECT_FALSE(util::RunSubprocess(options, &result, &error_msg));
  EXPECT_THAT(error_msg, HasSubstr("rexec-no-such-program"));
}

}  // namespace
