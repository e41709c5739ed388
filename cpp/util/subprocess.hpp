#ifndef UTIL_SUBPROCESS_HPP
#define UTIL_SUBPROCESS_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace util {

struct SubprocessOptions {
  // args[0] is resolved through PATH when it contains no slash.
  std::vector<std::string> args;
  // Extra KEY=VALUE entries appended to the inherited environment.
  std::vector<std::string> env;
  std::string input;
  // Zero means no limit. The whole process group is killed on expiry.
  int64_t timeout_millis = 0;
  // Bytes kept from each output stream; the rest is drained and discarded.
  size_t max_output = 64 * 1024 * 1024;
};

struct SubprocessResult {
  int exit_code = 0;
  int signal = 0;
  bool timed_out = false;
  std::string stdout_data;
  std::string stderr_data;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  int64_t wall_time_millis = 0;
};

// Spawns a process, feeds it input and collects its output. Returns false
// and sets error_msg if the process could not be started.
bool RunSubprocess(const SubprocessOptions& options, SubprocessResult* result,
                   std::string* error_msg);

}  // namespace util

#endif
