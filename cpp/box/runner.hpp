#ifndef BOX_RUNNER_HPP
#define BOX_RUNNER_HPP

#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>

namespace box {

// Settings to run a program under resource limits. Plain data, so that the
// forked child can read it without allocating.
struct ExecutionOptions {
  static const constexpr size_t str_len = 1024;
  static const constexpr size_t narg = 16;

  // Optional values, zero means unlimited. There is no process limit:
  // RLIMIT_NPROC counts per uid, and every sandbox runs as the same uid.
  int64_t cpu_limit_millis = 0;
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_kb = 0;
  int32_t max_files = 0;
  int64_t max_file_size_kb = 0;
  int64_t max_stack_kb = 0;

  char stdin_file[str_len] = {};
  char stdout_file[str_len] = {};
  char stderr_file[str_len] = {};
  char args[narg][str_len] = {};

  // Required values
  char root[str_len] = {};
  char executable[str_len] = {};

  ExecutionOptions(const std::string& root_, const std::string& executable_) {
    stringcpy(root, root_);
    stringcpy(executable, executable_);
    strncpy(&args[0][0], executable, str_len);
  }
  void SetArgs(const std::initializer_list<std::string>& a_) {
    size_t i = 1;
    for (const std::string& s : a_) {
      if (i >= narg) throw std::runtime_error("Too many arguments");
      stringcpy(&args[i++][0], s);
    }
  }

  static void stringcpy(char* dst, const std::string& s) {
    if (s.size() >= str_len) throw std::runtime_error("string too long");
    strncpy(dst, s.c_str(), str_len - 1);
  }
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  bool killed = false;
  char message[8192] = {};
};

// Runs a single program under OS resource limits.
class Runner {
 public:
  // Returns the best runner for this system.
  static std::unique_ptr<Runner> Create();

  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  // Implementations of this function may not be thread safe.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  virtual ~Runner() = default;
  Runner() = default;
  Runner(const Runner&) = delete;
  Runner(Runner&&) = delete;
  Runner& operator=(const Runner&) = delete;
  Runner& operator=(Runner&&) = delete;
};

}  // namespace box

#endif
