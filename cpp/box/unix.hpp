#ifndef BOX_UNIX_HPP
#define BOX_UNIX_HPP
#include "box/runner.hpp"

namespace box {

// fork + setrlimit + exec runner. The child gets its own session, so a wall
// limit kill reaches every process it spawned.
class Unix : public Runner {
 public:
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;

 private:
  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // executes Child and never returns.
  bool DoFork(std::string* error_msg);

  // Function that is executed in the child process. Must not allocate.
  [[noreturn]] void Child();

  // Waits for the termination of the child, killing it if it exceeds the
  // provided wall time limit.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  int pipe_fds_[2] = {};
  int child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;
};

}  // namespace box
#endif
