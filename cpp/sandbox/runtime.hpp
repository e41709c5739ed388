#ifndef SANDBOX_RUNTIME_HPP
#define SANDBOX_RUNTIME_HPP
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "sandbox/sandbox.hpp"

namespace sandbox {

struct ContainerSpec {
  std::string name;
  SandboxConfig config;
  std::map<std::string, std::string> labels;
};

struct ProcessOutcome {
  int exit_code = 0;
  bool timed_out = false;
  // Set when stdout_data holds only the first bytes the command wrote.
  bool stdout_truncated = false;
  std::string stdout_data;
  std::string stderr_data;
};

// Isolation backend. All methods are thread safe and may block.
class Runtime {
 public:
  virtual ~Runtime() = default;

  // Creates and starts a container. Returns false and sets error_msg on
  // failure.
  virtual bool Create(const ContainerSpec& spec, std::string* container_id,
                      std::string* error_msg) = 0;

  // Runs args inside a running container, feeding input to its stdin. A
  // command still running after timeout_millis is abandoned and reported
  // with timed_out. Returns false if the command could not be started.
  virtual bool Exec(const std::string& container_id,
                    const std::vector<std::string>& args,
                    const std::string& input, int64_t timeout_millis,
                    ProcessOutcome* outcome, std::string* error_msg) = 0;

  // Forcibly removes a container, killing whatever runs inside. Removing a
  // container that does not exist succeeds.
  virtual bool Remove(const std::string& container_id,
                      std::string* error_msg) = 0;

  // True if the backend answers.
  virtual bool Ping() = 0;
};

}  // namespace sandbox

#endif
