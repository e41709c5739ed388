#ifndef SANDBOX_DOCKER_HPP
#define SANDBOX_DOCKER_HPP
#include <cstdint>
#include <string>
#include <vector>

#include "sandbox/runtime.hpp"
#include "util/subprocess.hpp"

namespace sandbox {

struct DockerOptions {
  // docker CLI executable.
  std::string docker = "docker";
  // Daemon address, passed as --host when not empty.
  std::string host;
  std::string image = "rexec-box:latest";
  // Limit for create, start, rm and version.
  int64_t command_timeout_millis = 60000;
  size_t max_output = 64 * 1024 * 1024;
};

// Runtime that drives the docker command line client.
class DockerRuntime : public Runtime {
 public:
  explicit DockerRuntime(DockerOptions options)
      : options_(std::move(options)) {}

  bool Create(const ContainerSpec& spec, std::string* container_id,
              std::string* error_msg) override;
  bool Exec(const std::string& container_id,
            const std::vector<std::string>& args, const std::string& input,
            int64_t timeout_millis, ProcessOutcome* outcome,
            std::string* error_msg) override;
  bool Remove(const std::string& container_id,
              std::string* error_msg) override;
  bool Ping() override;

  // Command lines, exposed for tests.
  std::vector<std::string> CreateArgs(const ContainerSpec& spec) const;
  std::vector<std::string> StartArgs(const std::string& container_id) const;
  std::vector<std::string> ExecArgs(const std::string& container_id,
                                    const std::vector<std::string>& args) const;
  std::vector<std::string> RemoveArgs(const std::string& container_id) const;

 private:
  std::vector<std::string> Base() const;
  bool Run(std::vector<std::string> args, util::SubprocessResult* result,
           std::string* error_msg);

  DockerOptions options_;
};

}  // namespace sandbox

#endif
