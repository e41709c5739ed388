#include "sandbox/docker.hpp"

#include <cstdio>

#include <kj/debug.h>

namespace sandbox {
namespace {

std::string TrimNewlines(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
  return s;
}

std::string FormatCpus(double cpus) {
  char buf[32];
  snprintf(buf, sizeof(buf), "%.2f", cpus);
  return buf;
}

std::string Failure(const std::string& what,
                    const util::SubprocessResult& result) {
  if (result.timed_out) return what + ": docker timed out";
  std::string err = TrimNewlines(result.stderr_data);
  if (err.empty()) err = "exit code " + std::to_string(result.exit_code);
  return what + ": " + err;
}

}  // namespace

std::vector<std::string> DockerRuntime::Base() const {
  std::vector<std::string> args = {options_.docker};
  if (!options_.host.empty()) {
    args.push_back("--host");
    args.push_back(options_.host);
  }
  return args;
}

std::vector<std::string> DockerRuntime::CreateArgs(
    const ContainerSpec& spec) const {
  const SandboxConfig& config = spec.config;
  std::string memory = std::to_string(config.memory_mb) + "m";
  std::vector<std::string> args = Base();
  args.insert(
      args.end(),
      {"create", "--name", spec.name, "--network",
       config.network == NetworkMode::BRIDGE ? "bridge" : "none", "--cpus",
       FormatCpus(config.cpu_limit), "--memory", memory, "--memory-swap",
       memory, "--pids-limit", std::to_string(config.max_procs), "--read-only",
       "--tmpfs",
       "/workspace:rw,exec,nosuid,size=" + std::to_string(config.disk_mb) +
           "m",
       "--tmpfs", "/tmp:rw,nosuid,size=64m", "--workdir", "/workspace",
       "--cap-drop", "ALL", "--security-opt", "no-new-privileges", "--user",
       "65534:65534", "--env", "HOME=/workspace"});
  for (const auto& label : spec.labels) {
    args.push_back("--label");
    args.push_back(label.first + "=" + label.second);
  }
  args.insert(args.end(), {options_.image, "sleep", "infinity"});
  return args;
}

std::vector<std::string> DockerRuntime::StartArgs(
    const std::string& container_id) const {
  std::vector<std::string> args = Base();
  args.insert(args.end(), {"start", container_id});
  return args;
}

std::vector<std::string> DockerRuntime::ExecArgs(
    const std::string& container_id,
    const std::vector<std::string>& command) const {
  std::vector<std::string> args = Base();
  args.insert(args.end(), {"exec", "-i", container_id});
  args.insert(args.end(), command.begin(), command.end());
  return args;
}

std::vector<std::string> DockerRuntime::RemoveArgs(
    const std::string& container_id) const {
  std::vector<std::string> args = Base();
  args.insert(args.end(), {"rm", "-f", container_id});
  return args;
}

bool DockerRuntime::Run(std::vector<std::string> args,
                        util::SubprocessResult* result,
                        std::string* error_msg) {
  util::SubprocessOptions options;
  options.args = std::move(args);
  options.timeout_millis = options_.command_timeout_millis;
  options.max_output = options_.max_output;
  return util::RunSubprocess(options, result, error_msg);
}

bool DockerRuntime::Create(const ContainerSpec& spec,
                           std::string* container_id, std::string* error_msg) {
  util::SubprocessResult result;
  if (!Run(CreateArgs(spec), &result, error_msg)) return false;
  if (result.timed_out || result.exit_code != 0) {
    *error_msg = Failure("docker create", result);
    return false;
  }
  *container_id = TrimNewlines(result.stdout_data);
  KJ_LOG(INFO, "Container created", spec.name, *container_id);

  util::SubprocessResult start;
  bool started = Run(StartArgs(*container_id), &start, error_msg);
  if (started && (start.timed_out || start.exit_code != 0)) {
    *error_msg = Failure("docker start", start);
    started = false;
  }
  if (!started) {
    std::string remove_error;
    if (!Remove(*container_id, &remove_error)) {
      KJ_LOG(ERROR, "Cannot remove container that did not start",
             *container_id, remove_error);
    }
    return false;
  }
  return true;
}

bool DockerRuntime::Exec(const std::string& container_id,
                         const std::vector<std::string>& args,
                         const std::string& input, int64_t timeout_millis,
                         ProcessOutcome* outcome, std::string* error_msg) {
  util::SubprocessOptions options;
  options.args = ExecArgs(container_id, args);
  options.input = input;
  options.timeout_millis = timeout_millis;
  options.max_output = options_.max_output;
  util::SubprocessResult result;
  if (!util::RunSubprocess(options, &result, error_msg)) return false;
  outcome->exit_code = result.signal != 0 ? 128 + result.signal
                                          : result.exit_code;
  outcome->timed_out = result.timed_out;
  outcome->stdout_truncated = result.stdout_truncated;
  outcome->stdout_data = std::move(result.stdout_data);
  outcome->stderr_data = std::move(result.stderr_data);
  return true;
}

bool DockerRuntime::Remove(const std::string& container_id,
                           std::string* error_msg) {
  util::SubprocessResult result;
  if (!Run(RemoveArgs(container_id), &result, error_msg)) return false;
  if (result.exit_code != 0 &&
      result.stderr_data.find("No such container") != std::string::npos) {
    return true;
  }
  if (result.timed_out || result.exit_code != 0) {
    *error_msg = Failure("docker rm", result);
    return false;
  }
  KJ_LOG(INFO, "Container removed", container_id);
  return true;
}

bool DockerRuntime::Ping() {
  util::SubprocessResult result;
  std::string error_msg;
  std::vector<std::string> args = Base();
  args.insert(args.end(), {"version", "--format", "{{.Server.Version}}"});
  if (!Run(std::move(args), &result, &error_msg)) {
    KJ_LOG(WARNING, "Cannot run docker", error_msg);
    return false;
  }
  if (result.timed_out || result.exit_code != 0) {
    KJ_LOG(WARNING, "Docker daemon unreachable",
           Failure("docker version", result));
    return false;
  }
  return true;
}

}  // namespace sandbox
