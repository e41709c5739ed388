#include "server/execution.hpp"

#include <regex>

#include <kj/debug.h>

namespace server {
namespace {

const std::regex& DependencyRegex() {
  static const std::regex re(
      R"(^[A-Za-z0-9][A-Za-z0-9._-]*(\[[A-Za-z0-9,._-]+\])?)"
      R"(((==|>=|<=|~=|!=|<|>)[A-Za-z0-9.*+!-]+)?$)");
  return re;
}

}  // namespace

void CheckResources(int32_t timeout_seconds, int64_t memory_mb, double cpu,
                    int64_t disk_mb, const Limits& limits) {
  KJ_REQUIRE(timeout_seconds >= limits.min_timeout_seconds &&
                 timeout_seconds <= limits.max_timeout_seconds,
             "timeout out of range", timeout_seconds);
  KJ_REQUIRE(memory_mb >= limits.min_memory_mb &&
                 memory_mb <= limits.max_memory_mb,
             "memory limit out of range", memory_mb);
  KJ_REQUIRE(cpu >= limits.min_cpu && cpu <= limits.max_cpu,
             "cpu limit out of range", cpu);
  KJ_REQUIRE(disk_mb >= limits.min_disk_mb && disk_mb <= limits.max_disk_mb,
             "disk limit out of range", disk_mb);
}

void CheckRequest(const ExecutionRequest& request, const Limits& limits) {
  KJ_REQUIRE(!request.caller_id.empty(), "missing caller id");
  KJ_REQUIRE(!request.code.empty(), "empty program");
  KJ_REQUIRE(request.code.size() <= limits.max_code_bytes, "program too large",
             request.code.size());
  KJ_IF_MAYBE(input, request.input) {
    KJ_REQUIRE(input->size() <= limits.max_input_bytes, "input too large",
               input->size());
  }
  KJ_REQUIRE(request.dependencies.size() <= limits.max_dependencies,
             "too many dependencies", request.dependencies.size());
  for (const std::string& dep : request.dependencies) {
    KJ_REQUIRE(std::regex_match(dep, DependencyRegex()),
               "invalid dependency specifier", dep);
  }
  CheckResources(request.timeout_seconds, request.memory_mb,
                 request.cpu_limit, request.disk_mb, limits);
}

const char* StatusName(ExecutionStatus status) {
  switch (status) {
    case ExecutionStatus::PENDING:
      return "pending";
    case ExecutionStatus::RUNNING:
      return "running";
    case ExecutionStatus::COMPLETED:
      return "completed";
    case ExecutionStatus::FAILED:
      return "failed";
    case ExecutionStatus::TIMEOUT:
      return "timeout";
    case ExecutionStatus::CANCELLED:
      return "cancelled";
    case ExecutionStatus::BLOCKED:
      return "blocked";
  }
  return "failed";
}

}  // namespace server
