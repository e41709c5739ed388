#ifndef SERVER_EXECUTION_HPP
#define SERVER_EXECUTION_HPP
#include <cstdint>
#include <string>
#include <vector>

#include <kj/common.h>

#include "security/tier.hpp"
#include "security/validator.hpp"
#include "worker/executor.hpp"
#include "worker/summarizer.hpp"

namespace server {

// Accepted ranges for requests.
struct Limits {
  int32_t min_timeout_seconds = 1;
  int32_t max_timeout_seconds = 3600;
  int64_t min_memory_mb = 128;
  int64_t max_memory_mb = 8192;
  double min_cpu = 0.1;
  double max_cpu = 8;
  int64_t min_disk_mb = 16;
  int64_t max_disk_mb = 10240;
  size_t max_code_bytes = 256 * 1024;
  size_t max_input_bytes = 1024 * 1024;
  size_t max_dependencies = 32;
};

struct ExecutionRequest {
  std::string caller_id;
  std::string code;
  std::string language = "python";
  std::vector<std::string> dependencies;
  kj::Maybe<std::string> input;
  int32_t timeout_seconds = 30;
  int64_t memory_mb = 512;
  double cpu_limit = 1.0;
  int64_t disk_mb = 256;
  bool network_enabled = false;
  // Correlation id of the caller's task, if any.
  std::string task_id;
  // Persistent sandbox to run in; a fresh sandbox when empty.
  std::string sandbox_id;
};

// Throws a kj::Exception (FAILED) describing the first out of range field.
void CheckRequest(const ExecutionRequest& request, const Limits& limits);

// Same checks for the resource part of a sandbox request.
void CheckResources(int32_t timeout_seconds, int64_t memory_mb, double cpu,
                    int64_t disk_mb, const Limits& limits);

enum class ExecutionStatus {
  PENDING,
  RUNNING,
  COMPLETED,
  FAILED,
  TIMEOUT,
  CANCELLED,
  BLOCKED
};

const char* StatusName(ExecutionStatus status);

inline bool IsTerminal(ExecutionStatus status) {
  return status != ExecutionStatus::PENDING &&
         status != ExecutionStatus::RUNNING;
}

struct ExecutionRecord {
  std::string id;
  ExecutionRequest request;
  security::Tier tier = security::Tier::TASK;
  ExecutionStatus status = ExecutionStatus::PENDING;
  security::SecurityCheckResult security;
  // Absent until terminal, and for blocked, cancelled and provisioning
  // failures.
  kj::Maybe<worker::Summary> summary;
  kj::Maybe<worker::FaultKind> fault;
  std::string error;
  int64_t created_at = 0;
  int64_t started_at = 0;
  int64_t completed_at = 0;
  std::string sandbox_id;
  worker::Usage usage;

  int64_t ElapsedMillis() const {
    return completed_at ? completed_at - created_at : 0;
  }
};

}  // namespace server

#endif
