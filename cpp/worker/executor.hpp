#ifndef WORKER_EXECUTOR_HPP
#define WORKER_EXECUTOR_HPP
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <capnp/message.h>
#include <kj/memory.h>
#include <kj/one-of.h>

#include "capnp/value.capnp.h"
#include "sandbox/runtime.hpp"
#include "sandbox/sandbox.hpp"

namespace worker {

struct ExecutorOptions {
  // Path of the rexec binary inside the container image.
  std::string box_command = "/usr/local/bin/rexec";
  // Writable directory of the container where programs run.
  std::string workdir = "/workspace";
  int64_t install_timeout_millis = 120 * 1000;
  // Added to the host deadline on top of the program and install budgets.
  int64_t grace_millis = 5000;
  int32_t max_files = 256;
  // Bytes of each output stream returned by the box.
  size_t max_output = 1024 * 1024;
};

// What to run. Limits are already validated.
struct Program {
  std::string code;
  std::string language = "python";
  std::vector<std::string> dependencies;
  kj::Maybe<std::string> input;
  int32_t timeout_seconds = 30;
  int64_t memory_mb = 512;
  int64_t disk_mb = 256;
  bool network_enabled = false;
};

struct Usage {
  double cpu_time = 0;
  double sys_time = 0;
  double wall_time = 0;
  uint64_t memory_kb = 0;
};

enum class FaultKind {
  TIMEOUT,
  RUNTIME_ERROR,
  DEPENDENCY_INSTALL,
  SANDBOX_PROVISIONING,
  // The box answered with more than the runtime forwards.
  OUTPUT_LIMIT,
  INTERNAL
};

const char* FaultKindName(FaultKind kind);

struct FieldStats {
  std::string field;
  int64_t count = 0;
  int64_t nulls = 0;
  double min = 0;
  double max = 0;
  double mean = 0;
};

// Shape of a result list the box cut short, computed over every item. Schema
// and stats are empty unless the items are records.
struct TableShape {
  int64_t row_count = 0;
  std::vector<std::pair<std::string, std::string>> schema;
  std::vector<FieldStats> stats;
};

struct RawResult {
  // Holds the value of `result`; empty if the program never bound it.
  kj::Own<capnp::MallocMessageBuilder> value;
  // Set when value only holds the first items of the result.
  kj::Maybe<TableShape> capped;
  std::string result_type;
  std::string stdout_data;
  std::string stderr_data;
  Usage usage;

  bool HasValue() const { return value.get() != nullptr; }
  capnproto::Value::Reader Value() const {
    return value->getRoot<capnproto::Value>().asReader();
  }
};

struct ExecutionFault {
  FaultKind kind = FaultKind::INTERNAL;
  std::string message;
  std::string stdout_data;
  std::string stderr_data;
  Usage usage;
};

using Outcome = kj::OneOf<RawResult, ExecutionFault>;

// Runs programs inside a sandbox through `rexec box`.
class Executor {
 public:
  Executor(sandbox::Runtime* runtime, ExecutorOptions options)
      : runtime_(*runtime), options_(std::move(options)) {}

  // Never throws for failures of the program or of the sandbox: they are
  // reported as an ExecutionFault.
  Outcome Run(const sandbox::Sandbox& sandbox, const Program& program);

  // Host deadline for a program: its wall limit plus installation and grace.
  int64_t DeadlineMillis(const Program& program) const;

 private:
  sandbox::Runtime& runtime_;
  ExecutorOptions options_;
};

}  // namespace worker

#endif
