#include "worker/executor.hpp"

#include <cstring>

#include <capnp/serialize.h>
#include <kj/debug.h>

#include "capnp/box.capnp.h"

namespace worker {
namespace {

ExecutionFault Fault(FaultKind kind, std::string message) {
  ExecutionFault fault;
  fault.kind = kind;
  fault.message = std::move(message);
  return fault;
}

std::string AsString(capnp::Data::Reader data) {
  return std::string(reinterpret_cast<const char*>(data.begin()), data.size());
}

Usage FromCapnp(capnproto::BoxUsage::Reader usage) {
  Usage out;
  out.cpu_time = usage.getCpuTime();
  out.sys_time = usage.getSysTime();
  out.wall_time = usage.getWallTime();
  out.memory_kb = usage.getMemoryKb();
  return out;
}

TableShape ShapeFromCapnp(capnproto::BoxResponse::Reader response) {
  TableShape shape;
  shape.row_count = response.getResultCount();
  for (auto field : response.getResultSchema()) {
    shape.schema.emplace_back(field.getName(), field.getType());
  }
  for (auto field : response.getResultStats()) {
    FieldStats stats;
    stats.field = field.getField();
    stats.count = field.getCount();
    stats.nulls = field.getNulls();
    stats.min = field.getMin();
    stats.max = field.getMax();
    stats.mean = field.getMean();
    shape.stats.push_back(std::move(stats));
  }
  return shape;
}

std::string Tail(const std::string& s, size_t len) {
  return s.size() <= len ? s : s.substr(s.size() - len);
}

Outcome Decode(capnproto::BoxResponse::Reader response) {
  std::string stdout_data = AsString(response.getStdout());
  std::string stderr_data = AsString(response.getStderr());
  Usage usage = FromCapnp(response.getUsage());
  auto status = response.getStatus();
  ExecutionFault fault;
  switch (status.which()) {
    case capnproto::BoxResponse::Status::SUCCESS: {
      RawResult raw;
      if (response.getResult().isValue()) {
        raw.value = kj::heap<capnp::MallocMessageBuilder>();
        raw.value->setRoot(response.getResult().getValue());
        if (response.getResultCapped()) raw.capped = ShapeFromCapnp(response);
      }
      raw.result_type = response.getResultType();
      raw.stdout_data = std::move(stdout_data);
      raw.stderr_data = std::move(stderr_data);
      raw.usage = usage;
      return kj::mv(raw);
    }
    case capnproto::BoxResponse::Status::RUNTIME_ERROR:
      fault = Fault(FaultKind::RUNTIME_ERROR,
                    "Program exited with code " +
                        std::to_string(status.getRuntimeError()));
      break;
    case capnproto::BoxResponse::Status::TIME_LIMIT:
      fault = Fault(FaultKind::TIMEOUT, "CPU time limit exceeded");
      break;
    case capnproto::BoxResponse::Status::WALL_LIMIT:
      fault = Fault(FaultKind::TIMEOUT, "Wall time limit exceeded");
      break;
    case capnproto::BoxResponse::Status::MEMORY_LIMIT:
      fault = Fault(FaultKind::RUNTIME_ERROR, "Memory limit exceeded");
      break;
    case capnproto::BoxResponse::Status::SIGNAL:
      fault = Fault(FaultKind::RUNTIME_ERROR,
                    std::string("Program killed by signal ") +
                        strsignal(status.getSignal()));
      break;
    case capnproto::BoxResponse::Status::DEPENDENCY_FAILURE:
      fault = Fault(FaultKind::DEPENDENCY_INSTALL,
                    status.getDependencyFailure());
      break;
    case capnproto::BoxResponse::Status::INTERNAL_ERROR:
      fault = Fault(FaultKind::INTERNAL, status.getInternalError());
      break;
  }
  fault.stdout_data = std::move(stdout_data);
  fault.stderr_data = std::move(stderr_data);
  fault.usage = usage;
  return kj::mv(fault);
}

}  // namespace

const char* FaultKindName(FaultKind kind) {
  switch (kind) {
    case FaultKind::TIMEOUT:
      return "timeout";
    case FaultKind::RUNTIME_ERROR:
      return "runtime_error";
    case FaultKind::DEPENDENCY_INSTALL:
      return "dependency_install";
    case FaultKind::SANDBOX_PROVISIONING:
      return "sandbox_provisioning";
    case FaultKind::OUTPUT_LIMIT:
      return "output_limit";
    case FaultKind::INTERNAL:
      return "internal";
  }
  return "internal";
}

int64_t Executor::DeadlineMillis(const Program& program) const {
  int64_t deadline = program.timeout_seconds * 1000LL + options_.grace_millis;
  if (!program.dependencies.empty()) {
    deadline += options_.install_timeout_millis;
  }
  return deadline;
}

Outcome Executor::Run(const sandbox::Sandbox& sandbox,
                      const Program& program) {
  capnp::MallocMessageBuilder builder;
  auto request = builder.initRoot<capnproto::BoxRequest>();
  request.setCode(program.code);
  request.setLanguage(program.language);
  KJ_IF_MAYBE(input, program.input) {
    request.setInput(kj::ArrayPtr<const kj::byte>(
        reinterpret_cast<const kj::byte*>(input->data()), input->size()));
    request.setHasInput(true);
  }
  auto deps = request.initDependencies(program.dependencies.size());
  for (size_t i = 0; i < program.dependencies.size(); i++) {
    deps.set(i, program.dependencies[i]);
  }
  auto limits = request.initLimits();
  limits.setWallTimeMillis(program.timeout_seconds * 1000LL);
  limits.setCpuTimeMillis(program.timeout_seconds * 1000LL);
  limits.setMemoryKb(program.memory_mb * 1024);
  limits.setFileSizeKb(program.disk_mb * 1024);
  limits.setMaxFiles(options_.max_files);
  limits.setInstallTimeMillis(options_.install_timeout_millis);
  request.setNetworkEnabled(program.network_enabled);

  kj::Array<capnp::word> words = capnp::messageToFlatArray(builder);
  kj::ArrayPtr<const char> chars = words.asPtr().asChars();
  std::string input(chars.begin(), chars.size());

  std::vector<std::string> args = {
      options_.box_command, "box",        "--temp-dir",
      options_.workdir,     "--max-output",
      std::to_string(options_.max_output / 1024)};
  int64_t deadline = DeadlineMillis(program);
  KJ_LOG(INFO, "Running program", sandbox.id, deadline);

  sandbox::ProcessOutcome outcome;
  std::string error_msg;
  if (!runtime_.Exec(sandbox.container_id, args, input, deadline, &outcome,
                     &error_msg)) {
    return Fault(FaultKind::INTERNAL, "Cannot start the box: " + error_msg);
  }
  if (outcome.timed_out) {
    return Fault(FaultKind::TIMEOUT,
                 "Execution exceeded " +
                     std::to_string(program.timeout_seconds) + " seconds");
  }
  if (outcome.stdout_truncated) {
    KJ_LOG(WARNING, "Box response too large", sandbox.id,
           outcome.stdout_data.size());
    return Fault(FaultKind::OUTPUT_LIMIT,
                 "Box response exceeds " +
                     std::to_string(outcome.stdout_data.size()) + " bytes");
  }
  if (outcome.exit_code != 0 || outcome.stdout_data.empty()) {
    KJ_LOG(WARNING, "Box failed", sandbox.id, outcome.exit_code,
           Tail(outcome.stderr_data, 1000));
    return Fault(FaultKind::INTERNAL,
                 "Box exited with code " + std::to_string(outcome.exit_code));
  }

  kj::Array<capnp::word> response_words = kj::heapArray<capnp::word>(
      outcome.stdout_data.size() / sizeof(capnp::word));
  memcpy(response_words.begin(), outcome.stdout_data.data(),
         response_words.size() * sizeof(capnp::word));
  capnp::ReaderOptions reader_options;
  reader_options.traversalLimitInWords = 1024 * 1024 * 1024;
  reader_options.nestingLimit = 128;
  kj::Maybe<Outcome> decoded;
  KJ_IF_MAYBE(exc, kj::runCatchingExceptions([&]() {
                capnp::FlatArrayMessageReader reader(response_words,
                                                     reader_options);
                decoded = Decode(reader.getRoot<capnproto::BoxResponse>());
              })) {
    KJ_LOG(WARNING, "Malformed box response", sandbox.id,
           exc->getDescription());
    return Fault(FaultKind::INTERNAL,
                 kj::str("Malformed box response: ", exc->getDescription())
                     .cStr());
  }
  KJ_IF_MAYBE(result, decoded) { return kj::mv(*result); }
  return Fault(FaultKind::INTERNAL, "Empty box response");
}

}  // namespace worker
