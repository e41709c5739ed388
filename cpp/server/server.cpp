#include "server/server.hpp"

#include <kj/async.h>
#include <kj/debug.h>

namespace server {
namespace {

// Runs work on an orchestrator thread and resolves on the event loop. Work
// must own everything it reads: the call context is not touched off the loop.
template <typename T, typename Work>
kj::Promise<T> OffLoop(Orchestrator& orchestrator, const std::string& tag,
                       Work work) {
  auto paf = kj::newPromiseAndCrossThreadFulfiller<T>();
  orchestrator.Spawn(
      tag, [fulfiller = kj::mv(paf.fulfiller), work = kj::mv(work)]() mutable {
        auto failure =
            kj::runCatchingExceptions([&]() { fulfiller->fulfill(work()); });
        KJ_IF_MAYBE(exc, failure) { fulfiller->reject(kj::mv(*exc)); }
      });
  return kj::mv(paf.promise);
}

}  // namespace

ExecutionRequest FromCapnp(capnproto::ExecutionRequest::Reader request) {
  ExecutionRequest out;
  out.caller_id = request.getCallerId();
  out.code = request.getCode();
  out.language = request.getLanguage();
  for (auto dependency : request.getDependencies()) {
    out.dependencies.emplace_back(dependency);
  }
  if (request.getHasInput()) {
    auto input = request.getInput();
    out.input = std::string(reinterpret_cast<const char*>(input.begin()),
                            input.size());
  }
  auto limits = request.getLimits();
  out.timeout_seconds = limits.getTimeoutSeconds();
  out.memory_mb = limits.getMemoryMb();
  out.cpu_limit = limits.getCpuLimit();
  out.disk_mb = limits.getDiskMb();
  out.network_enabled = request.getNetworkEnabled();
  out.task_id = request.getTaskId();
  out.sandbox_id = request.getSandboxId();
  return out;
}

// The enums below are declared in the same order on both sides.

void ToCapnp(const ExecutionRecord& record,
             capnproto::ExecutionResponse::Builder out) {
  out.setExecutionId(record.id);
  out.setStatus(static_cast<capnproto::ExecutionStatus>(record.status));
  KJ_IF_MAYBE(summary, record.summary) {
    worker::ToCapnp(*summary, out.getSummary().initValue());
  } else {
    out.getSummary().setAbsent();
  }
  ToCapnp(record.security, out.initSecurity());
  KJ_IF_MAYBE(fault, record.fault) {
    out.setFault(worker::FaultKindName(*fault));
  }
  out.setError(record.error);
  out.setCreatedAt(record.created_at);
  out.setStartedAt(record.started_at);
  out.setCompletedAt(record.completed_at);
  out.setElapsedMillis(record.ElapsedMillis());
  out.setSandboxId(record.sandbox_id);
  auto usage = out.initUsage();
  usage.setCpuTime(record.usage.cpu_time);
  usage.setSysTime(record.usage.sys_time);
  usage.setWallTime(record.usage.wall_time);
  usage.setMemoryKb(record.usage.memory_kb);
}

void ToCapnp(const security::SecurityCheckResult& check,
             capnproto::SecurityCheck::Builder out) {
  out.setPassed(check.passed);
  auto violations = out.initViolations(check.violations.size());
  for (size_t i = 0; i < check.violations.size(); i++) {
    const security::Violation& violation = check.violations[i];
    violations[i].setKind(security::ViolationKindName(violation.kind));
    violations[i].setDescription(violation.description);
    violations[i].setLine(violation.line);
  }
  out.setSeverity(static_cast<capnproto::Severity>(check.severity));
  out.setRemediation(check.remediation);
}

void ToCapnp(const sandbox::Sandbox& sandbox,
             capnproto::SandboxInfo::Builder out) {
  out.setId(sandbox.id);
  out.setContainerId(sandbox.container_id);
  out.setStatus(static_cast<capnproto::SandboxStatus>(sandbox.status));
  out.setOwnerId(sandbox.owner_id);
  out.setPersistent(sandbox.persistent);
  auto limits = out.initLimits();
  limits.setTimeoutSeconds(sandbox.config.timeout_seconds);
  limits.setMemoryMb(sandbox.config.memory_mb);
  limits.setCpuLimit(sandbox.config.cpu_limit);
  limits.setDiskMb(sandbox.config.disk_mb);
  out.setNetworkEnabled(sandbox.config.network ==
                        sandbox::NetworkMode::BRIDGE);
  out.setCurrentExecution(sandbox.current_execution);
  out.setCreatedAt(sandbox.created_at);
  out.setDestroyedAt(sandbox.destroyed_at);
  out.setDestroyReason(sandbox.destroy_reason);
}

kj::Promise<void> Server::execute(ExecuteContext context) {
  ExecutionRequest request = FromCapnp(context.getParams().getRequest());
  KJ_LOG(INFO, "Execution received", request.caller_id);
  Orchestrator& orchestrator = orchestrator_;
  return OffLoop<ExecutionRecord>(orchestrator_, request.caller_id,
                                  [&orchestrator, request]() {
                                    return orchestrator.Execute(request);
                                  })
      .then([context](ExecutionRecord record) mutable {
        ToCapnp(record, context.getResults().initResponse());
      });
}

kj::Promise<void> Server::validate(ValidateContext context) {
  auto request = context.getParams().getRequest();
  security::SecurityCheckResult check = orchestrator_.Validate(
      request.getCode(), request.getLanguage(), request.getCallerId(),
      request.getNetworkEnabled());
  ToCapnp(check, context.getResults().initResult());
  return kj::READY_NOW;
}

kj::Promise<void> Server::createSandbox(CreateSandboxContext context) {
  auto params = context.getParams();
  auto limits = params.getLimits();
  SandboxRequest request;
  request.timeout_seconds = limits.getTimeoutSeconds();
  request.memory_mb = limits.getMemoryMb();
  request.cpu_limit = limits.getCpuLimit();
  request.disk_mb = limits.getDiskMb();
  request.network_enabled = params.getNetworkEnabled();
  request.persistent = params.getPersistent();
  std::string caller_id = params.getCallerId();
  Orchestrator& orchestrator = orchestrator_;
  return OffLoop<sandbox::Sandbox>(orchestrator_, caller_id,
                                   [&orchestrator, caller_id, request]() {
                                     return orchestrator.CreateSandbox(
                                         caller_id, request);
                                   })
      .then([context](sandbox::Sandbox sandbox) mutable {
        ToCapnp(sandbox, context.getResults().initSandbox());
      });
}

kj::Promise<void> Server::destroySandbox(DestroySandboxContext context) {
  auto params = context.getParams();
  std::string caller_id = params.getCallerId();
  std::string sandbox_id = params.getSandboxId();
  std::string reason = params.getReason();
  Orchestrator& orchestrator = orchestrator_;
  return OffLoop<bool>(orchestrator_, caller_id,
                       [&orchestrator, caller_id, sandbox_id, reason]() {
                         return orchestrator.DestroySandbox(caller_id,
                                                            sandbox_id, reason);
                       })
      .then([context](bool destroyed) mutable {
        context.getResults().setDestroyed(destroyed);
      });
}

kj::Promise<void> Server::listSandboxes(ListSandboxesContext context) {
  auto params = context.getParams();
  kj::Maybe<std::string> owner;
  if (params.getOwnerId().size() != 0) owner = std::string(params.getOwnerId());
  kj::Maybe<sandbox::SandboxStatus> status;
  if (params.getStatus().size() != 0) {
    sandbox::SandboxStatus parsed;
    KJ_REQUIRE(sandbox::ParseStatus(params.getStatus(), &parsed),
               "Unknown sandbox status", params.getStatus());
    status = parsed;
  }
  std::vector<sandbox::Sandbox> sandboxes =
      orchestrator_.ListSandboxes(params.getCallerId(), kj::mv(owner), status);
  auto out = context.getResults().initSandboxes(sandboxes.size());
  for (size_t i = 0; i < sandboxes.size(); i++) {
    ToCapnp(sandboxes[i], out[i]);
  }
  return kj::READY_NOW;
}

kj::Promise<void> Server::cancel(CancelContext context) {
  auto params = context.getParams();
  std::string execution_id = params.getExecutionId();
  std::string caller_id = params.getCallerId();
  Orchestrator& orchestrator = orchestrator_;
  return OffLoop<bool>(orchestrator_, caller_id,
                       [&orchestrator, execution_id, caller_id]() {
                         return orchestrator.Cancel(execution_id, caller_id);
                       })
      .then([context](bool cancelled) mutable {
        context.getResults().setCancelled(cancelled);
      });
}

kj::Promise<void> Server::getExecution(GetExecutionContext context) {
  auto params = context.getParams();
  auto found_record =
      orchestrator_.Get(params.getExecutionId(), params.getCallerId());
  KJ_IF_MAYBE(record, found_record) {
    context.getResults().setFound(true);
    ToCapnp(*record, context.getResults().initResponse());
  } else {
    context.getResults().setFound(false);
  }
  return kj::READY_NOW;
}

}  // namespace server
