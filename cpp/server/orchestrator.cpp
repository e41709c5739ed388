#include "server/orchestrator.hpp"

#include <thread>

#include <kj/debug.h>

#include "util/log_manager.hpp"

namespace server {

namespace {

sandbox::SandboxConfig ConfigFor(int32_t timeout_seconds, int64_t memory_mb,
                                 double cpu_limit, int64_t disk_mb,
                                 bool network_enabled, int32_t max_procs) {
  sandbox::SandboxConfig config;
  config.cpu_limit = cpu_limit;
  config.memory_mb = memory_mb;
  config.disk_mb = disk_mb;
  config.network = network_enabled ? sandbox::NetworkMode::BRIDGE
                                   : sandbox::NetworkMode::NONE;
  config.timeout_seconds = timeout_seconds;
  config.max_procs = max_procs;
  return config;
}

worker::Program ProgramFor(const ExecutionRequest& request) {
  worker::Program program;
  program.code = request.code;
  program.language = request.language;
  program.dependencies = request.dependencies;
  KJ_IF_MAYBE(input, request.input) { program.input = *input; }
  program.timeout_seconds = request.timeout_seconds;
  program.memory_mb = request.memory_mb;
  program.disk_mb = request.disk_mb;
  program.network_enabled = request.network_enabled;
  return program;
}

}  // namespace

Orchestrator::~Orchestrator() {
  std::unique_lock<std::mutex> lck(threads_mutex_);
  threads_done_.wait(lck, [this]() { return threads_ == 0; });
}

ExecutionRecord Orchestrator::Accept(const ExecutionRequest& request) {
  CheckRequest(request, options_.limits);
  security::Tier tier = authorizer_.TierOf(request.caller_id);

  if (running_.fetch_add(1) >= options_.max_running) {
    running_--;
    kj::throwFatalException(KJ_EXCEPTION(
        OVERLOADED, "Too many executions in progress", options_.max_running));
  }
  if (!sandboxes_.RuntimeAvailable()) {
    running_--;
    kj::throwFatalException(
        KJ_EXCEPTION(DISCONNECTED, "Container runtime unreachable"));
  }

  ExecutionRecord record;
  record.id = ids_.NextId("exec");
  record.request = request;
  record.tier = tier;
  record.status = ExecutionStatus::PENDING;
  record.created_at = clock_.NowMillis();
  if (!store_.Insert(record)) {
    running_--;
    KJ_FAIL_ASSERT("Execution id already in use", record.id);
  }
  KJ_LOG(INFO, "Execution accepted", record.id, request.caller_id,
         security::TierName(tier));
  return record;
}

ExecutionRecord Orchestrator::Execute(const ExecutionRequest& request) {
  return Run(Accept(request));
}

std::string Orchestrator::Submit(const ExecutionRequest& request,
                                 Callback on_done) {
  ExecutionRecord record = Accept(request);
  std::string id = record.id;
  Spawn(id, [this, record, on_done = kj::mv(on_done)]() mutable {
    on_done(Run(record));
  });
  return id;
}

void Orchestrator::Spawn(const std::string& tag, kj::Function<void()> work) {
  {
    std::lock_guard<std::mutex> lck(threads_mutex_);
    threads_++;
  }
  std::thread([this, tag, work = kj::mv(work)]() mutable {
    {
      util::LogManager log_manager(tag);
      KJ_IF_MAYBE(exc, kj::runCatchingExceptions([&]() { work(); })) {
        KJ_LOG(ERROR, "Background work failed", tag, *exc);
      }
    }
    std::lock_guard<std::mutex> lck(threads_mutex_);
    if (--threads_ == 0) threads_done_.notify_all();
  }).detach();
}

ExecutionRecord Orchestrator::Run(ExecutionRecord record) {
  ExecutionRecord result;
  // Empty when Process returned.
  std::string error;
  KJ_IF_MAYBE(exc, kj::runCatchingExceptions(
                       [&]() { result = Process(record); })) {
    error = exc->getDescription().cStr();
  }
  if (error.empty()) return result;

  KJ_LOG(ERROR, "Execution failed unexpectedly", record.id, error);
  auto stored = store_.Get(record.id);
  KJ_IF_MAYBE(current, stored) { record = kj::mv(*current); }
  record.status = ExecutionStatus::FAILED;
  record.fault = worker::FaultKind::INTERNAL;
  record.error = error;
  return Finish(kj::mv(record));
}

ExecutionRecord Orchestrator::Process(ExecutionRecord record) {
  const ExecutionRequest& request = record.request;
  record.security = validator_.Validate(request.code, request.language,
                                        record.tier, request.network_enabled);
  if (!record.security.passed) {
    record.status = ExecutionStatus::BLOCKED;
    record.error = std::string("Blocked by security validation (") +
                   security::SeverityName(record.security.severity) + ")";
    if (!record.security.remediation.empty()) {
      record.error += ": " + record.security.remediation;
    }
    return Finish(kj::mv(record));
  }
  if (IsCancelled(record.id)) {
    record.status = ExecutionStatus::CANCELLED;
    record.error = "Cancelled before start";
    return Finish(kj::mv(record));
  }

  record.status = ExecutionStatus::RUNNING;
  record.started_at = clock_.NowMillis();
  Store(record);

  sandbox::Sandbox box;
  if (!Provision(&record, &box)) return Finish(kj::mv(record));

  bool persistent = !request.sandbox_id.empty();
  bool destroy = !persistent;
  bool cancelled = false;
  {
    std::lock_guard<std::mutex> lck(active_mutex_);
    active_sandboxes_[record.id] = box.id;
    cancelled = cancelled_.count(record.id) > 0;
  }
  record.sandbox_id = box.id;
  Store(record);

  {
    std::string reason = "execution finished";
    auto teardown = kj::defer([&]() {
      {
        std::lock_guard<std::mutex> lck(active_mutex_);
        active_sandboxes_.erase(record.id);
      }
      if (destroy) {
        if (!sandboxes_.Destroy(box.id, reason)) {
          KJ_LOG(ERROR, "Sandbox teardown failed", box.id, record.id);
        }
      } else {
        sandboxes_.Release(box.id);
      }
    });

    if (cancelled) {
      record.status = ExecutionStatus::CANCELLED;
      record.error = "Cancelled";
      reason = "cancelled";
    } else {
      worker::Outcome outcome = executor_.Run(box, ProgramFor(request));
      if (IsCancelled(record.id)) {
        record.status = ExecutionStatus::CANCELLED;
        record.error = "Cancelled";
        reason = "cancelled";
        destroy = true;
      } else if (outcome.is<worker::RawResult>()) {
        worker::RawResult& raw = outcome.get<worker::RawResult>();
        record.status = ExecutionStatus::COMPLETED;
        record.summary = worker::Summarize(raw);
        record.usage = raw.usage;
      } else {
        worker::ExecutionFault& fault = outcome.get<worker::ExecutionFault>();
        record.fault = fault.kind;
        record.error = fault.message;
        record.usage = fault.usage;
        record.summary = worker::SummarizeFault(fault);
        if (fault.kind == worker::FaultKind::TIMEOUT) {
          record.status = ExecutionStatus::TIMEOUT;
          // Whatever the program left running goes with the sandbox.
          reason = "timeout";
          destroy = true;
        } else {
          record.status = ExecutionStatus::FAILED;
        }
      }
    }
  }
  return Finish(kj::mv(record));
}

bool Orchestrator::Provision(ExecutionRecord* record, sandbox::Sandbox* box) {
  const ExecutionRequest& request = record->request;
  std::string error;
  if (!request.sandbox_id.empty()) {
    auto found_existing = sandboxes_.Get(request.sandbox_id);
    KJ_IF_MAYBE(existing, found_existing) {
      if (existing->owner_id != request.caller_id &&
          !security::AtLeast(record->tier, security::Tier::HEAD_OF_COUNCIL)) {
        error = "Sandbox belongs to another caller: " + request.sandbox_id;
      } else if (!existing->persistent) {
        error = "Sandbox is not persistent: " + request.sandbox_id;
      } else if (sandboxes_.Acquire(existing->id, record->id, &error)) {
        *box = *existing;
        return true;
      }
    } else {
      error = "Sandbox not found: " + request.sandbox_id;
    }
  } else {
    sandbox::SandboxConfig config = ConfigFor(
        request.timeout_seconds, request.memory_mb, request.cpu_limit,
        request.disk_mb, request.network_enabled, options_.max_procs);
    KJ_IF_MAYBE(exc, kj::runCatchingExceptions([&]() {
                  *box = sandboxes_.Create(request.caller_id, config, false);
                })) {
      error = exc->getDescription().cStr();
    } else if (sandboxes_.Acquire(box->id, record->id, &error)) {
      return true;
    } else {
      sandboxes_.Destroy(box->id, "provisioning failed");
    }
  }

  KJ_LOG(WARNING, "Sandbox provisioning failed", record->id, error);
  record->status = ExecutionStatus::FAILED;
  record->fault = worker::FaultKind::SANDBOX_PROVISIONING;
  record->error = error;
  return false;
}

ExecutionRecord Orchestrator::Finish(ExecutionRecord record) {
  record.completed_at = clock_.NowMillis();
  Store(record);
  {
    std::lock_guard<std::mutex> lck(active_mutex_);
    active_sandboxes_.erase(record.id);
    cancelled_.erase(record.id);
  }
  audit_.Record(MakeAuditEvent(record));
  running_--;
  KJ_LOG(INFO, "Execution finished", record.id, StatusName(record.status),
         record.ElapsedMillis());
  return record;
}

void Orchestrator::Store(const ExecutionRecord& record) {
  store_.Update(record.id, [&](ExecutionRecord* stored) { *stored = record; });
}

bool Orchestrator::IsCancelled(const std::string& execution_id) {
  std::lock_guard<std::mutex> lck(active_mutex_);
  return cancelled_.count(execution_id) > 0;
}

security::SecurityCheckResult Orchestrator::Validate(
    const std::string& code, const std::string& language,
    const std::string& caller_id, bool network_requested) {
  return validator_.Validate(code, language, authorizer_.TierOf(caller_id),
                             network_requested);
}

kj::Maybe<ExecutionRecord> Orchestrator::Get(const std::string& execution_id,
                                             const std::string& caller_id) {
  auto found_record = store_.Get(execution_id);
  KJ_IF_MAYBE(record, found_record) {
    KJ_REQUIRE(record->request.caller_id == caller_id ||
                   security::AtLeast(authorizer_.TierOf(caller_id),
                                     security::Tier::HEAD_OF_COUNCIL),
               "Not allowed to read this execution", execution_id);
    return kj::mv(*record);
  }
  return nullptr;
}

size_t Orchestrator::PendingCancellations() {
  std::lock_guard<std::mutex> lck(active_mutex_);
  return cancelled_.size();
}

bool Orchestrator::Cancel(const std::string& execution_id,
                          const std::string& caller_id) {
  auto found_record = store_.Get(execution_id);
  KJ_IF_MAYBE(record, found_record) {
    KJ_REQUIRE(record->request.caller_id == caller_id ||
                   security::AtLeast(authorizer_.TierOf(caller_id),
                                     security::Tier::HEAD_OF_COUNCIL),
               "Not allowed to cancel this execution", execution_id);
    if (IsTerminal(record->status)) return false;
    std::string sandbox_id;
    {
      std::lock_guard<std::mutex> lck(active_mutex_);
      // Finish stores the terminal record before taking active_mutex_, so
      // an execution that is not terminal here will clear the flag itself.
      auto found_current = store_.Get(execution_id);
      KJ_IF_MAYBE(current, found_current) {
        if (IsTerminal(current->status)) return false;
      }
      cancelled_.insert(execution_id);
      auto it = active_sandboxes_.find(execution_id);
      if (it != active_sandboxes_.end()) sandbox_id = it->second;
    }
    KJ_LOG(INFO, "Cancelling execution", execution_id, caller_id, sandbox_id);
    // Removing the container kills the program inside it.
    if (!sandbox_id.empty() && !sandboxes_.Destroy(sandbox_id, "cancelled")) {
      KJ_LOG(ERROR, "Sandbox teardown failed", sandbox_id, execution_id);
    }
    return true;
  }
  return false;
}

sandbox::Sandbox Orchestrator::CreateSandbox(const std::string& caller_id,
                                             const SandboxRequest& request) {
  security::Tier tier = authorizer_.TierOf(caller_id);
  KJ_REQUIRE(!request.persistent || security::AtLeast(tier, security::Tier::LEAD),
             "Persistent sandboxes require lead tier or above", caller_id);
  KJ_REQUIRE(
      !request.network_enabled || security::AtLeast(tier, security::Tier::COUNCIL),
      "Network access requires council tier or above", caller_id);
  CheckResources(request.timeout_seconds, request.memory_mb, request.cpu_limit,
                 request.disk_mb, options_.limits);
  return sandboxes_.Create(
      caller_id,
      ConfigFor(request.timeout_seconds, request.memory_mb, request.cpu_limit,
                request.disk_mb, request.network_enabled, options_.max_procs),
      request.persistent);
}

bool Orchestrator::DestroySandbox(const std::string& caller_id,
                                  const std::string& sandbox_id,
                                  const std::string& reason) {
  auto found_existing = sandboxes_.Get(sandbox_id);
  KJ_IF_MAYBE(existing, found_existing) {
    KJ_REQUIRE(existing->owner_id == caller_id ||
                   security::AtLeast(authorizer_.TierOf(caller_id),
                                     security::Tier::HEAD_OF_COUNCIL),
               "Not allowed to destroy this sandbox", sandbox_id);
  }
  return sandboxes_.Destroy(
      sandbox_id, reason.empty() ? "requested by " + caller_id : reason);
}

std::vector<sandbox::Sandbox> Orchestrator::ListSandboxes(
    const std::string& caller_id, kj::Maybe<std::string> owner,
    kj::Maybe<sandbox::SandboxStatus> status) {
  if (!security::AtLeast(authorizer_.TierOf(caller_id),
                         security::Tier::HEAD_OF_COUNCIL)) {
    owner = caller_id;
  }
  return sandboxes_.List(kj::mv(owner), status);
}

}  // namespace server
