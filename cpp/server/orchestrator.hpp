#ifndef SERVER_ORCHESTRATOR_HPP
#define SERVER_ORCHESTRATOR_HPP
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <kj/function.h>

#include "sandbox/sandbox_manager.hpp"
#include "security/validator.hpp"
#include "server/audit.hpp"
#include "server/authorization.hpp"
#include "server/execution.hpp"
#include "server/record_store.hpp"
#include "util/clock.hpp"
#include "worker/executor.hpp"

namespace server {

struct OrchestratorOptions {
  // Executions admitted at the same time; more are rejected as OVERLOADED.
  int32_t max_running = 8;
  Limits limits;
  // Process ceiling of each sandbox.
  int32_t max_procs = 64;
};

struct SandboxRequest {
  int32_t timeout_seconds = 30;
  int64_t memory_mb = 512;
  double cpu_limit = 1.0;
  int64_t disk_mb = 256;
  bool network_enabled = false;
  bool persistent = false;
};

// Drives each execution through validation, provisioning, execution,
// summarization and teardown, and owns the execution records.
//
// Service-level failures (invalid request, capacity, unreachable runtime,
// missing privileges) are thrown as kj::Exceptions before anything is
// recorded. Everything that happens to an accepted execution ends up in its
// record instead.
class Orchestrator {
 public:
  using Callback = kj::Function<void(const ExecutionRecord&)>;

  Orchestrator(OrchestratorOptions options,
               sandbox::SandboxManager* sandboxes, worker::Executor* executor,
               const security::Validator* validator, Authorizer* authorizer,
               AuditSink* audit, util::Clock* clock, util::IdGenerator* ids)
      : options_(std::move(options)),
        sandboxes_(*sandboxes),
        executor_(*executor),
        validator_(*validator),
        authorizer_(*authorizer),
        audit_(*audit),
        clock_(*clock),
        ids_(*ids) {}

  // Waits for the threads started by Submit and Spawn.
  ~Orchestrator();

  KJ_DISALLOW_COPY(Orchestrator);

  // Runs an execution on the calling thread and returns its final record.
  ExecutionRecord Execute(const ExecutionRequest& request);

  // Starts an execution on its own thread and returns its id. on_done is
  // called, on that thread, with the final record.
  std::string Submit(const ExecutionRequest& request, Callback on_done);

  // Runs work on a new thread with its own LogManager tagged with tag. The
  // destructor waits for it. Exceptions escaping work are logged.
  void Spawn(const std::string& tag, kj::Function<void()> work);

  // Dry run of the security check. Never touches sandboxes.
  security::SecurityCheckResult Validate(const std::string& code,
                                         const std::string& language,
                                         const std::string& caller_id,
                                         bool network_requested = false);

  // Requests cancellation of a pending or running execution. Returns false
  // if it is unknown or already finished.
  bool Cancel(const std::string& execution_id, const std::string& caller_id);

  // Only the submitting caller and Head of Council may read a record.
  kj::Maybe<ExecutionRecord> Get(const std::string& execution_id,
                                 const std::string& caller_id);

  sandbox::Sandbox CreateSandbox(const std::string& caller_id,
                                 const SandboxRequest& request);
  bool DestroySandbox(const std::string& caller_id,
                      const std::string& sandbox_id,
                      const std::string& reason);
  // Callers below Head of Council only see their own sandboxes.
  std::vector<sandbox::Sandbox> ListSandboxes(
      const std::string& caller_id, kj::Maybe<std::string> owner,
      kj::Maybe<sandbox::SandboxStatus> status);

  int32_t Running() const { return running_; }
  // Cancellation flags not yet cleared by a finished execution.
  size_t PendingCancellations();

 private:
  // Checks the request, applies admission control and records it as pending.
  ExecutionRecord Accept(const ExecutionRequest& request);
  // Runs an accepted execution to a terminal state. Never throws.
  ExecutionRecord Run(ExecutionRecord record);
  ExecutionRecord Process(ExecutionRecord record);
  // Stores the terminal record, audits it and frees its admission slot.
  ExecutionRecord Finish(ExecutionRecord record);
  void Store(const ExecutionRecord& record);
  bool IsCancelled(const std::string& execution_id);

  // Obtains the sandbox for a running record. Returns false, after marking
  // the record failed, if there is none.
  bool Provision(ExecutionRecord* record, sandbox::Sandbox* sandbox);

  OrchestratorOptions options_;
  sandbox::SandboxManager& sandboxes_;
  worker::Executor& executor_;
  const security::Validator& validator_;
  Authorizer& authorizer_;
  AuditSink& audit_;
  util::Clock& clock_;
  util::IdGenerator& ids_;
  RecordStore store_;

  std::atomic<int32_t> running_{0};

  std::mutex active_mutex_;
  // Execution id to the sandbox it runs in.
  std::map<std::string, std::string> active_sandboxes_;
  std::set<std::string> cancelled_;

  std::mutex threads_mutex_;
  std::condition_variable threads_done_;
  int32_t threads_ = 0;
};

}  // namespace server

#endif
