#ifndef SANDBOX_SANDBOX_MANAGER_HPP
#define SANDBOX_SANDBOX_MANAGER_HPP
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <kj/common.h>

#include "sandbox/runtime.hpp"
#include "sandbox/sandbox.hpp"
#include "util/clock.hpp"

namespace sandbox {

// Registry of sandboxes and their lifecycle. The registry lock is never held
// across runtime calls, so slow container operations do not serialize.
class SandboxManager {
 public:
  SandboxManager(Runtime* runtime, util::Clock* clock, util::IdGenerator* ids)
      : runtime_(*runtime), clock_(*clock), ids_(*ids) {}

  // Creates a ready sandbox. Throws a kj::Exception if the container cannot
  // be created: DISCONNECTED if the runtime is unreachable, FAILED otherwise.
  // The sandbox is left in the registry with status ERROR.
  Sandbox Create(const std::string& owner, const SandboxConfig& config,
                 bool persistent);

  // Destroys a sandbox. Returns true if the sandbox is gone or going away
  // (unknown, destroyed, cleaning or still creating ids included), false if
  // the runtime failed to remove it, in which case its status is ERROR.
  bool Destroy(const std::string& id, const std::string& reason);

  std::vector<Sandbox> List(kj::Maybe<std::string> owner,
                            kj::Maybe<SandboxStatus> status);
  kj::Maybe<Sandbox> Get(const std::string& id);

  // Marks a ready sandbox busy with the given execution. Returns false and
  // sets error if it is unknown, busy or not ready.
  bool Acquire(const std::string& id, const std::string& execution_id,
               std::string* error);
  // Returns a busy sandbox to ready.
  void Release(const std::string& id);

  // Whether the runtime answered its last health check. Checks run at most
  // once per kHealthTtlMillis; a failed Create refreshes the answer.
  bool RuntimeAvailable();

  static const constexpr int64_t kHealthTtlMillis = 5000;

  Runtime& GetRuntime() { return runtime_; }

 private:
  struct Entry {
    Sandbox sandbox;
    // Destroy was called while creating.
    bool pending_destroy = false;
  };

  // Removes the container and records the outcome.
  bool Teardown(const std::string& id, const std::string& container_id,
                const std::string& reason);
  bool CheckHealth();

  Runtime& runtime_;
  util::Clock& clock_;
  util::IdGenerator& ids_;
  std::mutex mutex_;
  std::map<std::string, Entry> sandboxes_;

  std::mutex health_mutex_;
  bool healthy_ = false;
  // 0 until the first check.
  int64_t checked_at_ = 0;
};

}  // namespace sandbox

#endif
