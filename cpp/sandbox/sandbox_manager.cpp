#include "sandbox/sandbox_manager.hpp"

#include <kj/debug.h>

namespace sandbox {

Sandbox SandboxManager::Create(const std::string& owner,
                               const SandboxConfig& config, bool persistent) {
  std::string id = ids_.NextId("sbx");
  {
    std::lock_guard<std::mutex> lck(mutex_);
    Entry& entry = sandboxes_[id];
    entry.sandbox.id = id;
    entry.sandbox.status = SandboxStatus::CREATING;
    entry.sandbox.config = config;
    entry.sandbox.owner_id = owner;
    entry.sandbox.persistent = persistent;
    entry.sandbox.created_at = clock_.NowMillis();
  }

  ContainerSpec spec;
  spec.name = "rexec-" + id;
  spec.config = config;
  spec.labels["rexec.sandbox"] = id;
  spec.labels["rexec.owner"] = owner;
  std::string container_id;
  std::string error_msg;
  bool created = runtime_.Create(spec, &container_id, &error_msg);

  std::string reason;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    Entry& entry = sandboxes_[id];
    if (!created) {
      entry.sandbox.status = SandboxStatus::ERROR;
      entry.sandbox.destroyed_at = clock_.NowMillis();
      entry.sandbox.destroy_reason = error_msg;
    } else if (entry.pending_destroy) {
      entry.sandbox.container_id = container_id;
      entry.sandbox.status = SandboxStatus::CLEANING;
      reason = entry.sandbox.destroy_reason;
    } else {
      entry.sandbox.container_id = container_id;
      entry.sandbox.status = SandboxStatus::READY;
      KJ_LOG(INFO, "Sandbox ready", id, container_id, owner);
      return entry.sandbox;
    }
  }

  if (created) {
    Teardown(id, container_id, reason);
    KJ_FAIL_REQUIRE("Sandbox destroyed while being created", id);
  }
  KJ_LOG(WARNING, "Sandbox creation failed", id, error_msg);
  if (!CheckHealth()) {
    kj::throwFatalException(KJ_EXCEPTION(
        DISCONNECTED, "Container runtime unreachable", error_msg));
  }
  KJ_FAIL_REQUIRE("Sandbox creation failed", error_msg);
}

bool SandboxManager::CheckHealth() {
  bool healthy = runtime_.Ping();
  std::lock_guard<std::mutex> lck(health_mutex_);
  healthy_ = healthy;
  checked_at_ = clock_.NowMillis();
  if (!healthy) KJ_LOG(WARNING, "Container runtime unreachable");
  return healthy;
}

bool SandboxManager::RuntimeAvailable() {
  {
    std::lock_guard<std::mutex> lck(health_mutex_);
    if (checked_at_ != 0 &&
        clock_.NowMillis() - checked_at_ < kHealthTtlMillis) {
      return healthy_;
    }
  }
  return CheckHealth();
}

bool SandboxManager::Teardown(const std::string& id,
                              const std::string& container_id,
                              const std::string& reason) {
  std::string error_msg;
  bool removed =
      container_id.empty() || runtime_.Remove(container_id, &error_msg);
  std::lock_guard<std::mutex> lck(mutex_);
  Sandbox& sandbox = sandboxes_[id].sandbox;
  sandbox.current_execution.clear();
  if (removed) {
    sandbox.status = SandboxStatus::DESTROYED;
    sandbox.destroyed_at = clock_.NowMillis();
    sandbox.destroy_reason = reason;
    KJ_LOG(INFO, "Sandbox destroyed", id, reason);
  } else {
    sandbox.status = SandboxStatus::ERROR;
    sandbox.destroy_reason = error_msg;
    KJ_LOG(ERROR, "Sandbox teardown failed", id, error_msg);
  }
  return removed;
}

bool SandboxManager::Destroy(const std::string& id, const std::string& reason) {
  std::string container_id;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    auto it = sandboxes_.find(id);
    if (it == sandboxes_.end()) return true;
    Entry& entry = it->second;
    switch (entry.sandbox.status) {
      case SandboxStatus::DESTROYED:
      case SandboxStatus::CLEANING:
        return true;
      case SandboxStatus::CREATING:
        entry.pending_destroy = true;
        entry.sandbox.destroy_reason = reason;
        return true;
      case SandboxStatus::ERROR:
        // Creation failures have no container; failed teardowns are retried.
        if (entry.sandbox.container_id.empty()) return true;
        break;
      case SandboxStatus::READY:
      case SandboxStatus::BUSY:
        break;
    }
    entry.sandbox.status = SandboxStatus::CLEANING;
    container_id = entry.sandbox.container_id;
  }
  return Teardown(id, container_id, reason);
}

std::vector<Sandbox> SandboxManager::List(kj::Maybe<std::string> owner,
                                          kj::Maybe<SandboxStatus> status) {
  std::vector<Sandbox> out;
  std::lock_guard<std::mutex> lck(mutex_);
  for (const auto& kv : sandboxes_) {
    const Sandbox& sandbox = kv.second.sandbox;
    KJ_IF_MAYBE(o, owner) {
      if (sandbox.owner_id != *o) continue;
    }
    KJ_IF_MAYBE(s, status) {
      if (sandbox.status != *s) continue;
    }
    out.push_back(sandbox);
  }
  return out;
}

kj::Maybe<Sandbox> SandboxManager::Get(const std::string& id) {
  std::lock_guard<std::mutex> lck(mutex_);
  auto it = sandboxes_.find(id);
  if (it == sandboxes_.end()) return nullptr;
  return it->second.sandbox;
}

bool SandboxManager::Acquire(const std::string& id,
                             const std::string& execution_id,
                             std::string* error) {
  std::lock_guard<std::mutex> lck(mutex_);
  auto it = sandboxes_.find(id);
  if (it == sandboxes_.end()) {
    *error = "Sandbox not found: " + id;
    return false;
  }
  Sandbox& sandbox = it->second.sandbox;
  if (sandbox.status == SandboxStatus::BUSY) {
    *error = "Sandbox busy: " + id + " is running " + sandbox.current_execution;
    return false;
  }
  if (sandbox.status != SandboxStatus::READY) {
    *error = std::string("Sandbox not ready: ") + id + " is " +
             StatusName(sandbox.status);
    return false;
  }
  sandbox.status = SandboxStatus::BUSY;
  sandbox.current_execution = execution_id;
  return true;
}

void SandboxManager::Release(const std::string& id) {
  std::lock_guard<std::mutex> lck(mutex_);
  auto it = sandboxes_.find(id);
  if (it == sandboxes_.end()) return;
  Sandbox& sandbox = it->second.sandbox;
  if (sandbox.status != SandboxStatus::BUSY) return;
  sandbox.status = SandboxStatus::READY;
  sandbox.current_execution.clear();
}

}  // namespace sandbox
