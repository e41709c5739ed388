#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP
#include <cstdint>
#include <string>

namespace sandbox {

enum class SandboxStatus { CREATING, READY, BUSY, CLEANING, ERROR, DESTROYED };

const char* StatusName(SandboxStatus status);

// Parses the names returned by StatusName. Returns false on unknown names.
bool ParseStatus(const std::string& name, SandboxStatus* status);

inline bool IsTerminal(SandboxStatus status) {
  return status == SandboxStatus::DESTROYED || status == SandboxStatus::ERROR;
}

enum class NetworkMode { NONE, BRIDGE };

struct SandboxConfig {
  double cpu_limit = 1.0;
  int64_t memory_mb = 512;
  int64_t disk_mb = 256;
  NetworkMode network = NetworkMode::NONE;
  int32_t timeout_seconds = 30;
  int32_t max_procs = 64;
};

struct Sandbox {
  std::string id;
  std::string container_id;
  SandboxStatus status = SandboxStatus::CREATING;
  SandboxConfig config;
  std::string owner_id;
  bool persistent = false;
  // Set exactly when status is BUSY.
  std::string current_execution;
  int64_t created_at = 0;
  int64_t destroyed_at = 0;
  std::string destroy_reason;
};

}  // namespace sandbox

#endif
