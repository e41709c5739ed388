#include "sandbox/sandbox.hpp"

namespace sandbox {
namespace {
const constexpr SandboxStatus kStatuses[] = {
    SandboxStatus::CREATING, SandboxStatus::READY,    SandboxStatus::BUSY,
    SandboxStatus::CLEANING, SandboxStatus::ERROR, SandboxStatus::DESTROYED};
}  // namespace

const char* StatusName(SandboxStatus status) {
  switch (status) {
    case SandboxStatus::CREATING:
      return "creating";
    case SandboxStatus::READY:
      return "ready";
    case SandboxStatus::BUSY:
      return "busy";
    case SandboxStatus::CLEANING:
      return "cleaning";
    case SandboxStatus::ERROR:
      return "error";
    case SandboxStatus::DESTROYED:
      return "destroyed";
  }
  return "error";
}

bool ParseStatus(const std::string& name, SandboxStatus* status) {
  for (SandboxStatus s : kStatuses) {
    if (name == StatusName(s)) {
      *status = s;
      return true;
    }
  }
  return false;
}

}  // namespace sandbox
