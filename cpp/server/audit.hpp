#ifndef SERVER_AUDIT_HPP
#define SERVER_AUDIT_HPP
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

#include "server/execution.hpp"

namespace server {

struct AuditEvent {
  std::string execution_id;
  std::string caller_id;
  std::string task_id;
  // ProgramHash of the program and its input.
  std::string code_hash;
  std::string status;
  bool success = false;
  int64_t timestamp = 0;
};

// Hex SHA-256 of the length-prefixed program and input, so that moving bytes
// between the two changes the hash. An absent input differs from an empty one.
std::string ProgramHash(const std::string& code,
                        const kj::Maybe<std::string>& input);

AuditEvent MakeAuditEvent(const ExecutionRecord& record);

// Write-only destination of audit events. Must be thread safe.
class AuditSink {
 public:
  virtual ~AuditSink() = default;
  virtual void Record(const AuditEvent& event) = 0;
};

// Writes events to the log.
class LogAuditSink : public AuditSink {
 public:
  void Record(const AuditEvent& event) override;
};

// Appends events, one `key=value` line each, to a file.
class FileAuditSink : public AuditSink {
 public:
  explicit FileAuditSink(const std::string& path);
  void Record(const AuditEvent& event) override;

 private:
  std::mutex mutex_;
  std::ofstream out_;
};

}  // namespace server

#endif
