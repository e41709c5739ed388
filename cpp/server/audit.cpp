#include "server/audit.hpp"

#include <cerrno>
#include <system_error>

#include <kj/debug.h>

#include "util/file.hpp"
#include "util/sha256.hpp"

namespace server {

std::string ProgramHash(const std::string& code,
                        const kj::Maybe<std::string>& input) {
  util::SHA256 hasher;
  hasher.Update(std::to_string(code.size()) + ":");
  hasher.Update(code);
  KJ_IF_MAYBE(data, input) {
    hasher.Update(std::to_string(data->size()) + ":");
    hasher.Update(*data);
  } else {
    hasher.Update("-");
  }
  return hasher.FinishHex();
}

AuditEvent MakeAuditEvent(const ExecutionRecord& record) {
  AuditEvent event;
  event.execution_id = record.id;
  event.caller_id = record.request.caller_id;
  event.task_id = record.request.task_id;
  event.code_hash = ProgramHash(record.request.code, record.request.input);
  event.status = StatusName(record.status);
  event.success = record.status == ExecutionStatus::COMPLETED;
  event.timestamp = record.completed_at;
  return event;
}

void LogAuditSink::Record(const AuditEvent& event) {
  KJ_LOG(INFO, "Audit", event.execution_id, event.caller_id, event.task_id,
         event.code_hash, event.status, event.success, event.timestamp);
}

FileAuditSink::FileAuditSink(const std::string& path) {
  std::string dir = util::File::BaseDir(path);
  if (!dir.empty()) util::File::MakeDirs(dir);
  out_.open(path, std::ios::app);
  if (!out_) {
    throw std::system_error(errno, std::system_category(),
                            "Cannot open audit log " + path);
  }
}

void FileAuditSink::Record(const AuditEvent& event) {
  std::lock_guard<std::mutex> lck(mutex_);
  out_ << "time=" << event.timestamp << " execution=" << event.execution_id
       << " caller=" << event.caller_id << " task=" << event.task_id
       << " code_sha256=" << event.code_hash << " status=" << event.status
       << " success=" << (event.success ? "true" : "false") << std::endl;
  if (!out_) KJ_LOG(ERROR, "Audit log write failed", event.execution_id);
}

}  // namespace server
