#include "server/audit.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/sha256.hpp"

namespace {

using ::testing::HasSubstr;

server::ExecutionRecord Record() {
  server::ExecutionRecord record;
  record.id = "exec-7";
  record.request.caller_id = "20001";
  record.request.task_id = "task-3";
  record.request.code = "result = input_data\n";
  record.request.input = std::string("42");
  record.status = server::ExecutionStatus::COMPLETED;
  record.completed_at = 1700000000123;
  return record;
}

// NOLINTNEXTLINE
TEST(AuditTest, HashSeparatesCodeFromInput) {
  EXPECT_NE(server::ProgramHash("ab", std::string("c")),
            server::ProgramHash("a", std::string("bc")));
  EXPECT_NE(server::ProgramHash("ab", nullptr),
            server::ProgramHash("ab", std::string("")));
  EXPECT_EQ(server::ProgramHash("ab", std::string("c")),
            server::ProgramHash("ab", std::string("c")));
}

// NOLINTNEXTLINE
TEST(AuditTest, EventHashesCodeAndInput) {
  server::AuditEvent event = server::MakeAuditEvent(Record());
  EXPECT_EQ(event.execution_id, "exec-7");
  EXPECT_EQ(event.caller_id, "20001");
  EXPECT_EQ(event.task_id, "task-3");
  EXPECT_EQ(event.code_hash,
            util::SHA256::Hex("20:result = input_data\n2:42"));
  EXPECT_EQ(event.status, "completed");
  EXPECT_TRUE(event.success);
  EXPECT_EQ(event.timestamp, 1700000000123);

  server::ExecutionRecord failed = Record();
  failed.status = server::ExecutionStatus::TIMEOUT;
  EXPECT_FALSE(server::MakeAuditEvent(failed).success);
}

// NOLINTNEXTLINE
TEST(AuditTest, FileSinkAppends) {
  util::TempDir tmp("/tmp");
  std::string path = util::File::JoinPath(tmp.Path(), "logs/audit.log");
  {
    server::FileAuditSink sink(path);
    sink.Record(server::MakeAuditEvent(Record()));
  }
  {
    server::FileAuditSink sink(path);
    server::ExecutionRecord blocked = Record();
    blocked.id = "exec-8";
    blocked.status = server::ExecutionStatus::BLOCKED;
    sink.Record(server::MakeAuditEvent(blocked));
  }
  std::string content = util::File::ReadHead(path);
  EXPECT_THAT(content, HasSubstr("execution=exec-7 caller=20001 task=task-3"));
  EXPECT_THAT(content, HasSubstr("status=completed success=true\n"));
  EXPECT_THAT(content, HasSubstr("execution=exec-8"));
  EXPECT_THAT(content, HasSubstr("status=blocked success=false\n"));
}

// NOLINTNEXTLINE
TEST(AuditTest, UnwritableFileThrows) {
  EXPECT_THROW(server::FileAuditSink("/proc/rexec/audit.log"),
               std::system_error);
}

}  // namespace
