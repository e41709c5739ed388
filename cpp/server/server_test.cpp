#include "server/server.hpp"

#include <kj/async-io.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/fake_runtime.hpp"

namespace {

using ::testing::HasSubstr;

class ServerTest : public ::testing::Test {
 protected:
  capnp::Request<capnproto::RemoteExecutor::ExecuteParams,
                 capnproto::RemoteExecutor::ExecuteResults>
  ExecuteRequest(const std::string& caller, const std::string& code) {
    auto request = client_.executeRequest();
    auto body = request.initRequest();
    body.setCallerId(caller);
    body.setCode(code);
    return request;
  }

  kj::AsyncIoContext io_ = kj::setupAsyncIo();
  sandbox::FakeRuntime runtime_;
  util::FakeClock clock_;
  util::SequentialIdGenerator ids_;
  sandbox::SandboxManager manager_{&runtime_, &clock_, &ids_};
  worker::Executor executor_{&runtime_, worker::ExecutorOptions()};
  security::PythonParser parser_;
  security::Validator validator_{&parser_};
  server::AgentIdAuthorizer authorizer_;
  server::LogAuditSink audit_;
  server::Orchestrator orchestrator_{server::OrchestratorOptions(),
                                     &manager_,
                                     &executor_,
                                     &validator_,
                                     &authorizer_,
                                     &audit_,
                                     &clock_,
                                     &ids_};
  capnproto::RemoteExecutor::Client client_ =
      kj::heap<server::Server>(&orchestrator_);
};

// NOLINTNEXTLINE
TEST_F(ServerTest, ExecuteReturnsSummary) {
  auto request = ExecuteRequest("30001", "result = input_data\n");
  request.getRequest().setInput(kj::StringPtr("hello").asBytes());
  request.getRequest().setHasInput(true);
  request.getRequest().setTaskId("task-1");
  auto response = request.send().wait(io_.waitScope).getResponse();

  EXPECT_EQ(response.getStatus(), capnproto::ExecutionStatus::COMPLETED);
  EXPECT_EQ(response.getExecutionId(), "exec-1");
  EXPECT_TRUE(response.getSecurity().getPassed());
  ASSERT_TRUE(response.getSummary().isValue());
  auto summary = response.getSummary().getValue();
  EXPECT_TRUE(summary.getSuccess());
  EXPECT_EQ(summary.getResultType(), "str");
  EXPECT_THAT(summary.getPreview().cStr(), HasSubstr("hello"));
  EXPECT_EQ(summary.getStdout(), "ran\n");
  EXPECT_EQ(response.getSandboxId(), "sbx-2");
  EXPECT_EQ(response.getFault(), "");

  auto get = client_.getExecutionRequest();
  get.setCallerId("30001");
  get.setExecutionId("exec-1");
  auto found = get.send().wait(io_.waitScope);
  EXPECT_TRUE(found.getFound());
  EXPECT_EQ(found.getResponse().getStatus(),
            capnproto::ExecutionStatus::COMPLETED);
}

// NOLINTNEXTLINE
TEST_F(ServerTest, BlockedExecutionCarriesViolations) {
  auto request = ExecuteRequest("30001", "import socket\n");
  auto response = request.send().wait(io_.waitScope).getResponse();
  EXPECT_EQ(response.getStatus(), capnproto::ExecutionStatus::BLOCKED);
  EXPECT_TRUE(response.getSummary().isAbsent());
  auto security = response.getSecurity();
  EXPECT_FALSE(security.getPassed());
  EXPECT_EQ(security.getSeverity(), capnproto::Severity::HIGH);
  ASSERT_EQ(security.getViolations().size(), 1);
  EXPECT_EQ(security.getViolations()[0].getKind(), "restricted_import");
  EXPECT_EQ(security.getViolations()[0].getLine(), 1);
  EXPECT_EQ(runtime_.creates, 0);
}

// NOLINTNEXTLINE
TEST_F(ServerTest, InvalidRequestIsAnError) {
  auto request = ExecuteRequest("30001", "x = 1\n");
  request.getRequest().getLimits().setTimeoutSeconds(0);
  EXPECT_ANY_THROW(request.send().wait(io_.waitScope));

  auto unknown = ExecuteRequest("30001", "x = 1\n");
  unknown.getRequest().setLanguage("ruby");
  auto response = unknown.send().wait(io_.waitScope).getResponse();
  EXPECT_EQ(response.getStatus(), capnproto::ExecutionStatus::BLOCKED);
}

// NOLINTNEXTLINE
TEST_F(ServerTest, ValidateOnly) {
  auto request = client_.validateRequest();
  request.initRequest().setCallerId("30001");
  request.getRequest().setCode("import math\nresult = math.pi\n");
  auto result = request.send().wait(io_.waitScope).getResult();
  EXPECT_TRUE(result.getPassed());
  EXPECT_EQ(result.getSeverity(), capnproto::Severity::NONE);
  EXPECT_EQ(runtime_.creates, 0);
}

// NOLINTNEXTLINE
TEST_F(ServerTest, SandboxLifecycle) {
  auto create = client_.createSandboxRequest();
  create.setCallerId("20001");
  create.setPersistent(true);
  create.initLimits().setMemoryMb(1024);
  auto sandbox = create.send().wait(io_.waitScope).getSandbox();
  EXPECT_EQ(sandbox.getStatus(), capnproto::SandboxStatus::READY);
  EXPECT_TRUE(sandbox.getPersistent());
  EXPECT_EQ(sandbox.getLimits().getMemoryMb(), 1024);
  EXPECT_EQ(sandbox.getOwnerId(), "20001");
  std::string id = sandbox.getId();

  auto list = client_.listSandboxesRequest();
  list.setCallerId("20001");
  list.setStatus("ready");
  EXPECT_EQ(list.send().wait(io_.waitScope).getSandboxes().size(), 1);

  auto bad = client_.listSandboxesRequest();
  bad.setCallerId("20001");
  bad.setStatus("sleeping");
  EXPECT_ANY_THROW(bad.send().wait(io_.waitScope));

  auto destroy = client_.destroySandboxRequest();
  destroy.setCallerId("20001");
  destroy.setSandboxId(id);
  EXPECT_TRUE(destroy.send().wait(io_.waitScope).getDestroyed());
  EXPECT_EQ(runtime_.removes, 1);
}

// NOLINTNEXTLINE
TEST_F(ServerTest, UnknownExecution) {
  auto get = client_.getExecutionRequest();
  get.setCallerId("30001");
  get.setExecutionId("exec-404");
  EXPECT_FALSE(get.send().wait(io_.waitScope).getFound());

  auto cancel = client_.cancelRequest();
  cancel.setCallerId("30001");
  cancel.setExecutionId("exec-404");
  EXPECT_FALSE(cancel.send().wait(io_.waitScope).getCancelled());
}

// NOLINTNEXTLINE
TEST_F(ServerTest, ExecutionIsReadableByOwnerAndHeadOnly) {
  auto request = ExecuteRequest("30001", "x = 1\n");
  std::string id =
      request.send().wait(io_.waitScope).getResponse().getExecutionId();

  auto other = client_.getExecutionRequest();
  other.setCallerId("30002");
  other.setExecutionId(id);
  EXPECT_ANY_THROW(other.send().wait(io_.waitScope));

  auto head = client_.getExecutionRequest();
  head.setCallerId("00001");
  head.setExecutionId(id);
  EXPECT_TRUE(head.send().wait(io_.waitScope).getFound());
}

// NOLINTNEXTLINE
TEST_F(ServerTest, ValidateAnswersWhileExecutionRuns) {
  auto request = ExecuteRequest("30001", "while True:\n    pass\n");
  request.getRequest().getLimits().setTimeoutSeconds(60);
  auto pending = request.send();

  for (int i = 0; i < 3000 && runtime_.execs < 1; i++) {
    io_.provider->getTimer()
        .afterDelay(1 * kj::MILLISECONDS)
        .wait(io_.waitScope);
  }
  ASSERT_GE(runtime_.execs, 1);

  auto validate = client_.validateRequest();
  validate.initRequest().setCallerId("30001");
  validate.getRequest().setCode("x = 1\n");
  EXPECT_TRUE(validate.send().wait(io_.waitScope).getResult().getPassed());

  auto cancel = client_.cancelRequest();
  cancel.setCallerId("30001");
  cancel.setExecutionId("exec-1");
  EXPECT_TRUE(cancel.send().wait(io_.waitScope).getCancelled());
  auto response = pending.wait(io_.waitScope).getResponse();
  EXPECT_EQ(response.getStatus(), capnproto::ExecutionStatus::CANCELLED);
}

}  // namespace
