#ifndef SERVER_SERVER_HPP
#define SERVER_SERVER_HPP

#include "capnp/rexec.capnp.h"
#include "server/orchestrator.hpp"

namespace server {

// Conversions between the wire types and the orchestrator types.
ExecutionRequest FromCapnp(capnproto::ExecutionRequest::Reader request);
void ToCapnp(const ExecutionRecord& record,
             capnproto::ExecutionResponse::Builder out);
void ToCapnp(const security::SecurityCheckResult& check,
             capnproto::SecurityCheck::Builder out);
void ToCapnp(const sandbox::Sandbox& sandbox,
             capnproto::SandboxInfo::Builder out);

// RemoteExecutor capability backed by an Orchestrator. Calls that reach the
// container runtime run on orchestrator threads; the event loop only waits
// for them, so validation and lookups are answered while they block.
class Server : public capnproto::RemoteExecutor::Server {
 public:
  explicit Server(Orchestrator* orchestrator) : orchestrator_(*orchestrator) {}

  kj::Promise<void> execute(ExecuteContext context) override;
  kj::Promise<void> validate(ValidateContext context) override;
  kj::Promise<void> createSandbox(CreateSandboxContext context) override;
  kj::Promise<void> destroySandbox(DestroySandboxContext context) override;
  kj::Promise<void> listSandboxes(ListSandboxesContext context) override;
  kj::Promise<void> cancel(CancelContext context) override;
  kj::Promise<void> getExecution(GetExecutionContext context) override;

 private:
  Orchestrator& orchestrator_;
};

}  // namespace server

#endif
