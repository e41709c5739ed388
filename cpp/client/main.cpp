#include "client/main.hpp"

#include <iostream>

#include <capnp/ez-rpc.h>
#include <capnp/pretty-print.h>
#include <kj/debug.h>

#include "capnp/rexec.capnp.h"
#include "security/parser.hpp"
#include "security/validator.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace client {
namespace {

// Larger programs are rejected by the server anyway.
const constexpr uint64_t kMaxFileBytes = 16 * 1024 * 1024;

template <typename Reader>
void Print(Reader reader) {
  std::cout << capnp::prettyPrint(reader).flatten().cStr() << std::endl;
}

kj::MainBuilder& CommonOptions(kj::MainBuilder& builder) {
  return builder
      .addOptionWithArg({'s', "server"}, util::setString(&Flags::server),
                        "<ADDRESS>", "Address of the server")
      .addOptionWithArg({'p', "port"}, util::setInt(&Flags::port), "<PORT>",
                        "Port of the server")
      .addOptionWithArg({'c', "caller"}, util::setString(&Flags::caller_id),
                        "<ID>", "Agent id to act as")
      .addOption({'v', "verbose"}, util::setBool(&Flags::verbose),
                 "Log more messages");
}

}  // namespace

kj::MainBuilder::Validity Main::SetProgram(kj::StringPtr path) {
  if (!util::File::Exists(path)) return kj::str("no such file: ", path);
  code_ = util::File::ReadHead(path, kMaxFileBytes);
  return true;
}

kj::MainBuilder::Validity Main::SetInput(kj::StringPtr path) {
  if (!util::File::Exists(path)) return kj::str("no such file: ", path);
  input_ = util::File::ReadHead(path, kMaxFileBytes);
  has_input_ = true;
  return true;
}

kj::MainBuilder::Validity Main::SetTarget(kj::StringPtr id) {
  target_ = id.cStr();
  return true;
}

kj::MainBuilder::Validity Main::RunExecute() {
  util::LogManager log_manager(context);
  capnp::EzRpcClient client(Flags::server, Flags::port);
  auto executor = client.getMain<capnproto::RemoteExecutor>();
  auto request = executor.executeRequest();
  auto body = request.initRequest();
  body.setCallerId(Flags::caller_id);
  body.setCode(code_);
  body.setLanguage(language_);
  auto deps = body.initDependencies(dependencies_.size());
  for (size_t i = 0; i < dependencies_.size(); i++) {
    deps.set(i, dependencies_[i]);
  }
  if (has_input_) {
    body.setInput(kj::arrayPtr(
        reinterpret_cast<const capnp::byte*>(input_.data()), input_.size()));
    body.setHasInput(true);
  }
  auto limits = body.initLimits();
  limits.setTimeoutSeconds(timeout_seconds_);
  limits.setMemoryMb(memory_mb_);
  limits.setCpuLimit(cpu_limit_);
  limits.setDiskMb(disk_mb_);
  body.setNetworkEnabled(network_);
  body.setTaskId(task_id_);
  body.setSandboxId(sandbox_id_);

  auto response = request.send().wait(client.getWaitScope());
  Print(response.getResponse());
  if (response.getResponse().getStatus() !=
      capnproto::ExecutionStatus::COMPLETED) {
    context.exitError("execution did not complete");
  }
  return true;
}

kj::MainBuilder::Validity Main::RunValidate() {
  util::LogManager log_manager(context);
  capnp::EzRpcClient client(Flags::server, Flags::port);
  auto executor = client.getMain<capnproto::RemoteExecutor>();
  auto request = executor.validateRequest();
  auto body = request.initRequest();
  body.setCallerId(Flags::caller_id);
  body.setCode(code_);
  body.setLanguage(language_);
  body.setNetworkEnabled(network_);
  auto response = request.send().wait(client.getWaitScope());
  Print(response.getResult());
  if (!response.getResult().getPassed()) {
    context.exitError("program rejected");
  }
  return true;
}

kj::MainBuilder::Validity Main::RunStatus() {
  util::LogManager log_manager(context);
  capnp::EzRpcClient client(Flags::server, Flags::port);
  auto executor = client.getMain<capnproto::RemoteExecutor>();
  auto request = executor.getExecutionRequest();
  request.setCallerId(Flags::caller_id);
  request.setExecutionId(target_);
  auto response = request.send().wait(client.getWaitScope());
  if (!response.getFound()) return kj::str("unknown execution ", target_);
  Print(response.getResponse());
  return true;
}

kj::MainBuilder::Validity Main::RunCancel() {
  util::LogManager log_manager(context);
  capnp::EzRpcClient client(Flags::server, Flags::port);
  auto executor = client.getMain<capnproto::RemoteExecutor>();
  auto request = executor.cancelRequest();
  request.setCallerId(Flags::caller_id);
  request.setExecutionId(target_);
  auto response = request.send().wait(client.getWaitScope());
  if (!response.getCancelled()) {
    context.exitError(kj::str(target_, " is unknown or already finished"));
  }
  return true;
}

kj::MainBuilder::Validity Main::RunCreateSandbox() {
  util::LogManager log_manager(context);
  capnp::EzRpcClient client(Flags::server, Flags::port);
  auto executor = client.getMain<capnproto::RemoteExecutor>();
  auto request = executor.createSandboxRequest();
  request.setCallerId(Flags::caller_id);
  auto limits = request.initLimits();
  limits.setTimeoutSeconds(timeout_seconds_);
  limits.setMemoryMb(memory_mb_);
  limits.setCpuLimit(cpu_limit_);
  limits.setDiskMb(disk_mb_);
  request.setNetworkEnabled(network_);
  request.setPersistent(persistent_);
  auto response = request.send().wait(client.getWaitScope());
  Print(response.getSandbox());
  return true;
}

kj::MainBuilder::Validity Main::RunDestroySandbox() {
  util::LogManager log_manager(context);
  capnp::EzRpcClient client(Flags::server, Flags::port);
  auto executor = client.getMain<capnproto::RemoteExecutor>();
  auto request = executor.destroySandboxRequest();
  request.setCallerId(Flags::caller_id);
  request.setSandboxId(target_);
  request.setReason(reason_);
  auto response = request.send().wait(client.getWaitScope());
  if (!response.getDestroyed()) {
    context.exitError(kj::str("teardown of ", target_, " failed"));
  }
  return true;
}

kj::MainBuilder::Validity Main::RunListSandboxes() {
  util::LogManager log_manager(context);
  capnp::EzRpcClient client(Flags::server, Flags::port);
  auto executor = client.getMain<capnproto::RemoteExecutor>();
  auto request = executor.listSandboxesRequest();
  request.setCallerId(Flags::caller_id);
  request.setOwnerId(owner_);
  request.setStatus(status_);
  auto response = request.send().wait(client.getWaitScope());
  for (auto sandbox : response.getSandboxes()) Print(sandbox);
  return true;
}

kj::MainFunc Main::Execute() {
  kj::MainBuilder builder(context, "rexec client execute",
                          "Runs a program on the server and prints the "
                          "summary of its result");
  return CommonOptions(builder)
      .addOptionWithArg({'i', "input"}, KJ_BIND_METHOD(*this, SetInput),
                        "<FILE>", "Bind the content of FILE to input_data")
      .addOptionWithArg({'D', "dep"}, util::appendString(&dependencies_),
                        "<REQUIREMENT>", "Install a package before running")
      .addOptionWithArg({'t', "timeout"}, util::setInt(&timeout_seconds_),
                        "<SECONDS>", "Wall clock limit")
      .addOptionWithArg({'m', "memory"}, util::setInt(&memory_mb_), "<MB>",
                        "Memory limit")
      .addOptionWithArg({"cpu"}, util::setDouble(&cpu_limit_), "<CPUS>",
                        "CPU quota")
      .addOptionWithArg({"disk"}, util::setInt(&disk_mb_), "<MB>",
                        "Scratch space limit")
      .addOption({'n', "network"}, util::setBool(&network_),
                 "Allow outbound network access")
      .addOptionWithArg({'S', "sandbox"}, util::setString(&sandbox_id_),
                        "<ID>", "Run inside a persistent sandbox")
      .addOptionWithArg({"task"}, util::setString(&task_id_), "<ID>",
                        "Task id recorded in the audit log")
      .addOptionWithArg({"language"}, util::setString(&language_), "<LANG>",
                        "Language of the program")
      .expectArg("<PROGRAM>", KJ_BIND_METHOD(*this, SetProgram))
      .callAfterParsing(KJ_BIND_METHOD(*this, RunExecute))
      .build();
}

kj::MainFunc Main::Validate() {
  kj::MainBuilder builder(context, "rexec client validate",
                          "Checks a program without running it");
  return CommonOptions(builder)
      .addOption({'n', "network"}, util::setBool(&network_),
                 "Check as if network access was requested")
      .addOptionWithArg({"language"}, util::setString(&language_), "<LANG>",
                        "Language of the program")
      .expectArg("<PROGRAM>", KJ_BIND_METHOD(*this, SetProgram))
      .callAfterParsing(KJ_BIND_METHOD(*this, RunValidate))
      .build();
}

kj::MainFunc Main::Status() {
  kj::MainBuilder builder(context, "rexec client status",
                          "Prints the record of an execution");
  return CommonOptions(builder)
      .expectArg("<EXECUTION>", KJ_BIND_METHOD(*this, SetTarget))
      .callAfterParsing(KJ_BIND_METHOD(*this, RunStatus))
      .build();
}

kj::MainFunc Main::Cancel() {
  kj::MainBuilder builder(context, "rexec client cancel",
                          "Cancels a running execution");
  return CommonOptions(builder)
      .expectArg("<EXECUTION>", KJ_BIND_METHOD(*this, SetTarget))
      .callAfterParsing(KJ_BIND_METHOD(*this, RunCancel))
      .build();
}

kj::MainFunc Main::CreateSandbox() {
  kj::MainBuilder builder(context, "rexec client create-sandbox",
                          "Creates a sandbox");
  return CommonOptions(builder)
      .addOptionWithArg({'t', "timeout"}, util::setInt(&timeout_seconds_),
                        "<SECONDS>", "Default wall clock limit")
      .addOptionWithArg({'m', "memory"}, util::setInt(&memory_mb_), "<MB>",
                        "Memory limit")
      .addOptionWithArg({"cpu"}, util::setDouble(&cpu_limit_), "<CPUS>",
                        "CPU quota")
      .addOptionWithArg({"disk"}, util::setInt(&disk_mb_), "<MB>",
                        "Scratch space limit")
      .addOption({'n', "network"}, util::setBool(&network_),
                 "Allow outbound network access")
      .addOption({"persistent"}, util::setBool(&persistent_),
                 "Keep the sandbox across executions")
      .callAfterParsing(KJ_BIND_METHOD(*this, RunCreateSandbox))
      .build();
}

kj::MainFunc Main::DestroySandbox() {
  kj::MainBuilder builder(context, "rexec client destroy-sandbox",
                          "Destroys a sandbox");
  return CommonOptions(builder)
      .addOptionWithArg({'r', "reason"}, util::setString(&reason_),
                        "<TEXT>", "Reason recorded on the sandbox")
      .expectArg("<SANDBOX>", KJ_BIND_METHOD(*this, SetTarget))
      .callAfterParsing(KJ_BIND_METHOD(*this, RunDestroySandbox))
      .build();
}

kj::MainFunc Main::ListSandboxes() {
  kj::MainBuilder builder(context, "rexec client list-sandboxes",
                          "Lists the sandboxes visible to the caller");
  return CommonOptions(builder)
      .addOptionWithArg({'o', "owner"}, util::setString(&owner_), "<ID>",
                        "Only sandboxes of this owner")
      .addOptionWithArg({"status"}, util::setString(&status_), "<STATUS>",
                        "Only sandboxes in this status")
      .callAfterParsing(KJ_BIND_METHOD(*this, RunListSandboxes))
      .build();
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, "rexec client (" + util::version + ")",
                         "Command line client of the rexec server")
      .addSubCommand("execute", KJ_BIND_METHOD(*this, Execute),
                     "run a program")
      .addSubCommand("validate", KJ_BIND_METHOD(*this, Validate),
                     "check a program without running it")
      .addSubCommand("status", KJ_BIND_METHOD(*this, Status),
                     "show an execution")
      .addSubCommand("cancel", KJ_BIND_METHOD(*this, Cancel),
                     "cancel an execution")
      .addSubCommand("create-sandbox", KJ_BIND_METHOD(*this, CreateSandbox),
                     "create a sandbox")
      .addSubCommand("destroy-sandbox", KJ_BIND_METHOD(*this, DestroySandbox),
                     "destroy a sandbox")
      .addSubCommand("list-sandboxes", KJ_BIND_METHOD(*this, ListSandboxes),
                     "list sandboxes")
      .build();
}

kj::MainBuilder::Validity CheckMain::SetProgram(kj::StringPtr path) {
  if (!util::File::Exists(path)) return kj::str("no such file: ", path);
  code_ = util::File::ReadHead(path, kMaxFileBytes);
  return true;
}

kj::MainBuilder::Validity CheckMain::Run() {
  util::LogManager log_manager(context);
  security::Tier tier;
  if (tier_ == "head_of_council") {
    tier = security::Tier::HEAD_OF_COUNCIL;
  } else if (tier_ == "council") {
    tier = security::Tier::COUNCIL;
  } else if (tier_ == "lead") {
    tier = security::Tier::LEAD;
  } else if (tier_ == "task") {
    tier = security::Tier::TASK;
  } else {
    return kj::str("unknown tier ", tier_);
  }

  security::PythonParser parser;
  security::Validator validator(&parser);
  security::SecurityCheckResult check =
      validator.Validate(code_, "python", tier, network_);
  for (const security::Violation& violation : check.violations) {
    std::cout << violation.line << ": "
              << security::ViolationKindName(violation.kind) << ": "
              << violation.description << std::endl;
  }
  std::cout << "severity: " << security::SeverityName(check.severity)
            << std::endl;
  if (!check.passed) {
    context.exitError(kj::str("rejected: ", check.remediation));
  }
  return true;
}

kj::MainFunc CheckMain::getMain() {
  return kj::MainBuilder(context, "rexec check (" + util::version + ")",
                         "Runs the security validator on a local file")
      .addOptionWithArg({'t', "tier"}, util::setString(&tier_), "<TIER>",
                        "head_of_council, council, lead or task")
      .addOption({'n', "network"}, util::setBool(&network_),
                 "Check as if network access was requested")
      .addOption({'v', "verbose"}, util::setBool(&Flags::verbose),
                 "Log more messages")
      .expectArg("<PROGRAM>", KJ_BIND_METHOD(*this, SetProgram))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}

}  // namespace client
