#include "server/main.hpp"

#include <capnp/ez-rpc.h>
#include <kj/debug.h>

#include "sandbox/docker.hpp"
#include "sandbox/sandbox_manager.hpp"
#include "security/parser.hpp"
#include "security/validator.hpp"
#include "server/audit.hpp"
#include "server/authorization.hpp"
#include "server/orchestrator.hpp"
#include "server/server.hpp"
#include "util/clock.hpp"
#include "util/daemon.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"
#include "worker/executor.hpp"

namespace server {
kj::MainBuilder::Validity Main::Run() {
  if (Flags::daemon) {
    util::daemonize("server", Flags::pidfile);
  }
  util::LogManager log_manager(context);

  sandbox::DockerOptions docker_options;
  docker_options.docker = Flags::docker;
  docker_options.host = Flags::docker_host;
  docker_options.image = Flags::image;
  sandbox::DockerRuntime runtime(std::move(docker_options));
  if (!runtime.Ping()) {
    KJ_LOG(WARNING, "Container runtime unreachable, executions will fail",
           Flags::docker_host);
  }

  util::SystemClock clock;
  util::RandomIdGenerator ids;
  sandbox::SandboxManager sandboxes(&runtime, &clock, &ids);

  worker::ExecutorOptions executor_options;
  executor_options.box_command = Flags::box_command;
  executor_options.grace_millis = Flags::grace_millis;
  executor_options.install_timeout_millis =
      static_cast<int64_t>(Flags::install_timeout) * 1000;
  executor_options.max_output = static_cast<size_t>(Flags::max_output_kb) * 1024;
  worker::Executor executor(&runtime, std::move(executor_options));

  security::PythonParser parser;
  security::Validator validator(&parser);
  AgentIdAuthorizer authorizer;
  kj::Own<AuditSink> audit;
  if (Flags::audit_log.empty()) {
    audit = kj::heap<LogAuditSink>();
  } else {
    audit = kj::heap<FileAuditSink>(Flags::audit_log);
  }

  OrchestratorOptions options;
  options.max_running = Flags::max_running;
  options.max_procs = Flags::max_procs;
  Orchestrator orchestrator(std::move(options), &sandboxes, &executor,
                            &validator, &authorizer, audit.get(), &clock,
                            &ids);

  capnp::EzRpcServer server(kj::heap<server::Server>(&orchestrator),
                            Flags::listen_address, Flags::port);
  KJ_LOG(INFO, "Listening", Flags::listen_address, Flags::port);
  kj::NEVER_DONE.wait(server.getWaitScope());
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, "rexec server (" + util::version + ")",
                         "Runs untrusted programs in disposable containers")
      .addOption({'v', "verbose"}, util::setBool(&Flags::verbose),
                 "Log more messages")
      .addOptionWithArg({'L', "logfile"}, util::setString(&Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'d', "daemon"}, util::setBool(&Flags::daemon),
                 "Become a daemon")
      .addOptionWithArg({'P', "pidfile"}, util::setString(&Flags::pidfile),
                        "<PIDFILE>", "Path where the pidfile should be stored")
      .addOptionWithArg({'l', "address"},
                        util::setString(&Flags::listen_address), "<ADDRESS>",
                        "Address to listen on")
      .addOptionWithArg({'p', "port"}, util::setInt(&Flags::port), "<PORT>",
                        "Port to listen on")
      .addOptionWithArg({'j', "max-running"},
                        util::setInt(&Flags::max_running), "<N>",
                        "Maximum number of executions running at once")
      .addOptionWithArg({"docker"}, util::setString(&Flags::docker),
                        "<PATH>", "docker executable")
      .addOptionWithArg({'H', "docker-host"},
                        util::setString(&Flags::docker_host), "<HOST>",
                        "Docker daemon to connect to")
      .addOptionWithArg({'i', "image"}, util::setString(&Flags::image),
                        "<IMAGE>", "Image of the sandbox containers")
      .addOptionWithArg({"box-command"}, util::setString(&Flags::box_command),
                        "<PATH>", "Path of rexec inside the image")
      .addOptionWithArg({"grace"}, util::setInt(&Flags::grace_millis), "<MS>",
                        "Extra time given to a box before it is abandoned")
      .addOptionWithArg({"install-timeout"},
                        util::setInt(&Flags::install_timeout), "<SECONDS>",
                        "Time allowed for dependency installation")
      .addOptionWithArg({"max-procs"}, util::setInt(&Flags::max_procs), "<N>",
                        "Process limit of each sandbox")
      .addOptionWithArg({"max-output"}, util::setInt(&Flags::max_output_kb),
                        "<KB>", "Kilobytes of each output stream to keep")
      .addOptionWithArg({'A', "audit-log"}, util::setString(&Flags::audit_log),
                        "<FILE>", "Append audit events to FILE instead of the log")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace server
