#include "box/main.hpp"

#include <unistd.h>
#include <cstdio>
#include <cstdlib>

#include <capnp/message.h>
#include <capnp/serialize.h>
#include <kj/debug.h>

#include "box/box.hpp"
#include "box/interpreter.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"
#include "whereami++.h"

namespace box {
kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(context);
  if (!Flags::run_program.empty()) {
    int code = RunProgram(Flags::run_program);
    fflush(stdout);
    fflush(stderr);
    // The interpreter is never finalized: user code may have left threads
    // behind.
    _exit(code);
  }

  // Numeric libraries must not start more threads than the CPU quota.
  for (const char* var : {"OMP_NUM_THREADS", "OPENBLAS_NUM_THREADS",
                          "MKL_NUM_THREADS", "NUMEXPR_NUM_THREADS"}) {
    setenv(var, "1", 0);
  }

  capnp::ReaderOptions reader_options;
  reader_options.traversalLimitInWords = 64 * 1024 * 1024;
  capnp::StreamFdMessageReader reader(STDIN_FILENO, reader_options);
  auto request = reader.getRoot<capnproto::BoxRequest>();

  BoxOptions options;
  options.temp_directory = Flags::temp_directory;
  options.wheelhouse = Flags::wheelhouse;
  options.python = Flags::python;
  options.self = whereami::getExecutablePath();
  options.max_output = static_cast<size_t>(Flags::max_output_kb) * 1024;

  capnp::MallocMessageBuilder builder;
  Box box(std::move(options));
  box.Run(request, builder.initRoot<capnproto::BoxResponse>());
  capnp::writeMessageToFd(STDOUT_FILENO, builder);
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, "rexec box (" + util::version + ")",
                         "Runs one program inside the sandbox container")
      .addOption({'v', "verbose"}, util::setBool(&Flags::verbose),
                 "Log more messages")
      .addOptionWithArg({'T', "temp-dir"},
                        util::setString(&Flags::temp_directory), "<DIR>",
                        "Path where the scratch directories are created")
      .addOptionWithArg({'w', "wheelhouse"},
                        util::setString(&Flags::wheelhouse), "<DIR>",
                        "Local wheels for offline dependency installation")
      .addOptionWithArg({"python"}, util::setString(&Flags::python),
                        "<PYTHON>", "Interpreter used to run pip")
      .addOptionWithArg({"max-output"}, util::setInt(&Flags::max_output_kb),
                        "<KB>", "Kilobytes of each output stream to return")
      .addOptionWithArg({"run-program"}, util::setString(&Flags::run_program),
                        "<DIR>", "Run the program in DIR (internal)")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace box
