#include <signal.h>

#include "box/main.hpp"
#include "client/main.hpp"
#include "server/main.hpp"
#include "util/log_manager.hpp"
#include "util/version.hpp"

class RexecMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit RexecMain(kj::ProcessContext& context)
      : context(context), sm(&context), bm(&context), cm(&context),
        km(&context) {
    // Closed docker pipes must not kill the server.
    signal(SIGPIPE, SIG_IGN);
    util::InstallCrashHandler();
  }
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "rexec (" + util::version + ")",
                           "Runs untrusted programs in sandboxes")
        .addSubCommand("server", KJ_BIND_METHOD(sm, getMain), "run the server")
        .addSubCommand("box", KJ_BIND_METHOD(bm, getMain),
                       "run a program inside a sandbox container")
        .addSubCommand("client", KJ_BIND_METHOD(cm, getMain),
                       "talk to a server")
        .addSubCommand("check", KJ_BIND_METHOD(km, getMain),
                       "validate a program locally")
        .build();
  }

 private:
  kj::ProcessContext& context;
  server::Main sm;
  box::Main bm;
  client::Main cm;
  client::CheckMain km;
};

KJ_MAIN(RexecMain);
