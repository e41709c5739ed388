#ifndef CLIENT_MAIN_HPP
#define CLIENT_MAIN_HPP
#include <string>
#include <vector>

#include <kj/main.h>

namespace client {

// `rexec client <command>`: talks to a running server.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainFunc getMain();

 private:
  kj::MainFunc Execute();
  kj::MainFunc Validate();
  kj::MainFunc Status();
  kj::MainFunc Cancel();
  kj::MainFunc CreateSandbox();
  kj::MainFunc DestroySandbox();
  kj::MainFunc ListSandboxes();

  kj::MainBuilder::Validity SetProgram(kj::StringPtr path);
  kj::MainBuilder::Validity SetInput(kj::StringPtr path);
  kj::MainBuilder::Validity SetTarget(kj::StringPtr id);

  kj::MainBuilder::Validity RunExecute();
  kj::MainBuilder::Validity RunValidate();
  kj::MainBuilder::Validity RunStatus();
  kj::MainBuilder::Validity RunCancel();
  kj::MainBuilder::Validity RunCreateSandbox();
  kj::MainBuilder::Validity RunDestroySandbox();
  kj::MainBuilder::Validity RunListSandboxes();

  kj::ProcessContext& context;
  std::string code_;
  std::string input_;
  bool has_input_ = false;
  // Execution or sandbox id given as argument.
  std::string target_;
  std::vector<std::string> dependencies_;
  int32_t timeout_seconds_ = 30;
  int32_t memory_mb_ = 512;
  double cpu_limit_ = 1.0;
  int32_t disk_mb_ = 256;
  bool network_ = false;
  bool persistent_ = false;
  std::string sandbox_id_;
  std::string task_id_;
  std::string language_ = "python";
  std::string owner_;
  std::string status_;
  std::string reason_;
};

// `rexec check <file>`: runs the security validator locally.
class CheckMain {
 public:
  explicit CheckMain(kj::ProcessContext* context) : context(*context) {}
  kj::MainFunc getMain();

 private:
  kj::MainBuilder::Validity SetProgram(kj::StringPtr path);
  kj::MainBuilder::Validity Run();

  kj::ProcessContext& context;
  std::string code_;
  std::string tier_ = "task";
  bool network_ = false;
};

}  // namespace client
#endif
