#include "util/daemon.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <cstdlib>
#include <fstream>

#include <kj/debug.h>

#include "util/file.hpp"

namespace util {

void daemonize(const std::string& scope, std::string pidfile) {
  if (pidfile.empty()) {
    const char* runtime_dir = std::getenv("XDG_RUNTIME_DIR");
    std::string base = runtime_dir != nullptr ? runtime_dir : "/tmp";
    pidfile = File::JoinPath(base, "rexec-" + scope + ".pid");
  }
  pid_t pid;
  KJ_SYSCALL(pid = fork());
  if (pid > 0) _Exit(0);
  KJ_SYSCALL(setsid());
  KJ_SYSCALL(pid = fork());
  if (pid > 0) _Exit(0);
  umask(022);

  int null_fd;
  KJ_SYSCALL(null_fd = open("/dev/null", O_RDWR | O_CLOEXEC));
  KJ_SYSCALL(dup2(null_fd, STDIN_FILENO));
  KJ_SYSCALL(dup2(null_fd, STDOUT_FILENO));
  KJ_SYSCALL(dup2(null_fd, STDERR_FILENO));
  close(null_fd);

  std::ofstream pid_out(pidfile);
  KJ_REQUIRE(static_cast<bool>(pid_out), pidfile, "Cannot write the pidfile");
  pid_out << getpid() << std::endl;
}

}  // namespace util
