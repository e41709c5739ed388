#include "util/subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include <kj/debug.h>

#include "util/which.hpp"

extern char** environ;

namespace util {
namespace {

void CloseFd(int* fd) {
  if (*fd != -1) close(*fd);
  *fd = -1;
}

void Append(std::string* out, bool* truncated, const char* data, size_t len,
            size_t max_output) {
  if (out->size() >= max_output) {
    *truncated = *truncated || len > 0;
    return;
  }
  size_t take = std::min(len, max_output - out->size());
  out->append(data, take);
  if (take < len) *truncated = true;
}

}  // namespace

bool RunSubprocess(const SubprocessOptions& options, SubprocessResult* result,
                   std::string* error_msg) {
  KJ_REQUIRE(!options.args.empty(), "No command given");
  // Writing to a child that already exited must not kill us.
  static const bool sigpipe_ignored = signal(SIGPIPE, SIG_IGN) != SIG_ERR;
  KJ_ASSERT(sigpipe_ignored);
  std::string executable = which(options.args[0]);
  if (executable.empty()) {
    *error_msg = "Cannot find program: " + options.args[0];
    return false;
  }

  int in_pipe[2];
  int out_pipe[2];
  int err_pipe[2];
  if (pipe2(in_pipe, O_CLOEXEC) == -1) {
    *error_msg = "pipe: " + std::string(strerror(errno));
    return false;
  }
  if (pipe2(out_pipe, O_CLOEXEC) == -1 || pipe2(err_pipe, O_CLOEXEC) == -1) {
    *error_msg = "pipe: " + std::string(strerror(errno));
    close(in_pipe[0]);
    close(in_pipe[1]);
    return false;
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_adddup2(&actions, in_pipe[0], STDIN_FILENO);
  posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, err_pipe[1], STDERR_FILENO);

  // Own process group, so that a timeout kills the children too.
  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
  posix_spawnattr_setpgroup(&attr, 0);

  std::vector<std::vector<char>> args_storage;
  std::vector<char*> argv;
  for (const std::string& arg : options.args) {
    args_storage.emplace_back(arg.c_str(), arg.c_str() + arg.size() + 1);
  }
  for (auto& arg : args_storage) argv.push_back(arg.data());
  argv.push_back(nullptr);

  std::vector<std::vector<char>> env_storage;
  std::vector<char*> envp;
  for (char** e = environ; e != nullptr && *e != nullptr; e++) {
    envp.push_back(*e);
  }
  for (const std::string& var : options.env) {
    env_storage.emplace_back(var.c_str(), var.c_str() + var.size() + 1);
  }
  for (auto& var : env_storage) envp.push_back(var.data());
  envp.push_back(nullptr);

  pid_t pid = 0;
  int ret = posix_spawn(&pid, executable.c_str(), &actions, &attr, argv.data(),
                        envp.data());
  posix_spawn_file_actions_destroy(&actions);
  posix_spawnattr_destroy(&attr);
  close(in_pipe[0]);
  close(out_pipe[1]);
  close(err_pipe[1]);
  int stdin_fd = in_pipe[1];
  int stdout_fd = out_pipe[0];
  int stderr_fd = err_pipe[0];
  if (ret != 0) {
    *error_msg = "posix_spawn: " + std::string(strerror(ret));
    CloseFd(&stdin_fd);
    CloseFd(&stdout_fd);
    CloseFd(&stderr_fd);
    return false;
  }
  KJ_LOG(INFO, "Spawned", options.args[0], pid);

  fcntl(stdin_fd, F_SETFL, O_NONBLOCK);
  if (options.input.empty()) CloseFd(&stdin_fd);

  auto start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
  };

  size_t written = 0;
  char buf[64 * 1024];
  bool killed = false;
  while (stdout_fd != -1 || stderr_fd != -1) {
    struct pollfd fds[3];
    int nfds = 0;
    int out_idx = -1;
    int err_idx = -1;
    int in_idx = -1;
    if (stdout_fd != -1) {
      out_idx = nfds;
      fds[nfds++] = {stdout_fd, POLLIN, 0};
    }
    if (stderr_fd != -1) {
      err_idx = nfds;
      fds[nfds++] = {stderr_fd, POLLIN, 0};
    }
    if (stdin_fd != -1) {
      in_idx = nfds;
      fds[nfds++] = {stdin_fd, POLLOUT, 0};
    }
    int wait_millis = 100;
    if (options.timeout_millis != 0 && !killed) {
      int64_t left = options.timeout_millis - elapsed_millis();
      if (left <= 0) {
        KJ_LOG(WARNING, "Subprocess timed out, killing it", pid);
        kill(-pid, SIGKILL);
        killed = true;
        result->timed_out = true;
        CloseFd(&stdin_fd);
        continue;
      }
      wait_millis = static_cast<int>(std::min<int64_t>(left, 100));
    }
    int n = poll(fds, nfds, wait_millis);
    if (n == -1) {
      if (errno == EINTR) continue;
      *error_msg = "poll: " + std::string(strerror(errno));
      kill(-pid, SIGKILL);
      waitpid(pid, nullptr, 0);
      CloseFd(&stdin_fd);
      CloseFd(&stdout_fd);
      CloseFd(&stderr_fd);
      return false;
    }
    if (in_idx != -1 && fds[in_idx].revents != 0) {
      if (fds[in_idx].revents & (POLLERR | POLLHUP)) {
        CloseFd(&stdin_fd);
      } else {
        ssize_t w = write(stdin_fd, options.input.data() + written,
                          options.input.size() - written);
        if (w > 0) written += w;
        if ((w == -1 && errno != EAGAIN && errno != EINTR) ||
            written == options.input.size()) {
          CloseFd(&stdin_fd);
        }
      }
    }
    auto drain = [&buf, &options](int* fd, std::string* out, bool* truncated,
                                  short revents) {
      if (revents == 0) return;
      ssize_t r = read(*fd, buf, sizeof(buf));
      if (r > 0) {
        Append(out, truncated, buf, r, options.max_output);
      } else if (r == 0 || (errno != EAGAIN && errno != EINTR)) {
        CloseFd(fd);
      }
    };
    if (out_idx != -1) {
      drain(&stdout_fd, &result->stdout_data, &result->stdout_truncated,
            fds[out_idx].revents);
    }
    if (err_idx != -1) {
      drain(&stderr_fd, &result->stderr_data, &result->stderr_truncated,
            fds[err_idx].revents);
    }
  }
  CloseFd(&stdin_fd);

  // The streams may be closed while the process is still running.
  int status = 0;
  while (true) {
    int r = waitpid(pid, &status, WNOHANG);
    if (r == pid) break;
    if (r == -1) {
      if (errno == EINTR) continue;
      *error_msg = "waitpid: " + std::string(strerror(errno));
      return false;
    }
    if (!killed && options.timeout_millis != 0 &&
        elapsed_millis() >= options.timeout_millis) {
      kill(-pid, SIGKILL);
      killed = true;
      result->timed_out = true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  result->wall_time_millis = elapsed_millis();
  result->exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 0;
  result->signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
  return true;
}

}  // namespace util
