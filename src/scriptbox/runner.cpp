#include <scriptbox/runner.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <thread>
#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "utils.h"

const char kTimedOutMessage[] = "Script execution timed out";

namespace {

constexpr int kPollIntervalMs = 50;
constexpr auto kReapInterval = std::chrono::milliseconds(10);
constexpr auto kKillGrace = std::chrono::seconds(5);
constexpr size_t kReadBufferSize = 65536;
constexpr int kExecFailStatus = 127;

class Pipe {
  int fd_[2] = {-1, -1};
 public:
  Pipe() = default;
  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;
  ~Pipe() { Close(0); Close(1); }

  bool Open() { return pipe2(fd_, O_CLOEXEC) == 0; }
  int operator[](int i) const { return fd_[i]; }
  void Close(int i) {
    if (fd_[i] >= 0) close(fd_[i]);
    fd_[i] = -1;
  }
};

ProcessResult SpawnFailure(int err) {
  ProcessResult ret;
  ret.exit_code = kExitSentinel;
  ret.err = SanitizeUtf8(std::string("Error executing script: ") + strerror(err));
  spdlog::warn("Failed to spawn process: {}", strerror(err));
  return ret;
}

int DecodeStatus(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return -WTERMSIG(status);
  return kExitSentinel;
}

[[noreturn]] void ReportExecFailure(int report_fd) {
  int err = errno;
  IGNORE_RETURN(write(report_fd, &err, sizeof(err)));
  _exit(kExecFailStatus);
}

// Only async-signal-safe calls between fork and exec
[[noreturn]] void ChildExec(char* const* argv, const char* workdir, int out_fd, int err_fd, int report_fd) {
  // own process group so that the whole tree can be killed on timeout
  setpgid(0, 0);
  signal(SIGPIPE, SIG_DFL);
  int null_fd = open("/dev/null", O_RDONLY);
  if (null_fd < 0) ReportExecFailure(report_fd);
  if (dup2(null_fd, 0) < 0 || dup2(out_fd, 1) < 0 || dup2(err_fd, 2) < 0) {
    ReportExecFailure(report_fd);
  }
  if (chdir(workdir) < 0) ReportExecFailure(report_fd);
  execvp(argv[0], argv);
  ReportExecFailure(report_fd);
}

// Waits up to grace for the child to be reaped, then falls back to a blocking wait
int ReapKilled(pid_t pid) {
  int status = 0;
  auto deadline = std::chrono::steady_clock::now() + kKillGrace;
  while (std::chrono::steady_clock::now() < deadline) {
    pid_t ret = waitpid(pid, &status, WNOHANG);
    if (ret == pid) return status;
    if (ret < 0 && errno != EINTR) {
      spdlog::warn("waitpid {} failed: {}", pid, strerror(errno));
      return status;
    }
    std::this_thread::sleep_for(kReapInterval);
  }
  spdlog::warn("Process {} did not exit {}s after SIGKILL, waiting", pid, kKillGrace.count());
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR);
  return status;
}

// returns false on EOF or error
bool DrainOnce(int fd, std::string& buf) {
  char tmp[kReadBufferSize];
  ssize_t len = read(fd, tmp, sizeof(tmp));
  if (len > 0) {
    buf.append(tmp, len);
    return true;
  }
  if (len < 0 && (errno == EINTR || errno == EAGAIN)) return true;
  return false;
}

} // namespace

std::vector<std::string> ScriptCommand(
    const Interpreters& interpreters, ScriptKind kind, const fs::path& script_path) {
  switch (kind) {
    case ScriptKind::PYTHON: return {interpreters.python, script_path.string()};
    case ScriptKind::SHELL: return {interpreters.shell, script_path.string()};
  }
  __builtin_unreachable();
}

ProcessResult RunBounded(const RunOptions& opt) {
  if (opt.command.empty()) return SpawnFailure(EINVAL);

  std::vector<char*> argv;
  for (auto& i : opt.command) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  std::string workdir = opt.workdir.string();

  Pipe out_pipe, err_pipe, report_pipe;
  if (!out_pipe.Open() || !err_pipe.Open() || !report_pipe.Open()) return SpawnFailure(errno);

  pid_t pid = fork();
  if (pid < 0) return SpawnFailure(errno);
  if (pid == 0) ChildExec(argv.data(), workdir.c_str(), out_pipe[1], err_pipe[1], report_pipe[1]);

  // also set from the parent so that a kill right after fork reaches the group
  setpgid(pid, pid);
  out_pipe.Close(1);
  err_pipe.Close(1);
  report_pipe.Close(1);
  spdlog::debug("Spawned pid={} cwd={} command={} timeout={}ms",
                pid, workdir, fmt::format("{}", opt.command), opt.timeout.count());
  auto deadline = std::chrono::steady_clock::now() + opt.timeout;

  {
    // the report pipe is closed by a successful exec
    int err = 0;
    ssize_t len;
    while ((len = read(report_pipe[0], &err, sizeof(err))) < 0 && errno == EINTR);
    if (len == sizeof(err)) {
      int status;
      while (waitpid(pid, &status, 0) < 0 && errno == EINTR);
      return SpawnFailure(err);
    }
  }

  ProcessResult ret;
  ret.pid = pid;
  std::string out_buf, err_buf;
  struct pollfd fds[2] = {{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}};
  bool reaped = false, status_lost = false;
  int status = 0;
  while (true) {
    if (!reaped) {
      pid_t wait_ret = waitpid(pid, &status, WNOHANG);
      if (wait_ret == pid) {
        reaped = true;
      } else if (wait_ret < 0 && errno != EINTR) {
        // e.g. ECHILD when SIGCHLD is ignored and the child was reaped by the kernel
        spdlog::warn("waitpid {} failed: {}", pid, strerror(errno));
        reaped = true;
        status_lost = true;
      }
    }
    bool streams_open = fds[0].fd >= 0 || fds[1].fd >= 0;
    if (reaped && !streams_open) break;

    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      ret.timed_out = true;
      break;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count() + 1;
    int wait_ms = (int)std::min<long long>(kPollIntervalMs, remaining);
    if (!streams_open) {
      std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
      continue;
    }
    if (poll(fds, 2, wait_ms) < 0) {
      if (errno == EINTR) continue;
      spdlog::warn("poll failed: {}", strerror(errno));
      std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
      continue;
    }
    std::string* bufs[2] = {&out_buf, &err_buf};
    for (int i = 0; i < 2; i++) {
      if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
      if (!DrainOnce(fds[i].fd, *bufs[i])) fds[i].fd = -1; // poll ignores negative fds
    }
  }

  if (ret.timed_out) {
    spdlog::info("Process {} timed out after {}ms, killing its group", pid, opt.timeout.count());
    // descendants may outlive the leader, so the group is killed even if it was reaped
    kill(-pid, SIGKILL);
    if (!reaped) {
      kill(pid, SIGKILL);
      ReapKilled(pid);
    }
    ret.exit_code = kExitSentinel;
    ret.err = kTimedOutMessage;
    return ret;
  }
  ret.exit_code = status_lost ? kExitSentinel : DecodeStatus(status);
  ret.out = SanitizeUtf8(out_buf);
  ret.err = SanitizeUtf8(err_buf);
  spdlog::debug("Process {} exited with {}, stdout {} bytes, stderr {} bytes",
                pid, ret.exit_code, out_buf.size(), err_buf.size());
  return ret;
}
