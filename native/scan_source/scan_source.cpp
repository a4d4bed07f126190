/*
 * scan_source.cpp — Platform scan invocation
 */

#include "scan_source/scan_source.h"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <strings.h>
#include <sys/wait.h>
#include <unistd.h>

#include "common/atomic_file.h"
#include "common/log.h"

namespace wifi_ranger {

static const char *TAG = "SOURCE";

// Exit code of the child when execvp fails.
static constexpr int EXEC_FAILED_EXIT = 127;
static constexpr int POLL_SLICE_MS = 100;

const char *scan_status_name(ScanStatus s) {
  switch (s) {
  case ScanStatus::OK:
    return "OK";
  case ScanStatus::TOOL_NOT_FOUND:
    return "TOOL_NOT_FOUND";
  case ScanStatus::SPAWN_FAILED:
    return "SPAWN_FAILED";
  case ScanStatus::TIMEOUT:
    return "TIMEOUT";
  case ScanStatus::TOOL_FAILED:
    return "TOOL_FAILED";
  case ScanStatus::READ_FAILED:
    return "READ_FAILED";
  case ScanStatus::CANCELLED:
    return "CANCELLED";
  default:
    return "UNKNOWN";
  }
}

const char *scan_backend_name(ScanBackend b) {
  switch (b) {
  case ScanBackend::AIRPORT:
    return "airport";
  case ScanBackend::WPA_CLI:
    return "wpa_cli";
  case ScanBackend::CAPTURE_FILE:
    return "file";
  default:
    return "unknown";
  }
}

bool parse_scan_backend(const std::string &text, ScanBackend *out) {
  if (strcasecmp(text.c_str(), "airport") == 0)
    *out = ScanBackend::AIRPORT;
  else if (strcasecmp(text.c_str(), "wpa_cli") == 0)
    *out = ScanBackend::WPA_CLI;
  else if (strcasecmp(text.c_str(), "file") == 0)
    *out = ScanBackend::CAPTURE_FILE;
  else
    return false;
  return true;
}

// =========================================================================
// CHILD PROCESS
// =========================================================================

namespace {

// Owns the read end of the stdout pipe and the child pid. Whatever path
// leaves scan(), the pipe is closed and the child is killed and reaped.
class ChildProcess {
public:
  ChildProcess() : pid_(-1), fd_(-1) {}
  ~ChildProcess() {
    close_pipe();
    if (pid_ > 0) {
      kill(pid_, SIGKILL);
      int status = 0;
      while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
      }
    }
  }

  ChildProcess(const ChildProcess &) = delete;
  ChildProcess &operator=(const ChildProcess &) = delete;

  bool spawn(const std::vector<std::string> &argv, std::string *reason) {
    int fds[2];
    if (pipe(fds) != 0) {
      *reason = std::string("pipe() failed: ") + std::strerror(errno);
      return false;
    }

    std::vector<char *> args;
    for (const std::string &a : argv)
      args.push_back(const_cast<char *>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
      *reason = std::string("fork() failed: ") + std::strerror(errno);
      close(fds[0]);
      close(fds[1]);
      return false;
    }

    if (pid == 0) {
      if (dup2(fds[1], STDOUT_FILENO) < 0)
        _exit(EXEC_FAILED_EXIT);
      int devnull = open("/dev/null", O_RDWR);
      if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        dup2(devnull, STDERR_FILENO);
        close(devnull);
      }
      close(fds[0]);
      close(fds[1]);
      execvp(args[0], args.data());
      _exit(EXEC_FAILED_EXIT);
    }

    close(fds[1]);
    pid_ = pid;
    fd_ = fds[0];
    return true;
  }

  // Blocking reap after EOF. Returns the raw wait status.
  bool wait_exit(int *status) {
    while (waitpid(pid_, status, 0) < 0) {
      if (errno != EINTR)
        return false;
    }
    pid_ = -1;
    return true;
  }

  void close_pipe() {
    if (fd_ >= 0) {
      close(fd_);
      fd_ = -1;
    }
  }

  pid_t pid() const { return pid_; }
  int fd() const { return fd_; }

private:
  pid_t pid_;
  int fd_;
};

} // namespace

// =========================================================================
// COMMAND SOURCE
// =========================================================================

CommandScanSource::CommandScanSource(std::vector<std::string> argv,
                                     std::chrono::seconds timeout)
    : argv_(std::move(argv)),
      timeout_ms_(std::chrono::duration_cast<std::chrono::milliseconds>(timeout)
                      .count()),
      cancelled_(false), child_pid_(-1) {}

void CommandScanSource::set_timeout(std::chrono::seconds timeout) {
  timeout_ms_.store(
      std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count());
}

void CommandScanSource::cancel() {
  cancelled_.store(true);
  pid_t pid = child_pid_.load();
  if (pid > 0)
    kill(pid, SIGKILL);
}

void CommandScanSource::resume() { cancelled_.store(false); }

std::string CommandScanSource::name() const {
  std::string s;
  for (const std::string &a : argv_) {
    if (!s.empty())
      s += ' ';
    s += a;
  }
  return s;
}

bool CommandScanSource::verify(std::string *reason) const {
  if (argv_.empty()) {
    if (reason)
      *reason = "empty command";
    return false;
  }
  if (!find_executable(argv_[0])) {
    if (reason)
      *reason = "scan tool not found: " + argv_[0];
    return false;
  }
  return true;
}

ScanStatus CommandScanSource::scan(std::string *out, std::string *reason) {
  if (argv_.empty()) {
    *reason = "empty command";
    return ScanStatus::SPAWN_FAILED;
  }
  if (cancelled_.load()) {
    *reason = "cancelled";
    return ScanStatus::CANCELLED;
  }

  ChildProcess child;
  if (!child.spawn(argv_, reason))
    return ScanStatus::SPAWN_FAILED;
  child_pid_.store(child.pid());

  // Clears child_pid_ on every exit path, before ~ChildProcess reaps it.
  struct PidReset {
    std::atomic<pid_t> &pid;
    ~PidReset() { pid.store(-1); }
  } pid_reset{child_pid_};

  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(timeout_ms_.load());
  std::string data;
  char buf[4096];

  while (true) {
    if (cancelled_.load()) {
      *reason = "cancelled";
      return ScanStatus::CANCELLED;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      *reason = "timed out after " + std::to_string(timeout_ms_.load()) + "ms";
      return ScanStatus::TIMEOUT;
    }

    long long left_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)
            .count();
    pollfd pfd;
    pfd.fd = child.fd();
    pfd.events = POLLIN;
    pfd.revents = 0;
    int rc = poll(&pfd, 1,
                  static_cast<int>(left_ms < POLL_SLICE_MS ? left_ms
                                                           : POLL_SLICE_MS));
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      *reason = std::string("poll() failed: ") + std::strerror(errno);
      return ScanStatus::READ_FAILED;
    }
    if (rc == 0)
      continue;

    ssize_t n = read(child.fd(), buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      *reason = std::string("read() failed: ") + std::strerror(errno);
      return ScanStatus::READ_FAILED;
    }
    if (n == 0)
      break; // EOF
    if (data.size() + static_cast<size_t>(n) > MAX_SCAN_OUTPUT_BYTES) {
      *reason = "scan output exceeds limit";
      return ScanStatus::READ_FAILED;
    }
    data.append(buf, static_cast<size_t>(n));
  }

  child.close_pipe();
  child_pid_.store(-1); // no kill() from cancel() once we start reaping
  int status = 0;
  if (!child.wait_exit(&status)) {
    *reason = std::string("waitpid() failed: ") + std::strerror(errno);
    return ScanStatus::TOOL_FAILED;
  }
  if (cancelled_.load()) {
    *reason = "cancelled";
    return ScanStatus::CANCELLED;
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) == EXEC_FAILED_EXIT) {
    *reason = "cannot execute " + argv_[0];
    return ScanStatus::TOOL_NOT_FOUND;
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    *reason = WIFSIGNALED(status)
                  ? "killed by signal " + std::to_string(WTERMSIG(status))
                  : "exit status " + std::to_string(WEXITSTATUS(status));
    return ScanStatus::TOOL_FAILED;
  }

  *out = std::move(data);
  return ScanStatus::OK;
}

std::vector<std::string> airport_scan_argv() { return {AIRPORT_PATH, "-s"}; }

std::vector<std::string> wpa_cli_scan_argv(const std::string &interface) {
  return {"wpa_cli", "-i",
          interface.empty() ? DEFAULT_WPA_INTERFACE : interface,
          "scan_results"};
}

bool find_executable(const std::string &program) {
  if (program.empty())
    return false;
  if (program.find('/') != std::string::npos)
    return access(program.c_str(), X_OK) == 0;

  const char *path_env = std::getenv("PATH");
  std::string path = path_env ? path_env : "/usr/bin:/bin";
  size_t start = 0;
  while (start <= path.size()) {
    size_t colon = path.find(':', start);
    if (colon == std::string::npos)
      colon = path.size();
    std::string dir = path.substr(start, colon - start);
    if (dir.empty())
      dir = ".";
    if (access((dir + "/" + program).c_str(), X_OK) == 0)
      return true;
    start = colon + 1;
  }
  return false;
}

// =========================================================================
// FILE SOURCE
// =========================================================================

FileScanSource::FileScanSource(const std::string &path) : path_(path) {}

ScanStatus FileScanSource::scan(std::string *out, std::string *reason) {
  if (!read_file(path_, out)) {
    *reason = "cannot read " + path_;
    return ScanStatus::READ_FAILED;
  }
  return ScanStatus::OK;
}

bool FileScanSource::verify(std::string *reason) const {
  if (access(path_.c_str(), R_OK) != 0) {
    if (reason)
      *reason = "capture file not readable: " + path_;
    return false;
  }
  return true;
}

std::string FileScanSource::name() const { return "file:" + path_; }

// =========================================================================
// FACTORY
// =========================================================================

std::unique_ptr<ScanSource> make_scan_source(ScanBackend backend,
                                             const std::string &interface,
                                             const std::string &path,
                                             std::chrono::seconds timeout,
                                             std::string *reason) {
  switch (backend) {
  case ScanBackend::AIRPORT:
    return std::unique_ptr<ScanSource>(
        new CommandScanSource(airport_scan_argv(), timeout));
  case ScanBackend::WPA_CLI:
    return std::unique_ptr<ScanSource>(
        new CommandScanSource(wpa_cli_scan_argv(interface), timeout));
  case ScanBackend::CAPTURE_FILE:
    if (path.empty()) {
      if (reason)
        *reason = "file backend needs a capture path";
      return nullptr;
    }
    return std::unique_ptr<ScanSource>(new FileScanSource(path));
  default:
    break;
  }
  if (reason)
    *reason = "unknown scan backend";
  WR_LOG_ERROR(TAG, "unknown scan backend %d", static_cast<int>(backend));
  return nullptr;
}

} // namespace wifi_ranger
