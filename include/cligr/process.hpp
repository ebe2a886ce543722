/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file process.hpp
 * @brief Child process spawn, signalling and liveness probes.
 *
 * Features:
 *   - Subprocess: fork/exec with stdout/stderr on non-blocking pipes,
 *     inherited stdin, non-blocking reap (TryWait) and timed Wait
 *   - Liveness: IsProcessAlive (signal 0), SendSignal
 *   - Identity: ReadProcessExecutable / ProcessMatchesExecutable via
 *     /proc/[pid]/cmdline, used to double-check PIDs read back from disk
 *
 * Linux-only (requires /proc and kill(2)).
 */

#ifndef CLIGR_PROCESS_HPP_
#define CLIGR_PROCESS_HPP_

#include "cligr/platform.hpp"
#include "cligr/vocabulary.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

namespace cligr {

// ============================================================================
// ProcessResult
// ============================================================================

enum class ProcessResult : int8_t {
  kSuccess = 0,
  kNotFound = -1,  ///< No such process (ESRCH)
  kFailed = -2,    ///< Signal delivery refused (EPERM, invalid pid)
};

// ============================================================================
// ExitStatus
// ============================================================================

/// @brief How a child ended; exactly one of exited / signaled is set.
struct ExitStatus {
  bool exited = false;   ///< Normal exit via exit(2)
  int exit_code = -1;    ///< Valid if exited
  bool signaled = false; ///< Terminated by a signal
  int term_signal = 0;   ///< Valid if signaled

  static ExitStatus FromWaitStatus(int status) noexcept {
    ExitStatus es;
    if (WIFEXITED(status)) {
      es.exited = true;
      es.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      es.signaled = true;
      es.term_signal = WTERMSIG(status);
    }
    return es;
  }

  /// @brief Status reported when the child could not be created at all.
  static ExitStatus SpawnFailure() noexcept {
    ExitStatus es;
    es.exited = true;
    es.exit_code = 127;
    return es;
  }
};

namespace detail {

// ============================================================================
// Helper functions
// ============================================================================

/// @brief Sleep for @p ms milliseconds (nanosleep, not deprecated usleep).
inline void SleepMs(uint32_t ms) {
  struct timespec ts;
  ts.tv_sec = static_cast<time_t>(ms / 1000U);
  ts.tv_nsec = static_cast<long>(ms % 1000U) * 1000000L;  // NOLINT
  while (nanosleep(&ts, &ts) != 0 && errno == EINTR) {
  }
}

/// @brief Extract basename from a path (e.g., "/usr/bin/foo" -> "foo").
inline const char* Basename(const char* path) {
  const char* last_slash = nullptr;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/')
      last_slash = p;
  }
  return last_slash ? (last_slash + 1) : path;
}

/// @brief Read content of a /proc file into @p buf (up to buf_size-1 bytes).
/// @return Number of bytes read, or -1 on error.
inline int ReadProcFile(const char* path, char* buf, size_t buf_size) {
  int fd = open(path, O_RDONLY | O_CLOEXEC);  // NOLINT
  if (fd < 0)
    return -1;
  ssize_t n = read(fd, buf, buf_size - 1);
  close(fd);  // NOLINT
  if (n < 0)
    return -1;
  buf[static_cast<size_t>(n)] = '\0';
  return static_cast<int>(n);
}

/// @brief Set a file descriptor to non-blocking mode.
inline bool SetNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0)
    return false;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// ============================================================================
// PipeGuard - RAII wrapper for pipe file descriptors
// ============================================================================

class PipeGuard {
 public:
  PipeGuard() : fd_{-1, -1} {}
  ~PipeGuard() { CloseAll(); }

  /// @brief Both ends close-on-exec; dup2() in the child clears the flag.
  bool Create() { return pipe2(fd_, O_CLOEXEC) == 0; }

  int WriteEnd() const { return fd_[1]; }

  void CloseRead() {
    if (fd_[0] >= 0) {
      close(fd_[0]);
      fd_[0] = -1;
    }  // NOLINT
  }
  void CloseWrite() {
    if (fd_[1] >= 0) {
      close(fd_[1]);
      fd_[1] = -1;
    }  // NOLINT
  }
  void CloseAll() {
    CloseRead();
    CloseWrite();
  }

  /// @brief Release read-end ownership (caller takes responsibility).
  int ReleaseRead() {
    int r = fd_[0];
    fd_[0] = -1;
    return r;
  }

  PipeGuard(const PipeGuard&) = delete;
  PipeGuard& operator=(const PipeGuard&) = delete;

 private:
  int fd_[2];
};

}  // namespace detail

// ============================================================================
// Process query / control functions
// ============================================================================

/// @brief Wall-clock milliseconds since the Unix epoch.
inline int64_t NowEpochMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

/**
 * @brief Check if a PID is occupied (exists and can receive signals).
 *
 * EPERM also counts as alive: the PID exists but belongs to another user.
 */
inline bool IsProcessAlive(pid_t pid) {
  if (pid <= 0)
    return false;
  if (kill(pid, 0) == 0)
    return true;
  return errno == EPERM;
}

/**
 * @brief Send @p signo to @p pid.
 * @return kSuccess, kNotFound if the process is gone, kFailed otherwise.
 */
inline ProcessResult SendSignal(pid_t pid, int signo) {
  if (pid <= 0)
    return ProcessResult::kFailed;
  if (kill(pid, signo) == 0)
    return ProcessResult::kSuccess;
  return (errno == ESRCH) ? ProcessResult::kNotFound : ProcessResult::kFailed;
}

/**
 * @brief Read argv[0] of @p pid from /proc/[pid]/cmdline.
 * @return Empty string if the process is gone or unreadable.
 */
inline std::string ReadProcessExecutable(pid_t pid) {
  char path[64];
  snprintf(path, sizeof(path), "/proc/%d/cmdline", static_cast<int>(pid));
  char buf[512];
  if (detail::ReadProcFile(path, buf, sizeof(buf)) <= 0)
    return std::string();
  // cmdline is NUL-separated; buf stops at the first NUL.
  return std::string(buf);
}

/**
 * @brief Check that @p pid is running @p executable (basename comparison).
 *
 * @note TOCTOU: the PID may be recycled right after the check.
 */
inline bool ProcessMatchesExecutable(pid_t pid, const std::string& executable) {
  if (executable.empty())
    return false;
  std::string running = ReadProcessExecutable(pid);
  if (running.empty())
    return false;
  return std::strcmp(detail::Basename(running.c_str()),
                     detail::Basename(executable.c_str())) == 0;
}

// ============================================================================
// Subprocess - spawn child process with pipe capture
// ============================================================================

/// @brief Subprocess configuration.
struct SubprocessConfig {
  std::vector<std::string> argv;  ///< argv[0] is resolved through PATH
  const char* working_dir = nullptr;  ///< chdir before exec (nullptr = inherit)
  bool capture_stdout = true;   ///< Redirect child stdout to a pipe
  bool capture_stderr = true;   ///< Redirect child stderr to a pipe
  bool new_process_group = false;  ///< setpgid(0, 0) in the child
};

/**
 * @brief Handle to one spawned child.
 *
 * stdin is inherited from the parent. Pipe read ends are non-blocking and
 * close-on-exec; ReleaseStdout()/ReleaseStderr() hand them to an event loop.
 * RAII: destructor SIGKILLs and reaps a child that was never waited for.
 *
 * @code
 *   cligr::SubprocessConfig cfg;
 *   cfg.argv = {"ls", "-la"};
 *   cligr::Subprocess proc;
 *   if (proc.Start(cfg).has_value()) {
 *     cligr::ExitStatus st;
 *     proc.Wait(1000, st);
 *   }
 * @endcode
 */
class Subprocess {
 public:
  Subprocess() : pid_(-1), stdout_fd_(-1), stderr_fd_(-1) {}

  ~Subprocess() { Reset(); }

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  Subprocess(Subprocess&& other) noexcept
      : pid_(other.pid_), stdout_fd_(other.stdout_fd_),
        stderr_fd_(other.stderr_fd_) {
    other.pid_ = -1;
    other.stdout_fd_ = -1;
    other.stderr_fd_ = -1;
  }

  Subprocess& operator=(Subprocess&& other) noexcept {
    if (this != &other) {
      Reset();
      pid_ = other.pid_;
      stdout_fd_ = other.stdout_fd_;
      stderr_fd_ = other.stderr_fd_;
      other.pid_ = -1;
      other.stdout_fd_ = -1;
      other.stderr_fd_ = -1;
    }
    return *this;
  }

  /**
   * @brief Spawn a child process.
   *
   * A missing executable is not reported here: exec fails in the child,
   * which exits with status 127 and is observed like any other exit.
   */
  expected<void, SpawnError> Start(const SubprocessConfig& cfg) {
    if (cfg.argv.empty() || cfg.argv[0].empty())
      return expected<void, SpawnError>::error(SpawnError::kEmptyCommand);

    // Build the exec vector before fork: the child must not allocate.
    std::vector<char*> argv;
    argv.reserve(cfg.argv.size() + 1);
    for (const std::string& a : cfg.argv) {
      argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    detail::PipeGuard stdout_pipe, stderr_pipe;
    if (cfg.capture_stdout && !stdout_pipe.Create())
      return expected<void, SpawnError>::error(SpawnError::kPipeFailed);
    if (cfg.capture_stderr && !stderr_pipe.Create())
      return expected<void, SpawnError>::error(SpawnError::kPipeFailed);

    pid_t child = fork();
    if (child < 0)
      return expected<void, SpawnError>::error(SpawnError::kForkFailed);

    if (child == 0) {
      // -- Child process --
      if (cfg.new_process_group) {
        setpgid(0, 0);
      }

      // Reset signal dispositions and mask (SIG_IGN survives exec)
      struct sigaction sa_dfl;
      std::memset(&sa_dfl, 0, sizeof(sa_dfl));
      sa_dfl.sa_handler = SIG_DFL;
      for (int sig = 1; sig < 32; ++sig) {
        sigaction(sig, &sa_dfl, nullptr);  // ignore errors for uncatchable
      }
      sigset_t none;
      sigemptyset(&none);
      sigprocmask(SIG_SETMASK, &none, nullptr);

      if (cfg.working_dir) {
        if (chdir(cfg.working_dir) != 0)
          _exit(127);
      }

      if (cfg.capture_stdout) {
        stdout_pipe.CloseRead();
        dup2(stdout_pipe.WriteEnd(), STDOUT_FILENO);
        stdout_pipe.CloseWrite();
      }
      if (cfg.capture_stderr) {
        stderr_pipe.CloseRead();
        dup2(stderr_pipe.WriteEnd(), STDERR_FILENO);
        stderr_pipe.CloseWrite();
      }

      execvp(argv[0], argv.data());
      _exit(127);  // exec failed
    }

    // -- Parent process --
    pid_ = child;

    if (cfg.capture_stdout) {
      stdout_pipe.CloseWrite();
      stdout_fd_ = stdout_pipe.ReleaseRead();
      (void)detail::SetNonBlocking(stdout_fd_);
    }
    if (cfg.capture_stderr) {
      stderr_pipe.CloseWrite();
      stderr_fd_ = stderr_pipe.ReleaseRead();
      (void)detail::SetNonBlocking(stderr_fd_);
    }

    return expected<void, SpawnError>::success();
  }

  /// @brief Transfer ownership of the stdout read end (-1 if not captured).
  int ReleaseStdout() {
    int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
  }

  /// @brief Transfer ownership of the stderr read end (-1 if not captured).
  int ReleaseStderr() {
    int fd = stderr_fd_;
    stderr_fd_ = -1;
    return fd;
  }

  /**
   * @brief Reap the child if it has exited, without blocking.
   * @return true if reaped (status filled, handle cleared).
   */
  bool TryWait(ExitStatus& status) {
    if (pid_ <= 0)
      return false;
    int raw = 0;
    pid_t w = waitpid(pid_, &raw, WNOHANG);
    if (w == pid_) {
      status = ExitStatus::FromWaitStatus(raw);
      pid_ = -1;
      return true;
    }
    if (w < 0 && errno == ECHILD) {
      // Reaped elsewhere; nothing more to learn.
      status = ExitStatus();
      pid_ = -1;
      return true;
    }
    return false;
  }

  /**
   * @brief Wait for the child to exit.
   * @param timeout_ms Timeout in milliseconds (0 = wait forever).
   * @return true if the child was reaped, false on timeout.
   */
  bool Wait(uint32_t timeout_ms, ExitStatus& status) {
    if (pid_ <= 0)
      return false;

    if (timeout_ms == 0) {
      int raw = 0;
      pid_t w;
      do {
        w = waitpid(pid_, &raw, 0);
      } while (w < 0 && errno == EINTR);
      status = (w == pid_) ? ExitStatus::FromWaitStatus(raw) : ExitStatus();
      pid_ = -1;
      return true;
    }

    constexpr uint32_t kPollIntervalMs = 5;
    uint32_t elapsed = 0;
    while (elapsed < timeout_ms) {
      if (TryWait(status))
        return true;
      detail::SleepMs(kPollIntervalMs);
      elapsed += kPollIntervalMs;
    }
    return TryWait(status);
  }

  /**
   * @brief Send a signal to the child process.
   * @return kSuccess if sent, kNotFound/kFailed otherwise.
   */
  ProcessResult Signal(int signo) {
    if (pid_ <= 0)
      return ProcessResult::kNotFound;
    return SendSignal(pid_, signo);
  }

  /// @brief Get child PID (-1 if not started or already reaped).
  pid_t GetPid() const { return pid_; }

  /// @brief true until the child has been reaped.
  bool IsRunning() const { return pid_ > 0; }

 private:
  pid_t pid_;
  int stdout_fd_;
  int stderr_fd_;

  void Reset() {
    if (stdout_fd_ >= 0) {
      close(stdout_fd_);  // NOLINT
      stdout_fd_ = -1;
    }
    if (stderr_fd_ >= 0) {
      close(stderr_fd_);  // NOLINT
      stderr_fd_ = -1;
    }
    if (pid_ > 0) {
      kill(pid_, SIGKILL);
      int status;
      waitpid(pid_, &status, 0);
      pid_ = -1;
    }
  }
};

}  // namespace cligr

#endif  // CLIGR_PROCESS_HPP_
