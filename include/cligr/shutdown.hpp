/**
 * @file shutdown.hpp
 * @brief SIGINT/SIGTERM handling for the foreground `up` command.
 *
 * The signal handler only sets a flag and writes one byte to a
 * close-on-exec pipe; WaitForShutdown() blocks on that pipe and then runs
 * the registered cleanup callbacks in LIFO order on the calling thread.
 */

#ifndef CLIGR_SHUTDOWN_HPP_
#define CLIGR_SHUTDOWN_HPP_

#include "cligr/platform.hpp"
#include "cligr/vocabulary.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace cligr {

/// @brief Cleanup callback: signal number (0 for Quit()) and user context.
using ShutdownFn = void (*)(int signo, void* ctx);

class ShutdownManager;

namespace detail {

/// Exactly one ShutdownManager may be active per process.
inline ShutdownManager*& GetShutdownInstance() {
  static ShutdownManager* ptr = nullptr;
  return ptr;
}

}  // namespace detail

/**
 * @brief Blocks the main thread until SIGINT/SIGTERM, then cleans up.
 *
 * @code
 *   cligr::ShutdownManager mgr;
 *   mgr.Register(&StopAll, &supervisor);
 *   mgr.InstallSignalHandlers();
 *   int signo = mgr.WaitForShutdown();
 * @endcode
 */
class ShutdownManager final {
 public:
  static constexpr uint32_t kMaxCallbacks = 8;

  ShutdownManager() noexcept {
    pipe_fd_[0] = -1;
    pipe_fd_[1] = -1;
    if (detail::GetShutdownInstance() != nullptr) {
      return;
    }
    if (::pipe2(pipe_fd_, O_CLOEXEC | O_NONBLOCK) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    detail::GetShutdownInstance() = this;
    valid_ = true;
  }

  /// Restores the previous signal dispositions.
  ~ShutdownManager() {
    if (installed_) {
      (void)::sigaction(SIGINT, &old_int_, nullptr);
      (void)::sigaction(SIGTERM, &old_term_, nullptr);
    }
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
    if (detail::GetShutdownInstance() == this) {
      detail::GetShutdownInstance() = nullptr;
    }
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;
  ShutdownManager(ShutdownManager&&) = delete;
  ShutdownManager& operator=(ShutdownManager&&) = delete;

  /// false if another instance is active or the pipe could not be created.
  bool IsValid() const noexcept { return valid_; }

  expected<void, ShutdownError> Register(ShutdownFn fn, void* ctx = nullptr) noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    if (fn == nullptr || callback_count_ >= kMaxCallbacks) {
      return expected<void, ShutdownError>::error(ShutdownError::kCallbacksFull);
    }
    callbacks_[callback_count_] = Callback{fn, ctx};
    ++callback_count_;
    return expected<void, ShutdownError>::success();
  }

  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    struct sigaction sa {};
    sa.sa_handler = &ShutdownManager::SignalHandler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    if (::sigaction(SIGINT, &sa, &old_int_) != 0) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kSignalInstallFailed);
    }
    if (::sigaction(SIGTERM, &sa, &old_term_) != 0) {
      (void)::sigaction(SIGINT, &old_int_, nullptr);
      return expected<void, ShutdownError>::error(
          ShutdownError::kSignalInstallFailed);
    }
    installed_ = true;
    return expected<void, ShutdownError>::success();
  }

  /// @brief Request shutdown without a signal. Only the first request counts.
  void Quit(int signo = 0) noexcept {
    bool expected_val = false;
    if (shutdown_flag_.compare_exchange_strong(expected_val, true)) {
      signo_.store(signo, std::memory_order_relaxed);
      Wake();
    }
  }

  /**
   * @brief Block until shutdown is requested, run callbacks once (LIFO).
   * @param timeout_ms -1 waits forever.
   * @return Signal number (0 for Quit()), or -1 on timeout.
   */
  int WaitForShutdown(int timeout_ms = -1) noexcept {
    if (pipe_fd_[0] >= 0 && !shutdown_flag_.load()) {
      struct pollfd pfd {};
      pfd.fd = pipe_fd_[0];
      pfd.events = POLLIN;
      int rc;
      do {
        rc = ::poll(&pfd, 1, timeout_ms);
      } while (rc < 0 && errno == EINTR && !shutdown_flag_.load());
    }
    if (!shutdown_flag_.load()) {
      return -1;
    }

    uint8_t buf[16];
    while (pipe_fd_[0] >= 0 && ::read(pipe_fd_[0], buf, sizeof(buf)) > 0) {
    }

    const int signo = signo_.load(std::memory_order_relaxed);
    if (!callbacks_run_) {
      callbacks_run_ = true;
      for (uint32_t i = callback_count_; i > 0U; --i) {
        callbacks_[i - 1U].fn(signo, callbacks_[i - 1U].ctx);
      }
    }
    return signo;
  }

  bool IsShutdownRequested() const noexcept { return shutdown_flag_.load(); }

 private:
  struct Callback {
    ShutdownFn fn;
    void* ctx;
  };

  void Wake() noexcept {
    if (pipe_fd_[1] >= 0) {
      const uint8_t byte = 1;
      (void)::write(pipe_fd_[1], &byte, 1);
    }
  }

  /// Async-signal-safe: atomics and write(2) only.
  static void SignalHandler(int signo) {
    const int saved_errno = errno;
    ShutdownManager* self = detail::GetShutdownInstance();
    if (self != nullptr) {
      bool expected_val = false;
      if (self->shutdown_flag_.compare_exchange_strong(expected_val, true)) {
        self->signo_.store(signo, std::memory_order_relaxed);
      }
      self->Wake();
    }
    errno = saved_errno;
  }

  Callback callbacks_[kMaxCallbacks] = {};
  uint32_t callback_count_ = 0;
  std::atomic<bool> shutdown_flag_{false};
  std::atomic<int> signo_{0};
  int pipe_fd_[2];
  struct sigaction old_int_ {};
  struct sigaction old_term_ {};
  bool installed_ = false;
  bool valid_ = false;
  bool callbacks_run_ = false;
};

}  // namespace cligr

#endif  // CLIGR_SHUTDOWN_HPP_
