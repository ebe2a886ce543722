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
 * @file io_poller.hpp
 * @brief epoll wrapper plus an eventfd wakeup for single-threaded event loops.
 *
 * The supervisor coordinator thread waits on every child output pipe and on
 * one WakeupFd that other threads poke after queueing work for it.
 */

#ifndef CLIGR_IO_POLLER_HPP_
#define CLIGR_IO_POLLER_HPP_

#include "cligr/platform.hpp"
#include "cligr/vocabulary.hpp"

#include <array>
#include <cerrno>
#include <cstdint>

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace cligr {

// ============================================================================
// Event Types
// ============================================================================

enum class IoEvent : uint8_t {
  kReadable = 0x01,
  kWritable = 0x02,
  kError = 0x04,
  kHangup = 0x08
};

inline constexpr uint8_t operator|(IoEvent a, IoEvent b) {
  return static_cast<uint8_t>(a) | static_cast<uint8_t>(b);
}

inline constexpr bool HasEvent(uint8_t events, IoEvent e) {
  return (events & static_cast<uint8_t>(e)) != 0;
}

struct PollResult {
  int32_t fd;
  uint8_t events;  // bitmask of IoEvent
};

// ============================================================================
// IoPoller
// ============================================================================

#ifndef CLIGR_IO_POLLER_MAX_EVENTS
#define CLIGR_IO_POLLER_MAX_EVENTS 64U
#endif

/**
 * @brief Level-triggered epoll set.
 *
 * Level triggering lets the caller read a bounded chunk per wakeup without
 * losing readiness for the rest.
 */
class IoPoller {
 public:
  IoPoller() noexcept : poller_fd_(::epoll_create1(EPOLL_CLOEXEC)), results_{} {}

  ~IoPoller() {
    if (poller_fd_ >= 0) {
      ::close(poller_fd_);
    }
  }

  IoPoller(const IoPoller&) = delete;
  IoPoller& operator=(const IoPoller&) = delete;

  bool IsValid() const noexcept { return poller_fd_ >= 0; }

  /** @brief Add an fd to monitor with given events (kReadable, kWritable). */
  expected<void, PollerError> Add(int32_t fd, uint8_t events) {
    struct epoll_event ev {};
    ev.events = ToEpoll(events);
    ev.data.fd = fd;
    if (::epoll_ctl(poller_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
      return expected<void, PollerError>::error(PollerError::kAddFailed);
    }
    return expected<void, PollerError>::success();
  }

  /** @brief Change the event mask of a monitored fd. */
  expected<void, PollerError> Modify(int32_t fd, uint8_t events) {
    struct epoll_event ev {};
    ev.events = ToEpoll(events);
    ev.data.fd = fd;
    if (::epoll_ctl(poller_fd_, EPOLL_CTL_MOD, fd, &ev) != 0) {
      return expected<void, PollerError>::error(PollerError::kModifyFailed);
    }
    return expected<void, PollerError>::success();
  }

  /** @brief Remove an fd from monitoring. */
  expected<void, PollerError> Remove(int32_t fd) {
    if (::epoll_ctl(poller_fd_, EPOLL_CTL_DEL, fd, nullptr) != 0) {
      return expected<void, PollerError>::error(PollerError::kRemoveFailed);
    }
    return expected<void, PollerError>::success();
  }

  /**
   * @brief Wait for events.
   * @param timeout_ms  -1 for infinite, 0 for non-blocking.
   * @return Number of ready events (EINTR reports 0), readable via Results().
   */
  expected<uint32_t, PollerError> Wait(int32_t timeout_ms = -1) {
    struct epoll_event raw[CLIGR_IO_POLLER_MAX_EVENTS];
    int32_t n = ::epoll_wait(poller_fd_, raw,
                             static_cast<int>(CLIGR_IO_POLLER_MAX_EVENTS),
                             timeout_ms);
    if (n < 0) {
      if (errno == EINTR) {
        return expected<uint32_t, PollerError>::success(0U);
      }
      return expected<uint32_t, PollerError>::error(PollerError::kWaitFailed);
    }
    auto count = static_cast<uint32_t>(n);
    for (uint32_t i = 0; i < count; ++i) {
      results_[i].fd = raw[i].data.fd;
      results_[i].events = FromEpoll(raw[i].events);
    }
    return expected<uint32_t, PollerError>::success(count);
  }

  /** @brief Results of the last Wait() call. */
  const PollResult* Results() const noexcept { return results_.data(); }

 private:
  static uint32_t ToEpoll(uint8_t events) {
    uint32_t ep = 0;
    if (HasEvent(events, IoEvent::kReadable)) ep |= EPOLLIN;
    if (HasEvent(events, IoEvent::kWritable)) ep |= EPOLLOUT;
    return ep;
  }

  static uint8_t FromEpoll(uint32_t ep) {
    uint8_t ev = 0;
    if (ep & EPOLLIN) ev |= static_cast<uint8_t>(IoEvent::kReadable);
    if (ep & EPOLLOUT) ev |= static_cast<uint8_t>(IoEvent::kWritable);
    if (ep & EPOLLERR) ev |= static_cast<uint8_t>(IoEvent::kError);
    if (ep & EPOLLHUP) ev |= static_cast<uint8_t>(IoEvent::kHangup);
    return ev;
  }

  int32_t poller_fd_;
  std::array<PollResult, CLIGR_IO_POLLER_MAX_EVENTS> results_;
};

// ============================================================================
// WakeupFd
// ============================================================================

/** @brief Non-blocking eventfd used to interrupt IoPoller::Wait(). */
class WakeupFd {
 public:
  WakeupFd() noexcept : fd_(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {}
  ~WakeupFd() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  WakeupFd(const WakeupFd&) = delete;
  WakeupFd& operator=(const WakeupFd&) = delete;

  bool IsValid() const noexcept { return fd_ >= 0; }
  int32_t Fd() const noexcept { return fd_; }

  void Notify() noexcept {
    const uint64_t one = 1;
    // EAGAIN means the counter is already non-zero: the loop will wake.
    (void)::write(fd_, &one, sizeof(one));
  }

  void Drain() noexcept {
    uint64_t value = 0;
    (void)::read(fd_, &value, sizeof(value));
  }

 private:
  int32_t fd_;
};

}  // namespace cligr

#endif  // CLIGR_IO_POLLER_HPP_
