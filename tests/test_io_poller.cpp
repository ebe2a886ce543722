/**
 * @file test_io_poller.cpp
 * @brief Tests for io_poller.hpp: IoPoller, WakeupFd, IoEvent.
 */

#include <catch2/catch_test_macros.hpp>
#include "cligr/io_poller.hpp"

#include <chrono>
#include <thread>

#include <unistd.h>

namespace {

/// Pipe closed on scope exit.
struct Pipe {
  int fd[2] = {-1, -1};
  Pipe() { REQUIRE(::pipe(fd) == 0); }
  ~Pipe() {
    if (fd[0] >= 0) ::close(fd[0]);
    if (fd[1] >= 0) ::close(fd[1]);
  }
  void CloseWrite() {
    ::close(fd[1]);
    fd[1] = -1;
  }
};

constexpr uint8_t kRead = static_cast<uint8_t>(cligr::IoEvent::kReadable);

}  // namespace

TEST_CASE("io_poller - default construction is valid", "[io_poller]") {
  cligr::IoPoller poller;
  REQUIRE(poller.IsValid());
}

TEST_CASE("io_poller - event mask helpers", "[io_poller]") {
  const uint8_t both = cligr::IoEvent::kReadable | cligr::IoEvent::kHangup;
  REQUIRE(cligr::HasEvent(both, cligr::IoEvent::kReadable));
  REQUIRE(cligr::HasEvent(both, cligr::IoEvent::kHangup));
  REQUIRE_FALSE(cligr::HasEvent(both, cligr::IoEvent::kWritable));
}

TEST_CASE("io_poller - Add, Remove and their failures", "[io_poller]") {
  cligr::IoPoller poller;
  Pipe p;

  REQUIRE(poller.Add(p.fd[0], kRead).has_value());
  auto dup = poller.Add(p.fd[0], kRead);
  REQUIRE_FALSE(dup.has_value());
  REQUIRE(dup.get_error() == cligr::PollerError::kAddFailed);

  REQUIRE(poller.Remove(p.fd[0]).has_value());
  auto again = poller.Remove(p.fd[0]);
  REQUIRE_FALSE(again.has_value());
  REQUIRE(again.get_error() == cligr::PollerError::kRemoveFailed);
}

TEST_CASE("io_poller - Wait non-blocking returns 0 when idle", "[io_poller]") {
  cligr::IoPoller poller;
  Pipe p;
  REQUIRE(poller.Add(p.fd[0], kRead).has_value());

  auto r = poller.Wait(0);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 0U);
}

TEST_CASE("io_poller - readable event on pipe", "[io_poller]") {
  cligr::IoPoller poller;
  Pipe p;
  REQUIRE(poller.Add(p.fd[0], kRead).has_value());
  REQUIRE(::write(p.fd[1], "x", 1) == 1);

  auto r = poller.Wait(100);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 1U);
  REQUIRE(poller.Results()[0].fd == p.fd[0]);
  REQUIRE(cligr::HasEvent(poller.Results()[0].events, cligr::IoEvent::kReadable));

  // Level-triggered: unread data keeps reporting.
  REQUIRE(poller.Wait(0).value() == 1U);
}

TEST_CASE("io_poller - hangup after writer closes", "[io_poller]") {
  cligr::IoPoller poller;
  Pipe p;
  REQUIRE(poller.Add(p.fd[0], kRead).has_value());
  p.CloseWrite();

  auto r = poller.Wait(100);
  REQUIRE(r.value() == 1U);
  REQUIRE(cligr::HasEvent(poller.Results()[0].events, cligr::IoEvent::kHangup));
}

TEST_CASE("io_poller - Modify changes the watched events", "[io_poller]") {
  cligr::IoPoller poller;
  Pipe p;
  const uint8_t write_ev = static_cast<uint8_t>(cligr::IoEvent::kWritable);
  REQUIRE(poller.Add(p.fd[1], kRead).has_value());
  REQUIRE(poller.Wait(0).value() == 0U);

  REQUIRE(poller.Modify(p.fd[1], write_ev).has_value());
  REQUIRE(poller.Wait(0).value() == 1U);
  REQUIRE(cligr::HasEvent(poller.Results()[0].events, cligr::IoEvent::kWritable));

  auto bad = poller.Modify(p.fd[0], write_ev);
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.get_error() == cligr::PollerError::kModifyFailed);
}

TEST_CASE("io_poller - WakeupFd interrupts a blocking Wait", "[io_poller]") {
  cligr::IoPoller poller;
  cligr::WakeupFd wakeup;
  REQUIRE(wakeup.IsValid());
  REQUIRE(poller.Add(wakeup.Fd(), kRead).has_value());

  std::thread t([&wakeup]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    wakeup.Notify();
    wakeup.Notify();
  });
  auto r = poller.Wait(5000);
  t.join();
  REQUIRE(r.value() == 1U);
  REQUIRE(poller.Results()[0].fd == wakeup.Fd());

  // Notifications coalesce; one Drain clears them.
  wakeup.Drain();
  REQUIRE(poller.Wait(0).value() == 0U);
}
