/**
 * @file test_shutdown.cpp
 * @brief Tests for shutdown.hpp
 */

#include "cligr/shutdown.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <csignal>
#include <thread>
#include <vector>

namespace {

std::vector<int>* g_order = nullptr;

void RecordFirst(int, void*) { g_order->push_back(1); }
void RecordSecond(int, void*) { g_order->push_back(2); }

void StoreSigno(int signo, void* ctx) { *static_cast<int*>(ctx) = signo; }

void Noop(int, void*) {}

}  // namespace

TEST_CASE("ShutdownManager Register up to capacity", "[shutdown]") {
  cligr::ShutdownManager mgr;
  REQUIRE(mgr.IsValid());

  for (uint32_t i = 0; i < cligr::ShutdownManager::kMaxCallbacks; ++i) {
    REQUIRE(mgr.Register(&Noop).has_value());
  }
  auto full = mgr.Register(&Noop);
  REQUIRE(!full.has_value());
  REQUIRE(full.get_error() == cligr::ShutdownError::kCallbacksFull);
}

TEST_CASE("ShutdownManager null callback rejected", "[shutdown]") {
  cligr::ShutdownManager mgr;
  auto r = mgr.Register(nullptr);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == cligr::ShutdownError::kCallbacksFull);
}

TEST_CASE("ShutdownManager second instance is rejected", "[shutdown]") {
  cligr::ShutdownManager first;
  cligr::ShutdownManager second;
  REQUIRE(first.IsValid());
  REQUIRE_FALSE(second.IsValid());
  auto r = second.Register(&Noop);
  REQUIRE(r.get_error() == cligr::ShutdownError::kAlreadyInstantiated);
}

TEST_CASE("ShutdownManager Quit and IsShutdownRequested", "[shutdown]") {
  cligr::ShutdownManager mgr;
  REQUIRE(!mgr.IsShutdownRequested());
  mgr.Quit();
  REQUIRE(mgr.IsShutdownRequested());
  REQUIRE(mgr.WaitForShutdown() == 0);
}

TEST_CASE("ShutdownManager WaitForShutdown times out", "[shutdown]") {
  cligr::ShutdownManager mgr;
  REQUIRE(mgr.WaitForShutdown(20) == -1);
  REQUIRE_FALSE(mgr.IsShutdownRequested());
}

TEST_CASE("ShutdownManager runs callbacks LIFO exactly once", "[shutdown]") {
  std::vector<int> order;
  g_order = &order;
  {
    cligr::ShutdownManager mgr;
    REQUIRE(mgr.Register(&RecordFirst).has_value());
    REQUIRE(mgr.Register(&RecordSecond).has_value());
    mgr.Quit(42);
    mgr.Quit(7);  // ignored: first request wins
    REQUIRE(mgr.WaitForShutdown() == 42);
    REQUIRE(mgr.WaitForShutdown() == 42);
  }
  g_order = nullptr;
  REQUIRE(order == std::vector<int>{2, 1});
}

TEST_CASE("ShutdownManager Quit from another thread wakes the waiter", "[shutdown]") {
  cligr::ShutdownManager mgr;
  int seen = -1;
  REQUIRE(mgr.Register(&StoreSigno, &seen).has_value());

  std::thread t([&mgr]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    mgr.Quit(3);
  });
  REQUIRE(mgr.WaitForShutdown() == 3);
  t.join();
  REQUIRE(seen == 3);
}

TEST_CASE("ShutdownManager SIGTERM triggers shutdown", "[shutdown]") {
  cligr::ShutdownManager mgr;
  int seen = -1;
  REQUIRE(mgr.Register(&StoreSigno, &seen).has_value());
  REQUIRE(mgr.InstallSignalHandlers().has_value());

  REQUIRE(::raise(SIGTERM) == 0);
  REQUIRE(mgr.WaitForShutdown(1000) == SIGTERM);
  REQUIRE(seen == SIGTERM);
}
