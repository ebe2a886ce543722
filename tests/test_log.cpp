/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "cligr/log.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

namespace {

/// Routes log output to a temp file for the lifetime of the object.
struct CapturedLog {
  FILE* fp = std::tmpfile();
  cligr::log::Level prev = cligr::log::GetLevel();

  CapturedLog() { cligr::log::Init(fp); }
  ~CapturedLog() {
    cligr::log::Shutdown();
    cligr::log::SetLevel(prev);
    std::fclose(fp);
  }
};

}  // namespace

TEST_CASE("Log level defaults", "[log]") {
#ifdef NDEBUG
  REQUIRE(cligr::log::GetLevel() == cligr::log::Level::kInfo);
#else
  REQUIRE(cligr::log::GetLevel() == cligr::log::Level::kDebug);
#endif
}

TEST_CASE("Log ParseLevel accepts names case-insensitively", "[log]") {
  cligr::log::Level lvl = cligr::log::Level::kDebug;
  REQUIRE(cligr::log::ParseLevel("WARN", lvl));
  REQUIRE(lvl == cligr::log::Level::kWarn);
  REQUIRE(cligr::log::ParseLevel("warning", lvl));
  REQUIRE(lvl == cligr::log::Level::kWarn);
  REQUIRE(cligr::log::ParseLevel("off", lvl));
  REQUIRE(lvl == cligr::log::Level::kOff);

  REQUIRE_FALSE(cligr::log::ParseLevel("verbose", lvl));
  REQUIRE_FALSE(cligr::log::ParseLevel(nullptr, lvl));
  REQUIRE(lvl == cligr::log::Level::kOff);
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  REQUIRE(!cligr::log::IsInitialized());
  cligr::log::Init();
  REQUIRE(cligr::log::IsInitialized());
  cligr::log::Shutdown();
  REQUIRE(!cligr::log::IsInitialized());
}

TEST_CASE("Log line carries level, category and source", "[log]") {
  CapturedLog cap;
  cligr::log::SetLevel(cligr::log::Level::kDebug);
  CLIGR_LOG_WARN("Supervisor", "[%s] exited with %d", "api", 3);

  const std::string text = cligr_test::ReadAll(cap.fp);
  REQUIRE(text.find("[WARN ] [Supervisor] [api] exited with 3") != std::string::npos);
  REQUIRE(text.find("test_log.cpp:") != std::string::npos);
  REQUIRE(text.back() == '\n');
}

TEST_CASE("Log runtime level filtering", "[log]") {
  CapturedLog cap;
  cligr::log::SetLevel(cligr::log::Level::kWarn);
  CLIGR_LOG_DEBUG("Test", "hidden debug");
  CLIGR_LOG_INFO("Test", "hidden info");
  CLIGR_LOG_ERROR("Test", "shown error %d", 7);

  const std::string text = cligr_test::ReadAll(cap.fp);
  REQUIRE(text.find("hidden") == std::string::npos);
  REQUIRE(text.find("shown error 7") != std::string::npos);

  cligr::log::SetLevel(cligr::log::Level::kOff);
  CLIGR_LOG_ERROR("Test", "silenced");
  REQUIRE(cligr_test::ReadAll(cap.fp).find("silenced") == std::string::npos);
}

TEST_CASE("Log with very long message is truncated, not overflowed", "[log]") {
  CapturedLog cap;
  cligr::log::SetLevel(cligr::log::Level::kDebug);
  const std::string long_msg(4096, 'x');
  CLIGR_LOG_INFO("Test", "%s", long_msg.c_str());

  const std::string text = cligr_test::ReadAll(cap.fp);
  REQUIRE(text.find(std::string(1000, 'x')) != std::string::npos);
  REQUIRE(text.size() < 2048);
}
