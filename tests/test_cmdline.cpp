/**
 * @file test_cmdline.cpp
 * @brief Tests for cmdline.hpp
 */

#include "cligr/cmdline.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using cligr::TokenizeCommand;
using Argv = std::vector<std::string>;

TEST_CASE("TokenizeCommand splits on runs of whitespace", "[cmdline]") {
  REQUIRE(TokenizeCommand("  ls   -la\t/tmp  ") == Argv{"ls", "-la", "/tmp"});
}

TEST_CASE("TokenizeCommand of blank input is empty", "[cmdline]") {
  REQUIRE(TokenizeCommand("").empty());
  REQUIRE(TokenizeCommand("   \t ").empty());
}

TEST_CASE("TokenizeCommand keeps quoted whitespace", "[cmdline]") {
  REQUIRE(TokenizeCommand("sh -c \"echo 'a b'\"") ==
          Argv{"sh", "-c", "echo 'a b'"});
  REQUIRE(TokenizeCommand("echo 'x  \"y\"'") == Argv{"echo", "x  \"y\""});
}

TEST_CASE("TokenizeCommand joins adjacent quoted and bare text", "[cmdline]") {
  REQUIRE(TokenizeCommand("--name=\"John Doe\"") == Argv{"--name=John Doe"});
  REQUIRE(TokenizeCommand("a\"b c\"d") == Argv{"ab cd"});
}

TEST_CASE("TokenizeCommand keeps empty quoted arguments", "[cmdline]") {
  REQUIRE(TokenizeCommand("printf '' x") == Argv{"printf", "", "x"});
  REQUIRE(TokenizeCommand("\"\"") == Argv{""});
}

TEST_CASE("TokenizeCommand runs an unterminated quote to the end", "[cmdline]") {
  REQUIRE(TokenizeCommand("echo 'open ended") == Argv{"echo", "open ended"});
}
