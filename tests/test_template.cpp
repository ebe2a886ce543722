/**
 * @file test_template.cpp
 * @brief Tests for template.hpp
 */

#include "cligr/template.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using cligr::CommandTemplate;
using cligr::ExpandedCommand;
using cligr::Item;
using cligr::NamedParams;
using cligr::TemplateExpander;

// ============================================================================
// SplitArgs
// ============================================================================

TEST_CASE("SplitArgs trims and keeps empty segments", "[template]") {
  auto args = TemplateExpander::SplitArgs(" nginx , 8080,,  x ");
  REQUIRE(args.size() == 4);
  REQUIRE(args[0] == "nginx");
  REQUIRE(args[1] == "8080");
  REQUIRE(args[2].empty());
  REQUIRE(args[3] == "x");
}

TEST_CASE("SplitArgs of empty value is one empty argument", "[template]") {
  auto args = TemplateExpander::SplitArgs("");
  REQUIRE(args.size() == 1);
  REQUIRE(args[0].empty());
}

TEST_CASE("MaxPlaceholderIndex reads whole digit runs", "[template]") {
  REQUIRE(TemplateExpander::MaxPlaceholderIndex("echo hi") == 0);
  REQUIRE(TemplateExpander::MaxPlaceholderIndex("$1 $3 $2") == 3);
  REQUIRE(TemplateExpander::MaxPlaceholderIndex("run $12") == 12);
  REQUIRE(TemplateExpander::MaxPlaceholderIndex("$ $name") == 0);
}

// ============================================================================
// Positional expansion
// ============================================================================

TEST_CASE("Expand substitutes positional values", "[template]") {
  ExpandedCommand c =
      TemplateExpander::Expand("docker run -p $2:$2 $1", Item{"web", "nginx,8080"});
  REQUIRE(c.name == "web");
  REQUIRE(c.full_cmd == "docker run -p 8080:8080 nginx");
  REQUIRE(c.args.size() == 2);
}

TEST_CASE("Expand treats $10 as index ten, not $1 then 0", "[template]") {
  Item item{"many", "a,b,c,d,e,f,g,h,i,j"};
  ExpandedCommand c = TemplateExpander::Expand("$1 $10", item);
  REQUIRE(c.full_cmd == "a j");
}

TEST_CASE("Expand leaves out-of-range placeholders verbatim", "[template]") {
  ExpandedCommand c = TemplateExpander::Expand("echo $1 $2 $3", Item{"x", "only"});
  REQUIRE(c.full_cmd == "echo only $2 $3");

  ExpandedCommand zero = TemplateExpander::Expand("echo $0", Item{"x", "a"});
  REQUIRE(zero.full_cmd == "echo $0");
}

TEST_CASE("Expand leaves leading-zero placeholders verbatim", "[template]") {
  ExpandedCommand c = TemplateExpander::Expand("run $01 $1", Item{"n", "a"});
  REQUIRE(c.full_cmd == "run $01 a");
  REQUIRE(TemplateExpander::MaxPlaceholderIndex("run $01 $002") == 0);
}

TEST_CASE("Expand does not re-expand inserted values", "[template]") {
  NamedParams params{{"env", "prod"}};
  ExpandedCommand c =
      TemplateExpander::Expand("echo $1 $env", Item{"x", "$2,$env"}, params);
  REQUIRE(c.full_cmd == "echo $2 prod");
}

TEST_CASE("Expand keeps a bare dollar sign", "[template]") {
  ExpandedCommand c = TemplateExpander::Expand("cost $ $1", Item{"x", "5"});
  REQUIRE(c.full_cmd == "cost $ 5");
}

// ============================================================================
// Named expansion
// ============================================================================

TEST_CASE("Expand substitutes named params after positional ones", "[template]") {
  NamedParams params{{"env", "prod"}, {"region", "eu"}};
  ExpandedCommand c = TemplateExpander::Expand("deploy $1 --env $env --region $region",
                                               Item{"svc", "api"}, params);
  REQUIRE(c.full_cmd == "deploy api --env prod --region eu");
}

TEST_CASE("Expand prefers the longest matching param key", "[template]") {
  NamedParams params{{"name", "short"}, {"names", "long"}};
  ExpandedCommand c = TemplateExpander::Expand("$names $name", Item{"x", ""}, params);
  REQUIRE(c.full_cmd == "long short");
}

TEST_CASE("Expand leaves unknown named params alone", "[template]") {
  NamedParams params{{"env", "prod"}};
  ExpandedCommand c = TemplateExpander::Expand("run $env $missing", Item{"x", ""}, params);
  REQUIRE(c.full_cmd == "run prod $missing");
}

TEST_CASE("Expand replaces every occurrence of a named param", "[template]") {
  NamedParams params{{"host", "db"}};
  ExpandedCommand c =
      TemplateExpander::Expand("ping $host && ssh $host", Item{"x", ""}, params);
  REQUIRE(c.full_cmd == "ping db && ssh db");
}

// ============================================================================
// ParseItem
// ============================================================================

TEST_CASE("ParseItem appends surplus values to a positional template", "[template]") {
  ExpandedCommand c = TemplateExpander::ParseItem("node", "node $1.js", Item{"srv", "server,--port,3000"});
  REQUIRE(c.full_cmd == "node server.js --port 3000");
}

TEST_CASE("ParseItem never appends to a literal template", "[template]") {
  ExpandedCommand c = TemplateExpander::ParseItem("t", "echo fixed", Item{"a", "x,y"});
  REQUIRE(c.full_cmd == "echo fixed");
}

TEST_CASE("ParseItem without template prefixes the tool", "[template]") {
  ExpandedCommand c = TemplateExpander::ParseItem("python3", "", Item{"a", "app.py --debug"});
  REQUIRE(c.full_cmd == "python3 app.py --debug");
  REQUIRE(c.name == "a");
}

TEST_CASE("ParseItem without tool runs the raw value", "[template]") {
  ExpandedCommand c = TemplateExpander::ParseItem("", "", Item{"a", "sleep 5"});
  REQUIRE(c.full_cmd == "sleep 5");
}

TEST_CASE("ParseItem with CommandTemplate passes params through", "[template]") {
  CommandTemplate ct;
  ct.tool = "svc";
  ct.tool_template = "run $1 --env $env";
  ct.params["env"] = "staging";
  ExpandedCommand c = TemplateExpander::ParseItem(ct, Item{"api", "api"});
  REQUIRE(c.full_cmd == "run api --env staging");
}

TEST_CASE("ParseItem preserves quoting and spacing of the template", "[template]") {
  ExpandedCommand c = TemplateExpander::ParseItem(
      "sh", "sh -c \"echo '$1'  done\"", Item{"q", "hello world"});
  REQUIRE(c.full_cmd == "sh -c \"echo 'hello world'  done\"");
}
