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
 * @file main.cpp
 * @brief cligr command-line entry point.
 *
 *   cligr [options] <command> [args]
 *
 *   up <group>         Start a group in the foreground (Ctrl+C stops it)
 *   down <group>       Stop a group started by another invocation
 *   ls <group>         Show a group and its expanded commands
 *   groups [-v]        List groups (-v: table with tool/restart/items)
 *   config [--print]   Show the config path and open it in $EDITOR
 */

#include "cligr/log.hpp"
#include "cligr/session.hpp"
#include "cligr/shutdown.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

namespace {

struct CliArgs {
  cligr::SessionOptions session;
  std::vector<std::string> positional;
  bool verbose = false;
  bool print_only = false;
};

using CommandFn = int (*)(CliArgs& args);

struct CommandEntry {
  const char* name;
  const char* usage;
  bool needs_group;
  CommandFn fn;
};

int CmdUp(CliArgs& args) {
  cligr::ShutdownManager shutdown;
  auto installed = shutdown.InstallSignalHandlers();
  if (!installed.has_value()) {
    std::fprintf(stderr, "Error: %s\n", cligr::ToString(installed.get_error()));
    return cligr::kExitInternalError;
  }
  cligr::Session session(args.session);
  return session.Up(args.positional[0], shutdown);
}

int CmdDown(CliArgs& args) {
  cligr::Session session(args.session);
  return session.Down(args.positional[0]);
}

int CmdList(CliArgs& args) {
  cligr::Session session(args.session);
  return session.List(args.positional[0]);
}

int CmdGroups(CliArgs& args) {
  cligr::Session session(args.session);
  return session.Groups(args.verbose);
}

int CmdConfig(CliArgs& args) {
  cligr::Session session(args.session);
  return session.Config(!args.print_only);
}

const CommandEntry kCommands[] = {
    {"up", "up <group>          Start all processes in the group", true, &CmdUp},
    {"down", "down <group>        Stop a group started elsewhere", true, &CmdDown},
    {"ls", "ls <group>          List the items of a group", true, &CmdList},
    {"groups", "groups [-v]         List all groups", false, &CmdGroups},
    {"config", "config [--print]    Open the config file in $EDITOR", false,
     &CmdConfig},
};

void PrintUsage(FILE* out) {
  std::fprintf(out, "\nUsage: cligr [options] <command> [group]\n\nCommands:\n");
  for (const CommandEntry& c : kCommands) {
    std::fprintf(out, "  %s\n", c.usage);
  }
  std::fprintf(out,
               "\nOptions:\n"
               "  -c, --config <file>   Config file (default ~/.cligr.yml, "
               "then ./.cligr.yml)\n"
               "      --pid-dir <dir>   PID record directory "
               "(default ~/.cligr/pids)\n"
               "      --log-level <l>   debug|info|warn|error|fatal|off "
               "(env CLIGR_LOG_LEVEL)\n"
               "  -v, --verbose         Detailed output for 'groups'\n"
               "  -h, --help            Show this help\n\n");
}

bool ApplyLogLevel(const char* text) {
  cligr::log::Level level;
  if (!cligr::log::ParseLevel(text, level)) {
    std::fprintf(stderr, "Error: unknown log level '%s'\n", text);
    return false;
  }
  cligr::log::SetLevel(level);
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  cligr::log::Init(stderr);
  cligr::log::SetLevel(cligr::log::Level::kInfo);
  const char* env_level = std::getenv("CLIGR_LOG_LEVEL");
  if (env_level != nullptr && env_level[0] != '\0' && !ApplyLogLevel(env_level)) {
    return cligr::kExitUserError;
  }

  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    const char* a = argv[i];
    auto next = [&](const char* flag) -> const char* {
      if (i + 1 >= argc) {
        std::fprintf(stderr, "Error: %s requires a value\n", flag);
        return nullptr;
      }
      return argv[++i];
    };

    if (std::strcmp(a, "-h") == 0 || std::strcmp(a, "--help") == 0) {
      PrintUsage(stdout);
      return cligr::kExitOk;
    } else if (std::strcmp(a, "-c") == 0 || std::strcmp(a, "--config") == 0) {
      const char* v = next(a);
      if (v == nullptr) return cligr::kExitUserError;
      args.session.config_path = v;
    } else if (std::strcmp(a, "--pid-dir") == 0) {
      const char* v = next(a);
      if (v == nullptr) return cligr::kExitUserError;
      args.session.pid_dir = v;
    } else if (std::strcmp(a, "--log-level") == 0) {
      const char* v = next(a);
      if (v == nullptr || !ApplyLogLevel(v)) return cligr::kExitUserError;
    } else if (std::strcmp(a, "-v") == 0 || std::strcmp(a, "--verbose") == 0) {
      args.verbose = true;
    } else if (std::strcmp(a, "--print") == 0) {
      args.print_only = true;
    } else if (a[0] == '-' && a[1] != '\0') {
      std::fprintf(stderr, "Error: unknown option '%s'\n", a);
      PrintUsage(stderr);
      return cligr::kExitUserError;
    } else {
      args.positional.emplace_back(a);
    }
  }

  if (args.positional.empty()) {
    PrintUsage(stdout);
    return cligr::kExitUserError;
  }

  const std::string command = args.positional.front();
  args.positional.erase(args.positional.begin());

  for (const CommandEntry& c : kCommands) {
    if (command != c.name) continue;
    if (c.needs_group && args.positional.empty()) {
      std::fprintf(stderr, "Error: group name required\n");
      PrintUsage(stderr);
      return cligr::kExitUserError;
    }
    const int rc = c.fn(args);
    cligr::log::Shutdown();
    return rc;
  }

  std::fprintf(stderr, "Error: unknown command '%s'\n", command.c_str());
  PrintUsage(stderr);
  return cligr::kExitUserError;
}
