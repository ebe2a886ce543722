/**
 * @file test_session.cpp
 * @brief Tests for session.hpp: up/down/ls/groups/config commands.
 */

#include "cligr/session.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <string>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

using cligr::DownResult;
using cligr::ProcessRecord;
using cligr::ProcessRegistry;
using cligr::Session;
using cligr::SessionOptions;
using cligr_test::ReadAll;
using cligr_test::TempDir;
using cligr_test::WaitUntil;

namespace {

/// Temp workspace with a config file, a pid dir and captured output.
struct Fixture {
  TempDir dir;
  FILE* out = std::tmpfile();
  FILE* err = std::tmpfile();

  Fixture() {
    const std::string yaml =
        "tools:\n"
        "  sleeper:\n"
        "    cmd: \"sleep $2\"\n"
        "groups:\n"
        "  naps:\n"
        "    tool: sleeper\n"
        "    restart: unless-stopped\n"
        "    items:\n"
        "      - \"short,30\"\n"
        "      - \"long,60\"\n"
        "  direct:\n"
        "    items:\n"
        "      - \"sleep 30\"\n"
        "settings:\n"
        "  restart_delay_ms: 50\n"
        "  kill_grace_ms: 500\n"
        "  pid_dir: \"" + dir.File("pids") + "\"\n";
    (void)dir.WriteFile("cligr.yml", yaml);
  }

  ~Fixture() {
    std::fclose(out);
    std::fclose(err);
  }

  SessionOptions Options() const {
    SessionOptions opt;
    opt.config_path = dir.File("cligr.yml");
    opt.out = out;
    opt.err = err;
    return opt;
  }

  ProcessRegistry Registry() const { return ProcessRegistry(dir.File("pids")); }
};

ProcessRecord Record(const std::string& group, const std::string& item, pid_t pid,
                     int64_t start, const std::string& cmd) {
  ProcessRecord rec;
  rec.pid = pid;
  rec.group_name = group;
  rec.item_name = item;
  rec.start_time = start;
  rec.full_cmd = cmd;
  return rec;
}

pid_t DeadPid() {
  pid_t pid = fork();
  if (pid == 0) _exit(0);
  int status = 0;
  waitpid(pid, &status, 0);
  return pid;
}

}  // namespace

// ============================================================================
// ls / groups / config
// ============================================================================

TEST_CASE("List prints expanded commands", "[session]") {
  Fixture fx;
  Session session(fx.Options());
  REQUIRE(session.List("naps") == cligr::kExitOk);

  const std::string text = ReadAll(fx.out);
  REQUIRE(text.find("Group: naps") != std::string::npos);
  REQUIRE(text.find("Tool: sleeper") != std::string::npos);
  REQUIRE(text.find("Restart: unless-stopped") != std::string::npos);
  REQUIRE(text.find("  - short: sleep 30") != std::string::npos);
  REQUIRE(text.find("  - long: sleep 60") != std::string::npos);
}

TEST_CASE("List of an unknown group is a user error", "[session]") {
  Fixture fx;
  Session session(fx.Options());
  REQUIRE(session.List("missing") == cligr::kExitUserError);
  REQUIRE(ReadAll(fx.err).find("Unknown group: missing") != std::string::npos);
}

TEST_CASE("Groups lists names, verbose adds a table", "[session]") {
  Fixture fx;

  SECTION("plain") {
    Session session(fx.Options());
    REQUIRE(session.Groups(false) == cligr::kExitOk);
    REQUIRE(ReadAll(fx.out) == "direct\nnaps\n");
  }
  SECTION("verbose") {
    Session session(fx.Options());
    REQUIRE(session.Groups(true) == cligr::kExitOk);
    const std::string text = ReadAll(fx.out);
    REQUIRE(text.find("GROUP   TOOL     RESTART         ITEMS\n") == 0);
    REQUIRE(text.find("direct  (none)   yes             1\n") != std::string::npos);
    REQUIRE(text.find("naps    sleeper  unless-stopped  2\n") != std::string::npos);
  }
}

TEST_CASE("Missing config file is a user error", "[session]") {
  Fixture fx;
  SessionOptions opt = fx.Options();
  opt.config_path = fx.dir.File("absent.yml");
  Session session(opt);
  REQUIRE(session.Groups(false) == cligr::kExitUserError);
  REQUIRE(ReadAll(fx.err).find("Config file not found") != std::string::npos);
}

TEST_CASE("Config creates a loadable starter file", "[session]") {
  Fixture fx;
  SessionOptions opt = fx.Options();
  opt.config_path = fx.dir.File("new.yml");
  Session session(opt);

  REQUIRE(session.Config(false) == cligr::kExitOk);
  REQUIRE(cligr::ConfigLoader::FileExists(opt.config_path));
  REQUIRE(ReadAll(fx.out).find("Config file: " + opt.config_path) != std::string::npos);

  cligr::ConfigLoader loader;
  REQUIRE(loader.LoadFile(opt.config_path).has_value());
  REQUIRE(loader.GetGroup("web").has_value());
  REQUIRE(loader.GetGroup("simple").value().restart_policy ==
          cligr::RestartPolicy::kUnlessStopped);
}

// ============================================================================
// up
// ============================================================================

TEST_CASE("Up records processes and cleans up on shutdown", "[session]") {
  Fixture fx;
  ProcessRegistry registry = fx.Registry();
  cligr::ShutdownManager shutdown;
  REQUIRE(shutdown.IsValid());

  std::vector<ProcessRecord> seen;
  std::thread stopper([&]() {
    (void)WaitUntil([&] { return registry.ReadByGroup("naps").size() == 2; }, 5000);
    seen = registry.ReadByGroup("naps");
    shutdown.Quit();
  });

  Session session(fx.Options());
  const int rc = session.Up("naps", shutdown);
  stopper.join();

  REQUIRE(rc == cligr::kExitOk);
  REQUIRE(seen.size() == 2);
  REQUIRE(seen[0].supervisor_pid == getpid());
  REQUIRE(seen[0].restart_policy == cligr::RestartPolicy::kUnlessStopped);
  REQUIRE(seen[1].full_cmd == "sleep 30");
  REQUIRE(registry.ReadByGroup("naps").empty());

  const std::string text = ReadAll(fx.out);
  REQUIRE(text.find("Started group naps with 2 process(es)") != std::string::npos);
  REQUIRE(text.find("Shutting down...") != std::string::npos);
  REQUIRE_FALSE(cligr::IsProcessAlive(seen[0].pid));
}

TEST_CASE("Up refuses a group with valid records", "[session]") {
  Fixture fx;
  ProcessRegistry registry = fx.Registry();
  REQUIRE(registry.Write(Record("naps", "short", getpid(), cligr::NowEpochMs(),
                                "sleep 30")).has_value());

  cligr::ShutdownManager shutdown;
  Session session(fx.Options());
  REQUIRE(session.Up("naps", shutdown) == cligr::kExitUserError);
  REQUIRE(ReadAll(fx.err).find("already running") != std::string::npos);
  REQUIRE(registry.ReadByGroup("naps").size() == 1);
}

TEST_CASE("Up purges stale records before starting", "[session]") {
  Fixture fx;
  ProcessRegistry registry = fx.Registry();
  REQUIRE(registry.Write(Record("other", "x", DeadPid(), cligr::NowEpochMs(),
                                "sleep 1")).has_value());

  cligr::ShutdownManager shutdown;
  shutdown.Quit();
  Session session(fx.Options());
  REQUIRE(session.Up("direct", shutdown) == cligr::kExitOk);
  REQUIRE(registry.ReadAll().empty());
}

// ============================================================================
// down
// ============================================================================

TEST_CASE("Down stops a recorded process", "[session]") {
  Fixture fx;
  ProcessRegistry registry = fx.Registry();

  cligr::Subprocess proc;
  cligr::SubprocessConfig cfg;
  cfg.argv = {"sleep", "30"};
  cfg.capture_stdout = false;
  cfg.capture_stderr = false;
  REQUIRE(proc.Start(cfg).has_value());
  const pid_t pid = proc.GetPid();
  REQUIRE(registry.Write(Record("naps", "short", pid, cligr::NowEpochMs(),
                                "sleep 30")).has_value());

  // This process is the parent: reap concurrently so the PID really goes away.
  cligr::ExitStatus status;
  std::thread reaper([&]() { (void)proc.Wait(0, status); });

  Session session(fx.Options());
  const int rc = session.Down("naps");
  reaper.join();

  REQUIRE(rc == cligr::kExitOk);
  REQUIRE(status.signaled);
  REQUIRE(status.term_signal == SIGTERM);
  REQUIRE(registry.ReadByGroup("naps").empty());
  REQUIRE(ReadAll(fx.out).find("Stopped 1 process(es) for group 'naps'") !=
          std::string::npos);
}

TEST_CASE("Down prunes dead and reused PIDs without signalling", "[session]") {
  Fixture fx;
  ProcessRegistry registry = fx.Registry();
  const int64_t old = cligr::NowEpochMs() - ProcessRegistry::kValidityWindowMs - 1000;

  REQUIRE(registry.Write(Record("naps", "dead", DeadPid(), cligr::NowEpochMs(),
                                "sleep 30")).has_value());
  // Live PID (this test binary) but an old record for another executable.
  REQUIRE(registry.Write(Record("naps", "reused", getpid(), old,
                                "definitely-not-this-binary --flag")).has_value());

  Session session(fx.Options());
  DownResult result = session.StopRecordedGroup("naps");
  REQUIRE(result.killed == 0);
  REQUIRE(result.not_running == 2);
  REQUIRE(result.errors.empty());
  REQUIRE(registry.ReadByGroup("naps").empty());
}

TEST_CASE("Down of a group without records reports not running", "[session]") {
  Fixture fx;
  Session session(fx.Options());
  REQUIRE(session.Down("naps") == cligr::kExitOk);
  REQUIRE(ReadAll(fx.out) == "Group 'naps' is not running\n");
}

// ============================================================================
// RegistryRecorder
// ============================================================================

TEST_CASE("RegistryRecorder mirrors starts and exits", "[session]") {
  TempDir dir;
  ProcessRegistry registry(dir.Path());
  cligr::ConsoleListener console;
  cligr::RegistryRecorder recorder(registry, console);
  recorder.SetPolicy("g", cligr::RestartPolicy::kNever);

  recorder.OnProcessStarted("g", "a", 1234, "echo a");
  std::vector<ProcessRecord> recs = registry.ReadByGroup("g");
  REQUIRE(recs.size() == 1);
  REQUIRE(recs[0].pid == 1234);
  REQUIRE(recs[0].restart_policy == cligr::RestartPolicy::kNever);
  REQUIRE(recs[0].supervisor_pid == getpid());

  recorder.OnProcessExited("g", "a", cligr::ExitStatus(), true);
  REQUIRE(registry.ReadByGroup("g").empty());
}
