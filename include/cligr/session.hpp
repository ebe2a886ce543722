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
 * @file session.hpp
 * @brief User-facing commands: up, down, ls, groups, config.
 *
 * Each command returns a process exit status (kExitOk, kExitUserError,
 * kExitInternalError) and writes its report to the configured streams.
 */

#ifndef CLIGR_SESSION_HPP_
#define CLIGR_SESSION_HPP_

#include "cligr/cmdline.hpp"
#include "cligr/config.hpp"
#include "cligr/log.hpp"
#include "cligr/process.hpp"
#include "cligr/registry.hpp"
#include "cligr/shutdown.hpp"
#include "cligr/supervisor.hpp"
#include "cligr/template.hpp"
#include "cligr/vocabulary.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <map>
#include <string>
#include <vector>

#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

namespace cligr {

constexpr int kExitOk = 0;
constexpr int kExitUserError = 1;
constexpr int kExitInternalError = 2;

// ============================================================================
// RegistryRecorder
// ============================================================================

/**
 * @brief Mirrors supervisor lifecycle events into the ProcessRegistry.
 *
 * A record exists exactly while its process is alive: written on every
 * start (including restarts), removed on every exit. Output is forwarded
 * to @p output unchanged.
 */
class RegistryRecorder final : public SupervisorListener {
 public:
  RegistryRecorder(ProcessRegistry& registry, SupervisorListener& output)
      : registry_(registry), output_(output) {}

  /// Policy stored in the records of @p group. Call before SpawnGroup().
  void SetPolicy(const std::string& group, RestartPolicy policy) {
    policies_[group] = policy;
  }

  void OnProcessStarted(const std::string& group, const std::string& item,
                        pid_t pid, const std::string& full_cmd) override {
    ProcessRecord rec;
    rec.pid = pid;
    rec.group_name = group;
    rec.item_name = item;
    rec.start_time = NowEpochMs();
    auto it = policies_.find(group);
    rec.restart_policy = (it != policies_.end()) ? it->second : RestartPolicy::kAlways;
    rec.full_cmd = full_cmd;
    rec.supervisor_pid = ::getpid();
    auto r = registry_.Write(rec);
    if (!r.has_value()) {
      CLIGR_LOG_WARN("Session", "[%s] pid %d not recorded: %s", item.c_str(),
                     static_cast<int>(pid), ToString(r.get_error()));
    }
  }

  void OnProcessExited(const std::string& group, const std::string& item,
                       const ExitStatus& /*status*/, bool /*will_restart*/) override {
    (void)registry_.Delete(group, item);
  }

  void OnCrashLoop(const std::string& group, const std::string& item,
                   uint32_t exits_in_window) override {
    output_.OnCrashLoop(group, item, exits_in_window);
  }

  void OnOutput(const std::string& group, const std::string& item,
                OutputStream stream, const std::string& line) override {
    output_.OnOutput(group, item, stream, line);
  }

 private:
  ProcessRegistry& registry_;
  SupervisorListener& output_;
  std::map<std::string, RestartPolicy> policies_;
};

// ============================================================================
// Session
// ============================================================================

struct SessionOptions {
  std::string config_path;  ///< "" = ConfigLoader::ResolvePath() lookup
  std::string pid_dir;      ///< "" = settings.pid_dir, then registry default
  FILE* out = stdout;
  FILE* err = stderr;
};

/// @brief Outcome of stopping a group recorded in the registry.
struct DownResult {
  uint32_t killed = 0;       ///< Processes stopped (gracefully or forced)
  uint32_t forced = 0;       ///< Subset of killed that needed SIGKILL
  uint32_t not_running = 0;  ///< Stale records removed without signalling
  std::vector<std::string> errors;
};

class Session final {
 public:
  explicit Session(const SessionOptions& options = SessionOptions())
      : options_(options) {}

  // --------------------------------------------------------------------------
  // up
  // --------------------------------------------------------------------------

  /**
   * @brief Run @p group in the foreground until @p shutdown fires.
   *
   * Stale registry records are purged first. A group whose records are still
   * valid is running under another invocation and is refused.
   */
  int Up(const std::string& group, ShutdownManager& shutdown) {
    if (!LoadConfig()) return kExitUserError;
    auto spec = config_.GetGroup(group);
    if (!spec.has_value()) {
      PrintError(config_.ErrorDetail());
      return kExitUserError;
    }

    ProcessRegistry registry(RegistryDir());
    (void)registry.CleanupStale();
    for (const ProcessRecord& rec : registry.ReadByGroup(group)) {
      if (ProcessRegistry::IsValid(rec)) {
        std::fprintf(options_.err,
                     "Error: group '%s' is already running (%s, pid %d). "
                     "Run 'cligr down %s' first.\n",
                     group.c_str(), rec.item_name.c_str(),
                     static_cast<int>(rec.pid), group.c_str());
        return kExitUserError;
      }
    }

    ConsoleListener console(options_.out, options_.err);
    RegistryRecorder recorder(registry, console);
    recorder.SetPolicy(group, spec.value().restart_policy);
    Supervisor supervisor(config_.GetSettings().supervisor, &recorder);

    auto spawned = supervisor.SpawnGroup(group, spec.value().items,
                                         spec.value().restart_policy,
                                         spec.value().Template());
    if (!spawned.has_value()) {
      PrintError(std::string("cannot start group '") + group +
                 "': " + ToString(spawned.get_error()));
      return kExitInternalError;
    }

    UpContext ctx{&supervisor, options_.out};
    auto registered = shutdown.Register(&Session::StopSupervisor, &ctx);
    if (!registered.has_value()) {
      PrintError(std::string("cannot install shutdown hook: ") +
                 ToString(registered.get_error()));
      return kExitInternalError;
    }

    std::fprintf(options_.out, "Started group %s with %zu process(es)\n",
                 group.c_str(), spec.value().items.size());
    std::fprintf(options_.out, "Press Ctrl+C to stop...\n");
    std::fflush(options_.out);

    (void)shutdown.WaitForShutdown();
    (void)registry.DeleteGroup(group);
    return kExitOk;
  }

  // --------------------------------------------------------------------------
  // down
  // --------------------------------------------------------------------------

  int Down(const std::string& group) {
    DownResult result = StopRecordedGroup(group);

    if (result.killed == 0 && result.not_running == 0 && result.errors.empty()) {
      std::fprintf(options_.out, "Group '%s' is not running\n", group.c_str());
      return kExitOk;
    }
    if (result.killed > 0) {
      std::fprintf(options_.out, "Stopped %u process(es) for group '%s'\n",
                   result.killed, group.c_str());
    }
    if (result.forced > 0) {
      std::fprintf(options_.out, "  %u did not exit in time and were killed\n",
                   result.forced);
    }
    if (result.not_running > 0) {
      std::fprintf(options_.out,
                   "Cleaned up %u stale PID file(s) for group '%s'\n",
                   result.not_running, group.c_str());
    }
    if (!result.errors.empty()) {
      std::fprintf(options_.err, "Errors while stopping processes:\n");
      for (const std::string& e : result.errors) {
        std::fprintf(options_.err, "  %s\n", e.c_str());
      }
      return kExitUserError;
    }
    return kExitOk;
  }

  /**
   * @brief Stop every live process recorded for @p group.
   *
   * Dead PIDs are pruned. A live PID whose record is older than the trust
   * window is only signalled if it still runs the recorded executable;
   * otherwise the PID has likely been reused and the record is pruned.
   * Survivors of the grace period get SIGKILL.
   */
  DownResult StopRecordedGroup(const std::string& group) {
    if (options_.pid_dir.empty()) (void)LoadConfigQuietly();
    ProcessRegistry registry(RegistryDir());
    const uint32_t grace_ms = config_.GetSettings().supervisor.kill_grace_ms;

    DownResult result;
    std::vector<ProcessRecord> records = registry.ReadByGroup(group);
    StopOwningSupervisors(records);

    std::vector<ProcessRecord> live;
    for (ProcessRecord& rec : records) {
      if (!ProcessRegistry::IsRunning(rec.pid) || !StillOwnsPid(rec)) {
        ++result.not_running;
        (void)registry.Delete(rec.group_name, rec.item_name);
        continue;
      }
      ProcessResult sent = SendSignal(rec.pid, SIGTERM);
      if (sent == ProcessResult::kSuccess) {
        live.push_back(std::move(rec));
      } else if (sent == ProcessResult::kNotFound) {
        ++result.not_running;
        (void)registry.Delete(rec.group_name, rec.item_name);
      } else {
        result.errors.push_back("Failed to stop " + rec.item_name + " (pid " +
                                std::to_string(rec.pid) + "): " +
                                std::strerror(errno));
      }
    }

    WaitForExit(live, grace_ms, registry, result);
    if (live.empty()) return result;

    for (const ProcessRecord& rec : live) {
      CLIGR_LOG_WARN("Session", "[%s] pid %d ignored SIGTERM for %u ms, killing",
                     rec.item_name.c_str(), static_cast<int>(rec.pid), grace_ms);
      (void)SendSignal(rec.pid, SIGKILL);
    }
    const uint32_t killed_before = result.killed;
    WaitForExit(live, kForceWaitMs, registry, result);
    result.forced = result.killed - killed_before;
    for (const ProcessRecord& rec : live) {
      result.errors.push_back("Process " + rec.item_name + " (pid " +
                              std::to_string(rec.pid) + ") survived SIGKILL");
    }
    return result;
  }

  // --------------------------------------------------------------------------
  // ls / groups
  // --------------------------------------------------------------------------

  int List(const std::string& group) {
    if (!LoadConfig()) return kExitUserError;
    auto spec = config_.GetGroup(group);
    if (!spec.has_value()) {
      PrintError(config_.ErrorDetail());
      return kExitUserError;
    }
    const GroupSpec& g = spec.value();
    const CommandTemplate tmpl = g.Template();

    std::fprintf(options_.out, "\nGroup: %s\n", g.name.c_str());
    std::fprintf(options_.out, "Tool: %s\n", g.tool.empty() ? "(none)" : g.tool.c_str());
    std::fprintf(options_.out, "Restart: %s\n", ToString(g.restart_policy));
    std::fprintf(options_.out, "\nItems:\n");
    for (const Item& item : g.items) {
      ExpandedCommand cmd = TemplateExpander::ParseItem(tmpl, item);
      std::fprintf(options_.out, "  - %s: %s\n", item.name.c_str(),
                   cmd.full_cmd.c_str());
    }
    std::fprintf(options_.out, "\n");
    return kExitOk;
  }

  int Groups(bool verbose) {
    if (!LoadConfig()) return kExitUserError;
    const std::vector<std::string> names = config_.ListGroups();

    if (!verbose) {
      for (const std::string& name : names) {
        std::fprintf(options_.out, "%s\n", name.c_str());
      }
      return kExitOk;
    }
    if (names.empty()) return kExitOk;

    struct Row {
      std::string name, tool, restart;
      size_t items;
    };
    std::vector<Row> rows;
    size_t w_name = std::strlen("GROUP");
    size_t w_tool = std::strlen("TOOL");
    size_t w_restart = std::strlen("RESTART");
    for (const std::string& name : names) {
      auto spec = config_.GetGroup(name);
      if (!spec.has_value()) continue;
      Row r{name, spec.value().tool.empty() ? "(none)" : spec.value().tool,
            ToString(spec.value().restart_policy), spec.value().items.size()};
      w_name = std::max(w_name, r.name.size());
      w_tool = std::max(w_tool, r.tool.size());
      w_restart = std::max(w_restart, r.restart.size());
      rows.push_back(std::move(r));
    }

    std::fprintf(options_.out, "%-*s  %-*s  %-*s  ITEMS\n", static_cast<int>(w_name),
                 "GROUP", static_cast<int>(w_tool), "TOOL",
                 static_cast<int>(w_restart), "RESTART");
    for (const Row& r : rows) {
      std::fprintf(options_.out, "%-*s  %-*s  %-*s  %zu\n", static_cast<int>(w_name),
                   r.name.c_str(), static_cast<int>(w_tool), r.tool.c_str(),
                   static_cast<int>(w_restart), r.restart.c_str(), r.items);
    }
    return kExitOk;
  }

  // --------------------------------------------------------------------------
  // config
  // --------------------------------------------------------------------------

  /**
   * @brief Show the config path, creating a starter file if none exists,
   *        and optionally open it in $EDITOR (default vi).
   */
  int Config(bool open_editor) {
    const std::string path = ConfigLoader::ResolvePath(options_.config_path);
    if (!ConfigLoader::FileExists(path)) {
      if (!WriteStarterConfig(path)) {
        PrintError("cannot create " + path + ": " + std::strerror(errno));
        return kExitInternalError;
      }
      std::fprintf(options_.out, "Created %s\n", path.c_str());
    }
    std::fprintf(options_.out, "Config file: %s\n", path.c_str());
    std::fflush(options_.out);
    if (!open_editor) return kExitOk;

    const char* env = std::getenv("EDITOR");
    const std::string editor = (env != nullptr && env[0] != '\0') ? env : "vi";

    SubprocessConfig cfg;
    cfg.argv = TokenizeCommand(editor);
    cfg.argv.push_back(path);
    cfg.capture_stdout = false;
    cfg.capture_stderr = false;

    Subprocess proc;
    auto started = proc.Start(cfg);
    if (!started.has_value()) {
      PrintError("cannot start editor '" + editor + "': " +
                 ToString(started.get_error()));
      return kExitInternalError;
    }
    ExitStatus status;
    (void)proc.Wait(0, status);
    if (status.exited && status.exit_code == 127) {
      PrintError("Editor '" + editor +
                 "' not found. Set the EDITOR environment variable.");
      return kExitUserError;
    }
    return (status.exited && status.exit_code == 0) ? kExitOk : kExitUserError;
  }

  static const char* StarterConfig() {
    return "# cligr configuration\n"
           "\n"
           "tools:\n"
           "  docker:\n"
           "    cmd: \"docker run -p $2:$2 $1\"   # $1 = name, $2 = port\n"
           "  node:\n"
           "    cmd: \"node $1.js\"\n"
           "\n"
           "groups:\n"
           "  web:\n"
           "    tool: docker\n"
           "    restart: no\n"
           "    items:\n"
           "      - \"nginx,8080\"\n"
           "      - \"nginx,3000\"\n"
           "\n"
           "  simple:\n"
           "    tool: node\n"
           "    restart: unless-stopped\n"
           "    items:\n"
           "      - \"server\"\n"
           "\n"
           "# Items are comma-separated values: \"name,arg2,arg3\".\n"
           "# $1 is the first value, $2.. the following ones; $key reads params.\n"
           "# Without a registered tool the item is run as a command line.\n"
           "# restart: yes (default) | no | unless-stopped\n";
  }

 private:
  static constexpr uint32_t kPollIntervalMs = 50;
  static constexpr uint32_t kForceWaitMs = 1000;

  struct UpContext {
    Supervisor* supervisor;
    FILE* out;
  };

  static void StopSupervisor(int signo, void* arg) {
    auto* ctx = static_cast<UpContext*>(arg);
    std::fprintf(ctx->out, "\nShutting down...\n");
    std::fflush(ctx->out);
    CLIGR_LOG_INFO("Session", "stopping on signal %d", signo);
    KillReport report = ctx->supervisor->KillAll().get();
    if (report.forced > 0) {
      CLIGR_LOG_WARN("Session", "%u process(es) had to be killed", report.forced);
    }
  }

  bool LoadConfig() {
    if (loaded_) return true;
    const std::string path = ConfigLoader::ResolvePath(options_.config_path);
    auto r = config_.LoadFile(path);
    if (!r.has_value()) {
      PrintError(config_.ErrorDetail());
      return false;
    }
    loaded_ = true;
    return true;
  }

  bool LoadConfigQuietly() {
    if (loaded_) return true;
    const std::string path = ConfigLoader::ResolvePath(options_.config_path);
    loaded_ = config_.LoadFile(path).has_value();
    return loaded_;
  }

  std::string RegistryDir() const {
    if (!options_.pid_dir.empty()) return options_.pid_dir;
    if (!config_.GetSettings().pid_dir.empty()) return config_.GetSettings().pid_dir;
    return ProcessRegistry::DefaultDir();
  }

  /// Inside the trust window the record is believed; past it the PID must
  /// still run the recorded executable.
  static bool StillOwnsPid(const ProcessRecord& rec) {
    if (ProcessRegistry::IsValid(rec)) return true;
    std::vector<std::string> argv = TokenizeCommand(rec.full_cmd);
    if (argv.empty()) return false;
    if (ProcessMatchesExecutable(rec.pid, argv.front())) return true;
    CLIGR_LOG_INFO("Session", "[%s] pid %d no longer runs '%s', record dropped",
                   rec.item_name.c_str(), static_cast<int>(rec.pid),
                   argv.front().c_str());
    return false;
  }

  /**
   * Asks each foreground `up` that owns one of @p records to shut down, so
   * its restart policy does not bring the processes back.
   */
  static void StopOwningSupervisors(const std::vector<ProcessRecord>& records) {
    std::vector<pid_t> owners;
    for (const ProcessRecord& rec : records) {
      const pid_t owner = rec.supervisor_pid;
      if (owner <= 0 || owner == ::getpid()) continue;
      if (std::find(owners.begin(), owners.end(), owner) != owners.end()) continue;
      owners.push_back(owner);
      if (!ProcessRegistry::IsRunning(owner) ||
          !ProcessMatchesExecutable(owner, ReadProcessExecutable(::getpid()))) {
        continue;
      }
      CLIGR_LOG_INFO("Session", "asking supervisor pid %d to stop group '%s'",
                     static_cast<int>(owner), rec.group_name.c_str());
      (void)SendSignal(owner, SIGTERM);
    }
  }

  /// Polls @p live until empty or @p timeout_ms elapses; exits are counted.
  static void WaitForExit(std::vector<ProcessRecord>& live, uint32_t timeout_ms,
                          ProcessRegistry& registry, DownResult& result) {
    uint32_t waited = 0;
    for (;;) {
      for (auto it = live.begin(); it != live.end();) {
        if (!ProcessRegistry::IsRunning(it->pid)) {
          ++result.killed;
          (void)registry.Delete(it->group_name, it->item_name);
          it = live.erase(it);
        } else {
          ++it;
        }
      }
      if (live.empty() || waited >= timeout_ms) return;
      detail::SleepMs(kPollIntervalMs);
      waited += kPollIntervalMs;
    }
  }

  static bool WriteStarterConfig(const std::string& path) {
    FILE* fp = std::fopen(path.c_str(), "wx");
    if (fp == nullptr) return false;
    const char* body = StarterConfig();
    const size_t len = std::strlen(body);
    bool ok = std::fwrite(body, 1, len, fp) == len;
    ok = (std::fclose(fp) == 0) && ok;
    return ok;
  }

  void PrintError(const std::string& msg) const {
    std::fprintf(options_.err, "Error: %s\n", msg.c_str());
  }

  SessionOptions options_;
  ConfigLoader config_;
  bool loaded_ = false;
};

}  // namespace cligr

#endif  // CLIGR_SESSION_HPP_
