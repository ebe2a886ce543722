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
 * @file supervisor.hpp
 * @brief Spawn, monitor, restart and kill named groups of child processes.
 *
 * Per managed process:
 *
 *   Running --exit--> RestartScheduled --delay--> Running
 *          \-------> Stopped            (policy says no restart)
 *           \------> CrashLoopHalted    (too many restarts in the window)
 *
 * Threading:
 *   - One coordinator thread owns the event loop: it reads every child pipe
 *     through IoPoller, reaps exited children, turns each exit into an
 *     ExitEvent, fires restart timers and escalates kills to SIGKILL.
 *   - Public calls may come from any thread. All state lives behind a single
 *     mutex; the coordinator and callers are its only writers.
 *   - SupervisorListener callbacks run with that mutex held and must not call
 *     back into the Supervisor.
 *
 * Managed process records are stable slots inside their group: a restart
 * replaces the Subprocess handle and bumps the slot generation, so exit
 * events from a replaced handle are recognised and dropped.
 */

#ifndef CLIGR_SUPERVISOR_HPP_
#define CLIGR_SUPERVISOR_HPP_

#include "cligr/cmdline.hpp"
#include "cligr/io_poller.hpp"
#include "cligr/log.hpp"
#include "cligr/platform.hpp"
#include "cligr/process.hpp"
#include "cligr/template.hpp"
#include "cligr/vocabulary.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <signal.h>
#include <unistd.h>

namespace cligr {

// ============================================================================
// RestartPolicy
// ============================================================================

enum class RestartPolicy : uint8_t {
  kAlways = 0,     ///< Restart after every exit
  kNever,          ///< Never restart
  kUnlessStopped,  ///< Restart unless ended by the termination signal
};

/// @brief Config-file spelling: "yes", "no", "unless-stopped".
inline const char* ToString(RestartPolicy p) noexcept {
  switch (p) {
    case RestartPolicy::kAlways: return "yes";
    case RestartPolicy::kNever: return "no";
    case RestartPolicy::kUnlessStopped: return "unless-stopped";
  }
  return "yes";
}

inline bool ParseRestartPolicy(const std::string& text, RestartPolicy& out) {
  if (text == "yes" || text == "always" || text == "true") {
    out = RestartPolicy::kAlways;
  } else if (text == "no" || text == "never" || text == "false") {
    out = RestartPolicy::kNever;
  } else if (text == "unless-stopped" || text == "unless-explicitly-stopped") {
    out = RestartPolicy::kUnlessStopped;
  } else {
    return false;
  }
  return true;
}

// ============================================================================
// Status types
// ============================================================================

enum class ProcessState : uint8_t {
  kRunning = 0,
  kRestartScheduled,
  kStopped,
  kCrashLoopHalted,
};

inline const char* ToString(ProcessState s) noexcept {
  switch (s) {
    case ProcessState::kRunning: return "running";
    case ProcessState::kRestartScheduled: return "restarting";
    case ProcessState::kStopped: return "stopped";
    case ProcessState::kCrashLoopHalted: return "crash-loop";
  }
  return "unknown";
}

/// @brief Point-in-time copy of one managed process.
struct ProcessSnapshot {
  std::string name;
  pid_t pid = -1;  ///< -1 while not running
  ProcessState state = ProcessState::kRunning;
  uint32_t restarts = 0;
  std::string full_cmd;
  ExitStatus last_exit;
};

/// @brief Outcome of KillGroup() / KillAll().
struct KillReport {
  uint32_t terminated = 0;  ///< Exited within the grace period
  uint32_t forced = 0;      ///< Needed SIGKILL
};

enum class OutputStream : uint8_t { kStdout = 0, kStderr };

struct SupervisorOptions {
  uint32_t restart_delay_ms = 1000;  ///< Delay before a restart
  uint32_t kill_grace_ms = 5000;     ///< SIGTERM -> SIGKILL escalation
  uint32_t crash_window_ms = 10000;  ///< Trailing crash-loop window
  uint32_t max_restarts = 3;         ///< Restarts allowed inside the window
  int termination_signal = SIGTERM;  ///< Graceful stop signal
};

// ============================================================================
// SupervisorListener
// ============================================================================

/**
 * @brief Observer for process lifecycle and output.
 *
 * Called on the coordinator thread (or on the caller of SpawnGroup() for the
 * initial spawns) with the supervisor lock held.
 */
class SupervisorListener {
 public:
  virtual ~SupervisorListener() = default;

  /// A child was spawned (initially or by a restart).
  virtual void OnProcessStarted(const std::string& /*group*/,
                                const std::string& /*item*/, pid_t /*pid*/,
                                const std::string& /*full_cmd*/) {}

  /// A child ended; @p will_restart tells whether a restart is scheduled.
  virtual void OnProcessExited(const std::string& /*group*/,
                               const std::string& /*item*/,
                               const ExitStatus& /*status*/,
                               bool /*will_restart*/) {}

  /// Restarts for the item were halted permanently.
  virtual void OnCrashLoop(const std::string& /*group*/,
                           const std::string& /*item*/,
                           uint32_t /*exits_in_window*/) {}

  /// One output chunk prefixed with "[item] ": a whole line, or text the
  /// child has written without a newline yet. A bare "\n" closes such text
  /// when the stream ends.
  virtual void OnOutput(const std::string& group, const std::string& item,
                        OutputStream stream, const std::string& line) = 0;
};

/// @brief Writes prefixed child output to a pair of streams.
class ConsoleListener : public SupervisorListener {
 public:
  explicit ConsoleListener(FILE* out = stdout, FILE* err = stderr) noexcept
      : out_(out), err_(err) {}

  void OnOutput(const std::string& /*group*/, const std::string& /*item*/,
                OutputStream stream, const std::string& line) override {
    FILE* fp = (stream == OutputStream::kStdout) ? out_ : err_;
    (void)std::fwrite(line.data(), 1, line.size(), fp);
    (void)std::fflush(fp);
  }

 private:
  FILE* out_;
  FILE* err_;
};

// ============================================================================
// Supervisor
// ============================================================================

class Supervisor final {
 public:
  using Clock = std::chrono::steady_clock;

  explicit Supervisor(const SupervisorOptions& options = SupervisorOptions(),
                      SupervisorListener* listener = nullptr)
      : options_(options),
        listener_(listener != nullptr ? listener : &console_) {
    if (!poller_.IsValid() || !wakeup_.IsValid()) {
      CLIGR_LOG_ERROR("Supervisor", "cannot create event loop: %s",
                      ToString(PollerError::kCreateFailed));
      return;
    }
    if (!poller_.Add(wakeup_.Fd(), static_cast<uint8_t>(IoEvent::kReadable))) {
      CLIGR_LOG_ERROR("Supervisor", "cannot watch wakeup fd: %s",
                      ToString(PollerError::kAddFailed));
      return;
    }
    thread_ = std::thread([this]() { Run(); });
  }

  /// Kills every remaining group (with the normal grace period) and joins.
  ~Supervisor() {
    if (thread_.joinable()) {
      KillAll().wait();
      {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
      }
      wakeup_.Notify();
      thread_.join();
    }
    for (auto& kv : channels_) {
      ::close(kv.first);
    }
  }

  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;

  // --------------------------------------------------------------------------
  // Group control
  // --------------------------------------------------------------------------

  /**
   * @brief Start one child per item.
   *
   * Fails without side effects if @p group is already tracked. Commands are
   * produced by TemplateExpander::ParseItem(@p tmpl, item) at every spawn,
   * including restarts. A child that cannot be created is reported as an
   * exit (status 127) and goes through the restart policy like a crash.
   */
  expected<void, SupervisorError> SpawnGroup(
      const std::string& group, const std::vector<Item>& items,
      RestartPolicy policy, const CommandTemplate& tmpl = CommandTemplate()) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!thread_.joinable()) {
      return expected<void, SupervisorError>::error(
          SupervisorError::kPollerFailed);
    }
    if (groups_.find(group) != groups_.end()) {
      CLIGR_LOG_ERROR("Supervisor", "group '%s' is already running",
                      group.c_str());
      return expected<void, SupervisorError>::error(
          SupervisorError::kGroupAlreadyRunning);
    }

    GroupRecord& rec = groups_[group];
    rec.tmpl = tmpl;
    rec.processes.reserve(items.size());
    for (const Item& item : items) {
      ManagedProcess mp;
      mp.item = item;
      mp.policy = policy;
      rec.processes.push_back(std::move(mp));
    }
    for (uint32_t i = 0; i < rec.processes.size(); ++i) {
      SpawnSlot(group, rec, i);
    }
    CLIGR_LOG_INFO("Supervisor", "group '%s' started with %zu process(es)",
                   group.c_str(), rec.processes.size());
    wakeup_.Notify();
    return expected<void, SupervisorError>::success();
  }

  /**
   * @brief Stop a group.
   *
   * The termination signal goes to every live child, then the group leaves
   * the tracking table at once (pending restarts die with it). Children still
   * alive after the grace period get SIGKILL. The future completes when all
   * of them have been reaped; an unknown group completes immediately.
   */
  std::shared_future<KillReport> KillGroup(const std::string& group) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ticket = std::make_shared<KillTicket>();
    std::shared_future<KillReport> done = ticket->promise.get_future().share();

    auto it = groups_.find(group);
    if (it != groups_.end()) {
      BeginTermination(it->first, it->second, ticket);
      groups_.erase(it);
    }
    CompleteIfDone(*ticket);
    wakeup_.Notify();
    return done;
  }

  /// @brief KillGroup() for every tracked group, all running concurrently.
  std::shared_future<KillReport> KillAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ticket = std::make_shared<KillTicket>();
    std::shared_future<KillReport> done = ticket->promise.get_future().share();

    for (auto& kv : groups_) {
      BeginTermination(kv.first, kv.second, ticket);
    }
    groups_.clear();
    CompleteIfDone(*ticket);
    wakeup_.Notify();
    return done;
  }

  // --------------------------------------------------------------------------
  // Queries
  // --------------------------------------------------------------------------

  bool IsGroupRunning(const std::string& group) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return groups_.find(group) != groups_.end();
  }

  std::vector<ProcessSnapshot> GetGroupStatus(const std::string& group) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProcessSnapshot> out;
    auto it = groups_.find(group);
    if (it == groups_.end()) return out;
    out.reserve(it->second.processes.size());
    for (const ManagedProcess& mp : it->second.processes) {
      ProcessSnapshot s;
      s.name = mp.item.name;
      s.pid = mp.handle.GetPid();
      s.state = mp.state;
      s.restarts = mp.restarts;
      s.full_cmd = mp.full_cmd;
      s.last_exit = mp.last_exit;
      out.push_back(std::move(s));
    }
    return out;
  }

  std::vector<std::string> GetRunningGroups() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(groups_.size());
    for (const auto& kv : groups_) out.push_back(kv.first);
    return out;
  }

  const SupervisorOptions& Options() const noexcept { return options_; }

 private:
  // --------------------------------------------------------------------------
  // Internal types
  // --------------------------------------------------------------------------

  struct ManagedProcess {
    Item item;
    RestartPolicy policy = RestartPolicy::kAlways;
    Subprocess handle;
    uint64_t generation = 0;
    ProcessState state = ProcessState::kRunning;
    uint32_t restarts = 0;
    std::string full_cmd;
    ExitStatus last_exit;
    Clock::time_point restart_due;
  };

  struct GroupRecord {
    CommandTemplate tmpl;
    std::vector<ManagedProcess> processes;  // never resized after creation
  };

  struct ExitEvent {
    std::string group;
    uint32_t index;
    uint64_t generation;
    ExitStatus status;
  };

  struct KillTicket {
    std::promise<KillReport> promise;
    KillReport report;
    uint32_t remaining = 0;
    bool completed = false;
  };

  struct Terminating {
    std::string group;
    std::string item;
    Subprocess handle;
    Clock::time_point deadline;
    bool forced = false;
    std::shared_ptr<KillTicket> ticket;
  };

  struct OutputChannel {
    std::string group;
    std::string item;
    OutputStream stream;
    std::string partial;
    bool line_open = false;  ///< Last chunk sent did not end in '\n'
  };

  using HistoryKey = std::pair<std::string, std::string>;

  static constexpr int32_t kReapIntervalMs = 50;
  static constexpr size_t kReadChunk = 4096;
  static constexpr uint32_t kMaxReadsPerWake = 16;

  // --------------------------------------------------------------------------
  // Spawning (mutex held)
  // --------------------------------------------------------------------------

  void SpawnSlot(const std::string& group, GroupRecord& rec, uint32_t index) {
    ManagedProcess& mp = rec.processes[index];
    ExpandedCommand cmd = TemplateExpander::ParseItem(rec.tmpl, mp.item);
    mp.full_cmd = cmd.full_cmd;
    mp.generation = ++next_generation_;
    mp.state = ProcessState::kRunning;

    SubprocessConfig cfg;
    cfg.argv = TokenizeCommand(cmd.full_cmd);

    Subprocess proc;
    auto started = proc.Start(cfg);
    if (!started.has_value()) {
      CLIGR_LOG_ERROR("Supervisor", "[%s] spawn failed (%s): %s",
                      mp.item.name.c_str(), ToString(started.get_error()),
                      cmd.full_cmd.c_str());
      events_.push_back(
          ExitEvent{group, index, mp.generation, ExitStatus::SpawnFailure()});
      return;
    }

    AttachOutput(group, mp.item.name, proc.ReleaseStdout(), OutputStream::kStdout);
    AttachOutput(group, mp.item.name, proc.ReleaseStderr(), OutputStream::kStderr);
    mp.handle = std::move(proc);
    CLIGR_LOG_DEBUG("Supervisor", "[%s] pid %d: %s", mp.item.name.c_str(),
                    static_cast<int>(mp.handle.GetPid()), cmd.full_cmd.c_str());
    listener_->OnProcessStarted(group, mp.item.name, mp.handle.GetPid(),
                                mp.full_cmd);
  }

  void AttachOutput(const std::string& group, const std::string& item, int fd,
                    OutputStream stream) {
    if (fd < 0) return;
    if (!poller_.Add(fd, static_cast<uint8_t>(IoEvent::kReadable))) {
      CLIGR_LOG_WARN("Supervisor", "[%s] output not captured: %s", item.c_str(),
                     ToString(PollerError::kAddFailed));
      ::close(fd);
      return;
    }
    OutputChannel ch;
    ch.group = group;
    ch.item = item;
    ch.stream = stream;
    channels_[fd] = std::move(ch);
  }

  // --------------------------------------------------------------------------
  // Termination (mutex held)
  // --------------------------------------------------------------------------

  void BeginTermination(const std::string& group, GroupRecord& rec,
                        const std::shared_ptr<KillTicket>& ticket) {
    const Clock::time_point deadline =
        Clock::now() + std::chrono::milliseconds(options_.kill_grace_ms);
    for (ManagedProcess& mp : rec.processes) {
      if (!mp.handle.IsRunning()) continue;
      (void)mp.handle.Signal(options_.termination_signal);
      Terminating t;
      t.group = group;
      t.item = mp.item.name;
      t.handle = std::move(mp.handle);
      t.deadline = deadline;
      t.ticket = ticket;
      terminating_.push_back(std::move(t));
      ++ticket->remaining;
    }
    for (auto it = history_.begin(); it != history_.end();) {
      if (it->first.first == group) {
        it = history_.erase(it);
      } else {
        ++it;
      }
    }
  }

  static void CompleteIfDone(KillTicket& ticket) {
    if (!ticket.completed && ticket.remaining == 0) {
      ticket.completed = true;
      ticket.promise.set_value(ticket.report);
    }
  }

  // --------------------------------------------------------------------------
  // Event loop
  // --------------------------------------------------------------------------

  void Run() {
    for (;;) {
      int32_t timeout = NextTimeoutMs();
      auto waited = poller_.Wait(timeout);

      std::lock_guard<std::mutex> lock(mutex_);
      if (stop_) break;
      if (!waited.has_value()) {
        CLIGR_LOG_ERROR("Supervisor", "%s", ToString(waited.get_error()));
      } else {
        const PollResult* results = poller_.Results();
        for (uint32_t i = 0; i < waited.value(); ++i) {
          if (results[i].fd == wakeup_.Fd()) {
            wakeup_.Drain();
          } else {
            ServiceChannel(results[i].fd);
          }
        }
      }

      ReapChildren();
      DispatchExitEvents();
      FireRestartTimers();
      EnforceKillDeadlines();
    }
  }

  int32_t NextTimeoutMs() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!terminating_.empty() || !events_.empty()) return kReapIntervalMs;

    bool any_pending = false;
    Clock::time_point earliest = Clock::time_point::max();
    for (const auto& kv : groups_) {
      for (const ManagedProcess& mp : kv.second.processes) {
        if (mp.handle.IsRunning()) return kReapIntervalMs;
        if (mp.state == ProcessState::kRestartScheduled) {
          any_pending = true;
          earliest = std::min(earliest, mp.restart_due);
        }
      }
    }
    if (!any_pending) return -1;
    auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
                    earliest - Clock::now())
                    .count();
    if (wait < 0) return 0;
    return static_cast<int32_t>(std::min<int64_t>(wait, kReapIntervalMs));
  }

  void ServiceChannel(int fd) {
    auto it = channels_.find(fd);
    if (it == channels_.end()) return;
    OutputChannel& ch = it->second;

    char buf[kReadChunk];
    for (uint32_t n = 0; n < kMaxReadsPerWake; ++n) {
      ssize_t got = ::read(fd, buf, sizeof(buf));
      if (got > 0) {
        ch.partial.append(buf, static_cast<size_t>(got));
        EmitLines(ch);
        continue;
      }
      if (got < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
      if (got < 0 && errno == EINTR) continue;
      // EOF or hard error: flush and drop the channel.
      EmitTail(ch);
      (void)poller_.Remove(fd);
      ::close(fd);
      channels_.erase(it);
      return;
    }
    // Pipe drained (or read budget spent): prompts and progress output
    // without a newline go out as their own chunk.
    EmitPartial(ch);
  }

  void Emit(OutputChannel& ch, const char* data, size_t len) {
    std::string chunk = "[" + ch.item + "] ";
    chunk.append(data, len);
    ch.line_open = chunk.back() != '\n';
    listener_->OnOutput(ch.group, ch.item, ch.stream, chunk);
  }

  /// Complete lines, one chunk each.
  void EmitLines(OutputChannel& ch) {
    size_t start = 0;
    for (;;) {
      size_t nl = ch.partial.find('\n', start);
      if (nl == std::string::npos) break;
      Emit(ch, ch.partial.data() + start, nl - start + 1);
      start = nl + 1;
    }
    ch.partial.erase(0, start);
  }

  void EmitPartial(OutputChannel& ch) {
    if (ch.partial.empty()) return;
    Emit(ch, ch.partial.data(), ch.partial.size());
    ch.partial.clear();
  }

  /// End of stream: terminate whatever line is still open.
  void EmitTail(OutputChannel& ch) {
    if (!ch.partial.empty()) {
      ch.partial += '\n';
      EmitPartial(ch);
    } else if (ch.line_open) {
      ch.line_open = false;
      listener_->OnOutput(ch.group, ch.item, ch.stream, "\n");
    }
  }

  void ReapChildren() {
    for (auto& kv : groups_) {
      std::vector<ManagedProcess>& procs = kv.second.processes;
      for (uint32_t i = 0; i < procs.size(); ++i) {
        ExitStatus status;
        if (procs[i].handle.IsRunning() && procs[i].handle.TryWait(status)) {
          events_.push_back(ExitEvent{kv.first, i, procs[i].generation, status});
        }
      }
    }

    for (auto it = terminating_.begin(); it != terminating_.end();) {
      ExitStatus status;
      if (!it->handle.TryWait(status)) {
        ++it;
        continue;
      }
      if (it->forced) {
        ++it->ticket->report.forced;
      } else {
        ++it->ticket->report.terminated;
      }
      listener_->OnProcessExited(it->group, it->item, status, false);
      --it->ticket->remaining;
      CompleteIfDone(*it->ticket);
      it = terminating_.erase(it);
    }
  }

  void DispatchExitEvents() {
    while (!events_.empty()) {
      ExitEvent ev = std::move(events_.front());
      events_.pop_front();
      HandleExit(ev);
    }
  }

  /// Restart decision for one exit; stale events are dropped.
  void HandleExit(const ExitEvent& ev) {
    auto git = groups_.find(ev.group);
    if (git == groups_.end()) return;
    if (ev.index >= git->second.processes.size()) return;
    ManagedProcess& mp = git->second.processes[ev.index];
    if (mp.generation != ev.generation) return;

    mp.last_exit = ev.status;
    const char* name = mp.item.name.c_str();

    if (mp.policy == RestartPolicy::kUnlessStopped && ev.status.signaled &&
        ev.status.term_signal == options_.termination_signal) {
      CLIGR_LOG_INFO("Supervisor", "[%s] stopped by signal %d, not restarting",
                     name, ev.status.term_signal);
      mp.state = ProcessState::kStopped;
      listener_->OnProcessExited(ev.group, mp.item.name, ev.status, false);
      return;
    }
    if (mp.policy == RestartPolicy::kNever) {
      CLIGR_LOG_INFO("Supervisor", "[%s] exited (%s %d), restart policy 'no'",
                     name, ev.status.signaled ? "signal" : "code",
                     ev.status.signaled ? ev.status.term_signal
                                        : ev.status.exit_code);
      mp.state = ProcessState::kStopped;
      listener_->OnProcessExited(ev.group, mp.item.name, ev.status, false);
      return;
    }

    // Sliding window: keep only restarts inside the trailing window.
    const Clock::time_point now = Clock::now();
    std::deque<Clock::time_point>& hist = history_[HistoryKey(ev.group, mp.item.name)];
    hist.push_back(now);
    const auto window = std::chrono::milliseconds(options_.crash_window_ms);
    while (!hist.empty() && now - hist.front() > window) {
      hist.pop_front();
    }
    if (hist.size() > options_.max_restarts) {
      CLIGR_LOG_ERROR("Supervisor",
                      "[%s] crash loop detected: %zu exits within %u ms, "
                      "restarts halted",
                      name, hist.size(), options_.crash_window_ms);
      mp.state = ProcessState::kCrashLoopHalted;
      listener_->OnProcessExited(ev.group, mp.item.name, ev.status, false);
      listener_->OnCrashLoop(ev.group, mp.item.name,
                             static_cast<uint32_t>(hist.size()));
      return;
    }

    CLIGR_LOG_INFO("Supervisor", "[%s] exited (%s %d), restarting in %u ms",
                   name, ev.status.signaled ? "signal" : "code",
                   ev.status.signaled ? ev.status.term_signal
                                      : ev.status.exit_code,
                   options_.restart_delay_ms);
    mp.state = ProcessState::kRestartScheduled;
    mp.restart_due = now + std::chrono::milliseconds(options_.restart_delay_ms);
    listener_->OnProcessExited(ev.group, mp.item.name, ev.status, true);
  }

  void FireRestartTimers() {
    const Clock::time_point now = Clock::now();
    for (auto& kv : groups_) {
      for (uint32_t i = 0; i < kv.second.processes.size(); ++i) {
        ManagedProcess& mp = kv.second.processes[i];
        if (mp.state != ProcessState::kRestartScheduled || mp.restart_due > now) {
          continue;
        }
        ++mp.restarts;
        CLIGR_LOG_INFO("Supervisor", "[%s] restarting (attempt %u)",
                       mp.item.name.c_str(), mp.restarts);
        SpawnSlot(kv.first, kv.second, i);
      }
    }
  }

  void EnforceKillDeadlines() {
    const Clock::time_point now = Clock::now();
    for (Terminating& t : terminating_) {
      if (t.forced || now < t.deadline) continue;
      CLIGR_LOG_WARN("Supervisor",
                     "[%s] still alive %u ms after termination signal, "
                     "sending SIGKILL",
                     t.item.c_str(), options_.kill_grace_ms);
      (void)t.handle.Signal(SIGKILL);
      t.forced = true;
    }
  }

  // --------------------------------------------------------------------------
  // Data members
  // --------------------------------------------------------------------------

  const SupervisorOptions options_;
  ConsoleListener console_;
  SupervisorListener* listener_;

  mutable std::mutex mutex_;
  std::map<std::string, GroupRecord> groups_;
  std::map<HistoryKey, std::deque<Clock::time_point>> history_;
  std::deque<ExitEvent> events_;
  std::vector<Terminating> terminating_;
  std::map<int, OutputChannel> channels_;
  uint64_t next_generation_ = 0;
  bool stop_ = false;

  IoPoller poller_;
  WakeupFd wakeup_;
  std::thread thread_;
};

}  // namespace cligr

#endif  // CLIGR_SUPERVISOR_HPP_
