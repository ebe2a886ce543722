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
 * @file registry.hpp
 * @brief File-per-process PID records, shared between CLI invocations.
 *
 * One pretty-printed JSON file per (group, item) under a fixed directory
 * (default $HOME/.cligr/pids):
 *
 *   {
 *     "pid": 4242,
 *     "groupName": "web",
 *     "itemName": "api",
 *     "startTime": 1718000000000,
 *     "restartPolicy": "yes",
 *     "fullCmd": "node server.js 3000",
 *     "supervisorPid": 4200
 *   }
 *
 * File name is <enc(group)>_<enc(item)>.pid; enc percent-encodes every byte
 * outside [A-Za-z0-9.-], so the single '_' always separates the two parts.
 * Writes go to a temp file that is renamed over the target; a reader sees
 * either the old record or the new one.
 */

#ifndef CLIGR_REGISTRY_HPP_
#define CLIGR_REGISTRY_HPP_

#include "cligr/log.hpp"
#include "cligr/platform.hpp"
#include "cligr/process.hpp"
#include "cligr/supervisor.hpp"
#include "cligr/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

namespace cligr {

/// @brief Durable record of one spawned process.
struct ProcessRecord {
  pid_t pid = -1;
  std::string group_name;
  std::string item_name;
  int64_t start_time = 0;  ///< Epoch milliseconds at spawn
  RestartPolicy restart_policy = RestartPolicy::kAlways;
  std::string full_cmd;
  pid_t supervisor_pid = 0;  ///< Process running the supervisor (0 = unknown)
};

class ProcessRegistry final {
 public:
  /// Records older than this are not trusted even if the PID is alive.
  static constexpr int64_t kValidityWindowMs = 5 * 60 * 1000;

  explicit ProcessRegistry(std::string dir = DefaultDir()) : dir_(std::move(dir)) {}

  /// @brief $HOME/.cligr/pids, or ./.cligr/pids without HOME.
  static std::string DefaultDir() {
    const char* home = std::getenv("HOME");
    std::string base = (home != nullptr && home[0] != '\0') ? home : ".";
    return base + "/.cligr/pids";
  }

  const std::string& Dir() const noexcept { return dir_; }

  // --------------------------------------------------------------------------
  // Write / delete
  // --------------------------------------------------------------------------

  /// @brief Persist @p rec, replacing any record for the same (group, item).
  expected<void, RegistryError> Write(const ProcessRecord& rec) {
    if (!MakeDirs(dir_)) {
      CLIGR_LOG_ERROR("Registry", "cannot create %s: %s", dir_.c_str(),
                      std::strerror(errno));
      return expected<void, RegistryError>::error(RegistryError::kDirCreateFailed);
    }

    const std::string path = PathFor(rec.group_name, rec.item_name);
    const std::string tmp = path + ".tmp." + std::to_string(::getpid());
    const std::string body = Encode(rec);

    FILE* fp = std::fopen(tmp.c_str(), "w");
    if (fp == nullptr) {
      CLIGR_LOG_ERROR("Registry", "cannot open %s: %s", tmp.c_str(),
                      std::strerror(errno));
      return expected<void, RegistryError>::error(RegistryError::kWriteFailed);
    }
    auto unlink_tmp = MakeScopeGuard([&tmp]() { (void)::unlink(tmp.c_str()); });

    bool ok = std::fwrite(body.data(), 1, body.size(), fp) == body.size();
    ok = (std::fflush(fp) == 0) && ok;
    ok = (::fsync(::fileno(fp)) == 0) && ok;
    ok = (std::fclose(fp) == 0) && ok;
    if (!ok || std::rename(tmp.c_str(), path.c_str()) != 0) {
      CLIGR_LOG_ERROR("Registry", "cannot write %s: %s", path.c_str(),
                      std::strerror(errno));
      return expected<void, RegistryError>::error(RegistryError::kWriteFailed);
    }
    unlink_tmp.release();
    return expected<void, RegistryError>::success();
  }

  /// @brief Remove the record for (group, item). Absent is not an error.
  expected<void, RegistryError> Delete(const std::string& group,
                                       const std::string& item) {
    return RemoveFile(PathFor(group, item));
  }

  /// @brief Remove every record of @p group. Absent is not an error.
  expected<void, RegistryError> DeleteGroup(const std::string& group) {
    const std::string prefix = EncodeComponent(group) + "_";
    bool failed = false;
    for (const std::string& file : ListRecordFiles()) {
      if (file.compare(0, prefix.size(), prefix) != 0) continue;
      if (!RemoveFile(dir_ + "/" + file).has_value()) failed = true;
    }
    if (failed) {
      return expected<void, RegistryError>::error(RegistryError::kDeleteFailed);
    }
    return expected<void, RegistryError>::success();
  }

  // --------------------------------------------------------------------------
  // Read
  // --------------------------------------------------------------------------

  /// @brief Records of @p group; unreadable or corrupt files are skipped.
  std::vector<ProcessRecord> ReadByGroup(const std::string& group) const {
    const std::string prefix = EncodeComponent(group) + "_";
    std::vector<ProcessRecord> out;
    for (const std::string& file : ListRecordFiles()) {
      if (file.compare(0, prefix.size(), prefix) != 0) continue;
      ProcessRecord rec;
      if (ReadRecord(dir_ + "/" + file, rec) && rec.group_name == group) {
        out.push_back(std::move(rec));
      }
    }
    return out;
  }

  /// @brief Every readable record in the directory.
  std::vector<ProcessRecord> ReadAll() const {
    std::vector<ProcessRecord> out;
    for (const std::string& file : ListRecordFiles()) {
      ProcessRecord rec;
      if (ReadRecord(dir_ + "/" + file, rec)) {
        out.push_back(std::move(rec));
      }
    }
    return out;
  }

  /// @brief Distinct group names that have at least one record, sorted.
  std::vector<std::string> GetRecordedGroups() const {
    std::vector<std::string> groups;
    for (const ProcessRecord& rec : ReadAll()) {
      if (std::find(groups.begin(), groups.end(), rec.group_name) == groups.end()) {
        groups.push_back(rec.group_name);
      }
    }
    std::sort(groups.begin(), groups.end());
    return groups;
  }

  // --------------------------------------------------------------------------
  // Validity
  // --------------------------------------------------------------------------

  /// @brief Signal-0 probe: the PID is occupied by some process.
  static bool IsRunning(pid_t pid) { return IsProcessAlive(pid); }

  /// @brief Alive and recorded within the last kValidityWindowMs.
  static bool IsValid(const ProcessRecord& rec) {
    if (!IsRunning(rec.pid)) return false;
    return rec.start_time > NowEpochMs() - kValidityWindowMs;
  }

  /// @brief Delete every record that fails IsValid(); returns what was removed.
  std::vector<ProcessRecord> CleanupStale() {
    std::vector<ProcessRecord> removed;
    for (ProcessRecord& rec : ReadAll()) {
      if (IsValid(rec)) continue;
      if (Delete(rec.group_name, rec.item_name).has_value()) {
        CLIGR_LOG_DEBUG("Registry", "removed stale record %s/%s (pid %d)",
                        rec.group_name.c_str(), rec.item_name.c_str(),
                        static_cast<int>(rec.pid));
        removed.push_back(std::move(rec));
      }
    }
    return removed;
  }

  // --------------------------------------------------------------------------
  // Encoding
  // --------------------------------------------------------------------------

  std::string PathFor(const std::string& group, const std::string& item) const {
    return dir_ + "/" + EncodeComponent(group) + "_" + EncodeComponent(item) +
           ".pid";
  }

  static std::string EncodeComponent(const std::string& s) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
      if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
          (c >= '0' && c <= '9') || c == '.' || c == '-') {
        out += static_cast<char>(c);
      } else {
        out += '%';
        out += kHex[c >> 4];
        out += kHex[c & 0x0F];
      }
    }
    return out;
  }

  static std::string Encode(const ProcessRecord& rec) {
    nlohmann::json j;
    j["pid"] = static_cast<int64_t>(rec.pid);
    j["groupName"] = rec.group_name;
    j["itemName"] = rec.item_name;
    j["startTime"] = rec.start_time;
    j["restartPolicy"] = ToString(rec.restart_policy);
    j["fullCmd"] = rec.full_cmd;
    if (rec.supervisor_pid > 0) {
      j["supervisorPid"] = static_cast<int64_t>(rec.supervisor_pid);
    }
    return j.dump(2) + "\n";
  }

  /// @brief Parse a record body; false if it is not a complete record.
  static bool Decode(const std::string& text, ProcessRecord& out) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return false;

    auto pid = j.find("pid");
    auto group = j.find("groupName");
    auto item = j.find("itemName");
    auto start = j.find("startTime");
    auto cmd = j.find("fullCmd");
    if (pid == j.end() || !IsPid(*pid)) return false;
    if (group == j.end() || !group->is_string()) return false;
    if (item == j.end() || !item->is_string()) return false;
    if (start == j.end() || !start->is_number_integer()) return false;
    if (start->is_number_unsigned() &&
        start->get<uint64_t>() >
            static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return false;
    }
    if (cmd == j.end() || !cmd->is_string()) return false;

    ProcessRecord rec;
    rec.pid = static_cast<pid_t>(pid->get<int64_t>());
    rec.group_name = group->get<std::string>();
    rec.item_name = item->get<std::string>();
    rec.start_time = start->get<int64_t>();
    rec.full_cmd = cmd->get<std::string>();

    auto policy = j.find("restartPolicy");
    if (policy != j.end() && !policy->is_null()) {
      if (!policy->is_string() ||
          !ParseRestartPolicy(policy->get<std::string>(), rec.restart_policy)) {
        return false;
      }
    }
    auto owner = j.find("supervisorPid");
    if (owner != j.end() && !owner->is_null()) {
      if (!IsPid(*owner)) return false;
      rec.supervisor_pid = static_cast<pid_t>(owner->get<int64_t>());
    }
    out = std::move(rec);
    return true;
  }

 private:
  /// Integer in [1, max pid_t]; anything else would wrap on conversion.
  static bool IsPid(const nlohmann::json& v) {
    if (!v.is_number_integer()) return false;
    if (v.is_number_unsigned()) {
      const uint64_t n = v.get<uint64_t>();
      return n > 0 && n <= static_cast<uint64_t>(std::numeric_limits<pid_t>::max());
    }
    const int64_t n = v.get<int64_t>();
    return n > 0 && n <= std::numeric_limits<pid_t>::max();
  }

  static bool MakeDirs(const std::string& path) {
    std::string partial;
    size_t pos = 0;
    while (pos != std::string::npos) {
      pos = path.find('/', pos + 1);
      partial = path.substr(0, pos);
      if (partial.empty()) continue;
      if (::mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
        return false;
      }
    }
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
  }

  static expected<void, RegistryError> RemoveFile(const std::string& path) {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
      CLIGR_LOG_WARN("Registry", "cannot delete %s: %s", path.c_str(),
                     std::strerror(errno));
      return expected<void, RegistryError>::error(RegistryError::kDeleteFailed);
    }
    return expected<void, RegistryError>::success();
  }

  /// File names ending in ".pid"; a missing directory yields none.
  std::vector<std::string> ListRecordFiles() const {
    std::vector<std::string> files;
    DIR* dir = ::opendir(dir_.c_str());
    if (dir == nullptr) return files;
    while (struct dirent* ent = ::readdir(dir)) {
      const size_t len = std::strlen(ent->d_name);
      if (len > 4 && std::strcmp(ent->d_name + len - 4, ".pid") == 0) {
        files.emplace_back(ent->d_name, len);
      }
    }
    ::closedir(dir);
    std::sort(files.begin(), files.end());
    return files;
  }

  static bool ReadRecord(const std::string& path, ProcessRecord& out) {
    FILE* fp = std::fopen(path.c_str(), "r");
    if (fp == nullptr) return false;
    std::string text;
    char buf[1024];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), fp)) > 0) {
      text.append(buf, n);
    }
    std::fclose(fp);
    if (!Decode(text, out)) {
      CLIGR_LOG_DEBUG("Registry", "skipping unreadable record %s", path.c_str());
      return false;
    }
    return true;
  }

  std::string dir_;
};

}  // namespace cligr

#endif  // CLIGR_REGISTRY_HPP_
