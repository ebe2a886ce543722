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
 * @file config.hpp
 * @brief .cligr.yml loader (fkYAML backend).
 *
 * @code
 *   tools:
 *     docker:
 *       cmd: "docker run -p $2:$2 $1"
 *   groups:
 *     web:
 *       tool: docker
 *       restart: unless-stopped
 *       params: { env: prod }
 *       items:
 *         - "nginx,8080"             # name = "nginx"
 *         - api: "node,3000"         # explicit name
 *   settings:
 *     restart_delay_ms: 1000
 * @endcode
 *
 * The whole document is validated on load; GetGroup() only resolves.
 */

#ifndef CLIGR_CONFIG_HPP_
#define CLIGR_CONFIG_HPP_

#include "cligr/log.hpp"
#include "cligr/platform.hpp"
#include "cligr/supervisor.hpp"
#include "cligr/template.hpp"
#include "cligr/vocabulary.hpp"

#include <fkYAML/node.hpp>

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <set>
#include <string>
#include <vector>

#include <sys/stat.h>

namespace cligr {

/// @brief One resolved group.
struct GroupSpec {
  std::string name;
  std::string tool;           ///< As written in the file ("" = none)
  std::string tool_template;  ///< tools.<tool>.cmd, "" if tool is not registered
  RestartPolicy restart_policy = RestartPolicy::kAlways;
  std::vector<Item> items;
  NamedParams params;

  CommandTemplate Template() const {
    CommandTemplate ct;
    ct.tool = tool;
    ct.tool_template = tool_template;
    ct.params = params;
    return ct;
  }
};

/// @brief Optional `settings` block.
struct Settings {
  SupervisorOptions supervisor;
  std::string pid_dir;  ///< "" = registry default
};

class ConfigLoader final {
 public:
  static constexpr const char* kFileName = ".cligr.yml";

  /**
   * @brief Pick the config file.
   *
   * An explicit path always wins. Otherwise $HOME/.cligr.yml, then
   * ./.cligr.yml; if neither exists the home path is returned.
   */
  static std::string ResolvePath(const std::string& explicit_path = std::string()) {
    if (!explicit_path.empty()) return explicit_path;
    const std::string home = HomePath();
    if (FileExists(home)) return home;
    const std::string local = std::string("./") + kFileName;
    if (FileExists(local)) return local;
    return home;
  }

  static std::string HomePath() {
    const char* home = std::getenv("HOME");
    std::string base = (home != nullptr && home[0] != '\0') ? home : ".";
    return base + "/" + kFileName;
  }

  static bool FileExists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
  }

  // --------------------------------------------------------------------------
  // Loading
  // --------------------------------------------------------------------------

  expected<void, ConfigError> LoadFile(const std::string& path) {
    path_ = path;
    FILE* fp = std::fopen(path.c_str(), "r");
    if (fp == nullptr) {
      return Fail(ConfigError::kFileNotFound, "Config file not found: " + path);
    }
    std::string text;
    char buf[4096];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), fp)) > 0) {
      text.append(buf, n);
    }
    std::fclose(fp);
    return LoadBuffer(text);
  }

  expected<void, ConfigError> LoadBuffer(const std::string& yaml) {
    tools_.clear();
    groups_.clear();
    settings_ = Settings();
    detail_.clear();

    fkyaml::node root;
    try {
      root = fkyaml::node::deserialize(yaml);
    } catch (const fkyaml::exception& e) {
      return Fail(ConfigError::kParseError, std::string("Invalid YAML: ") + e.what());
    }
    if (!root.is_mapping()) {
      return Fail(ConfigError::kInvalidSchema, "Config must be a mapping");
    }

    try {
      if (root.contains("tools")) {
        auto r = ParseTools(root["tools"]);
        if (!r.has_value()) return r;
      }
      if (!root.contains("groups") || !root["groups"].is_mapping()) {
        return Fail(ConfigError::kInvalidSchema,
                    "Config must have a \"groups\" mapping");
      }
      fkyaml::node& groups = root["groups"];
      for (auto it = groups.begin(); it != groups.end(); ++it) {
        GroupSpec spec;
        spec.name = ScalarText(it.key());
        auto r = ParseGroup(*it, spec);
        if (!r.has_value()) return r;
        groups_[spec.name] = std::move(spec);
      }
      if (root.contains("settings")) {
        auto r = ParseSettings(root["settings"]);
        if (!r.has_value()) return r;
      }
    } catch (const fkyaml::exception& e) {
      return Fail(ConfigError::kInvalidSchema, e.what());
    }

    CLIGR_LOG_DEBUG("Config", "loaded %zu group(s), %zu tool(s)", groups_.size(),
                    tools_.size());
    return expected<void, ConfigError>::success();
  }

  // --------------------------------------------------------------------------
  // Queries
  // --------------------------------------------------------------------------

  expected<GroupSpec, ConfigError> GetGroup(const std::string& name) const {
    auto it = groups_.find(name);
    if (it == groups_.end()) {
      std::string available;
      for (const auto& kv : groups_) {
        if (!available.empty()) available += ", ";
        available += kv.first;
      }
      detail_ = "Unknown group: " + name + ". Available: " + available;
      return expected<GroupSpec, ConfigError>::error(ConfigError::kUnknownGroup);
    }
    return expected<GroupSpec, ConfigError>::success(it->second);
  }

  std::vector<std::string> ListGroups() const {
    std::vector<std::string> names;
    names.reserve(groups_.size());
    for (const auto& kv : groups_) names.push_back(kv.first);
    return names;
  }

  const std::map<std::string, std::string>& Tools() const noexcept { return tools_; }
  const Settings& GetSettings() const noexcept { return settings_; }
  const std::string& Path() const noexcept { return path_; }

  /// @brief Human-readable reason for the last failure.
  const std::string& ErrorDetail() const noexcept { return detail_; }

 private:
  expected<void, ConfigError> Fail(ConfigError err, const std::string& detail) const {
    detail_ = detail;
    CLIGR_LOG_DEBUG("Config", "%s: %s", ToString(err), detail.c_str());
    return expected<void, ConfigError>::error(err);
  }

  /// Scalars as text; "" for null and non-scalars.
  static std::string ScalarText(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) {
      char buf[64];
      std::snprintf(buf, sizeof(buf), "%g", n.get_value<double>());
      return buf;
    }
    return std::string();
  }

  static bool IsScalar(const fkyaml::node& n) {
    return n.is_string() || n.is_boolean() || n.is_integer() || n.is_float_number();
  }

  expected<void, ConfigError> ParseTools(fkyaml::node& tools) {
    if (tools.is_null()) return expected<void, ConfigError>::success();
    if (!tools.is_mapping()) {
      return Fail(ConfigError::kInvalidSchema, "\"tools\" must be a mapping");
    }
    for (auto it = tools.begin(); it != tools.end(); ++it) {
      const std::string name = ScalarText(it.key());
      fkyaml::node& def = *it;
      if (def.is_string()) {
        tools_[name] = def.get_value<std::string>();
      } else if (def.is_mapping() && def.contains("cmd") && IsScalar(def["cmd"])) {
        tools_[name] = ScalarText(def["cmd"]);
      } else {
        return Fail(ConfigError::kInvalidSchema,
                    "Tool '" + name + "' must have a \"cmd\" string");
      }
    }
    return expected<void, ConfigError>::success();
  }

  expected<void, ConfigError> ParseGroup(fkyaml::node& node, GroupSpec& spec) {
    if (!node.is_mapping()) {
      return Fail(ConfigError::kInvalidSchema,
                  "Group '" + spec.name + "' must be a mapping");
    }

    if (node.contains("tool") && !node["tool"].is_null()) {
      spec.tool = ScalarText(node["tool"]);
      auto tool = tools_.find(spec.tool);
      if (tool != tools_.end()) spec.tool_template = tool->second;
    }

    if (node.contains("restart") && !node["restart"].is_null()) {
      fkyaml::node& restart = node["restart"];
      if (restart.is_boolean()) {
        spec.restart_policy =
            restart.get_value<bool>() ? RestartPolicy::kAlways : RestartPolicy::kNever;
      } else if (!restart.is_string() ||
                 !ParseRestartPolicy(restart.get_value<std::string>(),
                                     spec.restart_policy)) {
        return Fail(ConfigError::kInvalidRestartPolicy,
                    "Group '" + spec.name + "': restart must be yes, no or "
                    "unless-stopped (got '" + ScalarText(restart) + "')");
      }
    }

    if (node.contains("params") && !node["params"].is_null()) {
      fkyaml::node& params = node["params"];
      if (!params.is_mapping()) {
        return Fail(ConfigError::kInvalidSchema,
                    "Group '" + spec.name + "': params must be a mapping");
      }
      for (auto it = params.begin(); it != params.end(); ++it) {
        spec.params[ScalarText(it.key())] = ScalarText(*it);
      }
    }

    if (!node.contains("items") || node["items"].is_null()) {
      return expected<void, ConfigError>::success();
    }
    fkyaml::node& items = node["items"];
    if (!items.is_sequence()) {
      return Fail(ConfigError::kInvalidSchema,
                  "Group '" + spec.name + "': items must be a list");
    }

    std::set<std::string> seen;
    for (auto it = items.begin(); it != items.end(); ++it) {
      Item item;
      fkyaml::node& entry = *it;
      if (IsScalar(entry)) {
        item.value = ScalarText(entry);
        item.name = TemplateExpander::SplitArgs(item.value).front();
      } else if (entry.is_mapping() && entry.size() == 1) {
        auto kv = entry.begin();
        item.name = ScalarText(kv.key());
        if (!IsScalar(*kv)) {
          return Fail(ConfigError::kInvalidItem,
                      "Group '" + spec.name + "': item '" + item.name +
                          "' must map to a string");
        }
        item.value = ScalarText(*kv);
      } else {
        return Fail(ConfigError::kInvalidItem,
                    "Group '" + spec.name +
                        "': each item must be a string or a single name: value pair");
      }
      if (item.name.empty()) {
        return Fail(ConfigError::kInvalidItem,
                    "Group '" + spec.name + "': item has an empty name");
      }
      if (!seen.insert(item.name).second) {
        return Fail(ConfigError::kDuplicateItem,
                    "Group '" + spec.name + "': duplicate item '" + item.name + "'");
      }
      spec.items.push_back(std::move(item));
    }
    return expected<void, ConfigError>::success();
  }

  expected<void, ConfigError> ParseSettings(fkyaml::node& node) {
    if (node.is_null()) return expected<void, ConfigError>::success();
    if (!node.is_mapping()) {
      return Fail(ConfigError::kInvalidSchema, "\"settings\" must be a mapping");
    }
    SupervisorOptions& opt = settings_.supervisor;
    struct Field {
      const char* key;
      uint32_t* target;
    };
    const Field fields[] = {
        {"restart_delay_ms", &opt.restart_delay_ms},
        {"kill_grace_ms", &opt.kill_grace_ms},
        {"crash_window_ms", &opt.crash_window_ms},
        {"max_restarts", &opt.max_restarts},
    };
    for (const Field& f : fields) {
      if (!node.contains(f.key)) continue;
      fkyaml::node& v = node[f.key];
      if (!v.is_integer() || v.get_value<int64_t>() < 0 ||
          v.get_value<int64_t>() > static_cast<int64_t>(UINT32_MAX)) {
        return Fail(ConfigError::kInvalidSchema,
                    std::string("settings.") + f.key +
                        " must be a non-negative integer");
      }
      *f.target = static_cast<uint32_t>(v.get_value<int64_t>());
    }
    if (node.contains("pid_dir")) {
      if (!node["pid_dir"].is_string()) {
        return Fail(ConfigError::kInvalidSchema, "settings.pid_dir must be a string");
      }
      settings_.pid_dir = node["pid_dir"].get_value<std::string>();
    }
    return expected<void, ConfigError>::success();
  }

  std::string path_;
  std::map<std::string, std::string> tools_;
  std::map<std::string, GroupSpec> groups_;
  Settings settings_;
  mutable std::string detail_;
};

}  // namespace cligr

#endif  // CLIGR_CONFIG_HPP_
