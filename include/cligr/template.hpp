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
 * @file template.hpp
 * @brief Command template expansion: item + template -> command line.
 *
 * A template such as "docker run -p $2:$3 $1 --env $env" is expanded in two
 * phases:
 *   1. Positional: $1..$N take the comma-split, trimmed values of the item.
 *      A placeholder is the longest digit run after '$', so $10 is never read
 *      as $1 followed by '0'. Indices outside 1..N, and runs with a leading
 *      zero such as $01, stay verbatim.
 *   2. Named: $key takes params[key]. Only template text is scanned; text
 *      inserted in phase 1 is never re-expanded. Unknown keys stay verbatim.
 *
 * Pure functions, no I/O; safe to call from any thread.
 */

#ifndef CLIGR_TEMPLATE_HPP_
#define CLIGR_TEMPLATE_HPP_

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace cligr {

// ============================================================================
// Data model
// ============================================================================

/// @brief One named unit of work within a group.
struct Item {
  std::string name;   ///< Unique within its group; becomes the process name
  std::string value;  ///< Comma-separated positional values
};

/// @brief Named template parameters, scoped per group.
using NamedParams = std::map<std::string, std::string>;

/// @brief Result of expanding one item.
struct ExpandedCommand {
  std::string name;               ///< Always Item::name
  std::vector<std::string> args;  ///< Split, trimmed positional values
  std::string full_cmd;           ///< Ready-to-tokenize command line
};

/// @brief How a group turns items into commands.
struct CommandTemplate {
  std::string tool;           ///< Tool name or direct executable ("" = none)
  std::string tool_template;  ///< Registered template ("" = not registered)
  NamedParams params;
};

namespace detail {

inline bool IsDigit(char c) noexcept { return c >= '0' && c <= '9'; }

inline bool IsSpace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' ||
         c == '\v';
}

inline std::string Trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && IsSpace(s[b])) ++b;
  while (e > b && IsSpace(s[e - 1])) --e;
  return s.substr(b, e - b);
}

/// @brief Parse the digit run at @p pos (after '$'); returns run length.
/// A run with a leading zero ($0, $01) yields index 0, which is never valid.
inline size_t ParseIndex(const std::string& s, size_t pos, uint64_t& index) {
  size_t end = pos;
  index = 0;
  while (end < s.size() && IsDigit(s[end])) {
    if (index < 1000000000ULL) {
      index = index * 10U + static_cast<uint64_t>(s[end] - '0');
    }
    ++end;
  }
  if (end > pos && s[pos] == '0') index = 0;
  return end - pos;
}

/// @brief Template text tagged with whether it came from the template.
struct Segment {
  std::string text;
  bool literal;
};

inline bool IsAllDigits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!IsDigit(c)) return false;
  }
  return true;
}

}  // namespace detail

// ============================================================================
// TemplateExpander
// ============================================================================

class TemplateExpander final {
 public:
  /**
   * @brief Split an item value on ',' and trim each segment.
   *
   * Empty segments are kept so positional slots can be skipped: ",b" yields
   * {"", "b"}. An empty value yields one empty argument.
   */
  static std::vector<std::string> SplitArgs(const std::string& value) {
    std::vector<std::string> out;
    size_t start = 0;
    for (;;) {
      size_t comma = value.find(',', start);
      if (comma == std::string::npos) {
        out.push_back(detail::Trim(value.substr(start)));
        break;
      }
      out.push_back(detail::Trim(value.substr(start, comma - start)));
      start = comma + 1;
    }
    return out;
  }

  /// @brief Highest $N index referenced by @p tmpl (0 if none).
  static uint64_t MaxPlaceholderIndex(const std::string& tmpl) {
    uint64_t max_index = 0;
    for (size_t i = 0; i < tmpl.size(); ++i) {
      if (tmpl[i] != '$') continue;
      uint64_t index = 0;
      size_t len = detail::ParseIndex(tmpl, i + 1, index);
      if (len > 0 && index > max_index) max_index = index;
      i += len;
    }
    return max_index;
  }

  /**
   * @brief Expand @p tmpl with the positional values of @p item, then with
   *        @p params.
   */
  static ExpandedCommand Expand(const std::string& tmpl, const Item& item,
                                const NamedParams& params = NamedParams()) {
    ExpandedCommand out;
    out.name = item.name;
    out.args = SplitArgs(item.value);

    std::vector<detail::Segment> segments = SubstitutePositional(tmpl, out.args);
    out.full_cmd = SubstituteNamed(segments, params);
    return out;
  }

  /**
   * @brief Build the command for @p item under a group's tool settings.
   *
   * With a registered template the item is expanded; if it carries more
   * values than the highest $N in the template, the surplus is appended
   * space-joined. A template without positional placeholders is a complete
   * literal command and never gets a surplus.
   * Without a template the raw item value is the command, prefixed by the
   * tool token when one is set.
   */
  static ExpandedCommand ParseItem(const std::string& tool,
                                   const std::string& tool_template,
                                   const Item& item,
                                   const NamedParams& params = NamedParams()) {
    if (!tool_template.empty()) {
      ExpandedCommand result = Expand(tool_template, item, params);
      const uint64_t max_index = MaxPlaceholderIndex(tool_template);
      if (max_index > 0 && result.args.size() > max_index) {
        std::string surplus;
        for (size_t i = static_cast<size_t>(max_index); i < result.args.size();
             ++i) {
          if (i > max_index) surplus += ' ';
          surplus += result.args[i];
        }
        result.full_cmd += ' ';
        result.full_cmd += surplus;
      }
      return result;
    }

    ExpandedCommand result;
    result.name = item.name;
    result.args = SplitArgs(item.value);
    result.full_cmd = tool.empty() ? item.value : tool + " " + item.value;
    return result;
  }

  static ExpandedCommand ParseItem(const CommandTemplate& ct, const Item& item) {
    return ParseItem(ct.tool, ct.tool_template, item, ct.params);
  }

 private:
  static std::vector<detail::Segment> SubstitutePositional(
      const std::string& tmpl, const std::vector<std::string>& args) {
    std::vector<detail::Segment> segments;
    std::string literal;
    for (size_t i = 0; i < tmpl.size(); ++i) {
      if (tmpl[i] == '$') {
        uint64_t index = 0;
        size_t len = detail::ParseIndex(tmpl, i + 1, index);
        if (len > 0 && index >= 1 && index <= args.size()) {
          if (!literal.empty()) {
            segments.push_back({literal, true});
            literal.clear();
          }
          segments.push_back({args[static_cast<size_t>(index - 1)], false});
          i += len;
          continue;
        }
        if (len > 0) {
          // Out-of-range placeholder: keep "$<digits>" verbatim.
          literal.append(tmpl, i, len + 1);
          i += len;
          continue;
        }
      }
      literal += tmpl[i];
    }
    if (!literal.empty()) segments.push_back({literal, true});
    return segments;
  }

  static std::string SubstituteNamed(const std::vector<detail::Segment>& segments,
                                     const NamedParams& params) {
    std::string out;
    for (const detail::Segment& seg : segments) {
      if (!seg.literal || params.empty()) {
        out += seg.text;
        continue;
      }
      const std::string& s = seg.text;
      for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '$') {
          // Longest key wins so "$names" is not read as "$name" + "s".
          const NamedParams::value_type* best = nullptr;
          for (const auto& kv : params) {
            if (kv.first.empty() || detail::IsAllDigits(kv.first)) continue;
            if (s.compare(i + 1, kv.first.size(), kv.first) == 0 &&
                (best == nullptr || kv.first.size() > best->first.size())) {
              best = &kv;
            }
          }
          if (best != nullptr) {
            out += best->second;
            i += best->first.size();
            continue;
          }
        }
        out += s[i];
      }
    }
    return out;
  }
};

}  // namespace cligr

#endif  // CLIGR_TEMPLATE_HPP_
