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
 * @file cmdline.hpp
 * @brief Split a command line into argv, honouring single and double quotes.
 *
 *   sh -c "echo 'a b'"   ->  {"sh", "-c", "echo 'a b'"}
 *   --name="John Doe"    ->  {"--name=John Doe"}
 *   ''                   ->  {""}
 *
 * Deliberately narrower than a shell: no escapes, no variable expansion,
 * no globbing, no pipes or redirections. An unterminated quote runs to the
 * end of the line.
 */

#ifndef CLIGR_CMDLINE_HPP_
#define CLIGR_CMDLINE_HPP_

#include <string>
#include <vector>

namespace cligr {

inline std::vector<std::string> TokenizeCommand(const std::string& line) {
  enum class State { kBetween, kWord, kQuoted };

  std::vector<std::string> argv;
  std::string current;
  State state = State::kBetween;
  char quote = '\0';

  for (char c : line) {
    switch (state) {
      case State::kBetween:
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
          break;
        }
        if (c == '"' || c == '\'') {
          quote = c;
          state = State::kQuoted;
        } else {
          current += c;
          state = State::kWord;
        }
        break;

      case State::kWord:
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
          argv.push_back(current);
          current.clear();
          state = State::kBetween;
        } else if (c == '"' || c == '\'') {
          quote = c;
          state = State::kQuoted;
        } else {
          current += c;
        }
        break;

      case State::kQuoted:
        if (c == quote) {
          // Stay inside the same token: a"b c"d is one argument.
          state = State::kWord;
        } else {
          current += c;
        }
        break;
    }
  }

  // kWord after a closing quote may hold an empty string (""), which is
  // still a real argument.
  if (state != State::kBetween) {
    argv.push_back(current);
  }
  return argv;
}

}  // namespace cligr

#endif  // CLIGR_CMDLINE_HPP_
