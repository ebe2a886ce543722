/**
 * @file test_helpers.hpp
 * @brief Shared fixtures for the cligr tests: temp directories and polling.
 */

#ifndef CLIGR_TESTS_TEST_HELPERS_HPP_
#define CLIGR_TESTS_TEST_HELPERS_HPP_

#include "cligr/process.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>

#include <dirent.h>
#include <unistd.h>

namespace cligr_test {

/// mkdtemp() directory removed (one level deep) on destruction.
class TempDir {
 public:
  TempDir() {
    char tmpl[] = "/tmp/cligr_test_XXXXXX";
    const char* dir = ::mkdtemp(tmpl);
    path_ = (dir != nullptr) ? dir : "";
  }

  ~TempDir() {
    if (path_.empty()) return;
    RemoveTree(path_);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::string& Path() const { return path_; }

  std::string File(const std::string& name) const { return path_ + "/" + name; }

  bool WriteFile(const std::string& name, const std::string& body) const {
    FILE* fp = std::fopen(File(name).c_str(), "w");
    if (fp == nullptr) return false;
    bool ok = std::fwrite(body.data(), 1, body.size(), fp) == body.size();
    return (std::fclose(fp) == 0) && ok;
  }

 private:
  static void RemoveTree(const std::string& dir) {
    DIR* d = ::opendir(dir.c_str());
    if (d != nullptr) {
      while (struct dirent* ent = ::readdir(d)) {
        std::string name = ent->d_name;
        if (name == "." || name == "..") continue;
        std::string child = dir + "/" + name;
        if (ent->d_type == DT_DIR) {
          RemoveTree(child);
        } else {
          (void)::unlink(child.c_str());
        }
      }
      ::closedir(d);
    }
    (void)::rmdir(dir.c_str());
  }

  std::string path_;
};

/// Poll @p pred every 10 ms until it holds or @p timeout_ms elapses.
template <typename Pred>
bool WaitUntil(Pred pred, uint32_t timeout_ms) {
  for (uint32_t waited = 0; waited < timeout_ms; waited += 10) {
    if (pred()) return true;
    cligr::detail::SleepMs(10);
  }
  return pred();
}

/// Read the whole content of a FILE* written by the code under test.
inline std::string ReadAll(FILE* fp) {
  std::fflush(fp);
  std::rewind(fp);
  std::string out;
  char buf[512];
  size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), fp)) > 0) out.append(buf, n);
  return out;
}

}  // namespace cligr_test

#endif  // CLIGR_TESTS_TEST_HELPERS_HPP_
