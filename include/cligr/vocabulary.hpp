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
 * @file vocabulary.hpp
 * @brief Error enums, expected<V, E> result type and ScopeGuard.
 *
 * Every fallible cligr operation returns expected<V, E> with a per-module
 * error enum instead of throwing. ToString() gives each enumerator a stable
 * human-readable spelling for logs and CLI messages.
 */

#ifndef CLIGR_VOCABULARY_HPP_
#define CLIGR_VOCABULARY_HPP_

#include "cligr/platform.hpp"

#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace cligr {

// ============================================================================
// Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kInvalidSchema,
  kUnknownGroup,
  kInvalidItem,
  kInvalidRestartPolicy,
  kDuplicateItem,
};

enum class SupervisorError : uint8_t {
  kGroupAlreadyRunning = 0,
  kGroupNotFound,
  kNotRunning,
  kPollerFailed,
};

enum class SpawnError : uint8_t {
  kEmptyCommand = 0,
  kPipeFailed,
  kForkFailed,
};

enum class RegistryError : uint8_t {
  kDirCreateFailed = 0,
  kWriteFailed,
  kDeleteFailed,
  kNotFound,
};

enum class PollerError : uint8_t {
  kCreateFailed = 0,
  kAddFailed,
  kModifyFailed,
  kRemoveFailed,
  kWaitFailed,
};

enum class ShutdownError : uint8_t {
  kCallbacksFull = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated,
};

inline const char* ToString(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound: return "config file not found";
    case ConfigError::kParseError: return "invalid YAML";
    case ConfigError::kInvalidSchema: return "invalid config schema";
    case ConfigError::kUnknownGroup: return "unknown group";
    case ConfigError::kInvalidItem: return "malformed item";
    case ConfigError::kInvalidRestartPolicy: return "invalid restart policy";
    case ConfigError::kDuplicateItem: return "duplicate item name";
  }
  return "unknown config error";
}

inline const char* ToString(SupervisorError e) noexcept {
  switch (e) {
    case SupervisorError::kGroupAlreadyRunning: return "group already running";
    case SupervisorError::kGroupNotFound: return "group not found";
    case SupervisorError::kNotRunning: return "supervisor not running";
    case SupervisorError::kPollerFailed: return "event poller failure";
  }
  return "unknown supervisor error";
}

inline const char* ToString(SpawnError e) noexcept {
  switch (e) {
    case SpawnError::kEmptyCommand: return "empty command line";
    case SpawnError::kPipeFailed: return "pipe creation failed";
    case SpawnError::kForkFailed: return "fork failed";
  }
  return "unknown spawn error";
}

inline const char* ToString(RegistryError e) noexcept {
  switch (e) {
    case RegistryError::kDirCreateFailed: return "cannot create registry dir";
    case RegistryError::kWriteFailed: return "cannot write registry record";
    case RegistryError::kDeleteFailed: return "cannot delete registry record";
    case RegistryError::kNotFound: return "registry record not found";
  }
  return "unknown registry error";
}

inline const char* ToString(PollerError e) noexcept {
  switch (e) {
    case PollerError::kCreateFailed: return "epoll_create failed";
    case PollerError::kAddFailed: return "epoll add failed";
    case PollerError::kModifyFailed: return "epoll modify failed";
    case PollerError::kRemoveFailed: return "epoll remove failed";
    case PollerError::kWaitFailed: return "epoll wait failed";
  }
  return "unknown poller error";
}

inline const char* ToString(ShutdownError e) noexcept {
  switch (e) {
    case ShutdownError::kCallbacksFull: return "shutdown callbacks full";
    case ShutdownError::kPipeCreationFailed: return "wakeup pipe failed";
    case ShutdownError::kSignalInstallFailed: return "sigaction failed";
    case ShutdownError::kAlreadyInstantiated: return "duplicate shutdown manager";
  }
  return "unknown shutdown error";
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Minimal value-or-error result.
 *
 * Constructed only through the named factories success() / error() so a call
 * site always states which branch it produces.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) {
    expected r;
    ::new (&r.storage_.value) V(val);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& val) {
    expected r;
    ::new (&r.storage_.value) V(std::move(val));
    r.has_value_ = true;
    return r;
  }

  static expected error(E err) noexcept {
    expected r;
    r.storage_.err = err;
    r.has_value_ = false;
    return r;
  }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(other.storage_.value);
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(std::move(other.storage_.value));
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) V(other.storage_.value);
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) V(std::move(other.storage_.value));
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    CLIGR_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& {
    CLIGR_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && {
    CLIGR_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  E get_error() const noexcept {
    CLIGR_ASSERT(!has_value_);
    return storage_.err;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

 private:
  expected() noexcept : has_value_(false) {}

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
      has_value_ = false;
    }
  }

  union Storage {
    Storage() noexcept : err() {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
};

/** Specialization for operations that only report success or failure. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E err) noexcept { return expected(false, err); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    CLIGR_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E err) noexcept : err_(err), has_value_(ok) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// ScopeGuard
// ============================================================================

/**
 * @brief Runs a callable on scope exit unless released.
 *
 * @code
 *   int fd = open(path, O_RDONLY);
 *   auto guard = cligr::MakeScopeGuard([fd]() { close(fd); });
 * @endcode
 */
template <typename F>
class ScopeGuard final {
 public:
  explicit ScopeGuard(F fn) noexcept(std::is_nothrow_move_constructible<F>::value)
      : fn_(std::move(fn)), active_(true) {}

  ScopeGuard(ScopeGuard&& other) noexcept(
      std::is_nothrow_move_constructible<F>::value)
      : fn_(std::move(other.fn_)), active_(other.active_) {
    other.active_ = false;
  }

  ~ScopeGuard() {
    if (active_) {
      fn_();
    }
  }

  void release() noexcept { active_ = false; }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

 private:
  F fn_;
  bool active_;
};

template <typename F>
ScopeGuard<F> MakeScopeGuard(F fn) {
  return ScopeGuard<F>(std::move(fn));
}

}  // namespace cligr

#endif  // CLIGR_VOCABULARY_HPP_
