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
 * @brief Error-handling vocabulary types: expected<V,E>, optional<T>,
 *        ScopeGuard.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 * Errors are plain enum class codes carried by value; nothing throws.
 */

#ifndef LANXFER_VOCABULARY_HPP_
#define LANXFER_VOCABULARY_HPP_

#include "lanxfer/platform.hpp"

#include <new>
#include <type_traits>
#include <utility>

namespace lanxfer {

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error code of type E.
 *
 * Constructed only through the success() / error() factories so the
 * intent is always visible at the return site.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) {
    expected r;
    ::new (static_cast<void*>(&r.value_)) V(v);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& v) {
    expected r;
    ::new (static_cast<void*>(&r.value_)) V(std::move(v));
    r.has_value_ = true;
    return r;
  }

  static expected error(E e) noexcept {
    expected r;
    r.error_ = e;
    r.has_value_ = false;
    return r;
  }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(other.value_);
    } else {
      error_ = other.error_;
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (static_cast<void*>(&value_)) V(std::move(other.value_));
    } else {
      error_ = other.error_;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Reset();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(other.value_);
      } else {
        error_ = other.error_;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Reset();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (static_cast<void*>(&value_)) V(std::move(other.value_));
      } else {
        error_ = other.error_;
      }
    }
    return *this;
  }

  ~expected() { Reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    LANXFER_ASSERT(has_value_);
    return value_;
  }

  const V& value() const& noexcept {
    LANXFER_ASSERT(has_value_);
    return value_;
  }

  V&& value() && noexcept {
    LANXFER_ASSERT(has_value_);
    return std::move(value_);
  }

  E get_error() const noexcept {
    LANXFER_ASSERT(!has_value_);
    return error_;
  }

  template <typename U>
  V value_or(U&& default_val) const& {
    return has_value_ ? value_ : static_cast<V>(std::forward<U>(default_val));
  }

 private:
  expected() noexcept : error_(), has_value_(false) {}

  void Reset() noexcept {
    if (has_value_) {
      value_.~V();
      has_value_ = false;
    }
  }

  union {
    V value_;
    E error_;
  };
  bool has_value_;
};

/** @brief expected<void, E>: success carries no value. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept {
    expected r;
    r.has_value_ = true;
    return r;
  }

  static expected error(E e) noexcept {
    expected r;
    r.error_ = e;
    r.has_value_ = false;
    return r;
  }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    LANXFER_ASSERT(!has_value_);
    return error_;
  }

 private:
  expected() noexcept : error_(), has_value_(false) {}

  E error_;
  bool has_value_;
};

/**
 * @brief Chain a fallible step: fn(value) runs only on success and must
 *        return an expected<U, E>; an error passes through unchanged.
 */
template <typename V, typename E, typename F>
auto and_then(const expected<V, E>& r, F&& fn) -> decltype(fn(r.value())) {
  using Result = decltype(fn(r.value()));
  if (r.has_value()) return fn(r.value());
  return Result::error(r.get_error());
}

/** @brief Observe an error: fn(error) runs only on failure; r is returned. */
template <typename V, typename E, typename F>
expected<V, E> or_else(const expected<V, E>& r, F&& fn) {
  if (!r.has_value()) fn(r.get_error());
  return r;
}

// ============================================================================
// optional<T>
// ============================================================================

/**
 * @brief Minimal optional value holder.
 */
template <typename T>
class optional final {
 public:
  optional() noexcept : empty_(), has_value_(false) {}

  optional(const T& v) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (static_cast<void*>(&value_)) T(v);
  }

  optional(T&& v) : has_value_(true) {  // NOLINT(google-explicit-constructor)
    ::new (static_cast<void*>(&value_)) T(std::move(v));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) ::new (static_cast<void*>(&value_)) T(other.value_);
  }

  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) ::new (static_cast<void*>(&value_)) T(std::move(other.value_));
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&value_)) T(other.value_);
        has_value_ = true;
      }
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (static_cast<void*>(&value_)) T(std::move(other.value_));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() & noexcept {
    LANXFER_ASSERT(has_value_);
    return value_;
  }

  const T& value() const& noexcept {
    LANXFER_ASSERT(has_value_);
    return value_;
  }

  T&& value() && noexcept {
    LANXFER_ASSERT(has_value_);
    return std::move(value_);
  }

  template <typename U>
  T value_or(U&& default_val) const& {
    return has_value_ ? value_ : static_cast<T>(std::forward<U>(default_val));
  }

  void reset() noexcept {
    if (has_value_) {
      value_.~T();
      has_value_ = false;
    }
  }

 private:
  union {
    char empty_;
    T value_;
  };
  bool has_value_;
};

// ============================================================================
// ScopeGuard
// ============================================================================

/**
 * @brief Runs a callable when the enclosing scope exits unless released.
 */
template <typename F>
class ScopeGuard final {
 public:
  explicit ScopeGuard(F fn) noexcept : fn_(std::move(fn)), active_(true) {}

  ScopeGuard(ScopeGuard&& other) noexcept
      : fn_(std::move(other.fn_)), active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() {
    if (active_) fn_();
  }

  void release() noexcept { active_ = false; }

 private:
  F fn_;
  bool active_;
};

template <typename F>
ScopeGuard<F> MakeScopeGuard(F fn) noexcept {
  return ScopeGuard<F>(std::move(fn));
}

#define LANXFER_SCOPE_EXIT(...)                                      \
  auto LANXFER_CONCAT(lanxfer_scope_exit_, __LINE__) =               \
      ::lanxfer::MakeScopeGuard([&]() { __VA_ARGS__; })

}  // namespace lanxfer

#endif  // LANXFER_VOCABULARY_HPP_
