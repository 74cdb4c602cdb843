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
 * @file platform.hpp
 * @brief Platform detection, LANXFER_ASSERT and the monotonic clock used
 *        for peer expiry.
 */

#ifndef LANXFER_PLATFORM_HPP_
#define LANXFER_PLATFORM_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace lanxfer {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define LANXFER_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define LANXFER_PLATFORM_MACOS 1
#endif

/// BSD sockets are available (Linux and macOS).
#ifndef LANXFER_HAS_NETWORK
#if defined(LANXFER_PLATFORM_LINUX) || defined(LANXFER_PLATFORM_MACOS)
#define LANXFER_HAS_NETWORK 1
#else
#define LANXFER_HAS_NETWORK 0
#endif
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "LANXFER_ASSERT failed: %s at %s:%d\n", cond,
                     file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define LANXFER_ASSERT(cond) ((void)0)
#else
#define LANXFER_ASSERT(cond) \
  ((cond) ? ((void)0) : ::lanxfer::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Macro Helpers
// ============================================================================

#define LANXFER_CONCAT_IMPL(a, b) a##b
#define LANXFER_CONCAT(a, b) LANXFER_CONCAT_IMPL(a, b)

// ============================================================================
// Clocks
// ============================================================================

/** @brief Monotonic time in microseconds (steady_clock). */
inline uint64_t SteadyNowUs() noexcept {
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now().time_since_epoch());
  return static_cast<uint64_t>(us.count());
}

}  // namespace lanxfer

#endif  // LANXFER_PLATFORM_HPP_
