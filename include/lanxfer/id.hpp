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
 * @file id.hpp
 * @brief 128-bit random identifiers (RFC 4122 version 4) for peers and
 *        transfers.
 *
 * PeerId and TransferId share one representation but are distinct types,
 * so a transfer id cannot be passed where a peer id is expected.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef LANXFER_ID_HPP_
#define LANXFER_ID_HPP_

#include "lanxfer/platform.hpp"
#include "lanxfer/vocabulary.hpp"

#include <array>
#include <cstring>
#include <random>
#include <string>

namespace lanxfer {

constexpr size_t kIdSize = 16;
constexpr size_t kIdTextSize = 36;  ///< 8-4-4-4-12 hex digits and dashes.

namespace detail {

inline std::mt19937_64& IdEngine() {
  thread_local std::mt19937_64 engine{[]() {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
  }()};
  return engine;
}

inline int HexValue(char c) noexcept {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

inline bool IsDashPosition(size_t i) noexcept {
  return i == 8 || i == 13 || i == 18 || i == 23;
}

}  // namespace detail

// ============================================================================
// BasicId
// ============================================================================

/**
 * @brief Opaque 128-bit identifier tagged by its use.
 * @tparam Tag Empty struct that makes each id family a distinct type.
 */
template <typename Tag>
class BasicId final {
 public:
  using Bytes = std::array<uint8_t, kIdSize>;

  /** @brief The all-zero (nil) id. */
  BasicId() noexcept : bytes_{} {}

  explicit BasicId(const Bytes& bytes) noexcept : bytes_(bytes) {}

  /** @brief Fresh random version-4 id. */
  static BasicId Generate() {
    auto& engine = detail::IdEngine();
    uint64_t hi = engine();
    uint64_t lo = engine();
    Bytes b;
    for (size_t i = 0; i < 8; ++i) {
      b[i] = static_cast<uint8_t>(hi >> (56 - 8 * i));
      b[8 + i] = static_cast<uint8_t>(lo >> (56 - 8 * i));
    }
    b[6] = static_cast<uint8_t>((b[6] & 0x0FU) | 0x40U);  // version 4
    b[8] = static_cast<uint8_t>((b[8] & 0x3FU) | 0x80U);  // RFC 4122 variant
    return BasicId(b);
  }

  /**
   * @brief Parse canonical text form (case-insensitive hex).
   * @return Empty optional when the text is not a well-formed id.
   */
  static optional<BasicId> Parse(const char* text, size_t len) noexcept {
    if (text == nullptr || len != kIdTextSize) return optional<BasicId>();
    Bytes b{};
    size_t out = 0;
    for (size_t i = 0; i < kIdTextSize;) {
      if (detail::IsDashPosition(i)) {
        if (text[i] != '-') return optional<BasicId>();
        ++i;
        continue;
      }
      int hi = detail::HexValue(text[i]);
      int lo = detail::HexValue(text[i + 1]);
      if (hi < 0 || lo < 0) return optional<BasicId>();
      b[out++] = static_cast<uint8_t>((hi << 4) | lo);
      i += 2;
    }
    return optional<BasicId>(BasicId(b));
  }

  static optional<BasicId> Parse(const std::string& text) noexcept {
    return Parse(text.c_str(), text.size());
  }

  /** @brief Lower-case canonical text form. */
  std::string ToString() const {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string s;
    s.reserve(kIdTextSize);
    for (size_t i = 0; i < kIdSize; ++i) {
      if (i == 4 || i == 6 || i == 8 || i == 10) s.push_back('-');
      s.push_back(kHex[bytes_[i] >> 4]);
      s.push_back(kHex[bytes_[i] & 0x0FU]);
    }
    return s;
  }

  const Bytes& bytes() const noexcept { return bytes_; }

  bool IsNil() const noexcept {
    for (uint8_t v : bytes_) {
      if (v != 0) return false;
    }
    return true;
  }

  bool operator==(const BasicId& o) const noexcept { return bytes_ == o.bytes_; }
  bool operator!=(const BasicId& o) const noexcept { return bytes_ != o.bytes_; }
  bool operator<(const BasicId& o) const noexcept { return bytes_ < o.bytes_; }

 private:
  Bytes bytes_;
};

struct PeerIdTag {};
struct TransferIdTag {};

using PeerId = BasicId<PeerIdTag>;
using TransferId = BasicId<TransferIdTag>;

}  // namespace lanxfer

#endif  // LANXFER_ID_HPP_
