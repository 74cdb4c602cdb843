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
 * @file frame.hpp
 * @brief Length-prefixed wire frames: [4-byte big-endian length][payload].
 *
 * One frame is carried per TCP connection. The length prefix is checked
 * against LANXFER_MAX_FRAME_SIZE before any payload buffer is allocated.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef LANXFER_FRAME_HPP_
#define LANXFER_FRAME_HPP_

#include "lanxfer/message.hpp"

#include <vector>

#ifndef LANXFER_MAX_FRAME_SIZE
#define LANXFER_MAX_FRAME_SIZE (1024U * 1024U)
#endif

namespace lanxfer {

class FrameCodec {
 public:
  static constexpr uint32_t kLengthSize = 4;
  static constexpr uint32_t kMaxFrameSize = LANXFER_MAX_FRAME_SIZE;

  static void EncodeLength(uint32_t len, uint8_t out[kLengthSize]) noexcept {
    out[0] = static_cast<uint8_t>(len >> 24);
    out[1] = static_cast<uint8_t>(len >> 16);
    out[2] = static_cast<uint8_t>(len >> 8);
    out[3] = static_cast<uint8_t>(len);
  }

  static uint32_t DecodeLength(const uint8_t in[kLengthSize]) noexcept {
    return (static_cast<uint32_t>(in[0]) << 24) |
           (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8) | static_cast<uint32_t>(in[3]);
  }

  /**
   * @brief Validate a decoded length prefix.
   * @return kFrameTooLarge when len exceeds kMaxFrameSize.
   */
  static expected<uint32_t, CodecError> CheckLength(uint32_t len) noexcept {
    if (len > kMaxFrameSize) {
      return expected<uint32_t, CodecError>::error(CodecError::kFrameTooLarge);
    }
    return expected<uint32_t, CodecError>::success(len);
  }

  /**
   * @brief Encode msg and prepend its length.
   * @return Complete frame bytes, kEncodeError, or kFrameTooLarge when the
   *         payload would be rejected by the receiving side.
   */
  static expected<std::vector<uint8_t>, CodecError> BuildFrame(
      const Message& msg) {
    using Result = expected<std::vector<uint8_t>, CodecError>;
    auto payload = MessageCodec::Encode(msg);
    if (!payload.has_value()) return Result::error(payload.get_error());

    const std::vector<uint8_t>& body = payload.value();
    if (body.size() > kMaxFrameSize) {
      return Result::error(CodecError::kFrameTooLarge);
    }

    std::vector<uint8_t> frame(kLengthSize + body.size());
    EncodeLength(static_cast<uint32_t>(body.size()), frame.data());
    if (!body.empty()) {
      std::memcpy(frame.data() + kLengthSize, body.data(), body.size());
    }
    return Result::success(std::move(frame));
  }

  /**
   * @brief Parse a complete in-memory frame (prefix + payload).
   * @return kTruncated when fewer bytes than the prefix declares are present,
   *         kTrailingBytes when more are.
   */
  static expected<Message, CodecError> ParseFrame(const uint8_t* data,
                                                  size_t len) {
    using Result = expected<Message, CodecError>;
    if (len < kLengthSize) return Result::error(CodecError::kTruncated);
    auto body_len = CheckLength(DecodeLength(data));
    if (!body_len.has_value()) return Result::error(body_len.get_error());
    size_t available = len - kLengthSize;
    if (available < body_len.value()) {
      return Result::error(CodecError::kTruncated);
    }
    if (available > body_len.value()) {
      return Result::error(CodecError::kTrailingBytes);
    }
    return MessageCodec::Decode(data + kLengthSize, body_len.value());
  }
};

}  // namespace lanxfer

#endif  // LANXFER_FRAME_HPP_
