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
 * @file message.hpp
 * @brief Peer-to-peer message variants and their binary payload codec.
 *
 * Payload layout (all integers big-endian):
 * +-------+---------------------------------------------------------------+
 * | tag   | fields                                                        |
 * | 1 byte| strings/bytes: len(4) + data, ids: 16 raw bytes, u64 sizes    |
 * +-------+---------------------------------------------------------------+
 *
 * Tags follow the variant index: Text=0, FileOffer=1, FileAccept=2,
 * FileReject=3, FileChunk=4, FileComplete=5.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef LANXFER_MESSAGE_HPP_
#define LANXFER_MESSAGE_HPP_

#include "lanxfer/id.hpp"
#include "lanxfer/platform.hpp"
#include "lanxfer/vocabulary.hpp"

#include <cstring>
#include <limits>
#include <string>
#include <variant>
#include <vector>

namespace lanxfer {

// ============================================================================
// Codec Error
// ============================================================================

enum class CodecError : uint8_t {
  kEncodeError = 0,  ///< Field too long for its u32 length prefix.
  kTruncated,        ///< Input ended inside a message.
  kUnknownTag,
  kTrailingBytes,    ///< Bytes left over after a complete message.
  kMalformed,
  kFrameTooLarge     ///< Length prefix above LANXFER_MAX_FRAME_SIZE.
};

inline const char* ToString(CodecError e) noexcept {
  switch (e) {
    case CodecError::kEncodeError:   return "encode error";
    case CodecError::kTruncated:     return "truncated payload";
    case CodecError::kUnknownTag:    return "unknown message tag";
    case CodecError::kTrailingBytes: return "trailing bytes after message";
    case CodecError::kMalformed:     return "malformed payload";
    case CodecError::kFrameTooLarge: return "frame too large";
  }
  return "unknown";
}

// ============================================================================
// Message variants
// ============================================================================

struct TextMessage {
  std::string content;

  bool operator==(const TextMessage& o) const { return content == o.content; }
  bool operator!=(const TextMessage& o) const { return !(*this == o); }
};

struct FileOffer {
  TransferId id;
  std::string name;  ///< Base name of the offered file.
  uint64_t size = 0;

  bool operator==(const FileOffer& o) const {
    return id == o.id && name == o.name && size == o.size;
  }
  bool operator!=(const FileOffer& o) const { return !(*this == o); }
};

struct FileAccept {
  TransferId id;

  bool operator==(const FileAccept& o) const { return id == o.id; }
  bool operator!=(const FileAccept& o) const { return !(*this == o); }
};

struct FileReject {
  TransferId id;

  bool operator==(const FileReject& o) const { return id == o.id; }
  bool operator!=(const FileReject& o) const { return !(*this == o); }
};

struct FileChunk {
  TransferId id;
  uint64_t offset = 0;
  std::vector<uint8_t> data;

  bool operator==(const FileChunk& o) const {
    return id == o.id && offset == o.offset && data == o.data;
  }
  bool operator!=(const FileChunk& o) const { return !(*this == o); }
};

struct FileComplete {
  TransferId id;

  bool operator==(const FileComplete& o) const { return id == o.id; }
  bool operator!=(const FileComplete& o) const { return !(*this == o); }
};

/// Variant index doubles as the wire tag; do not reorder.
using Message = std::variant<TextMessage, FileOffer, FileAccept, FileReject,
                             FileChunk, FileComplete>;

enum class MessageTag : uint8_t {
  kText = 0,
  kFileOffer = 1,
  kFileAccept = 2,
  kFileReject = 3,
  kFileChunk = 4,
  kFileComplete = 5,
};

inline MessageTag TagOf(const Message& m) noexcept {
  return static_cast<MessageTag>(m.index());
}

inline const char* ToString(MessageTag t) noexcept {
  switch (t) {
    case MessageTag::kText:         return "Text";
    case MessageTag::kFileOffer:    return "FileOffer";
    case MessageTag::kFileAccept:   return "FileAccept";
    case MessageTag::kFileReject:   return "FileReject";
    case MessageTag::kFileChunk:    return "FileChunk";
    case MessageTag::kFileComplete: return "FileComplete";
  }
  return "Unknown";
}

// Overloaded visitor pattern (C++17)
template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// ============================================================================
// Byte writer / reader
// ============================================================================

namespace detail {

class ByteWriter {
 public:
  explicit ByteWriter(std::vector<uint8_t>& out) noexcept : out_(out) {}

  void U8(uint8_t v) { out_.push_back(v); }

  void U32(uint32_t v) {
    for (int shift = 24; shift >= 0; shift -= 8) {
      out_.push_back(static_cast<uint8_t>(v >> shift));
    }
  }

  void U64(uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
      out_.push_back(static_cast<uint8_t>(v >> shift));
    }
  }

  void Raw(const uint8_t* data, size_t len) {
    out_.insert(out_.end(), data, data + len);
  }

  template <typename Tag>
  void Id(const BasicId<Tag>& id) {
    Raw(id.bytes().data(), kIdSize);
  }

  /// @return false when len does not fit the u32 prefix.
  bool Blob(const uint8_t* data, size_t len) {
    if (len > std::numeric_limits<uint32_t>::max()) return false;
    U32(static_cast<uint32_t>(len));
    Raw(data, len);
    return true;
  }

  bool Str(const std::string& s) {
    return Blob(reinterpret_cast<const uint8_t*>(s.data()), s.size());
  }

 private:
  std::vector<uint8_t>& out_;
};

class ByteReader {
 public:
  ByteReader(const uint8_t* data, size_t len) noexcept
      : data_(data), len_(len), pos_(0) {}

  bool U8(uint8_t& v) noexcept {
    if (Remaining() < 1) return false;
    v = data_[pos_++];
    return true;
  }

  bool U32(uint32_t& v) noexcept {
    if (Remaining() < 4) return false;
    v = 0;
    for (int i = 0; i < 4; ++i) v = (v << 8) | data_[pos_++];
    return true;
  }

  bool U64(uint64_t& v) noexcept {
    if (Remaining() < 8) return false;
    v = 0;
    for (int i = 0; i < 8; ++i) v = (v << 8) | data_[pos_++];
    return true;
  }

  template <typename Tag>
  bool Id(BasicId<Tag>& id) noexcept {
    if (Remaining() < kIdSize) return false;
    typename BasicId<Tag>::Bytes b;
    std::memcpy(b.data(), data_ + pos_, kIdSize);
    pos_ += kIdSize;
    id = BasicId<Tag>(b);
    return true;
  }

  bool Blob(std::vector<uint8_t>& out) {
    uint32_t n = 0;
    if (!U32(n) || Remaining() < n) return false;
    out.assign(data_ + pos_, data_ + pos_ + n);
    pos_ += n;
    return true;
  }

  bool Str(std::string& out) {
    uint32_t n = 0;
    if (!U32(n) || Remaining() < n) return false;
    out.assign(reinterpret_cast<const char*>(data_ + pos_), n);
    pos_ += n;
    return true;
  }

  size_t Remaining() const noexcept { return len_ - pos_; }

 private:
  const uint8_t* data_;
  size_t len_;
  size_t pos_;
};

}  // namespace detail

// ============================================================================
// MessageCodec
// ============================================================================

/**
 * @brief Pure, stateless encoder/decoder for Message payloads.
 *
 * Decode(Encode(m)) == m for every constructible m.
 */
class MessageCodec {
 public:
  /**
   * @brief Serialize a message to its payload bytes (no length prefix).
   * @return Payload bytes, or kEncodeError if a string or data field is
   *         longer than a u32 length can describe.
   */
  static expected<std::vector<uint8_t>, CodecError> Encode(const Message& msg) {
    std::vector<uint8_t> out;
    detail::ByteWriter w(out);
    w.U8(static_cast<uint8_t>(msg.index()));

    bool ok = std::visit(
        overloaded{
            [&w](const TextMessage& m) { return w.Str(m.content); },
            [&w](const FileOffer& m) {
              w.Id(m.id);
              if (!w.Str(m.name)) return false;
              w.U64(m.size);
              return true;
            },
            [&w](const FileAccept& m) {
              w.Id(m.id);
              return true;
            },
            [&w](const FileReject& m) {
              w.Id(m.id);
              return true;
            },
            [&w](const FileChunk& m) {
              w.Id(m.id);
              w.U64(m.offset);
              return w.Blob(m.data.data(), m.data.size());
            },
            [&w](const FileComplete& m) {
              w.Id(m.id);
              return true;
            },
        },
        msg);

    if (!ok) {
      return expected<std::vector<uint8_t>, CodecError>::error(
          CodecError::kEncodeError);
    }
    return expected<std::vector<uint8_t>, CodecError>::success(std::move(out));
  }

  /**
   * @brief Parse exactly one message from a payload.
   *
   * Never yields a partially-populated message: any failure returns an
   * error and discards what was read.
   */
  static expected<Message, CodecError> Decode(const uint8_t* data, size_t len) {
    using Result = expected<Message, CodecError>;
    if (data == nullptr && len != 0) {
      return Result::error(CodecError::kMalformed);
    }
    detail::ByteReader r(data, len);

    uint8_t tag = 0;
    if (!r.U8(tag)) return Result::error(CodecError::kTruncated);

    Message msg;
    bool ok = false;
    switch (static_cast<MessageTag>(tag)) {
      case MessageTag::kText: {
        TextMessage m;
        ok = r.Str(m.content);
        msg = std::move(m);
        break;
      }
      case MessageTag::kFileOffer: {
        FileOffer m;
        ok = r.Id(m.id) && r.Str(m.name) && r.U64(m.size);
        msg = std::move(m);
        break;
      }
      case MessageTag::kFileAccept: {
        FileAccept m;
        ok = r.Id(m.id);
        msg = m;
        break;
      }
      case MessageTag::kFileReject: {
        FileReject m;
        ok = r.Id(m.id);
        msg = m;
        break;
      }
      case MessageTag::kFileChunk: {
        FileChunk m;
        ok = r.Id(m.id) && r.U64(m.offset) && r.Blob(m.data);
        msg = std::move(m);
        break;
      }
      case MessageTag::kFileComplete: {
        FileComplete m;
        ok = r.Id(m.id);
        msg = m;
        break;
      }
      default:
        return Result::error(CodecError::kUnknownTag);
    }

    if (!ok) return Result::error(CodecError::kTruncated);
    if (r.Remaining() != 0) return Result::error(CodecError::kTrailingBytes);
    return Result::success(std::move(msg));
  }

  static expected<Message, CodecError> Decode(const std::vector<uint8_t>& bytes) {
    return Decode(bytes.data(), bytes.size());
  }
};

}  // namespace lanxfer

#endif  // LANXFER_MESSAGE_HPP_
