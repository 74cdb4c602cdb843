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
 * @file transfer.hpp
 * @brief Chunked file transfer engine: outbound sources, inbound partial
 *        files and the per-transfer state machine.
 *
 * State machine per transfer id:
 *
 *   Offered --> Accepted --> Transferring --> Completed
 *      |            |             |
 *      +--> Rejected             +--> Failed   (any non-terminal state)
 *
 * Offers are auto-accepted in the base flow: PrepareReceive registers the
 * inbound side directly in Transferring, and the outbound side moves from
 * Offered to Transferring on its first ReadChunk.
 *
 * Chunks are written with pwrite at their declared offset, so chunks of one
 * transfer may be applied in any order. Each inbound transfer tracks the
 * byte ranges already claimed; a chunk overlapping one of them is refused,
 * so received counts distinct bytes only. File I/O runs outside the engine
 * lock.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef LANXFER_TRANSFER_HPP_
#define LANXFER_TRANSFER_HPP_

#include "lanxfer/id.hpp"
#include "lanxfer/log.hpp"
#include "lanxfer/platform.hpp"
#include "lanxfer/vocabulary.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <deque>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#ifndef LANXFER_CHUNK_SIZE
#define LANXFER_CHUNK_SIZE (64U * 1024U)
#endif

#ifndef LANXFER_TRANSFER_HISTORY
#define LANXFER_TRANSFER_HISTORY 64U
#endif

#ifndef LANXFER_DOWNLOAD_DIR
#define LANXFER_DOWNLOAD_DIR "downloads"
#endif

namespace lanxfer {

constexpr uint32_t kChunkSize = LANXFER_CHUNK_SIZE;

// ============================================================================
// Transfer Error / State
// ============================================================================

enum class TransferError : uint8_t {
  kFileNotFound = 0,
  kNotRegularFile,
  kIoError,
  kTransferNotFound,
  kDuplicateTransfer,
  kInvalidName,
  kOutOfRange
};

inline const char* ToString(TransferError e) noexcept {
  switch (e) {
    case TransferError::kFileNotFound:      return "file not found";
    case TransferError::kNotRegularFile:    return "not a regular file";
    case TransferError::kIoError:           return "I/O error";
    case TransferError::kTransferNotFound:  return "transfer not found";
    case TransferError::kDuplicateTransfer: return "duplicate transfer id";
    case TransferError::kInvalidName:       return "invalid file name";
    case TransferError::kOutOfRange:        return "chunk out of range";
  }
  return "unknown";
}

enum class TransferState : uint8_t {
  kOffered = 0,
  kAccepted,
  kTransferring,
  kCompleted,
  kRejected,
  kFailed
};

inline const char* ToString(TransferState s) noexcept {
  switch (s) {
    case TransferState::kOffered:      return "offered";
    case TransferState::kAccepted:     return "accepted";
    case TransferState::kTransferring: return "transferring";
    case TransferState::kCompleted:    return "completed";
    case TransferState::kRejected:     return "rejected";
    case TransferState::kFailed:       return "failed";
  }
  return "unknown";
}

inline bool IsTerminal(TransferState s) noexcept {
  return s == TransferState::kCompleted || s == TransferState::kRejected ||
         s == TransferState::kFailed;
}

// ============================================================================
// Value types
// ============================================================================

/** @brief Result of PrepareSend: what goes into the FileOffer. */
struct OfferInfo {
  TransferId id;
  std::string name;
  uint64_t size = 0;
};

struct TransferProgress {
  uint64_t received = 0;
  uint64_t size = 0;
};

namespace detail {

/** @brief Owning POSIX file descriptor. */
class FileHandle {
 public:
  FileHandle() noexcept : fd_(-1) {}
  explicit FileHandle(int fd) noexcept : fd_(fd) {}
  ~FileHandle() { Close(); }

  FileHandle(FileHandle&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  FileHandle& operator=(FileHandle&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;

  void Close() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int Fd() const noexcept { return fd_; }
  bool IsValid() const noexcept { return fd_ >= 0; }

 private:
  int fd_;
};

/** @brief mkdir -p. */
inline bool MakeDirs(const std::string& path) {
  if (path.empty()) return true;
  std::string partial;
  partial.reserve(path.size());
  for (size_t i = 0; i < path.size(); ++i) {
    partial.push_back(path[i]);
    bool at_end = (i + 1 == path.size());
    if (path[i] != '/' && !at_end) continue;
    if (partial == "/") continue;
    if (::mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) return false;
  }
  struct stat st{};
  return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

/** @brief Final path component, accepting both '/' and '\\' separators. */
inline std::string BaseName(const std::string& name) {
  auto pos = name.find_last_of("/\\");
  return pos == std::string::npos ? name : name.substr(pos + 1);
}

/** @brief "name.ext" -> "name (n).ext"; dot-files keep their leading dot. */
inline std::string NumberedName(const std::string& base, unsigned n) {
  auto dot = base.find_last_of('.');
  if (dot == std::string::npos || dot == 0) dot = base.size();
  return base.substr(0, dot) + " (" + std::to_string(n) + ")" +
         base.substr(dot);
}

/**
 * @brief Set of disjoint half-open byte ranges [begin, end), adjacent
 *        ranges merged.
 */
class RangeSet {
 public:
  bool Overlaps(uint64_t begin, uint64_t end) const {
    if (begin >= end) return false;
    auto it = ranges_.upper_bound(begin);
    if (it != ranges_.begin() && std::prev(it)->second > begin) return true;
    return it != ranges_.end() && it->first < end;
  }

  /// Caller checks Overlaps() first.
  void Insert(uint64_t begin, uint64_t end) {
    if (begin >= end) return;
    auto next = ranges_.lower_bound(begin);
    if (next != ranges_.begin()) {
      auto prev = std::prev(next);
      if (prev->second == begin) {
        begin = prev->first;
        ranges_.erase(prev);
      }
    }
    next = ranges_.find(end);
    if (next != ranges_.end()) {
      end = next->second;
      ranges_.erase(next);
    }
    ranges_[begin] = end;
  }

  size_t Count() const noexcept { return ranges_.size(); }

 private:
  std::map<uint64_t, uint64_t> ranges_;
};

}  // namespace detail

// ============================================================================
// TransferEngine
// ============================================================================

class TransferEngine {
 public:
  explicit TransferEngine(std::string download_dir = LANXFER_DOWNLOAD_DIR)
      : download_dir_(std::move(download_dir)) {}

  TransferEngine(const TransferEngine&) = delete;
  TransferEngine& operator=(const TransferEngine&) = delete;

  // --------------------------------------------------------------------------
  // Sending side
  // --------------------------------------------------------------------------

  /**
   * @brief Register a local file for sending; no content is read.
   * @return {fresh id, base name, byte size}, or kFileNotFound,
   *         kNotRegularFile, kIoError.
   */
  expected<OfferInfo, TransferError> PrepareSend(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
      return expected<OfferInfo, TransferError>::error(
          errno == ENOENT || errno == ENOTDIR ? TransferError::kFileNotFound
                                              : TransferError::kIoError);
    }
    if (!S_ISREG(st.st_mode)) {
      return expected<OfferInfo, TransferError>::error(
          TransferError::kNotRegularFile);
    }

    OfferInfo info;
    info.name = detail::BaseName(path);
    info.size = static_cast<uint64_t>(st.st_size);
    {
      std::unique_lock<std::shared_mutex> lock(mutex_);
      do {
        info.id = TransferId::Generate();
      } while (outbound_.count(info.id) != 0 || inbound_.count(info.id) != 0 ||
               history_.count(info.id) != 0);
      outbound_.emplace(info.id, Outbound{path, TransferState::kOffered});
    }
    LANXFER_LOG_DEBUG("Transfer", "prepared %s (%s, %llu bytes)",
                      info.id.ToString().c_str(), info.name.c_str(),
                      static_cast<unsigned long long>(info.size));
    return expected<OfferInfo, TransferError>::success(std::move(info));
  }

  /**
   * @brief Read up to kChunkSize bytes at offset from the tracked source.
   * @return The bytes, an empty optional at end-of-file, or
   *         kTransferNotFound / kIoError.
   */
  expected<optional<std::vector<uint8_t>>, TransferError> ReadChunk(
      const TransferId& id, uint64_t offset) {
    using Result = expected<optional<std::vector<uint8_t>>, TransferError>;
    std::string path;
    {
      std::unique_lock<std::shared_mutex> lock(mutex_);
      auto it = outbound_.find(id);
      if (it == outbound_.end()) {
        return Result::error(TransferError::kTransferNotFound);
      }
      path = it->second.path;
      if (it->second.state == TransferState::kOffered ||
          it->second.state == TransferState::kAccepted) {
        it->second.state = TransferState::kTransferring;
      }
    }

    detail::FileHandle file(::open(path.c_str(), O_RDONLY));
    if (!file.IsValid()) return Result::error(TransferError::kIoError);

    std::vector<uint8_t> buf(kChunkSize);
    size_t got = 0;
    while (got < buf.size()) {
      ssize_t n = ::pread(file.Fd(), buf.data() + got, buf.size() - got,
                          static_cast<off_t>(offset + got));
      if (n < 0) {
        if (errno == EINTR) continue;
        return Result::error(TransferError::kIoError);
      }
      if (n == 0) break;
      got += static_cast<size_t>(n);
    }
    if (got == 0) {
      return Result::success(optional<std::vector<uint8_t>>());
    }
    buf.resize(got);
    return Result::success(optional<std::vector<uint8_t>>(std::move(buf)));
  }

  // --------------------------------------------------------------------------
  // Receiving side
  // --------------------------------------------------------------------------

  /**
   * @brief Create (truncate) the destination file and start tracking it.
   *
   * Only the final path component of name is used, and the file always
   * lands inside the download directory. A name already being written by
   * another active transfer gets a " (n)" suffix. An id whose offer fails
   * here is remembered as Failed.
   * @return Destination path, or kInvalidName, kDuplicateTransfer, kIoError.
   */
  expected<std::string, TransferError> PrepareReceive(const TransferId& id,
                                                      const std::string& name,
                                                      uint64_t size) {
    using Result = expected<std::string, TransferError>;
    std::string base = detail::BaseName(name);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (inbound_.count(id) != 0) {
      return Result::error(TransferError::kDuplicateTransfer);
    }
    if (base.empty() || base == "." || base == "..") {
      Remember(id, TransferState::kFailed);
      return Result::error(TransferError::kInvalidName);
    }
    if (!detail::MakeDirs(download_dir_)) {
      LANXFER_LOG_ERROR("Transfer", "cannot create '%s'", download_dir_.c_str());
      Remember(id, TransferState::kFailed);
      return Result::error(TransferError::kIoError);
    }

    std::string path = download_dir_ + "/" + base;
    for (unsigned n = 1; PathInUse(path); ++n) {
      path = download_dir_ + "/" + detail::NumberedName(base, n);
    }
    auto file = std::make_shared<detail::FileHandle>(
        ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
    if (!file->IsValid()) {
      LANXFER_LOG_ERROR("Transfer", "cannot create '%s'", path.c_str());
      Remember(id, TransferState::kFailed);
      return Result::error(TransferError::kIoError);
    }

    Inbound in;
    in.path = path;
    in.file = std::move(file);
    in.size = size;
    in.received = 0;
    in.state = TransferState::kTransferring;
    inbound_.emplace(id, std::move(in));
    return Result::success(path);
  }

  /**
   * @brief Write data at offset into the tracked destination.
   *
   * The range is claimed under the lock; pwrite and the final fsync run
   * without it.
   * @return true once every declared byte has been written; kTransferNotFound,
   *         kOutOfRange (beyond the declared size, or overlapping bytes
   *         already claimed) or kIoError.
   */
  expected<bool, TransferError> ApplyChunk(const TransferId& id,
                                           uint64_t offset, const uint8_t* data,
                                           size_t len) {
    using Result = expected<bool, TransferError>;
    std::shared_ptr<detail::FileHandle> file;
    std::string path;
    {
      std::unique_lock<std::shared_mutex> lock(mutex_);
      auto it = inbound_.find(id);
      if (it == inbound_.end()) {
        return Result::error(TransferError::kTransferNotFound);
      }
      Inbound& in = it->second;
      if (in.state == TransferState::kFailed) {
        return Result::error(TransferError::kIoError);
      }
      if (offset > in.size || len > in.size - offset ||
          in.claimed.Overlaps(offset, offset + len)) {
        return Result::error(TransferError::kOutOfRange);
      }
      in.claimed.Insert(offset, offset + len);
      file = in.file;
      path = in.path;
    }

    size_t written = 0;
    bool write_failed = false;
    while (written < len) {
      ssize_t n = ::pwrite(file->Fd(), data + written, len - written,
                           static_cast<off_t>(offset + written));
      if (n < 0) {
        if (errno == EINTR) continue;
        LANXFER_LOG_ERROR("Transfer", "write to '%s' failed (errno %d)",
                          path.c_str(), errno);
        write_failed = true;
        break;
      }
      written += static_cast<size_t>(n);
    }

    bool complete = false;
    {
      std::unique_lock<std::shared_mutex> lock(mutex_);
      auto it = inbound_.find(id);
      if (it == inbound_.end()) {
        return Result::error(TransferError::kTransferNotFound);
      }
      Inbound& in = it->second;
      if (write_failed) {
        if (!IsTerminal(in.state)) in.state = TransferState::kFailed;
        return Result::error(TransferError::kIoError);
      }
      in.received += len;
      complete = !IsTerminal(in.state) && in.received >= in.size;
      if (complete) in.state = TransferState::kCompleted;
    }

    if (complete && ::fsync(file->Fd()) != 0) {
      LANXFER_LOG_ERROR("Transfer", "fsync of '%s' failed (errno %d)",
                        path.c_str(), errno);
      std::unique_lock<std::shared_mutex> lock(mutex_);
      auto it = inbound_.find(id);
      if (it != inbound_.end()) it->second.state = TransferState::kFailed;
      return Result::error(TransferError::kIoError);
    }
    return Result::success(complete);
  }

  expected<bool, TransferError> ApplyChunk(const TransferId& id,
                                           uint64_t offset,
                                           const std::vector<uint8_t>& data) {
    return ApplyChunk(id, offset, data.data(), data.size());
  }

  /**
   * @brief Whether an inbound transfer has received all declared bytes.
   *        Covers zero-length files, which never see a chunk.
   */
  expected<bool, TransferError> IsComplete(const TransferId& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = inbound_.find(id);
    if (it == inbound_.end()) {
      return expected<bool, TransferError>::error(
          TransferError::kTransferNotFound);
    }
    return expected<bool, TransferError>::success(it->second.received >=
                                                  it->second.size);
  }

  /** @brief Destination path of an active inbound transfer. */
  optional<std::string> InboundPath(const TransferId& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = inbound_.find(id);
    if (it == inbound_.end()) return optional<std::string>();
    return optional<std::string>(it->second.path);
  }

  optional<TransferProgress> Progress(const TransferId& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = inbound_.find(id);
    if (it == inbound_.end()) return optional<TransferProgress>();
    return optional<TransferProgress>(
        TransferProgress{it->second.received, it->second.size});
  }

  // --------------------------------------------------------------------------
  // Lifecycle
  // --------------------------------------------------------------------------

  /**
   * @brief Stop tracking id on both sides and close the inbound handle.
   *
   * Idempotent. The final state stays queryable through State(): a
   * non-terminal outbound record ends Completed, a non-terminal inbound
   * record ends Completed if all bytes arrived and Failed otherwise.
   */
  void Finalize(const TransferId& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto in = inbound_.find(id);
    if (in != inbound_.end()) {
      TransferState s = in->second.state;
      if (!IsTerminal(s)) {
        s = in->second.received >= in->second.size ? TransferState::kCompleted
                                                   : TransferState::kFailed;
      }
      inbound_.erase(in);
      Remember(id, s);
    }
    auto out = outbound_.find(id);
    if (out != outbound_.end()) {
      TransferState s = out->second.state;
      if (!IsTerminal(s)) s = TransferState::kCompleted;
      outbound_.erase(out);
      Remember(id, s);
    }
  }

  /** @brief Offered -> Accepted for an outbound transfer. */
  expected<void, TransferError> MarkAccepted(const TransferId& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = outbound_.find(id);
    if (it == outbound_.end()) {
      return expected<void, TransferError>::error(
          TransferError::kTransferNotFound);
    }
    if (it->second.state == TransferState::kOffered) {
      it->second.state = TransferState::kAccepted;
    }
    return expected<void, TransferError>::success();
  }

  /** @brief Offered/Accepted -> Rejected for an outbound transfer. */
  expected<void, TransferError> MarkRejected(const TransferId& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = outbound_.find(id);
    if (it == outbound_.end()) {
      return expected<void, TransferError>::error(
          TransferError::kTransferNotFound);
    }
    if (!IsTerminal(it->second.state)) {
      it->second.state = TransferState::kRejected;
    }
    return expected<void, TransferError>::success();
  }

  /** @brief Any non-terminal state -> Failed, on whichever side tracks id. */
  expected<void, TransferError> MarkFailed(const TransferId& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    bool found = false;
    auto in = inbound_.find(id);
    if (in != inbound_.end()) {
      found = true;
      if (!IsTerminal(in->second.state)) in->second.state = TransferState::kFailed;
    }
    auto out = outbound_.find(id);
    if (out != outbound_.end()) {
      found = true;
      if (!IsTerminal(out->second.state)) {
        out->second.state = TransferState::kFailed;
      }
    }
    if (!found) {
      return expected<void, TransferError>::error(
          TransferError::kTransferNotFound);
    }
    return expected<void, TransferError>::success();
  }

  /**
   * @brief Current state of id: inbound record first, then outbound, then
   *        the history of recently finalized transfers.
   */
  optional<TransferState> State(const TransferId& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto in = inbound_.find(id);
    if (in != inbound_.end()) return optional<TransferState>(in->second.state);
    auto out = outbound_.find(id);
    if (out != outbound_.end()) {
      return optional<TransferState>(out->second.state);
    }
    auto h = history_.find(id);
    if (h != history_.end()) return optional<TransferState>(h->second);
    return optional<TransferState>();
  }

  size_t ActiveOutbound() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return outbound_.size();
  }

  size_t ActiveInbound() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return inbound_.size();
  }

  const std::string& DownloadDir() const noexcept { return download_dir_; }

 private:
  struct Outbound {
    std::string path;
    TransferState state;
  };

  struct Inbound {
    std::string path;
    std::shared_ptr<detail::FileHandle> file;  // shared with in-flight writes
    uint64_t size = 0;
    uint64_t received = 0;  // bytes written, never double-counted
    detail::RangeSet claimed;
    TransferState state = TransferState::kTransferring;
  };

  // Caller holds mutex_.
  bool PathInUse(const std::string& path) const {
    for (const auto& kv : inbound_) {
      if (kv.second.path == path) return true;
    }
    return false;
  }

  // Caller holds mutex_ exclusively.
  void Remember(const TransferId& id, TransferState s) {
    if (history_.count(id) == 0) history_order_.push_back(id);
    history_[id] = s;
    while (history_order_.size() > LANXFER_TRANSFER_HISTORY) {
      history_.erase(history_order_.front());
      history_order_.pop_front();
    }
  }

  std::string download_dir_;
  mutable std::shared_mutex mutex_;
  std::map<TransferId, Outbound> outbound_;
  std::map<TransferId, Inbound> inbound_;
  std::map<TransferId, TransferState> history_;
  std::deque<TransferId> history_order_;
};

}  // namespace lanxfer

#endif  // LANXFER_TRANSFER_HPP_
