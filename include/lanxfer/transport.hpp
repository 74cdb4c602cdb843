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
 * @file transport.hpp
 * @brief One-frame-per-connection TCP transport: listener, sender and the
 *        dispatch channel between them.
 *
 * Wire contract per connection:
 * +------------------+-----------------------+
 * | length (4B, BE)  | payload (length bytes)|
 * +------------------+-----------------------+
 * The sender closes after writing; the receiver closes after reading.
 *
 * The listener never calls user code on its I/O threads. Decoded messages
 * are pushed onto a MessageChannel that a single consumer drains.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef LANXFER_TRANSPORT_HPP_
#define LANXFER_TRANSPORT_HPP_

#include "lanxfer/frame.hpp"
#include "lanxfer/log.hpp"
#include "lanxfer/message.hpp"
#include "lanxfer/peer_registry.hpp"
#include "lanxfer/platform.hpp"
#include "lanxfer/socket.hpp"
#include "lanxfer/vocabulary.hpp"

#if LANXFER_HAS_NETWORK

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lanxfer {

// ============================================================================
// Transport Error
// ============================================================================

enum class TransportError : uint8_t {
  kPeerNotFound = 0,
  kInvalidAddress,
  kConnectionFailed,
  kSendFailed,
  kRecvFailed,
  kBindFailed,
  kListenFailed,
  kDecodeFailed,
  kAlreadyRunning,
  kNotRunning
};

inline const char* ToString(TransportError e) noexcept {
  switch (e) {
    case TransportError::kPeerNotFound:     return "peer not found";
    case TransportError::kInvalidAddress:   return "invalid peer address";
    case TransportError::kConnectionFailed: return "connection failed";
    case TransportError::kSendFailed:       return "send failed";
    case TransportError::kRecvFailed:       return "receive failed";
    case TransportError::kBindFailed:       return "bind failed";
    case TransportError::kListenFailed:     return "listen failed";
    case TransportError::kDecodeFailed:     return "decode failed";
    case TransportError::kAlreadyRunning:   return "listener already running";
    case TransportError::kNotRunning:       return "listener not running";
  }
  return "unknown";
}

// ============================================================================
// TransportConfig
// ============================================================================

struct TransportConfig {
  /// SO_RCVTIMEO / SO_SNDTIMEO on every connection. 0 = block indefinitely.
  uint32_t io_timeout_ms = 0;
};

// ============================================================================
// InboundMessage / MessageChannel
// ============================================================================

struct InboundMessage {
  Message message;
  std::string remote_host;  ///< Dotted IPv4 of the connecting peer.
};

/**
 * @brief Multi-producer / single-consumer blocking queue of inbound messages.
 *
 * Close() wakes all waiters; Pop() keeps returning queued messages after
 * Close() until the queue is drained, then returns an empty optional.
 */
class MessageChannel {
 public:
  MessageChannel() noexcept : closed_(false) {}

  MessageChannel(const MessageChannel&) = delete;
  MessageChannel& operator=(const MessageChannel&) = delete;

  /** @return false if the channel is closed (message dropped). */
  bool Push(InboundMessage msg) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) return false;
      queue_.push_back(std::move(msg));
    }
    cv_.notify_one();
    return true;
  }

  /** @brief Block until a message arrives or the channel is closed and empty. */
  optional<InboundMessage> Pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return closed_ || !queue_.empty(); });
    return TakeFront();
  }

  /** @brief Pop with a deadline; empty optional on timeout. */
  optional<InboundMessage> PopFor(uint32_t timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                 [this]() { return closed_ || !queue_.empty(); });
    return TakeFront();
  }

  optional<InboundMessage> TryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    return TakeFront();
  }

  void Close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

 private:
  // Caller holds mutex_.
  optional<InboundMessage> TakeFront() {
    if (queue_.empty()) return optional<InboundMessage>();
    optional<InboundMessage> out(std::move(queue_.front()));
    queue_.pop_front();
    return out;
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<InboundMessage> queue_;
  bool closed_;
};

// ============================================================================
// Frame I/O helpers
// ============================================================================

/**
 * @brief Read exactly one frame from sock and decode it.
 * @return kRecvFailed on I/O failure or early close, kDecodeFailed on an
 *         oversized length prefix or an undecodable payload.
 */
inline expected<Message, TransportError> ReadFrame(TcpSocket& sock) {
  using Result = expected<Message, TransportError>;
  uint8_t len_buf[FrameCodec::kLengthSize];
  if (!sock.RecvAll(len_buf, sizeof(len_buf)).has_value()) {
    return Result::error(TransportError::kRecvFailed);
  }
  auto len = FrameCodec::CheckLength(FrameCodec::DecodeLength(len_buf));
  if (!len.has_value()) {
    LANXFER_LOG_WARN("Transport", "rejecting frame: %s",
                     ToString(len.get_error()));
    return Result::error(TransportError::kDecodeFailed);
  }

  std::vector<uint8_t> payload(len.value());
  if (!payload.empty() &&
      !sock.RecvAll(payload.data(), payload.size()).has_value()) {
    return Result::error(TransportError::kRecvFailed);
  }

  auto msg = MessageCodec::Decode(payload.data(), payload.size());
  if (!msg.has_value()) {
    LANXFER_LOG_WARN("Transport", "undecodable payload (%u bytes): %s",
                     len.value(), ToString(msg.get_error()));
    return Result::error(TransportError::kDecodeFailed);
  }
  return Result::success(std::move(msg.value()));
}

/** @brief Write a prebuilt frame completely. */
inline expected<void, TransportError> WriteFrame(
    TcpSocket& sock, const std::vector<uint8_t>& frame) noexcept {
  if (!sock.SendAll(frame.data(), frame.size()).has_value()) {
    return expected<void, TransportError>::error(TransportError::kSendFailed);
  }
  return expected<void, TransportError>::success();
}

// ============================================================================
// TransportListener
// ============================================================================

/**
 * @brief Accepts connections and reads one frame from each on a short-lived
 *        worker thread.
 *
 * A failure on one connection is logged and counted; it never affects the
 * accept loop or other connections.
 */
class TransportListener {
 public:
  struct Stats {
    uint64_t accepted;
    uint64_t delivered;
    uint64_t failed;
  };

  explicit TransportListener(const TransportConfig& cfg = {}) noexcept
      : config_(cfg),
        channel_(nullptr),
        running_(false),
        port_(0),
        accepted_(0),
        delivered_(0),
        failed_(0) {}

  ~TransportListener() { Stop(); }

  TransportListener(const TransportListener&) = delete;
  TransportListener& operator=(const TransportListener&) = delete;

  /**
   * @brief Bind 0.0.0.0:port, listen, and spawn the accept thread.
   * @param port TCP port; 0 lets the OS choose (see Port()).
   * @param channel Destination for decoded messages; must outlive Stop().
   */
  expected<void, TransportError> Start(uint16_t port, MessageChannel& channel) {
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, TransportError>::error(
          TransportError::kAlreadyRunning);
    }

    auto lr = TcpListener::Create();
    if (!lr.has_value()) {
      return expected<void, TransportError>::error(TransportError::kBindFailed);
    }
    listener_ = std::move(lr.value());
    static_cast<void>(listener_.SetReuseAddr(true));

    if (!listener_.Bind(SocketAddress::AnyIpv4(port)).has_value()) {
      LANXFER_LOG_ERROR("Transport", "cannot bind port %u",
                        static_cast<unsigned>(port));
      listener_.Close();
      return expected<void, TransportError>::error(TransportError::kBindFailed);
    }
    if (!listener_.Listen().has_value()) {
      listener_.Close();
      return expected<void, TransportError>::error(
          TransportError::kListenFailed);
    }

    port_ = listener_.LocalPort();
    channel_ = &channel;
    running_.store(true, std::memory_order_release);
    accept_thread_ = std::thread([this]() { AcceptLoop(); });

    LANXFER_LOG_INFO("Transport", "listening on port %u",
                     static_cast<unsigned>(port_));
    return expected<void, TransportError>::success();
  }

  /**
   * @brief Stop accepting, unblock in-flight workers and join everything.
   *        Idempotent.
   */
  void Stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) return;

    if (accept_thread_.joinable()) accept_thread_.join();
    listener_.Close();

    std::list<std::unique_ptr<Connection>> conns;
    {
      std::lock_guard<std::mutex> lock(conns_mutex_);
      for (auto& c : conns_) {
        if (c->fd >= 0) (void)::shutdown(c->fd, SHUT_RDWR);
      }
      conns.swap(conns_);
    }
    for (auto& c : conns) {
      if (c->thread.joinable()) c->thread.join();
    }
    channel_ = nullptr;
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  /** @brief Bound port (valid after a successful Start()). */
  uint16_t Port() const noexcept { return port_; }

  Stats GetStats() const noexcept {
    return Stats{accepted_.load(std::memory_order_relaxed),
                 delivered_.load(std::memory_order_relaxed),
                 failed_.load(std::memory_order_relaxed)};
  }

 private:
  struct Connection {
    std::thread thread;
    int32_t fd = -1;    ///< Guarded by conns_mutex_; -1 once closed.
    bool done = false;  ///< Guarded by conns_mutex_.
  };

  static constexpr int32_t kAcceptPollMs = 100;

  void AcceptLoop() {
    while (running_.load(std::memory_order_acquire)) {
      ReapFinished();
      if (!PollReadable(listener_.Fd(), kAcceptPollMs)) continue;

      SocketAddress remote;
      auto sr = listener_.Accept(remote);
      if (!sr.has_value()) {
        if (running_.load(std::memory_order_acquire)) {
          LANXFER_LOG_WARN("Transport", "accept failed: %s",
                           ToString(sr.get_error()));
        }
        continue;
      }
      accepted_.fetch_add(1, std::memory_order_relaxed);

      auto conn = std::make_unique<Connection>();
      Connection* raw = conn.get();
      TcpSocket sock = std::move(sr.value());

      std::lock_guard<std::mutex> lock(conns_mutex_);
      raw->fd = sock.Fd();
      conns_.push_back(std::move(conn));
      raw->thread = std::thread(
          [this, raw, remote](TcpSocket s) { HandleConnection(raw, s, remote); },
          std::move(sock));
    }
  }

  void HandleConnection(Connection* conn, TcpSocket& sock,
                        const SocketAddress& remote) {
    if (config_.io_timeout_ms > 0) {
      static_cast<void>(sock.SetTimeouts(config_.io_timeout_ms));
    }

    auto msg = ReadFrame(sock);
    if (msg.has_value()) {
      LANXFER_LOG_DEBUG("Transport", "%s from %s",
                        ToString(TagOf(msg.value())), remote.Host().c_str());
      MessageChannel* ch = channel_;
      if (ch != nullptr &&
          ch->Push(InboundMessage{std::move(msg.value()), remote.Host()})) {
        delivered_.fetch_add(1, std::memory_order_relaxed);
      } else {
        failed_.fetch_add(1, std::memory_order_relaxed);
      }
    } else {
      failed_.fetch_add(1, std::memory_order_relaxed);
      LANXFER_LOG_WARN("Transport", "connection from %s dropped: %s",
                       remote.Host().c_str(), ToString(msg.get_error()));
    }

    std::lock_guard<std::mutex> lock(conns_mutex_);
    conn->fd = -1;
    sock.Close();
    conn->done = true;
  }

  void ReapFinished() {
    std::list<std::unique_ptr<Connection>> finished;
    {
      std::lock_guard<std::mutex> lock(conns_mutex_);
      for (auto it = conns_.begin(); it != conns_.end();) {
        if ((*it)->done) {
          finished.push_back(std::move(*it));
          it = conns_.erase(it);
        } else {
          ++it;
        }
      }
    }
    for (auto& c : finished) {
      if (c->thread.joinable()) c->thread.join();
    }
  }

  TransportConfig config_;
  TcpListener listener_;
  MessageChannel* channel_;
  std::atomic<bool> running_;
  uint16_t port_;
  std::thread accept_thread_;

  std::mutex conns_mutex_;
  std::list<std::unique_ptr<Connection>> conns_;

  std::atomic<uint64_t> accepted_;
  std::atomic<uint64_t> delivered_;
  std::atomic<uint64_t> failed_;
};

// ============================================================================
// Sender
// ============================================================================

/**
 * @brief Resolves a peer through the registry and delivers one message per
 *        connection. Single attempt, no acknowledgement.
 */
class Sender {
 public:
  explicit Sender(const PeerRegistry& registry,
                  const TransportConfig& cfg = {}) noexcept
      : registry_(registry), config_(cfg) {}

  /**
   * @brief Send msg to a registered peer.
   * @return kPeerNotFound (no network I/O), kInvalidAddress,
   *         kConnectionFailed or kSendFailed.
   */
  expected<void, TransportError> Send(const PeerId& peer_id,
                                      const Message& msg) const {
    auto peer = registry_.Find(peer_id);
    if (!peer.has_value()) {
      return expected<void, TransportError>::error(
          TransportError::kPeerNotFound);
    }
    return SendTo(peer.value().address, msg);
  }

  /** @brief Send msg to "host:port" without consulting the registry. */
  expected<void, TransportError> SendTo(const std::string& address,
                                        const Message& msg) const {
    auto addr = SocketAddress::Parse(address);
    if (!addr.has_value()) {
      return expected<void, TransportError>::error(
          TransportError::kInvalidAddress);
    }

    auto frame = FrameCodec::BuildFrame(msg);
    if (!frame.has_value()) {
      LANXFER_LOG_ERROR("Transport", "cannot frame %s: %s",
                        ToString(TagOf(msg)), ToString(frame.get_error()));
      return expected<void, TransportError>::error(TransportError::kSendFailed);
    }

    auto sr = TcpSocket::Create();
    if (!sr.has_value()) {
      return expected<void, TransportError>::error(
          TransportError::kConnectionFailed);
    }
    TcpSocket sock = std::move(sr.value());
    if (config_.io_timeout_ms > 0) {
      static_cast<void>(sock.SetTimeouts(config_.io_timeout_ms));
    }
    if (!sock.Connect(addr.value()).has_value()) {
      return expected<void, TransportError>::error(
          TransportError::kConnectionFailed);
    }
    static_cast<void>(sock.SetNoDelay(true));

    return WriteFrame(sock, frame.value());
  }

 private:
  const PeerRegistry& registry_;
  TransportConfig config_;
};

}  // namespace lanxfer

#endif  // LANXFER_HAS_NETWORK

#endif  // LANXFER_TRANSPORT_HPP_
