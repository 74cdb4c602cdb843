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
 * @file node.hpp
 * @brief Node facade: owns the registry, transfer engine, discovery,
 *        transport and the dispatch thread, and applies the inbound policy.
 *
 * Threads owned by a running node:
 *   - discovery announce + receive (MulticastDiscovery)
 *   - listener accept + one worker per connection (TransportListener)
 *   - dispatch: the single consumer of the MessageChannel
 *
 * Inbound policy (dispatch thread):
 *   Text         -> on_text
 *   FileOffer    -> auto-accept (PrepareReceive), on_file_offer
 *   FileChunk    -> ApplyChunk; when complete Finalize + on_transfer_complete.
 *                   A chunk for an id the engine has never seen is held
 *                   until its offer arrives; one for a finished or refused
 *                   id is dropped.
 *   FileComplete -> finish zero-length transfers; otherwise leave open
 *   FileAccept   -> MarkAccepted
 *   FileReject   -> MarkRejected
 * Errors are logged and reported through on_error; none stops dispatch.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef LANXFER_NODE_HPP_
#define LANXFER_NODE_HPP_

#include "lanxfer/config.hpp"
#include "lanxfer/discovery.hpp"
#include "lanxfer/id.hpp"
#include "lanxfer/log.hpp"
#include "lanxfer/message.hpp"
#include "lanxfer/peer_registry.hpp"
#include "lanxfer/transfer.hpp"
#include "lanxfer/transport.hpp"
#include "lanxfer/vocabulary.hpp"

#if LANXFER_HAS_NETWORK

#include <algorithm>
#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#ifndef LANXFER_MAX_PENDING_CHUNKS
#define LANXFER_MAX_PENDING_CHUNKS 64U
#endif

namespace lanxfer {

// ============================================================================
// NodeError
// ============================================================================

enum class NodeError : uint8_t {
  kAlreadyRunning = 0,
  kListenerFailed,
  kDiscoveryFailed,
  kPeerNotFound,
  kFileUnavailable,  ///< PrepareSend failed (missing, not regular, unreadable).
  kReadFailed,       ///< ReadChunk failed mid-transfer.
  kSendFailed        ///< Connection or write failure to the peer.
};

inline const char* ToString(NodeError e) noexcept {
  switch (e) {
    case NodeError::kAlreadyRunning:  return "node already running";
    case NodeError::kListenerFailed:  return "cannot start transport listener";
    case NodeError::kDiscoveryFailed: return "cannot start discovery";
    case NodeError::kPeerNotFound:    return "peer not found";
    case NodeError::kFileUnavailable: return "file unavailable";
    case NodeError::kReadFailed:      return "file read failed";
    case NodeError::kSendFailed:      return "send failed";
  }
  return "unknown";
}

// ============================================================================
// NodeObserver
// ============================================================================

/**
 * @brief Event sinks invoked on the dispatch thread (or the caller's
 *        thread for on_send_progress). Any pointer may be null.
 *
 * "from" is the registered peer name when the sender's host is known,
 * otherwise its IP address.
 */
struct NodeObserver {
  void (*on_text)(const char* from, const std::string& text,
                  void* ctx) = nullptr;
  void (*on_file_offer)(const char* from, const FileOffer& offer,
                        const std::string& path, void* ctx) = nullptr;
  void (*on_transfer_complete)(const TransferId& id, const std::string& path,
                               void* ctx) = nullptr;
  void (*on_send_progress)(const TransferId& id, uint64_t sent,
                           uint64_t total, void* ctx) = nullptr;
  void (*on_error)(const char* what, const char* detail, void* ctx) = nullptr;
  void* ctx = nullptr;
};

// ============================================================================
// Node
// ============================================================================

class Node {
 public:
  explicit Node(const NodeConfig& cfg)
      : cfg_(cfg),
        local_id_(PeerId::Generate()),
        engine_(cfg.download_dir),
        listener_(MakeTransportConfig(cfg)),
        sender_(registry_, MakeTransportConfig(cfg)),
        running_(false),
        pending_count_(0) {}

  ~Node() { Stop(); }

  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;

  /** @brief Install event sinks. Call before Start(). */
  void SetObserver(const NodeObserver& observer) noexcept {
    observer_ = observer;
  }

  /**
   * @brief Start listener, discovery (if enabled) and the dispatch thread.
   * @return kListenerFailed / kDiscoveryFailed are fatal for the caller.
   */
  expected<void, NodeError> Start() {
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, NodeError>::error(NodeError::kAlreadyRunning);
    }

    channel_ = std::make_unique<MessageChannel>();
    auto lr = listener_.Start(cfg_.port, *channel_);
    if (!lr.has_value()) {
      LANXFER_LOG_ERROR("Node", "listener on port %u: %s",
                        static_cast<unsigned>(cfg_.port),
                        ToString(lr.get_error()));
      return expected<void, NodeError>::error(NodeError::kListenerFailed);
    }

    if (cfg_.discovery_enabled) {
      DiscoveryConfig dcfg;
      dcfg.multicast_group = cfg_.discovery_group;
      dcfg.port = cfg_.discovery_port;
      dcfg.announce_interval_ms = cfg_.discovery_interval_ms;
      dcfg.timeout_ms = cfg_.discovery_timeout_ms;
      dcfg.service = cfg_.discovery_service;
      discovery_ = std::make_unique<MulticastDiscovery>(registry_, dcfg);
      discovery_->SetLocalNode(local_id_, cfg_.name, listener_.Port());
      auto dr = discovery_->Start();
      if (!dr.has_value()) {
        LANXFER_LOG_ERROR("Node", "discovery: %s", ToString(dr.get_error()));
        discovery_.reset();
        listener_.Stop();
        return expected<void, NodeError>::error(NodeError::kDiscoveryFailed);
      }
    }

    running_.store(true, std::memory_order_release);
    dispatch_thread_ = std::thread([this]() { DispatchLoop(); });
    LANXFER_LOG_INFO("Node", "'%s' (%s) up on port %u", cfg_.name.c_str(),
                     local_id_.ToString().c_str(),
                     static_cast<unsigned>(listener_.Port()));
    return expected<void, NodeError>::success();
  }

  /** @brief Stop discovery and listener, drain the channel, join. Idempotent. */
  void Stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) return;

    if (discovery_) {
      discovery_->Stop();
      discovery_.reset();
    }
    listener_.Stop();
    if (channel_) channel_->Close();
    if (dispatch_thread_.joinable()) dispatch_thread_.join();
    registry_.Clear();
    LANXFER_LOG_INFO("Node", "'%s' stopped", cfg_.name.c_str());
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  // --------------------------------------------------------------------------
  // Outbound
  // --------------------------------------------------------------------------

  expected<void, TransportError> SendText(const PeerId& peer_id,
                                          const std::string& text) {
    return sender_.Send(peer_id, Message(TextMessage{text}));
  }

  /**
   * @brief Offer path to peer_id and stream it: FileOffer, every FileChunk
   *        in order, FileComplete.
   *
   * Blocks the calling thread until the last frame is written. The outbound
   * record is finalized on every path (Completed or Failed).
   */
  expected<TransferId, NodeError> SendFile(const PeerId& peer_id,
                                           const std::string& path) {
    using Result = expected<TransferId, NodeError>;
    if (!registry_.Find(peer_id).has_value()) {
      return Result::error(NodeError::kPeerNotFound);
    }

    auto offer = engine_.PrepareSend(path);
    if (!offer.has_value()) {
      LANXFER_LOG_WARN("Node", "cannot send '%s': %s", path.c_str(),
                       ToString(offer.get_error()));
      return Result::error(NodeError::kFileUnavailable);
    }
    const OfferInfo info = offer.value();
    const TransferId id = info.id;

    auto fail = [this, &id](NodeError e) {
      static_cast<void>(engine_.MarkFailed(id));
      engine_.Finalize(id);
      return Result::error(e);
    };
    auto map_send = [](TransportError e) {
      return e == TransportError::kPeerNotFound ? NodeError::kPeerNotFound
                                                : NodeError::kSendFailed;
    };

    auto sr = sender_.Send(peer_id, Message(FileOffer{id, info.name, info.size}));
    if (!sr.has_value()) {
      LANXFER_LOG_WARN("Node", "offer of '%s' failed: %s", info.name.c_str(),
                       ToString(sr.get_error()));
      return fail(map_send(sr.get_error()));
    }

    uint64_t offset = 0;
    for (;;) {
      auto chunk = engine_.ReadChunk(id, offset);
      if (!chunk.has_value()) {
        LANXFER_LOG_WARN("Node", "read of '%s' at %llu failed: %s",
                         path.c_str(), static_cast<unsigned long long>(offset),
                         ToString(chunk.get_error()));
        return fail(NodeError::kReadFailed);
      }
      if (!chunk.value().has_value()) break;

      FileChunk fc;
      fc.id = id;
      fc.offset = offset;
      fc.data = std::move(chunk.value().value());
      const uint64_t len = fc.data.size();

      sr = sender_.Send(peer_id, Message(std::move(fc)));
      if (!sr.has_value()) {
        LANXFER_LOG_WARN("Node", "chunk at %llu failed: %s",
                         static_cast<unsigned long long>(offset),
                         ToString(sr.get_error()));
        return fail(map_send(sr.get_error()));
      }
      offset += len;
      if (observer_.on_send_progress != nullptr) {
        observer_.on_send_progress(id, offset, info.size, observer_.ctx);
      }
    }

    sr = sender_.Send(peer_id, Message(FileComplete{id}));
    if (!sr.has_value()) return fail(map_send(sr.get_error()));

    engine_.Finalize(id);
    LANXFER_LOG_INFO("Node", "sent '%s' (%llu bytes) as %s", info.name.c_str(),
                     static_cast<unsigned long long>(offset),
                     id.ToString().c_str());
    return Result::success(id);
  }

  // --------------------------------------------------------------------------
  // Inbound
  // --------------------------------------------------------------------------

  /**
   * @brief Apply the inbound policy to one message.
   *
   * Called by the dispatch thread; exposed so the policy can be driven
   * without sockets.
   */
  void Dispatch(const InboundMessage& in) {
    const std::string from = DescribeSender(in.remote_host);
    std::visit(overloaded{
                   [&](const TextMessage& m) { HandleText(from, m); },
                   [&](const FileOffer& m) { HandleOffer(from, m); },
                   [&](const FileAccept& m) { HandleAccept(m); },
                   [&](const FileReject& m) { HandleReject(m); },
                   [&](const FileChunk& m) { HandleChunk(m); },
                   [&](const FileComplete& m) { HandleComplete(m); },
               },
               in.message);
  }

  // --------------------------------------------------------------------------
  // Accessors
  // --------------------------------------------------------------------------

  const PeerId& Id() const noexcept { return local_id_; }
  const std::string& Name() const noexcept { return cfg_.name; }
  uint16_t Port() const noexcept { return listener_.Port(); }
  const NodeConfig& GetConfig() const noexcept { return cfg_; }

  std::vector<Peer> ListPeers() const { return registry_.List(); }

  /** @brief Chunks held for offers that have not arrived yet. */
  size_t PendingChunks() const noexcept { return pending_count_; }

  PeerRegistry& Registry() noexcept { return registry_; }
  TransferEngine& Engine() noexcept { return engine_; }

 private:
  static TransportConfig MakeTransportConfig(const NodeConfig& cfg) noexcept {
    TransportConfig t;
    t.io_timeout_ms = cfg.io_timeout_ms;
    return t;
  }

  void DispatchLoop() {
    MessageChannel* ch = channel_.get();
    for (;;) {
      auto msg = ch->Pop();
      if (!msg.has_value()) break;
      Dispatch(msg.value());
    }
  }

  std::string DescribeSender(const std::string& host) const {
    const std::string prefix = host + ":";
    for (const auto& p : registry_.List()) {
      if (p.address.compare(0, prefix.size(), prefix) == 0) return p.name;
    }
    return host;
  }

  void Report(const char* what, const char* detail) {
    LANXFER_LOG_WARN("Node", "%s: %s", what, detail);
    if (observer_.on_error != nullptr) {
      observer_.on_error(what, detail, observer_.ctx);
    }
  }

  void HandleText(const std::string& from, const TextMessage& m) {
    LANXFER_LOG_DEBUG("Node", "text from %s (%zu bytes)", from.c_str(),
                      m.content.size());
    if (observer_.on_text != nullptr) {
      observer_.on_text(from.c_str(), m.content, observer_.ctx);
    }
  }

  void HandleOffer(const std::string& from, const FileOffer& m) {
    auto r = engine_.PrepareReceive(m.id, m.name, m.size);
    if (!r.has_value()) {
      DropPending(m.id);
      Report("file offer rejected", ToString(r.get_error()));
      return;
    }
    LANXFER_LOG_INFO("Node", "receiving '%s' (%llu bytes) from %s",
                     m.name.c_str(), static_cast<unsigned long long>(m.size),
                     from.c_str());
    if (observer_.on_file_offer != nullptr) {
      observer_.on_file_offer(from.c_str(), m, r.value(), observer_.ctx);
    }
    ReplayPending(m.id);
  }

  void HandleAccept(const FileAccept& m) {
    auto r = engine_.MarkAccepted(m.id);
    if (!r.has_value()) Report("file accept", ToString(r.get_error()));
  }

  void HandleReject(const FileReject& m) {
    auto r = engine_.MarkRejected(m.id);
    if (!r.has_value()) {
      Report("file reject", ToString(r.get_error()));
      return;
    }
    LANXFER_LOG_INFO("Node", "transfer %s rejected by peer",
                     m.id.ToString().c_str());
  }

  void HandleChunk(const FileChunk& m) {
    auto r = engine_.ApplyChunk(m.id, m.offset, m.data);
    if (!r.has_value()) {
      if (r.get_error() == TransferError::kTransferNotFound) {
        auto state = engine_.State(m.id);
        if (state.has_value()) {
          LANXFER_LOG_DEBUG("Node", "late chunk for %s transfer %s dropped",
                            ToString(state.value()), m.id.ToString().c_str());
          return;
        }
        // Connections race: the chunk may beat its offer to the channel.
        HoldPending(m);
        return;
      }
      if (r.get_error() == TransferError::kIoError) {
        engine_.Finalize(m.id);
        DropPending(m.id);
      }
      Report("file chunk", ToString(r.get_error()));
      return;
    }
    if (r.value()) FinishInbound(m.id);
  }

  void HandleComplete(const FileComplete& m) {
    auto done = engine_.IsComplete(m.id);
    if (!done.has_value()) {
      LANXFER_LOG_DEBUG("Node", "complete for untracked %s",
                        m.id.ToString().c_str());
      return;
    }
    if (done.value()) {
      FinishInbound(m.id);
    } else {
      auto p = engine_.Progress(m.id);
      LANXFER_LOG_INFO("Node", "complete for %s at %llu/%llu, waiting for chunks",
                       m.id.ToString().c_str(),
                       static_cast<unsigned long long>(p.has_value() ? p.value().received : 0),
                       static_cast<unsigned long long>(p.has_value() ? p.value().size : 0));
    }
  }

  void FinishInbound(const TransferId& id) {
    std::string path = engine_.InboundPath(id).value_or(std::string());
    engine_.Finalize(id);
    DropPending(id);
    LANXFER_LOG_INFO("Node", "received %s -> %s", id.ToString().c_str(),
                     path.c_str());
    if (observer_.on_transfer_complete != nullptr) {
      observer_.on_transfer_complete(id, path, observer_.ctx);
    }
  }

  // ---- Chunks that arrived before their offer (dispatch thread only) ----

  // Full buffer: the id that has waited longest for its offer is dropped
  // first. A single id never evicts its own chunks.
  void HoldPending(const FileChunk& m) {
    while (pending_count_ >= LANXFER_MAX_PENDING_CHUNKS) {
      auto victim = std::find_if(
          pending_order_.begin(), pending_order_.end(),
          [&m](const TransferId& id) { return id != m.id; });
      if (victim == pending_order_.end()) {
        Report("file chunk", "too many chunks ahead of their offer");
        return;
      }
      const TransferId evicted = *victim;
      DropPending(evicted);
      LANXFER_LOG_WARN("Node", "no offer for %s, buffered chunks dropped",
                       evicted.ToString().c_str());
    }
    auto& chunks = pending_[m.id];
    if (chunks.empty()) pending_order_.push_back(m.id);
    chunks.push_back(m);
    ++pending_count_;
  }

  std::vector<FileChunk> TakePending(const TransferId& id) {
    std::vector<FileChunk> chunks;
    auto it = pending_.find(id);
    if (it == pending_.end()) return chunks;
    chunks = std::move(it->second);
    pending_.erase(it);
    pending_count_ -= chunks.size();
    pending_order_.erase(
        std::remove(pending_order_.begin(), pending_order_.end(), id),
        pending_order_.end());
    return chunks;
  }

  void ReplayPending(const TransferId& id) {
    for (const auto& c : TakePending(id)) HandleChunk(c);
  }

  void DropPending(const TransferId& id) {
    static_cast<void>(TakePending(id));
  }

  NodeConfig cfg_;
  PeerId local_id_;
  NodeObserver observer_;

  PeerRegistry registry_;
  TransferEngine engine_;
  TransportListener listener_;
  Sender sender_;
  std::unique_ptr<MessageChannel> channel_;
  std::unique_ptr<MulticastDiscovery> discovery_;

  std::atomic<bool> running_;
  std::thread dispatch_thread_;

  std::map<TransferId, std::vector<FileChunk>> pending_;
  std::deque<TransferId> pending_order_;
  size_t pending_count_;
};

}  // namespace lanxfer

#endif  // LANXFER_HAS_NETWORK

#endif  // LANXFER_NODE_HPP_
