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
 * @file discovery.hpp
 * @brief UDP multicast peer discovery feeding the PeerRegistry.
 *
 * Each node periodically multicasts an announcement carrying its service
 * identifier, stable node id, display name and TCP listen port, and listens
 * on the same group. Resolved announcements become registry entries; a
 * goodbye datagram or a liveness timeout removes entries by name.
 *
 * Announcement wire format (big-endian):
 * +-------+-----+------+---------+------+---------+---------+------+------+
 * | magic | ver | kind | node id | port | svc len | service | nlen | name |
 * | 4     | 1   | 1    | 16      | 2    | 1       | <= 63   | 1    | <=63 |
 * +-------+-----+------+---------+------+---------+---------+------+------+
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef LANXFER_DISCOVERY_HPP_
#define LANXFER_DISCOVERY_HPP_

#include "lanxfer/id.hpp"
#include "lanxfer/log.hpp"
#include "lanxfer/peer_registry.hpp"
#include "lanxfer/platform.hpp"
#include "lanxfer/socket.hpp"
#include "lanxfer/vocabulary.hpp"

#if LANXFER_HAS_NETWORK

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#ifndef LANXFER_DISCOVERY_PORT
#define LANXFER_DISCOVERY_PORT 9877
#endif
#ifndef LANXFER_DISCOVERY_INTERVAL_MS
#define LANXFER_DISCOVERY_INTERVAL_MS 1000
#endif
#ifndef LANXFER_DISCOVERY_TIMEOUT_MS
#define LANXFER_DISCOVERY_TIMEOUT_MS 3000
#endif
#ifndef LANXFER_DISCOVERY_MULTICAST_GROUP
#define LANXFER_DISCOVERY_MULTICAST_GROUP "239.255.42.99"
#endif
#ifndef LANXFER_DISCOVERY_SERVICE
#define LANXFER_DISCOVERY_SERVICE "_lanxfer._tcp"
#endif

namespace lanxfer {

// ============================================================================
// Discovery Error
// ============================================================================

enum class DiscoveryError : uint8_t {
  kSocketFailed,
  kBindFailed,
  kMulticastJoinFailed,
  kSendFailed,
  kAlreadyRunning,
  kNotRunning,
};

inline const char* ToString(DiscoveryError e) noexcept {
  switch (e) {
    case DiscoveryError::kSocketFailed:        return "discovery socket failed";
    case DiscoveryError::kBindFailed:          return "discovery bind failed";
    case DiscoveryError::kMulticastJoinFailed: return "multicast join failed";
    case DiscoveryError::kSendFailed:          return "discovery send failed";
    case DiscoveryError::kAlreadyRunning:      return "discovery already running";
    case DiscoveryError::kNotRunning:          return "discovery not running";
  }
  return "unknown";
}

// ============================================================================
// AnnouncePacket
// ============================================================================

struct AnnouncePacket {
  enum class Kind : uint8_t { kAnnounce = 1, kGoodbye = 2 };

  static constexpr uint32_t kMagic = 0x4C584644;  // "LXFD"
  static constexpr uint8_t kVersion = 1;
  static constexpr size_t kMaxField = 63;
  static constexpr size_t kFixedSize = 4 + 1 + 1 + kIdSize + 2 + 1 + 1;
  static constexpr size_t kMaxSize = kFixedSize + 2 * kMaxField;

  Kind kind = Kind::kAnnounce;
  std::string service;
  PeerId node_id;
  std::string name;
  uint16_t port = 0;

  /** @brief Serialize; service and name are truncated to kMaxField bytes. */
  std::vector<uint8_t> Encode() const {
    std::vector<uint8_t> out;
    out.reserve(kMaxSize);
    auto put32 = [&out](uint32_t v) {
      for (int s = 24; s >= 0; s -= 8) out.push_back(static_cast<uint8_t>(v >> s));
    };
    auto put_str = [&out](const std::string& s) {
      size_t n = s.size() < kMaxField ? s.size() : kMaxField;
      out.push_back(static_cast<uint8_t>(n));
      out.insert(out.end(), s.begin(), s.begin() + static_cast<ptrdiff_t>(n));
    };
    put32(kMagic);
    out.push_back(kVersion);
    out.push_back(static_cast<uint8_t>(kind));
    out.insert(out.end(), node_id.bytes().begin(), node_id.bytes().end());
    out.push_back(static_cast<uint8_t>(port >> 8));
    out.push_back(static_cast<uint8_t>(port));
    put_str(service);
    put_str(name);
    return out;
  }

  /**
   * @brief Parse a datagram.
   * @return Empty optional for foreign or malformed datagrams.
   */
  static optional<AnnouncePacket> Decode(const uint8_t* data, size_t len) {
    if (data == nullptr || len < kFixedSize || len > kMaxSize) {
      return optional<AnnouncePacket>();
    }
    size_t pos = 0;
    uint32_t magic = 0;
    for (int i = 0; i < 4; ++i) magic = (magic << 8) | data[pos++];
    if (magic != kMagic) return optional<AnnouncePacket>();
    if (data[pos++] != kVersion) return optional<AnnouncePacket>();

    AnnouncePacket p;
    uint8_t kind = data[pos++];
    if (kind != static_cast<uint8_t>(Kind::kAnnounce) &&
        kind != static_cast<uint8_t>(Kind::kGoodbye)) {
      return optional<AnnouncePacket>();
    }
    p.kind = static_cast<Kind>(kind);

    PeerId::Bytes id_bytes;
    std::memcpy(id_bytes.data(), data + pos, kIdSize);
    pos += kIdSize;
    p.node_id = PeerId(id_bytes);

    p.port = static_cast<uint16_t>((data[pos] << 8) | data[pos + 1]);
    pos += 2;

    auto get_str = [&](std::string& out) {
      if (pos >= len) return false;
      size_t n = data[pos++];
      if (n > kMaxField || len - pos < n) return false;
      out.assign(reinterpret_cast<const char*>(data + pos), n);
      pos += n;
      return true;
    };
    if (!get_str(p.service) || !get_str(p.name) || pos != len) {
      return optional<AnnouncePacket>();
    }
    return optional<AnnouncePacket>(std::move(p));
  }
};

// ============================================================================
// ResolvedPeer
// ============================================================================

/** @brief A decoded announcement plus the sender's IP. */
struct ResolvedPeer {
  PeerId id;
  std::string service;
  std::string name;
  std::string host;
  uint16_t port = 0;
};

// ============================================================================
// MulticastDiscovery
// ============================================================================

struct DiscoveryConfig {
  std::string multicast_group = LANXFER_DISCOVERY_MULTICAST_GROUP;
  uint16_t port = LANXFER_DISCOVERY_PORT;
  uint32_t announce_interval_ms = LANXFER_DISCOVERY_INTERVAL_MS;
  uint32_t timeout_ms = LANXFER_DISCOVERY_TIMEOUT_MS;
  std::string service = LANXFER_DISCOVERY_SERVICE;
};

class MulticastDiscovery {
 public:
  using PeerCallback = void (*)(const Peer&, void*);

  explicit MulticastDiscovery(PeerRegistry& registry,
                              const DiscoveryConfig& cfg = DiscoveryConfig())
      : registry_(registry),
        config_(cfg),
        running_(false),
        local_port_(0),
        on_peer_join_(nullptr),
        on_peer_leave_(nullptr),
        join_ctx_(nullptr),
        leave_ctx_(nullptr) {}

  ~MulticastDiscovery() { Stop(); }

  MulticastDiscovery(const MulticastDiscovery&) = delete;
  MulticastDiscovery& operator=(const MulticastDiscovery&) = delete;
  MulticastDiscovery(MulticastDiscovery&&) = delete;
  MulticastDiscovery& operator=(MulticastDiscovery&&) = delete;

  /**
   * @brief Set the identity this node advertises.
   * @param id Stable node id; announcements carrying it are ignored.
   * @param name Display name (truncated to 63 bytes on the wire).
   * @param service_port TCP port of the transport listener.
   */
  void SetLocalNode(const PeerId& id, const std::string& name,
                    uint16_t service_port) {
    local_id_ = id;
    local_name_ = name;
    local_port_ = service_port;
  }

  /** @brief Callback after a previously unknown peer id was registered. */
  void SetOnPeerJoin(PeerCallback cb, void* ctx = nullptr) noexcept {
    on_peer_join_ = cb;
    join_ctx_ = ctx;
  }

  /** @brief Callback for each registry entry removed by goodbye or timeout. */
  void SetOnPeerLeave(PeerCallback cb, void* ctx = nullptr) noexcept {
    on_peer_leave_ = cb;
    leave_ctx_ = ctx;
  }

  /**
   * @brief Open the socket, join the group and spawn announce/receive threads.
   * @return Success or DiscoveryError.
   */
  expected<void, DiscoveryError> Start() {
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, DiscoveryError>::error(
          DiscoveryError::kAlreadyRunning);
    }

    auto group = SocketAddress::FromIpv4(config_.multicast_group.c_str(),
                                         config_.port);
    if (!group.has_value()) {
      return expected<void, DiscoveryError>::error(
          DiscoveryError::kMulticastJoinFailed);
    }
    group_addr_ = group.value();

    auto sock = UdpSocket::Create();
    if (!sock.has_value()) {
      return expected<void, DiscoveryError>::error(
          DiscoveryError::kSocketFailed);
    }
    socket_ = std::move(sock.value());

    if (!socket_.SetReuse(true).has_value() ||
        !socket_.Bind(SocketAddress::AnyIpv4(config_.port)).has_value()) {
      socket_.Close();
      return expected<void, DiscoveryError>::error(DiscoveryError::kBindFailed);
    }

    if (!socket_.JoinGroup(group_addr_).has_value()) {
      socket_.Close();
      return expected<void, DiscoveryError>::error(
          DiscoveryError::kMulticastJoinFailed);
    }
    // Loopback lets several nodes on one host find each other.
    static_cast<void>(socket_.SetMulticastLoop(true));

    running_.store(true, std::memory_order_release);
    announce_thread_ = std::thread([this]() { AnnounceLoop(); });
    receive_thread_ = std::thread([this]() { ReceiveLoop(); });

    LANXFER_LOG_INFO("Discovery", "browsing %s on %s:%u as '%s'",
                     config_.service.c_str(), config_.multicast_group.c_str(),
                     static_cast<unsigned>(config_.port), local_name_.c_str());
    return expected<void, DiscoveryError>::success();
  }

  /**
   * @brief Send a goodbye, join threads and close the socket. Idempotent.
   */
  void Stop() {
    if (!running_.load(std::memory_order_acquire)) return;

    SendPacket(AnnouncePacket::Kind::kGoodbye);

    {
      std::lock_guard<std::mutex> lock(wake_mutex_);
      running_.store(false, std::memory_order_release);
    }
    wake_cv_.notify_all();

    if (announce_thread_.joinable()) announce_thread_.join();
    if (receive_thread_.joinable()) receive_thread_.join();

    socket_.Close();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      last_seen_.clear();
    }
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  /** @brief Snapshot of the registry this discovery feeds. */
  std::vector<Peer> ListPeers() const { return registry_.List(); }

  /**
   * @brief Apply a resolved announcement to the registry.
   *
   * Ignored when the service differs or the id is this node's own id.
   * @return true if the registry was updated.
   */
  bool OnPeerResolved(const ResolvedPeer& resolved) {
    if (resolved.service != config_.service) return false;
    if (resolved.id == local_id_) return false;

    Peer peer;
    peer.id = resolved.id;
    peer.name = resolved.name;
    peer.address = resolved.host + ":" + std::to_string(resolved.port);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      last_seen_[peer.id] = Liveness{peer.name, SteadyNowUs()};
    }

    bool is_new = registry_.Upsert(peer);
    if (is_new) {
      LANXFER_LOG_INFO("Discovery", "peer joined: %s (%s) at %s",
                       peer.name.c_str(), peer.id.ToString().c_str(),
                       peer.address.c_str());
      if (on_peer_join_ != nullptr) on_peer_join_(peer, join_ctx_);
    }
    return true;
  }

  /**
   * @brief Delete every registry entry whose name equals name.
   * @return Number of entries removed.
   */
  size_t OnPeerRemoved(const std::string& name) {
    std::vector<Peer> leaving;
    if (on_peer_leave_ != nullptr) {
      for (const auto& p : registry_.List()) {
        if (p.name == name) leaving.push_back(p);
      }
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (auto it = last_seen_.begin(); it != last_seen_.end();) {
        if (it->second.name == name) {
          it = last_seen_.erase(it);
        } else {
          ++it;
        }
      }
    }

    size_t removed = registry_.RemoveByName(name);
    if (removed > 0) {
      LANXFER_LOG_INFO("Discovery", "peer left: %s (%zu entries)", name.c_str(),
                       removed);
      for (const auto& p : leaving) on_peer_leave_(p, leave_ctx_);
    }
    return removed;
  }

  /**
   * @brief Remove peers not heard from within timeout_ms.
   * @param now_us Current steady time in microseconds.
   * @return Number of registry entries removed.
   */
  size_t ExpireStale(uint64_t now_us) {
    const uint64_t timeout_us = static_cast<uint64_t>(config_.timeout_ms) * 1000U;
    std::vector<std::string> expired;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (const auto& kv : last_seen_) {
        if (now_us > kv.second.last_seen_us &&
            now_us - kv.second.last_seen_us > timeout_us) {
          expired.push_back(kv.second.name);
        }
      }
    }
    size_t removed = 0;
    for (const auto& name : expired) {
      LANXFER_LOG_DEBUG("Discovery", "liveness timeout for '%s'", name.c_str());
      removed += OnPeerRemoved(name);
    }
    return removed;
  }

  const DiscoveryConfig& GetConfig() const noexcept { return config_; }

 private:
  struct Liveness {
    std::string name;
    uint64_t last_seen_us;
  };

  void SendPacket(AnnouncePacket::Kind kind) {
    AnnouncePacket pkt;
    pkt.kind = kind;
    pkt.service = config_.service;
    pkt.node_id = local_id_;
    pkt.name = local_name_;
    pkt.port = local_port_;
    std::vector<uint8_t> bytes = pkt.Encode();
    auto r = socket_.SendTo(bytes.data(), bytes.size(), group_addr_);
    if (!r.has_value()) {
      LANXFER_LOG_WARN("Discovery", "announce send failed: %s",
                       ToString(r.get_error()));
    }
  }

  void AnnounceLoop() {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    while (running_.load(std::memory_order_acquire)) {
      lock.unlock();
      SendPacket(AnnouncePacket::Kind::kAnnounce);
      lock.lock();
      wake_cv_.wait_for(
          lock, std::chrono::milliseconds(config_.announce_interval_ms),
          [this]() { return !running_.load(std::memory_order_acquire); });
    }
  }

  void ReceiveLoop() {
    uint8_t buf[AnnouncePacket::kMaxSize + 1];
    while (running_.load(std::memory_order_acquire)) {
      if (PollReadable(socket_.Fd(), kPollIntervalMs)) {
        SocketAddress sender;
        auto n = socket_.RecvFrom(buf, sizeof(buf), sender);
        if (n.has_value() && n.value() > 0) {
          ProcessDatagram(buf, static_cast<size_t>(n.value()), sender);
        }
      }
      ExpireStale(SteadyNowUs());
    }
  }

  void ProcessDatagram(const uint8_t* data, size_t len,
                       const SocketAddress& sender) {
    auto pkt = AnnouncePacket::Decode(data, len);
    if (!pkt.has_value()) return;
    const AnnouncePacket& p = pkt.value();
    if (p.service != config_.service || p.node_id == local_id_) return;

    if (p.kind == AnnouncePacket::Kind::kGoodbye) {
      OnPeerRemoved(p.name);
      return;
    }

    ResolvedPeer resolved;
    resolved.id = p.node_id;
    resolved.service = p.service;
    resolved.name = p.name;
    resolved.host = sender.Host();
    resolved.port = p.port;
    OnPeerResolved(resolved);
  }

  static constexpr int32_t kPollIntervalMs = 100;

  PeerRegistry& registry_;
  DiscoveryConfig config_;
  UdpSocket socket_;
  SocketAddress group_addr_;
  std::atomic<bool> running_;
  std::thread announce_thread_;
  std::thread receive_thread_;
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;

  PeerId local_id_;
  std::string local_name_;
  uint16_t local_port_;

  PeerCallback on_peer_join_;
  PeerCallback on_peer_leave_;
  void* join_ctx_;
  void* leave_ctx_;

  std::mutex mutex_;
  std::map<PeerId, Liveness> last_seen_;
};

}  // namespace lanxfer

#endif  // LANXFER_HAS_NETWORK

#endif  // LANXFER_DISCOVERY_HPP_
