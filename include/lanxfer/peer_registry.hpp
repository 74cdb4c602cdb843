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
 * @file peer_registry.hpp
 * @brief Concurrent table of known peers, keyed by PeerId.
 *
 * Written by discovery, read by the sender at send time. Readers share the
 * lock; every operation is a single critical section.
 *
 * Header-only, C++17.
 */

#ifndef LANXFER_PEER_REGISTRY_HPP_
#define LANXFER_PEER_REGISTRY_HPP_

#include "lanxfer/id.hpp"
#include "lanxfer/vocabulary.hpp"

#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace lanxfer {

// ============================================================================
// Peer
// ============================================================================

struct Peer {
  PeerId id;
  std::string name;
  std::string address;  ///< "host:port"

  bool operator==(const Peer& o) const {
    return id == o.id && name == o.name && address == o.address;
  }
  bool operator!=(const Peer& o) const { return !(*this == o); }
};

// ============================================================================
// PeerRegistry
// ============================================================================

class PeerRegistry {
 public:
  PeerRegistry() = default;

  PeerRegistry(const PeerRegistry&) = delete;
  PeerRegistry& operator=(const PeerRegistry&) = delete;

  /**
   * @brief Insert or replace the entry for peer.id.
   * @return true if the id was not known before.
   */
  bool Upsert(const Peer& peer) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = peers_.find(peer.id);
    if (it == peers_.end()) {
      peers_.emplace(peer.id, peer);
      return true;
    }
    it->second = peer;
    return false;
  }

  /** @return true if an entry was removed. */
  bool Remove(const PeerId& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return peers_.erase(id) > 0;
  }

  /**
   * @brief Delete every entry whose display name equals name.
   * @return Number of entries removed.
   */
  size_t RemoveByName(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = peers_.begin(); it != peers_.end();) {
      if (it->second.name == name) {
        it = peers_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    return removed;
  }

  optional<Peer> Find(const PeerId& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = peers_.find(id);
    if (it == peers_.end()) return optional<Peer>();
    return optional<Peer>(it->second);
  }

  /** @brief First entry with the given display name. */
  optional<Peer> FindByName(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& kv : peers_) {
      if (kv.second.name == name) return optional<Peer>(kv.second);
    }
    return optional<Peer>();
  }

  /** @brief Consistent snapshot (copy) of all entries, ordered by id. */
  std::vector<Peer> List() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Peer> out;
    out.reserve(peers_.size());
    for (const auto& kv : peers_) out.push_back(kv.second);
    return out;
  }

  size_t Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return peers_.size();
  }

  void Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    peers_.clear();
  }

 private:
  mutable std::shared_mutex mutex_;
  std::map<PeerId, Peer> peers_;
};

}  // namespace lanxfer

#endif  // LANXFER_PEER_REGISTRY_HPP_
