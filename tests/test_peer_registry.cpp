/**
 * @file test_peer_registry.cpp
 * @brief Tests for peer_registry.hpp
 */

#include "lanxfer/peer_registry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace {

lanxfer::Peer MakePeer(const char* name, const char* address) {
  lanxfer::Peer p;
  p.id = lanxfer::PeerId::Generate();
  p.name = name;
  p.address = address;
  return p;
}

}  // namespace

TEST_CASE("peer_registry - Upsert inserts then replaces", "[peer_registry]") {
  lanxfer::PeerRegistry reg;
  auto alice = MakePeer("alice", "192.168.1.10:9876");

  REQUIRE(reg.Upsert(alice));
  REQUIRE(reg.Size() == 1);

  alice.address = "192.168.1.11:9876";
  REQUIRE(!reg.Upsert(alice));
  REQUIRE(reg.Size() == 1);

  auto found = reg.Find(alice.id);
  REQUIRE(found.has_value());
  REQUIRE(found.value().address == "192.168.1.11:9876");
}

TEST_CASE("peer_registry - Find unknown id is empty", "[peer_registry]") {
  lanxfer::PeerRegistry reg;
  REQUIRE(!reg.Find(lanxfer::PeerId::Generate()).has_value());
  REQUIRE(!reg.FindByName("nobody").has_value());
}

TEST_CASE("peer_registry - Remove by id", "[peer_registry]") {
  lanxfer::PeerRegistry reg;
  auto a = MakePeer("a", "10.0.0.1:1");
  auto b = MakePeer("b", "10.0.0.2:2");
  reg.Upsert(a);
  reg.Upsert(b);

  REQUIRE(reg.Remove(a.id));
  REQUIRE(!reg.Remove(a.id));
  REQUIRE(reg.Size() == 1);
  REQUIRE(reg.Find(b.id).has_value());
}

TEST_CASE("peer_registry - RemoveByName drops every entry with that name",
          "[peer_registry]") {
  lanxfer::PeerRegistry reg;
  reg.Upsert(MakePeer("bob", "10.0.0.1:9876"));
  reg.Upsert(MakePeer("bob", "10.0.0.2:9876"));
  auto carol = MakePeer("carol", "10.0.0.3:9876");
  reg.Upsert(carol);

  REQUIRE(reg.RemoveByName("bob") == 2);
  REQUIRE(reg.RemoveByName("bob") == 0);
  REQUIRE(reg.Size() == 1);
  REQUIRE(reg.FindByName("carol").value() == carol);
}

TEST_CASE("peer_registry - List is an ordered snapshot", "[peer_registry]") {
  lanxfer::PeerRegistry reg;
  for (int i = 0; i < 5; ++i) {
    reg.Upsert(MakePeer("p", "10.0.0.1:9876"));
  }
  auto snapshot = reg.List();
  REQUIRE(snapshot.size() == 5);
  for (size_t i = 1; i < snapshot.size(); ++i) {
    REQUIRE(snapshot[i - 1].id < snapshot[i].id);
  }

  reg.Clear();
  REQUIRE(reg.Size() == 0);
  REQUIRE(snapshot.size() == 5);  // copy unaffected
}

TEST_CASE("peer_registry - concurrent writers and readers", "[peer_registry]") {
  lanxfer::PeerRegistry reg;
  constexpr int kWriters = 4;
  constexpr int kPerWriter = 200;
  std::atomic<bool> stop{false};
  std::atomic<int> bad_entries{0};

  std::thread reader([&]() {
    while (!stop.load()) {
      for (const auto& p : reg.List()) {
        if (p.id.IsNil() || p.name != "w") bad_entries.fetch_add(1);
      }
    }
  });

  std::vector<std::thread> writers;
  for (int w = 0; w < kWriters; ++w) {
    writers.emplace_back([&reg]() {
      for (int i = 0; i < kPerWriter; ++i) {
        reg.Upsert(MakePeer("w", "127.0.0.1:9876"));
      }
    });
  }
  for (auto& t : writers) t.join();
  stop.store(true);
  reader.join();

  REQUIRE(bad_entries.load() == 0);
  REQUIRE(reg.Size() == static_cast<size_t>(kWriters * kPerWriter));
}
