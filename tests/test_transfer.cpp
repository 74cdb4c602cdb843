/**
 * @file test_transfer.cpp
 * @brief Tests for transfer.hpp: chunked reads, positional writes and the
 *        transfer lifecycle.
 */

#include "lanxfer/transfer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

/// Scratch directory removed on scope exit.
class TempDir {
 public:
  TempDir() {
    char tmpl[] = "/tmp/lanxfer_transfer_XXXXXX";
    const char* p = ::mkdtemp(tmpl);
    path_ = (p != nullptr) ? p : "/tmp/lanxfer_transfer_fallback";
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  const std::string& Path() const { return path_; }
  std::string Join(const std::string& name) const { return path_ + "/" + name; }

 private:
  std::string path_;
};

std::vector<uint8_t> Pattern(size_t n) {
  std::vector<uint8_t> v(n);
  for (size_t i = 0; i < n; ++i) v[i] = static_cast<uint8_t>((i * 31U + 7U) & 0xFFU);
  return v;
}

void WriteFile(const std::string& path, const std::vector<uint8_t>& data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char*>(data.data()),
            static_cast<std::streamsize>(data.size()));
}

std::vector<uint8_t> ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                              std::istreambuf_iterator<char>());
}

}  // namespace

// ============================================================================
// Sending side
// ============================================================================

TEST_CASE("transfer - PrepareSend reports base name and size",
          "[transfer][send]") {
  TempDir dir;
  const std::string src = dir.Join("report.pdf");
  WriteFile(src, Pattern(1234));

  lanxfer::TransferEngine engine(dir.Join("downloads"));
  auto offer = engine.PrepareSend(src);
  REQUIRE(offer.has_value());
  REQUIRE(offer.value().name == "report.pdf");
  REQUIRE(offer.value().size == 1234);
  REQUIRE(!offer.value().id.IsNil());
  REQUIRE(engine.ActiveOutbound() == 1);
  REQUIRE(engine.State(offer.value().id).value() ==
          lanxfer::TransferState::kOffered);
}

TEST_CASE("transfer - PrepareSend ids are distinct", "[transfer][send]") {
  TempDir dir;
  const std::string src = dir.Join("a.txt");
  WriteFile(src, Pattern(10));

  lanxfer::TransferEngine engine(dir.Join("downloads"));
  auto a = engine.PrepareSend(src);
  auto b = engine.PrepareSend(src);
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(a.value().id != b.value().id);
  REQUIRE(engine.ActiveOutbound() == 2);
}

TEST_CASE("transfer - PrepareSend errors", "[transfer][send][error]") {
  TempDir dir;
  lanxfer::TransferEngine engine(dir.Join("downloads"));

  auto missing = engine.PrepareSend(dir.Join("does_not_exist"));
  REQUIRE(!missing.has_value());
  REQUIRE(missing.get_error() == lanxfer::TransferError::kFileNotFound);

  auto directory = engine.PrepareSend(dir.Path());
  REQUIRE(!directory.has_value());
  REQUIRE(directory.get_error() == lanxfer::TransferError::kNotRegularFile);

  REQUIRE(engine.ActiveOutbound() == 0);
}

TEST_CASE("transfer - ReadChunk walks a 150000-byte file", "[transfer][send]") {
  TempDir dir;
  const std::string src = dir.Join("big.bin");
  const auto content = Pattern(150000);
  WriteFile(src, content);

  lanxfer::TransferEngine engine(dir.Join("downloads"));
  auto offer = engine.PrepareSend(src);
  REQUIRE(offer.has_value());
  const auto id = offer.value().id;

  auto first = engine.ReadChunk(id, 0);
  REQUIRE(first.has_value());
  REQUIRE(first.value().has_value());
  REQUIRE(first.value().value().size() == 65536);
  REQUIRE(engine.State(id).value() == lanxfer::TransferState::kTransferring);

  auto last = engine.ReadChunk(id, 147456);
  REQUIRE(last.has_value());
  REQUIRE(last.value().has_value());
  REQUIRE(last.value().value().size() == 2544);
  REQUIRE(std::equal(last.value().value().begin(), last.value().value().end(),
                     content.begin() + 147456));

  auto eof = engine.ReadChunk(id, 150000);
  REQUIRE(eof.has_value());
  REQUIRE(!eof.value().has_value());

  // Chunk sequence reassembles the source exactly.
  std::vector<uint8_t> joined;
  uint64_t offset = 0;
  for (;;) {
    auto c = engine.ReadChunk(id, offset);
    REQUIRE(c.has_value());
    if (!c.value().has_value()) break;
    REQUIRE(c.value().value().size() <= lanxfer::kChunkSize);
    joined.insert(joined.end(), c.value().value().begin(),
                  c.value().value().end());
    offset += c.value().value().size();
  }
  REQUIRE(joined == content);
}

TEST_CASE("transfer - ReadChunk on unknown id", "[transfer][send][error]") {
  lanxfer::TransferEngine engine("/tmp/lanxfer_unused");
  auto r = engine.ReadChunk(lanxfer::TransferId::Generate(), 0);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == lanxfer::TransferError::kTransferNotFound);
}

TEST_CASE("transfer - ReadChunk after source removal is an I/O error",
          "[transfer][send][error]") {
  TempDir dir;
  const std::string src = dir.Join("gone.bin");
  WriteFile(src, Pattern(100));

  lanxfer::TransferEngine engine(dir.Join("downloads"));
  auto offer = engine.PrepareSend(src);
  REQUIRE(offer.has_value());
  fs::remove(src);

  auto r = engine.ReadChunk(offer.value().id, 0);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == lanxfer::TransferError::kIoError);
}

// ============================================================================
// Receiving side
// ============================================================================

TEST_CASE("transfer - 100-byte file in 40/40/20 chunks", "[transfer][receive]") {
  TempDir dir;
  lanxfer::TransferEngine engine(dir.Join("downloads"));
  const auto id = lanxfer::TransferId::Generate();
  const auto content = Pattern(100);

  auto path = engine.PrepareReceive(id, "notes.txt", 100);
  REQUIRE(path.has_value());
  REQUIRE(path.value() == dir.Join("downloads") + "/notes.txt");
  REQUIRE(fs::exists(path.value()));

  auto r1 = engine.ApplyChunk(id, 0, content.data(), 40);
  REQUIRE(r1.has_value());
  REQUIRE(!r1.value());
  auto r2 = engine.ApplyChunk(id, 40, content.data() + 40, 40);
  REQUIRE(r2.has_value());
  REQUIRE(!r2.value());
  REQUIRE(engine.Progress(id).value().received == 80);
  auto r3 = engine.ApplyChunk(id, 80, content.data() + 80, 20);
  REQUIRE(r3.has_value());
  REQUIRE(r3.value());
  REQUIRE(engine.State(id).value() == lanxfer::TransferState::kCompleted);

  engine.Finalize(id);
  REQUIRE(engine.ActiveInbound() == 0);
  REQUIRE(ReadFile(path.value()) == content);
}

TEST_CASE("transfer - chunks applied out of order land at their offsets",
          "[transfer][receive]") {
  TempDir dir;
  lanxfer::TransferEngine engine(dir.Join("downloads"));
  const auto id = lanxfer::TransferId::Generate();
  const auto content = Pattern(300);

  auto path = engine.PrepareReceive(id, "shuffled.bin", 300);
  REQUIRE(path.has_value());

  REQUIRE(!engine.ApplyChunk(id, 200, content.data() + 200, 100).value());
  REQUIRE(!engine.ApplyChunk(id, 0, content.data(), 100).value());
  REQUIRE(engine.ApplyChunk(id, 100, content.data() + 100, 100).value());

  engine.Finalize(id);
  REQUIRE(ReadFile(path.value()) == content);
}

TEST_CASE("transfer - PrepareReceive strips directories from the name",
          "[transfer][receive]") {
  TempDir dir;
  lanxfer::TransferEngine engine(dir.Join("downloads"));

  auto p = engine.PrepareReceive(lanxfer::TransferId::Generate(),
                                 "../../etc/passwd", 4);
  REQUIRE(p.has_value());
  REQUIRE(p.value() == dir.Join("downloads") + "/passwd");

  auto bad = engine.PrepareReceive(lanxfer::TransferId::Generate(), "dir/", 4);
  REQUIRE(!bad.has_value());
  REQUIRE(bad.get_error() == lanxfer::TransferError::kInvalidName);

  auto dots = engine.PrepareReceive(lanxfer::TransferId::Generate(), "..", 4);
  REQUIRE(!dots.has_value());
  REQUIRE(dots.get_error() == lanxfer::TransferError::kInvalidName);
}

TEST_CASE("transfer - duplicate offer id is rejected", "[transfer][receive]") {
  TempDir dir;
  lanxfer::TransferEngine engine(dir.Join("downloads"));
  const auto id = lanxfer::TransferId::Generate();
  REQUIRE(engine.PrepareReceive(id, "one.txt", 10).has_value());
  auto again = engine.PrepareReceive(id, "two.txt", 10);
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error() == lanxfer::TransferError::kDuplicateTransfer);
}

TEST_CASE("transfer - ApplyChunk errors", "[transfer][receive][error]") {
  TempDir dir;
  lanxfer::TransferEngine engine(dir.Join("downloads"));
  const auto data = Pattern(64);

  auto unknown = engine.ApplyChunk(lanxfer::TransferId::Generate(), 0, data);
  REQUIRE(!unknown.has_value());
  REQUIRE(unknown.get_error() == lanxfer::TransferError::kTransferNotFound);

  const auto id = lanxfer::TransferId::Generate();
  REQUIRE(engine.PrepareReceive(id, "small.bin", 50).has_value());

  auto past_end = engine.ApplyChunk(id, 0, data);  // 64 > 50
  REQUIRE(!past_end.has_value());
  REQUIRE(past_end.get_error() == lanxfer::TransferError::kOutOfRange);

  auto far_offset = engine.ApplyChunk(id, 1000, data.data(), 1);
  REQUIRE(!far_offset.has_value());
  REQUIRE(far_offset.get_error() == lanxfer::TransferError::kOutOfRange);

  // Rejected chunks leave progress untouched.
  REQUIRE(engine.Progress(id).value().received == 0);
}

TEST_CASE("transfer - resent and overlapping chunks are refused",
          "[transfer][receive][error]") {
  TempDir dir;
  lanxfer::TransferEngine engine(dir.Join("downloads"));
  const auto id = lanxfer::TransferId::Generate();
  const auto content = Pattern(100);
  auto path = engine.PrepareReceive(id, "x.bin", 100);
  REQUIRE(path.has_value());

  REQUIRE(!engine.ApplyChunk(id, 0, content.data(), 40).value());

  auto resent = engine.ApplyChunk(id, 0, content.data(), 40);
  REQUIRE(!resent.has_value());
  REQUIRE(resent.get_error() == lanxfer::TransferError::kOutOfRange);

  auto straddle = engine.ApplyChunk(id, 30, content.data() + 30, 20);
  REQUIRE(!straddle.has_value());
  REQUIRE(straddle.get_error() == lanxfer::TransferError::kOutOfRange);

  // 60 distinct bytes written: not complete, whatever was resent.
  auto tail = engine.ApplyChunk(id, 40, content.data() + 40, 20);
  REQUIRE(tail.has_value());
  REQUIRE(!tail.value());
  REQUIRE(engine.Progress(id).value().received == 60);
  REQUIRE(!engine.IsComplete(id).value());
  REQUIRE(engine.State(id).value() == lanxfer::TransferState::kTransferring);

  REQUIRE(engine.ApplyChunk(id, 60, content.data() + 60, 40).value());
  engine.Finalize(id);
  REQUIRE(ReadFile(path.value()) == content);
}

TEST_CASE("transfer - chunk after completion is refused",
          "[transfer][receive][error]") {
  TempDir dir;
  lanxfer::TransferEngine engine(dir.Join("downloads"));
  const auto id = lanxfer::TransferId::Generate();
  const auto content = Pattern(10);
  REQUIRE(engine.PrepareReceive(id, "done.bin", 10).has_value());
  REQUIRE(engine.ApplyChunk(id, 0, content).value());

  auto again = engine.ApplyChunk(id, 5, content.data(), 5);
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error() == lanxfer::TransferError::kOutOfRange);
  REQUIRE(engine.State(id).value() == lanxfer::TransferState::kCompleted);
}

TEST_CASE("transfer - chunks applied from several threads",
          "[transfer][receive][concurrency]") {
  TempDir dir;
  lanxfer::TransferEngine engine(dir.Join("downloads"));
  const auto id = lanxfer::TransferId::Generate();
  constexpr size_t kThreads = 8;
  constexpr size_t kPiece = 4096;
  const auto content = Pattern(kThreads * kPiece);
  auto path = engine.PrepareReceive(id, "parallel.bin", content.size());
  REQUIRE(path.has_value());

  std::atomic<int> completions{0};
  std::atomic<int> failures{0};
  std::vector<std::thread> workers;
  for (size_t t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t]() {
      auto r = engine.ApplyChunk(id, t * kPiece, content.data() + t * kPiece,
                                 kPiece);
      if (!r.has_value()) {
        failures.fetch_add(1);
      } else if (r.value()) {
        completions.fetch_add(1);
      }
      static_cast<void>(engine.State(id));
    });
  }
  for (auto& w : workers) w.join();

  REQUIRE(failures.load() == 0);
  REQUIRE(completions.load() == 1);
  REQUIRE(engine.State(id).value() == lanxfer::TransferState::kCompleted);
  engine.Finalize(id);
  REQUIRE(ReadFile(path.value()) == content);
}

TEST_CASE("transfer - RangeSet merges adjacent ranges", "[transfer][range]") {
  lanxfer::detail::RangeSet set;
  set.Insert(40, 60);
  set.Insert(0, 40);
  set.Insert(60, 100);
  REQUIRE(set.Count() == 1);
  REQUIRE(set.Overlaps(99, 100));
  REQUIRE(!set.Overlaps(100, 120));
  REQUIRE(!set.Overlaps(50, 50));

  lanxfer::detail::RangeSet gaps;
  gaps.Insert(10, 20);
  gaps.Insert(30, 40);
  REQUIRE(gaps.Count() == 2);
  REQUIRE(!gaps.Overlaps(20, 30));
  REQUIRE(gaps.Overlaps(15, 16));
  REQUIRE(gaps.Overlaps(0, 11));
  REQUIRE(gaps.Overlaps(19, 31));
}

TEST_CASE("transfer - same name in two active transfers gets a suffix",
          "[transfer][receive]") {
  TempDir dir;
  lanxfer::TransferEngine engine(dir.Join("downloads"));
  const auto a = lanxfer::TransferId::Generate();
  const auto b = lanxfer::TransferId::Generate();
  const auto c = lanxfer::TransferId::Generate();

  auto pa = engine.PrepareReceive(a, "report.pdf", 4);
  auto pb = engine.PrepareReceive(b, "report.pdf", 4);
  auto pc = engine.PrepareReceive(c, "report.pdf", 4);
  REQUIRE(pa.value() == dir.Join("downloads") + "/report.pdf");
  REQUIRE(pb.value() == dir.Join("downloads") + "/report (1).pdf");
  REQUIRE(pc.value() == dir.Join("downloads") + "/report (2).pdf");

  const std::vector<uint8_t> one = {1, 1, 1, 1};
  const std::vector<uint8_t> two = {2, 2, 2, 2};
  REQUIRE(engine.ApplyChunk(a, 0, one).value());
  REQUIRE(engine.ApplyChunk(b, 0, two).value());
  engine.Finalize(a);
  engine.Finalize(b);
  REQUIRE(ReadFile(pa.value()) == one);
  REQUIRE(ReadFile(pb.value()) == two);

  // Once a is finalized its name is free again.
  auto pd = engine.PrepareReceive(lanxfer::TransferId::Generate(),
                                  "report.pdf", 4);
  REQUIRE(pd.value() == dir.Join("downloads") + "/report.pdf");
}

TEST_CASE("transfer - NumberedName keeps the extension", "[transfer]") {
  REQUIRE(lanxfer::detail::NumberedName("a.tar.gz", 1) == "a.tar (1).gz");
  REQUIRE(lanxfer::detail::NumberedName("README", 3) == "README (3)");
  REQUIRE(lanxfer::detail::NumberedName(".bashrc", 2) == ".bashrc (2)");
}

TEST_CASE("transfer - refused offer is remembered as failed",
          "[transfer][receive][error]") {
  TempDir dir;
  lanxfer::TransferEngine engine(dir.Join("downloads"));
  const auto id = lanxfer::TransferId::Generate();

  auto r = engine.PrepareReceive(id, "..", 64);
  REQUIRE(!r.has_value());
  REQUIRE(engine.ActiveInbound() == 0);
  REQUIRE(engine.State(id).value() == lanxfer::TransferState::kFailed);
}

TEST_CASE("transfer - zero-length file is complete on arrival",
          "[transfer][receive]") {
  TempDir dir;
  lanxfer::TransferEngine engine(dir.Join("downloads"));
  const auto id = lanxfer::TransferId::Generate();

  auto p = engine.PrepareReceive(id, "empty.txt", 0);
  REQUIRE(p.has_value());
  REQUIRE(engine.IsComplete(id).value());
  engine.Finalize(id);
  REQUIRE(engine.State(id).value() == lanxfer::TransferState::kCompleted);
  REQUIRE(fs::file_size(p.value()) == 0);
}

TEST_CASE("transfer - PrepareReceive truncates an existing file",
          "[transfer][receive]") {
  TempDir dir;
  fs::create_directories(dir.Join("downloads"));
  WriteFile(dir.Join("downloads") + "/old.txt", Pattern(500));

  lanxfer::TransferEngine engine(dir.Join("downloads"));
  const auto id = lanxfer::TransferId::Generate();
  auto p = engine.PrepareReceive(id, "old.txt", 10);
  REQUIRE(p.has_value());
  REQUIRE(fs::file_size(p.value()) == 0);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE("transfer - Finalize is idempotent", "[transfer][lifecycle]") {
  TempDir dir;
  lanxfer::TransferEngine engine(dir.Join("downloads"));
  const auto id = lanxfer::TransferId::Generate();
  REQUIRE(engine.PrepareReceive(id, "x.bin", 10).has_value());

  engine.Finalize(id);
  engine.Finalize(id);
  engine.Finalize(lanxfer::TransferId::Generate());  // never tracked
  REQUIRE(engine.ActiveInbound() == 0);

  // Incomplete at finalize: remembered as failed, further chunks rejected.
  REQUIRE(engine.State(id).value() == lanxfer::TransferState::kFailed);
  const auto data = Pattern(10);
  auto late = engine.ApplyChunk(id, 0, data);
  REQUIRE(!late.has_value());
  REQUIRE(late.get_error() == lanxfer::TransferError::kTransferNotFound);
}

TEST_CASE("transfer - outbound state transitions", "[transfer][lifecycle]") {
  TempDir dir;
  const std::string src = dir.Join("s.bin");
  WriteFile(src, Pattern(10));
  lanxfer::TransferEngine engine(dir.Join("downloads"));

  auto accepted = engine.PrepareSend(src);
  REQUIRE(engine.MarkAccepted(accepted.value().id).has_value());
  REQUIRE(engine.State(accepted.value().id).value() ==
          lanxfer::TransferState::kAccepted);
  engine.Finalize(accepted.value().id);
  REQUIRE(engine.State(accepted.value().id).value() ==
          lanxfer::TransferState::kCompleted);

  auto rejected = engine.PrepareSend(src);
  REQUIRE(engine.MarkRejected(rejected.value().id).has_value());
  engine.Finalize(rejected.value().id);
  REQUIRE(engine.State(rejected.value().id).value() ==
          lanxfer::TransferState::kRejected);

  auto failed = engine.PrepareSend(src);
  REQUIRE(engine.MarkFailed(failed.value().id).has_value());
  engine.Finalize(failed.value().id);
  REQUIRE(engine.State(failed.value().id).value() ==
          lanxfer::TransferState::kFailed);

  REQUIRE(engine.ActiveOutbound() == 0);

  const auto unknown = lanxfer::TransferId::Generate();
  REQUIRE(engine.MarkAccepted(unknown).get_error() ==
          lanxfer::TransferError::kTransferNotFound);
  REQUIRE(engine.MarkRejected(unknown).get_error() ==
          lanxfer::TransferError::kTransferNotFound);
  REQUIRE(engine.MarkFailed(unknown).get_error() ==
          lanxfer::TransferError::kTransferNotFound);
  REQUIRE(!engine.State(unknown).has_value());
}

TEST_CASE("transfer - history keeps only recent transfers",
          "[transfer][lifecycle]") {
  TempDir dir;
  lanxfer::TransferEngine engine(dir.Join("downloads"));
  std::vector<lanxfer::TransferId> ids;
  for (uint32_t i = 0; i < LANXFER_TRANSFER_HISTORY + 5; ++i) {
    const auto id = lanxfer::TransferId::Generate();
    REQUIRE(engine.PrepareReceive(id, "h" + std::to_string(i), 0).has_value());
    engine.Finalize(id);
    ids.push_back(id);
  }
  REQUIRE(!engine.State(ids.front()).has_value());
  REQUIRE(engine.State(ids.back()).value() == lanxfer::TransferState::kCompleted);
}

TEST_CASE("transfer - ToString names", "[transfer]") {
  REQUIRE(std::string(lanxfer::ToString(lanxfer::TransferState::kTransferring))
              .size() > 0);
  REQUIRE(std::string(lanxfer::ToString(lanxfer::TransferError::kOutOfRange))
              .size() > 0);
  REQUIRE(lanxfer::IsTerminal(lanxfer::TransferState::kRejected));
  REQUIRE(!lanxfer::IsTerminal(lanxfer::TransferState::kAccepted));
}
