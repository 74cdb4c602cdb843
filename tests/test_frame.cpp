/**
 * @file test_frame.cpp
 * @brief Tests for frame.hpp: length prefix and whole-frame parsing.
 */

#include "lanxfer/frame.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <vector>

TEST_CASE("frame - length prefix is big-endian", "[frame]") {
  uint8_t buf[lanxfer::FrameCodec::kLengthSize];
  lanxfer::FrameCodec::EncodeLength(0x01020304U, buf);
  REQUIRE(buf[0] == 0x01);
  REQUIRE(buf[1] == 0x02);
  REQUIRE(buf[2] == 0x03);
  REQUIRE(buf[3] == 0x04);
  REQUIRE(lanxfer::FrameCodec::DecodeLength(buf) == 0x01020304U);
}

TEST_CASE("frame - BuildFrame prefixes the payload length", "[frame]") {
  lanxfer::Message msg = lanxfer::TextMessage{"ping"};
  auto payload = lanxfer::MessageCodec::Encode(msg);
  REQUIRE(payload.has_value());

  auto frame = lanxfer::FrameCodec::BuildFrame(msg);
  REQUIRE(frame.has_value());
  const auto& f = frame.value();
  REQUIRE(f.size() == lanxfer::FrameCodec::kLengthSize + payload.value().size());
  REQUIRE(lanxfer::FrameCodec::DecodeLength(f.data()) ==
          payload.value().size());

  auto parsed = lanxfer::FrameCodec::ParseFrame(f.data(), f.size());
  REQUIRE(parsed.has_value());
  REQUIRE(parsed.value() == msg);
}

TEST_CASE("frame - CheckLength enforces the maximum", "[frame]") {
  REQUIRE(lanxfer::FrameCodec::CheckLength(0).has_value());
  REQUIRE(lanxfer::FrameCodec::CheckLength(lanxfer::FrameCodec::kMaxFrameSize)
              .has_value());
  auto r = lanxfer::FrameCodec::CheckLength(lanxfer::FrameCodec::kMaxFrameSize + 1);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == lanxfer::CodecError::kFrameTooLarge);
}

TEST_CASE("frame - ParseFrame rejects oversized prefix before reading body",
          "[frame][error]") {
  const uint8_t huge[] = {0xFF, 0xFF, 0xFF, 0xFF, 0x00};
  auto r = lanxfer::FrameCodec::ParseFrame(huge, sizeof(huge));
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == lanxfer::CodecError::kFrameTooLarge);
}

TEST_CASE("frame - ParseFrame short and long input", "[frame][error]") {
  auto frame = lanxfer::FrameCodec::BuildFrame(lanxfer::TextMessage{"abc"});
  REQUIRE(frame.has_value());
  std::vector<uint8_t> f = frame.value();

  auto prefix_only = lanxfer::FrameCodec::ParseFrame(f.data(), 2);
  REQUIRE(prefix_only.get_error() == lanxfer::CodecError::kTruncated);

  auto short_body = lanxfer::FrameCodec::ParseFrame(f.data(), f.size() - 1);
  REQUIRE(!short_body.has_value());
  REQUIRE(short_body.get_error() == lanxfer::CodecError::kTruncated);

  f.push_back(0x00);
  auto long_body = lanxfer::FrameCodec::ParseFrame(f.data(), f.size());
  REQUIRE(!long_body.has_value());
  REQUIRE(long_body.get_error() == lanxfer::CodecError::kTrailingBytes);
}

TEST_CASE("frame - full-size chunk fits in one frame", "[frame]") {
  lanxfer::FileChunk chunk;
  chunk.id = lanxfer::TransferId::Generate();
  chunk.offset = 0;
  chunk.data.assign(64 * 1024, 0x5A);
  auto frame = lanxfer::FrameCodec::BuildFrame(lanxfer::Message(chunk));
  REQUIRE(frame.has_value());
  auto parsed =
      lanxfer::FrameCodec::ParseFrame(frame.value().data(), frame.value().size());
  REQUIRE(parsed.has_value());
  REQUIRE(std::get<lanxfer::FileChunk>(parsed.value()) == chunk);
}
