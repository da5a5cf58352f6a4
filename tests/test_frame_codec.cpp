/**
 * @file test_frame_codec.cpp
 * @brief Tests for frame_codec.hpp: EncodeFrame and FrameDecoder.
 */

#include "hidrem/frame_codec.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

namespace {

hidrem::Bytes Frame(const std::string& text) {
  return hidrem::EncodeFrame(text.data(), static_cast<uint32_t>(text.size()));
}

std::string AsText(const hidrem::Bytes& b) {
  return std::string(b.begin(), b.end());
}

}  // namespace

// ============================================================================
// Encoding
// ============================================================================

TEST_CASE("EncodeFrame writes a big-endian length prefix", "[frame]") {
  auto out = Frame("abc");
  REQUIRE(out.size() == 7U);
  REQUIRE(out[0] == 0x00);
  REQUIRE(out[1] == 0x00);
  REQUIRE(out[2] == 0x00);
  REQUIRE(out[3] == 0x03);
  REQUIRE(AsText(hidrem::Bytes(out.begin() + 4, out.end())) == "abc");
}

TEST_CASE("EncodeFrame of an empty payload is the bare prefix", "[frame]") {
  auto out = hidrem::EncodeFrame(nullptr, 0U);
  REQUIRE(out == hidrem::Bytes({0x00, 0x00, 0x00, 0x00}));
}

TEST_CASE("EncodeFrame appends to an existing buffer", "[frame]") {
  hidrem::Bytes out;
  hidrem::EncodeFrame("a", 1U, out);
  hidrem::EncodeFrame("bc", 2U, out);
  REQUIRE(out.size() == 5U + 6U);
  REQUIRE(hidrem::ReadBe32(out.data() + 5) == 2U);
}

TEST_CASE("WriteBe32 and ReadBe32 agree on byte order", "[frame]") {
  uint8_t buf[4];
  hidrem::WriteBe32(buf, 0x01020304U);
  REQUIRE(buf[0] == 0x01);
  REQUIRE(buf[3] == 0x04);
  REQUIRE(hidrem::ReadBe32(buf) == 0x01020304U);
}

// ============================================================================
// Decoding
// ============================================================================

TEST_CASE("FrameDecoder decodes one whole frame", "[frame][decoder]") {
  hidrem::FrameDecoder dec;
  std::vector<hidrem::Bytes> out;
  auto bytes = Frame("hello");
  auto r = dec.Feed(bytes.data(), bytes.size(), out);
  REQUIRE(r.has_value());
  REQUIRE(r.value() == 1U);
  REQUIRE(out.size() == 1U);
  REQUIRE(AsText(out[0]) == "hello");
  REQUIRE(dec.State() == hidrem::DecodeState::kAwaitingLengthPrefix);
  REQUIRE(dec.Required() == 4U);
  REQUIRE(dec.Buffered() == 0U);
}

TEST_CASE("FrameDecoder is independent of chunk boundaries",
          "[frame][decoder]") {
  hidrem::Bytes stream;
  const std::vector<std::string> msgs = {"one", "", "three", std::string(300, 'z')};
  for (const auto& m : msgs) {
    hidrem::EncodeFrame(m.data(), static_cast<uint32_t>(m.size()), stream);
  }

  for (size_t chunk = 1; chunk <= stream.size(); chunk += 7) {
    hidrem::FrameDecoder dec;
    std::vector<hidrem::Bytes> out;
    for (size_t pos = 0; pos < stream.size(); pos += chunk) {
      const size_t n = std::min(chunk, stream.size() - pos);
      REQUIRE(dec.Feed(stream.data() + pos, n, out).has_value());
    }
    REQUIRE(out.size() == msgs.size());
    for (size_t i = 0; i < msgs.size(); ++i) {
      REQUIRE(AsText(out[i]) == msgs[i]);
    }
    REQUIRE(dec.Buffered() == 0U);
  }
}

TEST_CASE("FrameDecoder tracks partial prefix and body", "[frame][decoder]") {
  hidrem::FrameDecoder dec;
  std::vector<hidrem::Bytes> out;
  auto bytes = Frame("abcdef");

  REQUIRE(dec.Feed(bytes.data(), 2U, out).value() == 0U);
  REQUIRE(dec.State() == hidrem::DecodeState::kAwaitingLengthPrefix);
  REQUIRE(dec.Buffered() == 2U);
  REQUIRE(dec.Required() == 2U);

  REQUIRE(dec.Feed(bytes.data() + 2, 2U, out).value() == 0U);
  REQUIRE(dec.State() == hidrem::DecodeState::kAwaitingBody);
  REQUIRE(dec.Buffered() == 0U);
  REQUIRE(dec.Required() == 6U);

  REQUIRE(dec.Feed(bytes.data() + 4, 2U, out).value() == 0U);
  REQUIRE(dec.Buffered() == 2U);
  REQUIRE(dec.Required() == 4U);

  REQUIRE(bytes.size() == 10U);
  REQUIRE(dec.Feed(bytes.data() + 6, 4U, out).value() == 1U);
  REQUIRE(AsText(out[0]) == "abcdef");
  REQUIRE(dec.State() == hidrem::DecodeState::kAwaitingLengthPrefix);
}

TEST_CASE("FrameDecoder emits zero-length messages", "[frame][decoder]") {
  hidrem::FrameDecoder dec;
  std::vector<hidrem::Bytes> out;
  const uint8_t zeros[8] = {0, 0, 0, 0, 0, 0, 0, 0};
  auto r = dec.Feed(zeros, sizeof(zeros), out);
  REQUIRE(r.value() == 2U);
  REQUIRE(out.size() == 2U);
  REQUIRE(out[0].empty());
  REQUIRE(out[1].empty());
}

TEST_CASE("FrameDecoder rejects an oversized prefix and latches",
          "[frame][decoder]") {
  hidrem::FrameDecoder dec(16U);
  std::vector<hidrem::Bytes> out;

  hidrem::Bytes stream = Frame("ok");
  uint8_t big[4];
  hidrem::WriteBe32(big, 17U);
  stream.insert(stream.end(), big, big + 4);
  stream.push_back('x');

  auto r = dec.Feed(stream.data(), stream.size(), out);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == hidrem::FrameError::kFrameTooLarge);
  REQUIRE(dec.Faulted());
  REQUIRE(out.size() == 1U);
  REQUIRE(AsText(out[0]) == "ok");

  auto again = Frame("later");
  REQUIRE(!dec.Feed(again.data(), again.size(), out).has_value());

  dec.Reset();
  REQUIRE(!dec.Faulted());
  REQUIRE(dec.Feed(again.data(), again.size(), out).value() == 1U);
  REQUIRE(AsText(out.back()) == "later");
}

TEST_CASE("FrameDecoder accepts a frame at exactly the limit",
          "[frame][decoder]") {
  hidrem::FrameDecoder dec(8U);
  REQUIRE(dec.MaxFrameSize() == 8U);
  std::vector<hidrem::Bytes> out;
  auto bytes = Frame("12345678");
  REQUIRE(dec.Feed(bytes.data(), bytes.size(), out).value() == 1U);
}

TEST_CASE("FrameDecoder Reset drops a partial frame", "[frame][decoder]") {
  hidrem::FrameDecoder dec;
  std::vector<hidrem::Bytes> out;
  auto partial = Frame("discarded");
  REQUIRE(dec.Feed(partial.data(), 7U, out).value() == 0U);
  dec.Reset();
  REQUIRE(dec.State() == hidrem::DecodeState::kAwaitingLengthPrefix);
  REQUIRE(dec.Buffered() == 0U);

  auto whole = Frame("kept");
  REQUIRE(dec.Feed(whole.data(), whole.size(), out).value() == 1U);
  REQUIRE(AsText(out[0]) == "kept");
}
