// FrameCodec tests: wire layout, streaming decode and malformed input.
#include <catch2/catch.hpp>

#include "frame_codec.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

using codec::DecodeStatus;

namespace {

std::vector<ProtocolMessage> every_frame() {
  return {
      Hello{},
      HelloAck{},
      CreateConferenceRequest{"$2b$10$abcdefghijklmnopqrstuv"},
      CreateConferenceResponse{8845684583ULL},
      JoinSaltRequest{8845684583ULL},
      JoinSaltResponse{8845684583ULL, "$2b$10$abcdefghijklmnopqrstuu"},
      JoinConferenceRequest{8845684583ULL, "credential"},
      JoinConferenceResponse{"anon-1f2e3d4c5b6a7988", 3},
      LeaveConferenceNotice{},
      ParticipantCount{4},
      ChatMessage{"anon-1f2e3d4c5b6a7988", 1, "你好"},
      Heartbeat{},
      Disconnect{},
      ErrorResponse{ErrorCode::WRONG_PASSWORD, "wrong password"},
  };
}

std::vector<uint8_t> raw_frame(uint32_t length, uint16_t type, const std::vector<uint8_t>& payload) {
  std::vector<uint8_t> out = {static_cast<uint8_t>(length >> 24), static_cast<uint8_t>(length >> 16), static_cast<uint8_t>(length >> 8),
                              static_cast<uint8_t>(length),       static_cast<uint8_t>(type >> 8),    static_cast<uint8_t>(type),
                              0,                                  0};
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

} // namespace

TEST_CASE("Every frame survives encode and decode", "[codec]") {
  for (const auto& m : every_frame()) {
    INFO(message_name(message_type(m)));
    auto bytes = codec::encode(m);
    ProtocolMessage out;
    size_t consumed = 0;
    std::string error;
    REQUIRE(codec::decode(bytes.data(), bytes.size(), out, consumed, error) == DecodeStatus::COMPLETE);
    REQUIRE(consumed == bytes.size());
    REQUIRE(out == m);
  }
}

TEST_CASE("Header is big-endian length, type, reserved", "[codec]") {
  auto bytes = codec::encode(CreateConferenceResponse{0x0102030405060708ULL});
  REQUIRE(bytes.size() == HEADER_SIZE + 8);
  REQUIRE(bytes == std::vector<uint8_t>{0, 0, 0, 8, 0x00, 0x11, 0, 0, 1, 2, 3, 4, 5, 6, 7, 8});

  auto chat = codec::encode(ChatMessage{"ab", 1, "x"});
  // sender: u16 len + 2 bytes, sequence: u64, payload: u16 len + 1 byte
  REQUIRE(chat == std::vector<uint8_t>{0, 0, 0, 15, 0x00, 0x20, 0, 0, 0, 2, 'a', 'b', 0, 0, 0, 0, 0, 0, 0, 1, 0, 1, 'x'});
}

TEST_CASE("Hello carries the protocol tag", "[codec]") {
  auto bytes = codec::encode(Hello{});
  std::string wire(bytes.begin(), bytes.end());
  REQUIRE(wire.find("AnonymousConference protocol") != std::string::npos);
  REQUIRE(bytes[HEADER_SIZE + 4] == 0x1C);
}

TEST_CASE("Decode reports INCOMPLETE until a whole frame is present", "[codec]") {
  auto bytes = codec::encode(ChatMessage{"anon-1", 7, "hello there"});
  ProtocolMessage out;
  size_t consumed = 99;
  std::string error;
  for (size_t n = 0; n < bytes.size(); ++n) {
    REQUIRE(codec::decode(bytes.data(), n, out, consumed, error) == DecodeStatus::INCOMPLETE);
    REQUIRE(consumed == 0);
  }
  REQUIRE(codec::decode(bytes.data(), bytes.size(), out, consumed, error) == DecodeStatus::COMPLETE);
}

TEST_CASE("FrameReader handles arbitrary chunking", "[codec][stream]") {
  std::vector<uint8_t> stream;
  for (const auto& m : every_frame()) {
    auto bytes = codec::encode(m);
    stream.insert(stream.end(), bytes.begin(), bytes.end());
  }

  for (size_t chunk : {size_t(1), size_t(3), size_t(7), size_t(64), stream.size()}) {
    INFO("chunk size " << chunk);
    codec::FrameReader reader;
    std::vector<ProtocolMessage> decoded;
    std::string error;
    for (size_t pos = 0; pos < stream.size(); pos += chunk) {
      reader.feed(stream.data() + pos, std::min(chunk, stream.size() - pos));
      ProtocolMessage m;
      DecodeStatus status;
      while ((status = reader.next(m, error)) == DecodeStatus::COMPLETE)
        decoded.push_back(m);
      REQUIRE(status == DecodeStatus::INCOMPLETE);
    }
    REQUIRE(decoded == every_frame());
    REQUIRE(reader.buffered() == 0);
  }
}

TEST_CASE("Decode leaves the following frame in place", "[codec][stream]") {
  auto a = codec::encode(Heartbeat{});
  auto b = codec::encode(ParticipantCount{2});
  std::vector<uint8_t> both = a;
  both.insert(both.end(), b.begin(), b.end());

  ProtocolMessage out;
  size_t consumed = 0;
  std::string error;
  REQUIRE(codec::decode(both.data(), both.size(), out, consumed, error) == DecodeStatus::COMPLETE);
  REQUIRE(consumed == a.size());
  REQUIRE(std::holds_alternative<Heartbeat>(out));
  REQUIRE(codec::decode(both.data() + consumed, both.size() - consumed, out, consumed, error) == DecodeStatus::COMPLETE);
  REQUIRE(std::get<ParticipantCount>(out).count == 2);
}

TEST_CASE("Malformed frames are rejected", "[codec][malformed]") {
  ProtocolMessage out;
  size_t consumed = 0;
  std::string error;

  SECTION("unknown type") {
    auto bytes = raw_frame(0, 0x55, {});
    REQUIRE(codec::decode(bytes.data(), bytes.size(), out, consumed, error) == DecodeStatus::MALFORMED);
    REQUIRE_FALSE(error.empty());
  }
  SECTION("length beyond the payload limit") {
    // Reported before the payload arrives.
    auto bytes = raw_frame(MAX_PAYLOAD_SIZE + 1, 0x20, {});
    REQUIRE(codec::decode(bytes.data(), bytes.size(), out, consumed, error) == DecodeStatus::MALFORMED);
  }
  SECTION("string length runs past the payload") {
    auto bytes = raw_frame(3, 0x10, {0, 9, 'x'});
    REQUIRE(codec::decode(bytes.data(), bytes.size(), out, consumed, error) == DecodeStatus::MALFORMED);
  }
  SECTION("payload shorter than the fields") {
    auto bytes = raw_frame(4, 0x11, {0, 0, 0, 1});
    REQUIRE(codec::decode(bytes.data(), bytes.size(), out, consumed, error) == DecodeStatus::MALFORMED);
  }
  SECTION("trailing bytes after the fields") {
    auto bytes = raw_frame(1, 0x30, {0});
    REQUIRE(codec::decode(bytes.data(), bytes.size(), out, consumed, error) == DecodeStatus::MALFORMED);
  }
  REQUIRE(consumed == 0);
}

TEST_CASE("Encode refuses payloads over the limit", "[codec]") {
  ChatMessage big{"anon-1", 1, std::string(MAX_PAYLOAD_SIZE, 'x')};
  REQUIRE_THROWS_AS(codec::encode(big), std::length_error);

  ChatMessage fits{"anon-1", 1, std::string(MAX_CHAT_TEXT, 'x')};
  REQUIRE_NOTHROW(codec::encode(fits));
}
