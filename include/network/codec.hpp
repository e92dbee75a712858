#pragma once

#include "network/decode_state.hpp"
#include "network/message.hpp"
#include "network/receive_buffer.hpp"
#include "network/websocket.hpp"
#include <cstdint>
#include <vector>

namespace algoprobe {
namespace message {

/**
 * PayloadCodec - body decoding/encoding selected by tag
 *
 * The tag is an explicit argument of every call; the codec holds no state.
 *
 *   MI, TS              topics
 *   PP, AV, NP, TX      MessagePack
 *   MS                  exactly 32 bytes
 *   pi, pj              exactly 8 bytes
 *   ??, SP, VB, UE, UC  NotImplemented (body left unconsumed)
 */
class PayloadCodec {
public:
  // nullptr + state.IsInvalid() on failure
  PayloadPtr decode(Tag tag, const uint8_t *data, size_t size, DecodeState &state) const;

  // Body bytes only. Throws std::logic_error for NotImplemented payloads.
  std::vector<uint8_t> encode(const Payload &payload) const;
};

/**
 * TagMsgCodec - 2-byte tag followed by the tag-specific body
 *
 * A message never spans WebSocket messages, so both directions work on one
 * complete application message.
 */
class TagMsgCodec {
public:
  PayloadPtr decode(const uint8_t *data, size_t size, DecodeState &state) const;

  // Tag code + body. RawBytes contributes no tag bytes.
  std::vector<uint8_t> encode(const Payload &payload) const;

private:
  PayloadCodec payload_codec_;
};

/**
 * AlgoMsg - one decoded application message
 *
 * raw is the complete WebSocket message (tag + body) as received, kept so
 * tests can replay it byte for byte.
 */
struct AlgoMsg {
  std::vector<uint8_t> raw;
  PayloadPtr payload;

  AlgoMsg() = default;
  AlgoMsg(std::vector<uint8_t> r, PayloadPtr p) : raw(std::move(r)), payload(std::move(p)) {}
  AlgoMsg(AlgoMsg &&) = default;
  AlgoMsg &operator=(AlgoMsg &&) = default;

  AlgoMsg(const AlgoMsg &other)
      : raw(other.raw), payload(other.payload ? other.payload->clone() : nullptr) {}
  AlgoMsg &operator=(const AlgoMsg &other) {
    if (this != &other) {
      raw = other.raw;
      payload = other.payload ? other.payload->clone() : nullptr;
    }
    return *this;
  }

  Tag tag() const { return payload ? payload->tag() : Tag::RawBytes; }
};

/**
 * AlgoMsgCodec - WebSocket framing layered over TagMsgCodec
 *
 * Per-connection: owns the WebSocket reassembly state.
 */
class AlgoMsgCodec {
public:
  explicit AlgoMsgCodec(network::Role role) : ws_(role) {}

  DecodeStatus try_decode(network::ReceiveBuffer &buffer, AlgoMsg &msg, DecodeState &state);

  // Framed bytes ready for the transport
  std::vector<uint8_t> encode(const Payload &payload) const;
  std::vector<uint8_t> encode_raw(const std::vector<uint8_t> &bytes) const;

  network::WebSocketCodec &websocket() { return ws_; }

private:
  network::WebSocketCodec ws_;
  TagMsgCodec tag_codec_;
};

} // namespace message
} // namespace algoprobe
