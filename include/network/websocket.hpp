// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/decode_state.hpp"
#include "network/receive_buffer.hpp"
#include <cstdint>
#include <vector>

namespace algoprobe {
namespace network {

using message::DecodeState;
using message::DecodeStatus;

// Connection role fixed at handshake time. The initiator masks the frames it
// sends; the responder must not.
enum class Role {
  Initiator,
  Responder,
};

const char *RoleName(Role role);

// RFC 6455 opcodes
enum class WsOpcode : uint8_t {
  Continuation = 0x0,
  Text = 0x1,
  Binary = 0x2,
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xa,
};

/**
 * WebSocketCodec - binary-message framing for one connection
 *
 * Decoding reassembles fragmented binary messages (FIN=0 + continuation
 * frames). Text and control frames, reserved bits, wrong masking for the
 * role and messages over MAX_WS_MESSAGE_SIZE are InvalidData.
 *
 * Not thread-safe; one instance per connection.
 */
class WebSocketCodec {
public:
  explicit WebSocketCodec(Role role) : role_(role) {}

  /**
   * Consume complete frames from buffer until one whole message is available
   *
   * COMPLETE:   message holds the reassembled payload
   * INCOMPLETE: need more bytes; frames already consumed are kept internally
   * INVALID:    state holds the cause; the connection must be dropped
   */
  DecodeStatus try_decode(ReceiveBuffer &buffer, std::vector<uint8_t> &message,
                          DecodeState &state);

  // One FIN binary frame carrying payload, masked if we are the initiator
  std::vector<uint8_t> encode(const std::vector<uint8_t> &payload) const;

  // Arbitrary frame, for probing peers with frames they should reject
  std::vector<uint8_t> encode_frame(WsOpcode opcode, const std::vector<uint8_t> &payload,
                                    bool fin = true) const;

  Role role() const { return role_; }

  // Drop any partially reassembled message
  void reset();

private:
  Role role_;
  std::vector<uint8_t> fragments_;
  bool fragmented_ = false;
};

} // namespace network
} // namespace algoprobe
