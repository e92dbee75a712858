// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/websocket.hpp"
#include "network/protocol.hpp"
#include "util/endian.hpp"
#include "util/logging.hpp"
#include "util/random.hpp"

namespace algoprobe {
namespace network {

namespace {

constexpr uint8_t FIN_BIT = 0x80;
constexpr uint8_t RSV_BITS = 0x70;
constexpr uint8_t OPCODE_MASK = 0x0f;
constexpr uint8_t MASK_BIT = 0x80;
constexpr uint8_t LEN_MASK = 0x7f;
constexpr uint8_t LEN_16 = 126;
constexpr uint8_t LEN_64 = 127;

void ApplyMask(uint8_t *data, size_t len, const uint8_t *key) {
  for (size_t i = 0; i < len; ++i) {
    data[i] ^= key[i % 4];
  }
}

} // namespace

const char *RoleName(Role role) {
  return role == Role::Initiator ? "initiator" : "responder";
}

void WebSocketCodec::reset() {
  fragments_.clear();
  fragmented_ = false;
}

DecodeStatus WebSocketCodec::try_decode(ReceiveBuffer &buffer, std::vector<uint8_t> &message,
                                        DecodeState &state) {
  for (;;) {
    const uint8_t *p = buffer.data();
    const size_t available = buffer.size();
    if (available < 2) {
      return DecodeStatus::INCOMPLETE;
    }

    const bool fin = (p[0] & FIN_BIT) != 0;
    const auto opcode = static_cast<WsOpcode>(p[0] & OPCODE_MASK);
    const bool masked = (p[1] & MASK_BIT) != 0;

    if ((p[0] & RSV_BITS) != 0) {
      state.Invalid("bad-ws-frame", "reserved bits set");
      return DecodeStatus::INVALID;
    }

    switch (opcode) {
    case WsOpcode::Binary:
      if (fragmented_) {
        state.Invalid("bad-ws-frame", "binary frame inside a fragmented message");
        return DecodeStatus::INVALID;
      }
      break;
    case WsOpcode::Continuation:
      if (!fragmented_) {
        state.Invalid("bad-ws-frame", "continuation frame without a message");
        return DecodeStatus::INVALID;
      }
      break;
    default:
      state.Invalid("bad-ws-opcode", "expected a binary opcode, got " +
                                         std::to_string(static_cast<int>(opcode)));
      return DecodeStatus::INVALID;
    }

    // Initiator frames must be masked, responder frames must not
    if (role_ == Role::Responder && !masked) {
      state.Invalid("bad-ws-frame", "unmasked frame from initiator");
      return DecodeStatus::INVALID;
    }
    if (role_ == Role::Initiator && masked) {
      state.Invalid("bad-ws-frame", "masked frame from responder");
      return DecodeStatus::INVALID;
    }

    size_t header_len = 2;
    uint64_t payload_len = p[1] & LEN_MASK;
    if (payload_len == LEN_16) {
      if (available < 4)
        return DecodeStatus::INCOMPLETE;
      payload_len = endian::ReadBE16(p + 2);
      header_len = 4;
    } else if (payload_len == LEN_64) {
      if (available < 10)
        return DecodeStatus::INCOMPLETE;
      payload_len = endian::ReadBE64(p + 2);
      header_len = 10;
    }

    // Reject before waiting for the body so an oversized declaration cannot
    // stall the connection
    if (payload_len > protocol::MAX_WS_MESSAGE_SIZE ||
        fragments_.size() + payload_len > protocol::MAX_WS_MESSAGE_SIZE) {
      state.Invalid("oversized-ws-message", "message exceeds " +
                                                std::to_string(protocol::MAX_WS_MESSAGE_SIZE) +
                                                " bytes");
      return DecodeStatus::INVALID;
    }

    const uint8_t *mask_key = nullptr;
    if (masked) {
      if (available < header_len + 4)
        return DecodeStatus::INCOMPLETE;
      mask_key = p + header_len;
      header_len += 4;
    }

    const size_t frame_len = header_len + static_cast<size_t>(payload_len);
    if (available < frame_len) {
      return DecodeStatus::INCOMPLETE;
    }

    const size_t start = fragments_.size();
    fragments_.insert(fragments_.end(), p + header_len, p + frame_len);
    if (mask_key) {
      ApplyMask(fragments_.data() + start, static_cast<size_t>(payload_len), mask_key);
    }
    buffer.consume(frame_len);

    if (fin) {
      message = std::move(fragments_);
      reset();
      return DecodeStatus::COMPLETE;
    }

    fragmented_ = true;
    LOG_CODEC_TRACE("ws fragment of {} bytes, {} buffered", payload_len, fragments_.size());
  }
}

std::vector<uint8_t> WebSocketCodec::encode(const std::vector<uint8_t> &payload) const {
  return encode_frame(WsOpcode::Binary, payload, true);
}

std::vector<uint8_t> WebSocketCodec::encode_frame(WsOpcode opcode,
                                                  const std::vector<uint8_t> &payload,
                                                  bool fin) const {
  const bool mask = role_ == Role::Initiator;
  std::vector<uint8_t> frame;
  frame.reserve(payload.size() + protocol::MAX_WS_HEADER_SIZE);

  frame.push_back(static_cast<uint8_t>((fin ? FIN_BIT : 0) | static_cast<uint8_t>(opcode)));

  const uint8_t mask_bit = mask ? MASK_BIT : 0;
  if (payload.size() < LEN_16) {
    frame.push_back(static_cast<uint8_t>(mask_bit | payload.size()));
  } else if (payload.size() <= 0xffff) {
    frame.push_back(mask_bit | LEN_16);
    uint8_t len[2];
    endian::WriteBE16(len, static_cast<uint16_t>(payload.size()));
    frame.insert(frame.end(), len, len + 2);
  } else {
    frame.push_back(mask_bit | LEN_64);
    uint8_t len[8];
    endian::WriteBE64(len, payload.size());
    frame.insert(frame.end(), len, len + 8);
  }

  const size_t body = frame.size() + (mask ? 4 : 0);
  if (mask) {
    uint8_t key[4];
    endian::WriteLE32(key, util::GenerateRandomUInt32());
    frame.insert(frame.end(), key, key + 4);
    frame.insert(frame.end(), payload.begin(), payload.end());
    ApplyMask(frame.data() + body, payload.size(), key);
  } else {
    frame.insert(frame.end(), payload.begin(), payload.end());
  }
  return frame;
}

} // namespace network
} // namespace algoprobe
