// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/codec.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"

namespace algoprobe {
namespace message {

PayloadPtr PayloadCodec::decode(Tag tag, const uint8_t *data, size_t size,
                                DecodeState &state) const {
  PayloadPtr payload = create_payload(tag);
  if (!payload) {
    state.Invalid("unexpected-tag", std::string(TagName(tag)) + " cannot be received");
    return nullptr;
  }
  if (!payload->deserialize(data, size, state)) {
    LOG_CODEC_DEBUG("failed to decode {} body ({} bytes): {}", TagName(tag), size,
                    state.ToString());
    return nullptr;
  }
  return payload;
}

std::vector<uint8_t> PayloadCodec::encode(const Payload &payload) const {
  return payload.serialize();
}

PayloadPtr TagMsgCodec::decode(const uint8_t *data, size_t size, DecodeState &state) const {
  auto tag = DecodeTag(data, size, state);
  if (!tag) {
    LOG_CODEC_DEBUG("failed to decode tag: {}", state.ToString());
    return nullptr;
  }
  return payload_codec_.decode(*tag, data + protocol::TAG_SIZE, size - protocol::TAG_SIZE,
                               state);
}

std::vector<uint8_t> TagMsgCodec::encode(const Payload &payload) const {
  const std::string_view code = TagCode(payload.tag());
  std::vector<uint8_t> body = payload_codec_.encode(payload);

  std::vector<uint8_t> out;
  out.reserve(code.size() + body.size());
  out.insert(out.end(), code.begin(), code.end());
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

DecodeStatus AlgoMsgCodec::try_decode(network::ReceiveBuffer &buffer, AlgoMsg &msg,
                                      DecodeState &state) {
  std::vector<uint8_t> frame;
  DecodeStatus status = ws_.try_decode(buffer, frame, state);
  if (status != DecodeStatus::COMPLETE) {
    if (status == DecodeStatus::INVALID) {
      LOG_CODEC_DEBUG("websocket decode failed: {}", state.ToString());
    }
    return status;
  }

  PayloadPtr payload = tag_codec_.decode(frame.data(), frame.size(), state);
  if (!payload) {
    return DecodeStatus::INVALID;
  }

  LOG_CODEC_TRACE("decoded {} ({} bytes)", TagName(payload->tag()), frame.size());
  msg = AlgoMsg(std::move(frame), std::move(payload));
  return DecodeStatus::COMPLETE;
}

std::vector<uint8_t> AlgoMsgCodec::encode(const Payload &payload) const {
  return ws_.encode(tag_codec_.encode(payload));
}

std::vector<uint8_t> AlgoMsgCodec::encode_raw(const std::vector<uint8_t> &bytes) const {
  return ws_.encode(bytes);
}

} // namespace message
} // namespace algoprobe
