// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/topic.hpp"
#include "network/message.hpp"
#include "network/protocol.hpp"
#include "util/string_parsing.hpp"
#include <stdexcept>

namespace algoprobe {
namespace message {

// TopicLength implementation
size_t TopicLength::encoded_size() const {
  if (value <= protocol::MAX_SHORT_TOPIC_LENGTH)
    return 1;
  if (value <= protocol::MAX_TOPIC_VALUE_LENGTH)
    return 2;
  throw std::length_error("topic value of " + std::to_string(value) +
                          " bytes exceeds the two-byte length form");
}

size_t TopicLength::encode(uint8_t *buffer) const {
  if (encoded_size() == 1) {
    buffer[0] = static_cast<uint8_t>(value);
    return 1;
  }
  buffer[0] = static_cast<uint8_t>(0x80 | (value & 0x7f));
  buffer[1] = static_cast<uint8_t>((value >> 7) & 0x7f);
  return 2;
}

size_t TopicLength::decode(const uint8_t *buffer, size_t available) {
  if (available < 1)
    return 0;

  if ((buffer[0] & 0x80) == 0) {
    value = buffer[0];
    return 1;
  }

  if (available < 2)
    return 0;
  const uint16_t tmp = static_cast<uint16_t>(buffer[0] | (buffer[1] << 8));
  value = ((tmp & 0x7f00) >> 1) | (tmp & 0x7f);
  return 2;
}

std::vector<uint8_t> MarshalTopics(const std::vector<Topic> &topics) {
  if (topics.size() > 0xff) {
    throw std::length_error("too many topics: " + std::to_string(topics.size()));
  }

  MessageSerializer s;
  s.write_uint8(static_cast<uint8_t>(topics.size()));
  for (const auto &topic : topics) {
    if (topic.key.size() > 0xff) {
      throw std::length_error("topic key '" + topic.key.substr(0, 16) + "...' too long");
    }
    s.write_uint8(static_cast<uint8_t>(topic.key.size()));
    s.write_bytes(reinterpret_cast<const uint8_t *>(topic.key.data()), topic.key.size());

    TopicLength len(topic.value.size());
    uint8_t prefix[2];
    s.write_bytes(prefix, len.encode(prefix));
    s.write_bytes(topic.value);
  }
  return s.data();
}

bool UnmarshalTopics(const uint8_t *data, size_t size, std::vector<Topic> &topics,
                     DecodeState &state) {
  MessageDeserializer d(data, size);
  topics.clear();

  const uint8_t count = d.read_uint8();
  if (d.has_error()) {
    return state.Invalid("bad-topic-count", "empty topic buffer");
  }
  topics.reserve(count);

  for (size_t i = 0; i < count; ++i) {
    const uint8_t key_len = d.read_uint8();
    if (d.has_error() || key_len > d.bytes_remaining()) {
      return state.Invalid("bad-topic-len",
                           "topic " + std::to_string(i) + " key length exceeds buffer");
    }
    std::vector<uint8_t> key = d.read_bytes(key_len);

    TopicLength value_len;
    size_t consumed = value_len.decode(d.current(), d.bytes_remaining());
    if (consumed == 0) {
      return state.Invalid("bad-topic-len",
                           "topic " + std::to_string(i) + " value length truncated");
    }
    d.skip(consumed);
    if (value_len.value > d.bytes_remaining()) {
      return state.Invalid("bad-topic-len",
                           "topic " + std::to_string(i) + " value length " +
                               std::to_string(value_len.value) + " exceeds remaining " +
                               std::to_string(d.bytes_remaining()) + " bytes");
    }
    std::vector<uint8_t> value = d.read_bytes(value_len.value);

    if (!util::IsValidUtf8(key.data(), key.size())) {
      return state.Invalid("bad-topic-key", "topic key is not valid UTF-8");
    }
    topics.emplace_back(std::string(key.begin(), key.end()), std::move(value));
  }

  return true;
}

// ============================================================================
// Topic-carried messages
// ============================================================================

namespace {

std::vector<uint8_t> U64Value(uint64_t v) {
  MessageSerializer s;
  s.write_uint64(v);
  return s.data();
}

template <typename T>
std::vector<uint8_t> OptionalMsgpack(const std::optional<T> &value) {
  if (!value) {
    return {0xc0};  // msgpack nil
  }
  return ToMsgpack(*value);
}

template <typename T>
bool OptionalFromMsgpack(const std::vector<uint8_t> &bytes, std::optional<T> &out,
                         DecodeState &state, const char *type_name) {
  try {
    json j = json::from_msgpack(DropNonStringKeys(bytes.data(), bytes.size(), true));
    if (j.is_null()) {
      out.reset();
    } else {
      out = j.get<T>();
    }
    return true;
  } catch (const json::exception &e) {
    return state.Invalid("bad-msgpack", std::string("couldn't deserialize the ") +
                                            type_name + ": " + e.what());
  } catch (const MsgpackError &e) {
    return state.Invalid("bad-msgpack", std::string("couldn't deserialize the ") +
                                            type_name + ": " + e.what());
  }
}

std::set<std::string> KeySet(const std::vector<Topic> &topics) {
  std::set<std::string> keys;
  for (const auto &topic : topics) {
    keys.insert(topic.key);
  }
  return keys;
}

} // namespace

std::string RequestDataTypeString(RequestDataType type) {
  switch (type) {
  case RequestDataType::Block:
    return protocol::request_types::BLOCK;
  case RequestDataType::Cert:
    return protocol::request_types::CERT;
  case RequestDataType::BlockAndCert:
    return protocol::request_types::BLOCK_AND_CERT;
  }
  return protocol::request_types::BLOCK_AND_CERT;
}

std::optional<RequestDataType> RequestDataTypeFromString(const std::string &str) {
  if (str == protocol::request_types::BLOCK)
    return RequestDataType::Block;
  if (str == protocol::request_types::CERT)
    return RequestDataType::Cert;
  if (str == protocol::request_types::BLOCK_AND_CERT)
    return RequestDataType::BlockAndCert;
  return std::nullopt;
}

std::vector<Topic> ToTopics(const MsgOfInterest &msg) {
  // std::set iterates in Tag enum order
  std::string value;
  for (Tag tag : msg.tags) {
    if (!value.empty()) {
      value += ',';
    }
    value += TagCode(tag);
  }
  return {Topic(protocol::topics::TAGS, value)};
}

std::vector<Topic> ToTopics(const BlockRequest &req) {
  return {
      Topic(protocol::topics::ROUND_KEY, U64Value(req.round)),
      Topic(protocol::topics::REQUEST_DATA_TYPE, RequestDataTypeString(req.data_type)),
      Topic(protocol::topics::NONCE, U64Value(req.nonce)),
  };
}

std::vector<Topic> ToTopics(const TopicMsgResp &rsp) {
  if (const auto *err = std::get_if<ErrorRsp>(&rsp)) {
    return {
        Topic(protocol::topics::ERROR, err->error),
        Topic(protocol::topics::REQUEST_HASH, err->request_hash),
    };
  }
  const auto &block = std::get<UniEnsBlockRsp>(rsp);
  return {
      Topic(protocol::topics::BLOCK_DATA, OptionalMsgpack(block.block)),
      Topic(protocol::topics::CERT_DATA, OptionalMsgpack(block.cert)),
      Topic(protocol::topics::REQUEST_HASH, block.request_hash),
  };
}

bool MsgOfInterestFromTopics(const std::vector<Topic> &topics, MsgOfInterest &out,
                             DecodeState &state) {
  if (topics.size() != 1) {
    return state.Invalid("bad-msg-of-interest", "expected a single topic");
  }
  const Topic &topic = topics.front();
  if (topic.key != protocol::topics::TAGS) {
    return state.Invalid("bad-msg-of-interest", "expected 'tags' topic");
  }
  if (!util::IsValidUtf8(topic.value.data(), topic.value.size())) {
    return state.Invalid("bad-msg-of-interest", "'tags' value is not a valid UTF-8 string");
  }

  // An empty value is an empty subscription. go-algorand splits on ',' and
  // would reject it as an unknown tag.
  out.tags.clear();
  const std::string value(topic.value.begin(), topic.value.end());
  size_t start = 0;
  while (start < value.size()) {
    size_t comma = value.find(',', start);
    if (comma == std::string::npos) {
      comma = value.size();
    }
    const std::string code = value.substr(start, comma - start);
    auto tag = TagFromCode(code);
    if (!tag) {
      return state.Invalid("unknown-tag", "'" + code + "' in MsgOfInterest");
    }
    out.tags.insert(*tag);
    start = comma + 1;
    // A trailing comma leaves an empty code behind it
    if (comma + 1 == value.size()) {
      return state.Invalid("unknown-tag", "empty code in MsgOfInterest");
    }
  }
  return true;
}

bool BlockRequestFromTopics(const std::vector<Topic> &topics, BlockRequest &out,
                            DecodeState &state) {
  bool have_round = false;
  bool have_type = false;
  bool have_nonce = false;

  for (const auto &topic : topics) {
    if (topic.key == protocol::topics::ROUND_KEY) {
      MessageDeserializer d(topic.value);
      out.round = d.read_uint64();
      if (d.has_error() || d.bytes_remaining() != 0) {
        return state.Invalid("bad-block-request", "roundKey must be 8 bytes");
      }
      have_round = true;
    } else if (topic.key == protocol::topics::NONCE) {
      MessageDeserializer d(topic.value);
      out.nonce = d.read_uint64();
      if (d.has_error() || d.bytes_remaining() != 0) {
        return state.Invalid("bad-block-request", "nonce must be 8 bytes");
      }
      have_nonce = true;
    } else if (topic.key == protocol::topics::REQUEST_DATA_TYPE) {
      auto type = RequestDataTypeFromString(std::string(topic.value.begin(), topic.value.end()));
      if (!type) {
        return state.Invalid("bad-block-request", "unknown requestDataType");
      }
      out.data_type = *type;
      have_type = true;
    }
  }

  if (!have_round || !have_type || !have_nonce) {
    return state.Invalid("bad-block-request", "missing roundKey, requestDataType or nonce");
  }
  return true;
}

bool TopicMsgRespFromTopics(const std::vector<Topic> &topics, TopicMsgResp &out,
                            DecodeState &state) {
  const auto keys = KeySet(topics);

  if (topics.size() == 2) {
    if (keys != std::set<std::string>{protocol::topics::ERROR, protocol::topics::REQUEST_HASH}) {
      return state.Invalid("unexpected-topic", "unexpected topic for an error response message");
    }
    ErrorRsp err;
    for (const auto &topic : topics) {
      if (topic.key == protocol::topics::ERROR) {
        if (!util::IsValidUtf8(topic.value.data(), topic.value.size())) {
          return state.Invalid("bad-error-rsp", "error value is not a valid UTF-8 string");
        }
        err.error.assign(topic.value.begin(), topic.value.end());
      } else {
        err.request_hash = topic.value;
      }
    }
    out = std::move(err);
    return true;
  }

  if (topics.size() == 3) {
    if (keys != std::set<std::string>{protocol::topics::BLOCK_DATA, protocol::topics::CERT_DATA,
                                      protocol::topics::REQUEST_HASH}) {
      return state.Invalid("unexpected-topic", "unexpected topic for a block response message");
    }
    UniEnsBlockRsp rsp;
    for (const auto &topic : topics) {
      if (topic.key == protocol::topics::BLOCK_DATA) {
        if (!OptionalFromMsgpack(topic.value, rsp.block, state, "block data")) {
          return false;
        }
      } else if (topic.key == protocol::topics::CERT_DATA) {
        if (!OptionalFromMsgpack(topic.value, rsp.cert, state, "cert data")) {
          return false;
        }
      } else {
        rsp.request_hash = topic.value;
      }
    }
    out = std::move(rsp);
    return true;
  }

  return state.Invalid("unexpected-topic-count",
                       "unexpected number of topics: " + std::to_string(topics.size()));
}

} // namespace message
} // namespace algoprobe
