#pragma once

#include "network/decode_state.hpp"
#include "network/msgpack_types.hpp"
#include "network/tag.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace algoprobe {
namespace message {

/**
 * Topic - one key/value pair of a topic-encoded message
 *
 * Keys are short printable strings (at most 64 bytes upstream), values are
 * opaque bytes.
 */
struct Topic {
  std::string key;
  std::vector<uint8_t> value;

  Topic() = default;
  Topic(std::string k, std::vector<uint8_t> v) : key(std::move(k)), value(std::move(v)) {}
  Topic(std::string k, const std::string &v) : key(std::move(k)), value(v.begin(), v.end()) {}

  bool operator==(const Topic &) const = default;
};

/**
 * TopicLength - value length prefix of a topic
 *
 * Two forms, selected by the high bit of the first byte:
 *   0xxxxxxx           length 0..127
 *   1aaaaaaa 0bbbbbbb  read as u16 little-endian tmp,
 *                      length = ((tmp & 0x7f00) >> 1) | (tmp & 0x7f)
 * i.e. a base-128 varint capped at two groups (max 16383).
 */
class TopicLength {
public:
  size_t value;

  TopicLength() : value(0) {}
  explicit TopicLength(size_t v) : value(v) {}

  // 1 or 2; throws std::length_error above 16383
  size_t encoded_size() const;

  // Encode to buffer (room for encoded_size() bytes), returns bytes written
  size_t encode(uint8_t *buffer) const;

  // Decode from buffer, returns bytes consumed (0 if the prefix is truncated)
  size_t decode(const uint8_t *buffer, size_t available);
};

/**
 * Encode topics: u8 count, then per topic u8 key length, key, value length
 * (TopicLength), value.
 *
 * Throws std::length_error for more than 255 topics, keys over 255 bytes or
 * values over 16383 bytes.
 */
std::vector<uint8_t> MarshalTopics(const std::vector<Topic> &topics);

/**
 * Decode topics in wire order
 *
 * Never reads past size. Fails with "bad-topic-count", "bad-topic-len",
 * "bad-topic-key" (not UTF-8). Bytes after the last topic are ignored.
 */
bool UnmarshalTopics(const uint8_t *data, size_t size, std::vector<Topic> &topics,
                     DecodeState &state);

// ============================================================================
// Topic-carried messages
// ============================================================================

// Tags a peer subscribes to; "tags" topic, comma-joined codes
struct MsgOfInterest {
  std::set<Tag> tags;

  bool operator==(const MsgOfInterest &) const = default;
};

enum class RequestDataType {
  Block,
  Cert,
  BlockAndCert,
};

// "blockData" / "certData" / "blockAndCert"
std::string RequestDataTypeString(RequestDataType type);
std::optional<RequestDataType> RequestDataTypeFromString(const std::string &str);

/**
 * Body shared by UniEnsBlockReq and UniCatchupReq
 *
 * Topics in order: roundKey (u64 LE), requestDataType (string), nonce (u64 LE).
 * The nonce correlates concurrent requests.
 */
struct BlockRequest {
  RequestDataType data_type = RequestDataType::BlockAndCert;
  Round round = 0;
  uint64_t nonce = 0;

  bool operator==(const BlockRequest &) const = default;
};

struct ErrorRsp {
  std::string error;                  // "Error"
  std::vector<uint8_t> request_hash;  // "RequestHash"
};

struct UniEnsBlockRsp {
  std::optional<BlockHeader> block;   // "blockData", msgpack
  std::optional<Certificate> cert;    // "certData", msgpack
  std::vector<uint8_t> request_hash;  // "RequestHash"
};

/**
 * Catchup response. The wire carries no discriminator: the variant follows
 * from which topics arrived (2 topics Error + RequestHash, or 3 topics
 * blockData + certData + RequestHash).
 */
using TopicMsgResp = std::variant<ErrorRsp, UniEnsBlockRsp>;

std::vector<Topic> ToTopics(const MsgOfInterest &msg);
std::vector<Topic> ToTopics(const BlockRequest &req);
std::vector<Topic> ToTopics(const TopicMsgResp &rsp);

bool MsgOfInterestFromTopics(const std::vector<Topic> &topics, MsgOfInterest &out,
                             DecodeState &state);

// Topics may arrive in any order; all three keys are required
bool BlockRequestFromTopics(const std::vector<Topic> &topics, BlockRequest &out,
                            DecodeState &state);

/**
 * Build a TopicMsgResp from the received key set
 *
 * Any other count or key set is InvalidData. Upstream does not guard against
 * a future response shape with the same topic count either.
 */
bool TopicMsgRespFromTopics(const std::vector<Topic> &topics, TopicMsgResp &out,
                            DecodeState &state);

} // namespace message
} // namespace algoprobe
