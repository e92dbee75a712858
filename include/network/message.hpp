#pragma once

#include "network/decode_state.hpp"
#include "network/msgpack_types.hpp"
#include "network/protocol.hpp"
#include "network/tag.hpp"
#include "network/topic.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace algoprobe {
namespace message {

/**
 * Serialization buffer for building wire-format messages
 */
class MessageSerializer {
public:
  MessageSerializer();

  // Write primitives (little-endian)
  void write_uint8(uint8_t value);
  void write_uint64(uint64_t value);

  void write_bytes(const uint8_t *data, size_t len);
  void write_bytes(const std::vector<uint8_t> &data);

  // Get serialized data
  const std::vector<uint8_t> &data() const { return buffer_; }

private:
  std::vector<uint8_t> buffer_;
};

/**
 * Deserialization buffer for parsing wire-format messages
 *
 * Reads past the end set a sticky error flag and return zero values; callers
 * check has_error() once after a group of reads.
 */
class MessageDeserializer {
public:
  MessageDeserializer(const uint8_t *data, size_t size);
  explicit MessageDeserializer(const std::vector<uint8_t> &data);

  // Read primitives (little-endian)
  uint8_t read_uint8();
  uint64_t read_uint64();

  std::vector<uint8_t> read_bytes(size_t count);
  void skip(size_t count);

  // State
  const uint8_t *current() const { return data_ + position_; }
  size_t bytes_remaining() const { return size_ - position_; }
  bool has_error() const { return error_; }

private:
  const uint8_t *data_;
  size_t size_;
  size_t position_;
  bool error_;

  void check_available(size_t bytes);
};

/**
 * Base class for all message payloads
 *
 * A payload's tag is a function of its concrete class (NotImplementedPayload
 * carries the tag it was decoded for). serialize() produces the body without
 * the 2-byte tag.
 */
class Payload {
public:
  virtual ~Payload() = default;

  virtual Tag tag() const = 0;

  // Serialize message body. Throws std::logic_error for payloads with no
  // outbound form.
  virtual std::vector<uint8_t> serialize() const = 0;

  // Deserialize message body (returns false and fills state on failure)
  virtual bool deserialize(const uint8_t *data, size_t size, DecodeState &state) = 0;

  virtual std::unique_ptr<Payload> clone() const = 0;
};

using PayloadPtr = std::unique_ptr<Payload>;

// ----------------------------------------------------------------------------
// Topic-carried payloads
// ----------------------------------------------------------------------------

/**
 * MI - subscribe to a set of tags
 */
class MsgOfInterestPayload : public Payload {
public:
  MsgOfInterest msg;

  MsgOfInterestPayload() = default;
  explicit MsgOfInterestPayload(std::set<Tag> tags) { msg.tags = std::move(tags); }

  Tag tag() const override { return Tag::MsgOfInterest; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size, DecodeState &state) override;
  PayloadPtr clone() const override { return std::make_unique<MsgOfInterestPayload>(*this); }
};

/**
 * TS - catchup response (ErrorRsp or UniEnsBlockRsp)
 */
class TopicMsgRespPayload : public Payload {
public:
  TopicMsgResp rsp;

  TopicMsgRespPayload() = default;
  explicit TopicMsgRespPayload(TopicMsgResp r) : rsp(std::move(r)) {}

  Tag tag() const override { return Tag::TopicMsgResp; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size, DecodeState &state) override;
  PayloadPtr clone() const override { return std::make_unique<TopicMsgRespPayload>(*this); }
};

/**
 * UE / UC - block and certificate requests
 */
class BlockRequestPayload : public Payload {
public:
  BlockRequest request;

  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size, DecodeState &state) override;

protected:
  BlockRequestPayload() = default;
  explicit BlockRequestPayload(const BlockRequest &req) : request(req) {}
};

class UniEnsBlockReqPayload : public BlockRequestPayload {
public:
  UniEnsBlockReqPayload() = default;
  explicit UniEnsBlockReqPayload(const BlockRequest &req) : BlockRequestPayload(req) {}

  Tag tag() const override { return Tag::UniEnsBlockReq; }
  PayloadPtr clone() const override { return std::make_unique<UniEnsBlockReqPayload>(*this); }
};

class UniCatchupReqPayload : public BlockRequestPayload {
public:
  UniCatchupReqPayload() = default;
  explicit UniCatchupReqPayload(const BlockRequest &req) : BlockRequestPayload(req) {}

  Tag tag() const override { return Tag::UniCatchupReq; }
  PayloadPtr clone() const override { return std::make_unique<UniCatchupReqPayload>(*this); }
};

// ----------------------------------------------------------------------------
// MessagePack payloads
// ----------------------------------------------------------------------------

/**
 * PP - block proposal
 */
class ProposalPayloadMessage : public Payload {
public:
  ProposalPayload proposal;

  Tag tag() const override { return Tag::ProposalPayload; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size, DecodeState &state) override;
  PayloadPtr clone() const override { return std::make_unique<ProposalPayloadMessage>(*this); }
};

/**
 * AV - agreement vote
 */
class AgreementVoteMessage : public Payload {
public:
  AgreementVote vote;

  Tag tag() const override { return Tag::AgreementVote; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size, DecodeState &state) override;
  PayloadPtr clone() const override { return std::make_unique<AgreementVoteMessage>(*this); }
};

/**
 * NP - answer to the handshake priority challenge
 */
class NetPrioResponseMessage : public Payload {
public:
  NetPrioResponse response;

  Tag tag() const override { return Tag::NetPrioResponse; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size, DecodeState &state) override;
  PayloadPtr clone() const override { return std::make_unique<NetPrioResponseMessage>(*this); }
};

/**
 * TX - signed transaction. Only the first transaction of a group is decoded.
 */
class TxnPayload : public Payload {
public:
  SignedTransaction txn;

  Tag tag() const override { return Tag::Txn; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size, DecodeState &state) override;
  PayloadPtr clone() const override { return std::make_unique<TxnPayload>(*this); }
};

// ----------------------------------------------------------------------------
// Fixed-size payloads
// ----------------------------------------------------------------------------

/**
 * MS - digest of a message the peer may skip
 */
class MsgDigestSkipPayload : public Payload {
public:
  std::array<uint8_t, protocol::MSG_DIGEST_SKIP_SIZE> digest{};

  MsgDigestSkipPayload() = default;
  explicit MsgDigestSkipPayload(const std::array<uint8_t, protocol::MSG_DIGEST_SKIP_SIZE> &d)
      : digest(d) {}

  Tag tag() const override { return Tag::MsgDigestSkip; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size, DecodeState &state) override;
  PayloadPtr clone() const override { return std::make_unique<MsgDigestSkipPayload>(*this); }
};

using PingNonce = std::array<uint8_t, protocol::PING_NONCE_SIZE>;

class NoncePayload : public Payload {
public:
  PingNonce nonce{};

  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *data, size_t size, DecodeState &state) override;

protected:
  NoncePayload() = default;
  explicit NoncePayload(const PingNonce &n) : nonce(n) {}
};

/**
 * pi - ping
 */
class PingPayload : public NoncePayload {
public:
  PingPayload() = default;
  explicit PingPayload(const PingNonce &n) : NoncePayload(n) {}

  Tag tag() const override { return Tag::Ping; }
  PayloadPtr clone() const override { return std::make_unique<PingPayload>(*this); }
};

/**
 * pj - ping reply
 */
class PingReplyPayload : public NoncePayload {
public:
  PingReplyPayload() = default;
  explicit PingReplyPayload(const PingNonce &n) : NoncePayload(n) {}

  Tag tag() const override { return Tag::PingReply; }
  PayloadPtr clone() const override { return std::make_unique<PingReplyPayload>(*this); }
};

// ----------------------------------------------------------------------------
// Escape hatches
// ----------------------------------------------------------------------------

/**
 * Bytes sent verbatim, tag included if the caller wants one. Used to inject
 * malformed or unmodeled messages.
 */
class RawBytesPayload : public Payload {
public:
  std::vector<uint8_t> bytes;

  RawBytesPayload() = default;
  explicit RawBytesPayload(std::vector<uint8_t> b) : bytes(std::move(b)) {}

  Tag tag() const override { return Tag::RawBytes; }
  std::vector<uint8_t> serialize() const override { return bytes; }
  bool deserialize(const uint8_t *data, size_t size, DecodeState &state) override;
  PayloadPtr clone() const override { return std::make_unique<RawBytesPayload>(*this); }
};

/**
 * A recognized tag whose body is not modeled. The body is not consumed and
 * the payload cannot be sent.
 */
class NotImplementedPayload : public Payload {
public:
  explicit NotImplementedPayload(Tag t) : tag_(t) {}

  Tag tag() const override { return tag_; }
  std::vector<uint8_t> serialize() const override;
  bool deserialize(const uint8_t *, size_t, DecodeState &) override { return true; }
  PayloadPtr clone() const override { return std::make_unique<NotImplementedPayload>(*this); }

private:
  Tag tag_;
};

// Factory: the payload a received body with this tag decodes into
// (nullptr for RawBytes, which never arrives off the wire)
PayloadPtr create_payload(Tag tag);

} // namespace message
} // namespace algoprobe
