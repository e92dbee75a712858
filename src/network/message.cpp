#include "network/message.hpp"
#include "util/endian.hpp"
#include <algorithm>
#include <stdexcept>

namespace algoprobe {
namespace message {

// MessageSerializer implementation
MessageSerializer::MessageSerializer() {
  buffer_.reserve(256);
}

void MessageSerializer::write_uint8(uint8_t value) { buffer_.push_back(value); }

void MessageSerializer::write_uint64(uint64_t value) {
  size_t pos = buffer_.size();
  buffer_.resize(pos + 8);
  endian::WriteLE64(buffer_.data() + pos, value);
}

void MessageSerializer::write_bytes(const uint8_t *data, size_t len) {
  buffer_.insert(buffer_.end(), data, data + len);
}

void MessageSerializer::write_bytes(const std::vector<uint8_t> &data) {
  buffer_.insert(buffer_.end(), data.begin(), data.end());
}

// MessageDeserializer implementation
MessageDeserializer::MessageDeserializer(const uint8_t *data, size_t size)
    : data_(data), size_(size), position_(0), error_(false) {}

MessageDeserializer::MessageDeserializer(const std::vector<uint8_t> &data)
    : data_(data.data()), size_(data.size()), position_(0), error_(false) {}

void MessageDeserializer::check_available(size_t bytes) {
  if (bytes_remaining() < bytes) {
    error_ = true;
  }
}

uint8_t MessageDeserializer::read_uint8() {
  check_available(1);
  if (error_)
    return 0;
  return data_[position_++];
}

uint64_t MessageDeserializer::read_uint64() {
  check_available(8);
  if (error_)
    return 0;
  uint64_t value = endian::ReadLE64(data_ + position_);
  position_ += 8;
  return value;
}

std::vector<uint8_t> MessageDeserializer::read_bytes(size_t count) {
  check_available(count);
  if (error_)
    return {};

  std::vector<uint8_t> result(data_ + position_, data_ + position_ + count);
  position_ += count;
  return result;
}

void MessageDeserializer::skip(size_t count) {
  check_available(count);
  if (!error_)
    position_ += count;
}

// Factory function
PayloadPtr create_payload(Tag tag) {
  switch (tag) {
  case Tag::MsgOfInterest:
    return std::make_unique<MsgOfInterestPayload>();
  case Tag::TopicMsgResp:
    return std::make_unique<TopicMsgRespPayload>();
  case Tag::ProposalPayload:
    return std::make_unique<ProposalPayloadMessage>();
  case Tag::AgreementVote:
    return std::make_unique<AgreementVoteMessage>();
  case Tag::NetPrioResponse:
    return std::make_unique<NetPrioResponseMessage>();
  case Tag::Txn:
    return std::make_unique<TxnPayload>();
  case Tag::MsgDigestSkip:
    return std::make_unique<MsgDigestSkipPayload>();
  case Tag::Ping:
    return std::make_unique<PingPayload>();
  case Tag::PingReply:
    return std::make_unique<PingReplyPayload>();
  case Tag::UnknownMsg:
  case Tag::StateProofSig:
  case Tag::VoteBundle:
  case Tag::UniEnsBlockReq:
  case Tag::UniCatchupReq:
    // Requests are only ever sent by us; their inbound body is not modeled
    return std::make_unique<NotImplementedPayload>(tag);
  case Tag::RawBytes:
    return nullptr;
  }
  return nullptr;
}

// Payload implementations

// MsgOfInterestPayload
std::vector<uint8_t> MsgOfInterestPayload::serialize() const {
  return MarshalTopics(ToTopics(msg));
}

bool MsgOfInterestPayload::deserialize(const uint8_t *data, size_t size, DecodeState &state) {
  std::vector<Topic> topics;
  if (!UnmarshalTopics(data, size, topics, state)) {
    return false;
  }
  return MsgOfInterestFromTopics(topics, msg, state);
}

// TopicMsgRespPayload
std::vector<uint8_t> TopicMsgRespPayload::serialize() const {
  return MarshalTopics(ToTopics(rsp));
}

bool TopicMsgRespPayload::deserialize(const uint8_t *data, size_t size, DecodeState &state) {
  std::vector<Topic> topics;
  if (!UnmarshalTopics(data, size, topics, state)) {
    return false;
  }
  return TopicMsgRespFromTopics(topics, rsp, state);
}

// BlockRequestPayload
std::vector<uint8_t> BlockRequestPayload::serialize() const {
  return MarshalTopics(ToTopics(request));
}

bool BlockRequestPayload::deserialize(const uint8_t *data, size_t size, DecodeState &state) {
  std::vector<Topic> topics;
  if (!UnmarshalTopics(data, size, topics, state)) {
    return false;
  }
  return BlockRequestFromTopics(topics, request, state);
}

// ProposalPayloadMessage
std::vector<uint8_t> ProposalPayloadMessage::serialize() const {
  return ToMsgpack(proposal);
}

bool ProposalPayloadMessage::deserialize(const uint8_t *data, size_t size, DecodeState &state) {
  return FromMsgpack(data, size, proposal, state, "ProposalPayload");
}

// AgreementVoteMessage
std::vector<uint8_t> AgreementVoteMessage::serialize() const {
  return ToMsgpack(vote);
}

bool AgreementVoteMessage::deserialize(const uint8_t *data, size_t size, DecodeState &state) {
  return FromMsgpack(data, size, vote, state, "AgreementVote");
}

// NetPrioResponseMessage
std::vector<uint8_t> NetPrioResponseMessage::serialize() const {
  return ToMsgpack(response);
}

bool NetPrioResponseMessage::deserialize(const uint8_t *data, size_t size, DecodeState &state) {
  return FromMsgpack(data, size, response, state, "NetPrioResponse");
}

// TxnPayload
std::vector<uint8_t> TxnPayload::serialize() const {
  return ToMsgpack(txn);
}

bool TxnPayload::deserialize(const uint8_t *data, size_t size, DecodeState &state) {
  return FromMsgpack(data, size, txn, state, "SignedTransaction", /*strict=*/false);
}

// MsgDigestSkipPayload
std::vector<uint8_t> MsgDigestSkipPayload::serialize() const {
  return std::vector<uint8_t>(digest.begin(), digest.end());
}

bool MsgDigestSkipPayload::deserialize(const uint8_t *data, size_t size, DecodeState &state) {
  if (size != digest.size()) {
    return state.Invalid("bad-digest-size", "MsgDigestSkip body is " + std::to_string(size) +
                                                " bytes, expected " +
                                                std::to_string(digest.size()));
  }
  std::copy(data, data + size, digest.begin());
  return true;
}

// NoncePayload (Ping / PingReply)
std::vector<uint8_t> NoncePayload::serialize() const {
  return std::vector<uint8_t>(nonce.begin(), nonce.end());
}

bool NoncePayload::deserialize(const uint8_t *data, size_t size, DecodeState &state) {
  if (size != nonce.size()) {
    return state.Invalid("bad-nonce-size", std::string(TagName(tag())) + " body is " +
                                               std::to_string(size) + " bytes, expected " +
                                               std::to_string(nonce.size()));
  }
  std::copy(data, data + size, nonce.begin());
  return true;
}

// RawBytesPayload
bool RawBytesPayload::deserialize(const uint8_t *data, size_t size, DecodeState &) {
  bytes.assign(data, data + size);
  return true;
}

// NotImplementedPayload
std::vector<uint8_t> NotImplementedPayload::serialize() const {
  throw std::logic_error("payload with tag " + std::string(TagName(tag_)) +
                         " has no outbound encoding");
}

} // namespace message
} // namespace algoprobe
