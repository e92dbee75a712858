#include "network/tag.hpp"
#include "network/protocol.hpp"
#include "util/string_parsing.hpp"

namespace algoprobe {
namespace message {

namespace {

struct TagEntry {
  Tag tag;
  std::string_view code;
  std::string_view name;
};

constexpr std::array<TagEntry, NUM_WIRE_TAGS + 1> kTagTable = {{
    {Tag::UnknownMsg, "??", "UnknownMsg"},
    {Tag::AgreementVote, "AV", "AgreementVote"},
    {Tag::MsgOfInterest, "MI", "MsgOfInterest"},
    {Tag::MsgDigestSkip, "MS", "MsgDigestSkip"},
    {Tag::NetPrioResponse, "NP", "NetPrioResponse"},
    {Tag::Ping, "pi", "Ping"},
    {Tag::PingReply, "pj", "PingReply"},
    {Tag::ProposalPayload, "PP", "ProposalPayload"},
    {Tag::StateProofSig, "SP", "StateProofSig"},
    {Tag::TopicMsgResp, "TS", "TopicMsgResp"},
    {Tag::Txn, "TX", "Txn"},
    {Tag::UniCatchupReq, "UC", "UniCatchupReq"},
    {Tag::UniEnsBlockReq, "UE", "UniEnsBlockReq"},
    {Tag::VoteBundle, "VB", "VoteBundle"},
    {Tag::RawBytes, "", "RawBytes"},
}};

const TagEntry &Entry(Tag tag) {
  return kTagTable[static_cast<size_t>(tag)];
}

} // namespace

const std::array<Tag, NUM_WIRE_TAGS> &WireTags() {
  static const std::array<Tag, NUM_WIRE_TAGS> tags = [] {
    std::array<Tag, NUM_WIRE_TAGS> out{};
    for (size_t i = 0; i < NUM_WIRE_TAGS; ++i) {
      out[i] = kTagTable[i].tag;
    }
    return out;
  }();
  return tags;
}

std::string_view TagCode(Tag tag) { return Entry(tag).code; }

std::string_view TagName(Tag tag) { return Entry(tag).name; }

std::optional<Tag> TagFromCode(std::string_view code) {
  if (code.size() != protocol::TAG_SIZE) {
    return std::nullopt;
  }
  for (size_t i = 0; i < NUM_WIRE_TAGS; ++i) {
    if (kTagTable[i].code == code) {
      return kTagTable[i].tag;
    }
  }
  return std::nullopt;
}

std::optional<Tag> DecodeTag(const uint8_t *data, size_t size, DecodeState &state) {
  if (size < protocol::TAG_SIZE) {
    state.Invalid("short-tag", "message has " + std::to_string(size) + " bytes, tag needs 2");
    return std::nullopt;
  }
  if (data[0] > 0x7f || data[1] > 0x7f) {
    state.Invalid("non-ascii-tag", util::HexStr(data, protocol::TAG_SIZE));
    return std::nullopt;
  }

  std::string_view code(reinterpret_cast<const char *>(data), protocol::TAG_SIZE);
  auto tag = TagFromCode(code);
  if (!tag) {
    state.Invalid("unknown-tag", util::HexStr(data, protocol::TAG_SIZE));
    return std::nullopt;
  }
  return tag;
}

} // namespace message
} // namespace algoprobe
