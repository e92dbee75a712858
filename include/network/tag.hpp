#pragma once

#include "network/decode_state.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace algoprobe {
namespace message {

/**
 * Tag - message kind identifier (go-algorand protocol/tags.go)
 *
 * Every wire tag has a 2-character ASCII code. RawBytes is internal only:
 * its code is empty, so encoding a RawBytes payload writes no tag bytes and
 * the caller-supplied bytes go out verbatim.
 */
enum class Tag : uint8_t {
  UnknownMsg,       // "??"
  AgreementVote,    // "AV"
  MsgOfInterest,    // "MI"
  MsgDigestSkip,    // "MS"
  NetPrioResponse,  // "NP"
  Ping,             // "pi"
  PingReply,        // "pj"
  ProposalPayload,  // "PP"
  StateProofSig,    // "SP"
  TopicMsgResp,     // "TS"
  Txn,              // "TX"
  UniCatchupReq,    // "UC"
  UniEnsBlockReq,   // "UE"
  VoteBundle,       // "VB"
  RawBytes,         // no wire code
};

constexpr size_t NUM_WIRE_TAGS = 14;

// All tags with a wire code, in enum order
const std::array<Tag, NUM_WIRE_TAGS> &WireTags();

// Wire code of a tag ("" for RawBytes)
std::string_view TagCode(Tag tag);

// Human-readable name for logs
std::string_view TagName(Tag tag);

// Exact code lookup; std::nullopt for anything not in the table
std::optional<Tag> TagFromCode(std::string_view code);

/**
 * Decode the 2-byte tag at the start of a message body
 *
 * Fails with:
 *   "short-tag"      fewer than 2 bytes available
 *   "non-ascii-tag"  a byte outside 0x00..0x7f
 *   "unknown-tag"    a well-formed ASCII pair that is not in the table
 *                    ("??" itself maps to UnknownMsg)
 */
std::optional<Tag> DecodeTag(const uint8_t *data, size_t size, DecodeState &state);

} // namespace message
} // namespace algoprobe
