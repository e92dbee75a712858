#pragma once

/*
 Structured payload bodies

 ProposalPayload, AgreementVote, NetPrioResponse and Txn bodies, and the
 block/cert values inside UniEnsBlockRsp topics, are MessagePack maps keyed by
 the short field names go-algorand uses ("snd", "rnd", "gh", ...).

 Conversion goes through nlohmann::json (from_msgpack / to_msgpack) with
 to_json / from_json overloads found by ADL. Fields fall in three groups:
   required   - missing key is a decode failure
   defaulted  - missing key leaves the default, zero value is omitted on encode
   optional   - std::optional, missing or nil decodes to std::nullopt
 Unknown keys are ignored, including entries of maps keyed by integers.
*/

#include "network/decode_state.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace algoprobe {
namespace message {

using json = nlohmann::json;

using Round = uint64_t;
using Period = uint64_t;
using Step = uint64_t;

// Thrown by from_json for shape errors nlohmann does not detect itself
// (wrong bin length, missing required key, unsupported variant)
class MsgpackError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * Fixed-size byte string carried as a msgpack bin of exactly N bytes
 */
template <size_t N, typename Kind>
struct FixedBytes {
  static constexpr size_t SIZE = N;

  std::array<uint8_t, N> bytes{};

  FixedBytes() = default;
  explicit FixedBytes(const std::array<uint8_t, N> &b) : bytes(b) {}

  bool operator==(const FixedBytes &) const = default;

  bool IsZero() const {
    for (uint8_t b : bytes) {
      if (b != 0) return false;
    }
    return true;
  }
};

using HashDigest = FixedBytes<32, struct HashDigestKind>;
using Ed25519PublicKey = FixedBytes<32, struct Ed25519PublicKeyKind>;
using Ed25519Seed = FixedBytes<32, struct Ed25519SeedKind>;
using Ed25519Signature = FixedBytes<64, struct Ed25519SignatureKind>;
using VrfProof = FixedBytes<80, struct VrfProofKind>;

/**
 * Account address: 32-byte public key
 *
 * Text form is base32 (no padding) of the key followed by the last 4 bytes
 * of SHA-512/256(key), 58 characters.
 */
class Address {
public:
  static constexpr size_t SIZE = 32;
  static constexpr size_t CHECKSUM_SIZE = 4;

  Address() = default;
  explicit Address(const std::array<uint8_t, SIZE> &bytes) : bytes_(bytes) {}

  // Parse checksummed base32 text; on failure returns std::nullopt and sets *error
  static std::optional<Address> FromString(const std::string &str,
                                           std::string *error = nullptr);
  std::string ToString() const;

  const std::array<uint8_t, SIZE> &bytes() const { return bytes_; }

  bool operator==(const Address &) const = default;

private:
  std::array<uint8_t, SIZE> bytes_{};
};

namespace detail {
template <size_t N>
void ReadFixedBin(const json &j, std::array<uint8_t, N> &out) {
  if (!j.is_binary()) {
    throw MsgpackError(std::string("expected a ") + std::to_string(N) +
                       " byte array, got " + j.type_name());
  }
  const auto &bin = j.get_binary();
  if (bin.size() != N) {
    throw MsgpackError("invalid byte array length: " + std::to_string(bin.size()));
  }
  std::copy(bin.begin(), bin.end(), out.begin());
}
} // namespace detail

template <size_t N, typename Kind>
void to_json(json &j, const FixedBytes<N, Kind> &value) {
  j = json::binary(std::vector<uint8_t>(value.bytes.begin(), value.bytes.end()));
}

template <size_t N, typename Kind>
void from_json(const json &j, FixedBytes<N, Kind> &value) {
  detail::ReadFixedBin(j, value.bytes);
}

void to_json(json &j, const Address &value);
void from_json(const json &j, Address &value);

// ============================================================================
// Consensus messages
// ============================================================================

// "Response"
struct Response {
  std::string nonce;  // "Nonce"
};

/**
 * Forward-secure signature (go-algorand crypto/onetimesig.go). All keys
 * required: "ps" is unused upstream but always present on the wire.
 */
struct OneTimeSignature {
  Ed25519Signature sig;      // "s"
  Ed25519PublicKey pk;       // "p"
  Ed25519Signature pksigold; // "ps"
  Ed25519PublicKey pk2;      // "p2"
  Ed25519Signature pk1sig;   // "p1s"
  Ed25519Signature pk2sig;   // "p2s"
};

// Answer to the priority challenge issued in the handshake response
struct NetPrioResponse {
  Response response;     // "Response"
  Round round = 0;       // "Round"
  Address sender;        // "Sender"
  OneTimeSignature sig;  // "Sig"
};

struct ProposalValue {
  Period original_period = 0;  // "oper", defaulted
  Address original_proposer;   // "oprop"
  HashDigest block_digest;     // "dig"
  HashDigest encoding_digest;  // "encdig"
};

struct RawVote {
  Address sender;                         // "snd"
  Round round = 0;                        // "rnd"
  Period period = 0;                      // "per", defaulted
  Step step = 0;                          // "step", defaulted
  std::optional<ProposalValue> proposal;  // "prop"
};

struct UnauthenticatedCredential {
  std::optional<VrfProof> vrf_proof;  // "pf"
};

struct UnauthenticatedVote {
  std::optional<RawVote> raw_vote;                    // "r"
  std::optional<UnauthenticatedCredential> cred;      // "cred"
  std::optional<OneTimeSignature> sig;                // "sig"
};

// transmittedPayload (go-algorand agreement/proposal.go)
struct ProposalPayload {
  uint64_t earn = 0;                         // defaulted
  Address fee_sink;                          // "fees"
  uint64_t leftover_fraction = 0;            // "frac", defaulted
  std::string genesis_id;                    // "gen"
  HashDigest genesis_hash;                   // "gh"
  std::optional<HashDigest> previous_block_hash;  // "prev"
  std::string protocol_current;              // "proto"
  uint64_t rewards_rate = 0;                 // "rate"
  Round round = 0;                           // "rnd", defaulted
  Round rewards_recalc_round = 0;            // "rwcalr"
  Address rewards_pool;                      // "rwd"
  std::optional<Ed25519Seed> sortition_seed; // "seed"
  int64_t timestamp = 0;                     // "ts", defaulted
  std::optional<HashDigest> txn_root;        // "txn"
  std::optional<HashDigest> txn_root_sha256; // "txn256"
  std::optional<VrfProof> seed_proof;        // "sdpf"
  Period original_period = 0;                // "oper", defaulted
  Address original_proposer;                 // "oprop"
  std::optional<UnauthenticatedVote> prior_vote;  // "pv"
};

struct AgreementVote {
  RawVote raw_vote;                     // "r"
  UnauthenticatedCredential cred;       // "cred"
  OneTimeSignature sig;                 // "sig"
};

// ============================================================================
// Transactions
// ============================================================================

struct Payment {
  Address receiver;                       // "rcv"
  uint64_t amount = 0;                    // "amt"
  std::optional<Address> close_remainder; // "close"
};

// Only payment transactions ("type": "pay") are modelled
struct Transaction {
  uint64_t fee = 0;                  // "fee"
  Round first_valid = 0;             // "fv"
  HashDigest genesis_hash;           // "gh"
  Round last_valid = 0;              // "lv"
  Address sender;                    // "snd"
  std::string genesis_id;            // "gen", defaulted
  std::optional<HashDigest> group;   // "grp"
  std::optional<HashDigest> lease;   // "lx"
  std::vector<uint8_t> note;         // "note", defaulted
  std::optional<Address> rekey_to;   // "rekey"
  Payment payment;                   // flattened, "type" = "pay"
};

struct MultisigSubsig {
  Ed25519PublicKey key;                // "pk"
  std::optional<Ed25519Signature> sig; // "s"
};

struct MultisigSignature {
  std::vector<MultisigSubsig> subsigs;  // "subsig"
  uint8_t threshold = 0;                // "thr"
  uint8_t version = 0;                  // "v"
};

struct SignedTransaction {
  std::optional<Ed25519Signature> sig;    // "sig"
  std::optional<MultisigSignature> msig;  // "msig"
  Transaction txn;                        // "txn"
};

// ============================================================================
// Catchup service bodies (carried inside UniEnsBlockRsp topics)
// ============================================================================

// Block header as served by the catchup service; every field is optional
struct BlockHeader {
  uint64_t earn = 0;
  std::optional<Address> fee_sink;             // "fees"
  uint64_t leftover_fraction = 0;              // "frac"
  std::string genesis_id;                      // "gen"
  std::optional<HashDigest> genesis_hash;      // "gh"
  std::optional<HashDigest> previous_block_hash;  // "prev"
  std::string protocol_current;                // "proto"
  uint64_t rewards_rate = 0;                   // "rate"
  Round round = 0;                             // "rnd"
  Round rewards_recalc_round = 0;              // "rwcalr"
  std::optional<Address> rewards_pool;         // "rwd"
  std::optional<Ed25519Seed> sortition_seed;   // "seed"
  int64_t timestamp = 0;                       // "ts"
  std::optional<HashDigest> txn_root;          // "txn"
  std::optional<HashDigest> txn_root_sha256;   // "txn256"
};

struct CertificateProposal {
  HashDigest block_digest;  // "dig"
};

struct Certificate {
  std::optional<CertificateProposal> proposal;  // "prop"
};

#define ALGOPROBE_DECLARE_JSON(Type)                                           \
  void to_json(json &j, const Type &value);                                    \
  void from_json(const json &j, Type &value)

ALGOPROBE_DECLARE_JSON(Response);
ALGOPROBE_DECLARE_JSON(OneTimeSignature);
ALGOPROBE_DECLARE_JSON(NetPrioResponse);
ALGOPROBE_DECLARE_JSON(ProposalValue);
ALGOPROBE_DECLARE_JSON(RawVote);
ALGOPROBE_DECLARE_JSON(UnauthenticatedCredential);
ALGOPROBE_DECLARE_JSON(UnauthenticatedVote);
ALGOPROBE_DECLARE_JSON(ProposalPayload);
ALGOPROBE_DECLARE_JSON(AgreementVote);
ALGOPROBE_DECLARE_JSON(Payment);
ALGOPROBE_DECLARE_JSON(Transaction);
ALGOPROBE_DECLARE_JSON(MultisigSubsig);
ALGOPROBE_DECLARE_JSON(MultisigSignature);
ALGOPROBE_DECLARE_JSON(SignedTransaction);
ALGOPROBE_DECLARE_JSON(BlockHeader);
ALGOPROBE_DECLARE_JSON(CertificateProposal);
ALGOPROBE_DECLARE_JSON(Certificate);

#undef ALGOPROBE_DECLARE_JSON

/**
 * Copy the first MessagePack value in [data, data + size), leaving out every
 * map entry whose key is not a string. go-algorand writes some maps with
 * integer keys ("spt" in block headers); nlohmann only reads string keys.
 *
 * strict: bytes after the value are an error.
 * Throws MsgpackError on truncated or malformed input.
 */
std::vector<uint8_t> DropNonStringKeys(const uint8_t *data, size_t size, bool strict);

/**
 * Serialize a record as one MessagePack value
 */
template <typename T>
std::vector<uint8_t> ToMsgpack(const T &value) {
  return json::to_msgpack(json(value));
}

/**
 * Decode a MessagePack value into a record
 *
 * strict: the value must span the whole buffer. Txn bodies decode only the
 * first value of a transaction group and pass strict = false.
 *
 * On failure records "bad-msgpack" naming type_name and returns false.
 */
template <typename T>
bool FromMsgpack(const uint8_t *data, size_t size, T &out, DecodeState &state,
                 const char *type_name, bool strict = true) {
  try {
    json j = json::from_msgpack(DropNonStringKeys(data, size, strict));
    out = j.get<T>();
    return true;
  } catch (const json::exception &e) {
    return state.Invalid("bad-msgpack", std::string("couldn't deserialize the ") +
                                            type_name + ": " + e.what());
  } catch (const MsgpackError &e) {
    return state.Invalid("bad-msgpack", std::string("couldn't deserialize the ") +
                                            type_name + ": " + e.what());
  }
}

} // namespace message
} // namespace algoprobe
