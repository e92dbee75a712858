// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/msgpack_types.hpp"
#include "util/base_encoding.hpp"
#include "util/endian.hpp"
#include "util/hash.hpp"
#include <algorithm>

namespace algoprobe {
namespace message {

namespace {

constexpr size_t MAX_MSGPACK_DEPTH = 256;

bool IsStringType(uint8_t type) {
  return (type >= 0xa0 && type <= 0xbf) || (type >= 0xd9 && type <= 0xdb);
}

void WriteMapHeader(size_t count, std::vector<uint8_t> &out) {
  if (count < 16) {
    out.push_back(static_cast<uint8_t>(0x80 | count));
  } else if (count <= 0xffff) {
    uint8_t header[3] = {0xde};
    endian::WriteBE16(header + 1, static_cast<uint16_t>(count));
    out.insert(out.end(), header, header + sizeof(header));
  } else {
    uint8_t header[5] = {0xdf};
    endian::WriteBE32(header + 1, static_cast<uint32_t>(count));
    out.insert(out.end(), header, header + sizeof(header));
  }
}

// Walks one MessagePack value, copying it to out (or skipping it when out is
// null) with non-string map keys removed
class KeyFilter {
public:
  KeyFilter(const uint8_t *data, size_t size) : data_(data), size_(size) {}

  size_t position() const { return pos_; }

  void Value(std::vector<uint8_t> *out, size_t depth) {
    if (depth > MAX_MSGPACK_DEPTH) {
      throw MsgpackError("msgpack nesting too deep");
    }
    const size_t start = pos_;
    const uint8_t type = *Take(1);

    if (type <= 0x7f || type >= 0xe0 || type == 0xc0 || type == 0xc2 || type == 0xc3) {
      // fixint, nil, bool
    } else if (type <= 0x8f) {
      return Map(type & 0x0f, out, depth);
    } else if (type <= 0x9f) {
      return Array(type & 0x0f, start, out, depth);
    } else if (type <= 0xbf) {
      Take(type & 0x1f);
    } else {
      switch (type) {
      case 0xc4: case 0xd9: Take(Length(1)); break;
      case 0xc5: case 0xda: Take(Length(2)); break;
      case 0xc6: case 0xdb: Take(Length(4)); break;
      case 0xc7: Take(Length(1) + 1); break;
      case 0xc8: Take(Length(2) + 1); break;
      case 0xc9: Take(Length(4) + 1); break;
      case 0xca: Take(4); break;
      case 0xcb: Take(8); break;
      case 0xcc: case 0xd0: Take(1); break;
      case 0xcd: case 0xd1: Take(2); break;
      case 0xce: case 0xd2: Take(4); break;
      case 0xcf: case 0xd3: Take(8); break;
      case 0xd4: Take(2); break;
      case 0xd5: Take(3); break;
      case 0xd6: Take(5); break;
      case 0xd7: Take(9); break;
      case 0xd8: Take(17); break;
      case 0xdc: return Array(Length(2), start, out, depth);
      case 0xdd: return Array(Length(4), start, out, depth);
      case 0xde: return Map(Length(2), out, depth);
      case 0xdf: return Map(Length(4), out, depth);
      default:
        throw MsgpackError("invalid msgpack type byte 0xc1");
      }
    }
    if (out) {
      out->insert(out->end(), data_ + start, data_ + pos_);
    }
  }

private:
  const uint8_t *Take(size_t n) {
    if (n > size_ - pos_) {
      throw MsgpackError("unexpected end of msgpack input");
    }
    const uint8_t *p = data_ + pos_;
    pos_ += n;
    return p;
  }

  size_t Length(size_t width) {
    const uint8_t *p = Take(width);
    switch (width) {
    case 1: return p[0];
    case 2: return endian::ReadBE16(p);
    default: return endian::ReadBE32(p);
    }
  }

  void Array(size_t count, size_t start, std::vector<uint8_t> *out, size_t depth) {
    if (out) {
      out->insert(out->end(), data_ + start, data_ + pos_);
    }
    for (size_t i = 0; i < count; ++i) {
      Value(out, depth + 1);
    }
  }

  void Map(size_t count, std::vector<uint8_t> *out, size_t depth) {
    std::vector<uint8_t> entries;
    size_t kept = 0;
    for (size_t i = 0; i < count; ++i) {
      if (pos_ >= size_) {
        throw MsgpackError("unexpected end of msgpack input");
      }
      const bool keep = IsStringType(data_[pos_]);
      std::vector<uint8_t> *target = (out && keep) ? &entries : nullptr;
      Value(target, depth + 1);
      Value(target, depth + 1);
      if (keep) {
        ++kept;
      }
    }
    if (out) {
      WriteMapHeader(kept, *out);
      out->insert(out->end(), entries.begin(), entries.end());
    }
  }

  const uint8_t *data_;
  size_t size_;
  size_t pos_ = 0;
};

void ExpectMap(const json &j, const char *type_name) {
  if (!j.is_object()) {
    throw MsgpackError(std::string(type_name) + " must be a map, got " + j.type_name());
  }
}

template <typename T>
void Required(const json &j, const char *key, T &out) {
  auto it = j.find(key);
  if (it == j.end()) {
    throw MsgpackError(std::string("missing field '") + key + "'");
  }
  it->get_to(out);
}

template <typename T>
void Defaulted(const json &j, const char *key, T &out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    it->get_to(out);
  }
}

template <typename T>
void Optional(const json &j, const char *key, std::optional<T> &out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    out.reset();
    return;
  }
  out = it->get<T>();
}

template <typename T>
void PutOptional(json &j, const char *key, const std::optional<T> &value) {
  if (value) {
    j[key] = *value;
  }
}

template <typename T>
void PutNonZero(json &j, const char *key, const T &value) {
  if (value != T{}) {
    j[key] = value;
  }
}

void ReadBytes(const json &j, const char *key, std::vector<uint8_t> &out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return;
  }
  if (!it->is_binary()) {
    throw MsgpackError(std::string("field '") + key + "' must be bin");
  }
  const auto &bin = it->get_binary();
  out.assign(bin.begin(), bin.end());
}

} // namespace

// ============================================================================
// Address
// ============================================================================

std::optional<Address> Address::FromString(const std::string &str, std::string *error) {
  auto set_error = [error](const std::string &msg) {
    if (error) *error = msg;
  };

  auto decoded = util::DecodeBase32NoPad(str);
  if (!decoded) {
    set_error("error decoding base32");
    return std::nullopt;
  }
  if (decoded->size() != SIZE + CHECKSUM_SIZE) {
    set_error("wrong address length: " + std::to_string(decoded->size()));
    return std::nullopt;
  }

  auto digest = util::Sha512_256(decoded->data(), SIZE);
  if (!std::equal(digest.end() - CHECKSUM_SIZE, digest.end(), decoded->begin() + SIZE)) {
    set_error("input checksum did not validate");
    return std::nullopt;
  }

  std::array<uint8_t, SIZE> key{};
  std::copy(decoded->begin(), decoded->begin() + SIZE, key.begin());
  return Address(key);
}

std::string Address::ToString() const {
  auto digest = util::Sha512_256(bytes_.data(), bytes_.size());
  std::vector<uint8_t> with_checksum(bytes_.begin(), bytes_.end());
  with_checksum.insert(with_checksum.end(), digest.end() - CHECKSUM_SIZE, digest.end());
  return util::EncodeBase32NoPad(with_checksum.data(), with_checksum.size());
}

void to_json(json &j, const Address &value) {
  j = json::binary(std::vector<uint8_t>(value.bytes().begin(), value.bytes().end()));
}

void from_json(const json &j, Address &value) {
  std::array<uint8_t, Address::SIZE> key{};
  detail::ReadFixedBin(j, key);
  value = Address(key);
}

// ============================================================================
// Consensus messages
// ============================================================================

void to_json(json &j, const Response &value) {
  j = json::object();
  j["Nonce"] = value.nonce;
}

void from_json(const json &j, Response &value) {
  ExpectMap(j, "Response");
  Required(j, "Nonce", value.nonce);
}

void to_json(json &j, const OneTimeSignature &value) {
  j = json::object();
  j["s"] = value.sig;
  j["p"] = value.pk;
  j["ps"] = value.pksigold;
  j["p2"] = value.pk2;
  j["p1s"] = value.pk1sig;
  j["p2s"] = value.pk2sig;
}

void from_json(const json &j, OneTimeSignature &value) {
  ExpectMap(j, "OneTimeSignature");
  Required(j, "s", value.sig);
  Required(j, "p", value.pk);
  Required(j, "ps", value.pksigold);
  Required(j, "p2", value.pk2);
  Required(j, "p1s", value.pk1sig);
  Required(j, "p2s", value.pk2sig);
}

void to_json(json &j, const NetPrioResponse &value) {
  j = json::object();
  j["Response"] = value.response;
  j["Round"] = value.round;
  j["Sender"] = value.sender;
  j["Sig"] = value.sig;
}

void from_json(const json &j, NetPrioResponse &value) {
  ExpectMap(j, "NetPrioResponse");
  Required(j, "Response", value.response);
  Required(j, "Round", value.round);
  Required(j, "Sender", value.sender);
  Required(j, "Sig", value.sig);
}

void to_json(json &j, const ProposalValue &value) {
  j = json::object();
  PutNonZero(j, "oper", value.original_period);
  j["oprop"] = value.original_proposer;
  j["dig"] = value.block_digest;
  j["encdig"] = value.encoding_digest;
}

void from_json(const json &j, ProposalValue &value) {
  ExpectMap(j, "ProposalValue");
  Defaulted(j, "oper", value.original_period);
  Required(j, "oprop", value.original_proposer);
  Required(j, "dig", value.block_digest);
  Required(j, "encdig", value.encoding_digest);
}

void to_json(json &j, const RawVote &value) {
  j = json::object();
  j["snd"] = value.sender;
  j["rnd"] = value.round;
  PutNonZero(j, "per", value.period);
  PutNonZero(j, "step", value.step);
  PutOptional(j, "prop", value.proposal);
}

void from_json(const json &j, RawVote &value) {
  ExpectMap(j, "RawVote");
  Required(j, "snd", value.sender);
  Required(j, "rnd", value.round);
  Defaulted(j, "per", value.period);
  Defaulted(j, "step", value.step);
  Optional(j, "prop", value.proposal);
}

void to_json(json &j, const UnauthenticatedCredential &value) {
  j = json::object();
  PutOptional(j, "pf", value.vrf_proof);
}

void from_json(const json &j, UnauthenticatedCredential &value) {
  ExpectMap(j, "UnauthenticatedCredential");
  Optional(j, "pf", value.vrf_proof);
}

void to_json(json &j, const UnauthenticatedVote &value) {
  j = json::object();
  PutOptional(j, "r", value.raw_vote);
  PutOptional(j, "cred", value.cred);
  PutOptional(j, "sig", value.sig);
}

void from_json(const json &j, UnauthenticatedVote &value) {
  ExpectMap(j, "UnauthenticatedVote");
  Optional(j, "r", value.raw_vote);
  Optional(j, "cred", value.cred);
  Optional(j, "sig", value.sig);
}

void to_json(json &j, const ProposalPayload &value) {
  j = json::object();
  PutNonZero(j, "earn", value.earn);
  j["fees"] = value.fee_sink;
  PutNonZero(j, "frac", value.leftover_fraction);
  j["gen"] = value.genesis_id;
  j["gh"] = value.genesis_hash;
  PutOptional(j, "prev", value.previous_block_hash);
  j["proto"] = value.protocol_current;
  j["rate"] = value.rewards_rate;
  PutNonZero(j, "rnd", value.round);
  j["rwcalr"] = value.rewards_recalc_round;
  j["rwd"] = value.rewards_pool;
  PutOptional(j, "seed", value.sortition_seed);
  PutNonZero(j, "ts", value.timestamp);
  PutOptional(j, "txn", value.txn_root);
  PutOptional(j, "txn256", value.txn_root_sha256);
  PutOptional(j, "sdpf", value.seed_proof);
  PutNonZero(j, "oper", value.original_period);
  j["oprop"] = value.original_proposer;
  PutOptional(j, "pv", value.prior_vote);
}

void from_json(const json &j, ProposalPayload &value) {
  ExpectMap(j, "ProposalPayload");
  Defaulted(j, "earn", value.earn);
  Required(j, "fees", value.fee_sink);
  Defaulted(j, "frac", value.leftover_fraction);
  Required(j, "gen", value.genesis_id);
  Required(j, "gh", value.genesis_hash);
  Optional(j, "prev", value.previous_block_hash);
  Required(j, "proto", value.protocol_current);
  Required(j, "rate", value.rewards_rate);
  Defaulted(j, "rnd", value.round);
  Required(j, "rwcalr", value.rewards_recalc_round);
  Required(j, "rwd", value.rewards_pool);
  Optional(j, "seed", value.sortition_seed);
  Defaulted(j, "ts", value.timestamp);
  Optional(j, "txn", value.txn_root);
  Optional(j, "txn256", value.txn_root_sha256);
  Optional(j, "sdpf", value.seed_proof);
  Defaulted(j, "oper", value.original_period);
  Required(j, "oprop", value.original_proposer);
  Optional(j, "pv", value.prior_vote);
}

void to_json(json &j, const AgreementVote &value) {
  j = json::object();
  j["r"] = value.raw_vote;
  j["cred"] = value.cred;
  j["sig"] = value.sig;
}

void from_json(const json &j, AgreementVote &value) {
  ExpectMap(j, "AgreementVote");
  Required(j, "r", value.raw_vote);
  Required(j, "cred", value.cred);
  Required(j, "sig", value.sig);
}

// ============================================================================
// Transactions
// ============================================================================

void to_json(json &j, const Payment &value) {
  j = json::object();
  j["rcv"] = value.receiver;
  j["amt"] = value.amount;
  PutOptional(j, "close", value.close_remainder);
}

void from_json(const json &j, Payment &value) {
  ExpectMap(j, "Payment");
  Required(j, "rcv", value.receiver);
  Required(j, "amt", value.amount);
  Optional(j, "close", value.close_remainder);
}

void to_json(json &j, const Transaction &value) {
  // Payment fields are flattened into the transaction map
  j = json(value.payment);
  j["type"] = "pay";
  j["fee"] = value.fee;
  j["fv"] = value.first_valid;
  j["gh"] = value.genesis_hash;
  j["lv"] = value.last_valid;
  j["snd"] = value.sender;
  PutNonZero(j, "gen", value.genesis_id);
  PutOptional(j, "grp", value.group);
  PutOptional(j, "lx", value.lease);
  if (!value.note.empty()) {
    j["note"] = json::binary(value.note);
  }
  PutOptional(j, "rekey", value.rekey_to);
}

void from_json(const json &j, Transaction &value) {
  ExpectMap(j, "Transaction");
  std::string type;
  Required(j, "type", type);
  if (type != "pay") {
    throw MsgpackError("unsupported transaction type '" + type + "'");
  }
  Required(j, "fee", value.fee);
  Required(j, "fv", value.first_valid);
  Required(j, "gh", value.genesis_hash);
  Required(j, "lv", value.last_valid);
  Required(j, "snd", value.sender);
  Defaulted(j, "gen", value.genesis_id);
  Optional(j, "grp", value.group);
  Optional(j, "lx", value.lease);
  ReadBytes(j, "note", value.note);
  Optional(j, "rekey", value.rekey_to);
  from_json(j, value.payment);
}

void to_json(json &j, const MultisigSubsig &value) {
  j = json::object();
  j["pk"] = value.key;
  PutOptional(j, "s", value.sig);
}

void from_json(const json &j, MultisigSubsig &value) {
  ExpectMap(j, "MultisigSubsig");
  Required(j, "pk", value.key);
  Optional(j, "s", value.sig);
}

void to_json(json &j, const MultisigSignature &value) {
  j = json::object();
  j["subsig"] = value.subsigs;
  j["thr"] = value.threshold;
  j["v"] = value.version;
}

void from_json(const json &j, MultisigSignature &value) {
  ExpectMap(j, "MultisigSignature");
  Required(j, "subsig", value.subsigs);
  Required(j, "thr", value.threshold);
  Required(j, "v", value.version);
}

void to_json(json &j, const SignedTransaction &value) {
  j = json::object();
  PutOptional(j, "sig", value.sig);
  PutOptional(j, "msig", value.msig);
  j["txn"] = value.txn;
}

void from_json(const json &j, SignedTransaction &value) {
  ExpectMap(j, "SignedTransaction");
  Optional(j, "sig", value.sig);
  Optional(j, "msig", value.msig);
  Required(j, "txn", value.txn);
}

std::vector<uint8_t> DropNonStringKeys(const uint8_t *data, size_t size, bool strict) {
  KeyFilter filter(data, size);
  std::vector<uint8_t> out;
  out.reserve(size);
  filter.Value(&out, 0);
  if (strict && filter.position() != size) {
    throw MsgpackError(std::to_string(size - filter.position()) +
                       " trailing bytes after msgpack value");
  }
  return out;
}

// ============================================================================
// Catchup service bodies
// ============================================================================

void to_json(json &j, const BlockHeader &value) {
  j = json::object();
  PutNonZero(j, "earn", value.earn);
  PutOptional(j, "fees", value.fee_sink);
  PutNonZero(j, "frac", value.leftover_fraction);
  PutNonZero(j, "gen", value.genesis_id);
  PutOptional(j, "gh", value.genesis_hash);
  PutOptional(j, "prev", value.previous_block_hash);
  PutNonZero(j, "proto", value.protocol_current);
  PutNonZero(j, "rate", value.rewards_rate);
  PutNonZero(j, "rnd", value.round);
  PutNonZero(j, "rwcalr", value.rewards_recalc_round);
  PutOptional(j, "rwd", value.rewards_pool);
  PutOptional(j, "seed", value.sortition_seed);
  PutNonZero(j, "ts", value.timestamp);
  PutOptional(j, "txn", value.txn_root);
  PutOptional(j, "txn256", value.txn_root_sha256);
}

void from_json(const json &j, BlockHeader &value) {
  ExpectMap(j, "BlockHeader");
  Defaulted(j, "earn", value.earn);
  Optional(j, "fees", value.fee_sink);
  Defaulted(j, "frac", value.leftover_fraction);
  Defaulted(j, "gen", value.genesis_id);
  Optional(j, "gh", value.genesis_hash);
  Optional(j, "prev", value.previous_block_hash);
  Defaulted(j, "proto", value.protocol_current);
  Defaulted(j, "rate", value.rewards_rate);
  Defaulted(j, "rnd", value.round);
  Defaulted(j, "rwcalr", value.rewards_recalc_round);
  Optional(j, "rwd", value.rewards_pool);
  Optional(j, "seed", value.sortition_seed);
  Defaulted(j, "ts", value.timestamp);
  Optional(j, "txn", value.txn_root);
  Optional(j, "txn256", value.txn_root_sha256);
}

void to_json(json &j, const CertificateProposal &value) {
  j = json::object();
  j["dig"] = value.block_digest;
}

void from_json(const json &j, CertificateProposal &value) {
  ExpectMap(j, "CertificateProposal");
  Required(j, "dig", value.block_digest);
}

void to_json(json &j, const Certificate &value) {
  j = json::object();
  PutOptional(j, "prop", value.proposal);
}

void from_json(const json &j, Certificate &value) {
  ExpectMap(j, "Certificate");
  Optional(j, "prop", value.proposal);
}

} // namespace message
} // namespace algoprobe
