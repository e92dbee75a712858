// Unit tests for network/msgpack_types.cpp - structured payload bodies

#include <catch2/catch_test_macros.hpp>
#include "network/msgpack_types.hpp"

using namespace algoprobe::message;

namespace {

json Bin(size_t size, uint8_t fill = 0) {
    return json::binary(std::vector<uint8_t>(size, fill));
}

json SignatureJson() {
    json sig = json::object();
    sig["s"] = Bin(64);
    sig["p"] = Bin(32);
    sig["ps"] = Bin(64);
    sig["p2"] = Bin(32);
    sig["p1s"] = Bin(64);
    sig["p2s"] = Bin(64);
    return sig;
}

template <typename T>
bool Decode(const json &j, T &out, DecodeState &state) {
    auto bytes = json::to_msgpack(j);
    return FromMsgpack(bytes.data(), bytes.size(), out, state, "test value");
}

} // namespace

TEST_CASE("Address - Checksummed text form", "[network][msgpack][address][unit]") {
    SECTION("Zero address") {
        Address zero;
        REQUIRE(zero.ToString() == "AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAY5HFKQ");
        auto parsed = Address::FromString(zero.ToString());
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == zero);
    }

    SECTION("Text form is 58 characters and parses back") {
        std::array<uint8_t, 32> key{};
        for (size_t i = 0; i < key.size(); ++i) {
            key[i] = static_cast<uint8_t>(i * 7 + 1);
        }
        Address addr(key);
        const auto text = addr.ToString();
        REQUIRE(text.size() == 58);
        REQUIRE(Address::FromString(text) == addr);
    }

    SECTION("Corrupted checksum") {
        auto text = Address().ToString();
        text[text.size() - 1] = text[text.size() - 1] == 'A' ? 'B' : 'A';
        std::string error;
        REQUIRE_FALSE(Address::FromString(text, &error).has_value());
        REQUIRE(!error.empty());
    }

    SECTION("Not base32") {
        std::string error;
        REQUIRE_FALSE(Address::FromString("not-an-address!", &error).has_value());
        REQUIRE(error == "error decoding base32");
    }

    SECTION("Wrong length") {
        std::string error;
        REQUIRE_FALSE(Address::FromString("AAAAAAAA", &error).has_value());
        REQUIRE(error.find("wrong address length") == 0);
    }
}

TEST_CASE("MessagePack - Field groups", "[network][msgpack][unit]") {
    SECTION("Defaulted fields are omitted when zero and restored when missing") {
        RawVote vote;
        vote.round = 10;
        json j = vote;
        REQUIRE_FALSE(j.contains("per"));
        REQUIRE_FALSE(j.contains("step"));
        REQUIRE_FALSE(j.contains("prop"));
        REQUIRE(j["rnd"] == 10);

        RawVote decoded;
        DecodeState state;
        REQUIRE(Decode(j, decoded, state));
        REQUIRE(decoded.round == 10);
        REQUIRE(decoded.period == 0);
        REQUIRE_FALSE(decoded.proposal.has_value());
    }

    SECTION("Missing required field") {
        json j = json::object();
        j["r"] = json::object({{"snd", Bin(32)}, {"rnd", 1}});
        j["sig"] = SignatureJson();
        AgreementVote vote;
        DecodeState state;
        REQUIRE_FALSE(Decode(j, vote, state));
        REQUIRE(state.GetRejectReason() == "bad-msgpack");
        REQUIRE(state.GetDebugMessage().find("cred") != std::string::npos);
    }

    SECTION("Fixed-size bin of the wrong length") {
        json j = json::object();
        j["r"] = json::object({{"snd", Bin(31)}, {"rnd", 1}});
        j["cred"] = json::object();
        j["sig"] = SignatureJson();
        AgreementVote vote;
        DecodeState state;
        REQUIRE_FALSE(Decode(j, vote, state));
        REQUIRE(state.GetRejectReason() == "bad-msgpack");
    }

    SECTION("Unknown keys are ignored") {
        json j = json::object();
        j["r"] = json::object({{"snd", Bin(32, 0x01)}, {"rnd", 7}, {"extra", "x"}});
        j["cred"] = json::object({{"pf", Bin(80, 0x02)}});
        j["sig"] = SignatureJson();
        j["future"] = 1;
        AgreementVote vote;
        DecodeState state;
        REQUIRE(Decode(j, vote, state));
        REQUIRE(vote.raw_vote.round == 7);
        REQUIRE(vote.raw_vote.sender.bytes()[0] == 0x01);
        REQUIRE(vote.cred.vrf_proof.has_value());
        REQUIRE(vote.cred.vrf_proof->bytes[79] == 0x02);
    }

    SECTION("Unknown integer-keyed maps are ignored") {
        json j = json::object();
        j["r"] = json::object({{"snd", Bin(32, 0x01)}, {"rnd", 7}});
        j["cred"] = json::object({{"pf", Bin(80, 0x02)}});
        j["sig"] = SignatureJson();
        auto body = json::to_msgpack(j);
        REQUIRE(body[0] == 0x83);

        // "spt": {0: {"n": 256}}
        body[0] = 0x84;
        const std::vector<uint8_t> spt = {0xa3, 's', 'p', 't', 0x81, 0x00,
                                          0x81, 0xa1, 'n', 0xcd, 0x01, 0x00};
        body.insert(body.end(), spt.begin(), spt.end());

        AgreementVote vote;
        DecodeState state;
        REQUIRE(FromMsgpack(body.data(), body.size(), vote, state, "AgreementVote"));
        REQUIRE(vote.raw_vote.round == 7);
        REQUIRE(vote.cred.vrf_proof->bytes[0] == 0x02);
    }

    SECTION("Non-map body") {
        const std::vector<uint8_t> body = {0x01};  // positive fixint
        NetPrioResponse rsp;
        DecodeState state;
        REQUIRE_FALSE(FromMsgpack(body.data(), body.size(), rsp, state, "NetPrioResponse"));
        REQUIRE(state.GetRejectReason() == "bad-msgpack");
    }
}

TEST_CASE("MessagePack - Transactions", "[network][msgpack][txn][unit]") {
    SECTION("Only payment transactions are modelled") {
        json txn = json::object();
        txn["type"] = "appl";
        txn["fee"] = 1000;
        txn["fv"] = 1;
        txn["gh"] = Bin(32);
        txn["lv"] = 2;
        txn["snd"] = Bin(32);
        SignedTransaction stx;
        DecodeState state;
        REQUIRE_FALSE(Decode(json::object({{"txn", txn}}), stx, state));
        REQUIRE(state.GetRejectReason() == "bad-msgpack");
    }

    SECTION("Multisig signature") {
        SignedTransaction stx;
        MultisigSignature msig;
        msig.version = 1;
        msig.threshold = 2;
        msig.subsigs.resize(3);
        msig.subsigs[1].sig = Ed25519Signature();
        stx.msig = msig;
        stx.txn.fee = 1;
        stx.txn.first_valid = 1;
        stx.txn.last_valid = 2;

        auto bytes = ToMsgpack(stx);
        SignedTransaction decoded;
        DecodeState state;
        REQUIRE(FromMsgpack(bytes.data(), bytes.size(), decoded, state, "SignedTransaction"));
        REQUIRE(decoded.msig.has_value());
        REQUIRE(decoded.msig->threshold == 2);
        REQUIRE(decoded.msig->subsigs.size() == 3);
        REQUIRE_FALSE(decoded.msig->subsigs[0].sig.has_value());
        REQUIRE(decoded.msig->subsigs[1].sig.has_value());
        REQUIRE_FALSE(decoded.sig.has_value());
    }
}

TEST_CASE("MessagePack - Non-string key filter", "[network][msgpack][unit]") {
    SECTION("Integer keys are dropped at any depth") {
        // {1: "a", "k": [{"x": 1, -1: nil}], 2: {3: 4}}
        const std::vector<uint8_t> body = {0x83, 0x01, 0xa1, 'a',
                                           0xa1, 'k', 0x91, 0x82, 0xa1, 'x', 0x01, 0xff, 0xc0,
                                           0x02, 0x81, 0x03, 0x04};
        auto filtered = DropNonStringKeys(body.data(), body.size(), true);
        json j = json::from_msgpack(filtered);
        REQUIRE(j == json::parse(R"({"k": [{"x": 1}]})"));
    }

    SECTION("String-keyed values are copied unchanged") {
        json j = json::object({{"a", Bin(40, 0x07)}, {"b", -5}, {"c", 1.5}, {"d", "text"}});
        auto body = json::to_msgpack(j);
        REQUIRE(DropNonStringKeys(body.data(), body.size(), true) == body);
    }

    SECTION("Large maps keep a valid header") {
        json j = json::object();
        for (int i = 0; i < 20; ++i) {
            j["k" + std::to_string(i)] = i;
        }
        auto body = json::to_msgpack(j);
        REQUIRE(json::from_msgpack(DropNonStringKeys(body.data(), body.size(), true)) == j);
    }

    SECTION("Truncated input") {
        const std::vector<uint8_t> body = {0x82, 0xa1, 'a', 0x01, 0x05};
        REQUIRE_THROWS_AS(DropNonStringKeys(body.data(), body.size(), true), MsgpackError);
        REQUIRE_THROWS_AS(DropNonStringKeys(body.data(), 0, true), MsgpackError);
    }

    SECTION("Trailing bytes only matter when strict") {
        const std::vector<uint8_t> body = {0x81, 0xa1, 'a', 0x01, 0x81};
        REQUIRE_THROWS_AS(DropNonStringKeys(body.data(), body.size(), true), MsgpackError);
        auto first = DropNonStringKeys(body.data(), body.size(), false);
        REQUIRE(first == std::vector<uint8_t>(body.begin(), body.end() - 1));
    }

    SECTION("Reserved type byte") {
        const std::vector<uint8_t> body = {0xc1};
        REQUIRE_THROWS_AS(DropNonStringKeys(body.data(), body.size(), true), MsgpackError);
    }
}
