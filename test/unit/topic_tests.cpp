// Unit tests for network/topic.cpp - topic container and topic-carried messages

#include <catch2/catch_test_macros.hpp>
#include "network/topic.hpp"
#include "network/protocol.hpp"
#include "util/endian.hpp"
#include <random>
#include <stdexcept>

using namespace algoprobe::message;
using namespace algoprobe::protocol;

namespace {

std::vector<uint8_t> Bytes(std::initializer_list<int> values) {
    std::vector<uint8_t> out;
    for (int v : values) {
        out.push_back(static_cast<uint8_t>(v));
    }
    return out;
}

std::vector<uint8_t> U64LE(uint64_t v) {
    std::vector<uint8_t> out(8);
    algoprobe::endian::WriteLE64(out.data(), v);
    return out;
}

} // namespace

TEST_CASE("TopicLength - Encoded size", "[network][topic][unit]") {
    REQUIRE(TopicLength(0).encoded_size() == 1);
    REQUIRE(TopicLength(127).encoded_size() == 1);
    REQUIRE(TopicLength(128).encoded_size() == 2);
    REQUIRE(TopicLength(16383).encoded_size() == 2);
    REQUIRE_THROWS_AS(TopicLength(16384).encoded_size(), std::length_error);
}

TEST_CASE("TopicLength - Wire form", "[network][topic][unit]") {
    uint8_t buf[2] = {0, 0};

    SECTION("127 is a single byte") {
        REQUIRE(TopicLength(127).encode(buf) == 1);
        REQUIRE(buf[0] == 0x7f);
    }

    SECTION("128 sets the continuation bit") {
        REQUIRE(TopicLength(128).encode(buf) == 2);
        REQUIRE(buf[0] == 0x80);
        REQUIRE(buf[1] == 0x01);
    }

    SECTION("16383 is the largest two-byte value") {
        REQUIRE(TopicLength(16383).encode(buf) == 2);
        REQUIRE(buf[0] == 0xff);
        REQUIRE(buf[1] == 0x7f);
    }

    SECTION("Decode two-byte form") {
        const uint8_t wire[] = {0x85, 0x03};
        TopicLength len;
        REQUIRE(len.decode(wire, 2) == 2);
        REQUIRE(len.value == (3 << 7 | 5));
    }

    SECTION("Truncated two-byte form consumes nothing") {
        const uint8_t wire[] = {0x85};
        TopicLength len;
        REQUIRE(len.decode(wire, 1) == 0);
    }
}

TEST_CASE("UnmarshalTopics - Known wire vectors", "[network][topic][unit]") {
    std::vector<Topic> topics;
    DecodeState state;

    SECTION("Two topics") {
        auto wire = Bytes({2, 3, 'k', 'e', 'y', 3, 'v', 'a', 'l', 1, 'a', 4, 'b', 'c', 'd', 'e'});
        REQUIRE(UnmarshalTopics(wire.data(), wire.size(), topics, state));
        REQUIRE(state.IsValid());
        REQUIRE(topics.size() == 2);
        REQUIRE(topics[0] == Topic("key", std::string("val")));
        REQUIRE(topics[1] == Topic("a", std::string("bcde")));
    }

    SECTION("Key length past the end of the buffer") {
        auto wire = Bytes({2, 100, 'k', 'e', 'y'});
        REQUIRE_FALSE(UnmarshalTopics(wire.data(), wire.size(), topics, state));
        REQUIRE(state.GetRejectReason() == "bad-topic-len");
    }

    SECTION("Value length past the end of the buffer") {
        auto wire = Bytes({1, 1, 'k', 5, 'a', 'b'});
        REQUIRE_FALSE(UnmarshalTopics(wire.data(), wire.size(), topics, state));
        REQUIRE(state.GetRejectReason() == "bad-topic-len");
    }

    SECTION("Empty buffer has no count") {
        REQUIRE_FALSE(UnmarshalTopics(nullptr, 0, topics, state));
        REQUIRE(state.GetRejectReason() == "bad-topic-count");
    }

    SECTION("Count larger than the topics present") {
        auto wire = Bytes({2, 1, 'k', 0});
        REQUIRE_FALSE(UnmarshalTopics(wire.data(), wire.size(), topics, state));
        REQUIRE(state.IsInvalid());
    }

    SECTION("Key that is not UTF-8") {
        auto wire = Bytes({1, 2, 0xc3, 0x28, 0});
        REQUIRE_FALSE(UnmarshalTopics(wire.data(), wire.size(), topics, state));
        REQUIRE(state.GetRejectReason() == "bad-topic-key");
    }

    SECTION("Zero topics") {
        auto wire = Bytes({0});
        REQUIRE(UnmarshalTopics(wire.data(), wire.size(), topics, state));
        REQUIRE(topics.empty());
    }

    SECTION("Trailing bytes are ignored") {
        auto wire = Bytes({1, 1, 'k', 1, 'v', 0xde, 0xad});
        REQUIRE(UnmarshalTopics(wire.data(), wire.size(), topics, state));
        REQUIRE(topics.size() == 1);
        REQUIRE(topics[0] == Topic("k", std::string("v")));
    }
}

TEST_CASE("MarshalTopics - Layout and limits", "[network][topic][unit]") {
    SECTION("Matches the reference layout") {
        std::vector<Topic> topics = {{"key", std::string("val")}, {"a", std::string("bcde")}};
        REQUIRE(MarshalTopics(topics) ==
                Bytes({2, 3, 'k', 'e', 'y', 3, 'v', 'a', 'l', 1, 'a', 4, 'b', 'c', 'd', 'e'}));
    }

    SECTION("Value at the one/two byte boundary") {
        std::vector<Topic> topics = {{"k", std::vector<uint8_t>(128, 0xaa)}};
        auto wire = MarshalTopics(topics);
        REQUIRE(wire.size() == 1 + 1 + 1 + 2 + 128);
        REQUIRE(wire[3] == 0x80);
        REQUIRE(wire[4] == 0x01);

        std::vector<Topic> decoded;
        DecodeState state;
        REQUIRE(UnmarshalTopics(wire.data(), wire.size(), decoded, state));
        REQUIRE(decoded == topics);
    }

    SECTION("Oversized value is rejected at encode time") {
        std::vector<Topic> topics = {{"k", std::vector<uint8_t>(MAX_TOPIC_VALUE_LENGTH + 1)}};
        REQUIRE_THROWS_AS(MarshalTopics(topics), std::length_error);
    }

    SECTION("Too many topics") {
        std::vector<Topic> topics(256, Topic("k", std::string("v")));
        REQUIRE_THROWS_AS(MarshalTopics(topics), std::length_error);
    }
}

TEST_CASE("Topics - Generated lists survive a round trip", "[network][topic][unit]") {
    std::mt19937_64 rng(42);

    for (int round = 0; round < 300; ++round) {
        std::vector<Topic> topics(rng() % 9);
        for (auto &topic : topics) {
            topic.key.resize(rng() % 17);
            for (auto &c : topic.key) {
                c = static_cast<char>('a' + rng() % 26);
            }
            topic.value.resize(rng() % (MAX_SHORT_TOPIC_LENGTH + 1));
            for (auto &b : topic.value) {
                b = static_cast<uint8_t>(rng());
            }
        }
        // Make sure both ends of the single-byte length range show up
        if (!topics.empty() && round % 3 == 0) {
            topics.front().value.clear();
            topics.back().value.resize(MAX_SHORT_TOPIC_LENGTH, 0x5a);
        }

        auto wire = MarshalTopics(topics);
        std::vector<Topic> decoded;
        DecodeState state;
        INFO("round " << round);
        REQUIRE(UnmarshalTopics(wire.data(), wire.size(), decoded, state));
        REQUIRE(decoded == topics);
    }
}

TEST_CASE("MsgOfInterest - Topic form", "[network][topic][msg_of_interest][unit]") {
    SECTION("Codes are comma-joined in enum order") {
        MsgOfInterest msg{{Tag::Txn, Tag::AgreementVote, Tag::ProposalPayload}};
        auto topics = ToTopics(msg);
        REQUIRE(topics.size() == 1);
        REQUIRE(topics[0].key == "tags");
        REQUIRE(std::string(topics[0].value.begin(), topics[0].value.end()) == "AV,PP,TX");
    }

    SECTION("Decodes a subscription") {
        MsgOfInterest out;
        DecodeState state;
        REQUIRE(MsgOfInterestFromTopics({{"tags", std::string("TX,pi")}}, out, state));
        REQUIRE(out.tags == std::set<Tag>{Tag::Txn, Tag::Ping});
    }

    SECTION("Empty value is an empty set") {
        MsgOfInterest out;
        DecodeState state;
        REQUIRE(MsgOfInterestFromTopics({{"tags", std::string("")}}, out, state));
        REQUIRE(out.tags.empty());
    }

    SECTION("Unknown code") {
        MsgOfInterest out;
        DecodeState state;
        REQUIRE_FALSE(MsgOfInterestFromTopics({{"tags", std::string("TX,ZZ")}}, out, state));
        REQUIRE(state.GetRejectReason() == "unknown-tag");
    }

    SECTION("Trailing comma") {
        MsgOfInterest out;
        DecodeState state;
        REQUIRE_FALSE(MsgOfInterestFromTopics({{"tags", std::string("TX,")}}, out, state));
        REQUIRE(state.GetRejectReason() == "unknown-tag");
    }

    SECTION("Wrong key") {
        MsgOfInterest out;
        DecodeState state;
        REQUIRE_FALSE(MsgOfInterestFromTopics({{"tag", std::string("TX")}}, out, state));
        REQUIRE(state.GetRejectReason() == "bad-msg-of-interest");
    }
}

TEST_CASE("BlockRequest - Topic form", "[network][topic][block_request][unit]") {
    BlockRequest req;
    req.data_type = RequestDataType::Cert;
    req.round = 0x0102030405060708ULL;
    req.nonce = 42;

    SECTION("Keys and little-endian integers") {
        auto topics = ToTopics(req);
        REQUIRE(topics.size() == 3);
        REQUIRE(topics[0] == Topic("roundKey", U64LE(req.round)));
        REQUIRE(topics[1] == Topic("requestDataType", std::string("certData")));
        REQUIRE(topics[2] == Topic("nonce", U64LE(42)));
    }

    SECTION("Topics in any order") {
        std::vector<Topic> topics = {{"nonce", U64LE(7)},
                                     {"requestDataType", std::string("blockAndCert")},
                                     {"roundKey", U64LE(100)}};
        BlockRequest out;
        DecodeState state;
        REQUIRE(BlockRequestFromTopics(topics, out, state));
        REQUIRE(out.nonce == 7);
        REQUIRE(out.round == 100);
        REQUIRE(out.data_type == RequestDataType::BlockAndCert);
    }

    SECTION("Short round value") {
        std::vector<Topic> topics = {{"roundKey", Bytes({1, 2, 3})},
                                     {"requestDataType", std::string("blockData")},
                                     {"nonce", U64LE(1)}};
        BlockRequest out;
        DecodeState state;
        REQUIRE_FALSE(BlockRequestFromTopics(topics, out, state));
        REQUIRE(state.GetRejectReason() == "bad-block-request");
    }

    SECTION("Long nonce value") {
        auto nonce = U64LE(1);
        nonce.push_back(0);
        std::vector<Topic> topics = {{"roundKey", U64LE(1)},
                                     {"requestDataType", std::string("blockData")},
                                     {"nonce", nonce}};
        BlockRequest out;
        DecodeState state;
        REQUIRE_FALSE(BlockRequestFromTopics(topics, out, state));
        REQUIRE(state.GetRejectReason() == "bad-block-request");
    }

    SECTION("Missing nonce") {
        std::vector<Topic> topics = {{"roundKey", U64LE(1)},
                                     {"requestDataType", std::string("blockData")}};
        BlockRequest out;
        DecodeState state;
        REQUIRE_FALSE(BlockRequestFromTopics(topics, out, state));
    }
}

TEST_CASE("TopicMsgResp - Variant selected by key set", "[network][topic][topic_msg_resp][unit]") {
    SECTION("Error response") {
        std::vector<Topic> topics = {{"Error", std::string("block not found")},
                                     {"RequestHash", Bytes({1, 2, 3, 4})}};
        TopicMsgResp out;
        DecodeState state;
        REQUIRE(TopicMsgRespFromTopics(topics, out, state));
        REQUIRE(std::holds_alternative<ErrorRsp>(out));
        REQUIRE(std::get<ErrorRsp>(out).error == "block not found");
        REQUIRE(std::get<ErrorRsp>(out).request_hash == Bytes({1, 2, 3, 4}));
    }

    SECTION("Block response with nil certificate") {
        BlockHeader header;
        header.round = 9;
        header.genesis_id = "private-v1";
        std::vector<Topic> topics = {{"blockData", ToMsgpack(header)},
                                     {"certData", Bytes({0xc0})},
                                     {"RequestHash", Bytes({9})}};
        TopicMsgResp out;
        DecodeState state;
        REQUIRE(TopicMsgRespFromTopics(topics, out, state));
        REQUIRE(std::holds_alternative<UniEnsBlockRsp>(out));
        const auto &rsp = std::get<UniEnsBlockRsp>(out);
        REQUIRE(rsp.block.has_value());
        REQUIRE(rsp.block->round == 9);
        REQUIRE(rsp.block->genesis_id == "private-v1");
        REQUIRE_FALSE(rsp.cert.has_value());
    }

    SECTION("Block header with an integer-keyed map") {
        BlockHeader header;
        header.round = 12;
        auto block = ToMsgpack(header);
        REQUIRE((block[0] & 0xf0) == 0x80);
        REQUIRE(block[0] < 0x8f);

        // "spt": {0: {"n": 256}} as a state proof tracking map
        block[0] += 1;
        const auto spt = Bytes({0xa3, 's', 'p', 't', 0x81, 0x00, 0x81, 0xa1, 'n', 0xcd, 0x01, 0x00});
        block.insert(block.end(), spt.begin(), spt.end());

        std::vector<Topic> topics = {{"blockData", block},
                                     {"certData", Bytes({0xc0})},
                                     {"RequestHash", Bytes({1})}};
        TopicMsgResp out;
        DecodeState state;
        REQUIRE(TopicMsgRespFromTopics(topics, out, state));
        REQUIRE(std::get<UniEnsBlockRsp>(out).block->round == 12);
    }

    SECTION("Two topics with the wrong keys") {
        std::vector<Topic> topics = {{"Error", std::string("x")}, {"nonce", U64LE(1)}};
        TopicMsgResp out;
        DecodeState state;
        REQUIRE_FALSE(TopicMsgRespFromTopics(topics, out, state));
        REQUIRE(state.GetRejectReason() == "unexpected-topic");
    }

    SECTION("Unsupported topic count") {
        std::vector<Topic> topics = {{"Error", std::string("x")}};
        TopicMsgResp out;
        DecodeState state;
        REQUIRE_FALSE(TopicMsgRespFromTopics(topics, out, state));
        REQUIRE(state.GetRejectReason() == "unexpected-topic-count");
    }

    SECTION("Encoder writes nil for absent bodies") {
        UniEnsBlockRsp rsp;
        rsp.request_hash = Bytes({5});
        auto topics = ToTopics(TopicMsgResp(rsp));
        REQUIRE(topics.size() == 3);
        REQUIRE(topics[0] == Topic("blockData", Bytes({0xc0})));
        REQUIRE(topics[1] == Topic("certData", Bytes({0xc0})));
        REQUIRE(topics[2] == Topic("RequestHash", Bytes({5})));
    }
}
