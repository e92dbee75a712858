// Unit tests for harness/config.cpp and harness/payload_factory.cpp

#include <catch2/catch_test_macros.hpp>
#include "harness/config.hpp"
#include "harness/payload_factory.hpp"
#include <filesystem>
#include <fstream>

using namespace algoprobe;
using namespace algoprobe::harness;
using namespace algoprobe::message;

TEST_CASE("ParseHandshakeConfig - overrides", "[harness][config][unit]") {
    std::string error;

    SECTION("Empty object keeps every default") {
        auto config = ParseHandshakeConfig("{}", error);
        REQUIRE(config.has_value());
        network::HandshakeConfig defaults;
        REQUIRE(config->genesis == defaults.genesis);
        REQUIRE(config->node_random == defaults.node_random);
        REQUIRE_FALSE(config->telemetry_id.has_value());
        REQUIRE_FALSE(config->challenge.has_value());
    }

    SECTION("Values are taken verbatim") {
        auto config = ParseHandshakeConfig(R"({
            "genesis": "testnet-v1.0",
            "location": "",
            "ws_version": "99",
            "telemetry_id": "abc",
            "accept_key_override": "x",
            "challenge": null,
            "unrelated": 5
        })", error);
        REQUIRE(config.has_value());
        REQUIRE(config->genesis == "testnet-v1.0");
        REQUIRE(config->location.empty());
        REQUIRE(config->ws_version == "99");
        REQUIRE(config->telemetry_id == "abc");
        REQUIRE(config->accept_key_override == "x");
        REQUIRE_FALSE(config->challenge.has_value());
    }

    SECTION("Malformed JSON") {
        REQUIRE_FALSE(ParseHandshakeConfig("{\"genesis\": ", error).has_value());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("Root must be an object") {
        REQUIRE_FALSE(ParseHandshakeConfig("[1, 2]", error).has_value());
        REQUIRE(error == "handshake config must be a JSON object");
    }

    SECTION("Non-string value") {
        REQUIRE_FALSE(ParseHandshakeConfig(R"({"version": 21})", error).has_value());
        REQUIRE(error == "\"version\" must be a string");
    }
}

TEST_CASE("LoadHandshakeConfig - files", "[harness][config][unit]") {
    auto path = std::filesystem::temp_directory_path() / "algoprobe_handshake_test.json";

    SECTION("Readable file") {
        {
            std::ofstream out(path);
            out << R"({"instance_name": "probe-7"})";
        }
        auto config = LoadHandshakeConfig(path.string());
        REQUIRE(config.has_value());
        REQUIRE(config->instance_name == "probe-7");
        std::filesystem::remove(path);
    }

    SECTION("Missing file") {
        std::filesystem::remove(path);
        REQUIRE_FALSE(LoadHandshakeConfig(path.string()).has_value());
    }
}

TEST_CASE("PayloadFactory - default customizer", "[harness][factory][unit]") {
    SECTION("Block requests get a fresh nonce each time") {
        BlockRequest req;
        req.round = 5;
        req.nonce = 10;
        PayloadFactory factory(UniEnsBlockReqPayload{req});

        auto payloads = factory.generate_payloads(3);
        REQUIRE(payloads.size() == 3);
        for (size_t i = 0; i < payloads.size(); ++i) {
            const auto &p = static_cast<const UniEnsBlockReqPayload &>(*payloads[i]);
            REQUIRE(p.request.nonce == 11 + i);
            REQUIRE(p.request.round == 5);
        }
        REQUIRE(static_cast<const BlockRequestPayload &>(factory.current()).request.nonce == 13);
    }

    SECTION("Other payloads are copied unchanged") {
        PingPayload ping(PingNonce{1, 2, 3, 4, 5, 6, 7, 8});
        PayloadFactory factory(ping);
        auto next = factory.generate_next();
        REQUIRE(next->tag() == Tag::Ping);
        REQUIRE(static_cast<const PingPayload &>(*next).nonce == ping.nonce);
    }
}

TEST_CASE("PayloadFactory - custom customizer and cache", "[harness][factory][unit]") {
    const Tag extra[] = {Tag::ProposalPayload, Tag::AgreementVote, Tag::Ping, Tag::PingReply};
    size_t calls = 0;
    PayloadFactory factory(MsgOfInterestPayload({Tag::Txn}), [&](Payload &p) {
        static_cast<MsgOfInterestPayload &>(p).msg.tags.insert(extra[calls++ % 4]);
    });

    factory.pre_generate_payloads_cache(2);
    REQUIRE(calls == 2);
    const auto &cache = factory.get_pre_generated_payload_cache();
    REQUIRE(cache.size() == 2);
    REQUIRE(static_cast<const MsgOfInterestPayload &>(*cache[0]).msg.tags.size() == 2);
    REQUIRE(static_cast<const MsgOfInterestPayload &>(*cache[1]).msg.tags.size() == 3);

    SECTION("Regenerating replaces the cache") {
        factory.pre_generate_payloads_cache(1);
        REQUIRE(factory.get_pre_generated_payload_cache().size() == 1);
    }

    SECTION("Copies are independent") {
        PayloadFactory copy(factory);
        REQUIRE(copy.get_pre_generated_payload_cache().size() == 2);
        REQUIRE(copy.get_pre_generated_payload_cache()[0].get() != cache[0].get());
        copy.generate_next();
        REQUIRE(static_cast<const MsgOfInterestPayload &>(copy.current()).msg.tags.size() == 4);
        REQUIRE(static_cast<const MsgOfInterestPayload &>(factory.current()).msg.tags.size() == 3);
    }
}
