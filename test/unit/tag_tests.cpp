#include <catch2/catch_test_macros.hpp>
#include "network/tag.hpp"
#include <set>
#include <string>

using namespace algoprobe::message;

TEST_CASE("Tag - Code table", "[network][tag][unit]") {
    SECTION("Every wire tag has a distinct two-character code") {
        std::set<std::string> codes;
        for (Tag tag : WireTags()) {
            auto code = TagCode(tag);
            REQUIRE(code.size() == 2);
            codes.insert(std::string(code));
            REQUIRE(TagFromCode(code) == tag);
        }
        REQUIRE(codes.size() == NUM_WIRE_TAGS);
    }

    SECTION("Known codes") {
        REQUIRE(TagFromCode("??") == Tag::UnknownMsg);
        REQUIRE(TagFromCode("AV") == Tag::AgreementVote);
        REQUIRE(TagFromCode("MI") == Tag::MsgOfInterest);
        REQUIRE(TagFromCode("MS") == Tag::MsgDigestSkip);
        REQUIRE(TagFromCode("NP") == Tag::NetPrioResponse);
        REQUIRE(TagFromCode("pi") == Tag::Ping);
        REQUIRE(TagFromCode("pj") == Tag::PingReply);
        REQUIRE(TagFromCode("PP") == Tag::ProposalPayload);
        REQUIRE(TagFromCode("SP") == Tag::StateProofSig);
        REQUIRE(TagFromCode("TS") == Tag::TopicMsgResp);
        REQUIRE(TagFromCode("TX") == Tag::Txn);
        REQUIRE(TagFromCode("UC") == Tag::UniCatchupReq);
        REQUIRE(TagFromCode("UE") == Tag::UniEnsBlockReq);
        REQUIRE(TagFromCode("VB") == Tag::VoteBundle);
    }

    SECTION("Lookups are exact") {
        REQUIRE_FALSE(TagFromCode("av").has_value());
        REQUIRE_FALSE(TagFromCode("PI").has_value());
        REQUIRE_FALSE(TagFromCode("TXN").has_value());
        REQUIRE_FALSE(TagFromCode("").has_value());
    }

    SECTION("RawBytes has no wire code") {
        REQUIRE(TagCode(Tag::RawBytes).empty());
    }
}

TEST_CASE("DecodeTag - Failure causes", "[network][tag][unit]") {
    DecodeState state;

    SECTION("Short input") {
        const uint8_t data[] = {'T'};
        REQUIRE_FALSE(DecodeTag(data, 1, state).has_value());
        REQUIRE(state.GetRejectReason() == "short-tag");
    }

    SECTION("Non-ASCII byte") {
        const uint8_t data[] = {'T', 0xc8};
        REQUIRE_FALSE(DecodeTag(data, 2, state).has_value());
        REQUIRE(state.GetRejectReason() == "non-ascii-tag");
    }

    SECTION("Printable but unmapped") {
        const uint8_t data[] = {'Z', 'Z'};
        REQUIRE_FALSE(DecodeTag(data, 2, state).has_value());
        REQUIRE(state.GetRejectReason() == "unknown-tag");
    }

    SECTION("Unknown marker decodes") {
        const uint8_t data[] = {'?', '?', 0x01};
        REQUIRE(DecodeTag(data, 3, state) == Tag::UnknownMsg);
        REQUIRE(state.IsValid());
    }
}
