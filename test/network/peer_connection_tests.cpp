// Tests for network/peer_connection.cpp over in-memory transport connections

#include <catch2/catch_test_macros.hpp>
#include "infra/mock_transport.hpp"
#include "network/peer_connection.hpp"
#include <string>
#include <vector>

using namespace algoprobe;
using namespace algoprobe::network;
using namespace algoprobe::message;

namespace {

struct Recorder {
    std::vector<AlgoMsg> messages;
    int established = 0;
    int closed = 0;

    PeerConnection::Callbacks Callbacks() {
        PeerConnection::Callbacks cb;
        cb.on_message = [this](const std::string &, AlgoMsg msg) { messages.push_back(std::move(msg)); };
        cb.on_established = [this](const std::string &) { ++established; };
        cb.on_closed = [this](const std::string &) { ++closed; };
        return cb;
    }
};

struct Pair {
    std::shared_ptr<MockTransportConnection> client_conn =
        std::make_shared<MockTransportConnection>("127.0.0.1", 4160);
    std::shared_ptr<MockTransportConnection> server_conn =
        std::make_shared<MockTransportConnection>("127.0.0.1", 51000);
    Recorder client_events;
    Recorder server_events;
    PeerConnectionPtr client;
    PeerConnectionPtr server;

    Pair(bool handshake, HandshakeConfig server_config = {}) {
        server_conn->set_inbound(true);
        client = PeerConnection::create(client_conn, Role::Initiator, handshake, HandshakeConfig{},
                                        client_events.Callbacks());
        server = PeerConnection::create(server_conn, Role::Responder, handshake,
                                        std::move(server_config), server_events.Callbacks());
        server->start();
        client->start();
    }

    void Pump() { PumpUntilIdle(*client_conn, *server_conn); }
};

} // namespace

TEST_CASE("PeerConnection - Handshake then messages", "[network][peer][unit]") {
    Pair pair(true);
    REQUIRE(pair.client->address() == "127.0.0.1:4160");
    REQUIRE(pair.client_conn->started());
    REQUIRE_FALSE(pair.client->is_established());
    REQUIRE(pair.client->handshake_state() == HandshakeState::SENT);

    pair.Pump();
    REQUIRE(pair.client->is_established());
    REQUIRE(pair.server->is_established());
    REQUIRE(pair.client_events.established == 1);
    REQUIRE(pair.server_events.established == 1);

    SECTION("Messages flow in both directions") {
        REQUIRE(pair.client->send(PingPayload(PingNonce{1, 1, 1, 1, 1, 1, 1, 1})));
        REQUIRE(pair.server->send(MsgOfInterestPayload({Tag::Txn})));
        pair.Pump();

        REQUIRE(pair.server_events.messages.size() == 1);
        REQUIRE(pair.server_events.messages[0].tag() == Tag::Ping);
        REQUIRE(pair.client_events.messages.size() == 1);
        REQUIRE(pair.client_events.messages[0].tag() == Tag::MsgOfInterest);
    }

    SECTION("Several frames in one read are delivered in order") {
        pair.client->send(PingPayload(PingNonce{1, 0, 0, 0, 0, 0, 0, 0}));
        pair.client->send(PingPayload(PingNonce{2, 0, 0, 0, 0, 0, 0, 0}));
        auto chunks = pair.client_conn->take_sent_messages();
        std::vector<uint8_t> joined;
        for (const auto &chunk : chunks) {
            joined.insert(joined.end(), chunk.begin(), chunk.end());
        }
        pair.server_conn->simulate_receive(joined);

        REQUIRE(pair.server_events.messages.size() == 2);
        REQUIRE(static_cast<const PingPayload &>(*pair.server_events.messages[0].payload).nonce[0] == 1);
        REQUIRE(static_cast<const PingPayload &>(*pair.server_events.messages[1].payload).nonce[0] == 2);
    }

    SECTION("Unframed garbage closes the receiver") {
        REQUIRE(pair.client->send_unframed({0x81, 0x01, 'x'}));
        pair.Pump();
        REQUIRE_FALSE(pair.server->is_open());
        REQUIRE(pair.server_events.closed == 1);
        REQUIRE(pair.server_events.messages.empty());
    }

    SECTION("Close fires on_closed once and blocks sends") {
        pair.client->close("test");
        pair.client->close("again");
        REQUIRE(pair.client_events.closed == 1);
        REQUIRE_FALSE(pair.client->is_open());
        REQUIRE_FALSE(pair.client->is_established());
        REQUIRE_FALSE(pair.client->send(PingPayload{}));
    }
}

TEST_CASE("PeerConnection - Handshake disabled", "[network][peer][unit]") {
    Pair pair(false);
    REQUIRE(pair.client->is_established());
    REQUIRE(pair.server->is_established());
    REQUIRE(pair.client_conn->sent_message_count() == 0);

    pair.client->send(PingReplyPayload(PingNonce{7, 7, 7, 7, 7, 7, 7, 7}));
    pair.Pump();
    REQUIRE(pair.server_events.messages.size() == 1);
    REQUIRE(pair.server_events.messages[0].tag() == Tag::PingReply);
}

TEST_CASE("PeerConnection - Rejected handshake", "[network][peer][unit]") {
    HandshakeConfig server_config;
    server_config.accept_key_override = "d3Jvbmcga2V5IGhlcmU=";
    Pair pair(true, server_config);
    pair.Pump();

    // The responder thinks it is done; the initiator refuses the accept key
    REQUIRE(pair.server->is_established());
    REQUIRE_FALSE(pair.client->is_established());
    REQUIRE_FALSE(pair.client->is_open());
    REQUIRE(pair.client->handshake_state() == HandshakeState::REJECTED);
    REQUIRE(pair.client_events.established == 0);
    REQUIRE(pair.client_events.closed == 1);
}

TEST_CASE("PeerConnection - Payload without an outbound encoding", "[network][peer][unit]") {
    Pair pair(false);
    NotImplementedPayload vote_bundle(Tag::VoteBundle);
    REQUIRE_THROWS_AS(pair.client->send(vote_bundle), std::logic_error);
}
