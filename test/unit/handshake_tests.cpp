// Unit tests for network/handshake.cpp - HTTP upgrade exchange

#include <catch2/catch_test_macros.hpp>
#include "network/handshake.hpp"
#include "network/protocol.hpp"
#include <string>

using namespace algoprobe;
using namespace algoprobe::network;

namespace {

ReceiveBuffer BufferWith(const std::string &text) {
    ReceiveBuffer buffer(protocol::DEFAULT_RECV_FLOOD_SIZE);
    buffer.append(reinterpret_cast<const uint8_t *>(text.data()), text.size());
    return buffer;
}

std::string AsString(const std::vector<uint8_t> &bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

TEST_CASE("Handshake - Accept key derivation", "[network][handshake][unit]") {
    SECTION("RFC 6455 sample") {
        REQUIRE(DeriveAcceptKey("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
    }

    SECTION("RFC 6455 section 4.1 nonce") {
        REQUIRE(DeriveAcceptKey("AQIDBAUGBwgJCgsMDQ4PEC==") == "OfS0wDaT5NoxF2gqm7Zj2YtetzM=");
    }

    SECTION("Generated keys are 16 random bytes in base64") {
        auto key = GenerateWebSocketKey();
        REQUIRE(key.size() == 24);
        REQUIRE(key.substr(22) == "==");
        REQUIRE(GenerateWebSocketKey() != key);
    }
}

TEST_CASE("Handshake - Initiator request", "[network][handshake][unit]") {
    HandshakeConfig config;
    config.user_agent = "probe/1";
    Handshake hs(Role::Initiator, config, "127.0.0.1:4160");

    const std::string request = AsString(hs.start());
    REQUIRE(hs.state() == HandshakeState::SENT);

    REQUIRE(request.rfind("GET /v1/private-v1/gossip HTTP/1.1\r\n", 0) == 0);
    REQUIRE(request.find("Host: 127.0.0.1:4160\r\n") != std::string::npos);
    REQUIRE(request.find("User-Agent: probe/1\r\n") != std::string::npos);
    REQUIRE(request.find("Connection: Upgrade\r\n") != std::string::npos);
    REQUIRE(request.find("Upgrade: websocket\r\n") != std::string::npos);
    REQUIRE(request.find("Sec-WebSocket-Version: 13\r\n") != std::string::npos);
    REQUIRE(request.find("Sec-WebSocket-Key: " + hs.sec_websocket_key() + "\r\n") !=
            std::string::npos);
    REQUIRE(request.find("X-Algorand-Accept-Version: 2.1\r\n") != std::string::npos);
    REQUIRE(request.find("X-Algorand-Instancename: synth_node\r\n") != std::string::npos);
    REQUIRE(request.find("X-Algorand-Location: \r\n") != std::string::npos);
    REQUIRE(request.find("X-Algorand-Noderandom: cGVhMnBlYQ==\r\n") != std::string::npos);
    REQUIRE(request.find("X-Algorand-Version: 2.1\r\n") != std::string::npos);
    REQUIRE(request.find("X-Algorand-Genesis: private-v1\r\n") != std::string::npos);
    REQUIRE(request.find("X-Algorand-Telid") == std::string::npos);
    REQUIRE(request.substr(request.size() - 4) == "\r\n\r\n");

    // Header order follows the upstream client
    REQUIRE(request.find("Host:") < request.find("User-Agent:"));
    REQUIRE(request.find("Upgrade: websocket") < request.find("X-Algorand-Accept-Version"));
    REQUIRE(request.find("X-Algorand-Version") < request.find("X-Algorand-Genesis"));
}

TEST_CASE("Handshake - Initiator checks the response", "[network][handshake][unit]") {
    Handshake hs(Role::Initiator, HandshakeConfig{}, "127.0.0.1:4160");
    hs.start();
    std::vector<uint8_t> reply;
    message::DecodeState state;

    SECTION("Valid 101 with WebSocket bytes behind it") {
        auto buffer = BufferWith("HTTP/1.1 101 Switching Protocols\r\n"
                                 "Upgrade: websocket\r\n"
                                 "Connection: Upgrade\r\n"
                                 "Sec-WebSocket-Accept: " + hs.expected_accept() + "\r\n"
                                 "X-Algorand-Version: 2.1\r\n"
                                 "X-Algorand-Prioritychallenge: abc\r\n"
                                 "\r\n"
                                 "\x82\x01Z");
        REQUIRE(hs.on_data(buffer, reply, state) == message::DecodeStatus::COMPLETE);
        REQUIRE(hs.is_complete());
        REQUIRE(reply.empty());
        REQUIRE(hs.peer_headers().at("x-algorand-prioritychallenge") == "abc");
        REQUIRE(buffer.size() == 3);  // Frame left for the WebSocket layer
        REQUIRE(buffer.data()[0] == 0x82);
    }

    SECTION("Response split across reads") {
        const std::string response = "HTTP/1.1 101 Switching Protocols\r\n"
                                     "Upgrade: websocket\r\n"
                                     "Connection: Upgrade\r\n"
                                     "Sec-WebSocket-Accept: " + hs.expected_accept() + "\r\n"
                                     "\r\n";
        ReceiveBuffer buffer(protocol::DEFAULT_RECV_FLOOD_SIZE);
        buffer.append(reinterpret_cast<const uint8_t *>(response.data()), 20);
        REQUIRE(hs.on_data(buffer, reply, state) == message::DecodeStatus::INCOMPLETE);
        buffer.append(reinterpret_cast<const uint8_t *>(response.data()) + 20,
                      response.size() - 20);
        REQUIRE(hs.on_data(buffer, reply, state) == message::DecodeStatus::COMPLETE);
        REQUIRE(buffer.empty());
    }

    SECTION("Wrong accept key") {
        auto buffer = BufferWith("HTTP/1.1 101 Switching Protocols\r\n"
                                 "Upgrade: websocket\r\n"
                                 "Connection: Upgrade\r\n"
                                 "Sec-WebSocket-Accept: AAAAAAAAAAAAAAAAAAAAAAAAAAA=\r\n"
                                 "\r\n");
        REQUIRE(hs.on_data(buffer, reply, state) == message::DecodeStatus::INVALID);
        REQUIRE(state.GetRejectReason() == "bad-accept");
        REQUIRE(hs.state() == HandshakeState::REJECTED);
    }

    SECTION("Missing accept key") {
        auto buffer = BufferWith("HTTP/1.1 101 Switching Protocols\r\n"
                                 "Upgrade: websocket\r\n"
                                 "\r\n");
        REQUIRE(hs.on_data(buffer, reply, state) == message::DecodeStatus::INVALID);
        REQUIRE(state.GetRejectReason() == "missing-accept");
    }

    SECTION("Non-101 status") {
        auto buffer = BufferWith("HTTP/1.1 412 Precondition Failed\r\n"
                                 "Content-Length: 0\r\n"
                                 "\r\n");
        REQUIRE(hs.on_data(buffer, reply, state) == message::DecodeStatus::INVALID);
        REQUIRE(state.GetRejectReason() == "handshake-rejected");
    }

    SECTION("Not HTTP") {
        auto buffer = BufferWith("\x82\x05hello\r\n\r\n");
        REQUIRE(hs.on_data(buffer, reply, state) == message::DecodeStatus::INVALID);
        REQUIRE(state.GetRejectReason() == "bad-http");
    }
}

TEST_CASE("Handshake - Responder", "[network][handshake][unit]") {
    HandshakeConfig client_config;
    Handshake client(Role::Initiator, client_config, "127.0.0.1:4161");
    const auto request = client.start();

    std::vector<uint8_t> reply;
    message::DecodeState state;

    SECTION("Answers with the derived accept key") {
        HandshakeConfig server_config;
        server_config.challenge = "c2VjcmV0";
        Handshake server(Role::Responder, server_config, "127.0.0.1:50000");
        ReceiveBuffer buffer(protocol::DEFAULT_RECV_FLOOD_SIZE);
        buffer.append(request);

        REQUIRE(server.on_data(buffer, reply, state) == message::DecodeStatus::COMPLETE);
        REQUIRE(server.is_complete());
        REQUIRE(server.peer_headers().at("x-algorand-genesis") == "private-v1");

        const std::string response = AsString(reply);
        REQUIRE(response.rfind("HTTP/1.1 101", 0) == 0);
        REQUIRE(response.find("X-Algorand-Prioritychallenge: c2VjcmV0\r\n") != std::string::npos);

        // The initiator accepts what the responder produced
        ReceiveBuffer back(protocol::DEFAULT_RECV_FLOOD_SIZE);
        back.append(reply);
        std::vector<uint8_t> unused;
        REQUIRE(client.on_data(back, unused, state) == message::DecodeStatus::COMPLETE);
        REQUIRE(client.is_complete());
    }

    SECTION("Accept override makes the initiator reject") {
        HandshakeConfig server_config;
        server_config.accept_key_override = "bm90IHRoZSByaWdodCBrZXk=";
        Handshake server(Role::Responder, server_config, "127.0.0.1:50000");
        ReceiveBuffer buffer(protocol::DEFAULT_RECV_FLOOD_SIZE);
        buffer.append(request);
        REQUIRE(server.on_data(buffer, reply, state) == message::DecodeStatus::COMPLETE);

        ReceiveBuffer back(protocol::DEFAULT_RECV_FLOOD_SIZE);
        back.append(reply);
        std::vector<uint8_t> unused;
        REQUIRE(client.on_data(back, unused, state) == message::DecodeStatus::INVALID);
        REQUIRE(state.GetRejectReason() == "bad-accept");
    }

    SECTION("Request without a key") {
        Handshake server(Role::Responder, HandshakeConfig{}, "127.0.0.1:50000");
        auto buffer = BufferWith("GET /v1/private-v1/gossip HTTP/1.1\r\n"
                                 "Host: localhost\r\n"
                                 "Upgrade: websocket\r\n"
                                 "\r\n");
        REQUIRE(server.on_data(buffer, reply, state) == message::DecodeStatus::INVALID);
        REQUIRE(state.GetRejectReason() == "missing-key");
    }

    SECTION("Responder cannot start") {
        Handshake server(Role::Responder, HandshakeConfig{}, "127.0.0.1:50000");
        REQUIRE_THROWS_AS(server.start(), std::logic_error);
    }
}

TEST_CASE("Handshake - Overridden header values", "[network][handshake][unit]") {
    HandshakeConfig config;
    config.genesis = "testnet-v1.0";
    config.ws_version = "12";
    config.instance_name = std::string(300, 'x');
    config.telemetry_id = "tel-1";
    config.host = "algod.example:4160";
    Handshake hs(Role::Initiator, config, "127.0.0.1:4160");

    const std::string request = AsString(hs.start());
    REQUIRE(request.rfind("GET /v1/testnet-v1.0/gossip HTTP/1.1\r\n", 0) == 0);
    REQUIRE(request.find("Host: algod.example:4160\r\n") != std::string::npos);
    REQUIRE(request.find("Sec-WebSocket-Version: 12\r\n") != std::string::npos);
    REQUIRE(request.find("X-Algorand-Instancename: " + std::string(300, 'x')) != std::string::npos);
    REQUIRE(request.find("X-Algorand-Telid: tel-1\r\n") != std::string::npos);
    REQUIRE(request.find("X-Algorand-Genesis: testnet-v1.0\r\n") != std::string::npos);
}
