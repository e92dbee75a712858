// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/decode_state.hpp"
#include "network/protocol.hpp"
#include "network/receive_buffer.hpp"
#include "network/websocket.hpp"
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace algoprobe {
namespace network {

/**
 * Header values of the gossip upgrade exchange
 *
 * Every value is sent exactly as configured (empty or oversized values are
 * allowed, for probing the peer's limits).
 */
struct HandshakeConfig {
  // Initiator request
  std::string genesis = protocol::DEFAULT_GENESIS;
  std::string request_target;  // empty: /v1/{genesis}/gossip
  std::string host;            // empty: the remote "address:port"
  std::string user_agent = GetUserAgent();
  std::string ws_version = protocol::SEC_WEBSOCKET_VERSION;
  std::string accept_version = protocol::ALGORAND_ACCEPT_VERSION;
  std::string instance_name = protocol::DEFAULT_INSTANCE_NAME;
  std::string location;
  std::string node_random = protocol::DEFAULT_NODE_RANDOM;
  std::string version = protocol::ALGORAND_VERSION;
  std::optional<std::string> telemetry_id;

  // Responder
  std::optional<std::string> accept_key_override;
  // Sent as X-Algorand-Prioritychallenge; the initiator answers with NP
  std::optional<std::string> challenge;
};

// RFC 6455: base64(SHA-1(key + GUID))
std::string DeriveAcceptKey(const std::string &sec_websocket_key);

// base64 of 16 random bytes
std::string GenerateWebSocketKey();

enum class HandshakeState {
  NOT_STARTED,
  SENT,
  ACCEPTED,
  REJECTED,
};

const char *HandshakeStateName(HandshakeState state);

/**
 * Handshake - HTTP upgrade for one connection
 *
 * Initiator: start() returns the GET request (NOT_STARTED -> SENT); on_data()
 * parses the 101 response and checks Sec-WebSocket-Accept.
 * Responder: on_data() parses the GET request and fills reply with the 101
 * response (NOT_STARTED -> ACCEPTED).
 *
 * on_data() consumes only the HTTP header block; anything after it is
 * WebSocket traffic and stays in the buffer.
 */
class Handshake {
public:
  Handshake(Role role, HandshakeConfig config, std::string remote_address);

  std::vector<uint8_t> start();

  message::DecodeStatus on_data(ReceiveBuffer &buffer, std::vector<uint8_t> &reply,
                                message::DecodeState &state);

  Role role() const { return role_; }
  HandshakeState state() const { return state_; }
  bool is_complete() const { return state_ == HandshakeState::ACCEPTED; }

  const std::string &sec_websocket_key() const { return key_; }
  const std::string &expected_accept() const { return expected_accept_; }

  // Headers received from the peer, names lower-cased
  const std::map<std::string, std::string> &peer_headers() const { return peer_headers_; }

  std::string build_request() const;
  std::string build_response(const std::string &accept) const;

private:
  message::DecodeStatus on_response(ReceiveBuffer &buffer, message::DecodeState &state);
  message::DecodeStatus on_request(ReceiveBuffer &buffer, std::vector<uint8_t> &reply,
                                   message::DecodeState &state);
  message::DecodeStatus reject(message::DecodeState &state, const std::string &reason,
                               const std::string &debug);

  template <typename Parser>
  message::DecodeStatus feed(Parser &parser, ReceiveBuffer &buffer,
                             message::DecodeState &state);

  Role role_;
  HandshakeConfig config_;
  std::string remote_address_;
  HandshakeState state_ = HandshakeState::NOT_STARTED;

  std::string key_;
  std::string expected_accept_;
  std::map<std::string, std::string> peer_headers_;

  std::optional<boost::beast::http::response_parser<boost::beast::http::empty_body>> response_parser_;
  std::optional<boost::beast::http::request_parser<boost::beast::http::empty_body>> request_parser_;
};

} // namespace network
} // namespace algoprobe
