// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/handshake.hpp"
#include "util/base_encoding.hpp"
#include "util/hash.hpp"
#include "util/logging.hpp"
#include "util/random.hpp"
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/asio/buffer.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace algoprobe {
namespace network {

namespace http = boost::beast::http;
using message::DecodeState;
using message::DecodeStatus;

namespace {

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

template <typename StringView>
std::string ToString(const StringView &sv) {
  return std::string(sv.data(), sv.size());
}

template <typename Fields>
std::map<std::string, std::string> CollectHeaders(const Fields &fields) {
  std::map<std::string, std::string> out;
  for (const auto &field : fields) {
    out[ToLower(ToString(field.name_string()))] = ToString(field.value());
  }
  return out;
}

} // namespace

std::string DeriveAcceptKey(const std::string &sec_websocket_key) {
  const auto digest = util::Sha1(sec_websocket_key + protocol::WEBSOCKET_GUID);
  return util::EncodeBase64(digest.data(), digest.size());
}

std::string GenerateWebSocketKey() {
  return util::EncodeBase64(util::GenerateRandomBytes(protocol::SEC_WEBSOCKET_KEY_NONCE_SIZE));
}

const char *HandshakeStateName(HandshakeState state) {
  switch (state) {
  case HandshakeState::NOT_STARTED:
    return "not-started";
  case HandshakeState::SENT:
    return "sent";
  case HandshakeState::ACCEPTED:
    return "accepted";
  case HandshakeState::REJECTED:
    return "rejected";
  }
  return "unknown";
}

Handshake::Handshake(Role role, HandshakeConfig config, std::string remote_address)
    : role_(role), config_(std::move(config)), remote_address_(std::move(remote_address)) {}

std::string Handshake::build_request() const {
  const std::string target = config_.request_target.empty()
                                 ? protocol::GossipPath(config_.genesis)
                                 : config_.request_target;

  http::request<http::empty_body> req{http::verb::get, target, 11};
  req.set(http::field::host, config_.host.empty() ? remote_address_ : config_.host);
  req.set(http::field::user_agent, config_.user_agent);
  req.set(http::field::connection, "Upgrade");
  req.set(http::field::sec_websocket_key, key_);
  req.set(http::field::sec_websocket_version, config_.ws_version);
  req.set(http::field::upgrade, "websocket");
  req.set("X-Algorand-Accept-Version", config_.accept_version);
  req.set("X-Algorand-Instancename", config_.instance_name);
  req.set("X-Algorand-Location", config_.location);
  req.set("X-Algorand-Noderandom", config_.node_random);
  if (config_.telemetry_id) {
    req.set("X-Algorand-Telid", *config_.telemetry_id);
  }
  req.set("X-Algorand-Version", config_.version);
  req.set("X-Algorand-Genesis", config_.genesis);

  std::ostringstream os;
  os << req;
  return os.str();
}

std::string Handshake::build_response(const std::string &accept) const {
  http::response<http::empty_body> res{http::status::switching_protocols, 11};
  res.set(http::field::upgrade, "websocket");
  res.set(http::field::connection, "Upgrade");
  res.set(http::field::sec_websocket_accept, accept);
  res.set("X-Algorand-Instancename", config_.instance_name);
  res.set("X-Algorand-Location", config_.location);
  res.set("X-Algorand-Noderandom", config_.node_random);
  res.set("X-Algorand-Version", config_.accept_version);
  res.set("X-Algorand-Genesis", config_.genesis);
  if (config_.challenge) {
    res.set("X-Algorand-Prioritychallenge", *config_.challenge);
  }

  std::ostringstream os;
  os << res;
  return os.str();
}

std::vector<uint8_t> Handshake::start() {
  if (role_ != Role::Initiator) {
    throw std::logic_error("only the initiator sends the upgrade request");
  }
  key_ = GenerateWebSocketKey();
  expected_accept_ = DeriveAcceptKey(key_);

  response_parser_.emplace();
  response_parser_->header_limit(static_cast<std::uint32_t>(protocol::MAX_HANDSHAKE_SIZE));
  response_parser_->skip(true);

  const std::string req = build_request();
  LOG_HS_DEBUG("sending upgrade request to {} ({} bytes)", remote_address_, req.size());
  LOG_HS_TRACE("request:\n{}", req);
  state_ = HandshakeState::SENT;
  return std::vector<uint8_t>(req.begin(), req.end());
}

DecodeStatus Handshake::on_data(ReceiveBuffer &buffer, std::vector<uint8_t> &reply,
                                DecodeState &state) {
  switch (state_) {
  case HandshakeState::SENT:
    return on_response(buffer, state);
  case HandshakeState::NOT_STARTED:
    if (role_ == Role::Responder) {
      if (!request_parser_) {
        request_parser_.emplace();
        request_parser_->header_limit(static_cast<std::uint32_t>(protocol::MAX_HANDSHAKE_SIZE));
      }
      return on_request(buffer, reply, state);
    }
    return reject(state, "handshake-not-started", "data received before the request was sent");
  case HandshakeState::ACCEPTED:
    return DecodeStatus::COMPLETE;
  case HandshakeState::REJECTED:
    state.Invalid("handshake-rejected");
    return DecodeStatus::INVALID;
  }
  return DecodeStatus::INVALID;
}

template <typename Parser>
DecodeStatus Handshake::feed(Parser &parser, ReceiveBuffer &buffer, DecodeState &state) {
  while (!parser.is_done()) {
    if (buffer.empty()) {
      return DecodeStatus::INCOMPLETE;
    }
    boost::beast::error_code ec;
    const size_t used = parser.put(boost::asio::buffer(buffer.data(), buffer.size()), ec);
    buffer.consume(used);
    if (ec == http::error::need_more) {
      return DecodeStatus::INCOMPLETE;
    }
    if (ec) {
      return reject(state, "bad-http", ec.message());
    }
  }
  return DecodeStatus::COMPLETE;
}

DecodeStatus Handshake::on_response(ReceiveBuffer &buffer, DecodeState &state) {
  DecodeStatus status = feed(*response_parser_, buffer, state);
  if (status != DecodeStatus::COMPLETE) {
    return status;
  }

  const auto &res = response_parser_->get();
  peer_headers_ = CollectHeaders(res);
  LOG_HS_TRACE("response from {}: status {}", remote_address_, res.result_int());

  if (res.result() != http::status::switching_protocols) {
    return reject(state, "handshake-rejected",
                  "peer answered with status " + std::to_string(res.result_int()));
  }

  auto it = res.find(http::field::sec_websocket_accept);
  if (it == res.end()) {
    return reject(state, "missing-accept", "missing Sec-WebSocket-Accept");
  }
  if (ToString(it->value()) != expected_accept_) {
    return reject(state, "bad-accept", "invalid Sec-WebSocket-Accept");
  }

  state_ = HandshakeState::ACCEPTED;
  response_parser_.reset();
  LOG_HS_DEBUG("handshake with {} accepted", remote_address_);
  return DecodeStatus::COMPLETE;
}

DecodeStatus Handshake::on_request(ReceiveBuffer &buffer, std::vector<uint8_t> &reply,
                                   DecodeState &state) {
  DecodeStatus status = feed(*request_parser_, buffer, state);
  if (status != DecodeStatus::COMPLETE) {
    return status;
  }

  const auto &req = request_parser_->get();
  peer_headers_ = CollectHeaders(req);
  LOG_HS_TRACE("upgrade request from {}: {} {}", remote_address_,
               ToString(req.method_string()), ToString(req.target()));

  auto it = req.find(http::field::sec_websocket_key);
  if (it == req.end()) {
    return reject(state, "missing-key", "missing Sec-WebSocket-Key");
  }
  key_ = ToString(it->value());
  expected_accept_ = config_.accept_key_override ? *config_.accept_key_override
                                                 : DeriveAcceptKey(key_);

  const std::string rsp = build_response(expected_accept_);
  reply.assign(rsp.begin(), rsp.end());
  state_ = HandshakeState::ACCEPTED;
  request_parser_.reset();
  LOG_HS_DEBUG("accepted upgrade from {}{}", remote_address_,
               config_.challenge ? " (priority challenge sent)" : "");
  return DecodeStatus::COMPLETE;
}

DecodeStatus Handshake::reject(DecodeState &state, const std::string &reason,
                               const std::string &debug) {
  state_ = HandshakeState::REJECTED;
  LOG_HS_WARN("handshake with {} failed: {} ({})", remote_address_, reason, debug);
  state.Invalid(reason, debug);
  return DecodeStatus::INVALID;
}

} // namespace network
} // namespace algoprobe
