// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer_connection.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace algoprobe {
namespace network {

using message::DecodeState;
using message::DecodeStatus;

namespace {

std::string FormatAddress(const TransportConnectionPtr &connection) {
  if (!connection) {
    return "unknown";
  }
  const std::string ip = connection->remote_address();
  if (ip.find(':') != std::string::npos) {
    return "[" + ip + "]:" + std::to_string(connection->remote_port());
  }
  return ip + ":" + std::to_string(connection->remote_port());
}

} // namespace

PeerConnectionPtr PeerConnection::create(TransportConnectionPtr connection, Role role,
                                         bool handshake_enabled, HandshakeConfig config,
                                         Callbacks callbacks) {
  return std::make_shared<PeerConnection>(PrivateTag{}, std::move(connection), role,
                                          handshake_enabled, std::move(config),
                                          std::move(callbacks));
}

PeerConnection::PeerConnection(PrivateTag, TransportConnectionPtr connection, Role role,
                               bool handshake_enabled, HandshakeConfig config,
                               Callbacks callbacks)
    : connection_(std::move(connection)), role_(role), handshake_enabled_(handshake_enabled),
      address_(FormatAddress(connection_)), callbacks_(std::move(callbacks)),
      handshake_(role, std::move(config), address_), codec_(role),
      recv_buffer_(protocol::DEFAULT_RECV_FLOOD_SIZE) {}

bool PeerConnection::is_open() const {
  return !closed_ && connection_ && connection_->is_open();
}

void PeerConnection::start() {
  if (!connection_) {
    throw std::logic_error("peer connection has no transport");
  }

  // Weak captures: the transport connection must not keep its owner alive
  std::weak_ptr<PeerConnection> weak = shared_from_this();
  connection_->set_receive_callback([weak](const std::vector<uint8_t> &data) {
    if (auto self = weak.lock()) {
      self->on_transport_receive(data);
    }
  });
  connection_->set_disconnect_callback([weak]() {
    if (auto self = weak.lock()) {
      self->on_transport_disconnect();
    }
  });

  LOG_NET_DEBUG("starting {} connection with {} (handshake {})", RoleName(role_), address_,
                handshake_enabled_ ? "enabled" : "disabled");

  if (!handshake_enabled_) {
    mark_established();
  } else if (role_ == Role::Initiator) {
    const auto request = handshake_.start();
    handshake_state_ = handshake_.state();
    if (!connection_->send(request)) {
      LOG_NET_DEBUG("connection to {} closed before the upgrade request was sent", address_);
    }
  }

  connection_->start();
}

bool PeerConnection::send(const message::Payload &payload) {
  if (!is_open()) {
    return false;
  }
  const auto bytes = codec_.encode(payload);
  LOG_NET_TRACE("sending {} ({} bytes framed) to {}", message::TagName(payload.tag()), bytes.size(),
                address_);
  return connection_->send(bytes);
}

bool PeerConnection::send_unframed(const std::vector<uint8_t> &bytes) {
  if (!is_open()) {
    return false;
  }
  LOG_NET_TRACE("sending {} unframed bytes to {}", bytes.size(), address_);
  return connection_->send(bytes);
}

void PeerConnection::close(const std::string &reason) {
  if (closed_.exchange(true)) {
    return;
  }
  established_ = false;
  LOG_NET_DEBUG("closing connection with {}: {}", address_, reason);
  if (connection_) {
    connection_->close();
  }
}

void PeerConnection::mark_established() {
  if (established_.exchange(true)) {
    return;
  }
  LOG_NET_INFO("connection with {} established ({})", address_, RoleName(role_));
  if (callbacks_.on_established) {
    callbacks_.on_established(address_);
  }
}

void PeerConnection::on_transport_receive(const std::vector<uint8_t> &data) {
  if (closed_) {
    return;
  }
  if (!recv_buffer_.append(data)) {
    LOG_NET_WARN("receive buffer overflow from {} ({} + {} bytes exceeds {})", address_,
                 recv_buffer_.size(), data.size(), recv_buffer_.limit());
    close("receive buffer overflow");
    return;
  }

  if (handshake_enabled_ && !handshake_.is_complete()) {
    if (!drive_handshake()) {
      return;
    }
  }
  process_frames();
}

bool PeerConnection::drive_handshake() {
  DecodeState state;
  std::vector<uint8_t> reply;
  const DecodeStatus status = handshake_.on_data(recv_buffer_, reply, state);
  handshake_state_ = handshake_.state();

  switch (status) {
  case DecodeStatus::INCOMPLETE:
    return false;
  case DecodeStatus::INVALID:
    LOG_CODEC_DEBUG("handshake with {} failed: {}", address_, state.ToString());
    close("handshake failed: " + state.GetRejectReason());
    return false;
  case DecodeStatus::COMPLETE:
    break;
  }

  if (!reply.empty() && !connection_->send(reply)) {
    LOG_NET_DEBUG("connection to {} closed before the upgrade response was sent", address_);
    return false;
  }
  mark_established();
  return true;
}

void PeerConnection::process_frames() {
  while (!closed_ && !recv_buffer_.empty()) {
    DecodeState state;
    message::AlgoMsg msg;
    const DecodeStatus status = codec_.try_decode(recv_buffer_, msg, state);
    if (status == DecodeStatus::INCOMPLETE) {
      return;
    }
    if (status == DecodeStatus::INVALID) {
      LOG_CODEC_DEBUG("invalid data from {}: {}", address_, state.ToString());
      close("invalid data: " + state.GetRejectReason());
      return;
    }

    LOG_NET_TRACE("received {} ({} bytes) from {}", message::TagName(msg.tag()), msg.raw.size(),
                  address_);
    if (callbacks_.on_message) {
      callbacks_.on_message(address_, std::move(msg));
    }
  }
}

void PeerConnection::on_transport_disconnect() {
  closed_ = true;
  established_ = false;
  LOG_NET_DEBUG("connection with {} closed (handshake {})", address_,
                HandshakeStateName(handshake_state_));
  if (callbacks_.on_closed) {
    callbacks_.on_closed(address_);
  }
}

} // namespace network
} // namespace algoprobe
