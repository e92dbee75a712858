// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "harness/synthetic_node.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <future>
#include <thread>

namespace algoprobe {
namespace harness {

using network::PeerConnection;
using network::PeerConnectionPtr;
using network::Role;

namespace {
constexpr std::chrono::milliseconds WAIT_POLL_INTERVAL{50};
}

SyntheticNode::SyntheticNode(SyntheticNodeConfig config)
    : config_(std::move(config)),
      transport_(std::make_unique<network::RealTransport>(config_.transport)),
      inbound_(config_.inbound_queue_capacity) {
  transport_->run();
}

SyntheticNode::~SyntheticNode() { shut_down(); }

PeerConnection::Callbacks SyntheticNode::make_callbacks() {
  PeerConnection::Callbacks callbacks;
  callbacks.on_message = [this](const std::string &peer, message::AlgoMsg msg) {
    // Blocks the io thread while the queue is full; reads resume as the owner pops
    if (!inbound_.Push({peer, std::move(msg)})) {
      LOG_NET_DEBUG("node shutting down, discarded message from {}", peer);
    }
  };
  callbacks.on_closed = [this](const std::string &peer) {
    if (peers_.Erase(peer)) {
      LOG_NET_DEBUG("peer {} removed", peer);
    }
  };
  return callbacks;
}

PeerConnectionPtr SyntheticNode::add_connection(network::TransportConnectionPtr connection,
                                                Role role, PeerConnection::Callbacks callbacks) {
  auto peer = PeerConnection::create(std::move(connection), role, config_.handshake,
                                     config_.handshake_config, std::move(callbacks));
  peers_.Insert(peer->address(), peer);
  peer->start();
  return peer;
}

bool SyntheticNode::connect(const std::string &address, uint16_t port) {
  if (shut_down_) {
    return false;
  }

  auto connected = std::make_shared<std::promise<bool>>();
  auto connected_future = connected->get_future();
  auto connection = transport_->connect(address, port, [connected](bool success) {
    connected->set_value(success);
  });
  if (!connection) {
    LOG_NET_WARN("failed to start connection to {}:{}", address, port);
    return false;
  }

  const auto deadline = std::chrono::steady_clock::now() + config_.handshake_timeout;
  if (connected_future.wait_until(deadline) != std::future_status::ready ||
      !connected_future.get()) {
    LOG_NET_WARN("TCP connect to {}:{} failed", address, port);
    connection->close();
    return false;
  }

  // Settled exactly once, by whichever of established/closed comes first
  auto established = std::make_shared<std::promise<bool>>();
  auto settled = std::make_shared<std::atomic<bool>>(false);
  auto established_future = established->get_future();

  auto callbacks = make_callbacks();
  callbacks.on_established = [established, settled](const std::string &) {
    if (!settled->exchange(true)) {
      established->set_value(true);
    }
  };
  auto on_closed = callbacks.on_closed;
  callbacks.on_closed = [on_closed, established, settled](const std::string &peer) {
    on_closed(peer);
    if (!settled->exchange(true)) {
      established->set_value(false);
    }
  };

  auto peer = add_connection(std::move(connection), Role::Initiator, std::move(callbacks));

  if (established_future.wait_until(deadline) != std::future_status::ready) {
    LOG_NET_WARN("handshake with {} timed out ({})", peer->address(),
                 network::HandshakeStateName(peer->handshake_state()));
    peer->close("handshake timeout");
    peers_.Erase(peer->address());
    return false;
  }
  if (!established_future.get()) {
    LOG_NET_WARN("connection to {} closed during handshake ({})", peer->address(),
                 network::HandshakeStateName(peer->handshake_state()));
    return false;
  }
  return true;
}

bool SyntheticNode::connect(const std::string &host_port) {
  auto parsed = util::SplitHostPort(host_port);
  if (!parsed) {
    LOG_NET_WARN("invalid peer address '{}'", host_port);
    return false;
  }
  return connect(parsed->first, parsed->second);
}

std::optional<std::string> SyntheticNode::start_listening() {
  if (shut_down_) {
    return std::nullopt;
  }
  if (listening_) {
    return listening_addr();
  }
  const bool ok = transport_->listen(
      config_.listen_address, config_.listen_port,
      [this](network::TransportConnectionPtr connection) {
        if (shut_down_) {
          connection->close();
          return;
        }
        auto callbacks = make_callbacks();
        auto peer = add_connection(std::move(connection), Role::Responder, std::move(callbacks));
        LOG_NET_DEBUG("accepted connection from {}", peer->address());
      });
  if (!ok) {
    return std::nullopt;
  }
  listening_ = true;
  return listening_addr();
}

std::optional<std::string> SyntheticNode::listening_addr() const {
  if (!listening_) {
    return std::nullopt;
  }
  return config_.listen_address + ":" + std::to_string(transport_->listening_port());
}

bool SyntheticNode::is_connected(const std::string &peer) const {
  auto conn = peers_.Get(peer);
  return conn && (*conn)->is_established();
}

size_t SyntheticNode::num_connected() const { return connected_peers().size(); }

std::vector<std::string> SyntheticNode::connected_peers() const {
  std::vector<std::string> out;
  for (const auto &[address, conn] : peers_.GetAll()) {
    if (conn->is_established()) {
      out.push_back(address);
    }
  }
  return out;
}

std::optional<std::string> SyntheticNode::wait_for_connection(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!shut_down_) {
    auto peers = connected_peers();
    if (!peers.empty()) {
      return peers.back();
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(WAIT_POLL_INTERVAL);
  }
  return std::nullopt;
}

bool SyntheticNode::unicast(const std::string &peer, const message::Payload &payload) {
  auto conn = peers_.Get(peer);
  if (!conn) {
    LOG_NET_DEBUG("unicast to unknown peer {}", peer);
    return false;
  }
  return (*conn)->send(payload);
}

bool SyntheticNode::unicast_raw(const std::string &peer, const std::vector<uint8_t> &bytes) {
  auto conn = peers_.Get(peer);
  if (!conn) {
    LOG_NET_DEBUG("unicast_raw to unknown peer {}", peer);
    return false;
  }
  return (*conn)->send_unframed(bytes);
}

void SyntheticNode::disconnect(const std::string &peer) {
  auto conn = peers_.Get(peer);
  if (conn) {
    (*conn)->close("disconnect requested");
  }
}

std::optional<SyntheticNode::InboundMessage> SyntheticNode::recv_message() {
  return inbound_.Pop();
}

std::optional<SyntheticNode::InboundMessage>
SyntheticNode::recv_message_timeout(std::chrono::milliseconds timeout) {
  return inbound_.PopFor(timeout);
}

bool SyntheticNode::expect_message(const PayloadCheck &check,
                                   std::optional<std::chrono::milliseconds> timeout) {
  const auto duration = timeout.value_or(
      std::chrono::duration_cast<std::chrono::milliseconds>(protocol::EXPECT_MESSAGE_TIMEOUT));
  const auto deadline = std::chrono::steady_clock::now() + duration;

  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    auto msg = inbound_.PopFor(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
    if (!msg) {
      return false;
    }
    const auto &payload = msg->second.payload;
    if (payload && check(*payload)) {
      return true;
    }
    LOG_NET_TRACE("expect_message skipped {} from {}", message::TagName(msg->second.tag()),
                  msg->first);
  }
}

void SyntheticNode::shut_down() {
  if (shut_down_.exchange(true)) {
    return;
  }
  LOG_NET_DEBUG("shutting down synthetic node ({} peers)", peers_.Size());

  // Release an io thread blocked on a full queue before joining it
  inbound_.Close();
  transport_->stop_listening();
  listening_ = false;
  for (const auto &[address, conn] : peers_.GetAll()) {
    conn->close("shutdown");
  }
  transport_->stop();
  peers_.Clear();
}

} // namespace harness
} // namespace algoprobe
