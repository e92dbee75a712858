#pragma once

#include "harness/config.hpp"
#include "network/codec.hpp"
#include "network/peer_connection.hpp"
#include "network/real_transport.hpp"
#include "util/threadsafe_containers.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace algoprobe {
namespace harness {

/**
 * SyntheticNode - a scriptable gossip peer for probing algod
 *
 * Owns a RealTransport (one io thread by default) and one PeerConnection
 * per TCP connection. Peers are keyed by their "ip:port" text and count as
 * connected once the upgrade exchange completes (immediately when the
 * handshake is disabled).
 *
 * Every decoded message from every peer lands in one bounded inbound queue in
 * receive order per peer. When the queue is full the io thread waits for the
 * owner to pop, which stalls reads (and, with one io thread, every other
 * transport event) until there is room. Nothing is dropped.
 *
 * All methods may be called from any thread except the transport's own
 * callbacks.
 */
class SyntheticNode {
public:
  using InboundMessage = std::pair<std::string, message::AlgoMsg>;
  using PayloadCheck = std::function<bool(const message::Payload &)>;

  explicit SyntheticNode(SyntheticNodeConfig config = {});
  ~SyntheticNode();

  SyntheticNode(const SyntheticNode &) = delete;
  SyntheticNode &operator=(const SyntheticNode &) = delete;

  // Connect as initiator and run the handshake. Blocks until the peer is
  // connected, the attempt fails, or handshake_timeout expires.
  bool connect(const std::string &address, uint16_t port);
  bool connect(const std::string &host_port);

  // Listen as responder; returns the bound "ip:port"
  std::optional<std::string> start_listening();
  std::optional<std::string> listening_addr() const;

  bool is_connected(const std::string &peer) const;
  size_t num_connected() const;
  std::vector<std::string> connected_peers() const;

  // Poll (every 50ms) until any peer is connected
  std::optional<std::string> wait_for_connection(
      std::chrono::milliseconds timeout = protocol::CONNECT_TIMEOUT);

  // Framed send of one application message. False when the peer is unknown
  // or its connection is closed.
  bool unicast(const std::string &peer, const message::Payload &payload);

  // Bytes straight onto the TCP stream, bypassing WebSocket framing
  bool unicast_raw(const std::string &peer, const std::vector<uint8_t> &bytes);

  void disconnect(const std::string &peer);

  // Blocks until a message arrives; std::nullopt once the node is shut down
  std::optional<InboundMessage> recv_message();
  std::optional<InboundMessage> recv_message_timeout(std::chrono::milliseconds timeout);

  // Discard messages until one satisfies check; false on timeout
  bool expect_message(const PayloadCheck &check,
                      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  void shut_down();

  size_t pending_messages() const { return inbound_.Size(); }
  const SyntheticNodeConfig &config() const { return config_; }

private:
  network::PeerConnectionPtr add_connection(network::TransportConnectionPtr connection,
                                            network::Role role,
                                            network::PeerConnection::Callbacks callbacks);
  network::PeerConnection::Callbacks make_callbacks();

  SyntheticNodeConfig config_;
  std::unique_ptr<network::RealTransport> transport_;

  // Every live connection, established or not
  util::ThreadSafeMap<std::string, network::PeerConnectionPtr> peers_;
  util::BoundedQueue<InboundMessage> inbound_;

  std::atomic<bool> listening_{false};
  std::atomic<bool> shut_down_{false};
};

} // namespace harness
} // namespace algoprobe
