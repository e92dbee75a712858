#pragma once

#include "network/codec.hpp"
#include "network/handshake.hpp"
#include "network/receive_buffer.hpp"
#include "network/transport.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace algoprobe {
namespace network {

class PeerConnection;
using PeerConnectionPtr = std::shared_ptr<PeerConnection>;

/**
 * PeerConnection - the codec pipeline of one TCP connection
 *
 *   transport bytes -> ReceiveBuffer -> Handshake (until accepted)
 *                   -> WebSocket -> tag -> payload -> on_message
 *
 * Everything on the receive path runs on the transport connection's strand,
 * so messages are delivered in receive order. InvalidData at any layer, a
 * rejected handshake or receive-buffer overflow closes the connection.
 */
class PeerConnection : public std::enable_shared_from_this<PeerConnection> {
public:
  struct Callbacks {
    std::function<void(const std::string &peer, message::AlgoMsg msg)> on_message;
    std::function<void(const std::string &peer)> on_established;
    std::function<void(const std::string &peer)> on_closed;
  };

  static PeerConnectionPtr create(TransportConnectionPtr connection, Role role,
                                  bool handshake_enabled, HandshakeConfig config,
                                  Callbacks callbacks);

  PeerConnection(const PeerConnection &) = delete;
  PeerConnection &operator=(const PeerConnection &) = delete;

  // Register transport callbacks and, as initiator, send the upgrade request
  void start();

  // Frame and send one application message. Throws std::logic_error for a
  // payload with no outbound encoding.
  bool send(const message::Payload &payload);

  // Send bytes as they are, without WebSocket framing
  bool send_unframed(const std::vector<uint8_t> &bytes);

  void close(const std::string &reason);

  // "ip:port" of the remote end
  const std::string &address() const { return address_; }
  Role role() const { return role_; }
  bool is_established() const { return established_; }
  bool is_open() const;
  HandshakeState handshake_state() const { return handshake_state_; }

private:
  struct PrivateTag {};

public:
  PeerConnection(PrivateTag, TransportConnectionPtr connection, Role role,
                 bool handshake_enabled, HandshakeConfig config, Callbacks callbacks);

private:
  void on_transport_receive(const std::vector<uint8_t> &data);
  void on_transport_disconnect();
  bool drive_handshake();
  void process_frames();
  void mark_established();

  TransportConnectionPtr connection_;
  Role role_;
  bool handshake_enabled_;
  std::string address_;
  Callbacks callbacks_;

  // Receive path state, touched only from the transport strand
  Handshake handshake_;
  message::AlgoMsgCodec codec_;
  ReceiveBuffer recv_buffer_;

  std::atomic<bool> established_{false};
  std::atomic<bool> closed_{false};
  std::atomic<HandshakeState> handshake_state_{HandshakeState::NOT_STARTED};
};

} // namespace network
} // namespace algoprobe
