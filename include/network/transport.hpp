#pragma once

#include "network/protocol.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace algoprobe {
namespace network {

// Abstract byte-stream transport. The codec stack sits on top of
// TransportConnection and never touches sockets directly:
// - RealTransport: TCP sockets via boost::asio
// - test doubles: in-memory connections in test/

class Transport;
class TransportConnection;
using TransportConnectionPtr = std::shared_ptr<TransportConnection>;

// Callback types for transport events
using ConnectCallback = std::function<void(bool success)>;
using ReceiveCallback = std::function<void(const std::vector<uint8_t> &data)>;
using DisconnectCallback = std::function<void()>;
using AcceptCallback = std::function<void(TransportConnectionPtr)>;

// TransportConnection - one ordered, reliable byte stream
class TransportConnection {
public:
  virtual ~TransportConnection() = default;

  // Start receiving data (callbacks invoked when data arrives or connection
  // closes)
  virtual void start() = 0;

  // Returns false only if the connection is already closed. A true return
  // means the bytes were handed to the implementation, not that they were
  // written; send-queue overflow closes the connection and fires the
  // disconnect callback.
  virtual bool send(const std::vector<uint8_t> &data) = 0;

  virtual void close() = 0;
  virtual bool is_open() const = 0;

  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;
  virtual bool is_inbound() const = 0;
  virtual uint64_t connection_id() const = 0;

  virtual void set_receive_callback(ReceiveCallback callback) = 0;
  virtual void set_disconnect_callback(DisconnectCallback callback) = 0;
};

struct TransportOptions {
  size_t io_threads = 1;
  std::chrono::milliseconds connect_timeout{protocol::CONNECT_TIMEOUT};
  size_t send_queue_limit = protocol::DEFAULT_SEND_QUEUE_SIZE;
};

// Transport - connection factory (outbound connect, inbound accept)
class Transport {
public:
  virtual ~Transport() = default;

  // Initiate outbound connection; callback reports success or failure
  virtual TransportConnectionPtr connect(const std::string &address, uint16_t port,
                                         ConnectCallback callback) = 0;

  // Start accepting inbound connections on address:port (port 0 picks an
  // ephemeral port, see listening_port())
  virtual bool listen(const std::string &address, uint16_t port,
                      AcceptCallback accept_callback) = 0;

  virtual void stop_listening() = 0;
  virtual uint16_t listening_port() const = 0;

  // Start the event loop threads (returns immediately)
  virtual void run() = 0;

  // Stop listening and the event loop
  virtual void stop() = 0;

  virtual bool is_running() const = 0;
};

} // namespace network
} // namespace algoprobe
