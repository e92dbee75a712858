#pragma once

#include "network/transport.hpp"
#include <atomic>
#include <utility> // std::exchange, needed before boost/asio (Boost 1.74)
#include <boost/asio.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <memory>
#include <queue>
#include <thread>
#include <vector>

namespace algoprobe {
namespace network {

/**
 * RealTransportConnection - TCP socket implementation of TransportConnection
 *
 * All socket work, callbacks and the send queue live on one strand.
 */
class RealTransportConnection
    : public TransportConnection,
      public std::enable_shared_from_this<RealTransportConnection> {
public:
  static TransportConnectionPtr create_outbound(boost::asio::io_context &io_context,
                                                const TransportOptions &options,
                                                const std::string &address, uint16_t port,
                                                ConnectCallback callback);

  static TransportConnectionPtr create_inbound(boost::asio::io_context &io_context,
                                               const TransportOptions &options,
                                               boost::asio::ip::tcp::socket socket);

  ~RealTransportConnection() override = default;

  RealTransportConnection(const RealTransportConnection &) = delete;
  RealTransportConnection &operator=(const RealTransportConnection &) = delete;

  // TransportConnection interface
  void start() override;
  bool send(const std::vector<uint8_t> &data) override;
  void close() override;
  bool is_open() const override { return open_; }
  std::string remote_address() const override { return remote_addr_; }
  uint16_t remote_port() const override { return remote_port_; }
  bool is_inbound() const override { return is_inbound_; }
  uint64_t connection_id() const override { return id_; }
  void set_receive_callback(ReceiveCallback callback) override;
  void set_disconnect_callback(DisconnectCallback callback) override;

private:
  RealTransportConnection(boost::asio::io_context &io_context, const TransportOptions &options,
                          bool is_inbound);

  void do_connect(const std::string &address, uint16_t port, ConnectCallback callback);
  void finish_connect(bool success, const ConnectCallback &callback);

  // Strand-serialized internals (must be called on strand_)
  void start_read_impl();
  void do_write_impl();
  void close_impl();

  // Deliver disconnect callback exactly once (must be called on strand)
  void deliver_disconnect_once();

  void set_socket_options();

  boost::asio::io_context &io_context_;
  boost::asio::ip::tcp::socket socket_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  TransportOptions options_;
  bool is_inbound_;
  uint64_t id_;
  static std::atomic<uint64_t> next_id_;

  // Accessed only on strand_
  ReceiveCallback receive_callback_;
  DisconnectCallback disconnect_callback_;
  bool disconnect_delivered_{false};

  std::queue<std::shared_ptr<std::vector<uint8_t>>> send_queue_;
  size_t send_queue_bytes_ = 0;
  std::atomic<bool> writing_{false};

  static constexpr size_t RECV_BUFFER_SIZE = 256 * 1024;

  // unique_ptr so close_impl() can destroy it while the io_context is alive
  std::unique_ptr<boost::asio::steady_timer> connect_timer_;
  std::atomic<bool> connect_done_{false};
  std::shared_ptr<boost::asio::ip::tcp::resolver> resolver_;

  std::atomic<bool> open_{false};
  std::string remote_addr_;
  uint16_t remote_port_ = 0;
};

/**
 * RealTransport - boost::asio implementation of Transport
 *
 * Owns the io_context and its worker threads.
 */
class RealTransport : public Transport {
public:
  explicit RealTransport(TransportOptions options = {});
  ~RealTransport() override;

  RealTransport(const RealTransport &) = delete;
  RealTransport &operator=(const RealTransport &) = delete;

  // Transport interface
  TransportConnectionPtr connect(const std::string &address, uint16_t port,
                                 ConnectCallback callback) override;
  bool listen(const std::string &address, uint16_t port,
              AcceptCallback accept_callback) override;
  void stop_listening() override;
  uint16_t listening_port() const override { return last_listen_port_; }
  void run() override;
  void stop() override;
  bool is_running() const override { return running_; }

  boost::asio::io_context &io_context() { return *io_context_; }

private:
  void start_accept();
  void handle_accept(const boost::system::error_code &ec, boost::asio::ip::tcp::socket socket);

  TransportOptions options_;

  // Destroyed only in the destructor so it outlives every connection strand
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> running_{false};

  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  AcceptCallback accept_callback_;
  std::atomic<uint16_t> last_listen_port_{0};
};

} // namespace network
} // namespace algoprobe
