// Copyright (c) 2025 The Unicity Foundation
// Real transport implementation using boost::asio TCP sockets

#include "network/real_transport.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace algoprobe {
namespace network {

namespace {

// Callbacks are user code; an exception escaping one must not unwind
// through an asio handler
template <typename Fn, typename... Args>
void InvokeCallback(const char *what, const Fn &fn, Args &&...args) {
  if (!fn) {
    return;
  }
  try {
    fn(std::forward<Args>(args)...);
  } catch (const std::exception &e) {
    LOG_NET_WARN("exception in {} callback: {}", what, e.what());
  }
}

} // namespace

// ============================================================================
// RealTransportConnection
// ============================================================================

std::atomic<uint64_t> RealTransportConnection::next_id_{1};

TransportConnectionPtr RealTransportConnection::create_outbound(
    boost::asio::io_context &io_context, const TransportOptions &options,
    const std::string &address, uint16_t port, ConnectCallback callback) {
  auto conn = std::shared_ptr<RealTransportConnection>(
      new RealTransportConnection(io_context, options, false));
  // Defer onto the strand so shared_from_this() is valid in do_connect
  boost::asio::post(conn->strand_, [conn, address, port, callback]() mutable {
    conn->do_connect(address, port, std::move(callback));
  });
  return conn;
}

TransportConnectionPtr RealTransportConnection::create_inbound(
    boost::asio::io_context &io_context, const TransportOptions &options,
    boost::asio::ip::tcp::socket socket) {
  auto conn = std::shared_ptr<RealTransportConnection>(
      new RealTransportConnection(io_context, options, true));
  conn->socket_ = std::move(socket);
  conn->open_ = true;

  boost::system::error_code ec;
  auto remote_ep = conn->socket_.remote_endpoint(ec);
  if (!ec) {
    conn->remote_addr_ = remote_ep.address().to_string();
    conn->remote_port_ = remote_ep.port();
  } else {
    LOG_NET_TRACE("failed to get remote endpoint: {}", ec.message());
  }
  conn->set_socket_options();
  return conn;
}

RealTransportConnection::RealTransportConnection(boost::asio::io_context &io_context,
                                                 const TransportOptions &options,
                                                 bool is_inbound)
    : io_context_(io_context), socket_(io_context), strand_(io_context.get_executor()),
      options_(options), is_inbound_(is_inbound), id_(next_id_++),
      connect_timer_(std::make_unique<boost::asio::steady_timer>(io_context)) {}

void RealTransportConnection::set_socket_options() {
  boost::system::error_code ec;
  socket_.set_option(boost::asio::ip::tcp::no_delay(true), ec);
  socket_.set_option(boost::asio::socket_base::keep_alive(true), ec);
}

void RealTransportConnection::finish_connect(bool success, const ConnectCallback &callback) {
  connect_done_ = true;
  if (connect_timer_) {
    (void)connect_timer_->cancel();
  }
  InvokeCallback("connect", callback, success);
}

void RealTransportConnection::do_connect(const std::string &address, uint16_t port,
                                         ConnectCallback callback) {
  remote_addr_ = address;
  remote_port_ = port;
  connect_done_ = false;

  if (options_.connect_timeout.count() > 0 && connect_timer_) {
    connect_timer_->expires_after(options_.connect_timeout);
    connect_timer_->async_wait(boost::asio::bind_executor(
        strand_, [this, self = shared_from_this(), callback](const boost::system::error_code &ec) {
          if (ec == boost::asio::error::operation_aborted || connect_done_) {
            return;
          }
          LOG_NET_WARN("connect timeout to {}:{} after {} ms", remote_addr_, remote_port_,
                       options_.connect_timeout.count());
          connect_done_ = true;
          boost::system::error_code ignored;
          if (resolver_)
            resolver_->cancel();
          socket_.cancel(ignored);
          socket_.close(ignored);
          InvokeCallback("connect", callback, false);
        }));
  }

  resolver_ = std::make_shared<boost::asio::ip::tcp::resolver>(io_context_);
  resolver_->async_resolve(
      address, std::to_string(port),
      boost::asio::bind_executor(
          strand_, [this, self = shared_from_this(), callback](
                       const boost::system::error_code &ec,
                       boost::asio::ip::tcp::resolver::results_type results) {
            if (connect_done_)
              return;
            if (ec) {
              LOG_NET_DEBUG("failed to resolve {}: {}", remote_addr_, ec.message());
              finish_connect(false, callback);
              return;
            }

            boost::asio::async_connect(
                socket_, results,
                boost::asio::bind_executor(
                    strand_, [this, self, callback](const boost::system::error_code &ec,
                                                    const boost::asio::ip::tcp::endpoint &ep) {
                      if (connect_done_)
                        return;
                      if (ec) {
                        LOG_NET_DEBUG("failed to connect to {}:{}: {}", remote_addr_,
                                      remote_port_, ec.message());
                        finish_connect(false, callback);
                        return;
                      }

                      open_ = true;
                      set_socket_options();
                      remote_addr_ = ep.address().to_string();
                      remote_port_ = ep.port();

                      LOG_NET_TRACE("connected to {}:{}", remote_addr_, remote_port_);
                      finish_connect(true, callback);
                    }));
          }));
}

void RealTransportConnection::start() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    if (!self->open_)
      return;
    self->start_read_impl();
  });
}

void RealTransportConnection::start_read_impl() {
  if (!open_)
    return;

  auto buf = std::make_shared<std::vector<uint8_t>>(RECV_BUFFER_SIZE);

  socket_.async_read_some(
      boost::asio::buffer(*buf),
      boost::asio::bind_executor(
          strand_, [this, self = shared_from_this(), buf](const boost::system::error_code &ec,
                                                          size_t bytes_transferred) {
            if (!open_) {
              deliver_disconnect_once();
              close_impl();
              return;
            }

            if (ec) {
              if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
                LOG_NET_TRACE("read error from {}:{}: {}", remote_addr_, remote_port_,
                              ec.message());
              }
              deliver_disconnect_once();
              close_impl();
              return;
            }

            if (bytes_transferred > 0) {
              LOG_NET_TRACE("tcp received {} bytes from {}:{}", bytes_transferred, remote_addr_,
                            remote_port_);
              std::vector<uint8_t> data(buf->begin(), buf->begin() + bytes_transferred);
              ReceiveCallback saved_receive_cb = receive_callback_;
              InvokeCallback("receive", saved_receive_cb, data);

              // The receive callback may have closed the connection
              if (!open_) {
                return;
              }
            }

            start_read_impl();
          }));
}

bool RealTransportConnection::send(const std::vector<uint8_t> &data) {
  if (!open_)
    return false;
  // Copy before posting: the caller's buffer may be gone by the time the
  // strand runs the lambda
  auto payload = std::make_shared<std::vector<uint8_t>>(data.begin(), data.end());
  boost::asio::dispatch(strand_, [this, self = shared_from_this(), payload]() {
    if (!open_)
      return;

    if (send_queue_bytes_ + payload->size() > options_.send_queue_limit) {
      LOG_NET_WARN("send queue overflow (current: {} bytes, incoming: {} bytes, limit: {} "
                   "bytes), disconnecting {}:{}",
                   send_queue_bytes_, payload->size(), options_.send_queue_limit,
                   remote_addr_, remote_port_);
      deliver_disconnect_once();
      close_impl();
      return;
    }

    send_queue_.push(payload);
    send_queue_bytes_ += payload->size();

    if (!writing_.exchange(true, std::memory_order_acquire)) {
      do_write_impl();
    }
  });
  return true;
}

void RealTransportConnection::do_write_impl() {
  if (!open_)
    return;

  if (send_queue_.empty()) {
    writing_.store(false, std::memory_order_release);
    return;
  }

  auto data_ptr = send_queue_.front();

  boost::asio::async_write(
      socket_, boost::asio::buffer(*data_ptr),
      boost::asio::bind_executor(
          strand_, [this, self = shared_from_this(), data_ptr](const boost::system::error_code &ec,
                                                               size_t) {
            if (!open_) {
              return;
            }

            if (ec) {
              LOG_NET_TRACE("write error to {}:{}: {}", remote_addr_, remote_port_,
                            ec.message());
              deliver_disconnect_once();
              close_impl();
              return;
            }

            send_queue_.pop();
            send_queue_bytes_ -= data_ptr->size();

            if (!send_queue_.empty()) {
              do_write_impl();
            } else {
              writing_.store(false, std::memory_order_release);
            }
          }));
}

void RealTransportConnection::deliver_disconnect_once() {
  if (disconnect_delivered_) {
    return;
  }
  disconnect_delivered_ = true;

  DisconnectCallback saved_disconnect_cb = std::move(disconnect_callback_);
  if (saved_disconnect_cb) {
    // Post to io_context (not strand) to avoid re-entering the strand
    boost::asio::post(io_context_, [cb = std::move(saved_disconnect_cb)]() {
      InvokeCallback("disconnect", cb);
    });
  }
}

void RealTransportConnection::close() {
  boost::asio::dispatch(strand_, [this, self = shared_from_this()]() {
    // A local close still tells the owner, so both close paths look the same
    deliver_disconnect_once();
    close_impl();
  });
}

void RealTransportConnection::close_impl() {
  if (!open_.exchange(false)) {
    return;
  }

  // Cancel outstanding I/O: pending handlers complete with operation_aborted
  // and release their shared_ptr
  {
    boost::asio::ip::tcp::socket socket_to_cancel(std::move(socket_));
    boost::system::error_code ec;
    socket_to_cancel.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_to_cancel.cancel(ec);
    socket_to_cancel.close(ec);
  }

  receive_callback_ = {};
  disconnect_callback_ = {};

  {
    auto timer_to_destroy = std::move(connect_timer_);
    if (timer_to_destroy) {
      (void)timer_to_destroy->cancel();
    }
  }
  resolver_.reset();

  std::queue<std::shared_ptr<std::vector<uint8_t>>> empty;
  std::swap(send_queue_, empty);
  send_queue_bytes_ = 0;
  writing_.store(false, std::memory_order_release);
}

void RealTransportConnection::set_receive_callback(ReceiveCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(),
                                  cb = std::move(callback)]() mutable {
    receive_callback_ = std::move(cb);
  });
}

void RealTransportConnection::set_disconnect_callback(DisconnectCallback callback) {
  boost::asio::dispatch(strand_, [this, self = shared_from_this(),
                                  cb = std::move(callback)]() mutable {
    disconnect_callback_ = std::move(cb);
  });
}

// ============================================================================
// RealTransport
// ============================================================================

RealTransport::RealTransport(TransportOptions options)
    : options_(options), io_context_(std::make_unique<boost::asio::io_context>()) {}

RealTransport::~RealTransport() { stop(); }

TransportConnectionPtr RealTransport::connect(const std::string &address, uint16_t port,
                                              ConnectCallback callback) {
  return RealTransportConnection::create_outbound(*io_context_, options_, address, port,
                                                  std::move(callback));
}

bool RealTransport::listen(const std::string &address, uint16_t port,
                           AcceptCallback accept_callback) {
  if (acceptor_) {
    LOG_NET_DEBUG("already listening on port {}", last_listen_port_.load());
    return false;
  }

  using tcp = boost::asio::ip::tcp;
  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address(address.empty() ? "::" : address, ec);
  if (ec) {
    LOG_NET_ERROR("invalid listen address '{}': {}", address, ec.message());
    return false;
  }

  accept_callback_ = std::move(accept_callback);

  try {
    acceptor_ = std::make_unique<tcp::acceptor>(*io_context_);
    tcp::endpoint endpoint(ip, port);

    // Unspecified v6: try dual-stack, fall back to IPv4-only
    if (ip.is_v6() && ip.is_unspecified()) {
      try {
        acceptor_->open(tcp::v6());
        acceptor_->set_option(boost::asio::ip::v6_only(false));
        acceptor_->set_option(tcp::acceptor::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen(boost::asio::socket_base::max_listen_connections);
      } catch (const boost::system::system_error &e) {
        LOG_NET_DEBUG("dual-stack listen failed ({}), falling back to IPv4", e.what());
        acceptor_->close(ec);
        acceptor_->open(tcp::v4());
        acceptor_->set_option(tcp::acceptor::reuse_address(true));
        acceptor_->bind(tcp::endpoint(tcp::v4(), port));
        acceptor_->listen(boost::asio::socket_base::max_listen_connections);
      }
    } else {
      acceptor_->open(endpoint.protocol());
      acceptor_->set_option(tcp::acceptor::reuse_address(true));
      acceptor_->bind(endpoint);
      acceptor_->listen(boost::asio::socket_base::max_listen_connections);
    }

    auto ep = acceptor_->local_endpoint(ec);
    last_listen_port_ = ec ? 0 : ep.port();

    LOG_NET_INFO("listening on {}:{}", address.empty() ? "::" : address,
                 last_listen_port_.load());
    start_accept();
    return true;
  } catch (const boost::system::system_error &e) {
    LOG_NET_ERROR("failed to listen on {}:{}: {}", address, port, e.what());
    if (acceptor_) {
      acceptor_->close(ec);
      acceptor_.reset();
    }
    accept_callback_ = {};
    return false;
  }
}

void RealTransport::start_accept() {
  if (!acceptor_)
    return;

  acceptor_->async_accept(
      [this](const boost::system::error_code &ec, boost::asio::ip::tcp::socket socket) {
        handle_accept(ec, std::move(socket));
      });
}

void RealTransport::handle_accept(const boost::system::error_code &ec,
                                  boost::asio::ip::tcp::socket socket) {
  if (ec) {
    if (ec != boost::asio::error::operation_aborted) {
      LOG_NET_TRACE("accept error: {}", ec.message());
      start_accept();
    }
    return;
  }

  auto conn = RealTransportConnection::create_inbound(*io_context_, options_, std::move(socket));
  LOG_NET_DEBUG("connection from {}:{} accepted", conn->remote_address(), conn->remote_port());

  InvokeCallback("accept", accept_callback_, conn);
  start_accept();
}

void RealTransport::stop_listening() {
  if (acceptor_) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    acceptor_.reset();
  }
  last_listen_port_ = 0;
  accept_callback_ = {};
}

void RealTransport::run() {
  if (running_.exchange(true)) {
    return;
  }
  io_context_->restart();
  work_guard_ = std::make_unique<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(*io_context_));
  for (size_t i = 0; i < std::max<size_t>(options_.io_threads, 1); i++) {
    io_threads_.emplace_back([this]() { io_context_->run(); });
  }
}

void RealTransport::stop() {
  running_.store(false);

  // Don't log here: called from the destructor, the logger may be gone

  stop_listening();

  work_guard_.reset();
  io_context_->stop();

  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
}

} // namespace network
} // namespace algoprobe
