#pragma once

#include "network/transport.hpp"
#include <mutex>
#include <vector>
#include <memory>
#include <string>

namespace algoprobe {
namespace network {

// In-memory transport connection for unit tests. Sent bytes are recorded;
// Deliver() moves them into another connection's receive callback.
class MockTransportConnection : public TransportConnection,
                                public std::enable_shared_from_this<MockTransportConnection> {
public:
    explicit MockTransportConnection(std::string address = "127.0.0.1", uint16_t port = 4160)
        : address_(std::move(address)), port_(port) {}

    void start() override { started_ = true; }

    bool send(const std::vector<uint8_t>& data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) return false;
        sent_messages_.push_back(data);
        return true;
    }

    void close() override {
        if (!open_) return;
        open_ = false;
        if (disconnect_callback_) {
            disconnect_callback_();
        }
    }

    bool is_open() const override { return open_; }
    std::string remote_address() const override { return address_; }
    uint16_t remote_port() const override { return port_; }
    bool is_inbound() const override { return is_inbound_; }
    uint64_t connection_id() const override { return 1; }

    void set_receive_callback(ReceiveCallback callback) override { receive_callback_ = callback; }
    void set_disconnect_callback(DisconnectCallback callback) override { disconnect_callback_ = callback; }

    void set_inbound(bool inbound) { is_inbound_ = inbound; }
    bool started() const { return started_; }

    void simulate_receive(const std::vector<uint8_t>& data) {
        if (receive_callback_) {
            receive_callback_(data);
        }
    }

    std::vector<std::vector<uint8_t>> take_sent_messages() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto out = std::move(sent_messages_);
        sent_messages_.clear();
        return out;
    }

    size_t sent_message_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_messages_.size();
    }

    // Move everything this connection sent into `to`; returns chunks moved
    size_t Deliver(MockTransportConnection& to) {
        auto chunks = take_sent_messages();
        for (const auto& chunk : chunks) {
            to.simulate_receive(chunk);
        }
        return chunks.size();
    }

private:
    std::string address_;
    uint16_t port_;
    bool open_ = true;
    bool started_ = false;
    bool is_inbound_ = false;
    ReceiveCallback receive_callback_;
    DisconnectCallback disconnect_callback_;
    std::mutex mutex_;
    std::vector<std::vector<uint8_t>> sent_messages_;
};

// Shuttle bytes both ways until neither side has anything queued
inline void PumpUntilIdle(MockTransportConnection& a, MockTransportConnection& b) {
    while (a.Deliver(b) + b.Deliver(a) > 0) {
    }
}

} // namespace network
} // namespace algoprobe
