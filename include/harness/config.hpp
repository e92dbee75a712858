#pragma once

#include "network/handshake.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace algoprobe {
namespace harness {

struct SyntheticNodeConfig {
  // Responder side (start_listening)
  std::string listen_address = "127.0.0.1";
  uint16_t listen_port = 0;  // 0: ephemeral

  size_t inbound_queue_capacity = protocol::DEFAULT_INBOUND_QUEUE_CAPACITY;

  // false: frames flow as soon as TCP connects
  bool handshake = true;
  network::HandshakeConfig handshake_config;

  // connect() waits this long for TCP connect plus the upgrade exchange
  std::chrono::milliseconds handshake_timeout{protocol::HANDSHAKE_TIMEOUT};

  network::TransportOptions transport;
};

/**
 * Handshake overrides from JSON
 *
 * Keys (all optional, all strings): genesis, request_target, host,
 * user_agent, ws_version, accept_version, instance_name, location,
 * node_random, version, telemetry_id, accept_key_override, challenge.
 * Missing keys keep their defaults; unknown keys are ignored.
 *
 * Returns std::nullopt and fills error on malformed input.
 */
std::optional<network::HandshakeConfig> ParseHandshakeConfig(const std::string &json_text,
                                                             std::string &error);

// Read and parse a JSON file; failures are logged
std::optional<network::HandshakeConfig> LoadHandshakeConfig(const std::string &path);

} // namespace harness
} // namespace algoprobe
