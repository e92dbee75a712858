#pragma once

#include "version.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace algoprobe {
namespace protocol {

// Every application message starts with a 2-byte ASCII tag
constexpr size_t TAG_SIZE = 2;

// Topic keys carried by topic-encoded control messages
namespace topics {
constexpr const char *TAGS = "tags";
constexpr const char *ROUND_KEY = "roundKey";
constexpr const char *REQUEST_DATA_TYPE = "requestDataType";
constexpr const char *REQUEST_HASH = "RequestHash";
constexpr const char *ERROR = "Error";
constexpr const char *NONCE = "nonce";
constexpr const char *CERT_DATA = "certData";
constexpr const char *BLOCK_DATA = "blockData";
} // namespace topics

// Request data type selectors for UniEnsBlockReq / UniCatchupReq
namespace request_types {
constexpr const char *BLOCK = "blockData";
constexpr const char *CERT = "certData";
constexpr const char *BLOCK_AND_CERT = "blockAndCert";
} // namespace request_types

// ============================================================================
// WIRE LIMITS
// ============================================================================

// Topic container (go-algorand network/topics.go)
constexpr size_t MAX_TOPICS = 32;            // Not enforced by the unmarshaller
constexpr size_t MAX_TOPIC_KEY_LENGTH = 64;  // Not enforced by the unmarshaller
constexpr size_t MAX_SHORT_TOPIC_LENGTH = 0x7f;    // Single-byte length form
constexpr size_t MAX_TOPIC_VALUE_LENGTH = 0x3fff;  // Two 7-bit groups

// Fixed-size bodies
constexpr size_t MSG_DIGEST_SKIP_SIZE = 32;
constexpr size_t PING_NONCE_SIZE = 8;

// WebSocket framing
constexpr size_t MAX_WS_MESSAGE_SIZE = 16 * 1024 * 1024;  // 16 MiB reassembled message
constexpr size_t MAX_WS_HEADER_SIZE = 14;

// Per-connection buffers
constexpr size_t MAX_HANDSHAKE_SIZE = 64 * 1024;  // HTTP header block
constexpr size_t DEFAULT_RECV_FLOOD_SIZE = MAX_WS_MESSAGE_SIZE + 64 * 1024;
constexpr size_t DEFAULT_SEND_QUEUE_SIZE = 32 * 1024 * 1024;

// ============================================================================
// HANDSHAKE DEFAULTS
// ============================================================================

constexpr const char *SEC_WEBSOCKET_VERSION = "13";
constexpr const char *WEBSOCKET_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
constexpr const char *ALGORAND_ACCEPT_VERSION = "2.1";
constexpr const char *ALGORAND_VERSION = "2.1";
constexpr const char *DEFAULT_INSTANCE_NAME = "synth_node";
constexpr const char *DEFAULT_NODE_RANDOM = "cGVhMnBlYQ==";
constexpr const char *DEFAULT_GENESIS = "private-v1";
constexpr size_t SEC_WEBSOCKET_KEY_NONCE_SIZE = 16;

// Request target of the gossip upgrade: /v1/{genesis}/gossip
inline std::string GossipPath(const std::string &genesis) {
  return "/v1/" + genesis + "/gossip";
}

// Timeouts
constexpr std::chrono::seconds CONNECT_TIMEOUT{10};
constexpr std::chrono::seconds EXPECT_MESSAGE_TIMEOUT{10};
constexpr std::chrono::seconds HANDSHAKE_TIMEOUT{10};

constexpr size_t DEFAULT_INBOUND_QUEUE_CAPACITY = 100;

} // namespace protocol
} // namespace algoprobe
