// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "harness/config.hpp"
#include "util/logging.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace algoprobe {
namespace harness {

using json = nlohmann::json;

namespace {

bool ReadString(const json &root, const char *key, std::string &out, std::string &error) {
  auto it = root.find(key);
  if (it == root.end()) {
    return true;
  }
  if (!it->is_string()) {
    error = std::string("\"") + key + "\" must be a string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool ReadOptionalString(const json &root, const char *key, std::optional<std::string> &out,
                        std::string &error) {
  auto it = root.find(key);
  if (it == root.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    error = std::string("\"") + key + "\" must be a string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

} // namespace

std::optional<network::HandshakeConfig> ParseHandshakeConfig(const std::string &json_text,
                                                             std::string &error) {
  json root;
  try {
    root = json::parse(json_text);
  } catch (const json::exception &e) {
    error = e.what();
    return std::nullopt;
  }
  if (!root.is_object()) {
    error = "handshake config must be a JSON object";
    return std::nullopt;
  }

  network::HandshakeConfig config;
  if (!ReadString(root, "genesis", config.genesis, error) ||
      !ReadString(root, "request_target", config.request_target, error) ||
      !ReadString(root, "host", config.host, error) ||
      !ReadString(root, "user_agent", config.user_agent, error) ||
      !ReadString(root, "ws_version", config.ws_version, error) ||
      !ReadString(root, "accept_version", config.accept_version, error) ||
      !ReadString(root, "instance_name", config.instance_name, error) ||
      !ReadString(root, "location", config.location, error) ||
      !ReadString(root, "node_random", config.node_random, error) ||
      !ReadString(root, "version", config.version, error) ||
      !ReadOptionalString(root, "telemetry_id", config.telemetry_id, error) ||
      !ReadOptionalString(root, "accept_key_override", config.accept_key_override, error) ||
      !ReadOptionalString(root, "challenge", config.challenge, error)) {
    return std::nullopt;
  }
  return config;
}

std::optional<network::HandshakeConfig> LoadHandshakeConfig(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_WARN("Cannot open handshake config {}", path);
    return std::nullopt;
  }
  std::stringstream contents;
  contents << file.rdbuf();

  std::string error;
  auto config = ParseHandshakeConfig(contents.str(), error);
  if (!config) {
    LOG_WARN("Invalid handshake config {}: {}", path, error);
    return std::nullopt;
  }
  LOG_DEBUG("Loaded handshake config from {}", path);
  return config;
}

} // namespace harness
} // namespace algoprobe
