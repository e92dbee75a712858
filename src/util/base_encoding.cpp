// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/base_encoding.hpp"
#include <openssl/evp.h>

namespace algoprobe {
namespace util {

namespace {

constexpr char kBase32Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

int Base32Value(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= '2' && c <= '7') return c - '2' + 26;
  return -1;
}

} // namespace

std::string EncodeBase64(const uint8_t* data, size_t size) {
  if (size == 0) {
    return {};
  }
  std::string out(4 * ((size + 2) / 3), '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data,
                                static_cast<int>(size));
  out.resize(static_cast<size_t>(written));
  return out;
}

std::string EncodeBase64(const std::vector<uint8_t>& data) {
  return EncodeBase64(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> DecodeBase64(const std::string& str) {
  if (str.empty()) {
    return std::vector<uint8_t>{};
  }
  if (str.size() % 4 != 0) {
    return std::nullopt;
  }

  std::vector<uint8_t> out(3 * (str.size() / 4));
  int len = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(str.data()),
                            static_cast<int>(str.size()));
  if (len < 0) {
    return std::nullopt;
  }

  // EVP_DecodeBlock counts padding as zero bytes
  size_t padding = 0;
  if (str[str.size() - 1] == '=') ++padding;
  if (str[str.size() - 2] == '=') ++padding;
  out.resize(static_cast<size_t>(len) - padding);
  return out;
}

std::string EncodeBase32NoPad(const uint8_t* data, size_t size) {
  std::string out;
  out.reserve((size * 8 + 4) / 5);
  uint32_t buffer = 0;
  int bits = 0;
  for (size_t i = 0; i < size; ++i) {
    buffer = (buffer << 8) | data[i];
    bits += 8;
    while (bits >= 5) {
      out.push_back(kBase32Alphabet[(buffer >> (bits - 5)) & 0x1f]);
      bits -= 5;
    }
  }
  if (bits > 0) {
    out.push_back(kBase32Alphabet[(buffer << (5 - bits)) & 0x1f]);
  }
  return out;
}

std::optional<std::vector<uint8_t>> DecodeBase32NoPad(const std::string& str) {
  std::vector<uint8_t> out;
  out.reserve(str.size() * 5 / 8);
  uint32_t buffer = 0;
  int bits = 0;
  for (char c : str) {
    int v = Base32Value(c);
    if (v < 0) {
      return std::nullopt;
    }
    buffer = (buffer << 5) | static_cast<uint32_t>(v);
    bits += 5;
    if (bits >= 8) {
      out.push_back(static_cast<uint8_t>((buffer >> (bits - 8)) & 0xff));
      bits -= 8;
    }
  }
  // Leftover bits must be zero padding, and never a whole symbol's worth
  if (bits >= 5 || (buffer & ((1u << bits) - 1)) != 0) {
    return std::nullopt;
  }
  return out;
}

} // namespace util
} // namespace algoprobe
