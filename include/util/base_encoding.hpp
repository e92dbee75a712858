#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace algoprobe {
namespace util {

// Standard (padded) base64 through OpenSSL EVP_EncodeBlock / EVP_DecodeBlock.
std::string EncodeBase64(const uint8_t* data, size_t size);
std::string EncodeBase64(const std::vector<uint8_t>& data);
std::optional<std::vector<uint8_t>> DecodeBase64(const std::string& str);

// RFC 4648 base32 alphabet, no padding (address text form)
std::string EncodeBase32NoPad(const uint8_t* data, size_t size);
std::optional<std::vector<uint8_t>> DecodeBase32NoPad(const std::string& str);

} // namespace util
} // namespace algoprobe
