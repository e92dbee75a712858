#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace algoprobe {
namespace util {

// Non-cryptographic random bytes (nonces, WebSocket keys, masking keys)
std::vector<uint8_t> GenerateRandomBytes(size_t len);

uint32_t GenerateRandomUInt32();

} // namespace util
} // namespace algoprobe
