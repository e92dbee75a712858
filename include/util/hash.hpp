// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace algoprobe {
namespace util {

using Sha1Digest = std::array<uint8_t, 20>;
using Sha512_256Digest = std::array<uint8_t, 32>;

// OpenSSL EVP digests. Throw std::runtime_error if the provider fails.
Sha1Digest Sha1(const uint8_t* data, size_t size);
Sha1Digest Sha1(const std::string& data);

// SHA-512/256 as used for Algorand address checksums
Sha512_256Digest Sha512_256(const uint8_t* data, size_t size);

} // namespace util
} // namespace algoprobe
