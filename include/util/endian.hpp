// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
#pragma once

#include <cstddef>
#include <cstdint>

// Byte-order helpers for the wire codecs. Topic integers (round, nonce) are
// little-endian; WebSocket extended payload lengths and MessagePack headers
// are big-endian.
namespace algoprobe {
namespace endian {

template <typename T>
inline T ReadLE(const uint8_t *ptr) {
  T result = 0;
  for (size_t i = 0; i < sizeof(T); ++i) {
    result |= static_cast<T>(ptr[i]) << (8 * i);
  }
  return result;
}

template <typename T>
inline void WriteLE(uint8_t *ptr, T value) {
  for (size_t i = 0; i < sizeof(T); ++i) {
    ptr[i] = static_cast<uint8_t>(value >> (8 * i));
  }
}

template <typename T>
inline T ReadBE(const uint8_t *ptr) {
  T result = 0;
  for (size_t i = 0; i < sizeof(T); ++i) {
    result = static_cast<T>((result << 8) | ptr[i]);
  }
  return result;
}

template <typename T>
inline void WriteBE(uint8_t *ptr, T value) {
  for (size_t i = 0; i < sizeof(T); ++i) {
    ptr[sizeof(T) - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
  }
}

inline uint64_t ReadLE64(const uint8_t *ptr) { return ReadLE<uint64_t>(ptr); }
inline void WriteLE32(uint8_t *ptr, uint32_t value) { WriteLE(ptr, value); }
inline void WriteLE64(uint8_t *ptr, uint64_t value) { WriteLE(ptr, value); }

inline uint16_t ReadBE16(const uint8_t *ptr) { return ReadBE<uint16_t>(ptr); }
inline uint32_t ReadBE32(const uint8_t *ptr) { return ReadBE<uint32_t>(ptr); }
inline uint64_t ReadBE64(const uint8_t *ptr) { return ReadBE<uint64_t>(ptr); }
inline void WriteBE16(uint8_t *ptr, uint16_t value) { WriteBE(ptr, value); }
inline void WriteBE32(uint8_t *ptr, uint32_t value) { WriteBE(ptr, value); }
inline void WriteBE64(uint8_t *ptr, uint64_t value) { WriteBE(ptr, value); }

} // namespace endian
} // namespace algoprobe
