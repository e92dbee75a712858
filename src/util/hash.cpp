// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/hash.hpp"
#include <memory>
#include <openssl/evp.h>
#include <stdexcept>

namespace algoprobe {
namespace util {

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

template <size_t N>
std::array<uint8_t, N> Digest(const EVP_MD* md, const uint8_t* data, size_t size) {
  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx || md == nullptr) {
    throw std::runtime_error("EVP digest context unavailable");
  }

  std::array<uint8_t, EVP_MAX_MD_SIZE> out{};
  unsigned int out_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1) {
    throw std::runtime_error("EVP digest failed");
  }
  if (out_len != N) {
    throw std::runtime_error("unexpected digest length");
  }

  std::array<uint8_t, N> digest{};
  std::copy(out.begin(), out.begin() + N, digest.begin());
  return digest;
}

} // namespace

Sha1Digest Sha1(const uint8_t* data, size_t size) {
  return Digest<20>(EVP_sha1(), data, size);
}

Sha1Digest Sha1(const std::string& data) {
  return Sha1(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Sha512_256Digest Sha512_256(const uint8_t* data, size_t size) {
  return Digest<32>(EVP_sha512_256(), data, size);
}

} // namespace util
} // namespace algoprobe
