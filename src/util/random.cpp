#include "util/random.hpp"
#include <random>

namespace algoprobe {
namespace util {

namespace {

std::mt19937_64& Rng() {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  return gen;
}

} // namespace

std::vector<uint8_t> GenerateRandomBytes(size_t len) {
  std::vector<uint8_t> out(len);
  auto& gen = Rng();
  size_t i = 0;
  while (i < len) {
    uint64_t word = gen();
    for (int b = 0; b < 8 && i < len; ++b, ++i) {
      out[i] = static_cast<uint8_t>(word >> (8 * b));
    }
  }
  return out;
}

uint32_t GenerateRandomUInt32() {
  return static_cast<uint32_t>(Rng()());
}

} // namespace util
} // namespace algoprobe
