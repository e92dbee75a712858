#include "util/string_parsing.hpp"
#include <cctype>
#include <stdexcept>

namespace algoprobe {
namespace util {

namespace {

bool StartsLikeNumber(const std::string& str) {
  return !str.empty() && !std::isspace(static_cast<unsigned char>(str[0]));
}

int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  if (!StartsLikeNumber(str)) {
    return std::nullopt;
  }
  try {
    size_t pos = 0;
    long value = std::stol(str, &pos);
    if (pos != str.size() || value < min || value > max) {
      return std::nullopt;
    }
    return static_cast<int>(value);
  } catch (const std::logic_error&) {
    // std::invalid_argument / std::out_of_range
    return std::nullopt;
  }
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = SafeParseInt(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<uint64_t> SafeParseUInt64(const std::string& str) {
  if (!StartsLikeNumber(str) || str[0] == '-' || str[0] == '+') {
    return std::nullopt;
  }
  try {
    size_t pos = 0;
    unsigned long long value = std::stoull(str, &pos);
    if (pos != str.size()) {
      return std::nullopt;
    }
    return static_cast<uint64_t>(value);
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

std::optional<std::pair<std::string, uint16_t>> SplitHostPort(const std::string& str) {
  std::string host;
  std::string port;
  if (!str.empty() && str[0] == '[') {
    auto close = str.find(']');
    if (close == std::string::npos || close + 1 >= str.size() || str[close + 1] != ':') {
      return std::nullopt;
    }
    host = str.substr(1, close - 1);
    port = str.substr(close + 2);
  } else {
    auto colon = str.rfind(':');
    if (colon == std::string::npos) {
      return std::nullopt;
    }
    host = str.substr(0, colon);
    port = str.substr(colon + 1);
  }
  auto parsed = SafeParsePort(port);
  if (host.empty() || !parsed) {
    return std::nullopt;
  }
  return std::make_pair(host, *parsed);
}

bool IsValidHex(const std::string& str) {
  if (str.empty()) {
    return false;
  }
  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

bool IsValidUtf8(const uint8_t* data, size_t size) {
  size_t i = 0;
  while (i < size) {
    uint8_t c = data[i];
    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t len = 0;
    uint32_t cp = 0;
    uint32_t min_cp = 0;
    if ((c & 0xe0) == 0xc0) {
      len = 2; cp = c & 0x1f; min_cp = 0x80;
    } else if ((c & 0xf0) == 0xe0) {
      len = 3; cp = c & 0x0f; min_cp = 0x800;
    } else if ((c & 0xf8) == 0xf0) {
      len = 4; cp = c & 0x07; min_cp = 0x10000;
    } else {
      return false;
    }
    if (size - i < len) {
      return false;
    }
    for (size_t k = 1; k < len; ++k) {
      uint8_t cc = data[i + k];
      if ((cc & 0xc0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (cc & 0x3f);
    }
    if (cp < min_cp || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) {
      return false;
    }
    i += len;
  }
  return true;
}

std::optional<std::vector<uint8_t>> ParseHex(const std::string& str) {
  if (str.size() % 2 != 0) {
    return std::nullopt;
  }
  std::vector<uint8_t> out;
  out.reserve(str.size() / 2);
  for (size_t i = 0; i < str.size(); i += 2) {
    int hi = HexDigit(str[i]);
    int lo = HexDigit(str[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::string HexStr(const uint8_t* data, size_t size) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (size_t i = 0; i < size; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0f]);
  }
  return out;
}

std::string HexStr(const std::vector<uint8_t>& data) {
  return HexStr(data.data(), data.size());
}

} // namespace util
} // namespace algoprobe
