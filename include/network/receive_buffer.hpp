#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace algoprobe {
namespace network {

/**
 * ReceiveBuffer - per-connection accumulation buffer
 *
 * Consumers read from data()/size() and call consume() for what they used.
 * A read offset avoids O(n^2) erase-from-front; the buffer is compacted once
 * the offset reaches half the stored size. Not thread-safe: owned by one
 * connection and driven from its strand.
 */
class ReceiveBuffer {
public:
  explicit ReceiveBuffer(size_t limit) : limit_(limit) {}

  // Append bytes; returns false (buffer unchanged) if the unread size would
  // exceed the limit
  bool append(const uint8_t *data, size_t len) {
    if (len > limit_ || size() + len > limit_) {
      return false;
    }
    if (offset_ > 0 && offset_ >= buffer_.size() / 2) {
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
      offset_ = 0;
      if (buffer_.size() < 1024) {
        buffer_.shrink_to_fit();
      }
    }
    buffer_.insert(buffer_.end(), data, data + len);
    return true;
  }

  bool append(const std::vector<uint8_t> &data) { return append(data.data(), data.size()); }

  const uint8_t *data() const { return buffer_.data() + offset_; }
  size_t size() const { return buffer_.size() - offset_; }
  bool empty() const { return size() == 0; }
  size_t limit() const { return limit_; }

  void consume(size_t n) {
    offset_ += (n < size() ? n : size());
    if (offset_ == buffer_.size()) {
      buffer_.clear();
      offset_ = 0;
    }
  }

  void clear() {
    buffer_.clear();
    buffer_.shrink_to_fit();
    offset_ = 0;
  }

private:
  std::vector<uint8_t> buffer_;
  size_t offset_ = 0;
  size_t limit_;
};

} // namespace network
} // namespace algoprobe
