#pragma once

#include <string>

namespace algoprobe {
namespace message {

/**
 * Three-state result for layers that can suspend on a short buffer
 * (WebSocket framing, handshake parsing).
 *
 * INCOMPLETE is not an error: read more bytes and call again.
 */
enum class DecodeStatus {
  COMPLETE,
  INCOMPLETE,
  INVALID,
};

const char *DecodeStatusName(DecodeStatus status);

/**
 * Decode state - records why decoding of the current message failed
 *
 * Every failure is InvalidData: the message is dropped and the connection
 * owner closes the connection. Decoders report through
 *   return state.Invalid("bad-topic-len", "value length 12 exceeds 3 bytes");
 */
class DecodeState {
public:
  enum class Result {
    VALID,
    INVALID,
  };

  DecodeState() : result_(Result::VALID) {}

  bool IsValid() const { return result_ == Result::VALID; }
  bool IsInvalid() const { return result_ == Result::INVALID; }

  bool Invalid(const std::string &reject_reason,
               const std::string &debug_message = "") {
    result_ = Result::INVALID;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  void Reset() {
    result_ = Result::VALID;
    reject_reason_.clear();
    debug_message_.clear();
  }

  const std::string &GetRejectReason() const { return reject_reason_; }
  const std::string &GetDebugMessage() const { return debug_message_; }

  std::string ToString() const {
    if (IsValid()) {
      return "valid";
    }
    if (debug_message_.empty()) {
      return reject_reason_;
    }
    return reject_reason_ + " (" + debug_message_ + ")";
  }

private:
  Result result_;
  std::string reject_reason_;
  std::string debug_message_;
};

inline const char *DecodeStatusName(DecodeStatus status) {
  switch (status) {
  case DecodeStatus::COMPLETE:
    return "complete";
  case DecodeStatus::INCOMPLETE:
    return "incomplete";
  case DecodeStatus::INVALID:
    return "invalid";
  }
  return "unknown";
}

} // namespace message
} // namespace algoprobe
