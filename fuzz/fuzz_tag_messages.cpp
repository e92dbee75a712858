// Fuzz target for application message decoding (tag + body)
// Tests all tags for crash-free parsing of untrusted gossip data

#include "network/codec.hpp"
#include <cstdint>
#include <cstddef>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace algoprobe::message;

    TagMsgCodec codec;
    DecodeState state;
    auto payload = codec.decode(data, size, state);
    if (!payload) {
        if (state.IsValid()) {
            __builtin_trap();
        }
        return 0;
    }

    // Inbound-only payloads have no encoding
    if (dynamic_cast<NotImplementedPayload *>(payload.get()) != nullptr) {
        return 0;
    }

    // Re-encoding a decoded payload must not crash, and its tag must survive
    auto encoded = codec.encode(*payload);
    DecodeState tag_state;
    auto tag = DecodeTag(encoded.data(), encoded.size(), tag_state);
    if (!tag || *tag != payload->tag()) {
        __builtin_trap();
    }

    auto copy = payload->clone();
    if (copy->tag() != payload->tag()) {
        __builtin_trap();
    }

    return 0;
}
