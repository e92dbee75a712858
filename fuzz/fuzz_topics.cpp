// Fuzz target for topic decoding
// Decoded topics must re-encode and decode to the same list

#include "network/topic.hpp"
#include <cstdint>
#include <cstddef>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace algoprobe::message;

    std::vector<Topic> topics;
    DecodeState state;
    if (!UnmarshalTopics(data, size, topics, state)) {
        if (state.IsValid()) {
            // Failure without a reject reason
            __builtin_trap();
        }
        return 0;
    }

    auto encoded = MarshalTopics(topics);
    std::vector<Topic> again;
    DecodeState state2;
    if (!UnmarshalTopics(encoded.data(), encoded.size(), again, state2) || again != topics) {
        __builtin_trap();
    }

    // The length prefix alone
    TopicLength len;
    len.decode(data, size);

    return 0;
}
