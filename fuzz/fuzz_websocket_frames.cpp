// Fuzz target for WebSocket frame decoding
// Input is fed in two chunks to both roles; the decoder must never read past
// the buffer or loop without consuming

#include "network/protocol.hpp"
#include "network/websocket.hpp"
#include <cstdint>
#include <cstddef>
#include <vector>

namespace {

void FeedAll(algoprobe::network::Role role, const uint8_t *data, size_t size, size_t split) {
    using namespace algoprobe::network;

    WebSocketCodec codec(role);
    ReceiveBuffer buffer(algoprobe::protocol::DEFAULT_RECV_FLOOD_SIZE);
    std::vector<uint8_t> message;

    const size_t chunks[2][2] = {{0, split}, {split, size - split}};
    for (const auto &chunk : chunks) {
        if (!buffer.append(data + chunk[0], chunk[1])) {
            return;
        }
        while (true) {
            DecodeState state;
            const size_t before = buffer.size();
            const auto status = codec.try_decode(buffer, message, state);
            if (status == DecodeStatus::INVALID) {
                return;
            }
            if (status == DecodeStatus::INCOMPLETE) {
                break;
            }
            if (message.size() > algoprobe::protocol::MAX_WS_MESSAGE_SIZE ||
                buffer.size() >= before) {
                __builtin_trap();
            }
        }
    }
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 1) return 0;

    const size_t split = data[0] % size;  // at most size - 1
    FeedAll(algoprobe::network::Role::Initiator, data + 1, size - 1, split);
    FeedAll(algoprobe::network::Role::Responder, data + 1, size - 1, split);
    return 0;
}
