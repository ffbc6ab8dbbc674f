#pragma once

#include "sgnet/net/SocketError.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>

namespace sgnet::net {

// Flags accepted by TCPSocket::transmitPackets. ReuseSocket only has an effect
// together with Disconnect.
enum class SendPacketsFlags : uint8_t {
    None = 0,
    Disconnect = 1 << 0,
    ReuseSocket = 1 << 1,
};

constexpr SendPacketsFlags operator|(SendPacketsFlags lhs, SendPacketsFlags rhs) noexcept {
    return static_cast<SendPacketsFlags>(static_cast<uint8_t>(lhs) | static_cast<uint8_t>(rhs));
}

constexpr SendPacketsFlags operator&(SendPacketsFlags lhs, SendPacketsFlags rhs) noexcept {
    return static_cast<SendPacketsFlags>(static_cast<uint8_t>(lhs) & static_cast<uint8_t>(rhs));
}

constexpr bool hasFlag(SendPacketsFlags flags, SendPacketsFlags flag) noexcept {
    return (flags & flag) == flag && flag != SendPacketsFlags::None;
}

// One kernel-ready piece of a scatter-gather send. Memory segments point at
// caller-owned bytes; file segments name an open descriptor and an absolute
// offset, and are sent with sendfile without moving the file position.
struct TransmitSegment {
    const std::byte* data = nullptr;
    int file_fd = -1;
    uint64_t offset = 0;
    uint64_t length = 0;
    // Ends the current kernel batch; the batch is sent without MSG_MORE.
    bool end_of_packet = false;

    bool isMemory() const noexcept {
        return file_fd < 0;
    }
};

struct TransmitResult {
    SocketError status = SocketError::Success;
    // errno behind a failed status, 0 otherwise.
    int native_error = 0;
    uint64_t bytes_transferred = 0;
};

using TransmitHandler = std::function<void(const TransmitResult&)>;

}  // namespace sgnet::net
