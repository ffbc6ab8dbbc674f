#pragma once

#include <cstddef>
#include <cstdint>

namespace sgnet::net {

// Tuning applied to every descriptor a TCPSocket creates.
struct SocketOptions {
    size_t send_buffer_bytes = 512 * 1024;
    size_t receive_buffer_bytes = 512 * 1024;
    bool no_delay = true;
    // Best effort: failure to set IP_TOS is not an error.
    bool low_delay_tos = true;
    uint32_t connect_timeout_ms = 2'000;
};

}  // namespace sgnet::net
