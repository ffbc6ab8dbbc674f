#pragma once

#include <cstdint>

namespace sgnet::net {

// Transport status reported by the send primitive. Never thrown; carried in
// results so callers branch on it instead of catching.
enum class SocketError : uint8_t {
    Success,
    InvalidArgument,
    Shutdown,
    NotConnected,
    ConnectionReset,
    ConnectionAborted,
    TimedOut,
    NoBufferSpaceAvailable,
    OperationAborted,
    HostUnreachable,
    NetworkDown,
    AccessDenied,
    IOError,
    OtherError,  // errno with no dedicated mapping
};

// Translates an errno value from a socket or sendfile call. 0 maps to Success.
SocketError socketErrorFromErrno(int error_code) noexcept;

const char* toString(SocketError error) noexcept;

}  // namespace sgnet::net
