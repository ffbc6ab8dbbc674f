#pragma once

#include "sgnet/net/SocketError.hpp"
#include "sgnet/net/Transmit.hpp"
#include "sgnet/send/SendDescriptor.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <optional>
#include <vector>

namespace sgnet::net {
class TCPSocket;
}

namespace sgnet::send {

using net::SendPacketsFlags;

struct SendOperationRequest {
    // std::nullopt is a null list and is rejected; an empty list is a no-op send.
    std::optional<std::vector<SendDescriptor>> descriptors = std::vector<SendDescriptor>{};
    SendPacketsFlags flags = SendPacketsFlags::None;
    // Upper bound on bytes per kernel call. 0 means unconstrained.
    size_t send_size = 0;
};

struct SendOperationResult {
    net::SocketError status = net::SocketError::Success;
    int native_error = 0;
    // Sum of the effective descriptor lengths on success, 0 on any failure.
    uint64_t bytes_transferred = 0;
};

// Validates a descriptor list, stages it and transmits it over one connected
// socket as a single logical send.
//
// Two error channels:
// - Caller misuse, bad paths and missing files/directories are thrown from
//   execute() before any byte reaches the socket (see sgnet/Errors.hpp).
// - Bounds violations on files and streams and every kernel error come back as
//   SendOperationResult::status with zero bytes transferred.
//
// Completion may be synchronous or deferred to the socket's event loop thread.
// Only one send may be in flight per socket. An exception thrown by the
// completion handler is logged and dropped on either path; it never leaves
// execute() or the event loop.
class ScatterGatherSendOperation {
public:
    using CompletionHandler = std::function<void(const SendOperationResult&)>;

    // Returns true when completion is pending and `on_complete` will run later
    // on the event loop thread; false when it already ran on this thread.
    bool execute(net::TCPSocket& socket,
                 const SendOperationRequest* request,
                 CompletionHandler on_complete) const;

    // Same operation with both completion paths folded into one future.
    // Do not wait on the future from the event loop thread.
    std::future<SendOperationResult> execute(net::TCPSocket& socket,
                                             const SendOperationRequest* request) const;
};

}  // namespace sgnet::send
