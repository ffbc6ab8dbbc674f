#include "sgnet/send/SendOperation.hpp"
#include "sgnet/Errors.hpp"
#include "sgnet/log/Logger.hpp"
#include "sgnet/net/TCPSocket.hpp"
#include "sgnet/send/TransmitPlan.hpp"

#include <exception>
#include <memory>
#include <system_error>
#include <utility>

namespace sgnet::send {

namespace {

void checkPreconditions(const net::TCPSocket& socket, const SendOperationRequest* request) {
    if (socket.isDisposed()) {
        throw ObjectDisposedError("TCPSocket");
    }
    if (request == nullptr) {
        throw ArgumentNullError("request");
    }
    if (!socket.isConnected()) {
        throw InvalidOperationError("operation requires a connected socket");
    }
    if (!request->descriptors.has_value()) {
        throw ArgumentNullError("request.descriptors");
    }
    if (socket.transmitInFlight()) {
        throw InvalidOperationError("a send is already in flight on this socket");
    }
}

void complete(const ScatterGatherSendOperation::CompletionHandler& on_complete,
              const SendOperationResult& result) noexcept {
    try {
        on_complete(result);
    } catch (const std::exception& ex) {
        SGNET_LOG_ERROR("send completion handler threw: ", ex.what());
    }
}

}  // namespace

bool ScatterGatherSendOperation::execute(net::TCPSocket& socket,
                                         const SendOperationRequest* request,
                                         CompletionHandler on_complete) const {
    checkPreconditions(socket, request);
    if (!on_complete) {
        throw ArgumentNullError("on_complete");
    }

    const bool disconnect = hasFlag(request->flags, SendPacketsFlags::Disconnect);
    if (hasFlag(request->flags, SendPacketsFlags::ReuseSocket) && !disconnect) {
        SGNET_LOG_WARN("ReuseSocket without Disconnect has no effect");
    }

    // Shared with the completion, which may run after this frame is gone.
    auto plan = std::make_shared<TransmitPlan>(TransmitPlan::build(*request->descriptors));

    if (plan->status() != net::SocketError::Success) {
        complete(on_complete, SendOperationResult{plan->status(), 0, 0});
        return false;
    }
    if (plan->empty()) {
        SGNET_LOG_DEBUG("nothing to send after elision");
        complete(on_complete, SendOperationResult{net::SocketError::Success, 0, 0});
        return false;
    }

    SGNET_LOG_DEBUG("sending ", plan->segments().size(), " segments, ", plan->totalBytes(), " bytes");

    auto completion = [plan, handler = std::move(on_complete)](const net::TransmitResult& transmitted) {
        SendOperationResult result{transmitted.status, transmitted.native_error, 0};
        if (transmitted.status == net::SocketError::Success) {
            result.bytes_transferred = transmitted.bytes_transferred;
            try {
                plan->commitStreamPositions();
            } catch (const std::system_error& ex) {
                SGNET_LOG_WARN("could not advance stream position: ", ex.what());
            }
        }
        complete(handler, result);
    };

    return socket.transmitPackets(plan->segments(), request->flags, request->send_size, std::move(completion));
}

std::future<SendOperationResult> ScatterGatherSendOperation::execute(net::TCPSocket& socket,
                                                                     const SendOperationRequest* request) const {
    auto promise = std::make_shared<std::promise<SendOperationResult>>();
    std::future<SendOperationResult> future = promise->get_future();

    execute(socket, request, [promise](const SendOperationResult& result) {
        promise->set_value(result);
    });
    return future;
}

}  // namespace sgnet::send
