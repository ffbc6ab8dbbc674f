#pragma once

#include "sgnet/eventloop/EventLoop.hpp"
#include "sgnet/eventloop/EventLoopHandler.hpp"
#include "sgnet/net/SocketOptions.hpp"
#include "sgnet/net/Transmit.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <sys/types.h>
#include <vector>

namespace sgnet::net {

struct Endpoint {
    sockaddr_storage address {};
    socklen_t address_length = 0;

    // Resolves a numeric or named host and a service/port with getaddrinfo.
    // Throws std::runtime_error when nothing resolves.
    static Endpoint resolve(std::string_view host, std::string_view port);
    static Endpoint loopbackV4(uint16_t port);
    static Endpoint loopbackV6(uint16_t port);

    int family() const noexcept;
    uint16_t port() const noexcept;
    std::string toString() const;
};

// Non-blocking TCP client socket with a scatter-gather transmit primitive.
//
// Responsibilities:
// - Own the socket descriptor; create it lazily on connect() for the
//   endpoint's family, so a socket reset by a reusing disconnect can connect
//   again.
// - Run transmitPackets() on the calling thread until the kernel send buffer
//   fills, then hand the rest to the event loop thread via EventLoop::post().
// - Apply post-send Disconnect / ReuseSocket.
//
// Thread model: connect/send/close and transmitPackets() are called from one
// owner thread. While a transmit is in flight the loop thread owns the
// in-flight state; close() from the owner thread aborts it.
class TCPSocket : public sgnet::EventLoopHandler {
public:
    enum class State : uint8_t {
        Idle,          // no descriptor; connect() allowed
        Connected,
        Disconnected,  // shut down after a transmit with Disconnect
        Closed,        // disposed
    };

    explicit TCPSocket(sgnet::EventLoop& loop, SocketOptions options = {});

    TCPSocket(const TCPSocket&) = delete;
    TCPSocket& operator=(const TCPSocket&) = delete;
    TCPSocket(TCPSocket&&) = delete;
    TCPSocket& operator=(TCPSocket&&) = delete;
    ~TCPSocket() override;

    // Blocking connect bounded by SocketOptions::connect_timeout_ms.
    // Throws ObjectDisposedError, InvalidOperationError (already connected or
    // disconnected without reuse), std::system_error / std::runtime_error on
    // connect failure.
    void connect(const Endpoint& endpoint);

    // True while a descriptor is owned.
    bool isOpen() const noexcept;
    bool isConnected() const noexcept;
    bool isDisposed() const noexcept;
    State state() const noexcept;
    bool transmitInFlight() const noexcept;

    Endpoint localEndpoint() const;
    Endpoint remoteEndpoint() const;

    // Synchronous send of one buffer; returns bytes accepted by the kernel.
    // Throws std::system_error with the kernel's errno (EPIPE once shut down).
    size_t send(std::span<const std::byte> data);

    // Scatter-gather primitive. `segments` must be non-empty, contain no
    // zero-length entry, and reference memory and descriptors that stay valid
    // until `on_complete` runs. A non-zero `send_size` caps each kernel call.
    // Returns true when completion was deferred to the event loop thread,
    // false when `on_complete` already ran on the calling thread.
    bool transmitPackets(std::vector<TransmitSegment> segments,
                         SendPacketsFlags flags,
                         size_t send_size,
                         TransmitHandler on_complete);

    // Shuts the connection down in both directions. With `reuse` the
    // descriptor is released and the socket returns to Idle.
    void disconnect(bool reuse);

    // Disposes the socket. Idempotent. A transmit in flight completes with
    // OperationAborted on the loop thread.
    //
    // Destroying the socket with a transmit in flight also completes it with
    // OperationAborted: on the calling thread when no loop thread is running
    // (or when called from it), otherwise on the loop thread while the
    // destructor waits.
    void close() noexcept;

    void onEvent(uint32_t event_mask) noexcept override;

protected:
    int socketFd() const noexcept;

    // Number of sendmsg/sendfile calls issued by transmitPackets().
    uint64_t debugTransmitSyscalls() const noexcept;

private:
    struct PendingTransmit {
        std::vector<TransmitSegment> segments;
        SendPacketsFlags flags = SendPacketsFlags::None;
        size_t send_size = 0;
        TransmitHandler on_complete;
        size_t index = 0;
        uint64_t segment_sent = 0;
        uint64_t total_sent = 0;
    };

    enum class PumpResult : uint8_t {
        Done,
        WouldBlock,
    };

    void ensureSocketForFamily(int family);
    void applySocketOptions();
    void throwIfDisposed() const;
    void waitWritable() const;

    // Both require lifecycle_mutex_ (or exclusive ownership on the owner thread).
    void releaseDescriptor() noexcept;
    void shutdownConnection(bool reuse) noexcept;

    PumpResult pumpTransmit() noexcept;
    ssize_t sendMemoryBatch(const PendingTransmit& pending) noexcept;
    ssize_t sendFileSegment(const PendingTransmit& pending) noexcept;
    void advance(PendingTransmit& pending, uint64_t sent) noexcept;
    void armWritable() noexcept;
    void finishTransmit(SocketError status, int native_error) noexcept;
    void abortOnLoopThread() noexcept;

    static constexpr size_t kMaxIovecBatch = 64;
    // Linux sendfile moves at most this many bytes per call.
    static constexpr uint64_t kMaxSendfileChunk = 0x7ffff000;

    sgnet::EventLoop& loop_;
    SocketOptions options_;
    int fd_ = -1;
    int family_ = 0;
    Endpoint remote_;
    // Serializes descriptor release between close() and transmit completion.
    mutable std::mutex lifecycle_mutex_;
    std::atomic<State> state_{State::Idle};
    std::atomic<bool> transmit_in_flight_{false};
    std::atomic<uint64_t> transmit_syscalls_{0};
    std::shared_ptr<PendingTransmit> pending_;
    // Owner-thread handle on pending_. Tasks posted to the loop hold a copy
    // and do nothing once the transmit it names has finished.
    std::weak_ptr<PendingTransmit> pending_guard_;
    sgnet::EventLoop::Registration registration_;
};

const char* toString(TCPSocket::State state) noexcept;

}  // namespace sgnet::net
