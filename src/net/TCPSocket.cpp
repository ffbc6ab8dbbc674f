#include "sgnet/net/TCPSocket.hpp"
#include "sgnet/Errors.hpp"
#include "sgnet/log/Logger.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <future>
#include <memory>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <sys/epoll.h>
#include <sys/sendfile.h>
#include <sys/uio.h>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace sgnet::net {

namespace {

using AddrInfoPtr = std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)>;

int createNonBlockingSocket(int domain, int type, int protocol) {
    const int fd = ::socket(domain, type | SOCK_NONBLOCK | SOCK_CLOEXEC, protocol);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "socket");
    }
    return fd;
}

void setSocketOptionInt(int fd,
                        int level,
                        int option_name,
                        int value,
                        const char* option_label,
                        bool required) {
    if (::setsockopt(fd, level, option_name, &value, sizeof(value)) == 0) {
        return;
    }

    if (required) {
        throw std::system_error(errno, std::generic_category(), option_label);
    }
    SGNET_LOG_DEBUG(option_label, " failed: ", std::strerror(errno));
}

void waitForConnectCompletion(int fd, uint32_t timeout_ms) {
    struct pollfd pfd {};
    pfd.fd = fd;
    pfd.events = POLLOUT;

    int poll_result = 0;
    do {
        poll_result = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
    } while (poll_result < 0 && errno == EINTR);

    if (poll_result == 0) {
        throw std::system_error(ETIMEDOUT, std::generic_category(), "connect timeout");
    }
    if (poll_result < 0) {
        throw std::system_error(errno, std::generic_category(), "poll");
    }

    int socket_error = 0;
    socklen_t option_len = sizeof(socket_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &socket_error, &option_len) != 0) {
        throw std::system_error(errno, std::generic_category(), "getsockopt");
    }
    if (socket_error != 0) {
        throw std::system_error(socket_error, std::generic_category(), "connect");
    }
}

constexpr auto kAbortPollInterval = std::chrono::milliseconds(10);

uint64_t clampChunk(uint64_t remaining, size_t send_size) noexcept {
    if (send_size != 0 && remaining > send_size) {
        return send_size;
    }
    return remaining;
}

}  // namespace

// -----------------------------------------------------------------------------
// Endpoint
// -----------------------------------------------------------------------------

Endpoint Endpoint::resolve(std::string_view host, std::string_view port) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    const std::string host_str(host);
    const std::string port_str(port);

    struct addrinfo* result_raw = nullptr;
    const int gai_result = ::getaddrinfo(host_str.c_str(), port_str.c_str(), &hints, &result_raw);
    if (gai_result != 0) {
        throw std::runtime_error(std::string("getaddrinfo failed: ") + ::gai_strerror(gai_result));
    }
    AddrInfoPtr result(result_raw, ::freeaddrinfo);

    for (addrinfo* current = result.get(); current != nullptr; current = current->ai_next) {
        if (current->ai_addrlen > sizeof(sockaddr_storage)) {
            continue;
        }
        Endpoint endpoint;
        std::memcpy(&endpoint.address, current->ai_addr, current->ai_addrlen);
        endpoint.address_length = current->ai_addrlen;
        return endpoint;
    }
    throw std::runtime_error("no usable address for " + host_str + ":" + port_str);
}

Endpoint Endpoint::loopbackV4(uint16_t port) {
    Endpoint endpoint;
    auto* addr = reinterpret_cast<sockaddr_in*>(&endpoint.address);
    addr->sin_family = AF_INET;
    addr->sin_port = htons(port);
    addr->sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    endpoint.address_length = sizeof(sockaddr_in);
    return endpoint;
}

Endpoint Endpoint::loopbackV6(uint16_t port) {
    Endpoint endpoint;
    auto* addr = reinterpret_cast<sockaddr_in6*>(&endpoint.address);
    addr->sin6_family = AF_INET6;
    addr->sin6_port = htons(port);
    addr->sin6_addr = in6addr_loopback;
    endpoint.address_length = sizeof(sockaddr_in6);
    return endpoint;
}

int Endpoint::family() const noexcept {
    return address.ss_family;
}

uint16_t Endpoint::port() const noexcept {
    if (address.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<const sockaddr_in*>(&address)->sin_port);
    }
    if (address.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&address)->sin6_port);
    }
    return 0;
}

std::string Endpoint::toString() const {
    char text[INET6_ADDRSTRLEN] = {};
    if (address.ss_family == AF_INET) {
        const auto* addr = reinterpret_cast<const sockaddr_in*>(&address);
        ::inet_ntop(AF_INET, &addr->sin_addr, text, sizeof(text));
        return std::string(text) + ":" + std::to_string(port());
    }
    if (address.ss_family == AF_INET6) {
        const auto* addr = reinterpret_cast<const sockaddr_in6*>(&address);
        ::inet_ntop(AF_INET6, &addr->sin6_addr, text, sizeof(text));
        return "[" + std::string(text) + "]:" + std::to_string(port());
    }
    return "<unspecified>";
}

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------

TCPSocket::TCPSocket(sgnet::EventLoop& loop, SocketOptions options)
    : loop_(loop), options_(options) {}

TCPSocket::~TCPSocket() {
    close();
    if (!transmit_in_flight_.load(std::memory_order_acquire)) {
        return;
    }
    if (loop_.isInLoopThread() || !loop_.hasLoopThread()) {
        // Tasks still queued for this transmit find their guard expired.
        finishTransmit(SocketError::OperationAborted, ECANCELED);
        return;
    }
    abortOnLoopThread();
}

void TCPSocket::connect(const Endpoint& endpoint) {
    throwIfDisposed();

    const State current = state_.load(std::memory_order_acquire);
    if (current == State::Connected) {
        throw InvalidOperationError("socket is already connected");
    }
    if (current == State::Disconnected) {
        throw InvalidOperationError("socket was disconnected without reuse");
    }
    if (endpoint.family() != AF_INET && endpoint.family() != AF_INET6) {
        throw std::invalid_argument("endpoint must be an IPv4 or IPv6 address");
    }

    ensureSocketForFamily(endpoint.family());

    try {
        if (::connect(fd_, reinterpret_cast<const sockaddr*>(&endpoint.address), endpoint.address_length) != 0) {
            if (errno != EINPROGRESS) {
                throw std::system_error(errno, std::generic_category(), "connect");
            }
            waitForConnectCompletion(fd_, options_.connect_timeout_ms);
        }
    } catch (...) {
        releaseDescriptor();
        throw;
    }

    remote_ = endpoint;
    state_.store(State::Connected, std::memory_order_release);
    SGNET_LOG_DEBUG("connected fd ", fd_, " to ", endpoint.toString());
}

bool TCPSocket::isOpen() const noexcept {
    const std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return fd_ >= 0;
}

bool TCPSocket::isConnected() const noexcept {
    return state_.load(std::memory_order_acquire) == State::Connected;
}

bool TCPSocket::isDisposed() const noexcept {
    return state_.load(std::memory_order_acquire) == State::Closed;
}

TCPSocket::State TCPSocket::state() const noexcept {
    return state_.load(std::memory_order_acquire);
}

bool TCPSocket::transmitInFlight() const noexcept {
    return transmit_in_flight_.load(std::memory_order_acquire);
}

Endpoint TCPSocket::localEndpoint() const {
    throwIfDisposed();
    if (fd_ < 0) {
        throw InvalidOperationError("socket has no descriptor");
    }

    Endpoint endpoint;
    endpoint.address_length = sizeof(endpoint.address);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&endpoint.address), &endpoint.address_length) != 0) {
        throw std::system_error(errno, std::generic_category(), "getsockname");
    }
    return endpoint;
}

Endpoint TCPSocket::remoteEndpoint() const {
    throwIfDisposed();
    if (state_.load(std::memory_order_acquire) == State::Idle) {
        throw InvalidOperationError("operation requires a connected socket");
    }
    return remote_;
}

size_t TCPSocket::send(std::span<const std::byte> data) {
    throwIfDisposed();
    if (state_.load(std::memory_order_acquire) == State::Idle) {
        throw InvalidOperationError("operation requires a connected socket");
    }
    if (transmit_in_flight_.load(std::memory_order_acquire)) {
        throw InvalidOperationError("a send is already in flight on this socket");
    }
    if (data.empty()) {
        return 0;
    }

    for (;;) {
        const ssize_t sent = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
        if (sent >= 0) {
            return static_cast<size_t>(sent);
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            waitWritable();
            continue;
        }
        throw std::system_error(errno, std::generic_category(), "send");
    }
}

void TCPSocket::disconnect(bool reuse) {
    throwIfDisposed();
    if (transmit_in_flight_.load(std::memory_order_acquire)) {
        throw InvalidOperationError("a send is already in flight on this socket");
    }
    if (state_.load(std::memory_order_acquire) != State::Connected) {
        throw InvalidOperationError("operation requires a connected socket");
    }

    const std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    shutdownConnection(reuse);
}

void TCPSocket::close() noexcept {
    const std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (state_.exchange(State::Closed, std::memory_order_acq_rel) == State::Closed) {
        return;
    }
    if (fd_ < 0) {
        return;
    }

    if (transmit_in_flight_.load(std::memory_order_acquire)) {
        // The loop thread still owns the in-flight state; wake it with a
        // hangup and let the completion release the descriptor.
        ::shutdown(fd_, SHUT_RDWR);
        return;
    }
    releaseDescriptor();
}

int TCPSocket::socketFd() const noexcept {
    return fd_;
}

uint64_t TCPSocket::debugTransmitSyscalls() const noexcept {
    return transmit_syscalls_.load(std::memory_order_relaxed);
}

void TCPSocket::ensureSocketForFamily(int family) {
    if (fd_ >= 0 && family_ == family) {
        return;
    }
    if (fd_ >= 0) {
        releaseDescriptor();
    }

    const int fd = createNonBlockingSocket(family, SOCK_STREAM, IPPROTO_TCP);
    {
        const std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        fd_ = fd;
        family_ = family;
    }

    try {
        applySocketOptions();
    } catch (...) {
        releaseDescriptor();
        throw;
    }
}

void TCPSocket::applySocketOptions() {
    setSocketOptionInt(fd_,
                       SOL_SOCKET,
                       SO_SNDBUF,
                       static_cast<int>(options_.send_buffer_bytes),
                       "setsockopt(SO_SNDBUF)",
                       true);
    setSocketOptionInt(fd_,
                       SOL_SOCKET,
                       SO_RCVBUF,
                       static_cast<int>(options_.receive_buffer_bytes),
                       "setsockopt(SO_RCVBUF)",
                       true);

    if (options_.no_delay) {
        setSocketOptionInt(fd_, IPPROTO_TCP, TCP_NODELAY, 1, "setsockopt(TCP_NODELAY)", true);
    }

    if (options_.low_delay_tos) {
        if (family_ == AF_INET6) {
            setSocketOptionInt(fd_, IPPROTO_IPV6, IPV6_TCLASS, IPTOS_LOWDELAY, "setsockopt(IPV6_TCLASS)", false);
        } else {
            setSocketOptionInt(fd_, IPPROTO_IP, IP_TOS, IPTOS_LOWDELAY, "setsockopt(IP_TOS)", false);
        }
    }
}

void TCPSocket::throwIfDisposed() const {
    if (state_.load(std::memory_order_acquire) == State::Closed) {
        throw ObjectDisposedError("TCPSocket");
    }
}

void TCPSocket::waitWritable() const {
    struct pollfd pfd {};
    pfd.fd = fd_;
    pfd.events = POLLOUT;

    const int poll_result = ::poll(&pfd, 1, static_cast<int>(options_.connect_timeout_ms));
    if (poll_result == 0) {
        throw std::system_error(ETIMEDOUT, std::generic_category(), "send");
    }
    if (poll_result < 0 && errno != EINTR) {
        throw std::system_error(errno, std::generic_category(), "poll");
    }
}

void TCPSocket::releaseDescriptor() noexcept {
    if (fd_ < 0) {
        return;
    }
    SGNET_LOG_DEBUG("releasing fd ", fd_);
    ::close(fd_);
    fd_ = -1;
    family_ = 0;
}

void TCPSocket::shutdownConnection(bool reuse) noexcept {
    if (::shutdown(fd_, SHUT_RDWR) != 0) {
        SGNET_LOG_DEBUG("shutdown of fd ", fd_, " failed: ", std::strerror(errno));
    }

    if (reuse) {
        releaseDescriptor();
        remote_ = Endpoint{};
        state_.store(State::Idle, std::memory_order_release);
        return;
    }
    state_.store(State::Disconnected, std::memory_order_release);
}

// -----------------------------------------------------------------------------
// Scatter-gather transmit
// -----------------------------------------------------------------------------

bool TCPSocket::transmitPackets(std::vector<TransmitSegment> segments,
                                SendPacketsFlags flags,
                                size_t send_size,
                                TransmitHandler on_complete) {
    throwIfDisposed();
    if (state_.load(std::memory_order_acquire) != State::Connected) {
        throw InvalidOperationError("operation requires a connected socket");
    }
    if (segments.empty()) {
        throw std::invalid_argument("transmit requires at least one segment");
    }
    if (!on_complete) {
        throw ArgumentNullError("on_complete");
    }
    for (const TransmitSegment& segment : segments) {
        if (segment.length == 0) {
            throw std::invalid_argument("transmit segments must not be empty");
        }
    }

    bool expected = false;
    if (!transmit_in_flight_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        throw InvalidOperationError("a send is already in flight on this socket");
    }

    pending_ = std::make_shared<PendingTransmit>();
    pending_guard_ = pending_;
    pending_->segments = std::move(segments);
    pending_->flags = flags;
    pending_->send_size = send_size;
    pending_->on_complete = std::move(on_complete);

    if (pumpTransmit() == PumpResult::Done) {
        return false;
    }

    // From here on only the loop thread touches pending_.
    try {
        loop_.post([this, guard = pending_guard_] {
            if (!guard.expired()) {
                armWritable();
            }
        });
    } catch (const std::exception& ex) {
        SGNET_LOG_ERROR("failed to defer transmit on fd ", fd_, ": ", ex.what());
        finishTransmit(SocketError::OtherError, 0);
        return false;
    }
    return true;
}

void TCPSocket::onEvent(uint32_t) noexcept {
    if (!pending_) {
        return;
    }
    pumpTransmit();
}

void TCPSocket::armWritable() noexcept {
    if (!pending_) {
        return;
    }
    if (state_.load(std::memory_order_acquire) == State::Closed) {
        finishTransmit(SocketError::OperationAborted, ECANCELED);
        return;
    }

    try {
        registration_ = loop_.registerFdScoped(fd_,
                                               this,
                                               kEpollOut | kEpollErr | kEpollHup,
                                               sgnet::EventLoop::FdOwnership::Borrowed);
    } catch (const std::exception& ex) {
        SGNET_LOG_ERROR("failed to arm EPOLLOUT on fd ", fd_, ": ", ex.what());
        finishTransmit(SocketError::OtherError, 0);
    }
}

TCPSocket::PumpResult TCPSocket::pumpTransmit() noexcept {
    PendingTransmit& pending = *pending_;

    while (pending.index < pending.segments.size()) {
        if (state_.load(std::memory_order_acquire) == State::Closed) {
            finishTransmit(SocketError::OperationAborted, ECANCELED);
            return PumpResult::Done;
        }

        const bool memory = pending.segments[pending.index].isMemory();
        const ssize_t sent = memory ? sendMemoryBatch(pending) : sendFileSegment(pending);
        const int error = errno;

        if (sent > 0) {
            advance(pending, static_cast<uint64_t>(sent));
            continue;
        }
        if (sent == 0) {
            // sendfile hit EOF: the file shrank below the staged length.
            if (!memory) {
                finishTransmit(SocketError::InvalidArgument, 0);
            } else {
                finishTransmit(SocketError::Shutdown, EPIPE);
            }
            return PumpResult::Done;
        }
        if (error == EINTR) {
            continue;
        }
        if (error == EAGAIN || error == EWOULDBLOCK) {
            return PumpResult::WouldBlock;
        }

        finishTransmit(socketErrorFromErrno(error), error);
        return PumpResult::Done;
    }

    finishTransmit(SocketError::Success, 0);
    return PumpResult::Done;
}

ssize_t TCPSocket::sendMemoryBatch(const PendingTransmit& pending) noexcept {
    struct iovec iovecs[kMaxIovecBatch];
    size_t iov_count = 0;
    uint64_t budget = pending.send_size != 0 ? pending.send_size : UINT64_MAX;
    size_t index = pending.index;
    uint64_t skip = pending.segment_sent;
    bool ends_packet = false;

    while (index < pending.segments.size() && iov_count < kMaxIovecBatch && budget > 0) {
        const TransmitSegment& segment = pending.segments[index];
        if (!segment.isMemory()) {
            break;
        }

        const uint64_t remaining = segment.length - skip;
        const uint64_t take = remaining < budget ? remaining : budget;
        iovecs[iov_count].iov_base = const_cast<std::byte*>(segment.data + skip);
        iovecs[iov_count].iov_len = static_cast<size_t>(take);
        ++iov_count;
        budget -= take;

        if (take < remaining) {
            break;
        }
        ++index;
        skip = 0;
        if (segment.end_of_packet) {
            ends_packet = true;
            break;
        }
    }

    struct msghdr msg {};
    msg.msg_iov = iovecs;
    msg.msg_iovlen = iov_count;

    int flags = MSG_NOSIGNAL;
    if (!ends_packet && index < pending.segments.size()) {
        flags |= MSG_MORE;
    }

    transmit_syscalls_.fetch_add(1, std::memory_order_relaxed);
    return ::sendmsg(fd_, &msg, flags);
}

ssize_t TCPSocket::sendFileSegment(const PendingTransmit& pending) noexcept {
    const TransmitSegment& segment = pending.segments[pending.index];
    uint64_t chunk = segment.length - pending.segment_sent;
    if (chunk > kMaxSendfileChunk) {
        chunk = kMaxSendfileChunk;
    }
    chunk = clampChunk(chunk, pending.send_size);

    off_t offset = static_cast<off_t>(segment.offset + pending.segment_sent);
    transmit_syscalls_.fetch_add(1, std::memory_order_relaxed);
    return ::sendfile(fd_, segment.file_fd, &offset, static_cast<size_t>(chunk));
}

void TCPSocket::advance(PendingTransmit& pending, uint64_t sent) noexcept {
    pending.total_sent += sent;

    uint64_t consumed = sent;
    while (consumed > 0 && pending.index < pending.segments.size()) {
        const uint64_t remaining = pending.segments[pending.index].length - pending.segment_sent;
        if (consumed < remaining) {
            pending.segment_sent += consumed;
            return;
        }
        consumed -= remaining;
        ++pending.index;
        pending.segment_sent = 0;
    }
}

void TCPSocket::finishTransmit(SocketError status, int native_error) noexcept {
    registration_.reset();
    std::shared_ptr<PendingTransmit> pending = std::move(pending_);

    {
        const std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (state_.load(std::memory_order_acquire) == State::Closed) {
            status = SocketError::OperationAborted;
            native_error = ECANCELED;
            releaseDescriptor();
        } else if (status == SocketError::Success && hasFlag(pending->flags, SendPacketsFlags::Disconnect)) {
            shutdownConnection(hasFlag(pending->flags, SendPacketsFlags::ReuseSocket));
        }
        transmit_in_flight_.store(false, std::memory_order_release);
    }

    TransmitResult result;
    result.status = status;
    result.native_error = native_error;
    result.bytes_transferred = (status == SocketError::Success) ? pending->total_sent : 0;

    if (status != SocketError::Success) {
        SGNET_LOG_WARN("transmit failed after ", pending->total_sent, " bytes: ", toString(status),
                       native_error != 0 ? " (" : "", native_error != 0 ? std::strerror(native_error) : "",
                       native_error != 0 ? ")" : "");
    }

    try {
        pending->on_complete(result);
    } catch (const std::exception& ex) {
        SGNET_LOG_ERROR("transmit completion handler threw: ", ex.what());
    }
}

// Runs the abort of an in-flight transmit on the loop thread and waits for it,
// so neither a posted task nor the EPOLLOUT registration outlives the socket.
void TCPSocket::abortOnLoopThread() noexcept {
    std::future<void> aborted;
    try {
        auto done = std::make_shared<std::promise<void>>();
        aborted = done->get_future();
        loop_.post([this, guard = pending_guard_, done] {
            if (!guard.expired()) {
                finishTransmit(SocketError::OperationAborted, ECANCELED);
            }
            done->set_value();
        });
    } catch (const std::exception& ex) {
        SGNET_LOG_ERROR("socket destroyed with a transmit in flight and the abort could not be posted: ",
                        ex.what());
        return;
    }

    while (aborted.wait_for(kAbortPollInterval) != std::future_status::ready) {
        if (!loop_.hasLoopThread()) {
            // run() returned without reaching the task.
            if (transmit_in_flight_.load(std::memory_order_acquire)) {
                finishTransmit(SocketError::OperationAborted, ECANCELED);
            }
            return;
        }
    }
}

const char* toString(TCPSocket::State state) noexcept {
    switch (state) {
        case TCPSocket::State::Idle:
            return "Idle";
        case TCPSocket::State::Connected:
            return "Connected";
        case TCPSocket::State::Disconnected:
            return "Disconnected";
        case TCPSocket::State::Closed:
            return "Closed";
    }
    return "Unknown";
}

}  // namespace sgnet::net
