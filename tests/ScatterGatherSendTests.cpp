#include "sgnet/Errors.hpp"
#include "sgnet/eventloop/EventLoop.hpp"
#include "sgnet/io/FileStream.hpp"
#include "sgnet/net/SocketError.hpp"
#include "sgnet/net/TCPSocket.hpp"
#include "sgnet/send/SendDescriptor.hpp"
#include "sgnet/send/SendOperation.hpp"

#include "TestSupport.hpp"

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <future>
#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <mutex>
#include <netinet/in.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace {

using sgnet::net::Endpoint;
using sgnet::net::SocketError;
using sgnet::net::TCPSocket;
using sgnet::send::EmptyRegion;
using sgnet::send::FileRegion;
using sgnet::send::MemoryRegion;
using sgnet::send::ScatterGatherSendOperation;
using sgnet::send::SendDescriptor;
using sgnet::send::SendOperationRequest;
using sgnet::send::SendOperationResult;
using sgnet::send::SendPacketsFlags;
using sgnet::send::StreamRegion;

constexpr uint64_t kFileSize = 1024;
constexpr auto kCompletionTimeout = std::chrono::seconds(10);

// Large enough to overflow the local send buffer plus the peer's receive
// buffer, so the send cannot finish before the peer starts reading.
constexpr size_t kLargePayloadBytes = 32 * 1024 * 1024;

std::span<const std::byte> bytesOf(const std::vector<std::byte>& buffer) {
    return std::span<const std::byte>(buffer.data(), buffer.size());
}

std::vector<std::byte> patternBuffer(size_t size) {
    std::vector<std::byte> buffer(size);
    for (size_t i = 0; i < size; ++i) {
        buffer[i] = static_cast<std::byte>(sgnet::test::patternByte(i));
    }
    return buffer;
}

// Listener that leaves its connection unaccepted until startDraining(), so a
// sender fills the kernel buffers and has to wait for writability.
class PausedReceiver {
public:
    explicit PausedReceiver(int family = AF_INET)
        : listen_fd_(sgnet::test::createTcpServerSocket(family, &port_)) {}

    PausedReceiver(const PausedReceiver&) = delete;
    PausedReceiver& operator=(const PausedReceiver&) = delete;

    ~PausedReceiver() {
        ::shutdown(listen_fd_, SHUT_RDWR);
        join();
        ::close(listen_fd_);
    }

    uint16_t port() const noexcept {
        return port_;
    }

    void startDraining() {
        thread_ = std::thread([this]() {
            const int client_fd = ::accept(listen_fd_, nullptr, nullptr);
            if (client_fd < 0) {
                return;
            }
            std::vector<char> buffer(256 * 1024);
            for (;;) {
                const ssize_t n = ::recv(client_fd, buffer.data(), buffer.size(), 0);
                if (n > 0) {
                    received_.append(buffer.data(), static_cast<size_t>(n));
                    continue;
                }
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                break;
            }
            ::close(client_fd);
        });
    }

    // Waits for the peer to close; only then is received() stable.
    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    const std::string& received() const noexcept {
        return received_;
    }

private:
    uint16_t port_ = 0;
    int listen_fd_ = -1;
    std::string received_;
    std::thread thread_;
};

class ScatterGatherSendTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_file_ = dir_.writePatternFile("payload", kFileSize);
    }

    void TearDown() override {
        loop_thread_.stop();
        EXPECT_EQ(loop_thread_.error(), nullptr);
    }

    Endpoint serverEndpoint() const {
        return Endpoint::loopbackV6(server_.port());
    }

    SendOperationResult execute(TCPSocket& socket, const SendOperationRequest& request) {
        std::future<SendOperationResult> future = operation_.execute(socket, &request);
        EXPECT_EQ(future.wait_for(kCompletionTimeout), std::future_status::ready);
        return future.get();
    }

    // One send over a fresh connection. Checks the result and that the server
    // saw exactly the reported bytes.
    void sendPackets(std::vector<SendDescriptor> descriptors,
                     SocketError expected_status,
                     uint64_t expected_bytes,
                     SendPacketsFlags flags = SendPacketsFlags::None) {
        TCPSocket socket(loop_);
        socket.connect(serverEndpoint());

        SendOperationRequest request;
        request.descriptors = std::move(descriptors);
        request.flags = flags;

        const SendOperationResult result = execute(socket, request);
        EXPECT_EQ(result.status, expected_status);
        EXPECT_EQ(result.bytes_transferred, expected_bytes);

        expected_received_ += expected_bytes;
        EXPECT_TRUE(server_.waitForBytes(expected_received_));

        if (hasFlag(flags, SendPacketsFlags::Disconnect) && result.status == SocketError::Success) {
            const std::array<std::byte, 1> one{std::byte{1}};
            if (hasFlag(flags, SendPacketsFlags::ReuseSocket)) {
                EXPECT_EQ(socket.state(), TCPSocket::State::Idle);
                socket.connect(serverEndpoint());
                EXPECT_EQ(socket.send(one), 1U);
                ++expected_received_;
                EXPECT_TRUE(server_.waitForBytes(expected_received_));
            } else {
                EXPECT_EQ(socket.state(), TCPSocket::State::Disconnected);
                EXPECT_THROW((void)socket.send(one), std::system_error);
            }
        }
    }

    void sendPackets(SendDescriptor descriptor, uint64_t expected_bytes) {
        sendPackets({std::move(descriptor)}, SocketError::Success, expected_bytes);
    }

    sgnet::test::TempDir dir_;
    std::string test_file_;
    sgnet::test::SinkServer server_{AF_INET6};
    sgnet::EventLoop loop_;
    sgnet::test::LoopThread loop_thread_{loop_};
    const ScatterGatherSendOperation operation_{};
    uint64_t expected_received_ = 0;
};

// -----------------------------------------------------------------------------
// Preconditions
// -----------------------------------------------------------------------------

TEST_F(ScatterGatherSendTest, DisposedSocketThrowsBeforeAnyOtherCheck) {
    TCPSocket socket(loop_);
    socket.connect(serverEndpoint());
    socket.close();

    SendOperationRequest request;
    EXPECT_THROW(operation_.execute(socket, &request), sgnet::ObjectDisposedError);
    EXPECT_THROW(operation_.execute(socket, nullptr), sgnet::ObjectDisposedError);
}

TEST_F(ScatterGatherSendTest, NullRequestThrows) {
    TCPSocket socket(loop_);
    socket.connect(serverEndpoint());

    try {
        (void)operation_.execute(socket, nullptr);
        FAIL() << "expected ArgumentNullError";
    } catch (const sgnet::ArgumentNullError& ex) {
        EXPECT_EQ(ex.paramName(), "request");
    }
}

TEST_F(ScatterGatherSendTest, NotConnectedThrows) {
    TCPSocket socket(loop_);
    SendOperationRequest request;
    EXPECT_THROW(operation_.execute(socket, &request), sgnet::InvalidOperationError);
}

TEST_F(ScatterGatherSendTest, NullListThrows) {
    TCPSocket socket(loop_);
    socket.connect(serverEndpoint());

    SendOperationRequest request;
    request.descriptors = std::nullopt;
    try {
        (void)operation_.execute(socket, &request);
        FAIL() << "expected ArgumentNullError";
    } catch (const sgnet::ArgumentNullError& ex) {
        EXPECT_EQ(ex.paramName(), "request.descriptors");
    }
}

TEST_F(ScatterGatherSendTest, NullCompletionHandlerThrows) {
    TCPSocket socket(loop_);
    socket.connect(serverEndpoint());

    SendOperationRequest request;
    EXPECT_THROW(operation_.execute(socket, &request, ScatterGatherSendOperation::CompletionHandler{}),
                 sgnet::ArgumentNullError);
}

TEST_F(ScatterGatherSendTest, DefaultSendSizeIsZero) {
    const SendOperationRequest request;
    EXPECT_EQ(request.send_size, 0U);
    EXPECT_EQ(request.flags, SendPacketsFlags::None);
    ASSERT_TRUE(request.descriptors.has_value());
    EXPECT_TRUE(request.descriptors->empty());
}

// -----------------------------------------------------------------------------
// Memory regions
// -----------------------------------------------------------------------------

TEST_F(ScatterGatherSendTest, NullElementIgnored) {
    sendPackets(EmptyRegion{}, 0);
}

TEST_F(ScatterGatherSendTest, EmptyListCompletesSynchronously) {
    TCPSocket socket(loop_);
    socket.connect(serverEndpoint());

    SendOperationRequest request;
    std::optional<SendOperationResult> result;
    const bool pending = operation_.execute(socket, &request, [&](const SendOperationResult& r) { result = r; });

    EXPECT_FALSE(pending);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, SocketError::Success);
    EXPECT_EQ(result->bytes_transferred, 0U);
    // Nothing reached the transport, so nothing was disconnected either.
    EXPECT_TRUE(socket.isConnected());
}

TEST_F(ScatterGatherSendTest, ZeroLengthOnlyListIssuesNoTransportCalls) {
    sgnet::test::InspectableTCPSocket socket(loop_);
    socket.connect(serverEndpoint());
    const std::vector<std::byte> buffer(10);

    SendOperationRequest request;
    request.descriptors = std::vector<SendDescriptor>{EmptyRegion{},
                                                      MemoryRegion(std::span<const std::byte>()),
                                                      MemoryRegion(bytesOf(buffer), 4, 0),
                                                      FileRegion(test_file_, 5, 0),
                                                      EmptyRegion{}};
    request.flags = SendPacketsFlags::Disconnect;

    const SendOperationResult result = execute(socket, request);
    EXPECT_EQ(result.status, SocketError::Success);
    EXPECT_EQ(result.bytes_transferred, 0U);
    EXPECT_EQ(socket.transmitSyscalls(), 0U);
    EXPECT_FALSE(socket.transmitInFlight());
    EXPECT_TRUE(socket.isConnected());
}

TEST_F(ScatterGatherSendTest, ThrowingHandlerDoesNotEscapeSynchronousCompletion) {
    TCPSocket socket(loop_);
    socket.connect(serverEndpoint());
    const std::vector<std::byte> buffer(4);
    const auto throwing = [](const SendOperationResult&) { throw std::runtime_error("handler failure"); };

    SendOperationRequest request;
    EXPECT_NO_THROW(EXPECT_FALSE(operation_.execute(socket, &request, throwing)));

    request.descriptors = std::vector<SendDescriptor>{FileRegion(test_file_, 5, 10000)};
    EXPECT_NO_THROW(EXPECT_FALSE(operation_.execute(socket, &request, throwing)));

    request.descriptors = std::vector<SendDescriptor>{MemoryRegion(bytesOf(buffer))};
    EXPECT_NO_THROW(EXPECT_FALSE(operation_.execute(socket, &request, throwing)));
    EXPECT_FALSE(socket.transmitInFlight());
    EXPECT_TRUE(server_.waitForBytes(4));
}

TEST_F(ScatterGatherSendTest, NormalBuffer) {
    const std::vector<std::byte> buffer(10);
    sendPackets(MemoryRegion(bytesOf(buffer)), 10);
}

TEST_F(ScatterGatherSendTest, NormalBufferRange) {
    const std::vector<std::byte> buffer(10);
    sendPackets(MemoryRegion(bytesOf(buffer), 5, 5), 5);
}

TEST_F(ScatterGatherSendTest, EmptyBufferIgnored) {
    const std::vector<std::byte> buffer;
    sendPackets(MemoryRegion(bytesOf(buffer)), 0);
}

TEST_F(ScatterGatherSendTest, BufferZeroCountIgnored) {
    const std::vector<std::byte> buffer(10);
    sendPackets(MemoryRegion(bytesOf(buffer), 4, 0), 0);
}

TEST_F(ScatterGatherSendTest, MixedBuffersSkipZeroCount) {
    const std::vector<std::byte> buffer = patternBuffer(10);
    sendPackets({MemoryRegion(bytesOf(buffer), 4, 0),
                 MemoryRegion(bytesOf(buffer), 4, 4),
                 MemoryRegion(bytesOf(buffer), 0, 4)},
                SocketError::Success,
                8);

    EXPECT_EQ(server_.received(), sgnet::test::patternBytes(4, 4) + sgnet::test::patternBytes(0, 4));
}

TEST_F(ScatterGatherSendTest, BufferZeroCountThenNormalOnOneSocket) {
    TCPSocket socket(loop_);
    socket.connect(serverEndpoint());
    const std::vector<std::byte> buffer(5);

    SendOperationRequest request;
    request.descriptors = std::vector<SendDescriptor>{MemoryRegion(bytesOf(buffer), 3, 0)};
    SendOperationResult result = execute(socket, request);
    EXPECT_EQ(result.status, SocketError::Success);
    EXPECT_EQ(result.bytes_transferred, 0U);

    request.descriptors = std::vector<SendDescriptor>{MemoryRegion(bytesOf(buffer), 1, 4)};
    result = execute(socket, request);
    EXPECT_EQ(result.status, SocketError::Success);
    EXPECT_EQ(result.bytes_transferred, 4U);
    EXPECT_TRUE(server_.waitForBytes(4));
}

TEST_F(ScatterGatherSendTest, MemoryRegionOutsideBufferThrows) {
    TCPSocket socket(loop_);
    socket.connect(serverEndpoint());
    const std::vector<std::byte> buffer(10);

    SendOperationRequest request;
    request.descriptors = std::vector<SendDescriptor>{MemoryRegion(bytesOf(buffer), 8, 4)};
    EXPECT_THROW(operation_.execute(socket, &request), sgnet::ArgumentOutOfRangeError);
    EXPECT_FALSE(socket.transmitInFlight());
}

TEST_F(ScatterGatherSendTest, SendSizeSplitsKernelCallsWithoutChangingBytes) {
    TCPSocket socket(loop_);
    socket.connect(serverEndpoint());
    const std::vector<std::byte> buffer = patternBuffer(30);

    SendOperationRequest request;
    request.descriptors = std::vector<SendDescriptor>{MemoryRegion(bytesOf(buffer), true),
                                                      FileRegion(test_file_, 0, 40),
                                                      MemoryRegion(bytesOf(buffer), 0, 7)};
    request.send_size = 7;

    const SendOperationResult result = execute(socket, request);
    EXPECT_EQ(result.status, SocketError::Success);
    EXPECT_EQ(result.bytes_transferred, 77U);
    ASSERT_TRUE(server_.waitForBytes(77));
    EXPECT_EQ(server_.received(),
              sgnet::test::patternBytes(0, 30) + sgnet::test::patternBytes(0, 40) + sgnet::test::patternBytes(0, 7));
}

// -----------------------------------------------------------------------------
// Disconnect and reuse
// -----------------------------------------------------------------------------

TEST_F(ScatterGatherSendTest, DisconnectShutsSocketDown) {
    const std::vector<std::byte> buffer(10);
    sendPackets({MemoryRegion(bytesOf(buffer), 4, 4)}, SocketError::Success, 4, SendPacketsFlags::Disconnect);
}

TEST_F(ScatterGatherSendTest, DisconnectWithReuseLeavesSocketReusable) {
    const std::vector<std::byte> buffer(10);
    sendPackets({MemoryRegion(bytesOf(buffer), 4, 4)},
                SocketError::Success,
                4,
                SendPacketsFlags::Disconnect | SendPacketsFlags::ReuseSocket);
}

TEST_F(ScatterGatherSendTest, ReuseWithoutDisconnectHasNoEffect) {
    TCPSocket socket(loop_);
    socket.connect(serverEndpoint());
    const std::vector<std::byte> buffer(10);

    SendOperationRequest request;
    request.descriptors = std::vector<SendDescriptor>{MemoryRegion(bytesOf(buffer))};
    request.flags = SendPacketsFlags::ReuseSocket;

    const SendOperationResult result = execute(socket, request);
    EXPECT_EQ(result.status, SocketError::Success);
    EXPECT_EQ(result.bytes_transferred, 10U);
    EXPECT_TRUE(socket.isConnected());
}

TEST_F(ScatterGatherSendTest, DisconnectIsSkippedWhenSendFails) {
    TCPSocket socket(loop_);
    socket.connect(serverEndpoint());

    SendOperationRequest request;
    request.descriptors = std::vector<SendDescriptor>{FileRegion(test_file_, 11000, 1)};
    request.flags = SendPacketsFlags::Disconnect;

    const SendOperationResult result = execute(socket, request);
    EXPECT_EQ(result.status, SocketError::InvalidArgument);
    EXPECT_TRUE(socket.isConnected());
}

// -----------------------------------------------------------------------------
// File regions
// -----------------------------------------------------------------------------

TEST_F(ScatterGatherSendTest, EmptyFileNameThrows) {
    TCPSocket socket(loop_);
    socket.connect(serverEndpoint());

    SendOperationRequest request;
    request.descriptors = std::vector<SendDescriptor>{FileRegion(std::string())};
    try {
        (void)operation_.execute(socket, &request);
        FAIL() << "expected ArgumentError";
    } catch (const sgnet::ArgumentError& ex) {
        EXPECT_EQ(ex.paramName(), "path");
    }
}

TEST_F(ScatterGatherSendTest, BlankFileNameIsAnOrdinaryMissingFile) {
    TCPSocket socket(loop_);
    socket.connect(serverEndpoint());

    SendOperationRequest request;
    request.descriptors = std::vector<SendDescriptor>{FileRegion(dir_.path("   "))};
    EXPECT_THROW(operation_.execute(socket, &request), sgnet::FileNotFoundError);
}

TEST_F(ScatterGatherSendTest, MissingDirectoryThrows) {
    TCPSocket socket(loop_);
    socket.connect(serverEndpoint());

    SendOperationRequest request;
    request.descriptors = std::vector<SendDescriptor>{FileRegion("nodir/nofile")};
    EXPECT_THROW(operation_.execute(socket, &request), sgnet::DirectoryNotFoundError);
}

TEST_F(ScatterGatherSendTest, MissingFileThrowsAndLeavesSocketUsable) {
    TCPSocket socket(loop_);
    socket.connect(serverEndpoint());
    const std::vector<std::byte> buffer(3);

    SendOperationRequest request;
    request.descriptors = std::vector<SendDescriptor>{MemoryRegion(bytesOf(buffer)), FileRegion(dir_.path("DoesntExit"))};
    EXPECT_THROW(operation_.execute(socket, &request), sgnet::FileNotFoundError);

    request.descriptors = std::vector<SendDescriptor>{MemoryRegion(bytesOf(buffer))};
    const SendOperationResult result = execute(socket, request);
    EXPECT_EQ(result.bytes_transferred, 3U);
    ASSERT_TRUE(server_.waitForBytes(3));
    EXPECT_EQ(server_.receivedSize(), 3U);
}

TEST_F(ScatterGatherSendTest, WholeFile) {
    sendPackets(FileRegion(test_file_), kFileSize);
    EXPECT_EQ(server_.received(), sgnet::test::patternBytes(0, kFileSize));
}

TEST_F(ScatterGatherSendTest, FileZeroCountIsWholeFile) {
    sendPackets(FileRegion(test_file_, 0, 0), kFileSize);
    sendPackets(FileRegion(test_file_, 0, 0), kFileSize);
}

TEST_F(ScatterGatherSendTest, FilePart) {
    sendPackets(FileRegion(test_file_, 10, 20), 20);
    EXPECT_EQ(server_.received(), sgnet::test::patternBytes(10, 20));
}

TEST_F(ScatterGatherSendTest, FileMultiPart) {
    sendPackets({FileRegion(test_file_, 10, 20),
                 FileRegion(test_file_, 30, 10),
                 FileRegion(test_file_, 0, 10),
                 FileRegion(test_file_, 10, 20),
                 FileRegion(test_file_, 30, 10),
                 FileRegion(test_file_, 0, 10)},
                SocketError::Success,
                80);

    const std::string once = sgnet::test::patternBytes(10, 20) + sgnet::test::patternBytes(30, 10) +
                             sgnet::test::patternBytes(0, 10);
    EXPECT_EQ(server_.received(), once + once);
}

TEST_F(ScatterGatherSendTest, FileZeroCountWithOffsetIsElided) {
    sendPackets({FileRegion(test_file_, 5, 0), FileRegion(dir_.path("DoesntExit"), 5, 0)}, SocketError::Success, 0);
}

TEST_F(ScatterGatherSendTest, FileLargeOffsetReportsInvalidArgument) {
    sendPackets({FileRegion(test_file_, 11000, 1)}, SocketError::InvalidArgument, 0);
    sendPackets({FileRegion(test_file_, static_cast<uint64_t>(std::numeric_limits<uint32_t>::max()) + 11000, 1)},
                SocketError::InvalidArgument,
                0);
}

TEST_F(ScatterGatherSendTest, FileLargeCountReportsInvalidArgument) {
    sendPackets({FileRegion(test_file_, 5, 10000)}, SocketError::InvalidArgument, 0);
}

TEST_F(ScatterGatherSendTest, BoundsFailureSendsNothing) {
    TCPSocket socket(loop_);
    socket.connect(serverEndpoint());
    const std::vector<std::byte> buffer(10);

    SendOperationRequest request;
    request.descriptors = std::vector<SendDescriptor>{MemoryRegion(bytesOf(buffer)), FileRegion(test_file_, 5, 10000)};
    SendOperationResult result = execute(socket, request);
    EXPECT_EQ(result.status, SocketError::InvalidArgument);
    EXPECT_EQ(result.bytes_transferred, 0U);

    const std::vector<std::byte> marker(2);
    request.descriptors = std::vector<SendDescriptor>{MemoryRegion(bytesOf(marker))};
    result = execute(socket, request);
    EXPECT_EQ(result.status, SocketError::Success);

    socket.close();
    ASSERT_TRUE(server_.waitForClosedConnections(1));
    EXPECT_EQ(server_.receivedSize(), 2U);
}

// -----------------------------------------------------------------------------
// Stream regions
// -----------------------------------------------------------------------------

TEST_F(ScatterGatherSendTest, StreamWholeSendsRemainderAndAdvancesPosition) {
    sgnet::io::FileStream stream = sgnet::io::FileStream::open(test_file_);
    stream.seek(kFileSize / 2);

    sendPackets(StreamRegion(&stream), kFileSize / 2);
    EXPECT_EQ(stream.position(), kFileSize);
    EXPECT_EQ(server_.received(), sgnet::test::patternBytes(kFileSize / 2, kFileSize / 2));

    // Same request again reflects the advanced position.
    sendPackets(StreamRegion(&stream), 0);
    EXPECT_EQ(stream.position(), kFileSize);
}

TEST_F(ScatterGatherSendTest, StreamZeroCountMatchesWholeStream) {
    sgnet::io::FileStream stream = sgnet::io::FileStream::open(test_file_);

    sendPackets(StreamRegion(&stream, 0, 0), kFileSize);
    EXPECT_EQ(stream.position(), kFileSize);

    stream.seek(kFileSize / 2);
    sendPackets(StreamRegion(&stream, 0, 0), kFileSize / 2);
    EXPECT_EQ(stream.position(), kFileSize);
}

TEST_F(ScatterGatherSendTest, StreamSizeCountLeavesPosition) {
    sgnet::io::FileStream stream = sgnet::io::FileStream::open(test_file_);
    stream.seek(kFileSize / 2);

    sendPackets(StreamRegion(&stream, 0, kFileSize), kFileSize);
    EXPECT_EQ(stream.position(), kFileSize / 2);

    sendPackets(StreamRegion(&stream, 0, kFileSize), kFileSize);
    EXPECT_EQ(stream.position(), kFileSize / 2);
}

TEST_F(ScatterGatherSendTest, StreamPart) {
    sgnet::io::FileStream stream = sgnet::io::FileStream::open(test_file_);
    stream.seek(kFileSize - 10);

    sendPackets(StreamRegion(&stream, 0, 20), 20);
    EXPECT_EQ(stream.position(), kFileSize - 10);

    sendPackets(StreamRegion(&stream, 10, 20), 20);
    EXPECT_EQ(stream.position(), kFileSize - 10);

    sendPackets(StreamRegion(&stream, kFileSize - 20, 20), 20);
    EXPECT_EQ(stream.position(), kFileSize - 10);

    EXPECT_EQ(server_.received(), sgnet::test::patternBytes(0, 20) + sgnet::test::patternBytes(10, 20) +
                                      sgnet::test::patternBytes(kFileSize - 20, 20));
}

TEST_F(ScatterGatherSendTest, StreamMultiPart) {
    sgnet::io::FileStream stream = sgnet::io::FileStream::open(test_file_);
    stream.seek(kFileSize - 10);

    const std::vector<SendDescriptor> elements{StreamRegion(&stream, 0, 20),
                                               StreamRegion(&stream, kFileSize - 10, 10),
                                               StreamRegion(&stream, 0, 10),
                                               StreamRegion(&stream, 10, 20),
                                               StreamRegion(&stream, 30, 10)};

    sendPackets(elements, SocketError::Success, 70);
    EXPECT_EQ(stream.position(), kFileSize - 10);

    sendPackets(elements, SocketError::Success, 70);
    EXPECT_EQ(stream.position(), kFileSize - 10);
}

TEST_F(ScatterGatherSendTest, StreamMixedWithWholeRegionAdvancesOnce) {
    sgnet::io::FileStream stream = sgnet::io::FileStream::open(test_file_);
    stream.seek(kFileSize - 100);

    sendPackets({StreamRegion(&stream, 0, 10), StreamRegion(&stream)}, SocketError::Success, 110);
    EXPECT_EQ(stream.position(), kFileSize);
}

TEST_F(ScatterGatherSendTest, StreamLargeOffsetReportsInvalidArgument) {
    sgnet::io::FileStream stream = sgnet::io::FileStream::open(test_file_);
    sendPackets({StreamRegion(&stream, static_cast<uint64_t>(std::numeric_limits<uint32_t>::max()) + 11000, 1)},
                SocketError::InvalidArgument,
                0);
    EXPECT_EQ(stream.position(), 0U);
}

TEST_F(ScatterGatherSendTest, StreamLargeCountReportsInvalidArgument) {
    sgnet::io::FileStream stream = sgnet::io::FileStream::open(test_file_);
    sendPackets({StreamRegion(&stream, 5, 10000)}, SocketError::InvalidArgument, 0);
}

TEST_F(ScatterGatherSendTest, FailedSendLeavesStreamPosition) {
    sgnet::io::FileStream stream = sgnet::io::FileStream::open(test_file_);
    stream.seek(100);

    sendPackets({StreamRegion(&stream), FileRegion(test_file_, 5, 10000)}, SocketError::InvalidArgument, 0);
    EXPECT_EQ(stream.position(), 100U);
}

TEST_F(ScatterGatherSendTest, NullOrClosedStreamThrows) {
    TCPSocket socket(loop_);
    socket.connect(serverEndpoint());

    SendOperationRequest request;
    request.descriptors = std::vector<SendDescriptor>{StreamRegion(nullptr)};
    EXPECT_THROW(operation_.execute(socket, &request), sgnet::ArgumentNullError);

    sgnet::io::FileStream stream = sgnet::io::FileStream::open(test_file_);
    stream.close();
    request.descriptors = std::vector<SendDescriptor>{StreamRegion(&stream)};
    EXPECT_THROW(operation_.execute(socket, &request), sgnet::ObjectDisposedError);
}

// -----------------------------------------------------------------------------
// Deferred completion
// -----------------------------------------------------------------------------

TEST_F(ScatterGatherSendTest, LargeSendCompletesOnLoopThread) {
    PausedReceiver receiver(AF_INET);
    const std::vector<std::byte> payload = patternBuffer(kLargePayloadBytes);

    TCPSocket socket(loop_);
    socket.connect(Endpoint::loopbackV4(receiver.port()));

    SendOperationRequest request;
    request.descriptors = std::vector<SendDescriptor>{MemoryRegion(bytesOf(payload)), FileRegion(test_file_)};

    std::mutex mu;
    std::condition_variable cv;
    std::optional<SendOperationResult> result;
    std::thread::id completion_thread;

    const bool pending = operation_.execute(socket, &request, [&](const SendOperationResult& r) {
        {
            std::lock_guard<std::mutex> lock(mu);
            result = r;
            completion_thread = std::this_thread::get_id();
        }
        cv.notify_one();
    });
    ASSERT_TRUE(pending);
    EXPECT_TRUE(socket.transmitInFlight());

    receiver.startDraining();
    {
        std::unique_lock<std::mutex> lock(mu);
        ASSERT_TRUE(cv.wait_for(lock, kCompletionTimeout, [&]() { return result.has_value(); }));
    }

    EXPECT_EQ(result->status, SocketError::Success);
    EXPECT_EQ(result->bytes_transferred, kLargePayloadBytes + kFileSize);
    EXPECT_NE(completion_thread, std::this_thread::get_id());
    EXPECT_FALSE(socket.transmitInFlight());

    socket.close();
    receiver.join();
    ASSERT_EQ(receiver.received().size(), kLargePayloadBytes + kFileSize);
    EXPECT_EQ(receiver.received().substr(kLargePayloadBytes), sgnet::test::patternBytes(0, kFileSize));
    EXPECT_EQ(receiver.received().substr(0, 4096), sgnet::test::patternBytes(0, 4096));
}

TEST_F(ScatterGatherSendTest, SecondSendWhileInFlightThrows) {
    PausedReceiver receiver(AF_INET);
    const std::vector<std::byte> payload = patternBuffer(kLargePayloadBytes);

    TCPSocket socket(loop_);
    socket.connect(Endpoint::loopbackV4(receiver.port()));

    SendOperationRequest request;
    request.descriptors = std::vector<SendDescriptor>{MemoryRegion(bytesOf(payload))};
    std::future<SendOperationResult> first = operation_.execute(socket, &request);

    EXPECT_THROW(operation_.execute(socket, &request), sgnet::InvalidOperationError);

    receiver.startDraining();
    ASSERT_EQ(first.wait_for(kCompletionTimeout), std::future_status::ready);
    const SendOperationResult result = first.get();
    EXPECT_EQ(result.status, SocketError::Success);
    EXPECT_EQ(result.bytes_transferred, kLargePayloadBytes);

    socket.close();
    receiver.join();
    EXPECT_EQ(receiver.received().size(), kLargePayloadBytes);
}

TEST_F(ScatterGatherSendTest, DeferredSendWithDisconnectShutsDownAfterCompletion) {
    PausedReceiver receiver(AF_INET);
    const std::vector<std::byte> payload = patternBuffer(kLargePayloadBytes);

    TCPSocket socket(loop_);
    socket.connect(Endpoint::loopbackV4(receiver.port()));

    SendOperationRequest request;
    request.descriptors = std::vector<SendDescriptor>{MemoryRegion(bytesOf(payload))};
    request.flags = SendPacketsFlags::Disconnect;
    std::future<SendOperationResult> future = operation_.execute(socket, &request);

    receiver.startDraining();
    ASSERT_EQ(future.wait_for(kCompletionTimeout), std::future_status::ready);
    EXPECT_EQ(future.get().status, SocketError::Success);
    EXPECT_EQ(socket.state(), TCPSocket::State::Disconnected);

    // The shutdown ends the stream for the receiver without closing the socket.
    receiver.join();
    EXPECT_EQ(receiver.received().size(), kLargePayloadBytes);
}

TEST_F(ScatterGatherSendTest, CloseWhileInFlightAbortsSend) {
    PausedReceiver receiver(AF_INET);
    const std::vector<std::byte> payload = patternBuffer(kLargePayloadBytes);

    TCPSocket socket(loop_);
    socket.connect(Endpoint::loopbackV4(receiver.port()));

    SendOperationRequest request;
    request.descriptors = std::vector<SendDescriptor>{MemoryRegion(bytesOf(payload))};
    std::future<SendOperationResult> future = operation_.execute(socket, &request);
    ASSERT_TRUE(socket.transmitInFlight());

    socket.close();
    ASSERT_EQ(future.wait_for(kCompletionTimeout), std::future_status::ready);

    const SendOperationResult result = future.get();
    EXPECT_EQ(result.status, SocketError::OperationAborted);
    EXPECT_EQ(result.bytes_transferred, 0U);
    EXPECT_TRUE(socket.isDisposed());
    EXPECT_FALSE(socket.isOpen());
}

TEST_F(ScatterGatherSendTest, DestroyingSocketWithSendInFlightAbortsOnLoopThread) {
    PausedReceiver receiver(AF_INET);
    const std::vector<std::byte> payload = patternBuffer(kLargePayloadBytes);

    auto socket = std::make_unique<TCPSocket>(loop_);
    socket->connect(Endpoint::loopbackV4(receiver.port()));

    SendOperationRequest request;
    request.descriptors = std::vector<SendDescriptor>{MemoryRegion(bytesOf(payload))};

    std::promise<std::thread::id> completion_thread;
    std::future<std::thread::id> completed_on = completion_thread.get_future();
    std::optional<SendOperationResult> result;
    ASSERT_TRUE(operation_.execute(*socket, &request, [&](const SendOperationResult& r) {
        result = r;
        completion_thread.set_value(std::this_thread::get_id());
    }));

    socket.reset();

    // The destructor waited for the abort, so the handler has already run.
    ASSERT_EQ(completed_on.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_NE(completed_on.get(), std::this_thread::get_id());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, SocketError::OperationAborted);
    EXPECT_EQ(result->bytes_transferred, 0U);

    // The loop keeps serving after the socket is gone.
    std::promise<void> ran;
    loop_.post([&ran] { ran.set_value(); });
    EXPECT_EQ(ran.get_future().wait_for(kCompletionTimeout), std::future_status::ready);
}

TEST(ScatterGatherSendLifetimeTests, DestroyingSocketBeforeLoopRunsDropsQueuedWork) {
    PausedReceiver receiver(AF_INET);
    const std::vector<std::byte> payload = patternBuffer(kLargePayloadBytes);
    sgnet::EventLoop loop;
    const ScatterGatherSendOperation operation{};

    auto socket = std::make_unique<TCPSocket>(loop);
    socket->connect(Endpoint::loopbackV4(receiver.port()));

    SendOperationRequest request;
    request.descriptors = std::vector<SendDescriptor>{MemoryRegion(bytesOf(payload))};

    std::optional<SendOperationResult> result;
    int completions = 0;
    ASSERT_TRUE(operation.execute(*socket, &request, [&](const SendOperationResult& r) {
        result = r;
        ++completions;
    }));

    // No loop thread yet: the abort completes here, on the calling thread.
    socket.reset();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, SocketError::OperationAborted);
    EXPECT_EQ(result->bytes_transferred, 0U);

    // The task queued by the deferred send must not touch the destroyed socket.
    sgnet::test::LoopThread loop_thread(loop);
    std::promise<void> ran;
    loop.post([&ran] { ran.set_value(); });
    EXPECT_EQ(ran.get_future().wait_for(kCompletionTimeout), std::future_status::ready);
    loop_thread.stop();

    EXPECT_EQ(loop_thread.error(), nullptr);
    EXPECT_EQ(completions, 1);
}

TEST_F(ScatterGatherSendTest, SendOverIpv4Loopback) {
    sgnet::test::SinkServer server(AF_INET);
    TCPSocket socket(loop_);
    socket.connect(Endpoint::loopbackV4(server.port()));

    const std::string text = "hello over v4";
    SendOperationRequest request;
    request.descriptors = std::vector<SendDescriptor>{sgnet::send::memoryRegion(text.data(), text.size()),
                                                      EmptyRegion{},
                                                      FileRegion(test_file_, 0, 16)};
    const SendOperationResult result = execute(socket, request);
    EXPECT_EQ(result.status, SocketError::Success);
    EXPECT_EQ(result.bytes_transferred, text.size() + 16);
    ASSERT_TRUE(server.waitForBytes(text.size() + 16));
    EXPECT_EQ(server.received(), text + sgnet::test::patternBytes(0, 16));
}

}  // namespace
