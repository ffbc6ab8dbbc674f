#pragma once

#include "sgnet/net/SocketError.hpp"
#include "sgnet/net/Transmit.hpp"
#include "sgnet/send/SendDescriptor.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sgnet::io {
class FileStream;
}

namespace sgnet::send {

// Staged form of a descriptor list: elided entries dropped, files opened,
// bounds checked, every survivor resolved to a kernel-ready segment in the
// original order.
//
// Owns the descriptors of files opened by path, so it has to outlive the
// transmit that uses its segments.
class TransmitPlan {
public:
    // Throws the local errors (ArgumentError family, ObjectDisposedError,
    // FileNotFoundError, DirectoryNotFoundError). Bounds violations do not
    // throw; they set status() to InvalidArgument.
    static TransmitPlan build(const std::vector<SendDescriptor>& descriptors);

    TransmitPlan(const TransmitPlan&) = delete;
    TransmitPlan& operator=(const TransmitPlan&) = delete;
    TransmitPlan(TransmitPlan&&) noexcept;
    TransmitPlan& operator=(TransmitPlan&&) noexcept;
    ~TransmitPlan();

    net::SocketError status() const noexcept;
    const std::vector<net::TransmitSegment>& segments() const noexcept;
    uint64_t totalBytes() const noexcept;
    bool empty() const noexcept;

    // Moves every whole-stream region's stream to the end of what it sent.
    // Call only after a successful transmit.
    void commitStreamPositions() const;

private:
    struct StreamAdvance {
        io::FileStream* stream = nullptr;
        uint64_t end_position = 0;
    };

    friend struct DescriptorStager;

    TransmitPlan() = default;

    io::FileStream& openFile(const std::string& path);
    void addSegment(const net::TransmitSegment& segment);
    void markOutOfRange() noexcept;

    net::SocketError status_ = net::SocketError::Success;
    std::vector<net::TransmitSegment> segments_;
    std::vector<StreamAdvance> stream_advances_;
    // Keyed by path so repeated regions of one file share a descriptor.
    std::map<std::string, std::unique_ptr<io::FileStream>> opened_files_;
    uint64_t total_bytes_ = 0;
};

}  // namespace sgnet::send
