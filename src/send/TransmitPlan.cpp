#include "sgnet/send/TransmitPlan.hpp"
#include "sgnet/Errors.hpp"
#include "sgnet/io/FileStream.hpp"
#include "sgnet/log/Logger.hpp"

#include <string>
#include <utility>
#include <variant>

namespace sgnet::send {

namespace {

// True when [offset, offset + length) does not fit in `size`, overflow included.
bool exceeds(uint64_t offset, uint64_t length, uint64_t size) noexcept {
    return offset > size || length > size - offset;
}

}  // namespace

// One visitor over the four descriptor cases.
struct DescriptorStager {
    TransmitPlan& plan;

    void operator()(const EmptyRegion&) const noexcept {}

    void operator()(const MemoryRegion& region) const {
        if (region.length == 0) {
            return;
        }
        if (region.offset > region.buffer.size()) {
            throw ArgumentOutOfRangeError("offset", "memory region offset is past the end of its buffer");
        }
        if (region.length > region.buffer.size() - region.offset) {
            throw ArgumentOutOfRangeError("length", "memory region extends past the end of its buffer");
        }

        net::TransmitSegment segment;
        segment.data = region.buffer.data() + region.offset;
        segment.length = region.length;
        segment.end_of_packet = region.end_of_packet;
        plan.addSegment(segment);
    }

    void operator()(const FileRegion& region) const {
        if (region.length == 0 && region.offset != 0) {
            return;
        }

        io::FileStream& file = plan.openFile(region.path);
        const uint64_t size = file.length();

        uint64_t length = region.length;
        if (region.offset == 0 && region.length == 0) {
            length = size;
        } else if (exceeds(region.offset, region.length, size)) {
            SGNET_LOG_DEBUG("file region [", region.offset, ", +", region.length, ") exceeds ",
                            region.path, " of size ", size);
            plan.markOutOfRange();
            return;
        }

        if (length == 0) {
            return;
        }

        net::TransmitSegment segment;
        segment.file_fd = file.nativeHandle();
        segment.offset = region.offset;
        segment.length = length;
        segment.end_of_packet = region.end_of_packet;
        plan.addSegment(segment);
    }

    void operator()(const StreamRegion& region) const {
        if (region.stream == nullptr) {
            throw ArgumentNullError("stream");
        }
        if (!region.stream->isOpen()) {
            throw ObjectDisposedError("FileStream");
        }
        if (region.length == 0 && region.offset != 0) {
            return;
        }

        const uint64_t size = region.stream->length();
        uint64_t offset = region.offset;
        uint64_t length = region.length;

        if (region.isWholeStream()) {
            const uint64_t position = region.stream->position();
            offset = position < size ? position : size;
            length = size - offset;
            if (length != 0) {
                plan.stream_advances_.push_back({region.stream, offset + length});
            }
        } else if (exceeds(region.offset, region.length, size)) {
            SGNET_LOG_DEBUG("stream region [", region.offset, ", +", region.length, ") exceeds ",
                            region.stream->path(), " of size ", size);
            plan.markOutOfRange();
            return;
        }

        if (length == 0) {
            return;
        }

        net::TransmitSegment segment;
        segment.file_fd = region.stream->nativeHandle();
        segment.offset = offset;
        segment.length = length;
        segment.end_of_packet = region.end_of_packet;
        plan.addSegment(segment);
    }
};

TransmitPlan TransmitPlan::build(const std::vector<SendDescriptor>& descriptors) {
    TransmitPlan plan;
    plan.segments_.reserve(descriptors.size());

    const DescriptorStager stager{plan};
    for (const SendDescriptor& descriptor : descriptors) {
        std::visit(stager, descriptor);
    }

    if (plan.status_ != net::SocketError::Success) {
        plan.segments_.clear();
        plan.stream_advances_.clear();
        plan.total_bytes_ = 0;
    }
    return plan;
}

TransmitPlan::TransmitPlan(TransmitPlan&&) noexcept = default;
TransmitPlan& TransmitPlan::operator=(TransmitPlan&&) noexcept = default;
TransmitPlan::~TransmitPlan() = default;

net::SocketError TransmitPlan::status() const noexcept {
    return status_;
}

const std::vector<net::TransmitSegment>& TransmitPlan::segments() const noexcept {
    return segments_;
}

uint64_t TransmitPlan::totalBytes() const noexcept {
    return total_bytes_;
}

bool TransmitPlan::empty() const noexcept {
    return segments_.empty();
}

void TransmitPlan::commitStreamPositions() const {
    for (const StreamAdvance& advance : stream_advances_) {
        if (advance.stream->isOpen()) {
            advance.stream->seek(advance.end_position);
        }
    }
}

io::FileStream& TransmitPlan::openFile(const std::string& path) {
    const auto it = opened_files_.find(path);
    if (it != opened_files_.end()) {
        return *it->second;
    }

    auto file = std::make_unique<io::FileStream>(io::FileStream::open(path));
    io::FileStream& ref = *file;
    opened_files_.emplace(path, std::move(file));
    return ref;
}

void TransmitPlan::addSegment(const net::TransmitSegment& segment) {
    segments_.push_back(segment);
    total_bytes_ += segment.length;
}

void TransmitPlan::markOutOfRange() noexcept {
    status_ = net::SocketError::InvalidArgument;
}

}  // namespace sgnet::send
