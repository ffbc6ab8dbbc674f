#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <variant>

namespace sgnet::io {
class FileStream;
}

namespace sgnet::send {

// Nothing is checked at construction. Bounds, paths and streams are validated
// when the descriptor list is staged for a send.

// Null element. Contributes nothing.
struct EmptyRegion {};

// Caller-owned bytes; must outlive the send that references them.
// Zero length is elided.
struct MemoryRegion {
    MemoryRegion() = default;
    explicit MemoryRegion(std::span<const std::byte> whole_buffer, bool eop = false) noexcept
        : buffer(whole_buffer), offset(0), length(whole_buffer.size()), end_of_packet(eop) {}
    MemoryRegion(std::span<const std::byte> buffer_in, size_t offset_in, size_t length_in, bool eop = false) noexcept
        : buffer(buffer_in), offset(offset_in), length(length_in), end_of_packet(eop) {}

    std::span<const std::byte> buffer;
    size_t offset = 0;
    size_t length = 0;
    bool end_of_packet = false;
};

// Region of a file named by path, opened for the duration of the send.
// offset 0 / length 0 is the whole file; length 0 with offset != 0 is elided.
struct FileRegion {
    FileRegion() = default;
    explicit FileRegion(std::string path_in, bool eop = false)
        : path(std::move(path_in)), end_of_packet(eop) {}
    FileRegion(std::string path_in, uint64_t offset_in, uint64_t length_in, bool eop = false)
        : path(std::move(path_in)), offset(offset_in), length(length_in), end_of_packet(eop) {}

    std::string path;
    uint64_t offset = 0;
    uint64_t length = 0;
    bool end_of_packet = false;
};

// Region of a caller-owned open stream. Explicit regions use absolute offsets.
// offset 0 / length 0 is the rest of the stream from its current position;
// length 0 with offset != 0 is elided.
struct StreamRegion {
    StreamRegion() = default;
    explicit StreamRegion(io::FileStream* stream_in, bool eop = false) noexcept
        : stream(stream_in), end_of_packet(eop) {}
    StreamRegion(io::FileStream* stream_in, uint64_t offset_in, uint64_t length_in, bool eop = false) noexcept
        : stream(stream_in), offset(offset_in), length(length_in), end_of_packet(eop) {}

    io::FileStream* stream = nullptr;
    uint64_t offset = 0;
    uint64_t length = 0;
    bool end_of_packet = false;

    bool isWholeStream() const noexcept {
        return offset == 0 && length == 0;
    }
};

using SendDescriptor = std::variant<EmptyRegion, MemoryRegion, FileRegion, StreamRegion>;

// Convenience for text and byte containers.
inline MemoryRegion memoryRegion(const void* data, size_t size, bool eop = false) noexcept {
    return MemoryRegion(std::span<const std::byte>(static_cast<const std::byte*>(data), size), eop);
}

}  // namespace sgnet::send
