#pragma once

#include <cstdint>
#include <string>

namespace sgnet::io {

// Read-only file stream over a POSIX descriptor.
//
// Owned by the caller. Scatter-gather sends read it with sendfile at explicit
// offsets, so its position only moves through seek() or when a whole-stream
// region completes.
class FileStream {
public:
    // Opens `path` read-only.
    // Throws ArgumentError for an empty path, DirectoryNotFoundError when the
    // parent directory is missing, FileNotFoundError when the file is missing,
    // std::system_error for any other open(2) failure.
    static FileStream open(const std::string& path);

    FileStream(const FileStream&) = delete;
    FileStream& operator=(const FileStream&) = delete;
    FileStream(FileStream&& other) noexcept;
    FileStream& operator=(FileStream&& other) noexcept;
    ~FileStream();

    bool isOpen() const noexcept;
    const std::string& path() const noexcept;

    // Current read position. Throws ObjectDisposedError once closed.
    uint64_t position() const;
    void seek(uint64_t position);

    // Size of the underlying file right now.
    uint64_t length() const;

    int nativeHandle() const noexcept;

    void close() noexcept;

private:
    FileStream(int fd, std::string path) noexcept;

    void throwIfClosed() const;

    int fd_ = -1;
    std::string path_;
};

}  // namespace sgnet::io
