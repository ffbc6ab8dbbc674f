#include "sgnet/io/FileStream.hpp"
#include "sgnet/Errors.hpp"

#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <limits>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace sgnet::io {

namespace {

// Tells a missing file apart from a missing directory on the way to it.
[[noreturn]] void throwNotFound(const std::string& path) {
    const std::filesystem::path fs_path(path);
    const std::filesystem::path parent = fs_path.parent_path();
    std::error_code ec;
    if (!parent.empty() && !std::filesystem::is_directory(parent, ec)) {
        throw DirectoryNotFoundError(path);
    }
    throw FileNotFoundError(path);
}

}  // namespace

FileStream FileStream::open(const std::string& path) {
    if (path.empty()) {
        throw ArgumentError("path", "path must not be empty");
    }
    if (path.find('\0') != std::string::npos) {
        throw ArgumentError("path", "path contains a NUL character");
    }

    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int error_code = errno;
        if (error_code == ENOENT) {
            throwNotFound(path);
        }
        if (error_code == ENOTDIR) {
            throw DirectoryNotFoundError(path);
        }
        throw std::system_error(error_code, std::generic_category(), "open(" + path + ")");
    }

    // O_RDONLY opens directories too; sendfile would reject them much later.
    struct stat st {};
    if (::fstat(fd, &st) != 0) {
        const int error_code = errno;
        ::close(fd);
        throw std::system_error(error_code, std::generic_category(), "fstat(" + path + ")");
    }
    if (S_ISDIR(st.st_mode)) {
        ::close(fd);
        throw ArgumentError("path", "path names a directory: " + path);
    }

    return FileStream(fd, path);
}

FileStream::FileStream(int fd, std::string path) noexcept
    : fd_(fd), path_(std::move(path)) {}

FileStream::FileStream(FileStream&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {}

FileStream& FileStream::operator=(FileStream&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
    }
    return *this;
}

FileStream::~FileStream() {
    close();
}

bool FileStream::isOpen() const noexcept {
    return fd_ >= 0;
}

const std::string& FileStream::path() const noexcept {
    return path_;
}

uint64_t FileStream::position() const {
    throwIfClosed();
    const off_t current = ::lseek(fd_, 0, SEEK_CUR);
    if (current < 0) {
        throw std::system_error(errno, std::generic_category(), "lseek(SEEK_CUR)");
    }
    return static_cast<uint64_t>(current);
}

void FileStream::seek(uint64_t position) {
    throwIfClosed();
    if (position > static_cast<uint64_t>(std::numeric_limits<off_t>::max())) {
        throw ArgumentOutOfRangeError("position", "position exceeds the largest file offset");
    }
    if (::lseek(fd_, static_cast<off_t>(position), SEEK_SET) < 0) {
        throw std::system_error(errno, std::generic_category(), "lseek(SEEK_SET)");
    }
}

uint64_t FileStream::length() const {
    throwIfClosed();
    struct stat st {};
    if (::fstat(fd_, &st) != 0) {
        throw std::system_error(errno, std::generic_category(), "fstat");
    }
    return static_cast<uint64_t>(st.st_size);
}

int FileStream::nativeHandle() const noexcept {
    return fd_;
}

void FileStream::close() noexcept {
    if (fd_ < 0) {
        return;
    }
    ::close(fd_);
    fd_ = -1;
}

void FileStream::throwIfClosed() const {
    if (fd_ < 0) {
        throw ObjectDisposedError("FileStream");
    }
}

}  // namespace sgnet::io
