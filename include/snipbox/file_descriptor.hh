#pragma once

#include <fcntl.h>
#include <string>
#include <string_view>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

// Owning wrapper around a file descriptor, closes it on destruction
class FileDescriptor {
    int fd_;

public:
    explicit FileDescriptor(int fd = -1) noexcept
    : fd_{fd} {}

    FileDescriptor(const std::string& path, int flags, mode_t mode = S_0644) noexcept
    : fd_{::open(path.c_str(), flags, mode)} {}

    FileDescriptor(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept
    : fd_{other.release()} {}

    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        reset(other.release());
        return *this;
    }

    FileDescriptor& operator=(int fd) noexcept {
        reset(fd);
        return *this;
    }

    ~FileDescriptor() {
        if (is_open()) {
            (void)::close(fd_);
        }
    }

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

    // Returns the owned fd and stops owning it
    int release() noexcept { return std::exchange(fd_, -1); }

    void reset(int fd = -1) noexcept {
        if (is_open()) {
            (void)::close(fd_);
        }
        fd_ = fd;
    }

    // Returns 0 on success, -1 on error (errno is set); the fd is released either way
    int close() noexcept {
        if (not is_open()) {
            return 0;
        }
        return ::close(release());
    }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const noexcept { return fd_; }

    static constexpr mode_t S_0644 = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
};

// Writes whole buffer, returns number of bytes written (less than len only on error)
size_t write_all(int fd, const void* buf, size_t len) noexcept;

inline size_t write_all(int fd, std::string_view str) noexcept {
    return write_all(fd, str.data(), str.size());
}
