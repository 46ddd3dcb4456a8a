#pragma once

#include <optional>
#include <snipbox/file_descriptor.hh>

struct Pipe {
    FileDescriptor readable;
    FileDescriptor writable;
};

// Returns std::nullopt on error (errno is set)
inline std::optional<Pipe> pipe2(int flags) noexcept {
    int fds[2];
    if (::pipe2(fds, flags)) {
        return std::nullopt;
    }
    return Pipe{
        .readable = FileDescriptor{fds[0]},
        .writable = FileDescriptor{fds[1]},
    };
}
