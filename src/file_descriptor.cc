#include <cerrno>
#include <snipbox/file_descriptor.hh>

size_t write_all(int fd, const void* buf, size_t len) noexcept {
    auto* data = static_cast<const char*>(buf);
    size_t pos = 0;
    errno = 0;
    while (pos < len) {
        auto rc = ::write(fd, data + pos, len - pos);
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        pos += static_cast<size_t>(rc);
    }
    return pos;
}
