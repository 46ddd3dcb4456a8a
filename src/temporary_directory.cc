#include <cstdlib>
#include <snipbox/errmsg.hh>
#include <snipbox/macros/throw.hh>
#include <snipbox/temporary_directory.hh>
#include <spdlog/spdlog.h>
#include <system_error>
#include <utility>

TemporaryDirectory::TemporaryDirectory(std::string templ) {
    if (mkdtemp(templ.data()) == nullptr) {
        THROW("mkdtemp(", templ, ")", errmsg());
    }
    path_ = std::move(templ);
}

TemporaryDirectory::TemporaryDirectory(TemporaryDirectory&& other) noexcept
: path_{std::exchange(other.path_, {})} {}

TemporaryDirectory& TemporaryDirectory::operator=(TemporaryDirectory&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::exchange(other.path_, {});
    }
    return *this;
}

TemporaryDirectory::~TemporaryDirectory() { remove(); }

void TemporaryDirectory::remove() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        spdlog::warn("failed to remove temporary directory {}: {}", path_.native(), ec.message());
    }
    path_.clear();
}
