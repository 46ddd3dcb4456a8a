#pragma once

#include <filesystem>
#include <string>

// Creates a unique directory with mkdtemp() and removes it recursively on destruction
class TemporaryDirectory {
    std::filesystem::path path_;

public:
    // @p templ has to end with "XXXXXX"; throws on error
    explicit TemporaryDirectory(std::string templ);

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory(TemporaryDirectory&& other) noexcept;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(TemporaryDirectory&& other) noexcept;

    ~TemporaryDirectory();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    void remove() noexcept;
};
