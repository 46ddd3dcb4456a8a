#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <snipbox/temporary_directory.hh>
#include <string>
#include <string_view>
#include <vector>

namespace snipbox {

// How concurrent executions for the same language are kept apart
enum class WorkspaceMode : uint8_t {
    Serialize, // one execution at a time in the shared workspace
    Isolate, // every execution in its own copy of the workspace
};

const char* to_string(WorkspaceMode mode) noexcept;

std::optional<WorkspaceMode> workspace_mode_from_string(std::string_view str) noexcept;

// Directory in which a single execution happens
class Workspace {
    std::filesystem::path root_;
    std::unique_lock<std::mutex> lock_; // held while the shared workspace is in use
    std::optional<TemporaryDirectory> copy_;

    Workspace(
        std::filesystem::path root,
        std::unique_lock<std::mutex> lock,
        std::optional<TemporaryDirectory> copy
    ) noexcept
    : root_{std::move(root)}
    , lock_{std::move(lock)}
    , copy_{std::move(copy)} {}

public:
    Workspace(const Workspace&) = delete;
    Workspace(Workspace&&) noexcept = default;
    Workspace& operator=(const Workspace&) = delete;
    Workspace& operator=(Workspace&&) noexcept = default;
    ~Workspace() = default;

    // Uses @p root directly; blocks until @p lock is acquired and holds it until destruction
    static Workspace shared(std::filesystem::path root, std::mutex& lock);

    // Copies the skeleton at @p skeleton into a new temporary directory that is removed on
    // destruction. Top-level entries named in @p linked_entries are symlinked instead of
    // copied. Throws on error.
    static Workspace
    isolated(const std::filesystem::path& skeleton, const std::vector<std::string>& linked_entries);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    // Truncates or creates @p relative_path inside the workspace and writes @p contents to it.
    // Missing parent directories are not created. Throws on error.
    void write_file(const std::filesystem::path& relative_path, std::string_view contents) const;
};

} // namespace snipbox
