#include <algorithm>
#include <fcntl.h>
#include <snipbox/errmsg.hh>
#include <snipbox/file_descriptor.hh>
#include <snipbox/macros/throw.hh>
#include <snipbox/workspace.hh>
#include <system_error>

namespace fs = std::filesystem;

namespace snipbox {

const char* to_string(WorkspaceMode mode) noexcept {
    switch (mode) {
    case WorkspaceMode::Serialize: return "serialize";
    case WorkspaceMode::Isolate: return "isolate";
    }
    return "unknown";
}

std::optional<WorkspaceMode> workspace_mode_from_string(std::string_view str) noexcept {
    if (str == "serialize") {
        return WorkspaceMode::Serialize;
    }
    if (str == "isolate") {
        return WorkspaceMode::Isolate;
    }
    return std::nullopt;
}

Workspace Workspace::shared(fs::path root, std::mutex& lock) {
    return Workspace{std::move(root), std::unique_lock{lock}, std::nullopt};
}

Workspace
Workspace::isolated(const fs::path& skeleton, const std::vector<std::string>& linked_entries) {
    std::error_code ec;
    auto abs_skeleton = fs::absolute(skeleton, ec);
    if (ec) {
        THROW("absolute(", skeleton, "): ", ec.message());
    }
    auto tmp_dir = fs::temp_directory_path(ec);
    if (ec) {
        THROW("temp_directory_path(): ", ec.message());
    }
    TemporaryDirectory copy{(tmp_dir / "snipbox-workspace-XXXXXX").native()};

    fs::directory_iterator it{abs_skeleton, ec};
    if (ec) {
        THROW("opening directory ", abs_skeleton, ": ", ec.message());
    }
    for (; it != fs::directory_iterator{}; it.increment(ec)) {
        const auto& src = it->path();
        auto name = src.filename().native();
        bool linked =
            std::find(linked_entries.begin(), linked_entries.end(), name) != linked_entries.end();
        auto dest = copy.path() / name;
        if (linked) {
            fs::create_symlink(src, dest, ec);
            if (ec) {
                THROW("symlink(", src, " -> ", dest, "): ", ec.message());
            }
        } else {
            fs::copy(src, dest, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
            if (ec) {
                THROW("copy(", src, " -> ", dest, "): ", ec.message());
            }
        }
    }
    if (ec) {
        THROW("reading directory ", abs_skeleton, ": ", ec.message());
    }

    auto root = copy.path();
    return Workspace{std::move(root), std::unique_lock<std::mutex>{}, std::move(copy)};
}

void Workspace::write_file(const fs::path& relative_path, std::string_view contents) const {
    auto path = root_ / relative_path;
    FileDescriptor fd{path.native(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC};
    if (not fd.is_open()) {
        THROW("open(", path, ")", errmsg());
    }
    if (write_all(fd, contents) != contents.size()) {
        THROW("write(", path, ")", errmsg());
    }
    if (fd.close()) {
        THROW("close(", path, ")", errmsg());
    }
}

} // namespace snipbox
