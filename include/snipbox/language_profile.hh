#pragma once

#include <filesystem>
#include <optional>
#include <snipbox/workspace.hh>
#include <string>
#include <vector>

namespace snipbox {

// Everything that differs between the supported languages
struct LanguageProfile {
    std::string name; // used in logs
    std::string route; // HTTP path accepting the submissions
    // Directory with the pre-built project skeleton
    std::filesystem::path workspace_root;
    // File overwritten with the submitted code, relative to workspace_root
    std::filesystem::path source_file;
    // Command building and running the project, executed in the workspace; command[0] is looked
    // up in PATH
    std::vector<std::string> command;
    // Failure is a compile failure if stderr contains any of these
    std::vector<std::string> compile_error_markers;
    // Command checking that the toolchain is available
    std::vector<std::string> version_command;
    // Overrides the configured workspace mode, for workspaces too large to copy per request
    std::optional<WorkspaceMode> workspace_mode;
    // Skeleton entries symlinked instead of copied into an isolated workspace; they have to be
    // left untouched by the command
    std::vector<std::string> linked_entries;
};

LanguageProfile rust_profile(std::filesystem::path workspace_root);

LanguageProfile typescript_profile(std::filesystem::path workspace_root);

} // namespace snipbox
