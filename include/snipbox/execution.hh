#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <snipbox/language_profile.hh>
#include <snipbox/url_rewriter.hh>
#include <snipbox/workspace.hh>
#include <string>
#include <string_view>
#include <variant>

namespace snipbox {

struct ExecutionOutcome {
    bool success;
    std::string stdout_data;
    std::string stderr_data;
    int exit_code; // exit status or 128 + signal number
    std::chrono::nanoseconds runtime;
};

struct ExecutionError {
    enum class Kind : uint8_t {
        IoFailure, // the workspace or the toolchain could not be used
        CompileFailure, // stderr looks like compiler diagnostics
        RuntimeFailure, // the program failed or exceeded the deadline
    } kind;

    std::string message;

    friend bool operator==(const ExecutionError&, const ExecutionError&) = default;
};

using ExecutionResult = std::variant<ExecutionOutcome, ExecutionError>;

const char* to_string(ExecutionError::Kind kind) noexcept;

// Message of the RuntimeFailure reported when the program exceeds the deadline
std::string timeout_message(std::chrono::seconds deadline);

// Runs submitted code in language workspaces
class Executor {
public:
    struct Options {
        Endpoints endpoints;
        std::chrono::seconds deadline{30};
        WorkspaceMode workspace_mode = WorkspaceMode::Serialize;
        size_t max_output_size = 8 << 20;
    };

    explicit Executor(Options options)
    : options_{std::move(options)} {}

    Executor(const Executor&) = delete;
    Executor(Executor&&) = delete;
    Executor& operator=(const Executor&) = delete;
    Executor& operator=(Executor&&) = delete;
    ~Executor() = default;

    // Writes @p source (with endpoints rewritten) into the profile's workspace, runs the
    // profile's command and classifies its result. Safe to call concurrently, also for the
    // same profile.
    ExecutionResult execute(const LanguageProfile& profile, std::string_view source);

    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    Workspace acquire_workspace(const LanguageProfile& profile);

    Options options_;
    std::mutex workspace_locks_mutex_;
    std::map<std::string, std::mutex> workspace_locks_; // profile name -> lock
};

} // namespace snipbox
