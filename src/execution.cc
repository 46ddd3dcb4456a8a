#include <snipbox/classify.hh>
#include <snipbox/concat_tostr.hh>
#include <snipbox/execution.hh>
#include <snipbox/subprocess.hh>
#include <snipbox/utf8.hh>
#include <spdlog/spdlog.h>

namespace snipbox {

const char* to_string(ExecutionError::Kind kind) noexcept {
    switch (kind) {
    case ExecutionError::Kind::IoFailure: return "io failure";
    case ExecutionError::Kind::CompileFailure: return "compile failure";
    case ExecutionError::Kind::RuntimeFailure: return "runtime failure";
    }
    return "unknown";
}

std::string timeout_message(std::chrono::seconds deadline) {
    return concat_tostr(
        "Execution timed out after ",
        deadline.count(),
        " seconds. Your code took too long to run."
    );
}

Workspace Executor::acquire_workspace(const LanguageProfile& profile) {
    switch (profile.workspace_mode.value_or(options_.workspace_mode)) {
    case WorkspaceMode::Serialize: {
        std::mutex* lock = nullptr;
        {
            std::lock_guard guard{workspace_locks_mutex_};
            lock = &workspace_locks_[profile.name];
        }
        return Workspace::shared(profile.workspace_root, *lock);
    }
    case WorkspaceMode::Isolate:
        return Workspace::isolated(profile.workspace_root, profile.linked_entries);
    }
    __builtin_unreachable();
}

ExecutionResult Executor::execute(const LanguageProfile& profile, std::string_view source) {
    auto code = rewrite_endpoints(source, options_.endpoints);

    subprocess::Result res;
    try {
        auto workspace = acquire_workspace(profile);
        workspace.write_file(profile.source_file, code);
        res = subprocess::run({
            .executable = profile.command.at(0),
            .args = profile.command,
            .working_dir = workspace.root().native(),
            .deadline = options_.deadline,
            .max_output_size = options_.max_output_size,
        });
    } catch (const std::exception& e) {
        spdlog::error("{}: execution failed: {}", profile.name, e.what());
        return ExecutionError{.kind = ExecutionError::Kind::IoFailure, .message = e.what()};
    }

    if (res.timed_out) {
        spdlog::info("{}: killed after exceeding the deadline", profile.name);
        return ExecutionError{
            .kind = ExecutionError::Kind::RuntimeFailure,
            .message = timeout_message(options_.deadline),
        };
    }

    if (res.stdout_truncated or res.stderr_truncated) {
        spdlog::info(
            "{}: output truncated to {} bytes per stream", profile.name, options_.max_output_size
        );
    }

    if (res.exited_successfully()) {
        return ExecutionOutcome{
            .success = true,
            .stdout_data = to_valid_utf8(res.stdout_data),
            .stderr_data = to_valid_utf8(res.stderr_data),
            .exit_code = res.exit_code(),
            .runtime = res.runtime,
        };
    }

    auto stderr_text = to_valid_utf8(res.stderr_data);
    // A program killed by a signal may leave nothing on stderr
    if (stderr_text.find_first_not_of(" \t\r\n") == std::string::npos) {
        stderr_text = concat_tostr("Program ", res.si_description());
    }
    return classify_failure(profile, std::move(stderr_text));
}

} // namespace snipbox
