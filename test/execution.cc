#include <filesystem>
#include <fstream>
#include <future>
#include <gtest/gtest.h>
#include <iterator>
#include <snipbox/execution.hh>
#include <snipbox/temporary_directory.hh>
#include <string>
#include <variant>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using snipbox::ExecutionError;
using snipbox::ExecutionOutcome;
using snipbox::ExecutionResult;
using snipbox::Executor;
using snipbox::LanguageProfile;
using snipbox::WorkspaceMode;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream file{path, std::ios::binary};
    return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

// Workspace whose "toolchain" runs the submitted code as a shell script
struct ShellWorkspace {
    TemporaryDirectory dir{(fs::temp_directory_path() / "snipbox-test-XXXXXX").native()};
    LanguageProfile profile;

    ShellWorkspace() {
        fs::create_directory(dir.path() / "src");
        std::ofstream{dir.path() / "src/main.sh"} << "echo skeleton\n";
        profile = {
            .name = "shell",
            .route = "/shell",
            .workspace_root = dir.path(),
            .source_file = "src/main.sh",
            .command = {"sh", "src/main.sh"},
            .compile_error_markers = {"error[E", "SyntaxError"},
            .version_command = {"sh", "-c", "true"},
            .workspace_mode = std::nullopt,
            .linked_entries = {},
        };
    }
};

Executor::Options executor_options(WorkspaceMode mode) {
    return {
        .endpoints =
            {
                .http_url = "http://validator.test:8899",
                .ws_url = "ws://validator.test:8900",
            },
        .deadline = 10s,
        .workspace_mode = mode,
        .max_output_size = 1 << 20,
    };
}

const ExecutionOutcome& expect_outcome(const ExecutionResult& result) {
    if (const auto* error = std::get_if<ExecutionError>(&result)) {
        throw std::runtime_error{"unexpected error (" + std::string{to_string(error->kind)} +
                                 "): " + error->message};
    }
    return std::get<ExecutionOutcome>(result);
}

const ExecutionError& expect_error(const ExecutionResult& result) {
    if (std::holds_alternative<ExecutionOutcome>(result)) {
        throw std::runtime_error{
            "unexpected success, stdout: " + std::get<ExecutionOutcome>(result).stdout_data
        };
    }
    return std::get<ExecutionError>(result);
}

class execution : public ::testing::TestWithParam<WorkspaceMode> {
protected:
    ShellWorkspace workspace;
    Executor executor{executor_options(GetParam())};
};

} // namespace

// NOLINTNEXTLINE
TEST_P(execution, success) {
    auto result = executor.execute(workspace.profile, "echo hello; echo warn >&2");
    const auto& outcome = expect_outcome(result);
    ASSERT_TRUE(outcome.success);
    ASSERT_EQ(outcome.stdout_data, "hello\n");
    ASSERT_EQ(outcome.stderr_data, "warn\n");
    ASSERT_EQ(outcome.exit_code, 0);
}

// NOLINTNEXTLINE
TEST_P(execution, compile_failure) {
    constexpr auto script = "echo 'error[E0425]: cannot find value `x`' >&2; exit 101";
    ASSERT_EQ(
        expect_error(executor.execute(workspace.profile, script)),
        (ExecutionError{
            .kind = ExecutionError::Kind::CompileFailure,
            .message = "error[E0425]: cannot find value `x`\n",
        })
    );
}

// NOLINTNEXTLINE
TEST_P(execution, runtime_failure) {
    constexpr auto script = "echo partial output; echo \"thread 'main' panicked\" >&2; exit 101";
    ASSERT_EQ(
        expect_error(executor.execute(workspace.profile, script)),
        (ExecutionError{
            .kind = ExecutionError::Kind::RuntimeFailure,
            .message = "thread 'main' panicked\n",
        })
    );
}

// NOLINTNEXTLINE
TEST_P(execution, failure_without_stderr_is_described) {
    ASSERT_EQ(
        expect_error(executor.execute(workspace.profile, "exit 3")),
        (ExecutionError{
            .kind = ExecutionError::Kind::RuntimeFailure,
            .message = "Program exited with 3",
        })
    );
    ASSERT_EQ(
        expect_error(executor.execute(workspace.profile, "kill -KILL $$")),
        (ExecutionError{
            .kind = ExecutionError::Kind::RuntimeFailure,
            .message = "Program killed by signal SIGKILL - Killed",
        })
    );
}

// NOLINTNEXTLINE
TEST_P(execution, timeout) {
    auto options = executor_options(GetParam());
    options.deadline = 1s;
    Executor short_executor{options};
    auto start = std::chrono::steady_clock::now();
    auto result = short_executor.execute(workspace.profile, "echo tick; sleep 30");
    ASSERT_LT(std::chrono::steady_clock::now() - start, 10s);
    ASSERT_EQ(
        expect_error(result),
        (ExecutionError{
            .kind = ExecutionError::Kind::RuntimeFailure,
            .message = "Execution timed out after 1 seconds. Your code took too long to run.",
        })
    );
}

// NOLINTNEXTLINE
TEST_P(execution, endpoints_are_rewritten) {
    auto result =
        executor.execute(workspace.profile, "echo http://127.0.0.1:8899; echo ws://localhost:8900");
    ASSERT_EQ(
        expect_outcome(result).stdout_data,
        "http://validator.test:8899\nws://validator.test:8900\n"
    );
}

// NOLINTNEXTLINE
TEST_P(execution, invalid_utf8_output_is_replaced) {
    auto result = executor.execute(workspace.profile, "printf '\\377ok'");
    ASSERT_EQ(expect_outcome(result).stdout_data, "\xEF\xBF\xBDok");
}

// NOLINTNEXTLINE
TEST_P(execution, missing_workspace_is_io_failure) {
    auto profile = workspace.profile;
    profile.workspace_root = "/nonexistent/snipbox/workspace";
    ASSERT_EQ(
        expect_error(executor.execute(profile, "echo hello")).kind,
        ExecutionError::Kind::IoFailure
    );
}

// NOLINTNEXTLINE
TEST_P(execution, missing_toolchain_is_io_failure) {
    auto profile = workspace.profile;
    profile.command = {"snipbox-no-such-toolchain", "run"};
    auto result = executor.execute(profile, "echo hello");
    const auto& error = expect_error(result);
    ASSERT_EQ(error.kind, ExecutionError::Kind::IoFailure);
    ASSERT_NE(error.message.find("snipbox-no-such-toolchain"), std::string::npos)
        << error.message;
}

// NOLINTNEXTLINE
TEST_P(execution, concurrent_executions_do_not_mix) {
    std::vector<std::future<ExecutionResult>> results;
    for (int i = 0; i < 6; ++i) {
        results.emplace_back(std::async(std::launch::async, [this, i] {
            return executor.execute(
                workspace.profile, "sleep 0.1\necho request " + std::to_string(i) + "\n"
            );
        }));
    }
    for (int i = 0; i < 6; ++i) {
        auto result = results[i].get();
        ASSERT_EQ(expect_outcome(result).stdout_data, "request " + std::to_string(i) + "\n");
    }
}

// NOLINTNEXTLINE
INSTANTIATE_TEST_SUITE_P(
    workspace_modes,
    execution,
    ::testing::Values(WorkspaceMode::Serialize, WorkspaceMode::Isolate),
    [](const ::testing::TestParamInfo<WorkspaceMode>& info) {
        return std::string{to_string(info.param)};
    }
);

// NOLINTNEXTLINE
TEST(execution_serialize, source_file_is_left_in_the_workspace) {
    ShellWorkspace workspace;
    Executor executor{executor_options(WorkspaceMode::Serialize)};
    (void)expect_outcome(executor.execute(workspace.profile, "echo http://127.0.0.1:8899"));
    ASSERT_EQ(
        read_file(workspace.dir.path() / "src/main.sh"), "echo http://validator.test:8899"
    );
}

// NOLINTNEXTLINE
TEST(execution_isolate, skeleton_is_left_untouched) {
    ShellWorkspace workspace;
    Executor executor{executor_options(WorkspaceMode::Isolate)};
    (void)expect_outcome(executor.execute(workspace.profile, "echo changed"));
    ASSERT_EQ(read_file(workspace.dir.path() / "src/main.sh"), "echo skeleton\n");
}

// NOLINTNEXTLINE
TEST(execution_isolate, profile_can_require_the_shared_workspace) {
    ShellWorkspace workspace;
    workspace.profile.workspace_mode = WorkspaceMode::Serialize;
    Executor executor{executor_options(WorkspaceMode::Isolate)};
    auto result = executor.execute(workspace.profile, "pwd");
    ASSERT_EQ(expect_outcome(result).stdout_data, workspace.dir.path().native() + "\n");
    ASSERT_EQ(read_file(workspace.dir.path() / "src/main.sh"), "pwd");
}
