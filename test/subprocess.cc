#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <optional>
#include <snipbox/subprocess.hh>
#include <snipbox/temporary_directory.hh>
#include <stdexcept>
#include <string>
#include <sys/wait.h>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using snipbox::subprocess::Options;
using snipbox::subprocess::run;

namespace {

Options shell(std::string script) {
    return {
        .executable = "/bin/sh",
        .args = {"sh", "-c", std::move(script)},
        .working_dir = {},
        .deadline = 10s,
        .max_output_size = 1 << 20,
    };
}

TemporaryDirectory make_tmp_dir() {
    return TemporaryDirectory{(fs::temp_directory_path() / "snipbox-test-XXXXXX").native()};
}

std::optional<pid_t> read_pid(const fs::path& path) {
    std::ifstream file{path};
    pid_t pid = 0;
    if (file >> pid) {
        return pid;
    }
    return std::nullopt;
}

// A zombie counts as dead
bool process_is_alive(pid_t pid) {
    std::ifstream stat{"/proc/" + std::to_string(pid) + "/stat"};
    std::string contents{std::istreambuf_iterator<char>{stat}, std::istreambuf_iterator<char>{}};
    auto pos = contents.rfind(')');
    if (pos == std::string::npos or pos + 2 >= contents.size()) {
        return false;
    }
    char state = contents[pos + 2];
    return state != 'Z' and state != 'X';
}

bool dies_within(pid_t pid, std::chrono::milliseconds limit) {
    auto until = std::chrono::steady_clock::now() + limit;
    while (process_is_alive(pid)) {
        if (std::chrono::steady_clock::now() > until) {
            return false;
        }
        std::this_thread::sleep_for(10ms);
    }
    return true;
}

} // namespace

// NOLINTNEXTLINE
TEST(subprocess, captures_stdout_and_stderr_separately) {
    auto res = run(shell("echo out; echo err >&2; printf 'more out'"));
    ASSERT_TRUE(res.exited_successfully()) << res.si_description();
    ASSERT_EQ(res.exit_code(), 0);
    ASSERT_EQ(res.stdout_data, "out\nmore out");
    ASSERT_EQ(res.stderr_data, "err\n");
    ASSERT_FALSE(res.timed_out);
    ASSERT_FALSE(res.stdout_truncated);
    ASSERT_FALSE(res.stderr_truncated);
    ASSERT_GT(res.runtime, 0ns);
}

// NOLINTNEXTLINE
TEST(subprocess, exit_status) {
    auto res = run(shell("echo failing >&2; exit 42"));
    ASSERT_FALSE(res.exited_successfully());
    ASSERT_EQ(res.si.code, CLD_EXITED);
    ASSERT_EQ(res.si.status, 42);
    ASSERT_EQ(res.exit_code(), 42);
    ASSERT_EQ(res.si_description(), "exited with 42");
    ASSERT_EQ(res.stderr_data, "failing\n");
}

// NOLINTNEXTLINE
TEST(subprocess, killed_by_signal) {
    auto res = run(shell("kill -KILL $$"));
    ASSERT_FALSE(res.exited_successfully());
    ASSERT_EQ(res.si.code, CLD_KILLED);
    ASSERT_EQ(res.si.status, SIGKILL);
    ASSERT_EQ(res.exit_code(), 128 + SIGKILL);
    ASSERT_EQ(res.si_description(), "killed by signal SIGKILL - Killed");
    ASSERT_FALSE(res.timed_out);
}

// NOLINTNEXTLINE
TEST(subprocess, args_default_to_the_executable) {
    auto res = run({.executable = "true"});
    ASSERT_TRUE(res.exited_successfully()) << res.si_description();
}

// NOLINTNEXTLINE
TEST(subprocess, stdin_is_empty) {
    auto res = run({.executable = "cat", .args = {"cat"}, .deadline = 10s});
    ASSERT_TRUE(res.exited_successfully()) << res.si_description();
    ASSERT_EQ(res.stdout_data, "");
}

// NOLINTNEXTLINE
TEST(subprocess, working_dir) {
    auto dir = make_tmp_dir();
    auto options = shell("pwd");
    options.working_dir = dir.path().native();
    auto res = run(options);
    ASSERT_TRUE(res.exited_successfully()) << res.si_description();
    ASSERT_EQ(res.stdout_data, dir.path().native() + "\n");
}

// NOLINTNEXTLINE
TEST(subprocess, missing_working_dir_throws) {
    auto options = shell("true");
    options.working_dir = "/nonexistent/snipbox/dir";
    ASSERT_THROW(run(options), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(subprocess, executable_not_in_path_throws) {
    ASSERT_THROW(run({.executable = "snipbox-no-such-program"}), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(subprocess, execve_failure_is_reported) {
    try {
        run({.executable = "/nonexistent/snipbox/program"});
        FAIL() << "expected an exception";
    } catch (const std::runtime_error& e) {
        std::string_view msg = e.what();
        ASSERT_NE(msg.find("execve(/nonexistent/snipbox/program)"), std::string_view::npos)
            << msg;
        ASSERT_NE(msg.find("ENOENT"), std::string_view::npos) << msg;
    }
}

// NOLINTNEXTLINE
TEST(subprocess, find_executable) {
    auto sh = snipbox::subprocess::find_executable("sh");
    ASSERT_TRUE(sh.ends_with("/sh")) << sh;
    ASSERT_EQ(snipbox::subprocess::find_executable("./relative/prog"), "./relative/prog");
    ASSERT_THROW(snipbox::subprocess::find_executable(""), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(subprocess, output_above_the_limit_is_discarded) {
    auto options = shell("head -c 100000 /dev/zero; echo done >&2");
    options.max_output_size = 1000;
    auto res = run(options);
    // The process is not blocked by the discarded output
    ASSERT_TRUE(res.exited_successfully()) << res.si_description();
    ASSERT_EQ(res.stdout_data.size(), 1000U);
    ASSERT_TRUE(res.stdout_truncated);
    ASSERT_EQ(res.stderr_data, "done\n");
    ASSERT_FALSE(res.stderr_truncated);
}

// NOLINTNEXTLINE
TEST(subprocess, large_output) {
    auto res = run(shell("head -c 500000 /dev/zero"));
    ASSERT_TRUE(res.exited_successfully()) << res.si_description();
    ASSERT_EQ(res.stdout_data, std::string(500000, '\0'));
}

// NOLINTNEXTLINE
TEST(subprocess, deadline_kills_the_process) {
    auto dir = make_tmp_dir();
    auto pid_file = dir.path() / "pid";
    auto options = shell("echo started; echo $$ > " + pid_file.native() + "; exec sleep 60");
    options.deadline = 300ms;
    auto start = std::chrono::steady_clock::now();
    auto res = run(options);
    ASSERT_LT(std::chrono::steady_clock::now() - start, 10s);
    ASSERT_TRUE(res.timed_out);
    ASSERT_FALSE(res.exited_successfully());
    ASSERT_EQ(res.si.code, CLD_KILLED);
    ASSERT_EQ(res.si.status, SIGKILL);
    ASSERT_GE(res.runtime, 300ms);
    ASSERT_EQ(res.stdout_data, "started\n");

    auto pid = read_pid(pid_file);
    ASSERT_TRUE(pid.has_value());
    ASSERT_TRUE(dies_within(*pid, 5s));
}

// NOLINTNEXTLINE
TEST(subprocess, deadline_kills_descendants) {
    auto dir = make_tmp_dir();
    auto pid_file = dir.path() / "pid";
    auto options = shell("sleep 60 & echo $! > " + pid_file.native() + "; wait");
    options.deadline = 300ms;
    auto res = run(options);
    ASSERT_TRUE(res.timed_out);

    auto pid = read_pid(pid_file);
    ASSERT_TRUE(pid.has_value());
    ASSERT_TRUE(dies_within(*pid, 5s));
}

// NOLINTNEXTLINE
TEST(subprocess, background_descendants_do_not_outlive_the_process) {
    auto dir = make_tmp_dir();
    auto pid_file = dir.path() / "pid";
    // The background sleep keeps stdout open, it has to be killed for run() to return
    auto options = shell("sleep 60 & echo $! > " + pid_file.native() + "; echo bye");
    auto start = std::chrono::steady_clock::now();
    auto res = run(options);
    ASSERT_LT(std::chrono::steady_clock::now() - start, 5s);
    ASSERT_FALSE(res.timed_out);
    ASSERT_TRUE(res.exited_successfully()) << res.si_description();
    ASSERT_EQ(res.stdout_data, "bye\n");

    auto pid = read_pid(pid_file);
    ASSERT_TRUE(pid.has_value());
    ASSERT_TRUE(dies_within(*pid, 5s));
}
