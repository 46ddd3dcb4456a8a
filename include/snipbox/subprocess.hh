#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace snipbox::subprocess {

struct Options {
    // Path to the program to run; if it contains no '/', it is looked up in PATH
    std::string executable;
    // Program args (same as for execve()); if empty, {executable} is used
    std::vector<std::string> args;
    // Working directory of the program; if empty, the current one is inherited
    std::string working_dir;
    // Wall-clock limit measured from the program start; on expiry the program and every
    // process in its process group is killed
    std::chrono::nanoseconds deadline = std::chrono::seconds{30};
    // Maximum number of bytes captured from each of stdout and stderr, the rest is discarded
    size_t max_output_size = 8 << 20;
};

struct Result {
    struct {
        int code; // siginfo_t::si_code from waitid() of the process
        int status; // siginfo_t::si_status from waitid() of the process
    } si{};

    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    // Whether the process was killed because of the deadline
    bool timed_out = false;
    // Real time from the start until the process was waited
    std::chrono::nanoseconds runtime{0};

    [[nodiscard]] bool exited_successfully() const noexcept;

    // Exit code in a shell-like manner: exit status or 128 + signal number
    [[nodiscard]] int exit_code() const noexcept;

    // Returns textual description of si field
    [[nodiscard]] std::string si_description() const;
};

// Runs the program with stdin connected to /dev/null, captures its stdout and stderr
// separately and waits for it. The program is placed in a new process group which is killed
// once the program exits or the deadline expires, so no descendant outlives this call.
// Throws an instance of std::runtime_error on error (e.g. the program cannot be executed).
Result run(const Options& options);

// Returns path of @p name in PATH or @p name itself if it contains '/'; throws if not found
std::string find_executable(const std::string& name);

} // namespace snipbox::subprocess
