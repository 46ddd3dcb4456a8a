#include <algorithm>
#include <array>
#include <cassert>
#include <cerrno>
#include <climits>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <initializer_list>
#include <linux/close_range.h>
#include <linux/sched.h>
#include <poll.h>
#include <snipbox/concat_tostr.hh>
#include <snipbox/errmsg.hh>
#include <snipbox/file_descriptor.hh>
#include <snipbox/macros/throw.hh>
#include <snipbox/pipe.hh>
#include <snipbox/subprocess.hh>
#include <snipbox/syscalls.hh>
#include <spdlog/spdlog.h>
#include <string_view>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

using std::chrono::steady_clock;
using std::string_view;

namespace {

// The code executed in the child process between clone3() and execve(). The parent may be
// multi-threaded, so only async-signal-safe functions are allowed here.
struct Child {
    const char* executable;
    char* const* argv;
    const char* working_dir; // nullptr means: inherit
    int stdout_fd;
    int stderr_fd;
    int error_fd; // close-on-exec, the parent reads EOF iff execve() succeeded

    // Passes errnum followed by the description to the parent
    [[noreturn]] void die(int errnum, std::initializer_list<string_view> description) noexcept {
        (void)write_all(error_fd, &errnum, sizeof(errnum));
        for (auto part : description) {
            (void)write_all(error_fd, part);
        }
        _exit(127);
    }

    void die_if_err(bool failed, string_view description) noexcept {
        if (failed) {
            die(errno, {description});
        }
    }

    void reset_signals() noexcept {
        sigset_t sigset;
        die_if_err(sigemptyset(&sigset), "sigemptyset()");
        die_if_err(sigprocmask(SIG_SETMASK, &sigset, nullptr), "sigprocmask()");
        // Ignored signals stay ignored after execve()
        struct sigaction sa {};
        sa.sa_handler = SIG_DFL;
        die_if_err(sigaction(SIGPIPE, &sa, nullptr), "sigaction(SIGPIPE)");
    }

    void setup_io() noexcept {
        int dev_null = open("/dev/null", O_RDONLY | O_CLOEXEC);
        die_if_err(dev_null == -1, "open(/dev/null)");
        die_if_err(dup2(dev_null, STDIN_FILENO) == -1, "dup2(stdin)");
        die_if_err(dup2(stdout_fd, STDOUT_FILENO) == -1, "dup2(stdout)");
        die_if_err(dup2(stderr_fd, STDERR_FILENO) == -1, "dup2(stderr)");
        // Other threads of the parent may have opened descriptors without O_CLOEXEC (e.g.
        // client sockets); ENOSYS and EINVAL mean a kernel older than 5.11
        die_if_err(
            close_range(3, ~0U, CLOSE_RANGE_CLOEXEC) and errno != ENOSYS and errno != EINVAL,
            "close_range()"
        );
    }

    [[noreturn]] void execute() noexcept {
        // New process group allows killing the whole process tree at once
        die_if_err(setpgid(0, 0), "setpgid()");
        die_if_err(prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0), "prctl(PR_SET_PDEATHSIG)");
        reset_signals();
        setup_io();
        if (working_dir and chdir(working_dir)) {
            die(errno, {"chdir(", working_dir, ")"});
        }
        execve(executable, argv, environ);
        die(errno, {"execve(", executable, ")"});
    }
};

// The spawned process as seen from the parent.
// State automaton:
//   --> RUNNING ----------> WAITED
//                 wait()
// Destructor of a RUNNING child kills its process group and waits for it.
class ChildProcess {
    pid_t pid_;
    FileDescriptor pidfd_;
    bool waited_ = false;
    siginfo_t si_{};

public:
    ChildProcess(pid_t pid, FileDescriptor pidfd) noexcept
    : pid_{pid}
    , pidfd_{std::move(pidfd)} {}

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess& operator=(ChildProcess&&) = delete;

    ~ChildProcess() {
        if (waited_) {
            return;
        }
        if (kill()) {
            spdlog::error("killing child process {} failed{}", pid_, errmsg());
        }
        if (syscalls::waitid(P_PIDFD, pidfd_, &si_, WEXITED, nullptr)) {
            spdlog::error("waitid() of child process {} failed{}", pid_, errmsg());
        }
    }

    [[nodiscard]] int pidfd() const noexcept { return pidfd_; }

    [[nodiscard]] bool waited() const noexcept { return waited_; }

    // Kills every remaining member of the child's process group; the child itself may be
    // a zombie. Returns -1 on error (errno is set), 0 otherwise.
    int kill_process_group() noexcept {
        if (::kill(-pid_, SIGKILL) and errno != ESRCH) {
            return -1;
        }
        return 0;
    }

    // Kills the child (even if it has not yet become a process group leader) and its process
    // group. Returns -1 on error (errno is set), 0 otherwise.
    int kill() noexcept {
        assert(not waited_);
        if (syscalls::pidfd_send_signal(pidfd_, SIGKILL, nullptr, 0) and errno != ESRCH) {
            return -1;
        }
        return kill_process_group();
    }

    const siginfo_t& wait() {
        assert(not waited_);
        if (syscalls::waitid(P_PIDFD, pidfd_, &si_, WEXITED, nullptr)) {
            THROW("waitid()", errmsg());
        }
        waited_ = true;
        return si_;
    }
};

std::string read_all(int fd) {
    std::string res;
    std::array<char, 4096> buff;
    for (;;) {
        auto len = read(fd, buff.data(), buff.size());
        if (len == 0) {
            return res;
        }
        if (len == -1) {
            if (errno == EINTR) {
                continue;
            }
            THROW("read()", errmsg());
        }
        res.append(buff.data(), static_cast<size_t>(len));
    }
}

} // namespace

namespace snipbox::subprocess {

bool Result::exited_successfully() const noexcept {
    return si.code == CLD_EXITED and si.status == 0;
}

int Result::exit_code() const noexcept {
    switch (si.code) {
    case CLD_EXITED: return si.status;
    case CLD_KILLED:
    case CLD_DUMPED: return 128 + si.status;
    }
    return -1;
}

std::string Result::si_description() const {
    auto signal_description = [](const char* prefix, int signum) {
        auto abbrv = sigabbrev_np(signum);
        auto descr = sigdescr_np(signum);
        if (abbrv) {
            if (descr) {
                return concat_tostr(prefix, " SIG", abbrv, " - ", descr);
            }
            return concat_tostr(prefix, " SIG", abbrv);
        }
        if (descr) {
            return concat_tostr(prefix, " with number ", signum, " - ", descr);
        }
        return concat_tostr(prefix, " with number ", signum);
    };
    switch (si.code) {
    case CLD_EXITED: return concat_tostr("exited with ", si.status);
    case CLD_KILLED: return signal_description("killed by signal", si.status);
    case CLD_DUMPED: return signal_description("killed and dumped by signal", si.status);
    case CLD_TRAPPED: return signal_description("trapped by signal", si.status);
    case CLD_STOPPED: return signal_description("stopped by signal", si.status);
    case CLD_CONTINUED: return signal_description("continued by signal", si.status);
    }
    return "unable to describe";
}

std::string find_executable(const std::string& name) {
    if (name.empty()) {
        THROW("executable name is empty");
    }
    if (name.find('/') != std::string::npos) {
        return name;
    }
    const char* path_env = getenv("PATH");
    string_view path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    for (;;) {
        auto colon = path.find(':');
        auto dir = path.substr(0, colon);
        auto candidate = concat_tostr(dir.empty() ? "." : dir, '/', name);
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        if (colon == string_view::npos) {
            break;
        }
        path.remove_prefix(colon + 1);
    }
    THROW("executable not found in PATH: ", name);
}

Result run(const Options& options) {
    auto executable = find_executable(options.executable);
    auto args = options.args.empty() ? std::vector{options.executable} : options.args;
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.emplace_back(arg.data());
    }
    argv.emplace_back(nullptr);

    auto stdout_pipe = pipe2(O_CLOEXEC);
    if (not stdout_pipe) {
        THROW("pipe2()", errmsg());
    }
    auto stderr_pipe = pipe2(O_CLOEXEC);
    if (not stderr_pipe) {
        THROW("pipe2()", errmsg());
    }
    auto error_pipe = pipe2(O_CLOEXEC);
    if (not error_pipe) {
        THROW("pipe2()", errmsg());
    }

    Child child_code = {
        .executable = executable.c_str(),
        .argv = argv.data(),
        .working_dir = options.working_dir.empty() ? nullptr : options.working_dir.c_str(),
        .stdout_fd = stdout_pipe->writable,
        .stderr_fd = stderr_pipe->writable,
        .error_fd = error_pipe->writable,
    };

    int child_pidfd{};
    clone_args cl_args = {
        .flags = CLONE_PIDFD,
        .pidfd = reinterpret_cast<uintptr_t>(&child_pidfd),
        .exit_signal = SIGCHLD,
    };
    auto start = steady_clock::now();
    auto pid = syscalls::clone3(&cl_args);
    if (pid == -1) {
        THROW("clone3()", errmsg());
    }
    if (pid == 0) {
        child_code.execute();
        __builtin_unreachable();
    }
    // Parent process
    ChildProcess child{pid, FileDescriptor{child_pidfd}};
    if (stdout_pipe->writable.close() or stderr_pipe->writable.close() or
        error_pipe->writable.close())
    {
        THROW("close()", errmsg());
    }

    // Wait until the child calls execve() or dies
    auto error_msg = read_all(error_pipe->readable);
    if (not error_msg.empty()) {
        (void)child.wait();
        int errnum = 0;
        if (error_msg.size() >= sizeof(errnum)) {
            std::memcpy(&errnum, error_msg.data(), sizeof(errnum));
            error_msg.erase(0, sizeof(errnum));
        }
        THROW(error_msg, errmsg(errnum));
    }
    spdlog::debug("started {} (pid {}) in {}", executable, pid, options.working_dir);

    Result res;
    std::array<pollfd, 3> pfds;
    enum {
        STDOUT = 0,
        STDERR = 1,
        PROCESS = 2,
    };
    pfds[STDOUT] = {
        .fd = stdout_pipe->readable,
        .events = POLLIN,
        .revents = 0,
    };
    pfds[STDERR] = {
        .fd = stderr_pipe->readable,
        .events = POLLIN,
        .revents = 0,
    };
    pfds[PROCESS] = {
        .fd = child.pidfd(), // becomes readable once the process dies
        .events = POLLIN,
        .revents = 0,
    };

    std::array<char, 1 << 16> buff;
    auto read_chunk =
        [&](FileDescriptor& fd, pollfd& pfd, std::string& data, bool& truncated) {
            auto len = read(fd, buff.data(), buff.size());
            if (len == -1) {
                if (errno == EINTR or errno == EAGAIN) {
                    return;
                }
                THROW("read()", errmsg());
            }
            if (len == 0) {
                if (fd.close()) {
                    THROW("close()", errmsg());
                }
                pfd.fd = -1;
                return;
            }
            // Data above the limit is still read, so that the process does not block on write
            auto taken = std::min(static_cast<size_t>(len), options.max_output_size - data.size());
            data.append(buff.data(), taken);
            if (taken < static_cast<size_t>(len)) {
                truncated = true;
            }
        };

    const auto deadline = start + options.deadline;
    while (pfds[STDOUT].fd >= 0 or pfds[STDERR].fd >= 0 or pfds[PROCESS].fd >= 0) {
        auto now = steady_clock::now();
        if (now >= deadline) {
            res.timed_out = true;
            break;
        }
        auto timeout_ms = std::chrono::ceil<std::chrono::milliseconds>(deadline - now).count();
        int rc = poll(
            pfds.data(), pfds.size(), static_cast<int>(std::min<int64_t>(timeout_ms, INT_MAX))
        );
        if (rc == 0 or (rc == -1 and errno == EINTR)) {
            continue;
        }
        if (rc == -1) {
            THROW("poll()", errmsg());
        }

        if (pfds[STDOUT].revents) {
            read_chunk(stdout_pipe->readable, pfds[STDOUT], res.stdout_data, res.stdout_truncated);
        }
        if (pfds[STDERR].revents) {
            read_chunk(stderr_pipe->readable, pfds[STDERR], res.stderr_data, res.stderr_truncated);
        }
        if (pfds[PROCESS].revents & POLLIN) {
            // Descendants left behind could hold the pipes open until the deadline. The
            // process is a zombie now, so its pid cannot be reused as a process group id yet.
            if (child.kill_process_group()) {
                THROW("kill()", errmsg());
            }
            const auto& si = child.wait();
            res.si = {.code = si.si_code, .status = si.si_status};
            res.runtime = steady_clock::now() - start;
            pfds[PROCESS].fd = -1;
        }
    }

    if (res.timed_out) {
        spdlog::debug("{} (pid {}) exceeded the deadline, killing it", executable, pid);
        if (not child.waited()) {
            if (child.kill()) {
                THROW("kill()", errmsg());
            }
            const auto& si = child.wait();
            res.si = {.code = si.si_code, .status = si.si_status};
        }
        res.runtime = steady_clock::now() - start;
    }
    return res;
}

} // namespace snipbox::subprocess
