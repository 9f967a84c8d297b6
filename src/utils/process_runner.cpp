/**
 * @file process_runner.cpp
 * @brief POSIX implementation of host process execution
 *
 * **Execution Workflow**:
 * 1. Build argv/envp arrays in the parent (no allocation after fork)
 * 2. fork(); child joins a fresh process group, redirects stdio, execvpe()
 * 3. Parent learns about exec failure through a close-on-exec status pipe
 * 4. poll() drains stdout/stderr into bounded buffers
 * 5. Deadline or cancellation sends SIGKILL to the process group
 * 6. waitpid() reaps the child and decodes its status
 *
 * @date 2025
 */

#include "threatweaver/utils/process_runner.hpp"
#include "threatweaver/utils/output_buffer.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace threatweaver {
namespace utils {

namespace {

// ============================================================================
// FILE DESCRIPTOR HELPERS
// ============================================================================

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

/**
 * @brief Read whatever is available on a non-blocking descriptor
 * @return false once the writer side is closed (EOF) or the read failed
 */
bool DrainFd(int fd, BoundedOutputBuffer& buffer) {
    std::array<char, 8192> chunk;
    while (true) {
        ssize_t n = ::read(fd, chunk.data(), chunk.size());
        if (n > 0) {
            buffer.Append(chunk.data(), static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

void SetNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<std::string> env;
    env.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        env.push_back(key + "=" + value);
    }
    return env;
}

void KillGroup(pid_t pid) {
    // Negative pid targets the whole process group created in the child.
    if (::kill(-pid, SIGKILL) != 0 && errno == ESRCH) {
        ::kill(pid, SIGKILL);
    }
}

void DecodeWaitStatus(int status, ProcessResult& result) {
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.term_signal = 0;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = -1;
        result.term_signal = WTERMSIG(status);
    }
}

} // anonymous namespace

// ============================================================================
// PATH RESOLUTION
// ============================================================================

std::filesystem::path PosixProcessRunner::FindExecutable(const std::string& program) {
    if (program.empty()) {
        return {};
    }

    auto is_executable = [](const std::filesystem::path& candidate) {
        struct stat st;
        return ::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
               ::access(candidate.c_str(), X_OK) == 0;
    };

    if (program.find('/') != std::string::npos) {
        return is_executable(program) ? std::filesystem::path(program) : std::filesystem::path();
    }

    const char* path_env = std::getenv("PATH");
    std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    std::size_t start = 0;
    while (start <= search.size()) {
        std::size_t end = search.find(':', start);
        if (end == std::string::npos) {
            end = search.size();
        }
        std::string dir = search.substr(start, end - start);
        if (!dir.empty()) {
            auto candidate = std::filesystem::path(dir) / program;
            if (is_executable(candidate)) {
                return candidate;
            }
        }
        start = end + 1;
    }

    return {};
}

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

ProcessResult PosixProcessRunner::Run(const std::vector<std::string>& argv,
                                      const ProcessOptions& options) {
    ProcessResult result;

    if (argv.empty() || argv.front().empty()) {
        result.spawn_failed = true;
        result.spawn_error = "empty argument vector";
        return result;
    }

    // Everything the child needs is prepared before fork().
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    auto env_strings = BuildEnvironment(options.environment);
    std::vector<char*> c_envp;
    c_envp.reserve(env_strings.size() + 1);
    for (auto& entry : env_strings) {
        c_envp.push_back(const_cast<char*>(entry.c_str()));
    }
    c_envp.push_back(nullptr);

    std::string working_dir = options.working_directory.string();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (::pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(stderr_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(status_pipe, O_CLOEXEC) != 0) {
        result.spawn_failed = true;
        result.spawn_error = std::string("pipe failed: ") + std::strerror(errno);
        for (int* fds : {stdout_pipe, stderr_pipe, status_pipe}) {
            CloseFd(fds[0]);
            CloseFd(fds[1]);
        }
        return result;
    }

    auto start = std::chrono::steady_clock::now();

    pid_t pid = ::fork();
    if (pid < 0) {
        result.spawn_failed = true;
        result.spawn_error = std::string("fork failed: ") + std::strerror(errno);
        for (int* fds : {stdout_pipe, stderr_pipe, status_pipe}) {
            CloseFd(fds[0]);
            CloseFd(fds[1]);
        }
        return result;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        ::setpgid(0, 0);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);

        if (!working_dir.empty() && ::chdir(working_dir.c_str()) != 0) {
            int err = errno;
            ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
            (void)ignored;
            ::_exit(126);
        }

        ::execvpe(c_argv[0], c_argv.data(), c_envp.data());

        int err = errno;
        ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    ::setpgid(pid, pid);
    CloseFd(stdout_pipe[1]);
    CloseFd(stderr_pipe[1]);
    CloseFd(status_pipe[1]);

    // The status pipe closes on successful exec; otherwise it carries errno.
    int exec_errno = 0;
    ssize_t status_read;
    do {
        status_read = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (status_read < 0 && errno == EINTR);
    CloseFd(status_pipe[0]);

    if (status_read == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        CloseFd(stdout_pipe[0]);
        CloseFd(stderr_pipe[0]);
        result.spawn_failed = true;
        result.spawn_error = "cannot execute '" + argv.front() + "': " + std::strerror(exec_errno);
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        spdlog::debug("Spawn failed: {}", result.spawn_error);
        return result;
    }

    SetNonBlocking(stdout_pipe[0]);
    SetNonBlocking(stderr_pipe[0]);

    BoundedOutputBuffer out(options.max_output_bytes);
    BoundedOutputBuffer err(options.max_output_bytes);

    const bool has_deadline = options.timeout.count() > 0;
    const auto deadline = start + options.timeout;
    const auto poll_interval = options.poll_interval.count() > 0
        ? options.poll_interval : std::chrono::milliseconds(50);

    bool exited = false;
    bool killed = false;
    int wait_status = 0;

    while (!exited) {
        if (options.cancel_token.IsCancelled()) {
            result.cancelled = true;
            KillGroup(pid);
            killed = true;
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (has_deadline && now >= deadline) {
            result.timed_out = true;
            KillGroup(pid);
            killed = true;
            break;
        }

        auto wait_for = poll_interval;
        if (has_deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            if (remaining < wait_for) {
                wait_for = remaining + std::chrono::milliseconds(1);
            }
        }

        std::array<pollfd, 2> fds{};
        nfds_t nfds = 0;
        if (stdout_pipe[0] >= 0) {
            fds[nfds++] = pollfd{stdout_pipe[0], POLLIN, 0};
        }
        if (stderr_pipe[0] >= 0) {
            fds[nfds++] = pollfd{stderr_pipe[0], POLLIN, 0};
        }

        if (nfds > 0) {
            int ready = ::poll(fds.data(), nfds, static_cast<int>(wait_for.count()));
            if (ready < 0 && errno != EINTR) {
                spdlog::warn("poll failed: {}", std::strerror(errno));
            }
            for (nfds_t i = 0; i < nfds; ++i) {
                if (fds[i].revents == 0) {
                    continue;
                }
                int& fd = (fds[i].fd == stdout_pipe[0]) ? stdout_pipe[0] : stderr_pipe[0];
                BoundedOutputBuffer& sink = (fds[i].fd == stdout_pipe[0]) ? out : err;
                if (!DrainFd(fd, sink)) {
                    CloseFd(fd);
                }
            }
        } else {
            // Both streams closed; the process may still be running.
            options.cancel_token.WaitFor(wait_for);
        }

        // WNOWAIT leaves the zombie in place so its process group id stays
        // reserved until the group is killed below.
        siginfo_t info{};
        if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0 &&
            info.si_pid == pid) {
            exited = true;
        }
    }

    if (killed) {
        ::waitpid(pid, &wait_status, 0);
        result.exit_code = -1;
        result.term_signal = SIGKILL;
    } else {
        // Kill anything the tool left behind in its group, then reap.
        ::kill(-pid, SIGKILL);
        ::waitpid(pid, &wait_status, 0);
        DecodeWaitStatus(wait_status, result);
    }

    // Final non-blocking drain; writers that escaped the group cannot stall us.
    if (stdout_pipe[0] >= 0) {
        DrainFd(stdout_pipe[0], out);
    }
    if (stderr_pipe[0] >= 0) {
        DrainFd(stderr_pipe[0], err);
    }
    CloseFd(stdout_pipe[0]);
    CloseFd(stderr_pipe[0]);

    result.stdout_truncated = out.Truncated();
    result.stderr_truncated = err.Truncated();
    result.stdout_output = out.Release();
    result.stderr_output = err.Release();
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    return result;
}

} // namespace utils
} // namespace threatweaver
