/**
 * @file process_runner.cpp
 * @brief ProcessRunner implementation: fork/exec with poll()-driven output capture.
 */

#include "executor/process_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace kernel_orchestrator {

namespace {

constexpr int POLL_INTERVAL_MS = 20;

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags != -1) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

/**
 * @brief Read whatever is available on @p fd into @p out.
 * @return false once the write end is closed.
 */
bool drain(int fd, std::string& out) {
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            size_t room = ProcessRunner::MAX_CAPTURE_BYTES > out.size()
                ? ProcessRunner::MAX_CAPTURE_BYTES - out.size() : 0;
            out.append(buf, std::min(room, static_cast<size_t>(n)));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

/**
 * @brief Parent environment plus the KO_* variables, built before fork().
 */
std::vector<std::string> build_child_env(const TestCase& test, const Environment& environment) {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        if (std::strncmp(*entry, "KO_", 3) == 0) continue;
        env.emplace_back(*entry);
    }
    env.push_back("KO_ENVIRONMENT_ID=" + environment.id);
    env.push_back("KO_ARCHITECTURE=" + environment.hardware.architecture);
    env.push_back("KO_KERNEL_VERSION=" + environment.kernel_version);
    env.push_back("KO_TEST_ID=" + test.id);
    return env;
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

}  // anonymous namespace

ProcessRunner::ProcessRunner(std::string shell, Duration kill_grace)
    : shell_(std::move(shell)), kill_grace_(kill_grace) {}

Result<RunOutcome> ProcessRunner::execute(const TestCase& test,
                                          const Environment& environment,
                                          std::stop_token stop) {
    if (test.script.empty()) {
        return Error{ErrorCode::InvalidArgument, "Test " + test.id + " has no script"};
    }

    int out_pipe[2];
    int err_pipe[2];
    // Close-on-exec from creation; dup2 clears it on the child's stdio copies
    if (::pipe2(out_pipe, O_CLOEXEC) == -1) {
        return Error{ErrorCode::Io, std::string{"pipe: "} + std::strerror(errno)};
    }
    if (::pipe2(err_pipe, O_CLOEXEC) == -1) {
        int saved = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return Error{ErrorCode::Io, std::string{"pipe: "} + std::strerror(saved)};
    }

    auto env_strings = build_child_env(test, environment);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& entry : env_strings) envp.push_back(entry.data());
    envp.push_back(nullptr);

    auto start = std::chrono::steady_clock::now();
    pid_t pid = ::fork();
    if (pid == -1) {
        int saved = errno;
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);
        return Error{ErrorCode::Io, std::string{"fork: "} + std::strerror(saved)};
    }

    if (pid == 0) {
        // Child: new process group so the whole tree can be signalled
        ::setpgid(0, 0);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) ::close(fd);

        ::execle(shell_.c_str(), shell_.c_str(), "-c", test.script.c_str(),
                 static_cast<char*>(nullptr), envp.data());
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    RunOutcome outcome;
    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    int status = 0;
    bool reaped = false;
    bool term_sent = false;
    std::chrono::steady_clock::time_point term_at;

    while (!reaped) {
        pollfd pfds[2];
        nfds_t count = 0;
        if (out_fd >= 0) pfds[count++] = pollfd{out_fd, POLLIN, 0};
        if (err_fd >= 0) pfds[count++] = pollfd{err_fd, POLLIN, 0};

        if (count > 0) {
            int ready = ::poll(pfds, count, POLL_INTERVAL_MS);
            if (ready > 0) {
                for (nfds_t i = 0; i < count; ++i) {
                    if (pfds[i].revents == 0) continue;
                    int& fd = (pfds[i].fd == out_fd) ? out_fd : err_fd;
                    std::string& sink = (pfds[i].fd == out_fd) ? outcome.stdout_text : outcome.stderr_text;
                    if (!drain(fd, sink)) {
                        ::close(fd);
                        fd = -1;
                    }
                }
            }
        } else {
            ::usleep(POLL_INTERVAL_MS * 1000);
        }

        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            reaped = true;
            break;
        }
        if (done == -1 && errno != EINTR) {
            int saved = errno;
            for (int fd : {out_fd, err_fd}) {
                if (fd >= 0) ::close(fd);
            }
            return Error{ErrorCode::Io, std::string{"waitpid: "} + std::strerror(saved)};
        }

        if (stop.stop_requested()) {
            auto now = std::chrono::steady_clock::now();
            if (!term_sent) {
                ::kill(-pid, SIGTERM);
                term_sent = true;
                term_at = now;
            } else if (now - term_at >= kill_grace_) {
                ::kill(-pid, SIGKILL);
            }
        }
    }

    // Collect anything written between the last poll and exit
    if (out_fd >= 0) {
        (void)drain(out_fd, outcome.stdout_text);
        ::close(out_fd);
    }
    if (err_fd >= 0) {
        (void)drain(err_fd, outcome.stderr_text);
        ::close(err_fd);
    }

    outcome.exit_code = decode_status(status);
    outcome.duration = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
    return outcome;
}

}  // namespace kernel_orchestrator
