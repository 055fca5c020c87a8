#include "runtime/process_executor.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include "core/config/limits.hpp"
#include "core/logging/logger.hpp"
#include "core/text/utf8.hpp"

extern char** environ;

namespace runner::runtime {

using protocol::Exited;
using protocol::LaunchFailed;
using protocol::ProcessOutcome;
using protocol::TimedOut;

namespace {

// What the child reports through the exec-error pipe before _exit().
struct ChildFailure {
    int stage = 0;  // 1 = chdir, 2 = exec
    int error = 0;
};

constexpr int kStageChdir = 1;
constexpr int kStageExec = 2;

struct Capture {
    std::string stdout_text;
    std::string stderr_text;
    int status = 0;
    bool timed_out = false;
};

void ignore_sigpipe_once() {
    // Writing stdin to a child that already exited must surface as EPIPE.
    static const bool ignored = [] {
        static_cast<void>(std::signal(SIGPIPE, SIG_IGN));
        return true;
    }();
    static_cast<void>(ignored);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void close_pipe(int (&fds)[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

// Bytes past `limit` are read and dropped so the child never blocks on a
// full pipe. A zero limit keeps everything.
void drain_pipe(int& fd, std::string& out, const std::size_t limit) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            std::size_t keep = static_cast<std::size_t>(n);
            if (limit > 0) {
                keep = out.size() >= limit ? 0 : std::min(keep, limit - out.size());
            }
            out.append(buffer, keep);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        close_fd(fd);
        return;
    }
}

void feed_stdin(int& fd, const std::string& input, std::size_t& written) {
    if (fd < 0) {
        return;
    }

    while (written < input.size()) {
        const ssize_t n = write(fd, input.data() + written, input.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        // EPIPE: the child closed its stdin. The rest of the input is dropped.
        break;
    }
    close_fd(fd);
}

std::string describe_failure(const ChildFailure& failure, const ProcessRequest& request) {
    const std::string target = failure.stage == kStageChdir
                                   ? request.working_directory.string()
                                   : request.argv.front();
    return "ERROR: [Errno " + std::to_string(failure.error) + "] " +
           std::strerror(failure.error) + ": '" + target + "'";
}

std::string errno_message(const std::string& what) {
    const int err = errno;
    return "ERROR: " + what + ": [Errno " + std::to_string(err) + "] " +
           std::strerror(err);
}

int decode_exit_code(const int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return -1;
}

}  // namespace

std::size_t capture_limit_for(const std::size_t output_limit_chars) {
    // A character decodes from at most four bytes, valid or not.
    return (output_limit_chars + 1) * 4;
}

const std::vector<std::string>& default_stripped_env_keys() {
    static const std::vector<std::string> keys = {"HTTP_PROXY", "HTTPS_PROXY",
                                                  "http_proxy", "https_proxy"};
    return keys;
}

EnvironmentMap current_environment() {
    EnvironmentMap env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string item(*entry);
        const auto eq = item.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        env.emplace(item.substr(0, eq), item.substr(eq + 1));
    }
    return env;
}

EnvironmentMap build_child_environment(EnvironmentMap base,
                                       const std::vector<std::string>& removed_keys,
                                       const EnvironmentMap& overrides) {
    for (const auto& key : removed_keys) {
        base.erase(key);
    }
    for (const auto& [key, value] : overrides) {
        base[key] = value;
    }
    return base;
}

ProcessExecutor::ProcessExecutor(ExecutorOptions options)
    : options_(std::move(options)) {}

ProcessOutcome ProcessExecutor::run(const ProcessRequest& request) const {
    if (request.argv.empty() || request.argv.front().empty()) {
        return LaunchFailed{"ERROR: empty command"};
    }
    ignore_sigpipe_once();

    // Everything the child touches is prepared before fork(), so the child
    // only makes async-signal-safe calls.
    std::vector<char*> argv;
    argv.reserve(request.argv.size() + 1);
    for (const auto& arg : request.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const EnvironmentMap env = build_child_environment(
        current_environment(), options_.stripped_env_keys, options_.env_overrides);
    std::vector<std::string> env_entries;
    env_entries.reserve(env.size());
    for (const auto& [key, value] : env) {
        env_entries.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    envp.reserve(env_entries.size() + 1);
    for (auto& entry : env_entries) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    const std::string cwd = request.working_directory.string();

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int failure_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) != 0 || pipe2(failure_pipe, O_CLOEXEC) != 0) {
        std::string message = errno_message("failed to create process pipes");
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(failure_pipe);
        LOG_ERROR("ProcessExecutor: " + message);
        return LaunchFailed{std::move(message)};
    }

    LOG_DEBUG("ProcessExecutor: launching " + request.argv.front() + " in " + cwd);
    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        std::string message = errno_message("failed to fork process");
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(failure_pipe);
        LOG_ERROR("ProcessExecutor: " + message);
        return LaunchFailed{std::move(message)};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        static_cast<void>(signal(SIGPIPE, SIG_DFL));
        static_cast<void>(dup2(stdin_pipe[0], STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));

        ChildFailure failure;
        if (chdir(cwd.c_str()) != 0) {
            failure = ChildFailure{kStageChdir, errno};
        } else {
            execvpe(argv[0], argv.data(), envp.data());
            failure = ChildFailure{kStageExec, errno};
        }
        static_cast<void>(write(failure_pipe[1], &failure, sizeof(failure)));
        _exit(127);
    }

    // Mirror the child's setpgid so the group exists before any kill.
    static_cast<void>(setpgid(pid, pid));
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(failure_pipe[1]);

    // The failure pipe is close-on-exec: EOF means exec succeeded.
    ChildFailure failure;
    ssize_t failure_bytes = 0;
    do {
        failure_bytes = read(failure_pipe[0], &failure, sizeof(failure));
    } while (failure_bytes < 0 && errno == EINTR);
    close_fd(failure_pipe[0]);

    if (failure_bytes == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        std::string message = describe_failure(failure, request);
        LOG_WARN("ProcessExecutor: launch failed: " + message);
        return LaunchFailed{std::move(message)};
    }

    int stdin_fd = stdin_pipe[1];
    int stdout_fd = stdout_pipe[0];
    int stderr_fd = stderr_pipe[0];
    set_nonblocking(stdin_fd);
    set_nonblocking(stdout_fd);
    set_nonblocking(stderr_fd);

    std::size_t stdin_written = 0;
    if (request.stdin_text.empty()) {
        close_fd(stdin_fd);
    }

    const auto deadline = started + std::chrono::seconds(request.timeout_seconds);
    std::chrono::steady_clock::time_point kill_deadline;
    Capture capture;
    bool child_exited = false;

    while (stdout_fd >= 0 || stderr_fd >= 0 || !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        if (!capture.timed_out && now >= deadline) {
            capture.timed_out = true;
            kill_deadline = now + options_.kill_grace;
            // The child itself may have moved to another group.
            static_cast<void>(kill(pid, SIGKILL));
            static_cast<void>(kill(-pid, SIGKILL));
            close_fd(stdin_fd);
            LOG_WARN("ProcessExecutor: deadline of " +
                     std::to_string(request.timeout_seconds) + "s expired, killed " +
                     request.argv.front());
        }
        if (capture.timed_out && now >= kill_deadline) {
            // A grandchild outside the group still holds the pipes.
            break;
        }

        pollfd fds[3];
        nfds_t nfds = 0;
        if (stdout_fd >= 0) {
            fds[nfds].fd = stdout_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_fd >= 0) {
            fds[nfds].fd = stderr_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stdin_fd >= 0) {
            fds[nfds].fd = stdin_fd;
            fds[nfds].events = POLLOUT;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else if (!child_exited) {
            static_cast<void>(usleep(10 * 1000));
        }

        feed_stdin(stdin_fd, request.stdin_text, stdin_written);
        drain_pipe(stdout_fd, capture.stdout_text, request.capture_limit_bytes);
        drain_pipe(stderr_fd, capture.stderr_text, request.capture_limit_bytes);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &capture.status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }
    }

    close_fd(stdin_fd);
    close_fd(stdout_fd);
    close_fd(stderr_fd);

    if (!child_exited) {
        while (waitpid(pid, &capture.status, 0) < 0 && errno == EINTR) {
        }
    }

    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - started)
                                .count();

    if (capture.timed_out) {
        return TimedOut{core::text::sanitize_utf8(capture.stdout_text)};
    }

    const int exit_code = decode_exit_code(capture.status);
    LOG_DEBUG("ProcessExecutor: " + request.argv.front() + " exited with " +
              std::to_string(exit_code) + " after " + std::to_string(elapsed_ms) +
              " ms");
    return Exited{exit_code, core::text::sanitize_utf8(capture.stdout_text),
                  core::text::sanitize_utf8(capture.stderr_text)};
}

protocol::RunResult to_run_result(const ProcessOutcome& outcome,
                                  const std::size_t output_limit) {
    const auto marker = core::config::kTruncationMarker;
    protocol::RunResult result;

    if (const auto* exited = std::get_if<Exited>(&outcome)) {
        result.succeeded = exited->exit_code == 0;
        result.exit_code = exited->exit_code;
        result.stdout_text =
            core::text::truncate_chars(exited->stdout_text, output_limit, marker);
        result.stderr_text =
            core::text::truncate_chars(exited->stderr_text, output_limit, marker);
    } else if (const auto* timed_out = std::get_if<TimedOut>(&outcome)) {
        result.succeeded = false;
        result.exit_code = core::config::kTimeoutExitCode;
        result.stdout_text =
            core::text::truncate_chars(timed_out->partial_stdout, output_limit, marker);
        result.stderr_text = std::string(core::config::kTimeoutMarker);
    } else if (const auto* failed = std::get_if<LaunchFailed>(&outcome)) {
        result.succeeded = false;
        result.exit_code = 1;
        result.stderr_text =
            core::text::truncate_chars(failed->message, output_limit, marker);
    }
    return result;
}

}  // namespace runner::runtime
