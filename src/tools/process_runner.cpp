#include "tools/process_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <signal.h>
#include <string>
#include <sys/stat.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"

namespace cidispatch::tools {

using core::errors::DispatchError;
using core::errors::ErrorCategory;
using protocol::ProcessResult;

namespace {

constexpr int kPollIntervalMs = 50;
// How long to keep reading after the child exited while a detached
// descendant still holds the pipes open.
constexpr std::int64_t kPostExitGraceMs = 500;
constexpr int kMaxInheritedFd = 65536;

struct ExecFailure {
    int stage;  // 0 = chdir, 1 = exec
    int error_number;
};

class FdGuard {
public:
    FdGuard() = default;
    explicit FdGuard(const int fd) : fd_(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    bool is_open() const { return fd_ >= 0; }

    void reset(const int fd = -1) {
        if (fd_ >= 0) {
            static_cast<void>(close(fd_));
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

bool make_pipe(FdGuard& read_end, FdGuard& write_end) {
    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

// Owns a forked child. Whatever path leaves the runner, the child's process
// group is killed and the child reaped before this object goes away.
class ChildProcess {
public:
    explicit ChildProcess(const pid_t pid) : pid_(pid) {}

    ~ChildProcess() {
        if (reaped_) {
            return;
        }
        kill_group();
        int status = 0;
        while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
    }

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    void kill_group() const {
        static_cast<void>(kill(-pid_, SIGKILL));
        if (!reaped_) {
            static_cast<void>(kill(pid_, SIGKILL));
        }
    }

    bool try_reap(int& status) {
        if (reaped_) {
            return true;
        }
        const pid_t waited = waitpid(pid_, &status, WNOHANG);
        if (waited == pid_) {
            reaped_ = true;
        }
        return reaped_;
    }

    void reap(int& status) {
        while (!reaped_) {
            const pid_t waited = waitpid(pid_, &status, 0);
            if (waited == pid_ || (waited < 0 && errno != EINTR)) {
                reaped_ = true;
            }
        }
    }

private:
    pid_t pid_;
    bool reaped_ = false;
};

class CappedBuffer {
public:
    explicit CappedBuffer(const std::size_t limit) : limit_(limit) {}

    void append(const char* data, const std::size_t size) {
        const std::size_t room = limit_ > text_.size() ? limit_ - text_.size() : 0;
        const std::size_t taken = std::min(room, size);
        text_.append(data, taken);
        dropped_ += size - taken;
    }

    bool truncated() const { return dropped_ > 0; }

    std::string finish() {
        if (dropped_ > 0) {
            text_ += "\n[output truncated: " + std::to_string(dropped_) + " bytes dropped]\n";
        }
        return std::move(text_);
    }

private:
    std::size_t limit_;
    std::size_t dropped_ = 0;
    std::string text_;
};

void drain_pipe(FdGuard& fd, CappedBuffer& out) {
    if (!fd.is_open()) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd.get(), buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        fd.reset();
        return;
    }
}

void feed_stdin(FdGuard& fd, const std::string& text, std::size_t& offset) {
    if (!fd.is_open()) {
        return;
    }
    while (offset < text.size()) {
        const ssize_t n = write(fd.get(), text.data() + offset, text.size() - offset);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        // Child closed its stdin early; the rest is discarded.
        break;
    }
    fd.reset();
}

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { static_cast<void>(signal(SIGPIPE, SIG_IGN)); });
}

std::string lookup_env(const policy::EnvironmentList& environment, const std::string& name) {
    for (const auto& [key, value] : environment) {
        if (key == name) {
            return value;
        }
    }
    return "";
}

bool is_executable_file(const std::filesystem::path& path) {
    struct stat info {};
    if (stat(path.c_str(), &info) != 0) {
        return false;
    }
    return S_ISREG(info.st_mode) && access(path.c_str(), X_OK) == 0;
}

}  // namespace

core::errors::Result<std::filesystem::path> ProcessRunner::resolve_executable(
    const std::string& executable, const policy::EnvironmentList& environment) {
    if (executable.empty()) {
        return DispatchError{ErrorCategory::Input, "Executable name cannot be empty.",
                             "empty_executable"};
    }

    if (executable.find('/') != std::string::npos) {
        const std::filesystem::path candidate(executable);
        std::error_code ec;
        if (!std::filesystem::exists(candidate, ec) || ec) {
            return DispatchError{ErrorCategory::Execution,
                                 "Executable not found: " + executable,
                                 "binary_not_found"};
        }
        if (!is_executable_file(candidate)) {
            return DispatchError{ErrorCategory::Execution,
                                 "Executable is not runnable: " + executable,
                                 "permission_denied"};
        }
        return candidate;
    }

    std::string search_path = lookup_env(environment, "PATH");
    if (search_path.empty()) {
        search_path = "/usr/local/bin:/usr/bin:/bin";
    }

    bool found_unrunnable = false;
    std::size_t start = 0;
    while (start <= search_path.size()) {
        const std::size_t end = std::min(search_path.find(':', start), search_path.size());
        const std::string dir = search_path.substr(start, end - start);
        start = end + 1;
        if (dir.empty()) {
            continue;
        }
        const std::filesystem::path candidate = std::filesystem::path(dir) / executable;
        std::error_code ec;
        if (!std::filesystem::exists(candidate, ec) || ec) {
            continue;
        }
        if (is_executable_file(candidate)) {
            return candidate;
        }
        found_unrunnable = true;
    }

    if (found_unrunnable) {
        return DispatchError{ErrorCategory::Execution,
                             "Executable is not runnable: " + executable,
                             "permission_denied"};
    }
    return DispatchError{ErrorCategory::Execution,
                         "Executable not found on PATH: " + executable,
                         "binary_not_found",
                         "Install " + executable + " or point the config at it."};
}

core::errors::Result<ProcessResult> ProcessRunner::run(const ProcessRequest& request) {
    if (request.cancel_token && request.cancel_token->load()) {
        ProcessResult result;
        result.cancelled = true;
        result.stderr_text = "Command cancelled before start.";
        return result;
    }

    auto resolved = resolve_executable(request.executable, request.environment);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::string program = core::errors::get_value(resolved).string();

    // Everything the child touches is built before fork().
    std::vector<std::string> argv_storage;
    argv_storage.reserve(request.arguments.size() + 1);
    argv_storage.push_back(request.executable);
    argv_storage.insert(argv_storage.end(), request.arguments.begin(),
                        request.arguments.end());
    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (const auto& [key, value] : request.environment) {
        env_storage.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& entry : env_storage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    const std::string cwd = request.working_directory.string();

    FdGuard stdout_read, stdout_write, stderr_read, stderr_write;
    FdGuard stdin_read, stdin_write, failure_read, failure_write;
    const bool has_stdin = request.stdin_text.has_value();
    if (!make_pipe(stdout_read, stdout_write) || !make_pipe(stderr_read, stderr_write) ||
        !make_pipe(failure_read, failure_write) ||
        (has_stdin && !make_pipe(stdin_read, stdin_write))) {
        return DispatchError{ErrorCategory::Internal, "Failed to create process pipes.",
                             "pipe_creation_failed"};
    }
    if (has_stdin) {
        ignore_sigpipe_once();
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        return DispatchError{ErrorCategory::Internal, "Failed to fork process.",
                             "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        static_cast<void>(signal(SIGPIPE, SIG_DFL));
        sigset_t all_signals;
        sigemptyset(&all_signals);
        static_cast<void>(sigprocmask(SIG_SETMASK, &all_signals, nullptr));

        ExecFailure failure{0, 0};
        if (chdir(cwd.c_str()) != 0) {
            failure.error_number = errno;
            static_cast<void>(write(failure_write.get(), &failure, sizeof(failure)));
            _exit(126);
        }

        const int stdin_fd = has_stdin ? stdin_read.get() : open("/dev/null", O_RDONLY);
        static_cast<void>(dup2(stdin_fd, STDIN_FILENO));
        static_cast<void>(dup2(stdout_write.get(), STDOUT_FILENO));
        static_cast<void>(dup2(stderr_write.get(), STDERR_FILENO));
        for (int fd = 3; fd < kMaxInheritedFd; ++fd) {
            if (fd != failure_write.get()) {
                static_cast<void>(close(fd));
            }
        }

        execve(program.c_str(), argv.data(), envp.data());
        failure.stage = 1;
        failure.error_number = errno;
        static_cast<void>(write(failure_write.get(), &failure, sizeof(failure)));
        _exit(127);
    }

    ChildProcess child(pid);
    static_cast<void>(setpgid(pid, pid));
    stdout_write.reset();
    stderr_write.reset();
    stdin_read.reset();
    failure_write.reset();

    // Blocks until exec succeeds (EOF through O_CLOEXEC) or the child reports why not.
    ExecFailure failure{};
    ssize_t failure_bytes = 0;
    do {
        failure_bytes = read(failure_read.get(), &failure, sizeof(failure));
    } while (failure_bytes < 0 && errno == EINTR);
    failure_read.reset();
    if (failure_bytes == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        child.reap(status);
        const std::string reason = std::strerror(failure.error_number);
        if (failure.stage == 0) {
            return DispatchError{ErrorCategory::Execution,
                                 "Cannot enter working directory " + cwd + ": " + reason,
                                 "invalid_working_directory"};
        }
        return DispatchError{ErrorCategory::Execution,
                             "Failed to execute " + request.executable + ": " + reason,
                             failure.error_number == EACCES ? "permission_denied"
                                                            : "exec_failed"};
    }

    set_nonblocking(stdout_read.get());
    set_nonblocking(stderr_read.get());
    if (has_stdin) {
        set_nonblocking(stdin_write.get());
    }

    ProcessResult result;
    result.timeout_ms = request.timeout_ms;
    CappedBuffer stdout_buffer(request.max_output_bytes);
    CappedBuffer stderr_buffer(request.max_output_bytes);
    std::size_t stdin_offset = 0;
    bool child_exited = false;
    int status = 0;
    std::chrono::steady_clock::time_point exited_at;

    while (stdout_read.is_open() || stderr_read.is_open() || !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        if (!child_exited && !result.cancelled && request.cancel_token &&
            request.cancel_token->load()) {
            result.cancelled = true;
            child.kill_group();
        }

        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - started).count();
        if (!child_exited && !result.timed_out && request.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(request.timeout_ms)) {
            result.timed_out = true;
            child.kill_group();
        }

        if (child_exited) {
            const auto since_exit =
                std::chrono::duration_cast<std::chrono::milliseconds>(now - exited_at)
                    .count();
            if (since_exit > kPostExitGraceMs) {
                LOG_WARN("Process " + request.executable +
                         " left descendants holding its output open; closing pipes.");
                break;
            }
        }

        pollfd fds[3];
        nfds_t nfds = 0;
        if (stdout_read.is_open()) {
            fds[nfds++] = pollfd{stdout_read.get(), POLLIN, 0};
        }
        if (stderr_read.is_open()) {
            fds[nfds++] = pollfd{stderr_read.get(), POLLIN, 0};
        }
        if (stdin_write.is_open()) {
            fds[nfds++] = pollfd{stdin_write.get(), POLLOUT, 0};
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, kPollIntervalMs));
        } else {
            static_cast<void>(poll(nullptr, 0, kPollIntervalMs));
        }

        if (has_stdin) {
            feed_stdin(stdin_write, *request.stdin_text, stdin_offset);
        }
        drain_pipe(stdout_read, stdout_buffer);
        drain_pipe(stderr_read, stderr_buffer);

        if (!child_exited && child.try_reap(status)) {
            child_exited = true;
            exited_at = std::chrono::steady_clock::now();
            // Background descendants die with the group leader.
            child.kill_group();
        }
    }

    if (!child_exited) {
        child.reap(status);
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = -1;
    }

    result.stdout_truncated = stdout_buffer.truncated();
    result.stderr_truncated = stderr_buffer.truncated();
    result.stdout_text = stdout_buffer.finish();
    result.stderr_text = stderr_buffer.finish();

    const auto ended = std::chrono::steady_clock::now();
    result.duration_ms = std::chrono::duration<double, std::milli>(ended - started).count();

    LOG_DEBUG("Process " + request.executable + " exited with " +
              std::to_string(result.exit_code) + " after " +
              std::to_string(static_cast<long long>(result.duration_ms)) + " ms");
    return result;
}

}  // namespace cidispatch::tools
