#include "ChildProcess.hpp"
#include "SignalGuard.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <optional>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace mcp_stdio {

namespace {

constexpr size_t kReadChunk = 4096;
constexpr size_t kMaxStderrBuffer = 64 * 1024;

void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void close_pair(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

std::optional<std::string> take_line(std::string& buffer) {
    auto pos = buffer.find('\n');
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    std::string line = buffer.substr(0, pos);
    buffer.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

// Reads whatever is available on fd into buffer; sets eof on end of stream
void fill_buffer(int fd, std::string& buffer, bool& eof) {
    std::array<char, kReadChunk> chunk;
    ssize_t n = ::read(fd, chunk.data(), chunk.size());
    if (n > 0) {
        buffer.append(chunk.data(), static_cast<size_t>(n));
    } else if (n == 0) {
        eof = true;
    } else if (errno != EINTR && errno != EAGAIN) {
        eof = true;
    }
}

// Inherited environment with overrides applied, as KEY=VALUE strings
std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> entries;

    for (char** env = environ; env && *env; ++env) {
        std::string entry(*env);
        auto eq = entry.find('=');
        std::string key = entry.substr(0, eq);
        if (overrides.find(key) == overrides.end()) {
            entries.push_back(std::move(entry));
        }
    }

    for (const auto& [key, value] : overrides) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

} // namespace

ChildProcess::~ChildProcess() {
    if (pid_ > 0 && !reaped_) {
        kill_and_reap();
    }
    close_fds();
}

bool ChildProcess::spawn(const LaunchSpec& spec, std::string* error) {
    auto fail = [error](const std::string& message) {
        if (error) {
            *error = message;
        }
        return false;
    };

    if (pid_ > 0) {
        return fail("a process is already associated with this instance");
    }
    if (spec.executable.empty()) {
        return fail("executable must not be empty");
    }

    ignore_sigpipe();

    stdout_buffer_.clear();
    stderr_buffer_.clear();
    stdout_eof_ = false;
    stderr_eof_ = false;
    reaped_ = false;
    exit_status_ = -1;

    // argv/envp are built before fork so the child only calls exec
    std::vector<std::string> env_entries = build_environment(spec.environment);
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(spec.executable.c_str()));
    for (const auto& arg : spec.arguments) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (auto& entry : env_entries) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};  // carries exec errno back to the parent

    if (pipe2(in_pipe, O_CLOEXEC) == -1 || pipe2(out_pipe, O_CLOEXEC) == -1 ||
        pipe2(err_pipe, O_CLOEXEC) == -1 || pipe2(status_pipe, O_CLOEXEC) == -1) {
        std::string reason = std::strerror(errno);
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(status_pipe);
        return fail("failed to create pipes: " + reason);
    }

    pid_t pid = fork();
    if (pid == -1) {
        std::string reason = std::strerror(errno);
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(status_pipe);
        return fail("fork failed: " + reason);
    }

    if (pid == 0) {
        // Child: own process group so shutdown signals reach its helpers too
        setpgid(0, 0);
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        // Ignored dispositions and the signal mask survive exec; the peer
        // starts with defaults
        ::signal(SIGPIPE, SIG_DFL);
        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

        // execvp searches PATH of the merged environment, not the parent's
        environ = envp.data();
        execvp(argv[0], argv.data());

        int exec_errno = errno;
        ssize_t ignored = ::write(status_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    // Parent
    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(status_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        return fail("cannot execute '" + spec.executable + "': " + std::strerror(exec_errno));
    }

    pid_ = pid;
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    return true;
}

bool ChildProcess::write_line(const std::string& text) {
    if (stdin_fd_ < 0) {
        return false;
    }

    std::string data = text;
    data += '\n';

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(stdin_fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

ChildProcess::LineRead ChildProcess::read_line(Stream stream, std::chrono::milliseconds timeout) {
    using clock = std::chrono::steady_clock;

    const bool from_stdout = stream == Stream::Output;
    int fd = from_stdout ? stdout_fd_ : stderr_fd_;
    std::string& buffer = from_stdout ? stdout_buffer_ : stderr_buffer_;
    bool& eof = from_stdout ? stdout_eof_ : stderr_eof_;

    const auto deadline = clock::now() + timeout;

    while (true) {
        if (auto line = take_line(buffer)) {
            return {LineStatus::Line, std::move(*line)};
        }

        if (eof || fd < 0) {
            if (!buffer.empty()) {
                // Unterminated final line
                std::string rest;
                rest.swap(buffer);
                return {LineStatus::Line, std::move(rest)};
            }
            return {LineStatus::Eof, {}};
        }

        // A signal that arrived outside poll() would otherwise go unseen
        if (SignalGuard::requested()) {
            return {LineStatus::Interrupted, {}};
        }

        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - clock::now());
        if (remaining.count() < 0) {
            remaining = std::chrono::milliseconds(0);
        }

        struct pollfd fds[2];
        nfds_t nfds = 1;
        fds[0].fd = fd;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        if (from_stdout && stderr_fd_ >= 0 && !stderr_eof_) {
            fds[1].fd = stderr_fd_;
            fds[1].events = POLLIN;
            fds[1].revents = 0;
            nfds = 2;
        }

        int ret = poll(fds, nfds, static_cast<int>(remaining.count()));

        if (ret < 0) {
            if (errno == EINTR) {
                if (SignalGuard::requested()) {
                    return {LineStatus::Interrupted, {}};
                }
                continue;
            }
            return {LineStatus::Error, std::strerror(errno)};
        }

        if (ret == 0) {
            if (clock::now() >= deadline) {
                return {LineStatus::Timeout, {}};
            }
            continue;
        }

        if (nfds == 2 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            drain_stderr();
        }

        if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            fill_buffer(fd, buffer, eof);
        }
    }
}

void ChildProcess::drain_stderr() {
    fill_buffer(stderr_fd_, stderr_buffer_, stderr_eof_);
    if (stderr_buffer_.size() > kMaxStderrBuffer) {
        stderr_buffer_.erase(0, stderr_buffer_.size() - kMaxStderrBuffer);
    }
}

void ChildProcess::close_stdin() {
    close_fd(stdin_fd_);
}

bool ChildProcess::has_exited() {
    if (reaped_ || pid_ <= 0) {
        return true;
    }

    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        record_exit(status);
    } else if (result == -1 && errno == ECHILD) {
        // Reaped elsewhere; nothing left to wait for
        reaped_ = true;
    }
    return reaped_;
}

bool ChildProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (!has_exited()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

bool ChildProcess::terminate() {
    if (has_exited()) {
        return false;
    }
    signal_group(SIGTERM);
    return true;
}

void ChildProcess::kill_and_reap() {
    if (pid_ <= 0 || reaped_) {
        return;
    }

    signal_group(SIGKILL);

    // SIGKILL cannot be ignored; this wait is never abandoned
    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, 0);
    } while (result == -1 && errno == EINTR);

    if (result == pid_) {
        record_exit(status);
    } else {
        reaped_ = true;
    }
}

ChildProcess::ShutdownReport ChildProcess::shutdown(const ShutdownPolicy& policy) {
    ShutdownReport report;

    if (pid_ <= 0) {
        close_fds();
        return report;
    }

    if (has_exited()) {
        report.path = ExitPath::AlreadyExited;
    } else {
        // 1. EOF on stdin for a cooperative peer
        if (stdin_fd_ >= 0) {
            close_stdin();
            if (wait_for_exit(policy.stdin_grace)) {
                report.path = ExitPath::InputClosed;
            }
        }

        // 2. Graceful termination signal
        if (!has_exited()) {
            terminate();
            if (wait_for_exit(policy.terminate_grace)) {
                report.path = ExitPath::Terminated;
            }
        }

        // 3. Forced kill
        if (!has_exited()) {
            kill_and_reap();
            report.path = ExitPath::Killed;
        }
    }

    // 4. Release pipes and drop the association
    report.exit_status = exit_status_;
    close_fds();
    pid_ = -1;
    return report;
}

void ChildProcess::record_exit(int status) {
    reaped_ = true;
    exit_status_ = status;
}

void ChildProcess::close_fds() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

void ChildProcess::signal_group(int signal) {
    if (pid_ <= 0) {
        return;
    }
    // Child calls setpgid(0, 0); fall back to the pid if the group is gone
    if (::kill(-pid_, signal) == -1) {
        ::kill(pid_, signal);
    }
}

std::string ChildProcess::describe_status(int status) {
    if (status == -1) {
        return "unknown status";
    }
    if (WIFEXITED(status)) {
        return "exited with code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "status " + std::to_string(status);
}

const char* ChildProcess::to_string(ExitPath path) {
    switch (path) {
        case ExitPath::NotRunning:    return "not running";
        case ExitPath::AlreadyExited: return "already exited";
        case ExitPath::InputClosed:   return "exited after stdin closed";
        case ExitPath::Terminated:    return "terminated gracefully";
        case ExitPath::Killed:        return "killed forcefully";
    }
    return "unknown";
}

} // namespace mcp_stdio
