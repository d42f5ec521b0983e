#pragma once

#include "LaunchSpec.hpp"
#include <chrono>
#include <string>
#include <sys/types.h>

namespace mcp_stdio {

/**
 * @brief Timing of the two-phase shutdown sequence
 */
struct ShutdownPolicy {
    std::chrono::milliseconds stdin_grace{100};      // wait after closing stdin
    std::chrono::milliseconds terminate_grace{3000}; // wait after SIGTERM
};

/**
 * @brief Owns one spawned child process and its three pipes
 *
 * POSIX only. Reads are line-oriented and bounded by a timeout; writes are
 * synchronous. The destructor kills and reaps a child that is still alive,
 * so a ChildProcess never leaks a process.
 */
class ChildProcess {
public:
    enum class Stream {
        Output,  // child's stdout
        Error    // child's stderr
    };

    enum class LineStatus {
        Line,
        Timeout,
        Eof,
        Error,
        Interrupted
    };

    struct LineRead {
        LineStatus status;
        std::string text;  // line without terminator, or error text
    };

    /**
     * @brief How the process ended during shutdown()
     */
    enum class ExitPath {
        NotRunning,     // nothing was spawned
        AlreadyExited,  // exited before shutdown started
        InputClosed,    // exited after stdin EOF
        Terminated,     // exited after SIGTERM
        Killed          // required SIGKILL
    };

    struct ShutdownReport {
        ExitPath path = ExitPath::NotRunning;
        int exit_status = -1;  // raw waitpid() status
    };

    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /**
     * @brief Spawn the process with stdin/stdout/stderr redirected to pipes
     *
     * Exec failures are detected before returning.
     *
     * @param spec Executable, arguments and environment overrides
     * @param error Receives a diagnostic on failure (may be null)
     * @return true if the process is running
     */
    bool spawn(const LaunchSpec& spec, std::string* error);

    /**
     * @brief Check if a process is associated with this instance
     */
    bool is_spawned() const { return pid_ > 0; }

    pid_t pid() const { return pid_; }

    /**
     * @brief Write text followed by a newline to the child's stdin
     * @return false if stdin is closed or the write failed
     */
    bool write_line(const std::string& text);

    /**
     * @brief Read one line from stdout or stderr, bounded by timeout
     *
     * While waiting on stdout, stderr output is buffered so the child never
     * blocks on a full stderr pipe.
     */
    LineRead read_line(Stream stream, std::chrono::milliseconds timeout);

    /**
     * @brief Close the write end of the child's stdin (EOF for the child)
     */
    void close_stdin();

    /**
     * @brief Non-blocking exit check; reaps the child if it has exited
     */
    bool has_exited();

    /**
     * @brief Wait up to timeout for the child to exit
     * @return true if the child has exited and was reaped
     */
    bool wait_for_exit(std::chrono::milliseconds timeout);

    /**
     * @brief Send SIGTERM to the child's process group
     */
    bool terminate();

    /**
     * @brief Send SIGKILL and wait unconditionally for the child to exit
     */
    void kill_and_reap();

    /**
     * @brief Close stdin, then SIGTERM, then SIGKILL, then release pipes
     *
     * Safe to call repeatedly; later calls report NotRunning.
     */
    ShutdownReport shutdown(const ShutdownPolicy& policy);

    /**
     * @brief Raw waitpid() status of the reaped child, -1 if not reaped
     */
    int exit_status() const { return exit_status_; }

    /**
     * @brief Human readable form of a waitpid() status
     */
    static std::string describe_status(int status);

    static const char* to_string(ExitPath path);

private:
    void record_exit(int status);
    void close_fds();
    void signal_group(int signal);
    void drain_stderr();

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;

    std::string stdout_buffer_;
    std::string stderr_buffer_;
    bool stdout_eof_ = false;
    bool stderr_eof_ = false;

    bool reaped_ = false;
    int exit_status_ = -1;
};

} // namespace mcp_stdio
