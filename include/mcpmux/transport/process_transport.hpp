#pragma once

#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "ProcessTransport is only available on POSIX-compatible systems (Linux, macOS, BSD)"
#endif

#include "mcpmux/transport.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace mcpmux {

// ═══════════════════════════════════════════════════════════════════════════
// Process Transport Configuration
// ═══════════════════════════════════════════════════════════════════════════

/// What happens to the child's stderr
enum class StderrHandling {
    Passthrough,  // Inherit the parent's stderr (default)
    Discard,      // Redirect to /dev/null
    Capture       // Pipe it back; each line is handed to stderr_callback
};

using StderrCallback = std::function<void(std::string_view line)>;

struct ProcessTransportConfig {
    std::string command;
    std::vector<std::string> args;

    /// Overrides merged onto the parent's environment
    std::map<std::string, std::string> env;

    StderrHandling stderr_handling{StderrHandling::Passthrough};
    StderrCallback stderr_callback;

    /// Upper bound on one newline-delimited message
    std::size_t max_message_size{1 << 20};

    /// How long stop() waits after closing stdin before SIGTERM, and again
    /// after SIGTERM before SIGKILL
    std::chrono::milliseconds shutdown_grace{500};

    /// Checked while receive() waits, including waits without a timeout.
    /// Raising it (from a signal handler, for instance) makes receive()
    /// return Cancelled within cancel_poll_interval. Not owned.
    const std::atomic<bool>* cancel_flag{nullptr};
    std::chrono::milliseconds cancel_poll_interval{100};
};

// ═══════════════════════════════════════════════════════════════════════════
// Process Transport
// ═══════════════════════════════════════════════════════════════════════════
// Owns one child process and the pipes bound to its stdin and stdout.
// Messages are newline-delimited JSON, one message per line.
//
// start() reports exec failures synchronously: the child writes errno to a
// close-on-exec pipe when execvp fails, so a missing or non-executable
// command is a Spawn error rather than an early EOF.
//
// All parent-side descriptors are close-on-exec, so transports started
// concurrently from several threads never leak their pipes into each other's
// children.
//
// send()/receive() are not meant to be interleaved by several callers; the
// Session on top serializes its requests.
//
// The first start() in a process sets SIGPIPE to SIG_IGN for the whole
// process, so that writing to a child that already exited fails with EPIPE
// instead of killing the host. An application that relies on its own
// SIGPIPE handler must reinstall it after the first start().

class ProcessTransport {
public:
    explicit ProcessTransport(ProcessTransportConfig config);
    ~ProcessTransport();

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;
    ProcessTransport(ProcessTransport&&) = delete;
    ProcessTransport& operator=(ProcessTransport&&) = delete;

    /// Spawn the child. Fails if already started.
    [[nodiscard]] TransportResult<void> start();

    /// Close stdin, wait, SIGTERM, wait, SIGKILL; reap the child; release
    /// every descriptor. Safe to call repeatedly and on a transport that was
    /// never started.
    void stop();

    [[nodiscard]] bool is_running() const;

    /// Non-blocking liveness check; reaps the child if it has exited
    [[nodiscard]] bool is_process_alive();

    /// Child pid, or -1 before start() / after stop()
    [[nodiscard]] pid_t pid() const;

    /// Exit status once the child has been reaped (negative = signal number)
    [[nodiscard]] std::optional<int> exit_code() const;

    [[nodiscard]] const ProcessTransportConfig& config() const noexcept { return config_; }

    /// Write one message followed by '\n'
    [[nodiscard]] TransportResult<void> send(const Json& message);

    /// Read one message. timeout 0 waits until a line, EOF, error or the
    /// cancel flag.
    [[nodiscard]] TransportResult<Json> receive(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

private:
    void stderr_reader_loop(int fd);
    void reap_if_exited();
    [[nodiscard]] TransportResult<std::size_t> fill_read_buffer(
        std::chrono::steady_clock::time_point deadline, bool has_deadline);

    ProcessTransportConfig config_;

    mutable std::mutex mutex_;
    pid_t child_pid_{-1};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    bool running_{false};
    bool reaped_{false};
    std::optional<int> exit_code_;

    // Only touched by the (single) reader
    static constexpr std::size_t kReadBufferSize = 8192;
    char read_buffer_[kReadBufferSize];
    std::size_t read_buffer_pos_{0};
    std::size_t read_buffer_len_{0};
    std::string partial_line_;
    bool discarding_line_{false};

    std::thread stderr_thread_;
    std::atomic<bool> stderr_stop_{false};
};

}  // namespace mcpmux
