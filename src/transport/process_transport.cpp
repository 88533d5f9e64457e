#include "mcpmux/transport/process_transport.hpp"
#include "mcpmux/log/logger.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

extern char** environ;

namespace mcpmux {

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds{10};
constexpr int kStderrPollMs = 100;

TransportError make_error(TransportError::Category cat, std::string msg) {
    return TransportError{cat, std::move(msg)};
}

std::string errno_message(const std::string& what, int err) {
    return what + ": " + std::strerror(err);
}

// Writing to a child that already exited must surface as EPIPE, not kill us
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

bool make_cloexec_pipe(int fds[2]) {
#if defined(__linux__)
    return ::pipe2(fds, O_CLOEXEC) == 0;
#else
    if (::pipe(fds) != 0) {
        return false;
    }
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

void close_fd(int& fd) {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

void close_pipe(int fds[2]) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

std::optional<int> decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return std::nullopt;
}

/// Poll waitpid until the child exits or the grace period runs out
bool wait_for_exit(pid_t pid, std::chrono::milliseconds grace, int& status) {
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (true) {
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            return true;
        }
        if (r == -1 && errno != EINTR) {
            // ECHILD: already reaped elsewhere
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }
}

/// parent environment with overrides applied, built before fork()
std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> out;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view kv(*entry);
        const auto eq = kv.find('=');
        const std::string key(kv.substr(0, eq));
        if (overrides.find(key) == overrides.end()) {
            out.emplace_back(kv);
        }
    }
    for (const auto& [key, value] : overrides) {
        out.push_back(key + "=" + value);
    }
    return out;
}

std::vector<char*> to_pointer_array(std::vector<std::string>& storage) {
    std::vector<char*> ptrs;
    ptrs.reserve(storage.size() + 1);
    for (auto& s : storage) {
        ptrs.push_back(s.data());
    }
    ptrs.push_back(nullptr);
    return ptrs;
}

}  // namespace

ProcessTransport::ProcessTransport(ProcessTransportConfig config)
    : config_(std::move(config))
{}

ProcessTransport::~ProcessTransport() {
    stop();
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> ProcessTransport::start() {
    std::lock_guard lock(mutex_);

    if (running_) {
        return tl::unexpected(make_error(TransportError::Category::Spawn, "Process already running"));
    }
    if (config_.command.empty()) {
        return tl::unexpected(make_error(TransportError::Category::Spawn, "Empty command"));
    }

    ignore_sigpipe_once();

    // Everything the child needs is allocated before fork(): after fork only
    // the calling thread exists, and malloc may be locked by another one.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(config_.args.size() + 1);
    argv_storage.push_back(config_.command);
    argv_storage.insert(argv_storage.end(), config_.args.begin(), config_.args.end());
    std::vector<char*> argv = to_pointer_array(argv_storage);

    std::vector<std::string> env_storage = build_environment(config_.env);
    std::vector<char*> envp = to_pointer_array(env_storage);

    const bool capture_stderr = (config_.stderr_handling == StderrHandling::Capture);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};

    const bool pipes_ok =
        make_cloexec_pipe(stdin_pipe) &&
        make_cloexec_pipe(stdout_pipe) &&
        make_cloexec_pipe(status_pipe) &&
        (!capture_stderr || make_cloexec_pipe(stderr_pipe));
    if (!pipes_ok) {
        const int err = errno;
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(status_pipe);
        close_pipe(stderr_pipe);
        return tl::unexpected(make_error(
            TransportError::Category::Spawn, errno_message("Failed to create pipes", err)));
    }

    const pid_t pid = ::fork();

    if (pid == -1) {
        const int err = errno;
        close_pipe(stdin_pipe);
        close_pipe(stdout_pipe);
        close_pipe(status_pipe);
        close_pipe(stderr_pipe);
        return tl::unexpected(make_error(
            TransportError::Category::Spawn, errno_message("Failed to fork", err)));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        ::dup2(stdin_pipe[0], STDIN_FILENO);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);

        switch (config_.stderr_handling) {
            case StderrHandling::Discard: {
                const int devnull = ::open("/dev/null", O_WRONLY);
                if (devnull != -1) {
                    ::dup2(devnull, STDERR_FILENO);
                    ::close(devnull);
                }
                break;
            }
            case StderrHandling::Capture:
                ::dup2(stderr_pipe[1], STDERR_FILENO);
                break;
            case StderrHandling::Passthrough:
                break;
        }

        // Ignored dispositions survive exec; give the server a normal SIGPIPE
        ::signal(SIGPIPE, SIG_DFL);

        environ = envp.data();
        ::execvp(argv[0], argv.data());

        const int err = errno;
        ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(status_pipe[1]);
    close_fd(stderr_pipe[1]);

    // EOF on the status pipe means exec succeeded (close-on-exec fired)
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n == -1 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        exit_code_ = decode_status(status);
        close_fd(stdin_pipe[1]);
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        return tl::unexpected(make_error(
            TransportError::Category::Spawn,
            errno_message("Failed to execute '" + config_.command + "'", exec_errno)));
    }

    child_pid_ = pid;
    stdin_fd_ = stdin_pipe[1];
    stdout_fd_ = stdout_pipe[0];
    running_ = true;
    reaped_ = false;
    exit_code_.reset();
    read_buffer_pos_ = 0;
    read_buffer_len_ = 0;
    partial_line_.clear();
    discarding_line_ = false;

    if (capture_stderr) {
        stderr_stop_ = false;
        stderr_thread_ = std::thread([this, fd = stderr_pipe[0]] { stderr_reader_loop(fd); });
    }

    MCPMUX_LOG_DEBUG("Started process " + config_.command + " (pid " + std::to_string(pid) + ")");
    return {};
}

void ProcessTransport::stop() {
    pid_t pid = -1;
    int stdin_fd = -1;
    int stdout_fd = -1;
    bool already_reaped = false;

    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return;
        }
        pid = child_pid_;
        stdin_fd = stdin_fd_;
        stdout_fd = stdout_fd_;
        already_reaped = reaped_;

        running_ = false;
        child_pid_ = -1;
        stdin_fd_ = -1;
        stdout_fd_ = -1;
        read_buffer_pos_ = 0;
        read_buffer_len_ = 0;
        partial_line_.clear();
        discarding_line_ = false;
    }

    // EOF on stdin is the polite shutdown request for a stdio server
    close_fd(stdin_fd);

    std::optional<int> code;
    if (pid > 0 && !already_reaped) {
        int status = 0;
        bool exited = wait_for_exit(pid, config_.shutdown_grace, status);
        if (!exited) {
            ::kill(pid, SIGTERM);
            exited = wait_for_exit(pid, config_.shutdown_grace, status);
        }
        if (!exited) {
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
            }
        }
        code = decode_status(status);
    }

    close_fd(stdout_fd);

    if (stderr_thread_.joinable()) {
        stderr_stop_ = true;
        stderr_thread_.join();
    }

    {
        std::lock_guard lock(mutex_);
        if (code) {
            exit_code_ = code;
        }
        reaped_ = true;
    }

    MCPMUX_LOG_DEBUG("Stopped process " + config_.command + " (pid " + std::to_string(pid) + ")");
}

bool ProcessTransport::is_running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

bool ProcessTransport::is_process_alive() {
    std::lock_guard lock(mutex_);
    reap_if_exited();
    return running_ && child_pid_ > 0 && !reaped_;
}

pid_t ProcessTransport::pid() const {
    std::lock_guard lock(mutex_);
    return child_pid_;
}

std::optional<int> ProcessTransport::exit_code() const {
    std::lock_guard lock(mutex_);
    return exit_code_;
}

void ProcessTransport::reap_if_exited() {
    // mutex_ held
    if (child_pid_ <= 0 || reaped_) {
        return;
    }
    int status = 0;
    if (::waitpid(child_pid_, &status, WNOHANG) == child_pid_) {
        exit_code_ = decode_status(status);
        reaped_ = true;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// I/O
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> ProcessTransport::send(const Json& message) {
    int fd = -1;
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return tl::unexpected(make_error(TransportError::Category::Closed, "Process not running"));
        }
        reap_if_exited();
        if (reaped_) {
            std::string msg = "Process exited";
            if (exit_code_) {
                msg += " with code " + std::to_string(*exit_code_);
            }
            return tl::unexpected(make_error(TransportError::Category::Io, msg));
        }
        fd = stdin_fd_;
    }

    // dump() escapes control characters, so the body never contains '\n'
    std::string data;
    try {
        data = message.dump();
    } catch (const Json::exception& e) {
        return tl::unexpected(make_error(
            TransportError::Category::Protocol, std::string("Failed to serialize message: ") + e.what()));
    }
    data.push_back('\n');

    const char* ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        const ssize_t written = ::write(fd, ptr, remaining);
        if (written == -1) {
            if (errno == EINTR) {
                continue;
            }
            return tl::unexpected(make_error(
                TransportError::Category::Io, errno_message("Failed to write to process", errno)));
        }
        ptr += written;
        remaining -= static_cast<std::size_t>(written);
    }
    return {};
}

TransportResult<Json> ProcessTransport::receive(std::chrono::milliseconds timeout) {
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            return tl::unexpected(make_error(TransportError::Category::Closed, "Process not running"));
        }
    }

    const bool has_deadline = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        while (read_buffer_pos_ < read_buffer_len_) {
            const char c = read_buffer_[read_buffer_pos_++];
            if (discarding_line_) {
                discarding_line_ = (c != '\n');
                continue;
            }
            if (c != '\n') {
                partial_line_.push_back(c);
                if (partial_line_.size() > config_.max_message_size) {
                    // Drop the rest of this line too
                    partial_line_.clear();
                    discarding_line_ = true;
                    return tl::unexpected(make_error(TransportError::Category::Protocol, "Message too large"));
                }
                continue;
            }

            std::string line;
            line.swap(partial_line_);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.find_first_not_of(" \t") == std::string::npos) {
                continue;
            }
            try {
                return Json::parse(line);
            } catch (const Json::exception& e) {
                return tl::unexpected(make_error(
                    TransportError::Category::Protocol, std::string("Failed to parse JSON: ") + e.what()));
            }
        }

        auto filled = fill_read_buffer(deadline, has_deadline);
        if (!filled) {
            return tl::unexpected(filled.error());
        }
    }
}

TransportResult<std::size_t> ProcessTransport::fill_read_buffer(
    std::chrono::steady_clock::time_point deadline, bool has_deadline)
{
    int fd = -1;
    {
        std::lock_guard lock(mutex_);
        fd = stdout_fd_;
    }
    if (fd == -1) {
        return tl::unexpected(make_error(TransportError::Category::Closed, "Process not running"));
    }

    // Without a deadline or a cancel flag the read below simply blocks
    const std::atomic<bool>* cancel = config_.cancel_flag;
    if (has_deadline || cancel != nullptr) {
        while (true) {
            if (cancel != nullptr && cancel->load()) {
                return tl::unexpected(make_error(TransportError::Category::Cancelled, "Read cancelled"));
            }

            int wait_ms = -1;
            if (has_deadline) {
                const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0) {
                    return tl::unexpected(make_error(TransportError::Category::Timeout, "Read timeout"));
                }
                wait_ms = static_cast<int>(remaining.count());
            }
            if (cancel != nullptr) {
                const int slice = static_cast<int>(std::max<long long>(1, config_.cancel_poll_interval.count()));
                wait_ms = wait_ms < 0 ? slice : std::min(wait_ms, slice);
            }

            struct pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLIN;
            const int r = ::poll(&pfd, 1, wait_ms);
            if (r > 0) {
                break;
            }
            // r == 0: the deadline and the cancel flag are re-checked above
            if (r == -1 && errno != EINTR) {
                return tl::unexpected(make_error(
                    TransportError::Category::Io, errno_message("poll failed", errno)));
            }
        }
    }

    ssize_t n;
    do {
        n = ::read(fd, read_buffer_, kReadBufferSize);
    } while (n == -1 && errno == EINTR);

    if (n < 0) {
        return tl::unexpected(make_error(
            TransportError::Category::Io, errno_message("Failed to read from process", errno)));
    }
    if (n == 0) {
        std::string msg = "Process closed connection";
        std::lock_guard lock(mutex_);
        reap_if_exited();
        if (exit_code_) {
            msg += " (exit code " + std::to_string(*exit_code_) + ")";
        }
        return tl::unexpected(make_error(TransportError::Category::Io, msg));
    }

    read_buffer_pos_ = 0;
    read_buffer_len_ = static_cast<std::size_t>(n);
    return read_buffer_len_;
}

// ─────────────────────────────────────────────────────────────────────────────
// stderr capture
// ─────────────────────────────────────────────────────────────────────────────

void ProcessTransport::stderr_reader_loop(int fd) {
    std::string pending;
    char buf[1024];

    auto emit = [this](std::string_view line) {
        if (!config_.stderr_callback) {
            return;
        }
        try {
            config_.stderr_callback(line);
        } catch (const std::exception& e) {
            MCPMUX_LOG_WARN(std::string("stderr callback threw: ") + e.what());
        }
    };

    while (!stderr_stop_) {
        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        const int r = ::poll(&pfd, 1, kStderrPollMs);
        if (r == 0 || (r == -1 && errno == EINTR)) {
            continue;
        }
        if (r == -1) {
            break;
        }
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n <= 0) {
            break;
        }
        pending.append(buf, static_cast<std::size_t>(n));

        std::size_t start = 0;
        for (auto nl = pending.find('\n'); nl != std::string::npos; nl = pending.find('\n', start)) {
            emit(std::string_view(pending).substr(start, nl - start));
            start = nl + 1;
        }
        pending.erase(0, start);
    }

    if (!pending.empty()) {
        emit(pending);
    }
    ::close(fd);
}

}  // namespace mcpmux
