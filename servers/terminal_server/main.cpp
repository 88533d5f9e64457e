// ─────────────────────────────────────────────────────────────────────────────
// mcpmux-terminal-server - reference stdio MCP server
// ─────────────────────────────────────────────────────────────────────────────
// Tools:
//   run_command(command) -> stdout of `/bin/sh -c command`, followed by
//                           "\n--- Standard Error ---\n<stderr>" when the
//                           command wrote to stderr
//
// The command runs with the server's own privileges. No sandboxing.

#include <cxxopts.hpp>

#include "mcpmux/log/spdlog_logger.hpp"
#include "mcpmux/server/tool_server.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace mcpmux;

namespace {

constexpr const char* kNoOutput = "Command executed with no output.";
constexpr const char* kStderrSeparator = "\n--- Standard Error ---\n";

bool open_pipe(int fds[2]) {
#ifdef __linux__
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

void close_quietly(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct CommandOutput {
    std::string out;
    std::string err;
    int status = 0;
};

/// Run `command` through /bin/sh and collect both streams until the shell exits
tl::expected<CommandOutput, std::string> run_shell(const std::string& command) {
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (!open_pipe(out_pipe)) {
        return tl::unexpected(std::string("pipe: ") + std::strerror(errno));
    }
    if (!open_pipe(err_pipe)) {
        const int saved = errno;
        close_quietly(out_pipe[0]);
        close_quietly(out_pipe[1]);
        return tl::unexpected(std::string("pipe: ") + std::strerror(saved));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int saved = errno;
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1]}) {
            close_quietly(*fd);
        }
        return tl::unexpected(std::string("fork: ") + std::strerror(saved));
    }

    if (pid == 0) {
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    close_quietly(out_pipe[1]);
    close_quietly(err_pipe[1]);

    CommandOutput output;
    std::array<pollfd, 2> fds{{{out_pipe[0], POLLIN, 0}, {err_pipe[0], POLLIN, 0}}};
    std::array<std::string*, 2> sinks{&output.out, &output.err};
    char buffer[4096];

    int open_streams = 2;
    while (open_streams > 0) {
        const int ready = ::poll(fds.data(), fds.size(), -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            const ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }
    for (auto& fd : fds) {
        close_quietly(fd.fd);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    output.status = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return output;
}

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

ToolHandlerResult run_command(const Json& arguments, const LoggerPtr& logger) {
    if (!arguments.contains("command") || !arguments["command"].is_string()) {
        return tl::unexpected(std::string("run_command requires a string argument 'command'"));
    }
    const auto command = arguments["command"].get<std::string>();
    logger->info("Executing command: " + command);

    auto result = run_shell(command);
    if (!result) {
        logger->error("Failed to execute command: " + result.error());
        return CallToolResult::text("Error executing command: " + result.error());
    }

    std::string text = result->out;
    if (!result->err.empty()) {
        text += kStderrSeparator;
        text += result->err;
    }
    if (result->status != 0) {
        logger->debug("Command exited with status " + std::to_string(result->status));
    }
    return CallToolResult::text(is_blank(text) ? kNoOutput : text);
}

}  // namespace

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcpmux-terminal-server", "Terminal MCP server over stdio");
    options.add_options()
        ("log-level", "Log level (trace, debug, info, warn, error, off)",
            cxxopts::value<std::string>()->default_value("info"))
        ("h,help", "Print usage");

    LogLevel level = LogLevel::Info;
    try {
        auto parsed = options.parse(argc, argv);
        if (parsed.count("help")) {
            std::cerr << options.help() << "\n";
            return 0;
        }
        level = parse_log_level(parsed["log-level"].as<std::string>());
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    LoggerPtr logger = make_spdlog_stderr_logger(level);
    set_default_logger(logger);

    ToolServerOptions server_options;
    server_options.server_info = {"terminal_server", "1.0.0"};
    server_options.instructions = "Provides terminal access for command execution.";

    ToolServer server(server_options, logger);

    server.add_tool({
        "run_command",
        "Execute a shell command on the host system.",
        Json{
            {"type", "object"},
            {"properties", {{"command", {
                {"type", "string"},
                {"description", "The full command string to execute in the terminal."}
            }}}},
            {"required", Json::array({"command"})}
        },
        [logger](const Json& arguments) { return run_command(arguments, logger); }
    });

    logger->info("Starting Terminal MCP Server...");
    const int rc = server.serve();
    return rc;
}
