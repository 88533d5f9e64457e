// ─────────────────────────────────────────────────────────────────────────────
// Server Configuration Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "mcpmux/config/server_config.hpp"

#include <filesystem>
#include <fstream>

#include <unistd.h>

using namespace mcpmux;

namespace {

class TempConfigFile {
public:
    explicit TempConfigFile(const std::string& contents)
        : path_(std::filesystem::temp_directory_path() /
                ("mcpmux_config_" + std::to_string(::getpid()) + "_" + std::to_string(counter_++) + ".json"))
    {
        std::ofstream out(path_);
        out << contents;
    }

    ~TempConfigFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    [[nodiscard]] std::string path() const { return path_.string(); }

private:
    static inline int counter_ = 0;
    std::filesystem::path path_;
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Valid Documents
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("parse_server_config reads command, args and env", "[config]") {
    auto result = parse_server_config(R"({
        "mcpServers": {
            "terminal": {
                "command": "mcpmux-terminal-server",
                "args": ["--log-level", "debug"],
                "env": {"TERM": "dumb"}
            },
            "echo": {"command": "mcpmux-echo-server"}
        }
    })");

    REQUIRE(result.has_value());
    REQUIRE(result->size() == 2);

    const auto& terminal = result->at("terminal");
    REQUIRE(terminal.name == "terminal");
    REQUIRE(terminal.command == "mcpmux-terminal-server");
    REQUIRE(terminal.args == std::vector<std::string>{"--log-level", "debug"});
    REQUIRE(terminal.env.has_value());
    REQUIRE(terminal.env->at("TERM") == "dumb");
    REQUIRE(terminal.command_line() == "mcpmux-terminal-server --log-level debug");

    const auto& echo = result->at("echo");
    REQUIRE(echo.args.empty());
    REQUIRE_FALSE(echo.env.has_value());
}

TEST_CASE("Descriptors keep declaration order", "[config]") {
    auto result = parse_server_config(R"({"mcpServers": {
        "zeta": {"command": "z"}, "alpha": {"command": "a"}, "mid": {"command": "m"}
    }})");
    REQUIRE(result.has_value());

    std::vector<std::string> names;
    for (const auto& [name, descriptor] : *result) {
        names.push_back(name);
    }
    REQUIRE(names == std::vector<std::string>{"zeta", "alpha", "mid"});
}

TEST_CASE("Missing or empty mcpServers yields no servers", "[config]") {
    auto missing = parse_server_config(R"({"other": 1})");
    REQUIRE(missing.has_value());
    REQUIRE(missing->empty());

    auto empty = parse_server_config(R"({"mcpServers": {}})");
    REQUIRE(empty.has_value());
    REQUIRE(empty->empty());
}

TEST_CASE("Null args and env are treated as absent", "[config]") {
    auto result = parse_server_config(R"({"mcpServers": {"s": {"command": "c", "args": null, "env": null}}})");
    REQUIRE(result.has_value());
    REQUIRE(result->at("s").args.empty());
    REQUIRE_FALSE(result->at("s").env.has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Malformed and Invalid Documents
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Unparsable JSON is Malformed", "[config][error]") {
    auto result = parse_server_config("{ not json", {}, "broken.json");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ConfigError::Code::Malformed);
    REQUIRE(result.error().source == "broken.json");
}

TEST_CASE("Wrong document shapes are Malformed", "[config][error]") {
    for (const char* text : {
             R"([1, 2, 3])",
             R"({"mcpServers": []})",
             R"({"mcpServers": {"s": "c"}})"}) {
        auto result = parse_server_config(text);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ConfigError::Code::Malformed);
    }
}

TEST_CASE("Unusable entries are Invalid", "[config][error]") {
    for (const char* text : {
             R"({"mcpServers": {"s": {}}})",
             R"({"mcpServers": {"s": {"command": ""}}})",
             R"({"mcpServers": {"s": {"command": 7}}})",
             R"({"mcpServers": {"s": {"command": "c", "args": "x"}}})",
             R"({"mcpServers": {"s": {"command": "c", "args": ["ok", 1]}}})",
             R"({"mcpServers": {"s": {"command": "c", "env": []}}})",
             R"({"mcpServers": {"s": {"command": "c", "env": {"A": 1}}}})"}) {
        auto result = parse_server_config(text);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ConfigError::Code::Invalid);
    }
}

TEST_CASE("Invalid entry names the server", "[config][error]") {
    auto result = parse_server_config(R"({"mcpServers": {"good": {"command": "c"}, "bad": {"args": []}}})");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().message.find("'bad'") != std::string::npos);
    REQUIRE(result.error().message.find("command") != std::string::npos);
}

// ═══════════════════════════════════════════════════════════════════════════
// Duplicate Names
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Duplicate server names are rejected by default", "[config][duplicates]") {
    constexpr const char* text = R"({"mcpServers": {
        "echo": {"command": "first"},
        "echo": {"command": "second"}
    }})";

    auto result = parse_server_config(text);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ConfigError::Code::Invalid);
    REQUIRE(result.error().message.find("echo") != std::string::npos);
}

TEST_CASE("Duplicate server names can be allowed, last wins", "[config][duplicates]") {
    constexpr const char* text = R"({"mcpServers": {
        "echo": {"command": "first"},
        "echo": {"command": "second"}
    }})";

    ConfigLoadOptions options;
    options.allow_duplicate_names = true;

    auto result = parse_server_config(text, options);
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 1);
    REQUIRE(result->at("echo").command == "second");
}

TEST_CASE("An allowed duplicate keeps the position of its first declaration", "[config][duplicates]") {
    constexpr const char* text = R"({"mcpServers": {
        "echo": {"command": "first"},
        "terminal": {"command": "t"},
        "echo": {"command": "second"}
    }})";

    ConfigLoadOptions options;
    options.allow_duplicate_names = true;

    auto result = parse_server_config(text, options);
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 2);
    REQUIRE(result->begin()->first == "echo");
    REQUIRE(result->begin()->second.command == "second");
}

TEST_CASE("Same key in nested objects is not a duplicate server", "[config][duplicates]") {
    auto result = parse_server_config(R"({"mcpServers": {
        "a": {"command": "c", "env": {"X": "1"}},
        "b": {"command": "c", "env": {"X": "2"}}
    }})");
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 2);
}

// ═══════════════════════════════════════════════════════════════════════════
// Files
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("load_server_config reads a file", "[config][file]") {
    TempConfigFile file(R"({"mcpServers": {"echo": {"command": "mcpmux-echo-server"}}})");

    auto result = load_server_config(file.path());
    REQUIRE(result.has_value());
    REQUIRE(result->at("echo").command == "mcpmux-echo-server");
}

TEST_CASE("load_server_config reports a missing file as NotFound", "[config][file]") {
    auto result = load_server_config("/nonexistent/dir/config.json");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ConfigError::Code::NotFound);
    REQUIRE(result.error().source == "/nonexistent/dir/config.json");
    REQUIRE(to_string(result.error().code) == "ConfigNotFound");
}

TEST_CASE("load_server_config reports a directory as NotFound", "[config][file]") {
    auto result = load_server_config(std::filesystem::temp_directory_path().string());
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ConfigError::Code::NotFound);
}

TEST_CASE("load_server_config propagates Malformed with the path", "[config][file]") {
    TempConfigFile file("mcpServers: echo");

    auto result = load_server_config(file.path());
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == ConfigError::Code::Malformed);
    REQUIRE(result.error().source == file.path());
}
