#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Server Configuration
// ═══════════════════════════════════════════════════════════════════════════
// Loads the set of stdio servers to launch:
//
//   {
//     "mcpServers": {
//       "echo":     { "command": "mcpmux-echo-server" },
//       "terminal": { "command": "mcpmux-terminal-server",
//                     "args": ["--verbose"],
//                     "env": { "TERM": "dumb" } }
//     }
//   }
//
// Loading is all-or-nothing: on any error no descriptor is returned.
// Servers keep the order they are declared in; that order is the connection
// order and decides which server wins when two advertise the same tool.

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpmux {

using Json = nlohmann::json;
using OrderedJson = nlohmann::ordered_json;

inline constexpr const char* kServersKey = "mcpServers";

/// How to launch one named server
struct ServerDescriptor {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::optional<std::map<std::string, std::string>> env;

    /// "command arg1 arg2", for log lines
    [[nodiscard]] std::string command_line() const;
};

/// Keyed by server name, iterated in declaration order
using ServerMap = nlohmann::ordered_map<std::string, ServerDescriptor>;

struct ConfigError {
    enum class Code {
        NotFound,   // File missing or unreadable
        Malformed,  // Not JSON, or the wrong JSON shape
        Invalid     // Well-formed, but an entry is unusable
    };

    Code code;
    std::string message;
    std::string source;  // Path, or "<memory>"
};

[[nodiscard]] constexpr std::string_view to_string(ConfigError::Code code) noexcept {
    switch (code) {
        case ConfigError::Code::NotFound:  return "ConfigNotFound";
        case ConfigError::Code::Malformed: return "ConfigMalformed";
        case ConfigError::Code::Invalid:   return "ConfigInvalid";
    }
    return "Unknown";
}

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

struct ConfigLoadOptions {
    /// false: a repeated server name is ConfigInvalid.
    /// true: the later entry replaces the earlier one.
    bool allow_duplicate_names = false;
};

[[nodiscard]] ConfigResult<ServerMap> parse_server_config(
    std::string_view text,
    const ConfigLoadOptions& options = {},
    std::string_view source = "<memory>"
);

[[nodiscard]] ConfigResult<ServerMap> load_server_config(
    const std::string& path,
    const ConfigLoadOptions& options = {}
);

/// Validate an already-parsed document (no duplicate detection possible)
[[nodiscard]] ConfigResult<ServerMap> servers_from_json(
    const OrderedJson& document,
    std::string_view source = "<memory>"
);

}  // namespace mcpmux
