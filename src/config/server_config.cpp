#include "mcpmux/config/server_config.hpp"

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace mcpmux {

namespace {

ConfigError make_error(ConfigError::Code code, std::string msg, std::string_view source) {
    return ConfigError{code, std::move(msg), std::string(source)};
}

// Tracks server names while the parser runs: the parsed document keeps only
// the last value for a repeated key, so duplicates must be caught here.
class DuplicateServerDetector {
public:
    bool operator()(int depth, OrderedJson::parse_event_t event, const OrderedJson& parsed) {
        if (event != OrderedJson::parse_event_t::key || !parsed.is_string()) {
            return true;
        }
        const auto& key = parsed.get_ref<const std::string&>();
        if (depth == 1) {
            in_servers_ = (key == kServersKey);
            if (in_servers_) {
                if (seen_servers_block_ && !duplicate_) {
                    duplicate_ = std::string(kServersKey);
                }
                seen_servers_block_ = true;
                names_.clear();
            }
        } else if (depth == 2 && in_servers_) {
            if (!names_.insert(key).second && !duplicate_) {
                duplicate_ = key;
            }
        }
        return true;
    }

    [[nodiscard]] const std::optional<std::string>& duplicate() const noexcept { return duplicate_; }

private:
    bool in_servers_ = false;
    bool seen_servers_block_ = false;
    std::set<std::string> names_;
    std::optional<std::string> duplicate_;
};

ConfigResult<std::vector<std::string>> parse_args(const OrderedJson& entry, const std::string& name,
                                                  std::string_view source) {
    std::vector<std::string> args;
    if (!entry.contains("args") || entry["args"].is_null()) {
        return args;
    }
    const OrderedJson& node = entry["args"];
    if (!node.is_array()) {
        return tl::unexpected(make_error(ConfigError::Code::Invalid,
            "server '" + name + "': 'args' must be an array of strings", source));
    }
    for (const auto& arg : node) {
        if (!arg.is_string()) {
            return tl::unexpected(make_error(ConfigError::Code::Invalid,
                "server '" + name + "': every entry of 'args' must be a string", source));
        }
        args.push_back(arg.get<std::string>());
    }
    return args;
}

ConfigResult<std::optional<std::map<std::string, std::string>>> parse_env(
    const OrderedJson& entry, const std::string& name, std::string_view source)
{
    if (!entry.contains("env") || entry["env"].is_null()) {
        return std::optional<std::map<std::string, std::string>>{};
    }
    const OrderedJson& node = entry["env"];
    if (!node.is_object()) {
        return tl::unexpected(make_error(ConfigError::Code::Invalid,
            "server '" + name + "': 'env' must be an object of strings", source));
    }
    std::map<std::string, std::string> env;
    for (const auto& [key, value] : node.items()) {
        if (!value.is_string()) {
            return tl::unexpected(make_error(ConfigError::Code::Invalid,
                "server '" + name + "': env value for '" + key + "' must be a string", source));
        }
        env.emplace(key, value.get<std::string>());
    }
    return std::optional<std::map<std::string, std::string>>{std::move(env)};
}

}  // namespace

std::string ServerDescriptor::command_line() const {
    std::string out = command;
    for (const auto& arg : args) {
        out += ' ';
        out += arg;
    }
    return out;
}

ConfigResult<ServerMap> servers_from_json(const OrderedJson& document, std::string_view source) {
    if (!document.is_object()) {
        return tl::unexpected(make_error(ConfigError::Code::Malformed,
            "top-level value must be an object", source));
    }

    ServerMap servers;
    if (!document.contains(kServersKey)) {
        return servers;
    }

    const OrderedJson& block = document.at(kServersKey);
    if (!block.is_object()) {
        return tl::unexpected(make_error(ConfigError::Code::Malformed,
            std::string("'") + kServersKey + "' must be an object", source));
    }

    for (const auto& [name, entry] : block.items()) {
        if (!entry.is_object()) {
            return tl::unexpected(make_error(ConfigError::Code::Malformed,
                "server '" + name + "' must be an object", source));
        }
        if (!entry.contains("command")) {
            return tl::unexpected(make_error(ConfigError::Code::Invalid,
                "server '" + name + "' is missing required field 'command'", source));
        }
        if (!entry["command"].is_string() || entry["command"].get_ref<const std::string&>().empty()) {
            return tl::unexpected(make_error(ConfigError::Code::Invalid,
                "server '" + name + "': 'command' must be a non-empty string", source));
        }

        auto args = parse_args(entry, name, source);
        if (!args) {
            return tl::unexpected(args.error());
        }
        auto env = parse_env(entry, name, source);
        if (!env) {
            return tl::unexpected(env.error());
        }

        ServerDescriptor descriptor;
        descriptor.name = name;
        descriptor.command = entry["command"].get<std::string>();
        descriptor.args = std::move(*args);
        descriptor.env = std::move(*env);
        servers[name] = std::move(descriptor);
    }
    return servers;
}

ConfigResult<ServerMap> parse_server_config(std::string_view text,
                                            const ConfigLoadOptions& options,
                                            std::string_view source) {
    DuplicateServerDetector detector;
    OrderedJson document;
    try {
        document = OrderedJson::parse(text.begin(), text.end(),
            [&detector](int depth, OrderedJson::parse_event_t event, OrderedJson& parsed) {
                return detector(depth, event, parsed);
            });
    } catch (const OrderedJson::parse_error& e) {
        return tl::unexpected(make_error(ConfigError::Code::Malformed,
            std::string("failed to parse JSON: ") + e.what(), source));
    }

    if (detector.duplicate() && !options.allow_duplicate_names) {
        return tl::unexpected(make_error(ConfigError::Code::Invalid,
            "duplicate server name '" + *detector.duplicate() + "'", source));
    }

    return servers_from_json(document, source);
}

ConfigResult<ServerMap> load_server_config(const std::string& path, const ConfigLoadOptions& options) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || std::filesystem::is_directory(path, ec)) {
        return tl::unexpected(make_error(ConfigError::Code::NotFound,
            "config file " + path + " not found", path));
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return tl::unexpected(make_error(ConfigError::Code::NotFound,
            "config file " + path + " could not be opened", path));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    return parse_server_config(buffer.str(), options, path);
}

}  // namespace mcpmux
