#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// For the child-process transport, use: #include "mcpmux/transport/process_transport.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace mcpmux {

using Json = nlohmann::json;

/// Error type for transport operations
struct TransportError {
    enum class Category {
        Spawn,     // exec failed: not found, permission denied, fork/pipe failure
        Io,        // read/write failure, child closed its end, child exited
        Timeout,   // nothing arrived before the deadline
        Protocol,  // bytes arrived but were not a JSON message
        Closed,    // transport was never started or already stopped
        Cancelled  // the caller's cancel flag was raised while waiting
    };

    Category category{};
    std::string message;
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Spawn:    return "Spawn";
        case TransportError::Category::Io:       return "Io";
        case TransportError::Category::Timeout:  return "Timeout";
        case TransportError::Category::Protocol: return "Protocol";
        case TransportError::Category::Closed:   return "Closed";
        case TransportError::Category::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

/// Result type for transport operations
template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace mcpmux
