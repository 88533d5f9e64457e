#pragma once

#include "mcpmux/client/client_error.hpp"
#include "mcpmux/client/session.hpp"
#include "mcpmux/log/logger.hpp"

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace mcpmux {

// ═══════════════════════════════════════════════════════════════════════════
// Connection Registry
// ═══════════════════════════════════════════════════════════════════════════
// Owns every Ready Session, in the order they were acquired, and closes them
// back-to-front.
//
// Lookups and iteration take a shared lock and may run from several threads;
// insert() and close_all() take the exclusive lock. find() and sessions()
// hand out shared ownership, so a caller still using a session when
// close_all() runs keeps a valid object: close() waits for its in-flight
// request and later requests fail with NotReady.

class ConnectionRegistry {
public:
    explicit ConnectionRegistry(LoggerPtr logger = nullptr);
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /// Take ownership of a Ready session. A rejected session (not Ready, or
    /// its name already registered) is closed before the error returns.
    [[nodiscard]] ClientResult<void> insert(std::unique_ptr<Session> session);

    /// nullptr when no session has that name
    [[nodiscard]] std::shared_ptr<Session> find(const std::string& name) const;

    /// Visit sessions in acquisition order, under the shared lock
    void for_each(const std::function<void(Session&)>& fn) const;

    /// Acquisition-order snapshot
    [[nodiscard]] std::vector<std::shared_ptr<Session>> sessions() const;

    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const;

    /// Close every session in reverse acquisition order and empty the
    /// registry. A failure while closing one session is logged and the rest
    /// are still closed. Returns how many sessions were closed.
    std::size_t close_all();

private:
    LoggerPtr logger_;
    mutable std::shared_mutex mutex_;
    std::vector<std::shared_ptr<Session>> sessions_;
};

}  // namespace mcpmux
