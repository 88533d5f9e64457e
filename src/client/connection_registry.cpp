#include "mcpmux/client/connection_registry.hpp"

#include <algorithm>
#include <mutex>

namespace mcpmux {

ConnectionRegistry::ConnectionRegistry(LoggerPtr logger)
    : logger_(logger_or_default(logger))
{}

ConnectionRegistry::~ConnectionRegistry() {
    close_all();
}

ClientResult<void> ConnectionRegistry::insert(std::unique_ptr<Session> session) {
    if (!session) {
        return tl::unexpected(ClientError::not_ready({}));
    }
    if (!session->is_ready()) {
        auto err = ClientError::not_ready(session->name());
        err.message = "Cannot register session in state " + std::string(to_string(session->state()));
        session->close();
        return tl::unexpected(std::move(err));
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    const bool taken = std::any_of(sessions_.begin(), sessions_.end(),
        [&](const auto& existing) { return existing->name() == session->name(); });
    if (taken) {
        auto err = ClientError::duplicate_server(session->name());
        lock.unlock();
        session->close();
        return tl::unexpected(std::move(err));
    }

    sessions_.push_back(std::move(session));
    return {};
}

std::shared_ptr<Session> ConnectionRegistry::find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& session : sessions_) {
        if (session->name() == name) {
            return session;
        }
    }
    return nullptr;
}

void ConnectionRegistry::for_each(const std::function<void(Session&)>& fn) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& session : sessions_) {
        fn(*session);
    }
}

std::vector<std::shared_ptr<Session>> ConnectionRegistry::sessions() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_;
}

std::vector<std::string> ConnectionRegistry::names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(sessions_.size());
    for (const auto& session : sessions_) {
        out.push_back(session->name());
    }
    return out;
}

std::size_t ConnectionRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.size();
}

bool ConnectionRegistry::empty() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.empty();
}

std::size_t ConnectionRegistry::close_all() {
    std::vector<std::shared_ptr<Session>> closing;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        closing.swap(sessions_);
    }

    std::size_t closed = 0;
    for (auto it = closing.rbegin(); it != closing.rend(); ++it) {
        const std::string name = (*it)->name();
        try {
            (*it)->close();
            ++closed;
        } catch (const std::exception& e) {
            logger_->error("Failed to close session '" + name + "': " + e.what());
        }
        it->reset();
    }
    return closed;
}

}  // namespace mcpmux
