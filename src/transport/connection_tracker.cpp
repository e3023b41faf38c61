#include "connection_tracker.hpp"
#include "../utils/logger.h"

#include <vector>

const char* to_string(ConnectionKind p_kind) {
    return p_kind == ConnectionKind::Http ? "http" : "tcp";
}

ActiveConnection::ActiveConnection(uint64_t id, ConnectionKind kind, Closer closer)
    : connection_id_(id), kind_(kind), state_(ConnectionState::Accepted),
      start_time_(std::chrono::steady_clock::now()), closer_(std::move(closer)) {
}

void ActiveConnection::set_state(ConnectionState state) {
    state_ = state;
    LOG_DEBUG("Connection " << connection_id_ << " state: " << static_cast<int>(state));
}

void ActiveConnection::close() {
    if (closer_) {
        closer_();
    }
}

std::shared_ptr<ActiveConnection> ConnectionTracker::open(ConnectionKind kind, ActiveConnection::Closer closer) {
    uint64_t id = generate_connection_id();
    auto connection = std::make_shared<ActiveConnection>(id, kind, std::move(closer));

    std::lock_guard<std::mutex> lock(mutex_);
    active_connections_[id] = connection;

    LOG_DEBUG("Opened " << to_string(kind) << " connection " << id
              << ", total active: " << active_connections_.size());
    return connection;
}

void ConnectionTracker::complete(uint64_t connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_connections_.find(connection_id);
    if (it != active_connections_.end()) {
        if (it->second->get_state() != ConnectionState::Failed) {
            it->second->set_state(ConnectionState::Completed);
        }
        active_connections_.erase(it);
        LOG_DEBUG("Completed connection " << connection_id
                  << ", remaining active: " << active_connections_.size());
    }
}

size_t ConnectionTracker::get_active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_connections_.size();
}

size_t ConnectionTracker::get_active_count(ConnectionKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [id, connection] : active_connections_) {
        if (connection->get_kind() == kind) {
            ++count;
        }
    }
    return count;
}

size_t ConnectionTracker::close_all() {
    std::vector<std::shared_ptr<ActiveConnection>> connections;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections.reserve(active_connections_.size());
        for (const auto& [id, connection] : active_connections_) {
            connections.push_back(connection);
        }
    }

    // Closers post to the session executors, so call them without the lock.
    for (auto& connection : connections) {
        connection->close();
    }
    if (!connections.empty()) {
        LOG_WARN("Force-closed " << connections.size() << " active connection(s)");
    }
    return connections.size();
}

void ConnectionTracker::log_statistics() const {
    LOG_INFO("Active connections: " << get_active_count(ConnectionKind::Http) << " http, "
             << get_active_count(ConnectionKind::Tcp) << " tcp");
}

uint64_t ConnectionTracker::generate_connection_id() {
    return next_connection_id_.fetch_add(1);
}
