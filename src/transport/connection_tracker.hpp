#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>

enum class ConnectionKind {
    Http,
    Tcp
};

enum class ConnectionState {
    Accepted,
    Routing,
    Connecting,
    Streaming,
    Completed,
    Failed
};

const char* to_string(ConnectionKind p_kind);

class ActiveConnection {
public:
    using Closer = std::function<void()>;

    ActiveConnection(uint64_t id, ConnectionKind kind, Closer closer);

    uint64_t get_id() const { return connection_id_; }
    ConnectionKind get_kind() const { return kind_; }
    ConnectionState get_state() const { return state_; }
    void set_state(ConnectionState state);
    std::chrono::steady_clock::time_point get_start_time() const { return start_time_; }

    // Asks the owning session to close its sockets.
    void close();

private:
    uint64_t connection_id_;
    ConnectionKind kind_;
    std::atomic<ConnectionState> state_;
    std::chrono::steady_clock::time_point start_time_;
    Closer closer_;
};

// In-flight proxy connections. Sessions open an entry when accepted and
// complete it when they are destroyed.
class ConnectionTracker {
public:
    ConnectionTracker() = default;
    ConnectionTracker(const ConnectionTracker&) = delete;
    ConnectionTracker& operator=(const ConnectionTracker&) = delete;

    std::shared_ptr<ActiveConnection> open(ConnectionKind kind, ActiveConnection::Closer closer);
    void complete(uint64_t connection_id);

    size_t get_active_count() const;
    size_t get_active_count(ConnectionKind kind) const;

    // Returns the number of connections asked to close.
    size_t close_all();
    void log_statistics() const;

private:
    uint64_t generate_connection_id();

    mutable std::mutex mutex_;
    std::unordered_map<uint64_t, std::shared_ptr<ActiveConnection>> active_connections_;
    std::atomic<uint64_t> next_connection_id_{1};
};
