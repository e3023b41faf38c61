#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

struct Target {
    std::string tunnel_id;
    std::string ip;
    int port;

    Target(const std::string& id, const std::string& address, int target_port)
        : tunnel_id(id), ip(address), port(target_port) {}
};

using TargetPtr = std::shared_ptr<const Target>;

// Hostname and port routes for the public listeners. Lookups take a shared
// lock, mutations an exclusive one.
class RouteTable {
public:
    RouteTable() = default;
    RouteTable(const RouteTable&) = delete;
    RouteTable& operator=(const RouteTable&) = delete;

    // Throws TunnelError(Conflict) if the hostname, or a positive port, is
    // already bound. Nothing is installed in that case.
    void add_route(const std::string& tunnel_id, const std::string& hostname,
                   const std::string& ip, int port);
    void remove_route(const std::string& tunnel_id);

    // Throw TunnelError(NotFound) on miss.
    Target lookup_by_host(std::string_view hostname) const;
    Target lookup_by_port(int port) const;

    // nullptr on miss.
    TargetPtr find_by_host(std::string_view hostname) const;
    TargetPtr find_by_port(int port) const;

    bool is_available(std::string_view hostname, int port) const;
    std::map<std::string, Target> list_routes() const;
    size_t size() const;

    static std::string normalize_host(std::string_view hostname);

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, TargetPtr> host_routes_;
    std::unordered_map<int, TargetPtr> port_routes_;
};
