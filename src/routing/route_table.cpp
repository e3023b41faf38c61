#include "route_table.hpp"
#include "../core/errors.h"
#include "../utils/logger.h"

#include <algorithm>
#include <cctype>
#include <mutex>

std::string RouteTable::normalize_host(std::string_view hostname) {
    std::string host(hostname);
    std::transform(host.begin(), host.end(), host.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return host;
}

void RouteTable::add_route(const std::string& tunnel_id, const std::string& hostname,
                           const std::string& ip, int port) {
    auto host = normalize_host(hostname);

    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (host_routes_.count(host)) {
        LOG_WARN("Route conflict: hostname " << host << " already bound to "
                 << host_routes_[host]->tunnel_id << ", rejected for " << tunnel_id);
        throw TunnelError(ErrorKind::Conflict, "hostname " + host + " is already in use");
    }
    if (port > 0 && port_routes_.count(port)) {
        LOG_WARN("Route conflict: port " << port << " already bound to "
                 << port_routes_[port]->tunnel_id << ", rejected for " << tunnel_id);
        throw TunnelError(ErrorKind::Conflict, "port " + std::to_string(port) + " is already in use");
    }

    auto target = std::make_shared<const Target>(tunnel_id, ip, port);
    host_routes_[host] = target;
    if (port > 0) {
        port_routes_[port] = target;
    }

    LOG_INFO("Installed route: " << host << " port " << port << " -> "
             << ip << ":" << port << " (tunnel " << tunnel_id << ")");
}

void RouteTable::remove_route(const std::string& tunnel_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    size_t removed = 0;
    for (auto it = host_routes_.begin(); it != host_routes_.end();) {
        if (it->second->tunnel_id == tunnel_id) {
            it = host_routes_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    for (auto it = port_routes_.begin(); it != port_routes_.end();) {
        if (it->second->tunnel_id == tunnel_id) {
            it = port_routes_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        LOG_INFO("Removed " << removed << " route(s) for tunnel " << tunnel_id);
    }
}

Target RouteTable::lookup_by_host(std::string_view hostname) const {
    auto target = find_by_host(hostname);
    if (!target) {
        throw TunnelError(ErrorKind::NotFound,
                          "no tunnel found for hostname: " + std::string(hostname));
    }
    return *target;
}

Target RouteTable::lookup_by_port(int port) const {
    auto target = find_by_port(port);
    if (!target) {
        throw TunnelError(ErrorKind::NotFound, "no tunnel found for port: " + std::to_string(port));
    }
    return *target;
}

TargetPtr RouteTable::find_by_host(std::string_view hostname) const {
    auto host = normalize_host(hostname);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = host_routes_.find(host);
    return it != host_routes_.end() ? it->second : nullptr;
}

TargetPtr RouteTable::find_by_port(int port) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = port_routes_.find(port);
    return it != port_routes_.end() ? it->second : nullptr;
}

bool RouteTable::is_available(std::string_view hostname, int port) const {
    auto host = normalize_host(hostname);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (host_routes_.count(host)) {
        return false;
    }
    return port <= 0 || !port_routes_.count(port);
}

std::map<std::string, Target> RouteTable::list_routes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::map<std::string, Target> routes;
    for (const auto& [host, target] : host_routes_) {
        routes.emplace(host, *target);
    }
    return routes;
}

size_t RouteTable::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return host_routes_.size();
}
