#pragma once

#include "../routing/route_table.hpp"
#include "../tunnel/tunnel_registry.hpp"

#include <mutex>
#include <string>
#include <vector>

struct TunnelInfo {
    TunnelRecord record;
    std::string public_endpoint;
};

// Tunnel lifecycle entry point. Keeps the registry and the route table in
// step: a route is installed only after its tunnel is committed and is
// removed before the tunnel is.
class TunnelService {
public:
    TunnelService(TunnelRegistry& registry, RouteTable& routes, bool tls_enabled, int public_port);
    TunnelService(const TunnelService&) = delete;
    TunnelService& operator=(const TunnelService&) = delete;

    // std::invalid_argument for malformed requests; TunnelError otherwise.
    TunnelInfo create_tunnel(const TunnelRequest& request);
    void remove_tunnel(const std::string& id);

    std::vector<TunnelInfo> list_tunnels() const;
    size_t tunnel_count() const { return registry_.size(); }
    size_t max_tunnels() const { return registry_.max_tunnels(); }

    std::string public_endpoint(const std::string& hostname) const;

private:
    TunnelRegistry& registry_;
    RouteTable& routes_;
    bool tls_enabled_;
    int public_port_;
    std::mutex lifecycle_mutex_;
};
