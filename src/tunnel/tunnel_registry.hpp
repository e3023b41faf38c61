#pragma once

#include "peer_allocator.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

using Metadata = std::map<std::string, std::string>;
using Clock = std::chrono::system_clock;

struct TunnelRecord {
    std::string id;
    std::string hostname;
    std::string target_ip;
    int target_port = 0;
    Clock::time_point created;
    Clock::time_point last_active;
    std::optional<PeerConfig> peer;
    Metadata metadata;
};

struct TunnelRequest {
    std::string id;
    std::string hostname;
    int target_port = 0;
    // Backend address for tunnels without a peer; empty means the registry default.
    std::string target_ip;
    std::string peer_public_key;
    Metadata metadata;
};

class TunnelRegistry {
public:
    // allocator may be null, in which case tunnels with a peer key are rejected.
    TunnelRegistry(size_t max_tunnels, PeerAllocator* allocator,
                   const std::string& default_target_ip = "127.0.0.1");
    TunnelRegistry(const TunnelRegistry&) = delete;
    TunnelRegistry& operator=(const TunnelRegistry&) = delete;

    TunnelRecord create_tunnel(const TunnelRequest& request);
    TunnelRecord create_tunnel(const std::string& id, const std::string& hostname, int target_port,
                               const std::string& peer_public_key = "",
                               const Metadata& metadata = {});
    void remove_tunnel(const std::string& id);

    TunnelRecord get_tunnel(const std::string& id) const;
    TunnelRecord get_tunnel_by_hostname(const std::string& hostname) const;
    bool contains(const std::string& id) const;

    void update_last_activity(const std::string& id);
    std::vector<TunnelRecord> list_tunnels() const;

    size_t size() const;
    size_t max_tunnels() const { return max_tunnels_; }

private:
    size_t max_tunnels_;
    PeerAllocator* allocator_;
    std::string default_target_ip_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, TunnelRecord> tunnels_;
    // Ids whose peer is being provisioned; they hold a capacity slot.
    std::unordered_set<std::string> pending_;
};
