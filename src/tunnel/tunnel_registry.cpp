#include "tunnel_registry.hpp"
#include "../core/errors.h"
#include "../utils/logger.h"

#include <algorithm>
#include <mutex>
#include <stdexcept>

TunnelRegistry::TunnelRegistry(size_t max_tunnels, PeerAllocator* allocator,
                               const std::string& default_target_ip)
    : max_tunnels_(max_tunnels), allocator_(allocator), default_target_ip_(default_target_ip) {}

TunnelRecord TunnelRegistry::create_tunnel(const std::string& id, const std::string& hostname,
                                           int target_port, const std::string& peer_public_key,
                                           const Metadata& metadata) {
    TunnelRequest request;
    request.id = id;
    request.hostname = hostname;
    request.target_port = target_port;
    request.peer_public_key = peer_public_key;
    request.metadata = metadata;
    return create_tunnel(request);
}

TunnelRecord TunnelRegistry::create_tunnel(const TunnelRequest& request) {
    if (request.id.empty()) {
        throw std::invalid_argument("tunnel id must not be empty");
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (tunnels_.size() + pending_.size() >= max_tunnels_) {
            LOG_WARN("Tunnel limit reached (" << max_tunnels_ << "), rejected " << request.id);
            throw TunnelError(ErrorKind::CapacityExceeded,
                              "maximum number of tunnels (" + std::to_string(max_tunnels_) + ") reached");
        }
        if (tunnels_.count(request.id) || pending_.count(request.id)) {
            throw TunnelError(ErrorKind::Conflict, "tunnel with ID " + request.id + " already exists");
        }
        pending_.insert(request.id);
    }

    std::optional<PeerConfig> peer;
    if (!request.peer_public_key.empty()) {
        try {
            if (!allocator_) {
                throw TunnelError(ErrorKind::ProvisioningError, "peer provisioning is not configured");
            }
            peer = allocator_->provision_peer(request.id, request.peer_public_key);
        } catch (const std::exception&) {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            pending_.erase(request.id);
            throw;
        }
    }

    TunnelRecord record;
    record.id = request.id;
    record.hostname = request.hostname;
    record.target_port = request.target_port;
    if (peer) {
        record.target_ip = peer->client_ip;
    } else {
        record.target_ip = request.target_ip.empty() ? default_target_ip_ : request.target_ip;
    }
    record.created = Clock::now();
    record.last_active = record.created;
    record.peer = std::move(peer);
    record.metadata = request.metadata;

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        pending_.erase(request.id);
        tunnels_[record.id] = record;
    }

    LOG_INFO("Created tunnel " << record.id << " hostname=" << record.hostname
             << " target=" << record.target_ip << ":" << record.target_port
             << (record.peer ? " wireguard=yes" : ""));
    return record;
}

void TunnelRegistry::remove_tunnel(const std::string& id) {
    TunnelRecord record;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = tunnels_.find(id);
        if (it == tunnels_.end()) {
            throw TunnelError(ErrorKind::NotFound, "tunnel with ID " + id + " not found");
        }
        record = std::move(it->second);
        tunnels_.erase(it);
    }

    if (record.peer && allocator_) {
        try {
            allocator_->release_peer(id);
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to remove peer for tunnel " << id << ": " << e.what());
        }
    }

    LOG_INFO("Removed tunnel " << id);
}

TunnelRecord TunnelRegistry::get_tunnel(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tunnels_.find(id);
    if (it == tunnels_.end()) {
        throw TunnelError(ErrorKind::NotFound, "tunnel with ID " + id + " not found");
    }
    return it->second;
}

TunnelRecord TunnelRegistry::get_tunnel_by_hostname(const std::string& hostname) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& [id, record] : tunnels_) {
        if (record.hostname == hostname) {
            return record;
        }
    }
    throw TunnelError(ErrorKind::NotFound, "no tunnel found for hostname " + hostname);
}

bool TunnelRegistry::contains(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tunnels_.count(id) > 0;
}

void TunnelRegistry::update_last_activity(const std::string& id) {
    auto now = Clock::now();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = tunnels_.find(id);
    if (it != tunnels_.end()) {
        it->second.last_active = std::max(it->second.last_active, now);
    }
}

std::vector<TunnelRecord> TunnelRegistry::list_tunnels() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<TunnelRecord> records;
    records.reserve(tunnels_.size());
    for (const auto& [id, record] : tunnels_) {
        records.push_back(record);
    }
    return records;
}

size_t TunnelRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tunnels_.size();
}
