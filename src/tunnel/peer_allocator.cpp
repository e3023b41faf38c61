#include "peer_allocator.hpp"
#include "../core/errors.h"
#include "../utils/logger.h"

#include <boost/system/system_error.hpp>

#include <stdexcept>

using boost::asio::ip::address_v4;
using boost::asio::ip::network_v4;

namespace {

network_v4 parse_block(const std::string& address_block) {
    network_v4 network;
    try {
        network = boost::asio::ip::make_network_v4(address_block);
    } catch (const boost::system::system_error& e) {
        throw std::invalid_argument("invalid peer address block '" + address_block + "': " + e.what());
    }
    if (network.prefix_length() > 30) {
        throw std::invalid_argument("peer address block " + address_block + " is too small");
    }
    return network.canonical();
}

} // namespace

PeerAllocator::PeerAllocator(PeerBackend& backend, const std::string& address_block, int listen_port)
    : backend_(backend), network_(parse_block(address_block)), listen_port_(listen_port) {
    server_address_ = address_v4(network_.network().to_uint() + 1);
    next_address_ = address_v4(server_address_.to_uint() + 1);
    LOG_INFO("Peer address block " << network_.to_string() << ", local address " << server_address_);
}

PeerConfig PeerAllocator::provision_peer(const std::string& tunnel_id, const std::string& peer_public_key) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (peers_.count(tunnel_id)) {
        throw TunnelError(ErrorKind::Conflict, "peer for tunnel " + tunnel_id + " already exists");
    }
    for (const auto& [id, peer] : peers_) {
        if (peer.public_key == peer_public_key) {
            throw TunnelError(ErrorKind::Conflict, "public key already registered for tunnel " + id);
        }
    }

    if (next_address_.to_uint() >= network_.broadcast().to_uint()) {
        LOG_ERROR("Peer address block " << network_.to_string() << " exhausted, tunnel " << tunnel_id);
        throw TunnelError(ErrorKind::AddressSpaceExhausted,
                          "no addresses left in " + network_.to_string());
    }
    address_v4 candidate = next_address_;

    PeerConfig config;
    try {
        KeyPair keys = backend_.generate_key_pair();
        backend_.register_peer(peer_public_key, candidate.to_string());
        config.public_key = std::move(keys.public_key);
        config.private_key = std::move(keys.private_key);
    } catch (const std::exception& e) {
        LOG_ERROR("Peer provisioning failed for tunnel " << tunnel_id << ": " << e.what());
        throw TunnelError(ErrorKind::ProvisioningError,
                          std::string("failed to set up peer: ") + e.what());
    }

    next_address_ = address_v4(candidate.to_uint() + 1);
    peers_[tunnel_id] = ActivePeer{peer_public_key, candidate};

    config.server_ip = server_address_.to_string();
    config.client_ip = candidate.to_string();
    config.port = listen_port_;

    LOG_INFO("Added peer for tunnel " << tunnel_id << " at " << config.client_ip);
    return config;
}

void PeerAllocator::release_peer(const std::string& tunnel_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = peers_.find(tunnel_id);
    if (it == peers_.end()) {
        throw TunnelError(ErrorKind::NotFound, "no peer for tunnel " + tunnel_id);
    }
    ActivePeer peer = it->second;
    peers_.erase(it);

    try {
        backend_.deregister_peer(peer.public_key);
    } catch (const std::exception& e) {
        throw TunnelError(ErrorKind::ProvisioningError,
                          std::string("failed to remove peer: ") + e.what());
    }
    LOG_INFO("Removed peer for tunnel " << tunnel_id << " (" << peer.address << ")");
}

std::string PeerAllocator::next_address() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_address_.to_string();
}

size_t PeerAllocator::active_peers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.size();
}
