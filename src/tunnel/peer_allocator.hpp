#pragma once

#include "peer_backend.hpp"

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/network_v4.hpp>

#include <mutex>
#include <string>
#include <unordered_map>

struct PeerConfig {
    std::string public_key;
    std::string private_key;
    std::string server_ip;
    std::string client_ip;
    int port = 0;
};

// Hands out peer addresses sequentially from a fixed block. The first host
// address belongs to the local interface; peers start at the one after it.
// Addresses are never reused, so the block bounds the lifetime number of peers.
class PeerAllocator {
public:
    PeerAllocator(PeerBackend& backend, const std::string& address_block, int listen_port);
    PeerAllocator(const PeerAllocator&) = delete;
    PeerAllocator& operator=(const PeerAllocator&) = delete;

    // Throws TunnelError: AddressSpaceExhausted, ProvisioningError, or
    // Conflict for an id or public key that already has a live peer.
    PeerConfig provision_peer(const std::string& tunnel_id, const std::string& peer_public_key);

    // Throws TunnelError(NotFound) for unknown ids and
    // TunnelError(ProvisioningError) when the backend rejects the removal.
    void release_peer(const std::string& tunnel_id);

    std::string server_address() const { return server_address_.to_string(); }
    std::string next_address() const;
    size_t active_peers() const;

private:
    struct ActivePeer {
        std::string public_key;
        boost::asio::ip::address_v4 address;
    };

    PeerBackend& backend_;
    boost::asio::ip::network_v4 network_;
    boost::asio::ip::address_v4 server_address_;
    boost::asio::ip::address_v4 next_address_;
    int listen_port_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ActivePeer> peers_;
};
