#pragma once

#include <string>

struct KeyPair {
    std::string private_key;
    std::string public_key;
};

// Operations the allocator needs from the encrypted link. Implementations
// report failures by throwing.
class PeerBackend {
public:
    virtual ~PeerBackend() = default;

    virtual KeyPair generate_key_pair() = 0;
    virtual void register_peer(const std::string& public_key, const std::string& allowed_ip) = 0;
    virtual void deregister_peer(const std::string& public_key) = 0;
};
