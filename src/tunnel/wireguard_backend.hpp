#pragma once

#include "peer_backend.hpp"

#include <string>
#include <string_view>
#include <vector>

// WireGuard peers on a local interface. Keys are X25519 pairs generated with
// OpenSSL; peers are added and removed through the `wg` tool.
class WireGuardBackend : public PeerBackend {
public:
    explicit WireGuardBackend(const std::string& interface_name, const std::string& wg_binary = "wg");

    KeyPair generate_key_pair() override;
    void register_peer(const std::string& public_key, const std::string& allowed_ip) override;
    void deregister_peer(const std::string& public_key) override;

    // A WireGuard key is 32 bytes, base64 encoded with padding (44 chars).
    static bool is_valid_key(std::string_view key);

private:
    void run_wg(const std::vector<std::string>& args) const;

    std::string interface_name_;
    std::string wg_binary_;
};
