#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

using EnvLookup = std::function<std::optional<std::string>(const std::string& p_name)>;

struct AgentConfig {
    // Management API
    std::string api_host = "0.0.0.0";
    int api_port = 8080;
    std::string api_base_path = "/api";

    // Public listeners
    std::string public_host = "0.0.0.0";
    int public_port = 443;
    int tcp_port = 444;

    // TLS is enabled when both paths are set
    std::string tls_cert_path;
    std::string tls_key_path;

    size_t max_tunnels = 100;
    std::string default_target_ip = "127.0.0.1";

    // WireGuard
    std::string wg_interface = "wg0";
    std::string wg_address_block = "10.10.0.0/16";
    int wg_listen_port = 51820;

    int threads = 4;
    std::string log_level = "info";
    std::chrono::seconds shutdown_timeout{30};

    bool tls_enabled() const { return !tls_cert_path.empty() && !tls_key_path.empty(); }

    // Throws std::invalid_argument when the result is not usable.
    void validate() const;

    static AgentConfig from_environment();
    static AgentConfig from_lookup(const EnvLookup& p_lookup);
};
