#include "config.h"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/network_v4.hpp>
#include <boost/system/system_error.hpp>

#include <cstdlib>
#include <stdexcept>

namespace {

std::string get_str(const EnvLookup& lookup, const std::string& name, const std::string& fallback) {
    auto value = lookup(name);
    return value ? *value : fallback;
}

// Unparseable values fall back to the default, as with unset variables.
int get_int(const EnvLookup& lookup, const std::string& name, int fallback) {
    auto value = lookup(name);
    if (!value) {
        return fallback;
    }
    try {
        size_t used = 0;
        int parsed = std::stoi(*value, &used);
        return used == value->size() ? parsed : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

void check_port(const char* what, int port) {
    if (port <= 0 || port > 65535) {
        throw std::invalid_argument(std::string("invalid ") + what + ": " + std::to_string(port));
    }
}

} // namespace

AgentConfig AgentConfig::from_environment() {
    return from_lookup([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

AgentConfig AgentConfig::from_lookup(const EnvLookup& p_lookup) {
    AgentConfig config;

    config.api_host = get_str(p_lookup, "API_HOST", config.api_host);
    config.api_port = get_int(p_lookup, "API_PORT", config.api_port);
    config.api_base_path = get_str(p_lookup, "API_BASE_PATH", config.api_base_path);

    config.public_host = get_str(p_lookup, "PUBLIC_HOST", config.public_host);
    config.public_port = get_int(p_lookup, "PUBLIC_PORT", config.public_port);
    config.tcp_port = get_int(p_lookup, "TCP_PORT", config.public_port + 1);

    config.tls_cert_path = get_str(p_lookup, "TLS_CERT_PATH", "");
    config.tls_key_path = get_str(p_lookup, "TLS_KEY_PATH", "");

    int max_tunnels = get_int(p_lookup, "MAX_TUNNELS", static_cast<int>(config.max_tunnels));
    if (max_tunnels <= 0) {
        throw std::invalid_argument("invalid MAX_TUNNELS: " + std::to_string(max_tunnels));
    }
    config.max_tunnels = static_cast<size_t>(max_tunnels);
    config.default_target_ip = get_str(p_lookup, "DEFAULT_TARGET_IP", config.default_target_ip);

    config.wg_interface = get_str(p_lookup, "WG_INTERFACE", config.wg_interface);
    config.wg_address_block = get_str(p_lookup, "WG_ADDRESS_BLOCK", config.wg_address_block);
    config.wg_listen_port = get_int(p_lookup, "WG_LISTEN_PORT", config.wg_listen_port);

    config.threads = get_int(p_lookup, "THREADS", config.threads);
    config.log_level = get_str(p_lookup, "LOG_LEVEL", config.log_level);
    config.shutdown_timeout = std::chrono::seconds(
        get_int(p_lookup, "SHUTDOWN_TIMEOUT_SECONDS", static_cast<int>(config.shutdown_timeout.count())));

    config.validate();
    return config;
}

void AgentConfig::validate() const {
    check_port("API port", api_port);
    check_port("public port", public_port);
    check_port("TCP port", tcp_port);
    check_port("WireGuard listen port", wg_listen_port);

    if (public_port == tcp_port) {
        throw std::invalid_argument("public port and TCP port must differ");
    }
    if (tls_cert_path.empty() != tls_key_path.empty()) {
        throw std::invalid_argument("both TLS certificate and key must be provided");
    }
    if (max_tunnels == 0) {
        throw std::invalid_argument("MAX_TUNNELS must be positive");
    }
    if (threads <= 0) {
        throw std::invalid_argument("THREADS must be positive");
    }
    if (shutdown_timeout.count() < 0) {
        throw std::invalid_argument("SHUTDOWN_TIMEOUT_SECONDS must not be negative");
    }
    if (api_base_path.empty() || api_base_path.front() != '/') {
        throw std::invalid_argument("API_BASE_PATH must start with '/'");
    }

    boost::system::error_code ec;
    boost::asio::ip::make_address(default_target_ip, ec);
    if (ec) {
        throw std::invalid_argument("invalid DEFAULT_TARGET_IP: " + default_target_ip);
    }

    try {
        auto block = boost::asio::ip::make_network_v4(wg_address_block);
        if (block.prefix_length() > 30) {
            throw std::invalid_argument("WG_ADDRESS_BLOCK " + wg_address_block + " is too small");
        }
    } catch (const boost::system::system_error&) {
        throw std::invalid_argument("invalid WG_ADDRESS_BLOCK: " + wg_address_block);
    }
}
