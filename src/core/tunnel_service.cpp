#include "tunnel_service.h"
#include "errors.h"
#include "../utils/logger.h"

#include <boost/asio/ip/address.hpp>

#include <stdexcept>

TunnelService::TunnelService(TunnelRegistry& registry, RouteTable& routes, bool tls_enabled, int public_port)
    : registry_(registry), routes_(routes), tls_enabled_(tls_enabled), public_port_(public_port) {}

TunnelInfo TunnelService::create_tunnel(const TunnelRequest& request) {
    if (request.hostname.empty()) {
        throw std::invalid_argument("hostname must not be empty");
    }
    if (request.target_port < 1 || request.target_port > 65535) {
        throw std::invalid_argument("target_port must be between 1 and 65535");
    }
    if (!request.target_ip.empty()) {
        boost::system::error_code ec;
        boost::asio::ip::make_address(request.target_ip, ec);
        if (ec) {
            throw std::invalid_argument("target_ip is not an IP address: " + request.target_ip);
        }
    }

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!routes_.is_available(request.hostname, request.target_port)) {
        throw TunnelError(ErrorKind::Conflict,
                          "route for " + request.hostname + " or port " +
                          std::to_string(request.target_port) + " already exists");
    }

    TunnelRecord record = registry_.create_tunnel(request);
    try {
        routes_.add_route(record.id, record.hostname, record.target_ip, record.target_port);
    } catch (const std::exception& e) {
        LOG_ERROR("Route install failed for tunnel " << record.id << ", rolling back: " << e.what());
        registry_.remove_tunnel(record.id);
        throw;
    }

    TunnelInfo info;
    info.public_endpoint = public_endpoint(record.hostname);
    info.record = std::move(record);
    return info;
}

void TunnelService::remove_tunnel(const std::string& id) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!registry_.contains(id)) {
        throw TunnelError(ErrorKind::NotFound, "tunnel with ID " + id + " not found");
    }
    routes_.remove_route(id);
    registry_.remove_tunnel(id);
}

std::vector<TunnelInfo> TunnelService::list_tunnels() const {
    std::vector<TunnelInfo> result;
    for (auto& record : registry_.list_tunnels()) {
        TunnelInfo info;
        info.public_endpoint = public_endpoint(record.hostname);
        info.record = std::move(record);
        result.push_back(std::move(info));
    }
    return result;
}

std::string TunnelService::public_endpoint(const std::string& hostname) const {
    std::string endpoint = (tls_enabled_ ? "https://" : "http://") + RouteTable::normalize_host(hostname);
    int default_port = tls_enabled_ ? 443 : 80;
    if (public_port_ != default_port) {
        endpoint += ":" + std::to_string(public_port_);
    }
    return endpoint;
}
