#include "management_api.h"
#include "../transport/request_handler.h"
#include "../utils/logger.h"

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

json peer_to_json(const PeerConfig& peer) {
    return {
        {"public_key", peer.public_key},
        {"private_key", peer.private_key},
        {"server_ip", peer.server_ip},
        {"client_ip", peer.client_ip},
        {"port", peer.port}
    };
}

} // namespace

ManagementApi::ManagementApi(TunnelService& service, const ConnectionTracker& tracker,
                             const std::string& version)
    : service_(service), tracker_(tracker), version_(version),
      start_time_(std::chrono::steady_clock::now()) {}

void ManagementApi::register_routes(RequestHandler& p_handler, const std::string& p_base_path) {
    std::string base = p_base_path;
    if (!base.empty() && base.back() == '/') {
        base.pop_back();
    }

    p_handler.register_route("POST", base + "/new-tunnel",
        [this](const ApiRequest& p_request, int32_t p_stream_id, ResponseSender p_sender) {
            p_sender(p_stream_id, create_tunnel(p_request));
        });
    p_handler.register_route("POST", base + "/remove-tunnel",
        [this](const ApiRequest& p_request, int32_t p_stream_id, ResponseSender p_sender) {
            p_sender(p_stream_id, remove_tunnel(p_request));
        });
    p_handler.register_route("GET", base + "/status",
        [this](const ApiRequest&, int32_t p_stream_id, ResponseSender p_sender) {
            p_sender(p_stream_id, status());
        });
    p_handler.register_route("GET", base + "/tunnels",
        [this](const ApiRequest&, int32_t p_stream_id, ResponseSender p_sender) {
            p_sender(p_stream_id, list_tunnels());
        });
}

HttpResponse ManagementApi::create_tunnel(const ApiRequest& p_request) {
    TunnelRequest request;
    try {
        auto body = json::parse(p_request.body);
        request.id = body.value("tunnel_id", "");
        request.hostname = body.value("hostname", "");
        auto target_port = body.value("target_port", std::int64_t{0});
        if (target_port < 1 || target_port > 65535) {
            return RequestHandler::error(400, "target_port must be between 1 and 65535");
        }
        request.target_port = static_cast<int>(target_port);
        request.target_ip = body.value("target_ip", "");
        request.peer_public_key = body.value("wireguard_public_key", "");
        if (body.contains("metadata") && !body["metadata"].is_null()) {
            request.metadata = body["metadata"].get<Metadata>();
        }
    } catch (const json::exception& e) {
        LOG_DEBUG("Rejected new-tunnel body: " << e.what());
        return RequestHandler::error(400, "invalid request body");
    }

    if (request.id.empty() || request.hostname.empty()) {
        return RequestHandler::error(400, "missing required fields");
    }

    try {
        TunnelInfo info = service_.create_tunnel(request);

        json response = {
            {"tunnel_id", info.record.id},
            {"public_endpoint", info.public_endpoint}
        };
        if (info.record.peer) {
            response["wireguard_config"] = peer_to_json(*info.record.peer);
        }
        return HttpResponse(201, response.dump());
    } catch (const TunnelError& e) {
        return error_response(e);
    } catch (const std::invalid_argument& e) {
        return RequestHandler::error(400, e.what());
    }
}

HttpResponse ManagementApi::remove_tunnel(const ApiRequest& p_request) {
    std::string tunnel_id;
    try {
        tunnel_id = json::parse(p_request.body).value("tunnel_id", "");
    } catch (const json::exception& e) {
        LOG_DEBUG("Rejected remove-tunnel body: " << e.what());
        return RequestHandler::error(400, "invalid request body");
    }
    if (tunnel_id.empty()) {
        return RequestHandler::error(400, "missing tunnel ID");
    }

    try {
        service_.remove_tunnel(tunnel_id);
    } catch (const TunnelError& e) {
        return error_response(e);
    }

    json response = {
        {"success", true},
        {"message", "Tunnel removed successfully"}
    };
    return HttpResponse(200, response.dump());
}

HttpResponse ManagementApi::status() const {
    json response = {
        {"status", "healthy"},
        {"version", version_},
        {"uptime", format_duration(std::chrono::steady_clock::now() - start_time_)},
        {"num_tunnels", service_.tunnel_count()},
        {"max_tunnels", service_.max_tunnels()},
        {"active_connections", tracker_.get_active_count()}
    };
    return HttpResponse(200, response.dump());
}

HttpResponse ManagementApi::list_tunnels() const {
    json tunnels = json::array();
    for (const auto& info : service_.list_tunnels()) {
        const auto& record = info.record;
        json entry = {
            {"tunnel_id", record.id},
            {"hostname", record.hostname},
            {"target_ip", record.target_ip},
            {"target_port", record.target_port},
            {"public_endpoint", info.public_endpoint},
            {"created", format_time(record.created)},
            {"last_active", format_time(record.last_active)},
            {"wireguard", record.peer.has_value()},
            {"metadata", record.metadata}
        };
        tunnels.push_back(std::move(entry));
    }

    json response = {
        {"tunnels", tunnels}
    };
    return HttpResponse(200, response.dump());
}

int ManagementApi::status_code_for(ErrorKind p_kind) {
    switch (p_kind) {
        case ErrorKind::Conflict:
            return 409;
        case ErrorKind::NotFound:
            return 404;
        case ErrorKind::CapacityExceeded:
        case ErrorKind::AddressSpaceExhausted:
            return 503;
        case ErrorKind::ProvisioningError:
        case ErrorKind::BackendUnreachable:
            return 500;
    }
    return 500;
}

// Renders e.g. "2h5m17s"; leading zero units are omitted.
std::string ManagementApi::format_duration(std::chrono::steady_clock::duration p_duration) {
    auto total = std::chrono::duration_cast<std::chrono::seconds>(p_duration).count();
    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    auto seconds = total % 60;

    std::ostringstream out;
    if (hours > 0) {
        out << hours << "h";
    }
    if (hours > 0 || minutes > 0) {
        out << minutes << "m";
    }
    out << seconds << "s";
    return out.str();
}

std::string ManagementApi::format_time(Clock::time_point p_time) {
    std::time_t time = Clock::to_time_t(p_time);
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

HttpResponse ManagementApi::error_response(const TunnelError& p_error) const {
    int code = status_code_for(p_error.kind());
    if (code >= 500) {
        LOG_ERROR("Tunnel operation failed (" << to_string(p_error.kind()) << "): " << p_error.what());
    } else {
        LOG_INFO("Tunnel operation rejected (" << to_string(p_error.kind()) << "): " << p_error.what());
    }
    return RequestHandler::error(code, p_error.what());
}
