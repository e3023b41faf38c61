#pragma once

#include "../core/errors.h"
#include "../core/tunnel_service.h"
#include "../transport/common.h"
#include "../transport/connection_tracker.hpp"

#include <chrono>
#include <string>

class RequestHandler;

// JSON handlers for the tunnel management endpoints.
class ManagementApi {
public:
    ManagementApi(TunnelService& service, const ConnectionTracker& tracker, const std::string& version);

    // Installs the endpoints under p_base_path (e.g. "/api").
    void register_routes(RequestHandler& p_handler, const std::string& p_base_path);

    HttpResponse create_tunnel(const ApiRequest& p_request);
    HttpResponse remove_tunnel(const ApiRequest& p_request);
    HttpResponse status() const;
    HttpResponse list_tunnels() const;

    static int status_code_for(ErrorKind p_kind);
    static std::string format_duration(std::chrono::steady_clock::duration p_duration);
    static std::string format_time(Clock::time_point p_time);

private:
    HttpResponse error_response(const TunnelError& p_error) const;

    TunnelService& service_;
    const ConnectionTracker& tracker_;
    std::string version_;
    std::chrono::steady_clock::time_point start_time_;
};
