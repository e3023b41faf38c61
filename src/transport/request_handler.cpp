#include "request_handler.h"
#include "../utils/logger.h"

namespace {

const char* status_text(int code) {
    switch (code) {
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Error";
    }
}

} // namespace

void RequestHandler::register_route(std::string_view p_method,
                                    std::string_view p_path,
                                    RequestCB p_callback) {
    RouteKey key = {std::string(p_method), std::string(p_path)};
    route_handlers_[key] = std::move(p_callback);
    LOG_DEBUG("Registered route: " << p_method << " " << p_path);
}

void RequestHandler::handle_request(const ApiRequest& p_request,
                                    int32_t p_stream_id,
                                    ResponseSender p_sender) const {
    LOG_DEBUG("Processing " << p_request.method << " " << p_request.path);

    // Query strings do not take part in routing.
    std::string path = p_request.path.substr(0, p_request.path.find('?'));
    try
    {
        auto it = route_handlers_.find(RouteKey{p_request.method, path});
        if (it != route_handlers_.end()) {
            it->second(p_request, p_stream_id, p_sender);
            return;
        }
        handle_default_routes(p_request, p_stream_id, p_sender);
    }
    catch(const std::exception& e)
    {
        LOG_ERROR("Management request " << p_request.method << " " << path << " failed: " << e.what());
        p_sender(p_stream_id, error(500, "internal server error"));
    }
}

json RequestHandler::create_error_response(int code, const std::string& message)
{
    return {
        {"error", status_text(code)},
        {"code", code},
        {"details", message}
    };
}

HttpResponse RequestHandler::error(int code, const std::string& details)
{
    return HttpResponse(code, create_error_response(code, details).dump());
}

void RequestHandler::handle_default_routes(const ApiRequest& p_request,
                                           int32_t p_stream_id,
                                           ResponseSender p_sender) const {
    std::string path = p_request.path.substr(0, p_request.path.find('?'));
    if (path == "/health") {
        if (p_request.method == "GET") {
            json response = {
                {"status", "ok"}
            };
            p_sender(p_stream_id, HttpResponse(200, response.dump()));
        } else {
            p_sender(p_stream_id, error(405, "method not allowed"));
        }
        return;
    }

    for (const auto& [key, handler] : route_handlers_) {
        if (key.second == path) {
            p_sender(p_stream_id, error(405, "method not allowed"));
            return;
        }
    }

    LOG_DEBUG("No route found for: " << p_request.method << " " << path);
    p_sender(p_stream_id, error(404, "route not found"));
}
