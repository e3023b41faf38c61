#pragma once

#include "common.h"

#include <map>
#include <string>
#include <string_view>

// Exact-match routing of management requests by method and path.
class RequestHandler {
    public:
        RequestHandler() = default;

        void register_route(std::string_view p_method,
                            std::string_view p_path,
                            RequestCB p_callback);
        void handle_request(const ApiRequest& p_request,
                            int32_t p_stream_id,
                            ResponseSender p_sender) const;

        static json create_error_response(int code, const std::string& message);
        static HttpResponse error(int code, const std::string& details);
    private:
        void handle_default_routes(const ApiRequest& p_request,
                                   int32_t p_stream_id,
                                   ResponseSender p_sender) const;

    private:
        std::map<RouteKey, RequestCB> route_handlers_;
};
