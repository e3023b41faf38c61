#pragma once

#include <nlohmann/json.hpp>
#include <nghttp2/nghttp2.h>

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

using json = nlohmann::json;

// A complete request received on the management listener.
struct ApiRequest {
    std::string method;
    std::string path;
    std::string authority;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse {
    int status_code = 200;
    std::string body;
    std::string content_type = "application/json";

    HttpResponse() = default;
    HttpResponse(int status, const std::string& response_body, const std::string& type = "application/json")
        : status_code(status), body(response_body), content_type(type) {}
};

using ResponseSender = std::function<void(int32_t stream_id, const HttpResponse& response)>;
using RequestCB = std::function<void(const ApiRequest& p_request,
                                     int32_t p_stream_id,
                                     ResponseSender p_sender)>;
using RouteKey = std::pair<std::string, std::string>; // {method, path}

template <size_t N>
nghttp2_nv make_nv_ls(const char (&name)[N], const std::string& value) {
    return {(uint8_t*)name, (uint8_t*)value.c_str(), (uint16_t)(N - 1),
            (uint16_t)value.size(), NGHTTP2_NV_FLAG_NONE};
}
