#include <catch2/catch.hpp>

#include "api/management_api.h"
#include "transport/request_handler.h"
#include "test_support.hpp"

namespace {

struct ApiFixture {
    FakePeerBackend backend;
    PeerAllocator allocator{backend, "10.10.0.0/24", 51820};
    TunnelRegistry registry{2, &allocator};
    RouteTable routes;
    ConnectionTracker tracker;
    TunnelService service{registry, routes, false, 80};
    ManagementApi api{service, tracker, "1.2.3"};
    RequestHandler handler;

    ApiFixture() {
        api.register_routes(handler, "/api");
    }

    HttpResponse call(const std::string& method, const std::string& path, const std::string& body = "") {
        ApiRequest request;
        request.method = method;
        request.path = path;
        request.body = body;

        HttpResponse result(0, "");
        handler.handle_request(request, 1, [&result](int32_t, const HttpResponse& response) {
            result = response;
        });
        return result;
    }

    HttpResponse create(const json& body) {
        return call("POST", "/api/new-tunnel", body.dump());
    }
};

} // namespace

TEST_CASE_METHOD(ApiFixture, "Creating tunnels over the API", "[api]") {
    SECTION("Plain tunnel") {
        HttpResponse response = create({{"tunnel_id", "a"}, {"hostname", "a.example.com"}, {"target_port", 3000},
                                         {"metadata", {{"team", "edge"}}}});
        REQUIRE(response.status_code == 201);
        REQUIRE(response.content_type == "application/json");

        auto body = json::parse(response.body);
        REQUIRE(body["tunnel_id"] == "a");
        REQUIRE(body["public_endpoint"] == "http://a.example.com");
        REQUIRE_FALSE(body.contains("wireguard_config"));
        REQUIRE(registry.get_tunnel("a").metadata.at("team") == "edge");
    }

    SECTION("Tunnel with a peer") {
        HttpResponse response = create({{"tunnel_id", "a"}, {"hostname", "a.example.com"}, {"target_port", 3000},
                                         {"wireguard_public_key", peer_key(1)}});
        REQUIRE(response.status_code == 201);

        auto config = json::parse(response.body)["wireguard_config"];
        REQUIRE(config["server_ip"] == "10.10.0.1");
        REQUIRE(config["client_ip"] == "10.10.0.2");
        REQUIRE(config["port"] == 51820);
        REQUIRE_FALSE(config["private_key"].get<std::string>().empty());
    }
}

TEST_CASE_METHOD(ApiFixture, "API error mapping", "[api]") {
    create({{"tunnel_id", "a"}, {"hostname", "a.example.com"}, {"target_port", 3000}});

    SECTION("Malformed JSON") {
        REQUIRE(call("POST", "/api/new-tunnel", "{not json").status_code == 400);
    }
    SECTION("Missing fields") {
        REQUIRE(create({{"tunnel_id", "b"}, {"target_port", 3000}}).status_code == 400);
    }
    SECTION("Wrong field type") {
        REQUIRE(create({{"tunnel_id", "b"}, {"hostname", "b.example.com"}, {"target_port", "3000"}}).status_code == 400);
    }
    SECTION("Port out of range") {
        REQUIRE(create({{"tunnel_id", "b"}, {"hostname", "b.example.com"}, {"target_port", 70000}}).status_code == 400);
        REQUIRE(create({{"tunnel_id", "b"}, {"hostname", "b.example.com"}, {"target_port", -1}}).status_code == 400);
    }
    SECTION("Port that wraps to a valid value when narrowed") {
        // 2^32 + 1 would become port 1 as a 32-bit int.
        HttpResponse response = create({{"tunnel_id", "b"}, {"hostname", "b.example.com"},
                                         {"target_port", 4294967297LL}});
        REQUIRE(response.status_code == 400);
        REQUIRE(routes.list_routes().size() == 1);
    }
    SECTION("Duplicate id") {
        HttpResponse response = create({{"tunnel_id", "a"}, {"hostname", "b.example.com"}, {"target_port", 3001}});
        REQUIRE(response.status_code == 409);
        auto body = json::parse(response.body);
        REQUIRE(body["error"] == "Conflict");
        REQUIRE(body["code"] == 409);
        REQUIRE_FALSE(body["details"].get<std::string>().empty());
    }
    SECTION("Capacity") {
        create({{"tunnel_id", "b"}, {"hostname", "b.example.com"}, {"target_port", 3001}});
        REQUIRE(create({{"tunnel_id", "c"}, {"hostname", "c.example.com"}, {"target_port", 3002}}).status_code == 503);
    }
    SECTION("Provisioning failure") {
        backend.fail_register = true;
        REQUIRE(create({{"tunnel_id", "b"}, {"hostname", "b.example.com"}, {"target_port", 3001},
                        {"wireguard_public_key", peer_key(2)}}).status_code == 500);
    }
    SECTION("Unknown tunnel on removal") {
        REQUIRE(call("POST", "/api/remove-tunnel", R"({"tunnel_id":"zzz"})").status_code == 404);
    }
    SECTION("Removal without an id") {
        REQUIRE(call("POST", "/api/remove-tunnel", "{}").status_code == 400);
    }
    SECTION("Wrong method") {
        REQUIRE(call("GET", "/api/new-tunnel").status_code == 405);
    }
}

TEST_CASE("Error kinds map to HTTP status codes", "[api]") {
    REQUIRE(ManagementApi::status_code_for(ErrorKind::Conflict) == 409);
    REQUIRE(ManagementApi::status_code_for(ErrorKind::NotFound) == 404);
    REQUIRE(ManagementApi::status_code_for(ErrorKind::CapacityExceeded) == 503);
    REQUIRE(ManagementApi::status_code_for(ErrorKind::AddressSpaceExhausted) == 503);
    REQUIRE(ManagementApi::status_code_for(ErrorKind::ProvisioningError) == 500);
}

TEST_CASE_METHOD(ApiFixture, "Removing tunnels over the API", "[api]") {
    create({{"tunnel_id", "a"}, {"hostname", "a.example.com"}, {"target_port", 3000}});

    HttpResponse response = call("POST", "/api/remove-tunnel", R"({"tunnel_id":"a"})");
    REQUIRE(response.status_code == 200);
    REQUIRE(json::parse(response.body)["success"] == true);
    REQUIRE(routes.size() == 0);
    REQUIRE(registry.size() == 0);
}

TEST_CASE_METHOD(ApiFixture, "Status and listing", "[api]") {
    create({{"tunnel_id", "a"}, {"hostname", "a.example.com"}, {"target_port", 3000}});
    auto connection = tracker.open(ConnectionKind::Http, nullptr);

    auto status = json::parse(call("GET", "/api/status").body);
    REQUIRE(status["status"] == "healthy");
    REQUIRE(status["version"] == "1.2.3");
    REQUIRE(status["num_tunnels"] == 1);
    REQUIRE(status["max_tunnels"] == 2);
    REQUIRE(status["active_connections"] == 1);
    REQUIRE_FALSE(status["uptime"].get<std::string>().empty());

    auto listing = json::parse(call("GET", "/api/tunnels").body);
    REQUIRE(listing["tunnels"].size() == 1);
    auto entry = listing["tunnels"][0];
    REQUIRE(entry["tunnel_id"] == "a");
    REQUIRE(entry["target_ip"] == "127.0.0.1");
    REQUIRE(entry["target_port"] == 3000);
    REQUIRE(entry["wireguard"] == false);
    REQUIRE(entry["created"].get<std::string>().back() == 'Z');
}

TEST_CASE("Duration formatting", "[api]") {
    using namespace std::chrono;
    REQUIRE(ManagementApi::format_duration(seconds(7)) == "7s");
    REQUIRE(ManagementApi::format_duration(seconds(125)) == "2m5s");
    REQUIRE(ManagementApi::format_duration(hours(3) + seconds(4)) == "3h0m4s");
}
