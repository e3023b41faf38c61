#include <catch2/catch.hpp>

#include "core/errors.h"
#include "tunnel/tunnel_registry.hpp"
#include "test_support.hpp"

#include <atomic>
#include <thread>
#include <vector>

namespace {

ErrorKind create_error(TunnelRegistry& registry, const std::string& id, const std::string& key = "") {
    try {
        registry.create_tunnel(id, id + ".example.com", 8080, key);
    } catch (const TunnelError& e) {
        return e.kind();
    }
    FAIL("expected TunnelError");
    return ErrorKind::ProvisioningError;
}

} // namespace

TEST_CASE("Registry capacity", "[registry]") {
    TunnelRegistry registry(1, nullptr);

    registry.create_tunnel("a", "a.example.com", 8080);
    REQUIRE(create_error(registry, "b") == ErrorKind::CapacityExceeded);

    registry.remove_tunnel("a");
    REQUIRE(registry.create_tunnel("b", "b.example.com", 8080).id == "b");
    REQUIRE(registry.size() == 1);
}

TEST_CASE("Duplicate ids leave the existing record alone", "[registry]") {
    TunnelRegistry registry(10, nullptr);
    Metadata metadata = {{"owner", "ops"}};
    registry.create_tunnel("a", "a.example.com", 8080, "", metadata);

    REQUIRE(create_error(registry, "a") == ErrorKind::Conflict);

    TunnelRecord record = registry.get_tunnel("a");
    REQUIRE(record.hostname == "a.example.com");
    REQUIRE(record.target_port == 8080);
    REQUIRE(record.metadata == metadata);
}

TEST_CASE("Capacity is checked before uniqueness", "[registry]") {
    TunnelRegistry registry(1, nullptr);
    registry.create_tunnel("a", "a.example.com", 8080);
    REQUIRE(create_error(registry, "a") == ErrorKind::CapacityExceeded);
}

TEST_CASE("Record contents", "[registry]") {
    TunnelRegistry registry(10, nullptr, "192.168.1.10");

    SECTION("Plain tunnels use the default backend address") {
        TunnelRecord record = registry.create_tunnel("a", "a.example.com", 8080);
        REQUIRE(record.target_ip == "192.168.1.10");
        REQUIRE_FALSE(record.peer.has_value());
        REQUIRE(record.created == record.last_active);
    }

    SECTION("An explicit backend address wins") {
        TunnelRequest request;
        request.id = "a";
        request.hostname = "a.example.com";
        request.target_port = 8080;
        request.target_ip = "10.1.2.3";
        REQUIRE(registry.create_tunnel(request).target_ip == "10.1.2.3");
    }

    SECTION("Empty ids are rejected") {
        REQUIRE_THROWS_AS(registry.create_tunnel("", "a.example.com", 8080), std::invalid_argument);
    }
}

TEST_CASE("Tunnels with a peer", "[registry]") {
    FakePeerBackend backend;
    PeerAllocator allocator(backend, "10.10.0.0/16", 51820);
    TunnelRegistry registry(10, &allocator);

    TunnelRecord record = registry.create_tunnel("a", "a.example.com", 8080, peer_key(1));
    REQUIRE(record.peer.has_value());
    REQUIRE(record.peer->client_ip == "10.10.0.2");
    REQUIRE(record.target_ip == "10.10.0.2");

    SECTION("Removal releases the peer") {
        registry.remove_tunnel("a");
        REQUIRE(backend.live.empty());
        REQUIRE(allocator.active_peers() == 0);
    }

    SECTION("Removal succeeds when the peer cannot be released") {
        LogCapture logs;
        backend.fail_deregister = true;
        registry.remove_tunnel("a");
        REQUIRE_FALSE(registry.contains("a"));
        REQUIRE(logs.contains("Failed to remove peer for tunnel a"));
    }
}

TEST_CASE("Failed provisioning releases the reserved slot", "[registry]") {
    FakePeerBackend backend;
    PeerAllocator allocator(backend, "10.10.0.0/16", 51820);
    TunnelRegistry registry(1, &allocator);

    backend.fail_register = true;
    REQUIRE(create_error(registry, "a", peer_key(1)) == ErrorKind::ProvisioningError);
    REQUIRE(registry.size() == 0);
    REQUIRE_FALSE(registry.contains("a"));

    backend.fail_register = false;
    REQUIRE(registry.create_tunnel("a", "a.example.com", 8080, peer_key(1)).peer->client_ip == "10.10.0.2");
}

TEST_CASE("Peer keys need an allocator", "[registry]") {
    TunnelRegistry registry(10, nullptr);
    REQUIRE(create_error(registry, "a", peer_key(1)) == ErrorKind::ProvisioningError);
    REQUIRE(registry.size() == 0);
}

TEST_CASE("Registry lookups", "[registry]") {
    TunnelRegistry registry(10, nullptr);
    registry.create_tunnel("a", "a.example.com", 8080);

    REQUIRE(registry.get_tunnel_by_hostname("a.example.com").id == "a");
    REQUIRE_THROWS_AS(registry.get_tunnel("b"), TunnelError);
    REQUIRE_THROWS_AS(registry.get_tunnel_by_hostname("b.example.com"), TunnelError);
    REQUIRE_THROWS_AS(registry.remove_tunnel("b"), TunnelError);
    REQUIRE(registry.list_tunnels().size() == 1);
}

TEST_CASE("Last activity only moves forward", "[registry]") {
    TunnelRegistry registry(10, nullptr);
    TunnelRecord created = registry.create_tunnel("a", "a.example.com", 8080);

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    registry.update_last_activity("a");
    TunnelRecord updated = registry.get_tunnel("a");
    REQUIRE(updated.last_active > created.last_active);
    REQUIRE(updated.created == created.created);

    // Unknown ids are ignored.
    registry.update_last_activity("missing");
    REQUIRE(registry.size() == 1);
}

TEST_CASE("Concurrent creates never exceed capacity", "[registry][concurrency]") {
    FakePeerBackend backend;
    PeerAllocator allocator(backend, "10.10.0.0/16", 51820);
    TunnelRegistry registry(5, &allocator);

    std::atomic<int> created{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&, i]() {
            try {
                registry.create_tunnel("t" + std::to_string(i), "h" + std::to_string(i), 8080, peer_key(i));
                ++created;
            } catch (const TunnelError& e) {
                if (e.kind() == ErrorKind::CapacityExceeded) {
                    ++rejected;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(created == 5);
    REQUIRE(rejected == 11);
    REQUIRE(registry.size() == 5);
    REQUIRE(allocator.active_peers() == 5);
}
