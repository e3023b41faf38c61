#include <catch2/catch.hpp>

#include "core/errors.h"
#include "routing/route_table.hpp"

#include <atomic>
#include <functional>
#include <thread>
#include <vector>

namespace {

ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const TunnelError& e) {
        return e.kind();
    }
    FAIL("expected TunnelError");
    return ErrorKind::ProvisioningError;
}

} // namespace

TEST_CASE("Route conflicts and removal", "[routes]") {
    RouteTable table;

    table.add_route("t1", "a.example.com", "10.0.0.1", 8080);
    CHECK(kind_of([&] { table.add_route("t2", "a.example.com", "10.0.0.2", 8081); }) == ErrorKind::Conflict);
    CHECK(kind_of([&] { table.add_route("t2", "b.example.com", "10.0.0.2", 8080); }) == ErrorKind::Conflict);

    table.remove_route("t1");
    CHECK(kind_of([&] { table.lookup_by_host("a.example.com"); }) == ErrorKind::NotFound);
    CHECK(kind_of([&] { table.lookup_by_port(8080); }) == ErrorKind::NotFound);
    CHECK(table.size() == 0);
}

TEST_CASE("Route lookups", "[routes]") {
    RouteTable table;
    table.add_route("t1", "a.example.com", "10.0.0.1", 8080);

    SECTION("By hostname") {
        Target target = table.lookup_by_host("a.example.com");
        REQUIRE(target.tunnel_id == "t1");
        REQUIRE(target.ip == "10.0.0.1");
        REQUIRE(target.port == 8080);
    }

    SECTION("By port") {
        Target target = table.lookup_by_port(8080);
        REQUIRE(target.tunnel_id == "t1");
    }

    SECTION("Hostnames are case-insensitive") {
        REQUIRE(table.find_by_host("A.Example.COM") != nullptr);
        CHECK(kind_of([&] { table.add_route("t2", "A.EXAMPLE.com", "10.0.0.2", 9000); }) == ErrorKind::Conflict);
    }

    SECTION("Misses") {
        REQUIRE(table.find_by_host("b.example.com") == nullptr);
        REQUIRE(table.find_by_port(9090) == nullptr);
    }

    SECTION("Listing copies the hostname map") {
        auto routes = table.list_routes();
        REQUIRE(routes.size() == 1);
        REQUIRE(routes.at("a.example.com").ip == "10.0.0.1");
    }
}

TEST_CASE("A rejected route leaves the table unchanged", "[routes]") {
    RouteTable table;
    table.add_route("t1", "a.example.com", "10.0.0.1", 8080);

    // Free hostname, taken port: the hostname must not be installed either.
    CHECK(kind_of([&] { table.add_route("t2", "b.example.com", "10.0.0.2", 8080); }) == ErrorKind::Conflict);
    REQUIRE(table.find_by_host("b.example.com") == nullptr);
    REQUIRE(table.lookup_by_port(8080).tunnel_id == "t1");
    REQUIRE(table.size() == 1);
}

TEST_CASE("Routes without a port", "[routes]") {
    RouteTable table;
    table.add_route("t1", "a.example.com", "10.0.0.1", 0);
    table.add_route("t2", "b.example.com", "10.0.0.2", 0);

    REQUIRE(table.size() == 2);
    REQUIRE(table.find_by_port(0) == nullptr);
    REQUIRE(table.is_available("c.example.com", 0));
    REQUIRE_FALSE(table.is_available("a.example.com", 0));
}

TEST_CASE("Removing an unknown tunnel is a no-op", "[routes]") {
    RouteTable table;
    table.add_route("t1", "a.example.com", "10.0.0.1", 8080);
    table.remove_route("missing");
    REQUIRE(table.size() == 1);
}

TEST_CASE("Concurrent installs of one hostname admit a single winner", "[routes][concurrency]") {
    RouteTable table;
    std::atomic<int> installed{0};
    std::atomic<int> conflicts{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() {
            try {
                table.add_route("t" + std::to_string(i), "shared.example.com", "10.0.0.1", 10000 + i);
                ++installed;
            } catch (const TunnelError& e) {
                if (e.kind() == ErrorKind::Conflict) {
                    ++conflicts;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(installed == 1);
    REQUIRE(conflicts == 7);
    REQUIRE(table.size() == 1);
}
