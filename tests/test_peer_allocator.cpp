#include <catch2/catch.hpp>

#include "core/errors.h"
#include "tunnel/peer_allocator.hpp"
#include "test_support.hpp"

#include <set>

TEST_CASE("Peers get sequential addresses after the local one", "[allocator]") {
    FakePeerBackend backend;
    PeerAllocator allocator(backend, "10.10.0.0/16", 51820);

    REQUIRE(allocator.server_address() == "10.10.0.1");
    REQUIRE(allocator.next_address() == "10.10.0.2");

    PeerConfig first = allocator.provision_peer("t1", peer_key(1));
    PeerConfig second = allocator.provision_peer("t2", peer_key(2));

    REQUIRE(first.server_ip == "10.10.0.1");
    REQUIRE(first.client_ip == "10.10.0.2");
    REQUIRE(first.port == 51820);
    REQUIRE(second.client_ip == "10.10.0.3");
    REQUIRE(first.public_key != second.public_key);
    REQUIRE_FALSE(first.private_key.empty());

    REQUIRE(backend.registered.size() == 2);
    REQUIRE(backend.registered[0] == std::make_pair(peer_key(1), std::string("10.10.0.2")));
    REQUIRE(allocator.active_peers() == 2);
}

TEST_CASE("A /30 block holds a single peer", "[allocator]") {
    FakePeerBackend backend;
    PeerAllocator allocator(backend, "192.168.50.0/30", 51820);

    PeerConfig peer = allocator.provision_peer("t1", peer_key(1));
    REQUIRE(peer.server_ip == "192.168.50.1");
    REQUIRE(peer.client_ip == "192.168.50.2");

    try {
        allocator.provision_peer("t2", peer_key(2));
        FAIL("expected exhaustion");
    } catch (const TunnelError& e) {
        REQUIRE(e.kind() == ErrorKind::AddressSpaceExhausted);
    }

    SECTION("Released addresses are not handed out again") {
        allocator.release_peer("t1");
        REQUIRE_THROWS_AS(allocator.provision_peer("t3", peer_key(3)), TunnelError);
    }
}

TEST_CASE("Addresses stay unique and inside the block", "[allocator]") {
    FakePeerBackend backend;
    PeerAllocator allocator(backend, "10.20.0.0/28", 51820);

    std::set<std::string> seen;
    for (int i = 0; i < 13; ++i) {
        PeerConfig peer = allocator.provision_peer("t" + std::to_string(i), peer_key(i));
        REQUIRE(seen.insert(peer.client_ip).second);
        if (i % 3 == 0) {
            allocator.release_peer("t" + std::to_string(i));
        }
    }

    // 10.20.0.2 .. 10.20.0.14 are all used; .15 is the broadcast address.
    REQUIRE(seen.count("10.20.0.14") == 1);
    REQUIRE(seen.count("10.20.0.15") == 0);
    REQUIRE_THROWS_AS(allocator.provision_peer("late", peer_key(40)), TunnelError);
}

TEST_CASE("Failed provisioning does not consume an address", "[allocator]") {
    FakePeerBackend backend;
    PeerAllocator allocator(backend, "10.10.0.0/24", 51820);

    SECTION("Registration failure") {
        backend.fail_register = true;
        try {
            allocator.provision_peer("t1", peer_key(1));
            FAIL("expected provisioning error");
        } catch (const TunnelError& e) {
            REQUIRE(e.kind() == ErrorKind::ProvisioningError);
        }
    }

    SECTION("Key generation failure") {
        backend.fail_keygen = true;
        REQUIRE_THROWS_AS(allocator.provision_peer("t1", peer_key(1)), TunnelError);
    }

    REQUIRE(allocator.next_address() == "10.10.0.2");
    REQUIRE(allocator.active_peers() == 0);

    backend.fail_register = false;
    backend.fail_keygen = false;
    REQUIRE(allocator.provision_peer("t1", peer_key(1)).client_ip == "10.10.0.2");
}

TEST_CASE("Duplicate peers are rejected", "[allocator]") {
    FakePeerBackend backend;
    PeerAllocator allocator(backend, "10.10.0.0/24", 51820);
    allocator.provision_peer("t1", peer_key(1));

    SECTION("Same tunnel id") {
        REQUIRE_THROWS_AS(allocator.provision_peer("t1", peer_key(2)), TunnelError);
    }
    SECTION("Same public key") {
        REQUIRE_THROWS_AS(allocator.provision_peer("t2", peer_key(1)), TunnelError);
    }
    REQUIRE(allocator.next_address() == "10.10.0.3");
}

TEST_CASE("Releasing peers", "[allocator]") {
    FakePeerBackend backend;
    PeerAllocator allocator(backend, "10.10.0.0/24", 51820);
    allocator.provision_peer("t1", peer_key(1));

    SECTION("Known peer is deregistered") {
        allocator.release_peer("t1");
        REQUIRE(backend.live.empty());
        REQUIRE(allocator.active_peers() == 0);
    }

    SECTION("Unknown peer") {
        try {
            allocator.release_peer("nope");
            FAIL("expected NotFound");
        } catch (const TunnelError& e) {
            REQUIRE(e.kind() == ErrorKind::NotFound);
        }
    }

    SECTION("Backend failure is reported") {
        backend.fail_deregister = true;
        try {
            allocator.release_peer("t1");
            FAIL("expected provisioning error");
        } catch (const TunnelError& e) {
            REQUIRE(e.kind() == ErrorKind::ProvisioningError);
        }
    }
}

TEST_CASE("Address blocks must leave room for a peer", "[allocator]") {
    FakePeerBackend backend;
    REQUIRE_THROWS_AS(PeerAllocator(backend, "10.10.0.0/31", 51820), std::invalid_argument);
    REQUIRE_THROWS_AS(PeerAllocator(backend, "not-a-block", 51820), std::invalid_argument);
}
