#include "api/management_api.h"
#include "core/config.h"
#include "core/server.h"
#include "core/tunnel_service.h"
#include "routing/route_table.hpp"
#include "transport/connection_tracker.hpp"
#include "transport/http1_proxy.hpp"
#include "transport/request_handler.h"
#include "transport/tcp_proxy.hpp"
#include "tunnel/peer_allocator.hpp"
#include "tunnel/tunnel_registry.hpp"
#include "tunnel/wireguard_backend.hpp"
#include "utils/logger.h"

#include <boost/asio.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#ifndef TUNNEL_AGENT_VERSION
#define TUNNEL_AGENT_VERSION "dev"
#endif

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

tcp::endpoint make_endpoint(const std::string& host, int port) {
    return tcp::endpoint(net::ip::make_address(host), static_cast<unsigned short>(port));
}

} // namespace

int main() {
    AgentConfig config;
    try {
        config = AgentConfig::from_environment();
        config.validate();
    } catch (const std::exception& e) {
        LOG_ERROR("Invalid configuration: " << e.what());
        return 1;
    }

    Logger::instance().set_level(Logger::parse_level(config.log_level));

    LOG_INFO("Starting tunnel edge agent " << TUNNEL_AGENT_VERSION);
    LOG_INFO("Management: " << config.api_host << ":" << config.api_port << config.api_base_path
             << ", HTTP: " << config.public_host << ":" << config.public_port
             << ", TCP: " << config.public_host << ":" << config.tcp_port
             << ", Threads: " << config.threads);
    LOG_INFO("TLS: " << (config.tls_enabled() ? "Enabled" : "Disabled")
             << ", Max tunnels: " << config.max_tunnels);

    WireGuardBackend wireguard(config.wg_interface);
    PeerAllocator allocator(wireguard, config.wg_address_block, config.wg_listen_port);
    TunnelRegistry registry(config.max_tunnels, &allocator, config.default_target_ip);
    RouteTable routes;
    ConnectionTracker tracker;
    TunnelService service(registry, routes, config.tls_enabled(), config.public_port);

    RequestHandler handler;
    ManagementApi api(service, tracker, TUNNEL_AGENT_VERSION);
    api.register_routes(handler, config.api_base_path);

    // Sessions still queued on the context refer to the objects above, so the
    // context has to be destroyed first.
    net::io_context io_context(config.threads);

    std::unique_ptr<Server> management;
    std::unique_ptr<PublicHttpServer> http_proxy;
    std::unique_ptr<TcpProxyServer> tcp_proxy;
    try {
        auto api_endpoint = make_endpoint(config.api_host, config.api_port);
        auto http_endpoint = make_endpoint(config.public_host, config.public_port);
        auto tcp_endpoint = make_endpoint(config.public_host, config.tcp_port);

        if (config.tls_enabled()) {
            management = std::make_unique<Server>(io_context, api_endpoint,
                                                  config.tls_cert_path, config.tls_key_path);
            http_proxy = std::make_unique<PublicHttpServer>(io_context, http_endpoint, routes, tracker,
                                                            config.tls_cert_path, config.tls_key_path);
        } else {
            management = std::make_unique<Server>(io_context, api_endpoint);
            http_proxy = std::make_unique<PublicHttpServer>(io_context, http_endpoint, routes, tracker);
        }
        tcp_proxy = std::make_unique<TcpProxyServer>(io_context, tcp_endpoint, routes, tracker);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start listeners: " << e.what());
        return 1;
    }

    management->set_request_handler([&handler](const ApiRequest& p_request, int32_t p_stream_id,
                                               ResponseSender p_sender) {
        handler.handle_request(p_request, p_stream_id, p_sender);
    });
    auto on_activity = [&registry](const std::string& tunnel_id) {
        registry.update_last_activity(tunnel_id);
    };
    http_proxy->set_activity_handler(on_activity);
    tcp_proxy->set_activity_handler(on_activity);

    management->start();
    http_proxy->start();
    tcp_proxy->start();

    // SIGINT/SIGTERM stop the listeners; open connections then get the
    // shutdown window to drain before they are closed.
    net::steady_timer shutdown_timer(io_context);
    std::chrono::steady_clock::time_point deadline;
    std::function<void()> wait_for_drain = [&]() {
        if (tracker.get_active_count() > 0 && std::chrono::steady_clock::now() < deadline) {
            shutdown_timer.expires_after(std::chrono::milliseconds(250));
            shutdown_timer.async_wait([&](const boost::system::error_code&) {
                wait_for_drain();
            });
            return;
        }
        size_t closed = tracker.close_all();
        if (closed > 0) {
            LOG_WARN("Shutdown window expired, closed " << closed << " connections");
        }
        io_context.stop();
    };

    net::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signum) {
        if (ec) {
            return;
        }
        LOG_INFO("Received signal " << signum << ", shutting down...");
        management->stop();
        http_proxy->stop();
        tcp_proxy->stop();
        tracker.log_statistics();

        deadline = std::chrono::steady_clock::now() + config.shutdown_timeout;
        wait_for_drain();
    });

    std::vector<std::thread> thread_pool;
    thread_pool.reserve(config.threads);
    for (int i = 0; i < config.threads - 1; ++i) {
        thread_pool.emplace_back([&io_context]() {
            io_context.run();
        });
    }

    LOG_INFO("Tunnel edge agent ready");
    io_context.run();

    for (auto& t : thread_pool) {
        if (t.joinable()) {
            t.join();
        }
    }

    LOG_INFO("Shutdown complete");
    return 0;
}
