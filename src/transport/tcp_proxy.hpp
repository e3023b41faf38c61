#pragma once

#include "proxy_context.hpp"

#include <boost/asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <memory>

namespace net = boost::asio;
using tcp = net::ip::tcp;

// A client connection paired with its backend connection. Bytes are pumped in
// both directions until either side stops; then both sockets are closed.
class TcpTunnelSession : public std::enable_shared_from_this<TcpTunnelSession> {
public:
    static constexpr size_t PUMP_BUFFER_SIZE = 32 * 1024;

    TcpTunnelSession(tcp::socket client, const ProxyContext& context);
    ~TcpTunnelSession();

    void start();

private:
    using PumpBuffer = std::array<char, PUMP_BUFFER_SIZE>;

    void route();
    void connect_backend();
    void pump(tcp::socket& from, tcp::socket& to, PumpBuffer& buffer, uint64_t& counter);
    void note_activity();
    void close_both();

    tcp::socket client_;
    tcp::socket backend_;
    ProxyContext context_;
    std::shared_ptr<ActiveConnection> connection_;
    TargetPtr target_;
    int local_port_ = 0;

    PumpBuffer upstream_buffer_;
    PumpBuffer downstream_buffer_;
    uint64_t bytes_up_ = 0;
    uint64_t bytes_down_ = 0;
    bool closed_ = false;
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point last_activity_report_;
};

class TcpProxyServer {
public:
    explicit TcpProxyServer(net::io_context& io_context, const tcp::endpoint& endpoint,
                            RouteTable& routes, ConnectionTracker& tracker);

    void set_activity_handler(ActivityCB handler);
    void start();
    void stop();

    tcp::endpoint local_endpoint() const { return endpoint_; }

private:
    void accept_connections();

    net::io_context& io_context_;
    tcp::acceptor acceptor_;
    net::steady_timer accept_timer_;
    tcp::endpoint endpoint_;
    ProxyContext context_;
    std::atomic<bool> stopped_{false};
};
