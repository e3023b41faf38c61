#pragma once

#include "proxy_context.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

// One client connection on the public HTTP listener. Each request is routed
// by its Host header and relayed to the tunnel backend over a fresh
// connection. Request and response bodies are streamed in fixed-size chunks;
// an accepted protocol upgrade turns the pair into a raw byte tunnel.
template <class Stream>
class PublicHttpSession : public std::enable_shared_from_this<PublicHttpSession<Stream>> {
public:
    static constexpr size_t RELAY_BUFFER_SIZE = 32 * 1024;

    PublicHttpSession(tcp::socket socket, ssl::context* ssl_context, const ProxyContext& context);
    ~PublicHttpSession();

    void start();

private:
    void handshake();
    void read_request();
    void handle_request();
    void connect_backend();
    void write_backend_request();
    void relay_request_body();
    void write_request_chunk();
    void read_backend_header();
    void write_response_header();
    void relay_body();
    void write_body_chunk();
    void finish_exchange();
    void start_upgraded_tunnel();
    void pump_upstream();
    void pump_downstream();
    void end_tunnel(beast::error_code ec);
    void note_activity();
    void send_error(http::status status, const std::string& text);
    void close_backend();
    void close_client();
    void force_close();

    Stream stream_;
    ProxyContext context_;
    bool secure_;
    std::shared_ptr<ActiveConnection> connection_;

    beast::flat_buffer client_buffer_;
    std::optional<http::request_parser<http::buffer_body>> request_parser_;
    std::optional<http::request_serializer<http::buffer_body>> request_serializer_;
    std::array<char, RELAY_BUFFER_SIZE> request_buffer_;
    std::optional<tcp::socket> backend_;
    beast::flat_buffer backend_buffer_;
    std::optional<http::response_parser<http::buffer_body>> response_parser_;
    std::optional<http::response_serializer<http::buffer_body>> serializer_;
    std::array<char, RELAY_BUFFER_SIZE> relay_buffer_;

    TargetPtr target_;
    std::string method_;
    std::string path_;
    bool client_keep_alive_ = false;
    bool upgrade_requested_ = false;
    bool reuse_client_ = false;
    bool closed_ = false;
    std::chrono::steady_clock::time_point request_start_;
    std::chrono::steady_clock::time_point last_activity_report_;
};

class PublicHttpServer {
public:
    explicit PublicHttpServer(net::io_context& io_context, const tcp::endpoint& endpoint,
                              RouteTable& routes, ConnectionTracker& tracker);
    explicit PublicHttpServer(net::io_context& io_context, const tcp::endpoint& endpoint,
                              RouteTable& routes, ConnectionTracker& tracker,
                              const std::string& cert_file, const std::string& key_file);

    void set_activity_handler(ActivityCB handler);
    void start();
    void stop();

    tcp::endpoint local_endpoint() const { return endpoint_; }
    bool is_ssl_enabled() const { return use_ssl_; }

    // "Example.com:8080" -> "Example.com", "[::1]:80" -> "[::1]"
    static std::string host_without_port(std::string_view host);

private:
    void accept_connection();
    void setup_ssl_context(const std::string& cert_file, const std::string& key_file);

    net::io_context& io_context_;
    tcp::acceptor acceptor_;
    net::steady_timer accept_timer_;
    tcp::endpoint endpoint_;
    ProxyContext context_;
    std::unique_ptr<ssl::context> ssl_context_;
    bool use_ssl_ = false;
    std::atomic<bool> stopped_{false};
};
