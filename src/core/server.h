#pragma once

#include "../transport/common.h"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <atomic>
#include <memory>

class Session;

// HTTP/2 listener for the management API. Plain connections must speak
// HTTP/2 with prior knowledge; TLS connections negotiate h2 through ALPN.
class Server {
public:
    explicit Server(boost::asio::io_context& p_io_context, const boost::asio::ip::tcp::endpoint& p_endpoint);
    explicit Server(boost::asio::io_context& p_io_context, const boost::asio::ip::tcp::endpoint& p_endpoint,
                   const std::string& cert_file, const std::string& key_file);
    ~Server() = default;

    void start();
    void stop();
    void set_request_handler(RequestCB p_handler);
    bool is_ssl_enabled() const { return use_ssl_; }
    boost::asio::ip::tcp::endpoint local_endpoint() const { return endpoint_; }
private:
    void listen(const boost::asio::ip::tcp::endpoint& p_endpoint);
    void accept_connection();
    void setup_ssl_context(const std::string& cert_file, const std::string& key_file);

private:
    boost::asio::io_context& io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::steady_timer accept_timer_;
    boost::asio::ip::tcp::endpoint endpoint_;
    RequestCB request_handler_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
    bool use_ssl_ = false;
    std::atomic<bool> stopped_{false};
};
