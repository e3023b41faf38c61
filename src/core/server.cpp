#include "server.h"
#include "../utils/logger.h"
#include "../transport/session.h"

using boost::asio::ip::tcp;
namespace ssl = boost::asio::ssl;

namespace {
constexpr std::chrono::milliseconds ACCEPT_RETRY_DELAY{100};
}

Server::Server(boost::asio::io_context& p_io_context, const tcp::endpoint& p_endpoint)
                : io_context_(p_io_context), acceptor_(boost::asio::make_strand(p_io_context)),
                  accept_timer_(acceptor_.get_executor()), use_ssl_(false) {
    listen(p_endpoint);
}

Server::Server(boost::asio::io_context& p_io_context, const tcp::endpoint& p_endpoint,
               const std::string& cert_file, const std::string& key_file)
                : io_context_(p_io_context), acceptor_(boost::asio::make_strand(p_io_context)),
                  accept_timer_(acceptor_.get_executor()), use_ssl_(true) {
    setup_ssl_context(cert_file, key_file);
    listen(p_endpoint);
}

void Server::listen(const tcp::endpoint& p_endpoint) {
    acceptor_.open(p_endpoint.protocol());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(p_endpoint);
    acceptor_.listen(boost::asio::socket_base::max_listen_connections);
    endpoint_ = acceptor_.local_endpoint();
}

void Server::start() {
    LOG_INFO("Management API listening on " << endpoint_ << (use_ssl_ ? " (TLS)" : ""));
    accept_connection();
}

void Server::stop() {
    stopped_ = true;
    boost::asio::post(acceptor_.get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        accept_timer_.cancel();
    });
}

void Server::set_request_handler(RequestCB handler) {
    request_handler_ = std::move(handler);
}

void Server::setup_ssl_context(const std::string& cert_file, const std::string& key_file) {
    ssl_context_ = std::make_unique<ssl::context>(ssl::context::tls_server);

    ssl_context_->set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1 |
        ssl::context::single_dh_use
    );

    ssl_context_->use_certificate_chain_file(cert_file);
    ssl_context_->use_private_key_file(key_file, ssl::context::pem);

    // Only h2 is offered; clients that do not ask for it are refused.
    SSL_CTX_set_alpn_select_cb(ssl_context_->native_handle(),
        [](SSL* ssl, const unsigned char** out, unsigned char* outlen,
           const unsigned char* in, unsigned int inlen, void* arg) -> int {
            const unsigned char h2[] = "\x02h2";
            if (SSL_select_next_proto((unsigned char**)out, outlen, h2, sizeof(h2) - 1, in, inlen) != OPENSSL_NPN_NEGOTIATED) {
                return SSL_TLSEXT_ERR_ALERT_FATAL;
            }
            return SSL_TLSEXT_ERR_OK;
        }, nullptr);

    LOG_INFO("Management TLS configured with certificate: " << cert_file);
}

void Server::accept_connection() {
    acceptor_.async_accept(boost::asio::make_strand(io_context_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == boost::asio::error::operation_aborted || stopped_) {
                LOG_INFO("Management API on " << endpoint_ << " stopped");
                return;
            }
            if (ec) {
                LOG_ERROR("Accept error: " << ec.message());
                accept_timer_.expires_after(ACCEPT_RETRY_DELAY);
                accept_timer_.async_wait([this](boost::system::error_code ec) {
                    if (!ec && !stopped_) {
                        accept_connection();
                    }
                });
                return;
            }
            LOG_DEBUG("Management connection from " << socket.remote_endpoint(ec));
            if (use_ssl_) {
                std::make_shared<Session>(std::move(socket), *ssl_context_, request_handler_)->start();
            } else {
                std::make_shared<Session>(std::move(socket), request_handler_)->start();
            }
            accept_connection();
        });
}
