#include "http1_proxy.hpp"
#include "../core/errors.h"
#include "../utils/logger.h"

#include <cstdint>
#include <limits>

namespace {

using SslStream = ssl::stream<tcp::socket>;

constexpr const char* SERVER_NAME = "tunnel-edge";

// An unset limit rejects any Content-Length body in Beast's parser.
constexpr std::uint64_t UNLIMITED_BODY = std::numeric_limits<std::uint64_t>::max();

constexpr std::chrono::seconds ACTIVITY_REPORT_INTERVAL{1};
constexpr std::chrono::milliseconds ACCEPT_RETRY_DELAY{100};

template <class Stream>
Stream make_stream(tcp::socket socket, ssl::context* ssl_context);

template <>
tcp::socket make_stream<tcp::socket>(tcp::socket socket, ssl::context*) {
    return socket;
}

template <>
SslStream make_stream<SslStream>(tcp::socket socket, ssl::context* ssl_context) {
    return SslStream(std::move(socket), *ssl_context);
}

void listen_on(tcp::acceptor& acceptor, const tcp::endpoint& endpoint) {
    acceptor.open(endpoint.protocol());
    acceptor.set_option(net::socket_base::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen(net::socket_base::max_listen_connections);
}

} // namespace

// Transport-specific parts

template <>
void PublicHttpSession<tcp::socket>::handshake() {
    read_request();
}

template <>
void PublicHttpSession<SslStream>::handshake() {
    stream_.async_handshake(ssl::stream_base::server,
        [self = shared_from_this()](beast::error_code ec) {
            if (ec) {
                LOG_WARN("TLS handshake failed: " << ec.message());
                self->connection_->set_state(ConnectionState::Failed);
                self->closed_ = true;
                beast::error_code ignored;
                beast::get_lowest_layer(self->stream_).close(ignored);
                return;
            }
            self->read_request();
        });
}

template <>
void PublicHttpSession<tcp::socket>::close_client() {
    if (closed_) {
        return;
    }
    closed_ = true;
    close_backend();
    beast::error_code ec;
    stream_.shutdown(tcp::socket::shutdown_send, ec);
    stream_.close(ec);
}

template <>
void PublicHttpSession<SslStream>::close_client() {
    if (closed_) {
        return;
    }
    closed_ = true;
    close_backend();
    stream_.async_shutdown([self = shared_from_this()](beast::error_code) {
        beast::error_code ec;
        beast::get_lowest_layer(self->stream_).close(ec);
    });
}

// Shared request handling

template <class Stream>
PublicHttpSession<Stream>::PublicHttpSession(tcp::socket socket, ssl::context* ssl_context,
                                             const ProxyContext& context)
    : stream_(make_stream<Stream>(std::move(socket), ssl_context)),
      context_(context), secure_(ssl_context != nullptr) {
}

template <class Stream>
PublicHttpSession<Stream>::~PublicHttpSession() {
    if (connection_) {
        context_.tracker.complete(connection_->get_id());
    }
}

template <class Stream>
void PublicHttpSession<Stream>::start() {
    std::weak_ptr<PublicHttpSession> weak = this->shared_from_this();
    auto executor = stream_.get_executor();
    connection_ = context_.tracker.open(ConnectionKind::Http, [weak, executor]() {
        net::post(executor, [weak]() {
            if (auto self = weak.lock()) {
                self->force_close();
            }
        });
    });
    net::dispatch(executor, [self = this->shared_from_this()]() { self->handshake(); });
}

template <class Stream>
void PublicHttpSession<Stream>::read_request() {
    request_parser_.emplace();
    request_parser_->body_limit(UNLIMITED_BODY);
    upgrade_requested_ = false;
    connection_->set_state(ConnectionState::Accepted);

    http::async_read_header(stream_, client_buffer_, *request_parser_,
        [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec == http::error::end_of_stream) {
                self->close_client();
                return;
            }
            if (ec) {
                if (ec != net::error::operation_aborted) {
                    LOG_DEBUG("HTTP read error: " << ec.message());
                }
                self->close_client();
                return;
            }
            self->handle_request();
        });
}

template <class Stream>
void PublicHttpSession<Stream>::handle_request() {
    request_start_ = std::chrono::steady_clock::now();
    auto& request = request_parser_->get();

    method_ = std::string(request.method_string());
    path_ = std::string(request.target());
    client_keep_alive_ = request.keep_alive();
    upgrade_requested_ = request_parser_->upgrade() && !request[http::field::upgrade].empty();
    std::string host = PublicHttpServer::host_without_port(std::string(request[http::field::host]));

    connection_->set_state(ConnectionState::Routing);
    target_ = context_.routes.find_by_host(host);
    if (!target_) {
        LOG_WARN("No tunnel found for host '" << host << "' (" << method_ << " " << path_ << ")");
        send_error(http::status::service_unavailable, "Service Unavailable");
        return;
    }

    context_.report_activity(target_->tunnel_id);
    connect_backend();
}

template <class Stream>
void PublicHttpSession<Stream>::connect_backend() {
    beast::error_code ec;
    auto address = net::ip::make_address(target_->ip, ec);
    if (ec) {
        LOG_ERROR("Tunnel " << target_->tunnel_id << " has an invalid backend address " << target_->ip);
        send_error(http::status::bad_gateway, "Bad Gateway");
        return;
    }
    tcp::endpoint endpoint(address, static_cast<unsigned short>(target_->port));

    connection_->set_state(ConnectionState::Connecting);
    backend_.emplace(stream_.get_executor());
    backend_->async_connect(endpoint,
        [self = this->shared_from_this(), endpoint](beast::error_code ec) {
            if (ec) {
                LOG_ERROR(to_string(ErrorKind::BackendUnreachable) << ": tunnel " << self->target_->tunnel_id
                          << " backend " << endpoint << ": " << ec.message());
                self->send_error(http::status::bad_gateway, "Bad Gateway");
                return;
            }
            self->write_backend_request();
        });
}

template <class Stream>
void PublicHttpSession<Stream>::write_backend_request() {
    auto& request = request_parser_->get();

    beast::error_code ec;
    auto remote = beast::get_lowest_layer(stream_).remote_endpoint(ec);
    if (!ec) {
        std::string client_ip = remote.address().to_string();
        std::string forwarded(request["X-Forwarded-For"]);
        request.set("X-Forwarded-For", forwarded.empty() ? client_ip : forwarded + ", " + client_ip);
    }
    std::string original_host(request[http::field::host]);
    if (request["X-Forwarded-Host"].empty() && !original_host.empty()) {
        request.set("X-Forwarded-Host", original_host);
    }
    request.set("X-Forwarded-Proto", secure_ ? "https" : "http");

    // The body is relayed as it arrives, so the backend never owes an interim 100.
    // Hop-by-hop headers stay on this hop; the backend connection is not reused
    // unless it is being upgraded.
    for (const char* name : {"Expect", "Proxy-Connection", "Keep-Alive", "TE", "Trailer"}) {
        request.erase(name);
    }
    if (!upgrade_requested_) {
        request.erase(http::field::upgrade);
        request.keep_alive(false);
    }

    request_serializer_.emplace(request);
    http::async_write_header(*backend_, *request_serializer_,
        [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec) {
                LOG_ERROR("Backend write failed for tunnel " << self->target_->tunnel_id << ": " << ec.message());
                self->send_error(http::status::bad_gateway, "Bad Gateway");
                return;
            }
            self->relay_request_body();
        });
}

template <class Stream>
void PublicHttpSession<Stream>::relay_request_body() {
    auto& body = request_parser_->get().body();

    if (request_parser_->is_done()) {
        body.data = nullptr;
        body.size = 0;
        body.more = false;
        write_request_chunk();
        return;
    }

    body.data = request_buffer_.data();
    body.size = request_buffer_.size();
    http::async_read(stream_, client_buffer_, *request_parser_,
        [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            if (ec) {
                LOG_DEBUG("Client body read failed for tunnel " << self->target_->tunnel_id << ": " << ec.message());
                self->force_close();
                return;
            }
            auto& body = self->request_parser_->get().body();
            body.size = self->request_buffer_.size() - body.size;
            body.data = self->request_buffer_.data();
            body.more = !self->request_parser_->is_done();
            self->write_request_chunk();
        });
}

template <class Stream>
void PublicHttpSession<Stream>::write_request_chunk() {
    http::async_write(*backend_, *request_serializer_,
        [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            if (ec) {
                LOG_ERROR("Backend write failed for tunnel " << self->target_->tunnel_id << ": " << ec.message());
                self->send_error(http::status::bad_gateway, "Bad Gateway");
                return;
            }
            if (!self->request_parser_->is_done() && !self->request_serializer_->is_done()) {
                self->relay_request_body();
            } else {
                self->read_backend_header();
            }
        });
}

template <class Stream>
void PublicHttpSession<Stream>::read_backend_header() {
    response_parser_.emplace();
    response_parser_->body_limit(UNLIMITED_BODY);
    if (request_parser_->get().method() == http::verb::head) {
        response_parser_->skip(true);
    }

    http::async_read_header(*backend_, backend_buffer_, *response_parser_,
        [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec) {
                LOG_ERROR("Backend read failed for tunnel " << self->target_->tunnel_id << ": " << ec.message());
                self->send_error(http::status::bad_gateway, "Bad Gateway");
                return;
            }
            int status = self->response_parser_->get().result_int();
            bool switching = status == 101 && self->upgrade_requested_;
            if (status >= 100 && status < 200 && !switching) {
                LOG_DEBUG("Dropping interim " << status << " from tunnel " << self->target_->tunnel_id);
                self->read_backend_header();
                return;
            }
            self->write_response_header();
        });
}

template <class Stream>
void PublicHttpSession<Stream>::write_response_header() {
    auto& response = response_parser_->get();

    if (response.result() == http::status::switching_protocols) {
        reuse_client_ = false;
    } else {
        // The client connection survives only if the relayed body is delimited.
        reuse_client_ = client_keep_alive_ &&
                        (response.chunked() || response.has_content_length() || response_parser_->is_done());
        response.keep_alive(reuse_client_);
    }

    serializer_.emplace(response);
    connection_->set_state(ConnectionState::Streaming);

    http::async_write_header(stream_, *serializer_,
        [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec) {
                LOG_WARN("Client write failed for tunnel " << self->target_->tunnel_id << ": " << ec.message());
                self->force_close();
                return;
            }
            self->relay_body();
        });
}

template <class Stream>
void PublicHttpSession<Stream>::relay_body() {
    auto& body = response_parser_->get().body();

    if (response_parser_->is_done()) {
        body.data = nullptr;
        body.size = 0;
        body.more = false;
        write_body_chunk();
        return;
    }

    body.data = relay_buffer_.data();
    body.size = relay_buffer_.size();
    http::async_read(*backend_, backend_buffer_, *response_parser_,
        [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            if (ec) {
                LOG_ERROR("Backend stream failed for tunnel " << self->target_->tunnel_id << ": " << ec.message());
                self->force_close();
                return;
            }
            auto& body = self->response_parser_->get().body();
            body.size = self->relay_buffer_.size() - body.size;
            body.data = self->relay_buffer_.data();
            body.more = !self->response_parser_->is_done();
            self->write_body_chunk();
        });
}

template <class Stream>
void PublicHttpSession<Stream>::write_body_chunk() {
    http::async_write(stream_, *serializer_,
        [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            if (ec) {
                LOG_WARN("Client write failed for tunnel " << self->target_->tunnel_id << ": " << ec.message());
                self->force_close();
                return;
            }
            if (!self->response_parser_->is_done() && !self->serializer_->is_done()) {
                self->relay_body();
            } else {
                self->finish_exchange();
            }
        });
}

template <class Stream>
void PublicHttpSession<Stream>::finish_exchange() {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - request_start_).count();
    int status = response_parser_->get().result_int();
    LOG_INFO("HTTP " << method_ << " " << path_ << " -> tunnel " << target_->tunnel_id
             << " status " << status << " in " << elapsed << "ms");

    serializer_.reset();
    request_serializer_.reset();

    if (status == 101) {
        start_upgraded_tunnel();
        return;
    }

    close_backend();
    response_parser_.reset();
    backend_buffer_.consume(backend_buffer_.size());
    target_.reset();

    if (reuse_client_) {
        read_request();
    } else {
        close_client();
    }
}

template <class Stream>
void PublicHttpSession<Stream>::start_upgraded_tunnel() {
    LOG_INFO("Connection upgraded to " << response_parser_->get()[http::field::upgrade]
             << " on tunnel " << target_->tunnel_id);
    last_activity_report_ = std::chrono::steady_clock::now();
    auto self = this->shared_from_this();

    // Bytes read past either HTTP header already belong to the new protocol.
    if (client_buffer_.size() > 0) {
        net::async_write(*backend_, client_buffer_.data(),
            [self](beast::error_code ec, std::size_t n) {
                if (ec) {
                    self->end_tunnel(ec);
                    return;
                }
                self->client_buffer_.consume(n);
                self->pump_upstream();
            });
    } else {
        pump_upstream();
    }

    if (backend_buffer_.size() > 0) {
        net::async_write(stream_, backend_buffer_.data(),
            [self](beast::error_code ec, std::size_t n) {
                if (ec) {
                    self->end_tunnel(ec);
                    return;
                }
                self->backend_buffer_.consume(n);
                self->pump_downstream();
            });
    } else {
        pump_downstream();
    }
}

template <class Stream>
void PublicHttpSession<Stream>::pump_upstream() {
    stream_.async_read_some(net::buffer(request_buffer_),
        [self = this->shared_from_this()](beast::error_code ec, std::size_t n) {
            if (ec) {
                self->end_tunnel(ec);
                return;
            }
            self->note_activity();
            net::async_write(*self->backend_, net::buffer(self->request_buffer_.data(), n),
                [self](beast::error_code ec, std::size_t) {
                    if (ec) {
                        self->end_tunnel(ec);
                        return;
                    }
                    self->pump_upstream();
                });
        });
}

template <class Stream>
void PublicHttpSession<Stream>::pump_downstream() {
    backend_->async_read_some(net::buffer(relay_buffer_),
        [self = this->shared_from_this()](beast::error_code ec, std::size_t n) {
            if (ec) {
                self->end_tunnel(ec);
                return;
            }
            self->note_activity();
            net::async_write(self->stream_, net::buffer(self->relay_buffer_.data(), n),
                [self](beast::error_code ec, std::size_t) {
                    if (ec) {
                        self->end_tunnel(ec);
                        return;
                    }
                    self->pump_downstream();
                });
        });
}

template <class Stream>
void PublicHttpSession<Stream>::end_tunnel(beast::error_code ec) {
    if (closed_) {
        return;
    }
    if (ec != net::error::eof && ec != net::error::operation_aborted && ec != ssl::error::stream_truncated) {
        LOG_DEBUG("Upgraded connection on tunnel " << target_->tunnel_id << " failed: " << ec.message());
        connection_->set_state(ConnectionState::Failed);
    }
    LOG_INFO("Upgraded connection on tunnel " << target_->tunnel_id << " closed");
    closed_ = true;
    close_backend();
    beast::error_code ignored;
    beast::get_lowest_layer(stream_).close(ignored);
}

template <class Stream>
void PublicHttpSession<Stream>::note_activity() {
    auto now = std::chrono::steady_clock::now();
    if (now - last_activity_report_ >= ACTIVITY_REPORT_INTERVAL) {
        last_activity_report_ = now;
        context_.report_activity(target_->tunnel_id);
    }
}

template <class Stream>
void PublicHttpSession<Stream>::send_error(http::status status, const std::string& text) {
    unsigned version = request_parser_ ? request_parser_->get().version() : 11;
    auto response = std::make_shared<http::response<http::string_body>>(status, version);
    response->set(http::field::server, SERVER_NAME);
    response->set(http::field::content_type, "text/plain");
    response->keep_alive(false);
    response->body() = text + "\n";
    response->prepare_payload();

    close_backend();
    connection_->set_state(ConnectionState::Failed);

    http::async_write(stream_, *response,
        [self = this->shared_from_this(), response](beast::error_code ec, std::size_t) {
            if (ec) {
                LOG_DEBUG("Error response write failed: " << ec.message());
            }
            self->close_client();
        });
}

template <class Stream>
void PublicHttpSession<Stream>::close_backend() {
    if (backend_ && backend_->is_open()) {
        beast::error_code ec;
        backend_->shutdown(tcp::socket::shutdown_both, ec);
        backend_->close(ec);
    }
}

template <class Stream>
void PublicHttpSession<Stream>::force_close() {
    connection_->set_state(ConnectionState::Failed);
    closed_ = true;
    close_backend();
    beast::error_code ec;
    beast::get_lowest_layer(stream_).close(ec);
}

// Listener

PublicHttpServer::PublicHttpServer(net::io_context& io_context, const tcp::endpoint& endpoint,
                                   RouteTable& routes, ConnectionTracker& tracker)
    : io_context_(io_context), acceptor_(net::make_strand(io_context)),
      accept_timer_(acceptor_.get_executor()), context_(routes, tracker), use_ssl_(false) {
    listen_on(acceptor_, endpoint);
    endpoint_ = acceptor_.local_endpoint();
}

PublicHttpServer::PublicHttpServer(net::io_context& io_context, const tcp::endpoint& endpoint,
                                   RouteTable& routes, ConnectionTracker& tracker,
                                   const std::string& cert_file, const std::string& key_file)
    : io_context_(io_context), acceptor_(net::make_strand(io_context)),
      accept_timer_(acceptor_.get_executor()), context_(routes, tracker), use_ssl_(true) {
    setup_ssl_context(cert_file, key_file);
    listen_on(acceptor_, endpoint);
    endpoint_ = acceptor_.local_endpoint();
}

void PublicHttpServer::set_activity_handler(ActivityCB handler) {
    context_.on_activity = std::move(handler);
}

void PublicHttpServer::setup_ssl_context(const std::string& cert_file, const std::string& key_file) {
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

    LOG_INFO("Public listener TLS configured with certificate: " << cert_file);
}

void PublicHttpServer::start() {
    LOG_INFO("HTTP listener on " << endpoint_ << (use_ssl_ ? " (TLS)" : ""));
    accept_connection();
}

void PublicHttpServer::stop() {
    stopped_ = true;
    net::post(acceptor_.get_executor(), [this]() {
        beast::error_code ec;
        acceptor_.close(ec);
        accept_timer_.cancel();
    });
}

void PublicHttpServer::accept_connection() {
    acceptor_.async_accept(net::make_strand(io_context_),
        [this](beast::error_code ec, tcp::socket socket) {
            if (ec == net::error::operation_aborted || stopped_) {
                LOG_INFO("HTTP listener on " << endpoint_ << " stopped");
                return;
            }
            if (ec) {
                // Persistent failures such as descriptor exhaustion would spin.
                LOG_ERROR("HTTP accept error: " << ec.message());
                accept_timer_.expires_after(ACCEPT_RETRY_DELAY);
                accept_timer_.async_wait([this](beast::error_code ec) {
                    if (!ec && !stopped_) {
                        accept_connection();
                    }
                });
                return;
            }
            if (use_ssl_) {
                std::make_shared<PublicHttpSession<SslStream>>(
                    std::move(socket), ssl_context_.get(), context_)->start();
            } else {
                std::make_shared<PublicHttpSession<tcp::socket>>(
                    std::move(socket), nullptr, context_)->start();
            }
            accept_connection();
        });
}

std::string PublicHttpServer::host_without_port(std::string_view host) {
    if (!host.empty() && host.front() == '[') {
        auto close = host.find(']');
        return std::string(close == std::string_view::npos ? host : host.substr(0, close + 1));
    }
    auto colon = host.find(':');
    if (colon != std::string_view::npos && host.find(':', colon + 1) == std::string_view::npos) {
        return std::string(host.substr(0, colon));
    }
    return std::string(host);
}
