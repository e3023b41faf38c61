#include "tcp_proxy.hpp"
#include "../core/errors.h"
#include "../utils/logger.h"

namespace {

// Registry updates take a write lock, so busy connections report at most
// once per interval.
constexpr std::chrono::seconds ACTIVITY_REPORT_INTERVAL{1};

constexpr std::chrono::milliseconds ACCEPT_RETRY_DELAY{100};

} // namespace

TcpTunnelSession::TcpTunnelSession(tcp::socket client, const ProxyContext& context)
    : client_(std::move(client)), backend_(client_.get_executor()), context_(context),
      start_time_(std::chrono::steady_clock::now()) {
}

TcpTunnelSession::~TcpTunnelSession() {
    if (connection_) {
        context_.tracker.complete(connection_->get_id());
    }
}

void TcpTunnelSession::start() {
    std::weak_ptr<TcpTunnelSession> weak = shared_from_this();
    auto executor = client_.get_executor();
    connection_ = context_.tracker.open(ConnectionKind::Tcp, [weak, executor]() {
        net::post(executor, [weak]() {
            if (auto self = weak.lock()) {
                self->connection_->set_state(ConnectionState::Failed);
                self->close_both();
            }
        });
    });

    net::dispatch(executor, [self = shared_from_this()]() { self->route(); });
}

void TcpTunnelSession::route() {
    boost::system::error_code ec;
    auto local = client_.local_endpoint(ec);
    if (ec) {
        LOG_WARN("TCP connection without local endpoint: " << ec.message());
        close_both();
        return;
    }
    local_port_ = local.port();

    connection_->set_state(ConnectionState::Routing);
    target_ = context_.routes.find_by_port(local_port_);
    if (!target_) {
        LOG_WARN("No tunnel found for port " << local_port_);
        connection_->set_state(ConnectionState::Failed);
        close_both();
        return;
    }

    context_.report_activity(target_->tunnel_id);
    last_activity_report_ = std::chrono::steady_clock::now();
    connect_backend();
}

void TcpTunnelSession::connect_backend() {
    boost::system::error_code ec;
    auto address = net::ip::make_address(target_->ip, ec);
    if (ec) {
        LOG_ERROR("Tunnel " << target_->tunnel_id << " has an invalid backend address " << target_->ip);
        connection_->set_state(ConnectionState::Failed);
        close_both();
        return;
    }
    tcp::endpoint endpoint(address, static_cast<unsigned short>(target_->port));

    connection_->set_state(ConnectionState::Connecting);
    backend_.async_connect(endpoint,
        [self = shared_from_this(), endpoint](boost::system::error_code ec) {
            if (ec) {
                LOG_ERROR(to_string(ErrorKind::BackendUnreachable) << ": tunnel " << self->target_->tunnel_id
                          << " backend " << endpoint << ": " << ec.message());
                self->connection_->set_state(ConnectionState::Failed);
                self->close_both();
                return;
            }
            LOG_DEBUG("TCP tunnel " << self->target_->tunnel_id << " connected to " << endpoint);
            self->connection_->set_state(ConnectionState::Streaming);
            self->pump(self->client_, self->backend_, self->upstream_buffer_, self->bytes_up_);
            self->pump(self->backend_, self->client_, self->downstream_buffer_, self->bytes_down_);
        });
}

void TcpTunnelSession::pump(tcp::socket& from, tcp::socket& to, PumpBuffer& buffer, uint64_t& counter) {
    from.async_read_some(net::buffer(buffer),
        [self = shared_from_this(), &from, &to, &buffer, &counter](boost::system::error_code ec, std::size_t length) {
            if (ec) {
                // EOF from either side ends the pair as well.
                self->close_both();
                return;
            }
            counter += length;
            self->note_activity();
            net::async_write(to, net::buffer(buffer.data(), length),
                [self, &from, &to, &buffer, &counter](boost::system::error_code ec, std::size_t) {
                    if (ec) {
                        self->close_both();
                        return;
                    }
                    self->pump(from, to, buffer, counter);
                });
        });
}

void TcpTunnelSession::note_activity() {
    auto now = std::chrono::steady_clock::now();
    if (now - last_activity_report_ >= ACTIVITY_REPORT_INTERVAL) {
        last_activity_report_ = now;
        context_.report_activity(target_->tunnel_id);
    }
}

void TcpTunnelSession::close_both() {
    if (closed_) {
        return;
    }
    closed_ = true;

    boost::system::error_code ec;
    client_.shutdown(tcp::socket::shutdown_both, ec);
    client_.close(ec);
    backend_.shutdown(tcp::socket::shutdown_both, ec);
    backend_.close(ec);

    if (target_) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_).count();
        LOG_INFO("TCP port " << local_port_ << " -> tunnel " << target_->tunnel_id
                 << " closed, " << bytes_up_ << " bytes up, " << bytes_down_
                 << " bytes down in " << elapsed << "ms");
    }
}

TcpProxyServer::TcpProxyServer(net::io_context& io_context, const tcp::endpoint& endpoint,
                               RouteTable& routes, ConnectionTracker& tracker)
    : io_context_(io_context), acceptor_(net::make_strand(io_context)),
      accept_timer_(acceptor_.get_executor()), context_(routes, tracker) {
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
    endpoint_ = acceptor_.local_endpoint();
}

void TcpProxyServer::set_activity_handler(ActivityCB handler) {
    context_.on_activity = std::move(handler);
}

void TcpProxyServer::start() {
    LOG_INFO("TCP listener on " << endpoint_);
    accept_connections();
}

void TcpProxyServer::stop() {
    stopped_ = true;
    net::post(acceptor_.get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        accept_timer_.cancel();
    });
}

void TcpProxyServer::accept_connections() {
    acceptor_.async_accept(net::make_strand(io_context_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == net::error::operation_aborted || stopped_) {
                LOG_INFO("TCP listener on " << endpoint_ << " stopped");
                return;
            }
            if (ec) {
                LOG_ERROR("TCP accept error: " << ec.message());
                accept_timer_.expires_after(ACCEPT_RETRY_DELAY);
                accept_timer_.async_wait([this](boost::system::error_code ec) {
                    if (!ec && !stopped_) {
                        accept_connections();
                    }
                });
                return;
            }
            std::make_shared<TcpTunnelSession>(std::move(socket), context_)->start();
            accept_connections();
        });
}
