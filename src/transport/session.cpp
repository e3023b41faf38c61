#include "session.h"

#include <algorithm>
#include <cstring>
#include <vector>

Session::Session(boost::asio::ip::tcp::socket p_socket, RequestCB p_request_cb)
    : request_cb_(std::move(p_request_cb)), use_ssl_(false) {
    plain_socket_ = std::make_unique<boost::asio::ip::tcp::socket>(std::move(p_socket));
}

Session::Session(boost::asio::ip::tcp::socket p_socket, boost::asio::ssl::context& ssl_context, RequestCB p_request_cb)
    : request_cb_(std::move(p_request_cb)), use_ssl_(true) {
    ssl_socket_ = std::make_unique<boost::asio::ssl::stream<boost::asio::ip::tcp::socket>>(std::move(p_socket), ssl_context);
}

Session::~Session() {
    if (session_) {
        nghttp2_session_del(session_);
    }
}

void Session::start() {
    LOG_DEBUG("Start management session");
    if (use_ssl_) {
        handle_ssl_handshake();
    } else if (setup_nghttp2()) {
        read_data();
    }
}

void Session::handle_ssl_handshake() {
    auto self(shared_from_this());
    ssl_socket_->async_handshake(boost::asio::ssl::stream_base::server,
        [this, self](boost::system::error_code ec) {
            if (ec) {
                LOG_WARN("Management TLS handshake failed: " << ec.message());
                close();
                return;
            }
            if (setup_nghttp2()) {
                read_data();
            }
        });
}

bool Session::setup_nghttp2() {
    nghttp2_session_callbacks* callbacks;
    if (nghttp2_session_callbacks_new(&callbacks) != 0) {
        LOG_ERROR("nghttp2_session_callbacks_new failed");
        close();
        return false;
    }

    nghttp2_session_callbacks_set_on_frame_recv_callback(callbacks, on_frame_recv_cb);
    nghttp2_session_callbacks_set_on_header_callback(callbacks, on_header_cb);
    nghttp2_session_callbacks_set_on_data_chunk_recv_callback(callbacks, on_data_chunk_recv_cb);
    nghttp2_session_callbacks_set_on_stream_close_callback(callbacks, on_stream_close_cb);
    nghttp2_session_callbacks_set_send_callback(callbacks, send_cb);

    int rv = nghttp2_session_server_new(&session_, callbacks, this);
    nghttp2_session_callbacks_del(callbacks);
    if (rv != 0) {
        LOG_ERROR("nghttp2_session_server_new failed: " << nghttp2_strerror(rv));
        close();
        return false;
    }

    nghttp2_settings_entry iv[1] = {
        {NGHTTP2_SETTINGS_MAX_CONCURRENT_STREAMS, 100}
    };
    nghttp2_submit_settings(session_, NGHTTP2_FLAG_NONE, iv, 1);
    return write_data();
}

void Session::read_data() {
    auto self(shared_from_this());
    auto handler = [this, self](boost::system::error_code ec, std::size_t length) {
        on_read(ec, length);
    };

    if (use_ssl_) {
        ssl_socket_->async_read_some(boost::asio::buffer(read_buffer_), handler);
    } else {
        plain_socket_->async_read_some(boost::asio::buffer(read_buffer_), handler);
    }
}

void Session::on_read(const boost::system::error_code& ec, std::size_t length) {
    if (ec) {
        if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
            LOG_DEBUG("Management read error: " << ec.message());
        }
        close();
        return;
    }

    ssize_t read = nghttp2_session_mem_recv(session_, read_buffer_.data(), length);
    if (read < 0) {
        LOG_WARN("nghttp2_session_mem_recv error: " << nghttp2_strerror((int)read));
        close();
        return;
    }

    if (!write_data()) {
        return;
    }
    if (nghttp2_session_want_read(session_) == 0 && nghttp2_session_want_write(session_) == 0) {
        close();
        return;
    }
    read_data();
}

bool Session::write_data() {
    int rv = nghttp2_session_send(session_);
    if (rv != 0) {
        LOG_WARN("nghttp2_session_send failed: " << nghttp2_strerror(rv));
        close();
        return false;
    }
    return true;
}

void Session::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    boost::system::error_code ec;
    if (use_ssl_) {
        ssl_socket_->lowest_layer().close(ec);
    } else {
        plain_socket_->close(ec);
    }
}

void Session::dispatch_request(int32_t p_stream_id) {
    auto it = streams_data_.find(p_stream_id);
    if (it == streams_data_.end() || it->second.dispatched) {
        return;
    }
    it->second.dispatched = true;

    const auto& request = it->second.request;
    LOG_DEBUG("Management request " << request.method << " " << request.path
              << " (body: " << request.body.length() << " bytes) on stream " << p_stream_id);

    // Responses are only queued here; on_read flushes them once nghttp2
    // has finished processing the received bytes.
    auto sender = [this](int32_t stream_id, const HttpResponse& response) {
        send_response(stream_id, response);
    };
    request_cb_(request, p_stream_id, sender);
}

void Session::send_response(int32_t p_stream_id, const HttpResponse& p_response) {
    auto it = streams_data_.find(p_stream_id);
    if (it == streams_data_.end()) {
        LOG_DEBUG("Dropping response for closed stream " << p_stream_id);
        return;
    }

    std::string status = std::to_string(p_response.status_code);
    std::string content_len = std::to_string(p_response.body.size());

    std::vector<nghttp2_nv> headers;
    headers.push_back(make_nv_ls(":status", status));
    int rv;
    if (p_response.body.empty()) {
        rv = nghttp2_submit_headers(session_, NGHTTP2_FLAG_END_STREAM,
                                    p_stream_id, nullptr,
                                    headers.data(), headers.size(),
                                    nullptr);
    }
    else {
        headers.push_back(make_nv_ls("content-type", p_response.content_type));
        headers.push_back(make_nv_ls("content-length", content_len));

        // The body has to live until nghttp2 has pulled all of it.
        auto& stream_data = it->second;
        stream_data.response_body = p_response.body;
        stream_data.response_offset = 0;

        nghttp2_data_provider data_prd;
        data_prd.source.ptr = &stream_data;
        data_prd.read_callback = body_read_cb;
        rv = nghttp2_submit_response(session_, p_stream_id, headers.data(), headers.size(), &data_prd);
    }
    if (rv != 0) {
        LOG_WARN("Failed to submit response on stream " << p_stream_id << ": " << nghttp2_strerror(rv));
        return;
    }
    LOG_DEBUG("Response queued on stream " << p_stream_id << " with status " << status);
}

// Static callbacks
ssize_t Session::body_read_cb(nghttp2_session* session, int32_t stream_id, uint8_t* buf,
                              size_t length, uint32_t* data_flags, nghttp2_data_source* source,
                              void* user_data) {
    auto* stream_data = static_cast<StreamData*>(source->ptr);
    size_t remaining = stream_data->response_body.size() - stream_data->response_offset;
    size_t len = std::min(remaining, length);

    std::memcpy(buf, stream_data->response_body.data() + stream_data->response_offset, len);
    stream_data->response_offset += len;
    if (stream_data->response_offset == stream_data->response_body.size()) {
        *data_flags |= NGHTTP2_DATA_FLAG_EOF;
    }
    return static_cast<ssize_t>(len);
}

int Session::on_frame_recv_cb(nghttp2_session* session, const nghttp2_frame* frame,
                              void* user_data) {
    Session* sess = static_cast<Session*>(user_data);

    switch (frame->hd.type) {
        case NGHTTP2_HEADERS:
        case NGHTTP2_DATA:
            if (frame->hd.flags & NGHTTP2_FLAG_END_STREAM) {
                sess->dispatch_request(frame->hd.stream_id);
            }
            break;
        default:
            break;
    }
    return 0;
}

int Session::on_header_cb(nghttp2_session* session, const nghttp2_frame* frame,
                          const uint8_t* name, size_t namelen, const uint8_t* value, size_t valuelen,
                          uint8_t flags, void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    if (frame->hd.type != NGHTTP2_HEADERS || frame->headers.cat != NGHTTP2_HCAT_REQUEST) {
        return 0;
    }

    auto& request = sess->streams_data_[frame->hd.stream_id].request;
    auto header_name = std::string(reinterpret_cast<const char*>(name), namelen);
    auto header_value = std::string(reinterpret_cast<const char*>(value), valuelen);
    if (header_name == ":method")
        request.method = header_value;
    else if (header_name == ":path")
        request.path = header_value;
    else if (header_name == ":authority")
        request.authority = header_value;
    else if (header_name.front() != ':')
        request.headers[header_name] = header_value;

    return 0;
}

int Session::on_data_chunk_recv_cb(nghttp2_session* session, uint8_t flags,
                                   int32_t stream_id, const uint8_t* data,
                                   size_t len, void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    auto it = sess->streams_data_.find(stream_id);
    if (it != sess->streams_data_.end()) {
        it->second.request.body.append(reinterpret_cast<const char*>(data), len);
    }
    return 0;
}

int Session::on_stream_close_cb(nghttp2_session* session, int32_t stream_id,
                                uint32_t error_code, void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    sess->streams_data_.erase(stream_id);
    LOG_DEBUG("Stream " << stream_id << " closed");
    return 0;
}

ssize_t Session::send_cb(nghttp2_session* session, const uint8_t* data,
                         size_t length, int flags, void* user_data) {
    Session* sess = static_cast<Session*>(user_data);
    boost::system::error_code ec;

    size_t written;
    if (sess->use_ssl_) {
        written = boost::asio::write(*sess->ssl_socket_,
                                     boost::asio::buffer(data, length),
                                     ec);
    } else {
        written = boost::asio::write(*sess->plain_socket_,
                                     boost::asio::buffer(data, length),
                                     ec);
    }

    if (ec) {
        LOG_WARN("Management write error: " << ec.message());
        return NGHTTP2_ERR_CALLBACK_FAILURE;
    }

    return written;
}
