#include "websocket_transport.h"
#include "log.h"
#include "WebSocketClient.h"
#include <boost/asio/post.hpp>
#include <chrono>
#include <utility>

namespace s2s_bridge {

namespace {

template <typename Gate, typename Handler>
void post_through(Gate& gate, Handler&& handler) {
    std::lock_guard<std::mutex> lock(gate.mutex);
    if (gate.ioc) boost::asio::post(*gate.ioc, std::forward<Handler>(handler));
}

}

WebSocketTransport::WebSocketTransport(boost::asio::io_context& ioc)
    : ioc_(ioc)
    , ws_(std::make_unique<WebSocketClient>())
    , gate_(std::make_shared<PostGate>())
    , connect_timer_(ioc)
{
    gate_->ioc = &ioc_;
}

WebSocketTransport::~WebSocketTransport() {
    shutdown_socket();
}

void WebSocketTransport::connect(const SessionConfig& cfg, OnConnectResult cb) {
    if (phase_ != Phase::IDLE) {
        ConnectionError error;
        error.message = "transport already used";
        boost::asio::post(ioc_, [cb, error]() { if (cb) cb(false, error); });
        return;
    }

    cfg_ = cfg;
    cb_connect_ = std::move(cb);
    phase_ = Phase::OPENING;

    ConnectionError error;
    if (!prepare(error)) {
        /* Still reported asynchronously, like every other connect outcome. */
        std::weak_ptr<WebSocketTransport> wp = shared_from_this();
        boost::asio::post(ioc_, [wp, error]() {
            if (auto self = wp.lock()) self->complete_connect(false, error);
        });
        return;
    }

    std::string url = base_url();
    WebSocketHeaders headers;
    if (cfg_.api_key_in_header) {
        headers.set("x-goog-api-key", cfg_.api_key);
    } else {
        url = append_key_param(url, cfg_.api_key);
    }

    S2S_LOG_INFO("%s: connecting to %s\n", name(), base_url().c_str());

    ws_->setUrl(url);
    if (!headers.empty()) ws_->setHeaders(headers);
    ws_->setConnectionTimeout((cfg_.connect_timeout_ms + 999) / 1000);
    ws_->setPingInterval(cfg_.ping_interval_s);
    ws_->enableCompression(false);

    WebSocketTLSOptions tls;
    tls.disableHostnameValidation = false;
    ws_->setTLSOptions(tls);

    bind_callbacks(shared_from_this());

    std::weak_ptr<WebSocketTransport> wp = shared_from_this();
    connect_timer_.expires_after(std::chrono::milliseconds(cfg_.connect_timeout_ms));
    connect_timer_.async_wait([wp](const boost::system::error_code& ec) {
        if (ec) return;
        if (auto self = wp.lock()) self->on_connect_timeout();
    });

    socket_started_ = true;
    ws_->connect();
}

void WebSocketTransport::bind_callbacks(std::weak_ptr<WebSocketTransport> wp) {
    std::shared_ptr<PostGate> gate = gate_;

    ws_->setOpenCallback([gate, wp]() {
        post_through(*gate, [wp]() {
            if (auto self = wp.lock()) self->on_socket_open();
        });
    });

    ws_->setMessageCallback([gate, wp](const std::string& message) {
        post_through(*gate, [wp, message]() {
            auto self = wp.lock();
            if (!self) return;
            if (self->phase_ != Phase::SETUP && self->phase_ != Phase::READY) return;
            self->handle_text(message);
        });
    });

    ws_->setBinaryCallback([gate, wp](const void* data, size_t len) {
        std::string payload(static_cast<const char*>(data), len);
        post_through(*gate, [wp, payload]() {
            auto self = wp.lock();
            if (!self) return;
            if (self->phase_ != Phase::SETUP && self->phase_ != Phase::READY) return;
            self->handle_binary(payload);
        });
    });

    ws_->setCloseCallback([gate, wp](int code, const std::string& reason) {
        post_through(*gate, [wp, code, reason]() {
            if (auto self = wp.lock()) self->on_socket_close(code, reason);
        });
    });

    ws_->setErrorCallback([gate, wp](int code, const std::string& msg) {
        post_through(*gate, [wp, code, msg]() {
            if (auto self = wp.lock()) self->on_socket_error(code, msg);
        });
    });
}

void WebSocketTransport::on_socket_open() {
    if (phase_ != Phase::OPENING) return;
    S2S_LOG_DEBUG("%s: socket open\n", name());
    handle_open();
}

void WebSocketTransport::on_socket_close(int code, const std::string& reason) {
    if (connecting()) {
        S2S_LOG_WARNING("%s: closed during connect (code=%d reason=%s)\n",
                        name(), code, reason.c_str());
        complete_connect(false, classify_close(code, reason));
        return;
    }
    if (phase_ != Phase::READY) return;

    S2S_LOG_INFO("%s: closed by remote (code=%d reason=%s)\n", name(), code, reason.c_str());
    phase_ = Phase::CLOSED;
    shutdown_socket();

    OnRemoteClose cb = cb_close_;
    clear_callbacks();
    if (cb) cb(code, reason);
}

void WebSocketTransport::on_socket_error(int http_status, const std::string& reason) {
    if (connecting()) {
        S2S_LOG_ERROR("%s: connect failed (status=%d reason=%s)\n",
                      name(), http_status, reason.c_str());
        complete_connect(false, classify_error(http_status, reason));
        return;
    }
    if (phase_ != Phase::READY) return;

    S2S_LOG_ERROR("%s: error (status=%d reason=%s)\n", name(), http_status, reason.c_str());
    if (cb_error_) cb_error_(reason);
}

void WebSocketTransport::on_connect_timeout() {
    if (!connecting()) return;
    ConnectionError error;
    error.kind = ConnectionError::UNREACHABLE;
    error.message = "timed out after " + std::to_string(cfg_.connect_timeout_ms) + " ms";
    S2S_LOG_ERROR("%s: connect %s\n", name(), error.message.c_str());
    complete_connect(false, error);
}

ConnectionError WebSocketTransport::classify_close(int code, const std::string& reason) const {
    ConnectionError error;
    error.kind = ConnectionError::UNREACHABLE;
    error.message = "closed during connect (code=" + std::to_string(code) + " " + reason + ")";
    return error;
}

ConnectionError WebSocketTransport::classify_error(int http_status, const std::string& reason) const {
    ConnectionError error;
    error.kind = ConnectionError::UNREACHABLE;
    error.http_status = http_status;
    error.message = reason;
    return error;
}

void WebSocketTransport::complete_connect(bool ok, const ConnectionError& error) {
    if (!connecting()) return;

    connect_timer_.cancel();
    if (ok) {
        phase_ = Phase::READY;
        S2S_LOG_INFO("%s: session ready\n", name());
    } else {
        phase_ = Phase::CLOSED;
        shutdown_socket();
        clear_callbacks();
    }

    OnConnectResult cb = std::move(cb_connect_);
    cb_connect_ = nullptr;
    if (cb) cb(ok, error);
}

void WebSocketTransport::send_audio(const AudioFrame& frame, OnSendComplete cb) {
    bool ok = false;
    std::string error;
    if (phase_ != Phase::READY) {
        error = "session not ready";
    } else if (!send_text(encode_audio(frame))) {
        error = "socket send failed";
    } else {
        ok = true;
    }

    if (!cb) return;
    boost::asio::post(ioc_, [cb, ok, error]() { cb(ok, error); });
}

bool WebSocketTransport::send_text(const std::string& text) {
    if (!socket_started_ || !ws_->isConnected()) return false;
    ws_->sendMessage(text);
    return true;
}

void WebSocketTransport::deliver_audio(AudioBytes&& pcm, int sample_rate) {
    if (phase_ != Phase::READY || pcm.empty()) return;
    if (cb_audio_) cb_audio_(std::move(pcm), sample_rate);
}

void WebSocketTransport::close() {
    if (phase_ == Phase::CLOSED) return;
    const bool was_open = phase_ != Phase::IDLE;
    phase_ = Phase::CLOSED;

    connect_timer_.cancel();
    cb_connect_ = nullptr;
    clear_callbacks();
    shutdown_socket();
    if (was_open) S2S_LOG_DEBUG("%s: closed locally\n", name());
}

void WebSocketTransport::shutdown_socket() {
    {
        std::lock_guard<std::mutex> lock(gate_->mutex);
        gate_->ioc = nullptr;
    }
    if (!socket_started_) return;
    socket_started_ = false;

    ws_->setMessageCallback({});
    ws_->setBinaryCallback({});
    ws_->setOpenCallback({});
    ws_->setCloseCallback({});
    ws_->setErrorCallback({});
    ws_->disconnect();
}

}
