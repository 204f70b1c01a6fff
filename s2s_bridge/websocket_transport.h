#ifndef S2S_BRIDGE_WEBSOCKET_TRANSPORT_H
#define S2S_BRIDGE_WEBSOCKET_TRANSPORT_H

#include <memory>
#include <mutex>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include "remote_transport.h"

class WebSocketClient;

namespace s2s_bridge {

/*
 * Common plumbing for transports speaking JSON over a WebSocket.
 *
 * WebSocketClient callbacks arrive on the libwsc event thread; they are bound
 * through a weak_ptr and re-posted onto the io_context, so everything below
 * (phase, callbacks, subclass hooks) runs on the event loop only. Once the
 * socket has been shut down nothing more is posted.
 *
 * Instances must be owned by a std::shared_ptr before connect() is called.
 */
class WebSocketTransport : public IRemoteTransport,
                           public std::enable_shared_from_this<WebSocketTransport> {
public:
    explicit WebSocketTransport(boost::asio::io_context& ioc);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    void connect(const SessionConfig& cfg, OnConnectResult cb) override;
    void send_audio(const AudioFrame& frame, OnSendComplete cb) override;
    /* A pending connect result is dropped. */
    void close() override;

protected:
    enum class Phase {
        IDLE,
        OPENING,    /* socket handshake in progress */
        SETUP,      /* socket open, waiting for the session to be accepted */
        READY,
        CLOSED
    };

    boost::asio::io_context& ioc_;
    SessionConfig            cfg_;
    Phase                    phase_ = Phase::IDLE;

    /* Endpoint without credentials; the key is appended unless header mode. */
    virtual std::string base_url() const = 0;

    /* Runs before the socket is opened. Returning false fails the connect. */
    virtual bool prepare(ConnectionError& error) { (void)error; return true; }

    /* Socket is open. Either send a handshake and move to SETUP, or call
     * complete_connect(true, ...). */
    virtual void handle_open() = 0;
    virtual void handle_text(const std::string& message) = 0;
    virtual void handle_binary(const std::string& payload) = 0;

    virtual std::string encode_audio(const AudioFrame& frame) const = 0;

    /* Maps a failure seen before READY onto a ConnectionError. */
    virtual ConnectionError classify_close(int code, const std::string& reason) const;
    virtual ConnectionError classify_error(int http_status, const std::string& reason) const;

    bool send_text(const std::string& text);
    void complete_connect(bool ok, const ConnectionError& error);
    void deliver_audio(AudioBytes&& pcm, int sample_rate);

private:
    /* Shared with the client callbacks; ioc is cleared under the mutex on shutdown. */
    struct PostGate {
        std::mutex               mutex;
        boost::asio::io_context* ioc = nullptr;
    };

    std::unique_ptr<WebSocketClient> ws_;
    std::shared_ptr<PostGate>        gate_;
    bool                             socket_started_ = false;
    boost::asio::steady_timer        connect_timer_;
    OnConnectResult                  cb_connect_;

    void bind_callbacks(std::weak_ptr<WebSocketTransport> wp);
    void on_socket_open();
    void on_socket_close(int code, const std::string& reason);
    void on_socket_error(int http_status, const std::string& reason);
    void on_connect_timeout();
    void shutdown_socket();

    bool connecting() const { return phase_ == Phase::OPENING || phase_ == Phase::SETUP; }
};

}

#endif
