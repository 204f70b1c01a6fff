#ifndef S2S_BRIDGE_REMOTE_TRANSPORT_H
#define S2S_BRIDGE_REMOTE_TRANSPORT_H

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <boost/asio/io_context.hpp>
#include "audio_format.h"

namespace s2s_bridge {

struct BridgeConfig;

struct SessionConfig {
    std::string api_key;
    bool        api_key_in_header  = false;
    std::string model;
    std::string system_instruction;
    std::vector<std::string> response_modalities = {"AUDIO"};
    bool        input_transcription  = false;
    bool        output_transcription = false;
    bool        has_temperature    = false;
    float       temperature        = 0.0f;
    int         max_output_tokens  = 0;
    std::string tools_json;          /* opaque tool catalog, forwarded verbatim */
    std::string endpoint_url;        /* raw socket endpoint; replaces the Live endpoint when set */
    int         connect_timeout_ms = 10000;
    int         ping_interval_s    = 25;
};

/* Output rate assumed when the remote does not declare one. */
static constexpr int kDefaultRemoteOutputRate = 24000;

struct RemoteAudioChunk {
    AudioBytes pcm;
    int        sample_rate = kDefaultRemoteOutputRate;
};

struct ConnectionError {
    enum Kind {
        UNREACHABLE,       /* network, TLS, auth rejection, timeout */
        INVALID_CONFIG     /* the session setup itself was rejected */
    };
    Kind        kind = UNREACHABLE;
    std::string message;
    int         http_status = 0;
};

const char* connection_error_kind_name(ConnectionError::Kind kind);

using OnConnectResult = std::function<void(bool ok, const ConnectionError& error)>;
using OnSendComplete  = std::function<void(bool ok, const std::string& error)>;
using OnRemoteAudio   = std::function<void(AudioBytes&& pcm, int sample_rate)>;
using OnRemoteClose   = std::function<void(int code, const std::string& reason)>;
using OnRemoteError   = std::function<void(const std::string& error)>;

/*
 * One live duplex audio session with the remote service.
 *
 * All callbacks are delivered on the io_context the transport was created
 * with. on_close/on_error only fire after a successful connect, and nothing
 * fires once close() has returned.
 */
class IRemoteTransport {
public:
    virtual ~IRemoteTransport() = default;

    /* Fails fast: the result callback fires exactly once, no retries. */
    virtual void connect(const SessionConfig& cfg, OnConnectResult cb) = 0;
    virtual void send_audio(const AudioFrame& frame, OnSendComplete cb) = 0;
    /* Idempotent, also after a failed or partial connect. */
    virtual void close() = 0;
    virtual const char* name() const = 0;

    void on_audio(OnRemoteAudio cb) { cb_audio_ = std::move(cb); }
    void on_close(OnRemoteClose cb) { cb_close_ = std::move(cb); }
    void on_error(OnRemoteError cb) { cb_error_ = std::move(cb); }

protected:
    OnRemoteAudio cb_audio_;
    OnRemoteClose cb_close_;
    OnRemoteError cb_error_;

    void clear_callbacks() {
        cb_audio_ = nullptr;
        cb_close_ = nullptr;
        cb_error_ = nullptr;
    }
};

SessionConfig make_session_config(const BridgeConfig& cfg);

/* Raw socket transport when an explicit endpoint is configured, otherwise the
 * managed Live session transport. */
std::shared_ptr<IRemoteTransport> create_remote_transport(const BridgeConfig& cfg,
                                                          boost::asio::io_context& ioc);

/* Appends `key=<url-encoded api key>` with '?' or '&' as appropriate. */
std::string append_key_param(const std::string& url, const std::string& api_key);

std::string url_encode(const std::string& value);

/* Decodes a base64 audio payload tagged with `mime`. A WAV container loses its
 * 44-byte header. Returns false with `error` set when the payload is not valid
 * base64. */
bool decode_inline_audio(const std::string& b64, const std::string& mime,
                         RemoteAudioChunk& out, std::string& error);

/* True when the first non-blank character opens a JSON object. */
bool looks_like_json(const std::string& text);

}

#endif
