#ifndef S2S_BRIDGE_LIVE_SESSION_TRANSPORT_H
#define S2S_BRIDGE_LIVE_SESSION_TRANSPORT_H

#include <string>
#include <vector>
#include "websocket_transport.h"

namespace s2s_bridge {

static constexpr const char* kLiveEndpoint =
    "wss://generativelanguage.googleapis.com/ws/"
    "google.ai.generativelanguage.v1beta.GenerativeService.BidiGenerateContent";

struct LiveServerMessage {
    bool setup_complete = false;
    bool turn_complete  = false;
    bool interrupted    = false;
    bool go_away        = false;
    std::string go_away_time_left;
    bool tool_call      = false;
    std::vector<RemoteAudioChunk> audio;
    std::vector<std::string>      text;
    std::string input_transcript;
    std::string output_transcript;
    int  bad_parts      = 0;     /* inlineData that failed to decode */
};

/* Serializes the session `setup` message. Fails with `error` set when the
 * tool catalog is not valid JSON. */
bool build_live_setup_message(const SessionConfig& cfg, std::string& out, std::string& error);

std::string build_live_audio_message(const AudioFrame& frame);

/* Returns false when `json` is not a JSON object. Unknown fields are ignored. */
bool parse_live_server_message(const std::string& json, LiveServerMessage& out);

/* Close received before setupComplete. 1007/1008 mean the setup was rejected,
 * unless the reason blames the API key. */
ConnectionError classify_live_close(int code, const std::string& reason);

/* Handshake failure. 401/403 are credential problems (unreachable), 400/404
 * point at a bad model or request (invalid config). */
ConnectionError classify_live_handshake_error(int http_status, const std::string& reason);

/*
 * Managed Live API session: opens the socket, sends `setup`, and reports the
 * connect result once `setupComplete` arrives.
 */
class LiveSessionTransport : public WebSocketTransport {
public:
    explicit LiveSessionTransport(boost::asio::io_context& ioc) : WebSocketTransport(ioc) {}

    const char* name() const override { return "live"; }

protected:
    std::string base_url() const override {
        return cfg_.endpoint_url.empty() ? std::string(kLiveEndpoint) : cfg_.endpoint_url;
    }
    bool prepare(ConnectionError& error) override;
    void handle_open() override;
    void handle_text(const std::string& message) override;
    void handle_binary(const std::string& payload) override;
    std::string encode_audio(const AudioFrame& frame) const override;
    ConnectionError classify_close(int code, const std::string& reason) const override;
    ConnectionError classify_error(int http_status, const std::string& reason) const override;

private:
    std::string setup_message_;
};

}

#endif
