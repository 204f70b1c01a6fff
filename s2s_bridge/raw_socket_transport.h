#ifndef S2S_BRIDGE_RAW_SOCKET_TRANSPORT_H
#define S2S_BRIDGE_RAW_SOCKET_TRANSPORT_H

#include <string>
#include <vector>
#include "websocket_transport.h"

namespace s2s_bridge {

/* {"type":"input_audio","mimeType":"audio/pcm;rate=16000","data":"<base64>"} */
std::string build_envelope_message(const AudioFrame& frame);

/*
 * Extracts audio from an envelope. Looks at `delta`, `audio`, `inlineData.data`
 * and finally `serverContent.modelTurn.parts[].inlineData`. A message with no
 * audio is valid and leaves `out` empty. Returns false when `json` cannot be
 * parsed or the audio is not valid base64.
 */
bool parse_envelope_message(const std::string& json, std::vector<RemoteAudioChunk>& out,
                            std::string& error);

/*
 * Fallback transport for an explicitly configured endpoint speaking a simple
 * JSON envelope. The session is usable as soon as the socket is open.
 */
class RawSocketTransport : public WebSocketTransport {
public:
    explicit RawSocketTransport(boost::asio::io_context& ioc) : WebSocketTransport(ioc) {}

    const char* name() const override { return "raw-ws"; }

protected:
    std::string base_url() const override { return cfg_.endpoint_url; }
    bool prepare(ConnectionError& error) override;
    void handle_open() override;
    void handle_text(const std::string& message) override;
    void handle_binary(const std::string& payload) override;
    std::string encode_audio(const AudioFrame& frame) const override;
};

}

#endif
