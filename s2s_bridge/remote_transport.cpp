#include "remote_transport.h"
#include "bridge_config.h"
#include "live_session_transport.h"
#include "raw_socket_transport.h"
#include <base64.h>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace s2s_bridge {

const char* connection_error_kind_name(ConnectionError::Kind kind) {
    switch (kind) {
        case ConnectionError::UNREACHABLE:    return "unreachable";
        case ConnectionError::INVALID_CONFIG: return "invalid-config";
    }
    return "unknown";
}

SessionConfig make_session_config(const BridgeConfig& cfg) {
    SessionConfig session;
    session.api_key            = cfg.api_key;
    session.api_key_in_header  = cfg.api_key_in_header;
    session.model              = cfg.model;
    session.system_instruction = cfg.system_instruction;
    session.input_transcription  = cfg.input_transcription;
    session.output_transcription = cfg.output_transcription;
    session.has_temperature    = cfg.has_temperature;
    session.temperature        = cfg.temperature;
    session.max_output_tokens  = cfg.max_output_tokens;
    session.tools_json         = cfg.tools_json;
    session.endpoint_url       = cfg.ws_url_override;
    session.connect_timeout_ms = cfg.connect_timeout_ms;
    session.ping_interval_s    = cfg.ping_interval_s;
    return session;
}

std::shared_ptr<IRemoteTransport> create_remote_transport(const BridgeConfig& cfg,
                                                          boost::asio::io_context& ioc) {
    if (!cfg.ws_url_override.empty()) {
        return std::make_shared<RawSocketTransport>(ioc);
    }
    return std::make_shared<LiveSessionTransport>(ioc);
}

std::string url_encode(const std::string& value) {
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            c == '!' || c == '*' || c == '\'' || c == '(' || c == ')') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

std::string append_key_param(const std::string& url, const std::string& api_key) {
    const char sep = url.find('?') != std::string::npos ? '&' : '?';
    return url + sep + "key=" + url_encode(api_key);
}

bool decode_inline_audio(const std::string& b64, const std::string& mime,
                         RemoteAudioChunk& out, std::string& error) {
    std::string raw;
    try {
        raw = base64_decode(b64);
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }

    size_t offset = 0;
    if (is_wav_mime(mime) && raw.size() > kWavHeaderBytes) {
        offset = kWavHeaderBytes;
    }

    out.pcm.assign(raw.begin() + static_cast<std::ptrdiff_t>(offset), raw.end());
    out.sample_rate = parse_mime_rate(mime, kDefaultRemoteOutputRate);
    return true;
}

bool looks_like_json(const std::string& text) {
    for (char c : text) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') continue;
        return c == '{';
    }
    return false;
}

}
