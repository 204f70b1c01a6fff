#include "raw_socket_transport.h"
#include "log.h"
#include <base64.h>
#include <cjson/cJSON.h>
#include <cstdlib>

namespace s2s_bridge {

std::string build_envelope_message(const AudioFrame& frame) {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "type", "input_audio");
    cJSON_AddStringToObject(root, "mimeType", pcm_mime_type(frame.rate).c_str());
    const std::string data = base64_encode(frame.data.data(), frame.data.size());
    cJSON_AddStringToObject(root, "data", data.c_str());

    char* json_str = cJSON_PrintUnformatted(root);
    std::string out = json_str ? json_str : "";
    free(json_str);
    cJSON_Delete(root);
    return out;
}

static const char* string_item(const cJSON* object, const char* key) {
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(object, key);
    if (!cJSON_IsString(item) || !item->valuestring || !*item->valuestring) return nullptr;
    return item->valuestring;
}

static bool decode_into(const char* b64, const char* mime,
                        std::vector<RemoteAudioChunk>& out, std::string& error) {
    RemoteAudioChunk chunk;
    if (!decode_inline_audio(b64, mime ? mime : "audio/pcm;rate=24000", chunk, error)) {
        return false;
    }
    if (!chunk.pcm.empty()) out.push_back(std::move(chunk));
    return true;
}

bool parse_envelope_message(const std::string& json, std::vector<RemoteAudioChunk>& out,
                            std::string& error) {
    cJSON* root = cJSON_Parse(json.c_str());
    if (!root || !cJSON_IsObject(root)) {
        cJSON_Delete(root);
        error = "not a JSON object";
        return false;
    }

    bool ok = true;
    const cJSON* inline_data = cJSON_GetObjectItemCaseSensitive(root, "inlineData");
    const char* mime = string_item(root, "mimeType");

    if (const char* delta = string_item(root, "delta")) {
        ok = decode_into(delta, mime, out, error);
    } else if (const char* audio = string_item(root, "audio")) {
        ok = decode_into(audio, mime, out, error);
    } else if (const char* data = string_item(inline_data, "data")) {
        ok = decode_into(data, string_item(inline_data, "mimeType"), out, error);
    } else {
        const cJSON* content = cJSON_GetObjectItemCaseSensitive(root, "serverContent");
        const cJSON* turn = cJSON_GetObjectItemCaseSensitive(content, "modelTurn");
        const cJSON* parts = cJSON_GetObjectItemCaseSensitive(turn, "parts");
        const cJSON* part = nullptr;
        cJSON_ArrayForEach(part, parts) {
            const cJSON* part_data = cJSON_GetObjectItemCaseSensitive(part, "inlineData");
            const char* b64 = string_item(part_data, "data");
            if (!b64) continue;
            if (!decode_into(b64, string_item(part_data, "mimeType"), out, error)) {
                ok = false;
                break;
            }
        }
    }

    cJSON_Delete(root);
    return ok;
}

bool RawSocketTransport::prepare(ConnectionError& error) {
    if (cfg_.endpoint_url.empty()) {
        error.kind = ConnectionError::INVALID_CONFIG;
        error.message = "no endpoint configured";
        return false;
    }
    return true;
}

void RawSocketTransport::handle_open() {
    complete_connect(true, ConnectionError());
}

void RawSocketTransport::handle_text(const std::string& message) {
    std::vector<RemoteAudioChunk> chunks;
    std::string error;
    if (!parse_envelope_message(message, chunks, error)) {
        S2S_LOG_WARNING("raw-ws: ignoring message (%s)\n", error.c_str());
        return;
    }
    for (auto& chunk : chunks) {
        deliver_audio(std::move(chunk.pcm), chunk.sample_rate);
    }
}

void RawSocketTransport::handle_binary(const std::string& payload) {
    if (looks_like_json(payload)) {
        handle_text(payload);
        return;
    }
    AudioBytes pcm(payload.begin(), payload.end());
    deliver_audio(std::move(pcm), kDefaultRemoteOutputRate);
}

std::string RawSocketTransport::encode_audio(const AudioFrame& frame) const {
    return build_envelope_message(frame);
}

}
