#include "live_session_transport.h"
#include "log.h"
#include <base64.h>
#include <cjson/cJSON.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace s2s_bridge {

static std::string print_and_delete(cJSON* root) {
    char* json_str = cJSON_PrintUnformatted(root);
    std::string out = json_str ? json_str : "";
    free(json_str);
    cJSON_Delete(root);
    return out;
}

static bool mentions_api_key(const std::string& reason) {
    std::string lower = reason;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("api key") != std::string::npos ||
           lower.find("api_key") != std::string::npos;
}

bool build_live_setup_message(const SessionConfig& cfg, std::string& out, std::string& error) {
    cJSON* tools = nullptr;
    if (!cfg.tools_json.empty()) {
        tools = cJSON_Parse(cfg.tools_json.c_str());
        if (!tools) {
            error = "tool catalog is not valid JSON";
            return false;
        }
    }

    cJSON* root = cJSON_CreateObject();
    cJSON* setup = cJSON_AddObjectToObject(root, "setup");
    cJSON_AddStringToObject(setup, "model", cfg.model.c_str());

    cJSON* generation = cJSON_AddObjectToObject(setup, "generationConfig");
    cJSON* modalities = cJSON_AddArrayToObject(generation, "responseModalities");
    for (const auto& modality : cfg.response_modalities) {
        cJSON_AddItemToArray(modalities, cJSON_CreateString(modality.c_str()));
    }
    if (cfg.has_temperature) {
        cJSON_AddNumberToObject(generation, "temperature", cfg.temperature);
    }
    if (cfg.max_output_tokens > 0) {
        cJSON_AddNumberToObject(generation, "maxOutputTokens", cfg.max_output_tokens);
    }

    if (cfg.input_transcription)  cJSON_AddObjectToObject(setup, "inputAudioTranscription");
    if (cfg.output_transcription) cJSON_AddObjectToObject(setup, "outputAudioTranscription");

    if (!cfg.system_instruction.empty()) {
        cJSON* instruction = cJSON_AddObjectToObject(setup, "systemInstruction");
        cJSON* parts = cJSON_AddArrayToObject(instruction, "parts");
        cJSON* part = cJSON_CreateObject();
        cJSON_AddStringToObject(part, "text", cfg.system_instruction.c_str());
        cJSON_AddItemToArray(parts, part);
    }

    if (tools) {
        cJSON_AddItemToObject(setup, "tools", tools);
    }

    out = print_and_delete(root);
    return true;
}

std::string build_live_audio_message(const AudioFrame& frame) {
    cJSON* root = cJSON_CreateObject();
    cJSON* input = cJSON_AddObjectToObject(root, "realtimeInput");
    cJSON* chunks = cJSON_AddArrayToObject(input, "mediaChunks");

    cJSON* chunk = cJSON_CreateObject();
    cJSON_AddStringToObject(chunk, "mimeType", pcm_mime_type(frame.rate).c_str());
    const std::string data = base64_encode(frame.data.data(), frame.data.size());
    cJSON_AddStringToObject(chunk, "data", data.c_str());
    cJSON_AddItemToArray(chunks, chunk);

    return print_and_delete(root);
}

static void parse_model_parts(const cJSON* parts, LiveServerMessage& out) {
    const cJSON* part = nullptr;
    cJSON_ArrayForEach(part, parts) {
        const cJSON* text = cJSON_GetObjectItemCaseSensitive(part, "text");
        if (cJSON_IsString(text) && text->valuestring) {
            out.text.emplace_back(text->valuestring);
        }

        const cJSON* inline_data = cJSON_GetObjectItemCaseSensitive(part, "inlineData");
        const cJSON* data = cJSON_GetObjectItemCaseSensitive(inline_data, "data");
        if (!cJSON_IsString(data) || !data->valuestring || !*data->valuestring) continue;

        const cJSON* mime = cJSON_GetObjectItemCaseSensitive(inline_data, "mimeType");
        const std::string mime_type = (cJSON_IsString(mime) && mime->valuestring)
                                          ? mime->valuestring : "audio/pcm;rate=24000";

        RemoteAudioChunk chunk;
        std::string error;
        if (!decode_inline_audio(data->valuestring, mime_type, chunk, error)) {
            S2S_LOG_WARNING("live: skipping undecodable audio part: %s\n", error.c_str());
            ++out.bad_parts;
            continue;
        }
        if (!chunk.pcm.empty()) out.audio.push_back(std::move(chunk));
    }
}

bool parse_live_server_message(const std::string& json, LiveServerMessage& out) {
    cJSON* root = cJSON_Parse(json.c_str());
    if (!root) return false;
    if (!cJSON_IsObject(root)) {
        cJSON_Delete(root);
        return false;
    }

    out.setup_complete = cJSON_HasObjectItem(root, "setupComplete");
    out.tool_call = cJSON_HasObjectItem(root, "toolCall");

    const cJSON* go_away = cJSON_GetObjectItemCaseSensitive(root, "goAway");
    if (go_away) {
        out.go_away = true;
        const cJSON* left = cJSON_GetObjectItemCaseSensitive(go_away, "timeLeft");
        if (cJSON_IsString(left) && left->valuestring) out.go_away_time_left = left->valuestring;
    }

    const cJSON* content = cJSON_GetObjectItemCaseSensitive(root, "serverContent");
    if (cJSON_IsObject(content)) {
        out.turn_complete = cJSON_IsTrue(cJSON_GetObjectItemCaseSensitive(content, "turnComplete"));
        out.interrupted = cJSON_IsTrue(cJSON_GetObjectItemCaseSensitive(content, "interrupted"));

        const cJSON* input = cJSON_GetObjectItemCaseSensitive(content, "inputTranscription");
        const cJSON* input_text = cJSON_GetObjectItemCaseSensitive(input, "text");
        if (cJSON_IsString(input_text) && input_text->valuestring) {
            out.input_transcript = input_text->valuestring;
        }
        const cJSON* output = cJSON_GetObjectItemCaseSensitive(content, "outputTranscription");
        const cJSON* output_text = cJSON_GetObjectItemCaseSensitive(output, "text");
        if (cJSON_IsString(output_text) && output_text->valuestring) {
            out.output_transcript = output_text->valuestring;
        }

        const cJSON* turn = cJSON_GetObjectItemCaseSensitive(content, "modelTurn");
        const cJSON* parts = cJSON_GetObjectItemCaseSensitive(turn, "parts");
        if (cJSON_IsArray(parts)) parse_model_parts(parts, out);
    }

    cJSON_Delete(root);
    return true;
}

ConnectionError classify_live_close(int code, const std::string& reason) {
    ConnectionError error;
    error.message = "setup rejected (code=" + std::to_string(code) + " " + reason + ")";
    if ((code == 1007 || code == 1008) && !mentions_api_key(reason)) {
        error.kind = ConnectionError::INVALID_CONFIG;
    } else {
        error.kind = ConnectionError::UNREACHABLE;
    }
    return error;
}

ConnectionError classify_live_handshake_error(int http_status, const std::string& reason) {
    ConnectionError error;
    error.http_status = http_status;
    error.message = reason;
    if (http_status == 400 || http_status == 404) {
        error.kind = ConnectionError::INVALID_CONFIG;
    } else {
        error.kind = ConnectionError::UNREACHABLE;
    }
    return error;
}

bool LiveSessionTransport::prepare(ConnectionError& error) {
    std::string reason;
    if (!build_live_setup_message(cfg_, setup_message_, reason)) {
        error.kind = ConnectionError::INVALID_CONFIG;
        error.message = reason;
        return false;
    }
    S2S_LOG_INFO("live: using model %s\n", cfg_.model.c_str());
    return true;
}

void LiveSessionTransport::handle_open() {
    phase_ = Phase::SETUP;
    if (!send_text(setup_message_)) {
        ConnectionError error;
        error.message = "failed to send setup";
        complete_connect(false, error);
        return;
    }
    S2S_LOG_DEBUG("live: setup sent (%zu bytes)\n", setup_message_.size());
}

void LiveSessionTransport::handle_text(const std::string& message) {
    LiveServerMessage msg;
    if (!parse_live_server_message(message, msg)) {
        S2S_LOG_WARNING("live: ignoring malformed message (%zu bytes)\n", message.size());
        return;
    }

    if (msg.setup_complete) {
        if (phase_ == Phase::SETUP) complete_connect(true, ConnectionError());
        return;
    }
    if (phase_ != Phase::READY) {
        S2S_LOG_DEBUG("live: message before setupComplete ignored\n");
        return;
    }

    for (auto& chunk : msg.audio) {
        deliver_audio(std::move(chunk.pcm), chunk.sample_rate);
    }
    for (const auto& text : msg.text) {
        S2S_LOG_DEBUG("live: model text: %s\n", text.c_str());
    }
    if (!msg.input_transcript.empty()) {
        S2S_LOG_INFO("live: caller said: %s\n", msg.input_transcript.c_str());
    }
    if (!msg.output_transcript.empty()) {
        S2S_LOG_INFO("live: model said: %s\n", msg.output_transcript.c_str());
    }
    if (msg.interrupted)   S2S_LOG_DEBUG("live: turn interrupted\n");
    if (msg.turn_complete) S2S_LOG_DEBUG("live: turn complete\n");
    if (msg.tool_call)     S2S_LOG_WARNING("live: toolCall received, no tool handler configured\n");
    if (msg.go_away) {
        S2S_LOG_WARNING("live: server going away (timeLeft=%s)\n", msg.go_away_time_left.c_str());
    }
}

void LiveSessionTransport::handle_binary(const std::string& payload) {
    if (looks_like_json(payload)) {
        handle_text(payload);
        return;
    }
    if (phase_ != Phase::READY) return;
    AudioBytes pcm(payload.begin(), payload.end());
    deliver_audio(std::move(pcm), kDefaultRemoteOutputRate);
}

std::string LiveSessionTransport::encode_audio(const AudioFrame& frame) const {
    return build_live_audio_message(frame);
}

ConnectionError LiveSessionTransport::classify_close(int code, const std::string& reason) const {
    if (phase_ == Phase::SETUP) return classify_live_close(code, reason);
    return WebSocketTransport::classify_close(code, reason);
}

ConnectionError LiveSessionTransport::classify_error(int http_status, const std::string& reason) const {
    return classify_live_handshake_error(http_status, reason);
}

}
