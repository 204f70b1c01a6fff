#ifndef S2S_BRIDGE_BRIDGE_CONFIG_H
#define S2S_BRIDGE_BRIDGE_CONFIG_H

#include <string>
#include "log.h"

namespace s2s_bridge {

static constexpr const char* kDefaultLiveModel        = "models/gemini-live-2.5-flash-preview";
static constexpr const char* kNativeAudioLiveModel    = "models/gemini-2.5-flash-preview-native-audio-dialog";
static constexpr const char* kDefaultInstructions     = "You are a helpful assistant and answer in a friendly tone.";

struct BridgeConfig {
    std::string api_key;
    std::string listen_address     = "0.0.0.0";
    int         port               = 6032;
    std::string model              = kDefaultLiveModel;
    std::string ws_url_override;                   /* non-empty selects the raw socket transport */
    bool        api_key_in_header  = false;
    std::string system_instruction = kDefaultInstructions;
    bool        input_transcription  = false;
    bool        output_transcription = false;
    bool        has_temperature    = false;
    float       temperature        = 0.0f;
    int         max_output_tokens  = 0;            /* 0 = leave to the service */
    std::string tools_json;                        /* opaque, passed through as-is */
    int         output_interval_ms = 20;
    int         uplink_interval_ms = 100;
    int         connect_timeout_ms = 10000;
    int         ping_interval_s    = 25;
    LogLevel    log_level          = LogLevel::INFO;
};

/*
 * Maps the configured model onto a Live model id:
 *   empty                    -> kDefaultLiveModel
 *   contains "flash-live"    -> kDefaultLiveModel
 *   contains "native-audio"  -> kNativeAudioLiveModel
 *   otherwise prefixed with "models/" unless it already is
 */
std::string resolve_live_model(const std::string& raw);

/* Builds the configuration from the process environment. Malformed values are
 * logged and replaced by their defaults. */
BridgeConfig load_bridge_config_from_env();

/* Seeds the environment from a KEY=VALUE file without overriding variables
 * that are already set. Returns false if the file cannot be opened. */
bool load_env_file(const std::string& path);

bool parse_bool_value(const std::string& value, bool& out);

}

#endif
