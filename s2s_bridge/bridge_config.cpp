#include "bridge_config.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace s2s_bridge {

static inline std::string trim(const std::string& s) {
    size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

static inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static inline const char* get_env_var(const char* name, const char* def) {
    const char* val = std::getenv(name);
    return (val && *val) ? val : def;
}

static int get_env_var_int(const char* name, int def, int min_value) {
    const char* val = get_env_var(name, nullptr);
    if (!val) return def;

    char* endptr = nullptr;
    errno = 0;
    long value = strtol(val, &endptr, 10);
    if (errno != 0 || endptr == val || *endptr != '\0' || value < min_value || value > INT_MAX) {
        S2S_LOG_WARNING("%s=%s is not a valid integer >= %d, using %d\n", name, val, min_value, def);
        return def;
    }
    return static_cast<int>(value);
}

std::string resolve_live_model(const std::string& raw) {
    const std::string val = trim(raw);
    if (val.empty()) return kDefaultLiveModel;

    const std::string lower = to_lower(val);
    if (lower.find("flash-live") != std::string::npos) return kDefaultLiveModel;
    if (lower.find("native-audio") != std::string::npos) return kNativeAudioLiveModel;
    return lower.compare(0, 7, "models/") == 0 ? val : "models/" + val;
}

bool parse_bool_value(const std::string& value, bool& out) {
    const std::string lower = to_lower(trim(value));
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        out = false;
        return true;
    }
    return false;
}

BridgeConfig load_bridge_config_from_env() {
    BridgeConfig cfg;

    if (const char* level = get_env_var("LOG_LEVEL", nullptr)) {
        if (!parse_log_level(level, cfg.log_level)) {
            S2S_LOG_WARNING("LOG_LEVEL=%s is not recognized, using info\n", level);
        }
    }

    cfg.api_key         = get_env_var("GEMINI_API_KEY", "");
    cfg.listen_address  = get_env_var("LISTEN_ADDRESS", cfg.listen_address.c_str());
    cfg.port            = get_env_var_int("PORT", cfg.port, 1);
    if (cfg.port > 65535) {
        S2S_LOG_WARNING("PORT=%d is out of range, using 6032\n", cfg.port);
        cfg.port = 6032;
    }
    cfg.model           = resolve_live_model(get_env_var("GEMINI_MODEL", ""));
    cfg.ws_url_override = trim(get_env_var("GEMINI_WS_URL", ""));
    cfg.system_instruction = get_env_var("GEMINI_INSTRUCTIONS", kDefaultInstructions);

    if (const char* header_mode = get_env_var("GEMINI_API_KEY_HEADER", nullptr)) {
        if (!parse_bool_value(header_mode, cfg.api_key_in_header)) {
            S2S_LOG_WARNING("GEMINI_API_KEY_HEADER=%s is not a boolean, using false\n", header_mode);
        }
    }

    if (const char* flag = get_env_var("GEMINI_INPUT_TRANSCRIPTION", nullptr)) {
        if (!parse_bool_value(flag, cfg.input_transcription)) {
            S2S_LOG_WARNING("GEMINI_INPUT_TRANSCRIPTION=%s is not a boolean, using false\n", flag);
        }
    }
    if (const char* flag = get_env_var("GEMINI_OUTPUT_TRANSCRIPTION", nullptr)) {
        if (!parse_bool_value(flag, cfg.output_transcription)) {
            S2S_LOG_WARNING("GEMINI_OUTPUT_TRANSCRIPTION=%s is not a boolean, using false\n", flag);
        }
    }

    if (const char* temp = get_env_var("GEMINI_TEMPERATURE", nullptr)) {
        char* endptr = nullptr;
        float value = strtof(temp, &endptr);
        if (endptr == temp || *endptr != '\0' || value < 0.0f) {
            S2S_LOG_WARNING("GEMINI_TEMPERATURE=%s is not a valid temperature, ignoring\n", temp);
        } else {
            cfg.has_temperature = true;
            cfg.temperature = value;
        }
    }

    cfg.max_output_tokens  = get_env_var_int("GEMINI_MAX_OUTPUT_TOKENS", 0, 0);
    cfg.output_interval_ms = get_env_var_int("INTERVAL_MS", cfg.output_interval_ms, 1);
    cfg.connect_timeout_ms = get_env_var_int("CONNECT_TIMEOUT_MS", cfg.connect_timeout_ms, 1);

    if (const char* tools_file = get_env_var("GEMINI_TOOLS_FILE", nullptr)) {
        std::ifstream in(tools_file, std::ios::binary);
        if (!in) {
            S2S_LOG_WARNING("GEMINI_TOOLS_FILE=%s cannot be read, no tools configured\n", tools_file);
        } else {
            std::ostringstream oss;
            oss << in.rdbuf();
            cfg.tools_json = trim(oss.str());
        }
    }

    if (cfg.api_key.empty()) {
        S2S_LOG_WARNING("GEMINI_API_KEY is not set, remote sessions will be rejected\n");
    }

    return cfg;
}

bool load_env_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) return false;

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.compare(0, 7, "export ") == 0) line = trim(line.substr(7));

        size_t eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        setenv(key.c_str(), value.c_str(), 0);
    }
    return true;
}

}
