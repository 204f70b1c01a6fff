#include "audio_format.h"
#include <cstdlib>
#include <climits>

namespace s2s_bridge {

int parse_mime_rate(const std::string& mime, int default_hz) {
    size_t pos = mime.find("rate=");
    if (pos == std::string::npos) return default_hz;

    const char* start = mime.c_str() + pos + 5;
    char* endptr = nullptr;
    long value = strtol(start, &endptr, 10);
    if (endptr == start || value <= 0 || value > INT_MAX) return default_hz;
    return static_cast<int>(value);
}

bool is_wav_mime(const std::string& mime) {
    return mime.compare(0, 9, "audio/wav") == 0;
}

}
