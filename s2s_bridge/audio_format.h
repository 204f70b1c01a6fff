#ifndef S2S_BRIDGE_AUDIO_FORMAT_H
#define S2S_BRIDGE_AUDIO_FORMAT_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace s2s_bridge {

/* PCM16 LE mono throughout */
static constexpr size_t kBytesPerSample = 2;
static constexpr size_t kWavHeaderBytes = 44;

enum class SampleRate : int {
    HZ_8000  = 8000,
    HZ_16000 = 16000,
    HZ_24000 = 24000
};

using AudioBytes = std::vector<uint8_t>;

struct AudioFrame {
    AudioBytes data;
    SampleRate rate = SampleRate::HZ_8000;
};

inline int sample_rate_hz(SampleRate rate) { return static_cast<int>(rate); }

/* Bytes needed for `ms` milliseconds of audio at `rate`. */
inline size_t bytes_for_ms(SampleRate rate, int ms) {
    return static_cast<size_t>(sample_rate_hz(rate)) * kBytesPerSample * ms / 1000;
}

inline std::string pcm_mime_type(SampleRate rate) {
    return "audio/pcm;rate=" + std::to_string(sample_rate_hz(rate));
}

/* Reads the `rate=` parameter of a mime type such as "audio/pcm;rate=24000".
 * Returns `default_hz` when the parameter is absent or not a positive number. */
int parse_mime_rate(const std::string& mime, int default_hz);

bool is_wav_mime(const std::string& mime);

}

#endif
