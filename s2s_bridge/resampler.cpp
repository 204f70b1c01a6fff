#include "resampler.h"
#include <cmath>

namespace s2s_bridge {

static constexpr size_t kUpsampleFactor   = 2;
static constexpr size_t kDownsampleFactor = 3;

static inline int16_t read_sample(const uint8_t* p) {
    return static_cast<int16_t>(static_cast<uint16_t>(p[0]) |
                                (static_cast<uint16_t>(p[1]) << 8));
}

static inline void write_sample(uint8_t* p, int16_t s) {
    const uint16_t u = static_cast<uint16_t>(s);
    p[0] = static_cast<uint8_t>(u & 0xff);
    p[1] = static_cast<uint8_t>(u >> 8);
}

static inline int16_t clamp16(double v) {
    if (v > 32767.0) return 32767;
    if (v < -32768.0) return -32768;
    return static_cast<int16_t>(v);
}

AudioBytes upsample_8k_to_16k(const uint8_t* data, size_t len) {
    if (!data || len == 0) return AudioBytes();

    const size_t in_samples = len / kBytesPerSample;
    if (in_samples < 2) return AudioBytes(data, data + len);

    AudioBytes out(in_samples * kUpsampleFactor * kBytesPerSample);

    for (size_t i = 0; i + 1 < in_samples; ++i) {
        const double current = read_sample(data + i * kBytesPerSample);
        const double next    = read_sample(data + (i + 1) * kBytesPerSample);

        for (size_t j = 0; j < kUpsampleFactor; ++j) {
            const double t = static_cast<double>(j) / kUpsampleFactor;
            /* round half up */
            const double interpolated = std::floor(current + (next - current) * t + 0.5);
            write_sample(&out[(i * kUpsampleFactor + j) * kBytesPerSample], clamp16(interpolated));
        }
    }

    const int16_t last = read_sample(data + (in_samples - 1) * kBytesPerSample);
    for (size_t j = 0; j < kUpsampleFactor; ++j) {
        write_sample(&out[((in_samples - 1) * kUpsampleFactor + j) * kBytesPerSample], last);
    }

    return out;
}

AudioBytes upsample_8k_to_16k(const AudioBytes& in) {
    return upsample_8k_to_16k(in.data(), in.size());
}

AudioBytes downsample_24k_to_8k(const uint8_t* data, size_t len) {
    if (!data || len == 0) return AudioBytes();

    const size_t in_samples = len / kBytesPerSample;
    if (in_samples < kDownsampleFactor) return AudioBytes(data, data + len);

    const size_t out_samples = in_samples / kDownsampleFactor;
    AudioBytes out(out_samples * kBytesPerSample);

    for (size_t i = 0; i < out_samples; ++i) {
        const uint8_t* src = data + i * kDownsampleFactor * kBytesPerSample;
        out[i * kBytesPerSample]     = src[0];
        out[i * kBytesPerSample + 1] = src[1];
    }

    return out;
}

AudioBytes downsample_24k_to_8k(const AudioBytes& in) {
    return downsample_24k_to_8k(in.data(), in.size());
}

}
