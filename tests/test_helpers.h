#ifndef S2S_BRIDGE_TEST_HELPERS_H
#define S2S_BRIDGE_TEST_HELPERS_H

#include <cstdint>
#include <vector>
#include "audio_format.h"

namespace s2s_bridge {
namespace test {

inline AudioBytes pcm_from_samples(const std::vector<int16_t>& samples) {
    AudioBytes out;
    out.reserve(samples.size() * 2);
    for (int16_t s : samples) {
        const uint16_t u = static_cast<uint16_t>(s);
        out.push_back(static_cast<uint8_t>(u & 0xff));
        out.push_back(static_cast<uint8_t>(u >> 8));
    }
    return out;
}

inline std::vector<int16_t> samples_from_pcm(const AudioBytes& pcm) {
    std::vector<int16_t> out;
    out.reserve(pcm.size() / 2);
    for (size_t i = 0; i + 1 < pcm.size(); i += 2) {
        out.push_back(static_cast<int16_t>(static_cast<uint16_t>(pcm[i]) |
                                           (static_cast<uint16_t>(pcm[i + 1]) << 8)));
    }
    return out;
}

}
}

#endif
