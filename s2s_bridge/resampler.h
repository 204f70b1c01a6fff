#ifndef S2S_BRIDGE_RESAMPLER_H
#define S2S_BRIDGE_RESAMPLER_H

#include <cstdint>
#include <cstddef>
#include "audio_format.h"

namespace s2s_bridge {

/*
 * 8 kHz -> 16 kHz by linear interpolation between neighbouring samples.
 * The last input sample has no successor and is repeated, so the output
 * always holds exactly twice as many samples as the input.
 * Fewer than 2 samples cannot be interpolated and are returned unchanged.
 */
AudioBytes upsample_8k_to_16k(const uint8_t* data, size_t len);
AudioBytes upsample_8k_to_16k(const AudioBytes& in);

/*
 * 24 kHz -> 8 kHz by plain decimation: keeps sample 0 of every group of 3
 * and drops the trailing partial group. No anti-aliasing filter.
 * Fewer than 3 samples are returned unchanged.
 */
AudioBytes downsample_24k_to_8k(const uint8_t* data, size_t len);
AudioBytes downsample_24k_to_8k(const AudioBytes& in);

}

#endif
