#ifndef S2S_BRIDGE_FRAME_ACCUMULATOR_H
#define S2S_BRIDGE_FRAME_ACCUMULATOR_H

#include <cstdint>
#include <cstddef>
#include "audio_format.h"

namespace s2s_bridge {

/*
 * Byte FIFO that releases audio in fixed-size frames, at most one per tick.
 * Not thread-safe: owned by one StreamController and only touched from its
 * event loop.
 */
class FrameAccumulator {
public:
    explicit FrameAccumulator(size_t frame_bytes);

    FrameAccumulator(const FrameAccumulator&) = delete;
    FrameAccumulator& operator=(const FrameAccumulator&) = delete;

    /* Returns false (and drops the data) once the accumulator is closed. */
    bool append(const uint8_t* data, size_t len);
    bool append(const AudioBytes& data) { return append(data.data(), data.size()); }

    /* Tick body: moves exactly frame_bytes() oldest bytes into `out` if that
     * many are queued. The remainder stays for the next tick. */
    bool pop_frame(AudioBytes& out);

    /* Discards queued audio; later appends are rejected. */
    void close();

    bool   is_closed()      const { return closed_; }
    size_t size()           const { return buffer_.size() - head_; }
    size_t frame_bytes()    const { return frame_bytes_; }
    size_t frames_emitted() const { return frames_emitted_; }

private:
    AudioBytes buffer_;
    size_t     head_           = 0;
    size_t     frame_bytes_;
    size_t     frames_emitted_ = 0;
    bool       closed_         = false;

    void compact();
};

}

#endif
