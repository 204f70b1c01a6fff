#include "frame_accumulator.h"
#include <algorithm>

namespace s2s_bridge {

FrameAccumulator::FrameAccumulator(size_t frame_bytes)
    : frame_bytes_(std::max<size_t>(frame_bytes, kBytesPerSample))
{
    buffer_.reserve(frame_bytes_ * 2);
}

bool FrameAccumulator::append(const uint8_t* data, size_t len) {
    if (closed_) return false;
    if (!data || len == 0) return true;
    buffer_.insert(buffer_.end(), data, data + len);
    return true;
}

bool FrameAccumulator::pop_frame(AudioBytes& out) {
    if (closed_ || size() < frame_bytes_) return false;

    const auto first = buffer_.begin() + static_cast<std::ptrdiff_t>(head_);
    out.assign(first, first + static_cast<std::ptrdiff_t>(frame_bytes_));
    head_ += frame_bytes_;
    ++frames_emitted_;

    compact();
    return true;
}

void FrameAccumulator::close() {
    closed_ = true;
    AudioBytes().swap(buffer_);
    head_ = 0;
}

/*
 * Consumed bytes are only shifted out once they make up at least half of the
 * storage, which keeps append/pop amortized O(1).
 */
void FrameAccumulator::compact() {
    if (head_ == buffer_.size()) {
        buffer_.clear();
        head_ = 0;
        return;
    }
    if (head_ >= frame_bytes_ && head_ * 2 >= buffer_.size()) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(head_));
        head_ = 0;
    }
}

}
