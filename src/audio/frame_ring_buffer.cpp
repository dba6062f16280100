#include "audio/frame_ring_buffer.hpp"

#include "audio/audio_utils.hpp"

#include <algorithm>
#include <stdexcept>

// Constructor
FrameRingBuffer::FrameRingBuffer(std::size_t capacity, std::size_t samplesPerFrame) {
    if (capacity == 0) throw std::invalid_argument("FrameRingBuffer capacity must be positive");
    slots_.resize(capacity);
    for (auto& slot : slots_) slot.samples.reserve(samplesPerFrame);
}

std::size_t FrameRingBuffer::capacityForJitter(int sampleRate, int frameSize, int jitterMs) {
    const int minimum = framesForMs(std::max(jitterMs, 200), frameSize, sampleRate);
    return (std::size_t)std::max(2, minimum + 1);
}

void FrameRingBuffer::store(std::size_t slot, const int16_t* samples, std::size_t count,
                            const AudioFrame& header) {
    AudioFrame& f = slots_[slot];
    f.samples.assign(samples, samples + count);
    f.sampleRate = header.sampleRate;
    f.channels = header.channels;
    f.timestampUs = header.timestampUs;
    f.sequence = header.sequence;
    f.streamId = header.streamId;
}

void FrameRingBuffer::take(AudioFrame& out) {
    AudioFrame& f = slots_[head_];
    out.samples.assign(f.samples.begin(), f.samples.end());
    out.sampleRate = f.sampleRate;
    out.channels = f.channels;
    out.timestampUs = f.timestampUs;
    out.sequence = f.sequence;
    out.streamId = f.streamId;
    head_ = (head_ + 1) % slots_.size();
    --count_;
}

FrameRingBuffer::PushResult FrameRingBuffer::push(const AudioFrame& frame) {
    return push(frame.samples.data(), frame.samples.size(), frame);
}

FrameRingBuffer::PushResult FrameRingBuffer::push(const int16_t* samples, std::size_t count,
                                                  const AudioFrame& header) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return PushResult::Closed;
        if (count_ == slots_.size()) {
            overflows_.fetch_add(1);
            return PushResult::Overflow;
        }
        store((head_ + count_) % slots_.size(), samples, count, header);
        ++count_;
    }
    cv_.notify_one();
    return PushResult::Ok;
}

FrameRingBuffer::PushResult FrameRingBuffer::pushDroppingOldest(const int16_t* samples, std::size_t count,
                                                                const AudioFrame& header) {
    PushResult result = PushResult::Ok;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return PushResult::Closed;
        if (count_ == slots_.size()) {
            overflows_.fetch_add(1);
            dropped_.fetch_add(1);
            head_ = (head_ + 1) % slots_.size();
            --count_;
            result = PushResult::Overflow;
        }
        store((head_ + count_) % slots_.size(), samples, count, header);
        ++count_;
    }
    cv_.notify_one();
    return result;
}

FrameRingBuffer::PopResult FrameRingBuffer::pop(AudioFrame& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return count_ > 0 || closed_; })) {
        return PopResult::Empty;
    }
    if (count_ == 0) return PopResult::Closed;
    take(out);
    return PopResult::Ok;
}

bool FrameRingBuffer::tryPop(AudioFrame& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (count_ == 0) return false;
    take(out);
    return true;
}

std::size_t FrameRingBuffer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t discarded = count_;
    dropped_.fetch_add(discarded);
    head_ = 0;
    count_ = 0;
    return discarded;
}

void FrameRingBuffer::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::size_t FrameRingBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

bool FrameRingBuffer::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}
