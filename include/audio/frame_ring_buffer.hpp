#ifndef FRAME_RING_BUFFER_HPP
#define FRAME_RING_BUFFER_HPP

#include "audio/audio_frame.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

// Bounded FIFO of audio frames between the device callback and the session
// worker. Slots are preallocated so the callback side never allocates for
// frames up to samplesPerFrame; push never blocks.
class FrameRingBuffer {
public:
    enum class PushResult { Ok, Overflow, Closed };
    enum class PopResult { Ok, Empty, Closed };

    FrameRingBuffer(std::size_t capacity, std::size_t samplesPerFrame);

    FrameRingBuffer(const FrameRingBuffer&) = delete;
    FrameRingBuffer& operator=(const FrameRingBuffer&) = delete;

    PushResult push(const AudioFrame& frame);
    PushResult push(const int16_t* samples, std::size_t count, const AudioFrame& header);

    // Capture path: on overflow the oldest frame is dropped and counted.
    PushResult pushDroppingOldest(const int16_t* samples, std::size_t count, const AudioFrame& header);

    PopResult pop(AudioFrame& out, std::chrono::milliseconds timeout);
    bool tryPop(AudioFrame& out);

    // Frames discarded; returns how many were queued.
    std::size_t clear();

    // Wakes blocked consumers; subsequent pushes fail with Closed and pops
    // drain what is left before reporting Closed.
    void close();

    std::size_t size() const;
    std::size_t capacity() const { return slots_.size(); }
    bool closed() const;

    uint64_t overflowCount() const { return overflows_.load(); }
    uint64_t droppedCount() const { return dropped_.load(); }

    // Slots needed for at least jitterMs of audio at the given cadence.
    static std::size_t capacityForJitter(int sampleRate, int frameSize, int jitterMs);

private:
    void store(std::size_t slot, const int16_t* samples, std::size_t count, const AudioFrame& header);
    void take(AudioFrame& out);

    std::vector<AudioFrame> slots_;

    std::size_t head_ = 0;
    std::size_t count_ = 0;
    bool closed_ = false;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::atomic<uint64_t> overflows_{0};
    std::atomic<uint64_t> dropped_{0};
};

#endif
