#ifndef AUDIO_FRAME_SOURCE_HPP
#define AUDIO_FRAME_SOURCE_HPP

#include "audio/audio_frame.hpp"
#include "audio/frame_ring_buffer.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

// Duplex audio endpoint. Owns one capture and one playback ring buffer; a
// device backend only has to move samples between the hardware and
// deliverCapture() / renderPlayback() from its real-time context.
//
// Backends must call close() from their own destructor, since releaseDevice()
// cannot be dispatched once the derived part is gone.
class AudioFrameSource {
public:
    struct Config {
        int sampleRate = 16000;
        int channels = 1;
        int frameSize = 160;

        // Headroom per direction; never less than 200 ms.
        int jitterMs = 200;
    };

    struct Stats {
        uint64_t framesCaptured = 0;
        uint64_t captureOverflows = 0;
        uint64_t framesRendered = 0;
        uint64_t outputGaps = 0;
        uint64_t staleFramesSkipped = 0;
    };

    AudioFrameSource() = default;
    virtual ~AudioFrameSource() = default;

    AudioFrameSource(const AudioFrameSource&) = delete;
    AudioFrameSource& operator=(const AudioFrameSource&) = delete;

    // Throws DeviceUnavailable; nothing stays acquired on failure.
    void open(const Config& config);

    // Blocks until a capture frame arrives. Throws StreamClosed after close()
    // and DeviceUnavailable once the device was lost.
    AudioFrame readFrame();
    bool readFrame(AudioFrame& out, std::chrono::milliseconds timeout);

    // Throws BackpressureExceeded when the playback ring is full.
    void writeFrame(const AudioFrame& frame);

    // Drops queued output of every stream up to streamId; frames of those
    // streams still reaching the device path are skipped.
    void discardOutput(uint64_t streamId);
    std::size_t queuedOutputFrames() const;

    void close();

    bool isOpen() const { return open_.load(); }
    bool deviceLost() const { return deviceLost_.load(); }
    const Config& config() const { return config_; }
    Stats stats() const;

protected:
    virtual void acquireDevice(const Config& config) = 0;
    virtual void releaseDevice() noexcept = 0;

    // Real-time side. Neither call blocks beyond a short critical section.
    void deliverCapture(const int16_t* samples, std::size_t count);
    void renderPlayback(int16_t* out, std::size_t count);
    void reportDeviceLost(const char* reason);

private:
    Config config_;

    std::unique_ptr<FrameRingBuffer> capture_;
    std::unique_ptr<FrameRingBuffer> playback_;

    std::mutex lifecycleMutex_;
    std::atomic<bool> open_{false};
    std::atomic<bool> deviceLost_{false};
    std::atomic<const char*> lostReason_{nullptr};

    std::atomic<uint64_t> cancelledThrough_{0};

    // Touched only from the real-time context.
    uint64_t captureSequence_ = 0;
    bool renderedLast_ = false;
    AudioFrame renderScratch_;

    std::atomic<uint64_t> framesCaptured_{0};
    std::atomic<uint64_t> framesRendered_{0};
    std::atomic<uint64_t> outputGaps_{0};
    std::atomic<uint64_t> staleSkipped_{0};
};

#endif
