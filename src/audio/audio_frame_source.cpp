#include "audio/audio_frame_source.hpp"

#include "audio/audio_utils.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cstring>
#include <memory>
#include <string>

// Acquires the device and sets up both ring buffers
void AudioFrameSource::open(const Config& config) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (open_.load()) throw DeviceUnavailable("audio device already open");
    if (config.sampleRate <= 0 || config.channels <= 0 || config.frameSize <= 0) {
        throw DeviceUnavailable("unsupported stream format: rate " + std::to_string(config.sampleRate) +
                                ", channels " + std::to_string(config.channels) +
                                ", frame size " + std::to_string(config.frameSize));
    }

    config_ = config;
    const std::size_t samplesPerFrame = (std::size_t)config.frameSize * config.channels;
    const std::size_t slots = FrameRingBuffer::capacityForJitter(config.sampleRate, config.frameSize, config.jitterMs);

    capture_ = std::make_unique<FrameRingBuffer>(slots, samplesPerFrame);
    playback_ = std::make_unique<FrameRingBuffer>(slots, samplesPerFrame);
    renderScratch_.samples.reserve(samplesPerFrame);

    captureSequence_ = 0;
    renderedLast_ = false;
    deviceLost_.store(false);
    lostReason_.store(nullptr);
    cancelledThrough_.store(0);

    try {
        acquireDevice(config_);
    } catch (...) {
        capture_->close();
        playback_->close();
        throw;
    }
    open_.store(true);
}

// Stops the device and wakes any blocked reader
void AudioFrameSource::close() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!open_.exchange(false)) return;

    releaseDevice();
    capture_->close();
    playback_->close();
}

AudioFrame AudioFrameSource::readFrame() {
    AudioFrame frame;
    while (!readFrame(frame, std::chrono::milliseconds(50))) {}
    return frame;
}

bool AudioFrameSource::readFrame(AudioFrame& out, std::chrono::milliseconds timeout) {
    if (deviceLost_.load()) {
        const char* reason = lostReason_.load();
        throw DeviceUnavailable(reason ? reason : "audio device lost");
    }
    if (!capture_ || (!open_.load() && capture_->size() == 0)) throw StreamClosed("capture stream closed");

    switch (capture_->pop(out, timeout)) {
    case FrameRingBuffer::PopResult::Ok:
        return true;
    case FrameRingBuffer::PopResult::Empty:
        if (deviceLost_.load()) throw DeviceUnavailable("audio device lost");
        return false;
    case FrameRingBuffer::PopResult::Closed:
        break;
    }
    if (deviceLost_.load()) throw DeviceUnavailable("audio device lost");
    throw StreamClosed("capture stream closed");
}

void AudioFrameSource::writeFrame(const AudioFrame& frame) {
    if (!open_.load() || !playback_) throw StreamClosed("playback stream closed");
    if (frame.streamId != 0 && frame.streamId <= cancelledThrough_.load()) {
        staleSkipped_.fetch_add(1);
        return;
    }

    switch (playback_->push(frame)) {
    case FrameRingBuffer::PushResult::Ok:
        return;
    case FrameRingBuffer::PushResult::Overflow:
        throw BackpressureExceeded("playback buffer full (" + std::to_string(playback_->capacity()) + " frames)");
    case FrameRingBuffer::PushResult::Closed:
        break;
    }
    throw StreamClosed("playback stream closed");
}

void AudioFrameSource::discardOutput(uint64_t streamId) {
    uint64_t current = cancelledThrough_.load();
    while (streamId > current && !cancelledThrough_.compare_exchange_weak(current, streamId)) {}
    if (playback_) playback_->clear();
}

std::size_t AudioFrameSource::queuedOutputFrames() const {
    return playback_ ? playback_->size() : 0;
}

AudioFrameSource::Stats AudioFrameSource::stats() const {
    Stats s;
    s.framesCaptured = framesCaptured_.load();
    s.captureOverflows = capture_ ? capture_->overflowCount() : 0;
    s.framesRendered = framesRendered_.load();
    s.outputGaps = outputGaps_.load();
    s.staleFramesSkipped = staleSkipped_.load();
    return s;
}

// Called from the device callback with one block of interleaved input
void AudioFrameSource::deliverCapture(const int16_t* samples, std::size_t count) {
    if (!capture_) return;

    AudioFrame header;
    header.sampleRate = config_.sampleRate;
    header.channels = config_.channels;
    header.sequence = captureSequence_++;
    header.timestampUs = frameTimestampUs(header.sequence, config_.frameSize, config_.sampleRate);

    if (capture_->pushDroppingOldest(samples, count, header) != FrameRingBuffer::PushResult::Closed) {
        framesCaptured_.fetch_add(1);
    }
}

// Called from the device callback; fills out with the next live frame or silence
void AudioFrameSource::renderPlayback(int16_t* out, std::size_t count) {
    if (playback_) {
        while (playback_->tryPop(renderScratch_)) {
            if (renderScratch_.streamId != 0 && renderScratch_.streamId <= cancelledThrough_.load()) {
                staleSkipped_.fetch_add(1);
                continue;
            }
            const std::size_t n = std::min(count, renderScratch_.samples.size());
            std::memcpy(out, renderScratch_.samples.data(), n * sizeof(int16_t));
            if (n < count) std::memset(out + n, 0, (count - n) * sizeof(int16_t));
            framesRendered_.fetch_add(1);
            renderedLast_ = true;
            return;
        }
    }

    std::memset(out, 0, count * sizeof(int16_t));
    if (renderedLast_) outputGaps_.fetch_add(1);
    renderedLast_ = false;
}

void AudioFrameSource::reportDeviceLost(const char* reason) {
    lostReason_.store(reason);
    deviceLost_.store(true);
    if (capture_) capture_->close();
}
