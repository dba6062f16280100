#include "turn/playback_scheduler.hpp"

#include "audio/audio_utils.hpp"
#include "core/errors.hpp"

#include <utility>

// Constructor
PlaybackScheduler::PlaybackScheduler(AudioFrameSource& sink) : sink_(sink) {}

void PlaybackScheduler::start(std::unique_ptr<ResponseStream> stream) {
    if (stream_) cancel();
    stream_ = std::move(stream);
    currentId_ = stream_ ? stream_->id() : 0;
    streamFinished_ = false;
    nextSequence_ = 0;
}

// Cuts a chunk into device frames; the partial tail waits for the next chunk
void PlaybackScheduler::append(const PlaybackChunk& chunk) {
    const AudioFrameSource::Config& cfg = sink_.config();
    const std::size_t frameSamples = (std::size_t)cfg.frameSize * cfg.channels;

    const std::vector<int16_t> mono = resampleLinear(chunk.samples, chunk.sampleRate, cfg.sampleRate);
    remainder_.reserve(remainder_.size() + mono.size() * cfg.channels);
    for (int16_t s : mono) {
        for (int c = 0; c < cfg.channels; ++c) remainder_.push_back(s);
    }

    std::size_t offset = 0;
    while (remainder_.size() - offset >= frameSamples) {
        AudioFrame frame;
        frame.samples.assign(remainder_.begin() + offset, remainder_.begin() + offset + frameSamples);
        frame.sampleRate = cfg.sampleRate;
        frame.channels = cfg.channels;
        frame.streamId = currentId_;
        frame.sequence = nextSequence_++;
        frame.timestampUs = frameTimestampUs(frame.sequence, cfg.frameSize, cfg.sampleRate);
        pending_.push_back(std::move(frame));
        offset += frameSamples;
    }
    remainder_.erase(remainder_.begin(), remainder_.begin() + offset);
}

// Pads the last partial frame with silence
void PlaybackScheduler::flushRemainder() {
    if (remainder_.empty()) return;
    const AudioFrameSource::Config& cfg = sink_.config();
    const std::size_t frameSamples = (std::size_t)cfg.frameSize * cfg.channels;

    AudioFrame frame;
    frame.samples = std::move(remainder_);
    frame.samples.resize(frameSamples, 0);
    frame.sampleRate = cfg.sampleRate;
    frame.channels = cfg.channels;
    frame.streamId = currentId_;
    frame.sequence = nextSequence_++;
    frame.timestampUs = frameTimestampUs(frame.sequence, cfg.frameSize, cfg.sampleRate);
    pending_.push_back(std::move(frame));
    remainder_.clear();
}

void PlaybackScheduler::fetch() {
    if (!stream_ || streamFinished_) return;

    PlaybackChunk chunk;
    while (true) {
        const ResponseStream::Status status = stream_->poll(chunk);
        if (status == ResponseStream::Status::Pending) return;
        if (status == ResponseStream::Status::Finished) {
            streamFinished_ = true;
            flushRemainder();
            return;
        }
        ++stats_.chunksReceived;
        append(chunk);
    }
}

std::size_t PlaybackScheduler::pump() {
    fetch();

    std::size_t written = 0;
    while (!pending_.empty()) {
        try {
            sink_.writeFrame(pending_.front());
        } catch (const BackpressureExceeded&) {
            ++stats_.backpressureEvents;
            break;
        }
        pending_.pop_front();
        ++written;
    }
    stats_.framesWritten += written;
    return written;
}

void PlaybackScheduler::cancel() {
    if (!stream_ && pending_.empty() && remainder_.empty()) return;

    if (stream_) stream_->cancel();
    sink_.discardOutput(currentId_);

    stats_.framesDiscarded += pending_.size();
    ++stats_.cancellations;
    pending_.clear();
    remainder_.clear();
    stream_.reset();
    streamFinished_ = false;
}

void PlaybackScheduler::finish() {
    stream_.reset();
    pending_.clear();
    remainder_.clear();
    streamFinished_ = false;
}

bool PlaybackScheduler::drained() const {
    return stream_ && streamFinished_ && pending_.empty() && remainder_.empty() &&
           sink_.queuedOutputFrames() == 0;
}
