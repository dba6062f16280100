#ifndef PLAYBACK_SCHEDULER_HPP
#define PLAYBACK_SCHEDULER_HPP

#include "audio/audio_frame.hpp"
#include "audio/audio_frame_source.hpp"
#include "exchange/response_stream.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <vector>

// Feeds one response stream to the device output, frame by frame, in order.
// A frame leaves the pending queue only after the device accepted it, so a
// BackpressureExceeded pauses the feed without losing or repeating audio.
class PlaybackScheduler {
public:
    struct Stats {
        uint64_t chunksReceived = 0;
        uint64_t framesWritten = 0;
        uint64_t backpressureEvents = 0;
        uint64_t framesDiscarded = 0;
        uint64_t cancellations = 0;
    };

    explicit PlaybackScheduler(AudioFrameSource& sink);

    PlaybackScheduler(const PlaybackScheduler&) = delete;
    PlaybackScheduler& operator=(const PlaybackScheduler&) = delete;

    // Cancels whatever was playing before.
    void start(std::unique_ptr<ResponseStream> stream);

    // Pulls ready chunks without writing. Throws ResponseFailed.
    void fetch();

    // Fetches, then writes pending frames until the device pushes back.
    // Returns the number of frames written. Throws ResponseFailed.
    std::size_t pump();

    // Drops buffered and queued audio and cancels the stream; complete on return.
    void cancel();

    // Releases a drained stream.
    void finish();

    bool active() const { return stream_ != nullptr; }
    bool hasPendingFrames() const { return !pending_.empty(); }
    bool streamFinished() const { return streamFinished_; }
    // Stream finished and every frame reached the device.
    bool drained() const;

    uint64_t currentId() const { return currentId_; }
    const Stats& stats() const { return stats_; }

private:
    void append(const PlaybackChunk& chunk);
    void flushRemainder();

    AudioFrameSource& sink_;

    std::unique_ptr<ResponseStream> stream_;
    uint64_t currentId_ = 0;
    bool streamFinished_ = false;

    std::deque<AudioFrame> pending_;
    std::vector<int16_t> remainder_;
    uint64_t nextSequence_ = 0;

    Stats stats_;
};

#endif
