#ifndef VOICE_SESSION_HPP
#define VOICE_SESSION_HPP

#include "audio/audio_frame_source.hpp"
#include "audio/voice_activity_segmenter.hpp"
#include "exchange/response_stream.hpp"
#include "turn/playback_scheduler.hpp"
#include "turn/session_event.hpp"
#include "turn/turn_controller.hpp"
#include "turn/turn_state.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

// One conversation with the device: owns the frame source, segmenter,
// scheduler and turn controller, and runs them on a worker thread that only
// talks to the device callback through the ring buffers.
class VoiceSession {
public:
    struct Config {
        AudioFrameSource::Config audio;
        // sampleRate and frameSize are taken from audio.
        VoiceActivitySegmenter::Config vad;
        TurnController::Config turn;

        // Longest wait for a capture frame before the worker ticks anyway.
        int pollMs = 10;
    };

    VoiceSession(Config config, std::unique_ptr<AudioFrameSource> source,
                 ExchangeCollaborator& exchange, SessionEventSink sink);
    ~VoiceSession();

    VoiceSession(const VoiceSession&) = delete;
    VoiceSession& operator=(const VoiceSession&) = delete;

    // Opens the device and starts listening. Throws DeviceUnavailable.
    void start();
    // Idempotent; returns once the worker has exited and the device is released.
    // Not to be called from the event sink, which runs on the worker.
    void stop();

    bool running() const { return running_.load(); }
    // The worker ended on its own (device lost).
    bool failed() const { return failed_.load(); }

    Turn turn() const { return state_.current(); }
    const TurnState& turnState() const { return state_; }
    AudioFrameSource::Stats deviceStats() const { return source_->stats(); }
    const PlaybackScheduler::Stats& playbackStats() const { return scheduler_.stats(); }

private:
    static VoiceActivitySegmenter::Config segmenterConfig(const Config& config);
    void run();

    Config config_;
    std::unique_ptr<AudioFrameSource> source_;

    TurnState state_;
    VoiceActivitySegmenter segmenter_;
    PlaybackScheduler scheduler_;
    TurnController controller_;

    std::mutex lifecycleMutex_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> failed_{false};
};

#endif
