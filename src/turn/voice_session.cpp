#include "turn/voice_session.hpp"

#include "core/errors.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

VoiceActivitySegmenter::Config VoiceSession::segmenterConfig(const Config& config) {
    VoiceActivitySegmenter::Config vad = config.vad;
    vad.sampleRate = config.audio.sampleRate;
    vad.frameSize = config.audio.frameSize;
    return vad;
}

static AudioFrameSource& require_source(const std::unique_ptr<AudioFrameSource>& source) {
    if (!source) throw std::invalid_argument("VoiceSession needs an audio frame source");
    return *source;
}

// Constructor
VoiceSession::VoiceSession(Config config, std::unique_ptr<AudioFrameSource> source,
                           ExchangeCollaborator& exchange, SessionEventSink sink)
    : config_(std::move(config)),
      source_(std::move(source)),
      segmenter_(segmenterConfig(config_)),
      scheduler_(require_source(source_)),
      controller_(config_.turn, state_, segmenter_, scheduler_, exchange, std::move(sink)) {}

// Destructor
VoiceSession::~VoiceSession() { stop(); }

void VoiceSession::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (running_.load()) return;

    source_->open(config_.audio);

    stopRequested_.store(false);
    failed_.store(false);
    controller_.startSession();
    running_.store(true);
    worker_ = std::thread(&VoiceSession::run, this);

    std::cout << "[Voice Session] Listening at " << config_.audio.sampleRate << " Hz, "
              << config_.audio.frameSize << " samples per frame"
              << (config_.turn.bargeInEnabled ? ", barge-in on" : "") << "\n";
}

void VoiceSession::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    stopRequested_.store(true);
    if (worker_.joinable()) worker_.join();
    if (!running_.exchange(false)) return;

    controller_.endSession();
    source_->close();

    const AudioFrameSource::Stats d = source_->stats();
    const PlaybackScheduler::Stats& p = scheduler_.stats();
    std::cout << "[Voice Session] Stopped. captured " << d.framesCaptured << " frames ("
              << d.captureOverflows << " overflows), rendered " << d.framesRendered << " frames ("
              << d.outputGaps << " gaps, " << d.staleFramesSkipped << " stale skipped), "
              << p.backpressureEvents << " backpressure pauses, " << p.cancellations << " cancellations\n";
}

// Worker loop: one capture frame, then one tick, until stopped or the device goes away
void VoiceSession::run() {
    const std::chrono::milliseconds poll(config_.pollMs > 0 ? config_.pollMs : 10);
    AudioFrame frame;

    while (!stopRequested_.load()) {
        try {
            if (source_->readFrame(frame, poll)) controller_.onFrame(frame);
            controller_.tick(TurnController::Clock::now());
        } catch (const StreamClosed&) {
            break;
        } catch (const DeviceUnavailable& e) {
            failed_.store(true);
            controller_.onDeviceFailure(e.what());
            break;
        }
    }
}
