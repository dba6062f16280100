#ifndef TURN_CONTROLLER_HPP
#define TURN_CONTROLLER_HPP

#include "audio/audio_frame.hpp"
#include "audio/utterance.hpp"
#include "audio/voice_activity_segmenter.hpp"
#include "exchange/response_stream.hpp"
#include "turn/playback_scheduler.hpp"
#include "turn/session_event.hpp"
#include "turn/turn_state.hpp"

#include <chrono>
#include <cstdint>
#include <string>

// Half-duplex turn taking on top of a full-duplex device.
//
// Captured frames reach the segmenter while the user holds the turn, and
// during playback only to detect barge-in. A sealed utterance goes to the
// exchange collaborator, and the segmenter stays suppressed until the
// response plays, fails or is cancelled. All calls come from the session
// worker thread.
class TurnController {
public:
    using Clock = std::chrono::steady_clock;

    struct Config {
        bool bargeInEnabled = true;
        // No first chunk within this time fails the response.
        int responseTimeoutMs = 15000;
    };

    TurnController(Config config, TurnState& state, VoiceActivitySegmenter& segmenter,
                   PlaybackScheduler& scheduler, ExchangeCollaborator& exchange, SessionEventSink sink);
    ~TurnController();

    TurnController(const TurnController&) = delete;
    TurnController& operator=(const TurnController&) = delete;

    void startSession();
    void onFrame(const AudioFrame& frame);
    // Moves the response along; also enforces the response timeout.
    void tick(Clock::time_point now);
    void endSession();

    // Device gone: report it and end the session.
    void onDeviceFailure(const std::string& reason);

    Turn turn() const { return state_.current(); }
    uint64_t responsesRequested() const { return responseCounter_; }

private:
    void handleUtterance(Utterance utterance);
    void bargeIn();
    void failResponse(const std::string& reason);
    void backToListening();
    void emit(SessionEvent event);

    Config config_;
    TurnState& state_;
    VoiceActivitySegmenter& segmenter_;
    PlaybackScheduler& scheduler_;
    ExchangeCollaborator& exchange_;
    SessionEventSink sink_;

    uint64_t responseCounter_ = 0;
    Clock::time_point submittedAt_;
    bool sessionOpen_ = false;
};

#endif
