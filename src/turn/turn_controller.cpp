#include "turn/turn_controller.hpp"

#include "core/errors.hpp"

#include <exception>
#include <iostream>
#include <utility>

const char* toString(SessionEvent::Type type) {
    switch (type) {
    case SessionEvent::Type::TurnChanged: return "turn_changed";
    case SessionEvent::Type::UtteranceSealed: return "utterance_sealed";
    case SessionEvent::Type::BargeIn: return "barge_in";
    case SessionEvent::Type::ResponseFailed: return "response_failed";
    case SessionEvent::Type::DeviceUnavailable: return "device_unavailable";
    case SessionEvent::Type::SessionEnded: return "session_done";
    }
    return "unknown";
}

// Constructor
TurnController::TurnController(Config config, TurnState& state, VoiceActivitySegmenter& segmenter,
                               PlaybackScheduler& scheduler, ExchangeCollaborator& exchange,
                               SessionEventSink sink)
    : config_(config), state_(state), segmenter_(segmenter), scheduler_(scheduler),
      exchange_(exchange), sink_(std::move(sink)) {
    state_.setObserver([this](Turn from, Turn to) {
        SessionEvent e;
        e.type = SessionEvent::Type::TurnChanged;
        e.from = from;
        e.to = to;
        e.responseId = scheduler_.currentId();
        emit(std::move(e));
    });
}

// Destructor
TurnController::~TurnController() { state_.setObserver(nullptr); }

void TurnController::emit(SessionEvent event) {
    if (!sink_) return;
    try {
        sink_(event);
    } catch (const std::exception& e) {
        std::cerr << "[Turn Controller] [ERROR] event sink threw: " << e.what() << "\n";
    }
}

void TurnController::startSession() {
    segmenter_.reset();
    sessionOpen_ = true;
    state_.enter(Turn::ListeningUser);
}

void TurnController::onFrame(const AudioFrame& frame) {
    switch (state_.current()) {
    case Turn::Idle:
    case Turn::ProcessingResponse:
        return;

    case Turn::ListeningUser: {
        const VoiceActivitySegmenter::Result r = segmenter_.feed(frame);
        if (r.utteranceSealed) handleUtterance(segmenter_.takeUtterance());
        return;
    }

    case Turn::PlayingResponse: {
        // detect-only: nothing heard while playing becomes utterance audio
        if (!config_.bargeInEnabled) return;
        if (segmenter_.feed(frame).speechStarted) bargeIn();
        return;
    }
    }
}

// Hands a sealed utterance to the exchange collaborator
void TurnController::handleUtterance(Utterance utterance) {
    SessionEvent sealed;
    sealed.type = SessionEvent::Type::UtteranceSealed;
    sealed.utteranceId = utterance.id;
    sealed.durationMs = utterance.durationMs();
    emit(std::move(sealed));

    const uint64_t responseId = ++responseCounter_;
    state_.enter(Turn::ProcessingResponse);
    segmenter_.reset();
    submittedAt_ = Clock::now();

    std::cout << "[Turn Controller] Utterance " << utterance.id << " (" << utterance.durationMs()
              << " ms" << (utterance.forceSealed ? ", force-sealed" : "") << ") -> response "
              << responseId << "\n";

    std::unique_ptr<ResponseStream> stream;
    try {
        stream = exchange_.submit(std::move(utterance), responseId);
    } catch (const std::exception& e) {
        failResponse(e.what());
        return;
    }
    if (!stream) {
        failResponse("exchange returned no response stream");
        return;
    }
    scheduler_.start(std::move(stream));
}

void TurnController::tick(Clock::time_point now) {
    switch (state_.current()) {
    case Turn::Idle:
    case Turn::ListeningUser:
        return;

    case Turn::ProcessingResponse:
        try {
            scheduler_.fetch();
        } catch (const ResponseFailed& e) {
            failResponse(e.what());
            return;
        }
        if (scheduler_.hasPendingFrames()) {
            state_.enter(Turn::PlayingResponse);
            segmenter_.reset();
            segmenter_.setMode(VoiceActivitySegmenter::Mode::DetectOnly);
            break;
        }
        if (scheduler_.streamFinished()) {
            std::cout << "[Turn Controller] Response " << scheduler_.currentId() << " had no audio\n";
            scheduler_.finish();
            backToListening();
            return;
        }
        if (now - submittedAt_ > std::chrono::milliseconds(config_.responseTimeoutMs)) {
            failResponse("no response within " + std::to_string(config_.responseTimeoutMs) + " ms");
        }
        return;

    case Turn::PlayingResponse:
        break;
    }

    try {
        scheduler_.pump();
    } catch (const ResponseFailed& e) {
        failResponse(e.what());
        return;
    }
    if (scheduler_.drained()) {
        scheduler_.finish();
        backToListening();
    }
}

// New speech while playing: the response is cut off and the user gets the turn.
// The segmenter stays in Speech, so the utterance starts with the next frame.
void TurnController::bargeIn() {
    const uint64_t responseId = scheduler_.currentId();
    scheduler_.cancel();
    state_.enter(Turn::ListeningUser);
    segmenter_.setMode(VoiceActivitySegmenter::Mode::Segment);

    std::cout << "[Turn Controller] Barge-in, response " << responseId << " cancelled\n";

    SessionEvent e;
    e.type = SessionEvent::Type::BargeIn;
    e.responseId = responseId;
    emit(std::move(e));
}

void TurnController::failResponse(const std::string& reason) {
    const uint64_t responseId = responseCounter_;
    scheduler_.cancel();

    std::cerr << "[Turn Controller] [WARN] Response " << responseId << " failed: " << reason << "\n";

    SessionEvent e;
    e.type = SessionEvent::Type::ResponseFailed;
    e.responseId = responseId;
    e.message = reason;
    emit(std::move(e));

    backToListening();
}

void TurnController::backToListening() {
    segmenter_.reset();
    state_.enter(Turn::ListeningUser);
}

void TurnController::endSession() {
    if (!sessionOpen_) return;
    sessionOpen_ = false;

    scheduler_.cancel();
    segmenter_.reset();
    state_.enter(Turn::Idle);

    SessionEvent e;
    e.type = SessionEvent::Type::SessionEnded;
    emit(std::move(e));
}

void TurnController::onDeviceFailure(const std::string& reason) {
    std::cerr << "[Turn Controller] [ERROR] Audio device unavailable: " << reason << "\n";

    SessionEvent e;
    e.type = SessionEvent::Type::DeviceUnavailable;
    e.message = reason;
    emit(std::move(e));

    endSession();
}
