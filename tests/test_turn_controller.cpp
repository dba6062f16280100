#include "turn/turn_controller.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <map>
#include <memory>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

namespace {

VoiceActivitySegmenter::Config vadConfig() {
    VoiceActivitySegmenter::Config cfg;
    cfg.onsetThreshold = 0.05f;
    cfg.onsetHoldMs = 80;
    cfg.hangoverMs = 200;
    cfg.maxUtteranceMs = 1000;
    return cfg;
}

const int16_t kResponseLevel = 1000;

class TurnControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_.open(AudioFrameSource::Config());
        makeController(TurnController::Config());
    }

    void makeController(TurnController::Config cfg, SessionEventSink sink = nullptr) {
        if (!sink) sink = [this](const SessionEvent& e) { events_.push_back(e); };
        // the old controller detaches from the turn state on destruction
        controller_.reset();
        controller_ = std::make_unique<TurnController>(cfg, state_, segmenter_, scheduler_, exchange_, std::move(sink));
    }

    void frames(float amplitude, int count) {
        for (int i = 0; i < count; ++i) {
            fedDuring_[seq_] = controller_->turn();
            controller_->onFrame(makeFrame(amplitude, seq_++));
        }
    }

    // Submitted utterance frames that were fed while the user did not have the turn.
    int framesFedOutsideListening() {
        int n = 0;
        std::lock_guard<std::mutex> lock(exchange_.mutex);
        for (const Utterance& u : exchange_.utterances) {
            for (const AudioFrame& f : u.frames) n += fedDuring_.at(f.sequence) != Turn::ListeningUser ? 1 : 0;
        }
        return n;
    }

    // One 100 ms utterance followed by enough silence to seal it.
    void sayUtterance() {
        frames(0.3f, 10);
        frames(0.0f, 20);
    }

    void tick() { controller_->tick(TurnController::Clock::now()); }

    int count(SessionEvent::Type type) const {
        int n = 0;
        for (const SessionEvent& e : events_) n += e.type == type ? 1 : 0;
        return n;
    }

    // Frames the device plays that carry response audio.
    int renderResponseFrames(int renders) {
        int n = 0;
        for (int i = 0; i < renders; ++i) n += source_.render().front() >= kResponseLevel ? 1 : 0;
        return n;
    }

    FakeFrameSource source_;
    TurnState state_;
    VoiceActivitySegmenter segmenter_{vadConfig()};
    PlaybackScheduler scheduler_{source_};
    ScriptedExchange exchange_;
    std::vector<SessionEvent> events_;
    std::unique_ptr<TurnController> controller_;
    std::map<uint64_t, Turn> fedDuring_;
    uint64_t seq_ = 0;
};

} // namespace

TEST_F(TurnControllerTest, SessionStartGivesTheUserTheTurn) {
    EXPECT_EQ(controller_->turn(), Turn::Idle);
    controller_->startSession();
    EXPECT_EQ(controller_->turn(), Turn::ListeningUser);
    ASSERT_EQ(count(SessionEvent::Type::TurnChanged), 1);
    EXPECT_EQ(events_[0].from, Turn::Idle);
    EXPECT_EQ(events_[0].to, Turn::ListeningUser);
}

TEST_F(TurnControllerTest, FramesBeforeSessionStartAreIgnored) {
    sayUtterance();
    EXPECT_EQ(exchange_.submitted(), 0u);
    EXPECT_EQ(controller_->turn(), Turn::Idle);
}

TEST_F(TurnControllerTest, SealedUtteranceGoesToTheExchange) {
    controller_->startSession();
    sayUtterance();

    EXPECT_EQ(controller_->turn(), Turn::ProcessingResponse);
    ASSERT_EQ(exchange_.submitted(), 1u);
    EXPECT_EQ(exchange_.utterances[0].durationMs(), 100);
    EXPECT_EQ(count(SessionEvent::Type::UtteranceSealed), 1);
    EXPECT_EQ(controller_->responsesRequested(), 1u);
}

TEST_F(TurnControllerTest, SpeechWhileProcessingIsNotSegmented) {
    controller_->startSession();
    sayUtterance();
    sayUtterance();
    sayUtterance();

    EXPECT_EQ(exchange_.submitted(), 1u);
    EXPECT_EQ(segmenter_.state(), VoiceActivitySegmenter::State::Silence);
    EXPECT_FALSE(segmenter_.hasUtterance());
}

TEST_F(TurnControllerTest, PlaysTheResponseThenListensAgain) {
    exchange_.configure = [](ScriptedStream::Script& s, const Utterance&) {
        s.add(std::vector<int16_t>(480, kResponseLevel));
        s.finish();
    };
    controller_->startSession();
    sayUtterance();
    tick();

    EXPECT_EQ(controller_->turn(), Turn::PlayingResponse);
    EXPECT_EQ(scheduler_.stats().framesWritten, 3u);

    tick();
    EXPECT_EQ(controller_->turn(), Turn::PlayingResponse);

    EXPECT_EQ(renderResponseFrames(3), 3);
    tick();
    EXPECT_EQ(controller_->turn(), Turn::ListeningUser);
    EXPECT_FALSE(scheduler_.active());

    // and the next utterance is heard
    sayUtterance();
    EXPECT_EQ(exchange_.submitted(), 2u);
}

TEST_F(TurnControllerTest, WaitsForTheFirstChunk) {
    controller_->startSession();
    sayUtterance();
    tick();
    tick();
    EXPECT_EQ(controller_->turn(), Turn::ProcessingResponse);

    exchange_.last()->add(std::vector<int16_t>(160, kResponseLevel));
    tick();
    EXPECT_EQ(controller_->turn(), Turn::PlayingResponse);
}

TEST_F(TurnControllerTest, BargeInCutsOffTenBufferedChunks) {
    exchange_.configure = [](ScriptedStream::Script& s, const Utterance&) {
        for (int c = 0; c < 10; ++c) s.add(std::vector<int16_t>(5 * 160, (int16_t)(kResponseLevel + c)));
    };
    controller_->startSession();
    sayUtterance();
    tick();
    ASSERT_EQ(controller_->turn(), Turn::PlayingResponse);
    EXPECT_EQ(renderResponseFrames(4), 4);
    tick();

    const auto script = exchange_.last();
    const uint64_t writtenBefore = scheduler_.stats().framesWritten;

    // onset hold is 8 frames; the 8th loud frame confirms speech
    frames(0.3f, 7);
    EXPECT_EQ(controller_->turn(), Turn::PlayingResponse);
    frames(0.3f, 1);

    EXPECT_EQ(controller_->turn(), Turn::ListeningUser);
    EXPECT_EQ(count(SessionEvent::Type::BargeIn), 1);
    EXPECT_TRUE(script->cancelled.load());
    EXPECT_EQ(source_.queuedOutputFrames(), 0u);

    const int pollsAtCancel = script->polls.load();
    for (int i = 0; i < 20; ++i) {
        tick();
        EXPECT_EQ(renderResponseFrames(2), 0);
    }
    EXPECT_EQ(scheduler_.stats().framesWritten, writtenBefore);
    EXPECT_EQ(script->polls.load(), pollsAtCancel);

    // the interrupting speech becomes the next utterance, from the first frame
    // captured after the turn switched
    const uint64_t firstAfterSwitch = seq_;
    frames(0.3f, 5);
    frames(0.0f, 20);
    ASSERT_EQ(exchange_.submitted(), 2u);
    EXPECT_EQ(exchange_.utterances[1].durationMs(), 50);
    EXPECT_EQ(exchange_.utterances[1].frames.front().sequence, firstAfterSwitch);
}

TEST_F(TurnControllerTest, AudioHeardDuringPlaybackIsNeverPartOfAnUtterance) {
    exchange_.configure = [](ScriptedStream::Script& s, const Utterance&) {
        s.add(std::vector<int16_t>(50 * 160, kResponseLevel));
    };
    controller_->startSession();
    sayUtterance();
    tick();
    ASSERT_EQ(controller_->turn(), Turn::PlayingResponse);

    // a false start, then speech that barges in and keeps going
    frames(0.3f, 3);
    frames(0.0f, 2);
    frames(0.3f, 12);
    EXPECT_EQ(count(SessionEvent::Type::BargeIn), 1);
    EXPECT_EQ(controller_->turn(), Turn::ListeningUser);
    frames(0.0f, 20);

    ASSERT_EQ(exchange_.submitted(), 2u);
    EXPECT_EQ(exchange_.utterances[1].frames.size(), 4u);
    EXPECT_EQ(framesFedOutsideListening(), 0);
}

TEST_F(TurnControllerTest, NoBargeInWhenDisabled) {
    TurnController::Config cfg;
    cfg.bargeInEnabled = false;
    makeController(cfg);

    exchange_.configure = [](ScriptedStream::Script& s, const Utterance&) {
        s.add(std::vector<int16_t>(10 * 160, kResponseLevel));
    };
    controller_->startSession();
    sayUtterance();
    tick();
    frames(0.3f, 30);

    EXPECT_EQ(controller_->turn(), Turn::PlayingResponse);
    EXPECT_FALSE(exchange_.last()->cancelled.load());
    EXPECT_EQ(count(SessionEvent::Type::BargeIn), 0);
}

TEST_F(TurnControllerTest, FailedResponseResumesListening) {
    exchange_.configure = [](ScriptedStream::Script& s, const Utterance&) { s.fail("chat backend down"); };
    controller_->startSession();
    sayUtterance();
    tick();

    EXPECT_EQ(controller_->turn(), Turn::ListeningUser);
    ASSERT_EQ(count(SessionEvent::Type::ResponseFailed), 1);
    for (const SessionEvent& e : events_) {
        if (e.type != SessionEvent::Type::ResponseFailed) continue;
        EXPECT_EQ(e.message, "chat backend down");
        EXPECT_EQ(e.responseId, 1u);
    }

    sayUtterance();
    EXPECT_EQ(exchange_.submitted(), 2u);
}

TEST_F(TurnControllerTest, FailureDuringPlaybackFlushesOutput) {
    controller_->startSession();
    sayUtterance();
    auto script = exchange_.last();
    script->add(std::vector<int16_t>(5 * 160, kResponseLevel));
    tick();
    ASSERT_EQ(controller_->turn(), Turn::PlayingResponse);

    script->fail("piper exited");
    tick();
    EXPECT_EQ(controller_->turn(), Turn::ListeningUser);
    EXPECT_EQ(count(SessionEvent::Type::ResponseFailed), 1);
    EXPECT_EQ(source_.queuedOutputFrames(), 0u);
    EXPECT_EQ(renderResponseFrames(5), 0);
}

TEST_F(TurnControllerTest, SilentExchangeTimesOut) {
    TurnController::Config cfg;
    cfg.responseTimeoutMs = 50;
    makeController(cfg);

    controller_->startSession();
    sayUtterance();
    tick();
    EXPECT_EQ(controller_->turn(), Turn::ProcessingResponse);

    controller_->tick(TurnController::Clock::now() + 1s);
    EXPECT_EQ(controller_->turn(), Turn::ListeningUser);
    EXPECT_EQ(count(SessionEvent::Type::ResponseFailed), 1);
    EXPECT_TRUE(exchange_.last()->cancelled.load());
}

TEST_F(TurnControllerTest, SubmitFailureIsAFailedResponse) {
    exchange_.throwOnSubmit = true;
    controller_->startSession();
    sayUtterance();

    EXPECT_EQ(controller_->turn(), Turn::ListeningUser);
    EXPECT_EQ(count(SessionEvent::Type::ResponseFailed), 1);
}

TEST_F(TurnControllerTest, ResponseWithoutAudioReturnsToListening) {
    exchange_.configure = [](ScriptedStream::Script& s, const Utterance&) { s.finish(); };
    controller_->startSession();
    sayUtterance();
    tick();

    EXPECT_EQ(controller_->turn(), Turn::ListeningUser);
    EXPECT_EQ(count(SessionEvent::Type::ResponseFailed), 0);
}

TEST_F(TurnControllerTest, EndingTheSessionCancelsTheExchange) {
    controller_->startSession();
    sayUtterance();
    ASSERT_EQ(controller_->turn(), Turn::ProcessingResponse);

    controller_->endSession();
    EXPECT_EQ(controller_->turn(), Turn::Idle);
    EXPECT_TRUE(exchange_.last()->cancelled.load());
    EXPECT_EQ(count(SessionEvent::Type::SessionEnded), 1);

    controller_->endSession();
    EXPECT_EQ(count(SessionEvent::Type::SessionEnded), 1);

    sayUtterance();
    tick();
    EXPECT_EQ(exchange_.submitted(), 1u);
}

TEST_F(TurnControllerTest, EndingTheSessionDuringPlaybackFlushesOutput) {
    exchange_.configure = [](ScriptedStream::Script& s, const Utterance&) {
        s.add(std::vector<int16_t>(10 * 160, kResponseLevel));
    };
    controller_->startSession();
    sayUtterance();
    tick();
    ASSERT_EQ(controller_->turn(), Turn::PlayingResponse);

    controller_->endSession();
    EXPECT_EQ(controller_->turn(), Turn::Idle);
    EXPECT_EQ(source_.queuedOutputFrames(), 0u);
    EXPECT_EQ(renderResponseFrames(10), 0);
}

TEST_F(TurnControllerTest, DeviceFailureEndsTheSession) {
    controller_->startSession();
    controller_->onDeviceFailure("unplugged");

    EXPECT_EQ(controller_->turn(), Turn::Idle);
    ASSERT_EQ(count(SessionEvent::Type::DeviceUnavailable), 1);
    EXPECT_EQ(count(SessionEvent::Type::SessionEnded), 1);
}

TEST_F(TurnControllerTest, ThrowingSinkDoesNotBreakTheController) {
    makeController(TurnController::Config(), [](const SessionEvent&) { throw std::runtime_error("ui gone"); });
    controller_->startSession();
    sayUtterance();
    EXPECT_EQ(controller_->turn(), Turn::ProcessingResponse);
}

// Random interleavings of capture, ticks, device pulls and exchange behaviour.
TEST_F(TurnControllerTest, TurnInvariantHoldsUnderRandomEvents) {
    std::mt19937 rng(20240611);
    std::uniform_int_distribution<int> op(0, 15);
    std::uniform_int_distribution<int> small(1, 4);

    controller_->startSession();
    for (int step = 0; step < 20000; ++step) {
        const auto script = exchange_.last();
        switch (op(rng)) {
        case 0: case 1: case 2: case 3:
            frames(0.3f, small(rng));
            break;
        case 4: case 5: case 6: case 7:
            frames(0.0f, small(rng) * 3);
            break;
        case 8: case 9:
            tick();
            break;
        case 10:
            for (int i = small(rng); i > 0; --i) source_.render();
            break;
        case 11:
            if (script) script->add(std::vector<int16_t>((std::size_t)(small(rng) * 100), kResponseLevel));
            break;
        case 12:
            if (script) script->finish();
            break;
        case 13:
            if (script && small(rng) == 1) script->fail("random failure");
            break;
        case 14:
            if (small(rng) == 1) controller_->tick(TurnController::Clock::now() + 20s);
            break;
        case 15:
            if (small(rng) == 1 && step % 7 == 0) {
                controller_->endSession();
                controller_->startSession();
            }
            break;
        }

        const Turn turn = controller_->turn();
        ASSERT_NE(turn, Turn::Idle);
        if (turn == Turn::ListeningUser) {
            ASSERT_FALSE(scheduler_.active());
            ASSERT_FALSE(scheduler_.hasPendingFrames());
        }
        if (turn == Turn::ProcessingResponse) {
            ASSERT_EQ(source_.queuedOutputFrames(), 0u);
            ASSERT_EQ(segmenter_.state(), VoiceActivitySegmenter::State::Silence);
        }
    }

    std::size_t listeningToProcessing = 0;
    for (const SessionEvent& e : events_) {
        if (e.type != SessionEvent::Type::TurnChanged) continue;
        ASSERT_TRUE(TurnState::allowed(e.from, e.to));
        ASSERT_FALSE(e.from == Turn::ListeningUser && e.to == Turn::PlayingResponse);
        if (e.from == Turn::ListeningUser && e.to == Turn::ProcessingResponse) ++listeningToProcessing;
    }
    EXPECT_EQ(listeningToProcessing, exchange_.submitted());
    EXPECT_GT(exchange_.submitted(), 5u);
    EXPECT_EQ(framesFedOutsideListening(), 0);
    EXPECT_EQ(state_.transitions(), (uint64_t)count(SessionEvent::Type::TurnChanged));
}
