#include "turn/voice_session.hpp"
#include "core/errors.hpp"
#include "exchange/threaded_response_stream.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

// Exchange whose producer sits on the cancellation token, like a slow model call.
class StallingExchange : public ExchangeCollaborator {
public:
    std::unique_ptr<ResponseStream> submit(Utterance, uint64_t responseId) override {
        ++submits;
        std::shared_ptr<std::atomic<bool>> flag = sawCancel;
        return std::make_unique<ThreadedResponseStream>(
            responseId, [flag](ThreadedResponseStream::Writer& w) {
                if (w.token().waitFor(10s)) flag->store(true);
            });
    }

    std::atomic<int> submits{0};
    std::shared_ptr<std::atomic<bool>> sawCancel = std::make_shared<std::atomic<bool>>(false);
};

class EventLog {
public:
    SessionEventSink sink() {
        return [this](const SessionEvent& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(e);
        };
    }

    int count(SessionEvent::Type type) {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (const SessionEvent& e : events_) n += e.type == type ? 1 : 0;
        return n;
    }

private:
    std::mutex mutex_;
    std::vector<SessionEvent> events_;
};

VoiceSession::Config sessionConfig() {
    VoiceSession::Config cfg;
    cfg.audio.jitterMs = 1000;
    cfg.vad.onsetThreshold = 0.05f;
    cfg.vad.onsetHoldMs = 80;
    cfg.vad.hangoverMs = 200;
    cfg.turn.responseTimeoutMs = 5000;
    cfg.pollMs = 5;
    return cfg;
}

// Plays the device callback: one captured frame per call, paced like a sound card.
void speak(FakeFrameSource& device, float amplitude, int frames) {
    for (int i = 0; i < frames; ++i) {
        device.capture(amplitude);
        std::this_thread::sleep_for(1ms);
    }
}

} // namespace

TEST(VoiceSession, StartListensAndStopReleasesTheDevice) {
    auto device = new FakeFrameSource();
    ScriptedExchange exchange;
    EventLog log;
    VoiceSession session(sessionConfig(), std::unique_ptr<AudioFrameSource>(device), exchange, log.sink());

    session.start();
    EXPECT_TRUE(session.running());
    EXPECT_EQ(session.turn(), Turn::ListeningUser);
    EXPECT_TRUE(device->isOpen());

    session.stop();
    EXPECT_FALSE(session.running());
    EXPECT_EQ(session.turn(), Turn::Idle);
    EXPECT_FALSE(device->isOpen());
    EXPECT_EQ(device->released.load(), 1);
    EXPECT_EQ(log.count(SessionEvent::Type::SessionEnded), 1);

    session.stop();
    EXPECT_EQ(log.count(SessionEvent::Type::SessionEnded), 1);
}

TEST(VoiceSession, MissingDeviceFailsStart) {
    auto device = new FakeFrameSource();
    device->failOpen = true;
    ScriptedExchange exchange;
    VoiceSession session(sessionConfig(), std::unique_ptr<AudioFrameSource>(device), exchange, nullptr);

    EXPECT_THROW(session.start(), DeviceUnavailable);
    EXPECT_FALSE(session.running());
    EXPECT_EQ(session.turn(), Turn::Idle);
}

TEST(VoiceSession, NullSourceIsRejected) {
    ScriptedExchange exchange;
    EXPECT_THROW(VoiceSession(sessionConfig(), nullptr, exchange, nullptr), std::invalid_argument);
}

TEST(VoiceSession, AnswersAnUtteranceAndListensAgain) {
    auto device = new FakeFrameSource();
    ScriptedExchange exchange;
    exchange.configure = [](ScriptedStream::Script& s, const Utterance&) {
        s.add(std::vector<int16_t>(3 * 160, 500));
        s.finish();
    };
    EventLog log;
    VoiceSession session(sessionConfig(), std::unique_ptr<AudioFrameSource>(device), exchange, log.sink());
    session.start();

    speak(*device, 0.3f, 10);
    speak(*device, 0.0f, 25);
    ASSERT_TRUE(waitUntil([&] { return device->queuedOutputFrames() == 3; }));
    EXPECT_EQ(exchange.submitted(), 1u);

    int played = 0;
    for (int i = 0; i < 3; ++i) played += device->render().front() == 500 ? 1 : 0;
    EXPECT_EQ(played, 3);

    ASSERT_TRUE(waitUntil([&] { return session.turn() == Turn::ListeningUser; }));
    EXPECT_EQ(session.deviceStats().framesRendered, 3u);
    EXPECT_EQ(session.playbackStats().framesWritten, 3u);
    EXPECT_EQ(log.count(SessionEvent::Type::UtteranceSealed), 1);

    session.stop();
}

TEST(VoiceSession, StopWhileProcessingCancelsTheExchangePromptly) {
    auto device = new FakeFrameSource();
    StallingExchange exchange;
    EventLog log;
    VoiceSession session(sessionConfig(), std::unique_ptr<AudioFrameSource>(device), exchange, log.sink());
    session.start();

    speak(*device, 0.3f, 10);
    speak(*device, 0.0f, 25);
    ASSERT_TRUE(waitUntil([&] { return session.turn() == Turn::ProcessingResponse; }));

    const auto begin = std::chrono::steady_clock::now();
    session.stop();
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, 500ms);
    EXPECT_EQ(session.turn(), Turn::Idle);
    EXPECT_TRUE(waitUntil([&] { return exchange.sawCancel->load(); }, 1000ms));
    EXPECT_EQ(exchange.submits.load(), 1);
    EXPECT_EQ(log.count(SessionEvent::Type::SessionEnded), 1);
}

TEST(VoiceSession, LostDeviceEndsTheSession) {
    auto device = new FakeFrameSource();
    ScriptedExchange exchange;
    EventLog log;
    VoiceSession session(sessionConfig(), std::unique_ptr<AudioFrameSource>(device), exchange, log.sink());
    session.start();

    device->loseDevice();
    ASSERT_TRUE(waitUntil([&] { return session.failed(); }));
    ASSERT_TRUE(waitUntil([&] { return session.turn() == Turn::Idle; }));
    EXPECT_EQ(log.count(SessionEvent::Type::DeviceUnavailable), 1);
    EXPECT_EQ(log.count(SessionEvent::Type::SessionEnded), 1);

    session.stop();
    EXPECT_FALSE(device->isOpen());
}

TEST(VoiceSession, CanBeRestartedAfterStop) {
    auto device = new FakeFrameSource();
    ScriptedExchange exchange;
    VoiceSession session(sessionConfig(), std::unique_ptr<AudioFrameSource>(device), exchange, nullptr);

    session.start();
    session.stop();
    session.start();
    EXPECT_EQ(session.turn(), Turn::ListeningUser);
    EXPECT_EQ(device->acquired.load(), 2);
    session.stop();
}
