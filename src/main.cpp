#include "audio/portaudio_frame_source.hpp"
#include "config/app_config.hpp"
#include "control/session_control.hpp"
#include "core/errors.hpp"
#include "exchange/chat_backend.hpp"
#include "exchange/speech_exchange.hpp"
#include "stt/whisper_stt.hpp"
#include "tts/piper_tts.hpp"
#include "turn/voice_session.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace {
std::atomic<bool> g_running{true};

void handle_signal(int) {
    g_running = false;
}

// Owns the one live session and serializes start/stop requests
class SessionManager {
public:
    SessionManager(const AppConfig& config, ExchangeCollaborator& exchange, SessionControl*& control)
        : config_(config), exchange_(exchange), control_(control) {}

    void start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_ && session_->running()) {
            std::cout << "[Main] [WARN] Session already running.\n";
            return;
        }
        session_.reset();

        auto source = std::make_unique<PortAudioFrameSource>(config_.inputDevice, config_.outputDevice);
        session_ = std::make_unique<VoiceSession>(config_.session, std::move(source), exchange_,
                                                  [this](const SessionEvent& e) { forward(e); });
        try {
            session_->start();
        } catch (const DeviceUnavailable& e) {
            std::cerr << "[Main] [ERROR] Cannot open audio device: " << e.what() << "\n";
            SessionEvent event;
            event.type = SessionEvent::Type::DeviceUnavailable;
            event.message = e.what();
            forward(event);
            session_.reset();
        }
    }

    void stop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_) return;
        session_->stop();
        session_.reset();
    }

    // Tears down a session whose device went away
    void reap() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_ && session_->failed()) {
            std::cerr << "[Main] [ERROR] Session ended: audio device unavailable.\n";
            session_->stop();
            session_.reset();
        }
    }

    bool running() {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_ && session_->running() && !session_->failed();
    }

    Turn turn() {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_ ? session_->turn() : Turn::Idle;
    }

private:
    void forward(const SessionEvent& e) {
        if (e.type == SessionEvent::Type::TurnChanged) {
            std::cout << "[Main] Turn: " << toString(e.from) << " -> " << toString(e.to) << "\n";
        }
        if (control_) control_->sendEvent(e);
    }

    const AppConfig& config_;
    ExchangeCollaborator& exchange_;
    SessionControl*& control_;

    std::mutex mutex_;
    std::unique_ptr<VoiceSession> session_;
};
} // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    std::string configPath;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--list-devices") == 0) {
            try {
                PortAudioFrameSource::listDevices();
            } catch (const DeviceUnavailable& e) {
                std::cerr << "[Main] [ERROR] " << e.what() << "\n";
                return 1;
            }
            return 0;
        }
        configPath = argv[i];
    }
    if (configPath.empty()) {
        const char* env = std::getenv("VOXTURN_CONFIG");
        if (env) configPath = env;
    }

    AppConfig config;
    try {
        config = configPath.empty() ? AppConfig() : loadConfig(configPath);
        if (configPath.empty()) validateConfig(config);
    } catch (const ConfigError& e) {
        std::cerr << "[Main] [ERROR] " << e.what() << "\n";
        return 1;
    }
    if (config.chat.command.empty()) {
        std::cerr << "[Main] [ERROR] chat.command is not configured.\n";
        return 1;
    }

    // STT model init
    std::shared_ptr<WhisperSTT> stt;
    try {
        stt = std::make_shared<WhisperSTT>(config.whisper);
    } catch (const std::exception& e) {
        std::cerr << "[Whisper STT] [ERROR] " << e.what() << std::endl;
        return 1;
    }

    auto tts = std::make_shared<PiperTTS>(config.piper);
    if (!tts->available()) {
        std::cerr << "[Main] [WARN] Piper is not ready; responses will fail until it is.\n";
    }
    auto chat = std::make_shared<CommandChatBackend>(config.chat);

    SpeechExchange exchange(stt, chat, tts, config.exchange);

    SessionControl* controlPtr = nullptr;
    SessionManager sessions(config, exchange, controlPtr);

    SessionControl control(config.control.bindIp, config.control.port,
        [&](SessionControl::Command command, const std::string& senderIp, uint16_t senderPort) {
        switch (command) {
        case SessionControl::Command::Start:
            std::cout << "[Session Control] session_start from " << senderIp << ":" << senderPort << "\n";
            sessions.start();
            break;
        case SessionControl::Command::Stop:
            std::cout << "[Session Control] session_stop from " << senderIp << ":" << senderPort << "\n";
            sessions.stop();
            break;
        case SessionControl::Command::Status:
            control.sendStatus(sessions.running(), sessions.turn());
            break;
        case SessionControl::Command::Unknown:
            break;
        }
    });
    controlPtr = &control;

    try {
        control.start();
    } catch (const std::exception& e) {
        std::cerr << "[Session Control] [ERROR] " << e.what() << "\n";
        return 1;
    }

    if (config.control.autoStart) sessions.start();

    std::cout << "\nBackend running on udp " << config.control.bindIp << ":" << config.control.port
              << "... Press Ctrl+C to quit." << std::endl;
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        sessions.reap();
    }

    sessions.stop();
    control.stop();
    std::cout << "Exiting.\n";
    return 0;
}
