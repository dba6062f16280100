#ifndef APP_CONFIG_HPP
#define APP_CONFIG_HPP

#include "exchange/chat_backend.hpp"
#include "exchange/speech_exchange.hpp"
#include "stt/whisper_stt.hpp"
#include "tts/piper_tts.hpp"
#include "turn/voice_session.hpp"

#include <string>

struct ControlConfig {
    std::string bindIp = "127.0.0.1";
    int port = 3939;
    // Start a session right away instead of waiting for session_start.
    bool autoStart = false;
};

struct AppConfig {
    VoiceSession::Config session;
    std::string inputDevice;
    std::string outputDevice;

    WhisperSTT::Config whisper;
    CommandChatBackend::Config chat;
    PiperTTS::Config piper;
    SpeechExchange::Config exchange;

    ControlConfig control;
};

// Missing keys keep their defaults and unknown keys are ignored. Throws
// ConfigError on malformed JSON, wrong types or out-of-range values.
AppConfig parseConfig(const std::string& jsonText);
AppConfig loadConfig(const std::string& path);

void validateConfig(const AppConfig& config);

#endif
