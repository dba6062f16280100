#include "config/app_config.hpp"

#include "core/errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

static std::string read_all(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) throw ConfigError("cannot open config file: " + path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

template <typename T>
static void read(const json& obj, const char* key, T& target) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return;
    try {
        target = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("config key '") + key + "': " + e.what());
    }
}

static const json* section(const json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end()) return nullptr;
    if (!it->is_object()) throw ConfigError(std::string("config section '") + name + "' must be an object");
    return &*it;
}

AppConfig parseConfig(const std::string& jsonText) {
    json j;
    try {
        j = json::parse(jsonText);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("invalid config JSON: ") + e.what());
    }
    if (!j.is_object()) throw ConfigError("config root must be an object");

    AppConfig cfg;

    if (const json* a = section(j, "audio")) {
        read(*a, "sample_rate", cfg.session.audio.sampleRate);
        read(*a, "channels", cfg.session.audio.channels);
        read(*a, "frame_size", cfg.session.audio.frameSize);
        read(*a, "jitter_ms", cfg.session.audio.jitterMs);
        read(*a, "input_device", cfg.inputDevice);
        read(*a, "output_device", cfg.outputDevice);
    }
    if (const json* v = section(j, "vad")) {
        read(*v, "onset_threshold", cfg.session.vad.onsetThreshold);
        read(*v, "release_threshold", cfg.session.vad.releaseThreshold);
        read(*v, "onset_hold_ms", cfg.session.vad.onsetHoldMs);
        read(*v, "hangover_ms", cfg.session.vad.hangoverMs);
        read(*v, "max_utterance_ms", cfg.session.vad.maxUtteranceMs);
        read(*v, "pre_roll_ms", cfg.session.vad.preRollMs);
    }
    if (const json* t = section(j, "turn")) {
        read(*t, "barge_in_enabled", cfg.session.turn.bargeInEnabled);
        read(*t, "response_timeout_ms", cfg.session.turn.responseTimeoutMs);
        read(*t, "poll_ms", cfg.session.pollMs);
    }
    if (const json* w = section(j, "whisper")) {
        read(*w, "model", cfg.whisper.modelPath);
        read(*w, "language", cfg.whisper.language);
        read(*w, "threads", cfg.whisper.threads);
        read(*w, "no_speech_threshold", cfg.whisper.noSpeechThreshold);
    }
    if (const json* c = section(j, "chat")) {
        read(*c, "command", cfg.chat.command);
        read(*c, "system_prompt", cfg.chat.systemPrompt);
        read(*c, "max_history_turns", cfg.chat.maxHistoryTurns);
        read(*c, "timeout_ms", cfg.chat.timeoutMs);
    }
    if (const json* p = section(j, "piper")) {
        read(*p, "executable", cfg.piper.executable);
        read(*p, "model", cfg.piper.modelPath);
        read(*p, "sample_rate", cfg.piper.sampleRate);
        read(*p, "timeout_ms", cfg.piper.timeoutMs);
        read(*p, "max_queued_chunks", cfg.exchange.maxQueuedChunks);
    }
    if (const json* c = section(j, "control")) {
        read(*c, "bind_ip", cfg.control.bindIp);
        read(*c, "port", cfg.control.port);
        read(*c, "auto_start", cfg.control.autoStart);
    }

    validateConfig(cfg);
    return cfg;
}

AppConfig loadConfig(const std::string& path) {
    return parseConfig(read_all(path));
}

static void require(bool ok, const std::string& what) {
    if (!ok) throw ConfigError("invalid config: " + what);
}

void validateConfig(const AppConfig& cfg) {
    const AudioFrameSource::Config& a = cfg.session.audio;
    require(a.sampleRate >= 8000 && a.sampleRate <= 192000, "audio.sample_rate must be within 8000..192000");
    require(a.channels >= 1 && a.channels <= 2, "audio.channels must be 1 or 2");
    require(a.frameSize > 0, "audio.frame_size must be positive");
    require(a.jitterMs >= 0, "audio.jitter_ms must not be negative");

    const VoiceActivitySegmenter::Config& v = cfg.session.vad;
    require(v.onsetThreshold >= 0.0f && v.onsetThreshold <= 1.0f, "vad.onset_threshold must be within 0..1");
    require(v.releaseThreshold <= v.onsetThreshold, "vad.release_threshold must not exceed vad.onset_threshold");
    require(v.onsetHoldMs >= 0, "vad.onset_hold_ms must not be negative");
    require(v.hangoverMs >= 0, "vad.hangover_ms must not be negative");
    require(v.maxUtteranceMs > 0, "vad.max_utterance_ms must be positive");
    require(v.preRollMs >= 0, "vad.pre_roll_ms must not be negative");

    require(cfg.session.turn.responseTimeoutMs > 0, "turn.response_timeout_ms must be positive");
    require(cfg.session.pollMs > 0, "turn.poll_ms must be positive");

    require(cfg.chat.timeoutMs > 0 && cfg.chat.timeoutMs < cfg.session.turn.responseTimeoutMs,
            "chat.timeout_ms must be positive and shorter than turn.response_timeout_ms");
    require(cfg.whisper.threads > 0, "whisper.threads must be positive");
    require(cfg.piper.sampleRate > 0, "piper.sample_rate must be positive");
    require(cfg.exchange.maxQueuedChunks > 0, "piper.max_queued_chunks must be positive");
    require(cfg.control.port > 0 && cfg.control.port < 65536, "control.port must be within 1..65535");
}
