#include "tts/piper_tts.hpp"

#include "exchange/process_runner.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <sys/stat.h>

// Constructor
PiperTTS::PiperTTS(Config config) : config_(std::move(config)) {}

bool PiperTTS::available() const {
    struct stat st;
    if (::stat(config_.modelPath.c_str(), &st) != 0) {
        std::cerr << "[Piper TTS] [WARN] Model file not found: " << config_.modelPath << "\n";
        return false;
    }
    const std::string lookup = "command -v " + shellQuote(config_.executable) + " >/dev/null 2>&1";
    if (std::system(lookup.c_str()) != 0) {
        std::cerr << "[Piper TTS] [WARN] " << config_.executable << " not found in PATH\n";
        return false;
    }
    return true;
}

std::vector<int16_t> PiperTTS::synthesize(const std::string& text, const CancellationToken& token) {
    if (text.empty()) return {};

    const std::string cmd = shellQuote(config_.executable) + " --model " + shellQuote(config_.modelPath) +
                            " --output_raw 2>/dev/null";

    const ProcessResult r = runProcess(cmd, text + "\n", token, config_.timeoutMs);
    if (r.cancelled) return {};
    if (r.timedOut) throw std::runtime_error("piper timed out after " + std::to_string(config_.timeoutMs) + " ms");
    if (r.exitCode != 0) throw std::runtime_error("piper exited with status " + std::to_string(r.exitCode));

    std::vector<int16_t> pcm(r.output.size() / sizeof(int16_t));
    if (!pcm.empty()) std::memcpy(pcm.data(), r.output.data(), pcm.size() * sizeof(int16_t));
    return pcm;
}
