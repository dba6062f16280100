#ifndef PIPER_TTS_HPP
#define PIPER_TTS_HPP

#include "core/cancellation_token.hpp"

#include <cstdint>
#include <string>
#include <vector>

// Text to speech through the piper command line, raw 16-bit mono on stdout.
class PiperTTS {
public:
    struct Config {
        std::string executable = "piper";
        std::string modelPath = "models/piper/en_US-lessac-medium.onnx";
        // Output rate of the voice model.
        int sampleRate = 22050;
        int timeoutMs = 30000;
    };

    explicit PiperTTS(Config config);

    // Model file present and executable on PATH.
    bool available() const;

    // Empty on cancellation. Throws std::runtime_error when piper fails.
    std::vector<int16_t> synthesize(const std::string& text, const CancellationToken& token);

    int sampleRate() const { return config_.sampleRate; }

private:
    Config config_;
};

#endif
