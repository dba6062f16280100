#ifndef WHISPER_STT_HPP
#define WHISPER_STT_HPP

#include "stt/speech_to_text.hpp"

#include <mutex>
#include <string>
#include <vector>

struct whisper_context;

class WhisperSTT : public SpeechToText {
public:
    struct Config {
        std::string modelPath = "models/whisper/ggml-base.en-q5_1.bin";
        std::string language = "en";
        int threads = 4;
        float noSpeechThreshold = 0.6f;
    };

    explicit WhisperSTT(Config config);
    ~WhisperSTT() override;

    WhisperSTT(const WhisperSTT&) = delete;
    WhisperSTT& operator=(const WhisperSTT&) = delete;

    std::string transcribe(const std::vector<float>& pcm16kMono, const CancellationToken* token = nullptr) override;

private:
    Config config_;
    whisper_context* context_ = nullptr;
    // One decode at a time per context.
    std::mutex mutex_;
};

#endif
