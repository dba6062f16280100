#ifndef SPEECH_TO_TEXT_HPP
#define SPEECH_TO_TEXT_HPP

#include "core/cancellation_token.hpp"

#include <string>
#include <vector>

// Recognizer seen by the speech exchange.
class SpeechToText {
public:
    static constexpr int kSampleRate = 16000;

    virtual ~SpeechToText() = default;

    // Returns an empty string when cancelled. Throws std::runtime_error on
    // failure.
    virtual std::string transcribe(const std::vector<float>& pcm16kMono, const CancellationToken* token = nullptr) = 0;
};

#endif
