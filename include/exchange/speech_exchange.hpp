#ifndef SPEECH_EXCHANGE_HPP
#define SPEECH_EXCHANGE_HPP

#include "exchange/chat_backend.hpp"
#include "exchange/response_stream.hpp"
#include "stt/speech_to_text.hpp"
#include "tts/piper_tts.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

// Utterance -> transcript -> chat reply -> piper audio, one chunk per
// sentence so playback starts before the whole reply is synthesized.
class SpeechExchange : public ExchangeCollaborator {
public:
    struct Config {
        std::size_t maxQueuedChunks = 8;
    };

    SpeechExchange(std::shared_ptr<SpeechToText> stt, std::shared_ptr<ChatBackend> chat,
                   std::shared_ptr<PiperTTS> tts, Config config);

    std::unique_ptr<ResponseStream> submit(Utterance utterance, uint64_t responseId) override;

    // Code blocks and markdown markup removed; they are not read aloud.
    static std::string speakableText(const std::string& reply);
    static std::vector<std::string> splitSentences(const std::string& text);

private:
    std::shared_ptr<SpeechToText> stt_;
    std::shared_ptr<ChatBackend> chat_;
    std::shared_ptr<PiperTTS> tts_;
    Config config_;
};

#endif
