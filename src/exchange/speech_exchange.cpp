#include "exchange/speech_exchange.hpp"

#include "audio/audio_utils.hpp"
#include "exchange/threaded_response_stream.hpp"

#include <cctype>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>

static std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Constructor
SpeechExchange::SpeechExchange(std::shared_ptr<SpeechToText> stt, std::shared_ptr<ChatBackend> chat,
                               std::shared_ptr<PiperTTS> tts, Config config)
    : stt_(std::move(stt)), chat_(std::move(chat)), tts_(std::move(tts)), config_(config) {
    if (!stt_ || !chat_ || !tts_) throw std::invalid_argument("SpeechExchange needs stt, chat and tts");
}

std::string SpeechExchange::speakableText(const std::string& reply) {
    std::string text;
    bool inCode = false;
    std::size_t i = 0;
    while (i < reply.size()) {
        if (reply.compare(i, 3, "```") == 0) {
            inCode = !inCode;
            i += 3;
            continue;
        }
        const char c = reply[i++];
        if (inCode) continue;
        if (c == '*' || c == '_' || c == '#' || c == '`') continue;
        text += (c == '\n' || c == '\t') ? ' ' : c;
    }

    std::string collapsed;
    for (char c : text) {
        if (c == ' ' && !collapsed.empty() && collapsed.back() == ' ') continue;
        collapsed += c;
    }
    return trim(collapsed);
}

std::vector<std::string> SpeechExchange::splitSentences(const std::string& text) {
    std::vector<std::string> out;
    std::string current;
    for (std::size_t i = 0; i < text.size(); ++i) {
        current += text[i];
        const bool terminal = text[i] == '.' || text[i] == '!' || text[i] == '?';
        const bool boundary = i + 1 == text.size() || std::isspace((unsigned char)text[i + 1]);
        if (terminal && boundary) {
            const std::string s = trim(current);
            if (!s.empty()) out.push_back(s);
            current.clear();
        }
    }
    const std::string rest = trim(current);
    if (!rest.empty()) out.push_back(rest);
    return out;
}

std::unique_ptr<ResponseStream> SpeechExchange::submit(Utterance utterance, uint64_t responseId) {
    const int rate = utterance.frames.empty() ? SpeechToText::kSampleRate : utterance.frames.front().sampleRate;
    std::vector<float> pcm = resampleLinear(utterance.pcm(), rate, SpeechToText::kSampleRate);

    std::shared_ptr<SpeechToText> stt = stt_;
    std::shared_ptr<ChatBackend> chat = chat_;
    std::shared_ptr<PiperTTS> tts = tts_;

    auto producer = [stt, chat, tts, pcm](ThreadedResponseStream::Writer& writer) {
        const CancellationToken& token = writer.token();

        const std::string heard = trim(stt->transcribe(pcm, &token));
        if (token.cancelled()) return;
        if (heard.empty()) {
            std::cout << "[Speech Exchange] (no speech recognised)\n";
            return;
        }
        std::cout << "[Speech Exchange] STT: " << heard << "\n";

        const std::string answer = chat->reply(heard, token);
        if (token.cancelled()) return;
        std::cout << "[Speech Exchange] Reply: " << answer << "\n";

        for (const std::string& sentence : splitSentences(speakableText(answer))) {
            if (token.cancelled()) return;
            PlaybackChunk chunk;
            chunk.samples = tts->synthesize(sentence, token);
            if (token.cancelled()) return;
            if (chunk.samples.empty()) continue;
            chunk.sampleRate = tts->sampleRate();
            chunk.text = sentence;
            if (!writer.emit(std::move(chunk))) return;
        }
    };

    return std::make_unique<ThreadedResponseStream>(responseId, producer, config_.maxQueuedChunks);
}
