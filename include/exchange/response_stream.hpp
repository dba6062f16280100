#ifndef RESPONSE_STREAM_HPP
#define RESPONSE_STREAM_HPP

#include "audio/utterance.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// One piece of synthesized response audio.
struct PlaybackChunk {
    uint64_t responseId = 0;
    int sampleRate = 16000;
    std::vector<int16_t> samples;

    // What the chunk says, for logs.
    std::string text;
};

// Lazy, finite, non-restartable sequence of chunks for one response.
class ResponseStream {
public:
    enum class Status { Chunk, Pending, Finished };

    virtual ~ResponseStream() = default;

    // Never blocks. Throws ResponseFailed once the producer failed.
    virtual Status poll(PlaybackChunk& out) = 0;

    // Asks the producer to stop; it is not waited for.
    virtual void cancel() = 0;

    virtual uint64_t id() const = 0;
};

// Turns one sealed utterance into a response stream (speech-to-text, chat
// turn, text-to-speech in the real deployment).
class ExchangeCollaborator {
public:
    virtual ~ExchangeCollaborator() = default;

    virtual std::unique_ptr<ResponseStream> submit(Utterance utterance, uint64_t responseId) = 0;
};

#endif
