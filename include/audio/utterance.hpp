#ifndef UTTERANCE_HPP
#define UTTERANCE_HPP

#include "audio/audio_frame.hpp"

#include <cstdint>
#include <vector>

// One sealed span of detected speech.
struct Utterance {
    uint64_t id = 0;

    int64_t startTimeUs = 0;
    int64_t endTimeUs = 0;

    std::vector<AudioFrame> frames;

    // Sealed at the length limit rather than by trailing silence.
    bool forceSealed = false;
    // Continues a force-sealed predecessor.
    bool continuation = false;

    int64_t durationUs() const { return endTimeUs - startTimeUs; }
    int durationMs() const { return (int)(durationUs() / 1000); }

    // Mono float samples in [-1, 1], channels averaged.
    std::vector<float> pcm() const;
};

#endif
