#ifndef AUDIO_FRAME_HPP
#define AUDIO_FRAME_HPP

#include <cstdint>
#include <vector>

// One fixed-size block of interleaved 16-bit PCM.
struct AudioFrame {
    std::vector<int16_t> samples;

    int sampleRate = 16000;
    int channels = 1;

    // Capture time relative to stream start, derived from the sequence index.
    int64_t timestampUs = 0;
    uint64_t sequence = 0;

    // Response the frame belongs to; 0 for captured audio.
    uint64_t streamId = 0;

    int frameCount() const { return channels > 0 ? (int)samples.size() / channels : 0; }
    int64_t durationUs() const {
        return sampleRate > 0 ? (int64_t)frameCount() * 1000000 / sampleRate : 0;
    }
};

#endif
