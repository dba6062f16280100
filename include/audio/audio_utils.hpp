#ifndef AUDIO_UTILS_HPP
#define AUDIO_UTILS_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

// RMS normalized to full scale, in [0, 1].
float rms(const int16_t* x, std::size_t n);

// Linear interpolation resampler; returns the input unchanged when rates match.
std::vector<int16_t> resampleLinear(const std::vector<int16_t>& in, int fromRate, int toRate);
std::vector<float> resampleLinear(const std::vector<float>& in, int fromRate, int toRate);

// Number of whole frames needed to cover ms, at least 1 for ms > 0.
int framesForMs(int ms, int frameSize, int sampleRate);

int64_t frameTimestampUs(uint64_t sequence, int frameSize, int sampleRate);

#endif
