#include "audio/audio_utils.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>

float rms(const int16_t* x, std::size_t n) {
    if (n == 0) return 0.0f;
    double acc = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double s = (double)x[i] / 32768.0;
        acc += s * s;
    }
    return (float)std::sqrt(acc / (double)n);
}

namespace {

template <typename T>
std::vector<T> resample_linear(const std::vector<T>& in, int fromRate, int toRate) {
    if (fromRate == toRate || in.empty() || fromRate <= 0 || toRate <= 0) return in;

    const std::size_t outLen = (std::size_t)((double)in.size() * toRate / fromRate);
    std::vector<T> out(outLen);
    const double step = (double)fromRate / (double)toRate;
    for (std::size_t i = 0; i < outLen; ++i) {
        const double pos = (double)i * step;
        const std::size_t i0 = std::min((std::size_t)pos, in.size() - 1);
        const std::size_t i1 = std::min(i0 + 1, in.size() - 1);
        const double frac = pos - (double)i0;
        const double v = (1.0 - frac) * in[i0] + frac * in[i1];
        out[i] = std::is_integral<T>::value ? (T)std::lround(v) : (T)v;
    }
    return out;
}

} // namespace

std::vector<int16_t> resampleLinear(const std::vector<int16_t>& in, int fromRate, int toRate) {
    return resample_linear(in, fromRate, toRate);
}

std::vector<float> resampleLinear(const std::vector<float>& in, int fromRate, int toRate) {
    return resample_linear(in, fromRate, toRate);
}

int framesForMs(int ms, int frameSize, int sampleRate) {
    if (ms <= 0 || frameSize <= 0 || sampleRate <= 0) return 0;
    const long long num = (long long)ms * sampleRate;
    const long long den = (long long)frameSize * 1000;
    return (int)std::max<long long>(1, (num + den - 1) / den);
}

int64_t frameTimestampUs(uint64_t sequence, int frameSize, int sampleRate) {
    if (sampleRate <= 0) return 0;
    return (int64_t)(sequence * (uint64_t)frameSize * 1000000ULL / (uint64_t)sampleRate);
}
