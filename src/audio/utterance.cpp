#include "audio/utterance.hpp"

std::vector<float> Utterance::pcm() const {
    std::vector<float> out;
    for (const auto& f : frames) {
        const int ch = f.channels > 0 ? f.channels : 1;
        const int n = f.frameCount();
        for (int i = 0; i < n; ++i) {
            float acc = 0.0f;
            for (int c = 0; c < ch; ++c) acc += (float)f.samples[(std::size_t)i * ch + c];
            out.push_back(acc / (float)ch / 32768.0f);
        }
    }
    return out;
}
