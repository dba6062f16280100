#include "audio/voice_activity_segmenter.hpp"

#include "audio/audio_utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

// Constructor
VoiceActivitySegmenter::VoiceActivitySegmenter(Config config) : config_(config) {
    if (config_.sampleRate <= 0 || config_.frameSize <= 0) {
        throw std::invalid_argument("segmenter needs a positive sample rate and frame size");
    }
    if (config_.maxUtteranceMs <= 0) throw std::invalid_argument("maxUtteranceMs must be positive");
    if (config_.onsetThreshold < 0.0f) throw std::invalid_argument("onsetThreshold must not be negative");

    releaseThreshold_ = config_.releaseThreshold < 0.0f ? config_.onsetThreshold : config_.releaseThreshold;
    if (releaseThreshold_ > config_.onsetThreshold) {
        throw std::invalid_argument("releaseThreshold must not exceed onsetThreshold");
    }

    onsetHoldFrames_ = std::max(1, framesForMs(config_.onsetHoldMs, config_.frameSize, config_.sampleRate));
    hangoverFrames_ = std::max(1, framesForMs(config_.hangoverMs, config_.frameSize, config_.sampleRate));
    maxFrames_ = std::max(1, framesForMs(config_.maxUtteranceMs, config_.frameSize, config_.sampleRate));
    preRollFrames_ = framesForMs(config_.preRollMs, config_.frameSize, config_.sampleRate);
}

float VoiceActivitySegmenter::score(const AudioFrame& frame) {
    return rms(frame.samples.data(), frame.samples.size());
}

// Resets segmentation state
void VoiceActivitySegmenter::reset() {
    state_ = State::Silence;
    mode_ = Mode::Segment;
    activeFrames_ = 0;
    silentFrames_ = 0;
    preRoll_.clear();
    candidate_.clear();
    tail_.clear();
    current_ = Utterance();
    sealed_.clear();
}

Utterance VoiceActivitySegmenter::takeUtterance() {
    if (sealed_.empty()) throw std::logic_error("no sealed utterance available");
    Utterance u = std::move(sealed_.front());
    sealed_.pop_front();
    return u;
}

void VoiceActivitySegmenter::pushPreRoll(const AudioFrame& frame) {
    if (preRollFrames_ <= 0) return;
    preRoll_.push_back(frame);
    while ((int)preRoll_.size() > preRollFrames_) preRoll_.pop_front();
}

void VoiceActivitySegmenter::beginUtterance(bool continuation) {
    current_ = Utterance();
    current_.continuation = continuation;
}

// Moves the in-progress utterance to the sealed queue; an utterance without speech is dropped
void VoiceActivitySegmenter::seal(bool includeTail, bool forced) {
    if (includeTail) {
        current_.frames.insert(current_.frames.end(), tail_.begin(), tail_.end());
    }
    tail_.clear();

    if (current_.frames.empty()) {
        current_ = Utterance();
        return;
    }

    current_.id = nextId_++;
    current_.forceSealed = forced;
    current_.startTimeUs = current_.frames.front().timestampUs;
    current_.endTimeUs = current_.frames.back().timestampUs + current_.frames.back().durationUs();
    sealed_.push_back(std::move(current_));
    current_ = Utterance();
}

VoiceActivitySegmenter::Result VoiceActivitySegmenter::feed(const AudioFrame& frame) {
    Result result;

    const float s = score(frame);
    const bool keep = mode_ == Mode::Segment;

    switch (state_) {
    case State::Silence:
        if (s > config_.onsetThreshold) {
            state_ = State::SpeechCandidate;
            candidate_.assign(preRoll_.begin(), preRoll_.end());
            preRoll_.clear();
            candidate_.push_back(frame);
            activeFrames_ = 1;
        } else {
            pushPreRoll(frame);
            return result;
        }
        break;

    case State::SpeechCandidate:
        if (s > config_.onsetThreshold) {
            candidate_.push_back(frame);
            ++activeFrames_;
        } else {
            // false trigger
            state_ = State::Silence;
            candidate_.clear();
            activeFrames_ = 0;
            pushPreRoll(frame);
            return result;
        }
        break;

    case State::Speech:
        if (s > releaseThreshold_) {
            current_.frames.insert(current_.frames.end(), tail_.begin(), tail_.end());
            tail_.clear();
            if (keep) current_.frames.push_back(frame);
            silentFrames_ = 0;
        } else {
            if (keep) tail_.push_back(frame);
            if (++silentFrames_ >= hangoverFrames_) {
                const std::size_t before = sealed_.size();
                seal(false, false);
                state_ = State::Silence;
                silentFrames_ = 0;
                result.utteranceSealed = sealed_.size() > before;
                return result;
            }
        }
        break;
    }

    if (state_ == State::SpeechCandidate && activeFrames_ >= onsetHoldFrames_) {
        state_ = State::Speech;
        beginUtterance(false);
        if (keep) current_.frames = std::move(candidate_);
        candidate_.clear();
        activeFrames_ = 0;
        silentFrames_ = 0;
        result.speechStarted = true;
    }

    if (state_ == State::Speech && currentFrames() >= maxFrames_) {
        const std::size_t before = sealed_.size();
        seal(true, true);
        beginUtterance(true);
        result.utteranceSealed = sealed_.size() > before;
    }

    return result;
}
