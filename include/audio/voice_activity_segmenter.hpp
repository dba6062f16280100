#ifndef VOICE_ACTIVITY_SEGMENTER_HPP
#define VOICE_ACTIVITY_SEGMENTER_HPP

#include "audio/audio_frame.hpp"
#include "audio/utterance.hpp"

#include <cstdint>
#include <deque>
#include <vector>

// Energy based speech/silence segmentation of captured frames into utterances.
//
//   Silence --score > onset--> SpeechCandidate --onsetHoldMs active--> Speech
//   SpeechCandidate --quiet frame--> Silence (frames dropped)
//   Speech --hangoverMs below release--> Silence (utterance sealed)
//
// Trailing hangover frames are not part of the sealed audio. An utterance
// reaching maxUtteranceMs is sealed on that frame and the next frame opens a
// continuation.
//
// In DetectOnly mode onsets are still reported but no audio is kept: confirmed
// speech leaves the segmenter in Speech with an empty utterance, and frames
// become utterance audio only once the mode is switched back to Segment.
class VoiceActivitySegmenter {
public:
    enum class State { Silence, SpeechCandidate, Speech };
    enum class Mode { Segment, DetectOnly };

    struct Config {
        int sampleRate = 16000;
        int frameSize = 160;

        float onsetThreshold = 0.014f;
        // Hysteresis; negative means "same as onset".
        float releaseThreshold = -1.0f;

        int onsetHoldMs = 80;
        int hangoverMs = 550;

        int maxUtteranceMs = 12000;
        int preRollMs = 0;
    };

    struct Result {
        bool speechStarted = false;
        bool utteranceSealed = false;
    };

    explicit VoiceActivitySegmenter(Config config);

    Result feed(const AudioFrame& frame);

    bool hasUtterance() const { return !sealed_.empty(); }
    // Oldest sealed utterance; throws std::logic_error when there is none.
    Utterance takeUtterance();

    // Drops in-progress and sealed audio and returns to Segment mode.
    // Utterance ids keep counting.
    void reset();

    void setMode(Mode mode) { mode_ = mode; }
    Mode mode() const { return mode_; }

    State state() const { return state_; }
    const Config& config() const { return config_; }

    // Normalized RMS of a frame; scales monotonically with amplitude.
    static float score(const AudioFrame& frame);

private:
    void beginUtterance(bool continuation);
    void seal(bool includeTail, bool forced);
    void pushPreRoll(const AudioFrame& frame);
    int currentFrames() const { return (int)current_.frames.size() + (int)tail_.size(); }

    Config config_;

    int onsetHoldFrames_ = 1;
    int hangoverFrames_ = 1;
    int maxFrames_ = 1;
    int preRollFrames_ = 0;
    float releaseThreshold_ = 0.0f;

    State state_ = State::Silence;
    Mode mode_ = Mode::Segment;

    int activeFrames_ = 0;
    int silentFrames_ = 0;
    uint64_t nextId_ = 1;

    std::deque<AudioFrame> preRoll_;
    std::vector<AudioFrame> candidate_;
    std::vector<AudioFrame> tail_;
    Utterance current_;
    std::deque<Utterance> sealed_;
};

#endif
