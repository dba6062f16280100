#ifndef PORTAUDIO_FRAME_SOURCE_HPP
#define PORTAUDIO_FRAME_SOURCE_HPP

#include "audio/audio_frame_source.hpp"

#include <portaudio.h>

#include <atomic>
#include <memory>
#include <string>

// PortAudio duplex stream driving an AudioFrameSource from its callback.
// Only one instance per process may hold the device at a time.
class PortAudioFrameSource : public AudioFrameSource {
public:
    // Empty names select the host's default devices; otherwise the first
    // device whose name contains the given text is used.
    explicit PortAudioFrameSource(std::string inputDevice = "", std::string outputDevice = "");
    ~PortAudioFrameSource() override;

    static void listDevices();

protected:
    void acquireDevice(const Config& config) override;
    void releaseDevice() noexcept override;

private:
    class Library;
    struct StreamCloser {
        void operator()(PaStream* stream) const;
    };

    static int streamCallback(const void* input, void* output, unsigned long frameCount,
                              const PaStreamCallbackTimeInfo* timeInfo,
                              PaStreamCallbackFlags statusFlags, void* userData);
    static void streamFinished(void* userData);

    std::string inputDevice_;
    std::string outputDevice_;
    int channels_ = 1;

    std::unique_ptr<Library> library_;
    std::unique_ptr<PaStream, StreamCloser> stream_;
    std::atomic<bool> stopping_{false};

    static std::atomic<bool> deviceHeld_;
};

#endif
