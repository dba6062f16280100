#include "audio/portaudio_frame_source.hpp"

#include "core/errors.hpp"

#include <cstring>
#include <iostream>
#include <memory>
#include <utility>

std::atomic<bool> PortAudioFrameSource::deviceHeld_{false};

static void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw DeviceUnavailable(std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
}

// Pa_Initialize / Pa_Terminate pair
class PortAudioFrameSource::Library {
public:
    Library() { pa_check(Pa_Initialize(), "Pa_Initialize"); }
    ~Library() { Pa_Terminate(); }

    Library(const Library&) = delete;
    Library& operator=(const Library&) = delete;
};

void PortAudioFrameSource::StreamCloser::operator()(PaStream* stream) const {
    if (!stream) return;
    Pa_AbortStream(stream);
    Pa_CloseStream(stream);
}

static PaDeviceIndex find_device(const std::string& name, bool input) {
    if (name.empty()) return input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();

    const int count = Pa_GetDeviceCount();
    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || !info->name) continue;
        const int channels = input ? info->maxInputChannels : info->maxOutputChannels;
        if (channels > 0 && std::strstr(info->name, name.c_str())) return i;
    }
    return paNoDevice;
}

// Constructor
PortAudioFrameSource::PortAudioFrameSource(std::string inputDevice, std::string outputDevice)
    : inputDevice_(std::move(inputDevice)), outputDevice_(std::move(outputDevice)) {}

// Destructor
PortAudioFrameSource::~PortAudioFrameSource() { close(); }

// Opens and starts the duplex stream; on any failure everything acquired so far is released
void PortAudioFrameSource::acquireDevice(const Config& config) {
    if (deviceHeld_.exchange(true)) {
        throw DeviceUnavailable("audio device already held by this process");
    }

    try {
        library_ = std::make_unique<Library>();

        PaStreamParameters inParams{};
        inParams.device = find_device(inputDevice_, true);
        if (inParams.device == paNoDevice) {
            throw DeviceUnavailable(inputDevice_.empty() ? "No default input device"
                                                         : "No input device matching '" + inputDevice_ + "'");
        }
        PaStreamParameters outParams{};
        outParams.device = find_device(outputDevice_, false);
        if (outParams.device == paNoDevice) {
            throw DeviceUnavailable(outputDevice_.empty() ? "No default output device"
                                                          : "No output device matching '" + outputDevice_ + "'");
        }

        const PaDeviceInfo* inInfo = Pa_GetDeviceInfo(inParams.device);
        const PaDeviceInfo* outInfo = Pa_GetDeviceInfo(outParams.device);
        std::cout << "[Audio Device] Input: " << (inInfo ? inInfo->name : "(unknown)")
                  << ", output: " << (outInfo ? outInfo->name : "(unknown)") << "\n";

        inParams.channelCount = config.channels;
        inParams.sampleFormat = paInt16;
        inParams.suggestedLatency = inInfo ? inInfo->defaultLowInputLatency : 0.05;
        inParams.hostApiSpecificStreamInfo = nullptr;

        outParams.channelCount = config.channels;
        outParams.sampleFormat = paInt16;
        outParams.suggestedLatency = outInfo ? outInfo->defaultLowOutputLatency : 0.05;
        outParams.hostApiSpecificStreamInfo = nullptr;

        pa_check(Pa_IsFormatSupported(&inParams, &outParams, config.sampleRate), "Pa_IsFormatSupported");

        channels_ = config.channels;
        stopping_.store(false);

        PaStream* stream = nullptr;
        pa_check(
            Pa_OpenStream(&stream, &inParams, &outParams,
                          config.sampleRate, config.frameSize,
                          paClipOff, &PortAudioFrameSource::streamCallback, this),
            "Pa_OpenStream"
        );
        stream_.reset(stream);

        pa_check(Pa_SetStreamFinishedCallback(stream, &PortAudioFrameSource::streamFinished), "Pa_SetStreamFinishedCallback");
        pa_check(Pa_StartStream(stream), "Pa_StartStream");
    } catch (...) {
        stopping_.store(true);
        stream_.reset();
        library_.reset();
        deviceHeld_.store(false);
        throw;
    }
}

// Stops the stream and gives the device back
void PortAudioFrameSource::releaseDevice() noexcept {
    if (!library_) return;
    stopping_.store(true);
    stream_.reset();
    library_.reset();
    deviceHeld_.store(false);
}

int PortAudioFrameSource::streamCallback(const void* input, void* output, unsigned long frameCount,
                                         const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags,
                                         void* userData) {
    auto* self = static_cast<PortAudioFrameSource*>(userData);
    const std::size_t samples = (std::size_t)frameCount * (std::size_t)self->channels_;

    if (input) self->deliverCapture(static_cast<const int16_t*>(input), samples);
    if (output) self->renderPlayback(static_cast<int16_t*>(output), samples);

    return self->stopping_.load() ? paComplete : paContinue;
}

void PortAudioFrameSource::streamFinished(void* userData) {
    auto* self = static_cast<PortAudioFrameSource*>(userData);
    if (!self->stopping_.load()) self->reportDeviceLost("audio stream stopped unexpectedly");
}

// Prints every device with its channel counts
void PortAudioFrameSource::listDevices() {
    Library library;

    const int count = Pa_GetDeviceCount();
    if (count <= 0) {
        std::cout << "No audio devices found.\n";
        return;
    }

    const PaDeviceIndex defIn = Pa_GetDefaultInputDevice();
    const PaDeviceIndex defOut = Pa_GetDefaultOutputDevice();

    std::cout << "Audio devices:\n";
    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        const PaHostApiInfo* api = Pa_GetHostApiInfo(info->hostApi);
        std::cout << "- " << i << ": " << (info->name ? info->name : "(unnamed)")
                  << " [" << (api ? api->name : "?") << "]"
                  << " in " << info->maxInputChannels << "ch, out " << info->maxOutputChannels << "ch"
                  << ", " << info->defaultSampleRate << " Hz";
        if (i == defIn) std::cout << " (default input)";
        if (i == defOut) std::cout << " (default output)";
        std::cout << "\n";
    }
}
