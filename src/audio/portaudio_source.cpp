#include "audio/portaudio_source.hpp"

#include <portaudio.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <vector>

static bool is_device_gone(PaError e) {
    return e == paDeviceUnavailable || e == paInvalidDevice || e == paUnanticipatedHostError;
}

// Setup calls: any failure is fatal
static void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw std::runtime_error(std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
}

// Per-capture calls: a vanished device ends the session, anything else skips the chunk
static void pa_check_capture(PaError e, const char* msg) {
    if (e == paNoError) return;
    const std::string what = std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e);
    if (is_device_gone(e)) throw DeviceLostError(what);
    throw CaptureError(what);
}

namespace {
// Stops the stream on every exit path out of a capture
struct RunningStream {
    PaStream* stream;
    explicit RunningStream(PaStream* s) : stream(s) { pa_check_capture(Pa_StartStream(stream), "Pa_StartStream"); }
    ~RunningStream() {
        const PaError e = Pa_StopStream(stream);
        if (e != paNoError) std::cerr << "[Audio] [WARN] Pa_StopStream: " << Pa_GetErrorText(e) << "\n";
    }
};
} // namespace

PortAudioSource::Library::Library() { pa_check(Pa_Initialize(), "Pa_Initialize"); }

PortAudioSource::Library::~Library() { Pa_Terminate(); }

// Constructor
PortAudioSource::PortAudioSource(Config config, const std::atomic<bool>& stopRequested)
    : config_(config), stopRequested_(stopRequested) {
    PaStreamParameters inParams{};
    inParams.device = config_.device < 0 ? Pa_GetDefaultInputDevice() : (PaDeviceIndex)config_.device;
    if (inParams.device == paNoDevice || inParams.device >= Pa_GetDeviceCount()) {
        throw std::runtime_error("No such input device: " + std::to_string(config_.device));
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(inParams.device);
    if (!info || info->maxInputChannels < 1) {
        throw std::runtime_error("Device " + std::to_string(inParams.device) + " has no input channels");
    }
    deviceName_ = info->name ? info->name : "(unknown)";

    if (config_.channels > info->maxInputChannels) {
        throw std::runtime_error(deviceName_ + " supports " + std::to_string(info->maxInputChannels) +
                                 " input channel(s), " + std::to_string(config_.channels) + " requested");
    }

    inParams.channelCount = config_.channels;
    inParams.sampleFormat = paInt16;
    inParams.suggestedLatency = info->defaultHighInputLatency;
    inParams.hostApiSpecificStreamInfo = nullptr;

    const PaError supported = Pa_IsFormatSupported(&inParams, nullptr, config_.sampleRate);
    if (supported != paFormatIsSupported) {
        throw std::runtime_error(deviceName_ + " rejects S16 " + std::to_string(config_.sampleRate) + " Hz x" +
                                 std::to_string(config_.channels) + ": " + Pa_GetErrorText(supported));
    }

    pa_check(
        Pa_OpenStream(&stream_, &inParams, nullptr,
                      config_.sampleRate, config_.framesPerBuffer,
                      paClipOff, nullptr, nullptr),
        "Pa_OpenStream"
    );

    config_.device = inParams.device;
}

// Destructor
PortAudioSource::~PortAudioSource() {
    if (stream_) Pa_CloseStream(stream_);
}

// Records `seconds` of fresh audio; returns early (possibly empty) when a stop is requested
AudioChunk PortAudioSource::capture(double seconds) {
    AudioChunk out;
    out.sampleRate = config_.sampleRate;
    out.channels = config_.channels;

    const long totalFrames = std::lround(seconds * config_.sampleRate);
    if (totalFrames <= 0 || stopRequested_.load()) return out;

    out.samples.reserve((size_t)totalFrames * config_.channels);
    std::vector<int16_t> buff((size_t)config_.framesPerBuffer * config_.channels);

    RunningStream running(stream_);

    long captured = 0;
    while (captured < totalFrames && !stopRequested_.load()) {
        const long frames = std::min<long>(config_.framesPerBuffer, totalFrames - captured);

        PaError e = Pa_ReadStream(stream_, buff.data(), frames);
        if (e == paInputOverflowed) {
            continue;
        }
        pa_check_capture(e, "Pa_ReadStream");

        for (long i = 0; i < frames * config_.channels; ++i) out.samples.push_back((float)buff[i] / 32768.0f);
        captured += frames;
    }

    return out;
}

std::string PortAudioSource::describe() const {
    return deviceName_ + " [" + std::to_string(config_.device) + "] " + std::to_string(config_.sampleRate) +
           " Hz, " + std::to_string(config_.channels) + " ch";
}

// One-second test recording before the session starts
void PortAudioSource::selfTest() {
    const AudioChunk probe = capture(1.0);
    if (probe.empty() && !stopRequested_.load()) {
        throw std::runtime_error("Test recording on " + deviceName_ + " captured no audio");
    }
}

std::vector<PortAudioSource::InputDevice> PortAudioSource::listInputDevices() {
    Library library;

    std::vector<InputDevice> devices;
    const PaDeviceIndex defaultIndex = Pa_GetDefaultInputDevice();
    const int count = Pa_GetDeviceCount();
    if (count < 0) pa_check(count, "Pa_GetDeviceCount");

    for (int i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels < 1) continue;

        InputDevice d;
        d.index = i;
        d.name = info->name ? info->name : "(unknown)";
        d.maxInputChannels = info->maxInputChannels;
        d.defaultSampleRate = info->defaultSampleRate;
        d.isDefault = (i == defaultIndex);
        devices.push_back(d);
    }
    return devices;
}
