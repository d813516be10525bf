#ifndef PORTAUDIO_SOURCE_HPP
#define PORTAUDIO_SOURCE_HPP

#include "audio/audio_source.hpp"

#include <atomic>
#include <string>
#include <vector>

typedef void PaStream;

class PortAudioSource : public AudioSource {
public:
    struct Config {
        int device = -1; // -1 selects the default input device
        int sampleRate = 48000;
        int channels = 2;

        int framesPerBuffer = 1024;
    };

    struct InputDevice {
        int index = -1;
        std::string name;
        int maxInputChannels = 0;
        double defaultSampleRate = 0.0;
        bool isDefault = false;
    };

    PortAudioSource(Config config, const std::atomic<bool>& stopRequested);
    ~PortAudioSource() override;

    PortAudioSource(const PortAudioSource&) = delete;
    PortAudioSource& operator=(const PortAudioSource&) = delete;

    AudioChunk capture(double seconds) override;
    std::string describe() const override;

    void selfTest();

    static std::vector<InputDevice> listInputDevices();

private:
    struct Library {
        Library();
        ~Library();
    };

    Library library_;
    Config config_;
    const std::atomic<bool>& stopRequested_;

    std::string deviceName_;
    PaStream* stream_ = nullptr;
};

#endif
