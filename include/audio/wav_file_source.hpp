#ifndef WAV_FILE_SOURCE_HPP
#define WAV_FILE_SOURCE_HPP

#include "audio/audio_source.hpp"

#include <cstddef>
#include <string>

// Replays a WAV recording in capture-sized pieces
class WavFileSource : public AudioSource {
public:
    explicit WavFileSource(const std::string& path);

    AudioChunk capture(double seconds) override;
    bool exhausted() const override;
    std::string describe() const override;

private:
    std::string path_;
    AudioChunk audio_;
    size_t cursor_ = 0;
};

#endif
