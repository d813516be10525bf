#include "audio/wav_file_source.hpp"

#include "audio/wav_file.hpp"

#include <algorithm>

// Constructor
WavFileSource::WavFileSource(const std::string& path) : path_(path), audio_(read_wav(path)) {}

AudioChunk WavFileSource::capture(double seconds) {
    AudioChunk out;
    out.sampleRate = audio_.sampleRate;
    out.channels = audio_.channels;
    if (exhausted()) return out;

    const size_t wanted = (size_t)(seconds * audio_.sampleRate) * audio_.channels;
    const size_t n = std::min(wanted, audio_.samples.size() - cursor_);
    out.samples.assign(audio_.samples.begin() + cursor_, audio_.samples.begin() + cursor_ + n);
    cursor_ += n;
    return out;
}

bool WavFileSource::exhausted() const {
    return cursor_ >= audio_.samples.size();
}

std::string WavFileSource::describe() const {
    return path_ + " (" + std::to_string(audio_.sampleRate) + " Hz, " +
           std::to_string(audio_.channels) + " ch, " + std::to_string((int)audio_.seconds()) + " s)";
}
