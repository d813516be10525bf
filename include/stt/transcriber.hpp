#ifndef TRANSCRIBER_HPP
#define TRANSCRIBER_HPP

#include <stdexcept>
#include <string>
#include <vector>

// One transcription call failed or timed out; the session skips the chunk
class TranscriptionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Transcriber {
public:
    virtual ~Transcriber() = default;

    // pcm16kMono: 16 kHz mono samples in [-1, 1]. Returns raw model text.
    // Throws TranscriptionError on failure.
    virtual std::string transcribe(const std::vector<float>& pcm16kMono) = 0;

    virtual std::string describe() const = 0;
};

#endif
