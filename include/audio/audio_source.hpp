#ifndef AUDIO_SOURCE_HPP
#define AUDIO_SOURCE_HPP

#include "audio/audio_chunk.hpp"

#include <stdexcept>
#include <string>

// Capture failed for this chunk only (device busy, timeout)
class CaptureError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The capture device itself is gone; ends the session
class DeviceLostError : public CaptureError {
public:
    using CaptureError::CaptureError;
};

class AudioSource {
public:
    virtual ~AudioSource() = default;

    // Blocks for up to `seconds` and returns the captured audio in the
    // source's native rate and channel layout. An empty chunk means nothing
    // was captured (cancelled or zero-length) and is not an error.
    virtual AudioChunk capture(double seconds) = 0;

    // True once the source can never produce audio again
    virtual bool exhausted() const { return false; }

    virtual std::string describe() const = 0;
};

#endif
