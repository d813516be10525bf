#ifndef WAV_FILE_HPP
#define WAV_FILE_HPP

#include "audio/audio_chunk.hpp"

#include <ostream>
#include <string>

// 16-bit PCM, any rate and channel count. Throws std::runtime_error on failure.
void write_wav(const std::string& path, const AudioChunk& chunk);

// Reads 16-bit PCM or 32-bit float WAV. Throws std::runtime_error on failure.
AudioChunk read_wav(const std::string& path);

// Owns one transient file path and removes the file when it goes out of scope
class WorkingFile {
public:
    WorkingFile() = default;
    WorkingFile(std::string path, std::ostream& log);
    ~WorkingFile();

    WorkingFile(const WorkingFile&) = delete;
    WorkingFile& operator=(const WorkingFile&) = delete;

    WorkingFile(WorkingFile&& other) noexcept;
    WorkingFile& operator=(WorkingFile&& other) noexcept;

    const std::string& path() const { return path_; }
    bool active() const { return !path_.empty(); }

    void remove();

private:
    std::string path_;
    std::ostream* log_ = nullptr;
};

#endif
