#include "audio/wav_file.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

namespace {
struct WavFormat {
    uint16_t audioFormat; // 1=PCM, 3=float
    uint16_t numChannels;
    uint32_t sampleRate;
    uint32_t byteRate;
    uint16_t blockAlign;
    uint16_t bitsPerSample;
};

template <typename T>
void put(std::ofstream& f, T value) {
    f.write(reinterpret_cast<const char*>(&value), sizeof(value));
}
} // namespace

void write_wav(const std::string& path, const AudioChunk& chunk) {
    std::ofstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open WAV for writing: " + path);

    const uint16_t channels = (uint16_t)std::max(1, chunk.channels);
    const uint32_t dataSize = (uint32_t)(chunk.samples.size() * sizeof(int16_t));

    f.write("RIFF", 4);
    put<uint32_t>(f, 36 + dataSize);
    f.write("WAVE", 4);
    f.write("fmt ", 4);
    put<uint32_t>(f, 16);
    put<uint16_t>(f, 1);
    put<uint16_t>(f, channels);
    put<uint32_t>(f, (uint32_t)chunk.sampleRate);
    put<uint32_t>(f, (uint32_t)chunk.sampleRate * channels * 2);
    put<uint16_t>(f, (uint16_t)(channels * 2));
    put<uint16_t>(f, 16);
    f.write("data", 4);
    put<uint32_t>(f, dataSize);

    std::vector<int16_t> pcm(chunk.samples.size());
    for (size_t i = 0; i < pcm.size(); ++i) {
        const float v = std::clamp(chunk.samples[i], -1.0f, 1.0f);
        pcm[i] = (int16_t)std::lrint(v * 32767.0f);
    }
    f.write(reinterpret_cast<const char*>(pcm.data()), (std::streamsize)dataSize);

    if (!f) throw std::runtime_error("short write to WAV: " + path);
}

AudioChunk read_wav(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open WAV: " + path);

    char riff[4];
    uint32_t riffSize = 0;
    char wave[4];
    if (!f.read(riff, 4) || !f.read(reinterpret_cast<char*>(&riffSize), 4) || !f.read(wave, 4)) {
        throw std::runtime_error("truncated WAV header: " + path);
    }
    if (std::strncmp(riff, "RIFF", 4) != 0 || std::strncmp(wave, "WAVE", 4) != 0) {
        throw std::runtime_error("not a RIFF/WAVE file: " + path);
    }

    // Chunks may come in any order; "fmt " has to precede "data"
    WavFormat fmt{};
    bool haveFmt = false;
    char chunkId[4];
    uint32_t chunkSize = 0;
    bool found = false;
    while (f.read(chunkId, 4)) {
        if (!f.read(reinterpret_cast<char*>(&chunkSize), 4)) break;
        if (std::strncmp(chunkId, "data", 4) == 0) {
            found = true;
            break;
        }
        if (std::strncmp(chunkId, "fmt ", 4) == 0 && chunkSize >= sizeof(WavFormat)) {
            if (!f.read(reinterpret_cast<char*>(&fmt), sizeof(fmt))) break;
            haveFmt = true;
            chunkSize -= (uint32_t)sizeof(fmt);
        }
        // Chunk bodies are padded to an even length
        f.seekg((std::streamoff)chunkSize + (chunkSize & 1u), std::ios::cur);
    }
    if (!haveFmt) throw std::runtime_error("WAV has no fmt chunk: " + path);
    if (!found) throw std::runtime_error("WAV has no data chunk: " + path);

    AudioChunk chunk;
    chunk.sampleRate = (int)fmt.sampleRate;
    chunk.channels = std::max<int>(1, fmt.numChannels);

    if (fmt.audioFormat == 1 && fmt.bitsPerSample == 16) {
        std::vector<int16_t> buf(chunkSize / sizeof(int16_t));
        f.read(reinterpret_cast<char*>(buf.data()), (std::streamsize)(buf.size() * sizeof(int16_t)));
        buf.resize((size_t)f.gcount() / sizeof(int16_t));
        chunk.samples.resize(buf.size());
        for (size_t i = 0; i < buf.size(); ++i) chunk.samples[i] = (float)buf[i] / 32768.0f;
    } else if (fmt.audioFormat == 3 && fmt.bitsPerSample == 32) {
        chunk.samples.resize(chunkSize / sizeof(float));
        f.read(reinterpret_cast<char*>(chunk.samples.data()), (std::streamsize)(chunk.samples.size() * sizeof(float)));
        chunk.samples.resize((size_t)f.gcount() / sizeof(float));
    } else {
        throw std::runtime_error("unsupported WAV encoding (need 16-bit PCM or 32-bit float): " + path);
    }

    // Drop a trailing partial frame
    chunk.samples.resize((size_t)chunk.frames() * chunk.channels);
    return chunk;
}

// Constructor
WorkingFile::WorkingFile(std::string path, std::ostream& log) : path_(std::move(path)), log_(&log) {}

// Destructor
WorkingFile::~WorkingFile() { remove(); }

WorkingFile::WorkingFile(WorkingFile&& other) noexcept
    : path_(std::move(other.path_)), log_(other.log_) {
    other.path_.clear();
}

WorkingFile& WorkingFile::operator=(WorkingFile&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        log_ = other.log_;
        other.path_.clear();
    }
    return *this;
}

// Deletes the file now; a file that was never written is not an error
void WorkingFile::remove() {
    if (path_.empty()) return;

    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec && log_) *log_ << "[Working File] [WARN] could not remove " << path_ << ": " << ec.message() << "\n";
    path_.clear();
}
