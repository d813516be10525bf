#include "stt/model_locator.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

std::vector<std::string> default_model_dirs() {
    std::vector<std::string> dirs = {".", "models", "models/whisper"};

    if (const char* home = std::getenv("HOME")) {
        dirs.push_back(std::string(home) + "/.cache/whisper");
        dirs.push_back(std::string(home) + "/whisper.cpp/models");
    }

    dirs.push_back("/usr/share/whisper/models");
    dirs.push_back("/usr/local/share/whisper/models");
    return dirs;
}

static bool matches_variant(const std::string& name, const std::string& variant) {
    const std::string prefix = "ggml-" + variant;
    const std::string suffix = ".bin";
    if (name.size() < prefix.size() + suffix.size()) return false;
    if (name.compare(0, prefix.size(), prefix) != 0) return false;
    if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) return false;

    // "ggml-base.en.bin" and "ggml-base-q5_1.bin" match "base", "ggml-base2.bin" does not
    const char next = name[prefix.size()];
    return next == '.' || next == '-' || next == '_';
}

std::string find_model(const std::string& variant, const std::vector<std::string>& dirs) {
    for (const std::string& dir : dirs) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) continue;

        std::vector<std::string> found;
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_regular_file(ec)) continue;
            const std::string name = it->path().filename().string();
            if (matches_variant(name, variant)) found.push_back(it->path().string());
        }

        if (!found.empty()) {
            std::sort(found.begin(), found.end());
            return found.front();
        }
    }

    std::ostringstream msg;
    msg << "Whisper model not found: ggml-" << variant << "*.bin\n"
        << "Searched in:\n";
    for (const std::string& dir : dirs) msg << "  - " << dir << "\n";
    msg << "Download one with whisper.cpp's models/download-ggml-model.sh " << variant << ".en\n"
        << "and place it in one of the directories above, or pass -m <file>.";
    throw ModelNotFoundError(msg.str());
}
