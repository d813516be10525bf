#include "cli/config_menu.hpp"

#include <algorithm>
#include <string>

namespace {
template <typename T>
int index_of(const std::vector<T>& values, T value, int fallback) {
    const auto it = std::find(values.begin(), values.end(), value);
    return it == values.end() ? fallback : (int)(it - values.begin());
}
} // namespace

// Constructor
ConfigMenu::ConfigMenu(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

bool ConfigMenu::run(SessionConfig& config) {
    const SessionConfig initial = config;

    Step step = Step::Preset;
    while (step != Step::Start && step != Step::Cancel) {
        switch (step) {
            case Step::Preset:
                config = initial;
                welcome();
                step = preset(config);
                break;
            case Step::ModelVariant: step = modelVariant(config); break;
            case Step::AudioProcessing: step = audioProcessing(config); break;
            case Step::Advanced: step = advanced(config); break;
            case Step::Confirm: step = confirm(config); break;
            default: step = Step::Cancel; break;
        }
    }

    if (step == Step::Cancel) {
        out_ << "\nConfiguration cancelled.\n";
        return false;
    }
    return true;
}

void ConfigMenu::welcome() {
    const std::string rule(70, '=');
    out_ << "\n" << rule << "\n"
         << "  PITRANSCRIBE - CONTINUOUS VOICE TRANSCRIPTION\n"
         << "  Overlapping chunks, energy gate, repetition and overlap filtering\n"
         << rule << "\n\n";
}

ConfigMenu::Step ConfigMenu::preset(SessionConfig& config) {
    const int choice = choose("Select Configuration Preset:",
                              {"Fastest (tiny model) [Recommended for Pi 5]",
                               "Balanced (base model)",
                               "Custom (configure all options)"},
                              1);
    switch (choice) {
        case 0: config.modelVariant = "tiny"; return Step::Confirm;
        case 1: config.modelVariant = "base"; return Step::Confirm;
        case 2: return Step::ModelVariant;
        default: return Step::Cancel;
    }
}

ConfigMenu::Step ConfigMenu::modelVariant(SessionConfig& config) {
    const std::vector<std::string> variants = {"tiny", "base"};
    const int choice = choose("Select Whisper Model Variant:",
                              {"tiny (fastest, 39M parameters)",
                               "base (balanced, 74M parameters)"},
                              index_of(variants, config.modelVariant, 1));
    if (choice < 0) return Step::Cancel;

    config.modelVariant = variants[choice];
    return Step::AudioProcessing;
}

ConfigMenu::Step ConfigMenu::audioProcessing(SessionConfig& config) {
    const std::vector<int> chunks = {3, 5, 7, 10, 15};
    int choice = choose("Select Chunk Duration:",
                        {"3 seconds (low latency, less context)",
                         "5 seconds",
                         "7 seconds (good context)",
                         "10 seconds (more context)",
                         "15 seconds (most context, high latency)"},
                        index_of(chunks, config.chunkSeconds, 2));
    if (choice < 0) return Step::Cancel;
    config.chunkSeconds = chunks[choice];

    // Overlap has to stay shorter than the chunk
    std::vector<int> overlaps;
    std::vector<std::string> overlapLabels;
    for (int s : {1, 2, 3}) {
        if (s >= config.chunkSeconds) continue;
        overlaps.push_back(s);
        overlapLabels.push_back(std::to_string(s) + (s == 1 ? " second" : " seconds"));
    }
    choice = choose("Select Overlap Duration:", overlapLabels,
                    index_of(overlaps, config.overlapSeconds, (int)overlaps.size() / 2));
    if (choice < 0) return Step::Cancel;
    config.overlapSeconds = overlaps[choice];

    const std::vector<float> gains = {10.0f, 20.0f, 30.0f, 40.0f, 50.0f};
    choice = choose("Select Microphone Gain:",
                    {"10x (low gain)", "20x", "30x (balanced)", "40x", "50x (maximum gain)"},
                    index_of(gains, config.gain, 2));
    if (choice < 0) return Step::Cancel;
    config.gain = gains[choice];

    return Step::Advanced;
}

ConfigMenu::Step ConfigMenu::advanced(SessionConfig& config) {
    int choice = choose("Configure Advanced Settings?",
                        {"Yes (energy threshold)", "No (use defaults)"}, 1);
    if (choice < 0) return Step::Cancel;
    if (choice == 1) return Step::Confirm;

    const std::vector<float> thresholds = {0.0001f, 0.0002f, 0.0005f, 0.001f};
    choice = choose("Select Minimum Audio Energy Threshold:",
                    {"0.0001 (very sensitive)", "0.0002 (balanced)", "0.0005 (moderate)", "0.001 (strict)"},
                    index_of(thresholds, config.minAudioEnergy, 1));
    if (choice < 0) return Step::Cancel;
    config.minAudioEnergy = thresholds[choice];

    return Step::Confirm;
}

ConfigMenu::Step ConfigMenu::confirm(const SessionConfig& config) {
    print_summary(config, out_);

    const int choice = choose("Start transcription with these settings?",
                              {"Yes, start transcription", "No, reconfigure", "Cancel"}, 0);
    switch (choice) {
        case 0: return Step::Start;
        case 1: return Step::Preset;
        default: return Step::Cancel;
    }
}

int ConfigMenu::choose(const std::string& title, const std::vector<std::string>& options, int current) {
    out_ << title << "\n";
    for (size_t i = 0; i < options.size(); ++i) {
        out_ << ((int)i == current ? "  -> " : "     ") << (i + 1) << ") " << options[i] << "\n";
    }

    std::string line;
    while (true) {
        out_ << "Choice [" << (current + 1) << "]: " << std::flush;
        if (!std::getline(in_, line)) {
            out_ << "\n";
            return -1;
        }

        line.erase(0, line.find_first_not_of(" \t\r"));
        line.erase(line.find_last_not_of(" \t\r") + 1);
        if (line.empty()) return current;

        if (line.find_first_not_of("0123456789") == std::string::npos && line.size() < 4) {
            const int n = std::stoi(line);
            if (n >= 1 && n <= (int)options.size()) {
                out_ << "\n";
                return n - 1;
            }
        }
        out_ << "Invalid choice, enter 1-" << options.size() << ".\n";
    }
}
