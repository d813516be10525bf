#include "headers.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {
struct Options {
    SessionConfig session;
    WhisperSTT::Config stt;
    PortAudioSource::Config audio;

    std::string inputFile;
    bool listDevices = false;
    bool skipMenu = false;
    bool verbose = false;
};

void print_usage(const char* argv0) {
    const SessionConfig d;
    std::fprintf(stderr, "\n");
    std::fprintf(stderr, "usage: %s [options]\n", argv0);
    std::fprintf(stderr, "\n");
    std::fprintf(stderr, "options:\n");
    std::fprintf(stderr, "  -h,       --help          show this help message and exit\n");
    std::fprintf(stderr, "  -m FILE,  --model FILE    whisper.cpp model (default: search for ggml-<variant>*.bin)\n");
    std::fprintf(stderr, "  -d N,     --device N      PortAudio input device index (default: system default)\n");
    std::fprintf(stderr, "  -i FILE,  --input FILE    transcribe a WAV file instead of the microphone\n");
    std::fprintf(stderr, "  -t N,     --threads N     inference threads (default: 4)\n");
    std::fprintf(stderr, "            --gpu           offload inference to the GPU\n");
    std::fprintf(stderr, "            --timeout MS    per-chunk transcription timeout (default: none)\n");
    std::fprintf(stderr, "            --gate any|all  energy gate policy (default: %s)\n", gate_policy_name(d.gatePolicy));
    std::fprintf(stderr, "            --work-dir DIR  stage each chunk's audio in DIR while it is processed\n");
    std::fprintf(stderr, "            --list-devices  list input devices and exit\n");
    std::fprintf(stderr, "  -y,       --yes           skip the configuration menus\n");
    std::fprintf(stderr, "  -v,       --verbose       log skipped chunks and transcriber errors to stderr\n");
    std::fprintf(stderr, "\n");
}

// Throws std::invalid_argument on a bad or missing value
bool parse_args(int argc, char** argv, Options& opt) {
    auto value = [&](int& i) -> std::string {
        if (i + 1 >= argc) throw std::invalid_argument(std::string("missing value for ") + argv[i]);
        return argv[++i];
    };

    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return false;
        }
        else if (arg == "-m" || arg == "--model")   { opt.session.modelPath = value(i); }
        else if (arg == "-d" || arg == "--device")  { opt.audio.device      = std::stoi(value(i)); }
        else if (arg == "-i" || arg == "--input")   { opt.inputFile         = value(i); }
        else if (arg == "-t" || arg == "--threads") { opt.stt.threads       = std::stoi(value(i)); }
        else if (               arg == "--gpu")     { opt.stt.useGpu        = true; }
        else if (               arg == "--timeout") { opt.stt.timeoutMs     = std::stoi(value(i)); }
        else if (               arg == "--work-dir"){ opt.session.workDir   = value(i); }
        else if (arg == "--list-devices")           { opt.listDevices       = true; }
        else if (arg == "-y" || arg == "--yes")     { opt.skipMenu          = true; }
        else if (arg == "-v" || arg == "--verbose") { opt.verbose           = true; }
        else if (arg == "--gate") {
            const std::string g = value(i);
            if (g == "any") opt.session.gatePolicy = GatePolicy::AnyOf;
            else if (g == "all") opt.session.gatePolicy = GatePolicy::AllOf;
            else throw std::invalid_argument("--gate expects 'any' or 'all', got '" + g + "'");
        }
        else {
            throw std::invalid_argument("unknown argument: " + arg);
        }
    }
    return true;
}

int list_devices() {
    const auto devices = PortAudioSource::listInputDevices();
    if (devices.empty()) {
        std::cout << "No input devices found." << std::endl;
        return 0;
    }
    std::cout << "Input devices:" << std::endl;
    for (const auto& d : devices) {
        std::cout << (d.isDefault ? "* " : "  ") << d.index << ": " << d.name
                  << " (" << d.maxInputChannels << " ch, " << d.defaultSampleRate << " Hz)\n";
    }
    return 0;
}

void print_banner(const std::string& title) {
    const std::string rule(70, '=');
    std::cout << "\n" << rule << "\n  " << title << "\n" << rule << "\n\n";
}
} // namespace

int main(int argc, char** argv) {
    Options opt;
    try {
        if (!parse_args(argc, argv, opt)) return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        if (opt.listDevices) return list_devices();
    } catch (const std::exception& e) {
        std::cerr << "[Audio] [ERROR] " << e.what() << std::endl;
        return 1;
    }

    if (!opt.skipMenu) {
        ConfigMenu menu(std::cin, std::cout);
        if (!menu.run(opt.session)) return 0;
    }

    try {
        opt.session.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "[Config] [ERROR] " << e.what() << std::endl;
        return 1;
    }

    print_banner("LOADING MODEL");

    // Model path resolution
    if (opt.session.modelPath.empty()) {
        try {
            opt.session.modelPath = find_model(opt.session.modelVariant, default_model_dirs());
        } catch (const ModelNotFoundError& e) {
            std::cerr << "[Model] [ERROR] " << e.what() << std::endl;
            return 1;
        }
    } else if (!std::filesystem::is_regular_file(opt.session.modelPath)) {
        std::cerr << "[Model] [ERROR] Model file not found: " << opt.session.modelPath << std::endl;
        return 1;
    }
    std::cout << "Model: " << opt.session.modelPath << std::endl;

    // STT model init
    std::unique_ptr<WhisperSTT> stt;
    try {
        opt.stt.modelPath = opt.session.modelPath;
        stt = std::make_unique<WhisperSTT>(opt.stt);
    } catch (const std::exception& e) {
        std::cerr << "[Whisper STT] [ERROR] " << e.what() << "\n"
                  << "Check that the file is a ggml whisper.cpp model and is not truncated." << std::endl;
        return 1;
    }

    InterruptGuard interrupt;

    // Audio source init
    std::unique_ptr<AudioSource> source;
    try {
        if (!opt.inputFile.empty()) {
            source = std::make_unique<WavFileSource>(opt.inputFile);
        } else {
            auto mic = std::make_unique<PortAudioSource>(opt.audio, interrupt.flag());
            std::cout << "Testing audio recording on " << mic->describe() << "..." << std::endl;
            mic->selfTest();
            source = std::move(mic);
        }
    } catch (const std::exception& e) {
        std::cerr << "[Audio] [ERROR] " << e.what() << "\n"
                  << "Troubleshooting:\n"
                  << "  1. List capture devices: " << argv[0] << " --list-devices\n"
                  << "  2. Check the microphone with: arecord -l\n"
                  << "  3. Pick a device explicitly with -d <index>" << std::endl;
        return 1;
    }
    if (interrupt.requested()) return 0;

    std::ostream nullLog(nullptr);
    std::ostream& log = opt.verbose ? std::cerr : nullLog;

    TranscriptionSession session(opt.session, *source, *stt, interrupt.flag(), std::cout, log);

    print_banner("TRANSCRIPTION ACTIVE");
    std::cout << "Source: " << source->describe() << "\n"
              << "Backend: " << stt->describe() << "\n\n"
              << "Ready! Speak naturally - transcription will flow continuously.\n"
              << "Press Ctrl+C to stop\n"
              << std::string(70, '-') << "\n" << std::endl;

    int rc = 0;
    SessionStats stats;
    try {
        stats = session.run();
    } catch (const DeviceLostError& e) {
        stats = session.stats();
        std::cerr << "\n[Audio] [ERROR] Capture device lost: " << e.what() << std::endl;
        rc = 1;
    } catch (const std::exception& e) {
        stats = session.stats();
        std::cerr << "\n[Session] [ERROR] " << e.what() << std::endl;
        rc = 1;
    }

    print_stats(stats, stt->describe(), std::cout);
    return rc;
}
