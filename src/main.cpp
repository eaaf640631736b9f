#include "headers.hpp"

#include <nlohmann/json.hpp>

#include <getopt.h>
#include <csignal>
#include <iostream>
#include <memory>

static volatile std::sig_atomic_t g_stop = 0;

extern "C" void on_signal(int) { g_stop = 1; }

static void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [options]\n"
              << "  -c, --config <file>   JSON configuration (default: built-in defaults)\n"
              << "  -v, --verbose         print recording event timelines and intent replies\n"
              << "  -h, --help            show this help\n";
}

int main(int argc, char* argv[]) {
    std::string configPath;
    bool verbose = false;

    static struct option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "c:vh", long_opts, nullptr)) != -1) {
        switch (opt) {
            case 'c': configPath = optarg; break;
            case 'v': verbose = true; break;
            case 'h': usage(argv[0]); return 0;
            default: usage(argv[0]); return 2;
        }
    }

    AppConfig config;
    try {
        config = configPath.empty() ? parseConfig(nlohmann::json::object()) : loadConfig(configPath);
    } catch (const ConfigurationError& e) {
        std::cerr << "[Config] [ERROR] " << e.what() << std::endl;
        return 1;
    }
    if (verbose) config.verbose = true;

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    try {
        CurlGlobal curl;
        PortAudioSystem portaudio;

        PorcupineWakeWord wake(config.wake.porcupine);
        if (wake.sampleRate() != config.recorder.sampleRate) {
            throw ConfigurationError("Wake word engine needs " + std::to_string(wake.sampleRate()) +
                                     " Hz audio (recorder.sample_rate is " + std::to_string(config.recorder.sampleRate) + ")");
        }

        std::unique_ptr<FvadDetector> vad;
        if (SilenceDetector::methodUsesVad(config.recorder.silence.method)) {
            vad.reset(new FvadDetector(config.recorder.vadMode, config.recorder.sampleRate));
        }
        RecordingSession session(config.recorder, vad.get(), std::cout);

        std::unique_ptr<WhisperSTT> whisper;
        if (config.stt.backend == "whisper") {
            whisper.reset(new WhisperSTT(config.stt.whisperModel, config.stt.language));
        }

        ServiceClient service(config.service);
        FeedbackPlayer feedback(config.feedback.wakeSound, config.feedback.intentSound, std::cout);
        Microphone mic(config.microphone, std::cout);

        Assistant assistant(config, mic, wake, session, service, whisper.get(), feedback, std::cout);

        std::cout << "\nListening for the wake word... Press Ctrl+C to quit." << std::endl;
        assistant.run(g_stop);
    } catch (const ConfigurationError& e) {
        std::cerr << "[Config] [ERROR] " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[voicecmd] [ERROR] " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Exit!" << std::endl;
    return 0;
}
