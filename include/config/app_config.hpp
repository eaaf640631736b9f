#ifndef APP_CONFIG_HPP
#define APP_CONFIG_HPP

#include "audio/command_recorder.hpp"
#include "audio/microphone.hpp"
#include "net/service_client.hpp"
#include "wake/porcupine_wake_word.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

struct AppConfig {
    Microphone::Config microphone;
    CommandRecorder::Config recorder;

    struct Wake {
        PorcupineWakeWord::Config porcupine;
        std::vector<std::string> keywords; // display names, same order as keyword paths
    } wake;

    ServiceClient::Config service;

    struct Transcription {
        std::string backend = "remote"; // "remote" or "whisper"
        std::string whisperModel = "models/whisper/ggml-base.en-q5_1.bin";
        std::string language = "en";
        int threads = 4;
    } stt;

    struct Feedback {
        std::string wakeSound;
        std::string intentSound;
    } feedback;

    bool verbose = false;

    // Name of keyword `index` for logs
    std::string keywordName(int index) const;
};

// Every key is optional. Throws ConfigurationError on unknown enum values,
// wrong JSON types, or a configuration the recorder would reject.
AppConfig parseConfig(const nlohmann::json& root);

AppConfig loadConfig(const std::string& path);

#endif
