#include "config/app_config.hpp"
#include "config/configuration_error.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>

namespace {

using nlohmann::json;

// Copies root[key] into out if present
template <typename T>
void read(const json& root, const char* key, T& out) {
    if (!root.contains(key) || root[key].is_null()) return;
    try {
        out = root[key].get<T>();
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Config key \"") + key + "\": " + e.what());
    }
}

const json& section(const json& root, const char* key) {
    static const json empty = json::object();
    if (!root.contains(key)) return empty;
    if (!root[key].is_object()) throw ConfigurationError(std::string("Config section \"") + key + "\" must be an object");
    return root[key];
}

void readSilence(const json& node, SilenceDetector::Config& silence) {
    std::string method = toString(silence.method);
    read(node, "method", method);
    if (!parseSilenceMethod(method, silence.method)) {
        throw ConfigurationError("Unknown silence method: " + method);
    }

    read(node, "max_energy", silence.maxEnergy);
    read(node, "max_current_ratio_threshold", silence.maxCurrentRatioThreshold);
    read(node, "current_energy_threshold", silence.currentEnergyThreshold);
    read(node, "persist_max_energy", silence.persistMaxEnergy);
}

} // namespace

std::string AppConfig::keywordName(int index) const {
    if (index >= 0 && index < (int)wake.keywords.size()) return wake.keywords[(size_t)index];
    if (index >= 0 && index < (int)wake.porcupine.keywordPaths.size()) return wake.porcupine.keywordPaths[(size_t)index];
    return "keyword " + std::to_string(index);
}

AppConfig parseConfig(const json& root) {
    if (!root.is_object()) throw ConfigurationError("Config root must be an object");

    AppConfig config;

    const json& mic = section(root, "microphone");
    read(mic, "device_index", config.microphone.deviceIndex);
    read(mic, "frames_per_buffer", config.microphone.framesPerBuffer);

    CommandRecorder::Config& rec = config.recorder;
    const json& recorder = section(root, "recorder");
    read(recorder, "sample_rate", rec.sampleRate);
    read(recorder, "sample_width", rec.sampleWidth);
    read(recorder, "channels", rec.channels);
    read(recorder, "chunk_size", rec.chunkSize);
    read(recorder, "vad_mode", rec.vadMode);
    read(recorder, "max_timeout", rec.maxTimeout);
    read(recorder, "skip_seconds", rec.skipSeconds);
    read(recorder, "min_seconds", rec.minSeconds);
    read(recorder, "max_seconds", rec.maxSeconds);
    read(recorder, "speech_seconds", rec.speechSeconds);
    read(recorder, "silence_seconds", rec.silenceSeconds);
    read(recorder, "before_seconds", rec.beforeSeconds);
    readSilence(section(recorder, "silence"), rec.silence);
    rec.validate();

    // One stream serves both the wake word and the recorder
    config.microphone.sampleRate = rec.sampleRate;

    const json& wake = section(root, "wake");
    read(wake, "access_key", config.wake.porcupine.accessKey);
    read(wake, "model_path", config.wake.porcupine.modelPath);
    read(wake, "keyword_paths", config.wake.porcupine.keywordPaths);
    read(wake, "sensitivities", config.wake.porcupine.sensitivities);
    read(wake, "keywords", config.wake.keywords);
    if (config.wake.porcupine.accessKey.empty()) {
        const char* key = std::getenv("PV_ACCESS_KEY");
        if (key) config.wake.porcupine.accessKey = key;
    }

    const json& service = section(root, "service");
    read(service, "site_id", config.service.siteId);
    read(service, "asr_url", config.service.asrUrl);
    read(service, "nlu_url", config.service.nluUrl);
    read(service, "timeout_seconds", config.service.timeoutSeconds);
    if (config.service.timeoutSeconds <= 0) throw ConfigurationError("service.timeout_seconds must be positive");

    const json& stt = section(root, "stt");
    read(stt, "backend", config.stt.backend);
    read(stt, "whisper_model", config.stt.whisperModel);
    read(stt, "language", config.stt.language);
    read(stt, "threads", config.stt.threads);
    if (config.stt.backend != "remote" && config.stt.backend != "whisper") {
        throw ConfigurationError("Unknown stt backend: " + config.stt.backend);
    }
    if (config.stt.backend == "whisper" && rec.sampleRate != 16000) {
        throw ConfigurationError("The whisper backend needs 16000 Hz audio (got " + std::to_string(rec.sampleRate) + ")");
    }

    const json& feedback = section(root, "feedback");
    read(feedback, "wake_sound", config.feedback.wakeSound);
    read(feedback, "intent_sound", config.feedback.intentSound);

    read(root, "verbose", config.verbose);
    return config;
}

AppConfig loadConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigurationError("Cannot open config file " + path);

    json root;
    try {
        in >> root;
    } catch (const json::parse_error& e) {
        throw ConfigurationError("Invalid JSON in " + path + ": " + e.what());
    }
    return parseConfig(root);
}
