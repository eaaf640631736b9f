#include "wake/porcupine_wake_word.hpp"
#include "config/configuration_error.hpp"

#include <pv_porcupine.h>
#include <stdexcept>

// Constructor
PorcupineWakeWord::PorcupineWakeWord(const Config& config) {
    if (config.keywordPaths.empty()) throw ConfigurationError("At least one wake keyword file is required");
    if (config.accessKey.empty()) throw ConfigurationError("Porcupine access key is missing (set wake.access_key or PV_ACCESS_KEY)");

    std::vector<const char*> paths;
    std::vector<float> sensitivities;
    for (size_t i = 0; i < config.keywordPaths.size(); ++i) {
        paths.push_back(config.keywordPaths[i].c_str());
        sensitivities.push_back(i < config.sensitivities.size() ? config.sensitivities[i] : 0.5f);
    }

    const pv_status_t status = pv_porcupine_init(config.accessKey.c_str(), config.modelPath.c_str(),
                                                 (int32_t)paths.size(), paths.data(),
                                                 sensitivities.data(), &porcupine_);
    if (status != PV_STATUS_SUCCESS) {
        throw std::runtime_error(std::string("pv_porcupine_init failed: ") + pv_status_to_string(status));
    }
}

// Destructor
PorcupineWakeWord::~PorcupineWakeWord() {
    if (porcupine_) pv_porcupine_delete(porcupine_);
}

int PorcupineWakeWord::frameLength() const {
    return (int)pv_porcupine_frame_length();
}

int PorcupineWakeWord::sampleRate() const {
    return (int)pv_sample_rate();
}

int PorcupineWakeWord::process(const int16_t* frame) {
    int32_t index = -1;
    const pv_status_t status = pv_porcupine_process(porcupine_, frame, &index);
    if (status != PV_STATUS_SUCCESS) {
        throw std::runtime_error(std::string("pv_porcupine_process failed: ") + pv_status_to_string(status));
    }
    return (int)index;
}
