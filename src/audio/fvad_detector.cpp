#include "audio/fvad_detector.hpp"
#include "config/configuration_error.hpp"

#include <fvad.h>
#include <stdexcept>
#include <string>

// Constructor
FvadDetector::FvadDetector(int mode, int sampleRate) {
    vad_ = fvad_new();
    if (!vad_) throw std::runtime_error("Failed to create fvad instance");

    if (fvad_set_mode(vad_, mode) != 0) {
        fvad_free(vad_);
        throw ConfigurationError("Failed to set VAD mode " + std::to_string(mode));
    }

    try {
        setSampleRate(sampleRate);
    } catch (const std::exception&) {
        fvad_free(vad_);
        throw;
    }
}

// Destructor
FvadDetector::~FvadDetector() {
    if (vad_) fvad_free(vad_);
}

void FvadDetector::setSampleRate(int sampleRate) {
    if (fvad_set_sample_rate(vad_, sampleRate) != 0) {
        throw ConfigurationError("VAD does not support sample rate " + std::to_string(sampleRate));
    }
    sampleRate_ = sampleRate;
}

bool FvadDetector::isSpeech(const int16_t* samples, size_t count, int sampleRate) {
    if (sampleRate != sampleRate_) setSampleRate(sampleRate);

    const int rc = fvad_process(vad_, samples, count);
    if (rc < 0) {
        throw std::runtime_error("fvad_process failed for a frame of " + std::to_string(count) + " samples");
    }
    return rc == 1;
}
