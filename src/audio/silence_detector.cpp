#include "audio/silence_detector.hpp"
#include "config/configuration_error.hpp"

#include <algorithm>
#include <cmath>

namespace {

int16_t sampleAt(const uint8_t* data, size_t i) {
    return (int16_t)(uint16_t)(data[2 * i] | (data[2 * i + 1] << 8));
}

// Truncated integer RMS over 16-bit samples
int rms16(const uint8_t* data, size_t bytes) {
    const size_t n = bytes / 2;
    if (n == 0) return 0;

    double acc = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double v = sampleAt(data, i);
        acc += v * v;
    }
    return (int)std::sqrt(acc / (double)n);
}

} // namespace

const char* toString(SilenceMethod method) {
    switch (method) {
        case SilenceMethod::VadOnly: return "vad_only";
        case SilenceMethod::RatioOnly: return "ratio_only";
        case SilenceMethod::CurrentOnly: return "current_only";
        case SilenceMethod::VadAndRatio: return "vad_and_ratio";
        case SilenceMethod::VadAndCurrent: return "vad_and_current";
        case SilenceMethod::All: return "all";
    }
    return "unknown";
}

bool parseSilenceMethod(const std::string& name, SilenceMethod& method) {
    static const SilenceMethod kMethods[] = {
        SilenceMethod::VadOnly, SilenceMethod::RatioOnly, SilenceMethod::CurrentOnly,
        SilenceMethod::VadAndRatio, SilenceMethod::VadAndCurrent, SilenceMethod::All,
    };
    for (SilenceMethod m : kMethods) {
        if (name == toString(m)) {
            method = m;
            return true;
        }
    }
    return false;
}

bool SilenceDetector::methodUsesVad(SilenceMethod m) {
    return m == SilenceMethod::VadOnly || m == SilenceMethod::VadAndRatio ||
           m == SilenceMethod::VadAndCurrent || m == SilenceMethod::All;
}

bool SilenceDetector::methodUsesRatio(SilenceMethod m) {
    return m == SilenceMethod::RatioOnly || m == SilenceMethod::VadAndRatio || m == SilenceMethod::All;
}

bool SilenceDetector::methodUsesCurrent(SilenceMethod m) {
    return m == SilenceMethod::CurrentOnly || m == SilenceMethod::VadAndCurrent || m == SilenceMethod::All;
}

void SilenceDetector::validate(const Config& config) {
    if (methodUsesRatio(config.method) && config.maxCurrentRatioThreshold < 0.0) {
        throw ConfigurationError("Max/current ratio threshold is required");
    }
    if (methodUsesCurrent(config.method) && config.currentEnergyThreshold < 0.0) {
        throw ConfigurationError("Current energy threshold is required");
    }
}

// Constructor
SilenceDetector::SilenceDetector(Config config, int sampleRate, VoiceActivityDetector* vad)
    : config_(config), sampleRate_(sampleRate), vad_(vad) {
    validate(config_);

    useVad_ = methodUsesVad(config_.method);
    useRatio_ = methodUsesRatio(config_.method);
    useCurrent_ = methodUsesCurrent(config_.method);

    if (useVad_ && !vad_) {
        throw ConfigurationError(std::string("Silence method ") + toString(config_.method) +
                                 " requires a voice activity detector");
    }

    dynamicMaxEnergy_ = config_.maxEnergy < 0.0;
    hasMaxEnergy_ = false;
    reset();
}

// Restores the configured energy ceiling unless calibration is kept across sessions
void SilenceDetector::reset() {
    if (!dynamicMaxEnergy_) {
        hasMaxEnergy_ = true;
        maxEnergy_ = config_.maxEnergy;
    } else if (!config_.persistMaxEnergy) {
        hasMaxEnergy_ = false;
        maxEnergy_ = 0.0;
    }
}

// RMS of the chunk after removing its DC bias
int SilenceDetector::debiasedEnergy(const uint8_t* chunk, size_t bytes) {
    const size_t n = bytes / 2;
    if (n == 0) return 0;

    // -rms packed as a little-endian 16-bit sample, then added with saturation
    const int16_t bias = (int16_t)(uint16_t)((-rms16(chunk, bytes)) & 0xFFFF);

    double acc = 0.0;
    for (size_t i = 0; i < n; ++i) {
        int v = (int)sampleAt(chunk, i) + (int)bias;
        v = std::min(32767, std::max(-32768, v));
        acc += (double)v * (double)v;
    }
    return (int)std::sqrt(acc / (double)n);
}

bool SilenceDetector::isSilence(const uint8_t* chunk, size_t bytes) {
    bool allSilence = true;

    if (useVad_) {
        const size_t n = bytes / 2;
        samples_.resize(n);
        for (size_t i = 0; i < n; ++i) samples_[i] = sampleAt(chunk, i);
        allSilence = allSilence && !vad_->isSpeech(samples_.data(), n, sampleRate_);
    }

    if (useRatio_ || useCurrent_) {
        const double energy = debiasedEnergy(chunk, bytes);

        if (useRatio_) {
            if (dynamicMaxEnergy_) {
                if (!hasMaxEnergy_) {
                    maxEnergy_ = energy;
                    hasMaxEnergy_ = true;
                } else {
                    maxEnergy_ = std::max(maxEnergy_, energy);
                }
            }

            // Zero energy gives ratio 0, which never counts as silence.
            const double ratio = energy > 0.0 ? maxEnergy_ / energy : 0.0;
            allSilence = allSilence && (ratio > config_.maxCurrentRatioThreshold);
        }

        if (useCurrent_) {
            allSilence = allSilence && (energy < config_.currentEnergyThreshold);
        }
    }

    return allSilence;
}
