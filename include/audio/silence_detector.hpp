#ifndef SILENCE_DETECTOR_HPP
#define SILENCE_DETECTOR_HPP

#include "audio/voice_activity.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

enum class SilenceMethod {
    VadOnly,
    RatioOnly,
    CurrentOnly,
    VadAndRatio,
    VadAndCurrent,
    All
};

const char* toString(SilenceMethod method);
bool parseSilenceMethod(const std::string& name, SilenceMethod& method);

class SilenceDetector {
public:
    struct Config {
        SilenceMethod method = SilenceMethod::VadOnly;

        // Negative values mean "not set".
        double maxEnergy = -1.0;
        double maxCurrentRatioThreshold = -1.0;
        double currentEnergyThreshold = -1.0;

        // Keep the calibrated max energy across reset() calls
        bool persistMaxEnergy = false;
    };

    // vad may be null when the method does not use it; it is not owned.
    SilenceDetector(Config config, int sampleRate, VoiceActivityDetector* vad);

    // True if the chunk of 16-bit little-endian samples is silence
    bool isSilence(const uint8_t* chunk, size_t bytes);

    void reset();

    bool usesVad() const { return useVad_; }
    bool usesRatio() const { return useRatio_; }
    bool usesCurrent() const { return useCurrent_; }

    bool hasMaxEnergy() const { return hasMaxEnergy_; }
    double maxEnergy() const { return maxEnergy_; }

    static int debiasedEnergy(const uint8_t* chunk, size_t bytes);

    static bool methodUsesVad(SilenceMethod method);
    static bool methodUsesRatio(SilenceMethod method);
    static bool methodUsesCurrent(SilenceMethod method);

    // Throws ConfigurationError when a threshold the method needs is missing
    static void validate(const Config& config);

private:
    Config config_;
    int sampleRate_;
    VoiceActivityDetector* vad_;

    bool useVad_ = false;
    bool useRatio_ = false;
    bool useCurrent_ = false;

    bool dynamicMaxEnergy_ = true;
    bool hasMaxEnergy_ = false;
    double maxEnergy_ = 0.0;

    std::vector<int16_t> samples_;
};

#endif
