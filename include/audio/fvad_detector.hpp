#ifndef FVAD_DETECTOR_HPP
#define FVAD_DETECTOR_HPP

#include "audio/voice_activity.hpp"

struct Fvad;

// WebRTC voice activity detection through libfvad
class FvadDetector : public VoiceActivityDetector {
public:
    FvadDetector(int mode, int sampleRate);
    ~FvadDetector() override;

    FvadDetector(const FvadDetector&) = delete;
    FvadDetector& operator=(const FvadDetector&) = delete;

    bool isSpeech(const int16_t* samples, size_t count, int sampleRate) override;

private:
    void setSampleRate(int sampleRate);

    Fvad* vad_ = nullptr;
    int sampleRate_ = 0;
};

#endif
