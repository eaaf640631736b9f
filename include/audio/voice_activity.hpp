#ifndef VOICE_ACTIVITY_HPP
#define VOICE_ACTIVITY_HPP

#include <cstddef>
#include <cstdint>

// Speech/non-speech primitive. Frames must be 10, 20 or 30 ms long.
class VoiceActivityDetector {
public:
    virtual ~VoiceActivityDetector() = default;

    virtual bool isSpeech(const int16_t* samples, size_t count, int sampleRate) = 0;
};

#endif
