#ifndef AUDIO_SOURCE_HPP
#define AUDIO_SOURCE_HPP

#include <cstddef>
#include <cstdint>

// Blocking source of 16-bit mono PCM.
class AudioSource {
public:
    virtual ~AudioSource() = default;

    // Fills exactly `bytes` bytes. Faults must be reported as std::exception
    // subclasses: RecordingSession and waitForWakeWord recover only from those,
    // anything else propagates to the caller.
    virtual void read(uint8_t* dst, size_t bytes) = 0;
};

#endif
