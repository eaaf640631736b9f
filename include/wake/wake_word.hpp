#ifndef WAKE_WORD_HPP
#define WAKE_WORD_HPP

#include "audio/audio_source.hpp"

#include <csignal>
#include <cstdint>
#include <ostream>
#include <string>

class WakeWordDetector {
public:
    virtual ~WakeWordDetector() = default;

    virtual int frameLength() const = 0;
    virtual int sampleRate() const = 0;

    // Keyword index on a match, -1 otherwise
    virtual int process(const int16_t* frame) = 0;
};

enum class WakeStatus {
    Detected,
    Stopped,     // interrupt flag raised
    SourceFault  // reading or processing a frame failed
};

struct WakeResult {
    WakeStatus status = WakeStatus::Stopped;
    int keyword = -1;
    std::string error;
};

// Reads frames from the source until a keyword is detected or `stop` is raised.
// A std::exception from the source or the detector is logged and returned as SourceFault.
WakeResult waitForWakeWord(AudioSource& source, WakeWordDetector& detector,
                           const volatile std::sig_atomic_t& stop, std::ostream& log);

#endif
