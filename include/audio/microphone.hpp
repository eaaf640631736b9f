#ifndef MICROPHONE_HPP
#define MICROPHONE_HPP

#include "audio/audio_source.hpp"

#include <ostream>
#include <string>

typedef void PaStream;

// Pa_Initialize / Pa_Terminate for the lifetime of the object
class PortAudioSystem {
public:
    PortAudioSystem();
    ~PortAudioSystem();

    PortAudioSystem(const PortAudioSystem&) = delete;
    PortAudioSystem& operator=(const PortAudioSystem&) = delete;
};

// Blocking 16-bit mono PortAudio input stream
class Microphone : public AudioSource {
public:
    struct Config {
        int deviceIndex = -1; // -1 = default input device
        int sampleRate = 16000;
        int framesPerBuffer = 1024;
    };

    Microphone(Config config, std::ostream& log);
    ~Microphone() override;

    Microphone(const Microphone&) = delete;
    Microphone& operator=(const Microphone&) = delete;

    // Input overflow is not an error; the samples read are still returned.
    void read(uint8_t* dst, size_t bytes) override;

    const Config& config() const { return config_; }

private:
    Config config_;
    std::ostream& log_;
    PaStream* stream_ = nullptr;
    std::string deviceName_;
};

#endif
