#include "audio/microphone.hpp"

#include <portaudio.h>
#include <stdexcept>
#include <string>

static void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw std::runtime_error(std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
}

// Constructor
PortAudioSystem::PortAudioSystem() {
    pa_check(Pa_Initialize(), "Pa_Initialize");
}

// Destructor
PortAudioSystem::~PortAudioSystem() {
    Pa_Terminate();
}

// Constructor
Microphone::Microphone(Config config, std::ostream& log) : config_(config), log_(log) {
    PaStreamParameters inParams{};
    inParams.device = config_.deviceIndex >= 0 ? (PaDeviceIndex)config_.deviceIndex : Pa_GetDefaultInputDevice();
    if (inParams.device == paNoDevice) {
        throw std::runtime_error("No default input device");
    }

    const PaDeviceInfo* info = Pa_GetDeviceInfo(inParams.device);
    if (!info) {
        throw std::runtime_error("Invalid input device index " + std::to_string(config_.deviceIndex));
    }
    deviceName_ = info->name;
    log_ << "[Microphone] Input device: " << deviceName_ << std::endl;

    inParams.channelCount = 1;
    inParams.sampleFormat = paInt16;
    inParams.suggestedLatency = info->defaultLowInputLatency;
    inParams.hostApiSpecificStreamInfo = nullptr;

    pa_check(
        Pa_OpenStream(&stream_, &inParams, nullptr,
                      config_.sampleRate, config_.framesPerBuffer,
                      paNoFlag, nullptr, nullptr),
        "Pa_OpenStream"
    );

    const PaError e = Pa_StartStream(stream_);
    if (e != paNoError) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        pa_check(e, "Pa_StartStream");
    }
}

// Destructor
Microphone::~Microphone() {
    if (stream_) {
        Pa_StopStream(stream_);
        Pa_CloseStream(stream_);
    }
}

void Microphone::read(uint8_t* dst, size_t bytes) {
    const unsigned long frames = (unsigned long)(bytes / sizeof(int16_t));

    PaError e = Pa_ReadStream(stream_, dst, frames);
    if (e == paNoError || e == paInputOverflowed) {
        return;
    }
    pa_check(e, ("Pa_ReadStream on \"" + deviceName_ + "\"").c_str());
}
