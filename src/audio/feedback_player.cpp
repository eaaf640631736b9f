#include "audio/feedback_player.hpp"

#include <portaudio.h>
#include <exception>
#include <utility>

// Constructor
FeedbackPlayer::FeedbackPlayer(const std::string& wakeSound, const std::string& intentSound, std::ostream& log)
    : log_(log) {
    load(wakeSound, wake_);
    load(intentSound, intent_);
}

void FeedbackPlayer::load(const std::string& path, wav::WavData& out) {
    if (path.empty()) return;

    try {
        wav::WavData sound = wav::readFile(path);
        if (sound.sampleWidth != 2) {
            log_ << "[Feedback] [WARN] " << path << ": only 16-bit sounds are supported" << std::endl;
            return;
        }
        out = std::move(sound);
    } catch (const std::exception& e) {
        log_ << "[Feedback] [WARN] " << e.what() << std::endl;
    }
}

// Plays a sound with a blocking output stream; failures are only logged
void FeedbackPlayer::play(const wav::WavData& sound, const char* name) {
    if (sound.pcm.empty()) return;

    PaStream* stream = nullptr;
    PaError e = Pa_OpenDefaultStream(&stream, 0, sound.channels, paInt16, sound.sampleRate,
                                     paFramesPerBufferUnspecified, nullptr, nullptr);
    if (e != paNoError) {
        log_ << "[Feedback] [WARN] cannot open output for " << name << " sound: " << Pa_GetErrorText(e) << std::endl;
        return;
    }

    e = Pa_StartStream(stream);
    if (e == paNoError) {
        const unsigned long frames = (unsigned long)(sound.pcm.size() / (size_t)(2 * sound.channels));
        e = Pa_WriteStream(stream, sound.pcm.data(), frames);
        if (e != paNoError && e != paOutputUnderflowed) {
            log_ << "[Feedback] [WARN] " << name << " sound: " << Pa_GetErrorText(e) << std::endl;
        }
        Pa_StopStream(stream);
    } else {
        log_ << "[Feedback] [WARN] " << name << " sound: " << Pa_GetErrorText(e) << std::endl;
    }
    Pa_CloseStream(stream);
}
