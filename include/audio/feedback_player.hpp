#ifndef FEEDBACK_PLAYER_HPP
#define FEEDBACK_PLAYER_HPP

#include "audio/wav.hpp"

#include <ostream>
#include <string>

// Short confirmation sounds. Needs a live PortAudioSystem.
class FeedbackPlayer {
public:
    FeedbackPlayer(const std::string& wakeSound, const std::string& intentSound, std::ostream& log);

    void playWake() { play(wake_, "wake"); }
    void playIntent() { play(intent_, "intent"); }

private:
    void load(const std::string& path, wav::WavData& out);
    void play(const wav::WavData& sound, const char* name);

    std::ostream& log_;
    wav::WavData wake_;
    wav::WavData intent_;
};

#endif
