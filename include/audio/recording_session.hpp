#ifndef RECORDING_SESSION_HPP
#define RECORDING_SESSION_HPP

#include "audio/audio_source.hpp"
#include "audio/command_recorder.hpp"
#include "audio/voice_command.hpp"

#include <ostream>
#include <string>
#include <vector>

enum class RecordStatus {
    Command,     // the recorder reached Success or Failure
    NoCommand,   // session ceiling reached first
    SourceFault  // reading the audio source failed
};

struct RecordingResult {
    RecordStatus status = RecordStatus::NoCommand;
    VoiceCommand command;
    std::string error;
};

// Pulls chunks from an audio source into a CommandRecorder until it finishes.
class RecordingSession {
public:
    RecordingSession(CommandRecorder::Config config, VoiceActivityDetector* vad, std::ostream& log);

    // A std::exception thrown by the source ends the attempt with SourceFault.
    // Exceptions of other types are not caught.
    RecordingResult record(AudioSource& source);

    int maxIterations() const { return maxIterations_; }
    const CommandRecorder::Config& config() const { return recorder_.config(); }

private:
    CommandRecorder recorder_;
    std::ostream& log_;

    int maxIterations_ = 0;
    std::vector<uint8_t> buff_;
};

#endif
