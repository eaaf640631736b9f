#ifndef COMMAND_RECORDER_HPP
#define COMMAND_RECORDER_HPP

#include "audio/chunk_buffer.hpp"
#include "audio/silence_detector.hpp"
#include "audio/voice_command.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

// Streaming phrase segmenter: finds the start and end of a spoken command
// in 16-bit mono PCM and returns it with some audio from just before it.
class CommandRecorder {
public:
    struct Config {
        int sampleRate = 16000;
        int sampleWidth = 2;
        int channels = 1;

        // bytes per analysis chunk, must be 10, 20 or 30 ms of audio
        int chunkSize = 960;
        int vadMode = 3;

        // seconds of audio a recording session may read
        double maxTimeout = 20.0;

        double skipSeconds = 0.0;
        double minSeconds = 1.0;
        double maxSeconds = 30.0;
        double speechSeconds = 0.3;
        double silenceSeconds = 0.5;
        double beforeSeconds = 0.5;

        SilenceDetector::Config silence;

        // Throws ConfigurationError
        void validate() const;

        double secondsPerBuffer() const;
        int chunkMs() const;
        int buffersFor(double seconds) const;
    };

    CommandRecorder(Config config, VoiceActivityDetector* vad);

    // Returns true once the command is complete or has failed
    bool feed(const uint8_t* data, size_t bytes);

    bool hasCommand() const { return finished_; }
    const VoiceCommand& command() const { return command_; }

    bool inPhrase() const { return inPhrase_; }
    double currentSeconds() const { return currentSeconds_; }
    size_t preRollBytes() const { return preRollCount_ * chunkSize_; }

    const Config& config() const { return config_; }

    void reset();

private:
    bool processChunk(const uint8_t* chunk);
    void pushPreRoll(const uint8_t* chunk);
    void addEvent(VoiceCommandEventType type);
    void finish(VoiceCommandResult result);

    Config config_;
    SilenceDetector detector_;
    ChunkBuffer chunks_;

    size_t chunkSize_ = 0;
    double secondsPerBuffer_ = 0.0;

    int beforeBuffers_ = 0;
    int speechBuffers_ = 0;
    int skipBuffers_ = 0;
    int minPhraseBuffers_ = 0;
    int silenceBuffers_ = 0;
    int maxBuffers_ = 0;

    int skipBuffersLeft_ = 0;
    int speechBuffersLeft_ = 0;
    int minPhraseBuffersLeft_ = 0;
    int silenceBuffersLeft_ = 0;
    int maxBuffersLeft_ = 0;

    bool firstChunk_ = true;
    bool lastSpeech_ = false;
    bool inPhrase_ = false;
    bool afterPhrase_ = false;
    bool finished_ = false;

    double currentSeconds_ = 0.0;

    // Ring of the last beforeBuffers_ chunks, flat storage
    std::vector<uint8_t> preRoll_;
    size_t preRollHead_ = 0;
    size_t preRollCount_ = 0;

    std::vector<uint8_t> phrase_;
    std::vector<VoiceCommandEvent> events_;

    VoiceCommand command_;
};

#endif
