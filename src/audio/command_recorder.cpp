#include "audio/command_recorder.hpp"
#include "config/configuration_error.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <string>

namespace {

const CommandRecorder::Config& validated(const CommandRecorder::Config& config) {
    config.validate();
    return config;
}

} // namespace

void CommandRecorder::Config::validate() const {
    if (sampleWidth != 2) {
        throw ConfigurationError("Sample width must be 2 bytes (got " + std::to_string(sampleWidth) + ")");
    }
    if (channels != 1) {
        throw ConfigurationError("Audio must be mono (got " + std::to_string(channels) + " channels)");
    }
    if (sampleRate <= 0 || chunkSize <= 0 || chunkSize % (sampleWidth * channels) != 0) {
        throw ConfigurationError("Invalid sample rate " + std::to_string(sampleRate) +
                                 " or chunk size " + std::to_string(chunkSize));
    }

    const long samples = chunkSize / (sampleWidth * channels);
    const bool wholeMs = (samples * 1000) % sampleRate == 0;
    const int ms = chunkMs();
    if (!wholeMs || (ms != 10 && ms != 20 && ms != 30)) {
        throw ConfigurationError(
            "Sample rate and chunk size must make for 10, 20, or 30 ms buffer sizes, assuming 16-bit mono audio (got " +
            std::to_string(1000.0 * samples / sampleRate) + " ms)");
    }

    if (vadMode < 1 || vadMode > 3) {
        throw ConfigurationError("VAD mode must be 1-3 (got " + std::to_string(vadMode) + ")");
    }

    if (maxTimeout <= 0.0) throw ConfigurationError("maxTimeout must be positive");
    if (skipSeconds < 0.0 || minSeconds < 0.0 || speechSeconds < 0.0 ||
        silenceSeconds < 0.0 || beforeSeconds < 0.0) {
        throw ConfigurationError("Recorder durations must not be negative");
    }

    // Chunk counts are ints
    const struct {
        const char* name;
        double seconds;
    } durations[] = {
        {"maxTimeout", maxTimeout}, {"maxSeconds", maxSeconds}, {"skipSeconds", skipSeconds},
        {"minSeconds", minSeconds}, {"speechSeconds", speechSeconds}, {"silenceSeconds", silenceSeconds},
        {"beforeSeconds", beforeSeconds},
    };
    const double limit = (double)std::numeric_limits<int>::max();
    for (const auto& d : durations) {
        if (!std::isfinite(d.seconds) || std::ceil(d.seconds / secondsPerBuffer()) > limit) {
            throw ConfigurationError(std::string(d.name) + " is out of range (" + std::to_string(d.seconds) + " s)");
        }
    }

    SilenceDetector::validate(silence);
}

double CommandRecorder::Config::secondsPerBuffer() const {
    return (double)(chunkSize / (sampleWidth * channels)) / (double)sampleRate;
}

int CommandRecorder::Config::chunkMs() const {
    return (int)((long)(chunkSize / (sampleWidth * channels)) * 1000 / sampleRate);
}

// Number of whole chunks covering `seconds`, rounded up
int CommandRecorder::Config::buffersFor(double seconds) const {
    if (seconds <= 0.0) return 0;
    return (int)std::ceil(seconds / secondsPerBuffer() - 1e-9);
}

// Constructor
CommandRecorder::CommandRecorder(Config config, VoiceActivityDetector* vad)
    : config_(validated(config)),
      detector_(config_.silence, config_.sampleRate, vad),
      chunks_((size_t)config_.chunkSize) {
    chunkSize_ = (size_t)config_.chunkSize;
    secondsPerBuffer_ = config_.secondsPerBuffer();

    beforeBuffers_ = config_.buffersFor(config_.beforeSeconds);
    speechBuffers_ = config_.buffersFor(config_.speechSeconds);
    skipBuffers_ = config_.buffersFor(config_.skipSeconds);
    minPhraseBuffers_ = config_.buffersFor(config_.minSeconds);
    silenceBuffers_ = config_.buffersFor(config_.silenceSeconds);
    maxBuffers_ = config_.buffersFor(config_.maxSeconds);

    preRoll_.resize((size_t)beforeBuffers_ * chunkSize_);
    phrase_.reserve((size_t)std::min(maxBuffers_ > 0 ? maxBuffers_ : 0, 2000) * chunkSize_);

    reset();
}

// Resets recording variables
void CommandRecorder::reset() {
    detector_.reset();
    chunks_.clear();

    skipBuffersLeft_ = skipBuffers_;
    speechBuffersLeft_ = speechBuffers_;
    minPhraseBuffersLeft_ = 0;
    silenceBuffersLeft_ = silenceBuffers_;
    maxBuffersLeft_ = maxBuffers_;

    firstChunk_ = true;
    lastSpeech_ = false;
    inPhrase_ = false;
    afterPhrase_ = false;
    finished_ = false;

    currentSeconds_ = 0.0;

    preRollHead_ = 0;
    preRollCount_ = 0;
    phrase_.clear();
    events_.clear();

    command_ = VoiceCommand();
}

void CommandRecorder::pushPreRoll(const uint8_t* chunk) {
    const size_t capacity = (size_t)beforeBuffers_;
    if (capacity == 0) return;

    size_t slot;
    if (preRollCount_ < capacity) {
        slot = (preRollHead_ + preRollCount_) % capacity;
        ++preRollCount_;
    } else {
        // Full: overwrite the oldest chunk
        slot = preRollHead_;
        preRollHead_ = (preRollHead_ + 1) % capacity;
    }
    std::memcpy(preRoll_.data() + slot * chunkSize_, chunk, chunkSize_);
}

void CommandRecorder::addEvent(VoiceCommandEventType type) {
    events_.push_back(VoiceCommandEvent{type, currentSeconds_});
}

void CommandRecorder::finish(VoiceCommandResult result) {
    command_ = VoiceCommand();
    command_.result = result;
    command_.events = events_;

    if (result == VoiceCommandResult::Success) {
        const size_t capacity = (size_t)beforeBuffers_;
        command_.audioData.reserve(preRollCount_ * chunkSize_ + phrase_.size());
        for (size_t i = 0; i < preRollCount_; ++i) {
            const uint8_t* chunk = preRoll_.data() + ((preRollHead_ + i) % capacity) * chunkSize_;
            command_.audioData.insert(command_.audioData.end(), chunk, chunk + chunkSize_);
        }
        command_.audioData.insert(command_.audioData.end(), phrase_.begin(), phrase_.end());
    }

    finished_ = true;
}

bool CommandRecorder::feed(const uint8_t* data, size_t bytes) {
    if (finished_) return true;

    chunks_.feed(data, bytes);

    const uint8_t* chunk = nullptr;
    while ((chunk = chunks_.next()) != nullptr) {
        if (processChunk(chunk)) return true;
    }
    return false;
}

// Advances the state machine by one chunk, returns true when finished
bool CommandRecorder::processChunk(const uint8_t* chunk) {
    if (skipBuffersLeft_ > 0) {
        --skipBuffersLeft_;
        return false;
    }

    if (inPhrase_) {
        phrase_.insert(phrase_.end(), chunk, chunk + chunkSize_);
    } else {
        pushPreRoll(chunk);
    }

    currentSeconds_ += secondsPerBuffer_;

    if (maxBuffers_ > 0) {
        --maxBuffersLeft_;
        if (maxBuffersLeft_ <= 0) {
            addEvent(VoiceCommandEventType::Timeout);
            finish(VoiceCommandResult::Failure);
            return true;
        }
    }

    // The first frame after the wake word is not classified
    if (firstChunk_) {
        firstChunk_ = false;
        return false;
    }

    const bool isSpeech = !detector_.isSilence(chunk, chunkSize_);

    if (!isSpeech && !inPhrase_) {
        // Any silence before the phrase is tolerated
        addEvent(VoiceCommandEventType::Silence);
        return false;
    }

    if (isSpeech && !lastSpeech_) {
        addEvent(VoiceCommandEventType::Speech);
    } else if (!isSpeech && lastSpeech_) {
        addEvent(VoiceCommandEventType::Silence);
    }
    lastSpeech_ = isSpeech;

    if (isSpeech && speechBuffersLeft_ > 0) {
        --speechBuffersLeft_;
    } else if (isSpeech && !inPhrase_) {
        addEvent(VoiceCommandEventType::Started);
        inPhrase_ = true;
        afterPhrase_ = false;
        minPhraseBuffersLeft_ = minPhraseBuffers_;
    } else if (inPhrase_ && minPhraseBuffersLeft_ > 0) {
        // Silence inside the minimum window does not end the phrase
        --minPhraseBuffersLeft_;
    } else if (!isSpeech) {
        if (!inPhrase_) {
            speechBuffersLeft_ = speechBuffers_;
        } else if (afterPhrase_ && silenceBuffersLeft_ > 0) {
            --silenceBuffersLeft_;
        } else if (afterPhrase_ && silenceBuffersLeft_ <= 0) {
            addEvent(VoiceCommandEventType::Stopped);
            finish(VoiceCommandResult::Success);
            return true;
        } else if (inPhrase_ && minPhraseBuffersLeft_ <= 0) {
            afterPhrase_ = true;
            silenceBuffersLeft_ = silenceBuffers_;
        }
    }

    return false;
}
