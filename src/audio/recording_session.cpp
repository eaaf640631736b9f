#include "audio/recording_session.hpp"

#include <exception>

// Constructor
RecordingSession::RecordingSession(CommandRecorder::Config config, VoiceActivityDetector* vad, std::ostream& log)
    : recorder_(config, vad), log_(log) {
    const CommandRecorder::Config& c = recorder_.config();
    maxIterations_ = c.buffersFor(c.maxTimeout);
    buff_.resize((size_t)c.chunkSize);
}

// Records one voice command from the source
RecordingResult RecordingSession::record(AudioSource& source) {
    RecordingResult result;
    recorder_.reset();

    log_ << "[Recorder] recording" << std::endl;

    try {
        for (int i = 0; i < maxIterations_; ++i) {
            source.read(buff_.data(), buff_.size());

            if (recorder_.feed(buff_.data(), buff_.size())) {
                result.status = RecordStatus::Command;
                result.command = recorder_.command();
                log_ << "[Recorder] done recording (" << toString(result.command.result) << ")" << std::endl;
                return result;
            }
        }
    } catch (const std::exception& e) {
        log_ << "[Recorder] [ERROR] record error: " << e.what() << std::endl;
        result.status = RecordStatus::SourceFault;
        result.error = e.what();
        return result;
    }

    log_ << "[Recorder] [WARN] no command after " << recorder_.config().maxTimeout << "s" << std::endl;
    result.status = RecordStatus::NoCommand;
    return result;
}
