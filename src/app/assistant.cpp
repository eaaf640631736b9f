#include "app/assistant.hpp"
#include "audio/wav.hpp"

#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

std::string now() {
    const std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

} // namespace

// Constructor
Assistant::Assistant(const AppConfig& config, AudioSource& mic, WakeWordDetector& wake,
                     RecordingSession& session, ServiceClient& service, WhisperSTT* whisper,
                     FeedbackPlayer& feedback, std::ostream& log)
    : config_(config), mic_(mic), wake_(wake), session_(session), service_(service),
      whisper_(whisper), feedback_(feedback), log_(log) {}

void Assistant::run(const volatile std::sig_atomic_t& stop) {
    int wakeFaults = 0;

    while (!stop) {
        const WakeResult wake = waitForWakeWord(mic_, wake_, stop, log_);
        if (wake.status == WakeStatus::Stopped) break;

        if (wake.status == WakeStatus::SourceFault) {
            // Already logged; a device that keeps failing ends the loop
            if (++wakeFaults >= kMaxWakeFaults) {
                throw std::runtime_error("Giving up after " + std::to_string(wakeFaults) +
                                         " consecutive wake word faults: " + wake.error);
            }
            continue;
        }
        wakeFaults = 0;

        log_ << "[" << now() << "] Detected " << config_.keywordName(wake.keyword) << std::endl;
        feedback_.playWake();

        const RecordingResult result = session_.record(mic_);

        switch (result.status) {
            case RecordStatus::Command:
                if (config_.verbose) {
                    log_ << "[Recorder] events: " << formatEvents(result.command.events) << std::endl;
                }
                if (result.command.result == VoiceCommandResult::Success) {
                    handleCommand(result.command);
                } else {
                    log_ << "[Recorder] recording timed out, back to listening" << std::endl;
                }
                break;
            case RecordStatus::NoCommand:
                log_ << "[Recorder] no command, back to listening" << std::endl;
                break;
            case RecordStatus::SourceFault:
                // Already logged by the session
                break;
        }
    }
}

std::string Assistant::transcribe(const VoiceCommand& command) {
    if (whisper_) {
        return whisper_->transcribePcm16(command.audioData, config_.stt.threads);
    }

    const CommandRecorder::Config& rec = session_.config();
    const std::vector<uint8_t> wavBytes = wav::encode(command.audioData, rec.sampleRate, rec.sampleWidth, rec.channels);
    return service_.speechToText(wavBytes);
}

void Assistant::handleCommand(const VoiceCommand& command) {
    std::string text;
    try {
        text = transcribe(command);
    } catch (const std::exception& e) {
        log_ << "[Service] [ERROR] speech to text: " << e.what() << std::endl;
        return;
    }

    log_ << "STT: " << text << std::endl;
    if (text.empty()) return;

    try {
        const nlohmann::json intent = service_.textToIntent(text);

        std::string name = "(none)";
        if (intent.contains("intent") && intent["intent"].is_object() &&
            intent["intent"].contains("name") && intent["intent"]["name"].is_string()) {
            name = intent["intent"]["name"].get<std::string>();
        }
        log_ << "Intent: " << name << std::endl;
        if (config_.verbose) log_ << intent.dump(2) << std::endl;
    } catch (const std::exception& e) {
        log_ << "[Service] [ERROR] text to intent: " << e.what() << std::endl;
        return;
    }

    feedback_.playIntent();
}
