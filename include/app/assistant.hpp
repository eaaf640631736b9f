#ifndef ASSISTANT_HPP
#define ASSISTANT_HPP

#include "audio/feedback_player.hpp"
#include "audio/recording_session.hpp"
#include "config/app_config.hpp"
#include "net/service_client.hpp"
#include "stt/whisper_stt.hpp"
#include "wake/wake_word.hpp"

#include <csignal>
#include <ostream>

// Wake word -> record -> transcribe -> intent, until interrupted
class Assistant {
public:
    // whisper may be null, then the remote speech-to-text endpoint is used
    Assistant(const AppConfig& config, AudioSource& mic, WakeWordDetector& wake,
              RecordingSession& session, ServiceClient& service, WhisperSTT* whisper,
              FeedbackPlayer& feedback, std::ostream& log);

    // Wake word faults are logged and listening resumes; after kMaxWakeFaults
    // in a row run() throws std::runtime_error.
    void run(const volatile std::sig_atomic_t& stop);

    static const int kMaxWakeFaults = 5;

private:
    void handleCommand(const VoiceCommand& command);
    std::string transcribe(const VoiceCommand& command);

    const AppConfig& config_;
    AudioSource& mic_;
    WakeWordDetector& wake_;
    RecordingSession& session_;
    ServiceClient& service_;
    WhisperSTT* whisper_;
    FeedbackPlayer& feedback_;
    std::ostream& log_;
};

#endif
