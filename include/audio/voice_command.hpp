#ifndef VOICE_COMMAND_HPP
#define VOICE_COMMAND_HPP

#include <cstdint>
#include <string>
#include <vector>

enum class VoiceCommandResult {
    Success,
    Failure
};

enum class VoiceCommandEventType {
    Started,
    Speech,
    Silence,
    Stopped,
    Timeout
};

struct VoiceCommandEvent {
    VoiceCommandEventType type;
    double time; // seconds since the session started
};

// Result of one recording attempt. audioData is empty unless result is Success.
struct VoiceCommand {
    VoiceCommandResult result = VoiceCommandResult::Failure;
    std::vector<uint8_t> audioData;
    std::vector<VoiceCommandEvent> events;
};

const char* toString(VoiceCommandResult result);
const char* toString(VoiceCommandEventType type);

// "speech@0.09 started@0.39 ..." for diagnostics
std::string formatEvents(const std::vector<VoiceCommandEvent>& events);

#endif
