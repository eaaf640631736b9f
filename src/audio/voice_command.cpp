#include "audio/voice_command.hpp"

#include <iomanip>
#include <sstream>

const char* toString(VoiceCommandResult result) {
    switch (result) {
        case VoiceCommandResult::Success: return "success";
        case VoiceCommandResult::Failure: return "failure";
    }
    return "unknown";
}

const char* toString(VoiceCommandEventType type) {
    switch (type) {
        case VoiceCommandEventType::Started: return "started";
        case VoiceCommandEventType::Speech: return "speech";
        case VoiceCommandEventType::Silence: return "silence";
        case VoiceCommandEventType::Stopped: return "stopped";
        case VoiceCommandEventType::Timeout: return "timeout";
    }
    return "unknown";
}

std::string formatEvents(const std::vector<VoiceCommandEvent>& events) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    for (size_t i = 0; i < events.size(); ++i) {
        if (i > 0) out << ' ';
        out << toString(events[i].type) << '@' << events[i].time;
    }
    return out.str();
}
