#include "wake/wake_word.hpp"

#include <exception>
#include <vector>

WakeResult waitForWakeWord(AudioSource& source, WakeWordDetector& detector,
                           const volatile std::sig_atomic_t& stop, std::ostream& log) {
    WakeResult result;
    std::vector<int16_t> frame((size_t)detector.frameLength());

    try {
        while (!stop) {
            source.read(reinterpret_cast<uint8_t*>(frame.data()), frame.size() * sizeof(int16_t));

            const int index = detector.process(frame.data());
            if (index >= 0) {
                result.status = WakeStatus::Detected;
                result.keyword = index;
                return result;
            }
        }
    } catch (const std::exception& e) {
        log << "[Wake] [ERROR] " << e.what() << std::endl;
        result.status = WakeStatus::SourceFault;
        result.error = e.what();
        return result;
    }

    result.status = WakeStatus::Stopped;
    return result;
}
