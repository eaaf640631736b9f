#include "wake/wake_word.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <csignal>
#include <sstream>
#include <stdexcept>

namespace {

const int kFrame = 512;
const size_t kFrameBytes = kFrame * 2;

// Matches keyword `first sample - 100` for first samples 100..102
class LevelWakeWord : public WakeWordDetector {
public:
    int frameLength() const override { return kFrame; }
    int sampleRate() const override { return 16000; }

    int process(const int16_t* frame) override {
        ++frames;
        if (failOnFrame == frames) throw std::runtime_error("engine failure");
        if (frame[0] >= 100 && frame[0] <= 102) return frame[0] - 100;
        return -1;
    }

    int frames = 0;
    int failOnFrame = -1;
};

} // namespace

TEST(WakeWord, ReturnsDetectedKeyword) {
    LevelWakeWord detector;
    ScriptedSource source;
    for (int i = 0; i < 4; ++i) source.add(constantChunk(kFrameBytes, 0));
    source.add(constantChunk(kFrameBytes, 102));

    volatile std::sig_atomic_t stop = 0;
    std::ostringstream log;
    const WakeResult result = waitForWakeWord(source, detector, stop, log);

    EXPECT_EQ(result.status, WakeStatus::Detected);
    EXPECT_EQ(result.keyword, 2);
    EXPECT_EQ(source.reads, 5);
    EXPECT_TRUE(log.str().empty());
}

TEST(WakeWord, RaisedStopFlagReadsNothing) {
    LevelWakeWord detector;
    ScriptedSource source;
    source.setTail(constantChunk(kFrameBytes, 0));

    volatile std::sig_atomic_t stop = 1;
    std::ostringstream log;
    const WakeResult result = waitForWakeWord(source, detector, stop, log);

    EXPECT_EQ(result.status, WakeStatus::Stopped);
    EXPECT_EQ(result.keyword, -1);
    EXPECT_EQ(source.reads, 0);
}

TEST(WakeWord, SourceFaultIsReportedNotThrown) {
    LevelWakeWord detector;
    ScriptedSource source;
    for (int i = 0; i < 3; ++i) source.add(constantChunk(kFrameBytes, 0));

    volatile std::sig_atomic_t stop = 0;
    std::ostringstream log;
    WakeResult result;
    EXPECT_NO_THROW(result = waitForWakeWord(source, detector, stop, log));

    EXPECT_EQ(result.status, WakeStatus::SourceFault);
    EXPECT_EQ(result.error, "device unplugged");
    EXPECT_EQ(source.reads, 4);
    EXPECT_NE(log.str().find("[Wake] [ERROR] device unplugged"), std::string::npos);
}

TEST(WakeWord, DetectorFaultIsReportedNotThrown) {
    LevelWakeWord detector;
    detector.failOnFrame = 2;
    ScriptedSource source;
    source.setTail(constantChunk(kFrameBytes, 0));

    volatile std::sig_atomic_t stop = 0;
    std::ostringstream log;
    const WakeResult result = waitForWakeWord(source, detector, stop, log);

    EXPECT_EQ(result.status, WakeStatus::SourceFault);
    EXPECT_EQ(result.error, "engine failure");
}

TEST(WakeWord, ListeningResumesAfterFault) {
    LevelWakeWord detector;
    volatile std::sig_atomic_t stop = 0;
    std::ostringstream log;

    ScriptedSource broken;
    EXPECT_EQ(waitForWakeWord(broken, detector, stop, log).status, WakeStatus::SourceFault);

    ScriptedSource source;
    source.add(constantChunk(kFrameBytes, 100));
    const WakeResult result = waitForWakeWord(source, detector, stop, log);
    EXPECT_EQ(result.status, WakeStatus::Detected);
    EXPECT_EQ(result.keyword, 0);
}
