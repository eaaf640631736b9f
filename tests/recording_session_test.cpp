#include "audio/recording_session.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace {

const size_t kChunk = 960;

CommandRecorder::Config sessionConfig() {
    CommandRecorder::Config config;
    config.chunkSize = (int)kChunk;
    config.maxTimeout = 1.2;     // 40 reads
    config.maxSeconds = 0.0;
    config.speechSeconds = 0.09;
    config.minSeconds = 0.3;
    config.silenceSeconds = 0.15;
    config.beforeSeconds = 0.15;
    return config;
}

// first chunk, confirmation + start, minimum phrase, end of phrase: 22 reads
void addPhrase(ScriptedSource& source) {
    source.add(constantChunk(kChunk, 1));
    for (int i = 0; i < 14; ++i) source.add(constantChunk(kChunk, (int16_t)(2000 + i)));
    for (int i = 0; i < 7; ++i) source.add(constantChunk(kChunk, (int16_t)(10 + i)));
}

// Fails with an exception type outside the std::exception hierarchy
class ForeignFaultSource : public AudioSource {
public:
    void read(uint8_t*, size_t) override { throw 42; }
};

} // namespace

TEST(RecordingSession, IterationCeilingFollowsMaxTimeout) {
    LevelVad vad;
    std::ostringstream log;
    RecordingSession session(sessionConfig(), &vad, log);
    EXPECT_EQ(session.maxIterations(), 40);
}

TEST(RecordingSession, ReturnsCommand) {
    LevelVad vad;
    std::ostringstream log;
    RecordingSession session(sessionConfig(), &vad, log);

    ScriptedSource source;
    addPhrase(source);

    const RecordingResult result = session.record(source);
    ASSERT_EQ(result.status, RecordStatus::Command);
    EXPECT_EQ(result.command.result, VoiceCommandResult::Success);
    EXPECT_EQ(result.command.audioData.size(), 22 * kChunk);
    EXPECT_EQ(source.reads, 22);
    EXPECT_TRUE(result.error.empty());
    EXPECT_NE(log.str().find("[Recorder] recording"), std::string::npos);
}

TEST(RecordingSession, GivesUpAtCeiling) {
    LevelVad vad;
    std::ostringstream log;
    RecordingSession session(sessionConfig(), &vad, log);

    ScriptedSource source;
    source.setTail(constantChunk(kChunk, 0));

    const RecordingResult result = session.record(source);
    EXPECT_EQ(result.status, RecordStatus::NoCommand);
    EXPECT_EQ(source.reads, session.maxIterations());
    EXPECT_NE(log.str().find("[WARN]"), std::string::npos);
}

TEST(RecordingSession, RecorderTimeoutIsACommand) {
    LevelVad vad;
    std::ostringstream log;
    CommandRecorder::Config config = sessionConfig();
    config.maxSeconds = 0.6;
    RecordingSession session(config, &vad, log);

    ScriptedSource source;
    source.setTail(constantChunk(kChunk, 0));

    const RecordingResult result = session.record(source);
    ASSERT_EQ(result.status, RecordStatus::Command);
    EXPECT_EQ(result.command.result, VoiceCommandResult::Failure);
    EXPECT_EQ(result.command.events.back().type, VoiceCommandEventType::Timeout);
    EXPECT_EQ(source.reads, 20);
}

TEST(RecordingSession, SourceFaultIsReportedNotThrown) {
    LevelVad vad;
    std::ostringstream log;
    RecordingSession session(sessionConfig(), &vad, log);

    ScriptedSource source;
    for (int i = 0; i < 5; ++i) source.add(constantChunk(kChunk, 0));

    RecordingResult result;
    EXPECT_NO_THROW(result = session.record(source));
    EXPECT_EQ(result.status, RecordStatus::SourceFault);
    EXPECT_EQ(result.error, "device unplugged");
    EXPECT_NE(log.str().find("[Recorder] [ERROR]"), std::string::npos);
}

TEST(RecordingSession, OnlyStandardExceptionsBecomeSourceFaults) {
    LevelVad vad;
    std::ostringstream log;
    RecordingSession session(sessionConfig(), &vad, log);

    ForeignFaultSource source;
    EXPECT_THROW(session.record(source), int);
    EXPECT_EQ(log.str().find("[ERROR]"), std::string::npos);
}

TEST(RecordingSession, ConsecutiveRecordsDoNotShareState) {
    LevelVad vad;
    std::ostringstream log;
    RecordingSession session(sessionConfig(), &vad, log);

    ScriptedSource source;
    addPhrase(source);

    const RecordingResult first = session.record(source);
    source.rewind();
    const RecordingResult second = session.record(source);

    ASSERT_EQ(first.status, RecordStatus::Command);
    ASSERT_EQ(second.status, RecordStatus::Command);
    EXPECT_EQ(second.command.result, first.command.result);
    EXPECT_EQ(second.command.audioData, first.command.audioData);
    ASSERT_EQ(second.command.events.size(), first.command.events.size());
    for (size_t i = 0; i < first.command.events.size(); ++i) {
        EXPECT_EQ(second.command.events[i].type, first.command.events[i].type);
        EXPECT_NEAR(second.command.events[i].time, first.command.events[i].time, 1e-9);
    }
}

TEST(RecordingSession, SessionAfterFaultStartsClean) {
    LevelVad vad;
    std::ostringstream log;
    RecordingSession session(sessionConfig(), &vad, log);

    ScriptedSource broken;
    broken.add(constantChunk(kChunk, 1));
    for (int i = 0; i < 8; ++i) broken.add(constantChunk(kChunk, 2000));
    EXPECT_EQ(session.record(broken).status, RecordStatus::SourceFault);

    ScriptedSource source;
    addPhrase(source);
    const RecordingResult result = session.record(source);
    ASSERT_EQ(result.status, RecordStatus::Command);
    EXPECT_EQ(result.command.audioData.size(), 22 * kChunk);
}
