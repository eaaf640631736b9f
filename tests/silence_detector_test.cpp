#include "audio/silence_detector.hpp"
#include "config/configuration_error.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

namespace {

const size_t kChunk = 960;
const int kRate = 16000;

SilenceDetector::Config methodConfig(SilenceMethod method) {
    SilenceDetector::Config config;
    config.method = method;
    return config;
}

} // namespace

TEST(DebiasedEnergy, ZeroChunkIsZero) {
    const std::vector<uint8_t> zeros(kChunk, 0);
    EXPECT_EQ(SilenceDetector::debiasedEnergy(zeros.data(), zeros.size()), 0);
}

TEST(DebiasedEnergy, EmptyChunkIsZero) {
    EXPECT_EQ(SilenceDetector::debiasedEnergy(nullptr, 0), 0);
}

TEST(DebiasedEnergy, PositiveDcOffsetIsRemoved) {
    const std::vector<uint8_t> dc = constantChunk(kChunk, 500);
    EXPECT_EQ(SilenceDetector::debiasedEnergy(dc.data(), dc.size()), 0);
}

TEST(DebiasedEnergy, SquareWave) {
    // rms 1000, shifted by -1000 gives 0 / -2000 samples
    const std::vector<uint8_t> wave = squareChunk(kChunk, 1000);
    EXPECT_EQ(SilenceDetector::debiasedEnergy(wave.data(), wave.size()), 1414);
}

TEST(DebiasedEnergy, SaturatesInsteadOfWrapping) {
    const std::vector<uint8_t> low = constantChunk(kChunk, -32768);
    EXPECT_EQ(SilenceDetector::debiasedEnergy(low.data(), low.size()), 32768);
}

TEST(SilenceMethodNames, ParseEveryMethod) {
    const char* names[] = {"vad_only", "ratio_only", "current_only", "vad_and_ratio", "vad_and_current", "all"};
    for (const char* name : names) {
        SilenceMethod method = SilenceMethod::VadOnly;
        ASSERT_TRUE(parseSilenceMethod(name, method)) << name;
        EXPECT_STREQ(toString(method), name);
    }

    SilenceMethod method = SilenceMethod::All;
    EXPECT_FALSE(parseSilenceMethod("loudness", method));
    EXPECT_EQ(method, SilenceMethod::All);
}

TEST(SilenceDetectorConfig, RatioNeedsThreshold) {
    EXPECT_THROW(SilenceDetector(methodConfig(SilenceMethod::RatioOnly), kRate, nullptr), ConfigurationError);
}

TEST(SilenceDetectorConfig, CurrentNeedsThreshold) {
    EXPECT_THROW(SilenceDetector(methodConfig(SilenceMethod::CurrentOnly), kRate, nullptr), ConfigurationError);
}

TEST(SilenceDetectorConfig, VadMethodsNeedDetector) {
    SilenceDetector::Config config = methodConfig(SilenceMethod::VadAndCurrent);
    config.currentEnergyThreshold = 100;
    EXPECT_THROW(SilenceDetector(config, kRate, nullptr), ConfigurationError);

    LevelVad vad;
    EXPECT_NO_THROW(SilenceDetector(config, kRate, &vad));
}

TEST(SilenceDetectorConfig, MethodsEnableSubChecks) {
    LevelVad vad;
    SilenceDetector::Config config = methodConfig(SilenceMethod::All);
    config.maxCurrentRatioThreshold = 10;
    config.currentEnergyThreshold = 100;

    SilenceDetector all(config, kRate, &vad);
    EXPECT_TRUE(all.usesVad());
    EXPECT_TRUE(all.usesRatio());
    EXPECT_TRUE(all.usesCurrent());

    config.method = SilenceMethod::RatioOnly;
    SilenceDetector ratio(config, kRate, nullptr);
    EXPECT_FALSE(ratio.usesVad());
    EXPECT_TRUE(ratio.usesRatio());
    EXPECT_FALSE(ratio.usesCurrent());
}

TEST(SilenceDetector, VadOnlyDelegates) {
    LevelVad vad;
    SilenceDetector detector(methodConfig(SilenceMethod::VadOnly), kRate, &vad);

    const std::vector<uint8_t> loud = constantChunk(kChunk, 2000);
    const std::vector<uint8_t> quiet = constantChunk(kChunk, 5);

    EXPECT_FALSE(detector.isSilence(loud.data(), loud.size()));
    EXPECT_TRUE(detector.isSilence(quiet.data(), quiet.size()));
    EXPECT_EQ(vad.calls, 2);
    EXPECT_EQ(vad.lastSampleRate, kRate);
}

TEST(SilenceDetector, CurrentOnlyComparesEnergy) {
    SilenceDetector::Config config = methodConfig(SilenceMethod::CurrentOnly);
    config.currentEnergyThreshold = 100;
    SilenceDetector detector(config, kRate, nullptr);

    const std::vector<uint8_t> quiet = squareChunk(kChunk, 10);
    const std::vector<uint8_t> loud = squareChunk(kChunk, 1000);

    for (int i = 0; i < 20; ++i) {
        EXPECT_TRUE(detector.isSilence(quiet.data(), quiet.size()));
    }
    EXPECT_FALSE(detector.isSilence(loud.data(), loud.size()));
}

TEST(SilenceDetector, RatioCalibratesMaxEnergy) {
    SilenceDetector::Config config = methodConfig(SilenceMethod::RatioOnly);
    config.maxCurrentRatioThreshold = 10;
    SilenceDetector detector(config, kRate, nullptr);

    const std::vector<uint8_t> quiet = squareChunk(kChunk, 10);
    const std::vector<uint8_t> loud = squareChunk(kChunk, 1000);

    EXPECT_FALSE(detector.hasMaxEnergy());

    // First chunk is its own maximum: ratio 1
    EXPECT_FALSE(detector.isSilence(quiet.data(), quiet.size()));
    EXPECT_DOUBLE_EQ(detector.maxEnergy(), 14.0);

    EXPECT_FALSE(detector.isSilence(loud.data(), loud.size()));
    EXPECT_DOUBLE_EQ(detector.maxEnergy(), 1414.0);

    // 1414 / 14 > 10
    EXPECT_TRUE(detector.isSilence(quiet.data(), quiet.size()));
}

TEST(SilenceDetector, RatioWithZeroEnergyIsNotSilence) {
    SilenceDetector::Config config = methodConfig(SilenceMethod::RatioOnly);
    config.maxCurrentRatioThreshold = 10;
    SilenceDetector detector(config, kRate, nullptr);

    const std::vector<uint8_t> loud = squareChunk(kChunk, 1000);
    const std::vector<uint8_t> zeros(kChunk, 0);

    EXPECT_FALSE(detector.isSilence(zeros.data(), zeros.size()));
    EXPECT_FALSE(detector.isSilence(loud.data(), loud.size()));
    EXPECT_FALSE(detector.isSilence(zeros.data(), zeros.size()));
}

TEST(SilenceDetector, FixedMaxEnergyIsNotCalibrated) {
    SilenceDetector::Config config = methodConfig(SilenceMethod::RatioOnly);
    config.maxCurrentRatioThreshold = 10;
    config.maxEnergy = 2000;
    SilenceDetector detector(config, kRate, nullptr);

    EXPECT_TRUE(detector.hasMaxEnergy());

    const std::vector<uint8_t> quiet = squareChunk(kChunk, 10);
    const std::vector<uint8_t> louder = squareChunk(kChunk, 3000);
    EXPECT_TRUE(detector.isSilence(quiet.data(), quiet.size()));
    EXPECT_FALSE(detector.isSilence(louder.data(), louder.size()));
    EXPECT_DOUBLE_EQ(detector.maxEnergy(), 2000.0);
}

TEST(SilenceDetector, ResetForgetsCalibration) {
    SilenceDetector::Config config = methodConfig(SilenceMethod::RatioOnly);
    config.maxCurrentRatioThreshold = 10;
    SilenceDetector detector(config, kRate, nullptr);

    const std::vector<uint8_t> loud = squareChunk(kChunk, 1000);
    detector.isSilence(loud.data(), loud.size());
    ASSERT_TRUE(detector.hasMaxEnergy());

    detector.reset();
    EXPECT_FALSE(detector.hasMaxEnergy());
}

TEST(SilenceDetector, PersistedCalibrationSurvivesReset) {
    SilenceDetector::Config config = methodConfig(SilenceMethod::RatioOnly);
    config.maxCurrentRatioThreshold = 10;
    config.persistMaxEnergy = true;
    SilenceDetector detector(config, kRate, nullptr);

    const std::vector<uint8_t> loud = squareChunk(kChunk, 1000);
    const std::vector<uint8_t> quiet = squareChunk(kChunk, 10);
    detector.isSilence(loud.data(), loud.size());

    detector.reset();
    EXPECT_TRUE(detector.hasMaxEnergy());
    EXPECT_TRUE(detector.isSilence(quiet.data(), quiet.size()));
}

TEST(SilenceDetector, EnabledChecksMustAllAgree) {
    LevelVad vad;
    SilenceDetector::Config config = methodConfig(SilenceMethod::VadAndCurrent);
    config.currentEnergyThreshold = 100;
    SilenceDetector detector(config, kRate, &vad);

    // VAD hears speech (first sample >= 1000) but energy is tiny: DC only
    const std::vector<uint8_t> dc = constantChunk(kChunk, 1500);
    EXPECT_FALSE(detector.isSilence(dc.data(), dc.size()));

    // VAD hears nothing but energy is high
    const std::vector<uint8_t> loudNegativeFirst = squareChunk(kChunk, -900);
    EXPECT_FALSE(detector.isSilence(loudNegativeFirst.data(), loudNegativeFirst.size()));

    const std::vector<uint8_t> quiet = squareChunk(kChunk, 10);
    EXPECT_TRUE(detector.isSilence(quiet.data(), quiet.size()));
}

TEST(SilenceDetector, AllUsesEveryCheck) {
    LevelVad vad;
    SilenceDetector::Config config = methodConfig(SilenceMethod::All);
    config.maxCurrentRatioThreshold = 10;
    config.currentEnergyThreshold = 100;
    config.maxEnergy = 2000;
    SilenceDetector detector(config, kRate, &vad);

    // ratio 2000/14 > 10, energy 14 < 100, VAD silent
    const std::vector<uint8_t> quiet = squareChunk(kChunk, 10);
    EXPECT_TRUE(detector.isSilence(quiet.data(), quiet.size()));

    // ratio 2000/70 > 10 and VAD silent, but energy 70 is not below 50
    SilenceDetector::Config strict = config;
    strict.currentEnergyThreshold = 50;
    SilenceDetector strictDetector(strict, kRate, &vad);
    const std::vector<uint8_t> medium = squareChunk(kChunk, 50);
    EXPECT_FALSE(strictDetector.isSilence(medium.data(), medium.size()));
}
