#include "detection/level_monitor.h"

#include "../support/fakes.h"

#include <gtest/gtest.h>

using namespace needledrop;
using namespace needledrop::detection;

namespace {

LevelConfig defaultConfig() {
    LevelConfig config;
    config.metric = LevelMetric::Peak;
    config.silenceThreshold = 0.05f;
    config.activityThreshold = 0.1f;
    config.activityWindow = 2;
    config.standbyWindow = 5;
    return config;
}

ActivityState feed(const LevelMonitor& monitor, ActivityState state, float metric, int times) {
    for (int i = 0; i < times; ++i) {
        state = monitor.update(state, metric).state;
    }
    return state;
}

ActivityState standbyState() {
    ActivityState state;
    state.activity = Activity::Standby;
    return state;
}

}  // namespace

TEST(LevelMonitor, FiveQuietSamplesEnterStandby) {
    LevelMonitor monitor(defaultConfig());
    ActivityState state = feed(monitor, ActivityState{}, 0.01f, 5);
    EXPECT_EQ(state.activity, Activity::Standby);
    EXPECT_EQ(state.consecutiveBelowThreshold, 5u);
}

TEST(LevelMonitor, FourQuietSamplesStayActive) {
    LevelMonitor monitor(defaultConfig());
    ActivityState state = feed(monitor, ActivityState{}, 0.01f, 4);
    EXPECT_EQ(state.activity, Activity::Active);
    EXPECT_EQ(state.consecutiveBelowThreshold, 4u);
}

TEST(LevelMonitor, SingleLoudSampleDoesNotLeaveStandby) {
    LevelMonitor monitor(defaultConfig());
    LevelReading reading = monitor.update(standbyState(), 0.8f);
    EXPECT_EQ(reading.state.activity, Activity::Standby);
    EXPECT_FALSE(reading.transitioned);
    EXPECT_EQ(reading.state.consecutiveAboveThreshold, 1u);
}

TEST(LevelMonitor, ActivityWindowOfOneWakesImmediately) {
    LevelConfig config = defaultConfig();
    config.activityWindow = 1;
    LevelMonitor monitor(config);
    LevelReading reading = monitor.update(standbyState(), 0.8f);
    EXPECT_EQ(reading.state.activity, Activity::Active);
    EXPECT_TRUE(reading.transitioned);
}

TEST(LevelMonitor, TwoLoudSamplesWakeWithDefaultWindow) {
    LevelMonitor monitor(defaultConfig());
    LevelReading first = monitor.update(standbyState(), 0.5f);
    LevelReading second = monitor.update(first.state, 0.5f);
    EXPECT_FALSE(first.transitioned);
    EXPECT_TRUE(second.transitioned);
    EXPECT_EQ(second.state.activity, Activity::Active);
}

TEST(LevelMonitor, LoudSampleResetsQuietCounter) {
    LevelMonitor monitor(defaultConfig());
    ActivityState state = feed(monitor, ActivityState{}, 0.01f, 4);
    state = monitor.update(state, 0.5f).state;
    EXPECT_EQ(state.consecutiveBelowThreshold, 0u);
    state = feed(monitor, state, 0.01f, 4);
    EXPECT_EQ(state.activity, Activity::Active);
}

TEST(LevelMonitor, ValuesBetweenThresholdsChangeNothing) {
    LevelMonitor monitor(defaultConfig());
    ActivityState state = feed(monitor, ActivityState{}, 0.01f, 3);
    LevelReading reading = monitor.update(state, 0.07f);
    EXPECT_EQ(reading.state.consecutiveBelowThreshold, 3u);
    EXPECT_EQ(reading.state.consecutiveAboveThreshold, 0u);
    EXPECT_EQ(reading.state.activity, Activity::Active);
    EXPECT_FLOAT_EQ(reading.metric, 0.07f);
}

TEST(LevelMonitor, ExactThresholdValuesAreInTheDeadBand) {
    LevelMonitor monitor(defaultConfig());
    ActivityState state = monitor.update(ActivityState{}, 0.05f).state;
    EXPECT_EQ(state.consecutiveBelowThreshold, 0u);
    state = monitor.update(standbyState(), 0.1f).state;
    EXPECT_EQ(state.consecutiveAboveThreshold, 0u);
}

TEST(LevelMonitor, PeakMetricUsesAbsoluteAmplitude) {
    LevelMonitor monitor(defaultConfig());
    audio::PcmBuffer buffer = testing_support::constantBuffer(16, 0.0f);
    buffer.samples[3] = -0.6f;
    buffer.samples[7] = 0.4f;
    EXPECT_FLOAT_EQ(monitor.measure(buffer), 0.6f);
}

TEST(LevelMonitor, RmsMetricIsInInt16Units) {
    LevelConfig config = defaultConfig();
    config.metric = LevelMetric::Rms;
    config.silenceThreshold = 100.0f;
    config.activityThreshold = 200.0f;
    LevelMonitor monitor(config);

    audio::PcmBuffer buffer = testing_support::constantBuffer(64, 0.5f);
    EXPECT_NEAR(monitor.measure(buffer), 0.5f * 32767.0f, 1.0f);

    LevelReading reading = monitor.update(standbyState(), buffer);
    EXPECT_EQ(reading.state.consecutiveAboveThreshold, 1u);
}

TEST(LevelMonitor, ParseLevelMetric) {
    EXPECT_EQ(parseLevelMetric("rms"), LevelMetric::Rms);
    EXPECT_EQ(parseLevelMetric("RMS"), LevelMetric::Rms);
    EXPECT_EQ(parseLevelMetric("peak"), LevelMetric::Peak);
    EXPECT_EQ(parseLevelMetric("loudness"), LevelMetric::Peak);
    EXPECT_STREQ(levelMetricToString(LevelMetric::Rms), "rms");
    EXPECT_STREQ(activityToString(Activity::Standby), "standby");
}
