// discrip - Disc video ripper
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <chrono>
#include <string>

#include <gtest/gtest.h>

#include "progress.h"
#include "test_support.h"

using namespace discrip::detail;
using discrip::test::ManualClock;
using discrip::test::RecordingEventSink;

namespace {

class FfmpegProgressReporterTest : public ::testing::Test {
protected:
    void feed(FfmpegProgressReporter& reporter, std::initializer_list<const char*> lines) {
        for (const char* line : lines) {
            reporter.handle_line(StreamKind::Stderr, line);
        }
    }

    RecordingEventSink sink;
    ManualClock clock;
};

}  // namespace

TEST_F(FfmpegProgressReporterTest, ProgressEndForcesCompletion) {
    FfmpegProgressReporter reporter(sink, 10.0, clock.fn());
    feed(reporter, {"out_time_ms=5000000", "speed=2.0x", "total_size=1000", "progress=end"});

    const auto events = sink.events("EVENT=PROGRESS");
    ASSERT_EQ(1u, events.size());
    EXPECT_EQ(
        "EVENT=PROGRESS BACKEND=ffmpeg PCT=100.0 ETA=00:00:00 SPEED=2.0x "
        "ELAPSED=00:00:00 BYTES_DONE=1000",
        events.back());
    EXPECT_DOUBLE_EQ(100.0, reporter.last_percent());

    reporter.finalize(true);
    EXPECT_EQ(1u, sink.events("EVENT=PROGRESS").size());
}

TEST_F(FfmpegProgressReporterTest, ReportsPercentAndSpeedAdjustedEta) {
    FfmpegProgressReporter reporter(sink, 10.0, clock.fn());
    clock.advance(std::chrono::seconds(65));
    feed(reporter, {"out_time_us=2500000", "speed=2.0x", "progress=continue"});

    const auto events = sink.events("EVENT=PROGRESS");
    ASSERT_EQ(1u, events.size());
    EXPECT_EQ(
        "EVENT=PROGRESS BACKEND=ffmpeg PCT=25.0 ETA=00:00:04 SPEED=2.0x ELAPSED=00:01:05",
        events.back());
}

TEST_F(FfmpegProgressReporterTest, EtaIsRemainingWithoutUsableSpeed) {
    FfmpegProgressReporter reporter(sink, 100.0, clock.fn());
    feed(reporter, {"out_time_us=40000000", "speed=N/A", "progress=continue"});

    const auto events = sink.events("EVENT=PROGRESS");
    ASSERT_EQ(1u, events.size());
    EXPECT_EQ(
        "EVENT=PROGRESS BACKEND=ffmpeg PCT=40.0 ETA=00:01:00 SPEED=N/A ELAPSED=00:00:00",
        events.back());
}

TEST_F(FfmpegProgressReporterTest, FinalizeEmitsOneCompletionBelowHundred) {
    FfmpegProgressReporter reporter(sink, 10.0, clock.fn());
    feed(reporter, {"out_time_us=5000000", "progress=continue"});
    ASSERT_DOUBLE_EQ(50.0, reporter.last_percent());

    reporter.finalize(true);
    reporter.finalize(true);

    const auto events = sink.events("EVENT=PROGRESS");
    ASSERT_EQ(2u, events.size());
    EXPECT_EQ(
        "EVENT=PROGRESS BACKEND=ffmpeg PCT=100.0 ETA=00:00:00 ELAPSED=00:00:00",
        events.back());
}

TEST_F(FfmpegProgressReporterTest, FinalizeAfterFailureEmitsNothing) {
    FfmpegProgressReporter reporter(sink, 10.0, clock.fn());
    feed(reporter, {"out_time_us=1000000", "progress=continue"});
    reporter.finalize(false);
    EXPECT_EQ(1u, sink.events("EVENT=PROGRESS").size());
}

TEST_F(FfmpegProgressReporterTest, UnknownDurationShowsSpinner) {
    FfmpegProgressReporter reporter(sink, 0.0, clock.fn());
    feed(reporter, {"out_time_us=1000000", "total_size=2048", "progress=continue"});
    reporter.finalize(true);

    const auto events = sink.events("EVENT=PROGRESS");
    ASSERT_EQ(1u, events.size());
    EXPECT_EQ(
        "EVENT=PROGRESS BACKEND=ffmpeg ELAPSED=00:00:00 BYTES_DONE=2048 SPINNER=true",
        events.back());
    EXPECT_LT(reporter.last_percent(), 0.0);
}

TEST_F(FfmpegProgressReporterTest, IgnoresStdoutAndNoise) {
    FfmpegProgressReporter reporter(sink, 10.0, clock.fn());
    reporter.handle_line(StreamKind::Stdout, "out_time_us=5000000");
    reporter.handle_line(StreamKind::Stdout, "progress=continue");
    reporter.handle_line(StreamKind::Stderr, "[mpeg @ 0x1234] some warning");
    reporter.handle_line(StreamKind::Stderr, "=orphan");
    reporter.handle_idle();
    EXPECT_TRUE(sink.events("EVENT=PROGRESS").empty());
}

TEST_F(FfmpegProgressReporterTest, BlockFieldsResetAfterEachProgressLine) {
    FfmpegProgressReporter reporter(sink, 10.0, clock.fn());
    feed(reporter, {"out_time_us=2000000", "total_size=500", "progress=continue"});
    feed(reporter, {"out_time_us=4000000", "progress=continue"});

    const auto events = sink.events("EVENT=PROGRESS");
    ASSERT_EQ(2u, events.size());
    EXPECT_NE(std::string::npos, events[0].find("BYTES_DONE=500"));
    EXPECT_EQ(std::string::npos, events[1].find("BYTES_DONE="));
    EXPECT_NE(std::string::npos, events[1].find("PCT=40.0"));
}

TEST_F(FfmpegProgressReporterTest, NegativeTimestampSentinelIsIgnored) {
    FfmpegProgressReporter reporter(sink, 5700.0, clock.fn());
    feed(reporter, {"out_time_us=-9223372036854775807", "speed=N/A", "progress=continue"});

    const auto events = sink.events("EVENT=PROGRESS");
    ASSERT_EQ(1u, events.size());
    EXPECT_EQ("EVENT=PROGRESS BACKEND=ffmpeg SPEED=N/A ELAPSED=00:00:00", events.back());
    EXPECT_LT(reporter.last_percent(), 0.0);

    feed(reporter, {"out_time_us=570000000", "progress=continue"});
    EXPECT_DOUBLE_EQ(10.0, reporter.last_percent());
}

TEST_F(FfmpegProgressReporterTest, TinySpeedClampsEta) {
    FfmpegProgressReporter reporter(sink, 10.0, clock.fn());
    feed(reporter, {"out_time_us=1000000", "speed=1e-300x", "progress=continue"});

    const auto events = sink.events("EVENT=PROGRESS");
    ASSERT_EQ(1u, events.size());
    EXPECT_EQ(
        "EVENT=PROGRESS BACKEND=ffmpeg PCT=10.0 ETA=99:59:59 SPEED=1e-300x ELAPSED=00:00:00",
        events.back());
}
