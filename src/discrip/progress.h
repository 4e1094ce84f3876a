#pragma once

// discrip - Disc video ripper
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "discrip/discrip.h"
#include "events.h"

namespace discrip::detail {

using Clock = std::chrono::steady_clock;
using ClockFn = std::function<Clock::time_point()>;

enum class StreamKind {
    Stdout,
    Stderr,
};

static inline const char* stream_name(StreamKind stream) {
    return stream == StreamKind::Stdout ? "stdout" : "stderr";
}

// Translates one backend run into EVENT=PROGRESS lines.
// One instance lives for exactly one process run.
class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    virtual void handle_line(StreamKind stream, const std::string& line) = 0;
    virtual void handle_idle() = 0;
    virtual void finalize(bool success) = 0;
};

class NullProgressReporter final : public ProgressReporter {
public:
    void handle_line(StreamKind, const std::string&) override {}
    void handle_idle() override {}
    void finalize(bool) override {}
};

/* ------------------------------------------------------------------- */

// Parses "ffmpeg -progress pipe:2" key=value blocks from stderr.
class FfmpegProgressReporter final : public ProgressReporter {
public:
    FfmpegProgressReporter(
        EventSink& sink,
        double duration_sec,
        ClockFn clock = &Clock::now);

    void handle_line(StreamKind stream, const std::string& line) override;
    void handle_idle() override {}
    void finalize(bool success) override;

    // Negative until a percentage has been reported.
    double last_percent() const { return last_percent_; }

private:
    void emit_block(bool end);
    double elapsed_sec() const;

    EventSink& sink_;
    double duration_sec_;
    ClockFn clock_;
    Clock::time_point started_;
    std::map<std::string, std::string> fields_;
    double last_percent_{-1.0};
};

/* ------------------------------------------------------------------- */

using DirectorySizer = std::function<uint64_t(const std::string&)>;

// Sum of regular file sizes below path; 0 when missing or unreadable.
uint64_t directory_size_bytes(const std::string& path);

// Extracts "Volume size is: <sectors>" and converts to bytes.
std::optional<uint64_t> parse_volume_size_bytes(const std::string& output);

// Runs "<probe_command> -d -i <device>" and parses its volume size.
std::optional<uint64_t> probe_volume_bytes(
    const std::string& probe_command,
    const std::string& device,
    EventSink& sink);

// dvdbackup has no progress channel; the output directory size stands in.
class DvdbackupProgressReporter final : public ProgressReporter {
public:
    DvdbackupProgressReporter(
        EventSink& sink,
        std::string target_dir,
        std::optional<uint64_t> total_bytes,
        std::chrono::milliseconds throttle,
        ClockFn clock = &Clock::now,
        DirectorySizer sizer = &directory_size_bytes);

    void handle_line(StreamKind, const std::string&) override {}
    void handle_idle() override;
    void finalize(bool success) override;

    const std::string& target_dir() const { return target_dir_; }
    std::optional<uint64_t> total_bytes() const { return total_bytes_; }

private:
    void sample(bool force);

    EventSink& sink_;
    std::string target_dir_;
    std::optional<uint64_t> total_bytes_;
    std::chrono::milliseconds throttle_;
    ClockFn clock_;
    DirectorySizer sizer_;
    Clock::time_point started_;
    std::optional<Clock::time_point> last_poll_;
    uint64_t last_bytes_{0};
};

/* ------------------------------------------------------------------- */

struct ReporterSettings {
    std::chrono::milliseconds size_throttle{300};
    std::string probe_command{"isoinfo"};
};

// Selects the reporter for a plan by the basename of command[0].
std::unique_ptr<ProgressReporter> make_progress_reporter(
    const DiscRipPlan& plan,
    EventSink& sink,
    const ReporterSettings& settings);

}  // namespace discrip::detail
