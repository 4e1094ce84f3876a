// discrip - Disc video ripper
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <algorithm>
#include <chrono>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include "internal.h"
#include "progress.h"

using namespace discrip::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static std::optional<double> field_number(
    const std::map<std::string, std::string>& fields,
    const std::string& key) {

    const auto it = fields.find(key);
    if (it == fields.end()) return std::nullopt;
    double value = 0.0;
    if (!parse_double_strict(it->second, value)) return std::nullopt;
    return value;
}

// "2.03x" => 2.03; "N/A" and non-positive values yield nothing.
static std::optional<double> parse_speed(const std::string& token) {
    std::string value = trim(token);
    if (value.empty() || (value.back() != 'x' && value.back() != 'X')) return std::nullopt;
    value.pop_back();
    double speed = 0.0;
    if (!parse_double_strict(value, speed) || speed <= 0.0) return std::nullopt;
    return speed;
}

// Encoded position in seconds. ffmpeg reports out_time_us in microseconds;
// out_time_ms is taken as milliseconds. Negative values (the no-timestamp
// sentinel of early blocks) count as absent.
static std::optional<double> out_time_sec(
    const std::map<std::string, std::string>& fields) {

    std::optional<double> sec;
    if (const auto us = field_number(fields, "out_time_us")) {
        sec = *us / 1000000.0;
    } else if (const auto ms = field_number(fields, "out_time_ms")) {
        sec = *ms / 1000.0;
    }
    if (!sec || !(*sec >= 0.0)) return std::nullopt;
    return sec;
}

/* ------------------------------------------------------------------- */

namespace discrip::detail {

FfmpegProgressReporter::FfmpegProgressReporter(
    EventSink& sink,
    double duration_sec,
    ClockFn clock)
    : sink_(sink),
      duration_sec_(duration_sec > 0.0 ? duration_sec : 0.0),
      clock_(std::move(clock)),
      started_(clock_()) {
}

double FfmpegProgressReporter::elapsed_sec() const {
    return std::chrono::duration<double>(clock_() - started_).count();
}

void FfmpegProgressReporter::handle_line(
    StreamKind stream,
    const std::string& line) {

    if (stream != StreamKind::Stderr) return;
    const std::string text = trim(line);
    const auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0) return;

    const std::string key = trim(text.substr(0, eq));
    const std::string value = trim(text.substr(eq + 1));
    if (key == "progress") {
        emit_block(value == "end");
        fields_.clear();
        return;
    }
    fields_[key] = value;
}

void FfmpegProgressReporter::emit_block(bool end) {
    std::optional<double> pct;
    std::optional<double> remaining;

    if (duration_sec_ > 0.0) {
        if (const auto position = out_time_sec(fields_)) {
            pct = std::min(100.0, *position / duration_sec_ * 100.0);
            remaining = std::max(0.0, duration_sec_ - *position);
        }
        // The final block can lag behind the real end; clamp it.
        if (end) {
            pct = 100.0;
            remaining = 0.0;
        }
    }

    const auto speed_it = fields_.find("speed");
    const std::string speed_token = speed_it != fields_.end() ? speed_it->second : std::string{};

    std::ostringstream oss;
    oss << "EVENT=PROGRESS BACKEND=ffmpeg";
    if (pct) {
        oss << " PCT=" << format_percent(*pct);
        const auto speed = parse_speed(speed_token);
        const double eta = speed ? *remaining / *speed : *remaining;
        oss << " ETA=" << format_clock(eta);
    }
    if (!speed_token.empty()) {
        oss << " SPEED=" << speed_token;
    }
    oss << " ELAPSED=" << format_clock(elapsed_sec());
    if (const auto total_size = field_number(fields_, "total_size")) {
        if (*total_size >= 0.0) {
            oss << " BYTES_DONE=" << static_cast<uint64_t>(*total_size);
        }
    }
    if (!pct && duration_sec_ <= 0.0) {
        oss << " SPINNER=true";
    }
    sink_.event(oss.str());

    if (pct) last_percent_ = *pct;
}

void FfmpegProgressReporter::finalize(bool success) {
    if (!success || duration_sec_ <= 0.0) return;
    if (last_percent_ >= 100.0) return;

    std::ostringstream oss;
    oss << "EVENT=PROGRESS BACKEND=ffmpeg"
        << " PCT=" << format_percent(100.0)
        << " ETA=" << format_clock(0.0)
        << " ELAPSED=" << format_clock(elapsed_sec());
    sink_.event(oss.str());
    last_percent_ = 100.0;
}

}  // namespace discrip::detail
