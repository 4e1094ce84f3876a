// discrip - Disc video ripper
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include <glib.h>

#include "internal.h"
#include "progress.h"

using namespace discrip::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

constexpr uint64_t kSectorBytes = 2048;

static const std::string volume_size_marker = "Volume size is:";

/* ------------------------------------------------------------------- */

namespace discrip::detail {

uint64_t directory_size_bytes(const std::string& path) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(path, ec)) return 0;

    uint64_t total = 0;
    fs::recursive_directory_iterator it(
        path, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;
    while (!ec && it != end) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) {
            const auto size = it->file_size(entry_ec);
            if (!entry_ec) total += static_cast<uint64_t>(size);
        }
        it.increment(ec);
    }
    return total;
}

std::optional<uint64_t> parse_volume_size_bytes(const std::string& output) {
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        const auto pos = line.find(volume_size_marker);
        if (pos == std::string::npos) continue;
        const std::string raw = trim(line.substr(pos + volume_size_marker.size()));
        if (raw.empty() || !std::all_of(raw.begin(), raw.end(),
                [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
            continue;
        }
        try {
            return static_cast<uint64_t>(std::stoull(raw)) * kSectorBytes;
        } catch (const std::out_of_range&) {
            continue;
        }
    }
    return std::nullopt;
}

std::optional<uint64_t> probe_volume_bytes(
    const std::string& probe_command,
    const std::string& device,
    EventSink& sink) {

    if (probe_command.empty() || device.empty()) return std::nullopt;

    const char* argv[] = {
        probe_command.c_str(), "-d", "-i", device.c_str(), nullptr,
    };
    gchar* out = nullptr;
    gint wait_status = 0;
    GError* gerr = nullptr;
    if (!g_spawn_sync(
            nullptr,
            const_cast<gchar**>(argv),
            nullptr,
            static_cast<GSpawnFlags>(G_SPAWN_SEARCH_PATH | G_SPAWN_STDERR_TO_DEV_NULL),
            nullptr,
            nullptr,
            &out,
            nullptr,
            &wait_status,
            &gerr)) {
        sink.debug(
            "Volume size probe with " + probe_command + " failed: " +
            (gerr ? gerr->message : "unknown"));
        g_clear_error(&gerr);
        return std::nullopt;
    }

    const std::string output = out ? out : "";
    g_free(out);
    const auto bytes = parse_volume_size_bytes(output);
    if (!bytes) {
        sink.debug("Volume size probe with " + probe_command + " reported no volume size");
    }
    return bytes;
}

DvdbackupProgressReporter::DvdbackupProgressReporter(
    EventSink& sink,
    std::string target_dir,
    std::optional<uint64_t> total_bytes,
    std::chrono::milliseconds throttle,
    ClockFn clock,
    DirectorySizer sizer)
    : sink_(sink),
      target_dir_(std::move(target_dir)),
      total_bytes_(total_bytes && *total_bytes > 0 ? total_bytes : std::nullopt),
      throttle_(throttle),
      clock_(std::move(clock)),
      sizer_(std::move(sizer)),
      started_(clock_()) {
}

void DvdbackupProgressReporter::handle_idle() {
    const auto now = clock_();
    if (last_poll_ && now - *last_poll_ < throttle_) return;
    last_poll_ = now;
    sample(false);
}

void DvdbackupProgressReporter::finalize(bool success) {
    if (!success) return;
    last_poll_ = clock_();
    sample(true);
}

void DvdbackupProgressReporter::sample(bool force) {
    const uint64_t bytes = sizer_(target_dir_);
    if (!force && bytes == last_bytes_) return;
    last_bytes_ = bytes;

    const double elapsed = std::chrono::duration<double>(clock_() - started_).count();
    std::ostringstream oss;
    oss << "EVENT=PROGRESS BACKEND=dvdbackup";
    if (total_bytes_) {
        const double pct = std::min(
            100.0,
            static_cast<double>(bytes) / static_cast<double>(*total_bytes_) * 100.0);
        oss << " PCT=" << format_percent(pct);
    }
    oss << " ELAPSED=" << format_clock(elapsed)
        << " BYTES_DONE=" << bytes;
    if (total_bytes_) {
        oss << " BYTES_TOTAL=" << *total_bytes_;
    } else {
        oss << " BYTES_TOTAL=unknown SPINNER=true";
    }
    sink_.event(oss.str());
}

/* ------------------------------------------------------------------- */

std::unique_ptr<ProgressReporter> make_progress_reporter(
    const DiscRipPlan& plan,
    EventSink& sink,
    const ReporterSettings& settings) {

    const std::vector<std::string> command = plan_command(plan);
    const std::string tool = command.empty() ? std::string{} : path_basename(command.front());

    if (tool == "ffmpeg") {
        return std::make_unique<FfmpegProgressReporter>(sink, plan.title.duration_sec);
    }
    if (tool == "dvdbackup") {
        // dvdbackup -o <parent> -n <label> writes below <parent>/<label>.
        std::string output_dir;
        std::string label;
        for (size_t i = 0; i + 1 < command.size(); ++i) {
            if (command[i] == "-o") output_dir = command[i + 1];
            if (command[i] == "-n") label = command[i + 1];
        }
        const std::string target = (std::filesystem::path(output_dir) / label).string();
        const auto total = probe_volume_bytes(
            settings.probe_command, to_string_or_empty(plan.device), sink);
        return std::make_unique<DvdbackupProgressReporter>(
            sink, target, total, settings.size_throttle);
    }
    return std::make_unique<NullProgressReporter>();
}

}  // namespace discrip::detail
