// discrip - Disc video ripper
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include <glib.h>

#include "internal.h"

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

// 99:59:59
constexpr double kMaxClockSeconds = 99 * 3600 + 59 * 60 + 59;

static bool is_shell_safe(const std::string& arg) {
    if (arg.empty()) return false;
    for (unsigned char ch : arg) {
        if (std::isalnum(ch)) continue;
        if (std::strchr("@%+=:,./-_", ch) != nullptr) continue;
        return false;
    }
    return true;
}

/* ------------------------------------------------------------------- */

namespace discrip::detail {

std::string shell_quote(const std::string& arg) {
    if (is_shell_safe(arg)) return arg;
    gchar* quoted = g_shell_quote(arg.c_str());
    std::string result = quoted ? quoted : "''";
    g_free(quoted);
    return result;
}

std::string shell_join(const std::vector<std::string>& argv) {
    std::ostringstream oss;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) oss << " ";
        oss << shell_quote(argv[i]);
    }
    return oss.str();
}

std::string format_clock(double seconds) {
    if (!(seconds > 0.0)) seconds = 0.0;
    if (seconds > kMaxClockSeconds) seconds = kMaxClockSeconds;
    const long t = static_cast<long>(seconds + 0.5);
    const long h = t / 3600;
    const long m = (t / 60) % 60;
    const long s = t % 60;
    std::ostringstream os;
    os << std::setw(2) << std::setfill('0') << h << ":"
       << std::setw(2) << std::setfill('0') << m << ":"
       << std::setw(2) << std::setfill('0') << s;
    return os.str();
}

std::string format_percent(double pct) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << pct;
    return os.str();
}

std::string quote_event_value(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char ch : value) {
        if (ch == '"' || ch == '\\') out.push_back('\\');
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

std::string path_basename(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

}  // namespace discrip::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

char* discrip_quote_event_value(
    const char* value) {

    return discrip::detail::make_mutable_cstr_copy(
        discrip::detail::quote_event_value(discrip::detail::to_string_or_empty(value)));
}

};
