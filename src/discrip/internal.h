#pragma once

// discrip - Disc video ripper
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>

#include <cctype>
#include <cstring>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include "discrip/discrip.h"

/* ------------------------------------------------------------------- */

namespace discrip::detail {

static inline const char* make_cstr_copy(const std::string& s) {
    auto* buf = new char[s.size() + 1];
    std::memcpy(buf, s.c_str(), s.size() + 1);
    return buf;
}

static inline const char* make_cstr_copy(const char* s) {
    return make_cstr_copy(s ? std::string{s} : std::string{});
}

static inline char* make_mutable_cstr_copy(const std::string& s) {
    auto* buf = new char[s.size() + 1];
    std::memcpy(buf, s.c_str(), s.size() + 1);
    return buf;
}

static inline std::string to_string_or_empty(const char* s) {
    return s ? std::string{s} : std::string{};
}

static inline std::string to_lower(const std::string& s) {
    std::string r;
    r.reserve(s.size());
    for (unsigned char c : s) r.push_back(static_cast<char>(std::tolower(c)));
    return r;
}

static inline std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    size_t end = s.find_last_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    return s.substr(start, end - start + 1);
}

static inline bool parse_int_strict(const std::string& s, int& out) {
    const std::string trimmed = trim(s);
    if (trimmed.empty()) return false;
    size_t idx = 0;
    try {
        int value = std::stoi(trimmed, &idx);
        if (idx != trimmed.size()) return false;
        out = value;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

static inline bool parse_double_strict(const std::string& s, double& out) {
    const std::string trimmed = trim(s);
    if (trimmed.empty()) return false;
    size_t idx = 0;
    try {
        double value = std::stod(trimmed, &idx);
        if (idx != trimmed.size()) return false;
        out = value;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

static inline void release_cstr(const char*& s) {
    delete[] s;
    s = nullptr;
}

static inline void set_error(const char** error, const std::string& message) {
    if (!error || *error) return;
    *error = make_cstr_copy(message);
}

static inline void clear_error(const char** error) {
    if (!error) return;
    discrip_release_error(*error);
    *error = nullptr;
}

static inline std::vector<std::string> to_string_vector(
    const char* const* argv,
    size_t count) {

    std::vector<std::string> result;
    result.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        result.push_back(to_string_or_empty(argv[i]));
    }
    return result;
}

static inline const char** make_cstr_array(const std::vector<std::string>& values) {
    auto** arr = new const char*[values.size()]{};
    for (size_t i = 0; i < values.size(); ++i) {
        arr[i] = make_cstr_copy(values[i]);
    }
    return arr;
}

static inline void release_cstr_array(const char**& arr, size_t count) {
    if (!arr) return;
    for (size_t i = 0; i < count; ++i) {
        release_cstr(arr[i]);
    }
    delete[] arr;
    arr = nullptr;
}

/* ------------------------------------------------------------------- */
/* Formatting helpers shared by the executor, reporters and the CLI */

// Quote one argument the way a POSIX shell reads it back.
std::string shell_quote(const std::string& arg);
std::string shell_join(const std::vector<std::string>& argv);

// HH:MM:SS, clamped to 00:00:00..99:59:59.
std::string format_clock(double seconds);

// One decimal digit, as used by PCT=.
std::string format_percent(double pct);

// Double-quoted event value with backslash escaping.
std::string quote_event_value(const std::string& value);

std::string path_basename(const std::string& path);

/* ------------------------------------------------------------------- */
/* Plan helpers */

void copy_title_info(
    DiscRipTitleInfo& dst,
    const DiscRipTitleInfo& src);

void release_title_info(
    DiscRipTitleInfo& title);

void release_plan_members(
    DiscRipPlan& plan);

static inline std::vector<std::string> plan_command(const DiscRipPlan& plan) {
    return to_string_vector(plan.command, plan.command_count);
}

}  // namespace discrip::detail
