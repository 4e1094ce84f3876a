// discrip - Disc video ripper
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <glib.h>

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

#include "internal.h"

using namespace discrip::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static void replace_cstr(
    const char*& target,
    const std::string& value) {

    release_cstr(target);
    target = make_cstr_copy(value);
}

static std::string strip_inline_comment_value(
    const std::string& raw) {

    bool in_single = false;
    bool in_double = false;
    bool escaped = false;
    for (size_t i = 0; i < raw.size(); ++i) {
        const char ch = raw[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (ch == '\\') {
            escaped = true;
            continue;
        }
        if (ch == '\'' && !in_double) {
            in_single = !in_single;
            continue;
        }
        if (ch == '"' && !in_single) {
            in_double = !in_double;
            continue;
        }
        if (!in_single && !in_double && (ch == '#' || ch == ';')) {
            if (i == 0 || std::isspace(static_cast<unsigned char>(raw[i - 1]))) {
                return trim(raw.substr(0, i));
            }
        }
    }
    return trim(raw);
}

static bool parse_bool_value(
    const std::string& raw,
    bool& out) {

    const std::string value = to_lower(trim(raw));
    if (value == "true" || value == "1") {
        out = true;
        return true;
    }
    if (value == "false" || value == "0") {
        out = false;
        return true;
    }
    return false;
}

static bool parse_log_level(
    const std::string& raw,
    DiscRipLogLevels& out) {

    const std::string value = to_lower(trim(raw));
    if (value == "debug") {
        out = DISCRIP_LOG_DEBUG;
        return true;
    }
    if (value == "info") {
        out = DISCRIP_LOG_INFO;
        return true;
    }
    if (value == "warning" || value == "warn") {
        out = DISCRIP_LOG_WARNING;
        return true;
    }
    return false;
}

static std::string expand_home(
    const std::string& path) {

    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;
    const char* home = g_get_home_dir();
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

static DiscRipConfig* make_default_config() {
    auto* cfg = new DiscRipConfig{};
    cfg->device = nullptr;
    const char* home = g_get_home_dir();
    const std::filesystem::path videos = std::filesystem::path(home ? home : ".") / "Videos";
    cfg->output_directory = make_cstr_copy(videos.string());
    cfg->dry_run = false;
    cfg->compression = false;
    cfg->poll_interval_ms = 250;
    cfg->size_throttle_ms = 300;
    cfg->probe_command = make_cstr_copy("isoinfo");
    cfg->naming.separator = '_';
    cfg->naming.lowercase = false;
    cfg->log_level = DISCRIP_LOG_INFO;
    cfg->config_path = nullptr;
    return cfg;
}

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

DiscRipConfig* discrip_load_config(
    const char* path,
    const char** error) {

    clear_error(error);

    auto* cfg = make_default_config();
    GKeyFile* key_file = g_key_file_new();
    bool loaded = false;
    std::string loaded_path;

    auto fail = [&](const std::string& message) -> DiscRipConfig* {
        set_error(error, message);
        discrip_release_config(cfg);
        g_key_file_unref(key_file);
        return nullptr;
    };

    auto fail_gerror = [&](GError* gerr, const char* fallback) -> DiscRipConfig* {
        const std::string msg = (gerr && gerr->message) ? gerr->message : fallback;
        if (gerr) g_error_free(gerr);
        return fail(msg);
    };

    std::vector<std::string> candidates;
    if (path) {
        candidates.emplace_back(expand_home(path));
    } else {
        candidates.emplace_back("discrip.conf");
        const char* home = std::getenv("HOME");
        if (home) {
            const std::filesystem::path home_path = std::filesystem::path(home) / ".discrip.conf";
            candidates.emplace_back(home_path.string());
        }
    }

    for (const auto& candidate : candidates) {
        GError* gerr = nullptr;
        if (g_key_file_load_from_file(key_file, candidate.c_str(), G_KEY_FILE_NONE, &gerr)) {
            loaded = true;
            loaded_path = candidate;
            break;
        }
        if (gerr) {
            if (path) {
                return fail_gerror(gerr, "Failed to load config");
            }
            g_error_free(gerr);
        }
    }

    if (!loaded) {
        g_key_file_unref(key_file);
        return cfg;
    }

    // Reads group/key with inline comments stripped. Returns false on a
    // GLib read error (already reported through error).
    std::string read_error;
    auto read_value = [&](const char* group, const char* key, std::optional<std::string>& out) -> bool {
        out.reset();
        if (!g_key_file_has_key(key_file, group, key, nullptr)) return true;
        GError* gerr = nullptr;
        char* value = g_key_file_get_string(key_file, group, key, &gerr);
        if (!value) {
            read_error = (gerr && gerr->message)
                ? gerr->message
                : std::string("Failed to parse ") + key;
            if (gerr) g_error_free(gerr);
            return false;
        }
        out = strip_inline_comment_value(value);
        g_free(value);
        return true;
    };

    std::optional<std::string> value;

    // [discrip] group
    if (!read_value("discrip", "device", value)) return fail(read_error);
    if (value && !value->empty()) replace_cstr(cfg->device, *value);

    if (!read_value("discrip", "output_directory", value)) return fail(read_error);
    if (value) {
        if (value->empty()) return fail("Invalid output_directory value");
        replace_cstr(cfg->output_directory, expand_home(*value));
    }

    if (!read_value("discrip", "dry_run", value)) return fail(read_error);
    if (value && !parse_bool_value(*value, cfg->dry_run)) {
        return fail("Invalid dry_run value");
    }

    if (!read_value("discrip", "compression", value)) return fail(read_error);
    if (value && !parse_bool_value(*value, cfg->compression)) {
        return fail("Invalid compression value");
    }

    // [progress] group
    if (!read_value("progress", "poll_interval_ms", value)) return fail(read_error);
    if (value) {
        int parsed = 0;
        if (!parse_int_strict(*value, parsed) || parsed <= 0) {
            return fail("Invalid poll_interval_ms value");
        }
        cfg->poll_interval_ms = parsed;
    }

    if (!read_value("progress", "size_throttle_ms", value)) return fail(read_error);
    if (value) {
        int parsed = 0;
        if (!parse_int_strict(*value, parsed) || parsed <= 0) {
            return fail("Invalid size_throttle_ms value");
        }
        cfg->size_throttle_ms = parsed;
    }

    if (!read_value("progress", "probe_command", value)) return fail(read_error);
    if (value) {
        if (value->empty()) return fail("Invalid probe_command value");
        replace_cstr(cfg->probe_command, *value);
    }

    // [naming] group
    if (!read_value("naming", "separator", value)) return fail(read_error);
    if (value) {
        if (value->size() != 1) return fail("Invalid separator value");
        cfg->naming.separator = value->front();
    }

    if (!read_value("naming", "lowercase", value)) return fail(read_error);
    if (value && !parse_bool_value(*value, cfg->naming.lowercase)) {
        return fail("Invalid lowercase value");
    }

    // [logging] group
    if (!read_value("logging", "level", value)) return fail(read_error);
    if (value && !parse_log_level(*value, cfg->log_level)) {
        return fail("Invalid logging level value");
    }

    g_key_file_unref(key_file);
    cfg->config_path = make_cstr_copy(loaded_path);
    return cfg;
}

void discrip_release_config(
    DiscRipConfig* cfg) {

    if (!cfg) return;
    release_cstr(cfg->device);
    release_cstr(cfg->output_directory);
    release_cstr(cfg->probe_command);
    release_cstr(cfg->config_path);
    delete cfg;
}

};
