// discrip - Disc video ripper
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include "discrip/discrip.h"
#include "version.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <glib.h>

#include <unistd.h>

#define DISCRIP_LOG_DOMAIN "discrip"

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitDiscNotDetected = 1;
constexpr int kExitUnexpectedError = 3;

std::string view_string(const char* s) {
    return s ? std::string{s} : std::string{};
}

std::string quote_value(const std::string& value) {
    char* quoted = discrip_quote_event_value(value.c_str());
    const std::string result = view_string(quoted);
    discrip_release_string(quoted);
    return result;
}

void print_error(const std::string& message) {
    std::cerr << "Error: " << message << "\n";
}

/* ------------------------------------------------------------------- */

DiscRipLogLevels g_min_level = DISCRIP_LOG_INFO;

void log_handler(
    const gchar* log_domain,
    GLogLevelFlags log_level,
    const gchar* message,
    gpointer) {

    const char* tag = "INFO";
    if (log_level & G_LOG_LEVEL_DEBUG) tag = "DEBUG";
    else if (log_level & (G_LOG_LEVEL_WARNING | G_LOG_LEVEL_CRITICAL | G_LOG_LEVEL_ERROR)) tag = "WARNING";
    std::cerr << tag << ":" << (log_domain ? log_domain : "") << ":" << (message ? message : "") << "\n";
}

void forward_event(
    DiscRipLogLevels level,
    const char* message,
    void*) {

    if (level < g_min_level) return;
    GLogLevelFlags flags = G_LOG_LEVEL_MESSAGE;
    switch (level) {
        case DISCRIP_LOG_DEBUG:
            flags = G_LOG_LEVEL_DEBUG;
            break;
        case DISCRIP_LOG_WARNING:
            flags = G_LOG_LEVEL_WARNING;
            break;
        default:
            flags = G_LOG_LEVEL_MESSAGE;
            break;
    }
    g_log(DISCRIP_LOG_DOMAIN, flags, "%s", message ? message : "");
}

void log_info(const std::string& message) {
    forward_event(DISCRIP_LOG_INFO, message.c_str(), nullptr);
}

/* ------------------------------------------------------------------- */

// ASCII letters and digits survive; everything else collapses into one separator.
std::string sanitize_component(
    const std::string& value,
    const DiscRipNamingConfig& naming) {

    gchar* ascii = g_str_to_ascii(value.c_str(), "C");
    const std::string folded = ascii ? ascii : "";
    g_free(ascii);

    const char separator = std::isalnum(static_cast<unsigned char>(naming.separator)) ||
        naming.separator == '-' || naming.separator == '_'
        ? naming.separator
        : '_';

    std::string result;
    bool previous_separator = false;
    for (unsigned char ch : folded) {
        if (std::isalnum(ch)) {
            result.push_back(static_cast<char>(ch));
            previous_separator = false;
        } else if (!previous_separator) {
            result.push_back(separator);
            previous_separator = true;
        }
    }
    while (!result.empty() && result.front() == separator) result.erase(result.begin());
    while (!result.empty() && result.back() == separator) result.pop_back();
    if (result.empty()) result = "untitled";
    if (naming.lowercase) {
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    }
    return result;
}

struct NamingContext {
    std::string output_directory;
    std::string disc_label;
    bool series{false};
    DiscRipNamingConfig naming{};
};

char* make_destination(
    const DiscRipTitleInfo* title,
    const char* episode_code,
    int,
    void* user_data,
    char** error) {

    const auto* ctx = static_cast<const NamingContext*>(user_data);
    const std::string label = sanitize_component(view_string(title->label), ctx->naming);
    if (!ctx->series) {
        gchar* path = g_build_filename(ctx->output_directory.c_str(), (label + ".mp4").c_str(), nullptr);
        return path;
    }
    if (!episode_code) {
        if (error) *error = g_strdup("Series classification requires episode codes for destination planning");
        return nullptr;
    }
    const std::string series = sanitize_component(ctx->disc_label, ctx->naming);
    const std::string filename = series + "-" + episode_code + "_" + label + ".mp4";
    return g_build_filename(ctx->output_directory.c_str(), series.c_str(), filename.c_str(), nullptr);
}

/* ------------------------------------------------------------------- */

struct TitleArg {
    std::string label;
    double duration_sec{0.0};
};

struct Options {
    std::optional<std::string> device;
    std::optional<std::string> output_directory;
    std::optional<bool> dry_run;
    std::string config_file;
    std::string disc_label;
    bool series = false;
    bool verbose = false;
    std::vector<TitleArg> titles;
};

bool parse_title_arg(const std::string& raw, TitleArg& out) {
    const auto pos = raw.rfind('=');
    if (pos == std::string::npos) {
        out.label = raw;
        out.duration_sec = 0.0;
        return !raw.empty();
    }
    out.label = raw.substr(0, pos);
    const std::string minutes = raw.substr(pos + 1);
    try {
        size_t idx = 0;
        const double value = std::stod(minutes, &idx);
        if (idx != minutes.size() || value < 0.0) return false;
        out.duration_sec = value * 60.0;
    } catch (const std::logic_error&) {
        return false;
    }
    return true;
}

Options parse_args(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-d" || arg == "--device") && i + 1 < argc) {
            opts.device = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            opts.output_directory = argv[++i];
        } else if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
            opts.config_file = argv[++i];
        } else if ((arg == "-l" || arg == "--label") && i + 1 < argc) {
            opts.disc_label = argv[++i];
        } else if ((arg == "-t" || arg == "--title") && i + 1 < argc) {
            TitleArg title;
            const std::string raw = argv[++i];
            if (!parse_title_arg(raw, title)) {
                std::cerr << "Error: -t/--title expects \"label=minutes\", got \"" << raw << "\"\n";
                std::exit(kExitUnexpectedError);
            }
            opts.titles.push_back(title);
        } else if (arg == "-n" || arg == "--dry-run") {
            opts.dry_run = true;
        } else if (arg == "-s" || arg == "--series") {
            opts.series = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-?" || arg == "-h" || arg == "--help") {
            std::cout << "Usage: discrip [-d device] [-o dir] [-i config] [-n] [-s] [-l label] [-v] -t label=minutes [-t ...]\n";
            std::cout << "  -d / --device: Optical device path (default: auto-detect)\n";
            std::cout << "  -o / --output: Output directory (default: ~/Videos)\n";
            std::cout << "  -i / --input: discrip config file path (default search: ./discrip.conf --> ~/.discrip.conf)\n";
            std::cout << "  -n / --dry-run: Print the rip commands without executing them\n";
            std::cout << "  -s / --series: Treat titles as episodes numbered s01e01, s01e02, ...\n";
            std::cout << "  -l / --label: Disc label used for series directories (default: \"disc\")\n";
            std::cout << "  -t / --title: Title to rip as \"label=minutes\" (repeatable)\n";
            std::cout << "  -v / --verbose: Enable debug logging\n";
            std::exit(0);
        } else {
            std::cerr << "Warning: ignoring unknown argument \"" << arg << "\"\n";
        }
    }
    return opts;
}

bool is_readable_device(const std::string& path) {
    if (path.empty()) return false;
    if (!g_file_test(path.c_str(), G_FILE_TEST_EXISTS)) return false;
    return ::access(path.c_str(), R_OK) == 0;
}

void emit_compression_plan(const DiscRipPlan& plan, bool executed) {
    char* command = discrip_compression_command(&plan);
    char* output = discrip_compression_output_path(&plan);
    const std::string message =
        std::string("EVENT=COMPRESS_PLAN STATUS=") + (executed ? "ready" : "dry-run") +
        " SOURCE=" + quote_value(view_string(plan.destination)) +
        " OUTPUT=" + quote_value(view_string(output)) +
        " COMMAND=" + quote_value(view_string(command));
    discrip_release_string(command);
    discrip_release_string(output);
    log_info(message);
}

int execute_plans(
    const DiscRipPlanList& plans,
    const DiscRipExecutorSettings& settings,
    bool enable_compression) {

    for (size_t i = 0; i < plans.count; ++i) {
        const DiscRipPlan& plan = plans.plans[i];
        DiscRipResult* result = nullptr;
        DiscRipExecutionError* err = nullptr;
        if (!discrip_execute_plan(&plan, &settings, &result, &err)) {
            const int code = err ? err->exit_code : DISCRIP_EXIT_RIP_FAILED;
            print_error(err ? view_string(err->message) : "Ripping failed");
            discrip_release_execution_error(err);
            return code;
        }
        if (enable_compression) {
            emit_compression_plan(plan, plan.will_execute && result != nullptr);
        }
        discrip_release_result(result);
    }
    return kExitSuccess;
}

}  // namespace

int main(int argc, char** argv) {
    Options cli_opts = parse_args(argc, argv);

    const char* config_err = nullptr;
    DiscRipConfig* cfg_raw = discrip_load_config(
        cli_opts.config_file.empty() ? nullptr : cli_opts.config_file.c_str(),
        &config_err);
    if (!cfg_raw) {
        print_error(config_err ? view_string(config_err) : "Failed to load config");
        discrip_release_error(config_err);
        return kExitUnexpectedError;
    }
    discrip_release_error(config_err);
    std::unique_ptr<DiscRipConfig, decltype(&discrip_release_config)> cfg(cfg_raw, &discrip_release_config);

    g_min_level = cli_opts.verbose ? DISCRIP_LOG_DEBUG : cfg->log_level;
    g_log_set_handler(DISCRIP_LOG_DOMAIN, G_LOG_LEVEL_MASK, &log_handler, nullptr);
    forward_event(DISCRIP_LOG_DEBUG,
        (std::string("discrip ") + VERSION + "-" + COMMIT_ID +
         ", config: " + (cfg->config_path ? cfg->config_path : "(defaults)")).c_str(),
        nullptr);

    std::string device;
    if (cli_opts.device) {
        device = *cli_opts.device;
    } else if (cfg->device) {
        device = cfg->device;
    } else {
        char* detected = discrip_default_device();
        device = view_string(detected);
        discrip_release_string(detected);
    }
    const bool dry_run = cli_opts.dry_run.value_or(cfg->dry_run);

    if (!is_readable_device(device)) {
        print_error(
            "device path '" + (device.empty() ? std::string("<unknown>") : device) +
            "' not found or unreadable. Check that the disc is inserted "
            "and the device path is correct.");
        return kExitDiscNotDetected;
    }
    if (cli_opts.titles.empty()) {
        print_error("No titles given; use -t \"label=minutes\"");
        return kExitUnexpectedError;
    }

    std::vector<DiscRipTitleInfo> titles;
    std::vector<std::string> codes;
    for (size_t i = 0; i < cli_opts.titles.size(); ++i) {
        DiscRipTitleInfo info{};
        info.label = cli_opts.titles[i].label.c_str();
        info.duration_sec = cli_opts.titles[i].duration_sec;
        titles.push_back(info);
        if (cli_opts.series) {
            gchar* code = g_strdup_printf("s01e%02zu", i + 1);
            codes.emplace_back(code);
            g_free(code);
        }
    }
    std::vector<const char*> code_ptrs;
    for (const auto& code : codes) code_ptrs.push_back(code.c_str());

    DiscRipClassification classification{};
    classification.disc_type = cli_opts.series ? "series" : "movie";
    classification.titles = titles.data();
    classification.titles_count = titles.size();
    classification.episode_codes = code_ptrs.empty() ? nullptr : code_ptrs.data();
    classification.episode_codes_count = code_ptrs.size();
    log_info(
        std::string("EVENT=CLASSIFIED TYPE=") + classification.disc_type +
        " EPISODES=" + std::to_string(titles.size()) +
        " LABEL=" + quote_value(cli_opts.disc_label.empty() ? "disc" : cli_opts.disc_label));

    NamingContext naming;
    naming.output_directory = cli_opts.output_directory.value_or(view_string(cfg->output_directory));
    naming.disc_label = cli_opts.disc_label.empty() ? "disc" : cli_opts.disc_label;
    naming.series = cli_opts.series;
    naming.naming = cfg->naming;

    const char* plan_err = nullptr;
    DiscRipPlanList* plans_raw = discrip_build_plans(
        device.c_str(),
        &classification,
        &make_destination,
        &naming,
        dry_run,
        nullptr,
        nullptr,
        &plan_err);
    if (!plans_raw) {
        print_error("Failed to prepare rip plan: " + view_string(plan_err));
        discrip_release_error(plan_err);
        return kExitUnexpectedError;
    }
    std::unique_ptr<DiscRipPlanList, decltype(&discrip_release_plan_list)> plans(
        plans_raw, &discrip_release_plan_list);

    DiscRipExecutorSettings settings{};
    settings.poll_interval_ms = cfg->poll_interval_ms;
    settings.size_throttle_ms = cfg->size_throttle_ms;
    settings.probe_command = cfg->probe_command;
    settings.log = &forward_event;
    settings.log_data = nullptr;

    return execute_plans(*plans, settings, cfg->compression);
}
