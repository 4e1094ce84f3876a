#pragma once

// discrip - Disc video ripper
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#ifndef __DISCRIP_H
#define __DISCRIP_H

#include <stddef.h>
#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/** Exit code carried by every execution-time failure. */
#define DISCRIP_EXIT_RIP_FAILED 2

/* ------------------------------------------------------------------- */

/**
 * Release error string allocated by library functions.
 * @param p Pointer returned via error out-parameters (nullable).
 */
void discrip_release_error(const char* p);

/**
 * Release a string allocated by library functions.
 * @param p Pointer to free (nullable).
 */
void discrip_release_string(char* p);

/* ------------------------------------------------------------------- */

/** Title metadata produced by disc inspection. */
typedef struct DiscRipTitleInfo {
    /** Title label (nullable). */
    const char* label;
    /** Duration in seconds (0 => unknown). */
    double duration_sec;
    /** Chapter start offsets in seconds. */
    const double* chapters;
    /** Number of entries in chapters. */
    size_t chapters_count;
} DiscRipTitleInfo;

/** External ripping backends. */
typedef enum DiscRipBackends {
    DISCRIP_BACKEND_DVDBACKUP = 0,
    DISCRIP_BACKEND_FFMPEG = 1,
} DiscRipBackends;

/** Immutable description of one title's extraction job. */
typedef struct DiscRipPlan {
    /** Source device path or identifier. */
    const char* device;
    /** Owned copy of the title metadata. */
    DiscRipTitleInfo title;
    /** Target file path. */
    const char* destination;
    /** Argument vector, command[0] is the tool name. */
    const char** command;
    /** Number of entries in command. */
    size_t command_count;
    /** Backend selected for this plan. */
    DiscRipBackends backend;
    /** False for dry-run plans. */
    bool will_execute;
} DiscRipPlan;

/** Ordered list of plans. */
typedef struct DiscRipPlanList {
    /** Array of plans. */
    DiscRipPlan* plans;
    /** Number of entries in plans. */
    size_t count;
} DiscRipPlanList;

/**
 * Tool resolution capability.
 * @param name Tool name (e.g. "dvdbackup").
 * @param user_data Opaque pointer supplied by the caller.
 * @return Non-zero when the tool resolves to an executable.
 */
typedef int (*DiscRipToolResolver)(const char* name, void* user_data);

/**
 * Default resolver: searches PATH.
 * @param name Tool name.
 * @param user_data Ignored.
 * @return Non-zero when found.
 */
int discrip_resolve_tool_on_path(const char* name, void* user_data);

/**
 * Build a rip plan. Prefers dvdbackup, then ffmpeg.
 * @param device Source device path.
 * @param title Title metadata (copied into the plan).
 * @param destination Target file path.
 * @param dry_run True to produce a plan that will not execute.
 * @param resolver Tool resolver (nullable => discrip_resolve_tool_on_path).
 * @param resolver_data Opaque pointer passed to resolver.
 * @param error Optional error string out-parameter.
 * @return Newly allocated plan; free with discrip_release_plan. Null when no tool is available.
 */
DiscRipPlan* discrip_build_plan(
    const char* device,
    const DiscRipTitleInfo* title,
    const char* destination,
    bool dry_run,
    DiscRipToolResolver resolver /* nullable */,
    void* resolver_data,
    const char** error /* nullable */);
/**
 * Release a plan.
 * @param p Plan pointer (nullable).
 */
void discrip_release_plan(
    DiscRipPlan* p);

/* ------------------------------------------------------------------- */

/** Classification result: which titles to rip, in order. */
typedef struct DiscRipClassification {
    /** "movie" or "series". */
    const char* disc_type;
    /** Ordered titles to rip. */
    const DiscRipTitleInfo* titles;
    /** Number of entries in titles. */
    size_t titles_count;
    /** Episode codes aligned with titles (nullable). */
    const char* const* episode_codes;
    /** Number of entries in episode_codes (0 or titles_count). */
    size_t episode_codes_count;
} DiscRipClassification;

/**
 * Destination naming callback.
 * @param title Title being planned.
 * @param episode_code Episode code (nullable).
 * @param index 1-based track index.
 * @param user_data Opaque pointer supplied by the caller.
 * @param error Optional error out-parameter; set with g_strdup() on failure.
 * @return Destination path allocated with g_strdup(), released by the library; null on failure.
 */
typedef char* (*DiscRipDestinationFactory)(
    const DiscRipTitleInfo* title,
    const char* episode_code,
    int index,
    void* user_data,
    char** error);

/**
 * Expand a classification into ordered rip plans. Performs no I/O.
 * Any failure aborts the whole build.
 * @param device Source device path.
 * @param classification Classification result.
 * @param factory Destination naming callback.
 * @param factory_data Opaque pointer passed to factory.
 * @param dry_run True to produce dry-run plans.
 * @param resolver Tool resolver (nullable => discrip_resolve_tool_on_path).
 * @param resolver_data Opaque pointer passed to resolver.
 * @param error Optional error string out-parameter.
 * @return Newly allocated list; free with discrip_release_plan_list. Null on failure.
 */
DiscRipPlanList* discrip_build_plans(
    const char* device,
    const DiscRipClassification* classification,
    DiscRipDestinationFactory factory,
    void* factory_data,
    bool dry_run,
    DiscRipToolResolver resolver /* nullable */,
    void* resolver_data,
    const char** error /* nullable */);
/**
 * Release a plan list.
 * @param p List pointer (nullable).
 */
void discrip_release_plan_list(
    DiscRipPlanList* p);

/* ------------------------------------------------------------------- */

/** Log levels passed to the event sink. */
typedef enum DiscRipLogLevels {
    DISCRIP_LOG_DEBUG = 0,
    DISCRIP_LOG_INFO = 1,
    DISCRIP_LOG_WARNING = 2,
} DiscRipLogLevels;

/** Structured event sink. */
typedef void (*DiscRipLogCallback)(
    DiscRipLogLevels level,
    const char* message,
    void* user_data);

/** Executor settings. */
typedef struct DiscRipExecutorSettings {
    /** Bounded wait of the supervising loop in milliseconds (<=0 => 250). */
    int poll_interval_ms;
    /** dvdbackup directory polling throttle in milliseconds (<=0 => 300). */
    int size_throttle_ms;
    /** Disc-info tool used for sector probing (nullable => "isoinfo"). */
    const char* probe_command;
    /** Event sink (nullable => events are dropped). */
    DiscRipLogCallback log;
    /** Opaque pointer passed to log. */
    void* log_data;
} DiscRipExecutorSettings;

/** Failure kinds. */
typedef enum DiscRipErrorKinds {
    DISCRIP_ERROR_NONE = 0,
    DISCRIP_ERROR_NO_SUPPORTED_TOOL = 1,
    DISCRIP_ERROR_DESTINATION_EXISTS = 2,
    DISCRIP_ERROR_TOOL_NOT_FOUND = 3,
    DISCRIP_ERROR_PERMISSION_DENIED = 4,
    DISCRIP_ERROR_NON_ZERO_EXIT = 5,
    DISCRIP_ERROR_IO = 6,
} DiscRipErrorKinds;

/** Execution failure (RipExecutionError). */
typedef struct DiscRipExecutionError {
    /** Failure kind. */
    DiscRipErrorKinds kind;
    /** Caller-facing exit code (DISCRIP_EXIT_RIP_FAILED). */
    int exit_code;
    /** Raw process status (0 when no process ran). */
    int process_status;
    /** Human-readable message, safe to print. */
    const char* message;
    /** Machine-readable reason tag (nullable for guard rejections). */
    const char* reason;
} DiscRipExecutionError;

/** Completed execution. */
typedef struct DiscRipResult {
    /** Executed argument vector. */
    const char** command;
    /** Number of entries in command. */
    size_t command_count;
    /** Process exit code. */
    int exit_code;
    /** Destination size in bytes (-1 => unknown). */
    int64_t bytes;
} DiscRipResult;

/**
 * Execute a plan: spawn the backend, monitor progress, map failures.
 * @param plan Plan to execute.
 * @param settings Executor settings (nullable for defaults).
 * @param result Out-parameter; set to a newly allocated result on success, null when skipped.
 * @param error Out-parameter; set to a newly allocated error on failure.
 * @return Non-zero on success or dry-run skip, zero on failure.
 */
int discrip_execute_plan(
    const DiscRipPlan* plan,
    const DiscRipExecutorSettings* settings /* nullable */,
    DiscRipResult** result /* nullable */,
    DiscRipExecutionError** error /* nullable */);
/**
 * Release a result.
 * @param p Result pointer (nullable).
 */
void discrip_release_result(
    DiscRipResult* p);
/**
 * Release an execution error.
 * @param p Error pointer (nullable).
 */
void discrip_release_execution_error(
    DiscRipExecutionError* p);

/* ------------------------------------------------------------------- */

/** Title naming preferences. */
typedef struct DiscRipNamingConfig {
    /** Replacement separator character. */
    char separator;
    /** Lowercase generated names. */
    bool lowercase;
} DiscRipNamingConfig;

/** Global configuration loaded from INI or defaults. */
typedef struct DiscRipConfig {
    /** Device path (nullable => auto-detect). */
    const char* device;
    /** Output directory for ripped titles. */
    const char* output_directory;
    /** Dry-run by default. */
    bool dry_run;
    /** Log a HandBrake compression plan after each rip. */
    bool compression;
    /** Supervising loop wait in milliseconds. */
    int poll_interval_ms;
    /** dvdbackup directory polling throttle in milliseconds. */
    int size_throttle_ms;
    /** Disc-info tool used for sector probing. */
    const char* probe_command;
    /** Naming preferences. */
    DiscRipNamingConfig naming;
    /** Minimum log level. */
    DiscRipLogLevels log_level;
    /** Loaded config file path, or null when defaults. */
    const char* config_path;
} DiscRipConfig;

/**
 * Load configuration from INI file.
 * Search order when path is null: ./discrip.conf then ~/.discrip.conf.
 * Returns defaults if no file found; returns null on parse/load error.
 * @param path Optional explicit config path.
 * @param error Optional error string out-parameter.
 * @return Newly allocated config, must free with discrip_release_config; null on failure.
 */
DiscRipConfig* discrip_load_config(
    const char* path /* nullable */,
    const char** error /* nullable */);
/**
 * Release configuration and owned members.
 * @param cfg Config pointer (nullable).
 */
void discrip_release_config(
    DiscRipConfig* cfg);

/* ------------------------------------------------------------------- */

/**
 * Detect the default optical device using libcdio.
 * @return Newly allocated device path ("/dev/sr0" when detection fails); free with discrip_release_string.
 */
char* discrip_default_device();

/**
 * Build the HandBrake compression command for a plan's destination.
 * The command is never executed by the library.
 * @param plan Source plan.
 * @return Newly allocated shell-quoted command line; free with discrip_release_string.
 */
char* discrip_compression_command(
    const DiscRipPlan* plan);

/**
 * Compression output path for a plan (<stem>-compressed<ext>).
 * @param plan Source plan.
 * @return Newly allocated path; free with discrip_release_string.
 */
char* discrip_compression_output_path(
    const DiscRipPlan* plan);

/**
 * Quote a value for an EVENT= line (double quotes, backslash escaping).
 * @param value Raw value (nullable => empty).
 * @return Newly allocated quoted value; free with discrip_release_string.
 */
char* discrip_quote_event_value(
    const char* value);

#ifdef __cplusplus
}
#endif

#endif
