// discrip - Disc video ripper
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <gio/gio.h>
#include <glib.h>

#include "executor.h"
#include "internal.h"

using namespace discrip::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

constexpr int kDefaultPollIntervalMs = 250;
constexpr int kDefaultSizeThrottleMs = 300;

// One queued line, or the end-of-stream marker when eof is set.
struct StreamItem {
    StreamKind stream{StreamKind::Stdout};
    bool eof{false};
    std::string line;
    std::string error;
};

static void release_stream_item(gpointer p) {
    delete static_cast<StreamItem*>(p);
}

static bool path_exists(const std::string& path) {
    GFile* file = g_file_new_for_path(path.c_str());
    const bool exists = g_file_query_exists(file, nullptr);
    g_object_unref(file);
    return exists;
}

static bool ensure_parent_directory(
    const std::string& path,
    std::string& err) {

    GFile* file = g_file_new_for_path(path.c_str());
    GFile* parent = g_file_get_parent(file);
    g_object_unref(file);
    if (!parent) return true;

    bool ok = true;
    GError* gerr = nullptr;
    if (!g_file_make_directory_with_parents(parent, nullptr, &gerr)) {
        if (gerr && !g_error_matches(gerr, G_IO_ERROR, G_IO_ERROR_EXISTS)) {
            err = gerr->message ? gerr->message : "unknown";
            ok = false;
        }
        g_clear_error(&gerr);
    }
    g_object_unref(parent);
    return ok;
}

static std::optional<uint64_t> query_file_size(
    const std::string& path) {

    GFile* file = g_file_new_for_path(path.c_str());
    GError* gerr = nullptr;
    GFileInfo* info = g_file_query_info(
        file,
        G_FILE_ATTRIBUTE_STANDARD_SIZE,
        G_FILE_QUERY_INFO_NONE,
        nullptr,
        &gerr);
    g_object_unref(file);
    if (!info) {
        g_clear_error(&gerr);
        return std::nullopt;
    }
    const goffset size = g_file_info_get_size(info);
    g_object_unref(info);
    if (size < 0) return std::nullopt;
    return static_cast<uint64_t>(size);
}

/* ------------------------------------------------------------------- */

namespace discrip::detail {

RipExecutor::RipExecutor(
    EventSink& sink,
    ProcessLauncher& launcher,
    ReporterFactory reporters,
    std::chrono::milliseconds poll_interval,
    std::ostream& out)
    : sink_(sink),
      launcher_(launcher),
      reporters_(std::move(reporters)),
      poll_interval_(poll_interval.count() > 0
          ? poll_interval
          : std::chrono::milliseconds(kDefaultPollIntervalMs)),
      out_(out) {
}

ExecutionOutcome RipExecutor::fail(
    const DiscRipPlan& plan,
    ProgressReporter* reporter,
    DiscRipErrorKinds kind,
    int process_status,
    const std::string& message,
    const std::string& reason,
    ExecutionFailure& failure) {

    const std::string destination = to_string_or_empty(plan.destination);
    sink_.event(
        "EVENT=RIP_FAILED FILE=" + quote_event_value(destination) +
        " EXIT_CODE=" + std::to_string(DISCRIP_EXIT_RIP_FAILED) +
        " REASON=" + quote_event_value(reason));
    if (reporter) reporter->finalize(false);

    failure.kind = kind;
    failure.exit_code = DISCRIP_EXIT_RIP_FAILED;
    failure.process_status = process_status;
    failure.message = message;
    failure.reason = reason;
    return ExecutionOutcome::Failed;
}

void RipExecutor::supervise(
    ChildProcess& child,
    ProgressReporter& reporter) {

    GAsyncQueue* queue = g_async_queue_new_full(&release_stream_item);

    auto read_stream = [&child, queue](StreamKind stream) {
        std::string line;
        std::string err;
        while (child.read_line(stream, line, err)) {
            auto* item = new StreamItem{};
            item->stream = stream;
            item->line = line;
            g_async_queue_push(queue, item);
        }
        if (!err.empty()) {
            std::string close_err;
            if (!child.close_stream(stream, close_err)) {
                err += " (closing the stream also failed: " + close_err + ")";
            }
        }
        auto* sentinel = new StreamItem{};
        sentinel->stream = stream;
        sentinel->eof = true;
        sentinel->error = err;
        g_async_queue_push(queue, sentinel);
    };

    std::thread stdout_reader(read_stream, StreamKind::Stdout);
    std::thread stderr_reader(read_stream, StreamKind::Stderr);

    const guint64 timeout_us =
        static_cast<guint64>(std::chrono::duration_cast<std::chrono::microseconds>(
            poll_interval_).count());
    bool stdout_done = false;
    bool stderr_done = false;
    while (true) {
        if (stdout_done && stderr_done &&
            g_async_queue_length(queue) <= 0 &&
            child.poll_exited()) {
            break;
        }

        auto* raw = static_cast<StreamItem*>(g_async_queue_timeout_pop(queue, timeout_us));
        if (!raw) {
            reporter.handle_idle();
            continue;
        }
        std::unique_ptr<StreamItem> item(raw);
        if (item->eof) {
            if (item->stream == StreamKind::Stdout) stdout_done = true;
            else stderr_done = true;
            if (!item->error.empty()) {
                sink_.warning(
                    std::string("Reading ") + stream_name(item->stream) +
                    " failed: " + item->error);
            }
            continue;
        }
        reporter.handle_line(item->stream, item->line);
    }

    stdout_reader.join();
    stderr_reader.join();
    g_async_queue_unref(queue);
}

ExecutionOutcome RipExecutor::execute(
    const DiscRipPlan& plan,
    ExecutionResult& result,
    ExecutionFailure& failure) {

    const std::string destination = to_string_or_empty(plan.destination);
    const std::vector<std::string> command = plan_command(plan);

    if (!plan.will_execute) {
        out_ << "[dry-run] Would execute: " << shell_join(command) << std::endl;
        sink_.event(
            "EVENT=RIP_SKIPPED FILE=" + quote_event_value(destination) +
            " REASON=dry-run");
        return ExecutionOutcome::Skipped;
    }

    // Check-then-act: concurrent executions on one destination can race.
    if (path_exists(destination)) {
        sink_.event(
            "EVENT=RIP_GUARD FILE=" + quote_event_value(destination) +
            " REASON=destination-exists");
        failure.kind = DISCRIP_ERROR_DESTINATION_EXISTS;
        failure.exit_code = DISCRIP_EXIT_RIP_FAILED;
        failure.process_status = 0;
        failure.message = "Destination already exists: " + destination;
        failure.reason = "destination-exists";
        return ExecutionOutcome::Failed;
    }

    if (command.empty()) {
        return fail(plan, nullptr, DISCRIP_ERROR_IO, 0,
            "Rip plan for " + destination + " has no command", "empty-command", failure);
    }
    const std::string& tool = command.front();

    std::unique_ptr<ProgressReporter> reporter;
    if (reporters_) reporter = reporters_(plan, sink_);
    if (!reporter) reporter = std::make_unique<NullProgressReporter>();

    std::string dir_err;
    if (!ensure_parent_directory(destination, dir_err)) {
        return fail(plan, reporter.get(), DISCRIP_ERROR_IO, 0,
            "Failed to create directories for " + destination + ": " + dir_err,
            dir_err, failure);
    }

    sink_.debug("Executing: " + shell_join(command));
    LaunchFailure launch_failure;
    std::unique_ptr<ChildProcess> child = launcher_.launch(command, launch_failure);
    if (!child) {
        switch (launch_failure.kind) {
            case DISCRIP_ERROR_TOOL_NOT_FOUND:
                return fail(plan, reporter.get(), launch_failure.kind, 0,
                    "Ripping tool not found: " + tool, "tool-not-found", failure);
            case DISCRIP_ERROR_PERMISSION_DENIED:
                return fail(plan, reporter.get(), launch_failure.kind, 0,
                    "Permission denied when executing " + tool, "permission-denied", failure);
            default:
                return fail(plan, reporter.get(), DISCRIP_ERROR_IO, 0,
                    "Failed to execute " + tool + ": " + launch_failure.message,
                    launch_failure.message, failure);
        }
    }

    supervise(*child, *reporter);

    int status = 0;
    std::string wait_err;
    if (!child->wait(status, wait_err)) {
        return fail(plan, reporter.get(), DISCRIP_ERROR_IO, 0,
            "Failed to wait for " + tool + ": " + wait_err, wait_err, failure);
    }
    if (status != 0) {
        return fail(plan, reporter.get(), DISCRIP_ERROR_NON_ZERO_EXIT, status,
            tool + " exited with status " + std::to_string(status),
            "subprocess-exit-" + std::to_string(status), failure);
    }

    const auto bytes = query_file_size(destination);
    sink_.event(
        "EVENT=RIP_DONE FILE=" + quote_event_value(destination) +
        " BYTES=" + (bytes ? std::to_string(*bytes) : std::string("unknown")) +
        " STATUS=success");
    reporter->finalize(true);

    result.command = command;
    result.exit_code = status;
    result.bytes = bytes;
    return ExecutionOutcome::Succeeded;
}

}  // namespace discrip::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

int discrip_execute_plan(
    const DiscRipPlan* plan,
    const DiscRipExecutorSettings* settings,
    DiscRipResult** result,
    DiscRipExecutionError** error) {

    if (result) *result = nullptr;
    if (error) *error = nullptr;

    auto set_exec_error = [&](const ExecutionFailure& f) {
        if (!error) return;
        auto* e = new DiscRipExecutionError{};
        e->kind = f.kind;
        e->exit_code = f.exit_code;
        e->process_status = f.process_status;
        e->message = make_cstr_copy(f.message);
        e->reason = f.reason.empty() ? nullptr : make_cstr_copy(f.reason);
        *error = e;
    };

    if (!plan) {
        ExecutionFailure f;
        f.kind = DISCRIP_ERROR_IO;
        f.message = "Invalid arguments to discrip_execute_plan";
        set_exec_error(f);
        return 0;
    }

    CallbackEventSink sink(
        settings ? settings->log : nullptr,
        settings ? settings->log_data : nullptr);

    ReporterSettings reporter_settings;
    if (settings && settings->size_throttle_ms > 0) {
        reporter_settings.size_throttle = std::chrono::milliseconds(settings->size_throttle_ms);
    } else {
        reporter_settings.size_throttle = std::chrono::milliseconds(kDefaultSizeThrottleMs);
    }
    if (settings && settings->probe_command && *settings->probe_command) {
        reporter_settings.probe_command = settings->probe_command;
    }
    const int poll_ms = settings && settings->poll_interval_ms > 0
        ? settings->poll_interval_ms
        : kDefaultPollIntervalMs;

    GioProcessLauncher launcher;
    RipExecutor executor(
        sink,
        launcher,
        [reporter_settings](const DiscRipPlan& p, EventSink& s) {
            return make_progress_reporter(p, s, reporter_settings);
        },
        std::chrono::milliseconds(poll_ms),
        std::cout);

    ExecutionResult exec_result;
    ExecutionFailure exec_failure;
    switch (executor.execute(*plan, exec_result, exec_failure)) {
        case ExecutionOutcome::Skipped:
            return 1;
        case ExecutionOutcome::Succeeded:
            if (result) {
                auto* r = new DiscRipResult{};
                r->command = make_cstr_array(exec_result.command);
                r->command_count = exec_result.command.size();
                r->exit_code = exec_result.exit_code;
                r->bytes = exec_result.bytes
                    ? static_cast<int64_t>(*exec_result.bytes)
                    : -1;
                *result = r;
            }
            return 1;
        case ExecutionOutcome::Failed:
        default:
            set_exec_error(exec_failure);
            return 0;
    }
}

void discrip_release_result(
    DiscRipResult* p) {

    if (!p) return;
    release_cstr_array(p->command, p->command_count);
    p->command_count = 0;
    delete p;
}

void discrip_release_execution_error(
    DiscRipExecutionError* p) {

    if (!p) return;
    release_cstr(p->message);
    release_cstr(p->reason);
    delete p;
}

};
