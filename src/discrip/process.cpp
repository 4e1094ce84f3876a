// discrip - Disc video ripper
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <memory>
#include <string>
#include <vector>

#include <gio/gio.h>
#include <glib.h>

#include "internal.h"
#include "process.h"

using namespace discrip::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

namespace {

class GioChildProcess final : public ChildProcess {
public:
    explicit GioChildProcess(GSubprocess* proc)
        : proc_(proc),
          stdout_(g_data_input_stream_new(g_subprocess_get_stdout_pipe(proc))),
          stderr_(g_data_input_stream_new(g_subprocess_get_stderr_pipe(proc))),
          context_(g_main_context_new()),
          cancellable_(g_cancellable_new()) {

        g_data_input_stream_set_newline_type(stdout_, G_DATA_STREAM_NEWLINE_TYPE_ANY);
        g_data_input_stream_set_newline_type(stderr_, G_DATA_STREAM_NEWLINE_TYPE_ANY);

        // Completion is dispatched on our private context, so poll_exited()
        // can observe it without blocking.
        g_main_context_push_thread_default(context_);
        g_subprocess_wait_async(proc_, cancellable_, &GioChildProcess::on_wait_done, this);
        g_main_context_pop_thread_default(context_);
    }

    ~GioChildProcess() override {
        if (!wait_done_) {
            g_cancellable_cancel(cancellable_);
            while (!wait_done_) {
                g_main_context_iteration(context_, TRUE);
            }
        }
        g_object_unref(stdout_);
        g_object_unref(stderr_);
        g_object_unref(proc_);
        g_object_unref(cancellable_);
        g_main_context_unref(context_);
    }

    GioChildProcess(const GioChildProcess&) = delete;
    GioChildProcess& operator=(const GioChildProcess&) = delete;

    bool read_line(StreamKind stream, std::string& line, std::string& err) override {
        GDataInputStream* in = stream == StreamKind::Stdout ? stdout_ : stderr_;
        gsize length = 0;
        GError* gerr = nullptr;
        char* raw = g_data_input_stream_read_line(in, &length, nullptr, &gerr);
        if (!raw) {
            if (gerr) {
                err = gerr->message ? gerr->message : "read error";
                g_clear_error(&gerr);
            }
            return false;
        }
        line.assign(raw, length);
        g_free(raw);
        return true;
    }

    bool close_stream(StreamKind stream, std::string& err) override {
        GDataInputStream* in = stream == StreamKind::Stdout ? stdout_ : stderr_;
        GError* gerr = nullptr;
        if (!g_input_stream_close(G_INPUT_STREAM(in), nullptr, &gerr)) {
            err = gerr && gerr->message ? gerr->message : "close failed";
            g_clear_error(&gerr);
            return false;
        }
        return true;
    }

    bool poll_exited() override {
        while (g_main_context_iteration(context_, FALSE)) {
        }
        return exited_;
    }

    bool wait(int& status, std::string& err) override {
        GError* gerr = nullptr;
        if (!g_subprocess_wait(proc_, nullptr, &gerr)) {
            err = gerr && gerr->message ? gerr->message : "wait failed";
            g_clear_error(&gerr);
            return false;
        }
        if (g_subprocess_get_if_exited(proc_)) {
            status = g_subprocess_get_exit_status(proc_);
        } else if (g_subprocess_get_if_signaled(proc_)) {
            status = 128 + g_subprocess_get_term_sig(proc_);
        } else {
            status = 1;
        }
        return true;
    }

private:
    static void on_wait_done(GObject* source, GAsyncResult* res, gpointer data) {
        auto* self = static_cast<GioChildProcess*>(data);
        GError* gerr = nullptr;
        if (g_subprocess_wait_finish(G_SUBPROCESS(source), res, &gerr)) {
            self->exited_ = true;
        }
        g_clear_error(&gerr);
        self->wait_done_ = true;
    }

    GSubprocess* proc_{nullptr};
    GDataInputStream* stdout_{nullptr};
    GDataInputStream* stderr_{nullptr};
    GMainContext* context_{nullptr};
    GCancellable* cancellable_{nullptr};
    bool wait_done_{false};
    bool exited_{false};
};

DiscRipErrorKinds classify_spawn_error(const GError* gerr) {
    if (g_error_matches(gerr, G_SPAWN_ERROR, G_SPAWN_ERROR_NOENT)) {
        return DISCRIP_ERROR_TOOL_NOT_FOUND;
    }
    if (g_error_matches(gerr, G_SPAWN_ERROR, G_SPAWN_ERROR_ACCES) ||
        g_error_matches(gerr, G_SPAWN_ERROR, G_SPAWN_ERROR_PERM)) {
        return DISCRIP_ERROR_PERMISSION_DENIED;
    }
    return DISCRIP_ERROR_IO;
}

}  // namespace

/* ------------------------------------------------------------------- */

namespace discrip::detail {

std::unique_ptr<ChildProcess> GioProcessLauncher::launch(
    const std::vector<std::string>& argv,
    LaunchFailure& failure) {

    failure = LaunchFailure{};
    if (argv.empty()) {
        failure.kind = DISCRIP_ERROR_IO;
        failure.message = "Empty command";
        return nullptr;
    }

    std::vector<const gchar*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) args.push_back(arg.c_str());
    args.push_back(nullptr);

    GError* gerr = nullptr;
    GSubprocess* proc = g_subprocess_newv(
        args.data(),
        static_cast<GSubprocessFlags>(
            G_SUBPROCESS_FLAGS_STDOUT_PIPE | G_SUBPROCESS_FLAGS_STDERR_PIPE),
        &gerr);
    if (!proc) {
        failure.kind = gerr ? classify_spawn_error(gerr) : DISCRIP_ERROR_IO;
        failure.message = gerr && gerr->message ? gerr->message : "Failed to spawn " + argv.front();
        g_clear_error(&gerr);
        return nullptr;
    }
    return std::make_unique<GioChildProcess>(proc);
}

}  // namespace discrip::detail
