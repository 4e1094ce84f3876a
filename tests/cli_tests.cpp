// discrip - Disc video ripper
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <fstream>
#include <string>
#include <vector>

#include <glib.h>
#include <gtest/gtest.h>

#include <sys/wait.h>

#include "test_support.h"

using discrip::test::TempDir;

namespace {

struct CliRun {
    int exit_code{-1};
    std::string err;
};

CliRun run_cli(const std::vector<std::string>& args) {
    std::vector<const gchar*> argv;
    argv.push_back(DISCRIP_CLI_PATH);
    for (const auto& arg : args) argv.push_back(arg.c_str());
    argv.push_back(nullptr);

    CliRun run;
    gchar* out = nullptr;
    gchar* err = nullptr;
    gint wait_status = 0;
    GError* gerr = nullptr;
    if (!g_spawn_sync(
            nullptr,
            const_cast<gchar**>(argv.data()),
            nullptr,
            G_SPAWN_DEFAULT,
            nullptr,
            nullptr,
            &out,
            &err,
            &wait_status,
            &gerr)) {
        run.err = gerr && gerr->message ? gerr->message : "spawn failed";
        g_clear_error(&gerr);
        return run;
    }
    run.err = err ? err : "";
    g_free(out);
    g_free(err);
    if (WIFEXITED(wait_status)) run.exit_code = WEXITSTATUS(wait_status);
    return run;
}

}  // namespace

TEST(CliTest, DryRunStillRequiresReadableDevice) {
    TempDir dir;
    const std::string config = dir.file("discrip.conf");
    { std::ofstream out(config); }

    const CliRun run = run_cli({
        "-i", config,
        "-o", dir.path().string(),
        "-d", dir.file("no-such-device"),
        "--dry-run",
        "-t", "Main=95",
    });
    EXPECT_EQ(1, run.exit_code) << run.err;
    EXPECT_NE(std::string::npos, run.err.find("Error: device path"));
}

TEST(CliTest, MalformedTitleIsRejected) {
    TempDir dir;
    const std::string config = dir.file("discrip.conf");
    { std::ofstream out(config); }

    const CliRun run = run_cli({"-i", config, "-t", "Main=soon"});
    EXPECT_EQ(3, run.exit_code) << run.err;
}
