// discrip - Disc video ripper
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <filesystem>
#include <string>
#include <vector>

#include "internal.h"

using namespace discrip::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static const std::string handbrake_preset = "Fast 1080p30";

static std::string compressed_path(
    const std::string& source) {

    const std::filesystem::path path(source);
    const std::string name =
        path.stem().string() + "-compressed" + path.extension().string();
    return (path.parent_path() / name).string();
}

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

char* discrip_compression_output_path(
    const DiscRipPlan* plan) {

    if (!plan || !plan->destination) return nullptr;
    return make_mutable_cstr_copy(compressed_path(plan->destination));
}

char* discrip_compression_command(
    const DiscRipPlan* plan) {

    if (!plan || !plan->destination) return nullptr;
    const std::string source = plan->destination;
    const std::vector<std::string> command = {
        "HandBrakeCLI",
        "-i",
        source,
        "-o",
        compressed_path(source),
        "--preset",
        handbrake_preset,
    };
    return make_mutable_cstr_copy(shell_join(command));
}

};
