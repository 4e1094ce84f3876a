// discrip - Disc video ripper
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include <glib.h>

#include "internal.h"

using namespace discrip::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static std::vector<std::string> ffmpeg_command(
    const std::string& device,
    const std::string& destination) {

    // "-progress pipe:2" makes stderr carry the key=value progress protocol.
    return {
        "ffmpeg",
        "-hide_banner",
        "-nostats",
        "-loglevel",
        "error",
        "-progress",
        "pipe:2",
        "-i",
        device,
        destination,
    };
}

static std::string dvdbackup_label(
    const DiscRipTitleInfo& title,
    const std::filesystem::path& destination) {

    const std::string stem = destination.stem().string();
    if (!stem.empty()) return stem;
    const std::string label = to_string_or_empty(title.label);
    if (!label.empty()) return label;
    return "title";
}

static std::vector<std::string> dvdbackup_command(
    const std::string& device,
    const DiscRipTitleInfo& title,
    const std::string& destination) {

    const std::filesystem::path dest_path(destination);
    std::string output_dir = dest_path.parent_path().string();
    if (output_dir.empty()) output_dir = ".";
    return {
        "dvdbackup",
        "-i",
        device,
        "-o",
        output_dir,
        "-n",
        dvdbackup_label(title, dest_path),
        "-F",
    };
}

static bool select_rip_command(
    const std::string& device,
    const DiscRipTitleInfo& title,
    const std::string& destination,
    DiscRipToolResolver resolver,
    void* resolver_data,
    std::vector<std::string>& command,
    DiscRipBackends& backend) {

    if (resolver("dvdbackup", resolver_data)) {
        command = dvdbackup_command(device, title, destination);
        backend = DISCRIP_BACKEND_DVDBACKUP;
        return true;
    }
    if (resolver("ffmpeg", resolver_data)) {
        command = ffmpeg_command(device, destination);
        backend = DISCRIP_BACKEND_FFMPEG;
        return true;
    }
    return false;
}

/* ------------------------------------------------------------------- */

namespace discrip::detail {

void copy_title_info(
    DiscRipTitleInfo& dst,
    const DiscRipTitleInfo& src) {

    dst.label = make_cstr_copy(src.label);
    dst.duration_sec = src.duration_sec;
    dst.chapters = nullptr;
    dst.chapters_count = 0;
    if (src.chapters && src.chapters_count > 0) {
        auto* chapters = new double[src.chapters_count];
        for (size_t i = 0; i < src.chapters_count; ++i) {
            chapters[i] = src.chapters[i];
        }
        dst.chapters = chapters;
        dst.chapters_count = src.chapters_count;
    }
}

void release_title_info(
    DiscRipTitleInfo& title) {

    release_cstr(title.label);
    delete[] title.chapters;
    title.chapters = nullptr;
    title.chapters_count = 0;
}

void release_plan_members(
    DiscRipPlan& plan) {

    release_cstr(plan.device);
    release_cstr(plan.destination);
    release_title_info(plan.title);
    release_cstr_array(plan.command, plan.command_count);
    plan.command_count = 0;
}

}  // namespace discrip::detail

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

void discrip_release_error(const char* p) {
    delete[] p;
}

void discrip_release_string(char* p) {
    delete[] p;
}

int discrip_resolve_tool_on_path(const char* name, void*) {
    if (!name || !*name) return 0;
    gchar* found = g_find_program_in_path(name);
    const int ok = found != nullptr;
    g_free(found);
    return ok;
}

DiscRipPlan* discrip_build_plan(
    const char* device,
    const DiscRipTitleInfo* title,
    const char* destination,
    bool dry_run,
    DiscRipToolResolver resolver,
    void* resolver_data,
    const char** error) {

    clear_error(error);
    if (!device || !title || !destination || !*destination) {
        set_error(error, "Invalid arguments to discrip_build_plan");
        return nullptr;
    }
    if (!resolver) resolver = &discrip_resolve_tool_on_path;

    std::vector<std::string> command;
    DiscRipBackends backend = DISCRIP_BACKEND_FFMPEG;
    if (!select_rip_command(device, *title, destination, resolver, resolver_data, command, backend)) {
        set_error(error, "No supported ripping tools found on PATH");
        return nullptr;
    }

    auto* plan = new DiscRipPlan{};
    plan->device = make_cstr_copy(device);
    copy_title_info(plan->title, *title);
    plan->destination = make_cstr_copy(destination);
    plan->command = make_cstr_array(command);
    plan->command_count = command.size();
    plan->backend = backend;
    plan->will_execute = !dry_run;
    return plan;
}

void discrip_release_plan(
    DiscRipPlan* p) {

    if (!p) return;
    release_plan_members(*p);
    delete p;
}

DiscRipPlanList* discrip_build_plans(
    const char* device,
    const DiscRipClassification* classification,
    DiscRipDestinationFactory factory,
    void* factory_data,
    bool dry_run,
    DiscRipToolResolver resolver,
    void* resolver_data,
    const char** error) {

    clear_error(error);
    if (!device || !classification || !factory) {
        set_error(error, "Invalid arguments to discrip_build_plans");
        return nullptr;
    }
    if (classification->titles_count > 0 && !classification->titles) {
        set_error(error, "Classification has no title array");
        return nullptr;
    }
    const bool has_codes =
        classification->episode_codes && classification->episode_codes_count > 0;
    if (has_codes && classification->episode_codes_count != classification->titles_count) {
        set_error(error, "Episode codes must align with titles");
        return nullptr;
    }

    std::vector<DiscRipPlan*> built;
    auto fail = [&](const std::string& message) -> DiscRipPlanList* {
        for (auto* plan : built) discrip_release_plan(plan);
        set_error(error, message);
        return nullptr;
    };

    for (size_t i = 0; i < classification->titles_count; ++i) {
        const DiscRipTitleInfo& title = classification->titles[i];
        const char* code = has_codes ? classification->episode_codes[i] : nullptr;
        const int index = static_cast<int>(i + 1);

        char* factory_err = nullptr;
        char* destination = factory(&title, code, index, factory_data, &factory_err);
        if (!destination) {
            std::string message = "Failed to resolve destination for title " + std::to_string(index);
            if (factory_err) message += std::string(": ") + factory_err;
            g_free(factory_err);
            return fail(message);
        }
        g_free(factory_err);

        const char* build_err = nullptr;
        DiscRipPlan* plan = discrip_build_plan(
            device, &title, destination, dry_run, resolver, resolver_data, &build_err);
        g_free(destination);
        if (!plan) {
            const std::string message = build_err ? build_err : "Failed to build rip plan";
            discrip_release_error(build_err);
            return fail(message);
        }
        built.push_back(plan);
    }

    auto* list = new DiscRipPlanList{};
    if (!built.empty()) {
        list->count = built.size();
        list->plans = new DiscRipPlan[list->count]{};
        for (size_t i = 0; i < list->count; ++i) {
            // Ownership of members moves into the list.
            list->plans[i] = *built[i];
            delete built[i];
        }
    }
    return list;
}

void discrip_release_plan_list(
    DiscRipPlanList* p) {

    if (!p) return;
    if (p->plans) {
        for (size_t i = 0; i < p->count; ++i) {
            release_plan_members(p->plans[i]);
        }
        delete[] p->plans;
        p->plans = nullptr;
    }
    p->count = 0;
    delete p;
}

};
