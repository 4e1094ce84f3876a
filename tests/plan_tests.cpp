// discrip - Disc video ripper
// Copyright (c) Kouji Matsui. (@kekyo@mi.kekyo.net)
// Under MIT.

#include <set>
#include <string>
#include <vector>

#include <glib.h>
#include <gtest/gtest.h>

#include "discrip/discrip.h"
#include "internal.h"

using namespace discrip::detail;

namespace {

struct ToolSet {
    std::set<std::string> available;
    std::vector<std::string> queried;
};

int resolve_from_set(const char* name, void* user_data) {
    auto* tools = static_cast<ToolSet*>(user_data);
    tools->queried.emplace_back(name);
    return tools->available.count(name) ? 1 : 0;
}

DiscRipTitleInfo make_title(const char* label, double duration_sec) {
    DiscRipTitleInfo title{};
    title.label = label;
    title.duration_sec = duration_sec;
    return title;
}

struct FactoryCall {
    std::string label;
    std::string code;
    int index;
};

struct FactoryState {
    std::vector<FactoryCall> calls;
    int fail_at{0};
};

char* record_destination(
    const DiscRipTitleInfo* title,
    const char* episode_code,
    int index,
    void* user_data,
    char** error) {

    auto* state = static_cast<FactoryState*>(user_data);
    state->calls.push_back({
        title->label ? title->label : "",
        episode_code ? episode_code : "",
        index});
    if (index == state->fail_at) {
        *error = g_strdup("disk full");
        return nullptr;
    }
    return g_strdup_printf("/out/%s.mp4", title->label);
}

}  // namespace

TEST(PlanBuilderTest, PrefersDvdbackupWhenBothResolve) {
    ToolSet tools{{"dvdbackup", "ffmpeg"}, {}};
    const DiscRipTitleInfo title = make_title("Main Feature", 5400.0);
    const char* err = nullptr;
    DiscRipPlan* plan = discrip_build_plan(
        "/dev/sr0", &title, "/out/movies/Main_Feature.mp4", false,
        &resolve_from_set, &tools, &err);
    ASSERT_NE(nullptr, plan) << (err ? err : "");

    EXPECT_EQ(DISCRIP_BACKEND_DVDBACKUP, plan->backend);
    const std::vector<std::string> expected = {
        "dvdbackup", "-i", "/dev/sr0", "-o", "/out/movies", "-n", "Main_Feature", "-F",
    };
    EXPECT_EQ(expected, plan_command(*plan));
    EXPECT_TRUE(plan->will_execute);
    EXPECT_STREQ("Main Feature", plan->title.label);
    EXPECT_DOUBLE_EQ(5400.0, plan->title.duration_sec);
    discrip_release_plan(plan);
}

TEST(PlanBuilderTest, FallsBackToFfmpeg) {
    ToolSet tools{{"ffmpeg"}, {}};
    const DiscRipTitleInfo title = make_title("Main", 60.0);
    DiscRipPlan* plan = discrip_build_plan(
        "/dev/sr1", &title, "/out/Main.mp4", true, &resolve_from_set, &tools, nullptr);
    ASSERT_NE(nullptr, plan);

    EXPECT_EQ(DISCRIP_BACKEND_FFMPEG, plan->backend);
    const std::vector<std::string> expected = {
        "ffmpeg", "-hide_banner", "-nostats", "-loglevel", "error",
        "-progress", "pipe:2", "-i", "/dev/sr1", "/out/Main.mp4",
    };
    EXPECT_EQ(expected, plan_command(*plan));
    EXPECT_FALSE(plan->will_execute);
    const std::vector<std::string> queried = {"dvdbackup", "ffmpeg"};
    EXPECT_EQ(queried, tools.queried);
    discrip_release_plan(plan);
}

TEST(PlanBuilderTest, FailsWhenNoToolResolves) {
    ToolSet tools{{}, {}};
    const DiscRipTitleInfo title = make_title("Main", 60.0);
    const char* err = nullptr;
    DiscRipPlan* plan = discrip_build_plan(
        "/dev/sr0", &title, "/out/Main.mp4", false, &resolve_from_set, &tools, &err);
    EXPECT_EQ(nullptr, plan);
    ASSERT_NE(nullptr, err);
    EXPECT_STREQ("No supported ripping tools found on PATH", err);
    discrip_release_error(err);
}

TEST(PlanBuilderTest, DvdbackupLabelFallsBackToTitleLabel) {
    ToolSet tools{{"dvdbackup"}, {}};
    const DiscRipTitleInfo title = make_title("Bonus", 60.0);
    DiscRipPlan* plan = discrip_build_plan(
        "/dev/sr0", &title, "/", false, &resolve_from_set, &tools, nullptr);
    ASSERT_NE(nullptr, plan);
    const auto command = plan_command(*plan);
    ASSERT_EQ(8u, command.size());
    EXPECT_EQ("Bonus", command[6]);
    discrip_release_plan(plan);
}

TEST(PlanBuilderTest, DvdbackupRelativeDestinationUsesCurrentDirectory) {
    ToolSet tools{{"dvdbackup"}, {}};
    const DiscRipTitleInfo title = make_title(nullptr, 0.0);
    DiscRipPlan* plan = discrip_build_plan(
        "/dev/sr0", &title, "clip.mp4", false, &resolve_from_set, &tools, nullptr);
    ASSERT_NE(nullptr, plan);
    const auto command = plan_command(*plan);
    EXPECT_EQ(".", command[4]);
    EXPECT_EQ("clip", command[6]);
    discrip_release_plan(plan);
}

TEST(PlanBuilderTest, RejectsMissingArguments) {
    const DiscRipTitleInfo title = make_title("Main", 60.0);
    const char* err = nullptr;
    EXPECT_EQ(nullptr, discrip_build_plan("/dev/sr0", &title, "", false, nullptr, nullptr, &err));
    ASSERT_NE(nullptr, err);
    discrip_release_error(err);
}

TEST(PlanBuilderTest, NinetyFiveMinuteTitleWithOnlyFfmpeg) {
    ToolSet tools{{"ffmpeg"}, {}};
    const DiscRipTitleInfo title = make_title("Feature", 95 * 60.0);
    DiscRipPlan* plan = discrip_build_plan(
        "/dev/sr0", &title, "/videos/Feature.mp4", false, &resolve_from_set, &tools, nullptr);
    ASSERT_NE(nullptr, plan);
    const auto command = plan_command(*plan);
    ASSERT_GE(command.size(), 3u);
    EXPECT_EQ("ffmpeg", command.front());
    EXPECT_EQ("/dev/sr0", command[command.size() - 2]);
    EXPECT_EQ("/videos/Feature.mp4", command.back());
    EXPECT_DOUBLE_EQ(5700.0, plan->title.duration_sec);
    discrip_release_plan(plan);
}

TEST(PlanOrchestratorTest, BuildsPlansInTitleOrderWithCodes) {
    ToolSet tools{{"ffmpeg"}, {}};
    const DiscRipTitleInfo titles[] = {
        make_title("Pilot", 1800.0),
        make_title("Second", 1750.0),
        make_title("Third", 1790.0),
    };
    const char* codes[] = {"s01e01", "s01e02", "s01e03"};
    DiscRipClassification classification{};
    classification.disc_type = "series";
    classification.titles = titles;
    classification.titles_count = 3;
    classification.episode_codes = codes;
    classification.episode_codes_count = 3;

    FactoryState state;
    const char* err = nullptr;
    DiscRipPlanList* list = discrip_build_plans(
        "/dev/sr0", &classification, &record_destination, &state, true,
        &resolve_from_set, &tools, &err);
    ASSERT_NE(nullptr, list) << (err ? err : "");
    ASSERT_EQ(3u, list->count);

    ASSERT_EQ(3u, state.calls.size());
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(i + 1, state.calls[i].index);
        EXPECT_EQ(codes[i], state.calls[i].code);
        EXPECT_STREQ(titles[i].label, list->plans[i].title.label);
        EXPECT_FALSE(list->plans[i].will_execute);
    }
    EXPECT_STREQ("/out/Pilot.mp4", list->plans[0].destination);
    EXPECT_STREQ("/out/Third.mp4", list->plans[2].destination);
    discrip_release_plan_list(list);
}

TEST(PlanOrchestratorTest, MovieTitlesGetNoCodes) {
    ToolSet tools{{"dvdbackup"}, {}};
    const DiscRipTitleInfo titles[] = {make_title("Feature", 6000.0)};
    DiscRipClassification classification{};
    classification.disc_type = "movie";
    classification.titles = titles;
    classification.titles_count = 1;

    FactoryState state;
    DiscRipPlanList* list = discrip_build_plans(
        "/dev/sr0", &classification, &record_destination, &state, false,
        &resolve_from_set, &tools, nullptr);
    ASSERT_NE(nullptr, list);
    ASSERT_EQ(1u, state.calls.size());
    EXPECT_EQ("", state.calls[0].code);
    EXPECT_EQ(DISCRIP_BACKEND_DVDBACKUP, list->plans[0].backend);
    discrip_release_plan_list(list);
}

TEST(PlanOrchestratorTest, StopsAtFirstFactoryFailure) {
    ToolSet tools{{"ffmpeg"}, {}};
    const DiscRipTitleInfo titles[] = {
        make_title("One", 60.0),
        make_title("Two", 60.0),
        make_title("Three", 60.0),
    };
    DiscRipClassification classification{};
    classification.disc_type = "movie";
    classification.titles = titles;
    classification.titles_count = 3;

    FactoryState state;
    state.fail_at = 2;
    const char* err = nullptr;
    DiscRipPlanList* list = discrip_build_plans(
        "/dev/sr0", &classification, &record_destination, &state, false,
        &resolve_from_set, &tools, &err);
    EXPECT_EQ(nullptr, list);
    EXPECT_EQ(2u, state.calls.size());
    ASSERT_NE(nullptr, err);
    EXPECT_STREQ("Failed to resolve destination for title 2: disk full", err);
    discrip_release_error(err);
}

TEST(PlanOrchestratorTest, MisalignedCodesAreRejected) {
    const DiscRipTitleInfo titles[] = {make_title("One", 60.0), make_title("Two", 60.0)};
    const char* codes[] = {"s01e01"};
    DiscRipClassification classification{};
    classification.disc_type = "series";
    classification.titles = titles;
    classification.titles_count = 2;
    classification.episode_codes = codes;
    classification.episode_codes_count = 1;

    FactoryState state;
    const char* err = nullptr;
    EXPECT_EQ(nullptr, discrip_build_plans(
        "/dev/sr0", &classification, &record_destination, &state, false,
        nullptr, nullptr, &err));
    EXPECT_TRUE(state.calls.empty());
    ASSERT_NE(nullptr, err);
    discrip_release_error(err);
}

TEST(PlanOrchestratorTest, NoToolsFailsWithoutPlans) {
    ToolSet tools{{}, {}};
    const DiscRipTitleInfo titles[] = {make_title("One", 60.0)};
    DiscRipClassification classification{};
    classification.disc_type = "movie";
    classification.titles = titles;
    classification.titles_count = 1;

    FactoryState state;
    const char* err = nullptr;
    EXPECT_EQ(nullptr, discrip_build_plans(
        "/dev/sr0", &classification, &record_destination, &state, false,
        &resolve_from_set, &tools, &err));
    ASSERT_NE(nullptr, err);
    EXPECT_STREQ("No supported ripping tools found on PATH", err);
    discrip_release_error(err);
}
