#include "onboard/Config.hpp"
#include "onboard/Packages.hpp"
#include "onboard/Simulation.hpp"
#include "onboard/Steps.hpp"

#include <gtest/gtest.h>

static SOnboardConfig withUpdates() {
    SOnboardConfig config;
    config.updates = {SUpdateCategory{.name = "Base", .packages = {SPackageConfig{.title = "git", .commands = {SCommandConfig{.name = "git", .command = {"true"}}}}}}};
    return config;
}

TEST(steps_tests, full_sequence_and_initial_locks) {
    const CStepSequence STEPS(withUpdates());

    ASSERT_EQ(STEPS.size(), 8u);
    EXPECT_EQ(STEPS.item(0).id, STEP_USER);
    EXPECT_EQ(STEPS.item(4).id, STEP_PREFERENCES);
    EXPECT_EQ(STEPS.item(7).id, STEP_REBOOT);

    for (size_t i = 0; i < STEPS.size(); ++i) {
        const bool SHOULD_LOCK = STEPS.item(i).id == STEP_UPDATE || STEPS.item(i).id == STEP_REBOOT;
        EXPECT_EQ(STEPS.isLocked(i), SHOULD_LOCK) << stepName(STEPS.item(i).id);
    }
}

TEST(steps_tests, optional_steps_follow_config) {
    SOnboardConfig config;
    config.locale.enabled              = false;
    config.network.enabled             = false;
    config.preferences.timezoneEnabled = false;

    const CStepSequence STEPS(config);

    ASSERT_EQ(STEPS.size(), 4u);
    EXPECT_EQ(STEPS.item(0).id, STEP_USER);
    EXPECT_EQ(STEPS.item(1).id, STEP_KEYBOARD);
    EXPECT_EQ(STEPS.item(2).id, STEP_REVIEW);
    EXPECT_EQ(STEPS.item(3).id, STEP_REBOOT);
    EXPECT_FALSE(STEPS.indexOf(STEP_UPDATE));
}

TEST(steps_tests, review_unlocks_update_then_reboot) {
    CStepSequence steps(withUpdates());
    const auto    UPDATE = *steps.indexOf(STEP_UPDATE);
    const auto    REBOOT = *steps.indexOf(STEP_REBOOT);

    EXPECT_FALSE(steps.setResult(UPDATE, STEP_RESULT_COMPLETED));

    steps.onReviewCompleted();
    EXPECT_EQ(steps.result(UPDATE), STEP_RESULT_PENDING);
    EXPECT_TRUE(steps.isLocked(REBOOT));

    steps.onUpdateFinished();
    EXPECT_EQ(steps.result(REBOOT), STEP_RESULT_PENDING);
}

TEST(steps_tests, review_unlocks_reboot_without_update) {
    CStepSequence steps(SOnboardConfig{});
    steps.onReviewCompleted();
    EXPECT_EQ(steps.result(*steps.indexOf(STEP_REBOOT)), STEP_RESULT_PENDING);
}

TEST(steps_tests, finished_steps_never_regress) {
    CStepSequence steps(withUpdates());

    EXPECT_TRUE(steps.setResult(0, STEP_RESULT_COMPLETED));
    EXPECT_FALSE(steps.setResult(0, STEP_RESULT_PENDING));
    EXPECT_FALSE(steps.setResult(0, STEP_RESULT_LOCKED));
    EXPECT_EQ(steps.result(0), STEP_RESULT_COMPLETED);

    // re-running a finished step may still fail it
    EXPECT_TRUE(steps.setResult(0, STEP_RESULT_FAILED));

    steps.onReviewCompleted();
    const auto UPDATE = *steps.indexOf(STEP_UPDATE);
    EXPECT_TRUE(steps.setResult(UPDATE, STEP_RESULT_SKIPPED));

    // unlocking again is a no-op
    steps.onReviewCompleted();
    EXPECT_EQ(steps.result(UPDATE), STEP_RESULT_SKIPPED);
}

static std::vector<SUpdateCategory> devCategory() {
    return {SUpdateCategory{
        .name             = "Development",
        .enabledByDefault = true,
        .packages =
            {
                SPackageConfig{.title = "base-devel", .required = true, .commands = {SCommandConfig{.name = "base", .command = {"pacman", "-S", "base-devel"}, .sudo = true}}},
                SPackageConfig{.title = "neovim", .commands = {SCommandConfig{.name = "nvim", .command = {"pacman", "-S", "neovim"}, .sudo = true}}},
                SPackageConfig{.title = "rustup", .commands = {SCommandConfig{.name = "rust", .command = {"rustup", "default", "stable"}}}},
            },
    }};
}

TEST(packages_tests, defaults) {
    auto cats                             = devCategory();
    cats[0].enabledByDefault              = false;
    cats[0].packages[2].enabledByDefault = true;

    const CPackageSelection SEL(cats);
    EXPECT_TRUE(SEL.isSelected(0, 0));
    EXPECT_FALSE(SEL.isSelected(0, 1));
    EXPECT_TRUE(SEL.isSelected(0, 2));
    EXPECT_TRUE(SEL.isCategoryPartiallySelected(0));
}

TEST(packages_tests, category_toggle_keeps_required) {
    CPackageSelection sel(devCategory());
    ASSERT_TRUE(sel.isCategoryFullySelected(0));

    sel.toggleCategory(0);
    EXPECT_TRUE(sel.isSelected(0, 0));
    EXPECT_FALSE(sel.isSelected(0, 1));
    EXPECT_FALSE(sel.isSelected(0, 2));
    EXPECT_TRUE(sel.isCategoryPartiallySelected(0));

    sel.togglePackage(0, 0);
    EXPECT_TRUE(sel.isSelected(0, 0));

    sel.togglePackage(0, 1);
    EXPECT_TRUE(sel.isCategoryPartiallySelected(0));
    EXPECT_FALSE(sel.isCategoryFullySelected(0));

    sel.togglePackage(0, 2);
    EXPECT_TRUE(sel.isCategoryFullySelected(0));
    EXPECT_FALSE(sel.isCategoryPartiallySelected(0));
}

TEST(packages_tests, commands_in_declaration_order) {
    CPackageSelection sel(devCategory());

    auto cmds = sel.selectedCommands();
    ASSERT_EQ(cmds.size(), 3u);
    EXPECT_EQ(cmds[0].name, "base");
    EXPECT_EQ(cmds[1].name, "nvim");
    EXPECT_EQ(cmds[2].name, "rust");
    EXPECT_TRUE(sel.needsSudo());

    sel.togglePackage(0, 1);
    cmds = sel.selectedCommands();
    ASSERT_EQ(cmds.size(), 2u);
    EXPECT_EQ(cmds[1].name, "rust");
}

TEST(packages_tests, cursor_walks_headers_and_packages) {
    auto cats = devCategory();
    cats.push_back(SUpdateCategory{.name = "Empty"});

    CPackageSelection sel(cats);
    EXPECT_EQ(sel.cursorCategory(), 0u);
    EXPECT_FALSE(sel.cursorPackage());

    sel.moveDown();
    EXPECT_EQ(sel.cursorPackage(), std::optional<size_t>{0});

    sel.moveDown();
    sel.toggleAtCursor();
    EXPECT_FALSE(sel.isSelected(0, 1));

    sel.moveDown();
    sel.moveDown();
    EXPECT_EQ(sel.cursorCategory(), 1u);
    EXPECT_FALSE(sel.cursorPackage());

    // last row
    sel.moveDown();
    EXPECT_EQ(sel.cursorCategory(), 1u);

    sel.moveUp();
    EXPECT_EQ(sel.cursorCategory(), 0u);
    EXPECT_EQ(sel.cursorPackage(), std::optional<size_t>{2});
}

static std::vector<STaskStatus> threeTasks() {
    return {STaskStatus{.name = "a"}, STaskStatus{.name = "b"}, STaskStatus{.name = "c"}};
}

TEST(simulation_tests, ten_percent_per_tick) {
    auto             tasks = threeTasks();
    CSimulationClock clock;
    clock.start(SIMULATION_REVIEW);

    for (int i = 0; i < 25; ++i) {
        ASSERT_FALSE(clock.tick(tasks));
    }

    EXPECT_EQ(tasks[0].state, TASK_SUCCESS);
    EXPECT_EQ(tasks[1].state, TASK_SUCCESS);
    EXPECT_EQ(tasks[2].state, TASK_RUNNING);
    EXPECT_EQ(tasks[2].progress, std::optional<uint8_t>{50});
}

TEST(simulation_tests, completes_on_the_tick_after_the_last_task) {
    auto             tasks = threeTasks();
    CSimulationClock clock;
    clock.start(SIMULATION_UPDATE);

    for (int i = 0; i < 30; ++i) {
        ASSERT_FALSE(clock.tick(tasks));
    }

    for (const auto& t : tasks) {
        EXPECT_EQ(t.state, TASK_SUCCESS);
        EXPECT_EQ(t.progress, std::optional<uint8_t>{100});
    }

    EXPECT_EQ(clock.tick(tasks), std::optional{SIMULATION_UPDATE});
    EXPECT_FALSE(clock.active());
    EXPECT_FALSE(clock.tick(tasks));
}

TEST(simulation_tests, idle_clock_does_nothing) {
    auto             tasks = threeTasks();
    CSimulationClock clock;

    EXPECT_FALSE(clock.tick(tasks));
    EXPECT_EQ(tasks[0].state, TASK_PENDING);

    clock.start(SIMULATION_REVIEW);
    clock.tick(tasks);
    clock.stop();
    clock.tick(tasks);
    EXPECT_EQ(tasks[0].progress, std::optional<uint8_t>{10});
}
