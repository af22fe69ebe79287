/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading and validation.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace print_scheduler;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "ps_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.shift.start_hour, 8u);
    EXPECT_EQ(config.shift.length_hours, 12u);
    EXPECT_EQ(config.shift.start_minutes(), 480);
    EXPECT_EQ(config.shift.length_minutes(), 720);
    EXPECT_EQ(config.proximity.threshold_minutes, 30);
    EXPECT_EQ(config.objective.proximity_weight, 5);
    EXPECT_EQ(config.objective.load_weight, 30);
    EXPECT_EQ(config.jobs.buffer_minutes, 0);
    EXPECT_DOUBLE_EQ(config.solver.time_limit_seconds, 100.0);
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [shift]
        start_hour = 6
        length_hours = 10

        [batching]
        capacity_override_minutes = 1200

        [horizon]
        safety_factor = 2.5
        pad_days = 1
        min_days = 0.25

        [objective]
        makespan_weight = 2
        proximity_weight = 10
        load_weight = 40
        tiebreak_weight = 0

        [proximity]
        threshold_minutes = 15
        lookahead = 8
        max_duration_gap_minutes = 45

        [jobs]
        buffer_minutes = 10
        unroutable_policy = "fail"

        [solver]
        time_limit_seconds = 12.5
        num_workers = 4
        random_seed = 7
        log_search = true
        parallel_batches = 3

        [telemetry]
        log_dir = "/tmp/ps_logs"
        log_level = "debug"
        max_file_size_mb = 10
        rotate_count = 2
        events_file = "/tmp/ps_logs/events.ndjson"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    const auto& config = *result;
    EXPECT_EQ(config.shift.start_hour, 6u);
    EXPECT_EQ(config.shift.length_hours, 10u);
    EXPECT_EQ(config.batching.capacity_override_minutes, 1200);
    EXPECT_DOUBLE_EQ(config.horizon.safety_factor, 2.5);
    EXPECT_EQ(config.horizon.pad_days, 1);
    EXPECT_DOUBLE_EQ(config.horizon.min_days, 0.25);
    EXPECT_EQ(config.objective.makespan_weight, 2);
    EXPECT_EQ(config.objective.proximity_weight, 10);
    EXPECT_EQ(config.objective.load_weight, 40);
    EXPECT_EQ(config.objective.tiebreak_weight, 0);
    EXPECT_EQ(config.proximity.threshold_minutes, 15);
    EXPECT_EQ(config.proximity.lookahead, 8u);
    EXPECT_EQ(config.proximity.max_duration_gap_minutes, 45);
    EXPECT_EQ(config.jobs.buffer_minutes, 10);
    EXPECT_EQ(config.jobs.unroutable_policy, "fail");
    EXPECT_DOUBLE_EQ(config.solver.time_limit_seconds, 12.5);
    EXPECT_EQ(config.solver.num_workers, 4u);
    EXPECT_EQ(config.solver.random_seed, 7);
    EXPECT_TRUE(config.solver.log_search);
    EXPECT_EQ(config.solver.parallel_batches, 3u);
    EXPECT_EQ(config.telemetry.log_dir, "/tmp/ps_logs");
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_EQ(config.telemetry.max_file_size_mb, 10u);
    EXPECT_EQ(config.telemetry.rotate_count, 2u);
    EXPECT_EQ(config.telemetry.events_file, "/tmp/ps_logs/events.ndjson");
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, PartialConfigKeepsDefaults) {
    auto path = write_toml(R"(
        [proximity]
        threshold_minutes = 20
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->proximity.threshold_minutes, 20);
    EXPECT_EQ(result->proximity.lookahead, 20u);
    EXPECT_EQ(result->shift.start_hour, 8u);
    EXPECT_EQ(result->objective.load_weight, 30);
}

TEST_F(ConfigTest, MissingFileIsIoError) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Io);
}

TEST_F(ConfigTest, InvalidTomlIsParseError) {
    auto path = write_toml("this is [not valid toml");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Parse);
}

TEST_F(ConfigTest, RejectsNegativeWeight) {
    auto config = default_config();
    config.objective.proximity_weight = -1;
    auto valid = validate_config(config);
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().kind, ErrorKind::Configuration);
}

TEST_F(ConfigTest, RejectsAllZeroWeights) {
    auto config = default_config();
    config.objective = ObjectiveConfig{.makespan_weight = 0, .proximity_weight = 0,
                                       .load_weight = 0, .tiebreak_weight = 0};
    EXPECT_FALSE(validate_config(config).has_value());
}

TEST_F(ConfigTest, RejectsBadBudgetsAndBounds) {
    auto expect_rejected = [](auto mutate) {
        auto config = default_config();
        mutate(config);
        auto valid = validate_config(config);
        ASSERT_FALSE(valid.has_value());
        EXPECT_EQ(valid.error().kind, ErrorKind::Configuration);
    };

    expect_rejected([](Config& c) { c.solver.time_limit_seconds = 0.0; });
    expect_rejected([](Config& c) { c.solver.num_workers = 0; });
    expect_rejected([](Config& c) { c.solver.parallel_batches = 0; });
    expect_rejected([](Config& c) { c.shift.start_hour = 24; });
    expect_rejected([](Config& c) { c.shift.length_hours = 0; });
    expect_rejected([](Config& c) { c.horizon.safety_factor = 0.5; });
    expect_rejected([](Config& c) { c.horizon.min_days = 0.0; });
    expect_rejected([](Config& c) { c.proximity.threshold_minutes = -5; });
    expect_rejected([](Config& c) { c.proximity.lookahead = 0; });
    expect_rejected([](Config& c) { c.jobs.buffer_minutes = -1; });
    expect_rejected([](Config& c) { c.jobs.unroutable_policy = "drop"; });
    expect_rejected([](Config& c) { c.telemetry.log_level = "verbose"; });
}

TEST_F(ConfigTest, NegativeIntegersAreRejectedBeforeNarrowing) {
    const std::string cases[] = {
        "[proximity]\nlookahead = -1\n",
        "[solver]\nnum_workers = -4\n",
        "[solver]\nparallel_batches = -1\n",
        "[telemetry]\nmax_file_size_mb = -10\n",
        "[shift]\nlength_hours = 4294967297\n",
    };
    for (const auto& content : cases) {
        auto result = load_config(write_toml(content));
        ASSERT_FALSE(result.has_value()) << content;
        EXPECT_EQ(result.error().kind, ErrorKind::Configuration) << content;
    }
}

TEST_F(ConfigTest, ObjectiveModeIsValidated) {
    auto path = write_toml("[objective]\nmode = \"makespan_and_printers\"\n");
    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->objective.mode, "makespan_and_printers");
    EXPECT_TRUE(validate_config(*result).has_value());

    auto config = default_config();
    EXPECT_EQ(config.objective.mode, "composite");
    config.objective.mode = "fastest";
    auto valid = validate_config(config);
    ASSERT_FALSE(valid.has_value());
    EXPECT_EQ(valid.error().kind, ErrorKind::Configuration);
}
