/**
 * @file test_horizon.cpp
 * @brief Unit tests for HorizonEstimator.
 */

#include "scheduler/horizon_estimator.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>

using namespace print_scheduler;

class HorizonEstimatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto roster = PrinterRoster::create({
            {1, "XL 001", "PETG", "FDM", "XL", "3"},
            {2, "XL 002", "PETG", "FDM", "XL", "3"},
            {3, "Core 001", "Fiberon", "FDM", "Core One", "2"},
        });
        ASSERT_TRUE(roster.has_value());
        roster_ = std::move(*roster);

        auto sink = std::make_unique<MemorySink>();
        sink_ = sink.get();
        logger_ = std::make_unique<Logger>(std::move(sink), LogLevel::Debug);
    }

    static Job job(JobId id, std::string material, Minutes duration) {
        return Job{.id = id, .title = "j" + std::to_string(id), .material = std::move(material),
                   .technology = "FDM", .machine_model = "XL", .duration = duration};
    }

    HorizonEstimator estimator(HorizonSettings settings = {}) {
        return HorizonEstimator(roster_, settings, *logger_);
    }

    PrinterRoster roster_;
    MemorySink* sink_ = nullptr;
    std::unique_ptr<Logger> logger_;
};

TEST_F(HorizonEstimatorTest, BusiestPairingDrivesHorizon) {
    // PETG: 1440 min over 2 printers = 1 day; Fiberon: 1080 over 1 = 1.5 days
    std::vector<Job> jobs{job(1, "PETG", 720), job(2, "PETG", 720), job(3, "Fiberon", 1080)};
    const auto est = estimator().estimate(jobs);

    EXPECT_DOUBLE_EQ(est.days_needed, 1.5);
    EXPECT_EQ(est.planning_days, 4 + 2);            // floor(1.5 × 3) + 2
    EXPECT_EQ(est.horizon, 720 * 6);
    EXPECT_FALSE(est.degenerate);
    EXPECT_EQ(est.pairings.size(), 2u);
    EXPECT_TRUE(est.unsupported.empty());
}

TEST_F(HorizonEstimatorTest, CapabilityCaseIsIgnored) {
    std::vector<Job> jobs{job(1, "petg", 720), job(2, "PETG ", 720)};
    const auto est = estimator().estimate(jobs);
    ASSERT_EQ(est.pairings.size(), 1u);
    EXPECT_EQ(est.pairings.front().work, 1440);
    EXPECT_EQ(est.pairings.front().printer_count, 2u);
}

TEST_F(HorizonEstimatorTest, UnsupportedPairingIsReportedNotFatal) {
    std::vector<Job> jobs{job(1, "ABS", 600), job(2, "PETG", 720)};
    const auto est = estimator().estimate(jobs);

    ASSERT_EQ(est.unsupported.size(), 1u);
    EXPECT_EQ(est.unsupported.front().material, "ABS");
    EXPECT_DOUBLE_EQ(est.days_needed, 0.5);
    EXPECT_EQ(sink_->count_containing("no printer supports"), 1u);
}

TEST_F(HorizonEstimatorTest, DegenerateBatchUsesMinimumWindow) {
    std::vector<Job> jobs{job(1, "ABS", 600)};
    const auto est = estimator().estimate(jobs);

    EXPECT_TRUE(est.degenerate);
    EXPECT_DOUBLE_EQ(est.days_needed, 0.1);
    EXPECT_EQ(est.planning_days, 2);                // floor(0.3) + 2
    EXPECT_GT(est.horizon, 0);
}

TEST_F(HorizonEstimatorTest, EmptyBatchKeepsPadding) {
    const auto est = estimator().estimate({});
    EXPECT_FALSE(est.degenerate);
    EXPECT_EQ(est.planning_days, 2);
    EXPECT_EQ(est.horizon, 1440);
}

TEST_F(HorizonEstimatorTest, MonotoneInWork) {
    auto est = estimator();
    Minutes previous = 0;
    for (Minutes work = 60; work <= 20000; work += 250) {
        std::vector<Job> jobs{job(1, "PETG", work)};
        const auto horizon = est.estimate(jobs).horizon;
        EXPECT_GE(horizon, previous) << "work " << work;
        previous = horizon;
    }
}

TEST_F(HorizonEstimatorTest, SettingsFromConfig) {
    Config config;
    config.shift.length_hours = 10;
    config.horizon.safety_factor = 2.0;
    config.horizon.pad_days = 1;

    const auto settings = HorizonSettings::from_config(config);
    EXPECT_EQ(settings.minutes_per_day, 600);

    std::vector<Job> jobs{job(1, "PETG", 1200)};    // 1 day over 2 printers
    const auto est = estimator(settings).estimate(jobs);
    EXPECT_EQ(est.planning_days, 3);
    EXPECT_EQ(est.horizon, 1800);
}
