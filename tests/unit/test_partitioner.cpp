/**
 * @file test_partitioner.cpp
 * @brief Unit tests for batch capacity and GreedyTitlePartitioner.
 */

#include "scheduler/batch_partitioner.hpp"
#include "workload/job_generator.hpp"

#include <gtest/gtest.h>
#include <random>
#include <set>

using namespace print_scheduler;

namespace {

Job job(JobId id, std::string title, Minutes duration) {
    return Job{.id = id, .title = std::move(title), .material = "PETG",
               .technology = "FDM", .machine_model = "XL", .duration = duration};
}

std::vector<JobId> ids(const Batch& batch) {
    std::vector<JobId> out;
    for (const auto& j : batch) out.push_back(j.id);
    return out;
}

}  // namespace

TEST(BatchCapacityTest, ShiftTimesPrinters) {
    EXPECT_EQ(batch_capacity(720, 11), 7920);
    EXPECT_EQ(batch_capacity(720, 0), 720);
}

TEST(BatchCapacityTest, TotalDuration) {
    std::vector<Job> jobs{job(1, "a", 30), job(2, "b", 45)};
    EXPECT_EQ(total_duration(jobs), 75);
    EXPECT_EQ(total_duration({}), 0);
}

TEST(GreedyTitlePartitionerTest, SortsByTitleThenFills) {
    std::vector<Job> jobs{
        job(1, "c_R1", 40),
        job(2, "a_R1", 40),
        job(3, "b_R1", 40),
        job(4, "a_R2", 40),
    };
    GreedyTitlePartitioner partitioner;
    auto batches = partitioner.partition(jobs, 100);

    ASSERT_EQ(batches.size(), 2u);
    EXPECT_EQ(ids(batches[0]), (std::vector<JobId>{2, 4}));
    EXPECT_EQ(ids(batches[1]), (std::vector<JobId>{3, 1}));
}

TEST(GreedyTitlePartitionerTest, StableForEqualTitles) {
    std::vector<Job> jobs{job(9, "same", 10), job(3, "same", 10), job(5, "same", 10)};
    GreedyTitlePartitioner partitioner;
    auto batches = partitioner.partition(jobs, 1000);
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(ids(batches[0]), (std::vector<JobId>{9, 3, 5}));
}

TEST(GreedyTitlePartitionerTest, OversizedJobFormsItsOwnBatch) {
    std::vector<Job> jobs{job(1, "a", 30), job(2, "b", 500), job(3, "c", 30)};
    GreedyTitlePartitioner partitioner;
    auto batches = partitioner.partition(jobs, 100);

    ASSERT_EQ(batches.size(), 3u);
    EXPECT_EQ(ids(batches[0]), (std::vector<JobId>{1}));
    EXPECT_EQ(ids(batches[1]), (std::vector<JobId>{2}));
    EXPECT_EQ(ids(batches[2]), (std::vector<JobId>{3}));
}

TEST(GreedyTitlePartitionerTest, SingleOversizedJob) {
    std::vector<Job> jobs{job(1, "big", 5000)};
    GreedyTitlePartitioner partitioner;
    auto batches = partitioner.partition(jobs, 720);
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(ids(batches[0]), (std::vector<JobId>{1}));
}

TEST(GreedyTitlePartitionerTest, EmptyInputGivesNoBatches) {
    GreedyTitlePartitioner partitioner;
    EXPECT_TRUE(partitioner.partition({}, 720).empty());
}

TEST(GreedyTitlePartitionerTest, CoversEveryJobOnceWithinCapacity) {
    auto roster = JobGenerator::reference_roster();
    std::mt19937 rng(11);
    auto jobs = JobGenerator::random_for_roster(roster, 300, 30, 600, rng);
    const Minutes capacity = 2000;

    GreedyTitlePartitioner partitioner;
    auto batches = partitioner.partition(jobs, capacity);

    size_t total = 0;
    std::set<JobId> seen;
    for (const auto& batch : batches) {
        EXPECT_FALSE(batch.empty());
        EXPECT_LE(total_duration(batch), capacity);
        total += batch.size();
        for (const auto& j : batch) {
            EXPECT_TRUE(seen.insert(j.id).second) << "job " << j.id << " in two batches";
        }
    }
    EXPECT_EQ(total, jobs.size());
}

TEST(GreedyTitlePartitionerTest, Deterministic) {
    auto roster = JobGenerator::reference_roster();
    std::mt19937 rng(5);
    auto jobs = JobGenerator::random_for_roster(roster, 120, 30, 600, rng);

    GreedyTitlePartitioner partitioner;
    EXPECT_EQ(partitioner.partition(jobs, 1500), partitioner.partition(jobs, 1500));
    EXPECT_EQ(partitioner.name(), "greedy_title");
}
