#include <gtest/gtest.h>
#include "core/job_registry.hpp"
#include <set>
#include <thread>
#include <vector>

TEST(JobRegistryTest, AddTracksJobUntilRemoved)
{
    JobRegistry registry;
    auto id = registry.add(OperationKind::AUDIO_MERGE, std::make_shared<CancellationToken>());

    EXPECT_EQ(registry.count(), 1u);
    auto jobs = registry.snapshot();
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].id, id);
    EXPECT_EQ(jobs[0].kind, OperationKind::AUDIO_MERGE);
    EXPECT_EQ(jobs[0].state, JobState::RECEIVED);

    EXPECT_TRUE(registry.setState(id, JobState::TRANSFORMING));
    EXPECT_EQ(registry.snapshot()[0].state, JobState::TRANSFORMING);

    registry.remove(id);
    EXPECT_EQ(registry.count(), 0u);
    EXPECT_FALSE(registry.setState(id, JobState::DONE));
}

TEST(JobRegistryTest, OutcomeCountersFollowLastState)
{
    JobRegistry registry;
    auto ok = registry.add(OperationKind::PDF_MERGE, nullptr);
    auto bad = registry.add(OperationKind::PDF_MERGE, nullptr);

    registry.setState(ok, JobState::DONE);
    registry.setState(bad, JobState::FAILED);
    registry.remove(ok);
    registry.remove(bad);
    registry.remove(bad);

    EXPECT_EQ(registry.completedCount(), 1u);
    EXPECT_EQ(registry.failedCount(), 1u);
}

TEST(JobRegistryTest, CancelAllCancelsEveryToken)
{
    JobRegistry registry;
    auto first = std::make_shared<CancellationToken>();
    auto second = std::make_shared<CancellationToken>();
    registry.add(OperationKind::VIDEO_TRANSCODE, first);
    registry.add(OperationKind::AUDIO_COMPRESS, second);

    EXPECT_EQ(registry.cancelAll("shutdown"), 2u);
    EXPECT_TRUE(first->isCancelled());
    EXPECT_TRUE(second->isCancelled());
    EXPECT_EQ(first->reason(), "shutdown");
}

TEST(JobRegistryTest, ConcurrentAddAndRemove)
{
    JobRegistry registry;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
    {
        threads.emplace_back([&registry]()
                             {
            for (int i = 0; i < 100; ++i)
            {
                auto id = registry.add(OperationKind::IMAGE_RESIZE, nullptr);
                registry.setState(id, JobState::DONE);
                registry.snapshot();
                registry.remove(id);
            } });
    }
    for (auto &t : threads)
        t.join();

    EXPECT_EQ(registry.count(), 0u);
    EXPECT_EQ(registry.completedCount(), 800u);
}

TEST(JobRegistryTest, StateNames)
{
    EXPECT_EQ(JobRegistry::stateName(JobState::RECEIVED), "received");
    EXPECT_EQ(JobRegistry::stateName(JobState::STREAMING), "streaming");
    EXPECT_EQ(JobRegistry::stateName(JobState::FAILED), "failed");
}
