#include "job_scheduler.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <set>
#include <stdexcept>
#include <thread>

namespace chunksync::engine {
namespace {

TEST(JobSchedulerTest, NeverExceedsWorkerLimit) {
    constexpr std::size_t kLimit = 3;
    JobScheduler scheduler(kLimit);
    std::atomic<int> running{0};
    std::atomic<int> observed_max{0};

    for (int i = 0; i < 20; ++i) {
        scheduler.submit("job " + std::to_string(i), [&] {
            const int now = ++running;
            int seen = observed_max.load();
            while (now > seen && !observed_max.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --running;
        });
    }
    const auto result = scheduler.wait_all();

    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.succeeded, 20u);
    EXPECT_LE(observed_max.load(), static_cast<int>(kLimit));
    EXPECT_LE(scheduler.peak_active(), kLimit);
    EXPECT_EQ(scheduler.max_parallel(), kLimit);
}

TEST(JobSchedulerTest, FailureDoesNotAbandonSiblings) {
    JobScheduler scheduler(2);
    std::atomic<int> completed{0};
    scheduler.submit("broken", [] { throw std::runtime_error("disk on fire"); });
    for (int i = 0; i < 5; ++i) {
        scheduler.submit("slow " + std::to_string(i), [&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            ++completed;
        });
    }
    const auto result = scheduler.wait_all();

    EXPECT_EQ(completed.load(), 5);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.failed, 1u);
    EXPECT_EQ(result.succeeded, 5u);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures.front(), "broken: disk on fire");
    EXPECT_THROW(result.rethrow_if_failed(), std::runtime_error);
}

TEST(JobSchedulerTest, StateOfTracksRunningJob) {
    JobScheduler scheduler(1);
    std::atomic<bool> started{false};
    std::atomic<bool> release{false};
    const auto job = scheduler.submit("gated", [&] {
        started = true;
        while (!release) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    while (!started) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_EQ(scheduler.state_of(job), JobState::kRunning);

    release = true;
    EXPECT_TRUE(scheduler.wait_all().ok());
    EXPECT_EQ(scheduler.state_of(job), JobState::kSucceeded);
}

TEST(JobSchedulerTest, WaitAnyReturnsEachJobOnce) {
    JobScheduler scheduler(2);
    scheduler.submit("a", [] {});
    scheduler.submit("b", [] { throw std::logic_error("nope"); });
    scheduler.submit("c", [] {});

    std::set<std::string> seen;
    while (const auto job = scheduler.wait_any()) {
        EXPECT_TRUE(seen.insert(job->name).second);
        if (job->name == "b") {
            EXPECT_EQ(job->state, JobState::kFailed);
            EXPECT_EQ(job->error, "nope");
        } else {
            EXPECT_EQ(job->state, JobState::kSucceeded);
        }
        if (seen.size() == 3) {
            break;
        }
    }
    EXPECT_EQ(seen, (std::set<std::string>{"a", "b", "c"}));
    EXPECT_EQ(scheduler.wait_all().failed, 1u);
}

TEST(JobSchedulerTest, BatchesAreIndependent) {
    JobScheduler scheduler(4);
    scheduler.submit("fails", [] { throw std::runtime_error("first batch"); });
    EXPECT_FALSE(scheduler.wait_all().ok());

    scheduler.submit("works", [] {});
    const auto second = scheduler.wait_all();
    EXPECT_TRUE(second.ok());
    EXPECT_EQ(second.succeeded, 1u);
    EXPECT_NO_THROW(second.rethrow_if_failed());
}

TEST(JobSchedulerTest, RejectsZeroWorkers) {
    EXPECT_THROW({ JobScheduler scheduler(0); }, std::invalid_argument);
}

TEST(JobSchedulerTest, SubmitAfterShutdownThrows) {
    JobScheduler scheduler(1);
    scheduler.shutdown();
    EXPECT_THROW(scheduler.submit("late", [] {}), std::logic_error);
}

}  // namespace
}  // namespace chunksync::engine
