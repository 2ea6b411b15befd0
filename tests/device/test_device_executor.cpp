/*
 * test_device_executor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Tests for the per-device worker lanes and the timer thread

**************************************************/

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

#include "device/bridge/device_executor.hpp"
#include "device/bridge/scheduler.hpp"

using namespace hearth::device;
using namespace std::chrono_literals;

namespace {

/**
 * @brief One-shot gate a job can block on
 */
class Gate {
public:
    void open() { promise_.set_value(); }
    void wait() { future_.wait(); }

private:
    std::promise<void> promise_;
    std::shared_future<void> future_{promise_.get_future().share()};
};

auto job(std::function<void()> run, std::function<void()> cancel = {},
         std::string key = {}) -> DeviceJob {
    return DeviceJob{std::move(run), std::move(cancel), std::move(key)};
}

}  // namespace

class DeviceExecutorTest : public ::testing::Test {
protected:
    DeviceId a_{"wiz:a"};
    DeviceId b_{"wiz:b"};
};

TEST_F(DeviceExecutorTest, SameDevice_RunsInSubmissionOrder) {
    DeviceExecutor executor(4);
    std::mutex mutex;
    std::vector<int> order;
    std::promise<void> done;

    for (int i = 0; i < 5; ++i) {
        executor.submit(a_, job([&, i] {
                            std::this_thread::sleep_for(2ms);
                            std::lock_guard<std::mutex> lock(mutex);
                            order.push_back(i);
                            if (i == 4) {
                                done.set_value();
                            }
                        }));
    }
    ASSERT_EQ(done.get_future().wait_for(5s), std::future_status::ready);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(DeviceExecutorTest, DifferentDevices_DoNotBlockEachOther) {
    DeviceExecutor executor(2);
    Gate gate;
    std::promise<void> bDone;

    executor.submit(a_, job([&] { gate.wait(); }));
    executor.submit(b_, job([&] { bDone.set_value(); }));

    // b finishes while a is still held
    EXPECT_EQ(bDone.get_future().wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(executor.isBusy(a_));
    gate.open();
}

TEST_F(DeviceExecutorTest, Supersede_DropsQueuedJobWithSameKey) {
    DeviceExecutor executor(2);
    Gate gate;
    std::atomic<int> ran{0};
    std::atomic<int> cancelled{0};
    std::promise<void> lastDone;

    executor.submit(a_, job([&] { gate.wait(); }));
    executor.submit(a_, job([&] { ran += 1; }, [&] { ++cancelled; }, "power"));
    executor.submit(a_, job(
                            [&] {
                                ran += 10;
                                lastDone.set_value();
                            },
                            [&] { ++cancelled; }, "power"));
    EXPECT_EQ(executor.queuedCount(a_), 1U);

    gate.open();
    ASSERT_EQ(lastDone.get_future().wait_for(5s), std::future_status::ready);
    EXPECT_EQ(ran, 10);
    EXPECT_EQ(cancelled, 1);
}

TEST_F(DeviceExecutorTest, Supersede_RunningJobIsNeverDropped) {
    DeviceExecutor executor(2);
    Gate started;
    Gate release;
    std::atomic<bool> firstFinished{false};
    std::promise<void> secondDone;

    executor.submit(a_, job(
                            [&] {
                                started.open();
                                release.wait();
                                firstFinished = true;
                            },
                            {}, "power"));
    started.wait();
    executor.submit(a_, job([&] { secondDone.set_value(); }, {}, "power"));
    release.open();

    ASSERT_EQ(secondDone.get_future().wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(firstFinished);
}

TEST_F(DeviceExecutorTest, SubmitIfIdle_RejectedWhileBusy) {
    DeviceExecutor executor(2);
    Gate gate;
    executor.submit(a_, job([&] { gate.wait(); }));

    bool cancelled = false;
    EXPECT_FALSE(executor.submitIfIdle(a_, job([] {}, [&] { cancelled = true; })));
    EXPECT_FALSE(cancelled);

    std::promise<void> ran;
    EXPECT_TRUE(executor.submitIfIdle(b_, job([&] { ran.set_value(); })));
    EXPECT_EQ(ran.get_future().wait_for(5s), std::future_status::ready);
    gate.open();
}

TEST_F(DeviceExecutorTest, Shutdown_CancelsQueuedAndRejectsNew) {
    auto executor = std::make_unique<DeviceExecutor>(1);
    Gate started;
    Gate release;
    std::atomic<int> cancelled{0};

    executor->submit(a_, job([&] {
                         started.open();
                         release.wait();
                     }));
    started.wait();
    executor->submit(a_, job([] {}, [&] { ++cancelled; }));

    std::thread releaser([&] {
        std::this_thread::sleep_for(20ms);
        release.open();
    });
    executor->shutdown();
    releaser.join();
    EXPECT_EQ(cancelled, 1);

    executor->submit(b_, job([] {}, [&] { ++cancelled; }));
    EXPECT_EQ(cancelled, 2);
    EXPECT_FALSE(executor->submitIfIdle(b_, job([] {})));
}

TEST_F(DeviceExecutorTest, CancelQueued_LeavesRunningJob) {
    DeviceExecutor executor(1);
    Gate gate;
    std::atomic<int> cancelled{0};
    executor.submit(a_, job([&] { gate.wait(); }));
    executor.submit(a_, job([] {}, [&] { ++cancelled; }));
    executor.submit(a_, job([] {}, [&] { ++cancelled; }));

    executor.cancelQueued(a_);
    EXPECT_EQ(cancelled, 2);
    EXPECT_EQ(executor.queuedCount(a_), 0U);
    EXPECT_TRUE(executor.isBusy(a_));
    gate.open();
}

TEST_F(DeviceExecutorTest, Pool_CapsConcurrentJobs) {
    DeviceExecutor executor(2);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::atomic<int> finished{0};
    std::promise<void> allDone;

    for (int i = 0; i < 6; ++i) {
        executor.submit(DeviceId("tuya:" + std::to_string(i)), job([&] {
                            int now = ++active;
                            int seen = peak.load();
                            while (now > seen &&
                                   !peak.compare_exchange_weak(seen, now)) {
                            }
                            std::this_thread::sleep_for(10ms);
                            --active;
                            if (++finished == 6) {
                                allDone.set_value();
                            }
                        }));
    }
    ASSERT_EQ(allDone.get_future().wait_for(5s), std::future_status::ready);
    EXPECT_LE(peak, 2);
}

TEST_F(DeviceExecutorTest, ThrowingJob_DoesNotStallLane) {
    DeviceExecutor executor(1);
    std::promise<void> next;
    executor.submit(a_, job([] { throw std::runtime_error("adapter bug"); }));
    executor.submit(a_, job([&] { next.set_value(); }));
    EXPECT_EQ(next.get_future().wait_for(5s), std::future_status::ready);
}

// ========== Scheduler ==========

TEST(SchedulerTest, ScheduleAfter_FiresOnce) {
    Scheduler scheduler;
    std::promise<void> fired;
    auto start = std::chrono::steady_clock::now();
    scheduler.scheduleAfter(30ms, [&] { fired.set_value(); });

    ASSERT_EQ(fired.get_future().wait_for(5s), std::future_status::ready);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
    EXPECT_EQ(scheduler.pendingCount(), 0U);
}

TEST(SchedulerTest, Cancel_PreventsCallback) {
    Scheduler scheduler;
    std::atomic<bool> fired{false};
    auto id = scheduler.scheduleAfter(200ms, [&] { fired = true; });

    EXPECT_TRUE(scheduler.cancel(id));
    EXPECT_FALSE(scheduler.cancel(id));
    std::this_thread::sleep_for(300ms);
    EXPECT_FALSE(fired);
}

TEST(SchedulerTest, Stop_DropsPendingAndRejectsNew) {
    Scheduler scheduler;
    std::atomic<bool> fired{false};
    scheduler.scheduleAfter(100ms, [&] { fired = true; });
    scheduler.stop();

    EXPECT_EQ(scheduler.pendingCount(), 0U);
    EXPECT_EQ(scheduler.scheduleAfter(1ms, [&] { fired = true; }), 0U);
    std::this_thread::sleep_for(150ms);
    EXPECT_FALSE(fired);
}
