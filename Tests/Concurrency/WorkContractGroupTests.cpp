#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "Concurrency/WorkContractGroup.h"
#include "Concurrency/WorkService.h"

using namespace Steadfast::Core::Concurrency;

TEST(WorkContractGroupAccounting, ScheduleAndExecute_AllCountersReturnToZero) {
    WorkContractGroup group(256, "AcctTest");
    std::atomic<int> executed{0};

    const int N = 50;
    for (int i = 0; i < N; ++i) {
        auto h = group.createContract([&executed]() { executed.fetch_add(1, std::memory_order_relaxed); });
        auto res = h.schedule();
        ASSERT_EQ(res, ScheduleResult::Scheduled);
    }
    EXPECT_EQ(group.scheduledCount(), static_cast<size_t>(N));

    // Execute on calling thread deterministically
    group.executeAllBackgroundWork();
    group.wait();

    EXPECT_EQ(executed.load(), N);
    EXPECT_EQ(group.scheduledCount(), 0u);
    EXPECT_EQ(group.executingCount(), 0u);
    EXPECT_EQ(group.activeCount(), 0u);
}

TEST(WorkContractGroupAccounting, CapacityExhaustion_ReturnsInvalidHandle) {
    WorkContractGroup group(2, "Tiny");
    auto a = group.createContract([] {});
    auto b = group.createContract([] {});
    auto c = group.createContract([] {});

    EXPECT_TRUE(a.valid());
    EXPECT_TRUE(b.valid());
    EXPECT_FALSE(c.valid());
    EXPECT_EQ(c.schedule(), ScheduleResult::Invalid);

    a.release();
    auto d = group.createContract([] {});
    EXPECT_TRUE(d.valid());
    EXPECT_FALSE(a.valid());
}

TEST(WorkContractGroupAccounting, DoubleScheduleAndUnschedule) {
    WorkContractGroup group(8, "Sched");
    bool ran = false;
    auto h = group.createContract([&ran] { ran = true; });

    EXPECT_EQ(h.schedule(), ScheduleResult::Scheduled);
    EXPECT_EQ(h.schedule(), ScheduleResult::AlreadyScheduled);
    EXPECT_TRUE(h.isScheduled());
    EXPECT_EQ(h.unschedule(), ScheduleResult::NotScheduled);
    EXPECT_FALSE(h.isScheduled());

    EXPECT_EQ(group.executeAllBackgroundWork(), 0u);
    EXPECT_FALSE(ran);
    h.release();
    EXPECT_EQ(group.activeCount(), 0u);
}

TEST(WorkContractGroupAccounting, StoppedGroupRejectsNewWork) {
    WorkContractGroup group(8, "Stopping");
    group.stop();
    EXPECT_TRUE(group.isStopping());
    auto h = group.createContract([] {});
    EXPECT_FALSE(h.valid());

    group.resume();
    auto h2 = group.createContract([] {});
    EXPECT_TRUE(h2.valid());
    h2.release();
}

TEST(WorkContractGroupAccounting, ThrowingContractStillFreesSlot) {
    WorkContractGroup group(4, "Throwing");
    auto h = group.createContract([] { throw std::runtime_error("contract failure"); });
    ASSERT_EQ(h.schedule(), ScheduleResult::Scheduled);
    EXPECT_EQ(group.executeAllBackgroundWork(), 1u);
    EXPECT_EQ(group.activeCount(), 0u);
    EXPECT_FALSE(h.valid());
}

TEST(WorkContractGroupAccounting, ExecuteContractRunsOnlyThatContract) {
    WorkContractGroup group(8, "Targeted");
    std::vector<int> order;
    auto first = group.createContract([&order] { order.push_back(1); });
    auto second = group.createContract([&order] { order.push_back(2); });
    ASSERT_EQ(first.schedule(), ScheduleResult::Scheduled);
    ASSERT_EQ(second.schedule(), ScheduleResult::Scheduled);

    EXPECT_TRUE(group.executeContract(second));
    EXPECT_EQ(order, std::vector<int>{2});
    EXPECT_EQ(group.scheduledCount(), 1u);
    EXPECT_TRUE(first.isScheduled());

    // Already executed: the stale handle is refused
    EXPECT_FALSE(group.executeContract(second));

    auto idle = group.createContract([&order] { order.push_back(3); });
    EXPECT_FALSE(group.executeContract(idle));

    EXPECT_EQ(group.executeAllBackgroundWork(), 1u);
    EXPECT_EQ(order, (std::vector<int>{2, 1}));
    idle.release();
    EXPECT_EQ(group.activeCount(), 0u);
}

TEST(WorkService, WorkersDrainRegisteredGroup) {
    WorkService service(WorkService::Config{2, 8});
    WorkContractGroup group(128, "Service");
    ASSERT_TRUE(service.addWorkContractGroup(&group));
    EXPECT_FALSE(service.addWorkContractGroup(&group));
    service.start();

    std::atomic<int> executed{0};
    for (int i = 0; i < 64; ++i) {
        auto h = group.createContract([&executed] { executed.fetch_add(1); });
        ASSERT_EQ(h.schedule(), ScheduleResult::Scheduled);
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (executed.load() < 64 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    group.wait();
    EXPECT_EQ(executed.load(), 64);

    EXPECT_TRUE(service.removeWorkContractGroup(&group));
    EXPECT_EQ(service.groupCount(), 0u);
    service.stop();
    EXPECT_FALSE(service.isRunning());
}
