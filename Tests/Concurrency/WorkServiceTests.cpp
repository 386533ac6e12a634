#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include "Concurrency/WorkContractGroup.h"
#include "Concurrency/WorkService.h"

using namespace AsyncFile::Core::Concurrency;

namespace {
    template <typename Pred>
    bool waitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!pred()) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return true;
    }
}

TEST(WorkService, WorkersDrainRegisteredGroup) {
    WorkService::Config cfg;
    cfg.threadCount = 4;
    WorkService service(cfg);
    WorkContractGroup group(512, "ServiceDrain");

    ASSERT_EQ(service.addWorkContractGroup(&group), WorkService::GroupOperationStatus::Added);
    service.start();
    EXPECT_TRUE(service.isRunning());
    EXPECT_EQ(service.getThreadCount(), 4u);

    std::atomic<int> executed{0};
    const int N = 300;
    for (int i = 0; i < N; ++i) {
        auto h = group.createContract([&executed]() { executed.fetch_add(1, std::memory_order_relaxed); });
        ASSERT_EQ(h.schedule(), ScheduleResult::Scheduled);
    }

    EXPECT_TRUE(waitFor([&] { return executed.load() == N; }));
    group.wait();
    EXPECT_EQ(group.activeCount(), 0u);

    service.removeWorkContractGroup(&group);
    service.stop();
    EXPECT_FALSE(service.isRunning());
}

TEST(WorkService, GroupRegistration_ReportsStatus) {
    WorkService::Config cfg;
    cfg.threadCount = 1;
    cfg.maxWorkGroups = 1;
    WorkService service(cfg);
    WorkContractGroup a(4, "A");
    WorkContractGroup b(4, "B");

    EXPECT_EQ(service.addWorkContractGroup(&a), WorkService::GroupOperationStatus::Added);
    EXPECT_EQ(service.addWorkContractGroup(&a), WorkService::GroupOperationStatus::Exists);
    EXPECT_EQ(service.addWorkContractGroup(&b), WorkService::GroupOperationStatus::OutOfSpace);
    EXPECT_EQ(service.getWorkContractGroupCount(), 1u);

    EXPECT_EQ(service.removeWorkContractGroup(&b), WorkService::GroupOperationStatus::NotFound);
    EXPECT_EQ(service.removeWorkContractGroup(&a), WorkService::GroupOperationStatus::Removed);
    EXPECT_EQ(service.getWorkContractGroupCount(), 0u);
}

TEST(WorkService, DestroyedGroup_UnregistersItself) {
    WorkService::Config cfg;
    cfg.threadCount = 2;
    WorkService service(cfg);
    service.start();
    {
        WorkContractGroup group(8, "ShortLived");
        service.addWorkContractGroup(&group);
        EXPECT_EQ(service.getWorkContractGroupCount(), 1u);
    }
    EXPECT_EQ(service.getWorkContractGroupCount(), 0u);
    service.stop();
}

TEST(WorkService, WorkScheduledBeforeStart_RunsAfterStart) {
    WorkService::Config cfg;
    cfg.threadCount = 2;
    WorkService service(cfg);
    WorkContractGroup group(8, "Deferred");
    service.addWorkContractGroup(&group);

    std::atomic<bool> ran{false};
    group.createContract([&ran]() { ran.store(true); }).schedule();

    service.start();
    EXPECT_TRUE(waitFor([&] { return ran.load(); }));
    service.stop();
}
