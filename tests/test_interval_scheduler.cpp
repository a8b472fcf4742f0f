#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "fakes.hpp"
#include "interval_scheduler.hpp"
#include "reconciler.hpp"
#include "sqlite.hpp"

using namespace std::chrono_literals;

class IntervalSchedulerTest : public ::testing::Test {
  protected:
    SQLite db{":memory:"};
    FakeTaskSource source;
    Reconciler reconciler{db, source};
    RecordingNotifier notifier;
};

TEST_F(IntervalSchedulerTest, RejectsSubMinimumIntervals) {
    IntervalSyncScheduler sync(db, reconciler, notifier, 30, 10ms);
    EXPECT_FALSE(sync.SetInterval(0));
    EXPECT_EQ(sync.GetInterval(), 30);
    EXPECT_FALSE(sync.SetInterval(-5));
    EXPECT_EQ(sync.GetInterval(), 30);
    EXPECT_TRUE(sync.SetInterval(1));
    EXPECT_EQ(sync.GetInterval(), 1);
}

TEST_F(IntervalSchedulerTest, ConstructorRejectsSubMinimumInterval) {
    EXPECT_THROW(IntervalSyncScheduler(db, reconciler, notifier, 0, 10ms), std::invalid_argument);
}

TEST_F(IntervalSchedulerTest, StartSeedsKnownIdsFromStore) {
    db.CreateTask("a", "[EXT-1]");
    db.CreateTask("b", "[EXT-2] text");
    db.CreateTask("c", "[EXT-3 broken");

    IntervalSyncScheduler sync(db, reconciler, notifier, 60, 1s);
    sync.Start();
    EXPECT_EQ(sync.KnownCount(), 2u);
    EXPECT_TRUE(sync.IsKnown("1"));
    EXPECT_TRUE(sync.IsKnown("2"));
    EXPECT_FALSE(sync.IsKnown("3"));
    sync.Stop();
}

TEST_F(IntervalSchedulerTest, FireNotifiesOncePerNetNewTask) {
    db.CreateTask("old", "[EXT-1]");
    source.SetSnapshot({MakeRemote("1", "old"), MakeRemote("2", "new one"), MakeRemote("3", "new two")});

    IntervalSyncScheduler sync(db, reconciler, notifier, 60, 1s);
    sync.Start();

    DetectResult result = sync.Fire();
    EXPECT_EQ(result.net_new.size(), 2u);
    EXPECT_EQ(notifier.Count(), 2u);
    EXPECT_TRUE(sync.IsKnown("2"));
    EXPECT_TRUE(sync.IsKnown("3"));
    EXPECT_EQ(db.ListTasks().size(), 3u);

    auto items = notifier.Items();
    EXPECT_EQ(items[0].data["type"], "new_task");

    // Nothing new the second time.
    EXPECT_TRUE(sync.Fire().net_new.empty());
    EXPECT_EQ(notifier.Count(), 2u);
    sync.Stop();
}

TEST_F(IntervalSchedulerTest, SkippedFetchLeavesKnownIdsAlone) {
    source.SetSnapshot({MakeRemote("1", "a")});
    source.SetFailing(true);

    IntervalSyncScheduler sync(db, reconciler, notifier, 60, 1s);
    sync.Start();
    DetectResult result = sync.Fire();
    EXPECT_TRUE(result.skipped);
    EXPECT_EQ(sync.KnownCount(), 0u);
    EXPECT_EQ(notifier.Count(), 0u);
    sync.Stop();
}

TEST_F(IntervalSchedulerTest, FiresOnTimeout) {
    source.SetSnapshot({MakeRemote("1", "a")});

    IntervalSyncScheduler sync(db, reconciler, notifier, 1, 40ms);
    sync.Start();
    EXPECT_TRUE(WaitFor([&] { return sync.FiringCount() >= 2; }, 2000ms));
    sync.Stop();

    EXPECT_EQ(notifier.Count(), 1u);
    EXPECT_EQ(db.ListTasks().size(), 1u);
}

TEST_F(IntervalSchedulerTest, IntervalChangeRestartsWaitWithoutFiring) {
    IntervalSyncScheduler sync(db, reconciler, notifier, 10, 100ms);
    sync.Start();
    std::this_thread::sleep_for(150ms);

    // A longer interval must not trigger a firing by itself.
    ASSERT_TRUE(sync.SetInterval(50));
    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(sync.FiringCount(), 0);

    // A shorter one fires one new interval after the change, not after the old remainder.
    const auto changedAt = std::chrono::steady_clock::now();
    ASSERT_TRUE(sync.SetInterval(2));
    ASSERT_TRUE(WaitFor([&] { return sync.FiringCount() >= 1; }, 3000ms));
    const auto elapsed = std::chrono::steady_clock::now() - changedAt;
    EXPECT_GE(elapsed, 180ms);
    EXPECT_LT(elapsed, 1500ms);
    sync.Stop();
}

TEST_F(IntervalSchedulerTest, StopIsPromptDuringLongWait) {
    IntervalSyncScheduler sync(db, reconciler, notifier, 1000, 1min);
    sync.Start();
    EXPECT_TRUE(sync.IsRunning());

    const auto start = std::chrono::steady_clock::now();
    sync.Stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_FALSE(sync.IsRunning());
    EXPECT_EQ(sync.FiringCount(), 0);
}

TEST_F(IntervalSchedulerTest, StopLetsInFlightFireFinish) {
    source.SetSnapshot({MakeRemote("1", "a")});
    source.SetDelay(200ms);

    IntervalSyncScheduler sync(db, reconciler, notifier, 1, 20ms);
    sync.Start();
    ASSERT_TRUE(WaitFor([&] { return source.Fetches() >= 1; }, 1000ms));
    sync.Stop();

    // The fetch that was running when Stop() came in still completed its import.
    EXPECT_EQ(db.ListTasks().size(), 1u);
}
