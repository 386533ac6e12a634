#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "IO/ExclusiveSlot.h"

using namespace AsyncFile::Core::IO;

TEST(ExclusiveSlot, CheckOutMakesSlotBusyUntilLeaseEnds) {
    auto slot = ExclusiveSlot<int>::create(5);
    EXPECT_EQ(slot->state(), ExclusiveSlot<int>::State::Idle);
    {
        auto lease = slot->tryCheckOut();
        ASSERT_TRUE(lease.has_value());
        EXPECT_TRUE(lease->held());
        EXPECT_EQ(**lease, 5);
        EXPECT_TRUE(slot->busy());
        EXPECT_FALSE(slot->tryCheckOut().has_value());
    }
    EXPECT_FALSE(slot->busy());
    EXPECT_TRUE(slot->tryCheckOut().has_value());
}

TEST(ExclusiveSlot, MutationsThroughLeaseAreKept) {
    auto slot = ExclusiveSlot<uint64_t>::create(0);
    {
        auto lease = slot->tryCheckOut();
        ASSERT_TRUE(lease);
        **lease += 16;
    }
    auto again = slot->tryCheckOut();
    ASSERT_TRUE(again);
    EXPECT_EQ(**again, 16u);
}

TEST(ExclusiveSlot, ExplicitCheckInReleasesOnce) {
    auto slot = ExclusiveSlot<std::string>::create("fd");
    auto lease = slot->tryCheckOut();
    ASSERT_TRUE(lease);
    lease->checkIn();
    EXPECT_FALSE(lease->held());
    EXPECT_FALSE(slot->busy());

    // A second check-in is a no-op
    lease->checkIn();
    auto next = slot->tryCheckOut();
    ASSERT_TRUE(next);
    EXPECT_EQ(**next, "fd");
}

TEST(ExclusiveSlot, MovedLeaseTransfersOwnership) {
    auto slot = ExclusiveSlot<int>::create(1);
    auto lease = slot->tryCheckOut();
    ASSERT_TRUE(lease);

    auto shared = std::make_shared<ExclusiveSlot<int>::Lease>(std::move(*lease));
    EXPECT_FALSE(lease->held());
    EXPECT_TRUE(shared->held());
    EXPECT_TRUE(slot->busy());

    shared.reset();
    EXPECT_FALSE(slot->busy());
}

TEST(ExclusiveSlot, LeaseKeepsSlotAliveAfterOwnerDrops) {
    auto slot = ExclusiveSlot<std::unique_ptr<int>>::create(std::make_unique<int>(9));
    std::weak_ptr<ExclusiveSlot<std::unique_ptr<int>>> watch = slot;

    auto lease = slot->tryCheckOut();
    ASSERT_TRUE(lease);
    slot.reset();
    EXPECT_FALSE(watch.expired());
    EXPECT_EQ(***lease, 9);

    lease.reset();
    EXPECT_TRUE(watch.expired());
}
