#include "src/server/reaper.h"
#include "tests/fake_backend.h"

#include <algorithm>
#include <gtest/gtest.h>
#include <thread>

namespace evalbox {
namespace {

using fakes::FakeBackend;
using Clock = LifecycleRegistry::Clock;

class ReaperTest : public ::testing::Test {
protected:
    ReaperTest()
        : backend_(new FakeBackend()),
          client_(std::unique_ptr<IsolationBackend>(backend_)),
          reaper_(registry_, client_, std::chrono::milliseconds(20)) {}

    void SetUp() override { ASSERT_TRUE(client_.Connect()); }

    // Provisions a real fake environment so Destroy has something to remove.
    std::string Provision(Clock::duration ttl) {
        ProvisionResult result = client_.Provision(ResourceLimits{}, ProgramMount{"/nonexistent", "main.py"});
        registry_.Register(result.handle, ttl);
        return result.handle;
    }

    FakeBackend* backend_;
    IsolationClient client_;
    LifecycleRegistry registry_;
    Reaper reaper_;
};

TEST_F(ReaperTest, SweepDestroysOnlyExpiredEnvironments) {
    std::string expired = Provision(Clock::duration::zero());
    std::string live = Provision(std::chrono::hours(1));

    std::vector<std::string> reaped = reaper_.Sweep();

    EXPECT_EQ(reaped, std::vector<std::string>{expired});
    EXPECT_FALSE(registry_.Find(expired).has_value());
    EXPECT_TRUE(registry_.Find(live).has_value());
    EXPECT_EQ(backend_->LiveCount(), 1u);
}

TEST_F(ReaperTest, FarFutureEntriesSurviveEverySweep) {
    std::string forever = Provision(Clock::duration::max());

    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(reaper_.Sweep(Clock::now() + std::chrono::hours(24 * 365 * i)).empty());
    }
    EXPECT_TRUE(registry_.Find(forever).has_value());
    EXPECT_EQ(backend_->destroy_calls, 0);
}

TEST_F(ReaperTest, FailedDestroyIsDroppedNotRetried) {
    std::string handle = Provision(Clock::duration::zero());
    backend_->fail_destroy = true;

    EXPECT_EQ(reaper_.Sweep(), std::vector<std::string>{handle});
    EXPECT_EQ(registry_.Size(), 0u);
    EXPECT_TRUE(reaper_.Sweep().empty());
    EXPECT_EQ(backend_->destroy_calls, 1);
}

TEST_F(ReaperTest, DestroyingAlreadyDestroyedHandleIsNoop) {
    std::string handle = Provision(Clock::duration::zero());

    DestroyResult first = client_.Destroy(handle);
    DestroyResult second = client_.Destroy(handle);

    EXPECT_TRUE(first.success);
    EXPECT_FALSE(first.already_gone);
    EXPECT_TRUE(second.success);
    EXPECT_TRUE(second.already_gone);
}

TEST_F(ReaperTest, RacingOwnerCleanupIsHarmless) {
    std::string handle = Provision(Clock::duration::zero());

    // The owner destroys and unregisters after the reaper already did.
    EXPECT_EQ(reaper_.Sweep().size(), 1u);
    EXPECT_TRUE(client_.Destroy(handle).success);
    EXPECT_FALSE(registry_.Unregister(handle));
    EXPECT_EQ(backend_->LiveCount(), 0u);
}

TEST_F(ReaperTest, BackgroundLoopReapsZeroTtlOnNextTick) {
    reaper_.Start();
    std::string handle = Provision(Clock::duration::zero());

    auto deadline = Clock::now() + std::chrono::seconds(5);
    while (registry_.Size() > 0 && Clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    EXPECT_EQ(registry_.Size(), 0u);
    EXPECT_EQ(backend_->LiveCount(), 0u);
    reaper_.Stop();
}

TEST_F(ReaperTest, StopDestroysEverythingStillRegistered) {
    reaper_.Start();
    Provision(Clock::duration::max());
    Provision(std::chrono::hours(1));

    reaper_.Stop();

    EXPECT_EQ(registry_.Size(), 0u);
    EXPECT_EQ(backend_->LiveCount(), 0u);
    EXPECT_EQ(backend_->destroy_calls, 2);
}

TEST_F(ReaperTest, StopReturnsPromptlyWithLongInterval) {
    Reaper slow(registry_, client_, std::chrono::hours(1));
    slow.Start();

    auto start = Clock::now();
    slow.Stop();

    EXPECT_LT(Clock::now() - start, std::chrono::seconds(1));
}

} // namespace
} // namespace evalbox
