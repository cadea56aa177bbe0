#include "locks/lock_manager.hpp"

#include <gtest/gtest.h>

#include "test_utils.hpp"

class LockManagerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        env.state.lock_params = LockParameters{10, 2};
    }

    TestEnv env;
    LockManager lock_manager{env.state, &env.currency, &env.lock_generator,
                             &env.events};
    const account_id_t alice = TestAccount(0xa1);
};

TEST(LockManager, MergeSumsSameBlock)
{
    lock_map_t existing = {{5, 10}, {10, 20}};
    LockManager::MergeLocks(existing, {{10, 5}, {15, 1}});

    ASSERT_EQ(existing, (lock_map_t{{5, 10}, {10, 25}, {15, 1}}));
}

TEST(LockManager, MergeSaturates)
{
    lock_map_t existing = {{5, UINT64_MAX - 1}};
    LockManager::MergeLocks(existing, {{5, 10}});

    ASSERT_EQ(existing.at(5), UINT64_MAX);
}

TEST(LockManager, SettleDropsExpired)
{
    lock_map_t locks = {{5, 10}, {10, 20}, {15, 30}};

    ASSERT_EQ(LockManager::SettleLocks(locks, 10, false), 30);
    ASSERT_EQ(locks, (lock_map_t{{15, 30}}));
}

TEST(LockManager, SettleForcedClearsAll)
{
    lock_map_t locks = {{5, 10}, {100, 20}};

    ASSERT_EQ(LockManager::SettleLocks(locks, 0, true), 0);
    ASSERT_TRUE(locks.empty());
}

TEST_F(LockManagerTest, RewardWithoutParamsIsFree)
{
    env.state.lock_params.reset();
    lock_manager.RewardAccount(alice, 100, 1);

    ASSERT_EQ(env.currency.FreeBalance(alice), 100);
    ASSERT_EQ(env.currency.UsableBalance(alice), 100);
    ASSERT_TRUE(lock_manager.GetLocks(alice).empty());
    ASSERT_FALSE(env.currency.GetLock(REWARDS_LOCK_ID, alice));
    ASSERT_EQ(env.events.Count(RewardEventType::REWARDED), 1);
    ASSERT_EQ(env.events.Count(RewardEventType::LOCKED), 0);
}

TEST_F(LockManagerTest, ZeroRewardDoesNothing)
{
    lock_manager.RewardAccount(alice, 0, 1);

    ASSERT_EQ(env.currency.FreeBalance(alice), 0);
    ASSERT_TRUE(env.events.GetEvents().empty());
}

TEST_F(LockManagerTest, RewardIsDepositedAndLocked)
{
    lock_manager.RewardAccount(alice, 100, 1);

    ASSERT_EQ(env.currency.FreeBalance(alice), 100);
    ASSERT_EQ(lock_manager.GetLocks(alice), (lock_map_t{{6, 50}, {11, 50}}));

    auto lock = env.currency.GetLock(REWARDS_LOCK_ID, alice);
    ASSERT_TRUE(lock);
    ASSERT_EQ(lock->amount, 100);
    ASSERT_FALSE(lock->reasons.Contains(WithdrawReason::TRANSACTION_PAYMENT));
    ASSERT_TRUE(lock->reasons.Contains(WithdrawReason::TRANSFER));
    ASSERT_EQ(env.currency.UsableBalance(alice), 0);

    auto locked = env.events.OfType(RewardEventType::LOCKED);
    ASSERT_EQ(locked.size(), 1);
    ASSERT_EQ(locked[0].amount, 100);
}

TEST_F(LockManagerTest, LaterRewardMergesAndSettles)
{
    lock_manager.RewardAccount(alice, 100, 1);
    lock_manager.RewardAccount(alice, 100, 6);

    // the bucket unlocking at 6 is released, 11 is shared
    ASSERT_EQ(lock_manager.GetLocks(alice), (lock_map_t{{11, 100}, {16, 50}}));
    ASSERT_EQ(env.currency.GetLock(REWARDS_LOCK_ID, alice)->amount, 150);
    ASSERT_EQ(env.currency.FreeBalance(alice), 200);
    ASSERT_EQ(env.currency.UsableBalance(alice), 50);
}

TEST_F(LockManagerTest, GetLockedIgnoresExpired)
{
    lock_manager.RewardAccount(alice, 100, 1);

    ASSERT_EQ(lock_manager.GetLocked(alice, 1), 100);
    ASSERT_EQ(lock_manager.GetLocked(alice, 6), 50);
    ASSERT_EQ(lock_manager.GetLocked(alice, 11), 0);
    ASSERT_EQ(lock_manager.GetLocked(TestAccount(0x01), 1), 0);
}

TEST_F(LockManagerTest, UpdateReleasesExpired)
{
    lock_manager.RewardAccount(alice, 100, 1);

    ASSERT_EQ(lock_manager.UpdateRewardLocks(alice, 7, false), 50);
    ASSERT_EQ(lock_manager.GetLocks(alice), (lock_map_t{{11, 50}}));
    ASSERT_EQ(env.currency.GetLock(REWARDS_LOCK_ID, alice)->amount, 50);

    ASSERT_EQ(lock_manager.UpdateRewardLocks(alice, 11, false), 0);
    ASSERT_TRUE(lock_manager.GetLocks(alice).empty());
    ASSERT_FALSE(env.state.reward_locks.contains(alice));

    // a zero lock stays on the currency until forced out
    auto lock = env.currency.GetLock(REWARDS_LOCK_ID, alice);
    ASSERT_TRUE(lock);
    ASSERT_EQ(lock->amount, 0);
    ASSERT_EQ(env.currency.UsableBalance(alice), 100);
}

TEST_F(LockManagerTest, ForceRemovesEverything)
{
    lock_manager.RewardAccount(alice, 100, 1);
    env.events.Clear();

    ASSERT_EQ(lock_manager.UpdateRewardLocks(alice, 2, true), 0);

    ASSERT_TRUE(lock_manager.GetLocks(alice).empty());
    ASSERT_FALSE(env.currency.GetLock(REWARDS_LOCK_ID, alice));
    ASSERT_EQ(env.currency.UsableBalance(alice), 100);
    ASSERT_EQ(env.events.Count(RewardEventType::LOCKED), 0);
}

TEST_F(LockManagerTest, RewardNearLastBlockStaysLocked)
{
    const block_number_t now = UINT32_MAX - 5;
    lock_manager.RewardAccount(alice, 100, now);

    ASSERT_EQ(lock_manager.GetLocked(alice, now), 100);
    ASSERT_EQ(env.currency.GetLock(REWARDS_LOCK_ID, alice)->amount, 100);
}

TEST_F(LockManagerTest, UpdateWithoutLocks)
{
    ASSERT_EQ(lock_manager.UpdateRewardLocks(alice, 5, false), 0);
    ASSERT_FALSE(env.state.reward_locks.contains(alice));
}
