#include "hooks/block_hook.hpp"

#include <gtest/gtest.h>

#include "test_utils.hpp"

DigestItem AuthorItem(const account_id_t& author)
{
    return DigestItem{.type = DigestItemType::PRE_RUNTIME,
                      .engine_id = POSCAN_ENGINE_ID,
                      .data = UnhexlifyV(author)};
}

class BlockHookTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        env.validator_set.SetValidators({validator});
        env.state.schedule.current_reward = 1000;
        env.state.schedule.current_mints = {{minted, 7}};
    }

    TestEnv env;
    ScheduleManager schedule_manager{env.state.schedule, &env.events};
    LockManager lock_manager{env.state, &env.currency, &env.lock_generator,
                             &env.events};
    RewardDistributor distributor{
        DistributionConfig{
            .miner_rewards_percent = Percent::FromPercent(50),
            .mining_pool_max_rate = Percent::FromPercent(30),
            .treasury_account = env.treasury},
        &lock_manager,
        &env.currency,
        &env.validator_set,
        &env.pool_stats,
        &env.events};
    BlockHook hook{env.state,     &schedule_manager, &distributor,
                   &env.currency, nullptr,           &env.events};

    const account_id_t author = TestAccount(0xaa);
    const account_id_t validator = TestAccount(0xbb);
    const account_id_t minted = TestAccount(0xcc);
};

TEST(BlockHook, FindAuthor)
{
    const account_id_t author = TestAccount(0x42);

    BlockDigest digest;
    ASSERT_FALSE(BlockHook::FindAuthor(digest));

    // other engines, other kinds and bad sizes are skipped
    digest.logs.push_back(DigestItem{.type = DigestItemType::PRE_RUNTIME,
                                     .engine_id = {'a', 'u', 'r', 'a'},
                                     .data = UnhexlifyV(TestAccount(0x01))});
    digest.logs.push_back(DigestItem{.type = DigestItemType::SEAL,
                                     .engine_id = POSCAN_ENGINE_ID,
                                     .data = UnhexlifyV(TestAccount(0x02))});
    digest.logs.push_back(DigestItem{.type = DigestItemType::PRE_RUNTIME,
                                     .engine_id = POSCAN_ENGINE_ID,
                                     .data = {1, 2, 3}});
    ASSERT_FALSE(BlockHook::FindAuthor(digest));

    digest.logs.push_back(AuthorItem(author));
    digest.logs.push_back(AuthorItem(TestAccount(0x43)));

    auto found = BlockHook::FindAuthor(digest);
    ASSERT_TRUE(found);
    ASSERT_EQ(*found, author);
}

TEST_F(BlockHookTest, BlockWithAuthor)
{
    hook.OnInitialize(1, BlockDigest{{AuthorItem(author)}});
    ASSERT_EQ(env.state.author, author);

    auto res = hook.OnFinalize(1);
    ASSERT_TRUE(res);
    ASSERT_EQ(res->author_paid, 500);

    ASSERT_EQ(env.currency.FreeBalance(author), 500);
    ASSERT_EQ(env.currency.FreeBalance(validator), 500);
    ASSERT_EQ(env.currency.FreeBalance(minted), 7);
    ASSERT_EQ(env.events.Count(RewardEventType::MINTED), 1);

    ASSERT_FALSE(env.state.author);
}

TEST_F(BlockHookTest, BlockWithoutAuthorStillMints)
{
    hook.OnInitialize(1, BlockDigest{});
    auto res = hook.OnFinalize(1);

    ASSERT_FALSE(res);
    ASSERT_EQ(env.currency.FreeBalance(validator), 0);
    ASSERT_EQ(env.currency.FreeBalance(minted), 7);
    ASSERT_EQ(env.currency.TotalIssuance(), 7);
}

TEST_F(BlockHookTest, AuthorOnlyRewardedOnce)
{
    hook.OnInitialize(1, BlockDigest{{AuthorItem(author)}});
    hook.OnFinalize(1);

    // the next block carries no author, nothing is distributed again
    hook.OnInitialize(2, BlockDigest{});
    ASSERT_FALSE(hook.OnFinalize(2));
    ASSERT_EQ(env.currency.FreeBalance(author), 500);
}

TEST_F(BlockHookTest, ScheduledChangeAppliesBeforeDistribution)
{
    env.state.schedule.reward_changes = {{5, 2000}};
    env.state.schedule.mint_changes = {{5, {}}};

    hook.OnInitialize(5, BlockDigest{{AuthorItem(author)}});
    auto res = hook.OnFinalize(5);

    ASSERT_EQ(res->miner_total, 1000);
    ASSERT_EQ(env.currency.FreeBalance(minted), 0);
}

TEST_F(BlockHookTest, RewardCurveSetsReward)
{
    HalvingRewardCurve curve(1000, 10);
    BlockHook curve_hook{env.state,     &schedule_manager, &distributor,
                         &env.currency, &curve,            &env.events};

    curve_hook.OnInitialize(25, BlockDigest{{AuthorItem(author)}});
    ASSERT_EQ(env.state.schedule.current_reward, 250);

    auto res = curve_hook.OnFinalize(25);
    ASSERT_EQ(res->author_paid, 125);
}

TEST(RewardCurve, Halving)
{
    HalvingRewardCurve curve(1000, 10);

    ASSERT_EQ(curve.CalcReward(0), 1000);
    ASSERT_EQ(curve.CalcReward(9), 1000);
    ASSERT_EQ(curve.CalcReward(10), 500);
    ASSERT_EQ(curve.CalcReward(10 * 64), 0);

    ASSERT_THROW(HalvingRewardCurve(1000, 0), std::invalid_argument);
}
