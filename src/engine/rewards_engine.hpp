#ifndef REWARDS_ENGINE_HPP_
#define REWARDS_ENGINE_HPP_

#include <optional>
#include <string_view>

#include "admin/admin_dispatcher.hpp"
#include "distribution/reward_distributor.hpp"
#include "hooks/block_hook.hpp"
#include "locks/lock_manager.hpp"
#include "logger/logger.hpp"
#include "schedule/schedule_manager.hpp"
#include "state/rewards_state.hpp"

struct EngineConfig
{
    Percent miner_rewards_percent;
    Percent mining_pool_max_rate;
    account_id_t treasury_account;
    LockBounds lock_bounds;
};

// not owned, must outlive the engine. reward_curve may be null.
struct EngineProviders
{
    Currency* currency;
    const ValidatorSet* validator_set;
    const MiningPoolStats* pool_stats;
    const RewardLockGenerator* lock_generator;
    const RewardCurve* reward_curve;
    EventSink* events;
};

class RewardsEngine
{
   public:
    RewardsEngine(const EngineConfig& config, const EngineProviders& providers);

    // Installs the initial schedule and lock parameters, validated like the
    // admin calls. Throws std::invalid_argument when rejected.
    void ApplyGenesis(const SetScheduleCall& schedule,
                      const std::optional<LockParameters>& lock_params);

    void OnInitialize(block_number_t now, const BlockDigest& digest);
    std::optional<DistributionResult> OnFinalize(block_number_t now);

    RewardsError Dispatch(const Origin& origin, const admin_call_t& call,
                          block_number_t now);

    balance_t GetLocked(const account_id_t& account, block_number_t now) const
    {
        return lock_manager.GetLocked(account, now);
    }
    const lock_map_t& GetLocks(const account_id_t& account) const
    {
        return lock_manager.GetLocks(account);
    }
    const RewardsState& GetState() const { return state; }

   private:
    static constexpr std::string_view field_str = "RewardsEngine";
    Logger logger{field_str};

    RewardsState state;

    ScheduleManager schedule_manager;
    LockManager lock_manager;
    RewardDistributor distributor;
    BlockHook block_hook;
    AdminDispatcher admin_dispatcher;
};

#endif
