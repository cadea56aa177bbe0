#include "rewards_engine.hpp"

#include <stdexcept>

RewardsEngine::RewardsEngine(const EngineConfig& config,
                             const EngineProviders& providers)
    : schedule_manager(state.schedule, providers.events),
      lock_manager(state, providers.currency, providers.lock_generator,
                   providers.events),
      distributor(
          DistributionConfig{
              .miner_rewards_percent = config.miner_rewards_percent,
              .mining_pool_max_rate = config.mining_pool_max_rate,
              .treasury_account = config.treasury_account},
          &lock_manager, providers.currency, providers.validator_set,
          providers.pool_stats, providers.events),
      block_hook(state, &schedule_manager, &distributor, providers.currency,
                 providers.reward_curve, providers.events),
      admin_dispatcher(state, &schedule_manager, &lock_manager,
                       providers.currency, config.lock_bounds,
                       providers.events)
{
    logger.Log<LogType::Info>(
        "Rewards engine created, miner share: {}%, max pool rate: {}%, "
        "treasury: {}",
        config.miner_rewards_percent.Deconstruct(),
        config.mining_pool_max_rate.Deconstruct(), config.treasury_account);
}

void RewardsEngine::ApplyGenesis(
    const SetScheduleCall& schedule,
    const std::optional<LockParameters>& lock_params)
{
    if (auto err = Dispatch(Origin::Root(), schedule, 0);
        err != RewardsError::NONE)
    {
        throw std::invalid_argument(
            fmt::format("Genesis schedule rejected: {}", ToString(err)));
    }

    if (!lock_params) return;

    if (auto err = Dispatch(Origin::Root(), SetLockParamsCall{*lock_params}, 0);
        err != RewardsError::NONE)
    {
        throw std::invalid_argument(
            fmt::format("Genesis lock parameters rejected: {}", ToString(err)));
    }
}

void RewardsEngine::OnInitialize(block_number_t now, const BlockDigest& digest)
{
    block_hook.OnInitialize(now, digest);
}

std::optional<DistributionResult> RewardsEngine::OnFinalize(block_number_t now)
{
    return block_hook.OnFinalize(now);
}

RewardsError RewardsEngine::Dispatch(const Origin& origin,
                                     const admin_call_t& call,
                                     block_number_t now)
{
    return admin_dispatcher.Dispatch(origin, call, now);
}
