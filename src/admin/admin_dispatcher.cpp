#include "admin_dispatcher.hpp"

AdminDispatcher::AdminDispatcher(RewardsState& state,
                                 ScheduleManager* schedule_manager,
                                 LockManager* lock_manager,
                                 const Currency* currency,
                                 const LockBounds& lock_bounds,
                                 EventSink* events)
    : state(state),
      schedule_manager(schedule_manager),
      lock_manager(lock_manager),
      currency(currency),
      lock_bounds(lock_bounds),
      events(events)
{
}

RewardsError AdminDispatcher::Dispatch(const Origin& origin,
                                       const admin_call_t& call,
                                       block_number_t now)
{
    const RewardsError err = std::visit(
        [&](const auto& c) { return Handle(origin, c, now); }, call);

    if (err != RewardsError::NONE)
    {
        logger.Log<LogType::Warn>("Call {} at block {} failed: {}",
                                  ToString(GetCallType(call)), now,
                                  ToString(err));
    }
    return err;
}

RewardsError AdminDispatcher::ValidateLockParams(const LockParameters& params,
                                                 const LockBounds& bounds)
{
    if (params.period < bounds.period_min ||
        params.period > bounds.period_max ||
        params.divide < bounds.divide_min || params.divide > bounds.divide_max)
    {
        return RewardsError::LOCK_PARAMS_OUT_OF_BOUNDS;
    }

    // divide == 0 can only pass with a zero minimum
    if (params.divide == 0 || params.period % params.divide != 0)
    {
        return RewardsError::LOCK_PERIOD_NOT_DIVISIBLE;
    }

    return RewardsError::NONE;
}

RewardSchedule AdminDispatcher::BuildSchedule(const SetScheduleCall& call)
{
    RewardSchedule sched;
    sched.current_reward = call.reward;

    for (const auto& [account, mint] : call.mints)
    {
        sched.current_mints.insert_or_assign(account, mint);
    }

    for (const auto& [block, reward] : call.reward_changes)
    {
        sched.reward_changes.insert_or_assign(block, reward);
    }

    for (const auto& [block, mints] : call.mint_changes)
    {
        mint_map_t change;
        for (const auto& [account, mint] : mints)
        {
            change.insert_or_assign(account, mint);
        }
        sched.mint_changes.insert_or_assign(block, std::move(change));
    }

    return sched;
}

RewardsError AdminDispatcher::Handle(const Origin& origin,
                                     const SetScheduleCall& call,
                                     block_number_t now)
{
    if (origin.type != OriginType::ROOT) return RewardsError::BAD_ORIGIN;

    logger.Log<LogType::Info>("Setting schedule at block {}", now);

    return schedule_manager->SetSchedule(BuildSchedule(call),
                                         currency->MinimumBalance());
}

RewardsError AdminDispatcher::Handle(const Origin& origin,
                                     const SetLockParamsCall& call,
                                     block_number_t)
{
    if (origin.type != OriginType::ROOT) return RewardsError::BAD_ORIGIN;

    if (auto err = ValidateLockParams(call.lock_params, lock_bounds);
        err != RewardsError::NONE)
    {
        return err;
    }

    state.lock_params = call.lock_params;
    events->Deposit(RewardEvent::LockParamsChanged(call.lock_params));

    return RewardsError::NONE;
}

RewardsError AdminDispatcher::Handle(const Origin& origin,
                                     const SetMinerShareCall& call,
                                     block_number_t)
{
    if (origin.type != OriginType::ROOT) return RewardsError::BAD_ORIGIN;

    if (call.percent > 100)
    {
        logger.Log<LogType::Warn>("Ignoring miner share of {}%", call.percent);
        return RewardsError::NONE;
    }

    const Percent pct = Percent::FromPercent(call.percent);
    state.miner_share = pct;
    events->Deposit(RewardEvent::MinerShareChanged(pct));

    return RewardsError::NONE;
}

RewardsError AdminDispatcher::Handle(const Origin& origin, const UnlockCall&,
                                     block_number_t now)
{
    if (origin.type != OriginType::SIGNED) return RewardsError::BAD_ORIGIN;

    const balance_t still_locked =
        lock_manager->UpdateRewardLocks(origin.account, now, false);

    logger.Log<LogType::Info>("{} unlocked at block {}, still locked: {}",
                              origin.account, now, still_locked);

    return RewardsError::NONE;
}

RewardsError AdminDispatcher::Handle(const Origin& origin,
                                     const ForceUnlockCall& call,
                                     block_number_t now)
{
    if (origin.type != OriginType::ROOT) return RewardsError::BAD_ORIGIN;

    lock_manager->UpdateRewardLocks(call.target, now, true);

    return RewardsError::NONE;
}
