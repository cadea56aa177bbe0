#include "schedule_manager.hpp"

ScheduleManager::ScheduleManager(RewardSchedule& schedule, EventSink* events)
    : schedule(schedule), events(events)
{
}

void ScheduleManager::Advance(block_number_t now)
{
    auto reward_end = schedule.reward_changes.upper_bound(now);
    for (auto it = schedule.reward_changes.begin(); it != reward_end; ++it)
    {
        schedule.current_reward = it->second;
        events->Deposit(RewardEvent::RewardChanged(it->second));

        logger.Log<LogType::Info>("Reward changed to {} (scheduled at {})",
                                  it->second, it->first);
    }
    schedule.reward_changes.erase(schedule.reward_changes.begin(), reward_end);

    auto mint_end = schedule.mint_changes.upper_bound(now);
    for (auto it = schedule.mint_changes.begin(); it != mint_end; ++it)
    {
        schedule.current_mints = it->second;
        events->Deposit(RewardEvent::MintsChanged(it->second));

        logger.Log<LogType::Info>(
            "Mints changed to {} account(s) (scheduled at {})",
            it->second.size(), it->first);
    }
    schedule.mint_changes.erase(schedule.mint_changes.begin(), mint_end);
}

RewardsError ScheduleManager::ValidateSchedule(const RewardSchedule& sched,
                                               balance_t minimum_balance)
{
    if (sched.current_reward < minimum_balance)
        return RewardsError::REWARD_TOO_LOW;

    for (const auto& [account, mint] : sched.current_mints)
    {
        if (mint < minimum_balance) return RewardsError::MINT_TOO_LOW;
    }

    for (const auto& [block, reward] : sched.reward_changes)
    {
        if (reward < minimum_balance) return RewardsError::REWARD_TOO_LOW;
    }

    for (const auto& [block, mints] : sched.mint_changes)
    {
        for (const auto& [account, mint] : mints)
        {
            if (mint < minimum_balance) return RewardsError::MINT_TOO_LOW;
        }
    }

    return RewardsError::NONE;
}

RewardsError ScheduleManager::SetSchedule(RewardSchedule sched,
                                          balance_t minimum_balance)
{
    if (auto err = ValidateSchedule(sched, minimum_balance);
        err != RewardsError::NONE)
    {
        logger.Log<LogType::Warn>("Rejected schedule: {}", ToString(err));
        return err;
    }

    schedule = std::move(sched);

    events->Deposit(RewardEvent::RewardChanged(schedule.current_reward));
    events->Deposit(RewardEvent::MintsChanged(schedule.current_mints));
    events->Deposit(RewardEvent::ScheduleSet());

    logger.Log<LogType::Info>(
        "Schedule set, reward: {}, mints: {}, pending reward changes: {}, "
        "pending mint changes: {}",
        schedule.current_reward, schedule.current_mints.size(),
        schedule.reward_changes.size(), schedule.mint_changes.size());

    return RewardsError::NONE;
}
