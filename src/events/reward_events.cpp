#include "reward_events.hpp"

#include <algorithm>
#include <iterator>

const char* ToString(RewardEventType type)
{
    switch (type)
    {
        case RewardEventType::SCHEDULE_SET:
            return "ScheduleSet";
        case RewardEventType::REWARDED:
            return "Rewarded";
        case RewardEventType::REWARD_CHANGED:
            return "RewardChanged";
        case RewardEventType::MINTED:
            return "Minted";
        case RewardEventType::MINTS_CHANGED:
            return "MintsChanged";
        case RewardEventType::LOCK_PARAMS_CHANGED:
            return "LockParamsChanged";
        case RewardEventType::LOCKED:
            return "Locked";
        case RewardEventType::MINER_SHARE_CHANGED:
            return "MinerShareChanged";
        case RewardEventType::POOL_EXCEEDS_LIMIT:
            return "PoolExceedsLimit";
        case RewardEventType::UNDISTRIBUTED_REWARD:
            return "UndistributedReward";
    }
    return "Unknown";
}

RewardEvent RewardEvent::ScheduleSet()
{
    return RewardEvent{.type = RewardEventType::SCHEDULE_SET};
}

RewardEvent RewardEvent::Rewarded(const account_id_t& account,
                                  balance_t amount)
{
    return RewardEvent{.type = RewardEventType::REWARDED,
                       .account = account,
                       .amount = amount};
}

RewardEvent RewardEvent::RewardChanged(balance_t amount)
{
    return RewardEvent{.type = RewardEventType::REWARD_CHANGED,
                       .amount = amount};
}

RewardEvent RewardEvent::Minted(const account_id_t& account, balance_t amount)
{
    return RewardEvent{
        .type = RewardEventType::MINTED, .account = account, .amount = amount};
}

RewardEvent RewardEvent::MintsChanged(const mint_map_t& mints)
{
    return RewardEvent{.type = RewardEventType::MINTS_CHANGED,
                       .mints = mints};
}

RewardEvent RewardEvent::LockParamsChanged(LockParameters params)
{
    return RewardEvent{.type = RewardEventType::LOCK_PARAMS_CHANGED,
                       .lock_params = params};
}

RewardEvent RewardEvent::Locked(const account_id_t& account, balance_t total)
{
    return RewardEvent{
        .type = RewardEventType::LOCKED, .account = account, .amount = total};
}

RewardEvent RewardEvent::MinerShareChanged(Percent pct)
{
    return RewardEvent{.type = RewardEventType::MINER_SHARE_CHANGED,
                       .percent = pct};
}

RewardEvent RewardEvent::PoolExceedsLimit(const account_id_t& author,
                                          balance_t amount)
{
    return RewardEvent{.type = RewardEventType::POOL_EXCEEDS_LIMIT,
                       .account = author,
                       .amount = amount};
}

RewardEvent RewardEvent::UndistributedReward(balance_t amount)
{
    return RewardEvent{.type = RewardEventType::UNDISTRIBUTED_REWARD,
                       .amount = amount};
}

std::size_t RecordingEventSink::Count(RewardEventType type) const
{
    return std::ranges::count_if(
        events, [type](const RewardEvent& ev) { return ev.type == type; });
}

std::vector<RewardEvent> RecordingEventSink::OfType(RewardEventType type) const
{
    std::vector<RewardEvent> res;
    std::ranges::copy_if(events, std::back_inserter(res),
                         [type](const RewardEvent& ev)
                         { return ev.type == type; });
    return res;
}

void LoggingEventSink::Deposit(const RewardEvent& event)
{
    switch (event.type)
    {
        case RewardEventType::SCHEDULE_SET:
            logger.Log<LogType::Info>("{}", ToString(event.type));
            break;
        case RewardEventType::REWARDED:
        case RewardEventType::MINTED:
        case RewardEventType::LOCKED:
            logger.Log<LogType::Debug>("{}: {} -> {}", ToString(event.type),
                                       event.account, event.amount);
            break;
        case RewardEventType::POOL_EXCEEDS_LIMIT:
            logger.Log<LogType::Warn>("{}: {} slashed {}",
                                      ToString(event.type), event.account,
                                      event.amount);
            break;
        case RewardEventType::REWARD_CHANGED:
        case RewardEventType::UNDISTRIBUTED_REWARD:
            logger.Log<LogType::Info>("{}: {}", ToString(event.type),
                                      event.amount);
            break;
        case RewardEventType::MINTS_CHANGED:
            logger.Log<LogType::Info>("{}: {} mint(s)", ToString(event.type),
                                      event.mints.size());
            break;
        case RewardEventType::LOCK_PARAMS_CHANGED:
            logger.Log<LogType::Info>("{}: period {}, divide {}",
                                      ToString(event.type),
                                      event.lock_params.period,
                                      event.lock_params.divide);
            break;
        case RewardEventType::MINER_SHARE_CHANGED:
            logger.Log<LogType::Info>("{}: {}%", ToString(event.type),
                                      event.percent.Deconstruct());
            break;
    }
}
