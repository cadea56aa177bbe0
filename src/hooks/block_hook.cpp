#include "block_hook.hpp"

#include "utils/hex_utils.hpp"

BlockHook::BlockHook(RewardsState& state, ScheduleManager* schedule_manager,
                     RewardDistributor* distributor, Currency* currency,
                     const RewardCurve* reward_curve, EventSink* events)
    : state(state),
      schedule_manager(schedule_manager),
      distributor(distributor),
      currency(currency),
      reward_curve(reward_curve),
      events(events)
{
}

std::optional<account_id_t> BlockHook::FindAuthor(const BlockDigest& digest)
{
    for (const auto& item : digest.logs)
    {
        if (item.type != DigestItemType::PRE_RUNTIME ||
            item.engine_id != POSCAN_ENGINE_ID)
        {
            continue;
        }

        if (item.data.size() == ACCOUNT_ID_SIZE)
        {
            return HexlifyS(item.data);
        }
    }

    return std::nullopt;
}

void BlockHook::OnInitialize(block_number_t now, const BlockDigest& digest)
{
    if (auto author = FindAuthor(digest))
    {
        state.author = std::move(*author);
    }
    else
    {
        logger.Log<LogType::Debug>("No author in block {} digest", now);
    }

    if (reward_curve)
    {
        schedule_manager->SetCurrentReward(reward_curve->CalcReward(now));
    }

    schedule_manager->Advance(now);
}

std::optional<DistributionResult> BlockHook::OnFinalize(block_number_t now)
{
    std::optional<DistributionResult> res;

    if (state.author)
    {
        res = distributor->Distribute(*state.author,
                                      state.schedule.current_reward,
                                      state.miner_share, now);

        logger.Log<LogType::Info>(
            "Block {} by {}: author {}, validators {}, slashed {}", now,
            *state.author, res->author_paid, res->validators_paid,
            res->slashed);
    }

    PayMints(state.schedule.current_mints);

    state.author.reset();
    return res;
}

void BlockHook::PayMints(const mint_map_t& mints)
{
    for (const auto& [destination, mint] : mints)
    {
        currency->Deposit(destination, mint);
        events->Deposit(RewardEvent::Minted(destination, mint));
    }
}
