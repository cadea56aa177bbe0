#include "reward_distributor.hpp"

#include <algorithm>

#include "arith/balance_math.hpp"

RewardDistributor::RewardDistributor(const DistributionConfig& config,
                                     LockManager* lock_manager,
                                     Currency* currency,
                                     const ValidatorSet* validator_set,
                                     const MiningPoolStats* pool_stats,
                                     EventSink* events)
    : config(config),
      lock_manager(lock_manager),
      currency(currency),
      validator_set(validator_set),
      pool_stats(pool_stats),
      events(events)
{
}

Perbill RewardDistributor::GetOvermined(Percent pool_rate, Percent limit)
{
    const Perbill rate = ToPerbill(pool_rate);
    const Perbill max_rate = ToPerbill(limit);

    if (rate <= max_rate) return Perbill::Zero();
    if (rate >= max_rate.IntMul(2)) return Perbill::One();

    return Perbill::SaturatingDiv(rate - max_rate, max_rate,
                                  Rounding::NearestPrefDown);
}

uint64_t RewardDistributor::GetTotalWeight(const member_weights_t& members)
{
    uint64_t total = 0;
    for (const auto& [member, weight] : members) total += weight;

    return total == 0 ? members.size() : total;
}

DistributionResult RewardDistributor::Distribute(
    const account_id_t& author, balance_t reward,
    std::optional<Percent> miner_share, block_number_t now)
{
    DistributionResult res;

    const Percent share = miner_share.value_or(config.miner_rewards_percent);
    balance_t miner_total = share.Mul(reward);
    res.miner_total = miner_total;

    logger.Log<LogType::Debug>(
        "Block {} reward: {}, miner share: {}%, miner total: {}", now, reward,
        share.Deconstruct(), miner_total);

    if (auto stat = pool_stats->GetStat(author))
    {
        const Perbill overmined =
            GetOvermined(stat->pool_rate, config.mining_pool_max_rate);
        const balance_t slash = overmined.Mul(miner_total);

        if (slash > 0)
        {
            currency->Deposit(config.treasury_account, slash);
            events->Deposit(RewardEvent::PoolExceedsLimit(author, slash));

            logger.Log<LogType::Warn>(
                "Pool {} rate {}% exceeds the {}% limit, slashed {} of {}",
                author, stat->pool_rate.Deconstruct(),
                config.mining_pool_max_rate.Deconstruct(), slash, miner_total);
        }
        res.slashed = slash;
        miner_total = SaturatingSub(miner_total, slash);

        miner_total = DistributePool(author, *stat, miner_total, now, res);
    }

    lock_manager->RewardAccount(author, miner_total, now);
    res.author_paid = miner_total;

    DistributeValidators(SaturatingSub(reward, miner_total), now, res);

    return res;
}

balance_t RewardDistributor::DistributePool(const account_id_t& author,
                                            const MiningPoolStat& stat,
                                            balance_t miner_total,
                                            block_number_t now,
                                            DistributionResult& res)
{
    const balance_t pool_total = stat.pool_rate.Mul(miner_total);
    const balance_t members_total = SaturatingSub(miner_total, pool_total);

    const uint64_t total_weight = GetTotalWeight(stat.members);
    const bool equal_weights = std::ranges::all_of(
        stat.members, [](const auto& member) { return member.second == 0; });

    // in the order given, every node must pay out identically
    balance_t paid = 0;
    for (const auto& [member, weight] : stat.members)
    {
        const uint64_t member_weight = equal_weights ? 1 : weight;
        // truncated, the shares never sum above members_total
        const balance_t member_reward = static_cast<balance_t>(
            DivRounded(static_cast<uint128_t>(members_total) * member_weight,
                       total_weight, Rounding::Down));

        logger.Log<LogType::Debug>("Pool {} member {} (weight {}): {}", author,
                                   member, member_weight, member_reward);

        lock_manager->RewardAccount(member, member_reward, now);
        paid += member_reward;
    }

    res.pool_total = pool_total;
    res.members_paid = paid;

    // rounding dust goes back to the author
    return SaturatingAdd(pool_total, members_total - paid);
}

void RewardDistributor::DistributeValidators(balance_t validator_total,
                                             block_number_t now,
                                             DistributionResult& res)
{
    res.validator_total = validator_total;

    const std::vector<account_id_t> validators = validator_set->Validators();
    if (validators.empty())
    {
        res.undistributed = validator_total;
        if (validator_total > 0)
        {
            logger.Log<LogType::Warn>(
                "Validator set is empty, {} left undistributed at block {}",
                validator_total, now);
            events->Deposit(RewardEvent::UndistributedReward(validator_total));
        }
        return;
    }

    // equal truncated shares, the remainder is left undistributed
    const balance_t per_validator = validator_total / validators.size();
    res.per_validator = per_validator;

    balance_t paid = 0;
    for (const auto& validator : validators)
    {
        lock_manager->RewardAccount(validator, per_validator, now);
        paid += per_validator;
    }

    res.validators_paid = paid;
    res.undistributed = validator_total - paid;

    if (res.undistributed > 0)
    {
        events->Deposit(RewardEvent::UndistributedReward(res.undistributed));
    }

    logger.Log<LogType::Debug>(
        "Paid {} to each of {} validator(s), undistributed: {}", per_validator,
        validators.size(), res.undistributed);
}
