#ifndef STATIC_PROVIDERS_HPP_
#define STATIC_PROVIDERS_HPP_

#include <unordered_map>

#include "providers/providers.hpp"

class StaticValidatorSet : public ValidatorSet
{
   public:
    StaticValidatorSet() = default;
    explicit StaticValidatorSet(std::vector<account_id_t> validators)
        : validators(std::move(validators))
    {
    }

    std::vector<account_id_t> Validators() const override
    {
        return validators;
    }
    void SetValidators(std::vector<account_id_t> vals)
    {
        validators = std::move(vals);
    }

   private:
    std::vector<account_id_t> validators;
};

class StaticMiningPoolStats : public MiningPoolStats
{
   public:
    std::optional<MiningPoolStat> GetStat(
        const account_id_t& author) const override;

    void SetStat(const account_id_t& author, MiningPoolStat stat)
    {
        stats.insert_or_assign(author, std::move(stat));
    }

   private:
    std::unordered_map<account_id_t, MiningPoolStat> stats;
};

class ConstantRewardCurve : public RewardCurve
{
   public:
    explicit ConstantRewardCurve(balance_t reward) : reward(reward) {}

    balance_t CalcReward(block_number_t) const override { return reward; }

   private:
    const balance_t reward;
};

// initial reward halved every halving_interval blocks
class HalvingRewardCurve : public RewardCurve
{
   public:
    HalvingRewardCurve(balance_t initial, block_number_t halving_interval);

    balance_t CalcReward(block_number_t block) const override;

   private:
    const balance_t initial;
    const block_number_t halving_interval;
};

#endif
