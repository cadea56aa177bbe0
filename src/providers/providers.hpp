#ifndef PROVIDERS_HPP_
#define PROVIDERS_HPP_

#include <optional>
#include <vector>

#include "types/reward_types.hpp"

// collaborators of the rewards engine, injected at construction

class Currency
{
   public:
    virtual ~Currency() = default;

    // creates the balance, never fails
    virtual void Deposit(const account_id_t& account, balance_t amount) = 0;
    virtual void SetLock(const lock_id_t& id, const account_id_t& account,
                         balance_t amount, WithdrawReasons reasons) = 0;
    virtual void RemoveLock(const lock_id_t& id,
                            const account_id_t& account) = 0;
    virtual balance_t MinimumBalance() const = 0;
};

class ValidatorSet
{
   public:
    virtual ~ValidatorSet() = default;
    virtual std::vector<account_id_t> Validators() const = 0;
};

class MiningPoolStats
{
   public:
    virtual ~MiningPoolStats() = default;
    virtual std::optional<MiningPoolStat> GetStat(
        const account_id_t& author) const = 0;
};

// nominal block reward before splitting
class RewardCurve
{
   public:
    virtual ~RewardCurve() = default;
    virtual balance_t CalcReward(block_number_t block) const = 0;
};

class RewardLockGenerator
{
   public:
    virtual ~RewardLockGenerator() = default;

    // buckets must sum up to total_reward exactly, empty means fully liquid
    virtual lock_map_t GenerateRewardLocks(
        block_number_t current_block, balance_t total_reward,
        const std::optional<LockParameters>& lock_params) const = 0;

    virtual uint32_t MaxLocks(const LockBounds& bounds) const = 0;
};

#endif
