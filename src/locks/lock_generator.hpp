#ifndef LOCK_GENERATOR_HPP_
#define LOCK_GENERATOR_HPP_

#include "providers/providers.hpp"

// Splits a payout into `divide` equal buckets, unlocking every
// period / divide blocks after the current one. The division remainder is
// added to the last bucket so nothing is lost.
class EvenLockGenerator : public RewardLockGenerator
{
   public:
    lock_map_t GenerateRewardLocks(
        block_number_t current_block, balance_t total_reward,
        const std::optional<LockParameters>& lock_params) const override;

    uint32_t MaxLocks(const LockBounds& bounds) const override
    {
        return bounds.divide_max;
    }
};

#endif
