#include "lock_generator.hpp"

#include <algorithm>
#include <limits>

lock_map_t EvenLockGenerator::GenerateRewardLocks(
    block_number_t current_block, balance_t total_reward,
    const std::optional<LockParameters>& lock_params) const
{
    lock_map_t locks;

    if (!lock_params || total_reward == 0 || lock_params->divide == 0)
    {
        return locks;
    }

    const uint16_t divide = lock_params->divide;
    const block_number_t step = lock_params->period / divide;
    const balance_t bucket = total_reward / divide;
    const balance_t remainder = total_reward % divide;

    // with a zero step every bucket lands on the same block and merges,
    // past the last block number they all land on the last one
    for (uint16_t i = 1; i <= divide; i++)
    {
        const block_number_t unlock_at =
            static_cast<block_number_t>(std::min<uint64_t>(
                static_cast<uint64_t>(current_block) +
                    static_cast<uint64_t>(step) * i,
                std::numeric_limits<block_number_t>::max()));
        const balance_t amount = i == divide ? bucket + remainder : bucket;

        if (amount == 0) continue;
        locks[unlock_at] += amount;
    }

    return locks;
}
