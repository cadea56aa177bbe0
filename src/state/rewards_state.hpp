#ifndef REWARDS_STATE_HPP_
#define REWARDS_STATE_HPP_

#include <map>
#include <optional>
#include <unordered_map>

#include "types/reward_types.hpp"

struct RewardSchedule
{
    balance_t current_reward = 0;
    // activation block -> new value, only pending entries are kept
    std::map<block_number_t, balance_t> reward_changes;

    mint_map_t current_mints;
    std::map<block_number_t, mint_map_t> mint_changes;
};

// everything the engine persists between blocks
struct RewardsState
{
    // set on block initialization, cleared on finalization
    std::optional<account_id_t> author;

    RewardSchedule schedule;
    std::unordered_map<account_id_t, lock_map_t> reward_locks;

    std::optional<LockParameters> lock_params;
    std::optional<Percent> miner_share;
};

#endif
