#ifndef REWARDS_CONFIG_HPP_
#define REWARDS_CONFIG_HPP_

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "types/reward_types.hpp"

struct GenesisConfig
{
    balance_t reward;
    std::vector<std::pair<account_id_t, balance_t>> mints;
    std::optional<LockParameters> lock_params;
};

struct PoolConfig
{
    account_id_t author;
    uint8_t pool_rate;  // percent
    member_weights_t members;
};

struct RewardCurveConfig
{
    std::string kind;  // "none", "constant" or "halving"
    balance_t initial;
    block_number_t halving_interval;
};

// only used by the simulator
struct SimulationConfig
{
    uint32_t blocks;
    block_number_t start_block;
    std::vector<account_id_t> validators;
    // round robin, an empty string is a block without author
    std::vector<account_id_t> authors;
    std::vector<PoolConfig> pools;
    RewardCurveConfig reward_curve;
};

struct RewardsConfig
{
    uint8_t miner_rewards_percent;
    uint8_t mining_pool_max_rate;
    balance_t minimum_balance;
    account_id_t treasury_account;
    LockBounds lock_bounds;

    GenesisConfig genesis;
    SimulationConfig simulation;
};

#endif
