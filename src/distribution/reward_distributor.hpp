#ifndef REWARD_DISTRIBUTOR_HPP_
#define REWARD_DISTRIBUTOR_HPP_

#include <optional>
#include <string_view>

#include "arith/per_thing.hpp"
#include "events/reward_events.hpp"
#include "locks/lock_manager.hpp"
#include "logger/logger.hpp"
#include "providers/providers.hpp"

struct DistributionConfig
{
    // miner share when no override is set
    Percent miner_rewards_percent;
    // pools above it get slashed, fully at twice the rate
    Percent mining_pool_max_rate;
    account_id_t treasury_account;
};

// what one call paid, for logging and tests
struct DistributionResult
{
    balance_t miner_total = 0;  // before the slash
    balance_t slashed = 0;
    balance_t pool_total = 0;
    balance_t members_paid = 0;
    balance_t author_paid = 0;
    balance_t validator_total = 0;
    balance_t per_validator = 0;
    balance_t validators_paid = 0;
    // validator part nobody received (empty set, rounding)
    balance_t undistributed = 0;
};

class RewardDistributor
{
   public:
    RewardDistributor(const DistributionConfig& config,
                      LockManager* lock_manager, Currency* currency,
                      const ValidatorSet* validator_set,
                      const MiningPoolStats* pool_stats, EventSink* events);

    // 0 up to the limit, ramping up to 1 at twice the limit
    static Perbill GetOvermined(Percent pool_rate, Percent limit);

    // Weight of every member in the pool, a zero total gives everyone the
    // same weight. Returns the total weight.
    static uint64_t GetTotalWeight(const member_weights_t& members);

    // Splits reward between the author (and its pool) and the validators.
    // Never fails, it runs for every block.
    DistributionResult Distribute(const account_id_t& author, balance_t reward,
                                  std::optional<Percent> miner_share,
                                  block_number_t now);

   private:
    // pays the members, returns the pool operator's part plus rounding dust
    balance_t DistributePool(const account_id_t& author,
                             const MiningPoolStat& stat, balance_t miner_total,
                             block_number_t now, DistributionResult& res);

    void DistributeValidators(balance_t validator_total, block_number_t now,
                              DistributionResult& res);

    static constexpr std::string_view field_str = "RewardDistributor";
    Logger logger{field_str};

    const DistributionConfig config;
    LockManager* lock_manager;
    Currency* currency;
    const ValidatorSet* validator_set;
    const MiningPoolStats* pool_stats;
    EventSink* events;
};

#endif
