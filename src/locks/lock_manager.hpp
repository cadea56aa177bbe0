#ifndef LOCK_MANAGER_HPP_
#define LOCK_MANAGER_HPP_

#include <string_view>

#include "events/reward_events.hpp"
#include "logger/logger.hpp"
#include "providers/providers.hpp"
#include "state/rewards_state.hpp"

// Vesting ledger: every payout is deposited in full and the part the
// generator schedules is locked at the currency level until it unlocks.
class LockManager
{
   public:
    LockManager(RewardsState& state, Currency* currency,
                const RewardLockGenerator* generator, EventSink* events);

    // adds the fresh buckets onto the existing ones, same block sums up
    static void MergeLocks(lock_map_t& existing, const lock_map_t& fresh);

    // Drops the expired entries (all of them when forced) and returns the
    // amount that stays locked.
    static balance_t SettleLocks(lock_map_t& locks, block_number_t now,
                                 bool force);

    // deposit + generate + merge + settle
    void RewardAccount(const account_id_t& account, balance_t amount,
                       block_number_t now);

    // settles the stored locks and mirrors the result on the currency lock
    balance_t UpdateRewardLocks(const account_id_t& account,
                                block_number_t now, bool force);

    // sum of the entries unlocking after now
    balance_t GetLocked(const account_id_t& account, block_number_t now) const;
    const lock_map_t& GetLocks(const account_id_t& account) const;

   private:
    balance_t ApplyLocks(const account_id_t& account, lock_map_t locks,
                         block_number_t now, bool force);

    static constexpr std::string_view field_str = "LockManager";
    Logger logger{field_str};

    RewardsState& state;
    Currency* currency;
    const RewardLockGenerator* generator;
    EventSink* events;
};

#endif
