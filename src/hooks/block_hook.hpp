#ifndef BLOCK_HOOK_HPP_
#define BLOCK_HOOK_HPP_

#include <optional>
#include <string_view>

#include "distribution/reward_distributor.hpp"
#include "hooks/block_digest.hpp"
#include "locks/lock_manager.hpp"
#include "logger/logger.hpp"
#include "schedule/schedule_manager.hpp"
#include "state/rewards_state.hpp"

// Drives one block: OnInitialize records the author and advances the
// schedule, OnFinalize pays the reward and the mints. Neither can fail.
class BlockHook
{
   public:
    BlockHook(RewardsState& state, ScheduleManager* schedule_manager,
              RewardDistributor* distributor, Currency* currency,
              const RewardCurve* reward_curve, EventSink* events);

    // first pre-runtime item of our engine with a well sized account
    static std::optional<account_id_t> FindAuthor(const BlockDigest& digest);

    void OnInitialize(block_number_t now, const BlockDigest& digest);
    // the distribution result when there was an author
    std::optional<DistributionResult> OnFinalize(block_number_t now);

   private:
    void PayMints(const mint_map_t& mints);

    static constexpr std::string_view field_str = "BlockHook";
    Logger logger{field_str};

    RewardsState& state;
    ScheduleManager* schedule_manager;
    RewardDistributor* distributor;
    Currency* currency;
    // optional
    const RewardCurve* reward_curve;
    EventSink* events;
};

#endif
