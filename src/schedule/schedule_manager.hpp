#ifndef SCHEDULE_MANAGER_HPP_
#define SCHEDULE_MANAGER_HPP_

#include <string_view>

#include "admin/rewards_error.hpp"
#include "events/reward_events.hpp"
#include "logger/logger.hpp"
#include "state/rewards_state.hpp"

class ScheduleManager
{
   public:
    ScheduleManager(RewardSchedule& schedule, EventSink* events);

    // Applies every pending reward and mint change activating at or before
    // now, in block order, one notification each. Applied entries are
    // removed so calling again for the same block does nothing.
    void Advance(block_number_t now);

    // all amounts must be at least the minimum balance
    static RewardsError ValidateSchedule(const RewardSchedule& schedule,
                                         balance_t minimum_balance);

    // replaces the whole schedule, nothing is changed on error
    RewardsError SetSchedule(RewardSchedule schedule,
                             balance_t minimum_balance);

    void SetCurrentReward(balance_t reward) { schedule.current_reward = reward; }

   private:
    static constexpr std::string_view field_str = "ScheduleManager";
    Logger logger{field_str};

    RewardSchedule& schedule;
    EventSink* events;
};

#endif
