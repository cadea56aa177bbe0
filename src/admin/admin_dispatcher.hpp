#ifndef ADMIN_DISPATCHER_HPP_
#define ADMIN_DISPATCHER_HPP_

#include <string_view>

#include "admin/admin_calls.hpp"
#include "admin/rewards_error.hpp"
#include "events/reward_events.hpp"
#include "locks/lock_manager.hpp"
#include "logger/logger.hpp"
#include "schedule/schedule_manager.hpp"
#include "state/rewards_state.hpp"

// Every call is checked entirely before it touches the state, a failed call
// leaves everything as it was.
class AdminDispatcher
{
   public:
    AdminDispatcher(RewardsState& state, ScheduleManager* schedule_manager,
                    LockManager* lock_manager, const Currency* currency,
                    const LockBounds& lock_bounds, EventSink* events);

    RewardsError Dispatch(const Origin& origin, const admin_call_t& call,
                          block_number_t now);

    static RewardsError ValidateLockParams(const LockParameters& params,
                                           const LockBounds& bounds);
    static RewardSchedule BuildSchedule(const SetScheduleCall& call);

   private:
    RewardsError Handle(const Origin& origin, const SetScheduleCall& call,
                        block_number_t now);
    RewardsError Handle(const Origin& origin, const SetLockParamsCall& call,
                        block_number_t now);
    RewardsError Handle(const Origin& origin, const SetMinerShareCall& call,
                        block_number_t now);
    RewardsError Handle(const Origin& origin, const UnlockCall& call,
                        block_number_t now);
    RewardsError Handle(const Origin& origin, const ForceUnlockCall& call,
                        block_number_t now);

    static constexpr std::string_view field_str = "AdminDispatcher";
    Logger logger{field_str};

    RewardsState& state;
    ScheduleManager* schedule_manager;
    LockManager* lock_manager;
    const Currency* currency;
    const LockBounds lock_bounds;
    EventSink* events;
};

#endif
