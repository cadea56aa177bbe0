#ifndef REWARD_EVENTS_HPP_
#define REWARD_EVENTS_HPP_

#include <cstddef>
#include <string_view>
#include <vector>

#include "logger/logger.hpp"
#include "types/reward_types.hpp"

enum class RewardEventType
{
    SCHEDULE_SET,
    REWARDED,
    REWARD_CHANGED,
    MINTED,
    MINTS_CHANGED,
    LOCK_PARAMS_CHANGED,
    LOCKED,
    MINER_SHARE_CHANGED,
    POOL_EXCEEDS_LIMIT,
    UNDISTRIBUTED_REWARD,
};

const char* ToString(RewardEventType type);

// only the fields relevant to the type are set
struct RewardEvent
{
    RewardEventType type;
    account_id_t account;
    balance_t amount = 0;
    mint_map_t mints;
    LockParameters lock_params{};
    Percent percent;

    static RewardEvent ScheduleSet();
    static RewardEvent Rewarded(const account_id_t& account, balance_t amount);
    static RewardEvent RewardChanged(balance_t amount);
    static RewardEvent Minted(const account_id_t& account, balance_t amount);
    static RewardEvent MintsChanged(const mint_map_t& mints);
    static RewardEvent LockParamsChanged(LockParameters params);
    static RewardEvent Locked(const account_id_t& account, balance_t total);
    static RewardEvent MinerShareChanged(Percent pct);
    static RewardEvent PoolExceedsLimit(const account_id_t& author,
                                        balance_t amount);
    static RewardEvent UndistributedReward(balance_t amount);
};

class EventSink
{
   public:
    virtual ~EventSink() = default;
    virtual void Deposit(const RewardEvent& event) = 0;
};

class RecordingEventSink : public EventSink
{
   public:
    void Deposit(const RewardEvent& event) override
    {
        events.push_back(event);
    }

    std::size_t Count(RewardEventType type) const;
    std::vector<RewardEvent> OfType(RewardEventType type) const;
    const std::vector<RewardEvent>& GetEvents() const { return events; }
    void Clear() { events.clear(); }

   private:
    std::vector<RewardEvent> events;
};

class LoggingEventSink : public EventSink
{
   public:
    void Deposit(const RewardEvent& event) override;

   private:
    static constexpr std::string_view field_str = "Events";
    Logger logger{field_str};
};

#endif
