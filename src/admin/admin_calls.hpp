#ifndef ADMIN_CALLS_HPP_
#define ADMIN_CALLS_HPP_

#include <cstdint>
#include <utility>
#include <variant>
#include <vector>

#include "types/reward_types.hpp"

enum class OriginType
{
    ROOT,
    SIGNED,
    NONE
};

struct Origin
{
    OriginType type;
    account_id_t account;

    static Origin Root() { return Origin{OriginType::ROOT, {}}; }
    static Origin Signed(account_id_t account)
    {
        return Origin{OriginType::SIGNED, std::move(account)};
    }
    static Origin None() { return Origin{OriginType::NONE, {}}; }
};

enum class AdminCallType
{
    SET_SCHEDULE,
    SET_LOCK_PARAMS,
    SET_MINER_SHARE,
    UNLOCK,
    FORCE_UNLOCK
};

// duplicated keys: the last one wins
struct SetScheduleCall
{
    balance_t reward;
    std::vector<std::pair<account_id_t, balance_t>> mints;
    std::vector<std::pair<block_number_t, balance_t>> reward_changes;
    std::vector<std::pair<block_number_t,
                          std::vector<std::pair<account_id_t, balance_t>>>>
        mint_changes;
};

struct SetLockParamsCall
{
    LockParameters lock_params;
};

struct SetMinerShareCall
{
    // ignored above 100
    uint8_t percent;
};

// unlocks the caller's expired locks
struct UnlockCall
{
};

struct ForceUnlockCall
{
    account_id_t target;
};

// alternatives in AdminCallType order
typedef std::variant<SetScheduleCall, SetLockParamsCall, SetMinerShareCall,
                     UnlockCall, ForceUnlockCall>
    admin_call_t;

inline AdminCallType GetCallType(const admin_call_t& call)
{
    return static_cast<AdminCallType>(call.index());
}

inline const char* ToString(AdminCallType type)
{
    switch (type)
    {
        case AdminCallType::SET_SCHEDULE:
            return "set_schedule";
        case AdminCallType::SET_LOCK_PARAMS:
            return "set_lock_params";
        case AdminCallType::SET_MINER_SHARE:
            return "set_miner_share";
        case AdminCallType::UNLOCK:
            return "unlock";
        case AdminCallType::FORCE_UNLOCK:
            return "force_unlock";
    }
    return "unknown";
}

#endif
