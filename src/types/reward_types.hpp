#ifndef REWARD_TYPES_HPP_
#define REWARD_TYPES_HPP_

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "arith/per_thing.hpp"

// hex of the 32 byte public key
typedef std::string account_id_t;
typedef uint64_t balance_t;
typedef uint32_t block_number_t;

// unlock block -> locked amount
typedef std::map<block_number_t, balance_t> lock_map_t;
typedef std::map<account_id_t, balance_t> mint_map_t;

typedef std::string lock_id_t;
// shared with the other owners of currency locks (validator set)
inline const lock_id_t REWARDS_LOCK_ID = "rewards ";

static constexpr std::size_t ACCOUNT_ID_SIZE = 32;

struct LockParameters
{
    uint16_t period;
    uint16_t divide;

    bool operator==(const LockParameters&) const = default;
};

struct LockBounds
{
    uint16_t period_min;
    uint16_t period_max;
    uint16_t divide_min;
    uint16_t divide_max;
};

typedef std::vector<std::pair<account_id_t, uint32_t>> member_weights_t;

struct MiningPoolStat
{
    Percent pool_rate;
    member_weights_t members;
};

enum WithdrawReason : uint8_t
{
    TRANSACTION_PAYMENT = 0b00001,
    TRANSFER = 0b00010,
    RESERVE = 0b00100,
    FEE = 0b01000,
    TIP = 0b10000,
};

struct WithdrawReasons
{
    static constexpr uint8_t ALL = 0b11111;

    uint8_t bits = ALL;

    static constexpr WithdrawReasons Except(WithdrawReason reason)
    {
        return WithdrawReasons{static_cast<uint8_t>(ALL & ~reason)};
    }

    constexpr bool Contains(WithdrawReason reason) const
    {
        return bits & reason;
    }

    bool operator==(const WithdrawReasons&) const = default;
};

#endif
