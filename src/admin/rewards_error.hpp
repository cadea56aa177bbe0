#ifndef REWARDS_ERROR_HPP_
#define REWARDS_ERROR_HPP_

enum class RewardsError
{
    NONE = 0,
    REWARD_TOO_LOW = 1,
    MINT_TOO_LOW = 2,
    NOT_SORTED = 3, /* reserved */
    LOCK_PARAMS_OUT_OF_BOUNDS = 4,
    LOCK_PERIOD_NOT_DIVISIBLE = 5,
    INSUFFICIENT_BALANCE = 6,              /* reserved */
    DECREASE_LOCK_AMOUNT_NOT_ALLOWED = 7,  /* reserved */
    BAD_ORIGIN = 8,
};

inline const char* ToString(RewardsError err)
{
    switch (err)
    {
        case RewardsError::NONE:
            return "None";
        case RewardsError::REWARD_TOO_LOW:
            return "RewardTooLow";
        case RewardsError::MINT_TOO_LOW:
            return "MintTooLow";
        case RewardsError::NOT_SORTED:
            return "NotSorted";
        case RewardsError::LOCK_PARAMS_OUT_OF_BOUNDS:
            return "LockParamsOutOfBounds";
        case RewardsError::LOCK_PERIOD_NOT_DIVISIBLE:
            return "LockPeriodNotDivisible";
        case RewardsError::INSUFFICIENT_BALANCE:
            return "InsufficientBalance";
        case RewardsError::DECREASE_LOCK_AMOUNT_NOT_ALLOWED:
            return "DecreaseLockAmountNotAllowed";
        case RewardsError::BAD_ORIGIN:
            return "BadOrigin";
    }
    return "Unknown";
}

#endif
