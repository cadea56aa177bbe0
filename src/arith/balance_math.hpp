#ifndef BALANCE_MATH_HPP_
#define BALANCE_MATH_HPP_

#include <limits>

#include "types/reward_types.hpp"

constexpr balance_t SaturatingAdd(balance_t a, balance_t b)
{
    return a > std::numeric_limits<balance_t>::max() - b
               ? std::numeric_limits<balance_t>::max()
               : a + b;
}

constexpr balance_t SaturatingSub(balance_t a, balance_t b)
{
    return a > b ? a - b : 0;
}

#endif
