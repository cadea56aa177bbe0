#ifndef PER_THING_HPP_
#define PER_THING_HPP_

#include <algorithm>
#include <compare>
#include <cstdint>

// fixed point fractions of one, no floating point allowed here: every node
// must end up with the exact same balances.

enum class Rounding
{
    Up,
    Down,
    NearestPrefUp,
    NearestPrefDown  // ties go towards zero
};

typedef unsigned __int128 uint128_t;

constexpr uint128_t DivRounded(uint128_t n, uint128_t d, Rounding rounding)
{
    const uint128_t quot = n / d;
    const uint128_t rem = n % d;

    switch (rounding)
    {
        case Rounding::Up:
            return rem ? quot + 1 : quot;
        case Rounding::Down:
            return quot;
        case Rounding::NearestPrefUp:
            return rem * 2 >= d ? quot + 1 : quot;
        case Rounding::NearestPrefDown:
            return rem * 2 > d ? quot + 1 : quot;
    }
    return quot;
}

template <typename Inner, Inner ACCURACY>
class PerThing
{
   public:
    typedef Inner inner_t;
    static constexpr uint64_t accuracy = ACCURACY;

    constexpr PerThing() = default;

    static constexpr PerThing Zero() { return PerThing(0); }
    static constexpr PerThing One() { return PerThing(ACCURACY); }

    // saturates at one
    static constexpr PerThing FromParts(uint64_t parts)
    {
        return PerThing(static_cast<Inner>(std::min(parts, accuracy)));
    }

    static constexpr PerThing FromPercent(uint64_t percent)
    {
        static_assert(ACCURACY % 100 == 0, "Accuracy must be a multiple of 100");
        return PerThing(
            static_cast<Inner>(std::min<uint64_t>(percent, 100) * (accuracy / 100)));
    }

    // p / q, q == 0 or p >= q gives one
    static constexpr PerThing FromRational(uint64_t p, uint64_t q,
                                           Rounding rounding = Rounding::Down)
    {
        if (q == 0 || p >= q) return One();

        return PerThing(static_cast<Inner>(
            DivRounded(static_cast<uint128_t>(p) * accuracy, q, rounding)));
    }

    // a / b, saturating at one (also when b is zero)
    static constexpr PerThing SaturatingDiv(PerThing a, PerThing b,
                                            Rounding rounding)
    {
        if (b.parts == 0 || a.parts >= b.parts) return One();

        return PerThing(static_cast<Inner>(DivRounded(
            static_cast<uint128_t>(a.parts) * accuracy, b.parts, rounding)));
    }

    constexpr Inner Deconstruct() const { return parts; }

    constexpr PerThing SaturatingAdd(PerThing other) const
    {
        return FromParts(static_cast<uint64_t>(parts) + other.parts);
    }

    constexpr PerThing SaturatingSub(PerThing other) const
    {
        return PerThing(
            static_cast<Inner>(parts > other.parts ? parts - other.parts : 0));
    }

    constexpr PerThing IntMul(uint64_t n) const
    {
        const uint128_t res = static_cast<uint128_t>(parts) * n;
        return res >= accuracy ? One() : PerThing(static_cast<Inner>(res));
    }

    // this * n, rounded to the nearest unit (ties down). never exceeds n.
    constexpr uint64_t Mul(uint64_t n) const
    {
        return static_cast<uint64_t>(DivRounded(static_cast<uint128_t>(n) * parts,
                                                accuracy,
                                                Rounding::NearestPrefDown));
    }

    constexpr PerThing operator+(PerThing other) const
    {
        return SaturatingAdd(other);
    }
    constexpr PerThing operator-(PerThing other) const
    {
        return SaturatingSub(other);
    }

    constexpr auto operator<=>(const PerThing&) const = default;

   private:
    constexpr explicit PerThing(Inner parts) : parts(parts) {}

    Inner parts = 0;
};

typedef PerThing<uint8_t, 100> Percent;
typedef PerThing<uint32_t, 1'000'000'000> Perbill;

constexpr Perbill ToPerbill(Percent pct)
{
    return Perbill::FromPercent(pct.Deconstruct());
}

#endif
