#include "static_providers.hpp"

#include <stdexcept>

std::optional<MiningPoolStat> StaticMiningPoolStats::GetStat(
    const account_id_t& author) const
{
    auto it = stats.find(author);
    if (it == stats.end()) return std::nullopt;

    return it->second;
}

HalvingRewardCurve::HalvingRewardCurve(balance_t initial,
                                       block_number_t halving_interval)
    : initial(initial), halving_interval(halving_interval)
{
    if (halving_interval == 0)
    {
        throw std::invalid_argument("Halving interval must be positive");
    }
}

balance_t HalvingRewardCurve::CalcReward(block_number_t block) const
{
    const block_number_t halvings = block / halving_interval;
    if (halvings >= 64) return 0;

    return initial >> halvings;
}
