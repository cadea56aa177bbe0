#ifndef IN_MEMORY_CURRENCY_HPP_
#define IN_MEMORY_CURRENCY_HPP_

#include <map>
#include <optional>
#include <string_view>
#include <unordered_map>

#include "logger/logger.hpp"
#include "providers/providers.hpp"

struct BalanceLock
{
    balance_t amount;
    WithdrawReasons reasons;
};

// balances and named locks kept in memory, used by the simulator and tests
class InMemoryCurrency : public Currency
{
   public:
    explicit InMemoryCurrency(balance_t minimum_balance);

    void Deposit(const account_id_t& account, balance_t amount) override;
    void SetLock(const lock_id_t& id, const account_id_t& account,
                 balance_t amount, WithdrawReasons reasons) override;
    void RemoveLock(const lock_id_t& id, const account_id_t& account) override;
    balance_t MinimumBalance() const override { return minimum_balance; }

    balance_t FreeBalance(const account_id_t& account) const;
    // free balance minus the largest lock
    balance_t UsableBalance(const account_id_t& account) const;
    std::optional<BalanceLock> GetLock(const lock_id_t& id,
                                       const account_id_t& account) const;
    balance_t TotalIssuance() const { return total_issuance; }
    const std::unordered_map<account_id_t, balance_t>& GetBalances() const
    {
        return balances;
    }

   private:
    static constexpr std::string_view field_str = "Currency";
    Logger logger{field_str};

    const balance_t minimum_balance;
    balance_t total_issuance = 0;
    std::unordered_map<account_id_t, balance_t> balances;
    std::unordered_map<account_id_t, std::map<lock_id_t, BalanceLock>> locks;
};

#endif
