#include "in_memory_currency.hpp"

#include <algorithm>

#include "arith/balance_math.hpp"

InMemoryCurrency::InMemoryCurrency(balance_t minimum_balance)
    : minimum_balance(minimum_balance)
{
}

void InMemoryCurrency::Deposit(const account_id_t& account, balance_t amount)
{
    if (amount == 0) return;

    auto& balance = balances[account];
    balance = SaturatingAdd(balance, amount);
    total_issuance = SaturatingAdd(total_issuance, amount);

    logger.Log<LogType::Debug>("Deposited {} to {}, balance: {}", amount,
                               account, balance);
}

void InMemoryCurrency::SetLock(const lock_id_t& id,
                               const account_id_t& account, balance_t amount,
                               WithdrawReasons reasons)
{
    locks[account].insert_or_assign(id, BalanceLock{amount, reasons});
}

void InMemoryCurrency::RemoveLock(const lock_id_t& id,
                                  const account_id_t& account)
{
    auto it = locks.find(account);
    if (it == locks.end()) return;

    it->second.erase(id);
    if (it->second.empty()) locks.erase(it);
}

balance_t InMemoryCurrency::FreeBalance(const account_id_t& account) const
{
    auto it = balances.find(account);
    return it == balances.end() ? 0 : it->second;
}

balance_t InMemoryCurrency::UsableBalance(const account_id_t& account) const
{
    const balance_t free = FreeBalance(account);

    auto it = locks.find(account);
    if (it == locks.end()) return free;

    balance_t frozen = 0;
    for (const auto& [id, lock] : it->second)
    {
        frozen = std::max(frozen, lock.amount);
    }
    return free > frozen ? free - frozen : 0;
}

std::optional<BalanceLock> InMemoryCurrency::GetLock(
    const lock_id_t& id, const account_id_t& account) const
{
    auto it = locks.find(account);
    if (it == locks.end()) return std::nullopt;

    auto lock_it = it->second.find(id);
    if (lock_it == it->second.end()) return std::nullopt;

    return lock_it->second;
}
