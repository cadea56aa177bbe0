#include "lock_manager.hpp"

#include "arith/balance_math.hpp"

LockManager::LockManager(RewardsState& state, Currency* currency,
                         const RewardLockGenerator* generator,
                         EventSink* events)
    : state(state), currency(currency), generator(generator), events(events)
{
}

void LockManager::MergeLocks(lock_map_t& existing, const lock_map_t& fresh)
{
    for (const auto& [unlock_at, amount] : fresh)
    {
        auto& balance = existing[unlock_at];
        balance = SaturatingAdd(balance, amount);
    }
}

balance_t LockManager::SettleLocks(lock_map_t& locks, block_number_t now,
                                   bool force)
{
    if (force)
    {
        locks.clear();
        return 0;
    }

    // everything unlocking at or before now is free
    locks.erase(locks.begin(), locks.upper_bound(now));

    balance_t total_locked = 0;
    for (const auto& [unlock_at, amount] : locks)
    {
        total_locked = SaturatingAdd(total_locked, amount);
    }
    return total_locked;
}

void LockManager::RewardAccount(const account_id_t& account, balance_t amount,
                                block_number_t now)
{
    if (amount == 0) return;

    const lock_map_t fresh =
        generator->GenerateRewardLocks(now, amount, state.lock_params);

    currency->Deposit(account, amount);
    events->Deposit(RewardEvent::Rewarded(account, amount));

    if (fresh.empty()) return;

    lock_map_t locks;
    if (auto it = state.reward_locks.find(account);
        it != state.reward_locks.end())
    {
        locks = it->second;
    }

    MergeLocks(locks, fresh);
    ApplyLocks(account, std::move(locks), now, false);
}

balance_t LockManager::UpdateRewardLocks(const account_id_t& account,
                                         block_number_t now, bool force)
{
    return ApplyLocks(account, GetLocks(account), now, force);
}

balance_t LockManager::ApplyLocks(const account_id_t& account,
                                  lock_map_t locks, block_number_t now,
                                  bool force)
{
    const balance_t total_locked = SettleLocks(locks, now, force);

    if (force)
    {
        currency->RemoveLock(REWARDS_LOCK_ID, account);
        logger.Log<LogType::Info>("Removed all reward locks of {}", account);
    }
    else
    {
        currency->SetLock(
            REWARDS_LOCK_ID, account, total_locked,
            WithdrawReasons::Except(WithdrawReason::TRANSACTION_PAYMENT));
        events->Deposit(RewardEvent::Locked(account, total_locked));

        logger.Log<LogType::Debug>(
            "Locked {} of {} in {} bucket(s) at block {}", total_locked,
            account, locks.size(), now);
    }

    if (locks.empty())
    {
        state.reward_locks.erase(account);
    }
    else
    {
        state.reward_locks.insert_or_assign(account, std::move(locks));
    }

    return total_locked;
}

balance_t LockManager::GetLocked(const account_id_t& account,
                                 block_number_t now) const
{
    auto it = state.reward_locks.find(account);
    if (it == state.reward_locks.end()) return 0;

    const lock_map_t& locks = it->second;
    balance_t total = 0;
    for (auto lock_it = locks.upper_bound(now); lock_it != locks.end();
         ++lock_it)
    {
        total = SaturatingAdd(total, lock_it->second);
    }
    return total;
}

const lock_map_t& LockManager::GetLocks(const account_id_t& account) const
{
    static const lock_map_t empty;

    auto it = state.reward_locks.find(account);
    return it == state.reward_locks.end() ? empty : it->second;
}
