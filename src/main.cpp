#include <signal.h>

#include <atomic>
#include <fstream>
#include <memory>
#include <string>

#include "config/config_parser.hpp"
#include "currency/in_memory_currency.hpp"
#include "engine/rewards_engine.hpp"
#include "locks/lock_generator.hpp"
#include "logger/logger.hpp"
#include "providers/static_providers.hpp"
#include "utils/hex_utils.hpp"

std::atomic<bool> stop_requested = false;

const Logger logger{config_field_str};
using enum LogType;

void SigintHandler(int sig)
{
    (void)sig;
    stop_requested = true;
}

std::unique_ptr<RewardCurve> MakeRewardCurve(const RewardCurveConfig& cfg)
{
    if (cfg.kind == "constant")
    {
        return std::make_unique<ConstantRewardCurve>(cfg.initial);
    }
    if (cfg.kind == "halving")
    {
        return std::make_unique<HalvingRewardCurve>(cfg.initial,
                                                    cfg.halving_interval);
    }
    return nullptr;
}

BlockDigest MakeDigest(const account_id_t& author)
{
    BlockDigest digest;
    if (!author.empty())
    {
        digest.logs.push_back(DigestItem{.type = DigestItemType::PRE_RUNTIME,
                                         .engine_id = POSCAN_ENGINE_ID,
                                         .data = UnhexlifyV(author)});
    }
    return digest;
}

int main(int argc, char** argv)
{
    logger.Log<Info>("Starting block rewards simulator!");
    logger.Log<Info>("Loading config...");

    if (signal(SIGINT, SigintHandler) == SIG_ERR)
    {
        logger.Log<Error>("Failed to register SIGINT...");
    }

    RewardsConfig config;
    try
    {
        if (argc < 2 || !std::ifstream(argv[1]).good())
        {
            throw std::invalid_argument("Bad config file specified");
        }

        simdjson::padded_string json = simdjson::padded_string::load(argv[1]);
        ParseRewardsConfig(json, config, logger);
    }
    catch (const std::exception& e)
    {
        logger.Log<Critical>("Failed to parse config: {}", e.what());
        return 1;
    }

    const SimulationConfig& sim = config.simulation;

    InMemoryCurrency currency(config.minimum_balance);
    StaticValidatorSet validator_set(sim.validators);
    StaticMiningPoolStats pool_stats;
    for (const auto& pool : sim.pools)
    {
        pool_stats.SetStat(
            pool.author,
            MiningPoolStat{.pool_rate = Percent::FromPercent(pool.pool_rate),
                           .members = pool.members});
    }
    EvenLockGenerator lock_generator;
    LoggingEventSink events;

    std::unique_ptr<RewardCurve> reward_curve;
    try
    {
        reward_curve = MakeRewardCurve(sim.reward_curve);
    }
    catch (const std::invalid_argument& e)
    {
        logger.Log<Critical>("Bad reward curve: {}", e.what());
        return 1;
    }

    RewardsEngine engine(
        EngineConfig{
            .miner_rewards_percent =
                Percent::FromPercent(config.miner_rewards_percent),
            .mining_pool_max_rate =
                Percent::FromPercent(config.mining_pool_max_rate),
            .treasury_account = config.treasury_account,
            .lock_bounds = config.lock_bounds},
        EngineProviders{.currency = &currency,
                        .validator_set = &validator_set,
                        .pool_stats = &pool_stats,
                        .lock_generator = &lock_generator,
                        .reward_curve = reward_curve.get(),
                        .events = &events});

    try
    {
        engine.ApplyGenesis(
            SetScheduleCall{.reward = config.genesis.reward,
                            .mints = config.genesis.mints},
            config.genesis.lock_params);
    }
    catch (const std::invalid_argument& e)
    {
        logger.Log<Critical>("{}", e.what());
        return 1;
    }

    logger.Log<Info>("Simulating {} block(s) from block {}", sim.blocks,
                     sim.start_block);

    balance_t undistributed = 0;
    block_number_t now = sim.start_block;
    for (uint32_t i = 0; i < sim.blocks && !stop_requested; i++, now++)
    {
        const account_id_t author =
            sim.authors.empty() ? account_id_t{}
                                : sim.authors[i % sim.authors.size()];

        engine.OnInitialize(now, MakeDigest(author));
        if (auto res = engine.OnFinalize(now))
        {
            undistributed += res->undistributed;
        }
    }

    logger.Log<Info>("Finished at block {}, total issuance: {}, "
                     "undistributed: {}",
                     now, currency.TotalIssuance(), undistributed);

    for (const auto& [account, balance] : currency.GetBalances())
    {
        logger.Log<Info>("{}: balance {}, locked {}, usable {}", account,
                         balance, engine.GetLocked(account, now),
                         currency.UsableBalance(account));
    }

    return 0;
}
