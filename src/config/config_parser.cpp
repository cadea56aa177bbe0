#include "config_parser.hpp"

#include <limits>
#include <stdexcept>
#include <type_traits>

#include "utils/hex_utils.hpp"

namespace
{
template <typename Doc>
void AssignJson(const char* name, std::string& obj, Doc& doc,
                const Logger& logger)
{
    try
    {
        std::string_view sv = doc[name].get_string();

        obj = std::string(sv);
    }
    catch (const simdjson::simdjson_error& err)
    {
        throw std::runtime_error(fmt::format(
            "Invalid or no \"{}\" (expected string) variable in config file: "
            "{}",
            name, err.what()));
    }
    logger.Log<LogType::Info>("{:<{}}: {}", name, CONFIG_PRINT_WIDTH, obj);
}

template <typename T, typename Doc>
void AssignJson(const char* name, T& obj, Doc& doc, const Logger& logger)
{
    static_assert(std::is_unsigned_v<T>, "Only unsigned integers are parsed");

    uint64_t val = 0;
    try
    {
        val = doc[name].get_uint64();
    }
    catch (const simdjson::simdjson_error& err)
    {
        throw std::runtime_error(fmt::format(
            "Invalid or no \"{}\" (expected unsigned integer) variable in "
            "config file: {}",
            name, err.what()));
    }

    if (val > std::numeric_limits<T>::max())
    {
        throw std::runtime_error(
            fmt::format("\"{}\" is out of range: {} > {}", name, val,
                        static_cast<uint64_t>(std::numeric_limits<T>::max())));
    }

    obj = static_cast<T>(val);
    logger.Log<LogType::Info>("{:<{}}: {}", name, CONFIG_PRINT_WIDTH, val);
}

template <typename Doc>
void AssignAccount(const char* name, account_id_t& obj, Doc& doc,
                   const Logger& logger)
{
    AssignJson(name, obj, doc, logger);

    if (!IsValidAccount(obj))
    {
        throw std::runtime_error(fmt::format(
            "\"{}\" is not a valid account ({} hex characters expected)", name,
            ACCOUNT_ID_SIZE * 2));
    }
}

template <typename Doc>
simdjson::ondemand::array GetArray(const char* name, Doc& doc)
{
    try
    {
        return doc[name].get_array();
    }
    catch (const simdjson::simdjson_error& err)
    {
        throw std::runtime_error(fmt::format(
            "Invalid or no \"{}\" (expected array) variable in config file: {}",
            name, err.what()));
    }
}

simdjson::ondemand::object AsObject(
    const char* name, simdjson::simdjson_result<simdjson::ondemand::value> res)
{
    try
    {
        return res.get_object();
    }
    catch (const simdjson::simdjson_error& err)
    {
        throw std::runtime_error(fmt::format(
            "Invalid or no \"{}\" (expected object) variable in config file: "
            "{}",
            name, err.what()));
    }
}

template <typename Doc>
simdjson::ondemand::object GetObject(const char* name, Doc& doc)
{
    return AsObject(name, doc[name]);
}

void ParseLockBounds(simdjson::ondemand::object ob, LockBounds& bounds,
                     const Logger& logger)
{
    AssignJson("period_min", bounds.period_min, ob, logger);
    AssignJson("period_max", bounds.period_max, ob, logger);
    AssignJson("divide_min", bounds.divide_min, ob, logger);
    AssignJson("divide_max", bounds.divide_max, ob, logger);

    if (bounds.period_min > bounds.period_max ||
        bounds.divide_min > bounds.divide_max)
    {
        throw std::runtime_error("Invalid \"lock_bounds\": min above max");
    }
    if (bounds.divide_min == 0)
    {
        throw std::runtime_error("Invalid \"lock_bounds\": divide_min is 0");
    }
}

void ParseGenesis(simdjson::ondemand::object ob, GenesisConfig& genesis,
                  const Logger& logger)
{
    AssignJson("reward", genesis.reward, ob, logger);

    for (auto item : GetArray("mints", ob))
    {
        simdjson::ondemand::object mint = item.get_object();
        std::pair<account_id_t, balance_t> entry;
        AssignAccount("account", entry.first, mint, logger);
        AssignJson("amount", entry.second, mint, logger);
        genesis.mints.push_back(std::move(entry));
    }

    auto lock_params = ob["lock_params"];
    if (lock_params.error() == simdjson::NO_SUCH_FIELD) return;

    simdjson::ondemand::object lp =
        AsObject("lock_params", std::move(lock_params));
    LockParameters params{};
    AssignJson("period", params.period, lp, logger);
    AssignJson("divide", params.divide, lp, logger);
    genesis.lock_params = params;
}

void ParsePools(simdjson::ondemand::array pools, std::vector<PoolConfig>& res,
                const Logger& logger)
{
    for (auto item : pools)
    {
        simdjson::ondemand::object ob = item.get_object();
        PoolConfig pool;
        AssignAccount("author", pool.author, ob, logger);
        AssignJson("pool_rate", pool.pool_rate, ob, logger);

        if (pool.pool_rate > 100)
        {
            throw std::runtime_error(
                fmt::format("Pool {} rate above 100%", pool.author));
        }

        for (auto member_item : GetArray("members", ob))
        {
            simdjson::ondemand::object member = member_item.get_object();
            std::pair<account_id_t, uint32_t> entry;
            AssignAccount("account", entry.first, member, logger);
            AssignJson("weight", entry.second, member, logger);
            pool.members.push_back(std::move(entry));
        }
        res.push_back(std::move(pool));
    }
}

void ParseSimulation(simdjson::ondemand::object ob, SimulationConfig& sim,
                     const Logger& logger)
{
    AssignJson("blocks", sim.blocks, ob, logger);
    AssignJson("start_block", sim.start_block, ob, logger);

    for (auto item : GetArray("validators", ob))
    {
        std::string_view sv = item.get_string();
        if (!IsValidAccount(sv))
        {
            throw std::runtime_error(
                fmt::format("Invalid validator account: {}", sv));
        }
        sim.validators.emplace_back(sv);
    }

    for (auto item : GetArray("authors", ob))
    {
        std::string_view sv = item.get_string();
        if (!sv.empty() && !IsValidAccount(sv))
        {
            throw std::runtime_error(
                fmt::format("Invalid author account: {}", sv));
        }
        sim.authors.emplace_back(sv);
    }

    ParsePools(GetArray("pools", ob), sim.pools, logger);

    simdjson::ondemand::object curve = GetObject("reward_curve", ob);
    AssignJson("kind", sim.reward_curve.kind, curve, logger);
    if (sim.reward_curve.kind == "none") return;

    AssignJson("initial", sim.reward_curve.initial, curve, logger);
    if (sim.reward_curve.kind == "halving")
    {
        AssignJson("halving_interval", sim.reward_curve.halving_interval,
                   curve, logger);
    }
    else if (sim.reward_curve.kind != "constant")
    {
        throw std::runtime_error(fmt::format("Unknown reward curve kind: {}",
                                             sim.reward_curve.kind));
    }
}
}  // namespace

bool IsValidAccount(std::string_view account)
{
    return account.size() == ACCOUNT_ID_SIZE * 2 && IsHexString(account);
}

void ParseRewardsConfig(const simdjson::padded_string& json,
                        RewardsConfig& cnfg, const Logger& logger)
{
    using namespace simdjson;
    ondemand::parser confParser;
    ondemand::document configDoc = confParser.iterate(json);

    AssignJson("miner_rewards_percent", cnfg.miner_rewards_percent, configDoc,
               logger);
    AssignJson("mining_pool_max_rate", cnfg.mining_pool_max_rate, configDoc,
               logger);

    if (cnfg.miner_rewards_percent > 100 || cnfg.mining_pool_max_rate > 100)
    {
        throw std::runtime_error("Percentages must not exceed 100");
    }

    AssignJson("minimum_balance", cnfg.minimum_balance, configDoc, logger);
    AssignAccount("treasury_account", cnfg.treasury_account, configDoc,
                  logger);

    ParseLockBounds(GetObject("lock_bounds", configDoc), cnfg.lock_bounds,
                    logger);
    ParseGenesis(GetObject("genesis", configDoc), cnfg.genesis, logger);

    auto simulation = configDoc["simulation"];
    if (simulation.error() == simdjson::NO_SUCH_FIELD)
    {
        cnfg.simulation = SimulationConfig{.blocks = 0,
                                           .start_block = 1,
                                           .reward_curve = {.kind = "none"}};
        return;
    }

    ParseSimulation(AsObject("simulation", std::move(simulation)),
                    cnfg.simulation, logger);
}
