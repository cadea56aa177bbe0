#include "config/config_parser.hpp"

#include <gtest/gtest.h>

#include "test_utils.hpp"

class ConfigParserTest : public ::testing::Test
{
   protected:
    void Parse(const std::string& json)
    {
        simdjson::padded_string padded(json);
        ParseRewardsConfig(padded, config, logger);
    }

    const std::string treasury = TestAccount(0xee);
    const std::string miner = TestAccount(0x01);
    const std::string validator = TestAccount(0x02);

    std::string BaseConfig(const std::string& genesis_extra = "",
                           const std::string& simulation = "")
    {
        return fmt::format(
            R"({{
    "miner_rewards_percent": 50,
    "mining_pool_max_rate": 30,
    "minimum_balance": 1,
    "treasury_account": "{}",
    "lock_bounds": {{
        "period_min": 10, "period_max": 1000,
        "divide_min": 1, "divide_max": 10
    }},
    "genesis": {{
        "reward": 1000,
        "mints": [{{"account": "{}", "amount": 5}}]{}
    }}{}
}})",
            treasury, miner, genesis_extra, simulation);
    }

    RewardsConfig config;
    Logger logger{"ConfigTest"};
};

TEST_F(ConfigParserTest, MinimalConfig)
{
    Parse(BaseConfig());

    ASSERT_EQ(config.miner_rewards_percent, 50);
    ASSERT_EQ(config.mining_pool_max_rate, 30);
    ASSERT_EQ(config.minimum_balance, 1);
    ASSERT_EQ(config.treasury_account, treasury);
    ASSERT_EQ(config.lock_bounds.period_max, 1000);
    ASSERT_EQ(config.lock_bounds.divide_max, 10);

    ASSERT_EQ(config.genesis.reward, 1000);
    ASSERT_EQ(config.genesis.mints.size(), 1);
    ASSERT_EQ(config.genesis.mints[0].first, miner);
    ASSERT_EQ(config.genesis.mints[0].second, 5);
    ASSERT_FALSE(config.genesis.lock_params);

    ASSERT_EQ(config.simulation.blocks, 0);
    ASSERT_EQ(config.simulation.reward_curve.kind, "none");
}

TEST_F(ConfigParserTest, LockParamsAndSimulation)
{
    const std::string simulation = fmt::format(
        R"(,
    "simulation": {{
        "blocks": 20,
        "start_block": 5,
        "validators": ["{}"],
        "authors": ["{}", ""],
        "pools": [{{
            "author": "{}",
            "pool_rate": 45,
            "members": [{{"account": "{}", "weight": 3}}]
        }}],
        "reward_curve": {{"kind": "halving", "initial": 800,
                          "halving_interval": 100}}
    }})",
        validator, miner, miner, validator);

    Parse(BaseConfig(R"(, "lock_params": {"period": 100, "divide": 4})",
                     simulation));

    ASSERT_TRUE(config.genesis.lock_params);
    ASSERT_EQ(config.genesis.lock_params, (LockParameters{100, 4}));

    const SimulationConfig& sim = config.simulation;
    ASSERT_EQ(sim.blocks, 20);
    ASSERT_EQ(sim.start_block, 5);
    ASSERT_EQ(sim.validators, std::vector<account_id_t>{validator});
    ASSERT_EQ(sim.authors.size(), 2);
    ASSERT_TRUE(sim.authors[1].empty());

    ASSERT_EQ(sim.pools.size(), 1);
    ASSERT_EQ(sim.pools[0].author, miner);
    ASSERT_EQ(sim.pools[0].pool_rate, 45);
    ASSERT_EQ(sim.pools[0].members,
              (member_weights_t{{validator, 3}}));

    ASSERT_EQ(sim.reward_curve.kind, "halving");
    ASSERT_EQ(sim.reward_curve.initial, 800);
    ASSERT_EQ(sim.reward_curve.halving_interval, 100);
}

TEST_F(ConfigParserTest, MissingFieldThrows)
{
    ASSERT_THROW(Parse(R"({"miner_rewards_percent": 50})"),
                 std::runtime_error);
}

TEST_F(ConfigParserTest, BadAccountThrows)
{
    std::string json = BaseConfig();
    json.replace(json.find(treasury), treasury.size(), "not-hex");

    ASSERT_THROW(Parse(json), std::runtime_error);
}

TEST_F(ConfigParserTest, OutOfRangeThrows)
{
    std::string json = BaseConfig();
    json.replace(json.find("\"period_max\": 1000"), 18,
                 "\"period_max\": 70000");

    ASSERT_THROW(Parse(json), std::runtime_error);
}

TEST_F(ConfigParserTest, PercentAbove100Throws)
{
    std::string json = BaseConfig();
    json.replace(json.find("\"miner_rewards_percent\": 50"), 27,
                 "\"miner_rewards_percent\": 150");

    ASSERT_THROW(Parse(json), std::runtime_error);
}

TEST(ConfigParser, IsValidAccount)
{
    ASSERT_TRUE(IsValidAccount(TestAccount(0xab)));
    ASSERT_FALSE(IsValidAccount(""));
    ASSERT_FALSE(IsValidAccount(std::string(64, 'g')));
    ASSERT_FALSE(IsValidAccount(TestAccount(0xab).substr(2)));
}
