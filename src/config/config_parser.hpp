#ifndef CONFIG_PARSER_HPP_
#define CONFIG_PARSER_HPP_

#include <simdjson.h>

#include <string_view>

#include "config/rewards_config.hpp"
#include "logger/logger.hpp"

static constexpr std::string_view config_field_str = "Config";

static constexpr auto CONFIG_PRINT_WIDTH = 40;

bool IsValidAccount(std::string_view account);

// throws std::runtime_error naming the first bad or missing variable
void ParseRewardsConfig(const simdjson::padded_string& json,
                        RewardsConfig& cnfg, const Logger& logger);

#endif
