// =============================================================================
// config.cpp - JSON configuration loader
// =============================================================================

#include "yield/config.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace yield {

namespace {

using nlohmann::json;

// Numbers are re-parsed from their JSON text so "0.003" stays exact
Decimal read_decimal(const json& value, const char* key) {
    if (value.is_string()) {
        return decimal::from_string(value.get<std::string>());
    }
    if (value.is_number()) {
        return decimal::from_string(value.dump());
    }
    throw LedgerError(errors::CONFIG_ERROR, std::string("expected a number for '") + key + "'");
}

void read(const json& section, const char* key, Decimal& out) {
    auto it = section.find(key);
    if (it != section.end()) out = read_decimal(*it, key);
}

void read(const json& section, const char* key, uint32_t& out) {
    auto it = section.find(key);
    if (it == section.end()) return;
    if (!it->is_number_unsigned()) {
        throw LedgerError(errors::CONFIG_ERROR, std::string("expected an unsigned integer for '") + key + "'");
    }
    out = it->get<uint32_t>();
}

void read(const json& section, const char* key, std::string& out) {
    auto it = section.find(key);
    if (it == section.end()) return;
    if (!it->is_string()) {
        throw LedgerError(errors::CONFIG_ERROR, std::string("expected a string for '") + key + "'");
    }
    out = it->get<std::string>();
}

const json* section_of(const json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end()) return nullptr;
    if (!it->is_object()) {
        throw LedgerError(errors::CONFIG_ERROR, std::string("section '") + name + "' must be an object");
    }
    return &*it;
}

}  // namespace

Config Config::from_json(std::string_view content) {
    json root;
    try {
        root = json::parse(content.begin(), content.end());
    } catch (const json::parse_error& e) {
        throw LedgerError(errors::CONFIG_ERROR, e.what());
    }
    if (!root.is_object()) {
        throw LedgerError(errors::CONFIG_ERROR, "config root must be an object");
    }

    Config config;

    if (const json* s = section_of(root, "general")) {
        read(*s, "log_level", config.general.log_level);
        read(*s, "log_pattern", config.general.log_pattern);
    }

    if (const json* s = section_of(root, "liquidity")) {
        read(*s, "default_swap_fee", config.liquidity.default_swap_fee);
        read(*s, "protocol_fee_rate", config.liquidity.protocol_fee_rate);
        read(*s, "max_price_impact", config.liquidity.max_price_impact);
    }

    if (const json* s = section_of(root, "staking")) {
        read(*s, "min_stake_amount", config.staking.min_stake_amount);
        read(*s, "max_stake_amount", config.staking.max_stake_amount);
        read(*s, "early_withdrawal_penalty", config.staking.early_withdrawal_penalty);
        read(*s, "unbonding_period_days", config.staking.unbonding_period_days);
        read(*s, "validator_min_stake", config.staking.validator_min_stake);
        read(*s, "commission_max_rate", config.staking.commission_max_rate);
        read(*s, "validator_reward_rate", config.staking.validator_reward_rate);
        read(*s, "native_reward_token", config.staking.native_reward_token);
    }

    if (const json* s = section_of(root, "governance")) {
        read(*s, "proposal_threshold", config.governance.proposal_threshold);
        read(*s, "default_voting_days", config.governance.default_voting_days);
    }

    if (config.liquidity.max_price_impact <= 0) {
        throw LedgerError(errors::CONFIG_ERROR, "max_price_impact must be positive");
    }
    if (config.staking.min_stake_amount > config.staking.max_stake_amount) {
        throw LedgerError(errors::CONFIG_ERROR, "min_stake_amount exceeds max_stake_amount");
    }

    return config;
}

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw LedgerError(errors::CONFIG_ERROR, "cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

}  // namespace yield
