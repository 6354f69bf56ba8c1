#ifndef YIELD_CONFIG_HPP
#define YIELD_CONFIG_HPP

#include <string>
#include <string_view>

#include "types.hpp"

namespace yield {

// =============================================================================
// Configuration Sections
// =============================================================================

struct GeneralConfig {
    std::string log_level = "info";     // trace, debug, info, warn, error, off
    std::string log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

struct LiquidityConfig {
    Decimal default_swap_fee{"0.003"};      // 0.3%
    Decimal protocol_fee_rate{"0.0005"};    // carved out of the swap fee
    Decimal max_price_impact{"0.05"};       // 5%
};

struct StakingConfig {
    Decimal min_stake_amount{"10"};
    Decimal max_stake_amount{"10000000"};
    Decimal early_withdrawal_penalty{"0.02"};   // fixed-term, before unlock
    uint32_t unbonding_period_days = 21;
    Decimal validator_min_stake{"32"};
    Decimal commission_max_rate{"0.20"};
    Decimal validator_reward_rate{"0.10"};      // delegation APY
    Address native_reward_token = "NATIVE";
};

struct GovernanceConfig {
    Decimal proposal_threshold{"1000"};     // voting power needed to propose
    uint32_t default_voting_days = 7;
};

// =============================================================================
// Config
// =============================================================================

struct Config {
    GeneralConfig general;
    LiquidityConfig liquidity;
    StakingConfig staking;
    GovernanceConfig governance;

    // Load from JSON text. Unknown keys are ignored, missing keys keep their
    // defaults. Decimal values may be JSON numbers or strings.
    static Config from_json(std::string_view content);

    // Load from a JSON file
    static Config from_file(std::string_view path);
};

} // namespace yield

#endif // YIELD_CONFIG_HPP
