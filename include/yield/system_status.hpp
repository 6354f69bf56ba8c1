#ifndef YIELD_SYSTEM_STATUS_HPP
#define YIELD_SYSTEM_STATUS_HPP

#include <nlohmann/json.hpp>

#include "pool_ledger.hpp"
#include "staking_ledger.hpp"
#include "validator_registry.hpp"

namespace yield {

// Entity counts across every ledger
struct SystemStatus {
    uint64_t pools = 0;
    uint64_t liquidity_positions = 0;
    uint64_t swaps = 0;
    uint64_t staking_pools = 0;
    uint64_t stakes = 0;
    uint64_t delegations = 0;
    uint64_t validators = 0;
    uint64_t timestamp = 0;
};

SystemStatus collect_status(const PoolLedger& pools, const StakingLedger& staking,
                            const ValidatorRegistry& validators, uint64_t now);

void to_json(nlohmann::json& j, const SystemStatus& status);

} // namespace yield

#endif // YIELD_SYSTEM_STATUS_HPP
