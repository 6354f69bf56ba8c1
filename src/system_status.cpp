#include "yield/system_status.hpp"

namespace yield {

SystemStatus collect_status(const PoolLedger& pools, const StakingLedger& staking,
                            const ValidatorRegistry& validators, uint64_t now) {
    auto pool_stats = pools.get_stats();
    auto staking_stats = staking.get_stats();

    SystemStatus status;
    status.pools = pool_stats.total_pools;
    status.liquidity_positions = pool_stats.total_positions;
    status.swaps = pool_stats.total_swaps;
    status.staking_pools = staking_stats.total_staking_pools;
    status.stakes = staking_stats.total_stakes;
    status.delegations = staking_stats.total_delegations;
    status.validators = validators.validator_count();
    status.timestamp = now;
    return status;
}

void to_json(nlohmann::json& j, const SystemStatus& status) {
    j = nlohmann::json{
        {"pools", status.pools},
        {"liquidity_positions", status.liquidity_positions},
        {"swaps", status.swaps},
        {"staking_pools", status.staking_pools},
        {"stakes", status.stakes},
        {"delegations", status.delegations},
        {"validators", status.validators},
        {"timestamp", status.timestamp}
    };
}

} // namespace yield
