#ifndef YIELD_STAKING_LEDGER_HPP
#define YIELD_STAKING_LEDGER_HPP

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "config.hpp"
#include "events.hpp"
#include "stake.hpp"
#include "token_registry.hpp"
#include "validator_registry.hpp"

namespace yield {

// Staking pool plus its stake positions, under one lock
struct StakingPoolSlot {
    mutable std::shared_mutex mutex;
    StakingPool pool;
    std::map<StakeId, StakePosition> positions;
};

struct StakingPoolAnalytics {
    StakingPoolId pool_id = 0;
    std::string name;
    StakeKind kind = StakeKind::Flexible;
    bool active = true;
    Decimal apy_pct;
    uint32_t lock_period_days = 0;
    Decimal total_staked;
    Decimal total_rewards_distributed;
    size_t active_positions = 0;
    size_t total_positions = 0;
    Decimal average_multiplier;     // over active positions, 0 when none
};

// =============================================================================
// StakingLedger
// =============================================================================

class StakingLedger {
public:
    // The token and validator registries must outlive the ledger
    StakingLedger(const TokenRegistry& tokens, ValidatorRegistry& validators,
                  StakingConfig config = {}, EventBus* events = nullptr,
                  Clock clock = default_clock());

    // Non-copyable
    StakingLedger(const StakingLedger&) = delete;
    StakingLedger& operator=(const StakingLedger&) = delete;

    // =========================================================================
    // Staking Pools
    // =========================================================================

    // min/max default to the configured stake bounds
    StakingPoolId create_staking_pool(const std::string& name, const Address& staking_token,
                                      const std::vector<Address>& reward_tokens, StakeKind kind,
                                      const Decimal& apy, uint32_t lock_period_days = 0,
                                      std::optional<Decimal> min_stake = std::nullopt,
                                      std::optional<Decimal> max_stake = std::nullopt);

    void set_staking_pool_active(StakingPoolId pool_id, bool active);

    // =========================================================================
    // Positions
    // =========================================================================

    // lock_days defaults to the pool lock period; a lock applies for
    // fixed-term pools or whenever lock_days is given
    StakePosition stake(StakingPoolId pool_id, const Address& owner, const Decimal& amount,
                        std::optional<uint32_t> lock_days = std::nullopt);

    // Accrues rewards since last_claim_time into accrued_rewards and returns them
    TokenAmounts claim_rewards(StakeId stake_id);

    // Same figures as claim_rewards without advancing the claim time
    TokenAmounts pending_rewards(StakeId stake_id) const;

    // amount defaults to the full position
    UnstakeResult unstake(StakeId stake_id, std::optional<Decimal> amount = std::nullopt);

    // Bonds stake to a validator as a validator-delegation position
    StakePosition delegate(const Address& owner, ValidatorId validator_id, const Decimal& amount);

    // =========================================================================
    // Query Operations
    // =========================================================================

    std::optional<StakePosition> get_stake(StakeId stake_id) const;
    std::optional<StakingPool> get_staking_pool(StakingPoolId pool_id) const;
    std::vector<StakingPoolId> staking_pool_ids() const;

    // Every position of the owner, delegations included, ordered by id
    std::vector<StakePosition> positions_of(const Address& owner) const;

    std::optional<StakingPoolAnalytics> staking_pool_analytics(StakingPoolId pool_id) const;

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_staking_pools;
        uint64_t total_stakes;
        uint64_t total_delegations;
        uint64_t total_claims;
    };
    Stats get_stats() const;

    const StakingConfig& config() const { return config_; }

private:
    // Where a stake id lives: a staking pool slot, or a validator slot
    struct StakeLocation {
        bool delegation = false;
        uint64_t owner_id = 0;
    };

    const TokenRegistry& tokens_;
    ValidatorRegistry& validators_;
    StakingConfig config_;
    EventBus* events_;
    Clock clock_;

    std::unordered_map<StakingPoolId, std::unique_ptr<StakingPoolSlot>> slots_;
    mutable std::shared_mutex slots_mutex_;

    std::unordered_map<StakeId, StakeLocation> stake_index_;
    std::unordered_map<Address, std::vector<StakeId>> owner_index_;
    mutable std::shared_mutex index_mutex_;

    std::atomic<uint64_t> next_pool_id_{1};
    std::atomic<uint64_t> next_stake_id_{1};
    std::atomic<uint64_t> total_claims_{0};

    StakingPoolSlot* find_slot(StakingPoolId pool_id) const;
    StakingPoolSlot& require_slot(StakingPoolId pool_id) const;
    std::optional<StakeLocation> locate(StakeId stake_id) const;
    void index_stake(StakeId stake_id, StakeLocation location, const Address& owner);

    // Rewards from last_claim_time to now for a pool position
    TokenAmounts accrue(const StakingPool& pool, const StakePosition& position, uint64_t now) const;
    // Rewards for a delegation: validator rate net of commission, native token
    TokenAmounts accrue(const ValidatorNode& validator, const StakePosition& position, uint64_t now) const;

    // Shared unstake arithmetic; returns the result, mutates position only
    UnstakeResult apply_unstake(StakePosition& position, const Decimal& amount,
                                const TokenAmounts& settled, uint64_t now) const;

    void emit(EventType type, const nlohmann::json& payload) const;
};

} // namespace yield

#endif // YIELD_STAKING_LEDGER_HPP
