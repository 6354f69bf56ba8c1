#ifndef YIELD_STAKE_HPP
#define YIELD_STAKE_HPP

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace yield {

// =============================================================================
// Stake Kind & Status
// =============================================================================

enum class StakeKind : uint8_t {
    Flexible = 0,               // unstake anytime
    FixedTerm = 1,              // locked until unlock_time
    LiquidityMining = 2,
    Governance = 3,             // carries voting power
    ValidatorDelegation = 4,
    YieldFarming = 5
};

enum class StakeStatus : uint8_t {
    Active = 0,
    Unbonding = 1,
    Slashed = 2,
    Withdrawn = 3,
    Locked = 4
};

enum class ValidatorStatus : uint8_t {
    Active = 0,
    Inactive = 1,
    Jailed = 2
};

const char* to_string(StakeKind kind) noexcept;
const char* to_string(StakeStatus status) noexcept;
const char* to_string(ValidatorStatus status) noexcept;

// =============================================================================
// Staking Pool
// =============================================================================

struct StakingPool {
    StakingPoolId id = 0;
    std::string name;
    Address staking_token;
    std::vector<Address> reward_tokens;
    StakeKind kind = StakeKind::Flexible;
    Decimal apy;                    // 0.08 = 8%
    uint32_t lock_period_days = 0;
    Decimal min_stake;
    Decimal max_stake;
    bool active = true;
    Decimal total_staked;
    Decimal total_rewards_distributed;
    uint64_t created_at = 0;
    uint64_t updated_at = 0;
};

// =============================================================================
// Stake Position
// =============================================================================

struct StakePosition {
    StakeId id = 0;
    Address owner;
    uint64_t pool_id = 0;           // staking pool, or validator for delegations
    Decimal amount;
    StakeKind kind = StakeKind::Flexible;
    StakeStatus status = StakeStatus::Active;
    Decimal multiplier;
    uint64_t stake_time = 0;
    std::optional<uint64_t> unlock_time;
    uint64_t last_claim_time = 0;
    TokenAmounts accrued_rewards;
    Decimal penalty_applied;
    Decimal governance_power;

    bool is_delegation() const { return kind == StakeKind::ValidatorDelegation; }
};

struct UnstakeResult {
    StakeId stake_id = 0;
    Decimal withdrawn_amount;
    Decimal penalty;
    Decimal final_amount;           // withdrawn - penalty
    TokenAmounts settled_rewards;   // pending rewards folded in before withdrawal
    bool early_withdrawal = false;
    StakeStatus status = StakeStatus::Active;
    uint64_t timestamp = 0;
};

// =============================================================================
// Validator
// =============================================================================

struct ValidatorNode {
    ValidatorId id = 0;
    Address operator_address;
    Decimal self_stake;
    Decimal commission_rate;
    Decimal performance_score;
    uint32_t slash_count = 0;
    Decimal delegated_stake;        // sum of bonded delegations
    ValidatorStatus status = ValidatorStatus::Active;
    uint64_t created_at = 0;
    uint64_t updated_at = 0;
};

struct SlashEvent {
    ValidatorId validator_id = 0;
    Decimal penalty_pct;
    Decimal validator_penalty;
    Decimal delegator_penalty;
    std::vector<StakeId> affected_delegations;
    std::string reason;
    uint64_t timestamp = 0;
};

// =============================================================================
// Reward Math
// =============================================================================

namespace reward_math {

// flexible 1.0, fixed-term 1.5, liquidity-mining 2.0, governance 1.2,
// validator-delegation 3.0, yield-farming 2.5
Decimal kind_multiplier(StakeKind kind);

// 30d 1.1, 90d 1.3, 180d 1.6, 365d 2.0, anything else 1.0
Decimal lock_bonus(uint32_t lock_days);

// amount * apy * multiplier * elapsed / SECONDS_PER_YEAR / token_count
Decimal accrued_per_token(const Decimal& amount, const Decimal& apy,
                          const Decimal& multiplier, uint64_t elapsed_seconds,
                          size_t reward_token_count);

} // namespace reward_math

} // namespace yield

#endif // YIELD_STAKE_HPP
