// =============================================================================
// stake.cpp - Staking enums and reward schedule
// =============================================================================

#include "yield/stake.hpp"

namespace yield {

const char* to_string(StakeKind kind) noexcept {
    switch (kind) {
        case StakeKind::Flexible: return "flexible";
        case StakeKind::FixedTerm: return "fixed_term";
        case StakeKind::LiquidityMining: return "liquidity_mining";
        case StakeKind::Governance: return "governance";
        case StakeKind::ValidatorDelegation: return "validator_delegation";
        case StakeKind::YieldFarming: return "yield_farming";
    }
    return "unknown";
}

const char* to_string(StakeStatus status) noexcept {
    switch (status) {
        case StakeStatus::Active: return "active";
        case StakeStatus::Unbonding: return "unbonding";
        case StakeStatus::Slashed: return "slashed";
        case StakeStatus::Withdrawn: return "withdrawn";
        case StakeStatus::Locked: return "locked";
    }
    return "unknown";
}

const char* to_string(ValidatorStatus status) noexcept {
    switch (status) {
        case ValidatorStatus::Active: return "active";
        case ValidatorStatus::Inactive: return "inactive";
        case ValidatorStatus::Jailed: return "jailed";
    }
    return "unknown";
}

namespace reward_math {

Decimal kind_multiplier(StakeKind kind) {
    switch (kind) {
        case StakeKind::Flexible: return Decimal("1.0");
        case StakeKind::FixedTerm: return Decimal("1.5");
        case StakeKind::LiquidityMining: return Decimal("2.0");
        case StakeKind::Governance: return Decimal("1.2");
        case StakeKind::ValidatorDelegation: return Decimal("3.0");
        case StakeKind::YieldFarming: return Decimal("2.5");
    }
    return Decimal(1);
}

Decimal lock_bonus(uint32_t lock_days) {
    switch (lock_days) {
        case 30: return Decimal("1.1");
        case 90: return Decimal("1.3");
        case 180: return Decimal("1.6");
        case 365: return Decimal("2.0");
        default: return Decimal(1);
    }
}

Decimal accrued_per_token(const Decimal& amount, const Decimal& apy,
                          const Decimal& multiplier, uint64_t elapsed_seconds,
                          size_t reward_token_count) {
    if (elapsed_seconds == 0 || reward_token_count == 0 || amount <= 0) {
        return Decimal(0);
    }
    Decimal total = amount * apy * multiplier * Decimal(elapsed_seconds) / Decimal(SECONDS_PER_YEAR);
    return total / Decimal(reward_token_count);
}

} // namespace reward_math

} // namespace yield
