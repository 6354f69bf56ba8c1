// =============================================================================
// staking_ledger.cpp - Staking pools, reward accrual, unstaking, delegation
// =============================================================================

#include "yield/staking_ledger.hpp"
#include "yield/serialization.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace yield {

namespace {

Decimal sum_of(const TokenAmounts& amounts) {
    Decimal total(0);
    for (const auto& [token, amount] : amounts) total += amount;
    return total;
}

void add_into(TokenAmounts& target, const TokenAmounts& amounts) {
    for (const auto& [token, amount] : amounts) target[token] += amount;
}

bool can_unstake(StakeStatus status) {
    return status == StakeStatus::Active || status == StakeStatus::Slashed ||
           status == StakeStatus::Unbonding;
}

nlohmann::json claim_payload(const StakePosition& position, const TokenAmounts& rewards) {
    return nlohmann::json{
        {"stake_id", position.id},
        {"owner", position.owner},
        {"pool_id", position.pool_id},
        {"rewards", rewards}
    };
}

} // namespace

StakingLedger::StakingLedger(const TokenRegistry& tokens, ValidatorRegistry& validators,
                             StakingConfig config, EventBus* events, Clock clock)
    : tokens_(tokens),
      validators_(validators),
      config_(std::move(config)),
      events_(events),
      clock_(clock ? std::move(clock) : default_clock()) {}

// =============================================================================
// Staking Pools
// =============================================================================

StakingPoolId StakingLedger::create_staking_pool(const std::string& name, const Address& staking_token,
                                                 const std::vector<Address>& reward_tokens, StakeKind kind,
                                                 const Decimal& apy, uint32_t lock_period_days,
                                                 std::optional<Decimal> min_stake,
                                                 std::optional<Decimal> max_stake) {
    if (!tokens_.contains(staking_token)) {
        throw LedgerError(errors::INVALID_TOKEN, "staking token not registered: " + staking_token);
    }
    if (reward_tokens.empty()) {
        throw LedgerError(errors::INVALID_TOKEN, "a staking pool needs at least one reward token");
    }
    for (const auto& token : reward_tokens) {
        if (!tokens_.contains(token)) {
            throw LedgerError(errors::INVALID_TOKEN, "reward token not registered: " + token);
        }
    }
    if (apy < 0) {
        throw LedgerError(errors::INVALID_AMOUNT, "apy must not be negative");
    }

    Decimal lower = min_stake.value_or(config_.min_stake_amount);
    Decimal upper = max_stake.value_or(config_.max_stake_amount);
    if (lower < 0 || lower > upper) {
        throw LedgerError(errors::INVALID_AMOUNT, "stake bounds must satisfy 0 <= min <= max");
    }

    auto slot = std::make_unique<StakingPoolSlot>();
    StakingPool& pool = slot->pool;
    pool.id = next_pool_id_.fetch_add(1);
    pool.name = name;
    pool.staking_token = staking_token;
    pool.reward_tokens = reward_tokens;
    pool.kind = kind;
    pool.apy = apy;
    pool.lock_period_days = lock_period_days;
    pool.min_stake = lower;
    pool.max_stake = upper;
    pool.active = true;
    pool.total_staked = 0;
    pool.total_rewards_distributed = 0;
    pool.created_at = clock_();
    pool.updated_at = pool.created_at;

    StakingPoolId id = pool.id;
    {
        std::unique_lock lock(slots_mutex_);
        slots_.emplace(id, std::move(slot));
    }

    spdlog::info("Created {} staking pool {} ({}) on {}, apy {}, lock {} days",
                 to_string(kind), id, name, staking_token, decimal::to_string(apy), lock_period_days);
    return id;
}

void StakingLedger::set_staking_pool_active(StakingPoolId pool_id, bool active) {
    StakingPoolSlot& slot = require_slot(pool_id);
    std::unique_lock lock(slot.mutex);
    slot.pool.active = active;
    slot.pool.updated_at = clock_();
    spdlog::info("Staking pool {} {}", pool_id, active ? "activated" : "deactivated");
}

// =============================================================================
// Staking
// =============================================================================

StakePosition StakingLedger::stake(StakingPoolId pool_id, const Address& owner, const Decimal& amount,
                                   std::optional<uint32_t> lock_days) {
    if (amount <= 0) {
        throw LedgerError(errors::INVALID_AMOUNT, "stake amount must be positive");
    }

    StakingPoolSlot& slot = require_slot(pool_id);
    std::unique_lock lock(slot.mutex);
    StakingPool& pool = slot.pool;

    if (!pool.active) {
        throw LedgerError(errors::POOL_INACTIVE, "staking pool " + pool.name + " is inactive");
    }
    if (amount < pool.min_stake || amount > pool.max_stake) {
        spdlog::warn("Rejected stake of {} into {}: bounds [{}, {}]", decimal::to_string(amount), pool.name,
                     decimal::to_string(pool.min_stake), decimal::to_string(pool.max_stake));
        throw LedgerError(errors::STAKE_OUT_OF_BOUNDS,
                          "stake must lie in [" + decimal::to_string(pool.min_stake) + ", " +
                          decimal::to_string(pool.max_stake) + "]");
    }

    uint64_t now = clock_();
    uint32_t days = lock_days.value_or(pool.lock_period_days);
    bool locked = (pool.kind == StakeKind::FixedTerm || lock_days.has_value()) && days > 0;

    StakePosition position;
    position.id = next_stake_id_.fetch_add(1);
    position.owner = owner;
    position.pool_id = pool.id;
    position.amount = amount;
    position.kind = pool.kind;
    position.status = StakeStatus::Active;
    position.multiplier = reward_math::kind_multiplier(pool.kind) *
                          (locked ? reward_math::lock_bonus(days) : Decimal(1));
    position.stake_time = now;
    if (locked) position.unlock_time = now + static_cast<uint64_t>(days) * SECONDS_PER_DAY;
    position.last_claim_time = now;
    position.penalty_applied = 0;
    position.governance_power = pool.kind == StakeKind::Governance ? amount * position.multiplier : Decimal(0);

    // Commit
    slot.positions.emplace(position.id, position);
    pool.total_staked += amount;
    pool.updated_at = now;
    index_stake(position.id, StakeLocation{false, pool.id}, owner);

    spdlog::info("Stake {} of {} {} by {} in {}, multiplier {}", position.id, decimal::to_string(amount),
                 pool.staking_token, owner, pool.name, decimal::to_string(position.multiplier));
    emit(EventType::StakeCreated, position);
    return position;
}

StakePosition StakingLedger::delegate(const Address& owner, ValidatorId validator_id, const Decimal& amount) {
    if (amount <= 0) {
        throw LedgerError(errors::INVALID_AMOUNT, "delegation amount must be positive");
    }

    uint64_t now = clock_();
    StakePosition position;
    position.id = next_stake_id_.fetch_add(1);
    position.owner = owner;
    position.pool_id = validator_id;
    position.amount = amount;
    position.kind = StakeKind::ValidatorDelegation;
    position.status = StakeStatus::Active;
    position.multiplier = reward_math::kind_multiplier(StakeKind::ValidatorDelegation);
    position.stake_time = now;
    position.unlock_time = now + static_cast<uint64_t>(config_.unbonding_period_days) * SECONDS_PER_DAY;
    position.last_claim_time = now;
    position.penalty_applied = 0;
    position.governance_power = 0;

    ValidatorNode node = validators_.add_delegation(validator_id, position);
    index_stake(position.id, StakeLocation{true, validator_id}, owner);

    spdlog::info("Delegation {}: {} bonded {} to validator {} (delegated stake now {})", position.id, owner,
                 decimal::to_string(amount), validator_id, decimal::to_string(node.delegated_stake));
    emit(EventType::Delegated, position);
    return position;
}

// =============================================================================
// Rewards
// =============================================================================

TokenAmounts StakingLedger::claim_rewards(StakeId stake_id) {
    auto location = locate(stake_id);
    if (!location) {
        throw LedgerError(errors::STAKE_NOT_FOUND, "no stake " + std::to_string(stake_id));
    }
    uint64_t now = clock_();
    TokenAmounts rewards;

    if (location->delegation) {
        validators_.modify_delegation(location->owner_id, stake_id,
            [&](ValidatorNode& node, StakePosition& position) {
                if (position.status != StakeStatus::Active) {
                    throw LedgerError(errors::STAKE_NOT_ACTIVE,
                                      "stake " + std::to_string(stake_id) + " is " + to_string(position.status));
                }
                rewards = accrue(node, position, now);
                add_into(position.accrued_rewards, rewards);
                position.last_claim_time = now;
                emit(EventType::RewardClaimed, claim_payload(position, rewards));
            });
    } else {
        StakingPoolSlot& slot = require_slot(location->owner_id);
        std::unique_lock lock(slot.mutex);

        auto it = slot.positions.find(stake_id);
        if (it == slot.positions.end()) {
            throw LedgerError(errors::STAKE_NOT_FOUND, "no stake " + std::to_string(stake_id));
        }
        StakePosition& position = it->second;
        if (position.status != StakeStatus::Active) {
            throw LedgerError(errors::STAKE_NOT_ACTIVE,
                              "stake " + std::to_string(stake_id) + " is " + to_string(position.status));
        }

        rewards = accrue(slot.pool, position, now);
        add_into(position.accrued_rewards, rewards);
        position.last_claim_time = now;
        slot.pool.total_rewards_distributed += sum_of(rewards);
        slot.pool.updated_at = now;
        emit(EventType::RewardClaimed, claim_payload(position, rewards));
    }

    total_claims_.fetch_add(1);
    spdlog::debug("Claimed rewards for stake {}: {} tokens, total {}", stake_id, rewards.size(),
                  decimal::to_string(sum_of(rewards)));
    return rewards;
}

TokenAmounts StakingLedger::pending_rewards(StakeId stake_id) const {
    auto location = locate(stake_id);
    if (!location) {
        throw LedgerError(errors::STAKE_NOT_FOUND, "no stake " + std::to_string(stake_id));
    }
    uint64_t now = clock_();
    TokenAmounts rewards;

    if (location->delegation) {
        validators_.inspect_delegation(location->owner_id, stake_id,
            [&](const ValidatorNode& node, const StakePosition& position) {
                if (position.status == StakeStatus::Active) rewards = accrue(node, position, now);
            });
        return rewards;
    }

    StakingPoolSlot& slot = require_slot(location->owner_id);
    std::shared_lock lock(slot.mutex);
    auto it = slot.positions.find(stake_id);
    if (it == slot.positions.end()) {
        throw LedgerError(errors::STAKE_NOT_FOUND, "no stake " + std::to_string(stake_id));
    }
    if (it->second.status == StakeStatus::Active) rewards = accrue(slot.pool, it->second, now);
    return rewards;
}

TokenAmounts StakingLedger::accrue(const StakingPool& pool, const StakePosition& position, uint64_t now) const {
    uint64_t elapsed = now > position.last_claim_time ? now - position.last_claim_time : 0;
    TokenAmounts rewards;
    for (const auto& token : pool.reward_tokens) {
        rewards[token] = reward_math::accrued_per_token(position.amount, pool.apy, position.multiplier,
                                                        elapsed, pool.reward_tokens.size());
    }
    return rewards;
}

TokenAmounts StakingLedger::accrue(const ValidatorNode& validator, const StakePosition& position,
                                   uint64_t now) const {
    uint64_t elapsed = now > position.last_claim_time ? now - position.last_claim_time : 0;
    Decimal rate = config_.validator_reward_rate * (Decimal(1) - validator.commission_rate);
    TokenAmounts rewards;
    rewards[config_.native_reward_token] =
        reward_math::accrued_per_token(position.amount, rate, position.multiplier, elapsed, 1);
    return rewards;
}

// =============================================================================
// Unstaking
// =============================================================================

UnstakeResult StakingLedger::apply_unstake(StakePosition& position, const Decimal& amount,
                                           const TokenAmounts& settled, uint64_t now) const {
    UnstakeResult result;
    result.stake_id = position.id;
    result.withdrawn_amount = amount;
    result.early_withdrawal = position.kind == StakeKind::FixedTerm && position.unlock_time &&
                              now < *position.unlock_time;
    result.penalty = result.early_withdrawal ? amount * config_.early_withdrawal_penalty : Decimal(0);
    result.final_amount = amount - result.penalty;
    result.settled_rewards = settled;
    result.timestamp = now;

    if (position.status == StakeStatus::Active) {
        add_into(position.accrued_rewards, settled);
        position.last_claim_time = now;
    }
    position.amount -= amount;
    position.penalty_applied += result.penalty;

    if (position.amount == 0) {
        position.status = StakeStatus::Withdrawn;
    } else if (position.kind != StakeKind::Flexible) {
        position.status = StakeStatus::Unbonding;
    }
    if (position.kind == StakeKind::Governance) {
        position.governance_power = position.amount * position.multiplier;
    }

    result.status = position.status;
    return result;
}

UnstakeResult StakingLedger::unstake(StakeId stake_id, std::optional<Decimal> amount) {
    if (amount && *amount <= 0) {
        throw LedgerError(errors::INVALID_AMOUNT, "unstake amount must be positive");
    }
    auto location = locate(stake_id);
    if (!location) {
        throw LedgerError(errors::STAKE_NOT_FOUND, "no stake " + std::to_string(stake_id));
    }
    uint64_t now = clock_();
    UnstakeResult result;

    // Validation shared by both storage locations; runs before any write
    auto check = [&](const StakePosition& position) {
        if (!can_unstake(position.status)) {
            throw LedgerError(errors::STAKE_NOT_ACTIVE,
                              "stake " + std::to_string(stake_id) + " is " + to_string(position.status));
        }
        Decimal requested = amount.value_or(position.amount);
        if (requested > position.amount) {
            spdlog::warn("Rejected unstake of {} from stake {}: only {} staked",
                         decimal::to_string(requested), stake_id, decimal::to_string(position.amount));
            throw LedgerError(errors::EXCEEDS_STAKED, "only " + decimal::to_string(position.amount) + " staked");
        }
        if (requested <= 0) {
            throw LedgerError(errors::INVALID_AMOUNT, "nothing left to unstake");
        }
        return requested;
    };

    if (location->delegation) {
        validators_.modify_delegation(location->owner_id, stake_id,
            [&](ValidatorNode& node, StakePosition& position) {
                Decimal requested = check(position);
                TokenAmounts settled = position.status == StakeStatus::Active
                    ? accrue(node, position, now) : TokenAmounts{};
                result = apply_unstake(position, requested, settled, now);
                node.delegated_stake -= requested;
                // Slashing scales the total and each delegation separately
                if (node.delegated_stake < 0) node.delegated_stake = 0;
                node.updated_at = now;
                emit(EventType::Unstaked, result);
            });
    } else {
        StakingPoolSlot& slot = require_slot(location->owner_id);
        std::unique_lock lock(slot.mutex);

        auto it = slot.positions.find(stake_id);
        if (it == slot.positions.end()) {
            throw LedgerError(errors::STAKE_NOT_FOUND, "no stake " + std::to_string(stake_id));
        }
        StakePosition& position = it->second;
        Decimal requested = check(position);
        TokenAmounts settled = position.status == StakeStatus::Active
            ? accrue(slot.pool, position, now) : TokenAmounts{};

        result = apply_unstake(position, requested, settled, now);
        slot.pool.total_staked -= requested;
        slot.pool.total_rewards_distributed += sum_of(settled);
        slot.pool.updated_at = now;
        emit(EventType::Unstaked, result);
    }

    spdlog::info("Unstaked {} from stake {}: penalty {}, final {}, status {}",
                 decimal::to_string(result.withdrawn_amount), stake_id, decimal::to_string(result.penalty),
                 decimal::to_string(result.final_amount), to_string(result.status));
    return result;
}

// =============================================================================
// Query Operations
// =============================================================================

std::optional<StakePosition> StakingLedger::get_stake(StakeId stake_id) const {
    auto location = locate(stake_id);
    if (!location) return std::nullopt;

    if (location->delegation) {
        return validators_.get_delegation(location->owner_id, stake_id);
    }

    StakingPoolSlot* slot = find_slot(location->owner_id);
    if (!slot) return std::nullopt;
    std::shared_lock lock(slot->mutex);
    auto it = slot->positions.find(stake_id);
    if (it == slot->positions.end()) return std::nullopt;
    return it->second;
}

std::optional<StakingPool> StakingLedger::get_staking_pool(StakingPoolId pool_id) const {
    StakingPoolSlot* slot = find_slot(pool_id);
    if (!slot) return std::nullopt;
    std::shared_lock lock(slot->mutex);
    return slot->pool;
}

std::vector<StakingPoolId> StakingLedger::staking_pool_ids() const {
    std::shared_lock lock(slots_mutex_);
    std::vector<StakingPoolId> ids;
    ids.reserve(slots_.size());
    for (const auto& [id, slot] : slots_) ids.push_back(id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<StakePosition> StakingLedger::positions_of(const Address& owner) const {
    std::vector<StakeId> ids;
    {
        std::shared_lock lock(index_mutex_);
        auto it = owner_index_.find(owner);
        if (it != owner_index_.end()) ids = it->second;
    }
    std::sort(ids.begin(), ids.end());

    std::vector<StakePosition> out;
    out.reserve(ids.size());
    for (StakeId id : ids) {
        if (auto position = get_stake(id)) out.push_back(std::move(*position));
    }
    return out;
}

std::optional<StakingPoolAnalytics> StakingLedger::staking_pool_analytics(StakingPoolId pool_id) const {
    StakingPoolSlot* slot = find_slot(pool_id);
    if (!slot) return std::nullopt;
    std::shared_lock lock(slot->mutex);
    const StakingPool& pool = slot->pool;

    StakingPoolAnalytics a;
    a.pool_id = pool.id;
    a.name = pool.name;
    a.kind = pool.kind;
    a.active = pool.active;
    a.apy_pct = pool.apy * 100;
    a.lock_period_days = pool.lock_period_days;
    a.total_staked = pool.total_staked;
    a.total_rewards_distributed = pool.total_rewards_distributed;
    a.total_positions = slot->positions.size();

    Decimal multiplier_sum(0);
    for (const auto& [id, position] : slot->positions) {
        if (position.status != StakeStatus::Active) continue;
        ++a.active_positions;
        multiplier_sum += position.multiplier;
    }
    a.average_multiplier = a.active_positions > 0
        ? multiplier_sum / Decimal(a.active_positions) : Decimal(0);
    return a;
}

StakingLedger::Stats StakingLedger::get_stats() const {
    Stats stats{};
    {
        std::shared_lock lock(slots_mutex_);
        stats.total_staking_pools = slots_.size();
    }
    {
        std::shared_lock lock(index_mutex_);
        stats.total_stakes = stake_index_.size();
        for (const auto& [id, location] : stake_index_) {
            if (location.delegation) ++stats.total_delegations;
        }
    }
    stats.total_claims = total_claims_.load();
    return stats;
}

// =============================================================================
// Internal Helpers
// =============================================================================

StakingPoolSlot* StakingLedger::find_slot(StakingPoolId pool_id) const {
    std::shared_lock lock(slots_mutex_);
    auto it = slots_.find(pool_id);
    return it != slots_.end() ? it->second.get() : nullptr;
}

StakingPoolSlot& StakingLedger::require_slot(StakingPoolId pool_id) const {
    StakingPoolSlot* slot = find_slot(pool_id);
    if (!slot) {
        throw LedgerError(errors::POOL_NOT_FOUND, "no staking pool " + std::to_string(pool_id));
    }
    return *slot;
}

std::optional<StakingLedger::StakeLocation> StakingLedger::locate(StakeId stake_id) const {
    std::shared_lock lock(index_mutex_);
    auto it = stake_index_.find(stake_id);
    if (it == stake_index_.end()) return std::nullopt;
    return it->second;
}

void StakingLedger::index_stake(StakeId stake_id, StakeLocation location, const Address& owner) {
    std::unique_lock lock(index_mutex_);
    stake_index_[stake_id] = location;
    owner_index_[owner].push_back(stake_id);
}

void StakingLedger::emit(EventType type, const nlohmann::json& payload) const {
    if (events_) events_->publish(type, clock_(), payload);
}

} // namespace yield
