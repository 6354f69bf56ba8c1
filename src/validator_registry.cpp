// =============================================================================
// validator_registry.cpp - Validators, bonded delegations and slashing
// =============================================================================

#include "yield/validator_registry.hpp"
#include "yield/serialization.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace yield {

namespace {
const Decimal PERFORMANCE_DECAY("0.9");
}

ValidatorRegistry::ValidatorRegistry(StakingConfig config, EventBus* events, Clock clock)
    : config_(std::move(config)),
      events_(events),
      clock_(clock ? std::move(clock) : default_clock()) {}

// =============================================================================
// Validators
// =============================================================================

ValidatorId ValidatorRegistry::create_validator(const Address& operator_address,
                                                const Decimal& self_stake,
                                                const Decimal& commission_rate) {
    if (self_stake < config_.validator_min_stake) {
        spdlog::warn("Rejected validator for {}: self stake {} below {}", operator_address,
                     decimal::to_string(self_stake), decimal::to_string(config_.validator_min_stake));
        throw LedgerError(errors::BELOW_MINIMUM_STAKE,
                          "self stake must be at least " + decimal::to_string(config_.validator_min_stake));
    }
    if (commission_rate < 0 || commission_rate > config_.commission_max_rate) {
        spdlog::warn("Rejected validator for {}: commission {} above {}", operator_address,
                     decimal::to_string(commission_rate), decimal::to_string(config_.commission_max_rate));
        throw LedgerError(errors::COMMISSION_TOO_HIGH,
                          "commission must lie in [0, " + decimal::to_string(config_.commission_max_rate) + "]");
    }

    auto slot = std::make_unique<ValidatorSlot>();
    ValidatorNode& node = slot->node;
    node.id = next_validator_id_.fetch_add(1);
    node.operator_address = operator_address;
    node.self_stake = self_stake;
    node.commission_rate = commission_rate;
    node.performance_score = 1;
    node.delegated_stake = 0;
    node.status = ValidatorStatus::Active;
    node.created_at = clock_();
    node.updated_at = node.created_at;

    ValidatorId id = node.id;
    nlohmann::json payload = node;
    {
        std::unique_lock lock(slots_mutex_);
        slots_.emplace(id, std::move(slot));
    }

    spdlog::info("Created validator {} for {} with self stake {}, commission {}",
                 id, operator_address, decimal::to_string(self_stake), decimal::to_string(commission_rate));
    emit(EventType::ValidatorCreated, payload);
    return id;
}

void ValidatorRegistry::set_validator_status(ValidatorId id, ValidatorStatus status) {
    ValidatorSlot& slot = require_slot(id);
    std::unique_lock lock(slot.mutex);
    ValidatorStatus previous = slot.node.status;
    slot.node.status = status;
    slot.node.updated_at = clock_();
    spdlog::info("Validator {} status {} -> {}", id, to_string(previous), to_string(status));
}

SlashEvent ValidatorRegistry::slash(ValidatorId id, const Decimal& penalty_pct,
                                    const std::string& reason) {
    if (penalty_pct <= 0 || penalty_pct > 1) {
        throw LedgerError(errors::INVALID_PENALTY, "penalty must lie in (0, 1]");
    }

    ValidatorSlot& slot = require_slot(id);
    std::unique_lock lock(slot.mutex);
    ValidatorNode& node = slot.node;
    uint64_t now = clock_();

    SlashEvent event;
    event.validator_id = id;
    event.penalty_pct = penalty_pct;
    event.reason = reason;
    event.timestamp = now;

    event.validator_penalty = node.self_stake * penalty_pct;
    node.self_stake -= event.validator_penalty;
    node.slash_count += 1;
    node.performance_score *= PERFORMANCE_DECAY;

    for (auto& [stake_id, delegation] : slot.delegations) {
        if (delegation.status == StakeStatus::Withdrawn) continue;
        Decimal removed = delegation.amount * penalty_pct;
        delegation.amount -= removed;
        delegation.penalty_applied += removed;
        delegation.status = delegation.amount > 0 ? StakeStatus::Slashed : StakeStatus::Withdrawn;
        event.affected_delegations.push_back(stake_id);
    }

    event.delegator_penalty = node.delegated_stake * penalty_pct;
    node.delegated_stake -= event.delegator_penalty;
    node.updated_at = now;

    slot.slashes.push_back(event);

    spdlog::warn("Slashed validator {} by {} ({}): validator penalty {}, delegator penalty {}, {} delegations",
                 id, decimal::to_string(penalty_pct), reason, decimal::to_string(event.validator_penalty),
                 decimal::to_string(event.delegator_penalty), event.affected_delegations.size());
    emit(EventType::ValidatorSlashed, event);
    return event;
}

// =============================================================================
// Delegation Storage
// =============================================================================

ValidatorNode ValidatorRegistry::add_delegation(ValidatorId id, const StakePosition& position) {
    ValidatorSlot& slot = require_slot(id);
    std::unique_lock lock(slot.mutex);

    if (slot.node.status != ValidatorStatus::Active) {
        throw LedgerError(errors::VALIDATOR_INACTIVE,
                          "validator " + std::to_string(id) + " is " + to_string(slot.node.status));
    }

    slot.delegations.emplace(position.id, position);
    slot.node.delegated_stake += position.amount;
    slot.node.updated_at = position.stake_time;
    return slot.node;
}

void ValidatorRegistry::modify_delegation(ValidatorId id, StakeId stake_id, const DelegationFn& fn) {
    ValidatorSlot& slot = require_slot(id);
    std::unique_lock lock(slot.mutex);

    auto it = slot.delegations.find(stake_id);
    if (it == slot.delegations.end()) {
        throw LedgerError(errors::STAKE_NOT_FOUND, "no delegation " + std::to_string(stake_id));
    }
    fn(slot.node, it->second);
}

void ValidatorRegistry::inspect_delegation(ValidatorId id, StakeId stake_id,
                                           const DelegationView& fn) const {
    ValidatorSlot& slot = require_slot(id);
    std::shared_lock lock(slot.mutex);

    auto it = slot.delegations.find(stake_id);
    if (it == slot.delegations.end()) {
        throw LedgerError(errors::STAKE_NOT_FOUND, "no delegation " + std::to_string(stake_id));
    }
    fn(slot.node, it->second);
}

std::optional<StakePosition> ValidatorRegistry::get_delegation(ValidatorId id, StakeId stake_id) const {
    ValidatorSlot* slot = find_slot(id);
    if (!slot) return std::nullopt;
    std::shared_lock lock(slot->mutex);

    auto it = slot->delegations.find(stake_id);
    if (it == slot->delegations.end()) return std::nullopt;
    return it->second;
}

// =============================================================================
// Query Operations
// =============================================================================

std::optional<ValidatorNode> ValidatorRegistry::get_validator(ValidatorId id) const {
    ValidatorSlot* slot = find_slot(id);
    if (!slot) return std::nullopt;
    std::shared_lock lock(slot->mutex);
    return slot->node;
}

std::vector<ValidatorId> ValidatorRegistry::validator_ids() const {
    std::shared_lock lock(slots_mutex_);
    std::vector<ValidatorId> ids;
    ids.reserve(slots_.size());
    for (const auto& [id, slot] : slots_) ids.push_back(id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<SlashEvent> ValidatorRegistry::slash_history(ValidatorId id) const {
    ValidatorSlot* slot = find_slot(id);
    if (!slot) return {};
    std::shared_lock lock(slot->mutex);
    return slot->slashes;
}

size_t ValidatorRegistry::validator_count() const {
    std::shared_lock lock(slots_mutex_);
    return slots_.size();
}

size_t ValidatorRegistry::delegation_count() const {
    std::shared_lock lock(slots_mutex_);
    size_t count = 0;
    for (const auto& [id, slot] : slots_) {
        std::shared_lock slot_lock(slot->mutex);
        count += slot->delegations.size();
    }
    return count;
}

// =============================================================================
// Internal Helpers
// =============================================================================

ValidatorSlot* ValidatorRegistry::find_slot(ValidatorId id) const {
    std::shared_lock lock(slots_mutex_);
    auto it = slots_.find(id);
    return it != slots_.end() ? it->second.get() : nullptr;
}

ValidatorSlot& ValidatorRegistry::require_slot(ValidatorId id) const {
    ValidatorSlot* slot = find_slot(id);
    if (!slot) {
        throw LedgerError(errors::VALIDATOR_NOT_FOUND, "no validator " + std::to_string(id));
    }
    return *slot;
}

void ValidatorRegistry::emit(EventType type, const nlohmann::json& payload) const {
    if (events_) events_->publish(type, clock_(), payload);
}

} // namespace yield
