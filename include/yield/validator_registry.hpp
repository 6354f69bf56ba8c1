#ifndef YIELD_VALIDATOR_REGISTRY_HPP
#define YIELD_VALIDATOR_REGISTRY_HPP

#include <atomic>
#include <functional>
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

namespace yield {

// Validator plus every delegation bonded to it. One lock covers both so a
// slash is a single critical section.
struct ValidatorSlot {
    mutable std::shared_mutex mutex;
    ValidatorNode node;
    std::map<StakeId, StakePosition> delegations;
    std::vector<SlashEvent> slashes;
};

// =============================================================================
// ValidatorRegistry
// =============================================================================

class ValidatorRegistry {
public:
    using DelegationFn = std::function<void(ValidatorNode&, StakePosition&)>;
    using DelegationView = std::function<void(const ValidatorNode&, const StakePosition&)>;

    ValidatorRegistry(StakingConfig config = {}, EventBus* events = nullptr,
                      Clock clock = default_clock());

    // Non-copyable
    ValidatorRegistry(const ValidatorRegistry&) = delete;
    ValidatorRegistry& operator=(const ValidatorRegistry&) = delete;

    // Requires self_stake >= validator_min_stake and
    // commission_rate in [0, commission_max_rate]
    ValidatorId create_validator(const Address& operator_address, const Decimal& self_stake,
                                 const Decimal& commission_rate);

    void set_validator_status(ValidatorId id, ValidatorStatus status);

    // Scales self stake, delegated stake and every bonded delegation by
    // (1 - penalty_pct) under one exclusive lock. penalty_pct in (0, 1].
    SlashEvent slash(ValidatorId id, const Decimal& penalty_pct, const std::string& reason);

    // =========================================================================
    // Delegation Storage (driven by StakingLedger)
    // =========================================================================

    // Bonds a delegation; validator must be active. Returns the updated node.
    ValidatorNode add_delegation(ValidatorId id, const StakePosition& position);

    // Runs fn on the validator and the delegation under the exclusive lock.
    // fn must validate before it writes; an exception leaves state untouched.
    void modify_delegation(ValidatorId id, StakeId stake_id, const DelegationFn& fn);

    // Shared-lock read of a validator and one of its delegations
    void inspect_delegation(ValidatorId id, StakeId stake_id, const DelegationView& fn) const;

    std::optional<StakePosition> get_delegation(ValidatorId id, StakeId stake_id) const;

    // =========================================================================
    // Query Operations
    // =========================================================================

    std::optional<ValidatorNode> get_validator(ValidatorId id) const;
    std::vector<ValidatorId> validator_ids() const;
    std::vector<SlashEvent> slash_history(ValidatorId id) const;
    size_t validator_count() const;
    size_t delegation_count() const;

    const StakingConfig& config() const { return config_; }

private:
    StakingConfig config_;
    EventBus* events_;
    Clock clock_;

    std::unordered_map<ValidatorId, std::unique_ptr<ValidatorSlot>> slots_;
    mutable std::shared_mutex slots_mutex_;
    std::atomic<uint64_t> next_validator_id_{1};

    ValidatorSlot* find_slot(ValidatorId id) const;
    ValidatorSlot& require_slot(ValidatorId id) const;
    void emit(EventType type, const nlohmann::json& payload) const;
};

} // namespace yield

#endif // YIELD_VALIDATOR_REGISTRY_HPP
