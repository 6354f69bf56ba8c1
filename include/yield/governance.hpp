#ifndef YIELD_GOVERNANCE_HPP
#define YIELD_GOVERNANCE_HPP

#include <atomic>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "config.hpp"
#include "events.hpp"
#include "staking_ledger.hpp"

namespace yield {

// =============================================================================
// Proposals
// =============================================================================

enum class VoteChoice : uint8_t {
    For = 0,
    Against = 1,
    Abstain = 2
};

const char* to_string(VoteChoice choice) noexcept;

struct Ballot {
    VoteChoice choice = VoteChoice::Abstain;
    Decimal power;
    uint64_t timestamp = 0;
};

struct Proposal {
    ProposalId id = 0;
    std::string title;
    std::string description;
    Address proposer;
    uint64_t voting_start = 0;
    uint64_t voting_end = 0;
    Decimal votes_for;
    Decimal votes_against;
    Decimal votes_abstain;
    std::map<Address, Ballot> ballots;

    bool is_open(uint64_t now) const { return now >= voting_start && now < voting_end; }
};

struct ProposalTally {
    ProposalId id = 0;
    Decimal votes_for;
    Decimal votes_against;
    Decimal votes_abstain;
    Decimal total_power;
    size_t voters = 0;
    bool closed = false;
    bool passed = false;            // closed and for > against
};

// =============================================================================
// GovernanceTally
// =============================================================================

class GovernanceTally {
public:
    GovernanceTally(const StakingLedger& staking, GovernanceConfig config = {},
                    EventBus* events = nullptr, Clock clock = default_clock());

    // Non-copyable
    GovernanceTally(const GovernanceTally&) = delete;
    GovernanceTally& operator=(const GovernanceTally&) = delete;

    // Sum of governance_power over the owner's active stake positions.
    // Reads StakingLedger state only; nothing is cached here.
    Decimal voting_power(const Address& owner) const;

    // Requires proposer voting power >= proposal_threshold
    ProposalId create_proposal(const Address& proposer, const std::string& title,
                               const std::string& description,
                               std::optional<uint32_t> voting_days = std::nullopt);

    // Weighted by the voter's current voting power; returns that power
    Decimal vote(ProposalId proposal_id, const Address& voter, VoteChoice choice);

    std::optional<Proposal> get_proposal(ProposalId proposal_id) const;
    std::optional<ProposalTally> tally(ProposalId proposal_id) const;

private:
    const StakingLedger& staking_;
    GovernanceConfig config_;
    EventBus* events_;
    Clock clock_;

    std::unordered_map<ProposalId, Proposal> proposals_;
    mutable std::shared_mutex proposals_mutex_;
    std::atomic<uint64_t> next_proposal_id_{1};
};

} // namespace yield

#endif // YIELD_GOVERNANCE_HPP
