// =============================================================================
// governance.cpp - Stake-weighted proposals and votes
// =============================================================================

#include "yield/governance.hpp"
#include "yield/serialization.hpp"

#include <spdlog/spdlog.h>

namespace yield {

const char* to_string(VoteChoice choice) noexcept {
    switch (choice) {
        case VoteChoice::For: return "for";
        case VoteChoice::Against: return "against";
        case VoteChoice::Abstain: return "abstain";
    }
    return "unknown";
}

GovernanceTally::GovernanceTally(const StakingLedger& staking, GovernanceConfig config,
                                 EventBus* events, Clock clock)
    : staking_(staking),
      config_(std::move(config)),
      events_(events),
      clock_(clock ? std::move(clock) : default_clock()) {}

Decimal GovernanceTally::voting_power(const Address& owner) const {
    Decimal power(0);
    for (const auto& position : staking_.positions_of(owner)) {
        if (position.status == StakeStatus::Active) power += position.governance_power;
    }
    return power;
}

ProposalId GovernanceTally::create_proposal(const Address& proposer, const std::string& title,
                                            const std::string& description,
                                            std::optional<uint32_t> voting_days) {
    uint32_t days = voting_days.value_or(config_.default_voting_days);
    if (days == 0) {
        throw LedgerError(errors::INVALID_AMOUNT, "voting period must be at least one day");
    }

    Decimal power = voting_power(proposer);
    if (power < config_.proposal_threshold) {
        spdlog::warn("Rejected proposal '{}' by {}: voting power {} below {}", title, proposer,
                     decimal::to_string(power), decimal::to_string(config_.proposal_threshold));
        throw LedgerError(errors::INSUFFICIENT_GOVERNANCE_POWER,
                          "proposing needs " + decimal::to_string(config_.proposal_threshold) + " voting power");
    }

    uint64_t now = clock_();
    Proposal proposal;
    proposal.id = next_proposal_id_.fetch_add(1);
    proposal.title = title;
    proposal.description = description;
    proposal.proposer = proposer;
    proposal.voting_start = now;
    proposal.voting_end = now + static_cast<uint64_t>(days) * SECONDS_PER_DAY;
    proposal.votes_for = 0;
    proposal.votes_against = 0;
    proposal.votes_abstain = 0;

    nlohmann::json payload{
        {"id", proposal.id},
        {"title", proposal.title},
        {"proposer", proposal.proposer},
        {"voting_start", proposal.voting_start},
        {"voting_end", proposal.voting_end}
    };

    ProposalId id = proposal.id;
    {
        std::unique_lock lock(proposals_mutex_);
        proposals_.emplace(id, std::move(proposal));
    }

    spdlog::info("Proposal {} '{}' opened by {} for {} days", id, title, proposer, days);
    if (events_) events_->publish(EventType::ProposalCreated, now, payload);
    return id;
}

Decimal GovernanceTally::vote(ProposalId proposal_id, const Address& voter, VoteChoice choice) {
    // Resolved before the proposal lock; staking state is never read under it
    Decimal power = voting_power(voter);
    uint64_t now = clock_();

    std::unique_lock lock(proposals_mutex_);
    auto it = proposals_.find(proposal_id);
    if (it == proposals_.end()) {
        throw LedgerError(errors::PROPOSAL_NOT_FOUND, "no proposal " + std::to_string(proposal_id));
    }
    Proposal& proposal = it->second;

    if (!proposal.is_open(now)) {
        throw LedgerError(errors::VOTING_CLOSED, "voting on proposal " + std::to_string(proposal_id) + " is closed");
    }
    if (proposal.ballots.count(voter) > 0) {
        throw LedgerError(errors::ALREADY_VOTED, voter + " already voted on proposal " + std::to_string(proposal_id));
    }
    if (power <= 0) {
        throw LedgerError(errors::INSUFFICIENT_GOVERNANCE_POWER, voter + " has no voting power");
    }

    switch (choice) {
        case VoteChoice::For: proposal.votes_for += power; break;
        case VoteChoice::Against: proposal.votes_against += power; break;
        case VoteChoice::Abstain: proposal.votes_abstain += power; break;
    }
    proposal.ballots.emplace(voter, Ballot{choice, power, now});

    spdlog::debug("Vote on proposal {} by {}: {} with power {}", proposal_id, voter,
                  to_string(choice), decimal::to_string(power));
    if (events_) {
        events_->publish(EventType::VoteCast, now, nlohmann::json{
            {"proposal_id", proposal_id},
            {"voter", voter},
            {"choice", to_string(choice)},
            {"power", power}
        });
    }
    return power;
}

std::optional<Proposal> GovernanceTally::get_proposal(ProposalId proposal_id) const {
    std::shared_lock lock(proposals_mutex_);
    auto it = proposals_.find(proposal_id);
    if (it == proposals_.end()) return std::nullopt;
    return it->second;
}

std::optional<ProposalTally> GovernanceTally::tally(ProposalId proposal_id) const {
    uint64_t now = clock_();
    std::shared_lock lock(proposals_mutex_);
    auto it = proposals_.find(proposal_id);
    if (it == proposals_.end()) return std::nullopt;
    const Proposal& proposal = it->second;

    ProposalTally t;
    t.id = proposal.id;
    t.votes_for = proposal.votes_for;
    t.votes_against = proposal.votes_against;
    t.votes_abstain = proposal.votes_abstain;
    t.total_power = proposal.votes_for + proposal.votes_against + proposal.votes_abstain;
    t.voters = proposal.ballots.size();
    t.closed = now >= proposal.voting_end;
    t.passed = t.closed && proposal.votes_for > proposal.votes_against;
    return t;
}

} // namespace yield
