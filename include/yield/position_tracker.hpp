#ifndef YIELD_POSITION_TRACKER_HPP
#define YIELD_POSITION_TRACKER_HPP

#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "pool.hpp"

namespace yield {

// =============================================================================
// PositionTracker - LP positions, fee accrual, impermanent loss
// =============================================================================
//
// Positions are stored inside their PoolBook; every mutating call expects the
// caller to hold that book's exclusive lock. The tracker itself only owns the
// position_id -> pool_id index used to route lookups.
//
// Fees use a reward-per-share accumulator: distributing a fee bumps
// pool.fee_per_lp_usd once, and each position's share is realized lazily as
// lp_amount * fee_per_lp_usd - fee_debt_usd.

class PositionTracker {
public:
    PositionTracker() = default;

    // Non-copyable
    PositionTracker(const PositionTracker&) = delete;
    PositionTracker& operator=(const PositionTracker&) = delete;

    // =========================================================================
    // Mutation (book lock held exclusively by caller)
    // =========================================================================

    LiquidityPosition& open_position(PoolBook& book, PositionId id, const Address& provider,
                                     const TokenAmounts& amounts, const Decimal& lp_amount,
                                     uint64_t now);

    // Burns lp_amount from the position, closing it at zero
    void reduce_position(PoolBook& book, LiquidityPosition& position,
                         const Decimal& lp_amount, uint64_t now);

    // Credit fee_value_usd to open positions pro-rata by LP share
    static void distribute_fees(Pool& pool, const Decimal& fee_value_usd);

    // Move accrued accumulator value into fees_earned[USD_KEY]
    static void settle_fees(const Pool& pool, LiquidityPosition& position);

    // =========================================================================
    // Read-only views (book lock held at least shared)
    // =========================================================================

    // Copy of the position with pending fees folded into fees_earned
    static LiquidityPosition settled_view(const Pool& pool, const LiquidityPosition& position);

    // (lp_value - hold_value) / hold_value * 100 at the given prices
    static Decimal impermanent_loss(const Pool& pool, const LiquidityPosition& position,
                                    const TokenAmounts& prices);

    // Pro-rata share of current reserves
    static TokenAmounts underlying_amounts(const Pool& pool, const LiquidityPosition& position);

    static size_t open_count(const PoolBook& book);

    // =========================================================================
    // Index
    // =========================================================================

    std::optional<PoolId> pool_of(PositionId id) const;
    std::vector<PositionId> positions_of(const Address& provider) const;
    size_t total_positions() const;

private:
    std::unordered_map<PositionId, PoolId> pool_index_;
    std::unordered_map<Address, std::vector<PositionId>> provider_index_;
    mutable std::shared_mutex index_mutex_;
};

} // namespace yield

#endif // YIELD_POSITION_TRACKER_HPP
