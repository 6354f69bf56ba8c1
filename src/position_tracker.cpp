// =============================================================================
// position_tracker.cpp - LP position bookkeeping
// =============================================================================

#include "yield/position_tracker.hpp"

namespace yield {

namespace {

Decimal price_or_zero(const TokenAmounts& prices, const Address& token) {
    auto it = prices.find(token);
    return it != prices.end() ? it->second : Decimal(0);
}

} // namespace

// =============================================================================
// Mutation
// =============================================================================

LiquidityPosition& PositionTracker::open_position(PoolBook& book, PositionId id,
                                                  const Address& provider,
                                                  const TokenAmounts& amounts,
                                                  const Decimal& lp_amount, uint64_t now) {
    LiquidityPosition position;
    position.id = id;
    position.provider = provider;
    position.pool_id = book.pool.id;
    position.token_amounts = amounts;
    position.lp_amount = lp_amount;
    position.entry_time = now;
    position.fees_earned[USD_KEY] = Decimal(0);
    // Fees distributed before entry do not belong to this position
    position.fee_debt_usd = lp_amount * book.pool.fee_per_lp_usd;

    auto [it, inserted] = book.positions.emplace(id, std::move(position));
    (void)inserted;

    {
        std::unique_lock lock(index_mutex_);
        pool_index_[id] = book.pool.id;
        provider_index_[provider].push_back(id);
    }

    return it->second;
}

void PositionTracker::reduce_position(PoolBook& book, LiquidityPosition& position,
                                      const Decimal& lp_amount, uint64_t now) {
    settle_fees(book.pool, position);

    position.lp_amount -= lp_amount;
    position.fee_debt_usd = position.lp_amount * book.pool.fee_per_lp_usd;

    if (position.lp_amount <= 0) {
        position.lp_amount = 0;
        position.fee_debt_usd = 0;
        position.open = false;
        position.closed_at = now;
    }
}

void PositionTracker::distribute_fees(Pool& pool, const Decimal& fee_value_usd) {
    if (fee_value_usd <= 0 || pool.lp_supply <= 0) return;
    pool.fee_per_lp_usd += fee_value_usd / pool.lp_supply;
}

void PositionTracker::settle_fees(const Pool& pool, LiquidityPosition& position) {
    if (!position.open) return;
    Decimal accrued = position.lp_amount * pool.fee_per_lp_usd - position.fee_debt_usd;
    if (accrued > 0) {
        position.fees_earned[USD_KEY] += accrued;
    }
    position.fee_debt_usd = position.lp_amount * pool.fee_per_lp_usd;
}

// =============================================================================
// Views
// =============================================================================

LiquidityPosition PositionTracker::settled_view(const Pool& pool, const LiquidityPosition& position) {
    LiquidityPosition copy = position;
    settle_fees(pool, copy);
    return copy;
}

Decimal PositionTracker::impermanent_loss(const Pool& pool, const LiquidityPosition& position,
                                          const TokenAmounts& prices) {
    Decimal hold_value(0);
    for (const auto& [token, amount] : position.token_amounts) {
        hold_value += amount * price_or_zero(prices, token);
    }
    if (hold_value <= 0) return Decimal(0);

    Decimal lp_value(0);
    for (const auto& [token, amount] : underlying_amounts(pool, position)) {
        lp_value += amount * price_or_zero(prices, token);
    }

    return (lp_value - hold_value) / hold_value * 100;
}

TokenAmounts PositionTracker::underlying_amounts(const Pool& pool, const LiquidityPosition& position) {
    TokenAmounts out;
    if (pool.lp_supply <= 0 || position.lp_amount <= 0) {
        for (const auto& token : pool.tokens) out[token] = Decimal(0);
        return out;
    }

    Decimal share = position.lp_amount / pool.lp_supply;
    for (const auto& [token, reserve] : pool.reserves) {
        out[token] = reserve * share;
    }
    return out;
}

size_t PositionTracker::open_count(const PoolBook& book) {
    size_t n = 0;
    for (const auto& [id, position] : book.positions) {
        if (position.open) ++n;
    }
    return n;
}

// =============================================================================
// Index
// =============================================================================

std::optional<PoolId> PositionTracker::pool_of(PositionId id) const {
    std::shared_lock lock(index_mutex_);
    auto it = pool_index_.find(id);
    if (it == pool_index_.end()) return std::nullopt;
    return it->second;
}

std::vector<PositionId> PositionTracker::positions_of(const Address& provider) const {
    std::shared_lock lock(index_mutex_);
    auto it = provider_index_.find(provider);
    if (it == provider_index_.end()) return {};
    return it->second;
}

size_t PositionTracker::total_positions() const {
    std::shared_lock lock(index_mutex_);
    return pool_index_.size();
}

} // namespace yield
