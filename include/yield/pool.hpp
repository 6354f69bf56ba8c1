#ifndef YIELD_POOL_HPP
#define YIELD_POOL_HPP

#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

#include "types.hpp"

namespace yield {

// =============================================================================
// Pool Kind & Status
// =============================================================================

enum class PoolKind : uint8_t {
    ConstantProduct = 0,    // x * y = k
    StableSwap = 1          // damped curve for correlated assets
};

enum class PoolStatus : uint8_t {
    Active = 0,
    Paused = 1,
    EmergencyPaused = 2,
    Migrating = 3,
    Deprecated = 4
};

const char* to_string(PoolKind kind) noexcept;
const char* to_string(PoolStatus status) noexcept;

// =============================================================================
// Pool State
// =============================================================================

struct Pool {
    PoolId id = 0;
    std::string name;
    PoolKind kind = PoolKind::ConstantProduct;
    PoolStatus status = PoolStatus::Active;
    std::vector<Address> tokens;        // creation order, distinct
    TokenAmounts reserves;              // keys == tokens
    Decimal lp_supply;
    Decimal swap_fee_rate;
    Decimal volume_usd;                 // cumulative traded value
    Decimal fees_collected_usd;         // cumulative LP fee value
    TokenAmounts protocol_fees;         // uncollected protocol share
    Decimal fee_per_lp_usd;             // fee accumulator per LP unit
    uint64_t created_at = 0;
    uint64_t updated_at = 0;

    bool has_token(const Address& token) const;
};

// =============================================================================
// Liquidity Position
// =============================================================================

struct LiquidityPosition {
    PositionId id = 0;
    Address provider;
    PoolId pool_id = 0;
    TokenAmounts token_amounts;         // contributed at entry
    Decimal lp_amount;
    uint64_t entry_time = 0;
    TokenAmounts fees_earned;           // USD_KEY -> settled fee value
    Decimal fee_debt_usd;               // lp_amount * fee_per_lp_usd at last settle
    Decimal impermanent_loss_pct;       // stored on each withdrawal
    bool open = true;
    uint64_t closed_at = 0;
};

// =============================================================================
// Swap Record (append-only)
// =============================================================================

struct SwapRecord {
    SwapId id = 0;
    PoolId pool_id = 0;
    Address trader;
    Address token_in;
    Address token_out;
    Decimal amount_in;
    Decimal amount_out;
    Decimal price_impact_pct;
    Decimal fee_paid;                   // in token_in units
    Decimal protocol_fee;               // portion of fee_paid kept by protocol
    Decimal slippage_pct;               // vs. spot quote before the trade
    uint64_t timestamp = 0;
};

// Result of pricing a swap against current reserves, not yet committed
struct SwapQuote {
    Decimal amount_out;
    Decimal fee_paid;
    Decimal protocol_fee;
    Decimal price_impact_pct;
    Decimal slippage_pct;
    Decimal new_reserve_in;
    Decimal new_reserve_out;
};

// =============================================================================
// AMM Math
// =============================================================================

namespace amm_math {

// Amplification for the simplified stable-swap curve
constexpr int STABLE_SWAP_AMPLIFICATION = 100;

// (reserve_in, reserve_out, amount_in, fee_rate) -> amount_out
using PricingFn = Decimal (*)(const Decimal&, const Decimal&, const Decimal&, const Decimal&);

// out = net * reserve_out / (reserve_in + net), net = amount_in * (1 - fee)
Decimal constant_product_out(const Decimal& reserve_in, const Decimal& reserve_out,
                             const Decimal& amount_in, const Decimal& fee_rate);

// r = net / (reserve_in + net); out = reserve_out * r * (1 - r / A)
Decimal stable_swap_out(const Decimal& reserve_in, const Decimal& reserve_out,
                        const Decimal& amount_in, const Decimal& fee_rate);

// Selected once when a pool is created
PricingFn pricing_for(PoolKind kind) noexcept;

// |new - old| / old where price = reserve_out / reserve_in
Decimal price_impact(const Decimal& reserve_in, const Decimal& reserve_out,
                     const Decimal& new_reserve_in, const Decimal& new_reserve_out);

// (v1 * v2 * ... * vn) ^ (1/n); zero if any value is zero
Decimal geometric_mean(const std::vector<Decimal>& values);

// Product of all reserves (k for a two-asset constant-product pool)
Decimal reserve_product(const TokenAmounts& reserves);

} // namespace amm_math

// =============================================================================
// Pool Book (one lockable unit per pool)
// =============================================================================

// Everything a pool operation reads or writes lives here, behind one lock.
struct PoolBook {
    mutable std::shared_mutex mutex;
    Pool pool;
    amm_math::PricingFn pricing = nullptr;
    std::map<PositionId, LiquidityPosition> positions;
    std::vector<SwapRecord> swaps;
};

} // namespace yield

#endif // YIELD_POOL_HPP
