#ifndef YIELD_POOL_LEDGER_HPP
#define YIELD_POOL_LEDGER_HPP

#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "config.hpp"
#include "events.hpp"
#include "pool.hpp"
#include "position_tracker.hpp"
#include "token_registry.hpp"

namespace yield {

// =============================================================================
// Pool Analytics
// =============================================================================

struct PoolAnalytics {
    PoolId pool_id = 0;
    std::string name;
    PoolKind kind = PoolKind::ConstantProduct;
    PoolStatus status = PoolStatus::Active;
    Decimal tvl_usd;
    Decimal volume_usd;             // cumulative
    Decimal volume_24h_usd;         // swaps in the trailing day, current prices
    Decimal fees_collected_usd;
    Decimal fee_apy_pct;            // volume_24h * fee * 365 / tvl * 100
    Decimal lp_supply;
    Decimal swap_fee_pct;
    size_t liquidity_providers = 0;
    size_t total_swaps = 0;
    size_t swaps_24h = 0;
    Decimal volatility;             // std-dev of execution price changes, trailing day
    TokenAmounts reserves;
    uint64_t updated_at = 0;
};

// =============================================================================
// PoolLedger - reserves, LP supply, swaps
// =============================================================================

class PoolLedger {
public:
    // `events` may be null. The registry must outlive the ledger.
    PoolLedger(const TokenRegistry& tokens, LiquidityConfig config = {},
               EventBus* events = nullptr, Clock clock = default_clock());
    ~PoolLedger() = default;

    // Non-copyable
    PoolLedger(const PoolLedger&) = delete;
    PoolLedger& operator=(const PoolLedger&) = delete;

    // =========================================================================
    // Core Operations
    // =========================================================================

    // New pool with lp_supply = 0. fee_rate defaults to the configured swap fee.
    PoolId create_pool(const std::string& name, const std::vector<Address>& tokens,
                       const TokenAmounts& initial_reserves, PoolKind kind,
                       std::optional<Decimal> fee_rate = std::nullopt);

    // Deposit and mint LP units into a new position
    LiquidityPosition add_liquidity(PoolId pool_id, const Address& provider,
                                    const TokenAmounts& amounts);

    // Burn LP units from a position; returns the withdrawn token amounts
    TokenAmounts remove_liquidity(PositionId position_id, const Decimal& lp_amount);

    SwapRecord swap(PoolId pool_id, const Address& trader,
                    const Address& token_in, const Address& token_out,
                    const Decimal& amount_in,
                    std::optional<Decimal> min_amount_out = std::nullopt);

    // Same pricing and checks as swap() without committing; limit checks
    // (price impact, slippage) are not applied
    SwapQuote quote_swap(PoolId pool_id, const Address& token_in,
                         const Address& token_out, const Decimal& amount_in) const;

    // =========================================================================
    // Fees
    // =========================================================================

    void distribute_fees(PoolId pool_id, const Decimal& fee_value_usd);

    // Hand out and zero the protocol's share of swap fees
    TokenAmounts collect_protocol_fees(PoolId pool_id);

    // =========================================================================
    // Administration
    // =========================================================================

    void set_pool_status(PoolId pool_id, PoolStatus status);

    // =========================================================================
    // Query Operations
    // =========================================================================

    std::optional<Pool> get_pool(PoolId pool_id) const;
    bool pool_exists(PoolId pool_id) const;
    std::vector<PoolId> pool_ids() const;

    // Fee view includes fees accrued since the last settlement
    std::optional<LiquidityPosition> get_position(PositionId position_id) const;
    std::vector<LiquidityPosition> positions_in(PoolId pool_id) const;        // open only
    std::vector<LiquidityPosition> positions_of(const Address& provider) const;

    // Live impermanent loss at current registry prices (not stored)
    std::optional<Decimal> impermanent_loss(PositionId position_id) const;

    std::vector<SwapRecord> swap_history(PoolId pool_id) const;

    std::optional<PoolAnalytics> pool_analytics(PoolId pool_id) const;

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_pools;
        uint64_t total_positions;
        uint64_t total_swaps;
        uint64_t total_liquidity_ops;
    };
    Stats get_stats() const;

    const LiquidityConfig& config() const { return config_; }

private:
    const TokenRegistry& tokens_;
    LiquidityConfig config_;
    EventBus* events_;
    Clock clock_;
    PositionTracker tracker_;

    // Pool storage: pool_id -> book (each book carries its own lock)
    std::unordered_map<PoolId, std::unique_ptr<PoolBook>> books_;
    mutable std::shared_mutex books_mutex_;

    std::atomic<uint64_t> next_pool_id_{1};
    std::atomic<uint64_t> next_position_id_{1};
    std::atomic<uint64_t> next_swap_id_{1};

    // Statistics
    std::atomic<uint64_t> total_swaps_{0};
    std::atomic<uint64_t> total_liquidity_ops_{0};

    // Internal helpers
    PoolBook* find_book(PoolId pool_id) const;
    PoolBook& require_book(PoolId pool_id) const;

    SwapQuote compute_swap(const PoolBook& book, const Address& token_in,
                           const Address& token_out, const Decimal& amount_in) const;

    void emit(EventType type, const nlohmann::json& payload) const;
};

} // namespace yield

#endif // YIELD_POOL_LEDGER_HPP
