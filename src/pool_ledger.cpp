// =============================================================================
// pool_ledger.cpp - PoolLedger reserves, LP minting and swap execution
// =============================================================================

#include "yield/pool_ledger.hpp"
#include "yield/serialization.hpp"

#include <algorithm>
#include <set>

#include <spdlog/spdlog.h>

namespace yield {

namespace {

// Relative tolerance for the k check; decimal rounding stays far below this
const Decimal K_TOLERANCE("1e-24");

Decimal price_or_zero(const TokenAmounts& prices, const Address& token) {
    auto it = prices.find(token);
    return it != prices.end() ? it->second : Decimal(0);
}

Decimal amount_or_zero(const TokenAmounts& amounts, const Address& token) {
    auto it = amounts.find(token);
    return it != amounts.end() ? it->second : Decimal(0);
}

std::string pool_label(const Pool& pool) {
    return pool.name.empty() ? "#" + std::to_string(pool.id) : pool.name;
}

} // namespace

// =============================================================================
// Constructor
// =============================================================================

PoolLedger::PoolLedger(const TokenRegistry& tokens, LiquidityConfig config,
                       EventBus* events, Clock clock)
    : tokens_(tokens),
      config_(std::move(config)),
      events_(events),
      clock_(clock ? std::move(clock) : default_clock()) {}

// =============================================================================
// Pool Creation
// =============================================================================

PoolId PoolLedger::create_pool(const std::string& name, const std::vector<Address>& tokens,
                               const TokenAmounts& initial_reserves, PoolKind kind,
                               std::optional<Decimal> fee_rate) {
    std::set<Address> distinct(tokens.begin(), tokens.end());
    if (tokens.size() < 2 || distinct.size() != tokens.size()) {
        throw LedgerError(errors::INVALID_TOKEN, "a pool needs at least two distinct tokens");
    }
    for (const auto& token : tokens) {
        if (!tokens_.contains(token)) {
            throw LedgerError(errors::INVALID_TOKEN, "token not registered: " + token);
        }
    }
    for (const auto& [token, amount] : initial_reserves) {
        if (distinct.find(token) == distinct.end()) {
            throw LedgerError(errors::INVALID_TOKEN, "initial reserve for token outside pool: " + token);
        }
        if (amount < 0) {
            throw LedgerError(errors::INVALID_AMOUNT, "negative initial reserve for " + token);
        }
    }

    Decimal fee = fee_rate.value_or(config_.default_swap_fee);
    if (fee < 0 || fee >= 1) {
        throw LedgerError(errors::INVALID_FEE, "swap fee must lie in [0, 1)");
    }

    auto book = std::make_unique<PoolBook>();
    Pool& pool = book->pool;
    pool.id = next_pool_id_.fetch_add(1);
    pool.name = name;
    pool.kind = kind;
    pool.status = PoolStatus::Active;
    pool.tokens = tokens;
    for (const auto& token : tokens) {
        pool.reserves[token] = amount_or_zero(initial_reserves, token);
    }
    pool.lp_supply = 0;
    pool.swap_fee_rate = fee;
    pool.created_at = clock_();
    pool.updated_at = pool.created_at;
    book->pricing = amm_math::pricing_for(kind);

    PoolId id = pool.id;
    nlohmann::json payload = pool;

    {
        std::unique_lock lock(books_mutex_);
        books_.emplace(id, std::move(book));
    }

    spdlog::info("Created {} pool {} ({}) with {} tokens, fee {}",
                 to_string(kind), id, name, tokens.size(), decimal::to_string(fee));
    emit(EventType::PoolCreated, payload);
    return id;
}

// =============================================================================
// Liquidity
// =============================================================================

LiquidityPosition PoolLedger::add_liquidity(PoolId pool_id, const Address& provider,
                                            const TokenAmounts& amounts) {
    if (amounts.empty()) {
        throw LedgerError(errors::INVALID_AMOUNT, "no token amounts supplied");
    }
    for (const auto& [token, amount] : amounts) {
        if (amount <= 0) {
            throw LedgerError(errors::INVALID_AMOUNT, "non-positive amount for " + token);
        }
    }

    // Prices are resolved before the pool is locked
    const TokenAmounts prices = tokens_.snapshot_prices();

    PoolBook& book = require_book(pool_id);
    std::unique_lock lock(book.mutex);
    Pool& pool = book.pool;

    if (pool.status != PoolStatus::Active) {
        throw LedgerError(errors::POOL_INACTIVE, "pool " + pool_label(pool) + " is " + to_string(pool.status));
    }
    for (const auto& [token, amount] : amounts) {
        if (!pool.has_token(token)) {
            throw LedgerError(errors::UNKNOWN_TOKEN, "token " + token + " not in pool " + pool_label(pool));
        }
    }

    Decimal lp_amount(0);
    if (pool.lp_supply == 0) {
        // First provision seeds the share unit: geometric mean of USD values
        std::vector<Decimal> values;
        values.reserve(amounts.size());
        for (const auto& [token, amount] : amounts) {
            values.push_back(amount * price_or_zero(prices, token));
        }
        lp_amount = amm_math::geometric_mean(values);
    } else {
        // Scarcest token decides; an omitted token contributes nothing
        std::optional<Decimal> min_ratio;
        for (const auto& token : pool.tokens) {
            const Decimal& reserve = pool.reserves[token];
            if (reserve <= 0) continue;
            Decimal ratio = amount_or_zero(amounts, token) / reserve;
            if (!min_ratio || ratio < *min_ratio) min_ratio = ratio;
        }
        if (min_ratio) lp_amount = pool.lp_supply * *min_ratio;
    }

    if (lp_amount <= 0) {
        spdlog::warn("Rejected deposit into pool {} by {}: mints no LP units", pool_label(pool), provider);
        throw LedgerError(errors::ZERO_LIQUIDITY, "deposit mints no LP units");
    }

    // Commit
    uint64_t now = clock_();
    for (const auto& [token, amount] : amounts) {
        pool.reserves[token] += amount;
    }
    pool.lp_supply += lp_amount;
    pool.updated_at = now;

    PositionId position_id = next_position_id_.fetch_add(1);
    LiquidityPosition& position = tracker_.open_position(book, position_id, provider, amounts, lp_amount, now);
    LiquidityPosition result = position;
    total_liquidity_ops_.fetch_add(1);

    spdlog::info("Added liquidity to pool {}: position {} for {}, {} LP minted",
                 pool_label(pool), position_id, provider, decimal::to_string(lp_amount));
    emit(EventType::PositionCreated, result);
    emit(EventType::PoolUpdated, pool);
    return result;
}

TokenAmounts PoolLedger::remove_liquidity(PositionId position_id, const Decimal& lp_amount) {
    if (lp_amount <= 0) {
        throw LedgerError(errors::INVALID_AMOUNT, "LP amount must be positive");
    }

    auto pool_id = tracker_.pool_of(position_id);
    if (!pool_id) {
        throw LedgerError(errors::POSITION_NOT_FOUND, "no position " + std::to_string(position_id));
    }

    const TokenAmounts prices = tokens_.snapshot_prices();

    PoolBook& book = require_book(*pool_id);
    std::unique_lock lock(book.mutex);
    Pool& pool = book.pool;

    auto it = book.positions.find(position_id);
    if (it == book.positions.end()) {
        throw LedgerError(errors::POSITION_NOT_FOUND, "no position " + std::to_string(position_id));
    }
    LiquidityPosition& position = it->second;

    if (!position.open || lp_amount > position.lp_amount) {
        spdlog::warn("Rejected withdrawal of {} LP from position {}: balance {}",
                     decimal::to_string(lp_amount), position_id, decimal::to_string(position.lp_amount));
        throw LedgerError(errors::INSUFFICIENT_LP, "position holds " + decimal::to_string(position.lp_amount));
    }

    // Measured on the holdings being withdrawn, before reserves move
    Decimal il = PositionTracker::impermanent_loss(pool, position, prices);

    // Commit
    uint64_t now = clock_();
    Decimal ratio = lp_amount / pool.lp_supply;
    TokenAmounts withdrawn;
    for (const auto& token : pool.tokens) {
        Decimal amount = pool.reserves[token] * ratio;
        withdrawn[token] = amount;
        pool.reserves[token] -= amount;
    }
    pool.lp_supply -= lp_amount;
    pool.updated_at = now;

    position.impermanent_loss_pct = il;
    tracker_.reduce_position(book, position, lp_amount, now);
    total_liquidity_ops_.fetch_add(1);

    spdlog::info("Removed {} LP from pool {} (position {}), impermanent loss {}%",
                 decimal::to_string(lp_amount), pool_label(pool), position_id, decimal::to_string(il));
    if (!position.open) {
        emit(EventType::PositionClosed, position);
    }
    emit(EventType::PoolUpdated, pool);
    return withdrawn;
}

// =============================================================================
// Swaps
// =============================================================================

SwapQuote PoolLedger::compute_swap(const PoolBook& book, const Address& token_in,
                                   const Address& token_out, const Decimal& amount_in) const {
    const Pool& pool = book.pool;

    if (token_in == token_out || !pool.has_token(token_in) || !pool.has_token(token_out)) {
        throw LedgerError(errors::UNKNOWN_TOKEN_PAIR,
                          token_in + "/" + token_out + " not tradable in pool " + pool_label(pool));
    }

    const Decimal& reserve_in = pool.reserves.at(token_in);
    const Decimal& reserve_out = pool.reserves.at(token_out);
    if (reserve_in <= 0 || reserve_out <= 0) {
        throw LedgerError(errors::INSUFFICIENT_LIQUIDITY, "pool " + pool_label(pool) + " has an empty reserve");
    }

    SwapQuote quote;
    quote.amount_out = book.pricing(reserve_in, reserve_out, amount_in, pool.swap_fee_rate);
    if (quote.amount_out <= 0 || quote.amount_out >= reserve_out) {
        throw LedgerError(errors::INSUFFICIENT_LIQUIDITY, "trade cannot be filled from reserves");
    }

    quote.fee_paid = amount_in * pool.swap_fee_rate;
    // Protocol cut comes out of the swap fee, never on top of it
    quote.protocol_fee = amount_in * decimal::min(config_.protocol_fee_rate, pool.swap_fee_rate);

    quote.new_reserve_in = reserve_in + amount_in - quote.protocol_fee;
    quote.new_reserve_out = reserve_out - quote.amount_out;
    quote.price_impact_pct = amm_math::price_impact(reserve_in, reserve_out,
                                                    quote.new_reserve_in, quote.new_reserve_out);

    Decimal net = amount_in - quote.fee_paid;
    Decimal spot_out = net * reserve_out / reserve_in;
    quote.slippage_pct = spot_out > 0 ? (spot_out - quote.amount_out) / spot_out : Decimal(0);
    return quote;
}

SwapQuote PoolLedger::quote_swap(PoolId pool_id, const Address& token_in,
                                 const Address& token_out, const Decimal& amount_in) const {
    if (amount_in <= 0) {
        throw LedgerError(errors::INVALID_AMOUNT, "swap amount must be positive");
    }
    PoolBook& book = require_book(pool_id);
    std::shared_lock lock(book.mutex);
    return compute_swap(book, token_in, token_out, amount_in);
}

SwapRecord PoolLedger::swap(PoolId pool_id, const Address& trader,
                            const Address& token_in, const Address& token_out,
                            const Decimal& amount_in, std::optional<Decimal> min_amount_out) {
    if (amount_in <= 0) {
        throw LedgerError(errors::INVALID_AMOUNT, "swap amount must be positive");
    }
    if (min_amount_out && *min_amount_out < 0) {
        throw LedgerError(errors::INVALID_AMOUNT, "minimum output must not be negative");
    }

    const Decimal price_in = tokens_.price_of(token_in).value_or(Decimal(0));

    PoolBook& book = require_book(pool_id);
    std::unique_lock lock(book.mutex);
    Pool& pool = book.pool;

    if (pool.status != PoolStatus::Active) {
        throw LedgerError(errors::POOL_INACTIVE, "pool " + pool_label(pool) + " is " + to_string(pool.status));
    }

    SwapQuote quote = compute_swap(book, token_in, token_out, amount_in);

    if (quote.price_impact_pct > config_.max_price_impact) {
        spdlog::warn("Rejected swap in pool {}: price impact {} over limit {}", pool_label(pool),
                     decimal::to_string(quote.price_impact_pct), decimal::to_string(config_.max_price_impact));
        throw LedgerError(errors::PRICE_IMPACT_EXCEEDED,
                          "price impact " + decimal::to_string(quote.price_impact_pct) + " exceeds " +
                          decimal::to_string(config_.max_price_impact));
    }
    if (min_amount_out && quote.amount_out < *min_amount_out) {
        spdlog::warn("Rejected swap in pool {}: output {} below minimum {}", pool_label(pool),
                     decimal::to_string(quote.amount_out), decimal::to_string(*min_amount_out));
        throw LedgerError(errors::SLIPPAGE_EXCEEDED,
                          "output " + decimal::to_string(quote.amount_out) + " below minimum " +
                          decimal::to_string(*min_amount_out));
    }

    if (pool.kind == PoolKind::ConstantProduct && pool.tokens.size() == 2) {
        Decimal k_before = pool.reserves[token_in] * pool.reserves[token_out];
        Decimal k_after = quote.new_reserve_in * quote.new_reserve_out;
        if (k_before - k_after > k_before * K_TOLERANCE) {
            spdlog::error("Swap in pool {} would shrink k from {} to {}", pool_label(pool),
                          decimal::to_string(k_before), decimal::to_string(k_after));
            throw LedgerError(errors::INVARIANT_VIOLATED, "constant product would decrease");
        }
    }

    // Commit
    uint64_t now = clock_();
    pool.reserves[token_in] = quote.new_reserve_in;
    pool.reserves[token_out] = quote.new_reserve_out;
    pool.protocol_fees[token_in] += quote.protocol_fee;

    Decimal fee_value_usd = quote.fee_paid * price_in;
    pool.volume_usd += amount_in * price_in;
    pool.fees_collected_usd += fee_value_usd;
    pool.updated_at = now;
    PositionTracker::distribute_fees(pool, fee_value_usd);

    SwapRecord record;
    record.id = next_swap_id_.fetch_add(1);
    record.pool_id = pool.id;
    record.trader = trader;
    record.token_in = token_in;
    record.token_out = token_out;
    record.amount_in = amount_in;
    record.amount_out = quote.amount_out;
    record.price_impact_pct = quote.price_impact_pct;
    record.fee_paid = quote.fee_paid;
    record.protocol_fee = quote.protocol_fee;
    record.slippage_pct = quote.slippage_pct;
    record.timestamp = now;
    book.swaps.push_back(record);
    total_swaps_.fetch_add(1);

    spdlog::debug("Swap {} in pool {}: {} {} -> {} {}, impact {}", record.id, pool_label(pool),
                  decimal::to_string(amount_in), token_in, decimal::to_string(quote.amount_out), token_out,
                  decimal::to_string(quote.price_impact_pct));
    emit(EventType::SwapExecuted, record);
    emit(EventType::PoolUpdated, pool);
    return record;
}

// =============================================================================
// Fees
// =============================================================================

void PoolLedger::distribute_fees(PoolId pool_id, const Decimal& fee_value_usd) {
    if (fee_value_usd < 0) {
        throw LedgerError(errors::INVALID_AMOUNT, "fee value must not be negative");
    }
    PoolBook& book = require_book(pool_id);
    std::unique_lock lock(book.mutex);
    PositionTracker::distribute_fees(book.pool, fee_value_usd);
}

TokenAmounts PoolLedger::collect_protocol_fees(PoolId pool_id) {
    PoolBook& book = require_book(pool_id);
    std::unique_lock lock(book.mutex);

    TokenAmounts collected;
    for (auto& [token, amount] : book.pool.protocol_fees) {
        if (amount > 0) collected[token] = amount;
        amount = 0;
    }
    spdlog::info("Collected protocol fees from pool {} in {} tokens", pool_label(book.pool), collected.size());
    return collected;
}

// =============================================================================
// Administration
// =============================================================================

void PoolLedger::set_pool_status(PoolId pool_id, PoolStatus status) {
    PoolBook& book = require_book(pool_id);
    std::unique_lock lock(book.mutex);

    PoolStatus previous = book.pool.status;
    book.pool.status = status;
    book.pool.updated_at = clock_();

    spdlog::info("Pool {} status {} -> {}", pool_label(book.pool), to_string(previous), to_string(status));
    emit(EventType::PoolUpdated, book.pool);
}

// =============================================================================
// Query Operations
// =============================================================================

std::optional<Pool> PoolLedger::get_pool(PoolId pool_id) const {
    PoolBook* book = find_book(pool_id);
    if (!book) return std::nullopt;
    std::shared_lock lock(book->mutex);
    return book->pool;
}

bool PoolLedger::pool_exists(PoolId pool_id) const {
    return find_book(pool_id) != nullptr;
}

std::vector<PoolId> PoolLedger::pool_ids() const {
    std::shared_lock lock(books_mutex_);
    std::vector<PoolId> ids;
    ids.reserve(books_.size());
    for (const auto& [id, book] : books_) ids.push_back(id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::optional<LiquidityPosition> PoolLedger::get_position(PositionId position_id) const {
    auto pool_id = tracker_.pool_of(position_id);
    if (!pool_id) return std::nullopt;

    PoolBook* book = find_book(*pool_id);
    if (!book) return std::nullopt;
    std::shared_lock lock(book->mutex);

    auto it = book->positions.find(position_id);
    if (it == book->positions.end()) return std::nullopt;
    return PositionTracker::settled_view(book->pool, it->second);
}

std::vector<LiquidityPosition> PoolLedger::positions_in(PoolId pool_id) const {
    PoolBook* book = find_book(pool_id);
    if (!book) return {};
    std::shared_lock lock(book->mutex);

    std::vector<LiquidityPosition> out;
    for (const auto& [id, position] : book->positions) {
        if (position.open) out.push_back(PositionTracker::settled_view(book->pool, position));
    }
    return out;
}

std::vector<LiquidityPosition> PoolLedger::positions_of(const Address& provider) const {
    std::vector<LiquidityPosition> out;
    for (PositionId id : tracker_.positions_of(provider)) {
        if (auto position = get_position(id)) out.push_back(std::move(*position));
    }
    return out;
}

std::optional<Decimal> PoolLedger::impermanent_loss(PositionId position_id) const {
    auto pool_id = tracker_.pool_of(position_id);
    if (!pool_id) return std::nullopt;

    const TokenAmounts prices = tokens_.snapshot_prices();

    PoolBook* book = find_book(*pool_id);
    if (!book) return std::nullopt;
    std::shared_lock lock(book->mutex);

    auto it = book->positions.find(position_id);
    if (it == book->positions.end()) return std::nullopt;
    if (!it->second.open) return it->second.impermanent_loss_pct;
    return PositionTracker::impermanent_loss(book->pool, it->second, prices);
}

std::vector<SwapRecord> PoolLedger::swap_history(PoolId pool_id) const {
    PoolBook* book = find_book(pool_id);
    if (!book) return {};
    std::shared_lock lock(book->mutex);
    return book->swaps;
}

std::optional<PoolAnalytics> PoolLedger::pool_analytics(PoolId pool_id) const {
    const TokenAmounts prices = tokens_.snapshot_prices();

    PoolBook* book = find_book(pool_id);
    if (!book) return std::nullopt;
    std::shared_lock lock(book->mutex);
    const Pool& pool = book->pool;

    PoolAnalytics a;
    a.pool_id = pool.id;
    a.name = pool.name;
    a.kind = pool.kind;
    a.status = pool.status;
    a.reserves = pool.reserves;
    a.lp_supply = pool.lp_supply;
    a.swap_fee_pct = pool.swap_fee_rate * 100;
    a.volume_usd = pool.volume_usd;
    a.fees_collected_usd = pool.fees_collected_usd;
    a.updated_at = pool.updated_at;
    a.liquidity_providers = PositionTracker::open_count(*book);
    a.total_swaps = book->swaps.size();

    a.tvl_usd = 0;
    for (const auto& [token, reserve] : pool.reserves) {
        a.tvl_usd += reserve * price_or_zero(prices, token);
    }

    uint64_t now = clock_();
    uint64_t window_start = now > SECONDS_PER_DAY ? now - SECONDS_PER_DAY : 0;
    std::vector<Decimal> execution_prices;
    a.volume_24h_usd = 0;
    for (const auto& swap : book->swaps) {
        if (swap.timestamp < window_start) continue;
        a.volume_24h_usd += swap.amount_in * price_or_zero(prices, swap.token_in);
        execution_prices.push_back(swap.amount_out / swap.amount_in);
    }
    a.swaps_24h = execution_prices.size();

    a.fee_apy_pct = a.tvl_usd > 0
        ? a.volume_24h_usd * pool.swap_fee_rate * 365 / a.tvl_usd * 100
        : Decimal(0);

    // Population std-dev of relative changes between consecutive fills
    a.volatility = 0;
    if (execution_prices.size() >= 2) {
        std::vector<Decimal> changes;
        for (size_t i = 1; i < execution_prices.size(); ++i) {
            const Decimal& prev = execution_prices[i - 1];
            changes.push_back(boost::multiprecision::abs(execution_prices[i] - prev) / prev);
        }
        Decimal mean(0);
        for (const auto& c : changes) mean += c;
        mean /= Decimal(changes.size());
        Decimal variance(0);
        for (const auto& c : changes) variance += (c - mean) * (c - mean);
        variance /= Decimal(changes.size());
        a.volatility = boost::multiprecision::sqrt(variance);
    }

    return a;
}

PoolLedger::Stats PoolLedger::get_stats() const {
    Stats stats{};
    {
        std::shared_lock lock(books_mutex_);
        stats.total_pools = books_.size();
    }
    stats.total_positions = tracker_.total_positions();
    stats.total_swaps = total_swaps_.load();
    stats.total_liquidity_ops = total_liquidity_ops_.load();
    return stats;
}

// =============================================================================
// Internal Helpers
// =============================================================================

// Books are never erased, so the pointer stays valid after the map lock drops
PoolBook* PoolLedger::find_book(PoolId pool_id) const {
    std::shared_lock lock(books_mutex_);
    auto it = books_.find(pool_id);
    return it != books_.end() ? it->second.get() : nullptr;
}

PoolBook& PoolLedger::require_book(PoolId pool_id) const {
    PoolBook* book = find_book(pool_id);
    if (!book) {
        throw LedgerError(errors::POOL_NOT_FOUND, "no pool " + std::to_string(pool_id));
    }
    return *book;
}

void PoolLedger::emit(EventType type, const nlohmann::json& payload) const {
    if (events_) events_->publish(type, clock_(), payload);
}

} // namespace yield
