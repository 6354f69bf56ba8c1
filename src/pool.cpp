// =============================================================================
// pool.cpp - Pool types and AMM pricing curves
// =============================================================================

#include "yield/pool.hpp"

#include <algorithm>

namespace yield {

const char* to_string(PoolKind kind) noexcept {
    switch (kind) {
        case PoolKind::ConstantProduct: return "constant_product";
        case PoolKind::StableSwap: return "stable_swap";
    }
    return "unknown";
}

const char* to_string(PoolStatus status) noexcept {
    switch (status) {
        case PoolStatus::Active: return "active";
        case PoolStatus::Paused: return "paused";
        case PoolStatus::EmergencyPaused: return "emergency_paused";
        case PoolStatus::Migrating: return "migrating";
        case PoolStatus::Deprecated: return "deprecated";
    }
    return "unknown";
}

bool Pool::has_token(const Address& token) const {
    return std::find(tokens.begin(), tokens.end(), token) != tokens.end();
}

namespace amm_math {

Decimal constant_product_out(const Decimal& reserve_in, const Decimal& reserve_out,
                             const Decimal& amount_in, const Decimal& fee_rate) {
    Decimal net = amount_in * (Decimal(1) - fee_rate);
    Decimal denominator = reserve_in + net;
    if (denominator <= 0) return Decimal(0);
    return net * reserve_out / denominator;
}

Decimal stable_swap_out(const Decimal& reserve_in, const Decimal& reserve_out,
                        const Decimal& amount_in, const Decimal& fee_rate) {
    Decimal net = amount_in * (Decimal(1) - fee_rate);
    Decimal denominator = reserve_in + net;
    if (denominator <= 0) return Decimal(0);

    // Not the full StableSwap invariant: a damping term on the input share
    Decimal ratio = net / denominator;
    return reserve_out * ratio * (Decimal(1) - ratio / STABLE_SWAP_AMPLIFICATION);
}

PricingFn pricing_for(PoolKind kind) noexcept {
    switch (kind) {
        case PoolKind::ConstantProduct: return &constant_product_out;
        case PoolKind::StableSwap: return &stable_swap_out;
    }
    return &constant_product_out;
}

Decimal price_impact(const Decimal& reserve_in, const Decimal& reserve_out,
                     const Decimal& new_reserve_in, const Decimal& new_reserve_out) {
    if (reserve_in <= 0 || reserve_out <= 0 || new_reserve_in <= 0) return Decimal(0);
    Decimal old_price = reserve_out / reserve_in;
    Decimal new_price = new_reserve_out / new_reserve_in;
    return boost::multiprecision::abs(new_price - old_price) / old_price;
}

Decimal geometric_mean(const std::vector<Decimal>& values) {
    if (values.empty()) return Decimal(0);

    Decimal product(1);
    for (const auto& v : values) {
        if (v <= 0) return Decimal(0);
        product *= v;
    }
    if (values.size() == 2) return boost::multiprecision::sqrt(product);
    return boost::multiprecision::pow(product, Decimal(1) / Decimal(values.size()));
}

Decimal reserve_product(const TokenAmounts& reserves) {
    if (reserves.empty()) return Decimal(0);
    Decimal k(1);
    for (const auto& [token, amount] : reserves) k *= amount;
    return k;
}

} // namespace amm_math

} // namespace yield
