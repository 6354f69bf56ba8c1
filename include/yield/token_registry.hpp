#ifndef YIELD_TOKEN_REGISTRY_HPP
#define YIELD_TOKEN_REGISTRY_HPP

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace yield {

// =============================================================================
// Token
// =============================================================================

struct Token {
    Address address;
    std::string symbol;
    std::string name;
    uint8_t decimals = 18;
    Decimal total_supply;
    Decimal price_usd;

    // "12.500000 USDC" with `decimals` fractional digits
    std::string format_amount(const Decimal& amount) const;
};

// =============================================================================
// Price Oracle Interface
// =============================================================================

// Supplied by the surrounding system. Consulted out-of-band through
// TokenRegistry::refresh_prices, never while a ledger entity is locked.
class PriceOracle {
public:
    virtual ~PriceOracle() = default;
    virtual std::optional<Decimal> get_price(const Address& token) const = 0;
};

// Fixed price table, handy for wiring and tests
class StaticPriceOracle : public PriceOracle {
public:
    void set_price(const Address& token, const Decimal& price) { prices_[token] = price; }

    std::optional<Decimal> get_price(const Address& token) const override {
        auto it = prices_.find(token);
        if (it == prices_.end()) return std::nullopt;
        return it->second;
    }

private:
    std::unordered_map<Address, Decimal> prices_;
};

// =============================================================================
// TokenRegistry
// =============================================================================

class TokenRegistry {
public:
    TokenRegistry() = default;

    // Non-copyable
    TokenRegistry(const TokenRegistry&) = delete;
    TokenRegistry& operator=(const TokenRegistry&) = delete;

    void register_token(const Token& token);
    bool contains(const Address& address) const;
    std::optional<Token> get(const Address& address) const;
    std::vector<Token> all() const;

    std::optional<Decimal> price_of(const Address& address) const;
    void set_price(const Address& address, const Decimal& price_usd);

    // Pull every registered token's price from the oracle. Tokens the oracle
    // does not know keep their last price. Returns the number updated.
    size_t refresh_prices(const PriceOracle& oracle);

    // token -> price for every registered token
    TokenAmounts snapshot_prices() const;

private:
    std::unordered_map<Address, Token> tokens_;
    mutable std::shared_mutex tokens_mutex_;
};

} // namespace yield

#endif // YIELD_TOKEN_REGISTRY_HPP
