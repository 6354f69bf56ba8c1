// =============================================================================
// token_registry.cpp - Token metadata and USD prices
// =============================================================================

#include "yield/token_registry.hpp"

#include <algorithm>
#include <ios>

#include <spdlog/spdlog.h>

namespace yield {

std::string Token::format_amount(const Decimal& amount) const {
    return amount.str(decimals, std::ios_base::fixed) + " " + symbol;
}

void TokenRegistry::register_token(const Token& token) {
    if (token.address.empty()) {
        throw LedgerError(errors::INVALID_TOKEN, "token address is empty");
    }
    if (token.price_usd < 0) {
        throw LedgerError(errors::INVALID_PRICE, "negative price for " + token.address);
    }

    std::unique_lock lock(tokens_mutex_);
    if (tokens_.find(token.address) != tokens_.end()) {
        throw LedgerError(errors::INVALID_TOKEN, "token already registered: " + token.address);
    }
    tokens_.emplace(token.address, token);

    spdlog::info("Registered token {} ({}) at {}", token.name, token.symbol, token.address);
}

bool TokenRegistry::contains(const Address& address) const {
    std::shared_lock lock(tokens_mutex_);
    return tokens_.find(address) != tokens_.end();
}

std::optional<Token> TokenRegistry::get(const Address& address) const {
    std::shared_lock lock(tokens_mutex_);
    auto it = tokens_.find(address);
    if (it == tokens_.end()) return std::nullopt;
    return it->second;
}

std::vector<Token> TokenRegistry::all() const {
    std::shared_lock lock(tokens_mutex_);
    std::vector<Token> out;
    out.reserve(tokens_.size());
    for (const auto& [address, token] : tokens_) {
        out.push_back(token);
    }
    std::sort(out.begin(), out.end(),
              [](const Token& a, const Token& b) { return a.address < b.address; });
    return out;
}

std::optional<Decimal> TokenRegistry::price_of(const Address& address) const {
    std::shared_lock lock(tokens_mutex_);
    auto it = tokens_.find(address);
    if (it == tokens_.end()) return std::nullopt;
    return it->second.price_usd;
}

void TokenRegistry::set_price(const Address& address, const Decimal& price_usd) {
    if (price_usd < 0) {
        throw LedgerError(errors::INVALID_PRICE, "negative price for " + address);
    }

    std::unique_lock lock(tokens_mutex_);
    auto it = tokens_.find(address);
    if (it == tokens_.end()) {
        throw LedgerError(errors::INVALID_TOKEN, "token not registered: " + address);
    }
    it->second.price_usd = price_usd;
}

size_t TokenRegistry::refresh_prices(const PriceOracle& oracle) {
    // Query the oracle without holding the registry lock
    std::vector<Address> addresses;
    {
        std::shared_lock lock(tokens_mutex_);
        addresses.reserve(tokens_.size());
        for (const auto& [address, token] : tokens_) addresses.push_back(address);
    }

    std::vector<std::pair<Address, Decimal>> fresh;
    for (const auto& address : addresses) {
        auto price = oracle.get_price(address);
        if (!price) continue;
        if (*price < 0) {
            spdlog::warn("Oracle returned negative price for {}, ignored", address);
            continue;
        }
        fresh.emplace_back(address, *price);
    }

    std::unique_lock lock(tokens_mutex_);
    size_t updated = 0;
    for (const auto& [address, price] : fresh) {
        auto it = tokens_.find(address);
        if (it == tokens_.end()) continue;
        it->second.price_usd = price;
        ++updated;
    }
    spdlog::debug("Refreshed {} of {} token prices", updated, addresses.size());
    return updated;
}

TokenAmounts TokenRegistry::snapshot_prices() const {
    std::shared_lock lock(tokens_mutex_);
    TokenAmounts prices;
    for (const auto& [address, token] : tokens_) {
        prices[address] = token.price_usd;
    }
    return prices;
}

} // namespace yield
