// =============================================================================
// types.cpp - Decimal helpers and error names
// =============================================================================

#include "yield/types.hpp"

#include <cctype>
#include <ios>

namespace yield {

// =============================================================================
// Decimal
// =============================================================================

namespace decimal {

namespace {

// Fractional digits kept when rendering (X18 convention)
constexpr int RENDER_SCALE = 18;

bool is_plain_number(const std::string& s) {
    size_t i = 0;
    if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
    bool digits = false;
    bool dot = false;
    for (; i < s.size(); ++i) {
        char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits = true;
        } else if (c == '.' && !dot) {
            dot = true;
        } else if ((c == 'e' || c == 'E') && digits) {
            // Exponent: optional sign then at least one digit
            size_t j = i + 1;
            if (j < s.size() && (s[j] == '-' || s[j] == '+')) ++j;
            if (j >= s.size()) return false;
            for (; j < s.size(); ++j) {
                if (!std::isdigit(static_cast<unsigned char>(s[j]))) return false;
            }
            return true;
        } else {
            return false;
        }
    }
    return digits;
}

} // namespace

Decimal from_string(const std::string& text) {
    if (!is_plain_number(text)) {
        throw LedgerError(errors::CONFIG_ERROR, "not a decimal number: '" + text + "'");
    }
    return Decimal(text);
}

std::string to_string(const Decimal& value) {
    std::string s = value.str(RENDER_SCALE, std::ios_base::fixed);

    auto dot = s.find('.');
    if (dot != std::string::npos) {
        size_t last = s.find_last_not_of('0');
        if (last == dot) --last;
        s.erase(last + 1);
    }
    if (s == "-0") s = "0";
    return s;
}

} // namespace decimal

// =============================================================================
// Error Names
// =============================================================================

namespace errors {

const char* name(int32_t code) noexcept {
    switch (code) {
        case OK: return "Ok";
        case INVALID_TOKEN: return "InvalidToken";
        case UNKNOWN_TOKEN: return "UnknownToken";
        case POOL_NOT_FOUND: return "PoolNotFound";
        case POOL_INACTIVE: return "PoolInactive";
        case UNKNOWN_TOKEN_PAIR: return "UnknownTokenPair";
        case PRICE_IMPACT_EXCEEDED: return "PriceImpactExceeded";
        case SLIPPAGE_EXCEEDED: return "SlippageExceeded";
        case INSUFFICIENT_LP: return "InsufficientLP";
        case INSUFFICIENT_LIQUIDITY: return "InsufficientLiquidity";
        case ZERO_LIQUIDITY: return "ZeroLiquidity";
        case INVALID_AMOUNT: return "InvalidAmount";
        case INVALID_FEE: return "InvalidFee";
        case INVALID_PRICE: return "InvalidPrice";
        case INVARIANT_VIOLATED: return "InvariantViolated";
        case POSITION_NOT_FOUND: return "PositionNotFound";
        case STAKE_NOT_FOUND: return "StakeNotFound";
        case STAKE_NOT_ACTIVE: return "StakeNotActive";
        case STAKE_OUT_OF_BOUNDS: return "StakeOutOfBounds";
        case EXCEEDS_STAKED: return "ExceedsStaked";
        case VALIDATOR_NOT_FOUND: return "ValidatorNotFound";
        case VALIDATOR_INACTIVE: return "ValidatorInactive";
        case BELOW_MINIMUM_STAKE: return "BelowMinimumStake";
        case COMMISSION_TOO_HIGH: return "CommissionTooHigh";
        case INVALID_PENALTY: return "InvalidPenalty";
        case PROPOSAL_NOT_FOUND: return "ProposalNotFound";
        case VOTING_CLOSED: return "VotingClosed";
        case ALREADY_VOTED: return "AlreadyVoted";
        case INSUFFICIENT_GOVERNANCE_POWER: return "InsufficientGovernancePower";
        case CONFIG_ERROR: return "ConfigError";
    }
    return "Unknown";
}

} // namespace errors

} // namespace yield
