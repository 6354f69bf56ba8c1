#ifndef YIELD_TYPES_HPP
#define YIELD_TYPES_HPP

#include <cstdint>
#include <chrono>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>

#include <boost/multiprecision/cpp_dec_float.hpp>

namespace yield {

// =============================================================================
// Decimal Arithmetic (28 significant digits)
// =============================================================================

// Expression templates are off so `auto` and ternaries yield plain values.
using Decimal = boost::multiprecision::number<
    boost::multiprecision::cpp_dec_float<28>,
    boost::multiprecision::et_off>;

namespace decimal {

inline Decimal zero() { return Decimal(0); }
inline Decimal one() { return Decimal(1); }

// Parse "123.456" style text; throws LedgerError(CONFIG_ERROR) on junk
Decimal from_string(const std::string& text);

// Fixed notation, trailing zeros trimmed
std::string to_string(const Decimal& value);

inline double to_double(const Decimal& value) {
    return value.convert_to<double>();
}

inline Decimal min(const Decimal& a, const Decimal& b) { return a < b ? a : b; }
inline Decimal max(const Decimal& a, const Decimal& b) { return a < b ? b : a; }

} // namespace decimal

// =============================================================================
// Identifiers
// =============================================================================

using Address = std::string;     // token or account address
using PoolId = uint64_t;
using PositionId = uint64_t;
using SwapId = uint64_t;
using StakingPoolId = uint64_t;
using StakeId = uint64_t;
using ValidatorId = uint64_t;
using ProposalId = uint64_t;

// Per-token amounts keyed by token address
using TokenAmounts = std::map<Address, Decimal>;

// Key used for USD-denominated fee balances
inline const Address USD_KEY = "USD";

// =============================================================================
// Time
// =============================================================================

// Unix seconds source; ledgers accept an injected clock for deterministic tests
using Clock = std::function<uint64_t()>;

inline uint64_t unix_now() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

inline Clock default_clock() { return &unix_now; }

constexpr uint64_t SECONDS_PER_DAY = 86400;
constexpr uint64_t SECONDS_PER_YEAR = 365 * SECONDS_PER_DAY;

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t INVALID_TOKEN = -1;
constexpr int32_t UNKNOWN_TOKEN = -2;
constexpr int32_t POOL_NOT_FOUND = -3;
constexpr int32_t POOL_INACTIVE = -4;
constexpr int32_t UNKNOWN_TOKEN_PAIR = -5;
constexpr int32_t PRICE_IMPACT_EXCEEDED = -6;
constexpr int32_t SLIPPAGE_EXCEEDED = -7;
constexpr int32_t INSUFFICIENT_LP = -8;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -9;
constexpr int32_t ZERO_LIQUIDITY = -10;
constexpr int32_t INVALID_AMOUNT = -11;
constexpr int32_t INVALID_FEE = -12;
constexpr int32_t INVALID_PRICE = -13;
constexpr int32_t INVARIANT_VIOLATED = -14;
constexpr int32_t POSITION_NOT_FOUND = -15;
constexpr int32_t STAKE_NOT_FOUND = -20;
constexpr int32_t STAKE_NOT_ACTIVE = -21;
constexpr int32_t STAKE_OUT_OF_BOUNDS = -22;
constexpr int32_t EXCEEDS_STAKED = -23;
constexpr int32_t VALIDATOR_NOT_FOUND = -30;
constexpr int32_t VALIDATOR_INACTIVE = -31;
constexpr int32_t BELOW_MINIMUM_STAKE = -32;
constexpr int32_t COMMISSION_TOO_HIGH = -33;
constexpr int32_t INVALID_PENALTY = -34;
constexpr int32_t PROPOSAL_NOT_FOUND = -40;
constexpr int32_t VOTING_CLOSED = -41;
constexpr int32_t ALREADY_VOTED = -42;
constexpr int32_t INSUFFICIENT_GOVERNANCE_POWER = -43;
constexpr int32_t CONFIG_ERROR = -50;

// Symbolic name, e.g. "PriceImpactExceeded"
const char* name(int32_t code) noexcept;
} // namespace errors

// Validation failure raised by ledger operations. Nothing has been mutated
// when this is thrown.
class LedgerError : public std::runtime_error {
public:
    LedgerError(int32_t code, const std::string& msg)
        : std::runtime_error(std::string(errors::name(code)) + ": " + msg), code_(code) {}

    int32_t code() const noexcept { return code_; }

private:
    int32_t code_;
};

} // namespace yield

#endif // YIELD_TYPES_HPP
