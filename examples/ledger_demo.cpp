// Yield Ledger - Demo
// Walks through a pool, a swap, a stake, a delegation and a slash.
// Usage: yield_demo [config.json]

#include <yield/config.hpp>
#include <yield/governance.hpp>
#include <yield/logging.hpp>
#include <yield/pool_ledger.hpp>
#include <yield/serialization.hpp>
#include <yield/staking_ledger.hpp>
#include <yield/system_status.hpp>

#include <iostream>

using namespace yield;

namespace {

Token token(const Address& address, uint8_t decimals, const char* price) {
    Token t;
    t.address = address;
    t.symbol = address;
    t.name = address;
    t.decimals = decimals;
    t.total_supply = Decimal("1000000000");
    t.price_usd = Decimal(price);
    return t;
}

} // namespace

int main(int argc, char** argv) {
    try {
        Config config = argc > 1 ? Config::from_file(argv[1]) : Config{};
        config.liquidity.max_price_impact = Decimal("0.2");
        logging::init(config.general);

        // Every event goes to stdout as JSON lines
        JsonLinesSink sink(std::cout);
        EventBus bus;
        bus.subscribe(&sink);

        TokenRegistry tokens;
        tokens.register_token(token("ETH", 18, "2000"));
        tokens.register_token(token("USDC", 6, "1"));
        tokens.register_token(token("STAKE", 18, "5"));
        tokens.register_token(token("REWARD", 18, "0.5"));

        PoolLedger pools(tokens, config.liquidity, &bus);
        ValidatorRegistry validators(config.staking, &bus);
        StakingLedger staking(tokens, validators, config.staking, &bus);
        GovernanceTally governance(staking, config.governance, &bus);

        // Liquidity and a swap
        PoolId pool = pools.create_pool("ETH/USDC", {"ETH", "USDC"}, {}, PoolKind::ConstantProduct);
        auto position = pools.add_liquidity(pool, "alice", {{"ETH", Decimal(50)}, {"USDC", Decimal(100000)}});
        auto swap = pools.swap(pool, "trader", "USDC", "ETH", Decimal(5000));
        std::cout << "\nSwapped 5000 USDC for " << tokens.get("ETH")->format_amount(swap.amount_out)
                  << " (impact " << decimal::to_string(swap.price_impact_pct * 100) << "%)\n";
        std::cout << "LP fees earned: "
                  << decimal::to_string(pools.get_position(position.id)->fees_earned.at(USD_KEY)) << " USD\n\n";

        // Staking and governance
        auto gov_pool = staking.create_staking_pool("Governance", "STAKE", {"REWARD"},
                                                    StakeKind::Governance, Decimal("0.05"));
        staking.stake(gov_pool, "alice", Decimal(1000));
        auto proposal = governance.create_proposal("alice", "Lower swap fee", "0.3% to 0.25%");
        governance.vote(proposal, "alice", VoteChoice::For);

        // Delegation and slashing
        auto validator = validators.create_validator("operator", Decimal(100), Decimal("0.1"));
        staking.delegate("bob", validator, Decimal(500));
        validators.slash(validator, Decimal("0.05"), "double_sign");

        nlohmann::json status = collect_status(pools, staking, validators, unix_now());
        std::cout << "\nStatus: " << status.dump(2) << "\n";

    } catch (const LedgerError& e) {
        std::cerr << "Error (" << e.code() << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
