// Yield Ledger - Pool Ledger Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <yield/pool_ledger.hpp>

#include "test_support.hpp"

using namespace yield;
using Catch::Approx;
using yield::test::d;
using yield::test::ManualClock;

namespace {

int32_t error_code(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const LedgerError& e) {
        return e.code();
    }
    return errors::OK;
}

LiquidityConfig wide_impact_config() {
    LiquidityConfig config;
    config.max_price_impact = Decimal("0.2");
    return config;
}

} // namespace

TEST_CASE("Pool creation", "[pool]") {
    TokenRegistry tokens;
    test::register_default_tokens(tokens);
    ManualClock clock;
    PoolLedger ledger(tokens, {}, nullptr, clock.clock());

    SECTION("Defaults") {
        PoolId id = ledger.create_pool("ETH/USDC", {"ETH", "USDC"}, {}, PoolKind::ConstantProduct);
        auto pool = ledger.get_pool(id);
        REQUIRE(pool.has_value());
        REQUIRE(pool->status == PoolStatus::Active);
        REQUIRE(pool->lp_supply == 0);
        REQUIRE(pool->swap_fee_rate == Decimal("0.003"));
        REQUIRE(pool->reserves.size() == 2);
        REQUIRE(pool->reserves.at("ETH") == 0);
        REQUIRE(pool->created_at == test::START_TIME);
        REQUIRE(ledger.pool_exists(id));
        REQUIRE(ledger.pool_ids() == std::vector<PoolId>{id});
    }

    SECTION("Initial reserves and custom fee") {
        PoolId id = ledger.create_pool("USDC/DAI", {"USDC", "DAI"}, {{"USDC", Decimal(500)}},
                                       PoolKind::StableSwap, Decimal("0.0004"));
        auto pool = ledger.get_pool(id).value();
        REQUIRE(pool.reserves.at("USDC") == 500);
        REQUIRE(pool.reserves.at("DAI") == 0);
        REQUIRE(pool.kind == PoolKind::StableSwap);
        REQUIRE(pool.swap_fee_rate == Decimal("0.0004"));
    }

    SECTION("Invalid inputs") {
        REQUIRE(error_code([&] {
            ledger.create_pool("x", {"ETH", "BTC"}, {}, PoolKind::ConstantProduct);
        }) == errors::INVALID_TOKEN);
        REQUIRE(error_code([&] {
            ledger.create_pool("x", {"ETH"}, {}, PoolKind::ConstantProduct);
        }) == errors::INVALID_TOKEN);
        REQUIRE(error_code([&] {
            ledger.create_pool("x", {"ETH", "ETH"}, {}, PoolKind::ConstantProduct);
        }) == errors::INVALID_TOKEN);
        REQUIRE(error_code([&] {
            ledger.create_pool("x", {"ETH", "USDC"}, {{"DAI", Decimal(1)}}, PoolKind::ConstantProduct);
        }) == errors::INVALID_TOKEN);
        REQUIRE(error_code([&] {
            ledger.create_pool("x", {"ETH", "USDC"}, {}, PoolKind::ConstantProduct, Decimal(1));
        }) == errors::INVALID_FEE);
        REQUIRE(error_code([&] {
            ledger.create_pool("x", {"ETH", "USDC"}, {}, PoolKind::ConstantProduct, Decimal("-0.01"));
        }) == errors::INVALID_FEE);
        REQUIRE(ledger.get_stats().total_pools == 0);
    }
}

TEST_CASE("Liquidity provision", "[pool]") {
    TokenRegistry tokens;
    test::register_default_tokens(tokens);
    ManualClock clock;
    PoolLedger ledger(tokens, {}, nullptr, clock.clock());
    PoolId id = ledger.create_pool("ETH/USDC", {"ETH", "USDC"}, {}, PoolKind::ConstantProduct);

    auto first = ledger.add_liquidity(id, "alice", {{"ETH", Decimal(50)}, {"USDC", Decimal(100000)}});

    SECTION("First provision mints the geometric mean of USD values") {
        REQUIRE(d(first.lp_amount) == Approx(100000.0));
        auto pool = ledger.get_pool(id).value();
        REQUIRE(pool.lp_supply == first.lp_amount);
        REQUIRE(pool.reserves.at("ETH") == 50);
        REQUIRE(pool.reserves.at("USDC") == 100000);
        REQUIRE(first.open);
        REQUIRE(first.provider == "alice");
    }

    SECTION("Subsequent provision mints by the scarcest ratio") {
        auto second = ledger.add_liquidity(id, "bob", {{"ETH", Decimal(5)}, {"USDC", Decimal(20000)}});
        REQUIRE(d(second.lp_amount) == Approx(10000.0));
        REQUIRE(d(ledger.get_pool(id)->lp_supply) == Approx(110000.0));
    }

    SECTION("Omitting a token mints nothing") {
        REQUIRE(error_code([&] {
            ledger.add_liquidity(id, "bob", {{"ETH", Decimal(5)}});
        }) == errors::ZERO_LIQUIDITY);
        REQUIRE(d(ledger.get_pool(id)->lp_supply) == Approx(100000.0));
    }

    SECTION("Rejected deposits") {
        REQUIRE(error_code([&] {
            ledger.add_liquidity(999, "bob", {{"ETH", Decimal(1)}});
        }) == errors::POOL_NOT_FOUND);
        REQUIRE(error_code([&] {
            ledger.add_liquidity(id, "bob", {{"DAI", Decimal(1)}});
        }) == errors::UNKNOWN_TOKEN);
        REQUIRE(error_code([&] {
            ledger.add_liquidity(id, "bob", {{"ETH", Decimal(0)}});
        }) == errors::INVALID_AMOUNT);
        REQUIRE(error_code([&] {
            ledger.add_liquidity(id, "bob", {});
        }) == errors::INVALID_AMOUNT);

        ledger.set_pool_status(id, PoolStatus::Paused);
        REQUIRE(error_code([&] {
            ledger.add_liquidity(id, "bob", {{"ETH", Decimal(1)}, {"USDC", Decimal(2000)}});
        }) == errors::POOL_INACTIVE);
    }
}

TEST_CASE("Swap execution", "[pool][swap]") {
    TokenRegistry tokens;
    test::register_default_tokens(tokens);
    ManualClock clock;
    PoolLedger ledger(tokens, wide_impact_config(), nullptr, clock.clock());
    PoolId id = ledger.create_pool("ETH/USDC", {"ETH", "USDC"}, {}, PoolKind::ConstantProduct);
    ledger.add_liquidity(id, "alice", {{"ETH", Decimal(50)}, {"USDC", Decimal(100000)}});

    SECTION("5000 USDC buys about 2.3741 ETH") {
        auto record = ledger.swap(id, "trader", "USDC", "ETH", Decimal(5000));
        REQUIRE(d(record.amount_out) == Approx(2.37415).margin(1e-5));
        REQUIRE(d(record.fee_paid) == Approx(15.0));
        REQUIRE(d(record.protocol_fee) == Approx(2.5));
        REQUIRE(d(record.price_impact_pct) == Approx(0.0928).margin(0.001));
        REQUIRE(record.slippage_pct > 0);
        REQUIRE(record.timestamp == test::START_TIME);

        auto pool = ledger.get_pool(id).value();
        REQUIRE(d(pool.reserves.at("USDC")) == Approx(104997.5));
        REQUIRE(d(pool.reserves.at("ETH")) == Approx(50.0 - d(record.amount_out)));
        REQUIRE(d(pool.protocol_fees.at("USDC")) == Approx(2.5));
        REQUIRE(d(pool.volume_usd) == Approx(5000.0));
        REQUIRE(d(pool.fees_collected_usd) == Approx(15.0));
        REQUIRE(ledger.swap_history(id).size() == 1);
    }

    SECTION("Constant product never decreases") {
        Decimal k = amm_math::reserve_product(ledger.get_pool(id)->reserves);
        for (int i = 0; i < 5; ++i) {
            ledger.swap(id, "trader", i % 2 ? "ETH" : "USDC", i % 2 ? "USDC" : "ETH",
                        i % 2 ? Decimal("0.5") : Decimal(1000));
            Decimal next = amm_math::reserve_product(ledger.get_pool(id)->reserves);
            REQUIRE(next >= k);
            k = next;
        }
    }

    SECTION("Quote matches execution") {
        auto quote = ledger.quote_swap(id, "USDC", "ETH", Decimal(5000));
        auto record = ledger.swap(id, "trader", "USDC", "ETH", Decimal(5000));
        REQUIRE(quote.amount_out == record.amount_out);
        REQUIRE(quote.price_impact_pct == record.price_impact_pct);
    }

    SECTION("Slippage guard") {
        auto pool_before = ledger.get_pool(id).value();
        REQUIRE(error_code([&] {
            ledger.swap(id, "trader", "USDC", "ETH", Decimal(5000), Decimal("2.5"));
        }) == errors::SLIPPAGE_EXCEEDED);
        auto pool_after = ledger.get_pool(id).value();
        REQUIRE(pool_after.reserves == pool_before.reserves);
        REQUIRE(ledger.swap_history(id).empty());

        REQUIRE_NOTHROW(ledger.swap(id, "trader", "USDC", "ETH", Decimal(5000), Decimal("2.37")));
    }

    SECTION("Rejected swaps") {
        REQUIRE(error_code([&] { ledger.swap(42, "t", "USDC", "ETH", Decimal(1)); }) == errors::POOL_NOT_FOUND);
        REQUIRE(error_code([&] { ledger.swap(id, "t", "USDC", "DAI", Decimal(1)); }) == errors::UNKNOWN_TOKEN_PAIR);
        REQUIRE(error_code([&] { ledger.swap(id, "t", "USDC", "USDC", Decimal(1)); }) == errors::UNKNOWN_TOKEN_PAIR);
        REQUIRE(error_code([&] { ledger.swap(id, "t", "USDC", "ETH", Decimal(0)); }) == errors::INVALID_AMOUNT);
        REQUIRE(error_code([&] { ledger.swap(id, "t", "USDC", "ETH", Decimal(60000)); }) == errors::PRICE_IMPACT_EXCEEDED);

        ledger.set_pool_status(id, PoolStatus::EmergencyPaused);
        REQUIRE(error_code([&] { ledger.swap(id, "t", "USDC", "ETH", Decimal(1)); }) == errors::POOL_INACTIVE);
    }

    SECTION("Empty pool cannot trade") {
        PoolId empty = ledger.create_pool("ETH/DAI", {"ETH", "DAI"}, {}, PoolKind::ConstantProduct);
        REQUIRE(error_code([&] { ledger.swap(empty, "t", "DAI", "ETH", Decimal(10)); })
                == errors::INSUFFICIENT_LIQUIDITY);
    }
}

TEST_CASE("Default price impact limit", "[pool][swap]") {
    TokenRegistry tokens;
    test::register_default_tokens(tokens);
    PoolLedger ledger(tokens);
    PoolId id = ledger.create_pool("ETH/USDC", {"ETH", "USDC"}, {}, PoolKind::ConstantProduct);
    ledger.add_liquidity(id, "alice", {{"ETH", Decimal(50)}, {"USDC", Decimal(100000)}});

    // ~9.3% impact against a 5% cap
    REQUIRE(error_code([&] {
        ledger.swap(id, "trader", "USDC", "ETH", Decimal(5000));
    }) == errors::PRICE_IMPACT_EXCEEDED);
    REQUIRE_NOTHROW(ledger.swap(id, "trader", "USDC", "ETH", Decimal(1000)));
}

TEST_CASE("Zero-fee pool keeps k within rounding", "[pool][swap]") {
    TokenRegistry tokens;
    test::register_default_tokens(tokens);
    LiquidityConfig config = wide_impact_config();
    config.protocol_fee_rate = Decimal(0);
    PoolLedger ledger(tokens, config);
    PoolId id = ledger.create_pool("ETH/USDC", {"ETH", "USDC"}, {}, PoolKind::ConstantProduct, Decimal(0));
    ledger.add_liquidity(id, "alice", {{"ETH", Decimal(50)}, {"USDC", Decimal(100000)}});

    Decimal k = amm_math::reserve_product(ledger.get_pool(id)->reserves);
    auto record = ledger.swap(id, "trader", "USDC", "ETH", Decimal(5000));
    REQUIRE(record.fee_paid == 0);
    REQUIRE(record.protocol_fee == 0);
    REQUIRE(d(amm_math::reserve_product(ledger.get_pool(id)->reserves)) == Approx(d(k)));
}

TEST_CASE("Stable swap pool", "[pool][swap]") {
    TokenRegistry tokens;
    test::register_default_tokens(tokens);
    PoolLedger ledger(tokens);
    PoolId id = ledger.create_pool("USDC/DAI", {"USDC", "DAI"}, {}, PoolKind::StableSwap, Decimal("0.0004"));
    ledger.add_liquidity(id, "alice", {{"USDC", Decimal(1000000)}, {"DAI", Decimal(1000000)}});

    auto record = ledger.swap(id, "trader", "USDC", "DAI", Decimal(1000));
    Decimal expected = amm_math::stable_swap_out(Decimal(1000000), Decimal(1000000), Decimal(1000), Decimal("0.0004"));
    REQUIRE(record.amount_out == expected);
    REQUIRE(d(record.amount_out) == Approx(998.6).margin(0.1));

    // 0.05% protocol rate is capped at the 0.04% swap fee
    REQUIRE(d(record.protocol_fee) == Approx(0.4));
    REQUIRE(d(ledger.get_pool(id)->reserves.at("USDC")) == Approx(1000999.6));
}

TEST_CASE("Protocol fees and administration", "[pool]") {
    TokenRegistry tokens;
    test::register_default_tokens(tokens);
    RecordingSink sink;
    EventBus bus;
    bus.subscribe(&sink);
    ManualClock clock;
    PoolLedger ledger(tokens, wide_impact_config(), &bus, clock.clock());
    PoolId id = ledger.create_pool("ETH/USDC", {"ETH", "USDC"}, {}, PoolKind::ConstantProduct);
    ledger.add_liquidity(id, "alice", {{"ETH", Decimal(50)}, {"USDC", Decimal(100000)}});
    ledger.swap(id, "trader", "USDC", "ETH", Decimal(5000));
    ledger.swap(id, "trader", "ETH", "USDC", Decimal(1));

    SECTION("Collect empties the vault") {
        auto collected = ledger.collect_protocol_fees(id);
        REQUIRE(d(collected.at("USDC")) == Approx(2.5));
        REQUIRE(d(collected.at("ETH")) == Approx(0.0005));
        REQUIRE(ledger.collect_protocol_fees(id).empty());
    }

    SECTION("Events describe every mutation") {
        REQUIRE(sink.count(EventType::PoolCreated) == 1);
        REQUIRE(sink.count(EventType::PositionCreated) == 1);
        REQUIRE(sink.count(EventType::SwapExecuted) == 2);
        auto swap_event = sink.events_of(EventType::SwapExecuted).front();
        REQUIRE(swap_event.payload["token_in"] == "USDC");
        REQUIRE(swap_event.payload["amount_in"] == "5000");
    }

    SECTION("Status changes") {
        ledger.set_pool_status(id, PoolStatus::Deprecated);
        REQUIRE(ledger.get_pool(id)->status == PoolStatus::Deprecated);
        ledger.set_pool_status(id, PoolStatus::Active);
        REQUIRE_NOTHROW(ledger.swap(id, "trader", "USDC", "ETH", Decimal(10)));
        REQUIRE(error_code([&] { ledger.set_pool_status(77, PoolStatus::Paused); }) == errors::POOL_NOT_FOUND);
    }

    SECTION("Analytics") {
        auto a = ledger.pool_analytics(id).value();
        REQUIRE(a.total_swaps == 2);
        REQUIRE(a.swaps_24h == 2);
        REQUIRE(a.liquidity_providers == 1);
        REQUIRE(d(a.volume_usd) == Approx(7000.0));
        REQUIRE(d(a.volume_24h_usd) == Approx(7000.0));
        REQUIRE(a.tvl_usd > 0);
        REQUIRE(a.fee_apy_pct > 0);
        REQUIRE(a.volatility >= 0);
        REQUIRE(d(a.swap_fee_pct) == Approx(0.3));

        clock.advance(2 * SECONDS_PER_DAY);
        auto later = ledger.pool_analytics(id).value();
        REQUIRE(later.swaps_24h == 0);
        REQUIRE(later.volume_24h_usd == 0);
        REQUIRE(later.fee_apy_pct == 0);
        REQUIRE_FALSE(ledger.pool_analytics(77).has_value());
    }

    SECTION("Stats") {
        auto stats = ledger.get_stats();
        REQUIRE(stats.total_pools == 1);
        REQUIRE(stats.total_positions == 1);
        REQUIRE(stats.total_swaps == 2);
        REQUIRE(stats.total_liquidity_ops == 1);
    }
}
