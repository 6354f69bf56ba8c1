// Yield Ledger - Staking Ledger Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <yield/staking_ledger.hpp>

#include "test_support.hpp"

using namespace yield;
using Catch::Approx;
using yield::test::d;
using yield::test::ManualClock;

namespace {

struct StakingFixture {
    TokenRegistry tokens;
    ManualClock clock;
    RecordingSink sink;
    EventBus bus;
    std::unique_ptr<ValidatorRegistry> validators;
    std::unique_ptr<StakingLedger> ledger;

    StakingFixture() {
        test::register_default_tokens(tokens);
        bus.subscribe(&sink);
        validators = std::make_unique<ValidatorRegistry>(StakingConfig{}, &bus, clock.clock());
        ledger = std::make_unique<StakingLedger>(tokens, *validators, StakingConfig{}, &bus, clock.clock());
    }

    int32_t error_of(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const LedgerError& e) {
            return e.code();
        }
        return errors::OK;
    }
};

Decimal total(const TokenAmounts& amounts) {
    Decimal sum(0);
    for (const auto& [token, amount] : amounts) sum += amount;
    return sum;
}

} // namespace

TEST_CASE("Staking pool creation", "[staking]") {
    StakingFixture f;

    SECTION("Defaults from config") {
        auto id = f.ledger->create_staking_pool("Flex", "STAKE", {"REWARD"}, StakeKind::Flexible, Decimal("0.08"));
        auto pool = f.ledger->get_staking_pool(id).value();
        REQUIRE(pool.min_stake == 10);
        REQUIRE(pool.max_stake == 10000000);
        REQUIRE(pool.active);
        REQUIRE(pool.total_staked == 0);
    }

    SECTION("Invalid pools") {
        REQUIRE(f.error_of([&] {
            f.ledger->create_staking_pool("x", "BTC", {"REWARD"}, StakeKind::Flexible, Decimal("0.1"));
        }) == errors::INVALID_TOKEN);
        REQUIRE(f.error_of([&] {
            f.ledger->create_staking_pool("x", "STAKE", {}, StakeKind::Flexible, Decimal("0.1"));
        }) == errors::INVALID_TOKEN);
        REQUIRE(f.error_of([&] {
            f.ledger->create_staking_pool("x", "STAKE", {"BTC"}, StakeKind::Flexible, Decimal("0.1"));
        }) == errors::INVALID_TOKEN);
        REQUIRE(f.error_of([&] {
            f.ledger->create_staking_pool("x", "STAKE", {"REWARD"}, StakeKind::Flexible, Decimal("-0.1"));
        }) == errors::INVALID_AMOUNT);
        REQUIRE(f.error_of([&] {
            f.ledger->create_staking_pool("x", "STAKE", {"REWARD"}, StakeKind::Flexible, Decimal("0.1"), 0,
                                          Decimal(100), Decimal(50));
        }) == errors::INVALID_AMOUNT);
    }
}

TEST_CASE("Stake multipliers and locks", "[staking]") {
    StakingFixture f;

    SECTION("Flexible") {
        auto pool = f.ledger->create_staking_pool("Flex", "STAKE", {"REWARD"}, StakeKind::Flexible, Decimal("0.08"));
        auto position = f.ledger->stake(pool, "alice", Decimal(1000));
        REQUIRE(position.multiplier == Decimal(1));
        REQUIRE_FALSE(position.unlock_time.has_value());
        REQUIRE(position.status == StakeStatus::Active);
        REQUIRE(position.last_claim_time == test::START_TIME);
        REQUIRE(position.governance_power == 0);
        REQUIRE(f.ledger->get_staking_pool(pool)->total_staked == 1000);
    }

    SECTION("Fixed term uses the pool lock period") {
        auto pool = f.ledger->create_staking_pool("Fixed", "STAKE", {"REWARD"}, StakeKind::FixedTerm,
                                                  Decimal("0.12"), 90);
        auto position = f.ledger->stake(pool, "alice", Decimal(1000));
        REQUIRE(d(position.multiplier) == Approx(1.5 * 1.3));
        REQUIRE(position.unlock_time.value() == test::START_TIME + 90 * SECONDS_PER_DAY);
    }

    SECTION("Explicit lock on a flexible pool") {
        auto pool = f.ledger->create_staking_pool("Flex", "STAKE", {"REWARD"}, StakeKind::Flexible, Decimal("0.08"));
        auto position = f.ledger->stake(pool, "alice", Decimal(1000), 365);
        REQUIRE(d(position.multiplier) == Approx(2.0));
        REQUIRE(position.unlock_time.value() == test::START_TIME + 365 * SECONDS_PER_DAY);
    }

    SECTION("Unlisted lock length gets no bonus") {
        auto pool = f.ledger->create_staking_pool("Farm", "STAKE", {"REWARD"}, StakeKind::YieldFarming, Decimal("0.2"));
        auto position = f.ledger->stake(pool, "alice", Decimal(1000), 45);
        REQUIRE(d(position.multiplier) == Approx(2.5));
    }

    SECTION("Governance stake carries voting power") {
        auto pool = f.ledger->create_staking_pool("Gov", "STAKE", {"REWARD"}, StakeKind::Governance, Decimal("0.05"));
        auto position = f.ledger->stake(pool, "alice", Decimal(1000));
        REQUIRE(d(position.governance_power) == Approx(1200.0));
    }

    SECTION("Pool lock period alone earns no bonus on an unlocked kind") {
        auto pool = f.ledger->create_staking_pool("Gov", "STAKE", {"REWARD"}, StakeKind::Governance,
                                                  Decimal("0.05"), 30);
        auto position = f.ledger->stake(pool, "alice", Decimal(1000));
        REQUIRE(d(position.multiplier) == Approx(1.2));
        REQUIRE(d(position.governance_power) == Approx(1200.0));
        REQUIRE_FALSE(position.unlock_time.has_value());

        auto locked = f.ledger->stake(pool, "bob", Decimal(1000), 30);
        REQUIRE(d(locked.multiplier) == Approx(1.2 * 1.1));
        REQUIRE(locked.unlock_time.value() == test::START_TIME + 30 * SECONDS_PER_DAY);
    }

    SECTION("Bounds and status") {
        auto pool = f.ledger->create_staking_pool("Flex", "STAKE", {"REWARD"}, StakeKind::Flexible, Decimal("0.08"),
                                                  0, Decimal(10), Decimal(5000));
        REQUIRE(f.error_of([&] { f.ledger->stake(pool, "alice", Decimal(5)); }) == errors::STAKE_OUT_OF_BOUNDS);
        REQUIRE(f.error_of([&] { f.ledger->stake(pool, "alice", Decimal(5001)); }) == errors::STAKE_OUT_OF_BOUNDS);
        REQUIRE(f.error_of([&] { f.ledger->stake(pool, "alice", Decimal(0)); }) == errors::INVALID_AMOUNT);
        REQUIRE(f.error_of([&] { f.ledger->stake(99, "alice", Decimal(100)); }) == errors::POOL_NOT_FOUND);

        f.ledger->set_staking_pool_active(pool, false);
        REQUIRE(f.error_of([&] { f.ledger->stake(pool, "alice", Decimal(100)); }) == errors::POOL_INACTIVE);
        REQUIRE(f.ledger->get_staking_pool(pool)->total_staked == 0);
    }
}

TEST_CASE("Reward accrual", "[staking][rewards]") {
    StakingFixture f;
    auto pool = f.ledger->create_staking_pool("Flex", "STAKE", {"REWARD"}, StakeKind::Flexible, Decimal("0.08"));
    auto position = f.ledger->stake(pool, "alice", Decimal(1000));

    SECTION("One day at 8% on 1000") {
        f.clock.advance(SECONDS_PER_DAY);
        REQUIRE(d(f.ledger->pending_rewards(position.id).at("REWARD")) == Approx(0.219178).margin(1e-6));

        auto rewards = f.ledger->claim_rewards(position.id);
        REQUIRE(d(rewards.at("REWARD")) == Approx(0.219178).margin(1e-6));

        auto after = f.ledger->get_stake(position.id).value();
        REQUIRE(after.accrued_rewards.at("REWARD") == rewards.at("REWARD"));
        REQUIRE(after.last_claim_time == test::START_TIME + SECONDS_PER_DAY);
        REQUIRE(f.ledger->get_staking_pool(pool)->total_rewards_distributed == rewards.at("REWARD"));
        REQUIRE(f.sink.count(EventType::RewardClaimed) == 1);
    }

    SECTION("Claiming twice without time passing yields nothing") {
        f.clock.advance(3600);
        f.ledger->claim_rewards(position.id);
        REQUIRE(total(f.ledger->claim_rewards(position.id)) == 0);
        REQUIRE(total(f.ledger->pending_rewards(position.id)) == 0);
    }

    SECTION("Split across reward tokens") {
        auto multi = f.ledger->create_staking_pool("Dual", "STAKE", {"REWARD", "NATIVE"}, StakeKind::LiquidityMining,
                                                   Decimal("0.1"));
        auto lm = f.ledger->stake(multi, "bob", Decimal(1000));
        f.clock.advance(SECONDS_PER_YEAR);
        auto rewards = f.ledger->claim_rewards(lm.id);
        // 1000 * 0.1 * 2.0 over two tokens
        REQUIRE(d(rewards.at("REWARD")) == Approx(100.0));
        REQUIRE(d(rewards.at("NATIVE")) == Approx(100.0));
    }

    SECTION("Unknown and inactive stakes") {
        REQUIRE(f.error_of([&] { f.ledger->claim_rewards(12345); }) == errors::STAKE_NOT_FOUND);
        f.ledger->unstake(position.id);
        REQUIRE(f.error_of([&] { f.ledger->claim_rewards(position.id); }) == errors::STAKE_NOT_ACTIVE);
    }
}

TEST_CASE("Unstaking", "[staking]") {
    StakingFixture f;
    auto flex_pool = f.ledger->create_staking_pool("Flex", "STAKE", {"REWARD"}, StakeKind::Flexible, Decimal("0.08"));
    auto fixed_pool = f.ledger->create_staking_pool("Fixed", "STAKE", {"REWARD"}, StakeKind::FixedTerm,
                                                    Decimal("0.12"), 30);

    SECTION("Partial flexible stays active") {
        auto position = f.ledger->stake(flex_pool, "alice", Decimal(1000));
        f.clock.advance(SECONDS_PER_DAY);
        auto result = f.ledger->unstake(position.id, Decimal(400));

        REQUIRE(result.withdrawn_amount == 400);
        REQUIRE(result.penalty == 0);
        REQUIRE(result.final_amount == 400);
        REQUIRE(result.status == StakeStatus::Active);
        REQUIRE(d(result.settled_rewards.at("REWARD")) == Approx(0.219178).margin(1e-6));

        auto after = f.ledger->get_stake(position.id).value();
        REQUIRE(after.amount == 600);
        REQUIRE(after.last_claim_time == f.clock.now());
        REQUIRE(f.ledger->get_staking_pool(flex_pool)->total_staked == 600);
    }

    SECTION("Full unstake withdraws") {
        auto position = f.ledger->stake(flex_pool, "alice", Decimal(1000));
        auto result = f.ledger->unstake(position.id);
        REQUIRE(result.withdrawn_amount == 1000);
        REQUIRE(result.status == StakeStatus::Withdrawn);
        REQUIRE(f.error_of([&] { f.ledger->unstake(position.id); }) == errors::STAKE_NOT_ACTIVE);
    }

    SECTION("Early fixed-term exit pays the penalty") {
        auto position = f.ledger->stake(fixed_pool, "alice", Decimal(1000));
        f.clock.advance(10 * SECONDS_PER_DAY);
        auto result = f.ledger->unstake(position.id);
        REQUIRE(result.early_withdrawal);
        REQUIRE(d(result.penalty) == Approx(20.0));
        REQUIRE(d(result.final_amount) == Approx(980.0));
        REQUIRE(d(f.ledger->get_stake(position.id)->penalty_applied) == Approx(20.0));
    }

    SECTION("Fixed-term exit after unlock is free") {
        auto position = f.ledger->stake(fixed_pool, "alice", Decimal(1000));
        f.clock.advance(31 * SECONDS_PER_DAY);
        auto result = f.ledger->unstake(position.id);
        REQUIRE_FALSE(result.early_withdrawal);
        REQUIRE(result.penalty == 0);
    }

    SECTION("Partial fixed-term exit starts unbonding") {
        auto position = f.ledger->stake(fixed_pool, "alice", Decimal(1000));
        f.clock.advance(31 * SECONDS_PER_DAY);
        auto result = f.ledger->unstake(position.id, Decimal(300));
        REQUIRE(result.status == StakeStatus::Unbonding);
        REQUIRE(f.error_of([&] { f.ledger->claim_rewards(position.id); }) == errors::STAKE_NOT_ACTIVE);

        auto rest = f.ledger->unstake(position.id);
        REQUIRE(rest.withdrawn_amount == 700);
        REQUIRE(rest.settled_rewards.empty());
        REQUIRE(rest.status == StakeStatus::Withdrawn);
    }

    SECTION("Over-withdrawal rejected without mutation") {
        auto position = f.ledger->stake(flex_pool, "alice", Decimal(1000));
        REQUIRE(f.error_of([&] { f.ledger->unstake(position.id, Decimal(1001)); }) == errors::EXCEEDS_STAKED);
        REQUIRE(f.error_of([&] { f.ledger->unstake(position.id, Decimal(0)); }) == errors::INVALID_AMOUNT);
        REQUIRE(f.error_of([&] { f.ledger->unstake(777); }) == errors::STAKE_NOT_FOUND);
        REQUIRE(f.ledger->get_stake(position.id)->amount == 1000);
        REQUIRE(f.sink.count(EventType::Unstaked) == 0);
    }

    SECTION("Governance power follows the remaining stake") {
        auto gov = f.ledger->create_staking_pool("Gov", "STAKE", {"REWARD"}, StakeKind::Governance, Decimal("0.05"));
        auto position = f.ledger->stake(gov, "alice", Decimal(1000));
        f.ledger->unstake(position.id, Decimal(500));
        auto after = f.ledger->get_stake(position.id).value();
        REQUIRE(after.status == StakeStatus::Unbonding);
        REQUIRE(d(after.governance_power) == Approx(600.0));
    }
}

TEST_CASE("Staking analytics and listings", "[staking]") {
    StakingFixture f;
    auto pool = f.ledger->create_staking_pool("Flex", "STAKE", {"REWARD"}, StakeKind::Flexible, Decimal("0.08"));
    auto locked = f.ledger->create_staking_pool("Fixed", "STAKE", {"REWARD"}, StakeKind::FixedTerm,
                                                Decimal("0.12"), 365);
    f.ledger->stake(pool, "alice", Decimal(100));
    f.ledger->stake(pool, "alice", Decimal(300), 90);
    auto bob = f.ledger->stake(pool, "bob", Decimal(200));
    f.ledger->stake(locked, "alice", Decimal(50));
    f.ledger->unstake(bob.id);

    auto a = f.ledger->staking_pool_analytics(pool).value();
    REQUIRE(a.total_staked == 400);
    REQUIRE(a.active_positions == 2);
    REQUIRE(a.total_positions == 3);
    REQUIRE(d(a.average_multiplier) == Approx((1.0 + 1.3) / 2));
    REQUIRE(d(a.apy_pct) == Approx(8.0));
    REQUIRE_FALSE(f.ledger->staking_pool_analytics(99).has_value());

    auto mine = f.ledger->positions_of("alice");
    REQUIRE(mine.size() == 3);
    REQUIRE(mine[2].pool_id == locked);
    REQUIRE(f.ledger->positions_of("carol").empty());

    auto stats = f.ledger->get_stats();
    REQUIRE(stats.total_staking_pools == 2);
    REQUIRE(stats.total_stakes == 4);
    REQUIRE(stats.total_delegations == 0);
    REQUIRE(f.ledger->staking_pool_ids().size() == 2);
}
