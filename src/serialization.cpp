// =============================================================================
// serialization.cpp - JSON views of ledger records (event payloads)
// =============================================================================

#include "yield/serialization.hpp"

namespace yield {

using nlohmann::json;

void to_json(json& j, const Token& token) {
    j = json{
        {"address", token.address},
        {"symbol", token.symbol},
        {"name", token.name},
        {"decimals", token.decimals},
        {"total_supply", token.total_supply},
        {"price_usd", token.price_usd}
    };
}

void to_json(json& j, const Pool& pool) {
    j = json{
        {"id", pool.id},
        {"name", pool.name},
        {"kind", to_string(pool.kind)},
        {"status", to_string(pool.status)},
        {"tokens", pool.tokens},
        {"reserves", pool.reserves},
        {"lp_supply", pool.lp_supply},
        {"swap_fee_rate", pool.swap_fee_rate},
        {"volume_usd", pool.volume_usd},
        {"fees_collected_usd", pool.fees_collected_usd},
        {"protocol_fees", pool.protocol_fees},
        {"created_at", pool.created_at},
        {"updated_at", pool.updated_at}
    };
}

void to_json(json& j, const LiquidityPosition& position) {
    j = json{
        {"id", position.id},
        {"provider", position.provider},
        {"pool_id", position.pool_id},
        {"token_amounts", position.token_amounts},
        {"lp_amount", position.lp_amount},
        {"entry_time", position.entry_time},
        {"fees_earned", position.fees_earned},
        {"impermanent_loss_pct", position.impermanent_loss_pct},
        {"open", position.open}
    };
    if (!position.open) j["closed_at"] = position.closed_at;
}

void to_json(json& j, const SwapRecord& record) {
    j = json{
        {"id", record.id},
        {"pool_id", record.pool_id},
        {"trader", record.trader},
        {"token_in", record.token_in},
        {"token_out", record.token_out},
        {"amount_in", record.amount_in},
        {"amount_out", record.amount_out},
        {"price_impact_pct", record.price_impact_pct},
        {"fee_paid", record.fee_paid},
        {"protocol_fee", record.protocol_fee},
        {"slippage_pct", record.slippage_pct},
        {"timestamp", record.timestamp}
    };
}

void to_json(json& j, const StakingPool& pool) {
    j = json{
        {"id", pool.id},
        {"name", pool.name},
        {"staking_token", pool.staking_token},
        {"reward_tokens", pool.reward_tokens},
        {"kind", to_string(pool.kind)},
        {"apy", pool.apy},
        {"lock_period_days", pool.lock_period_days},
        {"min_stake", pool.min_stake},
        {"max_stake", pool.max_stake},
        {"active", pool.active},
        {"total_staked", pool.total_staked},
        {"total_rewards_distributed", pool.total_rewards_distributed},
        {"created_at", pool.created_at},
        {"updated_at", pool.updated_at}
    };
}

void to_json(json& j, const StakePosition& position) {
    j = json{
        {"id", position.id},
        {"owner", position.owner},
        {"pool_id", position.pool_id},
        {"amount", position.amount},
        {"kind", to_string(position.kind)},
        {"status", to_string(position.status)},
        {"multiplier", position.multiplier},
        {"stake_time", position.stake_time},
        {"unlock_time", nullptr},
        {"last_claim_time", position.last_claim_time},
        {"accrued_rewards", position.accrued_rewards},
        {"penalty_applied", position.penalty_applied},
        {"governance_power", position.governance_power}
    };
    if (position.unlock_time) j["unlock_time"] = *position.unlock_time;
}

void to_json(json& j, const UnstakeResult& result) {
    j = json{
        {"stake_id", result.stake_id},
        {"withdrawn_amount", result.withdrawn_amount},
        {"penalty", result.penalty},
        {"final_amount", result.final_amount},
        {"settled_rewards", result.settled_rewards},
        {"early_withdrawal", result.early_withdrawal},
        {"status", to_string(result.status)},
        {"timestamp", result.timestamp}
    };
}

void to_json(json& j, const ValidatorNode& validator) {
    j = json{
        {"id", validator.id},
        {"operator", validator.operator_address},
        {"self_stake", validator.self_stake},
        {"commission_rate", validator.commission_rate},
        {"performance_score", validator.performance_score},
        {"slash_count", validator.slash_count},
        {"delegated_stake", validator.delegated_stake},
        {"status", to_string(validator.status)},
        {"created_at", validator.created_at},
        {"updated_at", validator.updated_at}
    };
}

void to_json(json& j, const SlashEvent& event) {
    j = json{
        {"validator_id", event.validator_id},
        {"penalty_pct", event.penalty_pct},
        {"validator_penalty", event.validator_penalty},
        {"delegator_penalty", event.delegator_penalty},
        {"affected_delegations", event.affected_delegations},
        {"reason", event.reason},
        {"timestamp", event.timestamp}
    };
}

} // namespace yield
