#ifndef YIELD_SERIALIZATION_HPP
#define YIELD_SERIALIZATION_HPP

#include <nlohmann/json.hpp>

#include "pool.hpp"
#include "stake.hpp"
#include "token_registry.hpp"
#include "types.hpp"

// Decimals travel as strings so no precision is lost in transit
namespace nlohmann {
template <>
struct adl_serializer<yield::Decimal> {
    static void to_json(json& j, const yield::Decimal& value) {
        j = yield::decimal::to_string(value);
    }

    static void from_json(const json& j, yield::Decimal& value) {
        value = j.is_string() ? yield::decimal::from_string(j.get<std::string>())
                              : yield::decimal::from_string(j.dump());
    }
};
} // namespace nlohmann

namespace yield {

void to_json(nlohmann::json& j, const Token& token);
void to_json(nlohmann::json& j, const Pool& pool);
void to_json(nlohmann::json& j, const LiquidityPosition& position);
void to_json(nlohmann::json& j, const SwapRecord& record);
void to_json(nlohmann::json& j, const StakingPool& pool);
void to_json(nlohmann::json& j, const StakePosition& position);
void to_json(nlohmann::json& j, const UnstakeResult& result);
void to_json(nlohmann::json& j, const ValidatorNode& validator);
void to_json(nlohmann::json& j, const SlashEvent& event);

} // namespace yield

#endif // YIELD_SERIALIZATION_HPP
