#pragma once

/**
 * nlohmann/json conversions for persisted records.
 *
 * Found by ADL, so `json j = trade;` and `j.get<Trade>()` work directly.
 * Optional fields serialize as null. Doubles round-trip exactly.
 */

#include "../risk/asset_health.hpp"
#include "../trading/milestone.hpp"
#include "../trading/trade.hpp"

#include <nlohmann/json.hpp>

namespace tickguard {

using json = nlohmann::json;

namespace trading {
void to_json(json& j, const Trade& t);
void from_json(const json& j, Trade& t);
void to_json(json& j, const MilestoneRecord& m);
void from_json(const json& j, MilestoneRecord& m);
void to_json(json& j, const PriceSample& s);
void from_json(const json& j, PriceSample& s);
} // namespace trading

namespace risk {
void to_json(json& j, const AssetKey& k);
void from_json(const json& j, AssetKey& k);
void to_json(json& j, const HealthMetrics& m);
void from_json(const json& j, HealthMetrics& m);
void to_json(json& j, const AssetHealthRecord& r);
void from_json(const json& j, AssetHealthRecord& r);
} // namespace risk

} // namespace tickguard
