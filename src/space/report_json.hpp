#ifndef SPACECHECK_SRC_SPACE_REPORT_JSON_HPP_
#define SPACECHECK_SRC_SPACE_REPORT_JSON_HPP_

#include "probe/capacity_info.hpp"
#include "space/space_verdict.hpp"

#include <nlohmann/json.hpp>

namespace SpaceCheck::Space
{

nlohmann::json CapacityToJson(const Probe::CapacityInfo& capacity);
nlohmann::json VerdictToJson(const SpaceVerdict& verdict);
nlohmann::json DecisionToJson(const AggregateDecision& decision);

// {"can_proceed": ..., "warnings": [...], "errors": [...], "destinations": [...]}
nlohmann::json ReportToJson(const AggregateReport& report);

}  // namespace SpaceCheck::Space

#endif  // SPACECHECK_SRC_SPACE_REPORT_JSON_HPP_
