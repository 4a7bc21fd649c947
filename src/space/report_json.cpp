#include "space/report_json.hpp"

#include "space/destination_aggregator.hpp"

namespace SpaceCheck::Space
{

nlohmann::json CapacityToJson(const Probe::CapacityInfo& capacity)
{
    nlohmann::json j;
    j["total_bytes"]         = capacity.total_bytes;
    j["free_bytes"]          = capacity.free_bytes;
    j["available_bytes"]     = capacity.available_bytes;
    j["percent_free"]        = capacity.percent_free;
    j["percent_available"]   = capacity.percent_available;
    j["formatted_available"] = capacity.FormattedAvailable();
    j["free_space_level"] = Probe::FreeSpaceLevelToString(Probe::ClassifyFreeSpace(capacity));
    j["source"]           = Probe::CapacitySourceToString(capacity.source);
    j["is_network_mount"] = capacity.is_network_mount;
    if (!capacity.filesystem_type.empty()) {
        j["filesystem_type"] = capacity.filesystem_type;
    }
    return j;
}

nlohmann::json VerdictToJson(const SpaceVerdict& verdict)
{
    nlohmann::json j = {
        {            "destination",          verdict.destination.string()},
        {                   "name", DestinationShortName(verdict.destination)},
        {               "capacity",        CapacityToJson(verdict.capacity)},
        {         "required_bytes",                verdict.required_bytes},
        {   "total_required_bytes",          verdict.total_required_bytes},
        {"percent_free_after_copy",       verdict.percent_free_after_copy},
        {             "sufficient",                    verdict.sufficient},
        {    "low_free_after_copy",           verdict.low_free_after_copy},
        {            "blocks_copy",                  verdict.BlocksCopy()}
    };
    if (verdict.warning_message.has_value()) {
        j["warning"] = *verdict.warning_message;
    }
    if (verdict.error_message.has_value()) {
        j["error"] = *verdict.error_message;
    }
    return j;
}

nlohmann::json DecisionToJson(const AggregateDecision& decision)
{
    return {
        {"can_proceed", decision.can_proceed},
        {   "warnings",    decision.warnings},
        {     "errors",      decision.errors}
    };
}

nlohmann::json ReportToJson(const AggregateReport& report)
{
    nlohmann::json j = DecisionToJson(report.decision);
    j["destinations"] = nlohmann::json::array();
    for (const auto& verdict : report.verdicts) {
        j["destinations"].push_back(VerdictToJson(verdict));
    }
    return j;
}

}  // namespace SpaceCheck::Space
