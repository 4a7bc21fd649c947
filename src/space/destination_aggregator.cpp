#include "space/destination_aggregator.hpp"

#include "async_probe_pool.hpp"
#include "space/space_evaluator.hpp"

#include <spdlog/spdlog.h>

#include <future>
#include <optional>
#include <stdexcept>
#include <utility>

namespace SpaceCheck::Space
{

DestinationAggregator::DestinationAggregator(
    const Probe::CapacityProbe& probe, EvaluationPolicy policy, AsyncProbePool* pool
)
    : probe_(probe), policy_(policy), pool_(pool)
{
}

std::vector<SpaceVerdict> DestinationAggregator::CheckAll(
    const std::vector<fs::path>& destinations, std::int64_t required_bytes
) const
{
    std::vector<SpaceVerdict> verdicts;
    verdicts.reserve(destinations.size());

    if (pool_ == nullptr || destinations.size() < 2) {
        for (const auto& destination : destinations) {
            verdicts.push_back(CheckDestination(probe_, destination, required_bytes, policy_));
        }
        return verdicts;
    }

    // Futures are kept in input order, so completion order does not matter
    std::vector<std::optional<std::future<SpaceVerdict>>> pending;
    pending.reserve(destinations.size());
    for (const auto& destination : destinations) {
        try {
            pending.emplace_back(pool_->SubmitCheck(probe_, destination, required_bytes, policy_));
        } catch (const std::runtime_error& e) {
            spdlog::warn("Probing {} inline: {}", destination.string(), e.what());
            pending.emplace_back(std::nullopt);
        }
    }

    for (size_t i = 0; i < destinations.size(); ++i) {
        if (pending[i].has_value()) {
            verdicts.push_back(pending[i]->get());
        } else {
            verdicts.push_back(CheckDestination(probe_, destinations[i], required_bytes, policy_));
        }
    }
    return verdicts;
}

AggregateReport DestinationAggregator::EvaluateAll(
    const std::vector<fs::path>& destinations, std::int64_t required_bytes
) const
{
    AggregateReport report;
    report.verdicts = CheckAll(destinations, required_bytes);
    report.decision = Decide(report.verdicts);

    spdlog::info(
        "Space check over {} destination(s): {} ({} warning(s), {} error(s))",
        destinations.size(), report.decision.can_proceed ? "proceed" : "blocked",
        report.decision.warnings.size(), report.decision.errors.size()
    );
    return report;
}

SpaceVerdict CheckDestination(
    const Probe::CapacityProbe& probe, const fs::path& destination, std::int64_t required_bytes,
    const EvaluationPolicy& policy
)
{
    return Evaluate(destination, probe.Probe(destination), required_bytes, policy);
}

AggregateDecision Decide(const std::vector<SpaceVerdict>& verdicts)
{
    AggregateDecision decision;
    for (const auto& verdict : verdicts) {
        const std::string name = DestinationShortName(verdict.destination);
        if (verdict.error_message.has_value()) {
            decision.errors.push_back(name + ": " + *verdict.error_message);
        }
        if (verdict.warning_message.has_value()) {
            decision.warnings.push_back(name + ": " + *verdict.warning_message);
        }
    }
    decision.can_proceed = decision.errors.empty();
    return decision;
}

std::string DestinationShortName(const fs::path& destination)
{
    fs::path name = destination.filename();
    if (name.empty()) {
        name = destination.parent_path().filename();
    }
    if (name.empty()) {
        return destination.string();
    }
    return name.string();
}

std::string FormatVerdictLine(const SpaceVerdict& verdict)
{
    const std::string name = DestinationShortName(verdict.destination);

    if (verdict.error_message.has_value()) {
        return "❌ " + name + ": " + *verdict.error_message;
    }
    if (verdict.warning_message.has_value()) {
        return "⚠️ " + name + ": " + *verdict.warning_message;
    }
    return "✅ " + name + ": " + verdict.capacity.FormattedAvailable() + " available";
}

}  // namespace SpaceCheck::Space
