#ifndef SPACECHECK_SRC_SPACE_DESTINATION_AGGREGATOR_HPP_
#define SPACECHECK_SRC_SPACE_DESTINATION_AGGREGATOR_HPP_

#include "probe/capacity_probe.hpp"
#include "space/space_verdict.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace SpaceCheck
{
class AsyncProbePool;
}

namespace SpaceCheck::Space
{

namespace fs = std::filesystem;

class DestinationAggregator
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//

    // With a pool, destinations are probed concurrently; otherwise one after another.
    explicit DestinationAggregator(
        const Probe::CapacityProbe& probe, EvaluationPolicy policy = {},
        AsyncProbePool* pool = nullptr
    );
    ~DestinationAggregator() = default;

    DestinationAggregator(const DestinationAggregator&)            = delete;
    DestinationAggregator& operator=(const DestinationAggregator&) = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    // One verdict per destination, in input order
    std::vector<SpaceVerdict> CheckAll(
        const std::vector<fs::path>& destinations, std::int64_t required_bytes
    ) const;

    // CheckAll followed by Decide. Never fails, even if every destination errors.
    AggregateReport EvaluateAll(
        const std::vector<fs::path>& destinations, std::int64_t required_bytes
    ) const;

    const EvaluationPolicy& GetPolicy() const { return policy_; }

    private:
    const Probe::CapacityProbe& probe_;
    EvaluationPolicy policy_;
    AsyncProbePool* pool_;
};

SpaceVerdict CheckDestination(
    const Probe::CapacityProbe& probe, const fs::path& destination, std::int64_t required_bytes,
    const EvaluationPolicy& policy = {}
);

// can_proceed is true iff no verdict carries an error. Messages keep verdict order
// and are prefixed with the destination's short name.
AggregateDecision Decide(const std::vector<SpaceVerdict>& verdicts);

// Last non-empty path component, or the whole path for the root
std::string DestinationShortName(const fs::path& destination);

// "❌ name: error", "⚠️ name: warning" or "✅ name: <available> available"
std::string FormatVerdictLine(const SpaceVerdict& verdict);

}  // namespace SpaceCheck::Space

#endif  // SPACECHECK_SRC_SPACE_DESTINATION_AGGREGATOR_HPP_
