#include "space/space_evaluator.hpp"

#include "util/byte_format.hpp"

#include <spdlog/fmt/fmt.h>

namespace SpaceCheck::Space
{

namespace
{
constexpr const char* kUnknownSpaceMessage = "Unable to determine available disk space";
}  // namespace

SpaceVerdict Evaluate(
    const std::filesystem::path& destination,
    const Probe::ProbeResult<Probe::CapacityInfo>& capacity, std::int64_t required_bytes,
    const EvaluationPolicy& policy
)
{
    SpaceVerdict verdict;
    verdict.destination          = destination;
    verdict.required_bytes       = required_bytes;
    verdict.total_required_bytes = Util::SaturatingAdd(required_bytes, policy.safety_buffer_bytes);

    if (!capacity) {
        // Unknown space is treated as dangerous
        verdict.sufficient          = false;
        verdict.low_free_after_copy = true;
        verdict.error_message       = kUnknownSpaceMessage;
        return verdict;
    }

    const Probe::CapacityInfo& info = *capacity;
    verdict.capacity                = info;
    verdict.sufficient              = info.available_bytes >= verdict.total_required_bytes;

    // Not clamped: a copy larger than the free space gives a negative percentage
    const std::int64_t space_after_copy = info.free_bytes - required_bytes;
    if (info.total_bytes > 0) {
        verdict.percent_free_after_copy = static_cast<double>(space_after_copy) /
                                          static_cast<double>(info.total_bytes) * 100.0;
    }
    verdict.low_free_after_copy =
        verdict.percent_free_after_copy < policy.low_free_threshold_percent;

    if (!verdict.sufficient) {
        verdict.error_message = fmt::format(
            "Insufficient space: Need {} but only {} available",
            Util::FormatBytes(verdict.total_required_bytes), info.FormattedAvailable()
        );
    } else if (verdict.low_free_after_copy) {
        verdict.warning_message = fmt::format(
            "Low disk space warning: After backup, only {:.1f}% will remain free",
            verdict.percent_free_after_copy
        );
    }
    return verdict;
}

}  // namespace SpaceCheck::Space
