#ifndef SPACECHECK_SRC_SPACE_SPACE_EVALUATOR_HPP_
#define SPACECHECK_SRC_SPACE_SPACE_EVALUATOR_HPP_

#include "probe/capacity_info.hpp"
#include "probe/probe_error.hpp"
#include "space/space_verdict.hpp"

#include <cstdint>
#include <filesystem>

namespace SpaceCheck::Space
{

/**
 * Classifies one destination from its probe result.
 *
 * - sufficient          : available >= required + safety buffer
 * - low_free_after_copy : (free - required) / total * 100 < threshold
 * - error_message       : probe failed, or space insufficient
 * - warning_message     : sufficient, but low free space after the copy
 *
 * A failed probe yields sufficient = false and low_free_after_copy = true.
 * Pure: no I/O, identical inputs give identical verdicts.
 */
SpaceVerdict Evaluate(
    const std::filesystem::path& destination,
    const Probe::ProbeResult<Probe::CapacityInfo>& capacity, std::int64_t required_bytes,
    const EvaluationPolicy& policy = {}
);

}  // namespace SpaceCheck::Space

#endif  // SPACECHECK_SRC_SPACE_SPACE_EVALUATOR_HPP_
