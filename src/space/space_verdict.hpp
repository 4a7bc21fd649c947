#ifndef SPACECHECK_SRC_SPACE_SPACE_VERDICT_HPP_
#define SPACECHECK_SRC_SPACE_SPACE_VERDICT_HPP_

#include "app_constants.hpp"
#include "probe/capacity_info.hpp"
#include "util/byte_format.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace SpaceCheck::Space
{

struct EvaluationPolicy {
    std::int64_t safety_buffer_bytes  = Constants::DEFAULT_SAFETY_BUFFER_BYTES;
    double low_free_threshold_percent = Constants::DEFAULT_LOW_FREE_THRESHOLD_PERCENT;

    bool IsValid() const
    {
        return safety_buffer_bytes >= 0 && low_free_threshold_percent > 0.0 &&
               low_free_threshold_percent <= 100.0;
    }
};

struct SpaceVerdict {
    std::filesystem::path destination;
    Probe::CapacityInfo capacity;  ///< Zero-valued when probing failed
    std::int64_t required_bytes       = 0;
    std::int64_t total_required_bytes = 0;  ///< required_bytes plus the safety buffer
    double percent_free_after_copy    = 0.0;
    bool sufficient                   = false;
    bool low_free_after_copy          = false;
    std::optional<std::string> warning_message;
    std::optional<std::string> error_message;

    bool BlocksCopy() const { return !sufficient || error_message.has_value(); }
    std::string FormattedRequired() const { return Util::FormatBytes(required_bytes); }

    bool operator==(const SpaceVerdict &) const = default;
};

struct AggregateDecision {
    bool can_proceed = true;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    bool operator==(const AggregateDecision &) const = default;
};

// Everything a caller needs to decide whether to start the copy
struct AggregateReport {
    std::vector<SpaceVerdict> verdicts;  ///< In destination input order
    AggregateDecision decision;
};

}  // namespace SpaceCheck::Space

#endif  // SPACECHECK_SRC_SPACE_SPACE_VERDICT_HPP_
