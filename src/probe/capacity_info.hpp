#ifndef SPACECHECK_SRC_PROBE_CAPACITY_INFO_HPP_
#define SPACECHECK_SRC_PROBE_CAPACITY_INFO_HPP_

#include "app_constants.hpp"
#include "util/byte_format.hpp"

#include <cstdint>
#include <string>

namespace SpaceCheck::Probe
{

// Which strategy of the probe chain produced a CapacityInfo
enum class CapacitySource : std::uint8_t { None, LowLevelStatistics, VolumeResources, FilesystemAttributes };

const char *CapacitySourceToString(CapacitySource source);

enum class FreeSpaceLevel : std::uint8_t { Healthy, Moderate, Critical };

const char *FreeSpaceLevelToString(FreeSpaceLevel level);

struct CapacityInfo {
    std::int64_t total_bytes     = 0;
    std::int64_t free_bytes      = 0;  ///< Includes blocks reserved for privileged processes
    std::int64_t available_bytes = 0;  ///< Usable by this (unprivileged) process
    double percent_free          = 0.0;
    double percent_available     = 0.0;

    CapacitySource source = CapacitySource::None;
    std::string filesystem_type;  ///< Empty when unknown
    bool is_network_mount = false;

    std::string FormattedTotal() const { return Util::FormatBytes(total_bytes); }
    std::string FormattedFree() const { return Util::FormatBytes(free_bytes); }
    std::string FormattedAvailable() const { return Util::FormatBytes(available_bytes); }

    bool operator==(const CapacityInfo &) const = default;
};

// Builds a CapacityInfo with the derived percentages. Percentages are 0 when total is 0.
inline CapacityInfo MakeCapacityInfo(
    std::int64_t total_bytes, std::int64_t free_bytes, std::int64_t available_bytes
)
{
    CapacityInfo info;
    info.total_bytes     = total_bytes;
    info.free_bytes      = free_bytes;
    info.available_bytes = available_bytes;
    if (total_bytes > 0) {
        info.percent_free =
            static_cast<double>(free_bytes) / static_cast<double>(total_bytes) * 100.0;
        info.percent_available =
            static_cast<double>(available_bytes) / static_cast<double>(total_bytes) * 100.0;
    }
    return info;
}

inline FreeSpaceLevel ClassifyFreeSpace(const CapacityInfo &info)
{
    if (info.total_bytes <= 0) {
        return FreeSpaceLevel::Critical;
    }
    if (info.percent_free > Constants::HEALTHY_FREE_PERCENT) {
        return FreeSpaceLevel::Healthy;
    }
    if (info.percent_free > Constants::MODERATE_FREE_PERCENT) {
        return FreeSpaceLevel::Moderate;
    }
    return FreeSpaceLevel::Critical;
}

inline const char *CapacitySourceToString(CapacitySource source)
{
    switch (source) {
        case CapacitySource::None:
            return "none";
        case CapacitySource::LowLevelStatistics:
            return "low_level_statistics";
        case CapacitySource::VolumeResources:
            return "volume_resources";
        case CapacitySource::FilesystemAttributes:
            return "filesystem_attributes";
        default:
            return "unknown";
    }
}

inline const char *FreeSpaceLevelToString(FreeSpaceLevel level)
{
    switch (level) {
        case FreeSpaceLevel::Healthy:
            return "healthy";
        case FreeSpaceLevel::Moderate:
            return "moderate";
        case FreeSpaceLevel::Critical:
            return "critical";
        default:
            return "unknown";
    }
}

}  // namespace SpaceCheck::Probe

#endif  // SPACECHECK_SRC_PROBE_CAPACITY_INFO_HPP_
