#ifndef SPACECHECK_SRC_PROBE_I_FILESYSTEM_STATS_HPP_
#define SPACECHECK_SRC_PROBE_I_FILESYSTEM_STATS_HPP_

#include "probe/probe_error.hpp"

#include <concepts>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace SpaceCheck::Probe
{

// Raw fields of the low-level statistics call. One query serves both mount-type
// detection and the capacity fields.
struct LowLevelStats {
    std::string filesystem_type;  ///< Empty when the type could not be named
    std::uint64_t blocks           = 0;
    std::uint64_t blocks_available = 0;
    std::uint64_t blocks_free      = 0;
    std::uint64_t block_size       = 0;
};

// Volume-level capacity. Any field may be absent.
struct VolumeCapacity {
    std::optional<std::uint64_t> total_capacity;
    std::optional<std::uint64_t> available_capacity_for_important_usage;
    std::optional<std::uint64_t> available_capacity;
};

struct FilesystemAttributes {
    std::optional<std::uint64_t> system_size;
    std::optional<std::uint64_t> system_free_size;
};

// Read-only capacity queries against the operating system
class IFilesystemStats
{
    public:
    virtual ~IFilesystemStats() = default;

    [[nodiscard]] virtual ProbeResult<LowLevelStats> QueryLowLevelStats(
        const std::filesystem::path& path
    ) const = 0;

    [[nodiscard]] virtual ProbeResult<VolumeCapacity> QueryVolumeCapacity(
        const std::filesystem::path& path
    ) const = 0;

    [[nodiscard]] virtual ProbeResult<FilesystemAttributes> QueryFilesystemAttributes(
        const std::filesystem::path& path
    ) const = 0;
};

template <typename T>
concept IsFilesystemStats = std::derived_from<T, IFilesystemStats>;

}  // namespace SpaceCheck::Probe

#endif  // SPACECHECK_SRC_PROBE_I_FILESYSTEM_STATS_HPP_
