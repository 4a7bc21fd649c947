#ifndef SPACECHECK_TESTS_MOCK_FILESYSTEM_STATS_HPP_
#define SPACECHECK_TESTS_MOCK_FILESYSTEM_STATS_HPP_

#include "probe/i_filesystem_stats.hpp"

#include <gmock/gmock.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace SpaceCheck::Probe::Testing
{

class MockFilesystemStats : public IFilesystemStats
{
    public:
    MOCK_METHOD(
        ProbeResult<LowLevelStats>, QueryLowLevelStats, (const std::filesystem::path&),
        (const, override)
    );
    MOCK_METHOD(
        ProbeResult<VolumeCapacity>, QueryVolumeCapacity, (const std::filesystem::path&),
        (const, override)
    );
    MOCK_METHOD(
        ProbeResult<FilesystemAttributes>, QueryFilesystemAttributes,
        (const std::filesystem::path&), (const, override)
    );
};

inline LowLevelStats MakeLowLevelStats(
    std::string type, std::uint64_t blocks, std::uint64_t blocks_free,
    std::uint64_t blocks_available, std::uint64_t block_size = 4096
)
{
    LowLevelStats stats;
    stats.filesystem_type  = std::move(type);
    stats.blocks           = blocks;
    stats.blocks_free      = blocks_free;
    stats.blocks_available = blocks_available;
    stats.block_size       = block_size;
    return stats;
}

inline VolumeCapacity MakeVolumeCapacity(
    std::optional<std::uint64_t> total, std::optional<std::uint64_t> important,
    std::optional<std::uint64_t> plain
)
{
    VolumeCapacity capacity;
    capacity.total_capacity                         = total;
    capacity.available_capacity_for_important_usage = important;
    capacity.available_capacity                     = plain;
    return capacity;
}

inline FilesystemAttributes MakeFilesystemAttributes(
    std::optional<std::uint64_t> size, std::optional<std::uint64_t> free_size
)
{
    FilesystemAttributes attributes;
    attributes.system_size      = size;
    attributes.system_free_size = free_size;
    return attributes;
}

}  // namespace SpaceCheck::Probe::Testing

#endif  // SPACECHECK_TESTS_MOCK_FILESYSTEM_STATS_HPP_
