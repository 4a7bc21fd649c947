#include "probe/capacity_probe.hpp"

#include "probe/mount_type.hpp"

#include <spdlog/spdlog.h>

#include <functional>
#include <limits>
#include <optional>
#include <vector>

namespace SpaceCheck::Probe
{

namespace
{

struct Strategy {
    CapacitySource source;
    std::function<std::optional<CapacityInfo>()> attempt;
};

std::optional<std::int64_t> ToSignedBytes(std::uint64_t bytes)
{
    if (bytes > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(bytes);
}

std::optional<std::int64_t> BlocksToBytes(std::uint64_t blocks, std::uint64_t block_size)
{
    std::uint64_t bytes = 0;
    if (__builtin_mul_overflow(blocks, block_size, &bytes)) {
        return std::nullopt;
    }
    return ToSignedBytes(bytes);
}

std::optional<CapacityInfo> FromLowLevelStats(const LowLevelStats& stats)
{
    auto total     = BlocksToBytes(stats.blocks, stats.block_size);
    auto available = BlocksToBytes(stats.blocks_available, stats.block_size);
    auto free      = BlocksToBytes(stats.blocks_free, stats.block_size);

    // Some network volumes report 0 or extremely large values
    if (!total || !available || !free || *total <= 0 || *available < 0 || *free < 0) {
        return std::nullopt;
    }
    return MakeCapacityInfo(*total, *free, *available);
}

std::optional<CapacityInfo> FromVolumeCapacity(const VolumeCapacity& capacity)
{
    if (!capacity.total_capacity.has_value()) {
        return std::nullopt;
    }
    auto total = ToSignedBytes(*capacity.total_capacity);
    if (!total || *total <= 0) {
        return std::nullopt;
    }

    const std::uint64_t raw_available = capacity.available_capacity_for_important_usage.value_or(
        capacity.available_capacity.value_or(0)
    );
    auto available = ToSignedBytes(raw_available);
    if (!available) {
        return std::nullopt;
    }

    // Free and available are not distinguished at this tier
    return MakeCapacityInfo(*total, *available, *available);
}

std::optional<CapacityInfo> FromFilesystemAttributes(const FilesystemAttributes& attributes)
{
    if (!attributes.system_size.has_value() || !attributes.system_free_size.has_value()) {
        return std::nullopt;
    }
    auto total = ToSignedBytes(*attributes.system_size);
    auto free  = ToSignedBytes(*attributes.system_free_size);
    if (!total || !free || *total <= 0) {
        return std::nullopt;
    }
    return MakeCapacityInfo(*total, *free, *free);
}

}  // namespace

ProbeResult<CapacityInfo> CapacityProbe::Probe(const std::filesystem::path& path) const
{
    std::optional<std::error_code> first_os_error;
    auto note_error = [&first_os_error](const std::error_code& ec) {
        if (!first_os_error.has_value()) {
            first_os_error = ec;
        }
    };

    // One low-level query answers both "is this a network mount" and its capacity fields
    const auto low_level = stats_.QueryLowLevelStats(path);
    if (!low_level) {
        note_error(low_level.error());
    }
    const std::string filesystem_type = low_level ? low_level->filesystem_type : std::string{};
    const bool is_network             = low_level && IsNetworkFilesystemType(filesystem_type);

    std::vector<Strategy> chain;
    chain.reserve(3);
    if (is_network) {
        chain.push_back({CapacitySource::LowLevelStatistics, [&]() {
                             auto info = FromLowLevelStats(*low_level);
                             if (!info) {
                                 spdlog::info(
                                     "Network volume {} reported unreliable space values, trying "
                                     "alternate methods",
                                     path.string()
                                 );
                             }
                             return info;
                         }});
    }
    chain.push_back({CapacitySource::VolumeResources, [&]() -> std::optional<CapacityInfo> {
                         auto capacity = stats_.QueryVolumeCapacity(path);
                         if (!capacity) {
                             note_error(capacity.error());
                             return std::nullopt;
                         }
                         return FromVolumeCapacity(*capacity);
                     }});
    chain.push_back({CapacitySource::FilesystemAttributes, [&]() -> std::optional<CapacityInfo> {
                         auto attributes = stats_.QueryFilesystemAttributes(path);
                         if (!attributes) {
                             note_error(attributes.error());
                             return std::nullopt;
                         }
                         return FromFilesystemAttributes(*attributes);
                     }});

    for (const auto& strategy : chain) {
        auto info = strategy.attempt();
        if (!info) {
            spdlog::debug(
                "Strategy '{}' gave no usable capacity for {}",
                CapacitySourceToString(strategy.source), path.string()
            );
            continue;
        }
        info->source           = strategy.source;
        info->filesystem_type  = filesystem_type;
        info->is_network_mount = is_network;
        spdlog::debug(
            "Capacity for {} via '{}' (fs '{}'): total={} free={} available={}", path.string(),
            CapacitySourceToString(strategy.source), filesystem_type, info->total_bytes,
            info->free_bytes, info->available_bytes
        );
        return *info;
    }

    const std::error_code ec = first_os_error.value_or(make_error_code(ProbeErrc::AllStrategiesFailed));
    spdlog::error("Failed to get disk space for {}: {}", path.string(), ec.message());
    return std::unexpected(ec);
}

}  // namespace SpaceCheck::Probe
