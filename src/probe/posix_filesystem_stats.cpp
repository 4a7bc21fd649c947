#include "probe/posix_filesystem_stats.hpp"

#include "probe/mount_type.hpp"

#include <spdlog/spdlog.h>
#include <sys/statvfs.h>
#include <sys/statfs.h>
#include <cerrno>
#include <cstring>
#include <utility>

namespace SpaceCheck::Probe
{

namespace
{

constexpr std::uintmax_t kUnknownSpaceField = static_cast<std::uintmax_t>(-1);

std::optional<std::uint64_t> KnownSpaceField(std::uintmax_t value)
{
    if (value == kUnknownSpaceField) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(value);
}

}  // namespace

PosixFilesystemStats::PosixFilesystemStats(fs::path mount_table)
    : mount_table_(std::move(mount_table))
{
}

std::error_code PosixFilesystemStats::MapFilesystemError(
    const std::error_code& ec, const std::string& operation
) const
{
    if (!ec)
        return {};
    ProbeErrc probe_errc = ProbeErrc::UnknownError;
    if (ec.category() == std::generic_category()) {
        probe_errc = ErrnoToProbeErrc(ec.value());
    } else if (ec.category() == std::system_category()) {
        probe_errc = ErrnoToProbeErrc(ec.value());
    }
    spdlog::debug("{} failed: {} ({})", operation, ec.message(), ec.value());
    return make_error_code(probe_errc);
}

std::string PosixFilesystemStats::ResolveFilesystemType(
    const fs::path& path, std::uint32_t magic
) const
{
    std::string type_name = FilesystemTypeFromMagic(magic);
    // FUSE magic hides the real filesystem (sshfs, davfs, ...); the mount table names it
    if (!type_name.empty() && type_name != "fuse") {
        return type_name;
    }

    std::error_code ec;
    fs::path absolute = fs::weakly_canonical(path, ec);
    if (ec) {
        absolute = fs::absolute(path, ec);
        if (ec) {
            return type_name;
        }
    }

    auto mount_type = FindMountFilesystemType(absolute, mount_table_);
    if (mount_type.has_value()) {
        return *mount_type;
    }
    return type_name;
}

ProbeResult<LowLevelStats> PosixFilesystemStats::QueryLowLevelStats(const fs::path& path) const
{
    struct statfs st = {};
    if (::statfs(path.c_str(), &st) == -1) {
        const int statfs_errno = errno;
        spdlog::debug("statfs({}) failed: {}", path.string(), std::strerror(statfs_errno));
        return std::unexpected(make_error_code(ErrnoToProbeErrc(statfs_errno)));
    }

    LowLevelStats stats;
    stats.filesystem_type  = ResolveFilesystemType(path, static_cast<std::uint32_t>(st.f_type));
    stats.blocks           = static_cast<std::uint64_t>(st.f_blocks);
    stats.blocks_available = static_cast<std::uint64_t>(st.f_bavail);
    stats.blocks_free      = static_cast<std::uint64_t>(st.f_bfree);
    stats.block_size       = st.f_frsize != 0 ? static_cast<std::uint64_t>(st.f_frsize)
                                              : static_cast<std::uint64_t>(st.f_bsize);
    return stats;
}

ProbeResult<VolumeCapacity> PosixFilesystemStats::QueryVolumeCapacity(const fs::path& path) const
{
    std::error_code ec;
    fs::space_info space = fs::space(path, ec);
    if (ec) {
        return std::unexpected(MapFilesystemError(ec, "volume_capacity"));
    }

    VolumeCapacity capacity;
    capacity.total_capacity                         = KnownSpaceField(space.capacity);
    capacity.available_capacity_for_important_usage = KnownSpaceField(space.available);
    capacity.available_capacity                     = KnownSpaceField(space.free);
    return capacity;
}

ProbeResult<FilesystemAttributes> PosixFilesystemStats::QueryFilesystemAttributes(
    const fs::path& path
) const
{
    struct statvfs st = {};
    if (::statvfs(path.c_str(), &st) == -1) {
        const int statvfs_errno = errno;
        spdlog::debug("statvfs({}) failed: {}", path.string(), std::strerror(statvfs_errno));
        return std::unexpected(make_error_code(ErrnoToProbeErrc(statvfs_errno)));
    }

    const auto fragment_size = static_cast<std::uint64_t>(st.f_frsize);
    const auto blocks        = static_cast<std::uint64_t>(st.f_blocks);
    const auto avail_blocks  = static_cast<std::uint64_t>(st.f_bavail);

    FilesystemAttributes attributes;
    // Overflowing products leave the field absent
    std::uint64_t product = 0;
    if (!__builtin_mul_overflow(blocks, fragment_size, &product)) {
        attributes.system_size = product;
    }
    if (!__builtin_mul_overflow(avail_blocks, fragment_size, &product)) {
        attributes.system_free_size = product;
    }
    return attributes;
}

}  // namespace SpaceCheck::Probe
