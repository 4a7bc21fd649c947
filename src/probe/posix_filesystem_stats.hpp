#ifndef SPACECHECK_SRC_PROBE_POSIX_FILESYSTEM_STATS_HPP_
#define SPACECHECK_SRC_PROBE_POSIX_FILESYSTEM_STATS_HPP_

#include "app_constants.hpp"
#include "probe/i_filesystem_stats.hpp"

#include <filesystem>
#include <system_error>

namespace SpaceCheck::Probe
{

namespace fs = std::filesystem;

// statfs(2), std::filesystem::space and statvfs(3) behind IFilesystemStats.
// Stateless apart from the mount table location, so safe to share across threads.
class PosixFilesystemStats : public IFilesystemStats
{
    public:
    explicit PosixFilesystemStats(
        fs::path mount_table = fs::path(Constants::DEFAULT_MOUNT_TABLE_PATH)
    );
    ~PosixFilesystemStats() override = default;

    PosixFilesystemStats(const PosixFilesystemStats&)            = delete;
    PosixFilesystemStats& operator=(const PosixFilesystemStats&) = delete;
    PosixFilesystemStats(PosixFilesystemStats&&)                 = delete;
    PosixFilesystemStats& operator=(PosixFilesystemStats&&)      = delete;

    ProbeResult<LowLevelStats> QueryLowLevelStats(const fs::path& path) const override;
    ProbeResult<VolumeCapacity> QueryVolumeCapacity(const fs::path& path) const override;
    ProbeResult<FilesystemAttributes> QueryFilesystemAttributes(const fs::path& path
    ) const override;

    private:
    std::string ResolveFilesystemType(const fs::path& path, std::uint32_t magic) const;
    std::error_code MapFilesystemError(const std::error_code& ec, const std::string& operation = "")
        const;

    const fs::path mount_table_;
};

}  // namespace SpaceCheck::Probe

#endif  // SPACECHECK_SRC_PROBE_POSIX_FILESYSTEM_STATS_HPP_
