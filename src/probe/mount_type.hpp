#ifndef SPACECHECK_SRC_PROBE_MOUNT_TYPE_HPP_
#define SPACECHECK_SRC_PROBE_MOUNT_TYPE_HPP_

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace SpaceCheck::Probe
{

// Maps a statfs(2) f_type magic number to a filesystem type name.
// Returns an empty string for magics not in the table.
std::string FilesystemTypeFromMagic(std::uint32_t magic);

// Finds the filesystem type of the mount containing `path` by longest mount-point
// prefix in a /proc/mounts formatted table. `path` should be absolute.
std::optional<std::string> FindMountFilesystemType(
    const std::filesystem::path& path, const std::filesystem::path& mount_table
);

// True for NFS, SMB, CIFS, AFP and WebDAV type names (case-insensitive).
bool IsNetworkFilesystemType(std::string_view filesystem_type);

}  // namespace SpaceCheck::Probe

#endif  // SPACECHECK_SRC_PROBE_MOUNT_TYPE_HPP_
