#include "probe/mount_type.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <sstream>

namespace SpaceCheck::Probe
{

namespace
{

// Network filesystem type names as reported by Linux and by BSD-derived systems
constexpr std::array<std::string_view, 8> kNetworkFilesystemTypes = {
    "nfs", "nfs4", "smbfs", "smb3", "cifs", "afpfs", "webdav", "davfs",
};

bool IsOctalDigit(char c) { return c >= '0' && c <= '7'; }

// Mount points in /proc/mounts escape space, tab, newline and backslash as \ooo
std::string DecodeMountField(const std::string& field)
{
    std::string decoded;
    decoded.reserve(field.size());
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size() && IsOctalDigit(field[i + 1]) &&
            IsOctalDigit(field[i + 2]) && IsOctalDigit(field[i + 3])) {
            decoded += static_cast<char>(
                (field[i + 1] - '0') * 64 + (field[i + 2] - '0') * 8 + (field[i + 3] - '0')
            );
            i += 3;
        } else {
            decoded += field[i];
        }
    }
    return decoded;
}

bool MountPointContains(const std::string& mount_point, const std::string& path)
{
    if (mount_point == "/") {
        return !path.empty() && path.front() == '/';
    }
    if (path.size() < mount_point.size() || path.compare(0, mount_point.size(), mount_point) != 0) {
        return false;
    }
    return path.size() == mount_point.size() || path[mount_point.size()] == '/';
}

}  // namespace

std::string FilesystemTypeFromMagic(std::uint32_t magic)
{
    switch (magic) {
        case 0xEF53:
            return "ext4";
        case 0x6969:
            return "nfs";
        case 0x517B:
            return "smbfs";
        case 0xFF534D42:
            return "cifs";
        case 0xFE534D42:
            return "smb3";
        case 0x4d44:
            return "vfat";
        case 0x5346544E:
            return "ntfs";
        case 0x52654973:
            return "reiserfs";
        case 0x01021994:
            return "tmpfs";
        case 0x58465342:
            return "xfs";
        case 0xF15F:
            return "ecryptfs";
        case 0x65735546:
            return "fuse";
        case 0x9123683E:
            return "btrfs";
        case 0x794C7630:
            return "overlay";
        case 0x2FC12FC1:
            return "zfs";
        default:
            return {};
    }
}

std::optional<std::string> FindMountFilesystemType(
    const std::filesystem::path& path, const std::filesystem::path& mount_table
)
{
    std::ifstream mounts(mount_table);
    if (!mounts.is_open()) {
        spdlog::debug("Mount table {} could not be opened", mount_table.string());
        return std::nullopt;
    }

    const std::string target = path.lexically_normal().string();
    std::optional<std::string> best_type;
    size_t best_length = 0;

    std::string line;
    while (std::getline(mounts, line)) {
        std::istringstream iss(line);
        std::string device, mount_point, fstype;
        if (!(iss >> device >> mount_point >> fstype)) {
            continue;
        }
        std::string decoded = DecodeMountField(mount_point);
        if (decoded.size() > 1 && decoded.back() == '/') {
            decoded.pop_back();
        }
        // Later entries stack on top of earlier ones at the same mount point
        if (MountPointContains(decoded, target) && decoded.size() >= best_length) {
            best_length = decoded.size();
            best_type   = fstype;
        }
    }
    return best_type;
}

bool IsNetworkFilesystemType(std::string_view filesystem_type)
{
    std::string lowered(filesystem_type);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
        return std::tolower(c);
    });
    return std::ranges::find(kNetworkFilesystemTypes, lowered) != kNetworkFilesystemTypes.end();
}

}  // namespace SpaceCheck::Probe
