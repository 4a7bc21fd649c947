#ifndef SPACECHECK_SRC_PROBE_PROBE_ERROR_HPP_
#define SPACECHECK_SRC_PROBE_PROBE_ERROR_HPP_

#include <cerrno>
#include <expected>
#include <string>
#include <system_error>
#include <type_traits>

namespace SpaceCheck::Probe
{

//------------------------------------------------------------------------------//
// Error Codes declared for Capacity Probing
//------------------------------------------------------------------------------//

// clang-format off
enum class ProbeErrc {
    Success = 0,          // Not an error
    PathNotFound,         // Path (or a component of it) does not exist
    PermissionDenied,     // Search permission denied on a path component
    IOError,              // I/O error while reading filesystem metadata
    NotSupported,         // Filesystem does not support the statistics call
    InvalidPath,          // Path is empty, too long or not a valid path
    StaleMount,           // Network mount handle went stale
    UnreliableValues,     // Query succeeded but reported zero or overflowing capacity
    MissingFields,        // Query succeeded but did not report the required fields
    AllStrategiesFailed,  // No strategy in the chain produced an accepted result
    UnknownError,         // An unspecified error occurred
};
// clang-format on

std::error_code make_error_code(ProbeErrc e);

inline ProbeErrc ErrnoToProbeErrc(int err_no)
{
    switch (err_no) {
        case 0:
            return ProbeErrc::Success;
        case ENOENT:
            return ProbeErrc::PathNotFound;
        case EACCES:
        case EPERM:
            return ProbeErrc::PermissionDenied;
        case EIO:
            return ProbeErrc::IOError;
        case ENOSYS:
        case EOPNOTSUPP:
            return ProbeErrc::NotSupported;
        case ENOTDIR:
        case ENAMETOOLONG:
        case ELOOP:
        case EFAULT:
            return ProbeErrc::InvalidPath;
        case ESTALE:
            return ProbeErrc::StaleMount;

        default:
            return ProbeErrc::UnknownError;
    }
}

//------------------------------------------------------------------------------//
// Error Category Definition (Private Implementation Detail)
//------------------------------------------------------------------------------//
namespace detail
{
class ProbeErrorCategory : public std::error_category
{
    public:
    const char* name() const noexcept override { return "SpaceCheck::Probe"; }
    std::string message(int ev) const override
    {
        switch (static_cast<ProbeErrc>(ev)) {
            case ProbeErrc::Success:
                return "Success";
            case ProbeErrc::PathNotFound:
                return "Path not found";
            case ProbeErrc::PermissionDenied:
                return "Permission denied";
            case ProbeErrc::IOError:
                return "Input/output error";
            case ProbeErrc::NotSupported:
                return "Filesystem statistics not supported";
            case ProbeErrc::InvalidPath:
                return "Invalid path";
            case ProbeErrc::StaleMount:
                return "Stale network mount";
            case ProbeErrc::UnreliableValues:
                return "Filesystem reported unreliable capacity values";
            case ProbeErrc::MissingFields:
                return "Filesystem did not report capacity fields";
            case ProbeErrc::AllStrategiesFailed:
                return "Unable to determine available disk space";
            case ProbeErrc::UnknownError:
                return "Unknown probe error";
            default:
                return "Unrecognized error code";
        }
    }
};
}  // namespace detail

// Global instance of the category
inline const detail::ProbeErrorCategory probe_error_category;

// Make the enum usable with std::error_code
inline std::error_code make_error_code(ProbeErrc e)
{
    return {static_cast<int>(e), probe_error_category};
}

//------------------------------------------------------------------------------//
// Result Type Alias
//------------------------------------------------------------------------------//
template <typename T>
using ProbeResult = std::expected<T, std::error_code>;

}  // namespace SpaceCheck::Probe

// Enable std::error_code implicit conversion for ProbeErrc
namespace std
{
template <>
struct is_error_code_enum<SpaceCheck::Probe::ProbeErrc> : true_type {
};
}  // namespace std

#endif  // SPACECHECK_SRC_PROBE_PROBE_ERROR_HPP_
