#ifndef SPACECHECK_SRC_APP_CONSTANTS_HPP_
#define SPACECHECK_SRC_APP_CONSTANTS_HPP_

#include <spdlog/common.h>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace SpaceCheck::Constants
{
// Application Info
constexpr std::string_view APP_NAME = "SpaceCheck";
#ifndef SPACECHECK_VERSION
#define SPACECHECK_VERSION "0.0.0"
#endif
constexpr std::string_view APP_VERSION_STRING = "SpaceCheck version " SPACECHECK_VERSION;
constexpr std::string_view APP_VERSION_SHORT  = SPACECHECK_VERSION;

// Logging
constexpr spdlog::level::level_enum DEFAULT_LOG_LEVEL   = spdlog::level::info;
constexpr spdlog::level::level_enum DEFAULT_FLUSH_LEVEL = spdlog::level::warn;
constexpr std::string_view DEFAULT_CONSOLE_LOG_PATTERN =
    "[%Y-%m-%d %H:%M:%S.%e] [ThreadID:%t] [%^%l%$] [%n] %v";

// Space policy
constexpr std::int64_t DEFAULT_SAFETY_BUFFER_BYTES  = 100'000'000;
constexpr double DEFAULT_LOW_FREE_THRESHOLD_PERCENT = 10.0;
constexpr double HEALTHY_FREE_PERCENT               = 30.0;
constexpr double MODERATE_FREE_PERCENT              = 15.0;

// Probing
constexpr std::size_t MAX_PROBE_THREADS = 64;

// Mount table consulted when statfs magic alone does not name the filesystem
constexpr std::string_view DEFAULT_MOUNT_TABLE_PATH = "/proc/self/mounts";

// Exit status
constexpr int EXIT_BLOCKED = 2;

}  // namespace SpaceCheck::Constants

#endif  // SPACECHECK_SRC_APP_CONSTANTS_HPP_
