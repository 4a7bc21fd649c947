#ifndef SPACECHECK_SRC_CONFIG_CONFIG_TYPES_HPP_
#define SPACECHECK_SRC_CONFIG_CONFIG_TYPES_HPP_

#include "app_constants.hpp"
#include "space/space_verdict.hpp"

#include <spdlog/spdlog.h>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace SpaceCheck::Config
{

// Function to convert string to spdlog::level::level_enum
std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str);

//------------------------------------------------------------------------------//
// Structs for Configuration Types
//------------------------------------------------------------------------------//

struct CheckSettings {
    std::int64_t safety_buffer_bytes  = Constants::DEFAULT_SAFETY_BUFFER_BYTES;
    double low_free_threshold_percent = Constants::DEFAULT_LOW_FREE_THRESHOLD_PERCENT;
    bool probe_concurrently           = false;
    std::size_t probe_threads         = 0;  ///< 0 = one worker per destination

    bool IsValid() const;
    Space::EvaluationPolicy ToPolicy() const;
};

struct GlobalSettings {
    spdlog::level::level_enum log_level = Constants::DEFAULT_LOG_LEVEL;
};

struct CheckConfig {
    std::vector<std::filesystem::path> destinations;
    std::optional<std::int64_t> required_bytes;  ///< May come from the command line instead
    CheckSettings check_settings;
    GlobalSettings global_settings;

    // Ready to run: destinations and required bytes present, settings valid
    bool IsValid() const;
};

//------------------------------------------------------------------------------//
// Implementation of Logging Conversion Functions
//------------------------------------------------------------------------------//

inline std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str)
{
    if (level_str == "trace") {
        return spdlog::level::trace;
    }
    if (level_str == "debug") {
        return spdlog::level::debug;
    }
    if (level_str == "info") {
        return spdlog::level::info;
    }
    if (level_str == "warn") {
        return spdlog::level::warn;
    }
    if (level_str == "error") {
        return spdlog::level::err;
    }
    if (level_str == "fatal" || level_str == "critical") {
        return spdlog::level::critical;
    }
    if (level_str == "off") {
        return spdlog::level::off;
    }
    return std::nullopt;
}

//------------------------------------------------------------------------------//
// Implementation of Configuration Structs Functions
//------------------------------------------------------------------------------//

inline bool CheckSettings::IsValid() const
{
    return ToPolicy().IsValid() && probe_threads <= Constants::MAX_PROBE_THREADS;
}

inline Space::EvaluationPolicy CheckSettings::ToPolicy() const
{
    Space::EvaluationPolicy policy;
    policy.safety_buffer_bytes        = safety_buffer_bytes;
    policy.low_free_threshold_percent = low_free_threshold_percent;
    return policy;
}

inline bool CheckConfig::IsValid() const
{
    if (destinations.empty() || !required_bytes.has_value() || *required_bytes < 0 ||
        !check_settings.IsValid()) {
        return false;
    }
    for (const auto &destination : destinations) {
        if (destination.empty()) {
            spdlog::error("Empty destination path in configuration.");
            return false;
        }
    }
    return true;
}

}  // namespace SpaceCheck::Config

#endif  // SPACECHECK_SRC_CONFIG_CONFIG_TYPES_HPP_
