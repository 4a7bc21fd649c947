#include "config_loader.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <system_error>
#include "config_types.hpp"
#include "util/byte_format.hpp"

#include <cstdint>
#include <limits>
#include <optional>

#define TRY_ASSIGN(target, json_obj, key, type)                            \
    try {                                                                  \
        if (json_obj.contains(key)) {                                      \
            target = json_obj.at(key).get<type>();                         \
        }                                                                  \
    } catch (const nlohmann::json::exception &e) {                         \
        spdlog::error("JSON parse error for key '{}': {}", key, e.what()); \
        return std::unexpected(LoadError::JsonParseError);                 \
    }

namespace SpaceCheck::Config
{

namespace
{

// Reads a byte size given either as a size string ("10GB") or a non-negative integer.
// A missing key leaves `target` untouched.
std::expected<void, LoadError> AssignSizeField(
    const nlohmann::json &obj, const char *key, std::optional<std::int64_t> &target
)
{
    if (!obj.contains(key)) {
        return {};
    }
    const auto &value = obj.at(key);
    if (value.is_string()) {
        const std::string size_str = value.get<std::string>();
        auto parsed_bytes          = Util::ParseSizeStringToBytes(size_str);
        if (!parsed_bytes.has_value()) {
            spdlog::error("Invalid size string ('{}') for '{}'", size_str, key);
            return std::unexpected(LoadError::ValidationError);
        }
        target = *parsed_bytes;
        return {};
    }
    if (value.is_number_unsigned()) {
        const auto bytes = value.get<std::uint64_t>();
        if (bytes <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            target = static_cast<std::int64_t>(bytes);
            return {};
        }
    } else if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
        target = value.get<std::int64_t>();
        return {};
    }
    spdlog::error("'{}' must be a size string or a non-negative integer.", key);
    return std::unexpected(LoadError::ValidationError);
}

}  // namespace

LoadResult loadConfigFromJson(const nlohmann::json &j)
{
    if (!j.is_object()) {
        spdlog::error("Configuration root must be a JSON object.");
        return std::unexpected(LoadError::ValidationError);
    }

    CheckConfig config;

    // Parse Top-Level Keys
    if (j.contains("destinations")) {
        const auto &destinations = j.at("destinations");
        if (!destinations.is_array()) {
            spdlog::error("'destinations' must be an array of paths.");
            return std::unexpected(LoadError::ValidationError);
        }
        for (const auto &item : destinations) {
            if (!item.is_string() || item.get<std::string>().empty()) {
                spdlog::error("Item in 'destinations' array is not a non-empty string.");
                return std::unexpected(LoadError::ValidationError);
            }
            config.destinations.emplace_back(item.get<std::string>());
        }
    }
    spdlog::info("Parsed {} destination(s)", config.destinations.size());

    if (auto res = AssignSizeField(j, "required_bytes", config.required_bytes); !res) {
        return std::unexpected(res.error());
    }

    if (j.contains("check_settings")) {
        const auto &cs = j.at("check_settings");
        if (!cs.is_object()) {
            spdlog::error("'check_settings' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }

        std::optional<std::int64_t> buffer;
        if (auto res = AssignSizeField(cs, "safety_buffer_bytes", buffer); !res) {
            return std::unexpected(res.error());
        }
        if (buffer.has_value()) {
            config.check_settings.safety_buffer_bytes = *buffer;
        }

        TRY_ASSIGN(
            config.check_settings.low_free_threshold_percent, cs, "low_free_threshold_percent",
            double
        );
        TRY_ASSIGN(config.check_settings.probe_concurrently, cs, "probe_concurrently", bool);
        TRY_ASSIGN(config.check_settings.probe_threads, cs, "probe_threads", std::size_t);
    }
    if (!config.check_settings.IsValid()) {
        spdlog::error(
            "Invalid check settings: safety_buffer_bytes={} low_free_threshold_percent={}",
            config.check_settings.safety_buffer_bytes,
            config.check_settings.low_free_threshold_percent
        );
        return std::unexpected(LoadError::ValidationError);
    }
    spdlog::info(
        "Check settings: safety_buffer={}, low_free_threshold={}%, concurrent={}, threads={}",
        Util::FormatBytes(config.check_settings.safety_buffer_bytes),
        config.check_settings.low_free_threshold_percent, config.check_settings.probe_concurrently,
        config.check_settings.probe_threads
    );

    if (j.contains("global_settings")) {
        const auto &gs = j.at("global_settings");
        if (!gs.is_object()) {
            spdlog::error("'global_settings' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        std::string log_level_str =
            spdlog::level::to_string_view(Constants::DEFAULT_LOG_LEVEL).data();
        TRY_ASSIGN(log_level_str, gs, "log_level", std::string);  // Assign default first
        if (!log_level_str.empty()) {
            auto level_opt = StringToLogLevel(log_level_str);
            if (!level_opt) {
                spdlog::error(
                    "Invalid 'log_level' value: {}. Using default '{}'.", log_level_str,
                    spdlog::level::to_string_view(config.global_settings.log_level)
                );
                // Keep the default already set in config.global_settings
            } else {
                config.global_settings.log_level = *level_opt;
            }
        }
    }

    return config;
}

LoadResult loadConfigFromFile(const std::filesystem::path &file_path)
{
    spdlog::info("Attempting to load configuration from: {}", file_path.string());

    std::ifstream config_stream(file_path);
    if (!config_stream.is_open()) {
        spdlog::error("Failed to open config file: {}", file_path.string());
        return std::unexpected(LoadError::FileNotFound);
    }

    nlohmann::json j;
    try {
        config_stream >> j;
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::error("Failed to parse JSON config file: {}", e.what());
        return std::unexpected(LoadError::JsonParseError);
    }

    auto result = loadConfigFromJson(j);
    if (result) {
        spdlog::info("Configuration loaded successfully from: {}", file_path.string());
    }
    return result;
}

LoadErrorMsg loadConfigFromFileVerbose(const std::filesystem::path &file_path)
{
    auto result = loadConfigFromFile(file_path);
    if (result.has_value()) {
        return result.value();
    } else {
        std::string error_message = "Failed to load config (" + file_path.string() + "): ";
        switch (result.error()) {
            case LoadError::FileNotFound:
                error_message += "File not found.";
                break;
            case LoadError::JsonParseError:
                error_message += "JSON parsing failed.";
                break;
            case LoadError::ValidationError:
                error_message += "Configuration validation failed.";
                break;
            default:
                error_message += "Unknown error.";
                break;
        }
        return std::unexpected(error_message);
    }
}

}  // namespace SpaceCheck::Config
