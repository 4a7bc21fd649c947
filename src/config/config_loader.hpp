#ifndef SPACECHECK_SRC_CONFIG_CONFIG_LOADER_HPP_
#define SPACECHECK_SRC_CONFIG_CONFIG_LOADER_HPP_

#include "config/config_types.hpp"

#include <expected>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace SpaceCheck::Config
{

//------------------------------------------------------------------------------//
// Error Handling for Configuration Loading
//------------------------------------------------------------------------------//

enum class LoadError {
    FileNotFound,
    JsonParseError,
    ValidationError,
};

using LoadResult   = std::expected<CheckConfig, LoadError>;
using LoadErrorMsg = std::expected<CheckConfig, std::string>;

// A loaded file may omit destinations and required_bytes; callers that take them
// from the command line check CheckConfig::IsValid() after merging.
LoadResult loadConfigFromJson(const nlohmann::json &j);
LoadResult loadConfigFromFile(const std::filesystem::path &file_path);
LoadErrorMsg loadConfigFromFileVerbose(const std::filesystem::path &file_path);

}  // namespace SpaceCheck::Config

#endif  // SPACECHECK_SRC_CONFIG_CONFIG_LOADER_HPP_
