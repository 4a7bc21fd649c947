#ifndef SPACECHECK_SRC_UTIL_BYTE_FORMAT_HPP_
#define SPACECHECK_SRC_UTIL_BYTE_FORMAT_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace SpaceCheck::Util
{

// Formats a byte count with decimal units, e.g. "512 bytes", "1.2 GB".
// Every user-facing message goes through this so the unit convention stays uniform.
std::string FormatBytes(std::int64_t bytes);

// Parses a size string (e.g., "500MB", "2 GiB", "1024") into bytes.
// Returns std::nullopt if parsing fails or the value does not fit in int64.
std::optional<std::int64_t> ParseSizeStringToBytes(const std::string &size_str);

// a + b, clamped to INT64_MAX. Both operands must be non-negative.
std::int64_t SaturatingAdd(std::int64_t a, std::int64_t b);

}  // namespace SpaceCheck::Util

#endif  // SPACECHECK_SRC_UTIL_BYTE_FORMAT_HPP_
