#include "util/byte_format.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string_view>
#include <unordered_map>

namespace SpaceCheck::Util
{

std::string FormatBytes(std::int64_t bytes)
{
    constexpr std::array<std::string_view, 5> units = {"KB", "MB", "GB", "TB", "PB"};
    constexpr double threshold                     = 1000.0;

    const bool negative = bytes < 0;
    // Magnitude as unsigned so INT64_MIN does not overflow on negation
    const std::uint64_t magnitude =
        negative ? static_cast<std::uint64_t>(-(bytes + 1)) + 1 : static_cast<std::uint64_t>(bytes);

    std::ostringstream oss;
    if (negative) {
        oss << '-';
    }

    if (magnitude < 1000) {
        oss << magnitude << " bytes";
        return oss.str();
    }

    double size       = static_cast<double>(magnitude) / threshold;
    size_t unit_index = 0;
    // Compare the value as it will be printed so 999,999 bytes becomes "1.0 MB", not "1000.0 KB"
    while (std::round(size * 10.0) / 10.0 >= threshold && unit_index < units.size() - 1) {
        size /= threshold;
        unit_index++;
    }

    oss << std::fixed << std::setprecision(1) << size << " " << units[unit_index];
    return oss.str();
}

std::optional<std::int64_t> ParseSizeStringToBytes(const std::string &size_str)
{
    if (size_str.empty()) {
        return std::nullopt;
    }

    std::string num_part;
    std::string unit_part;

    size_t i = 0;
    while (i < size_str.length() && std::isdigit(static_cast<unsigned char>(size_str[i]))) {
        num_part += size_str[i];
        i++;
    }

    // Allow optional space between number and unit
    while (i < size_str.length() && std::isspace(static_cast<unsigned char>(size_str[i]))) {
        i++;
    }

    while (i < size_str.length() && std::isalpha(static_cast<unsigned char>(size_str[i]))) {
        unit_part += size_str[i];
        i++;
    }

    // If there's anything left after number and unit (and optional space), it's an error
    if (i < size_str.length()) {
        spdlog::warn("Invalid characters found after unit in size string: '{}'", size_str);
        return std::nullopt;
    }

    if (num_part.empty()) {
        spdlog::warn("No numeric part in size string: '{}'", size_str);
        return std::nullopt;
    }

    std::int64_t value;
    auto conv_res = std::from_chars(num_part.data(), num_part.data() + num_part.length(), value);
    if (conv_res.ec != std::errc() || conv_res.ptr != num_part.data() + num_part.length()) {
        spdlog::warn("Failed to parse numeric part '{}' of size string: '{}'", num_part, size_str);
        return std::nullopt;
    }

    if (unit_part.empty()) {  // Assume bytes if no unit
        return value;
    }

    std::ranges::transform(unit_part, unit_part.begin(), [](unsigned char c) {
        return std::tolower(c);
    });

    static const std::unordered_map<std::string, std::int64_t> unit_multipliers = {
        {  "b",                                      1},
        {  "k",                                  1000LL},
        { "kb",                                  1000LL},
        {  "m",                        1000LL * 1000LL},
        { "mb",                        1000LL * 1000LL},
        {  "g",               1000LL * 1000LL * 1000LL},
        { "gb",               1000LL * 1000LL * 1000LL},
        {  "t",      1000LL * 1000LL * 1000LL * 1000LL},
        { "tb",      1000LL * 1000LL * 1000LL * 1000LL},
        {"kib",                                  1024LL},
        {"mib",                        1024LL * 1024LL},
        {"gib",               1024LL * 1024LL * 1024LL},
        {"tib",      1024LL * 1024LL * 1024LL * 1024LL}
    };
    auto it = unit_multipliers.find(unit_part);
    if (it == unit_multipliers.end()) {
        spdlog::warn("Unknown size unit '{}' in string '{}'", unit_part, size_str);
        return std::nullopt;  // Unknown unit
    }
    if (value > std::numeric_limits<std::int64_t>::max() / it->second) {
        spdlog::warn("Size string '{}' exceeds the representable range", size_str);
        return std::nullopt;
    }
    return value * it->second;
}

std::int64_t SaturatingAdd(std::int64_t a, std::int64_t b)
{
    if (a > std::numeric_limits<std::int64_t>::max() - b) {
        return std::numeric_limits<std::int64_t>::max();
    }
    return a + b;
}

}  // namespace SpaceCheck::Util
