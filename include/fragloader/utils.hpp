#ifndef FRAGLOADER_UTILS_HPP
#define FRAGLOADER_UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fragloader/export.hpp>

namespace fragloader
{
    namespace fs = std::filesystem;

    FRAGLOADER_API bool starts_with(const std::string_view& str, const std::string_view& prefix);
    FRAGLOADER_API bool ends_with(const std::string_view& str, const std::string_view& suffix);

    FRAGLOADER_API std::string string_transform(const std::string_view& input,
                                                int (*functor)(int));
    FRAGLOADER_API std::string to_lower(const std::string_view& input);
    FRAGLOADER_API std::string strip(const std::string_view& input);

    // Splits a raw "Key: Value\r\n" header line, the key is lower-cased.
    // Lines without a colon yield an empty key.
    FRAGLOADER_API std::pair<std::string, std::string> parse_header(
        const std::string_view& header);

    FRAGLOADER_API
    std::vector<std::string> split(const std::string_view& input,
                                   const std::string_view& sep,
                                   std::size_t max_split = SIZE_MAX);

    FRAGLOADER_API std::string path_to_url(const std::string& path);

    // Human readable byte count, e.g. "1.50MiB".
    FRAGLOADER_API std::string format_bytes(std::optional<double> bytes);
    // "HH:MM:SS" or "MM:SS", "--:--" when unknown.
    FRAGLOADER_API std::string format_seconds(std::optional<double> seconds);
}

#endif
