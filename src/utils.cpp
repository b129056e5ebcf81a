#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

#include <fmt/format.h>

#include <fragloader/utils.hpp>

namespace fragloader
{
    bool starts_with(const std::string_view& str, const std::string_view& prefix)
    {
        return str.size() >= prefix.size() && 0 == str.compare(0, prefix.size(), prefix);
    }

    bool ends_with(const std::string_view& str, const std::string_view& suffix)
    {
        return str.size() >= suffix.size()
               && 0 == str.compare(str.size() - suffix.size(), suffix.size(), suffix);
    }

    std::string string_transform(const std::string_view& input, int (*functor)(int))
    {
        std::string res(input);
        std::transform(
            res.begin(), res.end(), res.begin(), [&](unsigned char c) { return functor(c); });
        return res;
    }

    std::string to_lower(const std::string_view& input)
    {
        return string_transform(input, std::tolower);
    }

    std::string strip(const std::string_view& input)
    {
        const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
        auto begin = std::find_if_not(input.begin(), input.end(), is_space);
        auto end = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
        if (begin >= end)
            return {};
        return std::string(begin, end);
    }

    std::pair<std::string, std::string> parse_header(const std::string_view& header)
    {
        auto colon_idx = header.find(':');
        if (colon_idx != std::string_view::npos)
        {
            std::string_view key = header.substr(0, colon_idx);
            // http headers are case insensitive!
            return std::make_pair(to_lower(strip(key)), strip(header.substr(colon_idx + 1)));
        }
        return std::make_pair(std::string(), strip(header));
    }

    std::vector<std::string> split(const std::string_view& input,
                                   const std::string_view& sep,
                                   std::size_t max_split)
    {
        std::vector<std::string> result;
        std::size_t i = 0, j = 0, len = input.size(), n = sep.size();

        while (i + n <= len)
        {
            if (input[i] == sep[0] && input.substr(i, n) == sep)
            {
                if (max_split-- <= 0)
                    break;
                result.emplace_back(input.substr(j, i - j));
                i = j = i + n;
            }
            else
            {
                i++;
            }
        }
        result.emplace_back(input.substr(j, len - j));
        return result;
    }

    std::string path_to_url(const std::string& path)
    {
        const fs::path abs = fs::absolute(path);
#ifdef _WIN32
        return "file:///" + abs.generic_string();
#else
        return "file://" + abs.generic_string();
#endif
    }

    std::string format_bytes(std::optional<double> bytes)
    {
        if (!bytes)
            return "N/A";

        constexpr std::array<const char*, 9> suffixes
            = { "B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB", "ZiB", "YiB" };
        double value = bytes.value();
        std::size_t exponent = 0;
        if (value >= 1.0)
        {
            exponent = std::min(static_cast<std::size_t>(std::log(value) / std::log(1024.0)),
                                suffixes.size() - 1);
        }
        value /= std::pow(1024.0, static_cast<double>(exponent));
        return fmt::format("{:.2f}{}", value, suffixes[exponent]);
    }

    std::string format_seconds(std::optional<double> seconds)
    {
        if (!seconds || *seconds < 0)
            return "--:--";

        const auto total = static_cast<long long>(*seconds);
        const long long hours = total / 3600;
        const long long minutes = (total % 3600) / 60;
        const long long secs = total % 60;
        if (hours > 0)
            return fmt::format("{:02}:{:02}:{:02}", hours, minutes, secs);
        return fmt::format("{:02}:{:02}", minutes, secs);
    }
}
