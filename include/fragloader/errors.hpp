#ifndef FRAGLOADER_ERRORS_HPP
#define FRAGLOADER_ERRORS_HPP

#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include <fragloader/enums.hpp>

namespace fragloader
{
    struct DownloaderError
    {
        ErrorLevel level;
        ErrorCode code;
        std::string reason;

        // Set when the error is tied to one fragment of the stream.
        std::optional<std::size_t> fragment_index = std::nullopt;
        std::size_t attempts = 0;

        bool is_fatal() const noexcept
        {
            return level == ErrorLevel::FATAL;
        }

        DownloaderError with_fragment(std::size_t index, std::size_t attempt_count) const
        {
            DownloaderError res = *this;
            res.fragment_index = index;
            res.attempts = attempt_count;
            return res;
        }

        std::string to_string() const
        {
            if (fragment_index)
            {
                return fmt::format(
                    "{} (fragment {}, {} attempt(s))", reason, fragment_index.value(), attempts);
            }
            return reason;
        }

        void log() const
        {
            switch (level)
            {
                case ErrorLevel::FATAL:
                    spdlog::critical(to_string());
                    break;
                case ErrorLevel::SERIOUS:
                    spdlog::error(to_string());
                    break;
                default:
                    spdlog::warn(to_string());
            }
        }
    };
}

#endif
