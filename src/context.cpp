#include <fragloader/context.hpp>

#include <atomic>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include <fragloader/utils.hpp>

#include "./curl_internal.hpp"


namespace fragloader
{
    struct Context::Impl
    {
        std::optional<details::CURLSetup> curl_setup;
    };

    static std::atomic<bool> is_context_alive{ false };

    Context::Context(ContextOptions options)
        : impl(new Impl)
    {
        bool expected = false;
        if (!is_context_alive.compare_exchange_strong(expected, true))
            throw std::runtime_error(
                "fragloader::Context created more than once - instance must be unique");

        try
        {
            impl->curl_setup.emplace(options.ssl_backend);
        }
        catch (...)
        {
            is_context_alive = false;
            throw;
        }

        set_verbosity(0);
    }

    Context::~Context()
    {
        is_context_alive = false;
    }

    void Context::set_verbosity(int v)
    {
        verbosity = v;
        if (v > 2)
        {
            spdlog::set_level(spdlog::level::warn);
        }
        else if (v > 0)
        {
            spdlog::set_level(spdlog::level::debug);
        }
        else
        {
            spdlog::set_level(spdlog::level::off);
        }
    }

    void Context::set_log_level(spdlog::level::level_enum log_level)
    {
        spdlog::set_level(log_level);
    }

    std::string format_retries(const std::optional<std::size_t>& retries)
    {
        if (!retries)
            return "inf";
        return std::to_string(retries.value());
    }

    std::optional<std::size_t> parse_retries(const std::string& value)
    {
        const std::string count = strip(value);
        if (count == "inf" || count == "infinite")
            return std::nullopt;

        // stoul wraps a leading minus sign around instead of rejecting it
        if (count.empty() || count.find_first_not_of("0123456789") != std::string::npos)
            throw std::invalid_argument(fmt::format("'{}' is not a retry count", value));
        return static_cast<std::size_t>(std::stoul(count));
    }
}
