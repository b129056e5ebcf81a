#ifndef FRAGLOADER_CONTEXT_HPP
#define FRAGLOADER_CONTEXT_HPP

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <fragloader/export.hpp>
#include <fragloader/curl.hpp>

namespace fragloader
{
    namespace fs = std::filesystem;

    using proxy_map_type = std::map<std::string, std::string>;

    // Options provided when starting a fragloader context.
    struct ContextOptions
    {
        // If set, specifies which SSL backend to use with CURL.
        std::optional<ssl_backend_t> ssl_backend;
    };

    class FRAGLOADER_API Context
    {
    public:
        int verbosity = 0;

        // ssl options
        bool disable_ssl = false;
        bool ssl_no_revoke = false;
        fs::path ssl_ca_info;

        long connect_timeout = 30L;
        long low_speed_time = 30L;
        long low_speed_limit = 1000L;

        // Rate limit in bytes per second, applied to every fragment transfer.
        long max_speed_limit = -1L;

        // This can improve throughput significantly
        // see https://github.com/curl/curl/issues/9601
        long transfer_buffersize = 100 * 1024;

        // Low-level retries of transient transport errors, within one fragment fetch.
        std::size_t retries = 10;
        std::size_t retry_backoff_factor = 2;
        std::chrono::steady_clock::duration retry_default_timeout = std::chrono::seconds(2);

        // Write fragments straight to their destination instead of a .part file.
        bool nopart = false;
        // Continue partially fetched fragment files with a range request.
        bool continuedl = true;

        // Additional attempts per fragment before it is unavailable.
        // An empty value means retrying forever.
        std::optional<std::size_t> fragment_retries = 10;
        bool skip_unavailable_fragments = true;
        bool keep_fragments = false;

        proxy_map_type proxy_map;

        std::vector<std::string> additional_httpheaders;
        std::string user_agent;

        void set_verbosity(int v);
        void set_log_level(spdlog::level::level_enum);

        // Throws if another instance already exists: there can only be one at any time!
        Context(ContextOptions options = {});
        ~Context();

        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;
        Context(Context&&) = delete;
        Context& operator=(Context&&) = delete;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl;  // Private implementation details
    };

    // "inf" for an unbounded retry budget, the number otherwise.
    FRAGLOADER_API std::string format_retries(const std::optional<std::size_t>& retries);

    // Inverse of format_retries. Throws std::invalid_argument for anything that is not a
    // non-negative count, std::out_of_range when it does not fit.
    FRAGLOADER_API std::optional<std::size_t> parse_retries(const std::string& value);
}

#endif
