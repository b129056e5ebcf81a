#ifndef FRAGLOADER_FRAGMENT_TRANSPORT_HPP
#define FRAGLOADER_FRAGMENT_TRANSPORT_HPP

#include <chrono>
#include <filesystem>
#include <functional>

#include <tl/expected.hpp>

#include <fragloader/export.hpp>
#include <fragloader/context.hpp>
#include <fragloader/errors.hpp>
#include <fragloader/fragment.hpp>
#include <fragloader/progress.hpp>

namespace fragloader
{
    namespace fs = std::filesystem;

    // Fetches a single fragment to a local file.
    class FRAGLOADER_API FragmentTransport
    {
    public:
        using progress_callback_t = std::function<void(const TransportProgress&)>;

        virtual ~FragmentTransport() = default;

        // On success the complete fragment is at `destination`.
        // `progress` (may be empty) is invoked inline while the transfer runs.
        virtual tl::expected<void, DownloaderError> fetch(const FragmentLocator& locator,
                                                          const fs::path& destination,
                                                          const progress_callback_t& progress)
            = 0;
    };

    class FRAGLOADER_API CurlFragmentTransport : public FragmentTransport
    {
    public:
        explicit CurlFragmentTransport(const Context& ctx);

        tl::expected<void, DownloaderError> fetch(const FragmentLocator& locator,
                                                  const fs::path& destination,
                                                  const progress_callback_t& progress) override;

        // Whether another attempt at the same transfer might succeed.
        static bool is_transient(const DownloaderError& error) noexcept;

        // Delay before transport-level retry number `attempt` (1-based).
        std::chrono::steady_clock::duration backoff(std::size_t attempt) const;

        // Context-wide headers first, then the locator's. A locator header
        // replaces a context header with the same name.
        std::vector<std::string> merge_headers(const FragmentLocator& locator) const;

    private:
        tl::expected<void, DownloaderError> fetch_once(const FragmentLocator& locator,
                                                       const fs::path& destination,
                                                       const progress_callback_t& progress);

        const Context& m_ctx;
    };
}

#endif
