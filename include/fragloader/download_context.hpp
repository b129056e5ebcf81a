#ifndef FRAGLOADER_DOWNLOAD_CONTEXT_HPP
#define FRAGLOADER_DOWNLOAD_CONTEXT_HPP

#include <filesystem>

#include <fragloader/enums.hpp>
#include <fragloader/fragment.hpp>
#include <fragloader/progress.hpp>

namespace fragloader
{
    namespace fs = std::filesystem;

    // Mutable state of one download session. Owned by the FragmentDownloader and
    // handed by reference to the parts that need it, never shared between sessions.
    struct DownloadContext
    {
        fs::path filename;
        fs::path tmpfilename;
        SessionKind session = FiniteSession{};
        SessionState state = SessionState::kINIT;
        ProgressState progress;

        bool live() const noexcept
        {
            return is_live(session);
        }

        std::optional<std::size_t> total_fragments() const noexcept
        {
            return fragment_count(session);
        }

        std::size_t fragment_index() const noexcept
        {
            return progress.fragment_index;
        }

        // Whether the checkpoint sidecar is maintained for this session.
        bool resumable() const
        {
            return !live() && filename != "-";
        }
    };
}

#endif
