#ifndef FRAGLOADER_RESUME_STATE_HPP
#define FRAGLOADER_RESUME_STATE_HPP

#include <filesystem>
#include <optional>

#include <tl/expected.hpp>

#include <fragloader/export.hpp>
#include <fragloader/errors.hpp>

namespace fragloader
{
    namespace fs = std::filesystem;

    // Next fragment to fetch. Every fragment below it is already in the output.
    struct ResumeCheckpoint
    {
        std::size_t current_fragment_index = 0;
    };

    inline bool operator==(const ResumeCheckpoint& lhs, const ResumeCheckpoint& rhs)
    {
        return lhs.current_fragment_index == rhs.current_fragment_index;
    }

    // Keeps the resume checkpoint of an output file in a JSON sidecar next to it:
    //     {"download": {"current_fragment_index": 3}}
    class FRAGLOADER_API ResumeStateStore
    {
    public:
        static fs::path sidecar_path(const fs::path& output);

        // None when there is no sidecar (fresh download).
        tl::expected<std::optional<ResumeCheckpoint>, DownloaderError> load(
            const fs::path& output) const;

        // Replaces the sidecar. The new content is synced to disk before it becomes
        // visible under the sidecar name.
        tl::expected<void, DownloaderError> save(const fs::path& output,
                                                 const ResumeCheckpoint& checkpoint) const;

        tl::expected<void, DownloaderError> clear(const fs::path& output) const;
    };
}

#endif
