#ifndef FRAGLOADER_FRAGMENT_ASSEMBLER_HPP
#define FRAGLOADER_FRAGMENT_ASSEMBLER_HPP

#include <filesystem>
#include <memory>

#include <tl/expected.hpp>

#include <fragloader/export.hpp>
#include <fragloader/errors.hpp>
#include <fragloader/fileio.hpp>
#include <fragloader/resume_state.hpp>

namespace fragloader
{
    namespace fs = std::filesystem;

    // The output being assembled.
    struct AssemblerStream
    {
        std::unique_ptr<FileIO> file;
        fs::path output_path;
        fs::path temp_path;
        // Bytes that were already in the temp file when it was opened.
        std::uintmax_t resume_length = 0;
        // Current length of the assembled output.
        std::uintmax_t length = 0;

        bool to_stdout() const noexcept
        {
            return output_path == "-";
        }
    };

    class FRAGLOADER_API FragmentAssembler
    {
    public:
        explicit FragmentAssembler(const ResumeStateStore& store);

        // Name of the file the output is assembled in, `-` (stdout) is kept as is.
        static fs::path temp_name(const fs::path& output);
        // Name a fragment is fetched to before it is appended.
        static fs::path fragment_path(const fs::path& temp_path, std::size_t index);

        // Opens the temp output, appending to it when it already exists.
        // The size found on disk must agree with `checkpoint_index`: both zero or
        // both non-zero, anything else is a PD_RESUMEMISMATCH.
        tl::expected<AssemblerStream, DownloaderError> open(const fs::path& output,
                                                            std::size_t checkpoint_index) const;

        // Appends the content of `fragment_file` and syncs the output.
        // Returns the number of bytes appended. On failure the output is cut
        // back to the length it had before the call.
        tl::expected<std::uintmax_t, DownloaderError> append(AssemblerStream& stream,
                                                             const fs::path& fragment_file) const;

        // Removes a fragment file (and what is left of its transfer) once it is
        // no longer needed.
        void discard_fragment(const fs::path& fragment_file, bool keep) const;

        // Closes the output, moves it to its final name and drops the resume sidecar.
        // Returns the final size.
        tl::expected<std::uintmax_t, DownloaderError> finalize(AssemblerStream& stream) const;

    private:
        void rollback(AssemblerStream& stream) const;

        const ResumeStateStore& m_store;
    };
}

#endif
