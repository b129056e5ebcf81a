#include <spdlog/spdlog.h>

#include <fragloader/enums.hpp>
#include <fragloader/fragment_assembler.hpp>

namespace fragloader
{
    namespace
    {
        DownloaderError io_error(const std::string& what, const fs::path& path, std::error_code ec)
        {
            return DownloaderError{ ErrorLevel::FATAL,
                                    ErrorCode::PD_IO,
                                    fmt::format("{} {}: {}", what, path.string(), ec.message()) };
        }
    }

    FragmentAssembler::FragmentAssembler(const ResumeStateStore& store)
        : m_store(store)
    {
    }

    fs::path FragmentAssembler::temp_name(const fs::path& output)
    {
        if (output == "-")
            return output;
        return fs::path(output.string() + PARTEXT);
    }

    fs::path FragmentAssembler::fragment_path(const fs::path& temp_path, std::size_t index)
    {
        return fs::path(fmt::format("{}{}{}", temp_path.string(), FRAGEXT, index));
    }

    tl::expected<AssemblerStream, DownloaderError> FragmentAssembler::open(
        const fs::path& output, std::size_t checkpoint_index) const
    {
        AssemblerStream stream;
        stream.output_path = output;
        stream.temp_path = temp_name(output);

        if (stream.to_stdout())
        {
            if (checkpoint_index != 0)
            {
                return tl::unexpected(DownloaderError{
                    ErrorLevel::FATAL,
                    ErrorCode::PD_RESUMEMISMATCH,
                    "Cannot resume a download written to standard output" });
            }
            stream.file = std::make_unique<FileIO>(FileIO::standard_output());
            return stream;
        }

        std::error_code ec;
        const bool resuming = fs::is_regular_file(stream.temp_path, ec);
        if (resuming)
        {
            stream.resume_length = fs::file_size(stream.temp_path, ec);
            if (ec)
            {
                return tl::unexpected(io_error("Could not stat", stream.temp_path, ec));
            }
        }

        if ((checkpoint_index > 0) != (stream.resume_length > 0))
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL,
                ErrorCode::PD_RESUMEMISMATCH,
                fmt::format("Resume checkpoint is at fragment {} but {} holds {} bytes. Remove "
                            "both to restart the download",
                            checkpoint_index,
                            stream.temp_path.string(),
                            stream.resume_length) });
        }

        const auto open_mode = resuming ? FileIO::append_binary : FileIO::write_binary;
        if (resuming)
        {
            spdlog::info("Resuming {} at byte {}", stream.temp_path.string(), stream.resume_length);
        }

        stream.file = std::make_unique<FileIO>(stream.temp_path, open_mode, ec);
        if (ec)
        {
            return tl::unexpected(io_error("Could not open", stream.temp_path, ec));
        }
        stream.length = stream.resume_length;
        return stream;
    }

    tl::expected<std::uintmax_t, DownloaderError> FragmentAssembler::append(
        AssemblerStream& stream, const fs::path& fragment_file) const
    {
        if (!stream.file || !stream.file->open())
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL, ErrorCode::PD_BADFUNCARG, "Output stream is not open" });
        }

        std::error_code ec;
        FileIO fragment(fragment_file, FileIO::read_binary, ec);
        if (ec)
        {
            return tl::unexpected(io_error("Could not open fragment", fragment_file, ec));
        }

        const std::uintmax_t written = stream.file->copy_from(fragment, ec);
        if (ec)
        {
            auto error = io_error("Could not append to", stream.temp_path, ec);
            rollback(stream);
            return tl::unexpected(error);
        }

        stream.file->sync(ec);
        if (ec)
        {
            auto error = io_error("Could not sync", stream.temp_path, ec);
            rollback(stream);
            return tl::unexpected(error);
        }

        stream.length += written;
        spdlog::debug("Appended {} bytes from {}", written, fragment_file.string());
        return written;
    }

    void FragmentAssembler::rollback(AssemblerStream& stream) const
    {
        if (stream.to_stdout())
            return;

        // Close first: bytes still sitting in the stdio buffer must not reach
        // the file after it was cut back.
        std::error_code ec;
        stream.file->close(ec);
        stream.file.reset();
        if (ec)
        {
            spdlog::debug(
                "Dropped unwritten bytes of {}: {}", stream.temp_path.string(), ec.message());
        }

        fs::resize_file(stream.temp_path, stream.length, ec);
        if (ec)
        {
            spdlog::error("Could not cut {} back to {} bytes: {}",
                          stream.temp_path.string(),
                          stream.length,
                          ec.message());
            return;
        }

        auto file = std::make_unique<FileIO>(stream.temp_path, FileIO::append_binary, ec);
        if (ec)
        {
            spdlog::error("Could not reopen {}: {}", stream.temp_path.string(), ec.message());
            return;
        }
        stream.file = std::move(file);
    }

    void FragmentAssembler::discard_fragment(const fs::path& fragment_file, bool keep) const
    {
        if (keep)
            return;

        // A failed fetch can leave its partial transfer behind
        for (const auto& path : { fragment_file, fs::path(fragment_file.string() + PARTEXT) })
        {
            std::error_code ec;
            fs::remove(path, ec);
            if (ec)
            {
                spdlog::warn("Could not remove fragment file {}: {}", path.string(), ec.message());
            }
        }
    }

    tl::expected<std::uintmax_t, DownloaderError> FragmentAssembler::finalize(
        AssemblerStream& stream) const
    {
        std::error_code ec;
        if (stream.file)
        {
            stream.file->close(ec);
            stream.file.reset();
            if (ec)
            {
                return tl::unexpected(io_error("Could not close", stream.temp_path, ec));
            }
        }

        if (stream.to_stdout())
        {
            return stream.length;
        }

        fs::rename(stream.temp_path, stream.output_path, ec);
        if (ec)
        {
            return tl::unexpected(io_error("Could not rename to", stream.output_path, ec));
        }

        auto cleared = m_store.clear(stream.output_path);
        if (!cleared)
        {
            return tl::unexpected(cleared.error());
        }

        const std::uintmax_t size = fs::file_size(stream.output_path, ec);
        if (ec)
        {
            return tl::unexpected(io_error("Could not stat", stream.output_path, ec));
        }
        return size;
    }
}
