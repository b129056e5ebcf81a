#include <cerrno>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fragloader/enums.hpp>
#include <fragloader/fileio.hpp>
#include <fragloader/resume_state.hpp>

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

        DownloaderError corrupt(const fs::path& path, const std::string& why)
        {
            return DownloaderError{
                ErrorLevel::FATAL,
                ErrorCode::PD_CORRUPTCHECKPOINT,
                fmt::format("Resume file {} is corrupt ({}). Remove it and the partial output "
                            "to restart the download",
                            path.string(),
                            why)
            };
        }
    }

    fs::path ResumeStateStore::sidecar_path(const fs::path& output)
    {
        return fs::path(output.string() + RESUMEEXT);
    }

    tl::expected<std::optional<ResumeCheckpoint>, DownloaderError> ResumeStateStore::load(
        const fs::path& output) const
    {
        const fs::path sidecar = sidecar_path(output);

        std::error_code ec;
        const auto status = fs::status(sidecar, ec);
        if (status.type() == fs::file_type::not_found)
        {
            return std::optional<ResumeCheckpoint>{};
        }
        if (ec)
        {
            return tl::unexpected(io_error("Could not stat", sidecar, ec));
        }
        if (!fs::is_regular_file(status))
        {
            return tl::unexpected(corrupt(sidecar, "not a regular file"));
        }

        std::ifstream stream(sidecar, std::ios::binary);
        if (!stream)
        {
            return tl::unexpected(corrupt(sidecar, "cannot be opened"));
        }
        std::stringstream buffer;
        buffer << stream.rdbuf();

        nlohmann::json j;
        try
        {
            j = nlohmann::json::parse(buffer.str());
        }
        catch (const nlohmann::json::parse_error& e)
        {
            return tl::unexpected(corrupt(sidecar, e.what()));
        }

        if (!j.is_object() || !j.contains("download") || !j["download"].is_object())
        {
            return tl::unexpected(corrupt(sidecar, "missing 'download' object"));
        }
        const auto& index = j["download"]["current_fragment_index"];
        if (!index.is_number_unsigned())
        {
            return tl::unexpected(
                corrupt(sidecar, "'current_fragment_index' is not a non-negative integer"));
        }

        ResumeCheckpoint checkpoint{ index.get<std::size_t>() };
        spdlog::debug("Loaded resume checkpoint {} from {}",
                      checkpoint.current_fragment_index,
                      sidecar.string());
        return std::optional<ResumeCheckpoint>{ checkpoint };
    }

    tl::expected<void, DownloaderError> ResumeStateStore::save(
        const fs::path& output, const ResumeCheckpoint& checkpoint) const
    {
        const fs::path sidecar = sidecar_path(output);
        const fs::path staging = fs::path(sidecar.string() + ".tmp");

        nlohmann::json j;
        j["download"]["current_fragment_index"] = checkpoint.current_fragment_index;
        const std::string content = j.dump();

        std::error_code ec;
        {
            FileIO file(staging, FileIO::write_binary, ec);
            if (ec)
            {
                return tl::unexpected(io_error("Could not open", staging, ec));
            }
            if (file.write(content.data(), 1, content.size()) != content.size())
            {
                return tl::unexpected(io_error(
                    "Could not write", staging, std::error_code(errno, std::generic_category())));
            }
            file.sync(ec);
            if (ec)
            {
                return tl::unexpected(io_error("Could not sync", staging, ec));
            }
            file.close(ec);
            if (ec)
            {
                return tl::unexpected(io_error("Could not close", staging, ec));
            }
        }

        fs::rename(staging, sidecar, ec);
        if (ec)
        {
            return tl::unexpected(io_error("Could not replace", sidecar, ec));
        }
        return {};
    }

    tl::expected<void, DownloaderError> ResumeStateStore::clear(const fs::path& output) const
    {
        const fs::path sidecar = sidecar_path(output);
        std::error_code ec;
        fs::remove(sidecar, ec);
        if (ec)
        {
            return tl::unexpected(io_error("Could not remove", sidecar, ec));
        }
        return {};
    }
}
