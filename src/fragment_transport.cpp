#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <set>
#include <thread>

#include <spdlog/spdlog.h>

#include <fragloader/enums.hpp>
#include <fragloader/fileio.hpp>
#include <fragloader/fragment_transport.hpp>
#include <fragloader/utils.hpp>

#include "curl_internal.hpp"

namespace fragloader
{
    namespace
    {
        // State shared with the curl callbacks for the duration of one perform().
        struct FragmentTransfer
        {
            FileIO* file = nullptr;
            CURL* handle = nullptr;
            const FragmentTransport::progress_callback_t* progress = nullptr;

            // Bytes that were already on disk when the transfer started.
            std::uintmax_t offset = 0;
            bool range_requested = false;

            // Status of the last response seen, 0 for protocols without one.
            long status = 0;
            bool write_failed = false;
            curl_off_t last_reported = -1;

            static std::size_t header_callback(char* buffer,
                                               std::size_t size,
                                               std::size_t nitems,
                                               FragmentTransfer* self);

            static std::size_t write_callback(char* buffer,
                                              std::size_t size,
                                              std::size_t nitems,
                                              FragmentTransfer* self);

            static int progress_callback(FragmentTransfer* self,
                                         curl_off_t total_to_download,
                                         curl_off_t now_downloaded,
                                         curl_off_t /*total_to_upload*/,
                                         curl_off_t /*now_uploaded*/);
        };

        std::size_t FragmentTransfer::header_callback(char* buffer,
                                                      std::size_t size,
                                                      std::size_t nitems,
                                                      FragmentTransfer* self)
        {
            const std::size_t ret = size * nitems;
            std::string_view header(buffer, ret);

            // A new status line starts every response, redirects included.
            if (!starts_with(header, "HTTP/"))
                return ret;

            const auto parts = split(strip(header), " ", 2);
            self->status = parts.size() > 1 ? std::strtol(parts[1].c_str(), nullptr, 10) : 0;

            if (self->range_requested && self->offset > 0 && self->status == 200)
            {
                spdlog::info("Server ignored the range request, restarting {}",
                             self->file->path().string());
                std::error_code ec;
                self->file->truncate(0, ec);
                if (ec)
                {
                    spdlog::error(
                        "Could not truncate {}: {}", self->file->path().string(), ec.message());
                    self->write_failed = true;
                    return 0;
                }
                self->file->seek(0, SEEK_SET);
                self->offset = 0;
            }
            return ret;
        }

        std::size_t FragmentTransfer::write_callback(char* buffer,
                                                     std::size_t size,
                                                     std::size_t nitems,
                                                     FragmentTransfer* self)
        {
            const std::size_t all = size * nitems;

            // Bodies of redirects and error responses are not fragment data
            if (self->status >= 300)
                return all;

            const std::size_t written = self->file->write(buffer, 1, all);
            if (written != all)
            {
                spdlog::error(
                    "Writing file {}: {}", self->file->path().string(), std::strerror(errno));
                self->write_failed = true;
                return 0;
            }
            return written;
        }

        int FragmentTransfer::progress_callback(FragmentTransfer* self,
                                                curl_off_t total_to_download,
                                                curl_off_t now_downloaded,
                                                curl_off_t,
                                                curl_off_t)
        {
            if (self->progress == nullptr || !*self->progress
                || now_downloaded == self->last_reported || self->status >= 300)
            {
                return 0;
            }
            self->last_reported = now_downloaded;

            TransportProgress event;
            event.event = TransferEvent::kDOWNLOADING;
            event.downloaded_bytes = self->offset + static_cast<std::uintmax_t>(now_downloaded);
            if (total_to_download > 0)
            {
                event.total_bytes = self->offset + static_cast<std::uintmax_t>(total_to_download);
            }

            curl_off_t speed = 0;
            if (curl_easy_getinfo(self->handle, CURLINFO_SPEED_DOWNLOAD_T, &speed) == CURLE_OK
                && speed > 0)
            {
                event.speed = static_cast<double>(speed);
            }

            (*self->progress)(event);
            return 0;
        }

        DownloaderError file_error(const std::string& what,
                                   const fs::path& path,
                                   std::error_code ec)
        {
            return DownloaderError{ ErrorLevel::FATAL,
                                    ErrorCode::PD_FILE,
                                    fmt::format("{} {}: {}", what, path.string(), ec.message()) };
        }

        bool is_transient_status(long status)
        {
            return status / 100 == 5 || status == 408 || status == 429;
        }

        DownloaderError curl_code_error(CURLcode code,
                                        const std::string& url,
                                        const char* error_message)
        {
            std::string error = fmt::format("CURL error ({}): {} for {} [{}]",
                                            static_cast<int>(code),
                                            curl_easy_strerror(code),
                                            url,
                                            error_message);
            switch (code)
            {
                case CURLE_OPERATION_TIMEDOUT:
                case CURLE_COULDNT_CONNECT:
                case CURLE_RECV_ERROR:
                case CURLE_SEND_ERROR:
                case CURLE_PARTIAL_FILE:
                case CURLE_GOT_NOTHING:
                    return DownloaderError{
                        ErrorLevel::SERIOUS, ErrorCode::PD_TEMPORARYERR, error
                    };
                case CURLE_ABORTED_BY_CALLBACK:
                case CURLE_BAD_FUNCTION_ARGUMENT:
                case CURLE_COULDNT_RESOLVE_PROXY:
                case CURLE_FILESIZE_EXCEEDED:
                case CURLE_INTERFACE_FAILED:
                case CURLE_NOT_BUILT_IN:
                case CURLE_OUT_OF_MEMORY:
                case CURLE_SSL_CACERT_BADFILE:
                case CURLE_SSL_CRL_BADFILE:
                case CURLE_WRITE_ERROR:
                    return DownloaderError{ ErrorLevel::FATAL, ErrorCode::PD_CURL, error };
                default:
                    return DownloaderError{ ErrorLevel::INFO, ErrorCode::PD_CURL, error };
            }
        }
    }

    CurlFragmentTransport::CurlFragmentTransport(const Context& ctx)
        : m_ctx(ctx)
    {
    }

    bool CurlFragmentTransport::is_transient(const DownloaderError& error) noexcept
    {
        return error.code == ErrorCode::PD_TEMPORARYERR;
    }

    std::chrono::steady_clock::duration CurlFragmentTransport::backoff(std::size_t attempt) const
    {
        auto wait = m_ctx.retry_default_timeout;
        for (std::size_t i = 1; i < attempt; ++i)
        {
            wait *= static_cast<std::chrono::steady_clock::rep>(m_ctx.retry_backoff_factor);
        }
        return wait;
    }

    std::vector<std::string> CurlFragmentTransport::merge_headers(
        const FragmentLocator& locator) const
    {
        std::set<std::string> overridden;
        for (const auto& header : locator.headers)
        {
            overridden.insert(parse_header(header).first);
        }

        std::vector<std::string> res;
        for (const auto& header : m_ctx.additional_httpheaders)
        {
            if (overridden.count(parse_header(header).first) == 0)
                res.push_back(header);
        }
        res.insert(res.end(), locator.headers.begin(), locator.headers.end());
        return res;
    }

    tl::expected<void, DownloaderError> CurlFragmentTransport::fetch(
        const FragmentLocator& locator,
        const fs::path& destination,
        const progress_callback_t& progress)
    {
        for (std::size_t attempt = 1;; ++attempt)
        {
            auto result = fetch_once(locator, destination, progress);
            if (result || !is_transient(result.error()) || attempt > m_ctx.retries)
            {
                return result;
            }

            const auto wait = backoff(attempt);
            spdlog::warn("{}. Retrying in {} ms (attempt {} of {})",
                         result.error().reason,
                         std::chrono::duration_cast<std::chrono::milliseconds>(wait).count(),
                         attempt,
                         m_ctx.retries);
            std::this_thread::sleep_for(wait);
        }
    }

    tl::expected<void, DownloaderError> CurlFragmentTransport::fetch_once(
        const FragmentLocator& locator,
        const fs::path& destination,
        const progress_callback_t& progress)
    {
        const fs::path target
            = m_ctx.nopart ? destination : fs::path(destination.string() + PARTEXT);

        std::error_code ec;
        std::uintmax_t offset = 0;
        if (m_ctx.continuedl && fs::is_regular_file(target, ec))
        {
            offset = fs::file_size(target, ec);
            if (ec)
            {
                return tl::unexpected(file_error("Could not stat", target, ec));
            }
        }

        FileIO file(target, offset > 0 ? FileIO::append_binary : FileIO::write_binary, ec);
        if (ec)
        {
            return tl::unexpected(file_error("Could not open", target, ec));
        }

        FragmentTransfer transfer;
        transfer.file = &file;
        transfer.progress = &progress;
        transfer.offset = offset;

        CURLcode code = CURLE_OK;
        Response response;
        std::string error_message;
        try
        {
            CURLHandle h(m_ctx, locator.url);
            if (!m_ctx.user_agent.empty())
            {
                h.user_agent(m_ctx.user_agent);
            }
            h.add_headers(merge_headers(locator));

            if (offset > 0)
            {
                spdlog::info("Resuming {} from offset {}", target.string(), offset);
                h.setopt(CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(offset));
                transfer.range_requested = true;
            }

            h.setopt(CURLOPT_HEADERFUNCTION, &FragmentTransfer::header_callback);
            h.setopt(CURLOPT_HEADERDATA, &transfer);
            h.setopt(CURLOPT_WRITEFUNCTION, &FragmentTransfer::write_callback);
            h.setopt(CURLOPT_WRITEDATA, &transfer);

            if (progress)
            {
                h.setopt(CURLOPT_XFERINFOFUNCTION, &FragmentTransfer::progress_callback);
                h.setopt(CURLOPT_XFERINFODATA, &transfer);
                h.setopt(CURLOPT_NOPROGRESS, 0L);
            }

            transfer.handle = h.handle();
            code = h.perform();
            response.fill_values(h);
            error_message = h.error_message();
        }
        catch (const curl_error& e)
        {
            return tl::unexpected(
                DownloaderError{ ErrorLevel::FATAL, ErrorCode::PD_CURLSETOPT, e.what() });
        }

        if (transfer.write_failed)
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL,
                ErrorCode::PD_FILE,
                fmt::format("Could not write {}: {}", target.string(), std::strerror(errno)) });
        }

        if (code != CURLE_OK)
        {
            auto error = curl_code_error(code, locator.url, error_message.c_str());
            spdlog::error(error.reason);
            return tl::unexpected(error);
        }

        if (!response.ok())
        {
            if (response.http_status == 416 && transfer.offset > 0)
            {
                // The partial file doesn't match the remote one anymore, start over.
                file.truncate(0, ec);
                if (ec)
                {
                    return tl::unexpected(file_error("Could not truncate", target, ec));
                }
                return tl::unexpected(DownloaderError{
                    ErrorLevel::SERIOUS,
                    ErrorCode::PD_TEMPORARYERR,
                    fmt::format("Range not satisfiable for {}, restarting", locator.url) });
            }

            const auto status_code = is_transient_status(response.http_status)
                                         ? ErrorCode::PD_TEMPORARYERR
                                         : ErrorCode::PD_BADSTATUS;
            return tl::unexpected(DownloaderError{
                ErrorLevel::SERIOUS,
                status_code,
                fmt::format(
                    "HTTP Error {} for {}", response.http_status, response.effective_url) });
        }

        file.close(ec);
        if (ec)
        {
            return tl::unexpected(file_error("Could not close", target, ec));
        }

        if (target != destination)
        {
            fs::rename(target, destination, ec);
            if (ec)
            {
                return tl::unexpected(file_error("Could not rename to", destination, ec));
            }
        }

        const std::uintmax_t size = fs::file_size(destination, ec);
        if (ec)
        {
            return tl::unexpected(file_error("Could not stat", destination, ec));
        }
        spdlog::debug("Fetched {} ({} transferred at {}/s)",
                      locator.url,
                      format_bytes(static_cast<double>(response.downloaded_size)),
                      format_bytes(static_cast<double>(response.average_speed)));

        if (progress)
        {
            TransportProgress event;
            event.event = TransferEvent::kFINISHED;
            event.downloaded_bytes = size;
            event.total_bytes = size;
            progress(event);
        }
        return {};
    }
}
