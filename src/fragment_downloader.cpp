#include <spdlog/spdlog.h>

#include <fragloader/fragment_downloader.hpp>
#include <fragloader/utils.hpp>

namespace fragloader
{
    namespace
    {
        ProgressAggregator::clock::time_point now()
        {
            return ProgressAggregator::clock::now();
        }

        // Local failures are not worth another attempt at the same fragment
        bool is_local_error(const DownloaderError& error)
        {
            return error.code == ErrorCode::PD_IO || error.code == ErrorCode::PD_FILE;
        }
    }

    FragmentDownloader::FragmentDownloader(const Context& ctx,
                                           FragmentTransport& transport,
                                           FragmentSequence& fragments,
                                           fs::path output,
                                           DownloadObserver* observer)
        : m_ctx(ctx)
        , m_transport(transport)
        , m_fragments(fragments)
        , m_output(std::move(output))
        , m_observer(observer)
        , m_assembler(m_store)
    {
        m_download.filename = m_output;
        m_download.tmpfilename = FragmentAssembler::temp_name(m_output);
        m_download.session = m_fragments.kind();
    }

    void FragmentDownloader::request_stop() noexcept
    {
        m_stop_requested = true;
    }

    void FragmentDownloader::set_state(SessionState state)
    {
        m_download.state = state;
    }

    tl::expected<std::uintmax_t, DownloaderError> FragmentDownloader::abort(
        const DownloaderError& error)
    {
        set_state(SessionState::kABORTED);
        // Everything appended so far is synced, the partial output stays for a later resume
        m_stream.file.reset();
        error.log();
        return tl::unexpected(error);
    }

    void FragmentDownloader::apply(const TransportProgress& event)
    {
        auto step = ProgressAggregator::reduce(m_download, event, now());
        m_download.progress = step.state;
        if (m_observer)
        {
            m_observer->on_progress(step.snapshot);
        }
    }

    void FragmentDownloader::on_transport_progress(const TransportProgress& progress)
    {
        TransportProgress event = progress;
        if (event.event == TransferEvent::kFINISHED)
        {
            // The fragment only counts as finished once it is in the output
            event.event = TransferEvent::kDOWNLOADING;
        }
        else if (event.event != TransferEvent::kDOWNLOADING)
        {
            return;
        }
        apply(event);
    }

    tl::expected<void, DownloaderError> FragmentDownloader::initialize()
    {
        const auto count = m_download.total_fragments();
        if (count)
        {
            spdlog::info("Total fragments: {}", count.value());
        }
        else
        {
            spdlog::info("Total fragments: unknown (live)");
        }
        spdlog::info("Destination: {}", m_output.string());

        std::size_t start_index = 0;
        if (m_download.resumable())
        {
            auto loaded = m_store.load(m_output);
            if (!loaded)
            {
                return tl::unexpected(loaded.error());
            }

            if (loaded.value())
            {
                start_index = loaded.value()->current_fragment_index;
                if (count && start_index > count.value())
                {
                    return tl::unexpected(DownloaderError{
                        ErrorLevel::FATAL,
                        ErrorCode::PD_CORRUPTCHECKPOINT,
                        fmt::format("Resume checkpoint points at fragment {} of a {} fragment "
                                    "stream",
                                    start_index,
                                    count.value()) });
                }
            }
            else
            {
                auto saved = m_store.save(m_output, ResumeCheckpoint{ 0 });
                if (!saved)
                {
                    return tl::unexpected(saved.error());
                }
            }
        }

        auto stream = m_assembler.open(m_output, start_index);
        if (!stream)
        {
            return tl::unexpected(stream.error());
        }
        m_stream = std::move(stream.value());

        if (start_index > 0)
        {
            spdlog::info("Resuming at fragment {} ({} already downloaded)",
                         start_index,
                         format_bytes(static_cast<double>(m_stream.resume_length)));
            set_state(SessionState::kRESUMED);
        }
        else
        {
            set_state(SessionState::kFRESH);
        }

        m_download.progress = ProgressAggregator::start(start_index, m_stream.resume_length, now());
        if (m_observer)
        {
            m_observer->on_progress(ProgressAggregator::snapshot(m_download, now()));
        }
        return {};
    }

    tl::expected<void, DownloaderError> FragmentDownloader::append_fragment(
        std::size_t index, const fs::path& fragment_file, std::size_t attempts)
    {
        set_state(SessionState::kAPPENDING);

        auto written = m_assembler.append(m_stream, fragment_file);
        if (!written)
        {
            return tl::unexpected(written.error().with_fragment(index, attempts));
        }

        TransportProgress done;
        done.event = TransferEvent::kFINISHED;
        done.downloaded_bytes = written.value();
        done.total_bytes = written.value();
        apply(done);

        // A checkpoint past zero must never exist next to an empty output
        if (m_download.resumable() && m_stream.length > 0)
        {
            auto saved
                = m_store.save(m_output, ResumeCheckpoint{ m_download.fragment_index() });
            if (!saved)
            {
                return tl::unexpected(saved.error().with_fragment(index, attempts));
            }
        }

        m_assembler.discard_fragment(fragment_file, m_ctx.keep_fragments);
        return {};
    }

    tl::expected<FragmentDownloader::FragmentOutcome, DownloaderError>
    FragmentDownloader::process_fragment(std::size_t index, const FragmentLocator& locator)
    {
        const fs::path fragment_file = FragmentAssembler::fragment_path(m_stream.temp_path, index);
        const auto& retries = m_ctx.fragment_retries;

        std::size_t attempt = 0;
        while (true)
        {
            set_state(attempt == 0 ? SessionState::kFETCHING_FRAGMENT
                                   : SessionState::kRETRYING_FRAGMENT);
            ++attempt;

            auto fetched = m_transport.fetch(
                locator, fragment_file, [this](const TransportProgress& progress) {
                    on_transport_progress(progress);
                });

            if (fetched)
            {
                auto appended = append_fragment(index, fragment_file, attempt);
                if (!appended)
                {
                    return tl::unexpected(appended.error());
                }
                return FragmentOutcome::kAPPENDED;
            }

            const DownloaderError& error = fetched.error();

            TransportProgress reset;
            reset.event = TransferEvent::kRESET;
            apply(reset);

            if (is_local_error(error))
            {
                return tl::unexpected(error.with_fragment(index, attempt));
            }

            if (!retries || attempt - 1 < retries.value())
            {
                if (m_stop_requested)
                {
                    if (m_download.live())
                    {
                        m_assembler.discard_fragment(fragment_file, false);
                        return FragmentOutcome::kSTOPPED;
                    }
                    return tl::unexpected(
                        DownloaderError{
                            ErrorLevel::FATAL, ErrorCode::PD_INTERRUPTED, "Download interrupted" }
                            .with_fragment(index, attempt));
                }

                spdlog::warn(
                    "Got server HTTP error: {}. Retrying fragment {} (attempt {} of {})...",
                    error.reason,
                    index,
                    attempt,
                    format_retries(retries));
                if (m_observer)
                {
                    m_observer->on_fragment_retry(error, index, attempt, retries);
                }
                continue;
            }

            if (!m_ctx.skip_unavailable_fragments)
            {
                return tl::unexpected(
                    DownloaderError{
                        ErrorLevel::FATAL,
                        ErrorCode::PD_FRAGMENTUNAVAILABLE,
                        fmt::format("Giving up on fragment {}: {}", index, error.reason) }
                        .with_fragment(index, attempt));
            }

            set_state(SessionState::kSKIPPING_FRAGMENT);
            spdlog::warn("Skipping fragment {}...", index);
            m_assembler.discard_fragment(fragment_file, false);

            TransportProgress skipped;
            skipped.event = TransferEvent::kSKIPPED;
            apply(skipped);

            // While the output is still empty the checkpoint has to stay at zero
            if (m_download.resumable() && m_stream.length > 0)
            {
                auto saved
                    = m_store.save(m_output, ResumeCheckpoint{ m_download.fragment_index() });
                if (!saved)
                {
                    return tl::unexpected(saved.error().with_fragment(index, attempt));
                }
            }

            if (m_observer)
            {
                m_observer->on_fragment_skip(index);
            }
            return FragmentOutcome::kSKIPPED;
        }
    }

    tl::expected<std::uintmax_t, DownloaderError> FragmentDownloader::download()
    {
        if (m_download.state != SessionState::kINIT)
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL, ErrorCode::PD_BADFUNCARG, "Download was already started" });
        }

        auto initialized = initialize();
        if (!initialized)
        {
            return abort(initialized.error());
        }

        const auto count = m_download.total_fragments();
        while (!count || m_download.fragment_index() < count.value())
        {
            const std::size_t index = m_download.fragment_index();
            if (m_stop_requested)
            {
                if (m_download.live())
                {
                    spdlog::info("Stop requested, finishing live stream at fragment {}", index);
                    break;
                }
                return abort(
                    DownloaderError{
                        ErrorLevel::FATAL, ErrorCode::PD_INTERRUPTED, "Download interrupted" }
                        .with_fragment(index, 0));
            }

            auto locator = m_fragments.at(index);
            if (!locator)
            {
                if (m_download.live())
                {
                    spdlog::info("Live stream ended after {} fragments", index);
                    break;
                }
                return abort(DownloaderError{
                    ErrorLevel::FATAL,
                    ErrorCode::PD_UNFINISHED,
                    fmt::format("Fragment {} of {} is missing", index, count.value()) });
            }

            auto outcome = process_fragment(index, locator.value());
            if (!outcome)
            {
                return abort(outcome.error());
            }
            if (outcome.value() == FragmentOutcome::kSTOPPED)
            {
                break;
            }
        }

        set_state(SessionState::kFINALIZING);
        auto size = m_assembler.finalize(m_stream);
        if (!size)
        {
            return abort(size.error());
        }

        set_state(SessionState::kDONE);
        if (m_observer)
        {
            m_observer->on_progress(ProgressAggregator::finished(m_download, size.value(), now()));
        }
        spdlog::info("Downloaded {} ({})",
                     m_output.string(),
                     format_bytes(static_cast<double>(size.value())));
        return size.value();
    }
}
