#ifndef FRAGLOADER_FRAGMENT_DOWNLOADER_HPP
#define FRAGLOADER_FRAGMENT_DOWNLOADER_HPP

#include <atomic>
#include <filesystem>
#include <optional>

#include <tl/expected.hpp>

#include <fragloader/export.hpp>
#include <fragloader/context.hpp>
#include <fragloader/download_context.hpp>
#include <fragloader/errors.hpp>
#include <fragloader/fragment.hpp>
#include <fragloader/fragment_assembler.hpp>
#include <fragloader/fragment_transport.hpp>
#include <fragloader/progress.hpp>
#include <fragloader/resume_state.hpp>

namespace fragloader
{
    namespace fs = std::filesystem;

    // Receives the notifications of a download session. Calls happen inline on
    // the downloading thread.
    class FRAGLOADER_API DownloadObserver
    {
    public:
        virtual ~DownloadObserver() = default;

        virtual void on_progress(const ProgressSnapshot& /*snapshot*/)
        {
        }

        // `attempt` is the number of failed attempts so far, `retries` the budget
        // (none when unbounded).
        virtual void on_fragment_retry(const DownloaderError& /*error*/,
                                       std::size_t /*fragment_index*/,
                                       std::size_t /*attempt*/,
                                       const std::optional<std::size_t>& /*retries*/)
        {
        }

        virtual void on_fragment_skip(std::size_t /*fragment_index*/)
        {
        }
    };

    // Downloads a fragmented stream into one output file, one fragment at a time.
    //
    // Fragment i+1 is never fetched before fragment i is appended and synced, and
    // the resume checkpoint is only moved forward after that. An interrupted
    // session can therefore be picked up again by a new FragmentDownloader on the
    // same output.
    class FRAGLOADER_API FragmentDownloader
    {
    public:
        FragmentDownloader(const Context& ctx,
                           FragmentTransport& transport,
                           FragmentSequence& fragments,
                           fs::path output,
                           DownloadObserver* observer = nullptr);

        // Runs the session to completion. Returns the size of the final file
        // (bytes written for standard output).
        tl::expected<std::uintmax_t, DownloaderError> download();

        // May be called from any thread. Checked between fragments: a live
        // session is finalized, a finite one is aborted with PD_INTERRUPTED.
        void request_stop() noexcept;

        const DownloadContext& context() const noexcept
        {
            return m_download;
        }

    private:
        enum class FragmentOutcome
        {
            kAPPENDED,
            kSKIPPED,
            kSTOPPED,
        };

        tl::expected<void, DownloaderError> initialize();
        tl::expected<FragmentOutcome, DownloaderError> process_fragment(
            std::size_t index, const FragmentLocator& locator);
        tl::expected<void, DownloaderError> append_fragment(std::size_t index,
                                                            const fs::path& fragment_file,
                                                            std::size_t attempts);

        void on_transport_progress(const TransportProgress& progress);
        void apply(const TransportProgress& event);
        void set_state(SessionState state);
        tl::expected<std::uintmax_t, DownloaderError> abort(const DownloaderError& error);

        const Context& m_ctx;
        FragmentTransport& m_transport;
        FragmentSequence& m_fragments;
        fs::path m_output;
        DownloadObserver* m_observer;

        ResumeStateStore m_store;
        FragmentAssembler m_assembler;
        AssemblerStream m_stream;
        DownloadContext m_download;
        std::atomic<bool> m_stop_requested{ false };
    };
}

#endif
