#ifndef FRAGLOADER_PROGRESS_HPP
#define FRAGLOADER_PROGRESS_HPP

#include <chrono>
#include <filesystem>
#include <optional>

#include <fragloader/export.hpp>
#include <fragloader/enums.hpp>

namespace fragloader
{
    namespace fs = std::filesystem;

    struct DownloadContext;

    // What a transport reports about the fragment it is fetching.
    struct TransportProgress
    {
        TransferEvent event = TransferEvent::kDOWNLOADING;
        // Bytes of the in-flight fragment received so far, including bytes that were
        // already on disk when the transfer was continued.
        std::uintmax_t downloaded_bytes = 0;
        // Size of the fragment when the server announced it (always set on kFINISHED).
        std::optional<std::uintmax_t> total_bytes;
        // Instantaneous speed as seen by the transport, bytes per second.
        std::optional<double> speed;
    };

    // What the caller of a download gets to see.
    struct ProgressSnapshot
    {
        ProgressStatus status = ProgressStatus::kDOWNLOADING;
        std::uintmax_t downloaded_bytes = 0;
        // Only set on the final snapshot.
        std::optional<std::uintmax_t> total_bytes;
        // Extrapolated from the fragments seen so far, never set for live streams.
        std::optional<double> total_bytes_estimate;
        std::size_t fragment_index = 0;
        // None for live streams.
        std::optional<std::size_t> fragment_count;
        fs::path filename;
        fs::path tmpfilename;
        // Seconds since the session started.
        double elapsed = 0.0;
        std::optional<double> speed;
        std::optional<double> eta;
    };

    // Session-level byte accounting, the aggregator's state.
    struct ProgressState
    {
        std::chrono::steady_clock::time_point started;
        // Bytes that were already in the output when the session started.
        std::uintmax_t resume_bytes = 0;
        std::size_t fragment_index = 0;
        // Bytes of all fragments appended so far (resume_bytes included).
        std::uintmax_t complete_fragments_bytes = 0;
        // complete_fragments_bytes plus the in-flight fragment.
        std::uintmax_t downloaded_bytes = 0;
        // In-flight fragment bytes at the previous event.
        std::uintmax_t prev_fragment_bytes = 0;
        std::optional<double> speed;
        std::optional<double> eta;
        std::optional<double> total_bytes_estimate;
    };

    struct ProgressStep
    {
        ProgressState state;
        ProgressSnapshot snapshot;
    };

    // Turns fragment-level transport events into session-level snapshots.
    // Everything here is a pure function of its arguments.
    class FRAGLOADER_API ProgressAggregator
    {
    public:
        using clock = std::chrono::steady_clock;

        static ProgressState start(std::size_t fragment_index,
                                   std::uintmax_t resume_bytes,
                                   clock::time_point now);

        static ProgressStep reduce(const DownloadContext& ctx,
                                   const TransportProgress& event,
                                   clock::time_point now);

        // Current state of `ctx`, without applying any event.
        static ProgressSnapshot snapshot(const DownloadContext& ctx, clock::time_point now);

        // Terminal snapshot, the final file size is both downloaded and total bytes.
        static ProgressSnapshot finished(const DownloadContext& ctx,
                                         std::uintmax_t final_size,
                                         clock::time_point now);

        // (completed + current fragment) / (index + 1) * total fragments
        static double estimate_total_bytes(std::uintmax_t complete_fragments_bytes,
                                           std::uintmax_t current_fragment_bytes,
                                           std::size_t fragment_index,
                                           std::size_t fragment_count);

        // Average rate of the bytes transferred in this session, none until measurable.
        static std::optional<double> average_speed(std::uintmax_t session_bytes,
                                                   double elapsed_seconds);

        static std::optional<double> eta(std::optional<double> total_estimate,
                                         std::uintmax_t downloaded_bytes,
                                         std::optional<double> speed);

    private:
        static ProgressSnapshot make_snapshot(const DownloadContext& ctx,
                                              const ProgressState& state,
                                              clock::time_point now);
    };
}

#endif
