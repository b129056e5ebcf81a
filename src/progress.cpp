#include <algorithm>

#include <fragloader/download_context.hpp>
#include <fragloader/progress.hpp>

namespace fragloader
{
    namespace
    {
        double seconds_between(ProgressAggregator::clock::time_point from,
                               ProgressAggregator::clock::time_point to)
        {
            return std::max(0.0, std::chrono::duration<double>(to - from).count());
        }

        // Moves `value` by the signed difference `now - before`.
        std::uintmax_t shift(std::uintmax_t value, std::uintmax_t before, std::uintmax_t now)
        {
            if (now >= before)
                return value + (now - before);
            const std::uintmax_t back = before - now;
            return back > value ? 0 : value - back;
        }
    }

    ProgressState ProgressAggregator::start(std::size_t fragment_index,
                                            std::uintmax_t resume_bytes,
                                            clock::time_point now)
    {
        ProgressState state;
        state.started = now;
        state.resume_bytes = resume_bytes;
        state.fragment_index = fragment_index;
        state.complete_fragments_bytes = resume_bytes;
        state.downloaded_bytes = resume_bytes;
        return state;
    }

    double ProgressAggregator::estimate_total_bytes(std::uintmax_t complete_fragments_bytes,
                                                    std::uintmax_t current_fragment_bytes,
                                                    std::size_t fragment_index,
                                                    std::size_t fragment_count)
    {
        return static_cast<double>(complete_fragments_bytes + current_fragment_bytes)
               / static_cast<double>(fragment_index + 1) * static_cast<double>(fragment_count);
    }

    std::optional<double> ProgressAggregator::average_speed(std::uintmax_t session_bytes,
                                                            double elapsed_seconds)
    {
        if (session_bytes == 0 || elapsed_seconds < 0.001)
            return std::nullopt;
        return static_cast<double>(session_bytes) / elapsed_seconds;
    }

    std::optional<double> ProgressAggregator::eta(std::optional<double> total_estimate,
                                                  std::uintmax_t downloaded_bytes,
                                                  std::optional<double> speed)
    {
        if (!total_estimate || !speed || speed.value() <= 0.0)
            return std::nullopt;
        const double remaining = total_estimate.value() - static_cast<double>(downloaded_bytes);
        return std::max(0.0, remaining / speed.value());
    }

    ProgressStep ProgressAggregator::reduce(const DownloadContext& ctx,
                                            const TransportProgress& event,
                                            clock::time_point now)
    {
        ProgressState state = ctx.progress;
        const double elapsed = seconds_between(state.started, now);
        const auto count = ctx.total_fragments();

        if (event.event == TransferEvent::kDOWNLOADING || event.event == TransferEvent::kFINISHED)
        {
            if (count)
            {
                const std::uintmax_t fragment_total = event.total_bytes.value_or(0);
                state.total_bytes_estimate = estimate_total_bytes(
                    state.complete_fragments_bytes, fragment_total, state.fragment_index, *count);
            }
        }

        switch (event.event)
        {
            case TransferEvent::kDOWNLOADING:
                state.downloaded_bytes = shift(
                    state.downloaded_bytes, state.prev_fragment_bytes, event.downloaded_bytes);
                state.prev_fragment_bytes = event.downloaded_bytes;
                {
                    const std::uintmax_t session_bytes
                        = state.downloaded_bytes > state.resume_bytes
                              ? state.downloaded_bytes - state.resume_bytes
                              : 0;
                    auto speed = average_speed(session_bytes, elapsed);
                    if (speed)
                        state.speed = speed;
                }
                state.eta = eta(state.total_bytes_estimate, state.downloaded_bytes, state.speed);
                break;
            case TransferEvent::kFINISHED:
            {
                const std::uintmax_t fragment_total
                    = event.total_bytes.value_or(event.downloaded_bytes);
                state.downloaded_bytes
                    = shift(state.downloaded_bytes, state.prev_fragment_bytes, fragment_total);
                state.complete_fragments_bytes = state.downloaded_bytes;
                state.prev_fragment_bytes = 0;
                state.fragment_index++;
                break;
            }
            case TransferEvent::kRESET:
                state.downloaded_bytes = state.complete_fragments_bytes;
                state.prev_fragment_bytes = 0;
                break;
            case TransferEvent::kSKIPPED:
                state.downloaded_bytes = state.complete_fragments_bytes;
                state.prev_fragment_bytes = 0;
                state.fragment_index++;
                break;
        }

        return ProgressStep{ state, make_snapshot(ctx, state, now) };
    }

    ProgressSnapshot ProgressAggregator::snapshot(const DownloadContext& ctx, clock::time_point now)
    {
        return make_snapshot(ctx, ctx.progress, now);
    }

    ProgressSnapshot ProgressAggregator::make_snapshot(const DownloadContext& ctx,
                                                       const ProgressState& state,
                                                       clock::time_point now)
    {
        ProgressSnapshot res;
        res.status = ProgressStatus::kDOWNLOADING;
        res.downloaded_bytes = state.downloaded_bytes;
        res.fragment_index = state.fragment_index;
        res.fragment_count = ctx.total_fragments();
        res.filename = ctx.filename;
        res.tmpfilename = ctx.tmpfilename;
        res.elapsed = seconds_between(state.started, now);
        res.speed = state.speed;
        if (!ctx.live())
        {
            res.total_bytes_estimate = state.total_bytes_estimate;
            res.eta = state.eta;
        }
        return res;
    }

    ProgressSnapshot ProgressAggregator::finished(const DownloadContext& ctx,
                                                  std::uintmax_t final_size,
                                                  clock::time_point now)
    {
        ProgressSnapshot res;
        res.status = ProgressStatus::kFINISHED;
        res.downloaded_bytes = final_size;
        res.total_bytes = final_size;
        res.fragment_index = ctx.progress.fragment_index;
        res.fragment_count = ctx.total_fragments();
        res.filename = ctx.filename;
        res.tmpfilename = ctx.tmpfilename;
        res.elapsed = seconds_between(ctx.progress.started, now);
        res.speed = ctx.progress.speed;
        return res;
    }
}
