#include <doctest/doctest.h>

#include <fragloader/download_context.hpp>
#include <fragloader/progress.hpp>

using namespace fragloader;
using namespace std::chrono_literals;

namespace
{
    using steady = ProgressAggregator::clock;

    DownloadContext finite_context(std::size_t total, steady::time_point t0)
    {
        DownloadContext ctx;
        ctx.filename = "video.mp4";
        ctx.tmpfilename = "video.mp4.part";
        ctx.session = FiniteSession{ total };
        ctx.progress = ProgressAggregator::start(0, 0, t0);
        return ctx;
    }

    TransportProgress event(TransferEvent kind,
                            std::uintmax_t downloaded = 0,
                            std::optional<std::uintmax_t> total = std::nullopt)
    {
        TransportProgress p;
        p.event = kind;
        p.downloaded_bytes = downloaded;
        p.total_bytes = total;
        return p;
    }

    ProgressSnapshot feed(DownloadContext& ctx, const TransportProgress& p, steady::time_point now)
    {
        auto step = ProgressAggregator::reduce(ctx, p, now);
        ctx.progress = step.state;
        return step.snapshot;
    }
}

TEST_SUITE("progress")
{
    TEST_CASE("estimate_total_bytes")
    {
        CHECK_EQ(ProgressAggregator::estimate_total_bytes(0, 100, 0, 5), doctest::Approx(500));
        CHECK_EQ(ProgressAggregator::estimate_total_bytes(200, 100, 2, 5), doctest::Approx(500));
        CHECK_EQ(ProgressAggregator::estimate_total_bytes(100, 300, 1, 4), doctest::Approx(800));
    }

    TEST_CASE("average_speed")
    {
        CHECK_FALSE(ProgressAggregator::average_speed(0, 2.0));
        CHECK_FALSE(ProgressAggregator::average_speed(1000, 0.0));
        CHECK_EQ(ProgressAggregator::average_speed(1000, 2.0).value(), doctest::Approx(500));
    }

    TEST_CASE("eta")
    {
        CHECK_FALSE(ProgressAggregator::eta(std::nullopt, 10, 5.0));
        CHECK_FALSE(ProgressAggregator::eta(1000.0, 10, std::nullopt));
        CHECK_FALSE(ProgressAggregator::eta(1000.0, 10, 0.0));
        CHECK_EQ(ProgressAggregator::eta(1000.0, 500, 100.0).value(), doctest::Approx(5));
        // never negative when the estimate was too low
        CHECK_EQ(ProgressAggregator::eta(1000.0, 1500, 100.0).value(), doctest::Approx(0));
    }

    TEST_CASE("finite_session")
    {
        const auto t0 = steady::now();
        DownloadContext ctx = finite_context(5, t0);

        auto s = feed(ctx, event(TransferEvent::kDOWNLOADING, 50, 100), t0 + 1s);
        CHECK_EQ(s.status, ProgressStatus::kDOWNLOADING);
        CHECK_EQ(s.downloaded_bytes, 50u);
        CHECK_EQ(s.fragment_index, 0u);
        CHECK_EQ(s.fragment_count.value(), 5u);
        CHECK_EQ(s.total_bytes_estimate.value(), doctest::Approx(500));
        CHECK_EQ(s.speed.value(), doctest::Approx(50));
        CHECK_EQ(s.eta.value(), doctest::Approx(9));
        CHECK_FALSE(s.total_bytes);
        CHECK_EQ(s.filename, fs::path("video.mp4"));
        CHECK_EQ(s.tmpfilename, fs::path("video.mp4.part"));

        s = feed(ctx, event(TransferEvent::kDOWNLOADING, 100, 100), t0 + 2s);
        CHECK_EQ(s.downloaded_bytes, 100u);

        s = feed(ctx, event(TransferEvent::kFINISHED, 100, 100), t0 + 2s);
        CHECK_EQ(s.downloaded_bytes, 100u);
        CHECK_EQ(s.fragment_index, 1u);
        CHECK_EQ(ctx.progress.complete_fragments_bytes, 100u);
        CHECK_EQ(ctx.progress.prev_fragment_bytes, 0u);

        // second fragment, bigger than the first one
        s = feed(ctx, event(TransferEvent::kDOWNLOADING, 150, 300), t0 + 3s);
        CHECK_EQ(s.downloaded_bytes, 250u);
        CHECK_EQ(s.total_bytes_estimate.value(), doctest::Approx((100.0 + 300.0) / 2 * 5));
    }

    TEST_CASE("finished_counts_bytes_once")
    {
        const auto t0 = steady::now();
        DownloadContext ctx = finite_context(2, t0);

        feed(ctx, event(TransferEvent::kDOWNLOADING, 40, 100), t0 + 1s);
        feed(ctx, event(TransferEvent::kDOWNLOADING, 100, 100), t0 + 1s);
        auto s = feed(ctx, event(TransferEvent::kFINISHED, 100, 100), t0 + 1s);
        CHECK_EQ(s.downloaded_bytes, 100u);

        // a fragment that never reported any bytes before finishing
        s = feed(ctx, event(TransferEvent::kFINISHED, 80, 80), t0 + 2s);
        CHECK_EQ(s.downloaded_bytes, 180u);
        CHECK_EQ(s.fragment_index, 2u);
    }

    TEST_CASE("reset_and_skip")
    {
        const auto t0 = steady::now();
        DownloadContext ctx = finite_context(4, t0);

        feed(ctx, event(TransferEvent::kFINISHED, 100, 100), t0 + 1s);
        auto s = feed(ctx, event(TransferEvent::kDOWNLOADING, 30, 100), t0 + 2s);
        CHECK_EQ(s.downloaded_bytes, 130u);

        s = feed(ctx, event(TransferEvent::kRESET), t0 + 2s);
        CHECK_EQ(s.downloaded_bytes, 100u);
        CHECK_EQ(s.fragment_index, 1u);

        s = feed(ctx, event(TransferEvent::kDOWNLOADING, 20, 100), t0 + 3s);
        CHECK_EQ(s.downloaded_bytes, 120u);

        s = feed(ctx, event(TransferEvent::kSKIPPED), t0 + 3s);
        CHECK_EQ(s.downloaded_bytes, 100u);
        CHECK_EQ(s.fragment_index, 2u);
    }

    TEST_CASE("resumed_session_speed")
    {
        const auto t0 = steady::now();
        DownloadContext ctx;
        ctx.session = FiniteSession{ 5 };
        ctx.progress = ProgressAggregator::start(2, 200, t0);

        auto s = ProgressAggregator::snapshot(ctx, t0);
        CHECK_EQ(s.downloaded_bytes, 200u);
        CHECK_EQ(s.fragment_index, 2u);
        CHECK_FALSE(s.speed);

        // only bytes of this session count for the speed
        s = feed(ctx, event(TransferEvent::kDOWNLOADING, 50, 100), t0 + 1s);
        CHECK_EQ(s.downloaded_bytes, 250u);
        CHECK_EQ(s.speed.value(), doctest::Approx(50));
        CHECK_EQ(s.total_bytes_estimate.value(), doctest::Approx(500));
    }

    TEST_CASE("live_session")
    {
        const auto t0 = steady::now();
        DownloadContext ctx;
        ctx.session = LiveSession{};
        ctx.progress = ProgressAggregator::start(0, 0, t0);

        auto s = feed(ctx, event(TransferEvent::kDOWNLOADING, 50, 100), t0 + 1s);
        CHECK_EQ(s.downloaded_bytes, 50u);
        CHECK_FALSE(s.fragment_count);
        CHECK_FALSE(s.total_bytes_estimate);
        CHECK_FALSE(s.eta);
        CHECK(s.speed);
    }

    TEST_CASE("finished_snapshot")
    {
        const auto t0 = steady::now();
        DownloadContext ctx = finite_context(5, t0);
        feed(ctx, event(TransferEvent::kFINISHED, 100, 100), t0 + 1s);

        auto s = ProgressAggregator::finished(ctx, 500, t0 + 2s);
        CHECK_EQ(s.status, ProgressStatus::kFINISHED);
        CHECK_EQ(s.downloaded_bytes, 500u);
        CHECK_EQ(s.total_bytes.value(), 500u);
        CHECK_EQ(s.elapsed, doctest::Approx(2));
    }
}
