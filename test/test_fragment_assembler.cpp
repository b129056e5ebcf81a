#include <doctest/doctest.h>

#include <fragloader/fragment_assembler.hpp>

#include "test_helpers.hpp"

using namespace fragloader;
using namespace fragloader::test;

TEST_SUITE("fragment_assembler")
{
    TEST_CASE("names")
    {
        CHECK_EQ(FragmentAssembler::temp_name("video.mp4"), fs::path("video.mp4.part"));
        CHECK_EQ(FragmentAssembler::temp_name("-"), fs::path("-"));
        CHECK_EQ(FragmentAssembler::fragment_path("video.mp4.part", 3),
                 fs::path("video.mp4.part-Frag3"));
    }

    TEST_CASE("fresh_output")
    {
        TemporaryDirectory tmp;
        ResumeStateStore store;
        FragmentAssembler assembler(store);

        auto stream = assembler.open(tmp / "video.mp4", 0);
        REQUIRE(stream);
        CHECK_EQ(stream->resume_length, 0u);
        CHECK_EQ(stream->length, 0u);
        CHECK(fs::exists(tmp / "video.mp4.part"));
    }

    TEST_CASE("append_and_finalize")
    {
        TemporaryDirectory tmp;
        ResumeStateStore store;
        FragmentAssembler assembler(store);
        const fs::path output = tmp / "video.mp4";

        REQUIRE(store.save(output, ResumeCheckpoint{ 0 }));
        auto stream = assembler.open(output, 0);
        REQUIRE(stream);

        write_file(tmp / "frag0", "hello ");
        write_file(tmp / "frag1", "world");

        auto first = assembler.append(stream.value(), tmp / "frag0");
        REQUIRE(first);
        CHECK_EQ(first.value(), 6u);
        auto second = assembler.append(stream.value(), tmp / "frag1");
        REQUIRE(second);
        CHECK_EQ(stream->length, 11u);

        // every append is on disk before the next one starts
        CHECK_EQ(read_file(tmp / "video.mp4.part"), "hello world");

        auto size = assembler.finalize(stream.value());
        REQUIRE(size);
        CHECK_EQ(size.value(), 11u);
        CHECK_EQ(read_file(output), "hello world");
        CHECK_FALSE(fs::exists(tmp / "video.mp4.part"));
        CHECK_FALSE(fs::exists(ResumeStateStore::sidecar_path(output)));
    }

    TEST_CASE("resume_existing_output")
    {
        TemporaryDirectory tmp;
        ResumeStateStore store;
        FragmentAssembler assembler(store);
        const fs::path output = tmp / "video.mp4";

        write_file(tmp / "video.mp4.part", "abc");
        write_file(tmp / "frag1", "def");

        auto stream = assembler.open(output, 1);
        REQUIRE(stream);
        CHECK_EQ(stream->resume_length, 3u);
        CHECK_EQ(stream->length, 3u);

        REQUIRE(assembler.append(stream.value(), tmp / "frag1"));
        REQUIRE(assembler.finalize(stream.value()));
        CHECK_EQ(read_file(output), "abcdef");
    }

    TEST_CASE("resume_mismatch")
    {
        TemporaryDirectory tmp;
        ResumeStateStore store;
        FragmentAssembler assembler(store);
        const fs::path output = tmp / "video.mp4";

        SUBCASE("checkpoint without partial output")
        {
            auto stream = assembler.open(output, 2);
            REQUIRE_FALSE(stream);
            CHECK_EQ(stream.error().code, ErrorCode::PD_RESUMEMISMATCH);
        }

        SUBCASE("partial output without checkpoint")
        {
            write_file(tmp / "video.mp4.part", "leftover");
            auto stream = assembler.open(output, 0);
            REQUIRE_FALSE(stream);
            CHECK_EQ(stream.error().code, ErrorCode::PD_RESUMEMISMATCH);
            // nothing was touched
            CHECK_EQ(read_file(tmp / "video.mp4.part"), "leftover");
        }

        SUBCASE("empty partial output with checkpoint")
        {
            write_file(tmp / "video.mp4.part", "");
            auto stream = assembler.open(output, 1);
            REQUIRE_FALSE(stream);
            CHECK_EQ(stream.error().code, ErrorCode::PD_RESUMEMISMATCH);
        }
    }

    TEST_CASE("stdout_cannot_resume")
    {
        ResumeStateStore store;
        FragmentAssembler assembler(store);
        auto stream = assembler.open("-", 1);
        REQUIRE_FALSE(stream);
        CHECK_EQ(stream.error().code, ErrorCode::PD_RESUMEMISMATCH);
    }

    TEST_CASE("append_missing_fragment")
    {
        TemporaryDirectory tmp;
        ResumeStateStore store;
        FragmentAssembler assembler(store);

        auto stream = assembler.open(tmp / "video.mp4", 0);
        REQUIRE(stream);
        auto written = assembler.append(stream.value(), tmp / "nope");
        REQUIRE_FALSE(written);
        CHECK_EQ(written.error().code, ErrorCode::PD_IO);
        CHECK_EQ(stream->length, 0u);
    }

#ifndef _WIN32
    TEST_CASE("failed_append_leaves_output_intact")
    {
        TemporaryDirectory tmp;
        ResumeStateStore store;
        FragmentAssembler assembler(store);

        write_file(tmp / "frag0", std::string(100, 'a'));
        write_file(tmp / "frag1", std::string(100, 'b'));

        auto stream = assembler.open(tmp / "video.mp4", 0);
        REQUIRE(stream);
        REQUIRE(assembler.append(stream.value(), tmp / "frag0"));

        {
            FileSizeLimit limit(150);
            auto written = assembler.append(stream.value(), tmp / "frag1");
            REQUIRE_FALSE(written);
            CHECK_EQ(written.error().code, ErrorCode::PD_IO);
        }

        CHECK_EQ(stream->length, 100u);
        CHECK_EQ(fs::file_size(tmp / "video.mp4.part"), 100u);

        // the stream is usable again once the disk accepts writes
        REQUIRE(assembler.append(stream.value(), tmp / "frag1"));
        REQUIRE(assembler.finalize(stream.value()));
        CHECK_EQ(read_file(tmp / "video.mp4"), std::string(100, 'a') + std::string(100, 'b'));
    }
#endif

    TEST_CASE("discard_fragment")
    {
        TemporaryDirectory tmp;
        ResumeStateStore store;
        FragmentAssembler assembler(store);

        const fs::path fragment = tmp / "video.mp4.part-Frag0";
        write_file(fragment, "data");

        assembler.discard_fragment(fragment, true);
        CHECK(fs::exists(fragment));

        write_file(tmp / "video.mp4.part-Frag0.part", "da");
        assembler.discard_fragment(fragment, false);
        CHECK_FALSE(fs::exists(fragment));
        CHECK_FALSE(fs::exists(tmp / "video.mp4.part-Frag0.part"));

        // already gone is fine
        assembler.discard_fragment(fragment, false);
    }
}
