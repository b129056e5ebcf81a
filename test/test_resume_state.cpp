#include <doctest/doctest.h>

#include <fragloader/resume_state.hpp>

#include "test_helpers.hpp"

using namespace fragloader;
using namespace fragloader::test;

TEST_SUITE("resume_state")
{
    TEST_CASE("sidecar_path")
    {
        CHECK_EQ(ResumeStateStore::sidecar_path("out/video.mp4"),
                 fs::path("out/video.mp4.fragdl"));
    }

    TEST_CASE("missing_sidecar")
    {
        TemporaryDirectory tmp;
        ResumeStateStore store;
        auto loaded = store.load(tmp / "video.mp4");
        REQUIRE(loaded);
        CHECK_FALSE(loaded.value().has_value());
    }

#ifndef _WIN32
    TEST_CASE("unreadable_sidecar")
    {
        TemporaryDirectory tmp;
        ResumeStateStore store;
        const fs::path output = tmp / "video.mp4";

        SUBCASE("stat fails")
        {
            // a symlink pointing at itself cannot be resolved (ELOOP)
            fs::create_symlink(ResumeStateStore::sidecar_path("video.mp4"),
                               ResumeStateStore::sidecar_path(output));
            auto loaded = store.load(output);
            REQUIRE_FALSE(loaded);
            CHECK_EQ(loaded.error().code, ErrorCode::PD_IO);
        }

        SUBCASE("not a regular file")
        {
            fs::create_directories(ResumeStateStore::sidecar_path(output));
            auto loaded = store.load(output);
            REQUIRE_FALSE(loaded);
            CHECK_EQ(loaded.error().code, ErrorCode::PD_CORRUPTCHECKPOINT);
        }
    }
#endif

    TEST_CASE("save_and_load")
    {
        TemporaryDirectory tmp;
        ResumeStateStore store;
        const fs::path output = tmp / "video.mp4";

        REQUIRE(store.save(output, ResumeCheckpoint{ 0 }));
        REQUIRE(store.save(output, ResumeCheckpoint{ 3 }));

        auto loaded = store.load(output);
        REQUIRE(loaded);
        REQUIRE(loaded.value().has_value());
        CHECK_EQ(loaded.value()->current_fragment_index, 3u);

        // the staging file never outlives a save
        CHECK_FALSE(fs::exists(tmp / "video.mp4.fragdl.tmp"));
        CHECK_EQ(count_entries(tmp.path()), 1u);
    }

    TEST_CASE("sidecar_format")
    {
        TemporaryDirectory tmp;
        ResumeStateStore store;
        write_file(tmp / "video.mp4.fragdl", R"({"download": {"current_fragment_index": 7}})");

        auto loaded = store.load(tmp / "video.mp4");
        REQUIRE(loaded);
        REQUIRE(loaded.value().has_value());
        CHECK_EQ(loaded.value().value(), ResumeCheckpoint{ 7 });
    }

    TEST_CASE("corrupt_sidecar")
    {
        TemporaryDirectory tmp;
        ResumeStateStore store;
        const fs::path output = tmp / "video.mp4";
        const fs::path sidecar = ResumeStateStore::sidecar_path(output);

        for (const std::string content : { "{not json",
                                           R"({"fragments": 3})",
                                           R"({"download": {}})",
                                           R"({"download": {"current_fragment_index": -1}})",
                                           R"({"download": {"current_fragment_index": "3"}})" })
        {
            CAPTURE(content);
            write_file(sidecar, content);
            auto loaded = store.load(output);
            REQUIRE_FALSE(loaded);
            CHECK_EQ(loaded.error().code, ErrorCode::PD_CORRUPTCHECKPOINT);
            CHECK(loaded.error().is_fatal());
        }
    }

    TEST_CASE("clear")
    {
        TemporaryDirectory tmp;
        ResumeStateStore store;
        const fs::path output = tmp / "video.mp4";

        // nothing to clear is fine
        CHECK(store.clear(output));

        REQUIRE(store.save(output, ResumeCheckpoint{ 1 }));
        CHECK(fs::exists(ResumeStateStore::sidecar_path(output)));
        CHECK(store.clear(output));
        CHECK_FALSE(fs::exists(ResumeStateStore::sidecar_path(output)));
    }
}
