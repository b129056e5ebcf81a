#include <doctest/doctest.h>

#include <fragloader/fileio.hpp>

#include "test_helpers.hpp"

using namespace fragloader;
using namespace fragloader::test;

TEST_SUITE("fileio")
{
    TEST_CASE("open")
    {
        TemporaryDirectory tmp;
        std::error_code ec;
        FileIO f(tmp / "test.txt", FileIO::write_update_binary, ec);

        CHECK_FALSE(ec);
        CHECK(f.owned());
        f.write("test", 1, 4);
        f.close(ec);
        CHECK_FALSE(ec);
        CHECK_EQ(read_file(tmp / "test.txt"), "test");
    }

    TEST_CASE("open_missing")
    {
        TemporaryDirectory tmp;
        std::error_code ec;
        FileIO f(tmp / "missing" / "test.txt", FileIO::read_binary, ec);
        CHECK(ec);
        CHECK_FALSE(f.open());
    }

    TEST_CASE("truncate_empty")
    {
        TemporaryDirectory tmp;
        std::error_code ec;
        FileIO f(tmp / "empty.txt", FileIO::append_update_binary, ec);
        CHECK_FALSE(ec);
        CHECK(fs::exists(tmp / "empty.txt"));
        f.truncate(0, ec);
        CHECK_FALSE(ec);
    }

    TEST_CASE("copy_from")
    {
        TemporaryDirectory tmp;
        write_file(tmp / "x1.txt", "Hello world this is file number 1");
        write_file(tmp / "x2.txt", "File 2");

        std::error_code ec;
        {
            FileIO f1(tmp / "x1.txt", FileIO::append_binary, ec);
            REQUIRE_FALSE(ec);
            FileIO f2(tmp / "x2.txt", FileIO::read_binary, ec);
            REQUIRE_FALSE(ec);

            CHECK_EQ(f1.copy_from(f2, ec), 6u);
            CHECK_FALSE(ec);
            f1.sync(ec);
            CHECK_FALSE(ec);
        }
        CHECK_EQ(read_file(tmp / "x1.txt"), "Hello world this is file number 1File 2");
    }

    TEST_CASE("copy_from_empty")
    {
        TemporaryDirectory tmp;
        write_file(tmp / "out.txt", "abc");
        write_file(tmp / "empty.txt", "");

        std::error_code ec;
        {
            FileIO out(tmp / "out.txt", FileIO::append_binary, ec);
            FileIO empty(tmp / "empty.txt", FileIO::read_binary, ec);
            CHECK_EQ(out.copy_from(empty, ec), 0u);
            CHECK_FALSE(ec);
        }
        CHECK_EQ(read_file(tmp / "out.txt"), "abc");
    }

    TEST_CASE("standard_output")
    {
        std::error_code ec;
        FileIO out = FileIO::standard_output();
        CHECK(out.open());
        CHECK_FALSE(out.owned());
        CHECK_EQ(out.path(), fs::path("-"));
        out.close(ec);
        CHECK_FALSE(ec);
        CHECK_FALSE(out.open());
    }
}
