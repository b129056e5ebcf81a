#include <doctest/doctest.h>

#include <stdexcept>

#include <fragloader/context.hpp>
#include <fragloader/utils.hpp>

using namespace fragloader;

TEST_SUITE("utility")
{
    TEST_CASE("split")
    {
        const auto expected = std::vector<std::string>{ "HTTP/1.1", "206", "Partial Content" };
        CHECK_EQ(split("HTTP/1.1 206 Partial Content", " ", 2), expected);
        CHECK_EQ(split("a,b,,c", ",").size(), 4u);
        CHECK_EQ(split("abc", ","), std::vector<std::string>{ "abc" });
    }

    TEST_CASE("strip")
    {
        CHECK_EQ(strip("  value\r\n"), "value");
        CHECK_EQ(strip(" \t "), "");
        CHECK_EQ(strip("x"), "x");
    }

    TEST_CASE("parse_header")
    {
        auto [key, value] = parse_header("Content-Length:  1234\r\n");
        CHECK_EQ(key, "content-length");
        CHECK_EQ(value, "1234");

        auto no_colon = parse_header("HTTP/1.1 200 OK\r\n");
        CHECK(no_colon.first.empty());
        CHECK_EQ(no_colon.second, "HTTP/1.1 200 OK");
    }

    TEST_CASE("starts_ends_with")
    {
        CHECK(starts_with("HTTP/2 200", "HTTP/"));
        CHECK_FALSE(starts_with("HTT", "HTTP/"));
        CHECK(ends_with("video.mp4.part", ".part"));
        CHECK_FALSE(ends_with("video.mp4", ".part"));
    }

    TEST_CASE("format_bytes")
    {
        CHECK_EQ(format_bytes(std::nullopt), "N/A");
        CHECK_EQ(format_bytes(0.0), "0.00B");
        CHECK_EQ(format_bytes(0.5), "0.50B");
        CHECK_EQ(format_bytes(1536.0), "1.50KiB");
        CHECK_EQ(format_bytes(3.0 * 1024 * 1024), "3.00MiB");
    }

    TEST_CASE("format_seconds")
    {
        CHECK_EQ(format_seconds(std::nullopt), "--:--");
        CHECK_EQ(format_seconds(65.4), "01:05");
        CHECK_EQ(format_seconds(3725.0), "01:02:05");
    }

    TEST_CASE("format_retries")
    {
        CHECK_EQ(format_retries(std::nullopt), "inf");
        CHECK_EQ(format_retries(std::size_t(3)), "3");
    }

    TEST_CASE("parse_retries")
    {
        CHECK_EQ(parse_retries("3").value(), 3u);
        CHECK_EQ(parse_retries(" 0 ").value(), 0u);
        CHECK_FALSE(parse_retries("inf").has_value());
        CHECK_FALSE(parse_retries("infinite").has_value());
        CHECK_THROWS_AS(parse_retries("-1"), std::invalid_argument);
        CHECK_THROWS_AS(parse_retries("abc"), std::invalid_argument);
        CHECK_THROWS_AS(parse_retries(""), std::invalid_argument);
        CHECK_THROWS_AS(parse_retries("99999999999999999999999"), std::out_of_range);
    }

    TEST_CASE("path_to_url")
    {
        CHECK(starts_with(path_to_url("some/file.ts"), "file://"));
        CHECK(ends_with(path_to_url("some/file.ts"), "some/file.ts"));
    }
}
