#include "http/HttpUtils.hpp"

#include <doctest/doctest.h>

using ts::http::ByteRange;
using ts::http::parse_range;

TEST_CASE("parse_range accepts the three single-range forms")
{
    auto bounded = parse_range("bytes=0-99", 1000);
    CHECK(bounded.kind == ByteRange::Kind::Partial);
    CHECK(bounded.start == 0);
    CHECK(bounded.count == 100);
    CHECK(bounded.last() == 99);

    auto open = parse_range("bytes=900-", 1000);
    CHECK(open.kind == ByteRange::Kind::Partial);
    CHECK(open.start == 900);
    CHECK(open.count == 100);

    auto suffix = parse_range("bytes=-250", 1000);
    CHECK(suffix.kind == ByteRange::Kind::Partial);
    CHECK(suffix.start == 750);
    CHECK(suffix.count == 250);
}

TEST_CASE("parse_range clamps to the file length")
{
    auto past_end = parse_range("bytes=10-5000", 1000);
    CHECK(past_end.kind == ByteRange::Kind::Partial);
    CHECK(past_end.last() == 999);

    auto big_suffix = parse_range("bytes=-5000", 1000);
    CHECK(big_suffix.kind == ByteRange::Kind::Partial);
    CHECK(big_suffix.start == 0);
    CHECK(big_suffix.count == 1000);
}

TEST_CASE("parse_range only honours the first range of a list")
{
    auto range = parse_range("bytes=0-9, 20-29", 100);
    CHECK(range.kind == ByteRange::Kind::Partial);
    CHECK(range.count == 10);
}

TEST_CASE("parse_range rejects ranges outside the file")
{
    CHECK(parse_range("bytes=1000-", 1000).kind ==
          ByteRange::Kind::Unsatisfiable);
    CHECK(parse_range("bytes=1500-1600", 1000).kind ==
          ByteRange::Kind::Unsatisfiable);
    CHECK(parse_range("bytes=-0", 1000).kind ==
          ByteRange::Kind::Unsatisfiable);
    CHECK(parse_range("bytes=-10", 0).kind == ByteRange::Kind::Unsatisfiable);
}

TEST_CASE("malformed Range headers fall back to the full body")
{
    for (auto header : {"", "items=0-1", "bytes=", "bytes=abc-", "bytes=5",
                        "bytes=9-3", "bytes=1-x"})
    {
        CAPTURE(header);
        auto range = parse_range(header, 1000);
        CHECK(range.kind == ByteRange::Kind::Full);
        CHECK(range.start == 0);
        CHECK(range.count == 1000);
    }
}

TEST_CASE("mime_type_for maps media extensions")
{
    CHECK(ts::http::mime_type_for("movie.mp4") == "video/mp4");
    CHECK(ts::http::mime_type_for("Show.S01E01.MKV") == "video/x-matroska");
    CHECK(ts::http::mime_type_for("subs.srt") == "application/x-subrip");
    CHECK(ts::http::mime_type_for("archive.rar") ==
          "application/octet-stream");
    CHECK(ts::http::mime_type_for("README") == "application/octet-stream");
    CHECK(ts::http::mime_type_for("trailing.") == "application/octet-stream");
}

TEST_CASE("url_encode keeps unreserved characters and slashes")
{
    CHECK(ts::http::url_encode("Show/e01.mkv") == "Show/e01.mkv");
    CHECK(ts::http::url_encode("a b&c") == "a%20b%26c");
    CHECK(ts::http::url_encode("magnet:?xt=urn:btih:ab") ==
          "magnet%3A%3Fxt%3Durn%3Abtih%3Aab");
    CHECK(ts::http::url_encode("\xc3\xa9") == "%C3%A9");
}
