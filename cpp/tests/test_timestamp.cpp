#include <catch2/catch_test_macros.hpp>
#include "covenant/timestamp.hpp"

using namespace covenant;
using namespace std::chrono;

TEST_CASE("RFC 1123 formatting", "[timestamp]")
{
    Timestamp ts = sys_days{year{2030} / 1 / 1};
    REQUIRE(format_rfc1123(ts) == "Tue, 01 Jan 2030 00:00:00 GMT");
    REQUIRE(format_rfc1123(kNeverExpires) == kNeverExpiresText);

    Timestamp afternoon = sys_days{year{2024} / 2 / 29} + hours{13} + minutes{5} + seconds{9};
    REQUIRE(format_rfc1123(afternoon) == "Thu, 29 Feb 2024 13:05:09 GMT");
}

TEST_CASE("RFC 1123 parsing", "[timestamp]")
{
    auto parsed = parse_rfc1123("Tue, 01 Jan 2030 00:00:00 GMT");
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == Timestamp{sys_days{year{2030} / 1 / 1}});

    auto sentinel = parse_rfc1123(kNeverExpiresText);
    REQUIRE(sentinel.has_value());
    REQUIRE(*sentinel == kNeverExpires);
}

TEST_CASE("RFC 1123 parsing is strict", "[timestamp]")
{
    // wrong day of week
    REQUIRE_FALSE(parse_rfc1123("Wed, 01 Jan 2030 00:00:00 GMT").has_value());
    // other layouts
    REQUIRE_FALSE(parse_rfc1123("2030-01-01T00:00:00Z").has_value());
    REQUIRE_FALSE(parse_rfc1123("Tue, 1 Jan 2030 00:00:00 GMT").has_value());
    REQUIRE_FALSE(parse_rfc1123("Tue, 01 Jan 2030 00:00:00 UTC").has_value());
    // impossible dates
    REQUIRE_FALSE(parse_rfc1123("Fri, 30 Feb 2030 00:00:00 GMT").has_value());
    REQUIRE_FALSE(parse_rfc1123("Tue, 01 Jan 2030 24:00:00 GMT").has_value());
}

TEST_CASE("ISO 8601 parsing", "[timestamp]")
{
    const Timestamp new_year = sys_days{year{2030} / 1 / 1};

    REQUIRE(parse_iso8601("2030-01-01").value() == new_year);
    REQUIRE(parse_iso8601("2030-01-01T00:00:00Z").value() == new_year);
    REQUIRE(parse_iso8601("2030-01-01T02:00:00+02:00").value() == new_year);
    REQUIRE(parse_iso8601("2029-12-31T19:00:00-05:00").value() == new_year);

    REQUIRE_FALSE(parse_iso8601("2030/01/01").has_value());
    REQUIRE_FALSE(parse_iso8601("2030-01-01T00:00:00").has_value());
    REQUIRE_FALSE(parse_iso8601("2030-13-01").has_value());
}

TEST_CASE("Representable range", "[timestamp]")
{
    REQUIRE(is_representable(kNeverExpires));
    REQUIRE(is_representable(Timestamp{sys_days{year{1} / 1 / 1}}));
    REQUIRE_FALSE(is_representable(kNeverExpires + seconds{1}));
    REQUIRE_FALSE(is_representable(Timestamp{sys_days{year{0} / 12 / 31}}));
}
