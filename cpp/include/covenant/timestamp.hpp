#pragma once

#include "types.hpp"
#include <chrono>
#include <string>
#include <string_view>

namespace covenant
{

    /** Absolute instant with one-second resolution, always UTC */
    using Timestamp = std::chrono::sys_seconds;

    /**
     * Sentinel expiration meaning "never expires".
     * Absence of an expiration and an explicit sentinel are the same value.
     */
    inline constexpr Timestamp kNeverExpires =
        std::chrono::sys_days{std::chrono::year{9999} / 12 / 31} +
        std::chrono::hours{23} + std::chrono::minutes{59} + std::chrono::seconds{59};

    inline constexpr std::string_view kNeverExpiresText = "Fri, 31 Dec 9999 23:59:59 GMT";

    /** True when the instant falls within years 0001-9999 */
    bool is_representable(Timestamp ts);

    /**
     * Render as RFC 1123, e.g. "Tue, 01 Jan 2030 00:00:00 GMT".
     * Locale-independent. Requires is_representable(ts).
     */
    std::string format_rfc1123(Timestamp ts);

    /**
     * Parse the exact RFC 1123 layout produced by format_rfc1123.
     * The day name must agree with the date. No other layout is accepted.
     */
    Result<Timestamp> parse_rfc1123(std::string_view text);

    /**
     * Parse ISO 8601 input: "YYYY-MM-DD" (midnight UTC) or
     * "YYYY-MM-DDTHH:MM:SS" followed by "Z" or a "+HH:MM"/"-HH:MM" offset.
     */
    Result<Timestamp> parse_iso8601(std::string_view text);

} // namespace covenant
