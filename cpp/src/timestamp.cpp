#include "covenant/timestamp.hpp"
#include <array>
#include <format>
#include <optional>

namespace covenant
{

    namespace
    {
        using namespace std::chrono;

        constexpr std::array<std::string_view, 7> kDayNames = {
            "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};

        constexpr std::array<std::string_view, 12> kMonthNames = {
            "Jan", "Feb", "Mar", "Apr", "May", "Jun",
            "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

        std::optional<int> parse_digits(std::string_view s)
        {
            if (s.empty())
                return std::nullopt;
            int value = 0;
            for (char c : s)
            {
                if (c < '0' || c > '9')
                    return std::nullopt;
                value = value * 10 + (c - '0');
            }
            return value;
        }

        std::optional<unsigned> month_index(std::string_view name)
        {
            for (unsigned i = 0; i < kMonthNames.size(); ++i)
            {
                if (kMonthNames[i] == name)
                    return i + 1;
            }
            return std::nullopt;
        }

        Result<Timestamp> compose(int y, int mo, int d, int h, int mi, int s, std::string_view text)
        {
            year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
            if (y < 1 || y > 9999 || !ymd.ok() || h > 23 || mi > 59 || s > 59)
            {
                return std::unexpected(CovenantError::invalid_input(
                    std::format("Date out of range: '{}'", text)));
            }
            return Timestamp{sys_days{ymd}} + hours{h} + minutes{mi} + seconds{s};
        }

        Result<Timestamp> invalid(std::string_view text)
        {
            return std::unexpected(CovenantError::invalid_input(
                std::format("Unrecognized date format: '{}'", text)));
        }
    } // namespace

    bool is_representable(Timestamp ts)
    {
        const year_month_day ymd{floor<days>(ts)};
        return ymd.year() >= year{1} && ymd.year() <= year{9999};
    }

    std::string format_rfc1123(Timestamp ts)
    {
        const auto day_point = floor<days>(ts);
        const year_month_day ymd{day_point};
        const weekday wd{day_point};
        const hh_mm_ss hms{ts - day_point};

        return std::format("{}, {:02d} {} {:04d} {:02d}:{:02d}:{:02d} GMT",
                           kDayNames[wd.c_encoding()],
                           static_cast<unsigned>(ymd.day()),
                           kMonthNames[static_cast<unsigned>(ymd.month()) - 1],
                           static_cast<int>(ymd.year()),
                           hms.hours().count(),
                           hms.minutes().count(),
                           hms.seconds().count());
    }

    Result<Timestamp> parse_rfc1123(std::string_view text)
    {
        // ddd, dd MMM yyyy HH:mm:ss GMT
        if (text.size() != 29 ||
            text.substr(3, 2) != ", " || text[7] != ' ' || text[11] != ' ' ||
            text[16] != ' ' || text[19] != ':' || text[22] != ':' ||
            text.substr(25) != " GMT")
        {
            return invalid(text);
        }

        auto d = parse_digits(text.substr(5, 2));
        auto mo = month_index(text.substr(8, 3));
        auto y = parse_digits(text.substr(12, 4));
        auto h = parse_digits(text.substr(17, 2));
        auto mi = parse_digits(text.substr(20, 2));
        auto s = parse_digits(text.substr(23, 2));
        if (!d || !mo || !y || !h || !mi || !s)
        {
            return invalid(text);
        }

        auto ts = compose(*y, static_cast<int>(*mo), *d, *h, *mi, *s, text);
        if (!ts)
            return ts;

        const weekday wd{floor<days>(*ts)};
        if (kDayNames[wd.c_encoding()] != text.substr(0, 3))
        {
            return std::unexpected(CovenantError::invalid_input(
                std::format("Day of week does not match date: '{}'", text)));
        }
        return ts;
    }

    Result<Timestamp> parse_iso8601(std::string_view text)
    {
        if (text.size() < 10 || text[4] != '-' || text[7] != '-')
        {
            return invalid(text);
        }
        auto y = parse_digits(text.substr(0, 4));
        auto mo = parse_digits(text.substr(5, 2));
        auto d = parse_digits(text.substr(8, 2));
        if (!y || !mo || !d)
        {
            return invalid(text);
        }
        if (text.size() == 10)
        {
            return compose(*y, *mo, *d, 0, 0, 0, text);
        }

        // YYYY-MM-DDTHH:MM:SS then zone
        if (text.size() < 20 || (text[10] != 'T' && text[10] != 't') || text[13] != ':' || text[16] != ':')
        {
            return invalid(text);
        }
        auto h = parse_digits(text.substr(11, 2));
        auto mi = parse_digits(text.substr(14, 2));
        auto s = parse_digits(text.substr(17, 2));
        if (!h || !mi || !s)
        {
            return invalid(text);
        }

        auto ts = compose(*y, *mo, *d, *h, *mi, *s, text);
        if (!ts)
            return ts;

        auto zone = text.substr(19);
        if (zone == "Z" || zone == "z")
        {
            return ts;
        }
        if (zone.size() != 6 || (zone[0] != '+' && zone[0] != '-') || zone[3] != ':')
        {
            return invalid(text);
        }
        auto oh = parse_digits(zone.substr(1, 2));
        auto om = parse_digits(zone.substr(4, 2));
        if (!oh || !om || *oh > 23 || *om > 59)
        {
            return invalid(text);
        }
        const auto offset = hours{*oh} + minutes{*om};
        // Local time minus a positive offset gives UTC
        return zone[0] == '+' ? *ts - offset : *ts + offset;
    }

} // namespace covenant
