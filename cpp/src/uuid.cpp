#include "covenant/uuid.hpp"
#include "covenant/crypto.hpp"
#include <algorithm>
#include <format>

namespace covenant
{

    namespace
    {
        int hex_value(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }

        std::string_view trim(std::string_view s)
        {
            const auto first = s.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos)
                return {};
            const auto last = s.find_last_not_of(" \t\r\n");
            return s.substr(first, last - first + 1);
        }
    } // namespace

    Uuid Uuid::generate()
    {
        auto random = crypto::SecureRandom::generate_bytes(16);
        Bytes bytes{};
        std::copy_n(random.begin(), bytes.size(), bytes.begin());
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant
        return Uuid(bytes);
    }

    Result<Uuid> Uuid::parse(std::string_view text)
    {
        auto s = trim(text);
        if (s.size() == 38 &&
            ((s.front() == '{' && s.back() == '}') || (s.front() == '(' && s.back() == ')')))
        {
            s = s.substr(1, 36);
        }

        const bool hyphenated = s.size() == 36;
        if (!hyphenated && s.size() != 32)
        {
            return std::unexpected(CovenantError::invalid_input(
                std::format("Invalid identifier length: '{}'", text)));
        }

        Bytes bytes{};
        size_t out = 0;
        for (size_t i = 0; i < s.size();)
        {
            if (hyphenated && (i == 8 || i == 13 || i == 18 || i == 23))
            {
                if (s[i] != '-')
                {
                    return std::unexpected(CovenantError::invalid_input(
                        std::format("Invalid identifier separator: '{}'", text)));
                }
                ++i;
                continue;
            }
            int hi = hex_value(s[i]);
            int lo = i + 1 < s.size() ? hex_value(s[i + 1]) : -1;
            if (hi < 0 || lo < 0 || out >= bytes.size())
            {
                return std::unexpected(CovenantError::invalid_input(
                    std::format("Invalid identifier digit: '{}'", text)));
            }
            bytes[out++] = static_cast<uint8_t>((hi << 4) | lo);
            i += 2;
        }

        if (out != bytes.size())
        {
            return std::unexpected(CovenantError::invalid_input(
                std::format("Invalid identifier: '{}'", text)));
        }
        return Uuid(bytes);
    }

    std::string Uuid::to_string() const
    {
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < bytes_.size(); ++i)
        {
            if (i == 4 || i == 6 || i == 8 || i == 10)
                out += '-';
            out += std::format("{:02x}", bytes_[i]);
        }
        return out;
    }

    bool Uuid::is_nil() const
    {
        return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
    }

} // namespace covenant
