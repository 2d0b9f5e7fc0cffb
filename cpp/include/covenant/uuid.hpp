#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace covenant
{

    /**
     * 128-bit unique identifier.
     * Formatted as lowercase "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx".
     */
    class Uuid
    {
    public:
        using Bytes = std::array<uint8_t, 16>;

        /** The nil identifier (all zero) */
        Uuid() = default;

        explicit Uuid(const Bytes &bytes) : bytes_(bytes) {}

        /** Random (version 4) identifier */
        static Uuid generate();

        /**
         * Parse from text. Accepts the hyphenated form, 32 hex digits, and
         * the hyphenated form wrapped in {} or (). Case-insensitive;
         * surrounding whitespace is ignored.
         */
        static Result<Uuid> parse(std::string_view text);

        std::string to_string() const;

        bool is_nil() const;

        const Bytes &bytes() const { return bytes_; }

        bool operator==(const Uuid &other) const = default;

    private:
        Bytes bytes_{};
    };

} // namespace covenant
