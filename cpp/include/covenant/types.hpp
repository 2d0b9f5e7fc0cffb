#pragma once

#include <expected>
#include <format>
#include <stdexcept>
#include <string>

namespace covenant
{

    /**
     * Error types for Covenant operations
     */
    enum class ErrorCode
    {
        MalformedRecord,
        MissingSignature,
        MissingRawBody,
        VerificationError,
        SigningError,
        KeyError,
        LicenseError,
        ConfigError,
        InvalidInput,
        IOError
    };

    /**
     * Convert ErrorCode to string representation
     */
    inline std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::MalformedRecord:
            return "MalformedRecord";
        case ErrorCode::MissingSignature:
            return "MissingSignature";
        case ErrorCode::MissingRawBody:
            return "MissingRawBody";
        case ErrorCode::VerificationError:
            return "VerificationError";
        case ErrorCode::SigningError:
            return "SigningError";
        case ErrorCode::KeyError:
            return "KeyError";
        case ErrorCode::LicenseError:
            return "LicenseError";
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::IOError:
            return "IOError";
        }
        return "Unknown";
    }

    /**
     * Covenant error with code and message.
     * `field` names the offending license element for MalformedRecord errors
     * and the rejected field for InvalidInput errors where one applies.
     */
    class CovenantError : public std::runtime_error
    {
    public:
        ErrorCode code;
        std::string field;

        CovenantError(ErrorCode code, const std::string &message, std::string field = {})
            : std::runtime_error(message), code(code), field(std::move(field)) {}

        static CovenantError malformed(const std::string &field, const std::string &msg)
        {
            return CovenantError(ErrorCode::MalformedRecord,
                                 std::format("Malformed license element '{}': {}", field, msg),
                                 field);
        }

        static CovenantError missing_signature(const std::string &msg)
        {
            return CovenantError(ErrorCode::MissingSignature, msg);
        }

        static CovenantError missing_raw_body(const std::string &msg)
        {
            return CovenantError(ErrorCode::MissingRawBody, msg);
        }

        static CovenantError verification(const std::string &msg)
        {
            return CovenantError(ErrorCode::VerificationError, msg);
        }

        static CovenantError signing(const std::string &msg)
        {
            return CovenantError(ErrorCode::SigningError, msg);
        }

        static CovenantError key(const std::string &msg)
        {
            return CovenantError(ErrorCode::KeyError, msg);
        }

        static CovenantError license(const std::string &msg)
        {
            return CovenantError(ErrorCode::LicenseError, msg);
        }

        static CovenantError config(const std::string &msg)
        {
            return CovenantError(ErrorCode::ConfigError, msg);
        }

        static CovenantError invalid_input(const std::string &msg, std::string field = {})
        {
            return CovenantError(ErrorCode::InvalidInput, msg, std::move(field));
        }

        static CovenantError io(const std::string &msg)
        {
            return CovenantError(ErrorCode::IOError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, CovenantError>;

} // namespace covenant
