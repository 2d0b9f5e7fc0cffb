#include "covenant/license_validator.hpp"
#include <spdlog/spdlog.h>
#include <format>
#include <fstream>
#include <sstream>

namespace covenant
{

    Result<License> LicenseValidator::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(CovenantError::io("Failed to open license file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();

        auto license = License::load(buffer.str());
        if (!license)
        {
            spdlog::warn("Rejected license file {}: {}", path, license.error().what());
        }
        return license;
    }

    Result<void> LicenseValidator::validate(const License &license, const crypto::PublicKey &key, Timestamp now,
                                            const LicenseSigner &signer)
    {
        if (auto verifiable = LicenseSigner::check_verifiable(license); !verifiable)
        {
            return std::unexpected(CovenantError::license(verifiable.error().what()));
        }

        auto valid = signer.verify(license, key);
        if (!valid)
            return std::unexpected(valid.error());
        if (!*valid)
        {
            return std::unexpected(CovenantError::license("License signature verification failed"));
        }

        if (license.is_expired(now))
        {
            return std::unexpected(CovenantError::license(
                std::format("License expired on {}", format_rfc1123(license.expiration()))));
        }
        return {};
    }

    Result<std::vector<bool>> LicenseValidator::validate_sublicenses(const License &license, const crypto::PublicKey &key,
                                                                     const LicenseSigner &signer)
    {
        std::vector<bool> results;
        results.reserve(license.sublicenses().size());
        for (const auto &sub : license.sublicenses())
        {
            auto valid = signer.verify(sub, key);
            if (!valid)
                return std::unexpected(valid.error());
            results.push_back(*valid);
        }
        return results;
    }

} // namespace covenant
