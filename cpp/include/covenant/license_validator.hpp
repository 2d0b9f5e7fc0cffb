#pragma once

#include "crypto.hpp"
#include "license.hpp"
#include "license_signer.hpp"
#include "timestamp.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace covenant
{

    /**
     * Acceptance checks for a license file on the consuming side.
     */
    class LicenseValidator
    {
    public:
        /** Load a persisted license file */
        static Result<License> load(const std::string &path);

        /**
         * Check signature and expiry against `now`.
         * ErrorCode::LicenseError when unsigned, not verifiable, mismatched
         * or expired; ErrorCode::VerificationError is propagated.
         */
        static Result<void> validate(const License &license, const crypto::PublicKey &key, Timestamp now,
                                     const LicenseSigner &signer = LicenseSigner());

        /** Verify each direct sub-license on its own; one entry per child */
        static Result<std::vector<bool>> validate_sublicenses(const License &license, const crypto::PublicKey &key,
                                                              const LicenseSigner &signer = LicenseSigner());
    };
}
