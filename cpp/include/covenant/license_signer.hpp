#pragma once

#include "crypto.hpp"
#include "license.hpp"
#include "signer.hpp"
#include "types.hpp"
#include <memory>
#include <string_view>

namespace covenant
{

    /**
     * Sign/verify protocol for license documents.
     *
     * Signing canonicalizes the record without its signature, signs the
     * compact UTF-8 text with ECDSA/SHA-512 and re-parses the result, so the
     * returned license carries a raw body and can be verified at once.
     *
     * Verification only ever hashes the retained raw body of a parsed
     * license. A license that was built but never serialized has no raw body
     * and cannot be verified.
     *
     * Sub-licenses are not verified as part of their parent. Parent and
     * child signatures are independent; callers walk sublicenses() and verify
     * each child themselves.
     */
    class LicenseSigner
    {
    public:
        explicit LicenseSigner(std::shared_ptr<const crypto::Signer> signer = crypto::default_signer());

        /** New license equal to `license` plus a signature */
        Result<License> sign(const License &license, const crypto::PrivateKey &key) const;

        /** Load a PEM or base64 DER private key, then sign */
        Result<License> sign(const License &license, std::string_view private_key, std::string_view passphrase) const;

        /**
         * True when the signature matches the retained raw body.
         * False for a mismatch and for a license that is unsigned or has no
         * raw body. ErrorCode::VerificationError when the signature is not
         * valid base64 or the key cannot be used.
         */
        Result<bool> verify(const License &license, const crypto::PublicKey &key) const;

        /** Load a PEM or base64 DER public key, then verify */
        Result<bool> verify(const License &license, std::string_view public_key) const;

        /**
         * Explains why a license cannot be verified:
         * ErrorCode::MissingSignature or ErrorCode::MissingRawBody.
         */
        static Result<void> check_verifiable(const License &license);

    private:
        std::shared_ptr<const crypto::Signer> signer_;
    };

} // namespace covenant
