#pragma once

#include "crypto.hpp"
#include "types.hpp"
#include <memory>
#include <string_view>

namespace covenant::crypto
{

    /**
     * Signature algorithms understood by a Signer.
     * License documents are always signed with EcdsaSha512.
     */
    enum class SignatureAlgorithm
    {
        EcdsaSha512
    };

    /** Object identifier of the algorithm, e.g. "1.2.840.10045.4.3.4" */
    std::string_view algorithm_oid(SignatureAlgorithm algorithm);

    /**
     * Abstract signing capability.
     * Implementations must be safe for concurrent use; all key material is
     * passed per call.
     */
    class Signer
    {
    public:
        virtual ~Signer() = default;

        /**
         * Sign message bytes, returns the DER-encoded signature.
         * Failures are reported as ErrorCode::SigningError.
         */
        virtual Result<Bytes> sign(
            SignatureAlgorithm algorithm,
            const PrivateKey &key,
            const Bytes &message) const = 0;

        /**
         * Verify a DER-encoded signature.
         * Returns false on mismatch, ErrorCode::VerificationError when the
         * key cannot be used for verification.
         */
        virtual Result<bool> verify(
            SignatureAlgorithm algorithm,
            const PublicKey &key,
            const Bytes &message,
            const Bytes &signature) const = 0;
    };

    /**
     * Signer backed by OpenSSL EVP_DigestSign / EVP_DigestVerify
     */
    class OpenSslSigner : public Signer
    {
    public:
        Result<Bytes> sign(
            SignatureAlgorithm algorithm,
            const PrivateKey &key,
            const Bytes &message) const override;

        Result<bool> verify(
            SignatureAlgorithm algorithm,
            const PublicKey &key,
            const Bytes &message,
            const Bytes &signature) const override;
    };

    /** Process-wide stateless OpenSslSigner instance */
    std::shared_ptr<const Signer> default_signer();

} // namespace covenant::crypto
