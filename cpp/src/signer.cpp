#include "covenant/signer.hpp"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <format>

namespace covenant::crypto
{

    namespace
    {
        struct MdCtxDeleter
        {
            void operator()(EVP_MD_CTX *p) const { EVP_MD_CTX_free(p); }
        };
        using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

        const EVP_MD *digest_for(SignatureAlgorithm algorithm)
        {
            switch (algorithm)
            {
            case SignatureAlgorithm::EcdsaSha512:
                return EVP_sha512();
            }
            return nullptr;
        }
    } // namespace

    std::string_view algorithm_oid(SignatureAlgorithm algorithm)
    {
        switch (algorithm)
        {
        case SignatureAlgorithm::EcdsaSha512:
            return "1.2.840.10045.4.3.4";
        }
        return {};
    }

    Result<Bytes> OpenSslSigner::sign(
        SignatureAlgorithm algorithm,
        const PrivateKey &key,
        const Bytes &message) const
    {
        MdCtxPtr ctx(EVP_MD_CTX_new());
        if (!ctx)
        {
            return std::unexpected(CovenantError::signing("Failed to allocate digest context"));
        }

        if (EVP_DigestSignInit(ctx.get(), nullptr, digest_for(algorithm), nullptr, key.get()) != 1 ||
            EVP_DigestSignUpdate(ctx.get(), message.data(), message.size()) != 1)
        {
            return std::unexpected(CovenantError::signing(
                std::format("Signing setup failed: {}", openssl_error_string())));
        }

        size_t sig_len = 0;
        if (EVP_DigestSignFinal(ctx.get(), nullptr, &sig_len) != 1)
        {
            return std::unexpected(CovenantError::signing(
                std::format("Signing failed: {}", openssl_error_string())));
        }
        Bytes signature(sig_len);
        if (EVP_DigestSignFinal(ctx.get(), signature.data(), &sig_len) != 1)
        {
            return std::unexpected(CovenantError::signing(
                std::format("Signing failed: {}", openssl_error_string())));
        }
        signature.resize(sig_len);
        return signature;
    }

    Result<bool> OpenSslSigner::verify(
        SignatureAlgorithm algorithm,
        const PublicKey &key,
        const Bytes &message,
        const Bytes &signature) const
    {
        MdCtxPtr ctx(EVP_MD_CTX_new());
        if (!ctx)
        {
            return std::unexpected(CovenantError::verification("Failed to allocate digest context"));
        }

        if (EVP_DigestVerifyInit(ctx.get(), nullptr, digest_for(algorithm), nullptr, key.get()) != 1 ||
            EVP_DigestVerifyUpdate(ctx.get(), message.data(), message.size()) != 1)
        {
            return std::unexpected(CovenantError::verification(
                std::format("Verification setup failed: {}", openssl_error_string())));
        }

        // 0 is a mismatch, negative values a signature that is not valid DER;
        // both mean the signature does not belong to this message and key.
        int rc = EVP_DigestVerifyFinal(ctx.get(), signature.data(), signature.size());
        if (rc == 1)
            return true;
        ERR_clear_error();
        return false;
    }

    std::shared_ptr<const Signer> default_signer()
    {
        static const std::shared_ptr<const Signer> signer = std::make_shared<OpenSslSigner>();
        return signer;
    }

} // namespace covenant::crypto
