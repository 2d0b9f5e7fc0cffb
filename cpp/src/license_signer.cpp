#include "covenant/license_signer.hpp"
#include "covenant/license_serializer.hpp"
#include <spdlog/spdlog.h>
#include <format>

namespace covenant
{

    namespace
    {
        crypto::Bytes to_bytes(const std::string &text)
        {
            return crypto::Bytes(text.begin(), text.end());
        }
    } // namespace

    LicenseSigner::LicenseSigner(std::shared_ptr<const crypto::Signer> signer)
        : signer_(std::move(signer))
    {
    }

    Result<License> LicenseSigner::sign(const License &license, const crypto::PrivateKey &key) const
    {
        if (auto encodable = LicenseSerializer::check_encodable(license); !encodable)
            return std::unexpected(encodable.error());

        auto body = LicenseSerializer::to_canonical_form(license, false);
        auto message = to_bytes(LicenseSerializer::signable_text(body));

        auto signature = signer_->sign(crypto::SignatureAlgorithm::EcdsaSha512, key, message);
        if (!signature)
        {
            return std::unexpected(CovenantError::signing(signature.error().what()));
        }

        body.root().append_text_child("Signature", crypto::Base64::encode(*signature));
        spdlog::debug("Signed license {} ({} bytes covered)", license.id().to_string(), message.size());

        auto signed_license = LicenseSerializer::from_document(std::move(body));
        if (!signed_license)
        {
            return std::unexpected(CovenantError::signing(
                std::format("Signed license failed to re-parse: {}", signed_license.error().what())));
        }
        return signed_license;
    }

    Result<License> LicenseSigner::sign(const License &license, std::string_view private_key, std::string_view passphrase) const
    {
        auto key = crypto::PrivateKey::load(private_key, passphrase);
        if (!key)
        {
            return std::unexpected(CovenantError::signing(key.error().what()));
        }
        return sign(license, *key);
    }

    Result<void> LicenseSigner::check_verifiable(const License &license)
    {
        if (!license.signature())
        {
            return std::unexpected(CovenantError::missing_signature(
                std::format("License {} carries no signature", license.id().to_string())));
        }
        if (!license.raw_body())
        {
            return std::unexpected(CovenantError::missing_raw_body(
                std::format("License {} was never parsed; no signed bytes to check", license.id().to_string())));
        }
        return {};
    }

    Result<bool> LicenseSigner::verify(const License &license, const crypto::PublicKey &key) const
    {
        if (auto verifiable = check_verifiable(license); !verifiable)
        {
            spdlog::debug("Verification refused: {}", verifiable.error().what());
            return false;
        }

        auto signature = crypto::Base64::decode(*license.signature());
        if (!signature)
        {
            return std::unexpected(CovenantError::verification("Signature is not valid base64"));
        }

        auto message = to_bytes(LicenseSerializer::signable_text(*license.raw_body()));
        auto valid = signer_->verify(crypto::SignatureAlgorithm::EcdsaSha512, key, message, *signature);
        if (!valid)
        {
            return std::unexpected(CovenantError::verification(valid.error().what()));
        }
        if (!*valid)
        {
            spdlog::warn("Signature mismatch for license {}", license.id().to_string());
        }
        return *valid;
    }

    Result<bool> LicenseSigner::verify(const License &license, std::string_view public_key) const
    {
        auto key = crypto::PublicKey::load(public_key);
        if (!key)
        {
            return std::unexpected(CovenantError::verification(key.error().what()));
        }
        return verify(license, *key);
    }

} // namespace covenant
