#pragma once

#include "crypto.hpp"
#include "license.hpp"
#include "license_signer.hpp"
#include "timestamp.hpp"
#include "types.hpp"
#include "uuid.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace covenant
{

    /**
     * Mutable accumulator for a new License.
     *
     * Setters overwrite earlier values. Feature and attribute maps and the
     * sub-license list can be replaced wholesale or extended one entry at a
     * time. No cross-field validation is done.
     */
    class LicenseBuilder
    {
    public:
        LicenseBuilder() = default;

        LicenseBuilder &with_unique_identifier(const Uuid &id);
        LicenseBuilder &with_random_identifier();
        LicenseBuilder &expires_at(Timestamp date);
        LicenseBuilder &as(LicenseKind kind);
        LicenseBuilder &with_maximum_utilization(uint32_t quantity);
        LicenseBuilder &licensed_to(std::string name);
        LicenseBuilder &licensed_to(std::string name, std::string email);
        LicenseBuilder &with_version(uint32_t version);

        LicenseBuilder &with_product_features(AttributeMap features);
        LicenseBuilder &add_product_feature(std::string name, std::string value);

        LicenseBuilder &with_additional_attributes(AttributeMap attributes);
        LicenseBuilder &add_additional_attribute(std::string name, std::string value);

        /** Sub-licenses should already be signed when they are attached */
        LicenseBuilder &with_sublicenses(std::vector<License> sublicenses);
        LicenseBuilder &add_sublicense(License sublicense);

        const Uuid &id() const { return id_; }
        const std::optional<Timestamp> &expiration() const { return expiration_; }
        const std::optional<LicenseKind> &kind() const { return kind_; }
        uint32_t quantity() const { return quantity_; }
        const std::optional<Customer> &customer() const { return customer_; }
        const AttributeMap &product_features() const { return product_features_; }
        const AttributeMap &additional_attributes() const { return additional_attributes_; }
        const std::vector<License> &sublicenses() const { return sublicenses_; }
        uint32_t version() const { return version_; }

        /**
         * Materialize an unsigned license. An unset expiration becomes
         * kNeverExpires and an unset kind becomes None.
         * Fails with ErrorCode::InvalidInput when the expiration lies outside
         * years 0001-9999.
         */
        Result<License> create() const;

        /** create() followed by LicenseSigner::sign */
        Result<License> create_and_sign(const crypto::PrivateKey &key, const LicenseSigner &signer = LicenseSigner()) const;

        /** create() followed by signing with a PEM or base64 DER private key */
        Result<License> create_and_sign(std::string_view private_key, std::string_view passphrase,
                                        const LicenseSigner &signer = LicenseSigner()) const;

    private:
        Uuid id_{};
        std::optional<Timestamp> expiration_;
        std::optional<LicenseKind> kind_;
        uint32_t quantity_{0};
        std::optional<Customer> customer_;
        AttributeMap product_features_;
        AttributeMap additional_attributes_;
        std::vector<License> sublicenses_;
        uint32_t version_{0};
    };

} // namespace covenant
