#include "covenant/license_builder.hpp"
#include "covenant/license_serializer.hpp"
#include <format>

namespace covenant
{

    LicenseBuilder &LicenseBuilder::with_unique_identifier(const Uuid &id)
    {
        id_ = id;
        return *this;
    }

    LicenseBuilder &LicenseBuilder::with_random_identifier()
    {
        id_ = Uuid::generate();
        return *this;
    }

    LicenseBuilder &LicenseBuilder::expires_at(Timestamp date)
    {
        expiration_ = date;
        return *this;
    }

    LicenseBuilder &LicenseBuilder::as(LicenseKind kind)
    {
        kind_ = kind;
        return *this;
    }

    LicenseBuilder &LicenseBuilder::with_maximum_utilization(uint32_t quantity)
    {
        quantity_ = quantity;
        return *this;
    }

    LicenseBuilder &LicenseBuilder::licensed_to(std::string name)
    {
        customer_ = Customer{std::move(name), {}};
        return *this;
    }

    LicenseBuilder &LicenseBuilder::licensed_to(std::string name, std::string email)
    {
        customer_ = Customer{std::move(name), std::move(email)};
        return *this;
    }

    LicenseBuilder &LicenseBuilder::with_version(uint32_t version)
    {
        version_ = version;
        return *this;
    }

    LicenseBuilder &LicenseBuilder::with_product_features(AttributeMap features)
    {
        product_features_ = std::move(features);
        return *this;
    }

    LicenseBuilder &LicenseBuilder::add_product_feature(std::string name, std::string value)
    {
        product_features_.insert_or_assign(std::move(name), std::move(value));
        return *this;
    }

    LicenseBuilder &LicenseBuilder::with_additional_attributes(AttributeMap attributes)
    {
        additional_attributes_ = std::move(attributes);
        return *this;
    }

    LicenseBuilder &LicenseBuilder::add_additional_attribute(std::string name, std::string value)
    {
        additional_attributes_.insert_or_assign(std::move(name), std::move(value));
        return *this;
    }

    LicenseBuilder &LicenseBuilder::with_sublicenses(std::vector<License> sublicenses)
    {
        sublicenses_ = std::move(sublicenses);
        return *this;
    }

    LicenseBuilder &LicenseBuilder::add_sublicense(License sublicense)
    {
        sublicenses_.push_back(std::move(sublicense));
        return *this;
    }

    Result<License> LicenseBuilder::create() const
    {
        const auto expiration = expiration_.value_or(kNeverExpires);
        if (!is_representable(expiration))
        {
            return std::unexpected(CovenantError::invalid_input(
                "Expiration must fall between years 0001 and 9999"));
        }

        License license;
        license.id_ = id_;
        license.kind_ = kind_.value_or(LicenseKind::None);
        license.quantity_ = quantity_;
        license.expiration_ = expiration;
        license.customer_ = customer_;
        license.product_features_ = product_features_;
        license.additional_attributes_ = additional_attributes_;
        license.sublicenses_ = sublicenses_;
        license.version_ = version_;

        if (auto encodable = LicenseSerializer::check_encodable(license); !encodable)
            return std::unexpected(encodable.error());
        return license;
    }

    Result<License> LicenseBuilder::create_and_sign(const crypto::PrivateKey &key, const LicenseSigner &signer) const
    {
        auto license = create();
        if (!license)
            return std::unexpected(license.error());
        return signer.sign(*license, key);
    }

    Result<License> LicenseBuilder::create_and_sign(std::string_view private_key, std::string_view passphrase,
                                                    const LicenseSigner &signer) const
    {
        auto license = create();
        if (!license)
            return std::unexpected(license.error());
        return signer.sign(*license, private_key, passphrase);
    }

} // namespace covenant
