#pragma once

#include "timestamp.hpp"
#include "types.hpp"
#include "uuid.hpp"
#include "xml_document.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace covenant
{

    /**
     * Category of a license
     */
    enum class LicenseKind
    {
        None = 0,
        Trial = 1,
        Standard = 2,
        Unrestricted = 3
    };

    /**
     * Convert LicenseKind to its document token
     */
    inline std::string license_kind_to_string(LicenseKind kind)
    {
        switch (kind)
        {
        case LicenseKind::None:
            return "None";
        case LicenseKind::Trial:
            return "Trial";
        case LicenseKind::Standard:
            return "Standard";
        case LicenseKind::Unrestricted:
            return "Unrestricted";
        }
        return "None";
    }

    /**
     * Parse LicenseKind, case-insensitive, surrounding whitespace ignored
     */
    Result<LicenseKind> license_kind_from_string(std::string_view s);

    /**
     * License holder. Empty strings mean "not given".
     */
    struct Customer
    {
        std::string name;
        std::string email;

        bool operator==(const Customer &other) const = default;
    };

    /** Feature or attribute name -> value, kept in name order */
    using AttributeMap = std::map<std::string, std::string>;

    /**
     * Immutable license record.
     *
     * Built fresh through LicenseBuilder, or reconstructed by
     * LicenseSerializer. A parsed license keeps the exact parsed tree minus
     * its Signature element as raw_body(); signature verification always
     * runs over that tree, never over a re-serialization of the fields.
     */
    class License
    {
    public:
        /** All fields at their defaults; unsigned, no raw body */
        License() = default;

        /** Parse persisted license text */
        static Result<License> load(std::string_view text);

        const Uuid &id() const { return id_; }
        LicenseKind kind() const { return kind_; }
        uint32_t quantity() const { return quantity_; }
        Timestamp expiration() const { return expiration_; }
        const std::optional<Customer> &customer() const { return customer_; }
        const AttributeMap &product_features() const { return product_features_; }
        const AttributeMap &additional_attributes() const { return additional_attributes_; }
        const std::vector<License> &sublicenses() const { return sublicenses_; }
        uint32_t version() const { return version_; }
        const std::optional<std::string> &signature() const { return signature_; }

        /** Tree the signature was computed over; present only for parsed licenses */
        const std::optional<xml::Document> &raw_body() const { return raw_body_; }

        bool is_signed() const { return signature_.has_value(); }

        bool never_expires() const { return expiration_ == kNeverExpires; }

        bool is_expired(Timestamp now) const { return expiration_ < now; }

        /** Persisted text form (see LicenseSerializer::to_text) */
        std::string to_string(bool pretty = true) const;

        /** JSON view for inspection; not a signed representation */
        nlohmann::json to_json() const;

        /** Field-wise comparison; the raw body is bookkeeping and is ignored */
        bool operator==(const License &other) const;

    private:
        Uuid id_{};
        LicenseKind kind_{LicenseKind::None};
        uint32_t quantity_{0};
        Timestamp expiration_{kNeverExpires};
        std::optional<Customer> customer_;
        AttributeMap product_features_;
        AttributeMap additional_attributes_;
        std::vector<License> sublicenses_;
        uint32_t version_{0};
        std::optional<std::string> signature_;
        std::optional<xml::Document> raw_body_;

        friend class LicenseBuilder;
        friend class LicenseSerializer;
    };

} // namespace covenant
