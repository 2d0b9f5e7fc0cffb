#include "covenant/license.hpp"
#include "covenant/license_serializer.hpp"
#include <algorithm>
#include <cctype>
#include <format>

namespace covenant
{

    using Json = nlohmann::json;

    Result<LicenseKind> license_kind_from_string(std::string_view s)
    {
        const auto first = s.find_first_not_of(" \t\r\n");
        const auto last = s.find_last_not_of(" \t\r\n");
        std::string token;
        if (first != std::string_view::npos)
        {
            for (char c : s.substr(first, last - first + 1))
                token += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        if (token == "none")
            return LicenseKind::None;
        if (token == "trial")
            return LicenseKind::Trial;
        if (token == "standard")
            return LicenseKind::Standard;
        if (token == "unrestricted")
            return LicenseKind::Unrestricted;
        return std::unexpected(CovenantError::invalid_input(std::format("Invalid license type: '{}'", s)));
    }

    Result<License> License::load(std::string_view text)
    {
        return LicenseSerializer::from_text(text);
    }

    std::string License::to_string(bool pretty) const
    {
        return LicenseSerializer::to_text(*this, pretty);
    }

    Json License::to_json() const
    {
        Json j = {
            {"id", id_.to_string()},
            {"type", license_kind_to_string(kind_)},
            {"quantity", quantity_},
            {"expiration", format_rfc1123(expiration_)},
            {"never_expires", never_expires()},
            {"version", version_},
            {"product_features", product_features_},
            {"additional_attributes", additional_attributes_}};

        if (customer_)
        {
            j["customer"] = {{"name", customer_->name}, {"email", customer_->email}};
        }

        Json subs = Json::array();
        for (const auto &sub : sublicenses_)
        {
            subs.push_back(sub.to_json());
        }
        j["sublicenses"] = subs;

        if (signature_)
            j["signature"] = *signature_;
        j["verifiable"] = signature_.has_value() && raw_body_.has_value();

        return j;
    }

    bool License::operator==(const License &other) const
    {
        return id_ == other.id_ &&
               kind_ == other.kind_ &&
               quantity_ == other.quantity_ &&
               expiration_ == other.expiration_ &&
               customer_ == other.customer_ &&
               product_features_ == other.product_features_ &&
               additional_attributes_ == other.additional_attributes_ &&
               version_ == other.version_ &&
               signature_ == other.signature_ &&
               std::equal(sublicenses_.begin(), sublicenses_.end(),
                          other.sublicenses_.begin(), other.sublicenses_.end());
    }

} // namespace covenant
