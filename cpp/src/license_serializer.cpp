#include "covenant/license_serializer.hpp"
#include <spdlog/spdlog.h>
#include <charconv>
#include <format>
#include <optional>

namespace covenant
{

    namespace
    {
        constexpr std::string_view kLicense = "License";
        constexpr std::string_view kVersion = "version";
        constexpr std::string_view kId = "Id";
        constexpr std::string_view kType = "Type";
        constexpr std::string_view kQuantity = "Quantity";
        constexpr std::string_view kCustomer = "Customer";
        constexpr std::string_view kName = "Name";
        constexpr std::string_view kEmail = "Email";
        constexpr std::string_view kLicenseAttributes = "LicenseAttributes";
        constexpr std::string_view kAttribute = "Attribute";
        constexpr std::string_view kExpiration = "Expiration";
        constexpr std::string_view kProductFeatures = "ProductFeatures";
        constexpr std::string_view kFeature = "Feature";
        constexpr std::string_view kSublicenses = "Sublicenses";
        constexpr std::string_view kSignature = "Signature";
        constexpr std::string_view kNameAttribute = "name";

        std::optional<uint32_t> parse_unsigned(std::string_view text)
        {
            const auto first = text.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos)
                return std::nullopt;
            const auto last = text.find_last_not_of(" \t\r\n");
            text = text.substr(first, last - first + 1);

            uint32_t value = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size())
                return std::nullopt;
            return value;
        }

        void append_map(xml::Element parent, std::string_view block, std::string_view entry, const AttributeMap &map)
        {
            if (map.empty())
                return;
            auto container = parent.append_child(block);
            for (const auto &[name, value] : map)
            {
                auto element = container.append_text_child(entry, value);
                element.set_attribute(kNameAttribute, name);
            }
        }

        Result<void> check_text(std::string_view field, const std::string &value)
        {
            if (xml::is_xml_text(value))
                return {};
            return std::unexpected(CovenantError::invalid_input(
                std::format("{} is not valid UTF-8 XML text", field), std::string(field)));
        }

        Result<void> check_map(std::string_view entry, const AttributeMap &map)
        {
            for (const auto &[name, value] : map)
            {
                if (auto ok = check_text(entry, name); !ok)
                    return ok;
                if (auto ok = check_text(entry, value); !ok)
                    return ok;
            }
            return {};
        }

        Result<AttributeMap> read_map(const xml::Element &block, std::string_view entry)
        {
            AttributeMap map;
            for (const auto &element : block.children(entry))
            {
                auto name = element.attribute(kNameAttribute);
                if (!name)
                {
                    return std::unexpected(CovenantError::malformed(
                        std::string(entry), "missing 'name' attribute"));
                }
                if (!map.emplace(*name, element.text()).second)
                {
                    return std::unexpected(CovenantError::malformed(
                        std::string(entry), std::format("duplicate name '{}'", *name)));
                }
            }
            return map;
        }
    } // namespace

    xml::Document LicenseSerializer::to_canonical_form(const License &license, bool include_signature)
    {
        xml::Document doc(kLicense);
        auto root = doc.root();

        if (license.version_ > 0)
        {
            root.set_attribute(kVersion, std::to_string(license.version_));
        }

        if (!license.id_.is_nil())
        {
            root.append_text_child(kId, license.id_.to_string());
        }

        if (license.kind_ != LicenseKind::None)
        {
            root.append_text_child(kType, license_kind_to_string(license.kind_));
        }

        if (license.quantity_ != 0)
        {
            root.append_text_child(kQuantity, std::to_string(license.quantity_));
        }

        if (license.customer_)
        {
            auto customer = root.append_child(kCustomer);
            if (!license.customer_->name.empty())
                customer.append_text_child(kName, license.customer_->name);
            if (!license.customer_->email.empty())
                customer.append_text_child(kEmail, license.customer_->email);
        }

        append_map(root, kLicenseAttributes, kAttribute, license.additional_attributes_);

        if (license.expiration_ != kNeverExpires)
        {
            root.append_text_child(kExpiration, format_rfc1123(license.expiration_));
        }

        append_map(root, kProductFeatures, kFeature, license.product_features_);

        if (!license.sublicenses_.empty())
        {
            auto block = root.append_child(kSublicenses);
            for (const auto &sub : license.sublicenses_)
            {
                if (sub.raw_body_)
                {
                    // Embed the bytes the child's own signature covers
                    auto child = block.append_copy(sub.raw_body_->root());
                    if (sub.signature_)
                        child.append_text_child(kSignature, *sub.signature_);
                }
                else
                {
                    auto child_doc = to_canonical_form(sub, true);
                    block.append_copy(child_doc.root());
                }
            }
        }

        if (include_signature && license.signature_)
        {
            root.append_text_child(kSignature, *license.signature_);
        }

        return doc;
    }

    xml::Document LicenseSerializer::to_document(const License &license)
    {
        if (!license.raw_body_)
        {
            return to_canonical_form(license, true);
        }

        xml::Document doc(*license.raw_body_);
        if (license.signature_)
        {
            doc.root().append_text_child(kSignature, *license.signature_);
        }
        return doc;
    }

    Result<License> LicenseSerializer::from_document(xml::Document document)
    {
        auto root = document.root();
        if (root.name() != kLicense)
        {
            return std::unexpected(CovenantError::malformed(
                std::string(kLicense), std::format("unexpected root element '{}'", root.name())));
        }

        License license;

        if (auto version = root.attribute(kVersion))
        {
            auto value = parse_unsigned(*version);
            if (!value)
            {
                return std::unexpected(CovenantError::malformed(
                    std::string(kVersion), std::format("not a non-negative integer: '{}'", *version)));
            }
            license.version_ = *value;
        }

        if (auto id = root.child(kId))
        {
            auto parsed = Uuid::parse(id->text());
            if (!parsed)
            {
                return std::unexpected(CovenantError::malformed(std::string(kId), parsed.error().what()));
            }
            license.id_ = *parsed;
        }

        if (auto type = root.child(kType))
        {
            auto parsed = license_kind_from_string(type->text());
            if (!parsed)
            {
                return std::unexpected(CovenantError::malformed(std::string(kType), parsed.error().what()));
            }
            license.kind_ = *parsed;
        }

        if (auto quantity = root.child(kQuantity))
        {
            auto text = quantity->text();
            auto value = parse_unsigned(text);
            if (!value)
            {
                return std::unexpected(CovenantError::malformed(
                    std::string(kQuantity), std::format("not a non-negative integer: '{}'", text)));
            }
            license.quantity_ = *value;
        }

        if (auto customer = root.child(kCustomer))
        {
            Customer holder;
            if (auto name = customer->child(kName))
                holder.name = name->text();
            if (auto email = customer->child(kEmail))
                holder.email = email->text();
            license.customer_ = std::move(holder);
        }

        if (auto attributes = root.child(kLicenseAttributes))
        {
            auto map = read_map(*attributes, kAttribute);
            if (!map)
                return std::unexpected(map.error());
            license.additional_attributes_ = std::move(*map);
        }

        if (auto expiration = root.child(kExpiration))
        {
            auto text = expiration->text();
            if (!text.empty())
            {
                auto parsed = parse_rfc1123(text);
                if (!parsed)
                {
                    return std::unexpected(CovenantError::malformed(std::string(kExpiration), parsed.error().what()));
                }
                license.expiration_ = *parsed;
            }
        }

        if (auto features = root.child(kProductFeatures))
        {
            auto map = read_map(*features, kFeature);
            if (!map)
                return std::unexpected(map.error());
            license.product_features_ = std::move(*map);
        }

        if (auto block = root.child(kSublicenses))
        {
            size_t index = 0;
            for (const auto &element : block->children(kLicense))
            {
                auto sub = from_document(xml::Document::from_element(element));
                if (!sub)
                {
                    return std::unexpected(CovenantError::malformed(
                        std::string(kSublicenses),
                        std::format("sub-license #{}: {}", index, sub.error().what())));
                }
                license.sublicenses_.push_back(std::move(*sub));
                ++index;
            }
        }

        if (auto signature = root.child(kSignature))
        {
            license.signature_ = signature->text();
            root.remove_child(kSignature);
        }

        license.raw_body_ = std::move(document);
        return license;
    }

    Result<License> LicenseSerializer::from_text(std::string_view text)
    {
        auto document = xml::Document::parse(text);
        if (!document)
        {
            spdlog::debug("License text rejected by XML parser: {}", document.error().what());
            return std::unexpected(document.error());
        }
        return from_document(std::move(*document));
    }

    std::string LicenseSerializer::to_text(const License &license, bool pretty)
    {
        return to_document(license).to_text(pretty);
    }

    Result<void> LicenseSerializer::check_encodable(const License &license)
    {
        if (license.customer_)
        {
            if (auto ok = check_text("Customer.Name", license.customer_->name); !ok)
                return ok;
            if (auto ok = check_text("Customer.Email", license.customer_->email); !ok)
                return ok;
        }
        if (auto ok = check_map(kFeature, license.product_features_); !ok)
            return ok;
        if (auto ok = check_map(kAttribute, license.additional_attributes_); !ok)
            return ok;

        for (const auto &sub : license.sublicenses_)
        {
            if (sub.raw_body_)
                continue;
            if (auto ok = check_encodable(sub); !ok)
                return ok;
        }
        return {};
    }

    std::string LicenseSerializer::signable_text(const xml::Document &body)
    {
        return body.to_text(false);
    }

} // namespace covenant
