#include <catch2/catch_test_macros.hpp>
#include "covenant/license_builder.hpp"
#include "covenant/license_serializer.hpp"

using namespace covenant;
using namespace std::chrono;

namespace
{
    const Uuid kFixedId = Uuid::parse("77d4c193-6088-4c64-9663-ed7398ae8c1a").value();

    License make_full_license()
    {
        return LicenseBuilder()
            .with_unique_identifier(kFixedId)
            .as(LicenseKind::Standard)
            .with_maximum_utilization(5)
            .expires_at(sys_days{year{2030} / 1 / 1})
            .licensed_to("Ada Lovelace", "ada@example.com")
            .add_product_feature("seats", "5")
            .add_product_feature("export", "true")
            .add_additional_attribute("region", "eu")
            .with_version(2)
            .create()
            .value();
    }
}

TEST_CASE("Default license is sparse", "[serializer]")
{
    License empty;
    REQUIRE(LicenseSerializer::to_text(empty, false) == "<License></License>");
    REQUIRE(LicenseSerializer::to_canonical_form(empty, true).root().element_count() == 0);
}

TEST_CASE("Canonical element order", "[serializer]")
{
    auto license = make_full_license();
    auto text = LicenseSerializer::to_text(license, false);

    REQUIRE(text ==
            "<License version=\"2\">"
            "<Id>77d4c193-6088-4c64-9663-ed7398ae8c1a</Id>"
            "<Type>Standard</Type>"
            "<Quantity>5</Quantity>"
            "<Customer><Name>Ada Lovelace</Name><Email>ada@example.com</Email></Customer>"
            "<LicenseAttributes><Attribute name=\"region\">eu</Attribute></LicenseAttributes>"
            "<Expiration>Tue, 01 Jan 2030 00:00:00 GMT</Expiration>"
            "<ProductFeatures><Feature name=\"export\">true</Feature><Feature name=\"seats\">5</Feature></ProductFeatures>"
            "</License>");
}

TEST_CASE("Customer without email omits the Email element", "[serializer]")
{
    auto license = LicenseBuilder().licensed_to("Solo").create().value();
    REQUIRE(LicenseSerializer::to_text(license, false) ==
            "<License><Customer><Name>Solo</Name></Customer></License>");
}

TEST_CASE("Round trip through text", "[serializer]")
{
    auto license = make_full_license();

    for (bool pretty : {true, false})
    {
        auto parsed = LicenseSerializer::from_text(LicenseSerializer::to_text(license, pretty));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == license);
        REQUIRE(parsed->raw_body().has_value());
        REQUIRE_FALSE(parsed->is_signed());
    }
}

TEST_CASE("Sentinel expiration round trips", "[serializer]")
{
    auto license = LicenseBuilder().with_unique_identifier(kFixedId).create().value();
    REQUIRE(license.never_expires());

    auto text = license.to_string(false);
    REQUIRE(text.find("Expiration") == std::string::npos);

    auto parsed = License::load(text).value();
    REQUIRE(parsed.expiration() == kNeverExpires);
    REQUIRE(parsed.never_expires());

    auto explicit_sentinel = License::load(
        "<License><Expiration>Fri, 31 Dec 9999 23:59:59 GMT</Expiration></License>");
    REQUIRE(explicit_sentinel.has_value());
    REQUIRE(explicit_sentinel->never_expires());

    auto empty_element = License::load("<License><Expiration></Expiration></License>");
    REQUIRE(empty_element.has_value());
    REQUIRE(empty_element->expiration() == kNeverExpires);
}

TEST_CASE("Lenient parsing of field values", "[serializer]")
{
    auto parsed = License::load(
        "<License version=\" 4 \">"
        "<Id>{77D4C193-6088-4C64-9663-ED7398AE8C1A}</Id>"
        "<Type> trial </Type>"
        "<Quantity> 12 </Quantity>"
        "</License>");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->version() == 4);
    REQUIRE(parsed->id() == kFixedId);
    REQUIRE(parsed->kind() == LicenseKind::Trial);
    REQUIRE(parsed->quantity() == 12);
}

TEST_CASE("Parsing reports the malformed field", "[serializer]")
{
    struct Case
    {
        const char *text;
        const char *field;
    };
    const Case cases[] = {
        {"<Licence></Licence>", "License"},
        {"<License version=\"-1\"></License>", "version"},
        {"<License><Id>not-a-guid</Id></License>", "Id"},
        {"<License><Type>Gold</Type></License>", "Type"},
        {"<License><Quantity>-3</Quantity></License>", "Quantity"},
        {"<License><Quantity>many</Quantity></License>", "Quantity"},
        {"<License><Expiration>2030-01-01</Expiration></License>", "Expiration"},
        {"<License><ProductFeatures><Feature>1</Feature></ProductFeatures></License>", "Feature"},
        {"<License><LicenseAttributes><Attribute name=\"a\">1</Attribute><Attribute name=\"a\">2</Attribute></LicenseAttributes></License>", "Attribute"},
        {"<License><Sublicenses><License><Type>Gold</Type></License></Sublicenses></License>", "Sublicenses"},
    };

    for (const auto &c : cases)
    {
        auto parsed = License::load(c.text);
        REQUIRE_FALSE(parsed.has_value());
        CHECK(parsed.error().code == ErrorCode::MalformedRecord);
        CHECK(parsed.error().field == c.field);
    }
}

TEST_CASE("Unparseable text is malformed", "[serializer]")
{
    auto parsed = License::load("<License><Id>");
    REQUIRE_FALSE(parsed.has_value());
    REQUIRE(parsed.error().code == ErrorCode::MalformedRecord);
}

TEST_CASE("Signature element is split from the raw body", "[serializer]")
{
    auto parsed = License::load("<License><Quantity>1</Quantity><Signature>c2ln</Signature></License>");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->signature() == "c2ln");
    REQUIRE(LicenseSerializer::signable_text(*parsed->raw_body()) == "<License><Quantity>1</Quantity></License>");
    REQUIRE(parsed->to_string(false) == "<License><Quantity>1</Quantity><Signature>c2ln</Signature></License>");
}

TEST_CASE("Persisting a parsed license keeps its raw body", "[serializer]")
{
    // Kind token in unusual case survives persistence unchanged
    auto parsed = License::load("<License><Type>STANDARD</Type></License>").value();
    REQUIRE(parsed.kind() == LicenseKind::Standard);
    REQUIRE(parsed.to_string(false) == "<License><Type>STANDARD</Type></License>");
    REQUIRE(LicenseSerializer::to_canonical_form(parsed, false).to_text(false) ==
            "<License><Type>Standard</Type></License>");
}

TEST_CASE("JSON view", "[serializer]")
{
    auto json = make_full_license().to_json();
    REQUIRE(json["id"] == "77d4c193-6088-4c64-9663-ed7398ae8c1a");
    REQUIRE(json["type"] == "Standard");
    REQUIRE(json["quantity"] == 5);
    REQUIRE(json["product_features"]["seats"] == "5");
    REQUIRE(json["customer"]["email"] == "ada@example.com");
    REQUIRE(json["verifiable"] == false);
}
