#include <catch2/catch_test_macros.hpp>
#include "covenant/license_builder.hpp"
#include "covenant/license_serializer.hpp"
#include "covenant/license_signer.hpp"

using namespace covenant;

namespace
{
    License signed_child(const crypto::KeyPair &pair, const std::string &module)
    {
        return LicenseBuilder()
            .with_random_identifier()
            .as(LicenseKind::Standard)
            .add_product_feature("module", module)
            .create_and_sign(pair.private_key())
            .value();
    }
}

TEST_CASE("Parent embeds children with their signatures", "[sublicense]")
{
    auto pair = crypto::KeyGenerator::generate().value();
    auto child = signed_child(pair, "reports");

    auto parent = LicenseBuilder()
                      .with_random_identifier()
                      .add_sublicense(child)
                      .create_and_sign(pair.private_key())
                      .value();

    auto text = parent.to_string(false);
    REQUIRE(text.find("<Sublicenses><License>") != std::string::npos);
    REQUIRE(text.find(*child.signature()) != std::string::npos);

    auto parsed = License::load(text).value();
    REQUIRE(parsed.sublicenses().size() == 1);
    REQUIRE(parsed.sublicenses()[0] == child);

    LicenseSigner signer;
    REQUIRE(signer.verify(parsed, pair.public_key()).value());
    REQUIRE(signer.verify(parsed.sublicenses()[0], pair.public_key()).value());
}

TEST_CASE("Signed child moved to another parent still verifies", "[sublicense]")
{
    auto pair = crypto::KeyGenerator::generate().value();
    auto other_pair = crypto::KeyGenerator::generate().value();
    auto child = signed_child(pair, "analytics");

    auto first = LicenseBuilder().with_random_identifier().add_sublicense(child).create_and_sign(pair.private_key()).value();
    auto extracted = License::load(first.to_string()).value().sublicenses().at(0);

    auto second = LicenseBuilder()
                      .with_random_identifier()
                      .as(LicenseKind::Trial)
                      .add_sublicense(extracted)
                      .create_and_sign(other_pair.private_key())
                      .value();

    auto reparsed = License::load(second.to_string(true)).value();
    LicenseSigner signer;
    REQUIRE(signer.verify(reparsed, other_pair.public_key()).value());
    REQUIRE(signer.verify(reparsed.sublicenses()[0], pair.public_key()).value());
    REQUIRE_FALSE(signer.verify(reparsed.sublicenses()[0], other_pair.public_key()).value());
}

TEST_CASE("Tampered child fails alone", "[sublicense]")
{
    auto pair = crypto::KeyGenerator::generate().value();
    auto child = signed_child(pair, "reports");
    auto parent = LicenseBuilder().add_sublicense(child).create_and_sign(pair.private_key()).value();

    auto text = parent.to_string(false);
    auto pos = text.find(">reports<");
    REQUIRE(pos != std::string::npos);
    text.replace(pos, 9, ">billing<");

    auto tampered = License::load(text).value();
    LicenseSigner signer;
    REQUIRE_FALSE(signer.verify(tampered, pair.public_key()).value());
    REQUIRE_FALSE(signer.verify(tampered.sublicenses()[0], pair.public_key()).value());
}

TEST_CASE("Unsigned fresh children embed as canonical form", "[sublicense]")
{
    auto child = LicenseBuilder().with_maximum_utilization(2).create().value();
    auto grandparent = LicenseBuilder()
                           .add_sublicense(LicenseBuilder().add_sublicense(child).create().value())
                           .create()
                           .value();

    REQUIRE(LicenseSerializer::to_text(grandparent, false) ==
            "<License><Sublicenses><License><Sublicenses>"
            "<License><Quantity>2</Quantity></License>"
            "</Sublicenses></License></Sublicenses></License>");

    auto parsed = License::load(grandparent.to_string()).value();
    REQUIRE(parsed == grandparent);
    REQUIRE(parsed.sublicenses()[0].sublicenses()[0].quantity() == 2);
    REQUIRE(parsed.sublicenses()[0].sublicenses()[0].raw_body().has_value());
}

TEST_CASE("Sub-license list replacement", "[sublicense]")
{
    LicenseBuilder builder;
    builder.add_sublicense(License{}).add_sublicense(License{});
    REQUIRE(builder.sublicenses().size() == 2);

    builder.with_sublicenses({});
    REQUIRE(builder.create().value().sublicenses().empty());
}
