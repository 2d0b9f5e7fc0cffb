#pragma once

#include "license.hpp"
#include "types.hpp"
#include "xml_document.hpp"
#include <string>
#include <string_view>

namespace covenant
{

    /**
     * Converts licenses to and from their canonical tree.
     *
     * The element order and omission rules below are the compatibility
     * contract between the party that signs and the party that verifies:
     *
     *   <License version="N">          version only when > 0
     *     <Id/>                        omitted when nil
     *     <Type/>                      omitted when None
     *     <Quantity/>                  omitted when 0
     *     <Customer><Name/><Email/></Customer>
     *     <LicenseAttributes><Attribute name=""/>...</LicenseAttributes>
     *     <Expiration/>                omitted when never expiring
     *     <ProductFeatures><Feature name=""/>...</ProductFeatures>
     *     <Sublicenses><License/>...</Sublicenses>
     *     <Signature/>                 last; never part of the signed bytes
     *   </License>
     */
    class LicenseSerializer
    {
    public:
        /**
         * Canonical tree derived from the license fields.
         * Embedded sub-licenses that were parsed keep their retained raw body
         * so their own signatures stay valid inside the parent.
         */
        static xml::Document to_canonical_form(const License &license, bool include_signature);

        /**
         * Tree for persistence: the retained raw body plus Signature for a
         * parsed license, the canonical form otherwise.
         */
        static xml::Document to_document(const License &license);

        /**
         * Parse a license tree. The Signature element is split off and the
         * remaining tree is kept verbatim as the license's raw body.
         * Sub-licenses are parsed recursively as complete licenses; any
         * malformed sub-license fails the whole parse.
         */
        static Result<License> from_document(xml::Document document);

        static Result<License> from_text(std::string_view text);

        static std::string to_text(const License &license, bool pretty = true);

        /**
         * Check that every customer, feature and attribute string is XML 1.0
         * text, so the persisted form parses back to the same license.
         * Fresh sub-licenses are checked recursively; parsed ones already are.
         * Fails with ErrorCode::InvalidInput naming the field.
         */
        static Result<void> check_encodable(const License &license);

        /** Bytes covered by a signature: compact UTF-8 text of the tree */
        static std::string signable_text(const xml::Document &body);
    };

} // namespace covenant
