#pragma once

#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <libxml/tree.h>

namespace covenant::xml
{

    /** Largest document text parse() accepts */
    inline constexpr size_t kMaxDocumentSize = 8 * 1024 * 1024;

    /**
     * True when text is well-formed UTF-8 made only of XML 1.0 characters,
     * so it survives serialization and a later parse unchanged.
     */
    bool is_xml_text(std::string_view text);

    /**
     * Non-owning handle to an element inside a Document.
     * Valid only while the owning Document is alive and the element has not
     * been removed.
     */
    class Element
    {
    public:
        explicit Element(xmlNodePtr node) : node_(node) {}

        std::string name() const;

        /** First child element with the given name */
        std::optional<Element> child(std::string_view name) const;

        /** All child elements with the given name, in document order */
        std::vector<Element> children(std::string_view name) const;

        /** Number of child elements of any name */
        size_t element_count() const;

        std::optional<std::string> attribute(std::string_view name) const;

        /** Concatenated text content of the element and its descendants */
        std::string text() const;

        void set_attribute(std::string_view name, std::string_view value);

        /** Append an empty child element */
        Element append_child(std::string_view name);

        /** Append a child element holding escaped text */
        Element append_text_child(std::string_view name, std::string_view value);

        /** Append a deep copy of an element, possibly from another document */
        Element append_copy(const Element &other);

        /**
         * Unlink and free the first child element with the given name.
         * Returns false when no such child exists. Other nodes are untouched.
         */
        bool remove_child(std::string_view name);

        xmlNodePtr node() const { return node_; }

    private:
        xmlNodePtr node_;
    };

    /**
     * Owning XML document.
     * Copies are deep. Text is UTF-8 without an XML declaration.
     */
    class Document
    {
    public:
        /** New document with an empty root element */
        explicit Document(std::string_view root_name);

        Document(const Document &other);
        Document &operator=(const Document &other);
        Document(Document &&) noexcept = default;
        Document &operator=(Document &&) noexcept = default;

        /**
         * Parse document text. Indentation-only text between elements is
         * dropped, so pretty-printed and compact text give the same tree.
         * Network access and entity expansion are disabled. Text longer
         * than kMaxDocumentSize is rejected.
         */
        static Result<Document> parse(std::string_view text);

        /** New document whose root is a deep copy of element */
        static Document from_element(const Element &element);

        Element root() const;

        /**
         * Serialize the root element.
         * Compact output has no whitespace between elements and writes empty
         * elements as start/end pairs; it is the form that gets signed.
         */
        std::string to_text(bool pretty = false) const;

    private:
        struct DocDeleter
        {
            void operator()(xmlDocPtr doc) const { xmlFreeDoc(doc); }
        };

        explicit Document(xmlDocPtr doc) : doc_(doc) {}

        std::unique_ptr<xmlDoc, DocDeleter> doc_;
    };

} // namespace covenant::xml
