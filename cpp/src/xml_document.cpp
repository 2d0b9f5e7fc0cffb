#include "covenant/xml_document.hpp"
#include <libxml/parser.h>
#include <libxml/xmlerror.h>
#include <libxml/xmlsave.h>
#include <libxml/xmlstring.h>
#include <format>
#include <new>

namespace covenant::xml
{

    namespace
    {
        // xmlInitParser must run before the parser is used from several threads
        static struct ParserInitializer
        {
            ParserInitializer() { xmlInitParser(); }
        } parser_initializer;

        struct BufferDeleter
        {
            void operator()(xmlBufferPtr p) const { xmlBufferFree(p); }
        };

        const xmlChar *as_xml(const std::string &s)
        {
            return reinterpret_cast<const xmlChar *>(s.c_str());
        }

        bool is_element_named(xmlNodePtr node, std::string_view name)
        {
            return node->type == XML_ELEMENT_NODE &&
                   std::string_view(reinterpret_cast<const char *>(node->name)) == name;
        }

        std::string take_string(xmlChar *s)
        {
            if (!s)
                return {};
            std::string out(reinterpret_cast<const char *>(s));
            xmlFree(s);
            return out;
        }

        std::string last_error_message()
        {
            const xmlError *err = xmlGetLastError();
            if (!err || !err->message)
                return "unknown parser error";
            std::string message(err->message);
            while (!message.empty() && (message.back() == '\n' || message.back() == ' '))
                message.pop_back();
            return std::format("{} (line {})", message, err->line);
        }
    } // namespace

    bool is_xml_text(std::string_view text)
    {
        // xmlCheckUTF8 stops at the first NUL, which is not an XML character anyway
        if (text.find('\0') != std::string_view::npos)
            return false;
        std::string owned(text);
        const auto *bytes = reinterpret_cast<const unsigned char *>(owned.c_str());
        if (!xmlCheckUTF8(bytes))
            return false;

        size_t pos = 0;
        while (pos < owned.size())
        {
            int len = static_cast<int>(owned.size() - pos);
            int c = xmlGetUTF8Char(bytes + pos, &len);
            if (c < 0 || len <= 0)
                return false;
            // Char ::= #x9 | #xA | #xD | [#x20-#xD7FF] | [#xE000-#xFFFD] | [#x10000-#x10FFFF]
            const bool allowed = c == 0x9 || c == 0xA || c == 0xD ||
                                 (c >= 0x20 && c <= 0xD7FF) ||
                                 (c >= 0xE000 && c <= 0xFFFD) ||
                                 (c >= 0x10000 && c <= 0x10FFFF);
            if (!allowed)
                return false;
            pos += static_cast<size_t>(len);
        }
        return true;
    }

    // ========== Element Implementation ==========

    std::string Element::name() const
    {
        return std::string(reinterpret_cast<const char *>(node_->name));
    }

    std::optional<Element> Element::child(std::string_view name) const
    {
        for (xmlNodePtr n = node_->children; n; n = n->next)
        {
            if (is_element_named(n, name))
                return Element(n);
        }
        return std::nullopt;
    }

    std::vector<Element> Element::children(std::string_view name) const
    {
        std::vector<Element> out;
        for (xmlNodePtr n = node_->children; n; n = n->next)
        {
            if (is_element_named(n, name))
                out.emplace_back(n);
        }
        return out;
    }

    size_t Element::element_count() const
    {
        return static_cast<size_t>(xmlChildElementCount(node_));
    }

    std::optional<std::string> Element::attribute(std::string_view name) const
    {
        std::string key(name);
        xmlChar *value = xmlGetNoNsProp(node_, as_xml(key));
        if (!value)
            return std::nullopt;
        return take_string(value);
    }

    std::string Element::text() const
    {
        return take_string(xmlNodeGetContent(node_));
    }

    void Element::set_attribute(std::string_view name, std::string_view value)
    {
        std::string key(name);
        std::string val(value);
        if (!xmlSetProp(node_, as_xml(key), as_xml(val)))
            throw std::bad_alloc();
    }

    Element Element::append_child(std::string_view name)
    {
        std::string tag(name);
        xmlNodePtr child = xmlNewChild(node_, nullptr, as_xml(tag), nullptr);
        if (!child)
            throw std::bad_alloc();
        return Element(child);
    }

    Element Element::append_text_child(std::string_view name, std::string_view value)
    {
        std::string tag(name);
        std::string content(value);
        // xmlNewTextChild escapes content; xmlNewChild would interpret entity references
        xmlNodePtr child = xmlNewTextChild(node_, nullptr, as_xml(tag), as_xml(content));
        if (!child)
            throw std::bad_alloc();
        return Element(child);
    }

    Element Element::append_copy(const Element &other)
    {
        xmlNodePtr copy = xmlDocCopyNode(other.node_, node_->doc, 1);
        if (!copy)
            throw std::bad_alloc();
        if (!xmlAddChild(node_, copy))
        {
            xmlFreeNode(copy);
            throw std::bad_alloc();
        }
        return Element(copy);
    }

    bool Element::remove_child(std::string_view name)
    {
        auto found = child(name);
        if (!found)
            return false;
        xmlUnlinkNode(found->node_);
        xmlFreeNode(found->node_);
        return true;
    }

    // ========== Document Implementation ==========

    Document::Document(std::string_view root_name)
    {
        doc_.reset(xmlNewDoc(reinterpret_cast<const xmlChar *>("1.0")));
        if (!doc_)
            throw std::bad_alloc();
        std::string tag(root_name);
        xmlNodePtr root = xmlNewDocNode(doc_.get(), nullptr, as_xml(tag), nullptr);
        if (!root)
            throw std::bad_alloc();
        xmlDocSetRootElement(doc_.get(), root);
    }

    Document::Document(const Document &other)
        : doc_(xmlCopyDoc(other.doc_.get(), 1))
    {
        if (!doc_)
            throw std::bad_alloc();
    }

    Document &Document::operator=(const Document &other)
    {
        if (this != &other)
        {
            Document copy(other);
            doc_ = std::move(copy.doc_);
        }
        return *this;
    }

    Result<Document> Document::parse(std::string_view text)
    {
        if (text.size() > kMaxDocumentSize)
        {
            return std::unexpected(CovenantError::malformed(
                "document", std::format("document is {} bytes; limit is {}", text.size(), kMaxDocumentSize)));
        }

        const int options = XML_PARSE_NOBLANKS | XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;
        xmlResetLastError();
        xmlDocPtr raw = xmlReadMemory(text.data(), static_cast<int>(text.size()), nullptr, "UTF-8", options);
        if (!raw)
        {
            return std::unexpected(CovenantError::malformed("document", last_error_message()));
        }
        Document doc(raw);
        if (raw->intSubset != nullptr)
        {
            return std::unexpected(CovenantError::malformed("document", "document type declarations are not allowed"));
        }
        if (!xmlDocGetRootElement(raw))
        {
            return std::unexpected(CovenantError::malformed("document", "no root element"));
        }
        return doc;
    }

    Document Document::from_element(const Element &element)
    {
        xmlDocPtr raw = xmlNewDoc(reinterpret_cast<const xmlChar *>("1.0"));
        if (!raw)
            throw std::bad_alloc();
        Document doc(raw);
        xmlNodePtr copy = xmlDocCopyNode(element.node(), raw, 1);
        if (!copy)
            throw std::bad_alloc();
        xmlDocSetRootElement(raw, copy);
        return doc;
    }

    Element Document::root() const
    {
        return Element(xmlDocGetRootElement(doc_.get()));
    }

    std::string Document::to_text(bool pretty) const
    {
        std::unique_ptr<xmlBuffer, BufferDeleter> buffer(xmlBufferCreate());
        if (!buffer)
            throw std::bad_alloc();

        int options = XML_SAVE_NO_DECL | XML_SAVE_NO_EMPTY;
        if (pretty)
            options |= XML_SAVE_FORMAT;

        xmlSaveCtxtPtr ctxt = xmlSaveToBuffer(buffer.get(), "UTF-8", options);
        if (!ctxt)
            throw std::bad_alloc();
        xmlSaveTree(ctxt, xmlDocGetRootElement(doc_.get()));
        xmlSaveClose(ctxt);

        return std::string(reinterpret_cast<const char *>(xmlBufferContent(buffer.get())),
                           static_cast<size_t>(xmlBufferLength(buffer.get())));
    }

} // namespace covenant::xml
