//
// Created by gregorian-rayne on 1/10/26.
//

#ifndef COVA_XML_DOCUMENT_HPP
#define COVA_XML_DOCUMENT_HPP

/**
 * @file xml_document.hpp
 * @brief Read-only view over a libxml2 document.
 *
 * XmlDocument owns the parsed tree; XmlNode is a cheap non-owning handle
 * that stays valid while its document lives. Element names are compared
 * by local name, so namespaced MSBuild files and plain Cobertura reports
 * are walked the same way.
 */

#include "cova/result.hpp"
#include "cova/error.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct _xmlDoc;
struct _xmlNode;

namespace cova::xml {

    class XmlNode {
    public:
        explicit XmlNode(_xmlNode* node) noexcept : node_(node) {}

        [[nodiscard]] std::string name() const;

        [[nodiscard]] std::optional<std::string> attribute(std::string_view name) const;

        /**
         * Concatenated text content of this element and its descendants.
         */
        [[nodiscard]] std::string text() const;

        /// Direct element children, optionally filtered by local name.
        [[nodiscard]] std::vector<XmlNode> children(std::string_view name = {}) const;

        [[nodiscard]] std::optional<XmlNode> first_child(std::string_view name) const;

        /// All element descendants with the given local name, document order.
        [[nodiscard]] std::vector<XmlNode> descendants(std::string_view name) const;

        /// Source line of the element, for diagnostics.
        [[nodiscard]] long line() const noexcept;

    private:
        _xmlNode* node_;
    };

    class XmlDocument {
    public:
        /**
         * Parses a document from memory. Network access and entity
         * expansion are disabled.
         *
         * @param content Document text.
         * @param context Name used in error messages, usually the file path.
         */
        static Result<XmlDocument, Error> parse(std::string_view content, const std::string& context);

        [[nodiscard]] XmlNode root() const noexcept;

    private:
        struct Deleter {
            void operator()(_xmlDoc* doc) const noexcept;
        };

        explicit XmlDocument(_xmlDoc* doc) noexcept : doc_(doc) {}

        std::unique_ptr<_xmlDoc, Deleter> doc_;
    };

}  // namespace cova::xml

#endif //COVA_XML_DOCUMENT_HPP
