//
// Created by gregorian-rayne on 1/10/26.
//

#include "cova/xml/xml_document.hpp"
#include "cova/utils/string_utils.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <mutex>

namespace cova::xml {

    namespace {

        std::once_flag init_flag;

        std::string_view as_view(const xmlChar* text) {
            return text == nullptr ? std::string_view{} : std::string_view(reinterpret_cast<const char*>(text));
        }

        bool is_element(const xmlNode* node, const std::string_view name) {
            return node->type == XML_ELEMENT_NODE && (name.empty() || as_view(node->name) == name);
        }

        void collect_descendants(xmlNode* node, const std::string_view name, std::vector<XmlNode>& out) {
            for (xmlNode* child = node->children; child != nullptr; child = child->next) {
                if (child->type != XML_ELEMENT_NODE) {
                    continue;
                }
                if (is_element(child, name)) {
                    out.emplace_back(child);
                }
                collect_descendants(child, name, out);
            }
        }

    }  // namespace

    std::string XmlNode::name() const {
        return std::string(as_view(node_->name));
    }

    std::optional<std::string> XmlNode::attribute(const std::string_view name) const {
        const std::string key(name);
        xmlChar* value = xmlGetProp(node_, reinterpret_cast<const xmlChar*>(key.c_str()));
        if (value == nullptr) {
            return std::nullopt;
        }
        std::string result(as_view(value));
        xmlFree(value);
        return result;
    }

    std::string XmlNode::text() const {
        xmlChar* content = xmlNodeGetContent(node_);
        if (content == nullptr) {
            return {};
        }
        std::string result(as_view(content));
        xmlFree(content);
        return result;
    }

    std::vector<XmlNode> XmlNode::children(const std::string_view name) const {
        std::vector<XmlNode> result;
        for (xmlNode* child = node_->children; child != nullptr; child = child->next) {
            if (is_element(child, name)) {
                result.emplace_back(child);
            }
        }
        return result;
    }

    std::optional<XmlNode> XmlNode::first_child(const std::string_view name) const {
        for (xmlNode* child = node_->children; child != nullptr; child = child->next) {
            if (is_element(child, name)) {
                return XmlNode(child);
            }
        }
        return std::nullopt;
    }

    std::vector<XmlNode> XmlNode::descendants(const std::string_view name) const {
        std::vector<XmlNode> result;
        collect_descendants(node_, name, result);
        return result;
    }

    long XmlNode::line() const noexcept {
        return xmlGetLineNo(node_);
    }

    void XmlDocument::Deleter::operator()(_xmlDoc* doc) const noexcept {
        xmlFreeDoc(doc);
    }

    Result<XmlDocument, Error> XmlDocument::parse(const std::string_view content, const std::string& context) {
        std::call_once(init_flag, [] { xmlInitParser(); });

        xmlDoc* doc = xmlReadMemory(
            content.data(),
            static_cast<int>(content.size()),
            context.c_str(),
            nullptr,
            XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING
        );

        if (doc == nullptr) {
            std::string message = "Malformed XML";
            if (const xmlError* err = xmlGetLastError(); err != nullptr && err->message != nullptr) {
                message += ": ";
                message += string_utils::trim(err->message);
                message += " at line " + std::to_string(err->line);
            }
            return Result<XmlDocument, Error>::failure(Error::parse_error(message, context));
        }

        if (xmlDocGetRootElement(doc) == nullptr) {
            xmlFreeDoc(doc);
            return Result<XmlDocument, Error>::failure(Error::parse_error("Document has no root element", context));
        }

        return Result<XmlDocument, Error>::success(XmlDocument(doc));
    }

    XmlNode XmlDocument::root() const noexcept {
        return XmlNode(xmlDocGetRootElement(doc_.get()));
    }

}  // namespace cova::xml
