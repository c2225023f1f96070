#include "net/xml_utils.h"

#include "net/http_client.h"

namespace zonelink {
namespace net {

std::string_view localName(const char* qualifiedName) {
    if (qualifiedName == nullptr) {
        return {};
    }
    std::string_view name(qualifiedName);
    size_t colon = name.find(':');
    return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

const tinyxml2::XMLElement* firstChildByLocalName(const tinyxml2::XMLNode* parent,
                                                  std::string_view name) {
    if (parent == nullptr) {
        return nullptr;
    }
    for (const auto* child = parent->FirstChildElement(); child != nullptr;
         child = child->NextSiblingElement()) {
        if (localName(child->Name()) == name) {
            return child;
        }
    }
    return nullptr;
}

const tinyxml2::XMLElement* nextSiblingByLocalName(const tinyxml2::XMLElement* element,
                                                   std::string_view name) {
    if (element == nullptr) {
        return nullptr;
    }
    for (const auto* sibling = element->NextSiblingElement(); sibling != nullptr;
         sibling = sibling->NextSiblingElement()) {
        if (localName(sibling->Name()) == name) {
            return sibling;
        }
    }
    return nullptr;
}

std::string childText(const tinyxml2::XMLNode* parent, std::string_view name) {
    const auto* child = firstChildByLocalName(parent, name);
    if (child == nullptr || child->GetText() == nullptr) {
        return {};
    }
    return trimWhitespace(child->GetText());
}

std::string attributeOr(const tinyxml2::XMLElement* element, const char* name,
                        const std::string& fallback) {
    if (element == nullptr) {
        return fallback;
    }
    const char* value = element->Attribute(name);
    return value != nullptr ? std::string(value) : fallback;
}

std::string xmlEscape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        case '\'':
            out += "&apos;";
            break;
        default:
            out.push_back(c);
        }
    }
    return out;
}

}  // namespace net
}  // namespace zonelink
