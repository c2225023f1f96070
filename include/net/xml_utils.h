#ifndef ZONELINK_NET_XML_UTILS_H
#define ZONELINK_NET_XML_UTILS_H

#include <string>
#include <string_view>
#include <tinyxml2.h>

namespace zonelink {
namespace net {

// Element name without its namespace prefix ("s:Body" -> "Body").
std::string_view localName(const char* qualifiedName);

// First child element whose local name matches, ignoring namespace prefixes.
const tinyxml2::XMLElement* firstChildByLocalName(const tinyxml2::XMLNode* parent,
                                                  std::string_view name);

// Next sibling element with the same local name.
const tinyxml2::XMLElement* nextSiblingByLocalName(const tinyxml2::XMLElement* element,
                                                   std::string_view name);

// Trimmed text of the named child, or empty when absent.
std::string childText(const tinyxml2::XMLNode* parent, std::string_view name);

std::string attributeOr(const tinyxml2::XMLElement* element, const char* name,
                        const std::string& fallback = std::string());

// Escape &, <, >, " and ' for use in element content or attribute values.
std::string xmlEscape(std::string_view text);

}  // namespace net
}  // namespace zonelink

#endif  // ZONELINK_NET_XML_UTILS_H
