#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace solrfetch::detail {

// Element of a parsed Solr response. Solr keys every value by a "name"
// attribute, which is the only attribute kept.
struct XmlElement {
    std::string tag;
    std::string name;
    std::string text;
    std::vector<XmlElement> children;

    [[nodiscard]] const XmlElement* firstChild(std::string_view child_tag) const;
    [[nodiscard]] const XmlElement* namedChild(std::string_view child_tag,
                                               std::string_view child_name) const;
    // Text content with surrounding whitespace removed.
    [[nodiscard]] std::string value() const;
};

// Throws DecodeError when body is not well-formed XML.
XmlElement parseXml(std::string_view body);

} // namespace solrfetch::detail
