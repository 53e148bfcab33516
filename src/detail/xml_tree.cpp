#include "solrfetch/detail/xml_tree.hpp"
#include "solrfetch/errors.hpp"

#include <cstring>
#include <exception>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <expat.h>
#include <fmt/format.h>

namespace solrfetch::detail {

namespace {

// Solr responses nest a handful of levels; anything deeper is not a response.
constexpr std::size_t kMaxDepth = 32;

// Exceptions must not unwind through expat: a failing handler parks the error,
// stops the parser and every later callback is ignored.
struct TreeBuilder {
    XML_Parser parser{nullptr};
    std::exception_ptr error;
    std::vector<XmlElement> open;
    std::vector<XmlElement> roots;

    template <typename Fn>
    static void guarded(void* user_data, Fn&& fn) {
        auto* self = static_cast<TreeBuilder*>(user_data);
        if (self->error) {
            return;
        }
        try {
            fn(*self);
        } catch (...) {
            self->error = std::current_exception();
            XML_StopParser(self->parser, XML_FALSE);
        }
    }

    static void XMLCALL onStartElement(void* user_data, const char* tag, const char** atts) {
        guarded(user_data, [tag, atts](TreeBuilder& self) {
            if (self.open.size() >= kMaxDepth) {
                throw DecodeError(fmt::format("XML nesting deeper than {} levels", kMaxDepth));
            }

            XmlElement element;
            element.tag = tag;
            for (const char** p = atts; *p != nullptr; p += 2) {
                if (std::strcmp(p[0], "name") == 0) {
                    element.name = p[1];
                }
            }
            self.open.push_back(std::move(element));
        });
    }

    static void XMLCALL onEndElement(void* user_data, const char* /*tag*/) {
        guarded(user_data, [](TreeBuilder& self) {
            XmlElement element = std::move(self.open.back());
            self.open.pop_back();
            if (self.open.empty()) {
                self.roots.push_back(std::move(element));
            } else {
                self.open.back().children.push_back(std::move(element));
            }
        });
    }

    static void XMLCALL onCharacterData(void* user_data, const char* s, int len) {
        guarded(user_data, [s, len](TreeBuilder& self) {
            if (!self.open.empty()) {
                self.open.back().text.append(s, static_cast<std::size_t>(len));
            }
        });
    }
};

struct ParserDeleter {
    void operator()(XML_Parser parser) const noexcept { XML_ParserFree(parser); }
};

} // namespace

const XmlElement* XmlElement::firstChild(std::string_view child_tag) const {
    for (const auto& child : children) {
        if (child.tag == child_tag) {
            return &child;
        }
    }
    return nullptr;
}

const XmlElement* XmlElement::namedChild(std::string_view child_tag,
                                         std::string_view child_name) const {
    for (const auto& child : children) {
        if (child.tag == child_tag && child.name == child_name) {
            return &child;
        }
    }
    return nullptr;
}

std::string XmlElement::value() const {
    constexpr const char* whitespace = " \t\r\n";
    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

XmlElement parseXml(std::string_view body) {
    if (body.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw DecodeError("XML response too large");
    }

    std::unique_ptr<XML_ParserStruct, ParserDeleter> parser{XML_ParserCreate(nullptr)};
    if (!parser) {
        throw DecodeError("failed to create expat parser");
    }

    TreeBuilder builder;
    builder.parser = parser.get();
    XML_SetUserData(parser.get(), &builder);
    XML_SetElementHandler(parser.get(), &TreeBuilder::onStartElement, &TreeBuilder::onEndElement);
    XML_SetCharacterDataHandler(parser.get(), &TreeBuilder::onCharacterData);

    const XML_Status status =
        XML_Parse(parser.get(), body.data(), static_cast<int>(body.size()), XML_TRUE);
    if (builder.error) {
        std::rethrow_exception(builder.error);
    }
    if (status == XML_STATUS_ERROR) {
        throw DecodeError(fmt::format("XML parse error at line {}: {}",
                                      XML_GetCurrentLineNumber(parser.get()),
                                      XML_ErrorString(XML_GetErrorCode(parser.get()))));
    }

    if (builder.roots.empty()) {
        throw DecodeError("XML parse error: no content");
    }
    return std::move(builder.roots.front());
}

} // namespace solrfetch::detail
