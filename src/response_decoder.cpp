#include "solrfetch/response_decoder.hpp"
#include "solrfetch/detail/xml_tree.hpp"

#include <string>
#include <utility>

namespace solrfetch {

namespace {

using detail::XmlElement;

constexpr const char* kStatusField = "status";
constexpr const char* kSuccessStatus = "0";

ResponseHeader readHeader(const XmlElement& root) {
    ResponseHeader header;
    const XmlElement* lst = root.namedChild("lst", "responseHeader");
    if (!lst) {
        lst = root.firstChild("lst");
    }
    if (!lst) {
        return header;
    }
    for (const auto& field : lst->children) {
        if (field.tag == "int" || field.tag == "str" || field.tag == "long") {
            header.fields.push_back({field.name, field.value()});
        }
    }
    return header;
}

// <lst><str name="name">_8.fdt</str><long name="size">1024</long>...</lst>
IndexFileDescriptor readFileEntry(const XmlElement& entry) {
    IndexFileDescriptor file;

    const XmlElement* name = entry.namedChild("str", "name");
    if (!name) {
        name = entry.firstChild("str");
    }
    if (name) {
        file.name = name->value();
    }

    const XmlElement* size = entry.namedChild("long", "size");
    if (!size) {
        size = entry.firstChild("long");
    }
    if (size) {
        file.size = size->value();
    }
    return file;
}

} // namespace

std::optional<std::string> ResponseHeader::value(std::string_view name) const {
    for (const auto& field : fields) {
        if (field.name == name) {
            return field.value;
        }
    }
    return std::nullopt;
}

ServerStatus ResponseHeader::status() const {
    const auto status = value(kStatusField);
    if (!status || *status == kSuccessStatus) {
        return ServerStatus::success();
    }
    return ServerStatus::failure(*status);
}

std::optional<std::string> VersionResponse::value(std::string_view name) const {
    for (const auto& field : longs) {
        if (field.name == name) {
            return field.value;
        }
    }
    return std::nullopt;
}

const FileGroup* FileListResponse::group(std::string_view name) const {
    for (const auto& candidate : groups) {
        if (candidate.name == name) {
            return &candidate;
        }
    }
    return nullptr;
}

VersionResponse decodeVersionResponse(std::string_view body) {
    const XmlElement root = detail::parseXml(body);

    VersionResponse response;
    response.header = readHeader(root);
    for (const auto& child : root.children) {
        if (child.tag == "long") {
            response.longs.push_back({child.name, child.value()});
        }
    }
    return response;
}

FileListResponse decodeFileListResponse(std::string_view body) {
    const XmlElement root = detail::parseXml(body);

    FileListResponse response;
    response.header = readHeader(root);
    for (const auto& child : root.children) {
        if (child.tag != "arr") {
            continue;
        }
        FileGroup group;
        group.name = child.name;
        for (const auto& entry : child.children) {
            if (entry.tag == "lst") {
                group.files.push_back(readFileEntry(entry));
            }
        }
        response.groups.push_back(std::move(group));
    }
    return response;
}

} // namespace solrfetch
