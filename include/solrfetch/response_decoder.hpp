#pragma once

#include "index_types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace solrfetch {

class ServerStatus {
public:
    static ServerStatus success() { return ServerStatus{true, "0"}; }
    static ServerStatus failure(std::string code) { return ServerStatus{false, std::move(code)}; }

    [[nodiscard]] bool isSuccess() const noexcept { return success_; }
    // Raw value of the "status" header field, "0" on success.
    [[nodiscard]] const std::string& code() const noexcept { return code_; }

private:
    ServerStatus(bool success, std::string code) : success_(success), code_(std::move(code)) {}

    bool success_;
    std::string code_;
};

struct HeaderField {
    std::string name;
    std::string value;
};

struct ResponseHeader {
    std::vector<HeaderField> fields;

    [[nodiscard]] std::optional<std::string> value(std::string_view name) const;
    // A header without a "status" field counts as success.
    [[nodiscard]] ServerStatus status() const;
};

struct VersionResponse {
    ResponseHeader header;
    std::vector<HeaderField> longs;

    [[nodiscard]] std::optional<std::string> value(std::string_view name) const;
};

struct FileGroup {
    std::string name;
    std::vector<IndexFileDescriptor> files;
};

struct FileListResponse {
    ResponseHeader header;
    std::vector<FileGroup> groups;

    [[nodiscard]] const FileGroup* group(std::string_view name) const;
};

// Both decoders throw DecodeError on a body that is not well-formed XML. They
// do not look at the header status.
VersionResponse decodeVersionResponse(std::string_view body);
FileListResponse decodeFileListResponse(std::string_view body);

} // namespace solrfetch
