#include "solrfetch/index_resolver.hpp"
#include "solrfetch/errors.hpp"
#include "solrfetch/response_decoder.hpp"

#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace solrfetch {

namespace {

constexpr const char* kIndexVersion = "indexversion";
constexpr const char* kGeneration = "generation";
constexpr const char* kFileListGroup = "filelist";

bool isSuccessCode(long code) { return code >= 200 && code < 300; }

HttpResponse fetch(HttpClient& client, const std::string& url) {
    spdlog::debug("GET {}", url);
    return client.get(url);
}

// An error page that is not XML is reported as a transport failure, a broken
// body behind a 2xx answer as a decode failure.
template <typename Decoder>
auto decode(const HttpResponse& response, const std::string& url, Decoder decoder) {
    try {
        return decoder(response.body);
    } catch (const DecodeError& error) {
        if (!isSuccessCode(response.status_code)) {
            throw TransportError(fmt::format("GET {} returned HTTP {}", url, response.status_code));
        }
        throw DecodeError(fmt::format("cannot decode response of {}: {}", url, error.what()));
    }
}

void requireSuccess(const ResponseHeader& header, std::string_view step) {
    const ServerStatus status = header.status();
    if (!status.isSuccess()) {
        throw ProtocolStatusError(
            fmt::format("server reported status {} while {}", status.code(), step), status.code());
    }
}

bool isSafeFileName(const std::string& name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find_first_of("/\\") == std::string::npos;
}

} // namespace

ResolvedIndex IndexResolver::resolve(const ReplicationUrls& urls) {
    ResolvedIndex index;
    index.identity = resolveIdentity(urls);
    index.files = resolveFiles(urls, index.identity);
    return index;
}

IndexIdentity IndexResolver::resolveIdentity(const ReplicationUrls& urls) {
    const std::string url = urls.versionUrl();
    const HttpResponse response = fetch(client_, url);
    const VersionResponse decoded = decode(response, url, decodeVersionResponse);
    requireSuccess(decoded.header, "discovering the index version");

    auto version = decoded.value(kIndexVersion);
    auto generation = decoded.value(kGeneration);
    if (!version || !generation) {
        throw DecodeError(fmt::format("response of {} lacks {}", url,
                                      version ? kGeneration : kIndexVersion));
    }

    return IndexIdentity{urls.baseUrl(), std::move(*version), std::move(*generation)};
}

std::vector<IndexFileDescriptor> IndexResolver::resolveFiles(const ReplicationUrls& urls,
                                                             const IndexIdentity& identity) {
    const std::string url = urls.fileListUrl(identity);
    const HttpResponse response = fetch(client_, url);
    const FileListResponse decoded = decode(response, url, decodeFileListResponse);
    requireSuccess(decoded.header, "listing the index files");

    const FileGroup* group = decoded.group(kFileListGroup);
    if (!group) {
        throw DecodeError(fmt::format("response of {} has no '{}' group", url, kFileListGroup));
    }

    for (const auto& file : group->files) {
        if (!isSafeFileName(file.name)) {
            throw DecodeError(fmt::format("unsafe file name '{}' in generation {}",
                                          file.name, identity.generation));
        }
    }
    return group->files;
}

} // namespace solrfetch
