#include "solrfetch/replication_urls.hpp"
#include "solrfetch/errors.hpp"

#include <algorithm>
#include <array>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <fmt/format.h>

namespace solrfetch {

namespace {

constexpr const char* kReplicationHandler = "replication";

// Keys set by the encoder itself; a base URL must not be able to override them.
const std::array<std::string_view, 5> kProtocolKeys = {
    "command", "file", "generation", "indexversion", "wt",
};

using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

struct CurlStringDeleter {
    void operator()(char* ptr) const noexcept { curl_free(ptr); }
};

std::string getPart(CURLU* handle, CURLUPart part) {
    char* raw = nullptr;
    const CURLUcode uc = curl_url_get(handle, part, &raw, 0);
    std::unique_ptr<char, CurlStringDeleter> value{raw};
    if (uc == CURLUE_NO_QUERY || uc == CURLUE_NO_SCHEME) {
        return {};
    }
    if (uc != CURLUE_OK) {
        throw UrlParseError(fmt::format("cannot read url part: {}", curl_url_strerror(uc)));
    }
    return value ? std::string{value.get()} : std::string{};
}

// Drops the pairs of an encoded query whose key the encoder sets itself.
std::string withoutProtocolKeys(const std::string& query) {
    std::string kept;
    std::size_t begin = 0;
    while (begin <= query.size()) {
        std::size_t end = query.find('&', begin);
        if (end == std::string::npos) {
            end = query.size();
        }
        const std::string_view pair{query.data() + begin, end - begin};
        const std::string_view key = pair.substr(0, pair.find('='));
        const bool reserved = std::find(kProtocolKeys.begin(), kProtocolKeys.end(), key) !=
                              kProtocolKeys.end();
        if (!pair.empty() && !reserved) {
            if (!kept.empty()) {
                kept.push_back('&');
            }
            kept.append(pair);
        }
        begin = end + 1;
    }
    return kept;
}

} // namespace

class ReplicationUrls::Impl {
public:
    explicit Impl(std::string base_url)
        : base_url_(std::move(base_url)),
          handle_(curl_url(), &curl_url_cleanup) {
        if (!handle_) {
            throw UrlParseError("Could not initiate URL parser");
        }
        if (base_url_.empty()) {
            throw UrlParseError("server url is empty");
        }

        const CURLUcode uc = curl_url_set(handle_.get(), CURLUPART_URL, base_url_.c_str(), 0);
        if (uc != CURLUE_OK) {
            throw UrlParseError(fmt::format("invalid server url '{}': {}",
                                            base_url_, curl_url_strerror(uc)));
        }

        const auto scheme = getPart(handle_.get(), CURLUPART_SCHEME);
        if (scheme != "http" && scheme != "https") {
            throw UrlParseError(fmt::format("unsupported scheme '{}' in server url '{}'",
                                            scheme, base_url_));
        }

        // path.Join semantics: drop trailing slashes before appending the handler.
        std::string path = getPart(handle_.get(), CURLUPART_PATH);
        while (!path.empty() && path.back() == '/') {
            path.pop_back();
        }
        handler_path_ = path + "/" + kReplicationHandler;
        base_query_ = withoutProtocolKeys(getPart(handle_.get(), CURLUPART_QUERY));
    }

    const std::string& baseUrl() const { return base_url_; }

    // Query keys must be given in sorted order.
    std::string build(const std::vector<std::pair<std::string, std::string>>& query) const {
        UrlHandle url{curl_url_dup(handle_.get()), &curl_url_cleanup};
        if (!url) {
            throw UrlParseError("Could not duplicate URL handle");
        }

        CURLUcode uc = curl_url_set(url.get(), CURLUPART_PATH, handler_path_.c_str(), 0);
        if (uc != CURLUE_OK) {
            throw UrlParseError(fmt::format("cannot set path '{}': {}",
                                            handler_path_, curl_url_strerror(uc)));
        }

        uc = curl_url_set(url.get(), CURLUPART_QUERY,
                          base_query_.empty() ? nullptr : base_query_.c_str(), 0);
        if (uc != CURLUE_OK) {
            throw UrlParseError(fmt::format("cannot set query '{}': {}",
                                            base_query_, curl_url_strerror(uc)));
        }

        for (const auto& [key, value] : query) {
            const std::string pair = key + "=" + value;
            uc = curl_url_set(url.get(), CURLUPART_QUERY, pair.c_str(),
                              CURLU_APPENDQUERY | CURLU_URLENCODE);
            if (uc != CURLUE_OK) {
                throw UrlParseError(fmt::format("cannot append query '{}': {}",
                                                pair, curl_url_strerror(uc)));
            }
        }

        return getPart(url.get(), CURLUPART_URL);
    }

private:
    std::string base_url_;
    UrlHandle handle_;
    std::string handler_path_;
    std::string base_query_;
};

ReplicationUrls::ReplicationUrls(std::string base_url)
    : impl_(std::make_unique<Impl>(std::move(base_url))) {}

ReplicationUrls::~ReplicationUrls() = default;

ReplicationUrls::ReplicationUrls(ReplicationUrls&&) noexcept = default;

ReplicationUrls& ReplicationUrls::operator=(ReplicationUrls&&) noexcept = default;

const std::string& ReplicationUrls::baseUrl() const { return impl_->baseUrl(); }

// http://host:8983/solr/replication?command=indexversion
std::string ReplicationUrls::versionUrl() const {
    return impl_->build({{"command", "indexversion"}});
}

// http://host:8983/solr/replication?command=filelist&generation=13&indexversion=1401508582278
std::string ReplicationUrls::fileListUrl(const IndexIdentity& identity) const {
    return impl_->build({
        {"command", "filelist"},
        {"generation", identity.generation},
        {"indexversion", identity.version},
    });
}

// http://host:8983/solr/replication?command=filecontent&file=segments_d&generation=13&indexversion=1401508582278&wt=filestream
std::string ReplicationUrls::fileContentUrl(const IndexIdentity& identity,
                                            const std::string& file_name) const {
    return impl_->build({
        {"command", "filecontent"},
        {"file", file_name},
        {"generation", identity.generation},
        {"indexversion", identity.version},
        {"wt", "filestream"},
    });
}

} // namespace solrfetch
