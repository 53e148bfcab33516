#pragma once

#include "index_types.hpp"

#include <memory>
#include <string>

namespace solrfetch {

// Builds the three replication command URLs from a server root such as
// http://localhost:8983/solr. All of them point at <root path>/replication.
class ReplicationUrls {
public:
    // Throws UrlParseError when base_url is not an absolute http(s) URL.
    explicit ReplicationUrls(std::string base_url);
    ~ReplicationUrls();

    ReplicationUrls(ReplicationUrls&&) noexcept;
    ReplicationUrls& operator=(ReplicationUrls&&) noexcept;

    [[nodiscard]] const std::string& baseUrl() const;

    [[nodiscard]] std::string versionUrl() const;
    [[nodiscard]] std::string fileListUrl(const IndexIdentity& identity) const;
    [[nodiscard]] std::string fileContentUrl(const IndexIdentity& identity,
                                             const std::string& file_name) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace solrfetch
