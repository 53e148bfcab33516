#pragma once

#include "http_client.hpp"
#include "index_types.hpp"
#include "replication_urls.hpp"

#include <vector>

namespace solrfetch {

struct ResolvedIndex {
    IndexIdentity identity;
    std::vector<IndexFileDescriptor> files;
};

// Discovers the index generation the server currently serves and the files
// belonging to it. Any failure throws a FetchError; there is no partial result.
class IndexResolver {
public:
    explicit IndexResolver(HttpClient& client) : client_(client) {}

    ResolvedIndex resolve(const ReplicationUrls& urls);

    IndexIdentity resolveIdentity(const ReplicationUrls& urls);
    std::vector<IndexFileDescriptor> resolveFiles(const ReplicationUrls& urls,
                                                  const IndexIdentity& identity);

private:
    HttpClient& client_;
};

} // namespace solrfetch
