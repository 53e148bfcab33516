#pragma once

#include <cstdint>
#include <string>

namespace solrfetch {

// One snapshot of the server's index. Version and generation are only ever
// passed around together.
struct IndexIdentity {
    std::string base_url;
    std::string version;
    std::string generation;
};

struct IndexFileDescriptor {
    std::string name;
    std::string size;
};

struct DownloadJob {
    std::string file_name;
    std::string source_url;
};

struct DownloadOutcome {
    std::string source_url;
    long status_code{0};
    std::string file_name;
    std::uint64_t bytes_written{0};
};

} // namespace solrfetch
