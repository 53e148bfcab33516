#pragma once

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>

namespace solrfetch {

constexpr const char* kDefaultServerUrl = "http://172.20.20.20:8983/solr";
constexpr const char* kDefaultOutputDir = "/var/lib/solr/data";
constexpr std::size_t kMaxWorkerCount = 64;

struct FetchConfig {
    std::string server_url{kDefaultServerUrl};
    std::filesystem::path output_dir{kDefaultOutputDir};
    // Accepted for compatibility with existing deployments; nothing is written there.
    std::filesystem::path success_marker;
    std::size_t worker_count{1};
    std::size_t buffer_size{64 * 1024};
    bool verbose{false};
};

// Defaults for a process started as program_path.
FetchConfig defaultConfig(const char* program_path);

struct CommandLine {
    FetchConfig config;
    bool show_help{false};
};

// Throws std::invalid_argument on unknown options, missing values or an
// out-of-range worker count.
CommandLine parseCommandLine(int argc, const char* const* argv);

void printUsage(std::ostream& out, const char* program_name);

} // namespace solrfetch
