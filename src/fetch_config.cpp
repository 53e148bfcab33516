#include "solrfetch/fetch_config.hpp"
#include "solrfetch/transfer_scheduler.hpp"

#include <ostream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace solrfetch {

namespace {

std::size_t parseWorkerCount(const std::string& text) {
    int workers = 0;
    std::size_t consumed = 0;
    try {
        workers = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid worker count: " + text);
    }
    if (consumed != text.size() || workers <= 0 ||
        static_cast<std::size_t>(workers) > kMaxWorkerCount) {
        throw std::invalid_argument("Worker count must be between 1 and " +
                                    std::to_string(kMaxWorkerCount) + ": " + text);
    }
    return static_cast<std::size_t>(workers);
}

} // namespace

FetchConfig defaultConfig(const char* program_path) {
    FetchConfig config;
    config.worker_count = defaultWorkerCount();
    config.buffer_size = kDefaultTransferBufferSize;

    std::filesystem::path program_dir = std::filesystem::path{program_path ? program_path : ""}.parent_path();
    std::error_code ec;
    auto absolute_dir = std::filesystem::absolute(program_dir, ec);
    config.success_marker = ec ? program_dir : absolute_dir;
    return config;
}

CommandLine parseCommandLine(int argc, const char* const* argv) {
    CommandLine command_line;
    command_line.config = defaultConfig(argc > 0 ? argv[0] : nullptr);
    FetchConfig& config = command_line.config;

    int arg_index = 1;
    while (arg_index < argc) {
        const std::string option = argv[arg_index];

        if (option == "-h" || option == "--help") {
            command_line.show_help = true;
            return command_line;
        }
        if (option == "-v") {
            config.verbose = true;
            ++arg_index;
            continue;
        }

        if (option != "-l" && option != "-o" && option != "-s" && option != "-t") {
            throw std::invalid_argument("Unknown option: " + option);
        }
        if (arg_index + 1 >= argc) {
            throw std::invalid_argument("Missing value for option " + option);
        }

        const std::string value = argv[arg_index + 1];
        if (option == "-l") {
            config.server_url = value;
        } else if (option == "-o") {
            config.output_dir = value;
        } else if (option == "-s") {
            config.success_marker = value;
        } else {
            config.worker_count = parseWorkerCount(value);
        }
        arg_index += 2;
    }

    return command_line;
}

void printUsage(std::ostream& out, const char* program_name) {
    out << "Usage: " << program_name << " [-l <url>] [-o <directory>] [-s <path>] [-t <workers>] [-v]\n"
        << "Options:\n"
        << "  -l <url>         Location of the Solr server (default: " << kDefaultServerUrl << ")\n"
        << "  -o <directory>   Output location of the downloaded index (default: " << kDefaultOutputDir << ")\n"
        << "  -s <path>        Path of the file marking a successful download\n"
        << "  -t <workers>     Number of concurrent downloads (default: half the hardware threads)\n"
        << "  -v               Verbose logging\n"
        << "  -h, --help       Show this message" << std::endl;
}

} // namespace solrfetch
