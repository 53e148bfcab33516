#include "solrfetch/curl_http_client.hpp"
#include "solrfetch/errors.hpp"
#include "solrfetch/fetch_config.hpp"
#include "solrfetch/fetch_pipeline.hpp"
#include "solrfetch/logging.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    solrfetch::CommandLine command_line;
    try {
        command_line = solrfetch::parseCommandLine(argc, argv);
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << std::endl;
        solrfetch::printUsage(std::cerr, argv[0]);
        return 1;
    }
    if (command_line.show_help) {
        solrfetch::printUsage(std::cout, argv[0]);
        return 0;
    }

    const solrfetch::FetchConfig& config = command_line.config;
    solrfetch::initLogging(config.verbose);

    try {
        std::error_code ec;
        std::filesystem::create_directories(config.output_dir, ec);
        if (ec) {
            throw solrfetch::LocalIoError("Unable to create output path " +
                                          config.output_dir.string() + ": " + ec.message());
        }

        solrfetch::CurlHttpClient client(config.buffer_size);
        solrfetch::FetchPipeline pipeline(client, config);
        pipeline.run();
    } catch (const solrfetch::FetchError& ex) {
        spdlog::critical("fatal {}: {}", solrfetch::toString(ex.kind()), ex.what());
        return 1;
    } catch (const std::exception& ex) {
        spdlog::critical("fatal: {}", ex.what());
        return 1;
    }
    return 0;
}
