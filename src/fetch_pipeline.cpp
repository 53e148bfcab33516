#include "solrfetch/fetch_pipeline.hpp"
#include "solrfetch/index_resolver.hpp"
#include "solrfetch/replication_urls.hpp"

#include <exception>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace solrfetch {

FetchPipeline::FetchPipeline(HttpClient& client, FetchConfig config)
    : client_(client), config_(std::move(config)) {}

FetchReport FetchPipeline::run() {
    const ReplicationUrls urls(config_.server_url);

    spdlog::info("Beginning fetch of Solr index from {}", urls.baseUrl());
    IndexResolver resolver(client_);
    const ResolvedIndex index = resolver.resolve(urls);
    spdlog::info("Index version {} generation {} has {} files", index.identity.version,
                 index.identity.generation, index.files.size());

    SchedulerOptions options;
    options.worker_count = config_.worker_count;
    options.buffer_size = config_.buffer_size;
    options.on_failure = on_failure_;

    TransferScheduler scheduler(client_, config_.output_dir, std::move(options));
    scheduler.start();
    spdlog::debug("Started {} download workers", scheduler.workerCount());

    // Producer runs beside the collector so that neither queue can fill up
    // with nobody draining it.
    std::thread producer([&scheduler, &urls, &index]() {
        try {
            for (const auto& file : index.files) {
                DownloadJob job{file.name, urls.fileContentUrl(index.identity, file.name)};
                if (!scheduler.submit(std::move(job))) {
                    break;
                }
            }
        } catch (const std::exception&) {
            scheduler.fail(std::current_exception());
        }
        scheduler.finish();
    });

    ResultCollector collector(on_outcome_);
    FetchReport report;
    try {
        report = collector.collect(scheduler);
    } catch (...) {
        // Unblocks the producer before joining it.
        scheduler.fail(std::current_exception());
        producer.join();
        throw;
    }
    producer.join();

    scheduler.rethrowIfFailed();

    report.identity = index.identity;
    ResultCollector::logSummary(report);
    return report;
}

} // namespace solrfetch
