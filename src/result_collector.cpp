#include "solrfetch/result_collector.hpp"

#include <string>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace solrfetch {

namespace {

std::string formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    }
    return fmt::format("{} B", bytes);
}

} // namespace

FetchReport ResultCollector::collect(TransferScheduler& scheduler) const {
    FetchReport report;
    while (auto outcome = scheduler.nextOutcome()) {
        if (outcome->status_code >= 200 && outcome->status_code < 300) {
            spdlog::info("{} -> HTTP {} ({})", outcome->source_url, outcome->status_code,
                         formatSize(outcome->bytes_written));
        } else {
            ++report.failed_status_count;
            spdlog::warn("{} -> HTTP {} ({})", outcome->source_url, outcome->status_code,
                         formatSize(outcome->bytes_written));
        }
        report.total_bytes += outcome->bytes_written;
        if (on_outcome_) {
            on_outcome_(*outcome);
        }
        report.outcomes.push_back(std::move(*outcome));
    }
    return report;
}

void ResultCollector::logSummary(const FetchReport& report) {
    spdlog::info("Fetched {} files ({}) of index version {} generation {}",
                 report.outcomes.size(), formatSize(report.total_bytes),
                 report.identity.version, report.identity.generation);
    if (report.failed_status_count > 0) {
        spdlog::warn("{} files were served with a non-success HTTP status",
                     report.failed_status_count);
    }
}

} // namespace solrfetch
