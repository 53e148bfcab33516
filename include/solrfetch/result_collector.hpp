#pragma once

#include "index_types.hpp"
#include "transfer_scheduler.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace solrfetch {

struct FetchReport {
    IndexIdentity identity;
    // Completion order, which is not deterministic.
    std::vector<DownloadOutcome> outcomes;
    std::size_t failed_status_count{0};
    std::uint64_t total_bytes{0};
};

// Called for every outcome right after it is logged.
using OutcomeHandler = std::function<void(const DownloadOutcome&)>;

class ResultCollector {
public:
    ResultCollector() = default;
    explicit ResultCollector(OutcomeHandler on_outcome) : on_outcome_(std::move(on_outcome)) {}

    // Drains the scheduler's outcomes until every worker has exited, logging
    // each one as it arrives.
    FetchReport collect(TransferScheduler& scheduler) const;

    // One summary line for the whole run.
    static void logSummary(const FetchReport& report);

private:
    OutcomeHandler on_outcome_;
};

} // namespace solrfetch
