#pragma once

#include "fetch_config.hpp"
#include "http_client.hpp"
#include "result_collector.hpp"
#include "transfer_scheduler.hpp"

#include <utility>

namespace solrfetch {

// resolve -> queue one job per file -> download with a worker pool -> collect.
class FetchPipeline {
public:
    FetchPipeline(HttpClient& client, FetchConfig config);

    // Overrides the fail-fast policy applied to failed transfers.
    void setFailureHandler(FailureHandler handler) { on_failure_ = std::move(handler); }

    // Observes each outcome as it is collected.
    void setOutcomeHandler(OutcomeHandler handler) { on_outcome_ = std::move(handler); }

    // Throws the first FetchError met anywhere in the run.
    FetchReport run();

private:
    HttpClient& client_;
    FetchConfig config_;
    FailureHandler on_failure_{failFast};
    OutcomeHandler on_outcome_;
};

} // namespace solrfetch
