#pragma once

#include "bounded_queue.hpp"
#include "completion_latch.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "index_types.hpp"

#include <atomic>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace solrfetch {

constexpr std::size_t kDefaultTransferBufferSize = 64 * 1024;
constexpr std::size_t kDefaultOutcomeCapacity = 1000;

enum class FailureAction {
    Abort,
    Skip,
};

// Decides what a failed transfer does to the rest of the run.
using FailureHandler = std::function<FailureAction(const DownloadJob&, const FetchError&)>;

// Every failure aborts the run.
FailureAction failFast(const DownloadJob& job, const FetchError& error);

// Half the host's hardware threads, at least one.
std::size_t defaultWorkerCount();

struct SchedulerOptions {
    std::size_t worker_count{1};
    std::size_t buffer_size{kDefaultTransferBufferSize};
    std::size_t outcome_capacity{kDefaultOutcomeCapacity};
    FailureHandler on_failure{failFast};
};

// Fixed pool of workers draining a bounded job queue. Each job is written to
// <output_dir>/<file_name>; one DownloadOutcome is produced per completed job.
class TransferScheduler {
public:
    TransferScheduler(HttpClient& client, std::filesystem::path output_dir, SchedulerOptions options);
    ~TransferScheduler();

    TransferScheduler(const TransferScheduler&) = delete;
    TransferScheduler& operator=(const TransferScheduler&) = delete;

    void start();

    // Blocks while the job queue is full. Returns false once the run is aborted.
    bool submit(DownloadJob job);
    // No more jobs will be submitted.
    void finish();
    // Aborts the run with error unless it already failed.
    void fail(std::exception_ptr error);

    // Blocks for the next outcome; std::nullopt once every worker has exited.
    std::optional<DownloadOutcome> nextOutcome();

    [[nodiscard]] bool aborted() const noexcept { return aborted_.load(); }
    // Rethrows the error that aborted the run, if any.
    void rethrowIfFailed() const;

    [[nodiscard]] std::size_t workerCount() const noexcept { return options_.worker_count; }
    // Largest amount of data held in a transfer buffer by any job so far.
    [[nodiscard]] std::size_t peakBufferedBytes() const noexcept { return peak_buffered_.load(); }

private:
    void workerLoop(std::size_t worker_id);
    DownloadOutcome transfer(const DownloadJob& job);
    void recordPeak(std::size_t buffered);
    void shutdown();

    HttpClient& client_;
    std::filesystem::path output_dir_;
    SchedulerOptions options_;

    BoundedQueue<DownloadJob> jobs_;
    BoundedQueue<DownloadOutcome> outcomes_;
    CompletionLatch workers_done_;

    std::vector<std::thread> threads_;
    std::thread tracker_;

    std::atomic<bool> aborted_{false};
    std::atomic<std::size_t> peak_buffered_{0};
    mutable std::mutex error_mutex_;
    std::exception_ptr first_error_;
};

} // namespace solrfetch
