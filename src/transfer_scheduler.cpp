#include "solrfetch/transfer_scheduler.hpp"
#include "solrfetch/output_file.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace solrfetch {

FailureAction failFast(const DownloadJob& /*job*/, const FetchError& /*error*/) {
    return FailureAction::Abort;
}

std::size_t defaultWorkerCount() {
    return std::max<std::size_t>(1, std::thread::hardware_concurrency() / 2);
}

TransferScheduler::TransferScheduler(HttpClient& client, std::filesystem::path output_dir,
                                     SchedulerOptions options)
    : client_(client),
      output_dir_(std::move(output_dir)),
      options_(std::move(options)),
      jobs_(std::max<std::size_t>(1, options_.worker_count)),
      outcomes_(options_.outcome_capacity),
      workers_done_(std::max<std::size_t>(1, options_.worker_count)) {
    options_.worker_count = std::max<std::size_t>(1, options_.worker_count);
    if (!options_.on_failure) {
        options_.on_failure = failFast;
    }
}

TransferScheduler::~TransferScheduler() { shutdown(); }

void TransferScheduler::start() {
    if (!threads_.empty()) {
        throw std::logic_error("TransferScheduler already started");
    }

    threads_.reserve(options_.worker_count);
    for (std::size_t i = 0; i < options_.worker_count; ++i) {
        threads_.emplace_back([this, i]() { workerLoop(i); });
    }

    tracker_ = std::thread([this]() {
        workers_done_.wait();
        outcomes_.close();
    });
}

bool TransferScheduler::submit(DownloadJob job) {
    if (aborted_) {
        return false;
    }
    return jobs_.push(std::move(job));
}

void TransferScheduler::finish() { jobs_.close(); }

void TransferScheduler::fail(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        if (!first_error_) {
            first_error_ = std::move(error);
        }
    }
    aborted_ = true;
    jobs_.close();
    const auto dropped = jobs_.clear();
    if (dropped > 0) {
        spdlog::debug("dropped {} queued downloads", dropped);
    }
}

std::optional<DownloadOutcome> TransferScheduler::nextOutcome() { return outcomes_.pop(); }

void TransferScheduler::rethrowIfFailed() const {
    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        error = first_error_;
    }
    if (error) {
        std::rethrow_exception(error);
    }
}

void TransferScheduler::workerLoop(std::size_t worker_id) {
    while (auto job = jobs_.pop()) {
        if (aborted_) {
            break;
        }

        spdlog::debug("worker {} fetching {}", worker_id, job->file_name);
        try {
            if (!outcomes_.push(transfer(*job))) {
                break;
            }
        } catch (const FetchError& error) {
            if (options_.on_failure(*job, error) == FailureAction::Skip) {
                spdlog::warn("skipping {}: {}", job->file_name, error.what());
                continue;
            }
            spdlog::error("download of {} failed: {}", job->file_name, error.what());
            fail(std::current_exception());
        } catch (const std::exception& error) {
            spdlog::error("download of {} failed: {}", job->file_name, error.what());
            fail(std::current_exception());
        }
    }
    workers_done_.countDown();
}

DownloadOutcome TransferScheduler::transfer(const DownloadJob& job) {
    OutputFile out(output_dir_ / job.file_name, options_.buffer_size);
    const long status = client_.stream(job.source_url, [&out](const char* data, std::size_t size) {
        out.write(data, size);
    });
    out.close();
    recordPeak(out.peakBuffered());

    return {job.source_url, status, job.file_name, out.bytesWritten()};
}

void TransferScheduler::recordPeak(std::size_t buffered) {
    std::size_t current = peak_buffered_.load();
    while (buffered > current && !peak_buffered_.compare_exchange_weak(current, buffered)) {
    }
}

// Transfers already in flight run to completion; queued jobs are dropped.
void TransferScheduler::shutdown() {
    aborted_ = true;
    jobs_.close();
    jobs_.clear();
    outcomes_.close();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    if (tracker_.joinable()) {
        tracker_.join();
    }
}

} // namespace solrfetch
