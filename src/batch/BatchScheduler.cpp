#include "fastembed/batch/BatchScheduler.hpp"
#include "fastembed/core/Errors.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>

namespace fastembed {

size_t effective_batch_size(int requested) {
    return requested <= 0 ? kDefaultBatchSize : (size_t)requested;
}

std::vector<BatchJob> plan_batches(size_t n, size_t chunk_size) {
    if (chunk_size == 0) chunk_size = kDefaultBatchSize;

    std::vector<BatchJob> jobs;
    jobs.reserve((n + chunk_size - 1) / chunk_size);
    for (size_t i = 0; i < n; i += chunk_size) {
        jobs.push_back({i, std::min(i + chunk_size, n)});
    }
    return jobs;
}

namespace {

// First failure wins; later ones are dropped.
class ErrorSlot {
public:
    void record(std::exception_ptr e) {
        std::lock_guard<std::mutex> lock(m_mu);
        if (!m_first) m_first = e;
        m_failed.store(true, std::memory_order_release);
    }
    bool failed() const { return m_failed.load(std::memory_order_acquire); }
    void rethrow_if_any() const {
        if (m_first) std::rethrow_exception(m_first);
    }

private:
    std::mutex m_mu;
    std::exception_ptr m_first;
    std::atomic<bool> m_failed{false};
};

} // namespace

BatchScheduler::BatchScheduler(ChunkFn fn) : m_fn(std::move(fn)) {}

std::vector<Embedding> BatchScheduler::run_all(const std::vector<std::string>& inputs,
                                               const BatchOptions& opts) const {
    if (inputs.empty()) return {};

    const std::vector<BatchJob> jobs = plan_batches(inputs.size(), effective_batch_size(opts.batch_size));

    // each job owns results[start, end); no two jobs overlap
    std::vector<Embedding> results(inputs.size());
    ErrorSlot errors;
    std::atomic<size_t> next{0};

    auto run_job = [&](const BatchJob& job) {
        std::vector<std::string> chunk(inputs.begin() + job.start, inputs.begin() + job.end);
        std::vector<Embedding> out = m_fn(chunk);
        if (out.size() != chunk.size()) {
            throw ShapeError("chunk [" + std::to_string(job.start) + ", " + std::to_string(job.end) +
                             ") produced " + std::to_string(out.size()) + " vectors");
        }
        std::move(out.begin(), out.end(), results.begin() + job.start);
    };

    auto worker = [&]() {
        for (;;) {
            size_t idx = next.fetch_add(1);
            if (idx >= jobs.size()) return;
            if (opts.cancel_on_error && errors.failed()) continue;
            try {
                run_job(jobs[idx]);
            } catch (...) {
                errors.record(std::current_exception());
            }
        }
    };

    size_t n_workers = jobs.size();
    if (opts.max_in_flight > 0) n_workers = std::min(n_workers, opts.max_in_flight);

    // the calling thread is one of the workers
    std::vector<std::thread> threads;
    threads.reserve(n_workers - 1);
    for (size_t i = 1; i < n_workers; ++i) {
        try {
            threads.emplace_back(worker);
        } catch (const std::system_error&) {
            break; // run with the threads we have
        }
    }
    worker();
    for (auto& t : threads) t.join();

    errors.rethrow_if_any();
    return results;
}

} // namespace fastembed
