#pragma once
#include "fastembed/emb/Normalizer.hpp"

#include <functional>
#include <string>
#include <vector>

namespace fastembed {

constexpr size_t kDefaultBatchSize = 512;

// A contiguous [start, end) slice of the caller's inputs.
struct BatchJob {
    size_t start = 0;
    size_t end = 0;
};

struct BatchOptions {
    int batch_size = 0;            // <= 0 selects kDefaultBatchSize
    size_t max_in_flight = 0;      // 0 = one worker per chunk
    bool cancel_on_error = false;  // skip chunks not yet started once one fails
};

// Splits [0, n) into chunks of chunk_size; the last one may be shorter.
std::vector<BatchJob> plan_batches(size_t n, size_t chunk_size);
size_t effective_batch_size(int requested);

// Fans chunks out to worker threads and writes each chunk's vectors into its
// own slice of a pre-sized result, so the output order is the input order.
class BatchScheduler {
public:
    using ChunkFn = std::function<std::vector<Embedding>(const std::vector<std::string>& chunk)>;

    explicit BatchScheduler(ChunkFn fn);

    // Waits for every worker, then rethrows the first recorded failure.
    std::vector<Embedding> run_all(const std::vector<std::string>& inputs, const BatchOptions& opts) const;

private:
    ChunkFn m_fn;
};

} // namespace fastembed
