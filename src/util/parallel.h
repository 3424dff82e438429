// viralclust - Scoped parallel map over an index range
// The OpenMP region is the worker pool: it opens on entry and every worker is
// joined when the region closes, including on the exception path.

#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <omp.h>

namespace viralclust {

// Run fn(i) for i in [0, n) on `threads` workers. Callers write results into
// pre-sized slots indexed by i, so output order always matches input order.
// The first exception thrown by a task stops scheduling of further work and
// is rethrown on the calling thread once all workers have joined.
template <typename Fn>
void parallel_for(size_t n, int threads, Fn&& fn) {
    if (n == 0) return;
    if (threads < 1) threads = 1;

    std::exception_ptr first_error;
    std::mutex error_mutex;
    std::atomic<bool> failed{false};

    #pragma omp parallel for num_threads(threads) schedule(dynamic, 16)
    for (long long i = 0; i < static_cast<long long>(n); ++i) {
        if (failed.load(std::memory_order_relaxed)) continue;
        try {
            fn(static_cast<size_t>(i));
        } catch (...) {
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!first_error) first_error = std::current_exception();
            failed.store(true, std::memory_order_relaxed);
        }
    }

    if (first_error) std::rethrow_exception(first_error);
}

}  // namespace viralclust
