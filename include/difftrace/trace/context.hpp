#pragma once

#include "difftrace/core/executor.hpp"
#include <cstddef>

namespace difftrace::trace {

    // Call-time configuration for index maintenance work.
    //
    // pool: optional, non-owning. Without one every operation is sequential.
    // parallel_threshold: a compaction touching fewer keys than this stays on
    // the calling thread even when a pool is present.
    class ExecutionContext {
      public:
        static constexpr std::size_t kDefaultParallelThreshold = 64;

        ExecutionContext() = default;

        explicit ExecutionContext(difftrace::core::ThreadPool *pool,
                                  std::size_t parallel_threshold = kDefaultParallelThreshold)
            : pool_(pool), parallel_threshold_(parallel_threshold) {}

        bool has_parallel() const { return pool_ != nullptr; }

        bool parallel_for(std::size_t work_items) const {
            return has_parallel() && work_items >= parallel_threshold_ && work_items > 1;
        }

        difftrace::core::ThreadPool *pool() const { return pool_; }
        std::size_t parallel_threshold() const { return parallel_threshold_; }

      private:
        difftrace::core::ThreadPool *pool_ = nullptr;
        std::size_t parallel_threshold_ = kDefaultParallelThreshold;
    };

} // namespace difftrace::trace
