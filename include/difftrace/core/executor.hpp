#pragma once
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace difftrace::core {

    // Fixed-size worker pool. Tasks run in FIFO order; the destructor drains
    // the queue before joining.
    class ThreadPool {
      public:
        explicit ThreadPool(std::size_t threads = std::thread::hardware_concurrency()) {
            if (threads == 0)
                threads = 1;
            workers_.reserve(threads);
            while (workers_.size() < threads)
                workers_.emplace_back(&ThreadPool::work, this);
        }

        ThreadPool(const ThreadPool &) = delete;
        ThreadPool &operator=(const ThreadPool &) = delete;

        ~ThreadPool() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stopping_ = true;
            }
            wake_.notify_all();
            for (auto &worker : workers_)
                worker.join();
        }

        std::size_t size() const { return workers_.size(); }

        template <class F, class... A> auto submit(F &&f, A &&...args) -> std::future<std::invoke_result_t<F, A...>> {
            using R = std::invoke_result_t<F, A...>;
            auto task = std::make_shared<std::packaged_task<R()>>(
                [fn = std::forward<F>(f), ... captured = std::forward<A>(args)]() mutable {
                    return std::invoke(fn, captured...);
                });
            auto result = task->get_future();
            enqueue([task] { (*task)(); });
            return result;
        }

        // Runs f(0) .. f(n-1) on the pool and waits for all of them. The
        // first exception thrown by any task is rethrown here, after every
        // task has finished.
        template <class F> void bulk(F &&f, std::size_t n) {
            std::vector<std::future<void>> futures;
            futures.reserve(n);
            for (std::size_t i = 0; i < n; ++i)
                futures.push_back(submit([&f, i] { f(i); }));

            std::exception_ptr first;
            for (auto &fut : futures) {
                try {
                    fut.get();
                } catch (...) {
                    if (!first)
                        first = std::current_exception();
                }
            }
            if (first)
                std::rethrow_exception(first);
        }

      private:
        void enqueue(std::function<void()> job) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                tasks_.push(std::move(job));
            }
            wake_.notify_one();
        }

        void work() {
            std::unique_lock<std::mutex> lock(mutex_);
            for (;;) {
                wake_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
                if (tasks_.empty())
                    return;
                auto job = std::move(tasks_.front());
                tasks_.pop();
                lock.unlock();
                job();
                lock.lock();
            }
        }

        std::mutex mutex_;
        std::condition_variable wake_;
        std::queue<std::function<void()>> tasks_;
        std::vector<std::thread> workers_;
        bool stopping_ = false;
    };

} // namespace difftrace::core
