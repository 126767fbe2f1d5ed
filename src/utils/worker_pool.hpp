#pragma once

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <utility>

// Bounded pool for embedding and registry work. Tasks that outlive their
// caller's deadline still run to completion; the pool joins on destruction.
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads)
        : size_(num_threads > 0 ? num_threads
                                : std::max<size_t>(1, std::thread::hardware_concurrency())),
          pool_(size_) {
    }

    ~WorkerPool() {
        pool_.join();
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
        std::future<Result> result = task->get_future();
        boost::asio::post(pool_, [task] { (*task)(); });
        return result;
    }

    size_t size() const { return size_; }

private:
    size_t size_;
    boost::asio::thread_pool pool_;
};
