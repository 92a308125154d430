#include "curvefit/ThreadPool.hpp"

namespace curvefit {

ThreadPool::ThreadPool(unsigned nthreads)
{
    if (nthreads == 0) nthreads = 1;
    for (unsigned i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this] {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock lk(mtx_);
                    cv_.wait(lk, [this] { return stop_ || !tasks_.empty(); });
                    if (stop_ && tasks_.empty()) return;
                    task = std::move(tasks_.front());
                    tasks_.pop();
                }
                task();
            }
        });
    }
}

ThreadPool::~ThreadPool()
{
    {
        std::lock_guard lk(mtx_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

void ThreadPool::for_each_index(std::size_t n, const std::function<void(std::size_t)>& body)
{
    std::vector<std::future<void>> pending;
    pending.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        pending.push_back(enqueue(body, i));

    /* wait for all of them before the first rethrow, body may reference
       the caller's stack */
    for (auto& f : pending) f.wait();
    for (auto& f : pending) f.get();
}

} // namespace curvefit
