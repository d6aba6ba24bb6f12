/**
 * \file copy_executor.hpp
 * \brief Fixed-size worker pool running copy tasks.
 */
#pragma once
#include <condition_variable>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

namespace docsync {

/**
 * \brief Runs submitted jobs on a fixed set of worker threads.
 * \details Jobs start in submission order but finish in any order. The destructor finishes
 * every queued job before joining the workers; there is no cancellation.
 */
class CopyExecutor {
public:
    /** \param threads Worker count; 0 selects std::thread::hardware_concurrency(). */
    explicit CopyExecutor(unsigned threads = 0);
    ~CopyExecutor();

    CopyExecutor(const CopyExecutor &) = delete;
    CopyExecutor &operator=(const CopyExecutor &) = delete;

    /**
     * \brief Queue a job. Move-only callables are accepted.
     * \return Future that becomes ready when the job finishes and rethrows whatever it threw.
     */
    template <typename Job>
    std::future<void> submit(Job &&job) {
        std::packaged_task<void()> task(std::forward<Job>(job));
        auto future = task.get_future();
        enqueue(std::move(task));
        return future;
    }

    unsigned thread_count() const noexcept { return static_cast<unsigned>(workers_.size()); }

private:
    void enqueue(std::packaged_task<void()> task);
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::packaged_task<void()>> jobs_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

} // namespace docsync
