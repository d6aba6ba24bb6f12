#include "docsync/copy_executor.hpp"
#include <utility>

namespace docsync {

CopyExecutor::CopyExecutor(unsigned threads) {
    unsigned count = threads == 0 ? std::thread::hardware_concurrency() : threads;
    if(count == 0) count = 1;
    workers_.reserve(count);
    for(unsigned i = 0; i < count; ++i) workers_.emplace_back(&CopyExecutor::worker_loop, this);
}

CopyExecutor::~CopyExecutor() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for(auto &w : workers_) if(w.joinable()) w.join();
}

void CopyExecutor::enqueue(std::packaged_task<void()> task) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        jobs_.push(std::move(task));
    }
    cv_.notify_one();
}

void CopyExecutor::worker_loop() {
    for(;;) {
        std::packaged_task<void()> task;
        {
            std::unique_lock<std::mutex> lk(mutex_);
            cv_.wait(lk, [this]{ return stopping_ || !jobs_.empty(); });
            if(stopping_ && jobs_.empty()) return;
            task = std::move(jobs_.front());
            jobs_.pop();
        }
        // Exceptions are stored in the task's shared state.
        task();
    }
}

} // namespace docsync
