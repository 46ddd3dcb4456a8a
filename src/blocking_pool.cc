#include <snipbox/blocking_pool.hh>
#include <snipbox/macros/throw.hh>
#include <spdlog/spdlog.h>

namespace snipbox {

BlockingPool::BlockingPool(size_t max_threads, std::chrono::milliseconds keep_alive)
: max_threads_{max_threads}
, keep_alive_{keep_alive} {
    if (max_threads_ == 0) {
        THROW("BlockingPool needs at least one thread");
    }
}

BlockingPool::~BlockingPool() { join(); }

void BlockingPool::post(Job job) {
    std::lock_guard lock{mutex_};
    if (joining_) {
        THROW("BlockingPool::post() called after join()");
    }
    reap_exited_threads();
    jobs_.emplace_back(std::move(job));
    auto alive = threads_.size() - exited_threads_.size();
    if (jobs_.size() > idle_threads_ and alive < max_threads_) {
        try {
            std::thread thread{&BlockingPool::worker_loop, this};
            auto id = thread.get_id();
            threads_.emplace(id, std::move(thread));
        } catch (...) {
            jobs_.pop_back();
            throw;
        }
        spdlog::debug("blocking pool: started thread, {} running", alive + 1);
    } else {
        job_posted_.notify_one();
    }
}

void BlockingPool::join() noexcept {
    std::map<std::thread::id, std::thread> threads;
    {
        std::lock_guard lock{mutex_};
        joining_ = true;
        threads = std::move(threads_);
        threads_.clear();
        exited_threads_.clear();
    }
    job_posted_.notify_all();
    for (auto& [id, thread] : threads) {
        thread.join();
    }
}

size_t BlockingPool::thread_count() noexcept {
    std::lock_guard lock{mutex_};
    return threads_.size() - exited_threads_.size();
}

void BlockingPool::reap_exited_threads() noexcept {
    for (auto id : exited_threads_) {
        auto it = threads_.find(id);
        // The thread has finished its work and only returns from worker_loop()
        it->second.join();
        threads_.erase(it);
    }
    exited_threads_.clear();
}

void BlockingPool::worker_loop() {
    std::unique_lock lock{mutex_};
    for (;;) {
        if (jobs_.empty()) {
            if (joining_) {
                return;
            }
            ++idle_threads_;
            bool woken = job_posted_.wait_for(lock, keep_alive_, [this] {
                return joining_ or not jobs_.empty();
            });
            --idle_threads_;
            if (not woken) {
                // join() joins every thread it took over, the rest is reaped by post()
                exited_threads_.emplace_back(std::this_thread::get_id());
                return;
            }
            continue;
        }
        auto job = std::move(jobs_.front());
        jobs_.pop_front();
        lock.unlock();
        job();
        lock.lock();
    }
}

} // namespace snipbox
