#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace snipbox {

// Runs jobs that may block for a long time. A new thread is started whenever no idle thread
// can take a posted job, up to max_threads; above that jobs are queued. Threads idle for
// longer than keep_alive exit.
class BlockingPool {
public:
    using Job = std::function<void()>;

    explicit BlockingPool(
        size_t max_threads, std::chrono::milliseconds keep_alive = std::chrono::seconds{10}
    );

    BlockingPool(const BlockingPool&) = delete;
    BlockingPool(BlockingPool&&) = delete;
    BlockingPool& operator=(const BlockingPool&) = delete;
    BlockingPool& operator=(BlockingPool&&) = delete;

    // Calls join()
    ~BlockingPool();

    // @p job must not throw. Throws if called after join().
    void post(Job job);

    // Stops accepting jobs, waits until every posted job is done and joins all threads
    void join() noexcept;

    // Number of threads that have not exited yet
    [[nodiscard]] size_t thread_count() noexcept;

private:
    void worker_loop();

    // Requires mutex_ to be held
    void reap_exited_threads() noexcept;

    const size_t max_threads_;
    const std::chrono::milliseconds keep_alive_;
    std::mutex mutex_;
    std::condition_variable job_posted_;
    std::deque<Job> jobs_;
    size_t idle_threads_ = 0;
    bool joining_ = false;
    std::map<std::thread::id, std::thread> threads_;
    std::vector<std::thread::id> exited_threads_;
};

} // namespace snipbox
