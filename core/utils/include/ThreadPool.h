#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace SkipKP {

    /**
     * @brief Fixed set of workers fed from one FIFO queue.
     *
     * Runs HTTP connections and sync scheduler peer tasks. shutdown() refuses
     * new work, lets the workers finish what is already queued and joins
     * them. The destructor shuts the pool down.
     */
    class ThreadPool {
    public:
        using Task = std::function<void()>;

        /// @param threadCount 0 picks one worker per hardware thread
        explicit ThreadPool(std::size_t threadCount);
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Queue @p func and observe its completion.
         *
         * Exceptions thrown by @p func surface from future::get(). A task
         * refused by a closed pool is destroyed unrun, so its future reports
         * std::future_errc::broken_promise.
         */
        template<typename F>
        std::future<void> enqueue(F&& func) {
            auto job = std::make_shared<std::packaged_task<void()>>(std::forward<F>(func));
            std::future<void> done = job->get_future();
            if (!tryPost([job]() { (*job)(); })) {
                job.reset();
            }
            return done;
        }

        /// @return false when the pool is closed; @p task is dropped
        bool tryPost(Task task);

        std::size_t size() const { return workers_.size(); }

        /// Refuse new work, drain the queue and join the workers.
        void shutdown();

    private:
        bool takeNext(Task& out);
        void runWorker();

        std::vector<std::thread> workers_;
        std::deque<Task> queue_;
        std::mutex mutex_;
        std::condition_variable wake_;
        bool closed_ = false;
        std::once_flag joinOnce_;
    };

} // namespace SkipKP
