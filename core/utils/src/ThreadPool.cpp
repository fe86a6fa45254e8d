#include "ThreadPool.h"
#include "Logger.h"

#include <algorithm>
#include <exception>

namespace SkipKP {

    ThreadPool::ThreadPool(std::size_t threadCount) {
        std::size_t count = threadCount;
        if (count == 0) {
            count = std::max(1u, std::thread::hardware_concurrency());
        }
        workers_.reserve(count);
        while (workers_.size() < count) {
            workers_.emplace_back([this] { runWorker(); });
        }
    }

    ThreadPool::~ThreadPool() {
        shutdown();
    }

    bool ThreadPool::tryPost(Task task) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(task));
        lock.unlock();
        wake_.notify_one();
        return true;
    }

    void ThreadPool::shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        wake_.notify_all();

        std::call_once(joinOnce_, [this] {
            for (auto& worker : workers_) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
        });
    }

    // Blocks until a task is available; false once closed and drained.
    bool ThreadPool::takeNext(Task& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) {
            return false;
        }
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    void ThreadPool::runWorker() {
        Task task;
        while (takeNext(task)) {
            try {
                task();
            } catch (const std::exception& e) {
                Logger::instance().log(LogLevel::ERROR, std::string("Pool task threw: ") + e.what(), "ThreadPool");
            }
            task = nullptr;
        }
    }

} // namespace SkipKP
