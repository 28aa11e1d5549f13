#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>

namespace bucketfs {

/**
 * TaskRunner - One worker thread executing submitted tasks in FIFO order
 *
 * Tasks never overlap: the next one starts only after the previous one has
 * returned. Destruction finishes the queued tasks, then joins the worker.
 */
class TaskRunner {
public:
    TaskRunner();
    ~TaskRunner();

    // Non-copyable, non-movable
    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;
    TaskRunner(TaskRunner&&) = delete;
    TaskRunner& operator=(TaskRunner&&) = delete;

    // Enqueue a task and return a future for its result
    template <class F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        std::future<R> result = task->get_future();
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_) {
                throw std::runtime_error("submit on stopped TaskRunner");
            }
            tasks_.emplace([task]() { (*task)(); });
        }
        condition_.notify_one();
        return result;
    }

    // True when called from the worker thread
    bool runsOnWorker() const { return std::this_thread::get_id() == worker_.get_id(); }

private:
    void loop();

    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
    std::thread worker_;
};

} // namespace bucketfs
