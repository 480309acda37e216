#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "xct/core/Error.hpp"

namespace xct {
    /// Simple thread pool.
    /// \note Similarly to std::async, exceptions thrown inside the pool are correctly propagated
    ///       to the parent thread via std::future. See enqueue() for more details.
    class ThreadPool {
    public:
        /// Launches the thread pool.
        /// \details Threads are launched into the "waiting room". The first thread to arrive waits
        ///          for a task to pop-up into the queue or for the destructor to be called.
        ///          The area is guarded, so the first thread waits for the condition while the others
        ///          wait for the lock to be released. Once a task is added and the waiting thread receives
        ///          the notification, it extracts it from the queue, releases the lock so that another thread
        ///          can enter the waiting area, and launches the task.
        explicit ThreadPool(i64 n_threads) {
            check<ValueError>(n_threads > 0, "Threads should be a positive non-zero number, got {}", n_threads);

            auto waiting_room = [this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock lock(m_queue_mutex);
                        m_condition.wait(lock, [this] { return m_stop or not m_tasks.empty(); });
                        if (m_stop and m_tasks.empty()) // join only if there's no task left.
                            return;
                        task = std::move(m_tasks.front());
                        m_tasks.pop();
                    } // release the lock so that another thread can start to wait().
                    task();
                }
            };

            m_workers.reserve(static_cast<usize>(n_threads));
            for (i64 i{}; i < n_threads; ++i)
                m_workers.emplace_back(waiting_room); // launch threads into the pool.
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /// Enqueues a task. The queue is asynchronous and returns immediately. As such, the return
        /// value is a std::future. Use get() to retrieve to output value. Even if the task returns
        /// void, it is recommended to get() to output so that exceptions are not lost in the working
        /// thread.
        ///
        /// \example
        /// \code
        /// ThreadPool a(2);
        /// auto future = a.enqueue([]() -> int {
        ///     throw std::runtime_error("aie");
        ///     return 1;
        /// });
        /// future.get(); // throws std::runtime_error("aie")
        /// \endcode
        template<class F, class... Args>
        auto enqueue(F&& f, Args&& ... args) {
            using return_type = std::invoke_result_t<F, Args...>;

            auto task = std::make_shared<std::packaged_task<return_type()>>(
                [f_ = std::forward<F>(f), ...args_ = std::forward<Args>(args)]() mutable {
                    return std::invoke(f_, args_...);
                });

            std::future<return_type> res = task->get_future(); // res.valid() will work as expected.
            {
                std::unique_lock lock(m_queue_mutex);
                m_tasks.emplace([task] { (*task)(); });
            }
            m_condition.notify_one();
            return res;
        }

        [[nodiscard]] auto n_threads() const noexcept -> i64 {
            return static_cast<i64>(m_workers.size());
        }

        /// Ensures all tasks are done and then closes the pool.
        ~ThreadPool() {
            {
                std::unique_lock lock(m_queue_mutex);
                m_stop = true;
            }
            m_condition.notify_all();
            for (std::thread& worker: m_workers)
                worker.join();
        }

    private:
        std::vector<std::thread> m_workers;
        std::queue<std::function<void()>> m_tasks;

        // synchronization
        std::mutex m_queue_mutex;
        std::condition_variable m_condition;
        bool m_stop{};
    };
}
