/**
 * @file thread_pool_executor.hpp
 * @brief ThreadPoolExecutor running independent tasks concurrently.
 */
#pragma once
#include "jobtmpl/execution/executor.hpp"
#include <condition_variable>
#include <mutex>
#include <queue>
#include <thread>

namespace jobtmpl
{

/**
 * @brief Executor with a fixed pool of worker threads.
 *
 * @details
 * Workers are started per execute() call and joined before it returns.
 * Tasks of the same Step may run concurrently with each other and with
 * tasks of any Step that does not depend on it. Each worker names its
 * thread `Worker-N` for log output.
 *
 * @par Thread Safety
 * - execute() is not reentrant; call from one thread at a time.
 * - request_stop() can be called from any thread.
 */
class ThreadPoolExecutor : public Executor
{
public:
    ThreadPoolExecutor(ExecutorConfig config, std::shared_ptr<ITaskRunner> runner);
    ~ThreadPoolExecutor() override;

    JobResult execute(std::shared_ptr<const JobPlan> plan) override;

    void request_stop() override;

    void enqueue(TaskWrapperPtr task) override;

    void notify_completion(TaskWrapper* task) override;

    size_t worker_count() const noexcept
    {
        return m_worker_count;
    }

private:
    void worker_loop(size_t worker_id);
    void shutdown_workers();

    size_t m_worker_count;

    std::mutex m_mutex;
    std::condition_variable m_task_available;
    std::condition_variable m_all_done;
    std::queue<TaskWrapperPtr> m_ready_queue;
    // Enqueued tasks whose notify_completion() has not run yet
    size_t m_outstanding{0};
    bool m_shutdown{false};

    std::vector<std::thread> m_workers;
};

inline std::shared_ptr<ThreadPoolExecutor> make_thread_pool_executor(
    ExecutorConfig config, std::shared_ptr<ITaskRunner> runner)
{
    return std::make_shared<ThreadPoolExecutor>(std::move(config), std::move(runner));
}

} // namespace jobtmpl
