#include "jobtmpl/execution/thread_pool_executor.hpp"
#include "jobtmpl/common/logger.hpp"
#include "jobtmpl/execution/task_wrapper.hpp"

namespace jobtmpl
{

namespace
{

size_t resolve_worker_count(size_t requested)
{
    if (requested != 0)
    {
        return requested;
    }
    const unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : static_cast<size_t>(hw);
}

} // namespace

ThreadPoolExecutor::ThreadPoolExecutor(ExecutorConfig config, std::shared_ptr<ITaskRunner> runner)
    : Executor(std::move(config), std::move(runner))
    , m_worker_count{resolve_worker_count(m_config.thread_count)}
{
    JOBTMPL_LOG_DEBUG("ThreadPoolExecutor created with " + std::to_string(m_worker_count) + " workers");
}

ThreadPoolExecutor::~ThreadPoolExecutor()
{
    shutdown_workers();
}

JobResult ThreadPoolExecutor::execute(std::shared_ptr<const JobPlan> plan)
{
    if (!plan)
    {
        throw ValidationError("Cannot execute a null job plan");
    }
    auto start_time = std::chrono::steady_clock::now();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        while (!m_ready_queue.empty())
        {
            m_ready_queue.pop();
        }
        m_outstanding = 0;
        m_shutdown = false;
    }

    prepare(std::move(plan));
    JOBTMPL_LOG_INFO("Executing " + std::to_string(m_plan->task_count()) + " task(s) in " +
                     std::to_string(m_plan->step_count()) + " step(s) on " + std::to_string(m_worker_count) +
                     " worker(s)");

    m_workers.reserve(m_worker_count);
    for (size_t i = 0; i < m_worker_count; ++i)
    {
        m_workers.emplace_back(&ThreadPoolExecutor::worker_loop, this, i);
    }

    release_initial_steps();

    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_all_done.wait(lock, [this] { return m_outstanding == 0; });
    }

    shutdown_workers();

    if (stop_requested())
    {
        cancel_pending_tasks();
    }
    JobResult result = build_result(start_time);
    JOBTMPL_LOG_INFO(result.summary());
    reset();
    return result;
}

void ThreadPoolExecutor::request_stop()
{
    Executor::request_stop();
    // Wake idle workers so queued tasks drain as Canceled
    m_task_available.notify_all();
}

void ThreadPoolExecutor::enqueue(TaskWrapperPtr task)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_ready_queue.push(std::move(task));
        ++m_outstanding;
    }
    m_task_available.notify_one();
}

void ThreadPoolExecutor::notify_completion(TaskWrapper* task)
{
    (void)task;
    bool done = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_outstanding;
        done = (m_outstanding == 0);
    }
    if (done)
    {
        m_all_done.notify_all();
    }
}

void ThreadPoolExecutor::worker_loop(size_t worker_id)
{
    set_thread_name("Worker-" + std::to_string(worker_id));
    JOBTMPL_LOG_DEBUG("Worker-" + std::to_string(worker_id) + " thread started");

    while (true)
    {
        TaskWrapperPtr task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_task_available.wait(lock, [this] { return !m_ready_queue.empty() || m_shutdown; });
            if (m_ready_queue.empty())
            {
                // Shutdown with nothing left to drain
                break;
            }
            task = std::move(m_ready_queue.front());
            m_ready_queue.pop();
        }

        // TaskWrapper::run() captures task exceptions itself
        task->run();
    }

    JOBTMPL_LOG_DEBUG("Worker-" + std::to_string(worker_id) + " stopped");
}

void ThreadPoolExecutor::shutdown_workers()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
    }
    m_task_available.notify_all();

    for (auto& worker : m_workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
    m_workers.clear();
}

} // namespace jobtmpl
