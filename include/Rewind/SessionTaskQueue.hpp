// =================================================================
// include/Rewind/SessionTaskQueue.hpp
// =================================================================
// Serial task queues keyed by session id. Tasks for the same key run
// one at a time in submission order; different keys run independently.

#pragma once

#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>

namespace Rewind {

/**
 * @brief Per-key FIFO executor
 *
 * Each key owns one worker thread, created on first use. enqueue() never
 * runs a task inline. runSync() and waitForIdle() called from the key's own
 * worker do not block on the queue, which would deadlock.
 */
class SessionTaskQueue {
public:
    SessionTaskQueue() = default;
    ~SessionTaskQueue();

    SessionTaskQueue(const SessionTaskQueue&) = delete;
    SessionTaskQueue& operator=(const SessionTaskQueue&) = delete;

    /**
     * @brief Queue a task behind every task already queued for key
     * @return Future of the task's result; exceptions are stored in it
     * @throws std::runtime_error if the queue has been shut down
     */
    template<typename F>
    auto enqueue(const std::string& key, F&& f) -> std::future<std::invoke_result_t<F>> {
        using return_type = std::invoke_result_t<F>;
        
        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
        std::future<return_type> res = task->get_future();
        push(key, [task]() { (*task)(); });
        return res;
    }

    /**
     * @brief Run a task on the key's queue and wait for its result
     *
     * From the key's own worker the task runs inline.
     */
    template<typename F>
    auto runSync(const std::string& key, F&& f) -> std::invoke_result_t<F> {
        if (isWorkerFor(key)) {
            return f();
        }
        return enqueue(key, std::forward<F>(f)).get();
    }

    /**
     * @brief Block until every task queued for key before this call has run
     */
    void waitForIdle(const std::string& key);

    /**
     * @brief waitForIdle() for every known key
     */
    void waitForAll();

    /**
     * @brief Number of tasks queued or running for key
     */
    size_t pendingTasks(const std::string& key) const;

    /**
     * @brief True when called from the worker thread of key
     */
    bool isWorkerFor(const std::string& key) const;

    /**
     * @brief Drain the queue of key and join its worker
     *
     * A later enqueue() on key starts a new worker.
     *
     * @return False if key has no worker or the caller is that worker
     */
    bool retire(const std::string& key);

    /**
     * @brief Number of keys that currently own a worker thread
     */
    size_t workerCount() const;

    /**
     * @brief Drain all queues and join the workers
     *
     * Must not be called from a worker thread.
     */
    void shutdown();

private:
    class Strand;

    void push(const std::string& key, std::function<void()> task);
    std::shared_ptr<Strand> findStrand(const std::string& key) const;

    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<Strand>> m_strands;
    bool m_stop = false;
};

} // namespace Rewind
