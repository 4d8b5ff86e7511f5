// =================================================================
// src/Rewind/SessionTaskQueue.cpp
// =================================================================
// Implementation for the session-keyed serial task queue.

#include "Rewind/SessionTaskQueue.hpp"
#include "Rewind/Logger.hpp"
#include <condition_variable>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace Rewind {

namespace {
// Strand whose worker is the calling thread, if any
thread_local const void* t_current_strand = nullptr;
}

class SessionTaskQueue::Strand {
public:
    explicit Strand(const std::string& key) : m_key(key) {
        m_worker = std::thread([this] {
            t_current_strand = this;
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(m_queue_mutex);
                    m_condition.wait(lock, [this] { return m_stop || !m_tasks.empty(); });
                    
                    if (m_stop && m_tasks.empty()) {
                        return;
                    }
                    
                    task = std::move(m_tasks.front());
                    m_tasks.pop();
                    m_running = true;
                }
                
                task();
                
                {
                    std::unique_lock<std::mutex> lock(m_queue_mutex);
                    m_running = false;
                }
            }
        });
    }
    
    ~Strand() {
        stop();
    }
    
    void push(std::function<void()> task) {
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            if (m_stop) {
                throw std::runtime_error("enqueue on stopped session queue: " + m_key);
            }
            m_tasks.push(std::move(task));
        }
        m_condition.notify_one();
    }
    
    size_t pending() const {
        std::unique_lock<std::mutex> lock(m_queue_mutex);
        return m_tasks.size() + (m_running ? 1 : 0);
    }
    
    void stop() {
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            m_stop = true;
        }
        m_condition.notify_all();
        if (m_worker.joinable()) {
            m_worker.join();
        }
    }
    
private:
    std::string m_key;
    std::thread m_worker;
    std::queue<std::function<void()>> m_tasks;
    mutable std::mutex m_queue_mutex;
    std::condition_variable m_condition;
    bool m_stop = false;
    bool m_running = false;
};

SessionTaskQueue::~SessionTaskQueue() {
    shutdown();
}

void SessionTaskQueue::push(const std::string& key, std::function<void()> task) {
    // Pushed under m_mutex so a concurrent retire() never loses the task
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_stop) {
        throw std::runtime_error("enqueue on stopped session queue: " + key);
    }
    auto& slot = m_strands[key];
    if (!slot) {
        slot = std::make_shared<Strand>(key);
        LOG_DEBUG("SessionTaskQueue", "Started worker for session " + key);
    }
    slot->push(std::move(task));
}

std::shared_ptr<SessionTaskQueue::Strand> SessionTaskQueue::findStrand(const std::string& key) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    auto it = m_strands.find(key);
    return it == m_strands.end() ? nullptr : it->second;
}

bool SessionTaskQueue::isWorkerFor(const std::string& key) const {
    auto strand = findStrand(key);
    return strand && t_current_strand == strand.get();
}

void SessionTaskQueue::waitForIdle(const std::string& key) {
    if (!findStrand(key) || isWorkerFor(key)) {
        return;
    }
    enqueue(key, [] {}).wait();
}

void SessionTaskQueue::waitForAll() {
    std::vector<std::string> keys;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        for (const auto& entry : m_strands) {
            keys.push_back(entry.first);
        }
    }
    for (const auto& key : keys) {
        waitForIdle(key);
    }
}

size_t SessionTaskQueue::pendingTasks(const std::string& key) const {
    auto strand = findStrand(key);
    return strand ? strand->pending() : 0;
}

bool SessionTaskQueue::retire(const std::string& key) {
    std::shared_ptr<Strand> strand;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        auto it = m_strands.find(key);
        if (it == m_strands.end() || t_current_strand == it->second.get()) {
            return false;
        }
        strand = it->second;
        m_strands.erase(it);
    }
    strand->stop();
    LOG_DEBUG("SessionTaskQueue", "Retired worker for session " + key);
    return true;
}

size_t SessionTaskQueue::workerCount() const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_strands.size();
}

void SessionTaskQueue::shutdown() {
    std::map<std::string, std::shared_ptr<Strand>> strands;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_stop) {
            return;
        }
        m_stop = true;
        strands.swap(m_strands);
    }
    for (auto& entry : strands) {
        entry.second->stop();
    }
}

} // namespace Rewind
