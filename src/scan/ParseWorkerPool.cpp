#include "scan/ParseWorkerPool.h"

#include <iostream>
#include <utility>

namespace keyclash {

ParseWorkerPool::ParseWorkerPool(int workerCount, ParseWorker::ParseFunction parse) {
    const int count = qMax(1, workerCount);
    m_workers.reserve(count);
    for (int i = 0; i < count; ++i) {
        m_workers.push_back(std::make_unique<ParseWorker>(
            i, parse, [this](int workerId, ParseResult result) {
                onJobComplete(workerId, std::move(result));
            }));
        m_idleWorkers.push_back(i);
    }
}

ParseWorkerPool::~ParseWorkerPool() { shutdown(); }

void ParseWorkerPool::start() {
    if (m_started) {
        return;
    }
    m_started = true;
    for (const auto& worker : m_workers) {
        worker->start();
    }
}

void ParseWorkerPool::submit(const ParseJob& job) {
    start();
    {
        std::lock_guard<std::mutex> lock(m_resultMutex);
        ++m_inFlight;
    }

    std::lock_guard<std::mutex> lock(m_dispatchMutex);
    if (m_stopping) {
        std::lock_guard<std::mutex> resultLock(m_resultMutex);
        --m_inFlight;
        return;
    }
    if (!m_idleWorkers.empty()) {
        const int workerId = m_idleWorkers.front();
        m_idleWorkers.pop_front();
        m_workers[workerId]->assignJob(job);
        return;
    }
    m_queuedJobs.push_back(job);
}

std::optional<ParseResult> ParseWorkerPool::takeResult() {
    std::unique_lock<std::mutex> lock(m_resultMutex);
    m_resultCv.wait(lock, [this]() { return !m_results.empty() || m_inFlight == 0; });
    if (m_results.empty()) {
        return std::nullopt;
    }
    ParseResult result = std::move(m_results.front());
    m_results.pop_front();
    return result;
}

int ParseWorkerPool::cancelQueued() {
    int dropped = 0;
    {
        std::lock_guard<std::mutex> lock(m_dispatchMutex);
        dropped = static_cast<int>(m_queuedJobs.size());
        m_queuedJobs.clear();
    }
    if (dropped > 0) {
        std::lock_guard<std::mutex> lock(m_resultMutex);
        m_inFlight -= dropped;
    }
    m_resultCv.notify_all();
    return dropped;
}

void ParseWorkerPool::shutdown() {
    if (m_joined) {
        return;
    }
    m_joined = true;

    {
        std::lock_guard<std::mutex> lock(m_dispatchMutex);
        m_stopping = true;
    }
    cancelQueued();

    if (!m_started) {
        return;
    }

    {
        // Running jobs finish on their own; the reader honours the cancel
        // flag, so this wait is short after a stop request.
        std::unique_lock<std::mutex> lock(m_resultMutex);
        m_resultCv.wait(lock, [this]() { return m_inFlight == 0; });
    }

    for (const auto& worker : m_workers) {
        worker->requestStop();
    }
    for (const auto& worker : m_workers) {
        worker->wakeForStop();
    }
    for (const auto& worker : m_workers) {
        worker->join();
    }
}

int ParseWorkerPool::workerCount() const { return static_cast<int>(m_workers.size()); }

void ParseWorkerPool::onJobComplete(int workerId, ParseResult result) {
    {
        std::lock_guard<std::mutex> lock(m_resultMutex);
        m_results.push_back(std::move(result));
        --m_inFlight;
    }
    m_resultCv.notify_all();

    if (workerId < 0 || workerId >= static_cast<int>(m_workers.size())) {
        std::cerr << "[scan][warn] invalid worker id in completion callback: " << workerId
                  << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(m_dispatchMutex);
    if (!m_stopping && !m_queuedJobs.empty()) {
        const ParseJob next = m_queuedJobs.front();
        m_queuedJobs.pop_front();
        m_workers[workerId]->assignJob(next);
        return;
    }
    m_idleWorkers.push_back(workerId);
}

}  // namespace keyclash
