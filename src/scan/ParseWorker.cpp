#include "scan/ParseWorker.h"

#include <utility>

namespace keyclash {

ParseWorker::ParseWorker(int workerId, ParseFunction parse, JobCompleteCallback onJobComplete)
    : m_workerId(workerId), m_parse(std::move(parse)), m_onJobComplete(std::move(onJobComplete)) {}

ParseWorker::~ParseWorker() {
    if (!m_thread.joinable()) {
        return;
    }
    requestStop();
    wakeForStop();
    join();
}

void ParseWorker::start() { m_thread = std::thread([this]() { runLoop(); }); }

void ParseWorker::join() {
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void ParseWorker::assignJob(const ParseJob& job) {
    {
        std::lock_guard<std::mutex> lock(m_jobMutex);
        m_pendingJob = job;
        m_hasPendingJob = true;
    }
    m_workProvided.release();
}

void ParseWorker::requestStop() { m_stopRequested.store(true, std::memory_order_release); }

void ParseWorker::wakeForStop() { m_workProvided.release(); }

void ParseWorker::runLoop() {
    for (;;) {
        m_workProvided.acquire();

        ParseJob job;
        bool hasJob = false;
        {
            std::lock_guard<std::mutex> lock(m_jobMutex);
            if (m_hasPendingJob) {
                job = m_pendingJob;
                m_hasPendingJob = false;
                hasJob = true;
            }
        }

        if (!hasJob) {
            if (m_stopRequested.load(std::memory_order_acquire)) {
                return;
            }
            continue;
        }

        ParseResult result;
        result.path = job.path;
        result.cacheKey = job.cacheKey;
        if (m_parse != nullptr) {
            result.read = m_parse(job.path);
        }

        if (m_onJobComplete != nullptr) {
            m_onJobComplete(m_workerId, std::move(result));
        }
    }
}

}  // namespace keyclash
