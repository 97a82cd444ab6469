#pragma once

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "scan/ParseWorker.h"
#include "scan/ScanTypes.h"

namespace keyclash {

// Bounded set of parse threads plus a result channel. Jobs may be submitted
// and results taken from one thread only; workers never touch caller state.
class ParseWorkerPool {
public:
    ParseWorkerPool(int workerCount, ParseWorker::ParseFunction parse);
    ~ParseWorkerPool();

    ParseWorkerPool(const ParseWorkerPool&) = delete;
    ParseWorkerPool& operator=(const ParseWorkerPool&) = delete;

    void start();
    void submit(const ParseJob& job);

    // Blocks until a result is available. nullopt once nothing is queued,
    // running or waiting to be taken.
    std::optional<ParseResult> takeResult();

    // Drops jobs no worker has picked up yet; returns how many.
    int cancelQueued();

    // Cancels queued jobs, waits for running ones, joins every thread.
    void shutdown();

    int workerCount() const;

private:
    void onJobComplete(int workerId, ParseResult result);

    std::vector<std::unique_ptr<ParseWorker>> m_workers;

    std::mutex m_dispatchMutex;
    std::deque<int> m_idleWorkers;
    std::deque<ParseJob> m_queuedJobs;
    bool m_stopping = false;

    std::mutex m_resultMutex;
    std::condition_variable m_resultCv;
    std::deque<ParseResult> m_results;
    int m_inFlight = 0;

    bool m_started = false;
    bool m_joined = false;
};

}  // namespace keyclash
