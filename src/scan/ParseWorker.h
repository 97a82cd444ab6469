#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <semaphore>
#include <thread>

#include "scan/ScanTypes.h"

namespace keyclash {

class ParseWorker {
public:
    using ParseFunction = std::function<IndexReadResult(const QString& filePath)>;
    using JobCompleteCallback = std::function<void(int workerId, ParseResult result)>;

    ParseWorker(int workerId, ParseFunction parse, JobCompleteCallback onJobComplete);

    ~ParseWorker();

    void start();
    void join();
    void assignJob(const ParseJob& job);
    void requestStop();
    void wakeForStop();

private:
    void runLoop();

    int m_workerId = 0;
    std::atomic<bool> m_stopRequested{false};
    ParseFunction m_parse;
    JobCompleteCallback m_onJobComplete;

    std::binary_semaphore m_workProvided{0};
    mutable std::mutex m_jobMutex;
    ParseJob m_pendingJob;
    bool m_hasPendingJob = false;
    std::thread m_thread;
};

}  // namespace keyclash
