#pragma once

#include <QString>
#include <QVector>
#include <atomic>
#include <functional>

#include "cache/ParseCache.h"
#include "conflict/ConflictAccumulator.h"
#include "scan/ScanTypes.h"

namespace keyclash {

class ScanOrchestrator {
public:
    using IndexReaderFunction = std::function<IndexReadResult(
        const QString& filePath, const IndexReadOptions& options,
        const std::atomic<bool>* cancelFlag)>;
    // Called on the orchestrating thread with a non-decreasing count.
    using ProgressCallback = std::function<void(int processed, int total)>;

    explicit ScanOrchestrator(ScanOptions options, IndexReaderFunction reader = {});

    // Loads the parse cache from `options.cachePath`, then scans.
    ScanReport run(const QString& root, const ProgressCallback& progress = {});
    // Scans against an already-loaded cache snapshot.
    ScanReport runWithCache(const QString& root, const ParseCache& priorCache,
                            const ProgressCallback& progress = {});

    // Safe from any thread, including before run() starts. A stopped scan
    // returns no records. The request is never cleared: an orchestrator
    // runs at most one scan to completion.
    void requestStop();
    bool stopRequested() const;

    int resolvedWorkerCount(int candidateCount) const;

    // Candidate containers for `root`, from the inventory snapshot when it
    // is enabled and rooted at `root`, otherwise from a directory walk.
    QVector<QString> enumerateCandidates(const QString& root, ScanStats& stats) const;

private:
    struct ScanState;

    void consumeResult(ScanState& state, ParseResult result) const;
    void reportProgress(ScanState& state, bool force) const;
    ScanReport finishCancelled(ScanState& state) const;
    ScanReport finishCompleted(ScanState& state, const ParseCache& priorCache) const;
    void runSequential(ScanState& state, const QVector<ParseJob>& jobs) const;
    void runPooled(ScanState& state, const QVector<ParseJob>& jobs) const;
    IndexReadResult invokeReader(const QString& filePath) const;

    ScanOptions m_options;
    IndexReaderFunction m_reader;
    std::atomic<bool> m_stopRequested{false};
};

}  // namespace keyclash
