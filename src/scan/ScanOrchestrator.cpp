#include "scan/ScanOrchestrator.h"

#include <QDateTime>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QThread>

#include <algorithm>
#include <iostream>
#include <utility>

#include "io/FileEnumerator.h"
#include "io/InventorySnapshot.h"
#include "scan/ParseWorkerPool.h"

namespace keyclash {

namespace {
constexpr int kMinPoolWorkers = 2;
constexpr int kMaxPoolWorkers = 8;
}  // namespace

struct ScanOrchestrator::ScanState {
    explicit ScanState(const ScanOptions& options)
        : accumulator(options.companionScriptSuffix) {}

    ScanStats stats;
    ConflictAccumulator accumulator;
    ParseCache stagedEntries;
    ProgressCallback progress;
    QElapsedTimer timer;
    int processed = 0;
    int lastReported = -1;
    bool perFileProgress = true;
};

ScanOrchestrator::ScanOrchestrator(ScanOptions options, IndexReaderFunction reader)
    : m_options(std::move(options)), m_reader(std::move(reader)) {
    if (m_reader == nullptr) {
        m_reader = [](const QString& filePath, const IndexReadOptions& readOptions,
                      const std::atomic<bool>* cancelFlag) {
            return ResourceIndexReader::read(filePath, readOptions, cancelFlag);
        };
    }
}

ScanReport ScanOrchestrator::run(const QString& root, const ProgressCallback& progress) {
    ParseCacheLoadResult loaded = ParseCache::load(m_options.cachePath);
    if (loaded.corrupted) {
        std::cerr << "[scan][warn] parse cache unreadable, starting empty: path="
                  << m_options.cachePath.toStdString()
                  << " reason=" << loaded.errorMessage.toStdString() << std::endl;
    } else if (loaded.skippedEntries > 0) {
        std::cerr << "[scan][warn] parse cache skipped malformed entries: "
                  << loaded.skippedEntries << std::endl;
    }

    ScanReport report = runWithCache(root, loaded.cache, progress);
    report.stats.cacheLoadFailed = loaded.corrupted;
    return report;
}

ScanReport ScanOrchestrator::runWithCache(const QString& root, const ParseCache& priorCache,
                                          const ProgressCallback& progress) {
    ScanState state(m_options);
    state.timer.start();
    state.progress = progress;

    const QVector<QString> candidates = enumerateCandidates(root, state.stats);
    state.stats.filesTotal = candidates.size();
    const bool sequential = candidates.size() <= m_options.sequentialThreshold;
    state.perFileProgress = sequential;

    std::cerr << "[scan] started: root=" << root.toStdString() << " files=" << candidates.size()
              << " mode=" << (sequential ? "sequential" : "pooled")
              << " recursive=" << (m_options.recursive ? "true" : "false")
              << " inventory=" << (state.stats.usedInventorySnapshot ? "true" : "false")
              << " fast=" << (m_options.fastMode ? "true" : "false")
              << " cachedEntries=" << priorCache.size() << std::endl;

    QVector<ParseJob> jobs;
    jobs.reserve(candidates.size());
    for (const QString& path : candidates) {
        if (stopRequested()) {
            return finishCancelled(state);
        }

        ParseJob job;
        job.path = path;
        const auto statEntry = ParseCache::statEntry(job.path);
        if (statEntry.has_value()) {
            job.cacheKey = statEntry->cacheKey();
            auto cachedKeys = priorCache.lookup(job.cacheKey);
            if (cachedKeys.has_value()) {
                ParseResult cached;
                cached.path = job.path;
                cached.cacheKey = job.cacheKey;
                cached.fromCache = true;
                cached.read.keys = std::move(*cachedKeys);
                consumeResult(state, std::move(cached));
                continue;
            }
        }
        jobs.push_back(job);
    }

    if (sequential) {
        runSequential(state, jobs);
    } else {
        runPooled(state, jobs);
    }

    if (stopRequested()) {
        return finishCancelled(state);
    }
    return finishCompleted(state, priorCache);
}

void ScanOrchestrator::requestStop() { m_stopRequested.store(true, std::memory_order_release); }

bool ScanOrchestrator::stopRequested() const {
    return m_stopRequested.load(std::memory_order_acquire);
}

int ScanOrchestrator::resolvedWorkerCount(int candidateCount) const {
    int count = m_options.workerCount;
    if (count <= 0) {
        count = std::clamp(QThread::idealThreadCount(), kMinPoolWorkers, kMaxPoolWorkers);
    }
    return qMax(1, qMin(count, qMax(1, candidateCount)));
}

QVector<QString> ScanOrchestrator::enumerateCandidates(const QString& root, ScanStats& stats) const {
    if (!QFileInfo(root).isDir()) {
        std::cerr << "[scan][warn] scan root is not a directory: " << root.toStdString()
                  << std::endl;
        stats.enumerationFailed = true;
        return {};
    }

    if (m_options.useInventorySnapshot && !m_options.inventorySnapshotPath.isEmpty()) {
        const auto snapshot = InventorySnapshot::load(m_options.inventorySnapshotPath);
        if (!snapshot.has_value()) {
            std::cerr << "[scan][warn] inventory snapshot unreadable, walking tree: "
                      << m_options.inventorySnapshotPath.toStdString() << std::endl;
        } else if (!snapshot->isRootedAt(root)) {
            std::cerr << "[scan] inventory snapshot rooted elsewhere ("
                      << snapshot->root.toStdString() << "), walking tree" << std::endl;
        } else {
            const QVector<QString> listed = snapshot->containerPaths(root);
            if (!listed.isEmpty()) {
                stats.usedInventorySnapshot = true;
                return listed;
            }
        }
    }

    return FileEnumerator::enumerateContainers(root, m_options.containerSuffix,
                                               m_options.recursive);
}

void ScanOrchestrator::consumeResult(ScanState& state, ParseResult result) const {
    if (result.fromCache) {
        ++state.stats.cacheHits;
    } else {
        ++state.stats.readerInvocations;
        if (result.read.status == IndexReadStatus::InvalidContainer) {
            ++state.stats.invalidContainers;
        } else if (result.read.status == IndexReadStatus::IoError) {
            ++state.stats.ioErrors;
            std::cerr << "[scan][warn] read failed, file contributes no keys: "
                      << result.path.toStdString() << std::endl;
        }
        // I/O failures may be transient and cancelled reads are partial;
        // neither is worth remembering.
        const bool cacheable = !result.cacheKey.isEmpty() &&
                               result.read.status != IndexReadStatus::IoError &&
                               result.read.status != IndexReadStatus::Cancelled;
        if (cacheable) {
            state.stagedEntries.insert(result.cacheKey, result.read.keys);
        }
    }

    if (!result.read.keys.isEmpty()) {
        ++state.stats.filesParsedWithEntries;
        state.stats.totalEntriesFound += result.read.keys.size();
        state.accumulator.addFile(result.path, result.read.keys);
    }
    ++state.processed;
    reportProgress(state, state.perFileProgress);
}

void ScanOrchestrator::reportProgress(ScanState& state, bool force) const {
    if (state.progress == nullptr || state.processed == state.lastReported) {
        return;
    }
    const int interval = qMax(1, m_options.progressInterval);
    if (force || state.processed % interval == 0 || state.processed == state.stats.filesTotal) {
        state.lastReported = state.processed;
        state.progress(state.processed, state.stats.filesTotal);
    }
}

void ScanOrchestrator::runSequential(ScanState& state, const QVector<ParseJob>& jobs) const {
    for (const ParseJob& job : jobs) {
        if (stopRequested()) {
            return;
        }
        ParseResult result;
        result.path = job.path;
        result.cacheKey = job.cacheKey;
        result.read = invokeReader(job.path);
        consumeResult(state, std::move(result));
    }
}

void ScanOrchestrator::runPooled(ScanState& state, const QVector<ParseJob>& jobs) const {
    if (jobs.isEmpty()) {
        return;
    }

    ParseWorkerPool pool(resolvedWorkerCount(jobs.size()),
                         [this](const QString& filePath) { return invokeReader(filePath); });
    state.stats.workerCount = pool.workerCount();
    pool.start();
    for (const ParseJob& job : jobs) {
        if (stopRequested()) {
            break;
        }
        pool.submit(job);
    }

    while (!stopRequested()) {
        auto result = pool.takeResult();
        if (!result.has_value()) {
            break;
        }
        consumeResult(state, std::move(*result));
    }

    if (stopRequested()) {
        const int dropped = pool.cancelQueued();
        std::cerr << "[scan] stop requested: dropped queued jobs=" << dropped << std::endl;
    }
    pool.shutdown();
}

IndexReadResult ScanOrchestrator::invokeReader(const QString& filePath) const {
    IndexReadOptions readOptions;
    readOptions.allowTailFallback = !m_options.fastMode;
    return m_reader(filePath, readOptions, &m_stopRequested);
}

ScanReport ScanOrchestrator::finishCancelled(ScanState& state) const {
    ScanReport report;
    report.stats = state.stats;
    report.stats.cancelled = true;
    report.stats.elapsedSeconds = static_cast<double>(state.timer.nsecsElapsed()) / 1e9;
    state.accumulator.clear();
    std::cerr << "[scan] cancelled: processed=" << state.processed
              << " files=" << report.stats.filesTotal
              << " elapsed=" << report.stats.elapsedSeconds << "s" << std::endl;
    return report;
}

ScanReport ScanOrchestrator::finishCompleted(ScanState& state, const ParseCache& priorCache) const {
    ScanReport report;
    report.stats = state.stats;

    report.records = state.accumulator.takeConflicts();
    const QDateTime now = QDateTime::currentDateTime();
    for (ConflictRecord& record : report.records) {
        record.refreshMetadata(now);
    }
    std::sort(report.records.begin(), report.records.end(), conflictRecordLess);

    report.updatedCache = priorCache;
    report.updatedCache.merge(state.stagedEntries);
    if (!m_options.cachePath.isEmpty() && !state.stagedEntries.isEmpty()) {
        QString error;
        if (!report.updatedCache.save(m_options.cachePath, &error)) {
            report.stats.cacheWriteFailed = true;
            std::cerr << "[scan][warn] parse cache not saved: path="
                      << m_options.cachePath.toStdString() << " reason=" << error.toStdString()
                      << std::endl;
        }
    }

    report.stats.elapsedSeconds = static_cast<double>(state.timer.nsecsElapsed()) / 1e9;
    std::cerr << "[scan] finished: files=" << report.stats.filesTotal
              << " withEntries=" << report.stats.filesParsedWithEntries
              << " entries=" << report.stats.totalEntriesFound
              << " conflicts=" << report.records.size()
              << " cacheHits=" << report.stats.cacheHits
              << " parsed=" << report.stats.readerInvocations
              << " elapsed=" << report.stats.elapsedSeconds << "s" << std::endl;
    return report;
}

}  // namespace keyclash
