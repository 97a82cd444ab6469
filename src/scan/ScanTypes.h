#pragma once

#include <QString>
#include <QVector>
#include <QtGlobal>

#include "cache/ParseCache.h"
#include "index/ResourceIndexReader.h"
#include "model/ConflictTypes.h"

namespace keyclash {

struct ScanOptions {
    bool recursive = true;
    bool fastMode = false;  // no tail fallback
    bool useInventorySnapshot = false;
    QString inventorySnapshotPath;
    QString cachePath;  // empty disables persistence
    int workerCount = 0;  // 0 = clamp(idealThreadCount, 2, 8)
    int sequentialThreshold = 4;
    int progressInterval = 5;
    QString containerSuffix = QStringLiteral(".package");
    QString companionScriptSuffix = QStringLiteral(".ts4script");
};

struct ScanStats {
    int filesTotal = 0;
    int filesParsedWithEntries = 0;
    qint64 totalEntriesFound = 0;
    double elapsedSeconds = 0.0;
    bool cancelled = false;

    int cacheHits = 0;
    int readerInvocations = 0;
    int invalidContainers = 0;
    int ioErrors = 0;
    int workerCount = 0;  // parse threads started; 0 when nothing ran pooled
    bool usedInventorySnapshot = false;
    bool cacheLoadFailed = false;
    bool cacheWriteFailed = false;
    bool enumerationFailed = false;
};

struct ScanReport {
    QVector<ConflictRecord> records;  // empty when cancelled
    ScanStats stats;
    ParseCache updatedCache;  // prior cache merged with this scan's fresh parses
};

struct ParseJob {
    QString path;
    QString cacheKey;  // empty when the file could not be stat'ed
};

struct ParseResult {
    QString path;
    QString cacheKey;
    bool fromCache = false;
    IndexReadResult read;
};

}  // namespace keyclash
