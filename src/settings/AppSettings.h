#pragma once

#include <QString>

#include "scan/ScanTypes.h"

namespace keyclash {

// Persisted defaults only. Scans receive a resolved ScanOptions value.
class AppSettings {
public:
    static bool recursiveScanEnabled();
    static bool fastModeEnabled();
    static bool inventorySnapshotEnabled();
    static QString inventorySnapshotPath();
    static QString parseCachePath();
    static int workerCount();
    static void setRecursiveScanEnabled(bool enabled);
    static void setFastModeEnabled(bool enabled);
    static void setInventorySnapshotEnabled(bool enabled);
    static void setInventorySnapshotPath(const QString& path);
    static void setParseCachePath(const QString& path);
    static void setWorkerCount(int count);

    static QString defaultParseCachePath();
    static ScanOptions scanOptions();
    static void storeScanOptions(const ScanOptions& options);
};

}  // namespace keyclash
