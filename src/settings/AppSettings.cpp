#include "settings/AppSettings.h"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace keyclash {

namespace {
constexpr const char* kOrg = "keyclash";
constexpr const char* kApp = "keyclash";
constexpr const char* kRecursiveKey = "scan/recursive";
constexpr const char* kFastModeKey = "scan/fastMode";
constexpr const char* kInventoryEnabledKey = "scan/useInventorySnapshot";
constexpr const char* kInventoryPathKey = "scan/inventorySnapshotPath";
constexpr const char* kParseCachePathKey = "cache/parseCachePath";
constexpr const char* kWorkerCountKey = "scan/workerCount";
}  // namespace

bool AppSettings::recursiveScanEnabled() {
    QSettings settings(kOrg, kApp);
    return settings.value(kRecursiveKey, true).toBool();
}

bool AppSettings::fastModeEnabled() {
    QSettings settings(kOrg, kApp);
    return settings.value(kFastModeKey, false).toBool();
}

bool AppSettings::inventorySnapshotEnabled() {
    QSettings settings(kOrg, kApp);
    return settings.value(kInventoryEnabledKey, false).toBool();
}

QString AppSettings::inventorySnapshotPath() {
    QSettings settings(kOrg, kApp);
    return settings.value(kInventoryPathKey, QString()).toString();
}

QString AppSettings::parseCachePath() {
    QSettings settings(kOrg, kApp);
    return settings.value(kParseCachePathKey, defaultParseCachePath()).toString();
}

int AppSettings::workerCount() {
    QSettings settings(kOrg, kApp);
    return settings.value(kWorkerCountKey, 0).toInt();
}

void AppSettings::setRecursiveScanEnabled(bool enabled) {
    QSettings settings(kOrg, kApp);
    settings.setValue(kRecursiveKey, enabled);
}

void AppSettings::setFastModeEnabled(bool enabled) {
    QSettings settings(kOrg, kApp);
    settings.setValue(kFastModeKey, enabled);
}

void AppSettings::setInventorySnapshotEnabled(bool enabled) {
    QSettings settings(kOrg, kApp);
    settings.setValue(kInventoryEnabledKey, enabled);
}

void AppSettings::setInventorySnapshotPath(const QString& path) {
    QSettings settings(kOrg, kApp);
    settings.setValue(kInventoryPathKey, path);
}

void AppSettings::setParseCachePath(const QString& path) {
    QSettings settings(kOrg, kApp);
    settings.setValue(kParseCachePathKey, path);
}

void AppSettings::setWorkerCount(int count) {
    QSettings settings(kOrg, kApp);
    settings.setValue(kWorkerCountKey, count);
}

QString AppSettings::defaultParseCachePath() {
    const QString base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QDir::home().filePath(QStringLiteral(".keyclash/id_index_cache.json"));
    }
    return QDir(base).filePath(QStringLiteral("id_index_cache.json"));
}

ScanOptions AppSettings::scanOptions() {
    ScanOptions options;
    options.recursive = recursiveScanEnabled();
    options.fastMode = fastModeEnabled();
    options.useInventorySnapshot = inventorySnapshotEnabled();
    options.inventorySnapshotPath = inventorySnapshotPath();
    options.cachePath = parseCachePath();
    options.workerCount = workerCount();
    return options;
}

void AppSettings::storeScanOptions(const ScanOptions& options) {
    setRecursiveScanEnabled(options.recursive);
    setFastModeEnabled(options.fastMode);
    setInventorySnapshotEnabled(options.useInventorySnapshot);
    setInventorySnapshotPath(options.inventorySnapshotPath);
    setParseCachePath(options.cachePath);
    setWorkerCount(options.workerCount);
}

}  // namespace keyclash
