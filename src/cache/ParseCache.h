#pragma once

#include <QByteArray>
#include <QHash>
#include <QJsonObject>
#include <QString>
#include <QVector>
#include <QtGlobal>
#include <optional>

#include "model/ResourceKey.h"

namespace keyclash {

struct ParseCacheEntry {
    QString path;
    quint64 size = 0;
    qint64 mtime = 0;  // whole seconds since epoch

    QString cacheKey() const;
};

struct ParseCacheLoadResult;

// Stat-keyed memo of reader output, persisted as a JSON object mapping
// "path|size|mtime" to {"keys": [[type, group, "instance"], ...]}.
class ParseCache {
public:
    static QString makeKey(const QString& path, quint64 size, qint64 mtime);
    // Stats `path` now; nullopt when it cannot be stat'ed.
    static std::optional<ParseCacheEntry> statEntry(const QString& path);

    std::optional<QVector<ResourceKey>> lookup(const QString& cacheKey) const;
    void insert(const QString& cacheKey, const QVector<ResourceKey>& keys);
    void merge(const ParseCache& other);
    int size() const;
    bool isEmpty() const;
    void clear();

    QJsonObject toJson() const;
    QByteArray toJsonBytes() const;

    // Malformed documents yield nullopt; malformed entries are skipped.
    static std::optional<ParseCache> fromJsonBytes(const QByteArray& bytes,
                                                   int* skippedEntries = nullptr);

    // Missing file is an empty cache; unreadable or malformed content is an
    // empty cache with `corrupted` set.
    static ParseCacheLoadResult load(const QString& filePath);
    // Atomic replace. Returns false and fills `errorMessage` on failure.
    bool save(const QString& filePath, QString* errorMessage = nullptr) const;

private:
    QHash<QString, QVector<ResourceKey>> m_entries;
};

struct ParseCacheLoadResult {
    ParseCache cache;
    bool corrupted = false;
    int skippedEntries = 0;
    QString errorMessage;
};

}  // namespace keyclash
