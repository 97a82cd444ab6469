#include "cache/ParseCache.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSaveFile>

#include <limits>

namespace keyclash {

namespace {
constexpr const char* kKeysField = "keys";

std::optional<quint32> toU32(const QJsonValue& value) {
    if (!value.isDouble()) {
        return std::nullopt;
    }
    const qint64 raw = value.toInteger(-1);
    if (raw < 0 || raw > static_cast<qint64>(std::numeric_limits<quint32>::max())) {
        return std::nullopt;
    }
    return static_cast<quint32>(raw);
}

std::optional<quint64> toU64(const QJsonValue& value) {
    if (value.isString()) {
        bool ok = false;
        const quint64 parsed = value.toString().toULongLong(&ok, 10);
        if (!ok) {
            return std::nullopt;
        }
        return parsed;
    }
    if (value.isDouble()) {
        const qint64 raw = value.toInteger(-1);
        if (raw < 0) {
            return std::nullopt;
        }
        return static_cast<quint64>(raw);
    }
    return std::nullopt;
}

std::optional<QVector<ResourceKey>> parseKeys(const QJsonValue& entryValue) {
    if (!entryValue.isObject()) {
        return std::nullopt;
    }
    const QJsonValue keysValue = entryValue.toObject().value(QLatin1String(kKeysField));
    if (!keysValue.isArray()) {
        return std::nullopt;
    }

    QVector<ResourceKey> keys;
    const QJsonArray rawKeys = keysValue.toArray();
    keys.reserve(rawKeys.size());
    for (const QJsonValue& rawKey : rawKeys) {
        const QJsonArray triple = rawKey.toArray();
        if (triple.size() != 3) {
            return std::nullopt;
        }
        const auto type = toU32(triple.at(0));
        const auto group = toU32(triple.at(1));
        const auto instance = toU64(triple.at(2));
        if (!type.has_value() || !group.has_value() || !instance.has_value()) {
            return std::nullopt;
        }
        keys.push_back(ResourceKey(*type, *group, *instance));
    }
    return keys;
}
}  // namespace

QString ParseCacheEntry::cacheKey() const { return ParseCache::makeKey(path, size, mtime); }

QString ParseCache::makeKey(const QString& path, quint64 size, qint64 mtime) {
    return QStringLiteral("%1|%2|%3").arg(path).arg(size).arg(mtime);
}

std::optional<ParseCacheEntry> ParseCache::statEntry(const QString& path) {
    const QFileInfo info(path);
    if (!info.exists() || !info.isFile()) {
        return std::nullopt;
    }
    ParseCacheEntry entry;
    entry.path = path;
    entry.size = static_cast<quint64>(qMax<qint64>(0, info.size()));
    entry.mtime = info.lastModified().toSecsSinceEpoch();
    return entry;
}

std::optional<QVector<ResourceKey>> ParseCache::lookup(const QString& cacheKey) const {
    const auto it = m_entries.constFind(cacheKey);
    if (it == m_entries.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

void ParseCache::insert(const QString& cacheKey, const QVector<ResourceKey>& keys) {
    m_entries.insert(cacheKey, keys);
}

void ParseCache::merge(const ParseCache& other) {
    for (auto it = other.m_entries.cbegin(); it != other.m_entries.cend(); ++it) {
        m_entries.insert(it.key(), it.value());
    }
}

int ParseCache::size() const { return m_entries.size(); }

bool ParseCache::isEmpty() const { return m_entries.isEmpty(); }

void ParseCache::clear() { m_entries.clear(); }

QJsonObject ParseCache::toJson() const {
    QJsonObject root;
    for (auto it = m_entries.cbegin(); it != m_entries.cend(); ++it) {
        QJsonArray keys;
        for (const ResourceKey& key : it.value()) {
            keys.append(QJsonArray{static_cast<qint64>(key.typeId),
                                   static_cast<qint64>(key.groupId),
                                   QString::number(key.instanceId)});
        }
        QJsonObject entry;
        entry.insert(QLatin1String(kKeysField), keys);
        root.insert(it.key(), entry);
    }
    return root;
}

QByteArray ParseCache::toJsonBytes() const {
    return QJsonDocument(toJson()).toJson(QJsonDocument::Indented);
}

std::optional<ParseCache> ParseCache::fromJsonBytes(const QByteArray& bytes, int* skippedEntries) {
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        return std::nullopt;
    }

    ParseCache cache;
    int skipped = 0;
    const QJsonObject root = document.object();
    for (auto it = root.constBegin(); it != root.constEnd(); ++it) {
        auto keys = parseKeys(it.value());
        if (!keys.has_value()) {
            ++skipped;
            continue;
        }
        cache.m_entries.insert(it.key(), std::move(*keys));
    }
    if (skippedEntries != nullptr) {
        *skippedEntries = skipped;
    }
    return cache;
}

ParseCacheLoadResult ParseCache::load(const QString& filePath) {
    ParseCacheLoadResult result;
    if (filePath.isEmpty() || !QFileInfo::exists(filePath)) {
        return result;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        result.corrupted = true;
        result.errorMessage = file.errorString();
        return result;
    }

    auto parsed = fromJsonBytes(file.readAll(), &result.skippedEntries);
    if (!parsed.has_value()) {
        result.corrupted = true;
        result.errorMessage = QStringLiteral("malformed cache document");
        return result;
    }
    result.cache = std::move(*parsed);
    return result;
}

bool ParseCache::save(const QString& filePath, QString* errorMessage) const {
    if (filePath.isEmpty()) {
        if (errorMessage != nullptr) {
            *errorMessage = QStringLiteral("no cache path");
        }
        return false;
    }

    const QFileInfo info(filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        if (errorMessage != nullptr) {
            *errorMessage = QStringLiteral("cannot create %1").arg(info.absolutePath());
        }
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorMessage != nullptr) {
            *errorMessage = file.errorString();
        }
        return false;
    }
    const QByteArray bytes = toJsonBytes();
    if (file.write(bytes) != bytes.size() || !file.commit()) {
        if (errorMessage != nullptr) {
            *errorMessage = file.errorString();
        }
        return false;
    }
    return true;
}

}  // namespace keyclash
