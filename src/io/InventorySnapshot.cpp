#include "io/InventorySnapshot.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include <algorithm>

namespace keyclash {

namespace {
QString normalizedRoot(const QString& path) {
    QString cleaned = QDir::cleanPath(QDir::fromNativeSeparators(path));
#if defined(Q_OS_WIN)
    cleaned = cleaned.toLower();
#endif
    return cleaned;
}
}  // namespace

std::optional<InventorySnapshot> InventorySnapshot::load(const QString& filePath) {
    QFile file(filePath);
    if (filePath.isEmpty() || !file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    return fromJsonBytes(file.readAll());
}

std::optional<InventorySnapshot> InventorySnapshot::fromJsonBytes(const QByteArray& bytes) {
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        return std::nullopt;
    }

    const QJsonObject object = document.object();
    InventorySnapshot snapshot;
    snapshot.root = object.value(QStringLiteral("root")).toString();
    if (snapshot.root.isEmpty()) {
        return std::nullopt;
    }

    const QJsonArray entries = object.value(QStringLiteral("entries")).toArray();
    snapshot.entries.reserve(entries.size());
    for (const QJsonValue& value : entries) {
        const QJsonObject raw = value.toObject();
        InventoryEntry entry;
        entry.path = raw.value(QStringLiteral("path")).toString();
        entry.mtime = static_cast<qint64>(raw.value(QStringLiteral("mtime")).toDouble());
        entry.size = static_cast<quint64>(qMax(0.0, raw.value(QStringLiteral("size")).toDouble()));
        entry.type = raw.value(QStringLiteral("type")).toString();
        if (entry.path.isEmpty()) {
            continue;
        }
        snapshot.entries.push_back(entry);
    }
    return snapshot;
}

bool InventorySnapshot::isRootedAt(const QString& directoryPath) const {
    if (root.isEmpty() || directoryPath.isEmpty()) {
        return false;
    }
    return normalizedRoot(root) == normalizedRoot(directoryPath);
}

QVector<QString> InventorySnapshot::containerPaths(const QString& directoryPath,
                                                   const QString& type) const {
    QVector<QString> paths;
    if (!isRootedAt(directoryPath)) {
        return paths;
    }

    const QDir base(directoryPath);
    for (const InventoryEntry& entry : entries) {
        if (entry.type.compare(type, Qt::CaseInsensitive) != 0) {
            continue;
        }
        const QString full = QDir::cleanPath(base.filePath(entry.path));
        if (QFileInfo(full).isFile()) {
            paths.push_back(full);
        }
    }
    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
    return paths;
}

}  // namespace keyclash
