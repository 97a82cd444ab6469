#pragma once

#include <QString>
#include <QVector>
#include <QtGlobal>
#include <optional>

namespace keyclash {

struct InventoryEntry {
    QString path;  // relative to the snapshot root
    qint64 mtime = 0;
    quint64 size = 0;
    QString type;
};

// A filesystem listing written by another tool, reused to skip a full walk.
struct InventorySnapshot {
    QString root;
    QVector<InventoryEntry> entries;

    static std::optional<InventorySnapshot> load(const QString& filePath);
    static std::optional<InventorySnapshot> fromJsonBytes(const QByteArray& bytes);

    bool isRootedAt(const QString& directoryPath) const;

    // Absolute paths of existing entries of `type` (case-insensitive),
    // sorted. Empty when the snapshot is rooted elsewhere.
    QVector<QString> containerPaths(const QString& directoryPath,
                                    const QString& type = QStringLiteral("package")) const;
};

}  // namespace keyclash
