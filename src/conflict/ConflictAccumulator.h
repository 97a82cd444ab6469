#pragma once

#include <QHash>
#include <QSet>
#include <QString>
#include <QVector>

#include "model/ConflictTypes.h"
#include "model/ResourceKey.h"

namespace keyclash {

// Folds per-file key lists into key -> contributing files. Not thread-safe:
// only the orchestrating thread feeds it.
class ConflictAccumulator {
public:
    explicit ConflictAccumulator(QString companionScriptSuffix = QStringLiteral(".ts4script"));

    // Returns false when the file contributed nothing (no keys, already
    // added, or vanished before it could be stat'ed).
    bool addFile(const QString& filePath, const QVector<ResourceKey>& keys);

    // Keys shared by at least two files, one record each, files sorted by
    // path. Metadata is not refreshed here. Leaves the accumulator empty.
    QVector<ConflictRecord> takeConflicts();

    int distinctKeyCount() const;
    int contributingFileCount() const;
    void clear();

private:
    bool folderHasCompanionScript(const QString& folderPath);

    QString m_companionScriptSuffix;
    QHash<ResourceKey, QVector<ContributingFile>> m_filesByKey;
    QHash<QString, bool> m_companionByFolder;
    QSet<QString> m_addedPaths;
};

}  // namespace keyclash
