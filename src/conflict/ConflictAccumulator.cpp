#include "conflict/ConflictAccumulator.h"

#include <QDir>
#include <QFileInfo>

#include <algorithm>
#include <utility>

#include "conflict/ResourceCatalog.h"
#include "debug/ScanTrace.h"

namespace keyclash {

ConflictAccumulator::ConflictAccumulator(QString companionScriptSuffix)
    : m_companionScriptSuffix(std::move(companionScriptSuffix)) {}

bool ConflictAccumulator::addFile(const QString& filePath, const QVector<ResourceKey>& keys) {
    if (keys.isEmpty() || filePath.isEmpty() || m_addedPaths.contains(filePath)) {
        return false;
    }

    const QFileInfo info(filePath);
    if (!info.exists() || !info.isFile()) {
        KEYCLASH_SCANTRACE_FILE("accumulate skipped, file vanished", filePath, QString());
        return false;
    }

    ContributingFile file;
    file.path = filePath;
    file.modified = info.lastModified();
    file.size = static_cast<quint64>(qMax<qint64>(0, info.size()));
    file.hasCompanionScript = folderHasCompanionScript(info.absolutePath());
    file.keywordTags = ResourceCatalog::keywordTagsForPath(filePath);
    m_addedPaths.insert(filePath);

    QSet<ResourceKey> seenInFile;
    seenInFile.reserve(keys.size());
    for (const ResourceKey& key : keys) {
        if (key.isNull() || seenInFile.contains(key)) {
            continue;
        }
        seenInFile.insert(key);
        m_filesByKey[key].push_back(file);
    }
    return !seenInFile.isEmpty();
}

QVector<ConflictRecord> ConflictAccumulator::takeConflicts() {
    QVector<ConflictRecord> records;
    for (auto it = m_filesByKey.begin(); it != m_filesByKey.end(); ++it) {
        if (it.value().size() < 2) {
            continue;
        }
        ConflictRecord record;
        record.key = it.key();
        record.files = std::move(it.value());
        std::sort(record.files.begin(), record.files.end(),
                  [](const ContributingFile& lhs, const ContributingFile& rhs) {
                      return lhs.path < rhs.path;
                  });
        records.push_back(std::move(record));
    }
    clear();
    return records;
}

int ConflictAccumulator::distinctKeyCount() const { return m_filesByKey.size(); }

int ConflictAccumulator::contributingFileCount() const { return m_addedPaths.size(); }

void ConflictAccumulator::clear() {
    m_filesByKey.clear();
    m_companionByFolder.clear();
    m_addedPaths.clear();
}

bool ConflictAccumulator::folderHasCompanionScript(const QString& folderPath) {
    const auto cached = m_companionByFolder.constFind(folderPath);
    if (cached != m_companionByFolder.constEnd()) {
        return cached.value();
    }

    bool found = false;
    if (!m_companionScriptSuffix.isEmpty()) {
        const QStringList names = QDir(folderPath).entryList(QDir::Files | QDir::NoDotAndDotDot);
        found = std::any_of(names.cbegin(), names.cend(), [this](const QString& name) {
            return name.endsWith(m_companionScriptSuffix, Qt::CaseInsensitive);
        });
    }
    m_companionByFolder.insert(folderPath, found);
    return found;
}

}  // namespace keyclash
