#include "report/ConflictReport.h"

#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <QSet>
#include <QStringList>

#include <algorithm>

namespace keyclash {

namespace {
QString formatDateTime(const QDateTime& value) {
    if (!value.isValid()) {
        return QString();
    }
    return value.toString(QStringLiteral("dd/MM/yyyy HH:mm"));
}

struct SuggestionEntry {
    QString folder;
    Severity severity = Severity::Low;
    QString category;
    ConflictPriority priority;
    QStringList keywords;
};

QJsonArray priorityToJson(const ConflictPriority& priority) {
    return QJsonArray{static_cast<int>(priority.severityRank),
                      static_cast<int>(priority.categoryRank),
                      static_cast<qint64>(priority.negFileCount)};
}
}  // namespace

QJsonObject ConflictReport::recordToJson(const ConflictRecord& record) {
    QJsonObject object;
    object.insert(QStringLiteral("type"), record.key.typeHex());
    object.insert(QStringLiteral("group"), record.key.groupHex());
    object.insert(QStringLiteral("instance"), record.key.instanceHex());
    object.insert(QStringLiteral("category"), record.category);
    object.insert(QStringLiteral("label"), record.label);
    object.insert(QStringLiteral("severity"), severityName(record.severity));
    object.insert(QStringLiteral("fileCount"), static_cast<qint64>(record.files.size()));
    object.insert(QStringLiteral("latestModified"),
                  record.latestModified.isValid()
                      ? record.latestModified.toString(Qt::ISODate)
                      : QString());
    object.insert(QStringLiteral("keywords"), QJsonArray::fromStringList(record.keywordTags));

    QJsonArray files;
    for (const ContributingFile& file : record.files) {
        QJsonObject fileObject;
        fileObject.insert(QStringLiteral("path"), file.path);
        fileObject.insert(QStringLiteral("modified"),
                          file.modified.isValid() ? file.modified.toString(Qt::ISODate) : QString());
        fileObject.insert(QStringLiteral("size"), static_cast<qint64>(file.size));
        fileObject.insert(QStringLiteral("companionScript"), file.hasCompanionScript);
        fileObject.insert(QStringLiteral("keywords"), QJsonArray::fromStringList(file.keywordTags));
        files.append(fileObject);
    }
    object.insert(QStringLiteral("files"), files);
    return object;
}

QJsonObject ConflictReport::statsToJson(const ScanStats& stats) {
    QJsonObject object;
    object.insert(QStringLiteral("filesTotal"), stats.filesTotal);
    object.insert(QStringLiteral("filesParsedWithEntries"), stats.filesParsedWithEntries);
    object.insert(QStringLiteral("totalEntriesFound"), stats.totalEntriesFound);
    object.insert(QStringLiteral("elapsedSeconds"), stats.elapsedSeconds);
    object.insert(QStringLiteral("cancelled"), stats.cancelled);
    object.insert(QStringLiteral("cacheHits"), stats.cacheHits);
    object.insert(QStringLiteral("readerInvocations"), stats.readerInvocations);
    object.insert(QStringLiteral("invalidContainers"), stats.invalidContainers);
    object.insert(QStringLiteral("ioErrors"), stats.ioErrors);
    object.insert(QStringLiteral("workerCount"), stats.workerCount);
    object.insert(QStringLiteral("usedInventorySnapshot"), stats.usedInventorySnapshot);
    object.insert(QStringLiteral("cacheLoadFailed"), stats.cacheLoadFailed);
    object.insert(QStringLiteral("cacheWriteFailed"), stats.cacheWriteFailed);
    object.insert(QStringLiteral("enumerationFailed"), stats.enumerationFailed);
    return object;
}

QByteArray ConflictReport::toJson(const ScanReport& report) {
    QJsonArray records;
    for (const ConflictRecord& record : report.records) {
        records.append(recordToJson(record));
    }
    QJsonObject root;
    root.insert(QStringLiteral("stats"), statsToJson(report.stats));
    root.insert(QStringLiteral("records"), records);
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

QString ConflictReport::formatRecordLine(const ConflictRecord& record) {
    const QString keywords = record.keywordTags.isEmpty()
                                 ? QString()
                                 : QStringLiteral("  keywords=%1").arg(record.keywordSummary());
    return QStringLiteral("[%1] %2  %3 / %4  files=%5  latest=%6%7")
        .arg(severityName(record.severity), record.key.toString(), record.category, record.label,
             QString::number(record.files.size()), formatDateTime(record.latestModified),
             keywords);
}

QString ConflictReport::formatStatsLine(const ScanStats& stats) {
    if (stats.cancelled) {
        return QStringLiteral("Scan cancelled after %1 s").arg(stats.elapsedSeconds, 0, 'f', 1);
    }
    return QStringLiteral("%1/%2 files with entries, %3 entries, %4 cache hits, %5 s")
        .arg(stats.filesParsedWithEntries)
        .arg(stats.filesTotal)
        .arg(stats.totalEntriesFound)
        .arg(stats.cacheHits)
        .arg(stats.elapsedSeconds, 0, 'f', 1);
}

QString ConflictReport::toText(const ScanReport& report) {
    QStringList lines;
    for (const ConflictRecord& record : report.records) {
        lines.push_back(formatRecordLine(record));
        for (const ContributingFile& file : record.files) {
            const QString script =
                file.hasCompanionScript ? QStringLiteral("  +script") : QString();
            const QString keywords =
                file.keywordTags.isEmpty()
                    ? QString()
                    : QStringLiteral("  [%1]").arg(file.keywordTags.join(QStringLiteral(", ")));
            lines.push_back(QStringLiteral("    %1  (%2)%3%4")
                                .arg(QFileInfo(file.path).fileName(), file.folder(), script,
                                     keywords));
        }
    }
    if (!report.stats.cancelled) {
        lines.push_back(QStringLiteral("%1 conflicting resources").arg(report.records.size()));
    }
    lines.push_back(formatStatsLine(report.stats));
    return lines.join(QLatin1Char('\n'));
}

QJsonObject ConflictReport::loadOrderSuggestion(const QVector<ConflictRecord>& records,
                                                const QString& modsRoot,
                                                const QDateTime& generatedAt) {
    QVector<SuggestionEntry> entries;
    QSet<QString> seenFolders;
    for (const ConflictRecord& record : records) {
        for (const ContributingFile& file : record.files) {
            const QString folder = file.folder();
            if (seenFolders.contains(folder)) {
                continue;
            }
            seenFolders.insert(folder);

            SuggestionEntry entry;
            entry.folder = folder;
            entry.severity = record.severity;
            entry.category = record.category;
            entry.priority = record.priority;
            entry.keywords = file.keywordTags;
            entry.keywords.sort();
            entries.push_back(entry);
        }
    }
    std::stable_sort(entries.begin(), entries.end(),
                     [](const SuggestionEntry& lhs, const SuggestionEntry& rhs) {
                         return lhs.priority < rhs.priority;
                     });

    QJsonArray entryArray;
    for (const SuggestionEntry& entry : entries) {
        QJsonObject object;
        object.insert(QStringLiteral("folder"), entry.folder);
        object.insert(QStringLiteral("severity"), severityName(entry.severity));
        object.insert(QStringLiteral("category"), entry.category);
        object.insert(QStringLiteral("priority"), priorityToJson(entry.priority));
        object.insert(QStringLiteral("keywords"), QJsonArray::fromStringList(entry.keywords));
        entryArray.append(object);
    }

    QJsonObject root;
    root.insert(QStringLiteral("generated_at"), generatedAt.toString(Qt::ISODate));
    root.insert(QStringLiteral("mods_root"), modsRoot);
    root.insert(QStringLiteral("entries"), entryArray);
    return root;
}

bool ConflictReport::saveLoadOrderSuggestion(const QVector<ConflictRecord>& records,
                                             const QString& modsRoot, const QString& filePath,
                                             QString* errorMessage) {
    const QFileInfo info(filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        if (errorMessage != nullptr) {
            *errorMessage = QStringLiteral("cannot create %1").arg(info.absolutePath());
        }
        return false;
    }

    const QByteArray bytes =
        QJsonDocument(loadOrderSuggestion(records, modsRoot)).toJson(QJsonDocument::Indented);
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorMessage != nullptr) {
            *errorMessage = file.errorString();
        }
        return false;
    }
    if (file.write(bytes) != bytes.size() || !file.commit()) {
        if (errorMessage != nullptr) {
            *errorMessage = file.errorString();
        }
        return false;
    }
    return true;
}

}  // namespace keyclash
