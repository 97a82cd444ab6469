#include "model/ConflictTypes.h"

#include <QFileInfo>

#include <algorithm>

#include "conflict/ConflictClassifier.h"

namespace keyclash {

QString severityName(Severity severity) {
    switch (severity) {
        case Severity::Critical:
            return QStringLiteral("Critical");
        case Severity::High:
            return QStringLiteral("High");
        case Severity::Moderate:
            return QStringLiteral("Moderate");
        case Severity::Low:
            return QStringLiteral("Low");
    }
    return QStringLiteral("Low");
}

QString ContributingFile::folder() const { return QFileInfo(path).path(); }

void ConflictRecord::refreshMetadata(const QDateTime& now) {
    latestModified = QDateTime();
    hasCompanionScript = false;
    QSet<QString> tags;
    for (const ContributingFile& file : files) {
        hasCompanionScript = hasCompanionScript || file.hasCompanionScript;
        if (file.modified.isValid() && file.modified.toSecsSinceEpoch() > 0 &&
            (!latestModified.isValid() || file.modified > latestModified)) {
            latestModified = file.modified;
        }
        for (const QString& tag : file.keywordTags) {
            tags.insert(tag);
        }
    }
    keywordTags = QStringList(tags.cbegin(), tags.cend());
    std::sort(keywordTags.begin(), keywordTags.end(), [](const QString& lhs, const QString& rhs) {
        return QString::compare(lhs, rhs, Qt::CaseInsensitive) < 0;
    });

    const Classification classification = ConflictClassifier::classify(*this, now);
    category = classification.category;
    label = classification.label;
    severity = classification.severity;
    priority = classification.priority;
}

QString ConflictRecord::keywordSummary() const { return keywordTags.join(QStringLiteral(", ")); }

bool conflictRecordLess(const ConflictRecord& lhs, const ConflictRecord& rhs) {
    if (!(lhs.priority == rhs.priority)) {
        return lhs.priority < rhs.priority;
    }
    return lhs.key < rhs.key;
}

}  // namespace keyclash
