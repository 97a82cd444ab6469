#pragma once

#include <QDateTime>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

#include "model/ResourceKey.h"

namespace keyclash {

enum class Severity {
    Critical = 0,
    High,
    Moderate,
    Low
};

QString severityName(Severity severity);

struct ContributingFile {
    QString path;
    QDateTime modified;
    quint64 size = 0;
    bool hasCompanionScript = false;
    QStringList keywordTags;  // sorted, unique

    QString folder() const;
};

struct ConflictPriority {
    quint8 severityRank = 3;
    quint8 categoryRank = 6;
    qint64 negFileCount = 0;

    friend bool operator<(const ConflictPriority& lhs, const ConflictPriority& rhs) {
        if (lhs.severityRank != rhs.severityRank) {
            return lhs.severityRank < rhs.severityRank;
        }
        if (lhs.categoryRank != rhs.categoryRank) {
            return lhs.categoryRank < rhs.categoryRank;
        }
        return lhs.negFileCount < rhs.negFileCount;
    }
    friend bool operator==(const ConflictPriority& lhs, const ConflictPriority& rhs) {
        return lhs.severityRank == rhs.severityRank && lhs.categoryRank == rhs.categoryRank &&
               lhs.negFileCount == rhs.negFileCount;
    }
};

struct Classification {
    QString category;
    QString label;
    Severity severity = Severity::Low;
    ConflictPriority priority;
};

struct ConflictRecord {
    ResourceKey key;
    QVector<ContributingFile> files;
    QString category = QStringLiteral("Other");
    QString label = QStringLiteral("Unknown resource");
    Severity severity = Severity::Low;
    ConflictPriority priority;
    QDateTime latestModified;
    bool hasCompanionScript = false;
    QStringList keywordTags;

    // Re-derives every field below `files` from the current file list.
    // Must be called again whenever `files` changes.
    void refreshMetadata(const QDateTime& now);
    QString keywordSummary() const;
};

// Most urgent first; key order breaks remaining ties so output is stable.
bool conflictRecordLess(const ConflictRecord& lhs, const ConflictRecord& rhs);

}  // namespace keyclash
