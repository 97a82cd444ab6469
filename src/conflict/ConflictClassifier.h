#pragma once

#include <QDateTime>

#include "model/ConflictTypes.h"

namespace keyclash {

class ConflictClassifier {
public:
    static constexpr qint64 kRecentChangeDays = 14;

    // Pure: depends only on the record's key and files, and on `now`.
    static Classification classify(const ConflictRecord& record, const QDateTime& now);
    static quint8 severityRank(Severity severity);
};

}  // namespace keyclash
