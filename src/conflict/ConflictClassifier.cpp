#include "conflict/ConflictClassifier.h"

#include <algorithm>

#include "conflict/ResourceCatalog.h"

namespace keyclash {

namespace {
Severity baseSeverity(const ConflictRecord& record, const QString& category) {
    const quint32 typeId = record.key.typeId;
    if (ResourceCatalog::isCriticalType(typeId) || category == QLatin1String("Gameplay")) {
        return Severity::Critical;
    }

    const bool anyCompanionScript =
        std::any_of(record.files.cbegin(), record.files.cend(),
                    [](const ContributingFile& file) { return file.hasCompanionScript; });
    if (anyCompanionScript || ResourceCatalog::isHighImpactType(typeId) ||
        record.files.size() >= 3) {
        return Severity::High;
    }

    if (category == QLatin1String("CAS") || category == QLatin1String("Texture")) {
        return Severity::Moderate;
    }
    return Severity::Low;
}

QDateTime latestModification(const QVector<ContributingFile>& files) {
    QDateTime latest;
    for (const ContributingFile& file : files) {
        if (!file.modified.isValid() || file.modified.toSecsSinceEpoch() <= 0) {
            continue;
        }
        if (!latest.isValid() || file.modified > latest) {
            latest = file.modified;
        }
    }
    return latest;
}
}  // namespace

Classification ConflictClassifier::classify(const ConflictRecord& record, const QDateTime& now) {
    Classification out;
    const auto info = ResourceCatalog::lookup(record.key.typeId);
    if (info.has_value()) {
        out.category = info->category;
        out.label = info->label;
    } else {
        out.category = QStringLiteral("Other");
        out.label = QStringLiteral("Unknown resource");
    }

    out.severity = baseSeverity(record, out.category);

    const QDateTime latest = latestModification(record.files);
    if (latest.isValid() && out.severity != Severity::Critical) {
        const qint64 ageDays = std::max<qint64>(0, latest.secsTo(now) / 86400);
        if (ageDays <= kRecentChangeDays) {
            out.severity = Severity::High;
        }
    }

    out.priority.severityRank = severityRank(out.severity);
    out.priority.categoryRank = ResourceCatalog::categoryRank(out.category);
    out.priority.negFileCount = -static_cast<qint64>(record.files.size());
    return out;
}

quint8 ConflictClassifier::severityRank(Severity severity) {
    return static_cast<quint8>(severity);
}

}  // namespace keyclash
