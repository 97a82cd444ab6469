#pragma once

#include <QString>
#include <QStringList>
#include <QtGlobal>
#include <optional>

namespace keyclash {

struct ResourceTypeInfo {
    QString category;
    QString label;
};

// Static knowledge about resource type ids and well-known mod authors.
class ResourceCatalog {
public:
    static std::optional<ResourceTypeInfo> lookup(quint32 typeId);
    static bool isCriticalType(quint32 typeId);
    static bool isHighImpactType(quint32 typeId);
    static quint8 categoryRank(const QString& category);

    // Tags for every dictionary needle found in `path` (case-insensitive),
    // sorted and unique.
    static QStringList keywordTagsForPath(const QString& path);
};

}  // namespace keyclash
