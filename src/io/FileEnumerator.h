#pragma once

#include <QString>
#include <QVector>

namespace keyclash {

class FileEnumerator {
public:
    // Readable files under `directoryPath` whose name ends with `suffix`
    // (case-insensitive), sorted. An empty suffix matches every file.
    static QVector<QString> enumerateContainers(const QString& directoryPath, const QString& suffix,
                                                bool recursive);
};

}  // namespace keyclash
