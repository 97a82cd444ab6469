#include "io/FileEnumerator.h"

#include <QDirIterator>
#include <QFileInfo>

#include <algorithm>

namespace keyclash {

QVector<QString> FileEnumerator::enumerateContainers(const QString& directoryPath,
                                                     const QString& suffix, bool recursive) {
    QVector<QString> files;
    if (!QFileInfo(directoryPath).isDir()) {
        return files;
    }

    const QDirIterator::IteratorFlags flags =
        recursive ? QDirIterator::Subdirectories : QDirIterator::NoIteratorFlags;
    QDirIterator it(directoryPath, QDir::Files | QDir::Readable, flags);
    while (it.hasNext()) {
        const QString path = it.next();
        if (suffix.isEmpty() || path.endsWith(suffix, Qt::CaseInsensitive)) {
            files.push_back(path);
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

}  // namespace keyclash
