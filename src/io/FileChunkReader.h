#pragma once

#include <QByteArray>
#include <QFile>
#include <QString>
#include <QtGlobal>
#include <optional>

namespace keyclash {

// Owns one read-only handle for the lifetime of a single parse.
class FileChunkReader {
public:
    explicit FileChunkReader(const QString& filePath);

    bool open();
    quint64 fileSize() const;
    QString errorString() const;

    std::optional<QByteArray> readChunk(quint64 offset, quint64 bytesToRead);

private:
    QFile m_file;
    quint64 m_fileSize = 0;
};

}  // namespace keyclash
