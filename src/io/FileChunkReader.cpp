#include "io/FileChunkReader.h"

#include <limits>

namespace keyclash {

FileChunkReader::FileChunkReader(const QString& filePath) : m_file(filePath) {}

bool FileChunkReader::open() {
    if (m_file.fileName().isEmpty()) {
        return false;
    }
    if (!m_file.open(QIODevice::ReadOnly)) {
        return false;
    }
    m_fileSize = static_cast<quint64>(qMax<qint64>(0, m_file.size()));
    return true;
}

quint64 FileChunkReader::fileSize() const { return m_fileSize; }

QString FileChunkReader::errorString() const { return m_file.errorString(); }

std::optional<QByteArray> FileChunkReader::readChunk(quint64 offset, quint64 bytesToRead) {
    if (bytesToRead == 0) {
        return QByteArray();
    }
    if (!m_file.isOpen()) {
        return std::nullopt;
    }
    if (offset > static_cast<quint64>(std::numeric_limits<qint64>::max())) {
        return std::nullopt;
    }
    if (bytesToRead > static_cast<quint64>(std::numeric_limits<int>::max())) {
        return std::nullopt;
    }

    if (!m_file.seek(static_cast<qint64>(offset))) {
        return std::nullopt;
    }
    const QByteArray bytes = m_file.read(static_cast<qint64>(bytesToRead));
    if (bytes.isEmpty() && m_file.error() != QFileDevice::NoError) {
        return std::nullopt;
    }
    return bytes;
}

}  // namespace keyclash
