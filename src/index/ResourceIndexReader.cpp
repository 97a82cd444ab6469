#include "index/ResourceIndexReader.h"

#include <QSet>
#include <QtEndian>

#include <algorithm>

#include "debug/ScanTrace.h"
#include "io/FileChunkReader.h"

namespace keyclash {

namespace {
constexpr char kMagic[4] = {'D', 'B', 'P', 'F'};

struct IndexLayout {
    int countOffset;
    int tableOffsetOffset;
    int tableSizeOffset;
};

constexpr IndexLayout kPrimaryLayout{36, 40, 44};
constexpr IndexLayout kLegacyLayout{32, 48, 52};

struct IndexLocation {
    quint32 count = 0;
    quint64 offset = 0;
    quint64 size = 0;
};

quint32 readLeU32(const QByteArray& bytes, qsizetype offset) {
    if (offset < 0 || offset + 4 > bytes.size()) {
        return 0;
    }
    return qFromLittleEndian<quint32>(bytes.constData() + offset);
}

ResourceKey decodeKey(const QByteArray& bytes, qsizetype offset) {
    const quint32 type = readLeU32(bytes, offset);
    const quint32 group = readLeU32(bytes, offset + 4);
    const quint64 instanceHi = readLeU32(bytes, offset + 8);
    const quint64 instanceLo = readLeU32(bytes, offset + 12);
    return ResourceKey(type, group, (instanceHi << 32) | instanceLo);
}

bool isCancelled(const std::atomic<bool>* cancelFlag) {
    return cancelFlag != nullptr && cancelFlag->load(std::memory_order_acquire);
}

IndexLocation readLocation(const QByteArray& header, const IndexLayout& layout) {
    IndexLocation location;
    location.count = readLeU32(header, layout.countOffset);
    location.offset = readLeU32(header, layout.tableOffsetOffset);
    location.size = readLeU32(header, layout.tableSizeOffset);
    return location;
}

IndexLocation resolveLocation(const QByteArray& header, quint64 fileSize) {
    IndexLocation location = readLocation(header, kPrimaryLayout);
    if (location.offset + location.size > fileSize || location.size == 0) {
        location = readLocation(header, kLegacyLayout);
    }
    if (location.offset == 0 || location.offset > fileSize) {
        location.offset = 0;
        location.size = 0;
    }
    return location;
}

IndexReadResult readContainer(const QString& filePath, const IndexReadOptions& options,
                              const std::atomic<bool>* cancelFlag) {
    IndexReadResult result;
    if (isCancelled(cancelFlag)) {
        result.status = IndexReadStatus::Cancelled;
        return result;
    }

    FileChunkReader reader(filePath);
    if (!reader.open()) {
        result.status = IndexReadStatus::IoError;
        return result;
    }

    const quint64 fileSize = reader.fileSize();
    const auto header = reader.readChunk(0, ResourceIndexReader::kHeaderSize);
    if (!header.has_value()) {
        result.status = IndexReadStatus::IoError;
        return result;
    }
    if (header->size() < ResourceIndexReader::kHeaderSize || !header->startsWith(QByteArrayView(kMagic, 4))) {
        result.status = IndexReadStatus::InvalidContainer;
        return result;
    }

    const IndexLocation location = resolveLocation(*header, fileSize);
    QByteArray table;
    bool tableReadFailed = false;
    if (location.offset > 0 && location.size > 0) {
        const quint64 available = std::min(location.size, fileSize - location.offset);
        const auto chunk = reader.readChunk(location.offset, available);
        if (chunk.has_value()) {
            table = *chunk;
        } else {
            tableReadFailed = true;
        }
    }

    result.keys = ResourceIndexReader::parseIndexTable(table, location.count, cancelFlag,
                                                       &result.tableWidth);
    if (isCancelled(cancelFlag)) {
        result.status = IndexReadStatus::Cancelled;
        return result;
    }
    if (!result.keys.isEmpty()) {
        return result;
    }

    result.status = tableReadFailed ? IndexReadStatus::IoError : IndexReadStatus::OutOfRangeIndex;
    if (!options.allowTailFallback || fileSize == 0) {
        return result;
    }

    const quint64 windowSize = std::min(ResourceIndexReader::kTailWindowBytes, fileSize);
    const auto window = reader.readChunk(fileSize - windowSize, windowSize);
    if (!window.has_value()) {
        result.status = IndexReadStatus::IoError;
        return result;
    }

    result.usedTailFallback = true;
    result.keys = ResourceIndexReader::scanTailWindow(*window, fileSize, cancelFlag);
    if (isCancelled(cancelFlag)) {
        result.status = IndexReadStatus::Cancelled;
    } else if (!result.keys.isEmpty()) {
        result.status = IndexReadStatus::Ok;
    }
    return result;
}
}  // namespace

IndexReadResult ResourceIndexReader::read(const QString& filePath, const IndexReadOptions& options,
                                          const std::atomic<bool>* cancelFlag) {
    IndexReadResult result = readContainer(filePath, options, cancelFlag);
    KEYCLASH_SCANTRACE_FILE("read", filePath,
                            QStringLiteral("status=%1 keys=%2 width=%3 tail=%4")
                                .arg(indexReadStatusName(result.status))
                                .arg(result.keys.size())
                                .arg(result.tableWidth)
                                .arg(result.usedTailFallback ? 1 : 0));
    return result;
}

QVector<ResourceKey> ResourceIndexReader::readKeys(const QString& filePath,
                                                   const IndexReadOptions& options,
                                                   const std::atomic<bool>* cancelFlag) {
    return read(filePath, options, cancelFlag).keys;
}

QVector<ResourceKey> ResourceIndexReader::parseIndexTable(const QByteArray& table,
                                                          quint32 countHint,
                                                          const std::atomic<bool>* cancelFlag,
                                                          int* chosenWidth) {
    QVector<ResourceKey> best;
    int bestWidth = 0;

    for (const int width : kCandidateWidths) {
        if (isCancelled(cancelFlag)) {
            break;
        }

        qsizetype rows = table.size() / width;
        if (countHint > 0) {
            rows = std::min<qsizetype>(rows, static_cast<qsizetype>(countHint));
        }
        if (rows <= 0) {
            continue;
        }

        QVector<ResourceKey> candidate;
        candidate.reserve(rows);
        for (qsizetype row = 0; row < rows; ++row) {
            if ((row & 0xFFF) == 0 && isCancelled(cancelFlag)) {
                break;
            }
            const qsizetype base = row * width;
            if (base + kKeyBytes > table.size()) {
                break;
            }
            const ResourceKey key = decodeKey(table, base);
            if (key.isNull()) {
                continue;
            }
            candidate.push_back(key);
        }

        if (candidate.size() > best.size()) {
            best = std::move(candidate);
            bestWidth = width;
        }
    }

    if (chosenWidth != nullptr) {
        *chosenWidth = bestWidth;
    }
    return best;
}

QVector<ResourceKey> ResourceIndexReader::scanTailWindow(const QByteArray& window, quint64 fileSize,
                                                         const std::atomic<bool>* cancelFlag) {
    QVector<ResourceKey> unique;
    QSet<ResourceKey> seen;

    for (qsizetype pos = 0; pos + kTailRecordSize <= window.size(); pos += 4) {
        if ((pos & 0xFFFF) == 0 && isCancelled(cancelFlag)) {
            break;
        }
        const ResourceKey key = decodeKey(window, pos);
        if (key.isNull()) {
            continue;
        }
        const quint64 payloadOffset = readLeU32(window, pos + 16);
        const quint64 payloadSize = readLeU32(window, pos + 20);
        if (payloadSize == 0 || payloadOffset >= fileSize) {
            continue;
        }
        if (payloadOffset + payloadSize > fileSize) {
            continue;
        }
        if (seen.contains(key)) {
            continue;
        }
        seen.insert(key);
        unique.push_back(key);
    }
    return unique;
}

QString indexReadStatusName(IndexReadStatus status) {
    switch (status) {
        case IndexReadStatus::Ok:
            return QStringLiteral("ok");
        case IndexReadStatus::InvalidContainer:
            return QStringLiteral("invalid-container");
        case IndexReadStatus::OutOfRangeIndex:
            return QStringLiteral("out-of-range-index");
        case IndexReadStatus::IoError:
            return QStringLiteral("io-error");
        case IndexReadStatus::Cancelled:
            return QStringLiteral("cancelled");
    }
    return QStringLiteral("unknown");
}

}  // namespace keyclash
