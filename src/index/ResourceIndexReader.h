#pragma once

#include <QByteArray>
#include <QString>
#include <QVector>
#include <QtGlobal>
#include <array>
#include <atomic>

#include "model/ResourceKey.h"

namespace keyclash {

enum class IndexReadStatus {
    Ok = 0,
    InvalidContainer,
    OutOfRangeIndex,
    IoError,
    Cancelled
};

struct IndexReadOptions {
    bool allowTailFallback = true;
};

struct IndexReadResult {
    QVector<ResourceKey> keys;
    IndexReadStatus status = IndexReadStatus::Ok;
    int tableWidth = 0;  // 0 when no index table row was usable
    bool usedTailFallback = false;
};

// Recovers the resource keys a DBPF-style container defines. Record widths
// drift between producing tools, so the index table layout is guessed and a
// trailer scan backs up a broken header. Never throws.
class ResourceIndexReader {
public:
    static constexpr int kHeaderSize = 96;
    static constexpr quint64 kTailWindowBytes = 8ULL * 1024ULL * 1024ULL;
    static constexpr int kTailRecordSize = 24;
    static constexpr int kKeyBytes = 16;
    static constexpr std::array<int, 6> kCandidateWidths{16, 24, 28, 32, 36, 40};

    static IndexReadResult read(const QString& filePath, const IndexReadOptions& options,
                                const std::atomic<bool>* cancelFlag = nullptr);
    static QVector<ResourceKey> readKeys(const QString& filePath, const IndexReadOptions& options,
                                         const std::atomic<bool>* cancelFlag = nullptr);

    // Scores every candidate width by its non-zero row count and returns the
    // rows of the best one; the earliest width wins ties. A zero count hint
    // means "as many rows as fit".
    static QVector<ResourceKey> parseIndexTable(const QByteArray& table, quint32 countHint,
                                                const std::atomic<bool>* cancelFlag = nullptr,
                                                int* chosenWidth = nullptr);

    // Looks for 24-byte (key, payload offset, payload size) records at every
    // 4-byte step of `window` whose payload lies inside the file.
    static QVector<ResourceKey> scanTailWindow(const QByteArray& window, quint64 fileSize,
                                               const std::atomic<bool>* cancelFlag = nullptr);
};

QString indexReadStatusName(IndexReadStatus status);

}  // namespace keyclash
