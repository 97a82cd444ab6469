#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QVector>

#include "scan/ScanTypes.h"

namespace keyclash {

class ConflictReport {
public:
    static QJsonObject recordToJson(const ConflictRecord& record);
    static QJsonObject statsToJson(const ScanStats& stats);
    static QByteArray toJson(const ScanReport& report);

    static QString formatRecordLine(const ConflictRecord& record);
    static QString formatStatsLine(const ScanStats& stats);
    static QString toText(const ScanReport& report);

    // One entry per contributing folder, first seen in record order, then
    // stably sorted by priority: {"generated_at", "mods_root", "entries"}.
    static QJsonObject loadOrderSuggestion(const QVector<ConflictRecord>& records,
                                           const QString& modsRoot,
                                           const QDateTime& generatedAt = QDateTime::currentDateTime());
    static bool saveLoadOrderSuggestion(const QVector<ConflictRecord>& records,
                                        const QString& modsRoot, const QString& filePath,
                                        QString* errorMessage = nullptr);
};

}  // namespace keyclash
