#pragma once

#include <chrono>
#include <iostream>
#include <mutex>

#include <QByteArray>
#include <QString>
#include <QThread>
#include <QtGlobal>

namespace keyclash::debug {

inline bool scanTraceEnabled() {
    static const bool enabled = []() {
        bool ok = false;
        const int asInt = qEnvironmentVariableIntValue("KEYCLASH_SCANTRACE", &ok);
        if (ok) {
            return asInt != 0;
        }
        if (!qEnvironmentVariableIsSet("KEYCLASH_SCANTRACE")) {
            return false;
        }

        const QByteArray raw = qgetenv("KEYCLASH_SCANTRACE").trimmed().toLower();
        if (raw.isEmpty()) {
            return true;
        }
        return !(raw == "0" || raw == "false" || raw == "off" || raw == "no");
    }();
    return enabled;
}

inline quint64 scanTraceElapsedUs() {
    static const auto kStart = std::chrono::steady_clock::now();
    const auto now = std::chrono::steady_clock::now();
    return static_cast<quint64>(
        std::chrono::duration_cast<std::chrono::microseconds>(now - kStart).count());
}

// Worker threads trace concurrently; one lock keeps lines whole.
inline std::mutex& scanTraceMutex() {
    static std::mutex mutex;
    return mutex;
}

// Trace goes to stderr; stdout carries the report.
inline void scanTraceLog(const QString& message) {
    if (!scanTraceEnabled()) {
        return;
    }
    const quintptr threadId = reinterpret_cast<quintptr>(QThread::currentThreadId());
    std::lock_guard<std::mutex> lock(scanTraceMutex());
    std::cerr << "[scantrace +" << scanTraceElapsedUs() << "us t=0x" << std::hex << threadId
              << std::dec << "] " << message.toStdString() << std::endl;
}

// Per-container event: "<event> file=<path> key=value ...".
inline void scanTraceFile(const char* event, const QString& filePath,
                          const QString& details = QString()) {
    QString line = QStringLiteral("%1 file=%2").arg(QLatin1String(event), filePath);
    if (!details.isEmpty()) {
        line += QLatin1Char(' ') + details;
    }
    scanTraceLog(line);
}

}  // namespace keyclash::debug

#define KEYCLASH_SCANTRACE_FILE(EVENT, PATH, DETAILS)                 \
    do {                                                              \
        if (::keyclash::debug::scanTraceEnabled()) {                  \
            ::keyclash::debug::scanTraceFile(EVENT, PATH, DETAILS);   \
        }                                                             \
    } while (0)
