#pragma once

#include <QObject>
#include <QString>
#include <QTimer>
#include <atomic>
#include <memory>
#include <thread>

#include "scan/ScanOrchestrator.h"
#include "scan/ScanTypes.h"

namespace keyclash {

// Runs one ScanOrchestrator at a time on a background thread and reports
// through signals on the thread that owns the controller.
class ScanController : public QObject {
    Q_OBJECT

public:
    explicit ScanController(QObject* parent = nullptr);
    ~ScanController() override;

    // `reader` replaces the default index reader (instrumentation, tests).
    void startScan(const QString& root, const ScanOptions& options,
                   ScanOrchestrator::IndexReaderFunction reader = {});
    void requestStop();
    bool isRunning() const;
    const ScanReport& lastReport() const;

signals:
    void scanStarted(const QString& root);
    void progressUpdated(int processedFiles, int totalFiles);
    void scanFinished(bool cancelled);
    void scanError(const QString& message);

private slots:
    void onTick();

private:
    void joinScanThread();
    void emitProgress();

    std::unique_ptr<ScanOrchestrator> m_orchestrator;
    std::thread m_scanThread;
    std::atomic<int> m_processed{0};
    std::atomic<int> m_total{0};
    std::atomic<bool> m_scanDone{false};
    int m_lastEmittedProcessed = -1;

    QTimer m_tickTimer;
    bool m_running = false;
    ScanReport m_report;
    ScanReport m_pendingReport;
};

}  // namespace keyclash
