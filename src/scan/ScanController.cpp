#include "scan/ScanController.h"

#include <QFileInfo>

#include <utility>

namespace keyclash {

ScanController::ScanController(QObject* parent) : QObject(parent) {
    m_tickTimer.setInterval(100);
    connect(&m_tickTimer, &QTimer::timeout, this, &ScanController::onTick);
}

ScanController::~ScanController() {
    requestStop();
    joinScanThread();
}

void ScanController::startScan(const QString& root, const ScanOptions& options,
                               ScanOrchestrator::IndexReaderFunction reader) {
    if (m_running) {
        emit scanError(QStringLiteral("Scan already running"));
        return;
    }
    if (root.isEmpty() || !QFileInfo(root).isDir()) {
        emit scanError(QStringLiteral("Scan root is not a directory: %1").arg(root));
        return;
    }

    joinScanThread();
    m_report = ScanReport();
    m_pendingReport = ScanReport();
    m_processed.store(0, std::memory_order_release);
    m_total.store(0, std::memory_order_release);
    m_scanDone.store(false, std::memory_order_release);
    m_lastEmittedProcessed = -1;

    m_orchestrator = std::make_unique<ScanOrchestrator>(options, std::move(reader));
    ScanOrchestrator* orchestrator = m_orchestrator.get();
    m_scanThread = std::thread([this, orchestrator, root]() {
        m_pendingReport = orchestrator->run(root, [this](int processed, int total) {
            m_total.store(total, std::memory_order_release);
            m_processed.store(processed, std::memory_order_release);
        });
        m_scanDone.store(true, std::memory_order_release);
    });

    m_running = true;
    m_tickTimer.start();
    emit scanStarted(root);
}

void ScanController::requestStop() {
    if (!m_running || m_orchestrator == nullptr) {
        return;
    }
    m_orchestrator->requestStop();
}

bool ScanController::isRunning() const { return m_running; }

const ScanReport& ScanController::lastReport() const { return m_report; }

void ScanController::onTick() {
    if (!m_running) {
        return;
    }

    emitProgress();

    if (!m_scanDone.load(std::memory_order_acquire)) {
        return;
    }

    m_tickTimer.stop();
    joinScanThread();
    m_report = std::move(m_pendingReport);
    m_pendingReport = ScanReport();
    m_running = false;

    if (!m_report.stats.cancelled) {
        m_total.store(m_report.stats.filesTotal, std::memory_order_release);
        m_processed.store(m_report.stats.filesTotal, std::memory_order_release);
        emitProgress();
    }
    if (m_report.stats.enumerationFailed) {
        emit scanError(QStringLiteral("Could not enumerate containers"));
    }
    emit scanFinished(m_report.stats.cancelled);
}

void ScanController::joinScanThread() {
    if (m_scanThread.joinable()) {
        m_scanThread.join();
    }
}

void ScanController::emitProgress() {
    const int processed = m_processed.load(std::memory_order_acquire);
    if (processed == m_lastEmittedProcessed) {
        return;
    }
    m_lastEmittedProcessed = processed;
    emit progressUpdated(processed, m_total.load(std::memory_order_acquire));
}

}  // namespace keyclash
