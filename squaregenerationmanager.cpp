// squaregenerationmanager.cpp
#include "squaregenerationmanager.h"
#include "debugutils.h"
#include "squaresettings.h"
#include "squaretable.h"
#include <QDir>
#include <QMutexLocker>
#include <QRunnable>
#include <QThread>
#include <opencv2/core.hpp>

// Runs the generation of one recording on a pool thread
class RecordingWorker : public QRunnable {
public:
    RecordingWorker(SquareGenerationManager* manager, Recording* recording, const SquareGenerator* generator)
        : m_manager(manager), m_recording(recording), m_generator(generator) {
        setAutoDelete(true);
    }

    void run() override {
        m_manager->processRecording(*m_recording, *m_generator);
    }

private:
    SquareGenerationManager* m_manager;
    Recording* m_recording;
    const SquareGenerator* m_generator;
};


SquareGenerationManager::SquareGenerationManager(QObject* parent)
    : QObject(parent),
    m_cancelRequested(false),
    m_isRunning(false),
    m_totalRecordings(0),
    m_finishedRecordings(0),
    m_processedCount(0),
    m_failedCount(0),
    m_skippedCount(0)
{
    m_threadPool.setMaxThreadCount(qMax(1, QThread::idealThreadCount()));
    registerMetaTypes();
}

void SquareGenerationManager::registerMetaTypes()
{
    qRegisterMetaType<GenerationReport>("GenerationReport");
    SQUARES_DEBUG() << "SquareGenerationManager (" << this << ") created with" << m_threadPool.maxThreadCount() << "workers";
}

SquareGenerationManager::~SquareGenerationManager() {
    if (m_isRunning) {
        SQUARES_DEBUG() << "SquareGenerationManager Destructor: generation was running, requesting cancel.";
        cancelGeneration();
    }
    m_threadPool.waitForDone();
}

void SquareGenerationManager::setMaxWorkers(int workers) {
    const int ideal = qMax(1, QThread::idealThreadCount());
    m_threadPool.setMaxThreadCount(qBound(1, workers, ideal));
}

int SquareGenerationManager::getMaxWorkers() const {
    return m_threadPool.maxThreadCount();
}

void SquareGenerationManager::setOutputDirectory(const QString& directoryPath) {
    m_outputDirectory = directoryPath;
}

QString SquareGenerationManager::getOutputDirectory() const {
    return m_outputDirectory;
}

bool SquareGenerationManager::isRunning() const {
    return m_isRunning;
}

QList<GenerationReport> SquareGenerationManager::getReports() const {
    QMutexLocker locker(&m_dataMutex);
    return m_reports;
}

GenerationSummary SquareGenerationManager::generateSquares(std::vector<Recording>& recordings,
                                                           const Squares::GenerateSquaresSettings& settings) {
    GenerationSummary summary;
    if (m_isRunning.exchange(true)) {
        qWarning() << "SquareGenerationManager: Attempted to start generation while already running.";
        emit statusUpdate("Another square generation is already running.");
        return summary;
    }

    m_cancelRequested = false;
    {
        QMutexLocker locker(&m_dataMutex);
        m_reports.clear();
        m_totalRecordings = static_cast<int>(recordings.size());
        m_finishedRecordings = 0;
        m_processedCount = 0;
        m_failedCount = 0;
        m_skippedCount = 0;
    }

    try {
        SquareSettings::validate(settings);
    } catch (const Squares::InvalidConfiguration& e) {
        const QString reason = QString::fromStdString(e.what());
        qWarning() << "SquareGenerationManager: invalid settings:" << reason;
        for (const Recording& recording : recordings) {
            emit recordingFailed(recording.getName(), reason);
        }
        summary.failed = static_cast<int>(recordings.size());
        m_isRunning = false;
        emit generationFinished(0, summary.failed);
        return summary;
    }

    if (!m_outputDirectory.isEmpty()) {
        if (!QDir().mkpath(m_outputDirectory)) {
            qWarning() << "SquareGenerationManager: Failed to create output directory:" << m_outputDirectory;
        } else {
            SquareSettings::save(QDir(m_outputDirectory).absoluteFilePath("generate_squares_settings.json"), settings);
        }
    }

    emit statusUpdate(QString("Generating squares for %1 recordings").arg(static_cast<int>(recordings.size())));
    emit overallProgress(0);

    const SquareGenerator generator(settings);
    for (Recording& recording : recordings) {
        m_threadPool.start(new RecordingWorker(this, &recording, &generator));
    }
    m_threadPool.waitForDone();

    {
        QMutexLocker locker(&m_dataMutex);
        summary.processed = m_processedCount;
        summary.failed = m_failedCount;
        summary.skipped = m_skippedCount;
    }
    summary.cancelled = m_cancelRequested;
    m_isRunning = false;

    if (summary.cancelled) {
        emit statusUpdate(QString("Square generation cancelled after %1 recordings").arg(summary.processed));
        emit generationCancelled();
    } else {
        emit statusUpdate(QString("Square generation finished: %1 processed, %2 failed")
                              .arg(summary.processed).arg(summary.failed));
        emit generationFinished(summary.processed, summary.failed);
    }
    return summary;
}

void SquareGenerationManager::cancelGeneration() {
    SQUARES_DEBUG() << "SquareGenerationManager: cancel requested";
    m_cancelRequested = true;
}

void SquareGenerationManager::processRecording(Recording& recording, const SquareGenerator& generator) {
    if (m_cancelRequested) {
        QMutexLocker locker(&m_dataMutex);
        m_skippedCount++;
        m_finishedRecordings++;
        return;
    }

    QString failure;
    GenerationReport report;
    try {
        report = generator.generate(recording);
        if (!m_outputDirectory.isEmpty() && !writeOutput(recording)) {
            failure = "Failed to save CSV.";
        }
    } catch (const Squares::InvalidConfiguration& e) {
        failure = QString::fromStdString(e.what());
    } catch (const cv::Exception& e) {
        failure = QString("OpenCV error: %1").arg(QString::fromStdString(e.what()));
    } catch (const std::exception& e) {
        failure = QString::fromStdString(e.what());
    }

    {
        QMutexLocker locker(&m_dataMutex);
        m_finishedRecordings++;
        if (failure.isEmpty()) {
            m_processedCount++;
            m_reports.append(report);
        } else {
            m_failedCount++;
        }
    }

    if (failure.isEmpty()) {
        emit recordingProcessed(recording.getName(), report);
    } else {
        qWarning() << "SquareGenerationManager: recording" << recording.getName() << "failed:" << failure;
        emit recordingFailed(recording.getName(), failure);
    }
    updateOverallProgress();
}

bool SquareGenerationManager::writeOutput(const Recording& recording) {
    QDir outputDir(m_outputDirectory);
    const bool squaresOk = SquareTable::writeSquaresCsv(recording,
                                                        outputDir.absoluteFilePath(recording.getName() + "-squares.csv"));
    const bool tracksOk = SquareTable::writeTracksCsv(recording,
                                                      outputDir.absoluteFilePath(recording.getName() + "-tracks.csv"));
    return squaresOk && tracksOk;
}

void SquareGenerationManager::updateOverallProgress() {
    int percentage = 0;
    {
        QMutexLocker locker(&m_dataMutex);
        if (m_totalRecordings > 0) {
            percentage = (m_finishedRecordings * 100) / m_totalRecordings;
        }
    }
    emit overallProgress(percentage);
}
