// squaregenerationmanager.h
#ifndef SQUAREGENERATIONMANAGER_H
#define SQUAREGENERATIONMANAGER_H

#include <QObject>
#include <QList>
#include <QString>
#include <QMutex>
#include <QThreadPool>
#include <QMetaType>
#include <atomic>
#include <vector>

#include "squarecommon.h"
#include "recording.h"
#include "squaregenerator.h"

Q_DECLARE_METATYPE(GenerationReport)

/**
 * @brief Totals of one generateSquares() call.
 */
struct GenerationSummary {
    int processed = 0;
    int failed = 0;
    int skipped = 0;        // Not started because of cancellation
    bool cancelled = false;
};

/**
 * @brief Generates the squares of many recordings on a bounded worker pool.
 *
 * Each worker owns one recording for the duration of its run. Cancellation is
 * checked before a recording starts; a recording that is already running
 * finishes normally. Signals are emitted from the worker threads.
 */
class SquareGenerationManager : public QObject {
    Q_OBJECT

public:
    explicit SquareGenerationManager(QObject* parent = nullptr);
    ~SquareGenerationManager();

    // Number of recordings processed in parallel, at most QThread::idealThreadCount()
    void setMaxWorkers(int workers);
    int getMaxWorkers() const;

    /**
     * @brief Directory for the per-recording CSV files and the settings JSON.
     * Nothing is written while it is empty.
     */
    void setOutputDirectory(const QString& directoryPath);
    QString getOutputDirectory() const;

    bool isRunning() const;
    QList<GenerationReport> getReports() const;

    /**
     * @brief Generate squares for every recording and wait until all are done.
     * @param recordings Recordings to process; each is updated in place.
     * @param settings Settings shared by all recordings.
     * @return Totals of the run. Invalid settings fail every recording.
     */
    GenerationSummary generateSquares(std::vector<Recording>& recordings,
                                      const Squares::GenerateSquaresSettings& settings);

public slots:
    void cancelGeneration();

signals:
    void overallProgress(int percentage);
    void statusUpdate(const QString& statusMessage);
    void recordingProcessed(const QString& recordingName, const GenerationReport& report);
    void recordingFailed(const QString& recordingName, const QString& reason);
    void generationFinished(int processed, int failed);
    void generationCancelled();

private:
    friend class RecordingWorker;

    void processRecording(Recording& recording, const SquareGenerator& generator);
    bool writeOutput(const Recording& recording);
    void updateOverallProgress();
    void registerMetaTypes();

    QThreadPool m_threadPool;
    QString m_outputDirectory;
    std::atomic<bool> m_cancelRequested;
    std::atomic<bool> m_isRunning;

    // Protected by m_dataMutex
    mutable QMutex m_dataMutex;
    QList<GenerationReport> m_reports;
    int m_totalRecordings;
    int m_finishedRecordings;
    int m_processedCount;
    int m_failedCount;
    int m_skippedCount;
};

#endif // SQUAREGENERATIONMANAGER_H
