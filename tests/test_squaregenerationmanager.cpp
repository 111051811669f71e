#include <gtest/gtest.h>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include "squaregenerationmanager.h"
#include "testhelpers.h"

namespace {

Squares::GenerateSquaresSettings smallSettings() {
    Squares::GenerateSquaresSettings settings;
    settings.gridResolution = 2;
    settings.pixelSize = 1.0;
    settings.imageWidthPixels = 10;
    settings.imageHeightPixels = 10;
    settings.timeInterval = 0.1;
    settings.numberOfFrames = 100;
    settings.minTracksToCalculateTau = 3;
    return settings;
}

std::vector<Recording> makeRecordings(int count) {
    std::vector<Recording> recordings;
    for (int r = 0; r < count; ++r) {
        Recording recording(QString("rec%1").arg(r));
        for (int i = 0; i < 8; ++i) {
            recording.addTrack(TestHelpers::makeTrackAt(i, 1.0 + i, 1.0 + (i % 4) * 2.0, 0.1 * (1 + i % 4),
                                                          recording.getName()));
        }
        recordings.push_back(recording);
    }
    return recordings;
}

} // namespace

TEST(SquareGenerationManagerTest, ProcessesEveryRecording) {
    SquareGenerationManager manager;
    manager.setMaxWorkers(1);
    std::vector<Recording> recordings = makeRecordings(3);

    QStringList processed;
    int finishedProcessed = -1;
    QObject::connect(&manager, &SquareGenerationManager::recordingProcessed,
                     [&processed](const QString& name, const GenerationReport&) { processed << name; });
    QObject::connect(&manager, &SquareGenerationManager::generationFinished,
                     [&finishedProcessed](int count, int) { finishedProcessed = count; });

    const GenerationSummary summary = manager.generateSquares(recordings, smallSettings());

    EXPECT_EQ(summary.processed, 3);
    EXPECT_EQ(summary.failed, 0);
    EXPECT_FALSE(summary.cancelled);
    EXPECT_EQ(finishedProcessed, 3);
    EXPECT_EQ(processed.size(), 3);
    EXPECT_EQ(manager.getReports().size(), 3);
    EXPECT_FALSE(manager.isRunning());
    for (const Recording& recording : recordings) {
        EXPECT_EQ(recording.getSquares().size(), 4u);
    }
}

TEST(SquareGenerationManagerTest, InvalidSettingsFailEveryRecording) {
    SquareGenerationManager manager;
    std::vector<Recording> recordings = makeRecordings(2);
    Squares::GenerateSquaresSettings settings = smallSettings();
    settings.gridResolution = 0;

    int failures = 0;
    QObject::connect(&manager, &SquareGenerationManager::recordingFailed,
                     [&failures](const QString&, const QString&) { failures++; });

    const GenerationSummary summary = manager.generateSquares(recordings, settings);
    EXPECT_EQ(summary.processed, 0);
    EXPECT_EQ(summary.failed, 2);
    EXPECT_EQ(failures, 2);
    EXPECT_TRUE(recordings[0].getSquares().empty());
}

TEST(SquareGenerationManagerTest, BadRecordingDoesNotStopTheOthers) {
    SquareGenerationManager manager;
    std::vector<Recording> recordings = makeRecordings(3);
    recordings[1].setConcentration(0.0);
    manager.setMaxWorkers(1);

    QString failedName;
    QObject::connect(&manager, &SquareGenerationManager::recordingFailed,
                     [&failedName](const QString& name, const QString&) { failedName = name; });

    const GenerationSummary summary = manager.generateSquares(recordings, smallSettings());
    EXPECT_EQ(summary.processed, 2);
    EXPECT_EQ(summary.failed, 1);
    EXPECT_EQ(failedName, "rec1");
}

TEST(SquareGenerationManagerTest, CancelSkipsRemainingRecordings) {
    SquareGenerationManager manager;
    manager.setMaxWorkers(1);
    std::vector<Recording> recordings = makeRecordings(4);

    bool cancelledSignal = false;
    QObject::connect(&manager, &SquareGenerationManager::recordingProcessed, &manager,
                     [&manager](const QString&, const GenerationReport&) { manager.cancelGeneration(); },
                     Qt::DirectConnection);
    QObject::connect(&manager, &SquareGenerationManager::generationCancelled,
                     [&cancelledSignal]() { cancelledSignal = true; });

    const GenerationSummary summary = manager.generateSquares(recordings, smallSettings());
    EXPECT_TRUE(summary.cancelled);
    EXPECT_TRUE(cancelledSignal);
    EXPECT_EQ(summary.processed, 1);
    EXPECT_EQ(summary.skipped, 3);
}

TEST(SquareGenerationManagerTest, WritesOutputFiles) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString outputPath = QDir(dir.path()).absoluteFilePath("out");

    SquareGenerationManager manager;
    manager.setOutputDirectory(outputPath);
    std::vector<Recording> recordings = makeRecordings(2);

    const GenerationSummary summary = manager.generateSquares(recordings, smallSettings());
    ASSERT_EQ(summary.processed, 2);

    const QDir out(outputPath);
    EXPECT_TRUE(QFile::exists(out.absoluteFilePath("generate_squares_settings.json")));
    EXPECT_TRUE(QFile::exists(out.absoluteFilePath("rec0-squares.csv")));
    EXPECT_TRUE(QFile::exists(out.absoluteFilePath("rec0-tracks.csv")));
    EXPECT_TRUE(QFile::exists(out.absoluteFilePath("rec1-squares.csv")));
}
