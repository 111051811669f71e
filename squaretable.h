#ifndef SQUARETABLE_H
#define SQUARETABLE_H

#include <QString>
#include <QStringList>
#include "squarecommon.h"
#include "square.h"
#include "recording.h"

// Flat record layout of tracks and squares, as written to CSV.
namespace SquareTable {

    QStringList trackColumns();
    QStringList squareColumns();

    // "NaN" for undefined values, never 0 or an empty field
    QString formatValue(double value);

    // Recording name and number joined by '-', unique within an experiment
    QString uniqueKey(const QString& recordingName, int number);

    QStringList trackToRow(const Squares::Track& track);
    QStringList squareToRow(const QString& recordingName, const Square& square);

    /**
     * @brief Write one row per track of the recording
     * @return True if the file was written completely
     */
    bool writeTracksCsv(const Recording& recording, const QString& outputFilePath);

    /**
     * @brief Write one row per square of the recording
     * @return True if the file was written completely
     */
    bool writeSquaresCsv(const Recording& recording, const QString& outputFilePath);

} // namespace SquareTable

#endif // SQUARETABLE_H
