#include "squaretable.h"
#include "debugutils.h"
#include <QFile>
#include <QTextStream>
#include <cmath>

namespace {

QString escapeField(const QString& field) {
    if (field.contains(',') || field.contains('"') || field.contains('\n')) {
        QString quoted = field;
        quoted.replace("\"", "\"\"");
        return "\"" + quoted + "\"";
    }
    return field;
}

QString formatBool(bool value) {
    return value ? "true" : "false";
}

void writeRow(QTextStream& out, const QStringList& row) {
    QStringList escaped;
    escaped.reserve(row.size());
    for (const QString& field : row) {
        escaped << escapeField(field);
    }
    out << escaped.join(',') << "\n";
}

} // namespace

namespace SquareTable {

QStringList trackColumns() {
    return {
        "Unique Key", "Recording Name", "Track Id", "Track Label",
        "Number of Spots", "Number of Gaps", "Longest Gap", "Track Duration",
        "Track X Location", "Track Y Location", "Track Displacement",
        "Track Max Speed", "Track Median Speed",
        "Diffusion Coefficient", "Diffusion Coefficient Ext",
        "Total Distance", "Confinement Ratio",
        "Square Number", "Label Number"
    };
}

QStringList squareColumns() {
    return {
        "Unique Key", "Recording Name", "Square Number", "Row Number", "Column Number",
        "Label Number", "Cell ID", "Selected", "Square Manually Excluded", "Image Excluded",
        "X0", "Y0", "X1", "Y1",
        "Number of Tracks", "Variability", "Density", "Density Ratio", "Tau", "R Squared",
        "Median Diffusion Coefficient", "Median Diffusion Coefficient Ext",
        "Median Long Track Duration", "Median Short Track Duration",
        "Median Displacement", "Max Displacement", "Total Displacement",
        "Median Max Speed", "Max Max Speed", "Median Median Speed", "Max Median Speed",
        "Max Track Duration", "Total Track Duration", "Median Track Duration"
    };
}

QString formatValue(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    return QString::number(value, 'g', 12);
}

QString uniqueKey(const QString& recordingName, int number) {
    return QString("%1-%2").arg(recordingName).arg(number);
}

QStringList trackToRow(const Squares::Track& track) {
    const Squares::TrackAttributes& a = track.attributes;
    return {
        uniqueKey(track.recordingName, track.trackId),
        track.recordingName,
        QString::number(track.trackId),
        track.trackLabel,
        QString::number(a.numberOfSpots),
        QString::number(a.numberOfGaps),
        QString::number(a.longestGap),
        formatValue(a.duration),
        formatValue(a.xLocation),
        formatValue(a.yLocation),
        formatValue(a.displacement),
        formatValue(a.maxSpeed),
        formatValue(a.medianSpeed),
        formatValue(a.diffusionCoefficient),
        formatValue(a.diffusionCoefficientExt),
        formatValue(a.totalDistance),
        formatValue(a.confinementRatio),
        QString::number(track.squareNumber),
        QString::number(track.labelNumber)
    };
}

QStringList squareToRow(const QString& recordingName, const Square& square) {
    const Squares::SquareStatistics& s = square.getStatistics();
    return {
        uniqueKey(recordingName, square.getSquareNumber()),
        recordingName,
        QString::number(square.getSquareNumber()),
        QString::number(square.getRow()),
        QString::number(square.getColumn()),
        QString::number(square.getLabelNumber()),
        QString::number(square.getCellId()),
        formatBool(square.isSelected()),
        formatBool(square.isManuallyExcluded()),
        formatBool(square.isImageExcluded()),
        formatValue(square.getX0()),
        formatValue(square.getY0()),
        formatValue(square.getX1()),
        formatValue(square.getY1()),
        QString::number(s.numberOfTracks),
        formatValue(s.variability),
        formatValue(s.density),
        formatValue(s.densityRatio),
        formatValue(s.tau),
        formatValue(s.rSquared),
        formatValue(s.medianDiffusionCoefficient),
        formatValue(s.medianDiffusionCoefficientExt),
        formatValue(s.medianLongTrackDuration),
        formatValue(s.medianShortTrackDuration),
        formatValue(s.medianDisplacement),
        formatValue(s.maxDisplacement),
        formatValue(s.totalDisplacement),
        formatValue(s.medianMaxSpeed),
        formatValue(s.maxMaxSpeed),
        formatValue(s.medianMedianSpeed),
        formatValue(s.maxMedianSpeed),
        formatValue(s.maxTrackDuration),
        formatValue(s.totalTrackDuration),
        formatValue(s.medianTrackDuration)
    };
}

bool writeTracksCsv(const Recording& recording, const QString& outputFilePath) {
    if (outputFilePath.isEmpty()) return false;
    QFile f(outputFilePath);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Truncate)) {
        qWarning() << "SquareTable: cannot open" << outputFilePath << "for writing";
        return false;
    }

    QTextStream out(&f);
    writeRow(out, trackColumns());
    for (const Squares::Track& track : recording.getTracks()) {
        writeRow(out, trackToRow(track));
    }
    out.flush();
    f.close();
    SQUARES_DEBUG() << "SquareTable: wrote" << recording.getTracks().size() << "tracks to" << outputFilePath;
    return f.error() == QFile::NoError;
}

bool writeSquaresCsv(const Recording& recording, const QString& outputFilePath) {
    if (outputFilePath.isEmpty()) return false;
    QFile f(outputFilePath);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Truncate)) {
        qWarning() << "SquareTable: cannot open" << outputFilePath << "for writing";
        return false;
    }

    QTextStream out(&f);
    writeRow(out, squareColumns());
    for (const Square& square : recording.getSquares()) {
        writeRow(out, squareToRow(recording.getName(), square));
    }
    out.flush();
    f.close();
    SQUARES_DEBUG() << "SquareTable: wrote" << recording.getSquares().size() << "squares to" << outputFilePath;
    return f.error() == QFile::NoError;
}

} // namespace SquareTable
