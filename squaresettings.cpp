#include "squaresettings.h"
#include "debugutils.h"
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QDebug>
#include <QtMath>
#include <cmath>

namespace {

bool readInt(const QJsonObject& obj, const char* key, int& target, QString* errorMessage) {
    if (!obj.contains(key)) return true;
    const QJsonValue value = obj.value(key);
    if (!value.isDouble()) {
        if (errorMessage) *errorMessage = QString("%1 must be a number").arg(key);
        return false;
    }
    target = value.toInt();
    return true;
}

bool readDouble(const QJsonObject& obj, const char* key, double& target, QString* errorMessage) {
    if (!obj.contains(key)) return true;
    const QJsonValue value = obj.value(key);
    if (!value.isDouble()) {
        if (errorMessage) *errorMessage = QString("%1 must be a number").arg(key);
        return false;
    }
    target = value.toDouble();
    return true;
}

bool sameDouble(double a, double b) {
    return qAbs(a - b) < 1e-9;
}

} // namespace

namespace SquareSettings {

QJsonObject toJson(const Squares::GenerateSquaresSettings& settings) {
    QJsonObject obj;
    obj["gridResolution"] = settings.gridResolution;
    obj["pixelSize"] = settings.pixelSize;
    obj["imageWidthPixels"] = settings.imageWidthPixels;
    obj["imageHeightPixels"] = settings.imageHeightPixels;
    obj["timeInterval"] = settings.timeInterval;
    obj["numberOfFrames"] = settings.numberOfFrames;
    obj["minTracksToCalculateTau"] = settings.minTracksToCalculateTau;
    obj["variabilityGranularity"] = settings.variabilityGranularity;
    obj["backgroundMethod"] = Squares::backgroundMethodToString(settings.backgroundMethod);
    obj["backgroundSampleCount"] = settings.backgroundSampleCount;
    obj["backgroundSeed"] = QString::number(settings.backgroundSeed); // 64-bit, does not fit a JSON double
    obj["minRequiredRSquared"] = settings.minRequiredRSquared;
    obj["minRequiredDensityRatio"] = settings.minRequiredDensityRatio;
    obj["maxAllowableVariability"] = settings.maxAllowableVariability;
    obj["neighbourMode"] = Squares::neighbourModeToString(settings.neighbourMode);
    return obj;
}

bool fromJson(const QJsonObject& obj, Squares::GenerateSquaresSettings& settings, QString* errorMessage) {
    Squares::GenerateSquaresSettings parsed = settings;

    if (!readInt(obj, "gridResolution", parsed.gridResolution, errorMessage)
        || !readDouble(obj, "pixelSize", parsed.pixelSize, errorMessage)
        || !readInt(obj, "imageWidthPixels", parsed.imageWidthPixels, errorMessage)
        || !readInt(obj, "imageHeightPixels", parsed.imageHeightPixels, errorMessage)
        || !readDouble(obj, "timeInterval", parsed.timeInterval, errorMessage)
        || !readInt(obj, "numberOfFrames", parsed.numberOfFrames, errorMessage)
        || !readInt(obj, "minTracksToCalculateTau", parsed.minTracksToCalculateTau, errorMessage)
        || !readInt(obj, "variabilityGranularity", parsed.variabilityGranularity, errorMessage)
        || !readInt(obj, "backgroundSampleCount", parsed.backgroundSampleCount, errorMessage)
        || !readDouble(obj, "minRequiredRSquared", parsed.minRequiredRSquared, errorMessage)
        || !readDouble(obj, "minRequiredDensityRatio", parsed.minRequiredDensityRatio, errorMessage)
        || !readDouble(obj, "maxAllowableVariability", parsed.maxAllowableVariability, errorMessage)) {
        return false;
    }

    if (obj.contains("backgroundSeed")) {
        bool ok = false;
        const quint64 seed = obj.value("backgroundSeed").toString().toULongLong(&ok);
        if (!ok) {
            if (errorMessage) *errorMessage = "backgroundSeed must be an unsigned integer string";
            return false;
        }
        parsed.backgroundSeed = seed;
    }

    if (obj.contains("backgroundMethod")
        && !Squares::stringToBackgroundMethod(obj.value("backgroundMethod").toString(), parsed.backgroundMethod)) {
        if (errorMessage) *errorMessage = QString("Unknown background method '%1'").arg(obj.value("backgroundMethod").toString());
        return false;
    }

    if (obj.contains("neighbourMode")
        && !Squares::stringToNeighbourMode(obj.value("neighbourMode").toString(), parsed.neighbourMode)) {
        if (errorMessage) *errorMessage = QString("Unknown neighbour mode '%1'").arg(obj.value("neighbourMode").toString());
        return false;
    }

    settings = parsed;
    return true;
}

bool save(const QString& filePath, const Squares::GenerateSquaresSettings& settings) {
    if (filePath.isEmpty()) {
        qWarning() << "SquareSettings: Cannot save settings - empty file path";
        return false;
    }

    QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "SquareSettings: Failed to save settings to:" << filePath;
        return false;
    }
    file.write(doc.toJson());
    file.close();
    SQUARES_DEBUG() << "SquareSettings: Saved settings to:" << filePath;
    return file.error() == QFile::NoError;
}

bool load(const QString& filePath, Squares::GenerateSquaresSettings& settings) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "SquareSettings: Cannot read settings file:" << filePath;
        return false;
    }

    QByteArray data = file.readAll();
    file.close();

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "SquareSettings: JSON parse error in" << filePath << ":" << parseError.errorString();
        return false;
    }
    if (!doc.isObject()) {
        qWarning() << "SquareSettings: settings file does not hold a JSON object:" << filePath;
        return false;
    }

    QString error;
    if (!fromJson(doc.object(), settings, &error)) {
        qWarning() << "SquareSettings: invalid settings in" << filePath << ":" << error;
        return false;
    }
    return true;
}

QStringList differences(const Squares::GenerateSquaresSettings& stored,
                        const Squares::GenerateSquaresSettings& current) {
    QStringList result;

    auto compareInt = [&result](const char* key, int a, int b) {
        if (a != b) result << QString("%1: %2 vs %3").arg(key).arg(a).arg(b);
    };
    auto compareDouble = [&result](const char* key, double a, double b) {
        if (!sameDouble(a, b)) result << QString("%1: %2 vs %3").arg(key).arg(a).arg(b);
    };

    compareInt("gridResolution", stored.gridResolution, current.gridResolution);
    compareDouble("pixelSize", stored.pixelSize, current.pixelSize);
    compareInt("imageWidthPixels", stored.imageWidthPixels, current.imageWidthPixels);
    compareInt("imageHeightPixels", stored.imageHeightPixels, current.imageHeightPixels);
    compareDouble("timeInterval", stored.timeInterval, current.timeInterval);
    compareInt("numberOfFrames", stored.numberOfFrames, current.numberOfFrames);
    compareInt("minTracksToCalculateTau", stored.minTracksToCalculateTau, current.minTracksToCalculateTau);
    compareInt("variabilityGranularity", stored.variabilityGranularity, current.variabilityGranularity);
    compareInt("backgroundSampleCount", stored.backgroundSampleCount, current.backgroundSampleCount);
    compareDouble("minRequiredRSquared", stored.minRequiredRSquared, current.minRequiredRSquared);
    compareDouble("minRequiredDensityRatio", stored.minRequiredDensityRatio, current.minRequiredDensityRatio);
    compareDouble("maxAllowableVariability", stored.maxAllowableVariability, current.maxAllowableVariability);

    if (stored.backgroundSeed != current.backgroundSeed) {
        result << QString("backgroundSeed: %1 vs %2").arg(stored.backgroundSeed).arg(current.backgroundSeed);
    }
    if (stored.backgroundMethod != current.backgroundMethod) {
        result << QString("backgroundMethod: %1 vs %2")
                      .arg(Squares::backgroundMethodToString(stored.backgroundMethod),
                           Squares::backgroundMethodToString(current.backgroundMethod));
    }
    if (stored.neighbourMode != current.neighbourMode) {
        result << QString("neighbourMode: %1 vs %2")
                      .arg(Squares::neighbourModeToString(stored.neighbourMode),
                           Squares::neighbourModeToString(current.neighbourMode));
    }
    return result;
}

bool compareWithFile(const QString& filePath, const Squares::GenerateSquaresSettings& current) {
    Squares::GenerateSquaresSettings stored;
    if (!load(filePath, stored)) {
        return false;
    }

    const QStringList diff = differences(stored, current);
    if (!diff.isEmpty()) {
        SQUARES_DEBUG() << "SquareSettings: settings differ from" << filePath << ":" << diff.join("; ");
        return false;
    }
    return true;
}

void validate(const Squares::GenerateSquaresSettings& settings) {
    auto fail = [](const QString& message) {
        throw Squares::InvalidConfiguration(message.toStdString());
    };

    if (settings.gridResolution < 1)
        fail(QString("Grid resolution must be at least 1, got %1").arg(settings.gridResolution));
    if (!(settings.pixelSize > 0.0) || !std::isfinite(settings.pixelSize))
        fail(QString("Pixel size must be positive, got %1").arg(settings.pixelSize));
    if (settings.imageWidthPixels < 1 || settings.imageHeightPixels < 1)
        fail(QString("Image size must be positive, got %1 x %2").arg(settings.imageWidthPixels).arg(settings.imageHeightPixels));
    if (!(settings.timeInterval > 0.0) || !std::isfinite(settings.timeInterval))
        fail(QString("Time interval must be positive, got %1").arg(settings.timeInterval));
    if (settings.numberOfFrames < 1)
        fail(QString("Number of frames must be positive, got %1").arg(settings.numberOfFrames));
    if (settings.minTracksToCalculateTau < 0)
        fail(QString("Minimum number of tracks cannot be negative, got %1").arg(settings.minTracksToCalculateTau));
    if (settings.variabilityGranularity < 1)
        fail(QString("Variability granularity must be at least 1, got %1").arg(settings.variabilityGranularity));
    if (settings.backgroundSampleCount < 1)
        fail(QString("Background sample count must be at least 1, got %1").arg(settings.backgroundSampleCount));
    if (std::isnan(settings.minRequiredRSquared) || std::isnan(settings.minRequiredDensityRatio)
        || std::isnan(settings.maxAllowableVariability))
        fail("Visibility filter limits must be numbers");
}

} // namespace SquareSettings
