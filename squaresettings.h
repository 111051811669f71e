#ifndef SQUARESETTINGS_H
#define SQUARESETTINGS_H

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include "squarecommon.h"

// Reading, writing and checking of GenerateSquaresSettings.
namespace SquareSettings {

    QJsonObject toJson(const Squares::GenerateSquaresSettings& settings);

    /**
     * @brief Read settings from a JSON object. Keys that are absent keep the value already in `settings`.
     * @param errorMessage Receives the reason when false is returned.
     * @return False if a key holds a value of the wrong type or an unknown enum name.
     */
    bool fromJson(const QJsonObject& obj, Squares::GenerateSquaresSettings& settings, QString* errorMessage = nullptr);

    bool save(const QString& filePath, const Squares::GenerateSquaresSettings& settings);
    bool load(const QString& filePath, Squares::GenerateSquaresSettings& settings);

    // Human readable "key: stored vs current" lines, empty when both agree
    QStringList differences(const Squares::GenerateSquaresSettings& stored,
                            const Squares::GenerateSquaresSettings& current);

    // True if the file exists, parses and holds the same settings as `current`
    bool compareWithFile(const QString& filePath, const Squares::GenerateSquaresSettings& current);

    /**
     * @brief Reject settings that make every recording unprocessable.
     * @throws Squares::InvalidConfiguration naming the first offending setting.
     */
    void validate(const Squares::GenerateSquaresSettings& settings);

} // namespace SquareSettings

#endif // SQUARESETTINGS_H
