#ifndef SQUAREGENERATOR_H
#define SQUAREGENERATOR_H

#include <QString>
#include <memory>
#include "squarecommon.h"
#include "recording.h"
#include "decayfitter.h"
#include "backgroundestimator.h"

/**
 * @brief Counts of what happened while generating the squares of one recording.
 */
struct GenerationReport {
    QString recordingName;
    int numberOfSquares = 0;
    int numberOfTracks = 0;
    int recalculatedTracks = 0;     // Tracks whose attributes were derived from samples
    int undefinedLocations = 0;     // Tracks without a location, not assigned
    int outOfBoundsTracks = 0;      // Tracks outside the field of view, not assigned
    int aggregatedSquares = 0;      // Squares with enough tracks for statistics
    int failedFits = 0;             // Squares with enough tracks where no tau could be fitted
    int selectedSquares = 0;
    double backgroundDensity = SquareConstants::UNDEFINED;
};

/**
 * @brief Runs the complete square generation for one recording.
 *
 * Phase 1 derives the track attributes, lays out the grid, assigns tracks and
 * computes raw densities. The background density is estimated once all raw
 * densities exist. Phase 2 then finalizes the statistics of every square,
 * applies the visibility filter and computes the recording attributes.
 * Both phases spread their per-item work over cv::parallel_for_; every item
 * writes only its own slot, so results do not depend on scheduling.
 */
class SquareGenerator {
public:
    explicit SquareGenerator(const Squares::GenerateSquaresSettings& settings,
                             std::shared_ptr<const DecaySolver> solver = nullptr);

    const Squares::GenerateSquaresSettings& getSettings() const;

    /**
     * @brief Generate squares and statistics for a recording, replacing any existing grid.
     * @param recording The recording; its tracks' attributes and assignments are updated.
     * @return What was computed and what was excluded.
     * @throws Squares::InvalidConfiguration if the settings are unusable.
     */
    GenerationReport generate(Recording& recording) const;

private:
    void calculateTrackAttributes(Recording& recording, GenerationReport& report) const;
    void calculateRawDensities(Recording& recording) const;
    void finalizeSquares(Recording& recording, const BackgroundEstimate& background, GenerationReport& report) const;
    void calculateRecordingAttributes(Recording& recording, const BackgroundEstimate& background,
                                      const GenerationReport& report) const;

    Squares::GenerateSquaresSettings m_settings;
    std::shared_ptr<const DecaySolver> m_solver;
};

#endif // SQUAREGENERATOR_H
