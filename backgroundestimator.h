#ifndef BACKGROUNDESTIMATOR_H
#define BACKGROUNDESTIMATOR_H

#include <vector>
#include "squarecommon.h"
#include "square.h"

/**
 * @brief Reference density of a recording and the squares it was taken from.
 */
struct BackgroundEstimate {
    double density = SquareConstants::UNDEFINED;    // Mean raw density of the background squares
    std::vector<int> squareNumbers;                 // Background squares, ascending
    int numberOfTracks = 0;                         // Tracks in the background squares
    double averageTracks = SquareConstants::UNDEFINED;
};

namespace BackgroundEstimator {

    /**
     * @brief Draw `sampleCount` distinct indices out of [0, population).
     *
     * Partial Fisher-Yates shuffle driven by cv::RNG(seed), so the same seed
     * always yields the same subset. Returns every index when sampleCount >= population.
     * The result is sorted ascending.
     */
    std::vector<int> sampleIndices(int population, int sampleCount, quint64 seed);

    // Mean raw density of a seed-fixed random subset of squares
    BackgroundEstimate estimateRandomSample(const std::vector<Square>& squares, int sampleCount, quint64 seed);

    // Mean raw density after repeatedly dropping squares above mean + 2 sigma
    BackgroundEstimate estimateIterativeClipping(const std::vector<Square>& squares);

    // Dispatches on settings.backgroundMethod. Requires every square's raw density to be set.
    BackgroundEstimate estimate(const std::vector<Square>& squares, const Squares::GenerateSquaresSettings& settings);

} // namespace BackgroundEstimator

#endif // BACKGROUNDESTIMATOR_H
