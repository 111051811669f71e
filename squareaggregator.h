#ifndef SQUAREAGGREGATOR_H
#define SQUAREAGGREGATOR_H

#include <vector>
#include "squarecommon.h"
#include "square.h"
#include "decayfitter.h"

/**
 * @brief Recording-wide inputs every square of a recording is aggregated with.
 */
struct AggregationContext {
    int minTracks = SquareConstants::DEFAULT_MIN_TRACKS_FOR_TAU;
    double recordingDurationSeconds = SquareConstants::DEFAULT_NUMBER_OF_FRAMES * SquareConstants::DEFAULT_TIME_INTERVAL_SECONDS;
    double concentration = 1.0;
    double backgroundDensity = SquareConstants::UNDEFINED;
    int variabilityGranularity = SquareConstants::DEFAULT_VARIABILITY_GRANULARITY;
    double minRSquared = SquareConstants::DEFAULT_MIN_R_SQUARED;
    const DecaySolver* solver = nullptr;    // Not owned, must outlive the aggregation
};

namespace SquareAggregator {

    // count / (area * duration * concentration); NaN when any factor is not positive
    double calculateDensity(int numberOfTracks, double area, double durationSeconds, double concentration);

    // NaN when the background is zero or undefined
    double calculateDensityRatio(double density, double backgroundDensity);

    /**
     * @brief Coefficient of variation of track counts over a granularity x granularity
     * sub-grid of the square.
     *
     * Uses the population standard deviation. Locations on the far edge of the
     * square fall into the last sub-cell. NaN when the mean count is zero.
     */
    // Median of the longest / shortest max(round(fraction * n), 1) durations; NaN entries are ignored
    double medianLongTrackDuration(std::vector<double> durations, double fraction = SquareConstants::LONG_SHORT_TRACK_FRACTION);
    double medianShortTrackDuration(std::vector<double> durations, double fraction = SquareConstants::LONG_SHORT_TRACK_FRACTION);

    double calculateVariability(const Square& square, const std::vector<Squares::Track>& tracks, int granularity);

    /**
     * @brief Compute the statistics of one square from its tracks.
     *
     * A square with no tracks, or fewer than context.minTracks, gets the track
     * count and NaN for everything else. Never throws.
     *
     * @param square The square with its track indices set.
     * @param tracks Master track list the indices refer to.
     * @param context Recording-wide values, including the background density.
     * @param fitStatus If given, receives the outcome of the tau fit.
     */
    Squares::SquareStatistics aggregate(const Square& square,
                                        const std::vector<Squares::Track>& tracks,
                                        const AggregationContext& context,
                                        DecayFitting::FitStatus* fitStatus = nullptr);

    /**
     * @brief Mark squares as selected when they pass the density ratio, variability
     * and R squared limits, then apply the neighbour requirement.
     * @return Number of selected squares.
     */
    int applyVisibilityFilter(std::vector<Square>& squares,
                              double minDensityRatio,
                              double maxVariability,
                              double minRSquared,
                              Squares::NeighbourMode neighbourMode);

    // Sequential labels (0, 1, ...) for selected squares in square order, -1 for the rest
    int assignLabelNumbers(std::vector<Square>& squares);

} // namespace SquareAggregator

#endif // SQUAREAGGREGATOR_H
