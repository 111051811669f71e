#ifndef TRACKATTRIBUTES_H
#define TRACKATTRIBUTES_H

#include <vector>
#include "squarecommon.h"

namespace TrackAttributeCalculator {

    /**
     * @brief Derives the per-track attributes from the raw samples of one track.
     *
     * Samples are ordered by frame before anything is computed. With fewer than
     * two samples every derived double is NaN. The diffusion coefficients are
     * mean squared displacement over 4 * timeInterval, rounded to 2 decimals:
     * relative to the first sample for diffusionCoefficient and per step for
     * diffusionCoefficientExt. They are NaN when timeInterval <= 0.
     *
     * @param samples Positions of the track in micrometer, in any order.
     * @param timeInterval Seconds between two consecutive frames.
     * @return The attribute set. numberOfSpots is always the sample count.
     */
    Squares::TrackAttributes calculate(std::vector<Squares::TrackSample> samples, double timeInterval);

    // Recomputes the attributes of a track in place when it carries samples.
    // Tracks without samples keep the attributes they were loaded with.
    // Returns true if the attributes were recomputed.
    bool updateTrack(Squares::Track& track, double timeInterval);

} // namespace TrackAttributeCalculator

#endif // TRACKATTRIBUTES_H
