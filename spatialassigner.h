#ifndef SPATIALASSIGNER_H
#define SPATIALASSIGNER_H

#include <QString>
#include <vector>
#include "squarecommon.h"
#include "square.h"

/**
 * @brief Result of mapping the tracks of one recording onto its grid.
 */
struct SpatialAssignment {
    std::vector<int> squareOfTrack;     // Square number per track, -1 when excluded
    int assignedTracks = 0;
    int undefinedLocations = 0;         // Tracks without a location (fewer than 2 samples)
    int outOfBoundsTracks = 0;          // Tracks located outside the field of view

    int excludedTracks() const { return undefinedLocations + outOfBoundsTracks; }
};

namespace SpatialAssigner {

    /**
     * @brief Index of the grid cell containing `value` along one axis.
     *
     * Cells are half-open [left, right). The outer edge (value == extent) belongs
     * to the last cell. Returns -1 for NaN, negative or out-of-range values.
     */
    int locateIndex(double value, double extent, int resolution);

    // Square number containing (x, y), or -1 if the point lies outside the field
    int locateSquare(double x, double y, const Squares::FieldOfView& fieldOfView, int resolution);

    /**
     * @brief Assign every track to the square containing its representative location.
     *
     * Each square's track index list is replaced. Excluded tracks are counted and
     * logged with the recording name and track id; they never abort the assignment.
     *
     * @param tracks Master track list of the recording.
     * @param squares The resolution x resolution squares of the recording, row-major.
     * @throws Squares::InvalidConfiguration if squares does not hold resolution^2 entries.
     */
    SpatialAssignment assignTracks(const std::vector<Squares::Track>& tracks,
                                   std::vector<Square>& squares,
                                   const Squares::FieldOfView& fieldOfView,
                                   int resolution);

} // namespace SpatialAssigner

#endif // SPATIALASSIGNER_H
