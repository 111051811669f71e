#include "spatialassigner.h"
#include "gridpartitioner.h"
#include <QDebug>
#include <cmath>

namespace SpatialAssigner {

int locateIndex(double value, double extent, int resolution) {
    if (resolution < 1 || !(extent > 0.0)) {
        return -1;
    }
    if (std::isnan(value) || value < 0.0) {
        return -1;
    }
    const double tolerance = SquareConstants::BOUNDARY_TOLERANCE_FRACTION * extent;
    if (value > extent + tolerance) {
        return -1;
    }

    int index = static_cast<int>(std::floor(value / (extent / resolution)));
    if (index >= resolution) {
        index = resolution - 1;     // Outer edge belongs to the last cell
    }

    // Division may land one cell off near a grid line; settle against the actual edges
    while (index > 0 && value < GridPartitioner::edge(index, extent, resolution)) {
        --index;
    }
    while (index < resolution - 1 && value >= GridPartitioner::edge(index + 1, extent, resolution)) {
        ++index;
    }
    return index;
}

int locateSquare(double x, double y, const Squares::FieldOfView& fieldOfView, int resolution) {
    const int col = locateIndex(x, fieldOfView.width, resolution);
    const int row = locateIndex(y, fieldOfView.height, resolution);
    if (col < 0 || row < 0) {
        return -1;
    }
    return GridPartitioner::squareNumber(row, col, resolution);
}

SpatialAssignment assignTracks(const std::vector<Squares::Track>& tracks,
                               std::vector<Square>& squares,
                               const Squares::FieldOfView& fieldOfView,
                               int resolution) {
    if (resolution < 1 || squares.size() != static_cast<size_t>(resolution) * resolution) {
        throw Squares::InvalidConfiguration(
            QString("Expected %1 squares for grid resolution %2, got %3")
                .arg(resolution < 1 ? 0 : resolution * resolution).arg(resolution).arg(static_cast<int>(squares.size()))
                .toStdString());
    }

    SpatialAssignment assignment;
    assignment.squareOfTrack.assign(tracks.size(), -1);
    std::vector<std::vector<int>> tracksPerSquare(squares.size());

    for (size_t i = 0; i < tracks.size(); ++i) {
        const Squares::Track& track = tracks[i];
        const double x = track.attributes.xLocation;
        const double y = track.attributes.yLocation;

        if (std::isnan(x) || std::isnan(y)) {
            assignment.undefinedLocations++;
            qInfo() << "SpatialAssigner: recording" << track.recordingName << "track" << track.trackId
                    << "has no location and is not assigned";
            continue;
        }

        const int squareNumber = locateSquare(x, y, fieldOfView, resolution);
        if (squareNumber < 0) {
            assignment.outOfBoundsTracks++;
            qWarning() << "SpatialAssigner: recording" << track.recordingName << "track" << track.trackId
                       << "at (" << x << "," << y << ") lies outside the field of view, excluded";
            continue;
        }

        tracksPerSquare[squareNumber].push_back(static_cast<int>(i));
        assignment.squareOfTrack[i] = squareNumber;
        assignment.assignedTracks++;
    }

    for (size_t s = 0; s < squares.size(); ++s) {
        squares[s].setTrackIndices(std::move(tracksPerSquare[s]));
    }

    return assignment;
}

} // namespace SpatialAssigner
