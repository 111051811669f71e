#include "gridpartitioner.h"
#include "debugutils.h"
#include <cmath>

namespace GridPartitioner {

double edge(int index, double extent, int resolution) {
    if (index >= resolution) {
        return extent;  // index * extent / resolution may round away from extent
    }
    return index * extent / resolution;
}

std::vector<Square> createSquares(const Squares::FieldOfView& fieldOfView, int resolution) {
    if (resolution < 1) {
        throw Squares::InvalidConfiguration(
            QString("Grid resolution must be at least 1, got %1").arg(resolution).toStdString());
    }
    if (!(fieldOfView.width > 0.0) || !(fieldOfView.height > 0.0)) {
        throw Squares::InvalidConfiguration(
            QString("Field of view must be positive, got %1 x %2")
                .arg(fieldOfView.width).arg(fieldOfView.height).toStdString());
    }

    std::vector<Square> squares;
    squares.reserve(static_cast<size_t>(resolution) * resolution);

    for (int row = 0; row < resolution; ++row) {
        const double y0 = edge(row, fieldOfView.height, resolution);
        const double y1 = edge(row + 1, fieldOfView.height, resolution);
        for (int col = 0; col < resolution; ++col) {
            const double x0 = edge(col, fieldOfView.width, resolution);
            const double x1 = edge(col + 1, fieldOfView.width, resolution);
            squares.emplace_back(squareNumber(row, col, resolution), row, col, x0, y0, x1, y1);
        }
    }

    SQUARES_DEBUG() << "GridPartitioner: created" << squares.size() << "squares over"
                    << fieldOfView.width << "x" << fieldOfView.height << "um";
    return squares;
}

} // namespace GridPartitioner
